#pragma once

#include "match/cacheContext.hpp"
#include "match/config.hpp"
#include "match/shortlist.hpp"

#include <opencv2/core/mat.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace warlens::match {

/*! Resolves player name crops to known identities.
 *
 * Calls are synchronous. The caches are shared between matchers using the same context and are internally synchronised.
 */
class Matcher {
public:
	//! \param [in] caches Cache context; the process wide default context if null.
	explicit Matcher(MatcherConfig config = {}, std::shared_ptr<CacheContext> caches = nullptr);

	/*! Find the identity depicted by `query`.
	 * \param [in] identities Known identities and their reference crops. Not modified, nothing is registered.
	 * \param [in] query      BGR crop of a player name.
	 * \return     Id of the first candidate that verifies, or nothing for an unknown player.
	 */
	std::optional<int> match(const std::vector<IdentityRef>& identities, const cv::Mat& query) const;

	//! Diagnostic: centre crop NCC of the canonical grays of two crops.
	double verifyGray(const cv::Mat& a, const cv::Mat& b) const;

	const MatcherConfig& config() const { return m_config; }
	CacheContext& caches() const { return *m_caches; }

private:
	MatcherConfig m_config;
	std::shared_ptr<CacheContext> m_caches;
};

} // namespace warlens::match
