#include "match/matcher.hpp"

#include "Logging.hpp"
#include "match/alignment.hpp"
#include "match/batchScope.hpp"
#include "match/descriptor.hpp"
#include "match/verifier.hpp"
#include "vision/scopedTimer.hpp"

#include <format>

namespace warlens::match {

Matcher::Matcher(MatcherConfig config, std::shared_ptr<CacheContext> caches)
    : m_config(std::move(config)), m_caches(caches ? std::move(caches) : defaultCacheContext()) {
}

std::optional<int> Matcher::match(const std::vector<IdentityRef>& identities, const cv::Mat& query) const {
	if (query.empty()) {
		return std::nullopt;
	}
	ScopedTimer timer("Matching", Logger());
	BatchScope scope(m_config.batchCacheLimit);

	// 1. Query descriptor and geometry gated candidates.
	const auto queryDesc = buildDescriptor(query, m_config.canonicalSize, &scope);
	const auto candidates = gatherCandidates(identities, queryDesc, m_config, *m_caches, scope);
	if (candidates.empty()) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Matcher] No candidates among {} identities.", identities.size()));
		return std::nullopt;
	}

	// 2. Shortlist by hash and profile rank.
	const auto shortlist = rankShortlist(candidates, m_config);

	// 3. Verify in rank order.
	const auto queryCtx = makeQueryContext(queryDesc.gray, queryDesc.hash, m_config.verify.centerFrac, &scope);
	TieredVerifier verifier(m_config, *m_caches, scope);
	for (const auto& candidate : shortlist) {
		if (verifier.verify(queryCtx, candidate)) {
			Logger().Log(Logging::LogLevel::Info, std::format("[Matcher] Matched identity {} (hash distance {}, profile {:.3f}).", candidate.id,
			                                                  candidate.hashDistance, candidate.profileCos));
			return candidate.id;
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Matcher] No match among {} shortlisted of {} candidates.", shortlist.size(), candidates.size()));
	return std::nullopt;
}

double Matcher::verifyGray(const cv::Mat& a, const cv::Mat& b) const {
	const cv::Mat ga = canonicalGray(a, m_config.canonicalSize);
	const cv::Mat gb = canonicalGray(b, m_config.canonicalSize);
	return ncc(cropCenter(ga, m_config.verify.centerFrac), cropCenter(gb, m_config.verify.centerFrac));
}

} // namespace warlens::match
