#pragma once

#include "match/batchScope.hpp"
#include "match/cacheContext.hpp"
#include "match/config.hpp"
#include "match/descriptor.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warlens::match {

//! Known identity and the path of one of its reference crops.
struct IdentityRef {
	int id = 0;
	std::string path;
};

//! Reference crop that passed the geometry gates, with its similarity to the query.
struct Candidate {
	int id              = 0;
	int hashDistance    = 0;   //!< Hamming distance of the dHashes.
	double profileCos   = 0.0; //!< Cosine of the ink profiles.
	std::string path;
	cv::Mat gray;              //!< Canonical gray of the reference.
	std::uint64_t hash  = 0;
};

/*! Descriptor of a reference crop: descriptor cache, then image cache, then disk.
 * \return Nothing if the image is missing or unreadable.
 */
std::optional<Descriptor> referenceDescriptor(const std::string& path, const MatcherConfig& cfg, CacheContext& caches, BatchScope& scope);

/*! Score every reference against the query, dropping those failing the width and aspect gates.
 * References sharing a path are considered once; the first identity listed wins. Missing references are skipped.
 * \param [in] refs  Known identities.
 * \param [in] query Descriptor of the query crop.
 */
std::vector<Candidate> gatherCandidates(const std::vector<IdentityRef>& refs, const Descriptor& query, const MatcherConfig& cfg, CacheContext& caches,
                                        BatchScope& scope);

/*! Union of the top-K by hash distance and the top-K by profile cosine, ordered by the sum of both ranks, capped.
 * Ties keep the input order.
 */
std::vector<Candidate> rankShortlist(const std::vector<Candidate>& candidates, const MatcherConfig& cfg);

} // namespace warlens::match
