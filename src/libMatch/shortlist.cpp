#include "match/shortlist.hpp"

#include "Logging.hpp"
#include "match/textFeatures.hpp"
#include "vision/imageIo.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <unordered_set>

namespace warlens::match {

//! Source image of a reference crop through the image cache.
static std::optional<cv::Mat> referenceImage(const std::string& path, CacheContext& caches) {
	if (auto cached = caches.images->get(path)) {
		return cached;
	}

	auto image = vision::tryReadImage(path);
	if (!image) {
		return std::nullopt;
	}
	caches.images->put(path, *image);
	return image;
}

std::optional<Descriptor> referenceDescriptor(const std::string& path, const MatcherConfig& cfg, CacheContext& caches, BatchScope& scope) {
	if (auto cached = caches.descriptors->get(path)) {
		return cached;
	}

	const auto image = referenceImage(path, caches);
	if (!image) {
		return std::nullopt;
	}

	auto desc = buildDescriptor(*image, cfg.canonicalSize, &scope);
	caches.descriptors->put(path, desc);
	return desc;
}

std::vector<Candidate> gatherCandidates(const std::vector<IdentityRef>& refs, const Descriptor& query, const MatcherConfig& cfg, CacheContext& caches,
                                        BatchScope& scope) {
	const double queryAspect = query.width / std::max(1e-6, static_cast<double>(query.height));

	std::unordered_set<std::string> seen;
	std::vector<Candidate> candidates;
	for (const auto& ref : refs) {
		if (!seen.insert(ref.path).second) {
			continue;
		}

		const auto desc = referenceDescriptor(ref.path, cfg, caches, scope);
		if (!desc) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Shortlist] Skipping identity {}: could not read '{}'.", ref.id, ref.path));
			continue;
		}

		if (std::abs(desc->width - query.width) > cfg.maxWidthDiff) {
			continue;
		}
		if (cfg.useAspectFilter) {
			const double aspect = desc->width / std::max(1e-6, static_cast<double>(desc->height));
			if (std::abs(aspect - queryAspect) > cfg.maxAspectDiff) {
				continue;
			}
		}

		Candidate candidate;
		candidate.id           = ref.id;
		candidate.hashDistance = hamming64(query.hash, desc->hash);
		candidate.profileCos   = cosine(query.profile, desc->profile);
		candidate.path         = ref.path;
		candidate.gray         = desc->gray;
		candidate.hash         = desc->hash;
		candidates.push_back(std::move(candidate));
	}
	return candidates;
}

std::vector<Candidate> rankShortlist(const std::vector<Candidate>& candidates, const MatcherConfig& cfg) {
	const std::size_t n = candidates.size();
	if (n == 0) {
		return {};
	}

	std::vector<std::size_t> byHash(n);
	std::iota(byHash.begin(), byHash.end(), 0);
	std::vector<std::size_t> byProfile = byHash;

	std::stable_sort(byHash.begin(), byHash.end(), [&](std::size_t a, std::size_t b) { return candidates[a].hashDistance < candidates[b].hashDistance; });
	std::stable_sort(byProfile.begin(), byProfile.end(), [&](std::size_t a, std::size_t b) { return candidates[a].profileCos > candidates[b].profileCos; });

	std::vector<std::size_t> rankHash(n), rankProfile(n);
	for (std::size_t r = 0; r < n; ++r) {
		rankHash[byHash[r]]       = r;
		rankProfile[byProfile[r]] = r;
	}

	const std::size_t topHash    = std::clamp<std::size_t>(static_cast<std::size_t>(std::max(1, cfg.topKHash)), 1, n);
	const std::size_t topProfile = std::clamp<std::size_t>(static_cast<std::size_t>(std::max(1, cfg.topKProfile)), 1, n);

	std::vector<std::size_t> pool;
	for (std::size_t i = 0; i < n; ++i) {
		if (rankHash[i] < topHash || rankProfile[i] < topProfile) {
			pool.push_back(i);
		}
	}
	std::stable_sort(pool.begin(), pool.end(), [&](std::size_t a, std::size_t b) { return rankHash[a] + rankProfile[a] < rankHash[b] + rankProfile[b]; });
	if (pool.size() > static_cast<std::size_t>(std::max(0, cfg.maxCandidates))) {
		pool.resize(static_cast<std::size_t>(std::max(0, cfg.maxCandidates)));
	}

	std::vector<Candidate> shortlist;
	shortlist.reserve(pool.size());
	for (const auto i : pool) {
		shortlist.push_back(candidates[i]);
	}
	return shortlist;
}

} // namespace warlens::match
