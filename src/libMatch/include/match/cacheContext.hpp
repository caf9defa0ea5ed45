#pragma once

#include "match/cache.hpp"
#include "match/config.hpp"
#include "match/descriptor.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace warlens::match {

//! Rotation of a specific buffer by a specific angle.
struct RotationKey {
	const void* data = nullptr;
	double angle     = 0.0;

	bool operator==(const RotationKey&) const = default;
};

//! Rotated image together with the source it was computed from; holding the source keeps its address from being reused.
struct RotatedImage {
	cv::Mat source;
	cv::Mat rotated;
};

//! Verdict of one (query, candidate) pair under one parameter signature.
struct VerdictKey {
	std::uint64_t query     = 0;
	std::uint64_t candidate = 0;
	std::string signature;

	bool operator==(const VerdictKey&) const = default;
};

struct RotationKeyHash {
	std::size_t operator()(const RotationKey& key) const;
};

struct VerdictKeyHash {
	std::size_t operator()(const VerdictKey& key) const;
};

using ImageCache      = ICache<std::string, cv::Mat>;
using DescriptorCache = ICache<std::string, Descriptor>;
using RotationCache   = ICache<RotationKey, RotatedImage>;
using VerdictCache    = ICache<VerdictKey, bool>;

/*! Process wide caches of the identity resolution. Injectable for tests and for callers that want isolated caches.
 * Every cache is internally synchronised.
 */
struct CacheContext {
	std::shared_ptr<ImageCache> images;
	std::shared_ptr<DescriptorCache> descriptors;
	std::shared_ptr<RotationCache> rotations;
	std::shared_ptr<VerdictCache> verdicts;

	//! Drop the content of every cache.
	void clear();
};

//! Clear-on-full caches sized after `cfg`.
std::shared_ptr<CacheContext> makeCacheContext(const MatcherConfig& cfg);

//! Shared context used by matchers constructed without an explicit one.
std::shared_ptr<CacheContext> defaultCacheContext();

} // namespace warlens::match
