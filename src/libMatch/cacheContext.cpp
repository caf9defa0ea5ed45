#include "match/cacheContext.hpp"

#include <functional>
#include <mutex>

namespace warlens::match {

std::size_t RotationKeyHash::operator()(const RotationKey& key) const {
	std::size_t seed = std::hash<const void*>{}(key.data);
	hashCombine(seed, std::hash<double>{}(key.angle));
	return seed;
}

std::size_t VerdictKeyHash::operator()(const VerdictKey& key) const {
	std::size_t seed = std::hash<std::uint64_t>{}(key.query);
	hashCombine(seed, std::hash<std::uint64_t>{}(key.candidate));
	hashCombine(seed, std::hash<std::string>{}(key.signature));
	return seed;
}

void CacheContext::clear() {
	images->clear();
	descriptors->clear();
	rotations->clear();
	verdicts->clear();
}

std::shared_ptr<CacheContext> makeCacheContext(const MatcherConfig& cfg) {
	auto context         = std::make_shared<CacheContext>();
	context->images      = std::make_shared<ClearOnFullCache<std::string, cv::Mat>>(cfg.imageCacheSize);
	context->descriptors = std::make_shared<ClearOnFullCache<std::string, Descriptor>>(cfg.descriptorCacheSize);
	context->rotations   = std::make_shared<ClearOnFullCache<RotationKey, RotatedImage, RotationKeyHash>>(cfg.rotationCacheSize);
	context->verdicts    = std::make_shared<ClearOnFullCache<VerdictKey, bool, VerdictKeyHash>>(cfg.verdictCacheSize);
	return context;
}

std::shared_ptr<CacheContext> defaultCacheContext() {
	static std::once_flag initFlag;
	static std::shared_ptr<CacheContext> context;
	std::call_once(initFlag, [] { context = makeCacheContext(MatcherConfig{}); });
	return context;
}

} // namespace warlens::match
