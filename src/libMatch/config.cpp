#include "match/config.hpp"

#include "Logging.hpp"

#include <format>
#include <iomanip>
#include <limits>
#include <sstream>

namespace warlens::match {
namespace {

template <typename T>
void appendList(std::ostringstream& out, const std::vector<T>& values) {
	out << '[';
	for (std::size_t i = 0; i < values.size(); ++i) {
		out << (i ? "," : "") << values[i];
	}
	out << ']';
}

bool parseMotion(const std::string& name, MotionKind& kind) {
	if (name == "translation") {
		kind = MotionKind::Translation;
	} else if (name == "euclidean") {
		kind = MotionKind::Euclidean;
	} else if (name == "affine") {
		kind = MotionKind::Affine;
	} else {
		return false;
	}
	return true;
}

void readMotionKinds(const ConfigReader& reader, const char* key, std::vector<MotionKind>& value) {
	std::vector<std::string> names;
	reader.read(key, names);
	if (names.empty()) {
		return;
	}

	std::vector<MotionKind> kinds;
	for (const auto& name : names) {
		MotionKind kind{};
		if (parseMotion(name, kind)) {
			kinds.push_back(kind);
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Ignoring unknown motion model '{}' in '{}'.", name, key));
		}
	}
	value = std::move(kinds);
}

void readMethod(const ConfigReader& reader, const char* key, VerifyMethod& value) {
	std::string name;
	reader.read(key, name);
	if (name.empty()) {
		return;
	}

	if (name == "phase") {
		value = VerifyMethod::Phase;
	} else if (name == "ecc") {
		value = VerifyMethod::Ecc;
	} else if (name == "both") {
		value = VerifyMethod::Both;
	} else {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Unknown verification method '{}'. Keeping '{}'.", name, toString(value)));
	}
}

//! findTransformECC blurs with a square Gaussian of each size, which must be odd.
void readGaussSizes(const ConfigReader& reader, const char* key, std::vector<int>& value) {
	reader.read(key, value);
	for (const int size : value) {
		if (size <= 0 || size % 2 == 0) {
			reader.fail(key, std::format("sizes must be positive and odd, got {}", size));
		}
	}
}

void readSize(const ConfigReader& reader, const char* key, cv::Size& value) {
	std::vector<int> dims;
	reader.read(key, dims);
	if (dims.empty()) {
		return;
	}
	if (dims.size() != 2 || dims[0] <= 0 || dims[1] <= 0) {
		reader.fail(key, "expects [width, height] with positive entries");
	}
	value = cv::Size(dims[0], dims[1]);
}

} // namespace

const char* toString(MotionKind kind) {
	switch (kind) {
	case MotionKind::Translation: return "translation";
	case MotionKind::Euclidean: return "euclidean";
	case MotionKind::Affine: return "affine";
	}
	return "unknown";
}

const char* toString(VerifyMethod method) {
	switch (method) {
	case VerifyMethod::Phase: return "phase";
	case VerifyMethod::Ecc: return "ecc";
	case VerifyMethod::Both: return "both";
	}
	return "unknown";
}

std::string VerifyParams::signature() const {
	std::ostringstream out;
	out << std::setprecision(std::numeric_limits<double>::max_digits10);
	out << toString(method) << '|' << nccThr << '|' << nccCenterThr << '|' << edgeNccThr << '|' << centerFrac << '|' << maxShift << '|'
	    << eccCcMin << '|';
	appendList(out, rotations);
	appendList(out, gaussSizes);

	out << '[';
	for (std::size_t i = 0; i < kinds.size(); ++i) {
		out << (i ? "," : "") << toString(kinds[i]);
	}
	out << ']';

	out << '|' << eccMaxIter << '|' << eccEps << '|' << inkIouThr << '|' << profileCosThr << '|' << profileShiftedThr << '|'
	    << coverageDeltaMax << '|' << profileMaxShift;
	return out.str();
}

VerifyParams MatcherConfig::tier1Params() const {
	VerifyParams params = verify;
	params.rotations    = tier1Rotations.empty() ? std::vector<double>{0.0} : tier1Rotations;
	params.gaussSizes   = tier1GaussSizes.empty() ? std::vector<int>{5} : tier1GaussSizes;
	params.kinds        = tier1Kinds.empty() ? std::vector<MotionKind>{MotionKind::Euclidean} : tier1Kinds;
	return params;
}

MatcherConfig loadMatcherConfig(const std::filesystem::path& path) {
	const ConfigReader reader(path, "matcher");
	MatcherConfig cfg;

	auto& v = cfg.verify;
	readMethod(reader, "method", v.method);
	reader.read("nccThr", v.nccThr);
	reader.read("nccCenterThr", v.nccCenterThr);
	reader.read("edgeNccThr", v.edgeNccThr);
	reader.read("centerFrac", v.centerFrac);
	reader.read("maxShift", v.maxShift);
	reader.read("eccCcMin", v.eccCcMin);
	reader.read("eccRotations", v.rotations);
	readGaussSizes(reader, "eccGaussSizes", v.gaussSizes);
	readMotionKinds(reader, "eccKinds", v.kinds);
	reader.readPositive("eccMaxIter", v.eccMaxIter);
	reader.read("eccEps", v.eccEps);
	reader.read("inkIouThr", v.inkIouThr);
	reader.read("profileCosThr", v.profileCosThr);
	reader.read("profileShiftedThr", v.profileShiftedThr);
	reader.read("coverageDeltaMax", v.coverageDeltaMax);
	reader.read("profileMaxShift", v.profileMaxShift);
	if (v.profileMaxShift < 0) {
		reader.fail("profileMaxShift", "must not be negative");
	}

	reader.read("tiered", cfg.tiered);
	reader.read("tier1Rotations", cfg.tier1Rotations);
	readGaussSizes(reader, "tier1GaussSizes", cfg.tier1GaussSizes);
	readMotionKinds(reader, "tier1Kinds", cfg.tier1Kinds);

	reader.read("fastReject", cfg.fastReject);
	reader.read("fastRejectCenterNcc", cfg.fastRejectCenterNcc);
	reader.read("fastRejectProfileCos", cfg.fastRejectProfileCos);
	reader.read("escalateCenterNcc", cfg.escalateCenterNcc);
	reader.read("escalateProfileCos", cfg.escalateProfileCos);

	reader.read("maxWidthDiff", cfg.maxWidthDiff);
	reader.read("useAspectFilter", cfg.useAspectFilter);
	reader.read("maxAspectDiff", cfg.maxAspectDiff);
	reader.readPositive("topKHash", cfg.topKHash);
	reader.readPositive("topKProfile", cfg.topKProfile);
	reader.readPositive("maxCandidates", cfg.maxCandidates);
	readSize(reader, "canonicalSize", cfg.canonicalSize);

	reader.readPositive("imageCacheSize", cfg.imageCacheSize);
	reader.readPositive("descriptorCacheSize", cfg.descriptorCacheSize);
	reader.readPositive("rotationCacheSize", cfg.rotationCacheSize);
	reader.readPositive("verdictCacheSize", cfg.verdictCacheSize);
	reader.readPositive("batchCacheLimit", cfg.batchCacheLimit);

	Logger().Log(Logging::LogLevel::Info, std::format("[Config] Loaded matcher config '{}'.", path.string()));
	return cfg;
}

} // namespace warlens::match
