#pragma once

#include "vision/configReader.hpp"

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace warlens::match {

using warlens::ConfigError;

//! ECC motion model.
enum class MotionKind { Translation, Euclidean, Affine };

//! Alignment strategies tried by the verifier.
enum class VerifyMethod {
	Phase, //!< Phase correlation only.
	Ecc,   //!< ECC registration only.
	Both   //!< Phase correlation first, ECC if it did not accept.
};

const char* toString(MotionKind kind);
const char* toString(VerifyMethod method);

//! Parameters of one verification pass. Two passes with equal signature() produce the same verdict.
struct VerifyParams {
	VerifyMethod method = VerifyMethod::Both;

	double nccThr       = 0.82; //!< Full image NCC threshold.
	double nccCenterThr = 0.86; //!< Centre crop NCC threshold.
	double edgeNccThr   = 0.70; //!< Sobel magnitude NCC threshold.
	double centerFrac   = 0.9;  //!< Centre crop fraction on both axes.
	double maxShift     = 10.0; //!< Largest phase correlation shift that is trusted (px).
	double eccCcMin     = 0.0;  //!< Minimum ECC correlation coefficient; 0 disables the check.

	std::vector<double> rotations{-2.0, 0.0, 2.0};                      //!< Pre-rotations of the candidate (deg).
	std::vector<int> gaussSizes{3, 5, 7};                               //!< ECC Gaussian pre-filter sizes.
	std::vector<MotionKind> kinds{MotionKind::Euclidean, MotionKind::Affine}; //!< ECC motion models.
	int eccMaxIter = 200;
	double eccEps  = 1e-5;

	double inkIouThr         = 0.76; //!< Ink mask IoU threshold.
	double profileCosThr     = 0.93; //!< Ink profile cosine threshold.
	double profileShiftedThr = 0.99; //!< Best shifted profile cosine for the strong text check.
	double coverageDeltaMax  = 0.06; //!< Largest ink coverage difference for the strong text check.
	int profileMaxShift      = 40;   //!< Shift range of the best shifted cosine (columns).

	//! Stable textual signature of every parameter that influences the verdict.
	std::string signature() const;
};

//! Tunable parameters of the identity resolution.
struct MatcherConfig {
	VerifyParams verify; //!< Full (escalated) verification parameters.

	// Cheap first tier
	bool tiered = true;
	std::vector<double> tier1Rotations{0.0};
	std::vector<int> tier1GaussSizes{5};
	std::vector<MotionKind> tier1Kinds{MotionKind::Euclidean};

	// Fast reject and escalation guards
	bool fastReject               = true;
	double fastRejectCenterNcc    = 0.35;
	double fastRejectProfileCos   = 0.80;
	double escalateCenterNcc      = 0.55;
	double escalateProfileCos     = 0.90;

	// Geometry gates and shortlist
	int maxWidthDiff      = 60;  //!< Largest source width difference (px).
	bool useAspectFilter  = true;
	double maxAspectDiff  = 1.0; //!< Largest aspect ratio difference.
	int topKHash          = 12;
	int topKProfile       = 12;
	int maxCandidates     = 16;

	cv::Size canonicalSize{256, 64}; //!< Size all crops are compared at.

	// Cache capacities (entries)
	std::size_t imageCacheSize      = 256;
	std::size_t descriptorCacheSize = 2048;
	std::size_t rotationCacheSize   = 512;
	std::size_t verdictCacheSize    = 8192;
	std::size_t batchCacheLimit     = 1024;

	//! Parameters of the cheap tier. Empty tier lists fall back to rotation 0, Gaussian 5, Euclidean.
	VerifyParams tier1Params() const;
};

/*! Load a matcher configuration from a YAML/JSON/XML file. Keys absent from the file keep their defaults.
 * `canonicalSize` is stored as [width, height]. ECC Gaussian sizes must be positive and odd.
 * \throws ConfigError if the file cannot be opened or parsed, or a size or count is not positive.
 */
MatcherConfig loadMatcherConfig(const std::filesystem::path& path);

} // namespace warlens::match
