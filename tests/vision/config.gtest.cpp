#include "vision/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace warlens::gtest {

using namespace warlens::vision;

TEST(SegmenterConfig, LoadsOverridesAndKeepsDefaults) {
	const auto path = std::filesystem::temp_directory_path() / "warlens_segmenter_config.yml";
	{
		std::ofstream out(path);
		out << "%YAML:1.0\n"
		       "---\n"
		       "segmenter:\n"
		       "   minRows: 5\n"
		       "   rowHeightGain: 1.25\n"
		       "   lockMidToGlobal: 0\n"
		       "   contentRange: [0.2, 0.9]\n"
		       "   dialogHueRanges:\n"
		       "      - [ 100, 90, 70, 120, 255, 255 ]\n";
	}

	const auto cfg = loadSegmenterConfig(path);
	EXPECT_EQ(cfg.minRows, 5u);
	EXPECT_DOUBLE_EQ(cfg.rowHeightGain, 1.25);
	EXPECT_FALSE(cfg.lockMidToGlobal);
	EXPECT_DOUBLE_EQ(cfg.contentRange.begin, 0.2);
	EXPECT_DOUBLE_EQ(cfg.contentRange.end, 0.9);
	ASSERT_EQ(cfg.dialogHueRanges.size(), 1u);
	EXPECT_EQ(cfg.dialogHueRanges[0].lo, cv::Scalar(100, 90, 70));

	// Untouched keys keep their defaults.
	const SegmenterConfig defaults;
	EXPECT_EQ(cfg.trimPad, defaults.trimPad);
	EXPECT_DOUBLE_EQ(cfg.workBandHalf, defaults.workBandHalf);

	std::filesystem::remove(path);
}

TEST(SegmenterConfig, MissingFileThrows) {
	EXPECT_THROW(loadSegmenterConfig("/nonexistent/warlens.yml"), ConfigError);
}

static const auto kInvalidConfig = std::filesystem::temp_directory_path() / "warlens_segmenter_invalid.yml";

static std::filesystem::path writeConfig(const std::string& body) {
	std::ofstream(kInvalidConfig) << "%YAML:1.0\n---\nsegmenter:\n" << body;
	return kInvalidConfig;
}

TEST(SegmenterConfig, RejectsNonPositiveKernels) {
	EXPECT_THROW(loadSegmenterConfig(writeConfig("   dialogCloseKernel: 0\n")), ConfigError);
	EXPECT_THROW(loadSegmenterConfig(writeConfig("   trimSmoothKernel: -3\n")), ConfigError);
	EXPECT_THROW(loadSegmenterConfig(writeConfig("   anchorGap: -1\n")), ConfigError);
	EXPECT_THROW(loadSegmenterConfig(writeConfig("   minRows: -2\n")), ConfigError);
	EXPECT_NO_THROW(loadSegmenterConfig(writeConfig("   dialogCloseKernel: 3\n")));

	std::filesystem::remove(kInvalidConfig);
}

TEST(SegmenterConfig, RejectsInvertedRanges) {
	EXPECT_THROW(loadSegmenterConfig(writeConfig("   contentRange: [0.9, 0.2]\n")), ConfigError);
	EXPECT_THROW(loadSegmenterConfig(writeConfig("   hexHeight: [0.05]\n")), ConfigError);

	std::filesystem::remove(kInvalidConfig);
}

} // namespace warlens::gtest
