#include "match/matcher.hpp"
#include "syntheticImages.hpp"

#include <opencv2/imgcodecs.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace warlens::gtest {

using namespace warlens::match;

class MatcherTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_dir = std::filesystem::temp_directory_path() / "warlens_matcher";
		std::filesystem::remove_all(m_dir);
		std::filesystem::create_directories(m_dir);
	}
	void TearDown() override { std::filesystem::remove_all(m_dir); }

	std::string write(const std::string& name, const cv::Mat& image) const {
		const auto path = (m_dir / name).string();
		cv::imwrite(path, image);
		return path;
	}

	Matcher isolatedMatcher(MatcherConfig cfg = {}) const {
		auto caches = makeCacheContext(cfg);
		return Matcher(std::move(cfg), std::move(caches));
	}

	std::filesystem::path m_dir;
};

TEST_F(MatcherTest, EmptyPoolIsUnknown) {
	const auto matcher = isolatedMatcher();
	EXPECT_FALSE(matcher.match({}, textCrop("Ragnar")).has_value());
}

TEST_F(MatcherTest, EmptyQueryIsUnknown) {
	const auto matcher = isolatedMatcher();
	const std::vector<IdentityRef> refs{{1, write("ragnar.png", textCrop("Ragnar"))}};
	EXPECT_FALSE(matcher.match(refs, cv::Mat()).has_value());
}

TEST_F(MatcherTest, MatchesItself) {
	const auto matcher = isolatedMatcher();
	const cv::Mat crop = textCrop("Ragnar");

	const std::vector<IdentityRef> refs{{42, write("ragnar.png", crop)}};
	const auto id = matcher.match(refs, crop);
	ASSERT_TRUE(id.has_value());
	EXPECT_EQ(*id, 42);
}

TEST_F(MatcherTest, MatchesShiftedAndRotatedCapture) {
	const auto matcher   = isolatedMatcher();
	const cv::Mat crop   = textCrop("Ragnar");
	const cv::Mat recapt = shiftedRotated(crop, 2.0, 1.0, 1.0);

	const std::vector<IdentityRef> refs{
	    {1, write("other.png", textCrop("iiii"))},
	    {2, write("ragnar.png", crop)},
	};
	const auto id = matcher.match(refs, recapt);
	ASSERT_TRUE(id.has_value());
	EXPECT_EQ(*id, 2);
}

TEST_F(MatcherTest, RejectsDifferentName) {
	const auto matcher = isolatedMatcher();
	const std::vector<IdentityRef> refs{{1, write("w.png", textCrop("WWWWWW"))}};
	EXPECT_FALSE(matcher.match(refs, textCrop("iiii")).has_value());
}

TEST_F(MatcherTest, SkipsMissingReferences) {
	const auto matcher = isolatedMatcher();
	const cv::Mat crop = textCrop("Ragnar");

	const std::vector<IdentityRef> refs{
	    {1, (m_dir / "missing.png").string()},
	    {2, write("ragnar.png", crop)},
	};
	EXPECT_EQ(matcher.match(refs, crop), std::optional<int>(2));
}

TEST_F(MatcherTest, RepeatedCallsUseCachedVerdicts) {
	const auto matcher = isolatedMatcher();
	const cv::Mat crop = textCrop("Ragnar");
	const std::vector<IdentityRef> refs{{5, write("ragnar.png", crop)}};

	ASSERT_EQ(matcher.match(refs, crop), std::optional<int>(5));
	const auto verdicts = matcher.caches().verdicts->size();
	EXPECT_GT(verdicts, 0u);

	EXPECT_EQ(matcher.match(refs, crop), std::optional<int>(5));
	EXPECT_EQ(matcher.caches().verdicts->size(), verdicts);
}

TEST_F(MatcherTest, VerifyGrayDiagnostic) {
	const auto matcher = isolatedMatcher();
	const cv::Mat crop = textCrop("Ragnar");

	EXPECT_NEAR(matcher.verifyGray(crop, crop), 1.0, 1e-6);
	EXPECT_LT(matcher.verifyGray(crop, textCrop("iiii")), 0.9);
}

TEST_F(MatcherTest, LoadsConfigOverrides) {
	const auto path = m_dir / "matcher.yml";
	{
		std::ofstream out(path);
		out << "%YAML:1.0\n"
		       "---\n"
		       "matcher:\n"
		       "   method: \"ecc\"\n"
		       "   tiered: 0\n"
		       "   nccThr: 0.9\n"
		       "   eccKinds: [ \"affine\", \"bogus\" ]\n"
		       "   eccRotations: [ -1.5, 1.5 ]\n"
		       "   maxCandidates: 4\n"
		       "   verdictCacheSize: 32\n";
	}

	const auto cfg = loadMatcherConfig(path);
	EXPECT_EQ(cfg.verify.method, VerifyMethod::Ecc);
	EXPECT_FALSE(cfg.tiered);
	EXPECT_DOUBLE_EQ(cfg.verify.nccThr, 0.9);
	EXPECT_EQ(cfg.verify.kinds, std::vector<MotionKind>{MotionKind::Affine});
	EXPECT_EQ(cfg.verify.rotations, (std::vector<double>{-1.5, 1.5}));
	EXPECT_EQ(cfg.maxCandidates, 4);
	EXPECT_EQ(cfg.verdictCacheSize, 32u);

	const MatcherConfig defaults;
	EXPECT_DOUBLE_EQ(cfg.verify.edgeNccThr, defaults.verify.edgeNccThr);
	EXPECT_EQ(cfg.topKHash, defaults.topKHash);
	EXPECT_NE(cfg.verify.signature(), defaults.verify.signature());
}

TEST_F(MatcherTest, MissingConfigThrows) {
	EXPECT_THROW(loadMatcherConfig(m_dir / "missing.yml"), ConfigError);
}

TEST_F(MatcherTest, ReadsCanonicalSize) {
	const auto path = m_dir / "size.yml";
	std::ofstream(path) << "%YAML:1.0\n---\nmatcher:\n   canonicalSize: [ 128, 32 ]\n";
	EXPECT_EQ(loadMatcherConfig(path).canonicalSize, cv::Size(128, 32));

	std::ofstream(path) << "%YAML:1.0\n---\nmatcher:\n   canonicalSize: [ 128, 0 ]\n";
	EXPECT_THROW(loadMatcherConfig(path), ConfigError);
}

TEST_F(MatcherTest, RejectsInvalidSizesAndCounts) {
	const auto path = m_dir / "invalid.yml";
	for (const char* body : {"   eccGaussSizes: [ 3, 4 ]\n", "   tier1GaussSizes: [ 0 ]\n", "   eccMaxIter: 0\n", "   maxCandidates: -1\n",
	                         "   verdictCacheSize: 0\n"}) {
		std::ofstream(path) << "%YAML:1.0\n---\nmatcher:\n" << body;
		EXPECT_THROW(loadMatcherConfig(path), ConfigError) << body;
	}
}

TEST(VerifyParams, SignatureKeepsFullPrecision) {
	VerifyParams a;
	VerifyParams b;
	b.nccThr = a.nccThr + 1e-9;
	EXPECT_NE(a.signature(), b.signature());

	VerifyParams c;
	EXPECT_EQ(a.signature(), c.signature());
}

} // namespace warlens::gtest
