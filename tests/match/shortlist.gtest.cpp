#include "match/shortlist.hpp"
#include "syntheticImages.hpp"

#include <opencv2/imgcodecs.hpp>

#include <gtest/gtest.h>

#include <filesystem>

namespace warlens::gtest {

using namespace warlens::match;

static Candidate candidate(int id, int hashDistance, double profileCos) {
	Candidate c;
	c.id           = id;
	c.hashDistance = hashDistance;
	c.profileCos   = profileCos;
	return c;
}

TEST(Shortlist, RanksBySummedRank) {
	MatcherConfig cfg;
	cfg.topKHash    = 2;
	cfg.topKProfile = 2;

	// Hash ranks: 1 -> 0, 2 -> 1, 3 -> 2, 4 -> 3. Profile ranks: 3 -> 0, 2 -> 1, 4 -> 2, 1 -> 3.
	const std::vector<Candidate> candidates{candidate(1, 2, 0.1), candidate(2, 5, 0.8), candidate(3, 9, 0.95), candidate(4, 20, 0.5)};

	const auto shortlist = rankShortlist(candidates, cfg);
	ASSERT_EQ(shortlist.size(), 3u); // 4 is in neither top 2
	EXPECT_EQ(shortlist[0].id, 2);   // 1 + 1
	EXPECT_EQ(shortlist[1].id, 3);   // 2 + 0, ties keep the input order
	EXPECT_EQ(shortlist[2].id, 1);   // 0 + 3
}

TEST(Shortlist, IsCapped) {
	MatcherConfig cfg;
	cfg.maxCandidates = 2;

	std::vector<Candidate> candidates;
	for (int i = 0; i < 10; ++i) {
		candidates.push_back(candidate(i, i, 1.0 - 0.05 * i));
	}

	const auto shortlist = rankShortlist(candidates, cfg);
	ASSERT_EQ(shortlist.size(), 2u);
	EXPECT_EQ(shortlist[0].id, 0);
	EXPECT_EQ(shortlist[1].id, 1);
	EXPECT_TRUE(rankShortlist({}, cfg).empty());
}

class ShortlistFiles : public ::testing::Test {
protected:
	void SetUp() override {
		m_dir = std::filesystem::temp_directory_path() / "warlens_shortlist";
		std::filesystem::remove_all(m_dir);
		std::filesystem::create_directories(m_dir);
	}
	void TearDown() override { std::filesystem::remove_all(m_dir); }

	std::string write(const std::string& name, const cv::Mat& image) const {
		const auto path = (m_dir / name).string();
		cv::imwrite(path, image);
		return path;
	}

	std::filesystem::path m_dir;
};

TEST_F(ShortlistFiles, GatesDeduplicatesAndSkipsMissing) {
	const MatcherConfig cfg;
	auto caches = makeCacheContext(cfg);
	BatchScope scope;

	const auto same   = write("same.png", textCrop("Ragnar", {300, 80}));
	const auto wide   = write("wide.png", textCrop("Ragnar", {500, 80}));
	const auto square = write("square.png", textCrop("R", {300, 300}));

	const std::vector<IdentityRef> refs{
	    {1, same}, {2, same}, {3, wide}, {4, square}, {5, (m_dir / "missing.png").string()},
	};

	const auto query      = buildDescriptor(textCrop("Ragnar", {300, 80}), cfg.canonicalSize, &scope);
	const auto candidates = gatherCandidates(refs, query, cfg, *caches, scope);

	ASSERT_EQ(candidates.size(), 1u);
	EXPECT_EQ(candidates[0].id, 1); // first identity listed for a path wins
	EXPECT_EQ(candidates[0].hashDistance, 0);
	EXPECT_NEAR(candidates[0].profileCos, 1.0, 1e-5);

	// Descriptors of readable references are cached by path.
	EXPECT_TRUE(caches->descriptors->get(same).has_value());
	EXPECT_TRUE(caches->descriptors->get(wide).has_value());
	EXPECT_FALSE(caches->descriptors->get((m_dir / "missing.png").string()).has_value());
}

} // namespace warlens::gtest
