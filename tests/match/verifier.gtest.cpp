#include "match/alignment.hpp"
#include "match/descriptor.hpp"
#include "match/verifier.hpp"
#include "syntheticImages.hpp"

#include <gtest/gtest.h>

namespace warlens::gtest {

using namespace warlens::match;

namespace {

struct Fixture {
	explicit Fixture(MatcherConfig config = {}) : cfg(std::move(config)), caches(makeCacheContext(cfg)) {}

	Candidate candidateOf(const Descriptor& desc, double profileCos) const {
		Candidate c;
		c.id         = 7;
		c.gray       = desc.gray;
		c.hash       = desc.hash;
		c.profileCos = profileCos;
		return c;
	}

	MatcherConfig cfg;
	std::shared_ptr<CacheContext> caches;
	BatchScope scope;
};

} // namespace

TEST(Verifier, AcceptanceRules) {
	const VerifyParams params;

	AcceptanceScores strongText;
	strongText.shiftedCos    = 0.995;
	strongText.coverageDelta = 0.01;
	EXPECT_TRUE(acceptScores(strongText, params));

	strongText.coverageDelta = 0.2;
	EXPECT_FALSE(acceptScores(strongText, params));

	AcceptanceScores aligned;
	aligned.centerNcc  = 0.9;
	aligned.edgeNcc    = 0.75;
	aligned.inkIou     = 0.8;
	aligned.profileCos = 0.95;
	EXPECT_TRUE(acceptScores(aligned, params));

	aligned.inkIou = 0.5; // text check fails
	EXPECT_FALSE(acceptScores(aligned, params));

	AcceptanceScores full;
	full.fullNcc    = 0.85;
	full.edgeNcc    = 0.72;
	full.inkIou     = 0.8;
	full.profileCos = 0.95;
	EXPECT_TRUE(acceptScores(full, params));

	full.edgeNcc = 0.5; // neither centre nor edge
	EXPECT_FALSE(acceptScores(full, params));
}

TEST(Verifier, Guards) {
	const MatcherConfig cfg;
	EXPECT_TRUE(shouldFastReject(0.1, 0.5, cfg));
	EXPECT_FALSE(shouldFastReject(0.5, 0.5, cfg));
	EXPECT_FALSE(shouldFastReject(0.1, 0.9, cfg));

	EXPECT_TRUE(shouldEscalate(0.6, 0.0, cfg));
	EXPECT_TRUE(shouldEscalate(0.0, 0.95, cfg));
	EXPECT_FALSE(shouldEscalate(0.5, 0.85, cfg));
}

TEST(Verifier, TierSignaturesDiffer) {
	MatcherConfig cfg;
	EXPECT_NE(cfg.tier1Params().signature(), cfg.verify.signature());
	EXPECT_EQ(cfg.verify.signature(), MatcherConfig{}.verify.signature());

	cfg.tier1Rotations.clear();
	cfg.tier1GaussSizes.clear();
	cfg.tier1Kinds.clear();
	const auto tier1 = cfg.tier1Params();
	EXPECT_EQ(tier1.rotations, std::vector<double>{0.0});
	EXPECT_EQ(tier1.gaussSizes, std::vector<int>{5});
	ASSERT_EQ(tier1.kinds.size(), 1u);
	EXPECT_EQ(tier1.kinds[0], MotionKind::Euclidean);
}

TEST(Verifier, PhaseAlignmentRecoversShift) {
	const cv::Mat gray    = canonicalGray(textCrop("Ragnar"), {256, 64});
	const cv::Mat moved   = shiftedRotated(gray, 3.0, -2.0, 0.0);
	const auto alignment  = phaseAlign(gray, moved);

	EXPECT_NEAR(alignment.dx, 3.0, 0.5);
	EXPECT_NEAR(alignment.dy, -2.0, 0.5);
	EXPECT_GT(ncc(gray, alignment.aligned), ncc(gray, moved));
	EXPECT_GT(ncc(gray, alignment.aligned), 0.9);
}

TEST(Verifier, SelfCandidateAcceptedInFirstTier) {
	Fixture f;
	const auto desc  = buildDescriptor(textCrop("Ragnar"), f.cfg.canonicalSize);
	const auto query = makeQueryContext(desc.gray, desc.hash, f.cfg.verify.centerFrac);

	TieredVerifier verifier(f.cfg, *f.caches, f.scope);
	EXPECT_TRUE(verifier.verify(query, f.candidateOf(desc, 1.0)));
	EXPECT_EQ(verifier.trace(), (std::vector<VerifyState>{VerifyState::FastReject, VerifyState::Tier1, VerifyState::Accept}));

	const auto cached = f.caches->verdicts->get({desc.hash, desc.hash, f.cfg.tier1Params().signature()});
	ASSERT_TRUE(cached.has_value());
	EXPECT_TRUE(*cached);
}

TEST(Verifier, FastRejectEndsEarly) {
	MatcherConfig cfg;
	cfg.fastRejectCenterNcc  = 2.0;
	cfg.fastRejectProfileCos = 2.0;
	Fixture f(cfg);

	const auto desc  = buildDescriptor(textCrop("Ragnar"), f.cfg.canonicalSize);
	const auto query = makeQueryContext(desc.gray, desc.hash, f.cfg.verify.centerFrac);

	TieredVerifier verifier(f.cfg, *f.caches, f.scope);
	EXPECT_FALSE(verifier.verify(query, f.candidateOf(desc, 1.0)));
	EXPECT_EQ(verifier.trace(), (std::vector<VerifyState>{VerifyState::FastReject, VerifyState::Reject}));
	EXPECT_EQ(f.caches->verdicts->size(), 0u);
}

TEST(Verifier, EscalatesAfterFailedFirstTier) {
	Fixture f;
	const auto desc  = buildDescriptor(textCrop("Ragnar"), f.cfg.canonicalSize);
	const auto query = makeQueryContext(desc.gray, desc.hash, f.cfg.verify.centerFrac);

	// Cached verdicts decide both tiers.
	f.caches->verdicts->put({desc.hash, desc.hash, f.cfg.tier1Params().signature()}, false);
	f.caches->verdicts->put({desc.hash, desc.hash, f.cfg.verify.signature()}, true);

	TieredVerifier verifier(f.cfg, *f.caches, f.scope);
	EXPECT_TRUE(verifier.verify(query, f.candidateOf(desc, 1.0)));
	EXPECT_EQ(verifier.trace(),
	          (std::vector<VerifyState>{VerifyState::FastReject, VerifyState::Tier1, VerifyState::Tier2Escalate, VerifyState::Accept}));
}

TEST(Verifier, NoEscalationBelowThresholds) {
	MatcherConfig cfg;
	cfg.escalateCenterNcc  = 2.0;
	cfg.escalateProfileCos = 2.0;
	Fixture f(cfg);

	const auto desc  = buildDescriptor(textCrop("Ragnar"), f.cfg.canonicalSize);
	const auto query = makeQueryContext(desc.gray, desc.hash, f.cfg.verify.centerFrac);
	f.caches->verdicts->put({desc.hash, desc.hash, f.cfg.tier1Params().signature()}, false);

	TieredVerifier verifier(f.cfg, *f.caches, f.scope);
	EXPECT_FALSE(verifier.verify(query, f.candidateOf(desc, 1.0)));
	EXPECT_EQ(verifier.trace(), (std::vector<VerifyState>{VerifyState::FastReject, VerifyState::Tier1, VerifyState::Reject}));
}

TEST(Verifier, NonTieredRunsFullPassOnly) {
	MatcherConfig cfg;
	cfg.tiered     = false;
	cfg.fastReject = false;
	Fixture f(cfg);

	const auto desc  = buildDescriptor(textCrop("Ragnar"), f.cfg.canonicalSize);
	const auto query = makeQueryContext(desc.gray, desc.hash, f.cfg.verify.centerFrac);

	TieredVerifier verifier(f.cfg, *f.caches, f.scope);
	EXPECT_TRUE(verifier.verify(query, f.candidateOf(desc, 1.0)));
	EXPECT_EQ(verifier.trace(), (std::vector<VerifyState>{VerifyState::Tier2Escalate, VerifyState::Accept}));
	EXPECT_TRUE(f.caches->verdicts->get({desc.hash, desc.hash, f.cfg.verify.signature()}).has_value());
}

TEST(Verifier, EccOnlyMethodAlignsRotation) {
	VerifyParams params;
	params.method = VerifyMethod::Ecc;

	auto caches         = makeCacheContext(MatcherConfig{});
	const cv::Mat gray  = canonicalGray(textCrop("Ragnar"), {256, 64});
	const cv::Mat moved = shiftedRotated(gray, 1.0, 1.0, 1.0);
	const auto query    = makeQueryContext(gray, dhash64(gray), params.centerFrac);

	EXPECT_TRUE(verifyCandidate(query, moved, params, {*caches->rotations, nullptr}));
}

TEST(Verifier, EccFailureIsLocal) {
	const cv::Mat textured = canonicalGray(textCrop("Ragnar"), {256, 64});
	const cv::Mat flat(textured.size(), CV_8U, cv::Scalar(128));

	EXPECT_FALSE(eccAlign(textured, flat, MotionKind::Euclidean, 50, 1e-5, 5).has_value());
	EXPECT_FALSE(eccAlign(flat, textured, MotionKind::Affine, 50, 1e-5, 5).has_value());

	VerifyParams params;
	params.method = VerifyMethod::Ecc;

	auto caches      = makeCacheContext(MatcherConfig{});
	const auto query = makeQueryContext(textured, dhash64(textured), params.centerFrac);

	bool accepted = true;
	EXPECT_NO_THROW(accepted = verifyCandidate(query, flat, params, {*caches->rotations, nullptr}));
	EXPECT_FALSE(accepted);
}

} // namespace warlens::gtest
