#pragma once

#include "match/batchScope.hpp"
#include "match/cacheContext.hpp"
#include "match/config.hpp"
#include "match/shortlist.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <vector>

namespace warlens::match {

//! Query features computed once per resolution call and reused for every candidate.
struct QueryContext {
	std::uint64_t hash = 0;
	cv::Mat gray;      //!< Canonical gray.
	cv::Mat center;    //!< Central crop of the gray.
	cv::Mat sobel;     //!< Normalised gradient magnitude.
	cv::Mat ink;       //!< Ink mask.
	cv::Mat profile;   //!< Ink column profile.
	double coverage = 0.0;
	double centerFrac = 0.9;
};

QueryContext makeQueryContext(const cv::Mat& gray, std::uint64_t hash, double centerFrac, BatchScope* scope = nullptr);

//! Similarity of an aligned candidate to the query.
struct AcceptanceScores {
	double fullNcc       = 0.0;
	double centerNcc     = 0.0;
	double edgeNcc       = 0.0;
	double inkIou        = 0.0;
	double profileCos    = 0.0;
	double shiftedCos    = 0.0; //!< Best profile cosine over small column shifts.
	double coverageDelta = 1.0;
};

AcceptanceScores scoreAlignment(const QueryContext& query, const cv::Mat& aligned, const VerifyParams& params, BatchScope* scope = nullptr);

/*! Acceptance rule of an aligned candidate. Accepts if
 *  - the shifted profile matches strongly and the ink coverage agrees, or
 *  - centre, edge and text checks pass, or
 *  - full NCC and text checks pass together with centre or edge.
 */
bool acceptScores(const AcceptanceScores& scores, const VerifyParams& params);

//! Resources one verification pass may use.
struct VerifyResources {
	RotationCache& rotations;
	BatchScope* scope = nullptr;
};

/*! One verification pass: phase correlation and/or the ECC grid of `params`.
 * \return True on the first alignment that is accepted.
 */
bool verifyCandidate(const QueryContext& query, const cv::Mat& candidateGray, const VerifyParams& params, VerifyResources resources);

//! States of the tiered verification.
enum class VerifyState { FastReject, Tier1, Tier2Escalate, Accept, Reject };

const char* toString(VerifyState state);

//! Both the centre NCC and the profile cosine are below the fast reject floors.
bool shouldFastReject(double centerNcc, double profileCos, const MatcherConfig& cfg);

//! Either the centre NCC or the profile cosine is high enough to justify the expensive tier.
bool shouldEscalate(double centerNcc, double profileCos, const MatcherConfig& cfg);

/*! Tiered verification of candidates against one query.
 *
 * FastReject -> Tier1 -> Tier2Escalate, ending in Accept or Reject. Verdicts of each tier are cached under the query
 * hash, the candidate hash and the parameter signature of the tier.
 */
class TieredVerifier {
public:
	TieredVerifier(const MatcherConfig& cfg, CacheContext& caches, BatchScope& scope);

	//! Runs the state machine for one candidate; returns true if it ended in Accept.
	bool verify(const QueryContext& query, const Candidate& candidate);

	//! States visited by the last verify() call, final state included.
	const std::vector<VerifyState>& trace() const { return m_trace; }

private:
	VerifyState onFastReject(double centerNcc, const Candidate& candidate) const;
	VerifyState onTier1(const QueryContext& query, const Candidate& candidate);
	VerifyState onTier2(const QueryContext& query, const Candidate& candidate, double centerNcc);

	//! Cached verdict of a pass, running it on a miss.
	bool cachedVerdict(const QueryContext& query, const Candidate& candidate, const VerifyParams& params, const std::string& signature);

	const MatcherConfig& m_cfg;
	CacheContext& m_caches;
	BatchScope& m_scope;

	VerifyParams m_tier1;
	VerifyParams m_full;
	std::string m_tier1Signature;
	std::string m_fullSignature;

	std::vector<VerifyState> m_trace;
};

} // namespace warlens::match
