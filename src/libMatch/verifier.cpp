#include "match/verifier.hpp"

#include "Logging.hpp"
#include "match/alignment.hpp"
#include "match/textFeatures.hpp"

#include <cmath>
#include <format>

namespace warlens::match {

QueryContext makeQueryContext(const cv::Mat& gray, std::uint64_t hash, double centerFrac, BatchScope* scope) {
	QueryContext ctx;
	ctx.hash       = hash;
	ctx.gray       = gray;
	ctx.centerFrac = centerFrac;
	ctx.center     = cropCenter(gray, centerFrac);
	ctx.sobel      = sobelMagnitude(gray);
	ctx.ink        = inkMask(gray, scope);
	ctx.profile    = columnProfile(ctx.ink);
	ctx.coverage   = coverage(ctx.ink);
	return ctx;
}

AcceptanceScores scoreAlignment(const QueryContext& query, const cv::Mat& aligned, const VerifyParams& params, BatchScope* scope) {
	AcceptanceScores s;
	s.fullNcc   = ncc(query.gray, aligned, scope);
	s.centerNcc = ncc(query.center, cropCenter(aligned, params.centerFrac), scope);
	s.edgeNcc   = ncc(query.sobel, sobelMagnitude(aligned));

	const cv::Mat ink     = inkMask(aligned);
	const cv::Mat profile = columnProfile(ink);
	s.inkIou              = maskIou(query.ink, ink);
	s.profileCos          = cosine(query.profile, profile);
	s.shiftedCos          = bestShiftedCosine(query.profile, profile, params.profileMaxShift).first;
	s.coverageDelta       = std::abs(query.coverage - coverage(ink));
	return s;
}

bool acceptScores(const AcceptanceScores& s, const VerifyParams& params) {
	const bool fullOk     = s.fullNcc >= params.nccThr;
	const bool centerOk   = s.centerNcc >= params.nccCenterThr;
	const bool edgeOk     = s.edgeNcc >= params.edgeNccThr;
	const bool textStrong = s.shiftedCos >= params.profileShiftedThr && s.coverageDelta <= params.coverageDeltaMax;
	const bool textOk     = (s.inkIou >= params.inkIouThr && s.profileCos >= params.profileCosThr) || textStrong;

	if (textStrong) {
		return true;
	}
	if (centerOk && edgeOk && textOk) {
		return true;
	}
	return fullOk && textOk && (centerOk || edgeOk);
}

bool verifyCandidate(const QueryContext& query, const cv::Mat& candidateGray, const VerifyParams& params, VerifyResources resources) {
	auto accepted = [&](const cv::Mat& aligned) { return acceptScores(scoreAlignment(query, aligned, params, resources.scope), params); };

	if (params.method != VerifyMethod::Ecc) {
		const auto phase = phaseAlign(query.gray, candidateGray, resources.scope);
		if (std::abs(phase.dx) <= params.maxShift && std::abs(phase.dy) <= params.maxShift && accepted(phase.aligned)) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Verifier] Phase correlation accepted at ({:.2f}, {:.2f}).", phase.dx, phase.dy));
			return true;
		}
		if (params.method == VerifyMethod::Phase) {
			return false;
		}
	}

	for (const double angle : params.rotations) {
		const cv::Mat rotated = std::abs(angle) > 1e-6 ? rotateGrayCached(candidateGray, angle, resources.rotations) : candidateGray;
		for (const int gaussSize : params.gaussSizes) {
			for (const MotionKind kind : params.kinds) {
				const auto ecc = eccAlign(query.gray, rotated, kind, params.eccMaxIter, params.eccEps, gaussSize, resources.scope);
				if (!ecc) {
					continue;
				}
				if (params.eccCcMin > 0.0 && ecc->correlation < params.eccCcMin) {
					continue;
				}
				if (accepted(ecc->aligned)) {
					Logger().Log(Logging::LogLevel::Debug,
					             std::format("[Verifier] ECC accepted (rotation {}, gauss {}, {}, cc {:.3f}).", angle, gaussSize, toString(kind), ecc->correlation));
					return true;
				}
			}
		}
	}
	return false;
}

const char* toString(VerifyState state) {
	switch (state) {
	case VerifyState::FastReject: return "FastReject";
	case VerifyState::Tier1: return "Tier1";
	case VerifyState::Tier2Escalate: return "Tier2Escalate";
	case VerifyState::Accept: return "Accept";
	case VerifyState::Reject: return "Reject";
	}
	return "Unknown";
}

bool shouldFastReject(double centerNcc, double profileCos, const MatcherConfig& cfg) {
	return centerNcc < cfg.fastRejectCenterNcc && profileCos < cfg.fastRejectProfileCos;
}

bool shouldEscalate(double centerNcc, double profileCos, const MatcherConfig& cfg) {
	return centerNcc >= cfg.escalateCenterNcc || profileCos >= cfg.escalateProfileCos;
}

TieredVerifier::TieredVerifier(const MatcherConfig& cfg, CacheContext& caches, BatchScope& scope)
    : m_cfg(cfg), m_caches(caches), m_scope(scope), m_tier1(cfg.tier1Params()), m_full(cfg.verify), m_tier1Signature(m_tier1.signature()),
      m_fullSignature(m_full.signature()) {
}

bool TieredVerifier::verify(const QueryContext& query, const Candidate& candidate) {
	m_trace.clear();

	const double centerNcc = ncc(query.center, cropCenter(candidate.gray, query.centerFrac), &m_scope);

	VerifyState state = VerifyState::FastReject;
	if (!m_cfg.fastReject) {
		state = m_cfg.tiered ? VerifyState::Tier1 : VerifyState::Tier2Escalate;
	}

	while (true) {
		m_trace.push_back(state);
		switch (state) {
		case VerifyState::FastReject:
			state = onFastReject(centerNcc, candidate);
			break;
		case VerifyState::Tier1:
			state = onTier1(query, candidate);
			if (state == VerifyState::Reject && shouldEscalate(centerNcc, candidate.profileCos, m_cfg)) {
				state = VerifyState::Tier2Escalate;
			}
			break;
		case VerifyState::Tier2Escalate:
			state = onTier2(query, candidate, centerNcc);
			break;
		case VerifyState::Accept:
			return true;
		case VerifyState::Reject:
			return false;
		}
	}
}

VerifyState TieredVerifier::onFastReject(double centerNcc, const Candidate& candidate) const {
	if (shouldFastReject(centerNcc, candidate.profileCos, m_cfg)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Verifier] Fast reject of identity {} (centre ncc {:.3f}, profile {:.3f}).", candidate.id,
		                                                   centerNcc, candidate.profileCos));
		return VerifyState::Reject;
	}
	return m_cfg.tiered ? VerifyState::Tier1 : VerifyState::Tier2Escalate;
}

VerifyState TieredVerifier::onTier1(const QueryContext& query, const Candidate& candidate) {
	return cachedVerdict(query, candidate, m_tier1, m_tier1Signature) ? VerifyState::Accept : VerifyState::Reject;
}

VerifyState TieredVerifier::onTier2(const QueryContext& query, const Candidate& candidate, double centerNcc) {
	Logger().Log(Logging::LogLevel::Debug, std::format("[Verifier] Full verification of identity {} (centre ncc {:.3f}, profile {:.3f}).", candidate.id,
	                                                   centerNcc, candidate.profileCos));
	return cachedVerdict(query, candidate, m_full, m_fullSignature) ? VerifyState::Accept : VerifyState::Reject;
}

bool TieredVerifier::cachedVerdict(const QueryContext& query, const Candidate& candidate, const VerifyParams& params, const std::string& signature) {
	const VerdictKey key{query.hash, candidate.hash, signature};
	if (const auto cached = m_caches.verdicts->get(key)) {
		return *cached;
	}

	const bool verdict = verifyCandidate(query, candidate.gray, params, {*m_caches.rotations, &m_scope});
	m_caches.verdicts->put(key, verdict);
	return verdict;
}

} // namespace warlens::match
