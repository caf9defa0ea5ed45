#include "vision/scopedTimer.hpp"

#include <format>

namespace warlens {

ScopedTimer::ScopedTimer(std::string label, Logging::Logger logger)
    : m_label(std::move(label)), m_logger(std::move(logger)), m_start(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
	m_logger.Log(Logging::LogLevel::Debug, std::format("[Timing] {} took {:.2f} ms.", m_label, elapsedMs()));
}

double ScopedTimer::elapsedMs() const {
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - m_start).count();
}

} // namespace warlens
