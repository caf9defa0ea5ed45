#pragma once

#include "Logger/Logger.hpp"

#include <chrono>
#include <string>

namespace warlens {

//! Logs the wall time between construction and destruction at debug level.
class ScopedTimer {
public:
	ScopedTimer(std::string label, Logging::Logger logger);
	~ScopedTimer();

	ScopedTimer(const ScopedTimer&)            = delete;
	ScopedTimer& operator=(const ScopedTimer&) = delete;

	//! Milliseconds since construction.
	double elapsedMs() const;

private:
	std::string m_label;
	Logging::Logger m_logger;
	std::chrono::steady_clock::time_point m_start;
};

} // namespace warlens
