#include "Logging.hpp"

#include "vision/logSetup.hpp"

#include <mutex>

namespace warlens::match {

Logging::Logger Logger() {
	static Logging::LogConfig config;
	static std::once_flag initFlag;
	std::call_once(initFlag, [] { configureLogging(config, "WarLens/Match"); });

	return Logging::Logger(config);
}

} // namespace warlens::match
