#include "Logging.hpp"

#include "vision/logSetup.hpp"

#include <mutex>

namespace warlens::vision {

Logging::Logger Logger() {
	static Logging::LogConfig config;
	static std::once_flag initFlag;
	std::call_once(initFlag, [] { configureLogging(config, "WarLens/Vision"); });

	return Logging::Logger(config);
}

} // namespace warlens::vision
