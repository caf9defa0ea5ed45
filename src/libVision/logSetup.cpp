#include "vision/logSetup.hpp"

#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>

namespace warlens {

void configureLogging(Logging::LogConfig& config, std::string_view component) {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(Logging::LogLevel::Any);

	const auto logPath = Logging::GetDefaultLogDir(std::string(component));

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Could not create '{}' ({}). {} logs to the console only.\n", logPath.string(), ec.message(), component);
	} else {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "log.txt"));
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

} // namespace warlens
