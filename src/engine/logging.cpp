#include "logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace banchess::engine {

static Logging::LogConfig config;

//! Log sessions, matchmaking and persistence to a file + console(for debug builds).
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(Logging::LogLevel::Any);

	const auto logPath = Logging::GetDefaultLogDir("BanChess/Engine");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "log.txt"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nEngine will not log to file.", logPath.string());
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace banchess::engine
