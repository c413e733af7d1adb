#include "banchess/config.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace banchess::server {

using nlohmann::json;

std::optional<ServerConfig> parseConfig(const std::string& text) {
	const auto document = json::parse(text, nullptr, false);
	if (document.is_discarded() || !document.is_object()) {
		Logger().Log(Logging::LogLevel::Error, "[Config] Configuration is not a JSON object.");
		return {};
	}

	ServerConfig config;
	try {
		config.port               = document.value("port", config.port);
		config.graceWindowSeconds = document.value("graceWindowSeconds", config.graceWindowSeconds);
		config.retireDelaySeconds = document.value("retireDelaySeconds", config.retireDelaySeconds);
		config.giveTimeSeconds    = document.value("giveTimeSeconds", config.giveTimeSeconds);
		config.idleTimeoutSeconds = document.value("idleTimeoutSeconds", config.idleTimeoutSeconds);
		config.maxQueuedMessages  = document.value("maxQueuedMessages", config.maxQueuedMessages);
		config.persistenceDir     = document.value("persistenceDir", config.persistenceDir.string());
		config.authToken          = document.value("authToken", config.authToken);

		if (document.contains("defaultTimeControl")) {
			const auto& tc = document.at("defaultTimeControl");
			if (tc.is_null()) {
				config.defaultTimeControl.reset();
			} else {
				config.defaultTimeControl = engine::TimeControl{
				        .initialSeconds   = tc.at("initial").get<unsigned>(),
				        .incrementSeconds = tc.value("increment", 0u),
				};
			}
		}
	} catch (const json::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] Invalid configuration: {}", ex.what()));
		return {};
	}

	if (config.defaultTimeControl && !engine::isValid(*config.defaultTimeControl)) {
		Logger().Log(Logging::LogLevel::Error, "[Config] defaultTimeControl is out of range.");
		return {};
	}
	if (config.giveTimeSeconds == 0u || config.giveTimeSeconds > engine::MAX_GIVE_TIME_SECONDS) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] giveTimeSeconds must be in [1, {}].", engine::MAX_GIVE_TIME_SECONDS));
		return {};
	}
	if (config.maxQueuedMessages == 0u) {
		Logger().Log(Logging::LogLevel::Error, "[Config] maxQueuedMessages must be positive.");
		return {};
	}
	return config;
}

std::optional<ServerConfig> loadConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] Could not open '{}'.", path.string()));
		return {};
	}

	std::stringstream buffer;
	buffer << file.rdbuf();
	return parseConfig(buffer.str());
}

} // namespace banchess::server
