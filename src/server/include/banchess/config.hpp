#pragma once

#include "engine/types.hpp"
#include "network/core/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace banchess::server {

//! Server settings. Every key of the JSON file is optional.
struct ServerConfig {
	std::uint16_t port{network::core::DEFAULT_PORT};
	unsigned graceWindowSeconds{30};  //!< Seat reservation after the last player connection left.
	unsigned retireDelaySeconds{60};  //!< Finished sessions stay attachable this long.
	std::optional<engine::TimeControl> defaultTimeControl{engine::TimeControl{.initialSeconds = 300, .incrementSeconds = 0}}; //!< Empty: untimed.
	unsigned giveTimeSeconds{15};
	unsigned idleTimeoutSeconds{60};  //!< 0 disables the idle check.
	std::size_t maxQueuedMessages{network::core::DEFAULT_MAX_QUEUED_MESSAGES};
	std::filesystem::path persistenceDir{"games"};
	std::string authToken; //!< Empty for guest mode.
};

//! Parse a configuration from JSON text. Returns empty on malformed input.
std::optional<ServerConfig> parseConfig(const std::string& text);

//! Load a configuration file. Returns empty if the file can not be read or is malformed.
std::optional<ServerConfig> loadConfig(const std::filesystem::path& path);

} // namespace banchess::server
