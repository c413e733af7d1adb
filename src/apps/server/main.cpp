#include "banchess/config.hpp"
#include "banchess/gameServer.hpp"

#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv) {
	std::optional<banchess::server::ServerConfig> config = banchess::server::ServerConfig{};
	if (argc > 1) {
		config = banchess::server::loadConfig(argv[1]);
		if (!config) {
			std::cerr << "Invalid configuration file: " << argv[1] << '\n';
			return 1;
		}
	}

	banchess::server::GameServer server(*config);
	if (!server.start()) {
		std::cerr << "Could not start the server on port " << config->port << '\n';
		return 1;
	}
	std::cout << "Ban Chess server listening on port " << server.port() << ". Type 'quit' to stop.\n";

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
