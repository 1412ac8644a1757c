#include "noughts/gameServer.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char** argv) {
	noughts::app::ServerConfig config;
	unsigned idleTimeout = noughts::network::core::DEFAULT_IDLE_TIMEOUT_S;

	po::options_description desc("Noughts server options");
	// clang-format off
	desc.add_options()
		("help,h", "Print this help message")
		("host", po::value<std::string>(&config.host)->default_value(config.host), "Address to listen on")
		("port,p", po::value<std::uint16_t>(&config.port)->default_value(config.port), "TCP port to listen on")
		("max-workers", po::value<std::size_t>(&config.workers)->default_value(config.workers), "IO worker threads")
		("max-connections", po::value<std::size_t>(&config.maxConnections)->default_value(config.maxConnections), "Connections served at once. 0 for no limit")
		("idle-timeout", po::value<unsigned>(&idleTimeout)->default_value(idleTimeout), "Seconds before a silent connection is closed. 0 disables");
	// clang-format on

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
		po::notify(vm);
	} catch (const po::error& e) {
		std::cerr << e.what() << "\n" << desc << std::endl;
		return 1;
	}

	if (vm.count("help")) {
		std::cout << desc << std::endl;
		return 0;
	}
	config.idleTimeout = std::chrono::seconds(idleTimeout);

	noughts::app::GameServer server(config);
	if (!server.start()) {
		std::cerr << "Could not start the server on " << config.host << ":" << config.port << ".\n";
		return 1;
	}
	std::cout << "Listening on " << config.host << ":" << server.port() << ". Type 'quit' to stop.\n";

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
