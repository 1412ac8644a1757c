#include "terminalClient.hpp"

#include "network/core/protocol.hpp"

#include <boost/program_options.hpp>

#include <cstdint>
#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char** argv) {
	std::string host   = noughts::network::core::DEFAULT_HOST;
	std::uint16_t port = noughts::network::core::DEFAULT_PORT;
	std::string username;
	std::string avatar;

	po::options_description desc("Noughts client options");
	// clang-format off
	desc.add_options()
		("help,h", "Print this help message")
		("host", po::value<std::string>(&host)->default_value(host), "Server address")
		("port,p", po::value<std::uint16_t>(&port)->default_value(port), "Server port")
		("username,u", po::value<std::string>(&username), "Display name. The server picks one if empty")
		("avatar", po::value<std::string>(&avatar), "Optional avatar shown to the opponent");
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

	noughts::app::TerminalClient client(username, avatar);
	if (!client.connect(host, port)) {
		std::cerr << "Could not connect to " << host << ":" << port << ".\n";
		return 1;
	}
	std::cout << "Connected to " << host << ":" << port << ". Type 'help' for commands.\n";
	return client.run();
}
