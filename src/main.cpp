#include "NsmHttpServer.hpp"
#include <iostream>

int main() {
    try {
        nsm::Config config = nsm::Config::fromEnvironment();
        std::string host = config.host;
        int port = config.port;
        NsmHttpServer app(host, port, std::move(config));
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
