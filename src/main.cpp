#include "PhonoMatchHttpServer.hpp"
#include <cstdlib>
#include <iostream>

namespace {

std::string envOr(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : def;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string corpus = argc > 1 ? argv[1] : envOr("PHONOMATCH_CORPUS", "data/metadata.json");
        std::string host = envOr("PHONOMATCH_HOST", "0.0.0.0");
        int port = 8080;
        std::string portStr = envOr("PHONOMATCH_PORT", "");
        if (!portStr.empty()) {
            try {
                port = std::stoi(portStr);
            } catch (const std::exception& e) {
                std::cerr << "Ignoring PHONOMATCH_PORT=" << portStr << " (" << e.what() << ")\n";
            }
        }
        PhonoMatchHttpServer app(host, port, corpus);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
