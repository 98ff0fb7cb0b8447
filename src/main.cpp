#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/guard_config.hpp"
#include "service/privacy_gateway.hpp"
#include "service/redaction_service.hpp"
#include "service/request.hpp"
#include "service/response.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string readRequestText(const std::string& path) {
    if (path.empty() || path == "-") {
        return readAll(std::cin);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("main: cannot open request file: " + path);
    }
    return readAll(file);
}

} // namespace

// Usage: piiguard [config-file] [request-file|-]
// Reads one JSON request, prints one JSON response on stdout.
int main(int argc, char** argv) {
    auto& log = piiguard::util::logger::Logger::getInstance();

    try {
        // 1. Parse configuration
        piiguard::config::GuardConfig guardConfig;
        piiguard::util::ConfigParser configParser(guardConfig);

        std::string configPath = "piiguard.conf";
        if (argc > 1) {
            configPath = argv[1];
        }
        configParser.loadFromFile(configPath);

        log.setLogLevel(piiguard::util::logger::parseLogLevel(guardConfig.logLevel));
        if (!guardConfig.logFile.empty() && !log.enableFileOutput(guardConfig.logFile, true)) {
            log.warn("[main] Cannot open log file " + guardConfig.logFile + ", console only.");
        }
        log.info("[main] PII Guard starting.");

        // 2. Read and parse the request
        std::string requestPath = argc > 2 ? argv[2] : "-";
        const std::string raw = readRequestText(requestPath);

        piiguard::service::PrivacyGateway gateway(guardConfig);
        piiguard::service::RedactionService service(gateway);

        piiguard::service::Response response;
        try {
            piiguard::service::Request request = piiguard::service::parseRequest(raw);
            log.info("[main] Handling '" + request.mode + "' request.");
            response = service.HandleRequest(request);
        } catch (const std::runtime_error& ex) {
            log.error(std::string("[main] Malformed request: ") + ex.what());
            response = piiguard::service::Response(400, ex.what());
        }

        // 3. Emit the response
        std::cout << response.toJson() << std::endl;
        log.info("[main] Done with status " + std::to_string(response.statusCode) + ".");
        return response.statusCode == 200 ? 0 : 1;
    } catch (const std::exception& ex) {
        log.critical(std::string("[main] Fatal: ") + ex.what());
        return 2;
    }
}
