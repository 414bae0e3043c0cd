#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <future>
#include <memory>

#include "service/anonymizer_service.hpp"
#include "service/request_handler.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace {

bool readDocument(const std::string &source, std::string &out)
{
    if (source == "-") {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        out = oss.str();
        return true;
    }
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    out = oss.str();
    return true;
}

} // namespace

// Usage: piianon <config> [request.json ...]
// Each request document yields one response line on stdout, in argument order.
// Without request files a single document is read from stdin.
int main(int argc, char** argv) {
    using namespace piianon;

    util::logger::setLogLevel(util::logger::LogLevel::INFO);

    auto settings = std::make_shared<config::AnonymizerConfig>();
    std::string configPath = "piianon.conf";
    if (argc > 1) {
        configPath = argv[1];
    }

    std::unique_ptr<service::AnonymizerService> anonymizer;
    try {
        util::ConfigParser configParser(*settings);
        configParser.loadFromFile(configPath);

        util::logger::setLogLevel(util::logger::parseLogLevel(settings->logLevel));
        if (!settings->logFile.empty() && !util::logger::enableFileOutput(settings->logFile)) {
            util::logger::warn("[main] Could not open log file " + settings->logFile);
        }

        anonymizer = std::make_unique<service::AnonymizerService>(settings);
    }
    catch (const std::exception &ex) {
        util::logger::critical(std::string("[main] Startup failed: ") + ex.what());
        return 1;
    }

    std::vector<std::string> sources;
    for (int i = 2; i < argc; ++i) {
        sources.emplace_back(argv[i]);
    }
    if (sources.empty()) {
        sources.emplace_back("-");
    }

    util::ThreadPool pool(settings->workerThreads);
    util::logger::info("[main] Processing " + std::to_string(sources.size()) + " request(s) on " +
                       std::to_string(pool.size()) + " worker(s)");

    const service::AnonymizerService &svc = *anonymizer;
    std::vector<std::future<service::Response>> pending;
    pending.reserve(sources.size());
    for (const auto &source : sources) {
        std::string document;
        if (!readDocument(source, document)) {
            std::promise<service::Response> failed;
            failed.set_value(service::Response(400, "cannot read request file " + source));
            pending.push_back(failed.get_future());
            continue;
        }
        pending.push_back(pool.enqueue([&svc, doc = std::move(document)] {
            return service::handleRequest(svc, doc);
        }));
    }

    int failures = 0;
    for (auto &f : pending) {
        service::Response response = f.get();
        if (!response.ok()) {
            ++failures;
        }
        std::cout << response.toJson() << std::endl;
    }

    util::logger::info("[main] Done, " + std::to_string(failures) + " request(s) failed");
    return failures == 0 ? 0 : 2;
}
