#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include "HarvestTimer.hpp"
#include "HttpPayloadSender.hpp"
#include "LogReporter.hpp"
#include "RemoteLogger.hpp"
#include "logship/AgentConfig.hpp"

using namespace logship;

namespace {

// "WARN something happened" -> (Warn, "something happened"); lines without a
// recognizable level are logged at INFO.
std::pair<LogLevel, std::string> splitLine(const std::string& line) {
    auto space = line.find(' ');
    if (space != std::string::npos) {
        LogLevel level = parseLogLevel(line.substr(0, space), LogLevel::None);
        if (level != LogLevel::None) {
            return {level, line.substr(space + 1)};
        }
    }
    return {LogLevel::Info, line};
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = argc > 1 ? AgentConfig::fromFile(argv[1]) : std::make_shared<AgentConfig>();
        config->applyEnvironment();

        std::filesystem::create_directories(config->dataDir);
        auto sender = std::make_shared<HttpPayloadSender>(config->collector);
        auto reporter = LogReporter::initialize(config->dataDir, config, sender);

        RemoteLogger logger(reporter, config);
        HarvestTimer harvest(reporter, config->harvestPeriod);
        harvest.start();

        std::cout << "logship agent reading stdin; collector "
                  << config->collector.host << ":" << config->collector.port << config->collector.path << std::endl;

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;
            auto parsed = splitLine(line);
            logger.log(parsed.first, parsed.second);
        }

        logger.flush();
        harvest.stop();
        logger.shutdown();
        // Ship what is left before exiting.
        harvest.tick();
        reporter->finalizeWorkingFile();
        LogReporter::resetInstance();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
