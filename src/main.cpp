#include "../include/listing_ranker/common/Logger.h"
#include "../include/listing_ranker/config/ScoringConfig.h"
#include "../include/listing_ranker/geo/GeoDistance.h"
#include "../include/listing_ranker/models/Intent.h"
#include "../include/listing_ranker/ranking/RankingPipeline.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace listing_ranker;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInputError = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string configPath;
    std::string intentPath;
    std::string candidatesPath;
    std::optional<geo::Coordinates> target;
    std::optional<geo::Coordinates> avoid;
    std::optional<size_t> topN;
    std::optional<LogLevel> logLevel;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " --intent <file> --candidates <file> [--config <file>]"
                 " [--target lat,lng] [--avoid lat,lng] [--top N]"
                 " [--log-level trace|debug|info|warning|error|none]\n";
}

// Returns nullopt (after printing the problem) on any usage error
std::optional<CliOptions> parseArguments(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return std::nullopt;
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            options.configPath = value;
        } else if (arg == "--intent") {
            options.intentPath = value;
        } else if (arg == "--candidates") {
            options.candidatesPath = value;
        } else if (arg == "--target" || arg == "--avoid") {
            auto coords = geo::parseCoordinates(value);
            if (!coords) {
                std::cerr << "Invalid coordinates for " << arg << ": " << value << "\n";
                return std::nullopt;
            }
            (arg == "--target" ? options.target : options.avoid) = coords;
        } else if (arg == "--top") {
            try {
                size_t consumed = 0;
                long long top = std::stoll(value, &consumed);
                if (consumed != value.size() || top <= 0) {
                    throw std::invalid_argument(value);
                }
                options.topN = static_cast<size_t>(top);
            } catch (const std::exception&) {
                std::cerr << "--top must be a positive integer: " << value << "\n";
                return std::nullopt;
            }
        } else if (arg == "--log-level") {
            options.logLevel = Logger::parseLevel(value);
            if (!options.logLevel) {
                std::cerr << "Unknown log level: " << value << "\n";
                return std::nullopt;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.intentPath.empty() || options.candidatesPath.empty()) {
        std::cerr << "--intent and --candidates are required\n";
        return std::nullopt;
    }
    return options;
}

nlohmann::json readJsonFile(const std::string& path, const std::string& what) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + what + " file: " + path);
    }
    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Cannot parse " + what + " file " + path + ": " + e.what());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::getInstance().initFromEnvironment();

    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (options->logLevel) {
        Logger::getInstance().setLogLevel(*options->logLevel);
    }

    try {
        config::ScoringConfig scoringConfig = options->configPath.empty()
            ? config::ScoringConfig::createDefault()
            : config::ScoringConfig::loadFromFile(options->configPath);
        if (options->topN) {
            scoringConfig.ranking.finalTopN = *options->topN;
        }
        auto sharedConfig = std::make_shared<const config::ScoringConfig>(std::move(scoringConfig));

        nlohmann::json intentJson = readJsonFile(options->intentPath, "intent");
        if (!intentJson.is_object()) {
            throw std::runtime_error("Intent must be a JSON object: " + options->intentPath);
        }
        models::Intent intent = models::Intent::fromJson(intentJson);
        if (!intent.targetLocation.empty() && !options->target) {
            LOG_INFO("Intent names target location '" + intent.targetLocation +
                     "' but no --target coordinates were given; location proximity skipped");
        }
        if (!intent.avoidLocation.empty() && !options->avoid) {
            LOG_INFO("Intent names avoided location '" + intent.avoidLocation +
                     "' but no --avoid coordinates were given; avoidance check skipped");
        }

        nlohmann::json candidatesJson = readJsonFile(options->candidatesPath, "candidates");
        if (candidatesJson.is_object() && candidatesJson.contains("candidates")) {
            candidatesJson = candidatesJson["candidates"];
        }
        if (!candidatesJson.is_array()) {
            throw std::runtime_error("Candidates must be a JSON array: " + options->candidatesPath);
        }

        ranking::RankingPipeline pipeline(sharedConfig);
        auto candidates = ranking::RankingPipeline::parseCandidates(candidatesJson, sharedConfig->poiCatalog);
        LOG_INFO("Loaded " + std::to_string(candidates.size()) + " candidates from " + options->candidatesPath);

        ranking::RankingOutcome outcome = pipeline.rank(candidates, intent, options->target, options->avoid);
        std::cout << outcome.toJson().dump(2) << std::endl;
    } catch (const std::runtime_error& e) {
        LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitInputError;
    }

    return kExitOk;
}
