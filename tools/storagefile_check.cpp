/**
 * @file storagefile_check.cpp
 * @brief Validate file field values against a local storage tree
 *
 * Prints one JSON object per value with the decision and, for upload
 * references, the parsed name parts.
 *
 * Usage:
 *   ./storagefile-check [--field NAME] VALUE...
 *
 * Environment:
 *   STORAGE_ROOT     storage tree root (default ./storage)
 *   STORAGE_TMP_DIR  temporary directory below the root (default tmp)
 *   LOG_LEVEL        trace|debug|info|warn|error|critical|off (default warn)
 *   LOG_TO_FILE, LOG_FILE  optional rotating log file
 *
 * Exit status: 0 all values pass, 1 some value fails, 2 usage or configuration error.
 */

#include <iostream>
#include <string>
#include <vector>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include "storagefile/adapter/local_storage_adapter.h"
#include "storagefile/config/config_manager.h"
#include "storagefile/exception/exceptions.h"
#include "storagefile/logging/logger.h"
#include "storagefile/parser/name_parser.h"
#include "storagefile/validation/file_validator.h"

using namespace storagefile;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--field NAME] VALUE..." << std::endl;
}

Json::Value describe(const validation::FileValidator& validator,
                     const std::string& field, const std::string& value) {
    Json::Value result;
    result["field"] = field;
    result["value"] = value;

    auto outcome = validator.validate(field, value);
    result["passed"] = outcome.passed;
    result["isUrl"] = outcome.isUrl;
    result["reason"] = validation::toString(outcome.reason);
    if (!outcome.temporaryPath.empty()) {
        result["temporaryPath"] = outcome.temporaryPath;
    }
    if (!outcome.passed) {
        result["message"] = validation::FileValidator::message(field);
    }

    // a temporary path is only set once the name has parsed
    if (!outcome.temporaryPath.empty()) {
        auto parsed = parser::NameParser::parse(value);
        Json::Value name;
        name["displayName"] = parsed.getDisplayName();
        name["uniqueId"] = parsed.getUniqueId().getValue();
        name["extension"] = parsed.getExtension();
        name["movedFileName"] = parsed.getMovedFileName();
        result["parsed"] = name;
    }

    return result;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string field = "file";
    std::vector<std::string> values;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--field") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            field = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            values.push_back(arg);
        }
    }

    if (values.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    auto& settings = config::ConfigManager::getInstance();
    logging::Logger::initialize(
        "storagefile-check",
        settings.getString(config::ConfigManager::LOG_LEVEL, "warn"),
        settings.getBool(config::ConfigManager::LOG_TO_FILE, false),
        settings.getString(config::ConfigManager::LOG_FILE)
    );

    try {
        std::string root = settings.getString(config::ConfigManager::STORAGE_ROOT, "./storage");
        adapter::LocalStorageAdapter storage(root);
        validation::FileValidator validator(&storage, validation::ValidatorConfig::fromConfigManager(settings));

        spdlog::info("Checking {} value(s) against {}", values.size(), root);

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";

        bool allPassed = true;
        for (const auto& value : values) {
            Json::Value result = describe(validator, field, value);
            allPassed = allPassed && result["passed"].asBool();
            std::cout << Json::writeString(builder, result) << std::endl;
        }

        logging::Logger::flush();
        return allPassed ? 0 : 1;

    } catch (const exception::ConfigException& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
}
