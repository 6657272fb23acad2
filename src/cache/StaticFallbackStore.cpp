#include <filesystem>
#include <set>
#include <system_error>

#include "StaticFallbackStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/EndpointMapping.hpp"
#include "../parsers/CsvTableParser.hpp"
#include "../utils/Utils.hpp"

namespace fs = std::filesystem;

StaticFallbackStore::StaticFallbackStore(std::string directory,
                                         size_t max_cache_size,
                                         std::chrono::milliseconds cache_ttl,
                                         std::shared_ptr<ILogger> logger)
    : directory_(std::move(directory)), cache_(max_cache_size, cache_ttl), logger_(logger) {
    if (!directoryAvailable()) {
        logger_->warn("Static fallback directory '" + directory_ + "' does not exist; static tier will always miss");
    }
}

std::string StaticFallbackStore::pathFor(const std::string& file_name) const {
    return (fs::path(directory_) / file_name).string();
}

std::shared_ptr<const TableRecord> StaticFallbackStore::lookup(const std::string& endpoint,
                                                               const std::optional<std::string>& sub_option) {
    const EndpointMapping* mapping = EndpointCatalog::find(endpoint);
    if (mapping == nullptr) {
        logger_->debug("Static fallback: unknown endpoint " + endpoint);
        return nullptr;
    }

    // Unknown sub-options share the default slot
    const bool known_sub_option = sub_option && mapping->hasSubOption(*sub_option);
    const std::string cache_key = endpoint + "|" + (known_sub_option ? *sub_option : std::string("default"));

    if (auto cached = cache_.get(cache_key)) {
        logger_->debug("Static fallback cache hit for " + cache_key);
        return cached;
    }

    const std::string& file_name = mapping->sourceFor(known_sub_option ? sub_option : std::nullopt);
    TableParseOutcome outcome = CsvTableParser::parseFile(pathFor(file_name));
    if (!outcome.ok()) {
        logger_->warn("Static fallback file " + file_name + " unusable for " + endpoint + ": " + outcome.error);
        return nullptr;
    }

    auto record = std::make_shared<const TableRecord>(std::move(*outcome.record));
    cache_.put(cache_key, record);
    logger_->info("Loaded static fallback " + file_name + " for " + cache_key + " (" +
                  std::to_string(record->body.size()) + " rows)");
    return record;
}

json StaticFallbackStore::validateInventory() const {
    json report = {
        {"csv_directory", directory_},
        {"directory_exists", directoryAvailable()},
        {"total_endpoints", EndpointCatalog::mappings().size()},
        {"valid_endpoints", 0},
        {"invalid_endpoints", 0},
        {"endpoints", json::object()},
        {"missing_files_list", json::array()},
        {"validation_timestamp", Utils::formatUtc(std::chrono::system_clock::now())}
    };

    std::set<std::string> all_files;
    std::set<std::string> usable_files;
    std::set<std::string> missing_files;
    json file_reports = json::object();

    auto inspect = [&](const std::string& file_name) -> bool {
        if (file_reports.contains(file_name)) {
            return file_reports[file_name]["parseable"].get<bool>();
        }
        all_files.insert(file_name);

        std::error_code ec;
        const std::string path = pathFor(file_name);
        const bool exists = fs::is_regular_file(path, ec);
        const auto size = exists ? fs::file_size(path, ec) : 0;

        json file_report = {{"exists", exists}, {"size", ec ? 0 : size}, {"parseable", false}};
        if (exists) {
            TableParseOutcome outcome = CsvTableParser::parseFile(path);
            file_report["parseable"] = outcome.ok();
            if (outcome.ok()) {
                file_report["rows"] = outcome.record->body.size();
                usable_files.insert(file_name);
            } else {
                file_report["error"] = outcome.error;
            }
        } else {
            missing_files.insert(file_name);
        }
        file_reports[file_name] = file_report;
        return file_report["parseable"].get<bool>();
    };

    int valid_endpoints = 0;
    int invalid_endpoints = 0;
    for (const auto& [name, mapping] : EndpointCatalog::mappings()) {
        json endpoint_report = {
            {"default_file", mapping.default_source},
            {"default_file_usable", inspect(mapping.default_source)},
            {"sub_options_count", mapping.sub_options.size()},
            {"valid_sub_options", 0},
            {"errors", json::array()}
        };
        if (!endpoint_report["default_file_usable"].get<bool>()) {
            endpoint_report["errors"].push_back("Default file '" + mapping.default_source + "' missing or unparseable");
        }

        int valid_sub_options = 0;
        json files = json::object();
        for (const auto& [sub_option, file_name] : mapping.sub_options) {
            if (inspect(file_name)) {
                ++valid_sub_options;
            } else {
                endpoint_report["errors"].push_back("Sub-option '" + sub_option + "' file '" + file_name + "' missing or unparseable");
            }
            files[file_name] = file_reports[file_name];
        }
        files[mapping.default_source] = file_reports[mapping.default_source];
        endpoint_report["valid_sub_options"] = valid_sub_options;
        endpoint_report["files"] = files;

        const bool valid = endpoint_report["errors"].empty();
        endpoint_report["valid"] = valid;
        if (valid) {
            ++valid_endpoints;
        } else {
            ++invalid_endpoints;
        }
        report["endpoints"][name] = endpoint_report;
    }

    report["valid_endpoints"] = valid_endpoints;
    report["invalid_endpoints"] = invalid_endpoints;
    report["total_files"] = all_files.size();
    report["existing_files"] = all_files.size() - missing_files.size();
    report["missing_files"] = missing_files.size();
    report["usable_files"] = usable_files.size();
    for (const auto& file_name : missing_files) {
        report["missing_files_list"].push_back(file_name);
    }

    if (usable_files.size() == all_files.size()) {
        report["overall_status"] = "valid";
    } else if (!usable_files.empty()) {
        report["overall_status"] = "partial";
    } else {
        report["overall_status"] = "invalid";
    }
    return report;
}

bool StaticFallbackStore::directoryAvailable() const {
    std::error_code ec;
    return fs::is_directory(directory_, ec);
}

BoundedResultCacheStats StaticFallbackStore::cacheStats() const {
    return cache_.stats();
}

void StaticFallbackStore::clearCache() {
    cache_.clear();
    logger_->info("Static fallback cache cleared");
}
