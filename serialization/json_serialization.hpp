#ifndef CLOTHSIM_SERIALIZATION_JSON_SERIALIZATION_HPP
#define CLOTHSIM_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace clothsim::json {

// Version of the export format
constexpr const char* EXPORT_FORMAT_VERSION = "1.0.0";

// Document written by `clothsim run -o`.
// `kind` names what `payload` holds (currently only "render_snapshot").
struct ExportDocument {
    std::string format_version = EXPORT_FORMAT_VERSION;
    std::string kind;
    std::string created_at;
    std::string config_source;   // Config file the run was loaded from, if any
    nlohmann::json parameters;   // Effective simulation and run parameters
    nlohmann::json summary;      // Counters gathered over the run
    nlohmann::json payload;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["format_version"] = format_version;
        j["kind"] = kind;
        if (!created_at.empty()) j["created_at"] = created_at;
        if (!config_source.empty()) j["config_source"] = config_source;
        if (!parameters.is_null()) j["parameters"] = parameters;
        if (!summary.is_null()) j["summary"] = summary;
        j["payload"] = payload;
        return j;
    }
};

// UTC time as ISO 8601
inline std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("Failed while writing: " + path);
    }
}

// Reads and parses a JSON file. Parse errors are rethrown as
// std::runtime_error naming the file.
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }
}

// Returns the named top-level object of a config file, or null when the
// file has no such section.
inline nlohmann::json read_config_section(const std::string& path, const std::string& section) {
    nlohmann::json root = read_json_file(path);
    if (!root.is_object()) {
        throw std::runtime_error("Config file " + path + " must hold a JSON object");
    }
    auto it = root.find(section);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::runtime_error("Section '" + section + "' in " + path + " must be an object");
    }
    return *it;
}

inline void write_export(const std::string& path, const ExportDocument& document) {
    write_json_file(path, document.to_json());
}

}  // namespace clothsim::json

#endif // CLOTHSIM_SERIALIZATION_JSON_SERIALIZATION_HPP
