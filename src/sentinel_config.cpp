#include "sentinel_config.hpp"
#include "file_logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

using Setter = std::function<void(SentinelConfig&, const std::string&)>;

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string stripQuotes(std::string value)
{
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

long long toInteger(const std::string& value)
{
    size_t pos = 0;
    long long parsed = std::stoll(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return parsed;
}

size_t toSize(const std::string& value)
{
    long long parsed = toInteger(value);
    if (parsed < 0) {
        throw std::out_of_range("negative value");
    }
    return static_cast<size_t>(parsed);
}

double toReal(const std::string& value)
{
    size_t pos = 0;
    double parsed = std::stod(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return parsed;
}

bool toBool(const std::string& value)
{
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "on" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "off" || lower == "no") return false;
    throw std::invalid_argument("not a boolean");
}

FeatureSet toFeatureSet(const std::string& value)
{
    if (value == "live") return FeatureSet::Live;
    if (value == "extended") return FeatureSet::Extended;
    throw std::invalid_argument("expected live or extended");
}

#define INT_FIELD(section, field) \
    {#field, [](SentinelConfig& c, const std::string& v) { c.section.field = static_cast<int>(toInteger(v)); }}
#define SIZE_FIELD(section, field) \
    {#field, [](SentinelConfig& c, const std::string& v) { c.section.field = toSize(v); }}
#define REAL_FIELD(section, field) \
    {#field, [](SentinelConfig& c, const std::string& v) { c.section.field = toReal(v); }}
#define BOOL_FIELD(section, field) \
    {#field, [](SentinelConfig& c, const std::string& v) { c.section.field = toBool(v); }}
#define STRING_FIELD(section, field) \
    {#field, [](SentinelConfig& c, const std::string& v) { c.section.field = v; }}

const std::map<std::string, Setter>& setters()
{
    static const std::map<std::string, Setter> table = {
        SIZE_FIELD(detection, min_anomaly_samples),
        REAL_FIELD(detection, anomaly_threshold),
        REAL_FIELD(detection, classification_threshold),
        INT_FIELD(detection, anomaly_retrain_interval_seconds),
        SIZE_FIELD(detection, anomaly_sample_buffer_size),
        SIZE_FIELD(detection, anomaly_trees),
        SIZE_FIELD(detection, anomaly_subsample_size),
        REAL_FIELD(detection, anomaly_contamination),
        {"anomaly_seed", [](SentinelConfig& c, const std::string& v) {
             c.detection.anomaly_seed = static_cast<uint64_t>(toSize(v)); }},
        STRING_FIELD(detection, anomaly_model_path),
        STRING_FIELD(detection, classification_model_path),
        INT_FIELD(detection, classification_reload_interval_seconds),
        INT_FIELD(detection, detector_timeout_ms),
        {"feature_set", [](SentinelConfig& c, const std::string& v) {
             c.detection.feature_set = toFeatureSet(v); }},

        INT_FIELD(trackers, login_window_seconds),
        INT_FIELD(trackers, connection_idle_timeout_seconds),
        INT_FIELD(trackers, access_window_seconds),
        INT_FIELD(trackers, tracker_sweep_interval_seconds),
        SIZE_FIELD(trackers, max_tracked_keys),

        INT_FIELD(signatures, history_window_seconds),
        SIZE_FIELD(signatures, history_max_packets),
        SIZE_FIELD(signatures, port_scan_threshold),
        REAL_FIELD(signatures, dos_packet_rate_threshold),
        {"exfiltration_bytes_threshold", [](SentinelConfig& c, const std::string& v) {
             c.signatures.exfiltration_bytes_threshold = static_cast<uint64_t>(toSize(v)); }},
        SIZE_FIELD(signatures, brute_force_threshold),

        INT_FIELD(alerts, alert_dedup_window_seconds),
        INT_FIELD(alerts, persistence_retry_limit),
        SIZE_FIELD(alerts, persistence_queue_capacity),
        SIZE_FIELD(alerts, failed_persistence_buffer),

        INT_FIELD(stats, stats_flush_interval_seconds),
        SIZE_FIELD(stats, top_talkers),

        SIZE_FIELD(pipeline, queue_capacity),
        SIZE_FIELD(pipeline, worker_count),
        BOOL_FIELD(pipeline, drain_on_shutdown),

        STRING_FIELD(logging, log_directory),
        STRING_FIELD(logging, log_level),
    };
    return table;
}

#undef INT_FIELD
#undef SIZE_FIELD
#undef REAL_FIELD
#undef BOOL_FIELD
#undef STRING_FIELD

// Environment variable first, then ./.env
bool lookupEnvironment(const std::string& name, bool use_env_file, std::string& value)
{
    const char* env_value = std::getenv(name.c_str());
    if (env_value && *env_value) {
        value = env_value;
        return true;
    }
    if (!use_env_file) {
        return false;
    }

    std::ifstream env_file(".env");
    if (!env_file.is_open()) {
        return false;
    }

    const std::string search_key = name + "=";
    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind(search_key, 0) == 0) {
            std::string found = stripQuotes(trim(line.substr(search_key.size())));
            if (!found.empty()) {
                value = found;
                return true;
            }
        }
    }
    return false;
}

std::string toUpper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::string SentinelConfig::normalizeKey(const std::string& key)
{
    std::string out;
    out.reserve(key.size() + 8);
    for (char ch : key) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isupper(c)) {
            if (!out.empty() && out.back() != '_') {
                out.push_back('_');
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (ch == '-') {
            out.push_back('_');
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

std::vector<std::string> SentinelConfig::knownKeys()
{
    std::vector<std::string> keys;
    for (const auto& [key, setter] : setters()) {
        keys.push_back(key);
    }
    return keys;
}

bool SentinelConfig::set(const std::string& key, const std::string& value)
{
    const std::string normalized = normalizeKey(key);
    auto it = setters().find(normalized);
    if (it == setters().end()) {
        return false;
    }
    try {
        it->second(*this, value);
        return true;
    } catch (const std::exception& e) {
        TRAFFIC_SENTINEL_LOG_WARNING("Config: could not parse " + normalized + " = '" + value +
                                     "' (" + e.what() + "), keeping previous value");
        return false;
    }
}

bool SentinelConfig::loadFromFile(const std::string& config_path)
{
    std::ifstream file(config_path);
    if (!file.is_open()) {
        TRAFFIC_SENTINEL_LOG_WARNING("Config: could not open " + config_path + ", using defaults");
        return false;
    }

    // One "key": value per line; nesting only names the section
    std::string line;
    std::string current_section;
    size_t line_number = 0;
    size_t applied = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line.rfind("//", 0) == 0) continue;

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }

        std::string key = stripQuotes(trim(line.substr(0, colon_pos)));
        std::string value = trim(line.substr(colon_pos + 1));
        if (!value.empty() && value.back() == ',') {
            value.pop_back();
            value = trim(value);
        }

        if (value == "{") {
            current_section = key;
            continue;
        }
        value = stripQuotes(value);

        if (set(key, value)) {
            ++applied;
        } else if (setters().find(normalizeKey(key)) == setters().end()) {
            TRAFFIC_SENTINEL_LOG_WARNING("Config: unknown key '" + key + "' in section '" +
                                         current_section + "' at " + config_path + ":" +
                                         std::to_string(line_number));
        }
    }

    if (file.bad()) {
        TRAFFIC_SENTINEL_LOG_ERROR("Config: read error in " + config_path);
        return false;
    }

    TRAFFIC_SENTINEL_LOG_INFO("Config: loaded " + std::to_string(applied) + " values from " + config_path);
    return true;
}

size_t SentinelConfig::applyEnvironmentOverrides(bool use_env_file)
{
    size_t overridden = 0;
    for (const auto& [key, setter] : setters()) {
        std::string value;
        if (lookupEnvironment("TRAFFIC_SENTINEL_" + toUpper(key), use_env_file, value) &&
            set(key, value)) {
            ++overridden;
        }
    }
    return overridden;
}

bool SentinelConfig::validate(std::vector<std::string>& errors) const
{
    auto require = [&errors](bool condition, const std::string& message) {
        if (!condition) {
            errors.push_back(message);
        }
    };

    require(detection.anomaly_threshold >= 0.0 && detection.anomaly_threshold <= 1.0,
            "anomaly_threshold must be within [0,1]");
    require(detection.classification_threshold >= 0.0 && detection.classification_threshold <= 1.0,
            "classification_threshold must be within [0,1]");
    require(detection.anomaly_contamination > 0.0 && detection.anomaly_contamination < 0.5,
            "anomaly_contamination must be within (0,0.5)");
    require(detection.min_anomaly_samples >= 2, "min_anomaly_samples must be at least 2");
    require(detection.anomaly_sample_buffer_size >= detection.min_anomaly_samples,
            "anomaly_sample_buffer_size must hold at least min_anomaly_samples");
    require(detection.anomaly_trees > 0, "anomaly_trees must be positive");
    require(detection.anomaly_subsample_size >= 2, "anomaly_subsample_size must be at least 2");
    require(detection.anomaly_retrain_interval_seconds > 0, "anomaly_retrain_interval_seconds must be positive");
    require(detection.classification_reload_interval_seconds >= 0,
            "classification_reload_interval_seconds must not be negative");
    require(detection.detector_timeout_ms > 0, "detector_timeout_ms must be positive");

    require(trackers.login_window_seconds > 0, "login_window_seconds must be positive");
    require(trackers.connection_idle_timeout_seconds > 0, "connection_idle_timeout_seconds must be positive");
    require(trackers.access_window_seconds > 0, "access_window_seconds must be positive");
    require(trackers.tracker_sweep_interval_seconds > 0, "tracker_sweep_interval_seconds must be positive");
    require(trackers.max_tracked_keys > 0, "max_tracked_keys must be positive");

    require(signatures.history_window_seconds > 0, "history_window_seconds must be positive");
    require(signatures.history_max_packets > 0, "history_max_packets must be positive");
    require(signatures.port_scan_threshold > 0, "port_scan_threshold must be positive");
    require(signatures.dos_packet_rate_threshold > 0.0, "dos_packet_rate_threshold must be positive");
    require(signatures.exfiltration_bytes_threshold > 0, "exfiltration_bytes_threshold must be positive");
    require(signatures.brute_force_threshold > 0, "brute_force_threshold must be positive");

    require(alerts.alert_dedup_window_seconds > 0, "alert_dedup_window_seconds must be positive");
    require(alerts.persistence_retry_limit > 0, "persistence_retry_limit must be positive");
    require(alerts.persistence_queue_capacity > 0, "persistence_queue_capacity must be positive");

    require(stats.stats_flush_interval_seconds > 0, "stats_flush_interval_seconds must be positive");
    require(pipeline.queue_capacity > 0, "queue_capacity must be positive");

    FileLogger::LogLevel level;
    require(FileLogger::parse_log_level(logging.log_level, level),
            "log_level must be one of debug, info, warning, error, critical");

    return errors.empty();
}

size_t SentinelConfig::effectiveWorkerCount() const
{
    if (pipeline.worker_count > 0) {
        return pipeline.worker_count;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

std::string SentinelConfig::getSummary() const
{
    std::ostringstream oss;
    oss << "detection{min_anomaly_samples=" << detection.min_anomaly_samples
        << ", anomaly_threshold=" << detection.anomaly_threshold
        << ", classification_threshold=" << detection.classification_threshold
        << ", retrain=" << detection.anomaly_retrain_interval_seconds << "s"
        << ", feature_set=" << (detection.feature_set == FeatureSet::Extended ? "extended" : "live")
        << ", classification_model='" << detection.classification_model_path << "'}"
        << " trackers{login_window=" << trackers.login_window_seconds << "s"
        << ", idle_timeout=" << trackers.connection_idle_timeout_seconds << "s"
        << ", access_window=" << trackers.access_window_seconds << "s}"
        << " signatures{port_scan>" << signatures.port_scan_threshold
        << ", dos>" << signatures.dos_packet_rate_threshold << "pps"
        << ", exfil>" << signatures.exfiltration_bytes_threshold << "B}"
        << " alerts{dedup=" << alerts.alert_dedup_window_seconds << "s}"
        << " stats{flush=" << stats.stats_flush_interval_seconds << "s}"
        << " pipeline{queue=" << pipeline.queue_capacity
        << ", workers=" << effectiveWorkerCount() << "}";
    return oss.str();
}
