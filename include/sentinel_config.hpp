#ifndef SENTINEL_CONFIG_HPP
#define SENTINEL_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "feature_vector.hpp"

/**
 * @brief Runtime configuration for the traffic sentinel pipeline
 *
 * Values come from built-in defaults, then an optional JSON file, then
 * TRAFFIC_SENTINEL_* environment variables (or a .env file). Keys are
 * accepted in snake_case or camelCase.
 */
struct SentinelConfig {
    struct Detection {
        size_t min_anomaly_samples = 100;
        double anomaly_threshold = 0.5;
        double classification_threshold = 0.7;
        int anomaly_retrain_interval_seconds = 3600;
        size_t anomaly_sample_buffer_size = 10000;
        size_t anomaly_trees = 100;
        size_t anomaly_subsample_size = 256;
        double anomaly_contamination = 0.1;
        uint64_t anomaly_seed = 42;
        std::string anomaly_model_path;
        std::string classification_model_path;
        int classification_reload_interval_seconds = 0;
        int detector_timeout_ms = 20;
        FeatureSet feature_set = FeatureSet::Live;
    };

    struct Trackers {
        int login_window_seconds = 3600;
        int connection_idle_timeout_seconds = 300;
        int access_window_seconds = 300;
        int tracker_sweep_interval_seconds = 30;
        size_t max_tracked_keys = 100000;
    };

    struct Signatures {
        int history_window_seconds = 10;
        size_t history_max_packets = 1000;
        size_t port_scan_threshold = 20;
        double dos_packet_rate_threshold = 100.0;
        uint64_t exfiltration_bytes_threshold = 10ULL * 1024 * 1024;
        size_t brute_force_threshold = 5;
    };

    struct Alerts {
        int alert_dedup_window_seconds = 300;
        int persistence_retry_limit = 3;
        size_t persistence_queue_capacity = 10000;
        size_t failed_persistence_buffer = 1000;
    };

    struct Stats {
        int stats_flush_interval_seconds = 60;
        size_t top_talkers = 10;
    };

    struct Pipeline {
        size_t queue_capacity = 10000;
        size_t worker_count = 0; // 0 = hardware concurrency
        bool drain_on_shutdown = true;
    };

    struct Logging {
        std::string log_directory = "/var/log/traffic_sentinel";
        std::string log_level = "info";
    };

    Detection detection;
    Trackers trackers;
    Signatures signatures;
    Alerts alerts;
    Stats stats;
    Pipeline pipeline;
    Logging logging;

    /**
     * @brief Load values from a JSON configuration file
     * @return false if the file cannot be opened or read
     */
    bool loadFromFile(const std::string& config_path);

    /**
     * @brief Override values from TRAFFIC_SENTINEL_<KEY> variables
     * @param use_env_file also consult ./.env when a variable is unset
     * @return number of values overridden
     */
    size_t applyEnvironmentOverrides(bool use_env_file = true);

    /**
     * @brief Set one option by name
     * @return false for unknown keys or unparseable values
     */
    bool set(const std::string& key, const std::string& value);

    bool validate(std::vector<std::string>& errors) const;

    size_t effectiveWorkerCount() const;

    std::string getSummary() const;

    // "minAnomalySamples" -> "min_anomaly_samples"
    static std::string normalizeKey(const std::string& key);
    static std::vector<std::string> knownKeys();
};

#endif // SENTINEL_CONFIG_HPP
