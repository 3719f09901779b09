#include <array>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

// Publishes the latest traffic_sentinel stats snapshot over HTTP.
// The stats file holds one flush period as key:value lines; counters are
// advanced once per new period (detected by a changed period_end).
class TrafficSentinelMetricsExporter {
private:
    std::shared_ptr<prometheus::Registry> registry;
    prometheus::Exposer exposer;

    prometheus::Family<prometheus::Counter>& packets_family;
    prometheus::Family<prometheus::Counter>& bytes_family;
    prometheus::Family<prometheus::Counter>& dropped_family;
    prometheus::Family<prometheus::Counter>& detections_family;

    prometheus::Family<prometheus::Gauge>& packet_rate_family;
    prometheus::Family<prometheus::Gauge>& byte_rate_family;
    prometheus::Family<prometheus::Gauge>& connections_family;
    prometheus::Family<prometheus::Gauge>& avg_size_family;

    prometheus::Counter& packets;
    prometheus::Counter& bytes;
    prometheus::Counter& dropped;
    std::array<prometheus::Counter*, 3> detections;

    prometheus::Gauge& packet_rate;
    prometheus::Gauge& byte_rate;
    prometheus::Gauge& connections;
    prometheus::Gauge& avg_packet_size;

    std::string stats_file_path;
    double last_period_end = -1.0;

    static constexpr std::array<const char*, 3> DETECTOR_KINDS = {"signature", "anomaly", "classification"};

public:
    TrafficSentinelMetricsExporter(const std::string& bind_address, const std::string& stats_file)
        : registry{std::make_shared<prometheus::Registry>()}
        , exposer{bind_address}
        , packets_family{prometheus::BuildCounter()
                         .Name("traffic_sentinel_packets_total")
                         .Help("Packets analyzed by traffic sentinel")
                         .Register(*registry)}
        , bytes_family{prometheus::BuildCounter()
                       .Name("traffic_sentinel_bytes_total")
                       .Help("Bytes analyzed by traffic sentinel")
                       .Register(*registry)}
        , dropped_family{prometheus::BuildCounter()
                         .Name("traffic_sentinel_dropped_packets_total")
                         .Help("Packets dropped on queue saturation or shutdown")
                         .Register(*registry)}
        , detections_family{prometheus::BuildCounter()
                            .Name("traffic_sentinel_detections_total")
                            .Help("Detections by detector kind")
                            .Register(*registry)}
        , packet_rate_family{prometheus::BuildGauge()
                             .Name("traffic_sentinel_packet_rate")
                             .Help("Packets per second over the last flush period")
                             .Register(*registry)}
        , byte_rate_family{prometheus::BuildGauge()
                           .Name("traffic_sentinel_byte_rate")
                           .Help("Bytes per second over the last flush period")
                           .Register(*registry)}
        , connections_family{prometheus::BuildGauge()
                             .Name("traffic_sentinel_active_connections")
                             .Help("Flows currently tracked")
                             .Register(*registry)}
        , avg_size_family{prometheus::BuildGauge()
                          .Name("traffic_sentinel_avg_packet_size_bytes")
                          .Help("Average packet size over the last flush period")
                          .Register(*registry)}
        , packets{packets_family.Add({})}
        , bytes{bytes_family.Add({})}
        , dropped{dropped_family.Add({})}
        , detections{}
        , packet_rate{packet_rate_family.Add({})}
        , byte_rate{byte_rate_family.Add({})}
        , connections{connections_family.Add({})}
        , avg_packet_size{avg_size_family.Add({})}
        , stats_file_path{stats_file}
    {
        for (size_t i = 0; i < DETECTOR_KINDS.size(); ++i) {
            detections[i] = &detections_family.Add({{"detector", DETECTOR_KINDS[i]}});
        }
        exposer.RegisterCollectable(registry);
        std::cout << "Traffic sentinel metrics exporter started on " << bind_address << "\n";
        std::cout << "Reading stats from: " << stats_file_path << "\n";
    }

    std::map<std::string, double> parseStatsFile() {
        std::map<std::string, double> stats;
        std::ifstream file(stats_file_path);

        if (!file.is_open()) {
            std::cerr << "Warning: Could not open stats file: " << stats_file_path << '\n';
            return stats;
        }

        std::string line;
        while (std::getline(file, line)) {
            size_t delimiter_pos = line.find(':');
            if (delimiter_pos == std::string::npos) {
                continue;
            }
            std::string key = line.substr(0, delimiter_pos);
            // Top-talker lines carry "address count" pairs, not a number
            if (key.rfind("top_", 0) == 0) {
                continue;
            }
            try {
                stats[key] = std::stod(line.substr(delimiter_pos + 1));
            } catch (const std::exception& e) {
                std::cerr << "Error parsing value for key '" << key << "': " << e.what() << '\n';
            }
        }
        return stats;
    }

    void updateMetrics() {
        auto stats = parseStatsFile();
        if (stats.empty()) {
            return;
        }

        auto value = [&stats](const std::string& key) {
            auto it = stats.find(key);
            return it != stats.end() ? it->second : 0.0;
        };

        packet_rate.Set(value("packet_rate"));
        byte_rate.Set(value("byte_rate"));
        connections.Set(value("active_connections"));
        avg_packet_size.Set(value("avg_packet_size"));

        const double period_end = value("period_end");
        if (period_end == last_period_end) {
            return;
        }
        last_period_end = period_end;

        packets.Increment(value("total_packets"));
        bytes.Increment(value("total_bytes"));
        dropped.Increment(value("dropped_packets"));
        for (size_t i = 0; i < DETECTOR_KINDS.size(); ++i) {
            detections[i]->Increment(value(std::string("detections_") + DETECTOR_KINDS[i]));
        }

        std::cout << "Updated metrics - packets: " << value("total_packets")
                  << ", rate: " << value("packet_rate") << " pps"
                  << ", connections: " << value("active_connections") << '\n';
    }

    void run() {
        std::cout << "Starting traffic sentinel metrics collection..." << '\n';

        while (true) {
            try {
                updateMetrics();
            } catch (const std::exception& e) {
                std::cerr << "Error updating metrics: " << e.what() << '\n';
            }
            std::this_thread::sleep_for(std::chrono::seconds(5));
        }
    }
};

// Helper function to get environment variable or default
const char* get_env_or_default(const char* env_var, const char* default_val) {
    const char* value = std::getenv(env_var);
    return value ? value : default_val;
}

int main(int argc, char** argv) {
    try {
        std::string bind_address = get_env_or_default("BIND_ADDRESS", "0.0.0.0:9091");
        std::string stats_file = get_env_or_default("TRAFFIC_SENTINEL_STATS_FILE",
                                                    "/var/log/traffic_sentinel/traffic_sentinel_stats");

        // Allow overriding with command-line arguments
        if (argc > 1) {
            stats_file = argv[1];
        }
        if (argc > 2) {
            bind_address = argv[2];
        }

        TrafficSentinelMetricsExporter exporter(bind_address, stats_file);
        exporter.run(); // Blocking call

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
