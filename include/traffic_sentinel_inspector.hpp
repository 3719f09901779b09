#ifndef TRAFFIC_SENTINEL_INSPECTOR_HPP
#define TRAFFIC_SENTINEL_INSPECTOR_HPP

#include <framework/module.h>
#include <framework/inspector.h>
#include <framework/parameter.h>
#include <framework/value.h>
#include <protocols/packet.h>
#include <protocols/ip.h>
#include <protocols/tcp.h>
#include <protocols/udp.h>
#include <main/snort_config.h>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include "packet_record.hpp"
#include "sentinel_config.hpp"

class Pipeline;

// Hash specialization for IPv6 address arrays
namespace std {
    template<>
    struct hash<std::array<uint8_t, 16>> {
        size_t operator()(const std::array<uint8_t, 16>& arr) const {
            size_t h = 0;
            for (size_t i = 0; i < 16; ++i) {
                h ^= std::hash<uint8_t>{}(arr[i]) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}

class TrafficSentinelModule : public snort::Module
{
public:
    TrafficSentinelModule();
    ~TrafficSentinelModule() override = default;

    bool set(const char*, snort::Value&, snort::SnortConfig*) override;
    bool begin(const char*, int, snort::SnortConfig*) override;
    bool end(const char*, int, snort::SnortConfig*) override;

    const snort::Parameter* get_parameters() const;

    Usage get_usage() const override
    { return INSPECT; }

    const SentinelConfig& getConfig() const { return config; }

    std::string config_file;
    bool use_env_files = true;

private:
    SentinelConfig config;
    // Parameters set in snort.lua, re-applied on top of config_file
    std::unordered_map<std::string, std::string> lua_overrides;
};

class TrafficSentinelInspector : public snort::Inspector
{
public:
    explicit TrafficSentinelInspector(TrafficSentinelModule*);
    ~TrafficSentinelInspector() override;

    void eval(snort::Packet*) override;
    void show_stats(std::ostream&);

    bool configure(snort::SnortConfig*) override { return true; }

private:
    std::unique_ptr<Pipeline> pipeline;

    mutable std::mutex address_cache_mutex;
    std::unordered_map<uint32_t, std::string> ipv4_cache;
    std::unordered_map<std::array<uint8_t, 16>, std::string> ipv6_cache;

    std::atomic<uint64_t> packets_seen{0};
    std::atomic<uint64_t> packets_skipped{0};

    std::string getIPv4String(uint32_t addr);
    std::string getIPv6String(const snort::ip::snort_in6_addr* addr);
    std::pair<std::string, std::string> extractAddresses(snort::Packet* p);
    PacketRecord extractPacketRecord(snort::Packet* p);
};

#endif // TRAFFIC_SENTINEL_INSPECTOR_HPP
