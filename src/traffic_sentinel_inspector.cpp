#include "traffic_sentinel_inspector.hpp"
#include "file_logger.hpp"
#include "pipeline.hpp"
#include "random_forest_model.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <chrono>
#include <cstring>
#include <framework/snort_api.h>
#include <sstream>
#include <stdexcept>
#include <string_view>

using namespace snort;

//-------------------------------------------------------------------------
// module stuff
//-------------------------------------------------------------------------

static const Parameter sentinel_params[] = {
    {"config_file", Parameter::PT_STRING, nullptr, "",
     "JSON configuration file, loaded before environment overrides"},

    {"use_env_files", Parameter::PT_BOOL, nullptr, "true",
     "read TRAFFIC_SENTINEL_* from the environment and the .env file"},

    {"min_anomaly_samples", Parameter::PT_INT, "2:10000000", "100",
     "samples required before the first anomaly model training"},

    {"anomaly_threshold", Parameter::PT_REAL, "0.0:1.0", "0.5",
     "anomaly confidence above which a detection fires"},

    {"classification_threshold", Parameter::PT_REAL, "0.0:1.0", "0.7",
     "classifier confidence below which the verdict is benign"},

    {"anomaly_retrain_interval_seconds", Parameter::PT_INT, "1:604800", "3600",
     "background anomaly model retrain period"},

    {"anomaly_model_path", Parameter::PT_STRING, nullptr, "",
     "anomaly model file loaded at startup and saved after each training"},

    {"classification_model_path", Parameter::PT_STRING, nullptr, "",
     "random forest model artifact; empty disables classification"},

    {"classification_reload_interval_seconds", Parameter::PT_INT, "0:604800", "0",
     "classification model reload period, 0 disables reloading"},

    {"detector_timeout_ms", Parameter::PT_INT, "1:10000", "20",
     "wait for the anomaly and classification detectors per packet"},

    {"feature_set", Parameter::PT_STRING, nullptr, "live",
     "feature vector layout: live or extended"},

    {"login_window_seconds", Parameter::PT_INT, "1:86400", "3600",
     "failed login counting window"},

    {"connection_idle_timeout_seconds", Parameter::PT_INT, "1:86400", "300",
     "idle time after which a flow is evicted"},

    {"access_window_seconds", Parameter::PT_INT, "1:86400", "300",
     "per-source access frequency window"},

    {"max_tracked_keys", Parameter::PT_INT, "16:10000000", "100000",
     "maximum keys per tracker"},

    {"port_scan_threshold", Parameter::PT_INT, "1:65535", "20",
     "distinct destination ports that indicate a port scan"},

    {"dos_packet_rate_threshold", Parameter::PT_REAL, "1.0:10000000.0", "100.0",
     "per-source packets per second that indicate a DoS burst"},

    {"exfiltration_bytes_threshold", Parameter::PT_INT, "1:max53", "10485760",
     "per-source bytes in the history window that indicate exfiltration"},

    {"brute_force_threshold", Parameter::PT_INT, "1:100000", "5",
     "failed logins that indicate a brute force attempt"},

    {"alert_dedup_window_seconds", Parameter::PT_INT, "1:86400", "300",
     "window during which identical detections collapse into one alert"},

    {"stats_flush_interval_seconds", Parameter::PT_INT, "1:86400", "60",
     "traffic statistics flush period"},

    {"queue_capacity", Parameter::PT_INT, "1:10000000", "10000",
     "bounded packet queue size"},

    {"worker_count", Parameter::PT_INT, "0:1024", "0",
     "packet worker threads, 0 uses all cores"},

    {"log_directory", Parameter::PT_STRING, nullptr, "/var/log/traffic_sentinel",
     "directory for engine, alert, stats and performance logs"},

    {"log_level", Parameter::PT_STRING, nullptr, "info",
     "logging level: debug, info, warning, error, critical"},

    {nullptr, Parameter::PT_MAX, nullptr, nullptr, nullptr}};

#define SENTINEL_NAME "traffic_sentinel"
#define SENTINEL_HELP "signature, anomaly and classification based traffic detection"

TrafficSentinelModule::TrafficSentinelModule() : Module(SENTINEL_NAME, SENTINEL_HELP, sentinel_params)
{
}

const Parameter *TrafficSentinelModule::get_parameters() const
{
    return sentinel_params;
}

bool TrafficSentinelModule::set(const char *, Value &v, SnortConfig *)
{
    if (v.is("config_file"))
    {
        config_file = v.get_string();
        return true;
    }
    if (v.is("use_env_files"))
    {
        use_env_files = v.get_bool();
        return true;
    }

    for (const Parameter *param = sentinel_params; param->name; ++param)
    {
        if (!v.is(param->name))
            continue;

        std::string text;
        switch (param->type)
        {
        case Parameter::PT_BOOL:
            text = v.get_bool() ? "true" : "false";
            break;
        case Parameter::PT_INT:
            text = std::to_string(v.get_int64());
            break;
        case Parameter::PT_REAL:
            text = std::to_string(v.get_real());
            break;
        default:
            text = v.get_string();
            break;
        }
        if (!config.set(param->name, text))
            return false;
        lua_overrides[param->name] = text;
        return true;
    }
    return false;
}

bool TrafficSentinelModule::begin(const char *, int, SnortConfig *)
{
    config = SentinelConfig{};
    lua_overrides.clear();
    return true;
}

bool TrafficSentinelModule::end(const char *, int, SnortConfig *)
{
    SentinelConfig merged;
    if (!config_file.empty() && !merged.loadFromFile(config_file))
    {
        TRAFFIC_SENTINEL_LOG_ERROR("Cannot read configuration file: " + config_file);
        return false;
    }
    const size_t overridden = merged.applyEnvironmentOverrides(use_env_files);
    if (overridden > 0)
    {
        TRAFFIC_SENTINEL_LOG_INFO("Applied " + std::to_string(overridden) + " environment overrides");
    }
    for (const auto &[key, value] : lua_overrides)
    {
        if (!merged.set(key, value))
        {
            TRAFFIC_SENTINEL_LOG_ERROR("Invalid value for " + key + ": " + value);
            return false;
        }
    }

    std::vector<std::string> errors;
    if (!merged.validate(errors))
    {
        for (const auto &error : errors)
            TRAFFIC_SENTINEL_LOG_ERROR("Configuration error: " + error);
        return false;
    }

    const std::string &model_path = merged.detection.classification_model_path;
    if (!model_path.empty())
    {
        RandomForestModel probe;
        if (!probe.load(model_path))
        {
            TRAFFIC_SENTINEL_LOG_ERROR("Classification model cannot be loaded: " + model_path);
            return false;
        }
    }

    config = merged;
    TRAFFIC_SENTINEL_LOG_INFO("Traffic sentinel configuration completed: " + config.getSummary());
    return true;
}

//-------------------------------------------------------------------------
// inspector stuff
//-------------------------------------------------------------------------

TrafficSentinelInspector::TrafficSentinelInspector(TrafficSentinelModule *mod)
{
    const SentinelConfig &config = mod->getConfig();

    FileLogger::LogLevel level = FileLogger::LogLevel::LOG_INFO;
    if (!FileLogger::parse_log_level(config.logging.log_level, level))
    {
        TRAFFIC_SENTINEL_LOG_WARNING("Unknown log level '" + config.logging.log_level + "', using info");
    }
    g_file_logger.set_min_level(level);

    if (g_file_logger.initialize(config.logging.log_directory))
    {
        g_file_logger.start();
    }
    else
    {
        TRAFFIC_SENTINEL_LOG_ERROR("Failed to initialize file logger in " + config.logging.log_directory);
    }

    try
    {
        pipeline = std::make_unique<Pipeline>(config);
        pipeline->start();
        TRAFFIC_SENTINEL_LOG_INFO("Traffic sentinel engine initialized and ready for packet analysis");
    }
    catch (const std::exception &e)
    {
        TRAFFIC_SENTINEL_LOG_ERROR(std::string("Traffic sentinel engine failed to start: ") + e.what());
        pipeline.reset();
    }
}

TrafficSentinelInspector::~TrafficSentinelInspector()
{
    if (pipeline)
    {
        pipeline->shutdown();
        pipeline.reset();
    }
    g_file_logger.stop();
}

void TrafficSentinelInspector::eval(Packet *p)
{
    if (!pipeline || !p || !p->ptrs.ip_api.is_ip())
        return;

    packets_seen.fetch_add(1, std::memory_order_relaxed);
    if (!pipeline->submit(extractPacketRecord(p)))
        packets_skipped.fetch_add(1, std::memory_order_relaxed);
}

void TrafficSentinelInspector::show_stats(std::ostream &os)
{
    os << "traffic_sentinel: seen=" << packets_seen.load(std::memory_order_relaxed)
       << " not_queued=" << packets_skipped.load(std::memory_order_relaxed) << '\n';
    if (pipeline)
        os << "traffic_sentinel: " << pipeline->metrics().toString() << '\n';
}

// Address caching implementation for performance optimization
std::string TrafficSentinelInspector::getIPv4String(uint32_t addr)
{
    std::lock_guard<std::mutex> lock(address_cache_mutex);
    auto it = ipv4_cache.find(addr);
    if (it != ipv4_cache.end())
    {
        return it->second;
    }

    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)))
    {
        std::string addr_str(buffer);
        if (ipv4_cache.size() >= 1000)
        {
            ipv4_cache.clear();
        }
        ipv4_cache[addr] = addr_str;
        return addr_str;
    }

    return "0.0.0.0";
}

std::string TrafficSentinelInspector::getIPv6String(const snort::ip::snort_in6_addr *addr)
{
    std::lock_guard<std::mutex> lock(address_cache_mutex);

    std::array<uint8_t, 16> addr_bytes;
    std::memcpy(addr_bytes.data(), addr, 16);

    auto it = ipv6_cache.find(addr_bytes);
    if (it != ipv6_cache.end())
    {
        return it->second;
    }

    char buffer[INET6_ADDRSTRLEN];
    if (inet_ntop(AF_INET6, addr, buffer, sizeof(buffer)))
    {
        std::string addr_str(buffer);
        if (ipv6_cache.size() >= 1000)
        {
            ipv6_cache.clear();
        }
        ipv6_cache[addr_bytes] = addr_str;
        return addr_str;
    }

    return "::";
}

std::pair<std::string, std::string> TrafficSentinelInspector::extractAddresses(snort::Packet *p)
{
    std::string src_ip, dst_ip;

    if (p->ptrs.ip_api.is_ip4())
    {
        const snort::ip::IP4Hdr *ip4h = p->ptrs.ip_api.get_ip4h();
        src_ip = getIPv4String(ip4h->get_src());
        dst_ip = getIPv4String(ip4h->get_dst());
    }
    else if (p->ptrs.ip_api.is_ip6())
    {
        const snort::ip::IP6Hdr *ip6h = p->ptrs.ip_api.get_ip6h();
        src_ip = getIPv6String(ip6h->get_src());
        dst_ip = getIPv6String(ip6h->get_dst());
    }

    return {src_ip, dst_ip};
}

PacketRecord TrafficSentinelInspector::extractPacketRecord(snort::Packet *p)
{
    PacketRecord record;
    auto [src_ip, dst_ip] = extractAddresses(p);
    record.src_ip = std::move(src_ip);
    record.dst_ip = std::move(dst_ip);
    record.size = p->pktlen > 0 ? p->pktlen : p->dsize;

    if (p->pkth)
    {
        record.timestamp = std::chrono::system_clock::time_point(
            std::chrono::seconds(p->pkth->ts.tv_sec) + std::chrono::microseconds(p->pkth->ts.tv_usec));
    }
    else
    {
        record.timestamp = std::chrono::system_clock::now();
    }

    if (p->ptrs.tcph)
    {
        record.protocol = Protocol::Tcp;
        record.src_port = ntohs(p->ptrs.tcph->th_sport);
        record.dst_port = ntohs(p->ptrs.tcph->th_dport);
        // Snort's TH_* bits share the low five positions with tcp_flags
        record.tcp_flags = static_cast<uint8_t>(p->ptrs.tcph->th_flags & 0x1F);
    }
    else if (p->ptrs.udph)
    {
        record.protocol = Protocol::Udp;
        record.src_port = ntohs(p->ptrs.udph->uh_sport);
        record.dst_port = ntohs(p->ptrs.udph->uh_dport);
    }
    else if (p->is_icmp())
    {
        record.protocol = Protocol::Icmp;
    }

    if (p->data && p->dsize > 0)
    {
        record.payload.assign(reinterpret_cast<const char *>(p->data), p->dsize);
    }

    return record;
}

//-------------------------------------------------------------------------
// api stuff
//-------------------------------------------------------------------------

static Module *mod_ctor()
{
    return new TrafficSentinelModule;
}

static void mod_dtor(Module *m)
{
    delete m;
}

static Inspector *sentinel_ctor(Module *m)
{
    TrafficSentinelModule *mod = dynamic_cast<TrafficSentinelModule *>(m);
    return new TrafficSentinelInspector(mod);
}

static void sentinel_dtor(Inspector *p)
{
    delete p;
}

static const InspectApi sentinel_api = {
    {PT_INSPECTOR, sizeof(InspectApi), INSAPI_VERSION, 0, API_RESERVED, API_OPTIONS, SENTINEL_NAME,
     SENTINEL_HELP, mod_ctor, mod_dtor},
    IT_PACKET,
    PROTO_BIT__ANY_IP,
    nullptr, // buffers
    nullptr, // service
    nullptr, // pinit
    nullptr, // pterm
    nullptr, // tinit
    nullptr, // tterm
    sentinel_ctor,
    sentinel_dtor,
    nullptr, // ssn
    nullptr  // reset
};

//-------------------------------------------------------------------------
// plugin
//-------------------------------------------------------------------------

SO_PUBLIC const BaseApi *snort_plugins[] = {&sentinel_api.base, nullptr};
