#ifndef FEATURE_VECTOR_HPP
#define FEATURE_VECTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

enum class FeatureSet : std::uint8_t {
    Live = 0,     // 6 features
    Extended = 1  // live features + ports, flags, payload entropy
};

// Fixed-order named features. names and values always have the same length.
struct FeatureVector {
    std::vector<std::string> names;
    std::vector<double> values;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }

    // Value by name, or @p fallback when absent
    double get(const std::string& name, double fallback = 0.0) const {
        for (size_t i = 0; i < names.size() && i < values.size(); ++i) {
            if (names[i] == name) {
                return values[i];
            }
        }
        return fallback;
    }
};

namespace features {
    inline const std::string PACKET_SIZE = "packet_size";
    inline const std::string PROTOCOL_TYPE = "protocol_type";
    inline const std::string CONNECTION_DURATION = "connection_duration";
    inline const std::string FAILED_LOGIN_ATTEMPTS = "failed_login_attempts";
    inline const std::string DATA_TRANSFER_RATE = "data_transfer_rate";
    inline const std::string ACCESS_FREQUENCY = "access_frequency";
    inline const std::string SRC_PORT = "src_port";
    inline const std::string DST_PORT = "dst_port";
    inline const std::string TCP_FLAGS = "tcp_flags";
    inline const std::string PAYLOAD_ENTROPY = "payload_entropy";

    inline std::vector<std::string> namesFor(FeatureSet set) {
        std::vector<std::string> names = {PACKET_SIZE, PROTOCOL_TYPE, CONNECTION_DURATION,
                                          FAILED_LOGIN_ATTEMPTS, DATA_TRANSFER_RATE, ACCESS_FREQUENCY};
        if (set == FeatureSet::Extended) {
            names.insert(names.end(), {SRC_PORT, DST_PORT, TCP_FLAGS, PAYLOAD_ENTROPY});
        }
        return names;
    }

    // All-zero vector with the names of @p set
    inline FeatureVector zeroVector(FeatureSet set) {
        FeatureVector fv;
        fv.names = namesFor(set);
        fv.values.assign(fv.names.size(), 0.0);
        return fv;
    }
}

#endif // FEATURE_VECTOR_HPP
