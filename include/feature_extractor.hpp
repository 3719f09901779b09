#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include <string_view>
#include "feature_trackers.hpp"
#include "feature_vector.hpp"
#include "packet_record.hpp"

/**
 * @brief Turns a packet into a fixed-order feature vector
 *
 * Updates the trackers as a side effect: connection upsert, byte
 * accumulation, access recording and, for auth-failure responses, a failed
 * login attributed to the client. Never throws; on internal failure a zero
 * vector with the configured names is returned.
 */
class FeatureExtractor {
public:
    explicit FeatureExtractor(FeatureSet feature_set = FeatureSet::Live);

    FeatureVector extract(const PacketRecord& packet, FeatureTrackers& trackers) const;

    FeatureSet featureSet() const { return feature_set_; }
    const std::vector<std::string>& featureNames() const { return names_; }

    // True when the payload carries a server-side authentication failure
    static bool isAuthFailure(std::string_view payload);

    // Shannon entropy of the payload bytes, in bits
    static double payloadEntropy(std::string_view payload);

private:
    FeatureVector extractUnchecked(const PacketRecord& packet, FeatureTrackers& trackers) const;

    FeatureSet feature_set_;
    std::vector<std::string> names_;
};

#endif // FEATURE_EXTRACTOR_HPP
