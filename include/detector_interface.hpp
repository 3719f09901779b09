#ifndef DETECTOR_INTERFACE_H
#define DETECTOR_INTERFACE_H

#include <atomic>
#include <string>
#include <vector>
#include "detection.hpp"
#include "feature_vector.hpp"
#include "packet_history.hpp"
#include "packet_record.hpp"

namespace detection {
    // Everything a detector may look at for one packet. All members are
    // read-only for the duration of the detect() call.
    struct DetectionInput {
        const PacketRecord& packet;
        const FeatureVector& features;
        const HistorySummary& history;
    };

    class IDetector {
    public:
        virtual ~IDetector() = default;
        virtual std::vector<Detection> detect(const DetectionInput& input) = 0;
        virtual DetectorKind kind() const = 0;
        virtual std::string getName() const = 0;
        virtual bool isEnabled() const = 0;
        virtual void setEnabled(bool enabled) = 0;
        virtual int getPriority() const = 0; // Higher priority detectors run first
    };

    // Base implementation for common detector functionality
    class BaseDetector : public IDetector {
    private:
        std::string name_;
        DetectorKind kind_;
        std::atomic<bool> enabled_;
        int priority_;

    public:
        BaseDetector(std::string name, DetectorKind kind, int priority = 100)
            : name_(std::move(name)), kind_(kind), enabled_(true), priority_(priority) {}

        DetectorKind kind() const override { return kind_; }
        std::string getName() const override { return name_; }
        bool isEnabled() const override { return enabled_.load(std::memory_order_acquire); }
        void setEnabled(bool enabled) override { enabled_.store(enabled, std::memory_order_release); }
        int getPriority() const override { return priority_; }
    };
}

#endif // DETECTOR_INTERFACE_H
