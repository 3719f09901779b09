#ifndef MOCK_PERSISTENCE_SINK_HPP
#define MOCK_PERSISTENCE_SINK_HPP

#include <gmock/gmock.h>
#include <mutex>
#include <vector>
#include "persistence_sink.hpp"

class MockPersistenceSink : public IPersistenceSink {
public:
    MOCK_METHOD(bool, persistAlert, (const Alert& alert), (override));
    MOCK_METHOD(bool, persistSnapshot, (const TrafficStatsSnapshot& snapshot), (override));
};

// Accepts everything and keeps a copy; safe to call from the writer thread
class RecordingPersistenceSink : public IPersistenceSink {
public:
    bool persistAlert(const Alert& alert) override {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts_.push_back(alert);
        return true;
    }

    bool persistSnapshot(const TrafficStatsSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_.push_back(snapshot);
        return true;
    }

    std::vector<Alert> alerts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alerts_;
    }

    std::vector<TrafficStatsSnapshot> snapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Alert> alerts_;
    std::vector<TrafficStatsSnapshot> snapshots_;
};

#endif // MOCK_PERSISTENCE_SINK_HPP
