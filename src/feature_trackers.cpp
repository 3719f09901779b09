#include "feature_trackers.hpp"
#include "sentinel_config.hpp"
#include <algorithm>

namespace {

// Hard cap on per-key event deques so one noisy source cannot grow without bound
constexpr size_t MAX_EVENTS_PER_KEY = 10000;

void pruneBefore(std::deque<TimePoint>& events, TimePoint cutoff)
{
    while (!events.empty() && events.front() <= cutoff) {
        events.pop_front();
    }
}

void appendBounded(std::deque<TimePoint>& events, TimePoint now)
{
    events.push_back(now);
    if (events.size() > MAX_EVENTS_PER_KEY) {
        events.pop_front();
    }
}

} // namespace

//-------------------------------------------------------------------------
// ConnectionTracker
//-------------------------------------------------------------------------

ConnectionTracker::ConnectionTracker(std::chrono::seconds idle_timeout, size_t capacity)
    : idle_timeout_(idle_timeout), flows_(capacity)
{
}

void ConnectionTracker::record(const FlowKey& key, size_t bytes, TimePoint now)
{
    flows_.upsert(
        key,
        [now]() {
            ConnectionState state;
            state.first_seen = now;
            state.last_seen = now;
            return state;
        },
        [&](ConnectionState& state) {
            // An idle flow that was not swept yet starts over
            if (now - state.last_seen > idle_timeout_) {
                state = ConnectionState{};
                state.first_seen = now;
            }
            state.last_seen = std::max(state.last_seen, now);
            state.bytes += bytes;
            state.packets += 1;
        });
}

std::optional<double> ConnectionTracker::query(const FlowKey& key, TimePoint now) const
{
    std::optional<double> elapsed;
    flows_.with_read(key, [&](const ConnectionState& state) {
        if (now - state.last_seen <= idle_timeout_) {
            elapsed = std::max(0.0, secondsBetween(state.first_seen, now));
        }
    });
    return elapsed;
}

std::optional<ConnectionState> ConnectionTracker::snapshot(const FlowKey& key) const
{
    std::optional<ConnectionState> copy;
    flows_.with_read(key, [&](const ConnectionState& state) { copy = state; });
    return copy;
}

std::optional<double> ConnectionTracker::end(const FlowKey& key, TimePoint now)
{
    auto duration = query(key, now);
    flows_.erase(key);
    return duration;
}

size_t ConnectionTracker::sweep(TimePoint now)
{
    return flows_.erase_if([&](const FlowKey&, const ConnectionState& state) {
        return now - state.last_seen > idle_timeout_;
    });
}

//-------------------------------------------------------------------------
// LoginAttemptTracker
//-------------------------------------------------------------------------

LoginAttemptTracker::LoginAttemptTracker(std::chrono::seconds window, size_t capacity)
    : window_(window), attempts_(capacity)
{
}

void LoginAttemptTracker::record(const std::string& src_ip, TimePoint now)
{
    attempts_.upsert(
        src_ip, []() { return std::deque<TimePoint>{}; },
        [&](std::deque<TimePoint>& events) { appendBounded(events, now); });
}

size_t LoginAttemptTracker::query(const std::string& src_ip, TimePoint now)
{
    size_t count = 0;
    attempts_.with_write(src_ip, [&](std::deque<TimePoint>& events) {
        pruneBefore(events, now - window_);
        count = events.size();
    });
    return count;
}

size_t LoginAttemptTracker::sweep(TimePoint now)
{
    const TimePoint cutoff = now - window_;
    return attempts_.erase_if([&](const std::string&, const std::deque<TimePoint>& events) {
        return events.empty() || events.back() <= cutoff;
    });
}

//-------------------------------------------------------------------------
// FlowRateCalculator
//-------------------------------------------------------------------------

FlowRateCalculator::FlowRateCalculator(std::chrono::seconds idle_timeout, size_t capacity)
    : idle_timeout_(idle_timeout), flows_(capacity)
{
}

void FlowRateCalculator::record(const FlowKey& key, size_t bytes, TimePoint now)
{
    flows_.upsert(
        key,
        [now]() {
            FlowBytes flow;
            flow.first_seen = now;
            flow.last_seen = now;
            return flow;
        },
        [&](FlowBytes& flow) {
            if (now - flow.last_seen > idle_timeout_) {
                flow = FlowBytes{};
                flow.first_seen = now;
            }
            flow.last_seen = std::max(flow.last_seen, now);
            flow.bytes += bytes;
        });
}

double FlowRateCalculator::query(const FlowKey& key, TimePoint now) const
{
    double rate = 0.0;
    flows_.with_read(key, [&](const FlowBytes& flow) {
        double elapsed = std::max(secondsBetween(flow.first_seen, now), 1.0);
        rate = static_cast<double>(flow.bytes) / elapsed;
    });
    return rate;
}

size_t FlowRateCalculator::sweep(TimePoint now)
{
    return flows_.erase_if([&](const FlowKey&, const FlowBytes& flow) {
        return now - flow.last_seen > idle_timeout_;
    });
}

//-------------------------------------------------------------------------
// AccessFrequencyTracker
//-------------------------------------------------------------------------

AccessFrequencyTracker::AccessFrequencyTracker(std::chrono::seconds window, size_t capacity)
    : window_(window), accesses_(capacity)
{
}

void AccessFrequencyTracker::record(const std::string& src_ip, TimePoint now)
{
    accesses_.upsert(
        src_ip, []() { return std::deque<TimePoint>{}; },
        [&](std::deque<TimePoint>& events) {
            appendBounded(events, now);
            pruneBefore(events, now - window_);
        });
}

double AccessFrequencyTracker::query(const std::string& src_ip, TimePoint now)
{
    double frequency = 0.0;
    accesses_.with_write(src_ip, [&](std::deque<TimePoint>& events) {
        pruneBefore(events, now - window_);
        if (events.size() < 2) {
            return;
        }
        double span = secondsBetween(events.front(), events.back());
        auto count = static_cast<double>(events.size());
        frequency = span <= 0.0 ? count : count / span;
    });
    return frequency;
}

size_t AccessFrequencyTracker::sweep(TimePoint now)
{
    const TimePoint cutoff = now - window_;
    return accesses_.erase_if([&](const std::string&, const std::deque<TimePoint>& events) {
        return events.empty() || events.back() <= cutoff;
    });
}

//-------------------------------------------------------------------------
// FeatureTrackers
//-------------------------------------------------------------------------

FeatureTrackers::FeatureTrackers() : FeatureTrackers(SentinelConfig{}) {}

FeatureTrackers::FeatureTrackers(const SentinelConfig& config)
    : connections_(std::chrono::seconds(config.trackers.connection_idle_timeout_seconds),
                   config.trackers.max_tracked_keys),
      logins_(std::chrono::seconds(config.trackers.login_window_seconds),
              config.trackers.max_tracked_keys),
      flow_rates_(std::chrono::seconds(config.trackers.connection_idle_timeout_seconds),
                  config.trackers.max_tracked_keys),
      access_(std::chrono::seconds(config.trackers.access_window_seconds),
              config.trackers.max_tracked_keys)
{
}

size_t FeatureTrackers::sweep(TimePoint now)
{
    return connections_.sweep(now) + logins_.sweep(now) + flow_rates_.sweep(now) + access_.sweep(now);
}
