#ifndef FILE_PERSISTENCE_SINK_HPP
#define FILE_PERSISTENCE_SINK_HPP

#include <string>
#include "persistence_sink.hpp"

class FileLogger;

/**
 * @brief Writes alerts to the ALERTS log and snapshots to the stats file
 *
 * The stats file holds only the latest snapshot as key:value lines, which is
 * the format the metrics exporter polls.
 */
class FilePersistenceSink : public IPersistenceSink {
public:
    explicit FilePersistenceSink(FileLogger& logger);

    bool persistAlert(const Alert& alert) override;
    bool persistSnapshot(const TrafficStatsSnapshot& snapshot) override;

    static std::string formatAlert(const Alert& alert);
    static std::string formatSnapshot(const TrafficStatsSnapshot& snapshot);

private:
    FileLogger& logger_;
};

#endif // FILE_PERSISTENCE_SINK_HPP
