#ifndef FILE_LOGGER_HPP
#define FILE_LOGGER_HPP

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>
#include <deque>
#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <unordered_map>

/**
 * @brief Asynchronous file logger for the traffic sentinel engine
 *
 * Log entries are queued by the packet workers and written by a dedicated
 * thread, so a slow disk never stalls detection. Each FileType maps to its
 * own file with independent size-based rotation.
 */
class FileLogger {
public:
    enum class LogLevel : uint8_t {
        LOG_DEBUG = 0,
        LOG_INFO = 1,
        LOG_WARNING = 2,
        LOG_ERROR = 3,
        LOG_CRITICAL = 4
    };

    enum class FileType : uint8_t {
        ENGINE_LOG = 0,
        ALERTS = 1,
        TRAFFIC_STATS = 2,
        PERFORMANCE_LOG = 3,
        DEBUG_LOG = 4
    };

    struct LogEntry {
        LogLevel level = LogLevel::LOG_INFO;
        FileType file_type = FileType::ENGINE_LOG;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string source_file;
        int line_number = 0;

        LogEntry() = default;
        LogEntry(LogLevel lvl, FileType type, std::string msg,
                 std::string file = "", int line = 0)
            : level(lvl), file_type(type), message(std::move(msg)),
              timestamp(std::chrono::system_clock::now()),
              source_file(std::move(file)), line_number(line) {}
    };

    struct FileConfig {
        std::string file_path;
        size_t max_file_size = 50 * 1024 * 1024;
        int max_backup_files = 5;
        bool auto_flush = true;
        std::chrono::milliseconds flush_interval{5000};
        bool truncate_on_write = false; // file holds only the latest entry
    };

    struct LoggerMetrics {
        uint64_t total_entries = 0;
        uint64_t dropped_entries = 0;
        uint64_t flush_operations = 0;
        uint64_t file_rotations = 0;
        size_t current_queue_size = 0;
        bool is_running = false;
    };

private:
    std::atomic<bool> logger_running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<LogLevel> min_level_{LogLevel::LOG_INFO};
    std::thread logger_thread_;

    mutable std::mutex queue_mutex_;
    std::deque<LogEntry> log_queue_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    bool writer_busy_ = false;

    mutable std::mutex config_mutex_;
    std::unordered_map<FileType, FileConfig> file_configs_;

    // Only touched by the writer thread (or after it has been joined)
    std::unordered_map<FileType, std::unique_ptr<std::ofstream>> active_files_;
    std::unordered_map<FileType, std::chrono::steady_clock::time_point> last_flush_times_;

    std::atomic<uint64_t> total_log_entries_{0};
    std::atomic<uint64_t> dropped_entries_{0};
    std::atomic<uint64_t> flush_operations_{0};
    std::atomic<uint64_t> file_rotations_{0};

    static constexpr size_t MAX_QUEUE_SIZE = 10000;

public:
    FileLogger();
    ~FileLogger();

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;
    FileLogger(FileLogger&&) = delete;
    FileLogger& operator=(FileLogger&&) = delete;

    /**
     * @brief Point every file type at @p log_directory and create it
     * @return false if the directory could not be created
     */
    bool initialize(const std::string& log_directory);
    bool initialize(const std::unordered_map<FileType, FileConfig>& configs);
    void start();
    void stop();
    bool is_running() const { return logger_running_.load(std::memory_order_acquire); }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_release); }
    LogLevel get_min_level() const { return min_level_.load(std::memory_order_acquire); }

    void log(LogLevel level, FileType file_type, const std::string& message,
             const std::string& source_file = "", int line_number = 0);

    void debug(FileType file_type, const std::string& message,
               const std::string& source_file = "", int line_number = 0);
    void info(FileType file_type, const std::string& message,
              const std::string& source_file = "", int line_number = 0);
    void warning(FileType file_type, const std::string& message,
                 const std::string& source_file = "", int line_number = 0);
    void error(FileType file_type, const std::string& message,
               const std::string& source_file = "", int line_number = 0);
    void critical(FileType file_type, const std::string& message,
                  const std::string& source_file = "", int line_number = 0);

    void write_alert(const std::string& alert_line);
    void write_traffic_stats(const std::string& stats_data);
    void write_performance_metrics(const std::string& perf_data);

    // Blocks until every queued entry has been written or the timeout expires
    bool wait_until_drained(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    FileConfig get_file_config(FileType file_type) const;
    LoggerMetrics get_metrics() const;

    static std::string log_level_to_string(LogLevel level);
    static bool parse_log_level(const std::string& text, LogLevel& level);
    static std::string file_type_to_string(FileType type);
    // Alerts, stats and performance output ignore the minimum level
    static bool is_structured(FileType type);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

private:
    void logger_loop();
    void process_log_entry(const LogEntry& entry);
    bool open_file(FileType file_type, bool truncate);
    void close_file(FileType file_type);
    static void ensure_directory_exists(const std::string& file_path);
    bool should_rotate_file(FileType file_type);
    void perform_file_rotation(FileType file_type);
    void flush_file(FileType file_type);
    void flush_open_files();
    void handle_queue_overflow();
    static std::string format_log_message(const LogEntry& entry);
};

#define FILE_LOG_DEBUG(logger, file_type, message) \
    (logger).debug(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_INFO(logger, file_type, message) \
    (logger).info(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_WARNING(logger, file_type, message) \
    (logger).warning(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_ERROR(logger, file_type, message) \
    (logger).error(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_CRITICAL(logger, file_type, message) \
    (logger).critical(file_type, message, __FILE__, __LINE__)

// Shorthands for the engine log used throughout the detection path
#define TRAFFIC_SENTINEL_LOG_INFO(message) \
    FILE_LOG_INFO(g_file_logger, FileLogger::FileType::ENGINE_LOG, message)
#define TRAFFIC_SENTINEL_LOG_WARNING(message) \
    FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::ENGINE_LOG, message)
#define TRAFFIC_SENTINEL_LOG_ERROR(message) \
    FILE_LOG_ERROR(g_file_logger, FileLogger::FileType::ENGINE_LOG, message)
#define TRAFFIC_SENTINEL_LOG_DEBUG(message) \
    FILE_LOG_DEBUG(g_file_logger, FileLogger::FileType::DEBUG_LOG, message)

extern FileLogger g_file_logger;

#endif // FILE_LOGGER_HPP
