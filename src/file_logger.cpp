#include "file_logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>

FileLogger g_file_logger;

namespace {

FileLogger::FileConfig make_config(const std::string& dir, const char* name, size_t max_size,
                                   int backups, std::chrono::milliseconds flush_interval,
                                   bool truncate = false)
{
    FileLogger::FileConfig cfg;
    cfg.file_path = dir + "/" + name;
    cfg.max_file_size = max_size;
    cfg.max_backup_files = backups;
    cfg.auto_flush = true;
    cfg.flush_interval = flush_interval;
    cfg.truncate_on_write = truncate;
    return cfg;
}

std::unordered_map<FileLogger::FileType, FileLogger::FileConfig> default_configs(const std::string& dir)
{
    using FT = FileLogger::FileType;
    std::unordered_map<FT, FileLogger::FileConfig> configs;
    configs[FT::ENGINE_LOG] = make_config(dir, "engine.log", 50 * 1024 * 1024, 5,
                                          std::chrono::milliseconds(2000));
    configs[FT::ALERTS] = make_config(dir, "alerts.log", 100 * 1024 * 1024, 10,
                                      std::chrono::milliseconds(1000));
    configs[FT::TRAFFIC_STATS] = make_config(dir, "traffic_sentinel_stats", 1024 * 1024, 1,
                                             std::chrono::milliseconds(1000), true);
    configs[FT::PERFORMANCE_LOG] = make_config(dir, "performance.log", 20 * 1024 * 1024, 3,
                                               std::chrono::milliseconds(10000));
    configs[FT::DEBUG_LOG] = make_config(dir, "debug.log", 50 * 1024 * 1024, 2,
                                         std::chrono::milliseconds(30000));
    return configs;
}

} // namespace

FileLogger::FileLogger() : file_configs_(default_configs("/var/log/traffic_sentinel")) {}

FileLogger::~FileLogger() {
    stop();
}

bool FileLogger::initialize(const std::string& log_directory) {
    return initialize(default_configs(log_directory));
}

bool FileLogger::initialize(const std::unordered_map<FileType, FileConfig>& configs) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (const auto& [type, config] : configs) {
        file_configs_[type] = config;
    }

    for (const auto& [type, config] : file_configs_) {
        try {
            ensure_directory_exists(config.file_path);
        } catch (const std::exception& e) {
            std::cerr << "FileLogger: Failed to create directory for "
                      << file_type_to_string(type) << ": " << e.what() << '\n';
            return false;
        }
    }
    return true;
}

void FileLogger::start() {
    if (logger_running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    shutdown_requested_.store(false, std::memory_order_release);

    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (const auto& [type, config] : file_configs_) {
            last_flush_times_[type] = now;
        }
    }

    logger_thread_ = std::thread(&FileLogger::logger_loop, this);
}

void FileLogger::stop() {
    if (!logger_running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    queue_cv_.notify_all();

    if (logger_thread_.joinable()) {
        logger_thread_.join();
    }

    logger_running_.store(false, std::memory_order_release);

    for (auto& [type, file] : active_files_) {
        if (file && file->is_open()) {
            file->flush();
            file->close();
        }
    }
    active_files_.clear();
    drained_cv_.notify_all();
}

void FileLogger::log(LogLevel level, FileType file_type, const std::string& message,
                     const std::string& source_file, int line_number) {
    const bool structured = is_structured(file_type);
    if (!structured && level < min_level_.load(std::memory_order_acquire)) {
        return;
    }

    if (!logger_running_.load(std::memory_order_acquire)) {
        // Nowhere to write yet; keep problems visible on stderr
        if (!structured && level >= LogLevel::LOG_WARNING) {
            std::cerr << format_log_message(LogEntry(level, file_type, message, source_file, line_number))
                      << '\n';
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (log_queue_.size() >= MAX_QUEUE_SIZE) {
            handle_queue_overflow();
        }
        log_queue_.emplace_back(level, file_type, message, source_file, line_number);
        total_log_entries_.fetch_add(1, std::memory_order_relaxed);
    }

    queue_cv_.notify_one();
}

void FileLogger::debug(FileType file_type, const std::string& message,
                       const std::string& source_file, int line_number) {
    log(LogLevel::LOG_DEBUG, file_type, message, source_file, line_number);
}

void FileLogger::info(FileType file_type, const std::string& message,
                      const std::string& source_file, int line_number) {
    log(LogLevel::LOG_INFO, file_type, message, source_file, line_number);
}

void FileLogger::warning(FileType file_type, const std::string& message,
                         const std::string& source_file, int line_number) {
    log(LogLevel::LOG_WARNING, file_type, message, source_file, line_number);
}

void FileLogger::error(FileType file_type, const std::string& message,
                       const std::string& source_file, int line_number) {
    log(LogLevel::LOG_ERROR, file_type, message, source_file, line_number);
}

void FileLogger::critical(FileType file_type, const std::string& message,
                          const std::string& source_file, int line_number) {
    log(LogLevel::LOG_CRITICAL, file_type, message, source_file, line_number);
}

void FileLogger::write_alert(const std::string& alert_line) {
    log(LogLevel::LOG_INFO, FileType::ALERTS, alert_line);
}

void FileLogger::write_traffic_stats(const std::string& stats_data) {
    log(LogLevel::LOG_INFO, FileType::TRAFFIC_STATS, stats_data);
}

void FileLogger::write_performance_metrics(const std::string& perf_data) {
    log(LogLevel::LOG_INFO, FileType::PERFORMANCE_LOG, perf_data);
}

bool FileLogger::wait_until_drained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return drained_cv_.wait_for(lock, timeout, [this] {
        return (log_queue_.empty() && !writer_busy_) ||
               !logger_running_.load(std::memory_order_acquire);
    });
}

FileLogger::FileConfig FileLogger::get_file_config(FileType file_type) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = file_configs_.find(file_type);
    return (it != file_configs_.end()) ? it->second : FileConfig{};
}

FileLogger::LoggerMetrics FileLogger::get_metrics() const {
    LoggerMetrics metrics;
    metrics.total_entries = total_log_entries_.load(std::memory_order_acquire);
    metrics.dropped_entries = dropped_entries_.load(std::memory_order_acquire);
    metrics.flush_operations = flush_operations_.load(std::memory_order_acquire);
    metrics.file_rotations = file_rotations_.load(std::memory_order_acquire);
    metrics.is_running = logger_running_.load(std::memory_order_acquire);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        metrics.current_queue_size = log_queue_.size();
    }
    return metrics;
}

bool FileLogger::is_structured(FileType type) {
    return type == FileType::ALERTS || type == FileType::TRAFFIC_STATS ||
           type == FileType::PERFORMANCE_LOG;
}

std::string FileLogger::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO: return "INFO";
        case LogLevel::LOG_WARNING: return "WARNING";
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

bool FileLogger::parse_log_level(const std::string& text, LogLevel& level) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") level = LogLevel::LOG_DEBUG;
    else if (lower == "info") level = LogLevel::LOG_INFO;
    else if (lower == "warning" || lower == "warn") level = LogLevel::LOG_WARNING;
    else if (lower == "error") level = LogLevel::LOG_ERROR;
    else if (lower == "critical") level = LogLevel::LOG_CRITICAL;
    else return false;
    return true;
}

std::string FileLogger::file_type_to_string(FileType type) {
    switch (type) {
        case FileType::ENGINE_LOG: return "ENGINE_LOG";
        case FileType::ALERTS: return "ALERTS";
        case FileType::TRAFFIC_STATS: return "TRAFFIC_STATS";
        case FileType::PERFORMANCE_LOG: return "PERFORMANCE_LOG";
        case FileType::DEBUG_LOG: return "DEBUG_LOG";
        default: return "UNKNOWN";
    }
}

std::string FileLogger::format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_storage;
    localtime_r(&time_t_value, &tm_storage);
    std::ostringstream oss;
    oss << std::put_time(&tm_storage, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void FileLogger::logger_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
            return !log_queue_.empty() || shutdown_requested_.load(std::memory_order_acquire);
        });

        while (!log_queue_.empty()) {
            LogEntry entry = std::move(log_queue_.front());
            log_queue_.pop_front();
            writer_busy_ = true;
            lock.unlock();

            try {
                process_log_entry(entry);
            } catch (const std::exception& e) {
                std::cerr << "FileLogger: Error processing log entry: " << e.what() << '\n';
                dropped_entries_.fetch_add(1, std::memory_order_relaxed);
            }

            lock.lock();
            writer_busy_ = false;
        }
        drained_cv_.notify_all();

        if (shutdown_requested_.load(std::memory_order_acquire)) {
            break;
        }

        lock.unlock();
        flush_open_files();
        lock.lock();
    }
    lock.unlock();

    for (auto& [type, file] : active_files_) {
        if (file && file->is_open()) {
            file->flush();
        }
    }
}

void FileLogger::flush_open_files() {
    auto now = std::chrono::steady_clock::now();
    std::unordered_map<FileType, FileConfig> config_snapshot;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        config_snapshot = file_configs_;
    }

    for (const auto& [type, config] : config_snapshot) {
        if (config.auto_flush && now - last_flush_times_[type] >= config.flush_interval) {
            flush_file(type);
            last_flush_times_[type] = now;
        }
        if (!config.truncate_on_write && should_rotate_file(type)) {
            perform_file_rotation(type);
        }
    }
}

void FileLogger::process_log_entry(const LogEntry& entry) {
    FileConfig config = get_file_config(entry.file_type);

    if (config.truncate_on_write) {
        close_file(entry.file_type);
    }
    if (!open_file(entry.file_type, config.truncate_on_write)) {
        dropped_entries_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto& file = active_files_[entry.file_type];
    *file << format_log_message(entry) << '\n';

    if (config.truncate_on_write || entry.level >= LogLevel::LOG_ERROR) {
        file->flush();
        flush_operations_.fetch_add(1, std::memory_order_relaxed);
    }

    bool failed = file->fail();
    if (failed) {
        std::cerr << "FileLogger: Failed to write to " << config.file_path << '\n';
        dropped_entries_.fetch_add(1, std::memory_order_relaxed);
    }
    if (failed || config.truncate_on_write) {
        close_file(entry.file_type);
    }
}

bool FileLogger::open_file(FileType file_type, bool truncate) {
    auto it = active_files_.find(file_type);
    if (it != active_files_.end() && it->second && it->second->is_open()) {
        return true;
    }

    FileConfig config = get_file_config(file_type);
    if (config.file_path.empty()) {
        std::cerr << "FileLogger: No config found for file type: "
                  << file_type_to_string(file_type) << '\n';
        return false;
    }

    try {
        ensure_directory_exists(config.file_path);
        auto mode = truncate ? std::ios::trunc : std::ios::app;
        auto file = std::make_unique<std::ofstream>(config.file_path, std::ios::out | mode);
        if (!file->is_open()) {
            std::cerr << "FileLogger: Failed to open file: " << config.file_path
                      << " - " << std::strerror(errno) << '\n';
            return false;
        }
        active_files_[file_type] = std::move(file);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "FileLogger: Exception opening file " << config.file_path
                  << ": " << e.what() << '\n';
        return false;
    }
}

void FileLogger::close_file(FileType file_type) {
    auto it = active_files_.find(file_type);
    if (it != active_files_.end()) {
        if (it->second && it->second->is_open()) {
            it->second->flush();
            it->second->close();
        }
        active_files_.erase(it);
    }
}

void FileLogger::ensure_directory_exists(const std::string& file_path) {
    std::filesystem::path dir = std::filesystem::path(file_path).parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

bool FileLogger::should_rotate_file(FileType file_type) {
    FileConfig config = get_file_config(file_type);
    std::error_code ec;
    if (config.file_path.empty() || !std::filesystem::exists(config.file_path, ec)) {
        return false;
    }
    auto size = std::filesystem::file_size(config.file_path, ec);
    return !ec && size >= config.max_file_size;
}

void FileLogger::perform_file_rotation(FileType file_type) {
    FileConfig config = get_file_config(file_type);
    close_file(file_type);

    try {
        // engine.log.N is dropped, engine.log.(i) -> engine.log.(i+1)
        std::string oldest = config.file_path + "." + std::to_string(config.max_backup_files);
        if (std::filesystem::exists(oldest)) {
            std::filesystem::remove(oldest);
        }
        for (int i = config.max_backup_files - 1; i >= 1; --i) {
            std::string from = config.file_path + "." + std::to_string(i);
            if (std::filesystem::exists(from)) {
                std::filesystem::rename(from, config.file_path + "." + std::to_string(i + 1));
            }
        }
        if (std::filesystem::exists(config.file_path)) {
            std::filesystem::rename(config.file_path, config.file_path + ".1");
        }
        file_rotations_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "FileLogger: File rotation failed for "
                  << file_type_to_string(file_type) << ": " << e.what() << '\n';
    }
}

void FileLogger::flush_file(FileType file_type) {
    auto it = active_files_.find(file_type);
    if (it != active_files_.end() && it->second && it->second->is_open()) {
        it->second->flush();
        flush_operations_.fetch_add(1, std::memory_order_relaxed);
    }
}

void FileLogger::handle_queue_overflow() {
    // Caller holds queue_mutex_. Oldest entries go first.
    constexpr double overflow_factor = 0.8;
    auto target_size = static_cast<size_t>(static_cast<double>(MAX_QUEUE_SIZE) * overflow_factor);
    size_t dropped = 0;
    while (log_queue_.size() > target_size) {
        log_queue_.pop_front();
        ++dropped;
    }
    dropped_entries_.fetch_add(dropped, std::memory_order_relaxed);
    std::cerr << "FileLogger: Queue overflow - dropped " << dropped << " entries" << '\n';
}

std::string FileLogger::format_log_message(const LogEntry& entry) {
    // Structured outputs are written verbatim
    if (entry.file_type == FileType::TRAFFIC_STATS || entry.file_type == FileType::PERFORMANCE_LOG) {
        return entry.message;
    }

    std::ostringstream oss;
    oss << "[" << format_timestamp(entry.timestamp) << "] ";
    oss << "[" << log_level_to_string(entry.level) << "] ";

    if (!entry.source_file.empty()) {
        std::string filename = entry.source_file;
        size_t last_slash = filename.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            filename = filename.substr(last_slash + 1);
        }
        oss << "[" << filename << ":" << entry.line_number << "] ";
    }

    oss << entry.message;
    return oss.str();
}
