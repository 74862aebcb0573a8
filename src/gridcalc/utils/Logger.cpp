#include "gridcalc/utils/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>

namespace gridcalc {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    current_level_.store(level);
    enable_console_.store(enable_console);
    max_file_size_ = max_file_size;
    max_files_ = max_files == 0 ? 1 : max_files;
    write_mode_ = write_mode;

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    log_file_path_ = log_file_path;
    current_file_size_ = 0;

    if (!log_file_path_.empty()) {
        std::error_code ec;
        std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
        if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Logger: cannot create log directory " << log_dir.string()
                      << ": " << ec.message() << std::endl;
        }

        std::ios::openmode mode = (write_mode_ == WriteMode::APPEND)
                                      ? (std::ios::out | std::ios::app)
                                      : (std::ios::out | std::ios::trunc);
        file_stream_.open(log_file_path_, mode);
        if (!file_stream_.is_open()) {
            std::cerr << "Logger: cannot open log file " << log_file_path_ << std::endl;
        } else if (write_mode_ == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_ = static_cast<size_t>(file_stream_.tellp());
        }
    }

    initialized_.store(true);
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::should_log(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!should_log(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string formatted = format_message(level, message);
    if (enable_console_.load()) {
        log_to_console(level, formatted);
    }
    log_to_file(formatted);

    // WARN 及以上立即落盘
    if (level >= Level::WARN && file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::log_to_console(Level level, const std::string& message) {
    const char* color_code = "\033[0m";
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break;
        case Level::DEBUG:    color_code = "\033[36m"; break;
        case Level::INFO:     color_code = "\033[32m"; break;
        case Level::WARN:     color_code = "\033[33m"; break;
        case Level::ERROR:    color_code = "\033[31m"; break;
        case Level::CRITICAL: color_code = "\033[35m"; break;
        default: break;
    }
    // 诊断信息走 stderr，不污染调用方的标准输出
    std::cerr << color_code << message << "\033[0m" << '\n';
}

void Logger::log_to_file(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }
    rotate_file_if_needed();
    file_stream_ << message << '\n';
    current_file_size_ += message.size() + 1;
}

void Logger::rotate_file_if_needed() {
    if (current_file_size_ < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::string older = get_rotated_filename(i - 1);
        if (std::filesystem::exists(older, ec)) {
            std::filesystem::rename(older, get_rotated_filename(i), ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::get_rotated_filename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::format_message(Level level, const std::string& message) const {
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}",
                       now, level_to_string(level), tid.str(), message);
}

const char* Logger::level_to_string(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace gridcalc
