#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace gridcalc {

/**
 * @brief 引擎日志器
 *
 * 进程级单例，负责控制台与文件两路输出：
 * - 日志级别过滤
 * - 控制台彩色输出
 * - 文件输出与按大小轮转
 *
 * 引擎的数据状态不经过日志器，日志器只承载诊断信息。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，空字符串表示只输出到控制台
     * @param level 最低输出级别
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件的最大字节数
     * @param max_files 轮转保留的文件个数
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::WARN,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isEnabled(Level level) const { return should_log(level); }

    void log(Level level, const std::string& message);

    void trace(const std::string& message) { log(Level::TRACE, message); }
    void debug(const std::string& message) { log(Level::DEBUG, message); }
    void info(const std::string& message) { log(Level::INFO, message); }
    void warn(const std::string& message) { log(Level::WARN, message); }
    void error(const std::string& message) { log(Level::ERROR, message); }
    void critical(const std::string& message) { log(Level::CRITICAL, message); }

    /**
     * @brief 带源码位置的格式化日志（供宏使用）
     *
     * 格式化失败时退回到原始格式串，日志调用本身不会抛出。
     */
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string body;
        try {
            body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            body = fmt_str;
        }
        log(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), body));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 去掉路径，只保留文件名
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 去掉命名空间和参数列表
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define GRIDCALC_FUNC __FUNCTION__
#else
#  define GRIDCALC_FUNC __func__
#endif

#define GRIDCALC_LOG_TRACE(fmt, ...)    ::gridcalc::Logger::getInstance().logCtx(::gridcalc::Logger::Level::TRACE,    __FILE__, __LINE__, GRIDCALC_FUNC, fmt, ##__VA_ARGS__)
#define GRIDCALC_LOG_DEBUG(fmt, ...)    ::gridcalc::Logger::getInstance().logCtx(::gridcalc::Logger::Level::DEBUG,    __FILE__, __LINE__, GRIDCALC_FUNC, fmt, ##__VA_ARGS__)
#define GRIDCALC_LOG_INFO(fmt, ...)     ::gridcalc::Logger::getInstance().logCtx(::gridcalc::Logger::Level::INFO,     __FILE__, __LINE__, GRIDCALC_FUNC, fmt, ##__VA_ARGS__)
#define GRIDCALC_LOG_WARN(fmt, ...)     ::gridcalc::Logger::getInstance().logCtx(::gridcalc::Logger::Level::WARN,     __FILE__, __LINE__, GRIDCALC_FUNC, fmt, ##__VA_ARGS__)
#define GRIDCALC_LOG_ERROR(fmt, ...)    ::gridcalc::Logger::getInstance().logCtx(::gridcalc::Logger::Level::ERROR,    __FILE__, __LINE__, GRIDCALC_FUNC, fmt, ##__VA_ARGS__)
#define GRIDCALC_LOG_CRITICAL(fmt, ...) ::gridcalc::Logger::getInstance().logCtx(::gridcalc::Logger::Level::CRITICAL, __FILE__, __LINE__, GRIDCALC_FUNC, fmt, ##__VA_ARGS__)

} // namespace gridcalc
