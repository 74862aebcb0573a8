#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>

namespace gridcalc {
namespace utils {

/**
 * @brief 时间工具类 - 日期值与纪元天数之间的换算
 *
 * 日期值以 1970-01-01 为第 0 天（UTC，前推格里历），不依赖本地时区。
 */
class TimeUtils {
public:
    struct CivilDate {
        int64_t year;
        unsigned month;  // 1-12
        unsigned day;    // 1-31
    };

    /**
     * @brief 年月日转纪元天数
     */
    static int64_t daysFromCivil(int64_t year, unsigned month, unsigned day) {
        year -= month <= 2 ? 1 : 0;
        const int64_t era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);
        const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    /**
     * @brief 纪元天数转年月日
     */
    static CivilDate civilFromDays(int64_t days) {
        days += 719468;
        const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(days - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned day = doy - (153 * mp + 2) / 5 + 1;
        const unsigned month = mp < 10 ? mp + 3 : mp - 9;
        const int64_t year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
        return CivilDate{year, month, day};
    }

    /**
     * @brief 纪元天数格式化为 ISO 8601 日期（YYYY-MM-DD）
     */
    static std::string formatIsoDate(int64_t days) {
        CivilDate date = civilFromDays(days);
        return fmt::format("{:04}-{:02}-{:02}", date.year, date.month, date.day);
    }

    /**
     * @brief 时间点转带小数的纪元天数
     */
    static double fractionalDaysSinceEpoch(std::chrono::system_clock::time_point tp) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        return static_cast<double>(ms) / 86400000.0;
    }

    /**
     * @brief 时间点所在的纪元日（向下取整）
     */
    static int64_t daysSinceEpoch(std::chrono::system_clock::time_point tp) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        int64_t days = secs / 86400;
        if (secs % 86400 < 0) {
            --days;
        }
        return days;
    }
};

}} // namespace gridcalc::utils
