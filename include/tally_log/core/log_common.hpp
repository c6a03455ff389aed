#ifndef TALLY_LOG_COMMON_HPP
#define TALLY_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <memory>
#include <utility>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace tally {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::tm localTime(const std::chrono::system_clock::time_point &time) {
        std::time_t t = std::chrono::system_clock::to_time_t(time);
        std::tm tmBuf;
#if defined(_MSC_VER)
        localtime_s(&tmBuf, &t);
#else
        localtime_r(&t, &tmBuf);
#endif
        return tmBuf;
    }

    inline std::string formatLocalTime(const std::chrono::system_clock::time_point &time, const char *pattern) {
        std::tm tmBuf = localTime(time);
        char buf[64];
        size_t written = std::strftime(buf, sizeof(buf), pattern, &tmBuf);
        return std::string(buf, written);
    }
} // namespace detail

    /// "MM/DD/YY HH:MM:SS", the console column.
    inline std::string formatConsoleTimestamp(const std::chrono::system_clock::time_point &time) {
        return detail::formatLocalTime(time, "%m/%d/%y %H:%M:%S");
    }

    /// "YYYY-MM-DD HH:MM:SS", the CSV timestamp field.
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        return detail::formatLocalTime(time, "%Y-%m-%d %H:%M:%S");
    }

    /// ISO 8601 local time with microseconds and UTC offset.
    /// Example: "2026-10-19T14:03:07.123456+09:00"
    inline std::string formatIsoTimestamp(const std::chrono::system_clock::time_point &time) {
        std::tm tmBuf = detail::localTime(time);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            time.time_since_epoch()) % 1000000;

        char buf[64];
        size_t pos = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmBuf);
        std::snprintf(buf + pos, sizeof(buf) - pos, ".%06ld",
                      static_cast<long>((micros.count() + 1000000) % 1000000));
        std::string result(buf);

        // strftime renders the offset as +hhmm; ISO 8601 extended form wants +hh:mm.
        char offset[16];
        size_t offsetLen = std::strftime(offset, sizeof(offset), "%z", &tmBuf);
        if (offsetLen == 5) {
            result.append(offset, 3);
            result += ':';
            result.append(offset + 3, 2);
        } else {
            result.append(offset, offsetLen);
        }
        return result;
    }

    inline long currentProcessId() {
#ifdef _WIN32
        return static_cast<long>(_getpid());
#else
        return static_cast<long>(getpid());
#endif
    }
} // namespace tally

#endif // TALLY_LOG_COMMON_HPP
