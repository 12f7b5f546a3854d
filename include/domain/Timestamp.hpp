#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <cstdint>

namespace authcore::domain {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Временная метка в UTC
 *
 * Сериализуется в RFC 3339 ("2024-01-31T12:00:00Z").
 */
class Timestamp {
public:
    TimePoint value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(TimePoint tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(TimePoint(std::chrono::seconds(seconds)));
    }

    int64_t toEpochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief RFC 3339 с наносекундами ("2024-01-31T12:00:00.250000000Z")
     *
     * Для сроков, которые сравниваются после разбора: toString()
     * отбрасывает доли секунды.
     */
    std::string toPreciseString() const {
        auto sinceEpoch = value.time_since_epoch();
        auto whole = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch - whole).count();

        auto time_t_val = static_cast<std::time_t>(whole.count());
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(9) << std::setfill('0') << nanos << 'Z';
        return ss.str();
    }

    /**
     * @brief Строгий разбор RFC 3339
     *
     * Допускает дробные секунды и смещение (Z, +hh:mm, -hh:mm).
     * @return std::nullopt, если строка не соответствует формату
     */
    static std::optional<Timestamp> parse(const std::string& str) {
        if (str.size() < 20) return std::nullopt;

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!readDigits(str, 0, 4, year) || str[4] != '-' ||
            !readDigits(str, 5, 2, month) || str[7] != '-' ||
            !readDigits(str, 8, 2, day) || (str[10] != 'T' && str[10] != 't') ||
            !readDigits(str, 11, 2, hour) || str[13] != ':' ||
            !readDigits(str, 14, 2, minute) || str[16] != ':' ||
            !readDigits(str, 17, 2, second)) {
            return std::nullopt;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 ||
            hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }

        size_t pos = 19;
        int64_t nanos = 0;
        if (str[pos] == '.') {
            ++pos;
            size_t start = pos;
            int digits = 0;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                if (digits < 9) {
                    nanos = nanos * 10 + (str[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (pos == start) return std::nullopt;
            for (; digits < 9; ++digits) nanos *= 10;
        }
        if (pos >= str.size()) return std::nullopt;

        int offsetSeconds = 0;
        if (str[pos] == 'Z' || str[pos] == 'z') {
            ++pos;
        } else if (str[pos] == '+' || str[pos] == '-') {
            int sign = str[pos] == '-' ? -1 : 1;
            int offsetHours = 0, offsetMinutes = 0;
            if (pos + 6 != str.size() ||
                !readDigits(str, pos + 1, 2, offsetHours) || str[pos + 3] != ':' ||
                !readDigits(str, pos + 4, 2, offsetMinutes) ||
                offsetHours > 23 || offsetMinutes > 59) {
                return std::nullopt;
            }
            offsetSeconds = sign * (offsetHours * 3600 + offsetMinutes * 60);
            pos += 6;
        } else {
            return std::nullopt;
        }
        if (pos != str.size()) return std::nullopt;

        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        std::time_t epoch = timegm(&tm);

        // timegm нормализует 31 февраля в 3 марта
        if (tm.tm_mday != day || tm.tm_mon != month - 1) return std::nullopt;

        auto tp = std::chrono::system_clock::from_time_t(epoch)
                - std::chrono::seconds(offsetSeconds)
                + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                      std::chrono::nanoseconds(nanos));
        return Timestamp(tp);
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

private:
    static bool readDigits(const std::string& str, size_t pos, size_t count, int& out) {
        if (pos + count > str.size()) return false;
        int result = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(str[i]))) return false;
            result = result * 10 + (str[i] - '0');
        }
        out = result;
        return true;
    }
};

} // namespace authcore::domain
