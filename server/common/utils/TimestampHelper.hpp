#pragma once

/**
 * @brief 时间戳助手
 *
 * 统一使用 UTC ISO-8601 文本（数据库连接时区固定为 UTC），精度为毫秒。
 */
class TimestampHelper {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static std::string now() {
        return toIso(std::chrono::system_clock::now());
    }

    /**
     * @brief 时间点 → "YYYY-MM-DDTHH:MM:SS[.sss]Z"（截断到毫秒，整秒时省略小数）
     */
    static std::string toIso(TimePoint tp) {
        auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
        auto secs = std::chrono::floor<std::chrono::seconds>(ms);
        auto dp = std::chrono::floor<std::chrono::days>(secs);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{secs - dp};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count();
        if (auto frac = (ms - secs).count(); frac != 0) {
            oss << "." << std::setw(3) << frac;
        }
        oss << "Z";
        return oss.str();
    }

    /**
     * @brief 解析 ISO-8601 / PostgreSQL 时间文本
     *
     * 支持 "2024-05-01T12:00:00Z"、"2024-05-01 12:00:00.123+00"、
     * "2024-05-01T12:00:00+08:00" 等格式，小数秒保留到毫秒。
     */
    static std::optional<TimePoint> parse(const std::string& text) {
        if (text.size() < 19) return std::nullopt;

        std::tm tm{};
        std::istringstream ss(text.substr(0, 19));
        ss >> std::get_time(&tm, text[10] == 'T' ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S");
        if (ss.fail()) return std::nullopt;

        auto tp = std::chrono::system_clock::from_time_t(
#ifdef _WIN32
            _mkgmtime(&tm)
#else
            timegm(&tm)
#endif
        );

        // 小数秒：取前三位，其余截断
        size_t pos = 19;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int millis = 0;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 3) {
                    millis = millis * 10 + (text[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (; digits < 3; ++digits) millis *= 10;
            tp += std::chrono::milliseconds(millis);
        }

        if (pos >= text.size() || text[pos] == 'Z') return tp;

        // 时区偏移 ±HH[:MM] / ±HHMM
        char sign = text[pos];
        if (sign != '+' && sign != '-') return std::nullopt;
        std::string digits;
        for (size_t i = pos + 1; i < text.size(); ++i) {
            if (std::isdigit(static_cast<unsigned char>(text[i]))) digits.push_back(text[i]);
            else if (text[i] != ':') return std::nullopt;
        }
        if (digits.size() != 2 && digits.size() != 4) return std::nullopt;

        int hours = std::stoi(digits.substr(0, 2));
        int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
        auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
        return sign == '+' ? tp - offset : tp + offset;
    }

    /**
     * @brief 时间点 → 毫秒时间戳（WebSocket 推送用）
     */
    static int64_t toEpochMs(TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
};
