#pragma once

namespace fs = std::filesystem;

/**
 * @brief 日志配置（custom_config.logging）
 */
struct LogSettings {
    std::string dir = "./logs";
    std::string level = "INFO";
    bool console = false;
    uint64_t maxFileMb = 100;
    int retentionDays = 30;     // 0 表示不清理历史日志

    static std::optional<trantor::Logger::LogLevel> parseLevel(const std::string& level) {
        static const std::map<std::string, trantor::Logger::LogLevel> levels = {
            {"TRACE", trantor::Logger::kTrace}, {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},   {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError}, {"FATAL", trantor::Logger::kFatal},
        };
        auto it = levels.find(level);
        if (it == levels.end()) return std::nullopt;
        return it->second;
    }

    static LogSettings fromJson(const Json::Value& logging, std::vector<std::string>& errors) {
        LogSettings s;
        if (logging.isNull()) return s;
        if (!logging.isObject()) {
            errors.emplace_back("[custom_config.logging] 必须是对象");
            return s;
        }
        s.dir = logging.get("dir", s.dir).asString();
        s.level = logging.get("level", s.level).asString();
        s.console = logging.get("console", s.console).asBool();
        if (!parseLevel(s.level)) {
            errors.push_back("[custom_config.logging] level 无效: " + s.level + "（TRACE/DEBUG/INFO/WARN/ERROR/FATAL）");
        }
        if (logging.isMember("max_file_mb")) {
            if (!logging["max_file_mb"].isIntegral() || logging["max_file_mb"].asInt64() < 1) {
                errors.emplace_back("[custom_config.logging] max_file_mb 必须为正整数");
            } else {
                s.maxFileMb = logging["max_file_mb"].asUInt64();
            }
        }
        if (logging.isMember("retention_days")) {
            if (!logging["retention_days"].isIntegral() || logging["retention_days"].asInt() < 0) {
                errors.emplace_back("[custom_config.logging] retention_days 不能为负");
            } else {
                s.retentionDays = logging["retention_days"].asInt();
            }
        }
        return s;
    }
};

/**
 * @brief 日志管理器
 *
 * trantor::AsyncFileLogger 异步写盘，按日期切换文件，单文件超过 max_file_mb 时由 trantor 轮转。
 * 文件命名: <dir>/hazard-monitor_YYYY-MM-DD.*.log，超过 retention_days 的文件在切换日期时删除。
 *
 * 启动顺序：initialize() 先以默认设置接管 trantor 输出（配置错误也能落盘），
 * 配置加载后 apply() 生效。
 */
class LoggerManager {
public:
    static void initialize(const LogSettings& settings = LogSettings{}) {
        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(output, flush);
        apply(settings);
    }

    static void apply(const LogSettings& settings) {
        std::unique_ptr<trantor::AsyncFileLogger> old;
        int today = todayInt();
        {
            std::unique_lock lock(mutex_);
            bool reopen = !fileLogger_ || settings.dir != settings_.dir || settings.maxFileMb != settings_.maxFileMb;
            settings_ = settings;
            if (reopen) {
                fs::create_directories(settings_.dir);
                old = std::move(fileLogger_);
                fileLogger_ = openLogger(today);
                currentDay_.store(today, std::memory_order_relaxed);
            }
        }
        consoleOutput_.store(settings.console, std::memory_order_relaxed);
        trantor::Logger::setLogLevel(LogSettings::parseLevel(settings.level).value_or(trantor::Logger::kInfo));
        purgeExpired(today);
    }

    static void close() {
        std::unique_lock lock(mutex_);
        fileLogger_.reset();
    }

private:
    inline static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    inline static std::shared_mutex mutex_;
    inline static LogSettings settings_;
    inline static std::atomic<int> currentDay_{0};
    inline static std::atomic<bool> consoleOutput_{false};

    static constexpr const char* FILE_PREFIX = "hazard-monitor_";

    /** 当天日期 YYYYMMDD */
    static int todayInt() {
        std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<int>(static_cast<unsigned>(ymd.month())) * 100
             + static_cast<int>(static_cast<unsigned>(ymd.day()));
    }

    static std::string dayToStr(int day) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", day / 10000, day % 10000 / 100, day % 100);
        return buf;
    }

    /** 调用方持有 mutex_ */
    static std::unique_ptr<trantor::AsyncFileLogger> openLogger(int day) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(settings_.dir + "/" + FILE_PREFIX + dayToStr(day));
        logger->setFileSizeLimit(settings_.maxFileMb * 1024 * 1024);
        logger->startLogging();
        return logger;
    }

    static void rotate(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> old;
        {
            std::unique_lock lock(mutex_);
            if (today == currentDay_.load(std::memory_order_relaxed)) return;
            old = std::move(fileLogger_);
            fileLogger_ = openLogger(today);
            currentDay_.store(today, std::memory_order_relaxed);
        }
        // old 在锁外析构并 flush
        old.reset();
        purgeExpired(today);
    }

    /**
     * @brief 删除日期早于保留期的日志文件（按文件名中的日期判断）
     */
    static void purgeExpired(int today) {
        std::string dir;
        int retention = 0;
        {
            std::shared_lock lock(mutex_);
            dir = settings_.dir;
            retention = settings_.retentionDays;
        }
        if (retention <= 0) return;

        std::chrono::year_month_day todayYmd{std::chrono::year(today / 10000),
                                             std::chrono::month(static_cast<unsigned>(today % 10000 / 100)),
                                             std::chrono::day(static_cast<unsigned>(today % 100))};
        auto cutoff = std::chrono::sys_days(todayYmd) - std::chrono::days(retention);

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            auto name = entry.path().filename().string();
            if (!name.starts_with(FILE_PREFIX) || name.size() < std::strlen(FILE_PREFIX) + 10) continue;
            auto date = parseDay(std::string_view(name).substr(std::strlen(FILE_PREFIX), 10));
            if (!date || *date >= cutoff) continue;
            std::error_code removeEc;
            if (!fs::remove(entry.path(), removeEc) && removeEc) {
                LOG_WARN << "[Logger] Failed to remove expired log " << name << ": " << removeEc.message();
            }
        }
    }

    /** "YYYY-MM-DD" */
    static std::optional<std::chrono::sys_days> parseDay(std::string_view s) {
        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
        if (std::from_chars(s.data(), s.data() + 4, y).ec != std::errc()
            || std::from_chars(s.data() + 5, s.data() + 7, m).ec != std::errc()
            || std::from_chars(s.data() + 8, s.data() + 10, d).ec != std::errc()) {
            return std::nullopt;
        }
        std::chrono::year_month_day ymd{std::chrono::year(y), std::chrono::month(m), std::chrono::day(d)};
        if (!ymd.ok()) return std::nullopt;
        return std::chrono::sys_days(ymd);
    }

    /**
     * @brief "YYYYMMDD HH:MM:SS.micros tid LEVEL [func] msg - file:line" → "YYYY-MM-DD HH:MM:SS tid LEVEL msg"
     */
    static std::string format(const char* msg, uint64_t len) {
        std::string_view raw(msg, len);
        if (len < 17 || raw[8] != ' ') return std::string(raw);
        auto timeEnd = raw.find(' ', 9);
        if (timeEnd == std::string_view::npos || timeEnd <= 15) return std::string(raw);

        std::string rest(raw.substr(timeEnd));
        if (auto op = rest.find("[operator ()"); op != std::string::npos) {
            if (auto close = rest.find("] ", op); close != std::string::npos) rest.erase(op, close + 2 - op);
        }
        if (auto src = rest.rfind(" - "); src != std::string::npos
            && (rest.find(".hpp:", src) != std::string::npos || rest.find(".cpp:", src) != std::string::npos)) {
            rest.erase(src);
            rest += '\n';
        }

        std::string out;
        out.reserve(rest.size() + 19);
        out.append(raw.substr(0, 4)).append("-").append(raw.substr(4, 2)).append("-").append(raw.substr(6, 2));
        out.append(" ").append(raw.substr(9, 8)).append(rest);
        return out;
    }

    static void output(const char* msg, const uint64_t len) {
        auto line = format(msg, len);

        int today = todayInt();
        if (today != currentDay_.load(std::memory_order_relaxed)) rotate(today);

        if (consoleOutput_.load(std::memory_order_relaxed)) {
            std::fwrite(line.data(), 1, line.size(), stdout);
        }

        std::shared_lock lock(mutex_);
        if (fileLogger_) fileLogger_->output(line.c_str(), line.size());
    }

    static void flush() {
        std::shared_lock lock(mutex_);
        if (fileLogger_) fileLogger_->flush();
    }
};
