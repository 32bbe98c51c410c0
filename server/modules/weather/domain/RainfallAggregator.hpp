#pragma once

#include "WeatherObservation.hpp"

/**
 * @brief 降雨统计窗口
 */
enum class RainWindow {
    OneHour,
    OneDay,
    SevenDays
};

inline std::string rainWindowToString(RainWindow w) {
    switch (w) {
        case RainWindow::OneHour:   return "1h";
        case RainWindow::OneDay:    return "24h";
        case RainWindow::SevenDays: return "7d";
    }
    return "24h";
}

inline std::optional<RainWindow> rainWindowFromString(const std::string& s) {
    if (s == "1h") return RainWindow::OneHour;
    if (s == "24h") return RainWindow::OneDay;
    if (s == "7d") return RainWindow::SevenDays;
    return std::nullopt;
}

inline std::chrono::seconds rainWindowDuration(RainWindow w) {
    switch (w) {
        case RainWindow::OneHour:   return std::chrono::hours(1);
        case RainWindow::OneDay:    return std::chrono::hours(24);
        case RainWindow::SevenDays: return std::chrono::hours(24 * 7);
    }
    return std::chrono::hours(24);
}

/**
 * @brief 滑动窗口累加器
 *
 * 新值立即计入总和，过期项在下一次查询时惰性淘汰，摊还 O(1)。
 * 窗口为左开右闭区间 (now - window, now]。
 */
class SlidingSum {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit SlidingSum(std::chrono::seconds window) : window_(window) {}

    void add(TimePoint t, double value) {
        entries_.emplace_back(t, value);
        sum_ += value;
    }

    double sumAt(TimePoint now) {
        auto cutoff = now - window_;
        while (!entries_.empty() && entries_.front().first <= cutoff) {
            sum_ -= entries_.front().second;
            entries_.pop_front();
        }
        if (entries_.empty()) sum_ = 0.0;   // 消除浮点累积误差
        return (std::max)(sum_, 0.0);
    }

    size_t size() const { return entries_.size(); }

private:
    std::chrono::seconds window_;
    std::deque<std::pair<TimePoint, double>> entries_;
    double sum_ = 0.0;
};

/**
 * @brief 累计降雨序列，可对保留期内任意 (from, to] 区间求和
 */
class CumulativeRain {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit CumulativeRain(std::chrono::seconds retention) : retention_(retention) {}

    void add(TimePoint t, double value) {
        total_ += value;
        entries_.emplace_back(t, total_);
        auto cutoff = t - retention_;
        while (!entries_.empty() && entries_.front().first <= cutoff) {
            base_ = entries_.front().second;
            entries_.pop_front();
        }
    }

    double sumBetween(TimePoint from, TimePoint to) const {
        return (std::max)(cumulativeAt(to) - cumulativeAt(from), 0.0);
    }

private:
    std::chrono::seconds retention_;
    std::deque<std::pair<TimePoint, double>> entries_;
    double total_ = 0.0;
    double base_ = 0.0;       // 已淘汰部分的累计值

    /** 时间不晚于 t 的最后一项的累计值 */
    double cumulativeAt(TimePoint t) const {
        auto it = std::upper_bound(entries_.begin(), entries_.end(), t,
            [](TimePoint value, const std::pair<TimePoint, double>& e) { return value < e.first; });
        return it == entries_.begin() ? base_ : std::prev(it)->second;
    }
};

/**
 * @brief 某时刻的滚动降雨量
 *
 * dailyMm[i] 为 (now - (i+1) 天, now - i 天] 的降雨量，dailyMm[0] 即最近 24 小时。
 */
struct RainfallTotals {
    static constexpr size_t ANTECEDENT_DAYS = 14;

    double lastHourMm = 0.0;
    double last24hMm = 0.0;
    double last7dMm = 0.0;
    double last14dMm = 0.0;
    std::array<double, ANTECEDENT_DAYS> dailyMm{};

    double of(RainWindow w) const {
        switch (w) {
            case RainWindow::OneHour:   return lastHourMm;
            case RainWindow::OneDay:    return last24hMm;
            case RainWindow::SevenDays: return last7dMm;
        }
        return last24hMm;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["rainfall_1h_mm"] = lastHourMm;
        json["rainfall_24h_mm"] = last24hMm;
        json["rainfall_7d_mm"] = last7dMm;
        json["rainfall_14d_mm"] = last14dMm;
        return json;
    }
};

/**
 * @brief 降雨聚合器
 *
 * 每个监测点维护 1h / 24h / 7d 三个滑动窗口、14 天累计序列（逐日前期降雨）
 * 和最近提交的观测时间。
 * 同一监测点的写入由 IngestWorkerPool 串行化；每个监测点自带互斥锁，
 * 只为让 HTTP 查询线程读取到一致的窗口。
 */
class RainfallAggregator {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief 接收一条观测并更新窗口
     * @return 以该观测时间为基准的滚动降雨量
     * @throws ValidationException 降雨为负，或时间不晚于已提交的最新观测
     */
    RainfallTotals accept(const WeatherObservation& obs) {
        if (obs.rainfallMm < 0 || obs.intensityMmHr < 0) {
            throw ValidationException("降雨量/雨强不能为负");
        }

        auto& windows = windowsFor(obs.locationId);
        std::lock_guard lock(windows.mutex);

        if (windows.lastTimestamp && obs.timestamp <= *windows.lastTimestamp) {
            throw ValidationException("观测时间 " + TimestampHelper::toIso(obs.timestamp)
                + " 不晚于监测点 " + obs.locationId + " 最新观测 "
                + TimestampHelper::toIso(*windows.lastTimestamp));
        }

        windows.lastTimestamp = obs.timestamp;
        windows.oneHour.add(obs.timestamp, obs.rainfallMm);
        windows.oneDay.add(obs.timestamp, obs.rainfallMm);
        windows.sevenDays.add(obs.timestamp, obs.rainfallMm);
        windows.antecedent.add(obs.timestamp, obs.rainfallMm);
        return totalsLocked(windows, obs.timestamp);
    }

    /**
     * @brief 查询监测点在指定时刻的滚动降雨量（无数据时全为 0）
     */
    RainfallTotals totals(const std::string& locationId, TimePoint now) {
        auto* windows = findWindows(locationId);
        if (!windows) return {};
        std::lock_guard lock(windows->mutex);
        return totalsLocked(*windows, now);
    }

    std::optional<TimePoint> lastTimestamp(const std::string& locationId) {
        auto* windows = findWindows(locationId);
        if (!windows) return std::nullopt;
        std::lock_guard lock(windows->mutex);
        return windows->lastTimestamp;
    }

private:
    struct LocationWindows {
        std::mutex mutex;
        SlidingSum oneHour{rainWindowDuration(RainWindow::OneHour)};
        SlidingSum oneDay{rainWindowDuration(RainWindow::OneDay)};
        SlidingSum sevenDays{rainWindowDuration(RainWindow::SevenDays)};
        CumulativeRain antecedent{std::chrono::hours(24 * RainfallTotals::ANTECEDENT_DAYS)};
        std::optional<TimePoint> lastTimestamp;
    };

    std::map<std::string, std::unique_ptr<LocationWindows>> windows_;
    std::shared_mutex windowsMutex_;

    static RainfallTotals totalsLocked(LocationWindows& w, TimePoint now) {
        RainfallTotals t;
        t.lastHourMm = w.oneHour.sumAt(now);
        t.last24hMm = w.oneDay.sumAt(now);
        t.last7dMm = w.sevenDays.sumAt(now);
        constexpr std::chrono::hours day{24};
        for (size_t i = 0; i < RainfallTotals::ANTECEDENT_DAYS; ++i) {
            auto to = now - day * static_cast<int>(i);
            t.dailyMm[i] = w.antecedent.sumBetween(to - day, to);
        }
        t.last14dMm = w.antecedent.sumBetween(now - day * static_cast<int>(RainfallTotals::ANTECEDENT_DAYS), now);
        return t;
    }

    LocationWindows* findWindows(const std::string& locationId) {
        std::shared_lock lock(windowsMutex_);
        auto it = windows_.find(locationId);
        return it == windows_.end() ? nullptr : it->second.get();
    }

    LocationWindows& windowsFor(const std::string& locationId) {
        if (auto* w = findWindows(locationId)) return *w;
        std::unique_lock lock(windowsMutex_);
        auto& slot = windows_[locationId];
        if (!slot) slot = std::make_unique<LocationWindows>();
        return *slot;
    }
};
