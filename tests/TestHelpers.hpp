#pragma once

#include <gtest/gtest.h>

#include "common/utils/AppException.hpp"
#include "common/store/SpatialStore.hpp"
#include "modules/weather/domain/MonitoredLocation.hpp"

/**
 * @brief 测试用的构造工具
 */
namespace TestHelpers {

using TimePoint = std::chrono::system_clock::time_point;

/** 固定基准时间 2024-06-01T00:00:00Z */
inline TimePoint baseTime() {
    return *TimestampHelper::parse("2024-06-01T00:00:00Z");
}

inline TimePoint at(std::chrono::seconds offset) {
    return baseTime() + offset;
}

inline WeatherObservation observation(const std::string& locationId, TimePoint t,
                                      double rainfallMm, double intensityMmHr) {
    WeatherObservation obs;
    obs.locationId = locationId;
    obs.timestamp = t;
    obs.location = {103.0, 30.0};
    obs.rainfallMm = rainfallMm;
    obs.intensityMmHr = intensityMmHr;
    obs.source = "test";
    return obs;
}

inline MonitoredLocation location(const std::string& id, double lon = 103.0, double lat = 30.0,
                                  double radiusM = 5000.0) {
    MonitoredLocation loc;
    loc.id = id;
    loc.name = id;
    loc.point = {lon, lat};
    loc.radiusM = radiusM;
    return loc;
}

/** 以 (lon, lat) 为左下角、边长 size 度的正方形 */
inline GeoPolygon square(double lon, double lat, double size) {
    return GeoPolygon::fromBox({lon, lat, lon + size, lat + size});
}

inline TerrainSnapshot snapshot(const std::string& versionName, const GeoPolygon& extent) {
    TerrainSnapshot s;
    s.timestamp = baseTime();
    s.versionName = versionName;
    s.demPath = "/data/dem/" + versionName + ".tif";
    s.resolutionM = 1.0;
    s.extent = extent;
    s.source = "lidar";
    return s;
}

inline SourceArea sourceArea(const GeoPolygon& geometry, std::optional<double> susceptibility,
                             std::optional<double> material) {
    SourceArea area;
    area.geometry = geometry;
    area.susceptibility = susceptibility;
    area.baseMaterialAvailability = material;
    area.materialAvailability = material;
    area.timestamp = baseTime();
    area.updatedAt = baseTime();
    return area;
}

/** 在存储中开启一个活跃事件 */
inline RainfallEvent openEvent(SpatialStore& store, const std::string& locationId, TimePoint start,
                               double maxIntensityMmHr = 20.0, bool thresholdExceeded = false) {
    RainfallEvent event;
    event.locationId = locationId;
    event.startTime = start;
    event.lastObservationAt = start;
    event.absorb(start, 5.0, maxIntensityMmHr);
    event.thresholdExceeded = thresholdExceeded;
    return store.openEvent(event);
}

}  // namespace TestHelpers
