#pragma once

#include "common/domain/DomainEvent.hpp"
#include "TerrainSnapshot.hpp"
#include "ChangeDetection.hpp"
#include "SourceArea.hpp"

// ==================== 地形相关事件 ====================

struct SnapshotIngested : DomainEvent {
    TerrainSnapshot snapshot;

    explicit SnapshotIngested(TerrainSnapshot s)
        : DomainEvent("SnapshotIngested", s.id, "TerrainSnapshot"), snapshot(std::move(s)) {}
};

struct ChangeDetectionIngested : DomainEvent {
    ChangeDetection change;

    explicit ChangeDetectionIngested(ChangeDetection cd)
        : DomainEvent("ChangeDetectionIngested", cd.id, "ChangeDetection"), change(std::move(cd)) {}
};

struct SourceAreaUpdated : DomainEvent {
    SourceArea area;

    explicit SourceAreaUpdated(SourceArea a)
        : DomainEvent("SourceAreaUpdated", a.id, "SourceArea"), area(std::move(a)) {}
};
