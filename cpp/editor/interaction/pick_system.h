#pragma once

#include <cstdint>
#include <utility>
#include <vector>
#include "editor/core/types.h"
#include "editor/interaction/interaction_types.h"

class DesignEditor;

enum class PickTarget : std::uint8_t {
    None = 0,
    RotateHandle = 1,
    WallGrip = 2,
    AnnotationLabel = 3,
    AnnotationAnchor = 4,
    ZoneHandle = 5,
    ZoneBody = 6,
    FixtureBody = 7,
};

// Return struct for picking
struct PickResult {
    PickTarget target = PickTarget::None;
    std::uint32_t id = kNoId;
    ZoneHandle handle = ZoneHandle::SE;  // ZoneHandle only
    WallEnd wallEnd = WallEnd::End;      // WallGrip only
    double distance = 0.0;               // feet from the hit feature
};

// Hit-test sizes in feet; the tool controller derives them from pixel
// sizes and the current zoom.
struct PickOptions {
    double toleranceFt = 0.125;
    double zoneHandleSizeFt = 0.2;
    double rotateHandleOffsetFt = 0.6;
    double rotateHandleRadiusFt = 0.25;
    double wallGripRadiusFt = 0.25;
    double annotationRadiusFt = 0.3;
    bool zoneEditMode = false;
};

// Internal candidate during picking
struct PickCandidate {
    PickResult result;
    std::uint32_t zIndex = 0;

    // Sort order:
    // 1. Target priority: rotate handle > wall grip > annotation > zone handle > zone body > fixture body
    // 2. Z-Index: later in the document is on top
    // 3. Distance: closer is better
    bool operator<(const PickCandidate& other) const {
        auto priority = [](PickTarget t) {
            switch (t) {
                case PickTarget::RotateHandle: return 10;
                case PickTarget::WallGrip: return 9;
                case PickTarget::AnnotationLabel: return 8;
                case PickTarget::AnnotationAnchor: return 7;
                case PickTarget::ZoneHandle: return 6;
                case PickTarget::ZoneBody: return 3;
                case PickTarget::FixtureBody: return 2;
                default: return 0;
            }
        };
        const int p1 = priority(result.target);
        const int p2 = priority(other.result.target);
        if (p1 != p2) return p1 > p2;
        if (zIndex != other.zIndex) return zIndex > other.zIndex;
        return result.distance < other.result.distance;
    }
};

class PickSystem {
public:
    PickResult pick(const DesignEditor& editor, const PointFt& point, const PickOptions& options) const;

    // Geometry of the pickable features, shared with renderers.
    static PointFt rotateHandleCenter(const RectFt& rect, double offsetFt);
    // Low-coordinate end first.
    static std::pair<PointFt, PointFt> wallEndpoints(const RectFt& rect);
    static PointFt zoneHandlePoint(const Zone& zone, ZoneHandle handle);

private:
    void collectFixtureTargets(const DesignEditor& editor, const PointFt& p, const PickOptions& options,
                               std::vector<PickCandidate>& out) const;
    void collectAnnotationTargets(const DesignEditor& editor, const PointFt& p, const PickOptions& options,
                                  std::vector<PickCandidate>& out) const;
    void collectZoneTargets(const DesignEditor& editor, const PointFt& p, const PickOptions& options,
                            std::vector<PickCandidate>& out) const;
};

const char* pickTargetName(PickTarget target);
