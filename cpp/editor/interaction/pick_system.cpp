#include "editor/interaction/pick_system.h"
#include "editor/editor.h"

#include <algorithm>
#include <cmath>

namespace {

double pointDistance(const PointFt& a, const PointFt& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

// Distance from p to the rectangle, 0 when inside.
double rectDistance(const RectFt& r, const PointFt& p) {
    const double dx = std::max({r.x - p.x, 0.0, p.x - r.right()});
    const double dy = std::max({r.y - p.y, 0.0, p.y - r.bottom()});
    return std::hypot(dx, dy);
}

constexpr ZoneHandle kZoneHandles[] = {
    ZoneHandle::NE, ZoneHandle::NW, ZoneHandle::SE, ZoneHandle::SW,
    ZoneHandle::N, ZoneHandle::S, ZoneHandle::E, ZoneHandle::W,
};

} // namespace

PointFt PickSystem::rotateHandleCenter(const RectFt& rect, double offsetFt) {
    return PointFt{rect.x + rect.width * 0.5, rect.y - offsetFt};
}

std::pair<PointFt, PointFt> PickSystem::wallEndpoints(const RectFt& rect) {
    const double cx = rect.x + rect.width * 0.5;
    const double cy = rect.y + rect.height * 0.5;
    if (rect.width >= rect.height) {
        return {PointFt{rect.x, cy}, PointFt{rect.right(), cy}};
    }
    return {PointFt{cx, rect.y}, PointFt{cx, rect.bottom()}};
}

PointFt PickSystem::zoneHandlePoint(const Zone& zone, ZoneHandle handle) {
    const double left = zone.xFt;
    const double right = zone.xFt + zone.lengthFt;
    const double top = zone.yFt;
    const double bottom = zone.yFt + zone.widthFt;
    const double cx = (left + right) * 0.5;
    const double cy = (top + bottom) * 0.5;
    switch (handle) {
        case ZoneHandle::N: return {cx, top};
        case ZoneHandle::S: return {cx, bottom};
        case ZoneHandle::E: return {right, cy};
        case ZoneHandle::W: return {left, cy};
        case ZoneHandle::NE: return {right, top};
        case ZoneHandle::NW: return {left, top};
        case ZoneHandle::SE: return {right, bottom};
        case ZoneHandle::SW: return {left, bottom};
    }
    return {cx, cy};
}

void PickSystem::collectFixtureTargets(
    const DesignEditor& editor,
    const PointFt& p,
    const PickOptions& options,
    std::vector<PickCandidate>& out) const {
    const auto& selected = editor.selectedIds();
    const auto isSelected = [&](std::uint32_t id) {
        return std::find(selected.begin(), selected.end(), id) != selected.end();
    };

    // Rotation handle of the primary fixture.
    const std::uint32_t primary = editor.primarySelectedId();
    if (primary != kNoId) {
        const Fixture* fixture = editor.findFixture(primary);
        const auto rect = editor.fixtureRect(primary);
        if (fixture && rect && !fixture->locked && !isWallKey(fixture->catalogKey)) {
            const double d = pointDistance(p, rotateHandleCenter(*rect, options.rotateHandleOffsetFt));
            if (d <= options.rotateHandleRadiusFt) {
                PickCandidate c;
                c.result.target = PickTarget::RotateHandle;
                c.result.id = primary;
                c.result.distance = d;
                out.push_back(c);
            }
        }
    }

    const auto& fixtures = editor.design().fixtures;
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(fixtures.size()); ++i) {
        const Fixture& fixture = fixtures[i];
        const auto rect = editor.fixtureRect(fixture.id);
        if (!rect) continue;

        // Wall end grips on selected, unlocked walls.
        if (isWallKey(fixture.catalogKey) && !fixture.locked && isSelected(fixture.id)) {
            const auto ends = wallEndpoints(*rect);
            const double dStart = pointDistance(p, ends.first);
            const double dEnd = pointDistance(p, ends.second);
            const bool endCloser = dEnd < dStart;
            const double d = endCloser ? dEnd : dStart;
            if (d <= options.wallGripRadiusFt) {
                PickCandidate c;
                c.result.target = PickTarget::WallGrip;
                c.result.id = fixture.id;
                c.result.wallEnd = endCloser ? WallEnd::End : WallEnd::Start;
                c.result.distance = d;
                c.zIndex = i;
                out.push_back(c);
            }
        }

        const double d = rectDistance(*rect, p);
        if (d <= options.toleranceFt) {
            PickCandidate c;
            c.result.target = PickTarget::FixtureBody;
            c.result.id = fixture.id;
            c.result.distance = d;
            c.zIndex = i;
            out.push_back(c);
        }
    }
}

void PickSystem::collectAnnotationTargets(
    const DesignEditor& editor,
    const PointFt& p,
    const PickOptions& options,
    std::vector<PickCandidate>& out) const {
    const auto& annotations = editor.design().annotations;
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(annotations.size()); ++i) {
        const Annotation& a = annotations[i];
        const double dLabel = pointDistance(p, a.labelFt);
        if (dLabel <= options.annotationRadiusFt) {
            PickCandidate c;
            c.result.target = PickTarget::AnnotationLabel;
            c.result.id = a.id;
            c.result.distance = dLabel;
            c.zIndex = i;
            out.push_back(c);
        }
        const double dAnchor = pointDistance(p, a.anchorFt);
        if (dAnchor <= options.annotationRadiusFt) {
            PickCandidate c;
            c.result.target = PickTarget::AnnotationAnchor;
            c.result.id = a.id;
            c.result.distance = dAnchor;
            c.zIndex = i;
            out.push_back(c);
        }
    }
}

void PickSystem::collectZoneTargets(
    const DesignEditor& editor,
    const PointFt& p,
    const PickOptions& options,
    std::vector<PickCandidate>& out) const {
    if (!options.zoneEditMode) return;

    const std::uint32_t selectedZone = editor.selectedZoneId();
    const auto& zones = editor.design().zones;
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(zones.size()); ++i) {
        const Zone& zone = zones[i];

        // Handles only on the selected zone.
        if (zone.id == selectedZone) {
            for (ZoneHandle handle : kZoneHandles) {
                const PointFt hp = zoneHandlePoint(zone, handle);
                if (std::abs(p.x - hp.x) <= options.zoneHandleSizeFt &&
                    std::abs(p.y - hp.y) <= options.zoneHandleSizeFt) {
                    PickCandidate c;
                    c.result.target = PickTarget::ZoneHandle;
                    c.result.id = zone.id;
                    c.result.handle = handle;
                    c.result.distance = pointDistance(p, hp);
                    c.zIndex = i;
                    out.push_back(c);
                }
            }
        }

        const RectFt rect{zone.xFt, zone.yFt, zone.lengthFt, zone.widthFt};
        const double d = rectDistance(rect, p);
        if (d <= options.toleranceFt) {
            PickCandidate c;
            c.result.target = PickTarget::ZoneBody;
            c.result.id = zone.id;
            c.result.distance = d;
            c.zIndex = i;
            out.push_back(c);
        }
    }
}

PickResult PickSystem::pick(const DesignEditor& editor, const PointFt& point, const PickOptions& options) const {
    std::vector<PickCandidate> candidates;
    collectFixtureTargets(editor, point, options, candidates);
    collectAnnotationTargets(editor, point, options, candidates);
    collectZoneTargets(editor, point, options, candidates);

    if (candidates.empty()) return PickResult{};
    return std::min_element(candidates.begin(), candidates.end())->result;
}

const char* pickTargetName(PickTarget target) {
    switch (target) {
        case PickTarget::None: return "none";
        case PickTarget::RotateHandle: return "rotate-handle";
        case PickTarget::WallGrip: return "wall-grip";
        case PickTarget::AnnotationLabel: return "annotation-label";
        case PickTarget::AnnotationAnchor: return "annotation-anchor";
        case PickTarget::ZoneHandle: return "zone-handle";
        case PickTarget::ZoneBody: return "zone-body";
        case PickTarget::FixtureBody: return "fixture-body";
    }
    return "unknown";
}
