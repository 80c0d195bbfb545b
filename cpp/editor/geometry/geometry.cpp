#include "editor/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace editor::geometry {

double snap(double value, double increment) {
    if (!(increment > 0.0) || !std::isfinite(increment) || !std::isfinite(value)) {
        return value;
    }
    // std::round breaks ties away from zero.
    return std::round(value / increment) * increment;
}

PointFt snapPoint(const PointFt& p, double increment) {
    return PointFt{snap(p.x, increment), snap(p.y, increment)};
}

std::optional<std::int32_t> normalizeRotation(double degrees) {
    if (!std::isfinite(degrees)) return std::nullopt;
    const double quarters = degrees / 90.0;
    const double rounded = std::round(quarters);
    if (std::fabs(quarters - rounded) > 1e-9) return std::nullopt;
    const long long turns = static_cast<long long>(rounded);
    const long long folded = ((turns % 4) + 4) % 4;
    return static_cast<std::int32_t>(folded * 90);
}

const double* numberProperty(const PropertyMap& properties, const char* key) {
    auto it = properties.find(key);
    if (it == properties.end()) return nullptr;
    return std::get_if<double>(&it->second);
}

double resolvedLengthFt(const Fixture& fixture, const CatalogItem& item) {
    if (const double* v = numberProperty(fixture.properties, kLengthOverrideProp)) {
        return std::max(*v, kMinOverrideFt);
    }
    return item.footprint.lengthFt;
}

double resolvedWidthFt(const Fixture& fixture, const CatalogItem& item) {
    if (const double* v = numberProperty(fixture.properties, kWidthOverrideProp)) {
        return std::max(*v, kMinOverrideFt);
    }
    return item.footprint.widthFt;
}

RectFt rectFromFixture(const Fixture& fixture, const CatalogItem& item) {
    const double length = resolvedLengthFt(fixture, item);
    const double width = resolvedWidthFt(fixture, item);

    const bool rotated = fixture.rotationDeg == 90 || fixture.rotationDeg == 270;
    RectFt rect{};
    rect.width = rotated ? length : width;
    rect.height = rotated ? width : length;

    switch (item.anchor) {
        case FootprintAnchor::Center:
            rect.x = fixture.xFt - rect.width / 2.0;
            rect.y = fixture.yFt - rect.height / 2.0;
            break;
        case FootprintAnchor::FrontLeft:
        case FootprintAnchor::BackLeft:
            rect.x = fixture.xFt;
            rect.y = fixture.yFt;
            break;
    }
    return rect;
}

PointFt anchorFromRect(const RectFt& rect, FootprintAnchor anchor) {
    if (anchor == FootprintAnchor::Center) {
        return PointFt{rect.x + rect.width / 2.0, rect.y + rect.height / 2.0};
    }
    return PointFt{rect.x, rect.y};
}

namespace {
// Lower bound wins when the range is empty (rectangle larger than the shell).
double clampRange(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}
} // namespace

PointFt clampAnchorToShell(const PointFt& anchorPos, double width, double height, const Shell& shell, FootprintAnchor anchor) {
    if (anchor == FootprintAnchor::Center) {
        const double halfW = width / 2.0;
        const double halfH = height / 2.0;
        return PointFt{
            clampRange(anchorPos.x, halfW, shell.lengthFt - halfW),
            clampRange(anchorPos.y, halfH, shell.widthFt - halfH),
        };
    }
    return PointFt{
        clampRange(anchorPos.x, 0.0, shell.lengthFt - width),
        clampRange(anchorPos.y, 0.0, shell.widthFt - height),
    };
}

RectFt clampRectToShell(const RectFt& rect, const Shell& shell) {
    RectFt out = rect;
    out.x = clampRange(rect.x, 0.0, shell.lengthFt - rect.width);
    out.y = clampRange(rect.y, 0.0, shell.widthFt - rect.height);
    return out;
}

std::vector<FixtureRect> resolveFixtureRects(const std::vector<Fixture>& fixtures, const CatalogLookup& catalog) {
    std::vector<FixtureRect> out;
    out.reserve(fixtures.size());
    for (const auto& fixture : fixtures) {
        const CatalogItem* item = catalog.find(fixture.catalogKey);
        if (!item) continue;
        FixtureRect entry{};
        entry.id = fixture.id;
        entry.catalogKey = fixture.catalogKey;
        entry.mount = item->mount;
        entry.rect = rectFromFixture(fixture, *item);
        out.push_back(std::move(entry));
    }
    return out;
}

std::optional<RectFt> intersection(const RectFt& a, const RectFt& b) {
    const double left = std::max(a.x, b.x);
    const double top = std::max(a.y, b.y);
    const double right = std::min(a.right(), b.right());
    const double bottom = std::min(a.bottom(), b.bottom());
    const double w = right - left;
    const double h = bottom - top;
    if (w <= 0.0 || h <= 0.0) return std::nullopt;
    return RectFt{left, top, w, h};
}

bool rectsOverlap(const RectFt& a, const RectFt& b, double clearance) {
    return !(a.right() + clearance <= b.x
        || b.right() + clearance <= a.x
        || a.bottom() + clearance <= b.y
        || b.bottom() + clearance <= a.y);
}

namespace {
bool isExemptPair(const FixtureRect& a, const FixtureRect& b) {
    if (a.mount != b.mount) return true;
    const bool aWall = isWallKey(a.catalogKey);
    const bool bWall = isWallKey(b.catalogKey);
    if (aWall && bWall) return true;
    if ((isDoorKey(a.catalogKey) && bWall) || (aWall && isDoorKey(b.catalogKey))) return true;
    return false;
}
} // namespace

std::vector<CollisionHit> collisions(const std::vector<FixtureRect>& fixtures) {
    std::vector<CollisionHit> hits;
    for (std::size_t i = 0; i < fixtures.size(); ++i) {
        for (std::size_t j = i + 1; j < fixtures.size(); ++j) {
            const FixtureRect& a = fixtures[i];
            const FixtureRect& b = fixtures[j];
            if (isExemptPair(a, b)) continue;
            const auto overlap = intersection(a.rect, b.rect);
            if (!overlap) continue;
            CollisionHit hit{};
            hit.firstId = std::min(a.id, b.id);
            hit.secondId = std::max(a.id, b.id);
            hit.overlap = *overlap;
            hits.push_back(hit);
        }
    }
    return hits;
}

std::vector<AlignmentGuide> alignmentGuides(
    const std::vector<FixtureRect>& fixtures,
    const std::vector<std::uint32_t>& selectedIds,
    double thresholdFt) {
    std::vector<AlignmentGuide> guides;
    if (selectedIds.size() != 1) return guides;

    const std::uint32_t selectedId = selectedIds.front();
    auto selectedIt = std::find_if(fixtures.begin(), fixtures.end(), [&](const FixtureRect& f) {
        return f.id == selectedId;
    });
    if (selectedIt == fixtures.end()) return guides;
    const RectFt sel = selectedIt->rect;

    auto near = [thresholdFt](double a, double b) { return std::fabs(a - b) <= thresholdFt; };

    for (const auto& other : fixtures) {
        if (other.id == selectedId) continue;
        const RectFt& r = other.rect;
        if (near(sel.x, r.x)) {
            guides.push_back(AlignmentGuide{GuideOrientation::Vertical, r.x, other.id});
        }
        if (near(sel.right(), r.right())) {
            guides.push_back(AlignmentGuide{GuideOrientation::Vertical, r.right(), other.id});
        }
        if (near(sel.y, r.y)) {
            guides.push_back(AlignmentGuide{GuideOrientation::Horizontal, r.y, other.id});
        }
        if (near(sel.bottom(), r.bottom())) {
            guides.push_back(AlignmentGuide{GuideOrientation::Horizontal, r.bottom(), other.id});
        }
    }
    return guides;
}

std::optional<RectFt> selectionBounds(
    const std::vector<FixtureRect>& fixtures,
    const std::vector<std::uint32_t>& selectedIds) {
    if (selectedIds.empty()) return std::nullopt;
    std::unordered_set<std::uint32_t> wanted(selectedIds.begin(), selectedIds.end());

    bool any = false;
    double minX = 0.0, minY = 0.0, maxX = 0.0, maxY = 0.0;
    for (const auto& f : fixtures) {
        if (wanted.find(f.id) == wanted.end()) continue;
        if (!any) {
            minX = f.rect.x;
            minY = f.rect.y;
            maxX = f.rect.right();
            maxY = f.rect.bottom();
            any = true;
            continue;
        }
        minX = std::min(minX, f.rect.x);
        minY = std::min(minY, f.rect.y);
        maxX = std::max(maxX, f.rect.right());
        maxY = std::max(maxY, f.rect.bottom());
    }
    if (!any) return std::nullopt;
    return RectFt{minX, minY, maxX - minX, maxY - minY};
}

RectFt rectFromCorners(const PointFt& a, const PointFt& b) {
    const double x = std::min(a.x, b.x);
    const double y = std::min(a.y, b.y);
    return RectFt{x, y, std::fabs(b.x - a.x), std::fabs(b.y - a.y)};
}

bool isInsideShell(const Shell& shell, const RectFt& rect) {
    return rect.x >= 0.0
        && rect.y >= 0.0
        && rect.right() <= shell.lengthFt
        && rect.bottom() <= shell.widthFt;
}

bool isInsideZone(const Zone& zone, const RectFt& rect) {
    return rect.x >= zone.xFt
        && rect.y >= zone.yFt
        && rect.right() <= zone.xFt + zone.lengthFt
        && rect.bottom() <= zone.yFt + zone.widthFt;
}

std::vector<std::uint32_t> zonesContainingRect(const std::vector<Zone>& zones, const RectFt& rect) {
    std::vector<std::uint32_t> ids;
    for (const auto& zone : zones) {
        const bool apart = rect.right() <= zone.xFt
            || zone.xFt + zone.lengthFt <= rect.x
            || rect.bottom() <= zone.yFt
            || zone.yFt + zone.widthFt <= rect.y;
        if (!apart) ids.push_back(zone.id);
    }
    return ids;
}

ClearanceEdges rotateClearance(const Clearance& c, std::int32_t rotationDeg) {
    // Rotation 0: front faces +Y (bottom), back -Y, left -X, right +X. Rotation is clockwise.
    switch (rotationDeg) {
        case 0: return ClearanceEdges{c.back, c.front, c.left, c.right};
        case 90: return ClearanceEdges{c.left, c.right, c.front, c.back};
        case 180: return ClearanceEdges{c.front, c.back, c.right, c.left};
        case 270: return ClearanceEdges{c.right, c.left, c.back, c.front};
        default: return ClearanceEdges{};
    }
}

std::optional<RectFt> clearanceRect(const Fixture& fixture, const CatalogItem& item) {
    if (!item.hasClearance) return std::nullopt;
    const RectFt rect = rectFromFixture(fixture, item);
    const ClearanceEdges edges = rotateClearance(item.minClearance, fixture.rotationDeg);
    return RectFt{
        rect.x - edges.left,
        rect.y - edges.top,
        rect.width + edges.left + edges.right,
        rect.height + edges.top + edges.bottom,
    };
}

double wallLengthFt(const Fixture& wall, const CatalogItem* item) {
    if (const double* v = numberProperty(wall.properties, kLengthOverrideProp)) {
        return *v;
    }
    if (item) return item->footprint.lengthFt;
    return kDefaultWallLengthFt;
}

} // namespace editor::geometry
