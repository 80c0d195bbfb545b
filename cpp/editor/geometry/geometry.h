#pragma once

#include "editor/catalog/catalog.h"
#include "editor/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace editor::geometry {

constexpr double kAlignThresholdFt = 0.25;
constexpr double kMinOverrideFt = 0.5;

// Nearest multiple of increment; ties round half away from zero.
// Non-positive or non-finite increments leave the value untouched.
double snap(double value, double increment);
PointFt snapPoint(const PointFt& p, double increment);

// Folds any multiple of 90 into {0, 90, 180, 270}; other angles are rejected.
std::optional<std::int32_t> normalizeRotation(double degrees);

const double* numberProperty(const PropertyMap& properties, const char* key);

// Footprint length/width after applying the size override properties.
double resolvedLengthFt(const Fixture& fixture, const CatalogItem& item);
double resolvedWidthFt(const Fixture& fixture, const CatalogItem& item);

/**
 * Physical axis-aligned rectangle of a fixture. Rotation 90/270 swaps the
 * footprint axes; a center anchor centers the rectangle on (xFt, yFt), corner
 * anchors use (xFt, yFt) as the rectangle origin.
 */
RectFt rectFromFixture(const Fixture& fixture, const CatalogItem& item);

// Inverse of rectFromFixture for a rectangle origin.
PointFt anchorFromRect(const RectFt& rect, FootprintAnchor anchor);

// Clamps an anchor position so a width x height rectangle stays inside the shell.
PointFt clampAnchorToShell(const PointFt& anchorPos, double width, double height, const Shell& shell, FootprintAnchor anchor);
RectFt clampRectToShell(const RectFt& rect, const Shell& shell);

// A fixture resolved against the catalog.
struct FixtureRect {
    std::uint32_t id = kNoId;
    std::string catalogKey;
    MountLayer mount = MountLayer::Floor;
    RectFt rect{};
};

// Fixtures whose catalog key cannot be resolved are skipped.
std::vector<FixtureRect> resolveFixtureRects(const std::vector<Fixture>& fixtures, const CatalogLookup& catalog);

struct CollisionHit {
    std::uint32_t firstId = kNoId;  // smaller id of the pair
    std::uint32_t secondId = kNoId;
    RectFt overlap{};
};

std::optional<RectFt> intersection(const RectFt& a, const RectFt& b);
bool rectsOverlap(const RectFt& a, const RectFt& b, double clearance = 0.0);

/**
 * Pairwise overlap test. Pairs on different mount layers, wall/wall pairs and
 * door/wall pairs are exempt. Each hit is reported once with ordered ids.
 */
std::vector<CollisionHit> collisions(const std::vector<FixtureRect>& fixtures);

enum class GuideOrientation : std::uint8_t {
    Vertical = 0,
    Horizontal = 1,
};

struct AlignmentGuide {
    GuideOrientation orientation = GuideOrientation::Vertical;
    double positionFt = 0.0;
    std::uint32_t targetId = kNoId;
};

std::vector<AlignmentGuide> alignmentGuides(
    const std::vector<FixtureRect>& fixtures,
    const std::vector<std::uint32_t>& selectedIds,
    double thresholdFt = kAlignThresholdFt);

std::optional<RectFt> selectionBounds(
    const std::vector<FixtureRect>& fixtures,
    const std::vector<std::uint32_t>& selectedIds);

// Normalized rectangle spanned by two corner points.
RectFt rectFromCorners(const PointFt& a, const PointFt& b);

bool isInsideShell(const Shell& shell, const RectFt& rect);
bool isInsideZone(const Zone& zone, const RectFt& rect);
std::vector<std::uint32_t> zonesContainingRect(const std::vector<Zone>& zones, const RectFt& rect);

struct ClearanceEdges {
    double top = 0.0;
    double bottom = 0.0;
    double left = 0.0;
    double right = 0.0;
};

ClearanceEdges rotateClearance(const Clearance& clearance, std::int32_t rotationDeg);
std::optional<RectFt> clearanceRect(const Fixture& fixture, const CatalogItem& item);

// Wall length in feet: the override property, else the catalog footprint, else the default.
double wallLengthFt(const Fixture& wall, const CatalogItem* item);

} // namespace editor::geometry
