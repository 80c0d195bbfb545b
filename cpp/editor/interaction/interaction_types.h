#pragma once

#include "editor/catalog/catalog.h"
#include "editor/core/types.h"

#include <cstdint>
#include <variant>

enum class ToolKind : std::uint8_t {
    Select = 0,
    Pan = 1,
    Wall = 2,
    Measure = 3,
    Annotate = 4,
};

// Compass handles of a zone rectangle; north is -Y.
enum class ZoneHandle : std::uint8_t {
    N = 0,
    S = 1,
    E = 2,
    W = 3,
    NE = 4,
    NW = 5,
    SE = 6,
    SW = 7,
};

// Start is the low-coordinate end of a wall (left or top), End the other one.
enum class WallEnd : std::uint8_t {
    Start = 0,
    End = 1,
};

// Modifier bits carried by pointer and key input.
enum class InputModifier : std::uint32_t {
    None = 0,
    Shift = 1u << 0,
    Ctrl = 1u << 1,
    Alt = 1u << 2,
    Meta = 1u << 3,
};

constexpr std::uint32_t kShiftMask = static_cast<std::uint32_t>(InputModifier::Shift);
constexpr std::uint32_t kCtrlMask = static_cast<std::uint32_t>(InputModifier::Ctrl);
constexpr std::uint32_t kAltMask = static_cast<std::uint32_t>(InputModifier::Alt);
constexpr std::uint32_t kMetaMask = static_cast<std::uint32_t>(InputModifier::Meta);

enum class AnnotationTarget : std::uint8_t {
    Anchor = 0,
    Label = 1,
};

struct FixtureDragState {
    std::uint32_t fixtureId = kNoId;
    PointFt pointerOriginFt{};
    PointFt startPositionFt{};
    RectFt startRect{};
    FootprintAnchor anchor = FootprintAnchor::Center;
};

struct ZoneDragState {
    std::uint32_t zoneId = kNoId;
    PointFt pointerOriginFt{};
    PointFt startPositionFt{};
};

struct ZoneResizeState {
    std::uint32_t zoneId = kNoId;
    ZoneHandle handle = ZoneHandle::SE;
    PointFt pointerOriginFt{};
    double startXFt = 0.0;
    double startYFt = 0.0;
    double startLengthFt = 0.0;
    double startWidthFt = 0.0;
};

struct MarqueeState {
    PointFt originFt{};
    PointFt currentFt{};
    bool append = false;
};

struct WallDrawState {
    PointFt startFt{};
    bool hasCurrent = false;
    PointFt currentFt{};
};

struct WallLengthDragState {
    std::uint32_t fixtureId = kNoId;
    WallEnd end = WallEnd::End;
    bool horizontal = true;
    PointFt pointerOriginFt{};
    double startLengthFt = 0.0;
    PointFt startCenterFt{};
};

struct AnnotationDragState {
    std::uint32_t annotationId = kNoId;
    AnnotationTarget target = AnnotationTarget::Anchor;
    PointFt pointerOriginFt{};
    PointFt startFt{};
};

// At most one transient interaction exists; monostate means none.
using TransientInteraction = std::variant<
    std::monostate,
    FixtureDragState,
    ZoneDragState,
    ZoneResizeState,
    MarqueeState,
    WallDrawState,
    WallLengthDragState,
    AnnotationDragState>;

// Mirrors the alternative order of TransientInteraction.
enum class TransientKind : std::uint8_t {
    None = 0,
    FixtureDrag = 1,
    ZoneDrag = 2,
    ZoneResize = 3,
    Marquee = 4,
    WallDraw = 5,
    WallLengthDrag = 6,
    AnnotationDrag = 7,
};

inline TransientKind transientKind(const TransientInteraction& t) {
    return static_cast<TransientKind>(t.index());
}

const char* toolKindName(ToolKind tool);
const char* transientKindName(TransientKind kind);
const char* zoneHandleName(ZoneHandle handle);

bool operator==(const FixtureDragState& a, const FixtureDragState& b);
bool operator==(const ZoneDragState& a, const ZoneDragState& b);
bool operator==(const ZoneResizeState& a, const ZoneResizeState& b);
bool operator==(const MarqueeState& a, const MarqueeState& b);
bool operator==(const WallDrawState& a, const WallDrawState& b);
bool operator==(const WallLengthDragState& a, const WallLengthDragState& b);
bool operator==(const AnnotationDragState& a, const AnnotationDragState& b);
