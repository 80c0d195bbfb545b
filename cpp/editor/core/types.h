#ifndef FIXTURE_EDITOR_CORE_TYPES_H
#define FIXTURE_EDITOR_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

// Document and view types shared by every editor subsystem.
// All lengths are in feet unless the name says otherwise.

static constexpr std::uint32_t kNoId = 0;

struct PointFt {
    double x = 0.0;
    double y = 0.0;
};

struct RectFt {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
};

struct Shell {
    double lengthFt = 20.0;
    double widthFt = 8.0;
    double heightFt = 8.0;
};

struct ZoneConstraints {
    double minLengthFt = 1.0;
    double maxLengthFt = 0.0; // 0 = unbounded
    bool canResize = true;
};

struct Zone {
    std::uint32_t id = kNoId;
    std::string name;
    double xFt = 0.0;
    double yFt = 0.0;
    double lengthFt = 0.0;
    double widthFt = 0.0;
    bool hasConstraints = false;
    ZoneConstraints constraints{};
};

using PropertyValue = std::variant<double, bool, std::string>;
using PropertyMap = std::map<std::string, PropertyValue>;

// Property keys understood by the core.
static constexpr const char* kLengthOverrideProp = "lengthOverrideFt";
static constexpr const char* kWidthOverrideProp = "widthOverrideFt";
static constexpr const char* kMaterialProp = "material";
static constexpr const char* kTransparent3DProp = "transparent3D";

struct Fixture {
    std::uint32_t id = kNoId;
    std::string catalogKey;
    double xFt = 0.0;
    double yFt = 0.0;
    std::int32_t rotationDeg = 0; // 0, 90, 180 or 270
    bool locked = false;
    PropertyMap properties;
    std::uint32_t zoneId = kNoId;
};

struct Annotation {
    std::uint32_t id = kNoId;
    PointFt anchorFt{};
    PointFt labelFt{};
    std::string text;
};

struct Design {
    Shell shell{};
    std::vector<Zone> zones;
    std::vector<Fixture> fixtures;
    std::vector<Annotation> annotations;
};

struct Viewport {
    double scale = 1.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
};

// Optional clamp applied to viewport offsets while panning/zooming.
struct ViewportBounds {
    double minOffsetX = 0.0;
    double maxOffsetX = 0.0;
    double minOffsetY = 0.0;
    double maxOffsetY = 0.0;
};

enum class EditorError : std::uint32_t {
    Ok = 0,
    UnknownEntity = 1,
    UnknownCatalogItem = 2,
    EntityLocked = 3,
    InteractionBusy = 4,
    NoActiveInteraction = 5,
    InvalidArgument = 6,
    PersistenceFailed = 7,
};

const char* editorErrorName(EditorError error);

bool operator==(const PointFt& a, const PointFt& b);
bool operator!=(const PointFt& a, const PointFt& b);
bool operator==(const RectFt& a, const RectFt& b);
bool operator!=(const RectFt& a, const RectFt& b);
bool operator==(const Shell& a, const Shell& b);
bool operator==(const ZoneConstraints& a, const ZoneConstraints& b);
bool operator==(const Zone& a, const Zone& b);
bool operator==(const Fixture& a, const Fixture& b);
bool operator==(const Annotation& a, const Annotation& b);
bool operator==(const Design& a, const Design& b);
bool operator!=(const Design& a, const Design& b);
bool operator==(const Viewport& a, const Viewport& b);
bool operator!=(const Viewport& a, const Viewport& b);

#endif // FIXTURE_EDITOR_CORE_TYPES_H
