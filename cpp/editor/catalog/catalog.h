#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

enum class FootprintAnchor : std::uint8_t {
    Center = 0,
    FrontLeft = 1,
    BackLeft = 2,
};

enum class MountLayer : std::uint8_t {
    Floor = 0,
    Wall = 1,
};

struct Footprint {
    double lengthFt = 1.0;
    double widthFt = 1.0;
};

// Clearance is expressed relative to the fixture: front faces +Y at rotation 0.
struct Clearance {
    double front = 0.0;
    double back = 0.0;
    double left = 0.0;
    double right = 0.0;
};

struct CatalogItem {
    std::string key;
    std::string label;
    std::string category;
    Footprint footprint{};
    FootprintAnchor anchor = FootprintAnchor::Center;
    MountLayer mount = MountLayer::Floor;
    bool hasClearance = false;
    Clearance minClearance{};
    bool hidden = false;
};

// Key of the catalog item placed by the wall tool.
static constexpr const char* kWallCatalogKey = "fixture-wall";
static constexpr double kDefaultWallLengthFt = 4.0;

// Read-only catalog port. The host owns the real catalog; the editor only
// resolves footprints through this interface.
class CatalogLookup {
public:
    virtual ~CatalogLookup() = default;
    virtual const CatalogItem* find(const std::string& key) const = 0;
};

class CatalogTable : public CatalogLookup {
public:
    CatalogTable() = default;
    explicit CatalogTable(const std::vector<CatalogItem>& items);

    void upsert(const CatalogItem& item);
    bool remove(const std::string& key);
    std::size_t size() const noexcept { return items_.size(); }

    const CatalogItem* find(const std::string& key) const override;

    // Thin interior wall drawn by the wall tool.
    static CatalogItem makeWallItem();

private:
    std::unordered_map<std::string, CatalogItem> items_;
};

bool isWallKey(const std::string& key);
bool isDoorKey(const std::string& key);
