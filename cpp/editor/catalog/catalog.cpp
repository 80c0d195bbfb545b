#include "editor/catalog/catalog.h"
#include "editor/core/string_utils.h"

CatalogTable::CatalogTable(const std::vector<CatalogItem>& items) {
    items_.reserve(items.size());
    for (const auto& item : items) {
        items_[item.key] = item;
    }
}

void CatalogTable::upsert(const CatalogItem& item) {
    items_[item.key] = item;
}

bool CatalogTable::remove(const std::string& key) {
    return items_.erase(key) > 0;
}

const CatalogItem* CatalogTable::find(const std::string& key) const {
    auto it = items_.find(key);
    if (it == items_.end()) return nullptr;
    return &it->second;
}

CatalogItem CatalogTable::makeWallItem() {
    CatalogItem item{};
    item.key = kWallCatalogKey;
    item.label = "Interior Wall";
    item.category = "interior";
    item.footprint = Footprint{kDefaultWallLengthFt, 0.25};
    item.anchor = FootprintAnchor::Center;
    item.mount = MountLayer::Floor;
    item.hidden = true;
    return item;
}

bool isWallKey(const std::string& key) {
    return editor::containsIgnoreCase(key, "wall");
}

bool isDoorKey(const std::string& key) {
    return editor::containsIgnoreCase(key, "door");
}
