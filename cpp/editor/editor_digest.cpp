// editor_digest.cpp - Document digest computation for DesignEditor.
// Two editors that reached the same design through any sequence of actions
// report the same digest.

#include "editor/editor.h"
#include "editor/internal/editor_core.h"
#include "editor/core/string_utils.h"

#include <type_traits>
#include <variant>

using editor::kDigestOffset;
using editor::hashU32;
using editor::hashF64;
using editor::hashString;

namespace {

constexpr std::uint32_t kDigestVersion = 1;

std::uint64_t hashPoint(std::uint64_t h, const PointFt& p) {
    h = hashF64(h, p.x);
    return hashF64(h, p.y);
}

std::uint64_t hashProperties(std::uint64_t h, const PropertyMap& properties) {
    h = hashU32(h, static_cast<std::uint32_t>(properties.size()));
    for (const auto& kv : properties) {
        h = hashString(h, kv.first);
        h = hashU32(h, static_cast<std::uint32_t>(kv.second.index()));
        h = std::visit([h](const auto& value) -> std::uint64_t {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, double>) {
                return hashF64(h, value);
            } else if constexpr (std::is_same_v<T, bool>) {
                return hashU32(h, value ? 1u : 0u);
            } else {
                return hashString(h, value);
            }
        }, kv.second);
    }
    return h;
}

} // namespace

DesignEditor::DocumentDigest DesignEditor::getDocumentDigest() const noexcept {
    const Design& design = core_->design;
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x4C595846u); // "FXYL" marker
    h = hashU32(h, kDigestVersion);

    h = hashF64(h, design.shell.lengthFt);
    h = hashF64(h, design.shell.widthFt);
    h = hashF64(h, design.shell.heightFt);

    h = hashU32(h, static_cast<std::uint32_t>(design.zones.size()));
    for (const Zone& zone : design.zones) {
        h = hashU32(h, zone.id);
        h = hashString(h, zone.name);
        h = hashF64(h, zone.xFt);
        h = hashF64(h, zone.yFt);
        h = hashF64(h, zone.lengthFt);
        h = hashF64(h, zone.widthFt);
        h = hashU32(h, zone.hasConstraints ? 1u : 0u);
        if (zone.hasConstraints) {
            h = hashF64(h, zone.constraints.minLengthFt);
            h = hashF64(h, zone.constraints.maxLengthFt);
            h = hashU32(h, zone.constraints.canResize ? 1u : 0u);
        }
    }

    h = hashU32(h, static_cast<std::uint32_t>(design.fixtures.size()));
    for (const Fixture& fixture : design.fixtures) {
        h = hashU32(h, fixture.id);
        h = hashString(h, fixture.catalogKey);
        h = hashF64(h, fixture.xFt);
        h = hashF64(h, fixture.yFt);
        h = hashU32(h, static_cast<std::uint32_t>(fixture.rotationDeg));
        h = hashU32(h, fixture.locked ? 1u : 0u);
        h = hashU32(h, fixture.zoneId);
        h = hashProperties(h, fixture.properties);
    }

    h = hashU32(h, static_cast<std::uint32_t>(design.annotations.size()));
    for (const Annotation& annotation : design.annotations) {
        h = hashU32(h, annotation.id);
        h = hashPoint(h, annotation.anchorFt);
        h = hashPoint(h, annotation.labelFt);
        h = hashString(h, annotation.text);
    }

    return DocumentDigest{
        static_cast<std::uint32_t>(h & 0xffffffffu),
        static_cast<std::uint32_t>(h >> 32),
    };
}
