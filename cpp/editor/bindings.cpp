#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "editor/catalog/catalog.h"
#include "editor/command/command_bindings.h"
#include "editor/editor.h"
#include "editor/interaction/tool_controller.h"

#ifdef EMSCRIPTEN
// Owns the catalog and the input adapters so the JS side deals with one object.
class WasmEditor {
public:
    WasmEditor()
        : editor_(catalog_)
        , tools_(editor_)
        , commands_(editor_, &tools_) {
        catalog_.upsert(CatalogTable::makeWallItem());
    }

    void upsertCatalogItem(const std::string& key, const std::string& label, const std::string& category,
                           double lengthFt, double widthFt, int anchor, int mount) {
        CatalogItem item;
        item.key = key;
        item.label = label;
        item.category = category;
        item.footprint = Footprint{lengthFt, widthFt};
        item.anchor = static_cast<FootprintAnchor>(anchor);
        item.mount = static_cast<MountLayer>(mount);
        catalog_.upsert(item);
    }

    void setSurface(double left, double top, double width, double height, double pixelRatio) {
        tools_.setSurface(editor::viewport::SurfaceMetrics{left, top, width, height, pixelRatio});
    }

    bool pointerDown(int id, int type, int button, double x, double y, std::uint32_t modifiers) {
        return tools_.pointerDown(makeInput(id, type, button, x, y, modifiers));
    }
    bool pointerMove(int id, int type, double x, double y, std::uint32_t modifiers) {
        return tools_.pointerMove(makeInput(id, type, 0, x, y, modifiers));
    }
    bool pointerUp(int id, int type, double x, double y, std::uint32_t modifiers) {
        return tools_.pointerUp(makeInput(id, type, 0, x, y, modifiers));
    }
    bool pointerCancel(int id) { return tools_.pointerCancel(id); }
    bool wheel(double x, double y, double deltaY) { return tools_.wheel(x, y, deltaY); }
    bool pinch(double ratio, double x, double y) { return tools_.pinch(ratio, x, y); }
    bool setTool(ToolKind tool) { return tools_.setTool(tool); }
    bool handleKey(const std::string& key, std::uint32_t modifiers) { return commands_.handleKey(KeyChord{key, modifiers}); }
    bool execute(const std::string& command) { return commands_.execute(command); }
    bool setZoneEditMode(bool enabled) {
        tools_.config().zoneEditMode = enabled;
        return true;
    }

    bool beginPlacement(const std::string& key, int rotationDeg) {
        return editor_.dispatch(editor::action::BeginPlacement{key, rotationDeg});
    }
    bool undo() { return editor_.dispatch(editor::action::Undo{}); }
    bool redo() { return editor_.dispatch(editor::action::Redo{}); }

    std::uint32_t getGeneration() const { return editor_.getGeneration(); }
    EditorError getLastError() const { return editor_.getLastError(); }
    void clearError() { editor_.clearError(); }
    ToolKind activeTool() const { return editor_.activeTool(); }
    TransientKind transientKind() const { return editor_.transientKind(); }
    std::size_t historySize() const { return editor_.historySize(); }
    std::size_t futureSize() const { return editor_.futureSize(); }
    std::size_t fixtureCount() const { return editor_.design().fixtures.size(); }
    Viewport viewport() const { return editor_.viewport(); }
    DesignEditor::DocumentDigest getDocumentDigest() const { return editor_.getDocumentDigest(); }
    DesignEditor::EventBufferMeta pollEvents(std::uint32_t maxEvents) { return editor_.pollEvents(maxEvents); }
    void ackResync(std::uint32_t generation) { editor_.ackResync(generation); }

private:
    static PointerInput makeInput(int id, int type, int button, double x, double y, std::uint32_t modifiers) {
        PointerInput input;
        input.pointerId = id;
        input.type = static_cast<PointerType>(type);
        input.button = button;
        input.x = x;
        input.y = y;
        input.modifiers = modifiers;
        return input;
    }

    CatalogTable catalog_;
    DesignEditor editor_;
    ToolController tools_;
    CommandDispatcher commands_;
};

EMSCRIPTEN_BINDINGS(fixture_editor_module) {
    emscripten::enum_<ToolKind>("ToolKind")
        .value("Select", ToolKind::Select)
        .value("Pan", ToolKind::Pan)
        .value("Wall", ToolKind::Wall)
        .value("Measure", ToolKind::Measure)
        .value("Annotate", ToolKind::Annotate);

    emscripten::enum_<TransientKind>("TransientKind")
        .value("None", TransientKind::None)
        .value("FixtureDrag", TransientKind::FixtureDrag)
        .value("ZoneDrag", TransientKind::ZoneDrag)
        .value("ZoneResize", TransientKind::ZoneResize)
        .value("Marquee", TransientKind::Marquee)
        .value("WallDraw", TransientKind::WallDraw)
        .value("WallLengthDrag", TransientKind::WallLengthDrag)
        .value("AnnotationDrag", TransientKind::AnnotationDrag);

    emscripten::enum_<EditorError>("EditorError")
        .value("Ok", EditorError::Ok)
        .value("UnknownEntity", EditorError::UnknownEntity)
        .value("UnknownCatalogItem", EditorError::UnknownCatalogItem)
        .value("EntityLocked", EditorError::EntityLocked)
        .value("InteractionBusy", EditorError::InteractionBusy)
        .value("NoActiveInteraction", EditorError::NoActiveInteraction)
        .value("InvalidArgument", EditorError::InvalidArgument)
        .value("PersistenceFailed", EditorError::PersistenceFailed);

    emscripten::value_object<Viewport>("Viewport")
        .field("scale", &Viewport::scale)
        .field("offsetX", &Viewport::offsetX)
        .field("offsetY", &Viewport::offsetY);

    emscripten::value_object<DesignEditor::DocumentDigest>("DocumentDigest")
        .field("lo", &DesignEditor::DocumentDigest::lo)
        .field("hi", &DesignEditor::DocumentDigest::hi);

    emscripten::value_object<DesignEditor::EventBufferMeta>("EventBufferMeta")
        .field("generation", &DesignEditor::EventBufferMeta::generation)
        .field("count", &DesignEditor::EventBufferMeta::count)
        .field("overflowed", &DesignEditor::EventBufferMeta::overflowed);

    emscripten::class_<WasmEditor>("FixtureEditor")
        .constructor<>()
        .function("upsertCatalogItem", &WasmEditor::upsertCatalogItem)
        .function("setSurface", &WasmEditor::setSurface)
        .function("pointerDown", &WasmEditor::pointerDown)
        .function("pointerMove", &WasmEditor::pointerMove)
        .function("pointerUp", &WasmEditor::pointerUp)
        .function("pointerCancel", &WasmEditor::pointerCancel)
        .function("wheel", &WasmEditor::wheel)
        .function("pinch", &WasmEditor::pinch)
        .function("setTool", &WasmEditor::setTool)
        .function("handleKey", &WasmEditor::handleKey)
        .function("execute", &WasmEditor::execute)
        .function("setZoneEditMode", &WasmEditor::setZoneEditMode)
        .function("beginPlacement", &WasmEditor::beginPlacement)
        .function("undo", &WasmEditor::undo)
        .function("redo", &WasmEditor::redo)
        .function("getGeneration", &WasmEditor::getGeneration)
        .function("getLastError", &WasmEditor::getLastError)
        .function("clearError", &WasmEditor::clearError)
        .function("activeTool", &WasmEditor::activeTool)
        .function("transientKind", &WasmEditor::transientKind)
        .function("historySize", &WasmEditor::historySize)
        .function("futureSize", &WasmEditor::futureSize)
        .function("fixtureCount", &WasmEditor::fixtureCount)
        .function("viewport", &WasmEditor::viewport)
        .function("getDocumentDigest", &WasmEditor::getDocumentDigest)
        .function("pollEvents", &WasmEditor::pollEvents)
        .function("ackResync", &WasmEditor::ackResync);
}
#endif
