#pragma once

#include "Config/Settings.h"
#include "Core/EditorState.h"
#include "Core/InteractionEngine.h"
#include "Grid/GridDevice.h"
#include "Rendering/GridRenderer.h"
#include <mutex>

namespace shapegrid {

// ============================================================
// ShapeGridApp — owns the editor and wires it to a grid device.
// Key events and render ticks both go through stateLock_, so a
// frame never sees a half-applied edit.
// ============================================================
class ShapeGridApp : public GridDevice::Listener {
public:
    ShapeGridApp(const Settings& settings, GridDevice& device);
    ~ShapeGridApp() override;

    // Stops rendering and darkens the grid if it is still attached
    void shutdown();

    // GridDevice::Listener
    void gridReady(int width, int height) override;
    void gridDisconnected() override;
    void gridKey(int x, int y, bool pressed) override;

    // For tests: feed a key with an explicit timestamp
    EditResult handleKey(int x, int y, bool pressed, double nowMs);

    EditorState& getEditor() { return editor_; }
    InteractionEngine& getEngine() { return engine_; }
    GridRenderer& getRenderer() { return renderer_; }
    std::mutex& getStateLock() { return stateLock_; }

private:
    GridDevice& device_;
    std::mutex stateLock_;
    EditorState editor_;
    InteractionEngine engine_;
    GridRenderer renderer_;
    bool shutDown_ = false;
};

} // namespace shapegrid
