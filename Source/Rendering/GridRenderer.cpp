#include "GridRenderer.h"

namespace shapegrid {

GridRenderer::GridRenderer(EditorState& editor, GridDevice& device, std::mutex& stateLock)
    : editor_(editor), device_(device), stateLock_(stateLock)
{
}

GridRenderer::~GridRenderer()
{
    stopTimer();
}

void GridRenderer::setFrameRate(int hz)
{
    periodMs_ = juce::jmax(1, 1000 / juce::jmax(1, hz));
    if (isTimerRunning())
        startTimer(periodMs_);
}

void GridRenderer::start()
{
    running_ = true;
    startTimer(periodMs_);
    DBG("[renderer] Started, period " + juce::String(periodMs_) + "ms");
}

void GridRenderer::stop()
{
    running_ = false;
    stopTimer();
    DBG("[renderer] Stopped");
}

void GridRenderer::shutdown()
{
    stop();
    if (device_.isConnected())
        pushDarkFrame();
}

void GridRenderer::timerCallback()
{
    tick(juce::Time::getMillisecondCounterHiRes());
}

void GridRenderer::tick(double nowMs)
{
    if (!running_) return;
    if (!device_.isConnected()) return;

    {
        std::lock_guard<std::mutex> lock(stateLock_);
        if (frame_.getWidth() != editor_.getGridWidth() || frame_.getHeight() != editor_.getGridHeight())
            frame_.resize(editor_.getGridWidth(), editor_.getGridHeight());
        renderFrame(frame_, nowMs);
    }

    device_.pushFrame(frame_);
    ++framesSent_;
}

void GridRenderer::renderFrame(FrameBuffer& frame, double nowMs) const
{
    frame.clear();

    // Controls never overlap, so draw order only needs to be stable
    for (auto& [id, control] : editor_.controls())
        control.draw(frame, policy_, nowMs);

    // Cells of the gesture in progress
    for (auto& p : editor_.pointBuffer())
        frame.setLevel(p.x, p.y, PendingPointLevel);

    auto key = editor_.metaKey();
    frame.setLevel(key.x, key.y, editor_.isMetaMode() ? MetaKeyActiveLevel : MetaKeyIdleLevel);

    if (editor_.isMetaMode()) {
        if (auto cells = editor_.selectedMetaCells()) {
            frame.setLevel(cells->increment.x, cells->increment.y, IncrementLevel);
            frame.setLevel(cells->decrement.x, cells->decrement.y, DecrementLevel);
            frame.setLevel(cells->copyDelete.x, cells->copyDelete.y,
                           editor_.clipboard().hasContent() ? CopyFullLevel : CopyEmptyLevel);
            if (cells->cycle != key)
                frame.setLevel(cells->cycle.x, cells->cycle.y, CycleLevel);
        }
    }
}

void GridRenderer::pushDarkFrame()
{
    FrameBuffer dark(device_.getWidth(), device_.getHeight());
    device_.pushFrame(dark);
    DBG("[renderer] Pushed dark frame");
}

} // namespace shapegrid
