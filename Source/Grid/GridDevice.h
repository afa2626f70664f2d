#pragma once

#include "FrameBuffer.h"
#include <algorithm>
#include <mutex>
#include <vector>

namespace shapegrid {

// ============================================================
// GridDevice — the button grid as seen by the editor.
// Implementations own the transport; the editor only sees
// dimensions, key events, lifecycle events and frame pushes.
// ============================================================
class GridDevice {
public:
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void gridReady(int width, int height) {}
        virtual void gridDisconnected() {}
        virtual void gridKey(int x, int y, bool pressed) {}
    };

    virtual ~GridDevice() = default;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;
    virtual bool isConnected() const = 0;

    // Fire-and-forget: a failed push is dropped, the next frame retries
    virtual void pushFrame(const FrameBuffer& frame) = 0;

    void addListener(Listener* l)
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners_.push_back(l);
    }

    void removeListener(Listener* l)
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), l), listeners_.end());
    }

protected:
    void notifyReady(int width, int height)
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (auto* l : listeners_)
            l->gridReady(width, height);
    }

    void notifyDisconnected()
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (auto* l : listeners_)
            l->gridDisconnected();
    }

    void notifyKey(int x, int y, bool pressed)
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (auto* l : listeners_)
            l->gridKey(x, y, pressed);
    }

private:
    std::vector<Listener*> listeners_;
    std::mutex listenerMutex_;
};

} // namespace shapegrid
