#pragma once

#include "GridDevice.h"
#include "OscMessage.h"
#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace shapegrid {

// ============================================================
// MonomeGrid — GridDevice over serialosc (OSC on UDP).
// Asks serialosc for devices, binds to the first grid it reports
// and follows add/remove notifications for reconnects.
// ============================================================
class MonomeGrid : public GridDevice,
                   private juce::Thread {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int serialoscPort = 12002;
        int listenPort = 0;
        std::string prefix = "/shapegrid";
    };

    explicit MonomeGrid(Options options);
    ~MonomeGrid() override;

    // Binds the listening socket, starts receiving and asks for devices
    bool start();
    void shutdown();

    int getWidth() const override { return width_; }
    int getHeight() const override { return height_; }
    bool isConnected() const override { return connected_; }
    void pushFrame(const FrameBuffer& frame) override;

    int getListenPort() const;

    // Decoded packet from serialosc or the device
    void handleMessage(const OscMessage& message);

private:
    void run() override;

    void send(const OscMessage& message, int port);
    void requestDeviceList();
    void requestNotifications();
    void connectToDevice(const std::string& id, int port);
    void dropDevice(const std::string& id);

    // Lifecycle events reach listeners on the message thread
    void dispatchLifecycle(std::function<void()> fn);

    Options options_;
    std::unique_ptr<juce::DatagramSocket> socket_;
    std::mutex socketLock_;

    std::atomic<bool> connected_ {false};
    std::atomic<bool> keysEnabled_ {false};  // set after gridReady has been delivered
    std::atomic<int> width_ {0};
    std::atomic<int> height_ {0};

    std::mutex deviceLock_;
    std::string deviceId_;
    int devicePort_ = 0;

    // Shared with queued lifecycle callbacks so they can outlive us safely
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace shapegrid
