#include "MonomeGrid.h"

namespace shapegrid {

static constexpr int QuadSize = 8;
static constexpr int MaxPacketSize = 1024;

MonomeGrid::MonomeGrid(Options options)
    : juce::Thread("serialosc receiver"),
      options_(std::move(options)),
      alive_(std::make_shared<std::atomic<bool>>(true))
{
}

MonomeGrid::~MonomeGrid()
{
    *alive_ = false;
    shutdown();
}

bool MonomeGrid::start()
{
    {
        std::lock_guard<std::mutex> lock(socketLock_);
        socket_ = std::make_unique<juce::DatagramSocket>(false);
        if (!socket_->bindToPort(options_.listenPort)) {
            juce::Logger::writeToLog("[grid] Could not bind UDP port " + juce::String(options_.listenPort));
            socket_.reset();
            return false;
        }
    }

    juce::Logger::writeToLog("[grid] Listening on port " + juce::String(getListenPort()));
    startThread();
    requestDeviceList();
    requestNotifications();
    return true;
}

void MonomeGrid::shutdown()
{
    signalThreadShouldExit();
    {
        std::lock_guard<std::mutex> lock(socketLock_);
        if (socket_)
            socket_->shutdown();
    }
    stopThread(1000);

    std::lock_guard<std::mutex> lock(socketLock_);
    socket_.reset();
    connected_ = false;
    keysEnabled_ = false;
}

int MonomeGrid::getListenPort() const
{
    return socket_ ? socket_->getBoundPort() : -1;
}

void MonomeGrid::run()
{
    std::vector<uint8_t> buffer(MaxPacketSize);

    while (!threadShouldExit()) {
        juce::DatagramSocket* socket = socket_.get();
        if (socket == nullptr) return;

        int ready = socket->waitUntilReady(true, 100);
        if (ready < 0) return;
        if (ready == 0) continue;

        juce::String senderHost;
        int senderPort = 0;
        int bytes = socket->read(buffer.data(), (int)buffer.size(), false, senderHost, senderPort);
        if (bytes <= 0) continue;

        OscMessage message;
        if (OscMessage::parse(buffer.data(), bytes, message))
            handleMessage(message);
        else
            DBG("[grid] Dropping malformed packet from " + senderHost + ":" + juce::String(senderPort));
    }
}

void MonomeGrid::handleMessage(const OscMessage& m)
{
    const auto& address = m.getAddress();

    if (m.matches("/serialosc/device", "ssi")) {
        if (!connected_)
            connectToDevice(m.arg(0).s, m.arg(2).i);
        return;
    }

    if (m.matches("/serialosc/add", "ssi")) {
        // Notifications are one-shot; re-arm before acting
        requestNotifications();
        if (!connected_)
            connectToDevice(m.arg(0).s, m.arg(2).i);
        return;
    }

    if (m.matches("/serialosc/remove", "ssi")) {
        requestNotifications();
        dropDevice(m.arg(0).s);
        return;
    }

    if (m.matches("/sys/size", "ii")) {
        int w = m.arg(0).i, h = m.arg(1).i;
        if (w <= 0 || h <= 0) return;
        width_ = w;
        height_ = h;
        bool wasConnected = connected_.exchange(true);
        juce::Logger::writeToLog("[grid] Ready: " + juce::String(w) + "x" + juce::String(h));
        if (!wasConnected) {
            dispatchLifecycle([this, w, h] {
                notifyReady(w, h);
                // Keys reach listeners only once they have set up for this size
                if (connected_)
                    keysEnabled_ = true;
            });
        }
        return;
    }

    if (m.matches(options_.prefix + "/grid/key", "iii")) {
        if (!connected_ || !keysEnabled_) return;
        int x = m.arg(0).i, y = m.arg(1).i;
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        notifyKey(x, y, m.arg(2).i != 0);
        return;
    }

    if (address.rfind("/sys/", 0) == 0)
        return;  // id, host, port, prefix, rotation echoes

    DBG("[grid] Unhandled OSC " + juce::String(address) + " ," + juce::String(m.typeTags()));
}

void MonomeGrid::pushFrame(const FrameBuffer& frame)
{
    int port;
    {
        std::lock_guard<std::mutex> lock(deviceLock_);
        port = devicePort_;
    }
    if (!connected_ || port <= 0) return;

    auto address = options_.prefix + "/grid/led/level/map";
    for (int y0 = 0; y0 < frame.getHeight(); y0 += QuadSize) {
        for (int x0 = 0; x0 < frame.getWidth(); x0 += QuadSize) {
            OscMessage m(address);
            m.addInt(x0).addInt(y0);
            for (int y = 0; y < QuadSize; ++y)
                for (int x = 0; x < QuadSize; ++x)
                    m.addInt(frame.getLevel(x0 + x, y0 + y));
            send(m, port);
        }
    }
}

void MonomeGrid::send(const OscMessage& message, int port)
{
    auto bytes = message.toBytes();
    std::lock_guard<std::mutex> lock(socketLock_);
    if (!socket_) return;
    if (socket_->write(options_.host, port, bytes.data(), (int)bytes.size()) < 0)
        DBG("[grid] Send failed: " + juce::String(message.getAddress()));
}

void MonomeGrid::requestDeviceList()
{
    send(OscMessage("/serialosc/list").addString(options_.host).addInt(getListenPort()),
         options_.serialoscPort);
}

void MonomeGrid::requestNotifications()
{
    send(OscMessage("/serialosc/notify").addString(options_.host).addInt(getListenPort()),
         options_.serialoscPort);
}

void MonomeGrid::connectToDevice(const std::string& id, int port)
{
    {
        std::lock_guard<std::mutex> lock(deviceLock_);
        deviceId_ = id;
        devicePort_ = port;
    }
    juce::Logger::writeToLog("[grid] Connecting to " + juce::String(id) + " on port " + juce::String(port));

    int listenPort = getListenPort();
    send(OscMessage("/sys/port").addInt(listenPort), port);
    send(OscMessage("/sys/host").addString(options_.host), port);
    send(OscMessage("/sys/prefix").addString(options_.prefix), port);
    send(OscMessage("/sys/info").addString(options_.host).addInt(listenPort), port);
}

void MonomeGrid::dropDevice(const std::string& id)
{
    {
        std::lock_guard<std::mutex> lock(deviceLock_);
        if (id != deviceId_) return;
        deviceId_.clear();
        devicePort_ = 0;
    }

    keysEnabled_ = false;
    if (connected_.exchange(false)) {
        juce::Logger::writeToLog("[grid] Disconnected from " + juce::String(id));
        dispatchLifecycle([this] { notifyDisconnected(); });
    }
}

void MonomeGrid::dispatchLifecycle(std::function<void()> fn)
{
    auto* mm = juce::MessageManager::getInstanceWithoutCreating();
    if (mm == nullptr || mm->isThisTheMessageThread()) {
        fn();
        return;
    }

    auto alive = alive_;
    juce::MessageManager::callAsync([alive, fn = std::move(fn)] {
        if (*alive) fn();
    });
}

} // namespace shapegrid
