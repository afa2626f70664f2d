#include "Config/Settings.h"
#include "Grid/MonomeGrid.h"
#include "ShapeGridApp.h"
#include <juce_events/juce_events.h>
#include <atomic>
#include <csignal>
#include <iostream>

namespace {

std::atomic<bool> quitRequested {false};

extern "C" void handleQuitSignal(int)
{
    quitRequested = true;
}

// Polls the signal flag from the message thread and ends the dispatch loop
class QuitWatcher : public juce::Timer {
public:
    QuitWatcher() { startTimer(100); }
    ~QuitWatcher() override { stopTimer(); }

    void timerCallback() override
    {
        if (quitRequested) {
            stopTimer();
            juce::MessageManager::getInstance()->stopDispatchLoop();
        }
    }
};

void printUsage()
{
    std::cout << "Usage: ShapeGrid [options]\n"
                 "  -c, --config=<file>   JSON settings file\n"
                 "  -r, --rate=<hz>       render rate (default 30)\n"
                 "  -p, --port=<port>     serialosc port (default 12002)\n"
                 "  -h, --help            show this help\n";
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI init;
    juce::ArgumentList args(argc, argv);

    if (args.containsOption("-h|--help")) {
        printUsage();
        return 0;
    }

    shapegrid::Settings settings;

    if (args.containsOption("-c|--config")) {
        juce::File file = juce::File::getCurrentWorkingDirectory()
                              .getChildFile(args.getValueForOption("-c|--config"));
        auto result = settings.loadFromFile(file);
        if (result.failed())
            juce::Logger::writeToLog("[config] " + result.getErrorMessage() + ", using defaults");
        else
            juce::Logger::writeToLog("[config] Loaded " + file.getFullPathName());
    }
    if (args.containsOption("-r|--rate"))
        settings.frameRateHz = juce::jlimit(1, 120, args.getValueForOption("-r|--rate").getIntValue());
    if (args.containsOption("-p|--port"))
        settings.serialoscPort = juce::jlimit(1, 65535, args.getValueForOption("-p|--port").getIntValue());

    std::unique_ptr<juce::FileLogger> fileLogger;
    if (!settings.logFile.empty()) {
        fileLogger = std::make_unique<juce::FileLogger>(
            juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(settings.logFile)),
            "Shape Grid log");
        juce::Logger::setCurrentLogger(fileLogger.get());
    }

    shapegrid::MonomeGrid::Options options;
    options.host = settings.serialoscHost;
    options.serialoscPort = settings.serialoscPort;
    options.listenPort = settings.listenPort;
    options.prefix = settings.prefix;

    int exitCode = 0;
    {
        shapegrid::MonomeGrid grid(options);
        shapegrid::ShapeGridApp app(settings, grid);

        if (grid.start()) {
            std::signal(SIGINT, handleQuitSignal);
            std::signal(SIGTERM, handleQuitSignal);

            QuitWatcher watcher;
            juce::MessageManager::getInstance()->runDispatchLoop();
            juce::Logger::writeToLog("[grid] Shutting down");
        } else {
            exitCode = 1;
        }

        app.shutdown();
        grid.shutdown();
    }

    juce::Logger::setCurrentLogger(nullptr);
    return exitCode;
}
