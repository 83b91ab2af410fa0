#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "CommandLine.hpp"
#include "ConfigGlobal.hpp"
#include "ControlFlow.hpp"
#include "Notifier.hpp"
#include "ProcessLauncher.hpp"

static const char* SYNCPILOT_VERSION = "1.0.0";

static volatile std::sig_atomic_t StopSignal = 0;

static void HandleSignal(int)
{
    StopSignal = 1;
}

int main(int argc, char** argv)
{
    ConfigGlobal::InitializeDefaults();

    CommandLineResult Options = ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    switch (Options.Action)
    {
    case CommandLineAction::ShowHelp:
        std::cout << UsageText();
        return 0;
    case CommandLineAction::ShowVersion:
        std::cout << "SyncPilot " << SYNCPILOT_VERSION << "\n";
        return 0;
    case CommandLineAction::UsageError:
        std::cerr << Options.Error << "\n" << UsageText();
        return 1;
    case CommandLineAction::Run:
        break;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    PosixProcessLauncher Processes;
    DesktopNotifier Notify(Processes, ConfigGlobal::Silent);

    ControlFlow Flow(Processes, Notify);
    Flow.SetStopFunction([] { return StopSignal != 0; });

    // Sleep in short slices so a signal is noticed within a second
    Flow.SetSleepFunction([](std::chrono::seconds Duration)
    {
        for (auto Slept = std::chrono::seconds(0); Slept < Duration && StopSignal == 0; ++Slept)
        {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    });

    return Flow.Run();
}
