#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "EngineOutputParser.hpp"
#include "Notifier.hpp"
#include "ProcessLauncher.hpp"

class ControlFlow
{
public:
    using SleepFunction = std::function<void(std::chrono::seconds)>;
    using StopFunction = std::function<bool()>;

    ControlFlow(ProcessLauncher& Processes, Notifier& Notify);

    int Run();

    void SetSleepFunction(SleepFunction Sleep);
    void SetStopFunction(StopFunction Stop);

private:
    ProcessLauncher& Processes;
    Notifier& Notify;
    ConfigParser Parser;
    EngineOutputParser OutputParser;
    SleepFunction Sleep;
    StopFunction StopRequested;

    int Abort(const std::string& Reason);
    void LogJobs();
};
