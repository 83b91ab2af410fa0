#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include "ProcessLauncher.hpp"

class PreconditionValidator
{
public:
    using SleepFunction = std::function<void(std::chrono::seconds)>;
    using PathProbe = std::function<bool(const std::string&)>;
    using StopFunction = std::function<bool()>;

    explicit PreconditionValidator(ProcessLauncher& Launcher);

    void SetSleepFunction(SleepFunction Sleep);
    void SetPathProbe(PathProbe Probe);
    void SetStopFunction(StopFunction Stop);

    // Fatal checks in order, stops at the first failure
    bool ValidateHost();

    bool CheckNoCompetingInstance();
    bool CheckEngineFiles();
    // Attempt n sleeps 6 * n seconds before the next probe. Gives up early on a stop request.
    bool WaitForSourceVolume(const std::string& VolumePath, unsigned short int MaxAttempts);
    // Not fatal, the destination probes decide
    bool CheckConnectivity(const std::string& Host);

    const std::vector<std::string>& GetErrors() const;
    std::chrono::seconds GetTotalSlept() const;

    static bool IsExecutableOnPath(const std::string& Program);

private:
    ProcessLauncher& Launcher;
    SleepFunction Sleep;
    PathProbe VolumeReachable;
    StopFunction StopRequested;
    std::vector<std::string> Errors;
    std::chrono::seconds TotalSlept{ 0 };

    void AddError(const std::string& Message);
};
