#include "DestinationProber.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

DestinationProber::DestinationProber(ProcessLauncher& Launcher) : Launcher(Launcher)
{
}

std::optional<std::string> DestinationProber::ParseRemoteToken(const std::string& Destination)
{
    size_t ColonPos = Destination.find(':');
    if (ColonPos == std::string::npos || ColonPos == 0)
    {
        return std::nullopt;
    }
    return Destination.substr(0, ColonPos + 1);
}

bool DestinationProber::Probe(const std::string& RemoteToken)
{
    auto Cached = ProbedTokens.find(RemoteToken);
    if (Cached != ProbedTokens.end())
    {
        return Cached->second;
    }

    std::vector<std::string> Args = { ConfigGlobal::EnginePath, "lsd", RemoteToken, "--config", ConfigGlobal::EngineConfigPath, "--max-depth", "1" };
    Log.Info("[Probe] " + JoinCommandLine(Args));

    int Code = Launcher.Run(Args, "/dev/null");
    bool Reachable = (Code == 0);
    ProbedTokens[RemoteToken] = Reachable;

    if (Reachable)
    {
        Log.Info("[Probe] Remote " + RemoteToken + " is reachable");
    }
    return Reachable;
}

ProbeResult DestinationProber::Partition(const std::vector<JobSpec>& Jobs)
{
    ProbeResult Result;

    for (const auto& Spec : Jobs)
    {
        auto Token = ParseRemoteToken(Spec.Destination);
        if (!Token)
        {
            Result.Warnings.push_back("Job '" + Spec.Source + "' dropped: destination '" + Spec.Destination + "' is not in remote:path form");
            continue;
        }

        if (!Probe(*Token))
        {
            Result.Warnings.push_back("Job '" + Spec.Source + "' dropped: remote " + *Token + " is unreachable (check engine config " + ConfigGlobal::EngineConfigPath + ")");
            continue;
        }

        ValidatedJob Job;
        Job.Spec = Spec;
        Job.RemoteToken = *Token;
        Result.Valid.push_back(std::move(Job));
    }

    for (const auto& Warning : Result.Warnings)
    {
        Log.Warn("[Probe] " + Warning);
    }
    return Result;
}
