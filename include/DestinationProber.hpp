#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "JobTypes.hpp"
#include "ProcessLauncher.hpp"

struct ProbeResult
{
    std::vector<ValidatedJob> Valid;
    std::vector<std::string> Warnings; // one per dropped job
};

class DestinationProber
{
public:
    explicit DestinationProber(ProcessLauncher& Launcher);

    // "remote:path" -> "remote:". Nothing when there is no non-empty token before the first colon.
    static std::optional<std::string> ParseRemoteToken(const std::string& Destination);

    // Lists the bare remote; reachable when the engine exits with 0
    bool Probe(const std::string& RemoteToken);

    // Order of the valid jobs follows the config, which fixes their indices
    ProbeResult Partition(const std::vector<JobSpec>& Jobs);

private:
    ProcessLauncher& Launcher;
    std::unordered_map<std::string, bool> ProbedTokens;
};
