#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "ProcessLauncher.hpp"
#include "EngineOutputParser.hpp"

class BandwidthEstimator
{
public:
    BandwidthEstimator(ProcessLauncher& Launcher, const EngineOutputParser& Parser);

    // One real upload of a 1 MiB payload to RemoteToken. Nothing on any failure.
    std::optional<double> Estimate(const std::string& RemoteToken);

    // Last rate annotation found in the engine output
    std::optional<double> ExtractRate(const std::filesystem::path& OutputPath) const;

    static constexpr std::size_t PayloadBytes = 1024 * 1024;

private:
    ProcessLauncher& Launcher;
    const EngineOutputParser& Parser;

    bool WritePayload(const std::filesystem::path& PayloadPath);
    void RemoveRemoteProbe(const std::string& RemoteObject, const std::filesystem::path& OutputPath);
};
