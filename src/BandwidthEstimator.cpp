#include "BandwidthEstimator.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <fstream>
#include <random>
#include <vector>

namespace FS = std::filesystem;

BandwidthEstimator::BandwidthEstimator(ProcessLauncher& Launcher, const EngineOutputParser& Parser)
    : Launcher(Launcher), Parser(Parser)
{
}

bool BandwidthEstimator::WritePayload(const FS::path& PayloadPath)
{
    // Random bytes so a compressing remote cannot shortcut the upload
    std::mt19937 Rng(std::random_device{}());
    std::vector<char> Buffer(PayloadBytes);
    for (auto& Byte : Buffer)
    {
        Byte = static_cast<char>(Rng() & 0xFF);
    }

    std::ofstream Out(PayloadPath, std::ios::binary | std::ios::trunc);
    if (!Out.is_open())
    {
        return false;
    }
    Out.write(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
    return Out.good();
}

std::optional<double> BandwidthEstimator::ExtractRate(const FS::path& OutputPath) const
{
    std::ifstream In(OutputPath);
    if (!In.is_open())
    {
        return std::nullopt;
    }

    std::optional<double> Rate;
    std::string Line;
    while (std::getline(In, Line))
    {
        if (auto LineRate = Parser.ParseRate(Line))
        {
            Rate = LineRate;
        }
    }
    return Rate;
}

void BandwidthEstimator::RemoveRemoteProbe(const std::string& RemoteObject, const FS::path& OutputPath)
{
    int Code = Launcher.Run({ ConfigGlobal::EnginePath, "deletefile", RemoteObject, "--config", ConfigGlobal::EngineConfigPath }, OutputPath.string());
    if (Code != 0)
    {
        Log.Warn("[Bandwidth] Could not remove probe object " + RemoteObject + " (exit " + std::to_string(Code) + "). Delete it manually.");
    }
}

std::optional<double> BandwidthEstimator::Estimate(const std::string& RemoteToken)
{
    const std::string Stamp = Logger::GetTimestampForFilename();
    std::error_code ec;
    FS::path ScratchDir = FS::temp_directory_path(ec) / ("SyncPilot_Probe_" + Stamp);
    if (ec)
    {
        Log.Warn("[Bandwidth] No temp directory available: " + ec.message());
        return std::nullopt;
    }

    FS::path PayloadPath = ScratchDir / "payload.bin";
    FS::path OutputPath = ScratchDir / "probe.log";
    std::string RemoteObject = RemoteToken + "SyncPilot_Probe/" + Stamp + ".bin";

    std::optional<double> Mbps;

    if (!FS::create_directories(ScratchDir, ec) && ec)
    {
        Log.Warn("[Bandwidth] Cannot create scratch directory " + ScratchDir.string() + ": " + ec.message());
        return std::nullopt;
    }

    if (!WritePayload(PayloadPath))
    {
        Log.Warn("[Bandwidth] Cannot write probe payload " + PayloadPath.string());
    }
    else
    {
        std::vector<std::string> Args = {
            ConfigGlobal::EnginePath, "copyto", PayloadPath.string(), RemoteObject,
            "--config", ConfigGlobal::EngineConfigPath,
            "--stats", "1s", "--stats-one-line", "-v"
        };
        Log.Info("[Bandwidth] Measuring upload: " + JoinCommandLine(Args));

        int Code = Launcher.Run(Args, OutputPath.string());
        if (Code != 0)
        {
            Log.Warn("[Bandwidth] Probe upload to " + RemoteToken + " exited with code " + std::to_string(Code));
        }
        else
        {
            Mbps = ExtractRate(OutputPath);
            if (!Mbps || *Mbps <= 0.0)
            {
                Log.Warn("[Bandwidth] No transfer rate found in probe output for " + RemoteToken);
                Mbps.reset();
            }
        }

        // A failed upload may still leave a partial object behind
        if (Code != -1)
        {
            RemoveRemoteProbe(RemoteObject, OutputPath);
        }
    }

    FS::remove_all(ScratchDir, ec);
    if (ec)
    {
        Log.Warn("[Bandwidth] Could not remove scratch directory " + ScratchDir.string() + ": " + ec.message());
    }

    if (Mbps)
    {
        Log.Info("[Bandwidth] Measured upload: " + std::to_string(*Mbps) + " Mbps");
    }
    return Mbps;
}
