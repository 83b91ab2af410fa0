#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string SourceVolumePath;
    std::string EnginePath;
    std::string EngineConfigPath;
    std::string ConnectivityHost;
    std::string TargetHostOverride;
    std::string RunStamp;

    bool Silent;

    unsigned short int MaxVolumeWaitAttempts;
    unsigned short int LogRetentionDays;
    unsigned short int DayStartHour;
    unsigned short int DayEndHour;
    unsigned short int PollIntervalSeconds;
    unsigned short int StallMinutes;
    unsigned short int LaunchStaggerSeconds;

    double DayFraction;
    double NightFraction;
    double FallbackUploadMbps;

    std::filesystem::path EngineLogPathForJob(int Index)
    {
        // Same path for every launch of a job, the engine appends to it
        return std::filesystem::path(LogDir) / ("Engine_Log" + RunStamp + "_Job" + std::to_string(Index) + ".txt");
    }

    const std::string& EffectiveConnectivityHost()
    {
        return TargetHostOverride.empty() ? ConnectivityHost : TargetHostOverride;
    }

    void InitializeDefaults()
    {
        ConfigFile = "SyncPilot.conf"; //Can be replaced with --config
        LogDir = "Sync_Logs";
        SourceVolumePath.clear();
        EnginePath.clear();
        EngineConfigPath.clear();
        ConnectivityHost = "1.1.1.1";
        TargetHostOverride.clear();
        RunStamp.clear();
        Silent = false;
        MaxVolumeWaitAttempts = 10;
        LogRetentionDays = 30;
        DayStartHour = 6;
        DayEndHour = 18;
        PollIntervalSeconds = 15;
        StallMinutes = 5;
        LaunchStaggerSeconds = 2;
        DayFraction = 0.5;
        NightFraction = 0.75;
        FallbackUploadMbps = 2.4;
    }
}
