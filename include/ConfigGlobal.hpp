#pragma once

#include <string>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string SourceVolumePath;
    extern std::string EnginePath;
    extern std::string EngineConfigPath;
    extern std::string ConnectivityHost;
    extern std::string TargetHostOverride;
    extern std::string RunStamp;

    extern bool Silent;

    extern unsigned short int MaxVolumeWaitAttempts;
    extern unsigned short int LogRetentionDays;
    extern unsigned short int DayStartHour;
    extern unsigned short int DayEndHour;
    extern unsigned short int PollIntervalSeconds;
    extern unsigned short int StallMinutes;
    extern unsigned short int LaunchStaggerSeconds;

    extern double DayFraction;
    extern double NightFraction;
    extern double FallbackUploadMbps;

    std::filesystem::path EngineLogPathForJob(int Index);
    const std::string& EffectiveConnectivityHost();

    void InitializeDefaults();
}
