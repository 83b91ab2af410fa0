#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "PreconditionValidator.hpp"
#include "DestinationProber.hpp"
#include "BandwidthEstimator.hpp"
#include "BandwidthPolicy.hpp"
#include "JobLauncher.hpp"
#include "Supervisor.hpp"
#include "RunReport.hpp"

ControlFlow::ControlFlow(ProcessLauncher& Processes, Notifier& Notify)
    : Processes(Processes),
      Notify(Notify),
      Sleep([](std::chrono::seconds Duration) { std::this_thread::sleep_for(Duration); }),
      StopRequested([] { return false; })
{
}

void ControlFlow::SetSleepFunction(SleepFunction NewSleep)
{
    Sleep = std::move(NewSleep);
}

void ControlFlow::SetStopFunction(StopFunction Stop)
{
    StopRequested = std::move(Stop);
}

int ControlFlow::Abort(const std::string& Reason)
{
    Log.Error(Reason + " Exiting.");
    std::cerr << Reason << " Exiting.\n";

    // A failed notification must not hide the original error
    if (!Notify.Send("SyncPilot: sync aborted", Reason))
    {
        std::cerr << "(desktop notification could not be delivered)\n";
    }
    return 1;
}

int ControlFlow::Run()
{
    const bool ConfigOk = Parser.Parse(ConfigGlobal::ConfigFile);

    Log.Init(ConfigGlobal::LogDir);
    ConfigGlobal::RunStamp = Logger::GetTimestampForFilename();
    std::cout << "Starting SyncPilot \n";

    if (!ConfigOk)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        return Abort("Configuration " + ConfigGlobal::ConfigFile + " is invalid (" + Parser.GetErrors().front() + ").");
    }
    Log.Info("Config Parsed Successfully.");
    std::cout << "Config Parsed Successfully.\n";

    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Config Info: " << Info << "\n";
        Log.Info(Info);
    }

    Log.PurgeExpiredLogs(ConfigGlobal::LogRetentionDays);
    LogJobs();

    PreconditionValidator Validator(Processes);
    Validator.SetSleepFunction(Sleep);
    Validator.SetStopFunction(StopRequested);
    if (!Validator.ValidateHost())
    {
        return Abort(Validator.GetErrors().front());
    }
    Log.Info("Host Preconditions Verified.");
    std::cout << "Host Preconditions Verified.\n";
    if (StopRequested())
    {
        return Abort("Stop requested before destinations were probed, no transfer was started.");
    }

    Validator.CheckConnectivity(ConfigGlobal::EffectiveConnectivityHost());

    Log.Info("Probing Destinations...");
    std::cout << "Probing Destinations...\n";

    DestinationProber Prober(Processes);
    ProbeResult Probed = Prober.Partition(Parser.GetJobs());
    for (const auto& Warning : Probed.Warnings)
    {
        std::cerr << "Warning: " << Warning << "\n";
    }
    if (Probed.Valid.empty())
    {
        return Abort("None of the " + std::to_string(Parser.GetJobs().size()) + " configured destination(s) is reachable.");
    }
    Log.Info(std::to_string(Probed.Valid.size()) + " of " + std::to_string(Parser.GetJobs().size()) + " job(s) validated.");
    std::cout << Probed.Valid.size() << " of " << Parser.GetJobs().size() << " job(s) validated.\n";
    if (StopRequested())
    {
        return Abort("Stop requested before bandwidth was measured, no transfer was started.");
    }

    BandwidthEstimator Estimator(Processes, OutputParser);
    std::optional<double> Measured = Estimator.Estimate(Probed.Valid.front().RemoteToken);
    double UploadMbps = ConfigGlobal::FallbackUploadMbps;
    if (Measured)
    {
        UploadMbps = *Measured;
        std::cout << "Measured upload: " << UploadMbps << " Mbps\n";
    }
    else
    {
        Log.Warn("Bandwidth measurement against " + Probed.Valid.front().RemoteToken + " failed, using fallback " + std::to_string(UploadMbps) + " Mbps");
        std::cerr << "Warning: bandwidth measurement failed, using fallback " << UploadMbps << " Mbps\n";
    }

    if (StopRequested())
    {
        return Abort("Stop requested before transfers were launched.");
    }

    JobLauncher Launcher(Processes);
    Launcher.SetSleepFunction(Sleep);

    Supervisor Fleet(Processes, Launcher, OutputParser);
    Fleet.SetSleepFunction(Sleep);
    Fleet.SetStopFunction(StopRequested);

    Log.Info("Launching Transfers...");
    std::cout << "Launching Transfers...\n";

    SupervisorState State = Fleet.Start(Probed.Valid, BandwidthPolicy::FromConfig(UploadMbps));
    Fleet.Run(State);

    RunReport Report = RunReport::FromState(State);
    for (const auto& Line : Report.SummaryLines())
    {
        std::cout << Line << "\n";
        if (Report.AllSucceeded())
        {
            Log.Info(Line);
        }
        else
        {
            Log.Error(Line);
        }
    }

    if (!Notify.Send(Report.NotificationTitle(), Report.NotificationBody()))
    {
        std::cerr << "(desktop notification could not be delivered)\n";
    }

    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    std::cout << (Report.AllSucceeded() ? "Sync Complete \n" : "Sync Finished With Errors \n");
    return Report.ExitStatus();
}

void ControlFlow::LogJobs()
{
    Log.Info("Source Volume:");
    Log.Info("  " + ConfigGlobal::SourceVolumePath);

    Log.Info("Jobs:");
    for (const auto& Job : Parser.GetJobs())
    {
        std::string Line = "  " + Job.Source + " -> " + Job.Destination;
        if (!Job.Exclude.empty())
        {
            Line += " (exclude " + Job.Exclude + ")";
        }
        Log.Info(Line);
    }
}
