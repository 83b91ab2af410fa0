/**
 * @file test_supervisor.cpp
 * @brief Supervisor loop, run report and the end-to-end control flow
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>

#include "ConfigGlobal.hpp"
#include "ControlFlow.hpp"
#include "JobLauncher.hpp"
#include "Notifier.hpp"
#include "RunReport.hpp"
#include "Supervisor.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;

namespace {

// Two jobs with real source directories and logs under one scratch dir
struct Fleet {
    TempDir dir;
    FakeProcessLauncher fake;
    EngineOutputParser parser;
    JobLauncher launcher{fake};
    Supervisor supervisor{fake, launcher, parser};
    BandwidthPolicy policy;
    std::vector<ValidatedJob> valid;
    int hour = 12;

    explicit Fleet(size_t job_count = 2) {
        ConfigGlobal::InitializeDefaults();
        ConfigGlobal::EnginePath = "rclone";
        ConfigGlobal::LogDir = dir.mkdir("logs").string();
        ConfigGlobal::RunStamp = "20260101_020000";

        launcher.SetSleepFunction([](std::chrono::seconds) {});
        launcher.SetStagger(std::chrono::seconds(2));
        supervisor.SetStallThreshold(std::chrono::minutes(5));
        supervisor.SetSleepFunction([](std::chrono::seconds) {});
        supervisor.SetHourFunction([this] { return hour; });

        policy.MeasuredUploadMbps = 10.0;
        for (size_t i = 0; i < job_count; ++i) {
            ValidatedJob job;
            job.Spec.Source = dir.mkdir("src" + std::to_string(i)).string();
            job.Spec.Destination = "gdrive:dst" + std::to_string(i);
            job.RemoteToken = "gdrive:";
            valid.push_back(job);
        }
    }
};

void append(const std::string &path, const std::string &text) {
    std::ofstream out(path, std::ios::app | std::ios::binary);
    out << text;
}

}  // namespace

// =============================================================================
// Bandwidth window changes
// =============================================================================

TEST(bucket_change_relaunches_fleet_once) {
    Fleet f;
    f.hour = 17;
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    ASSERT_NEAR(state.ActiveCapKBs, 312.5, 1e-9);
    ASSERT_EQ(f.fake.alive_count(), 2u);

    f.hour = 18;
    TickReport report = f.supervisor.Tick(state);

    ASSERT(report.Relaunched);
    ASSERT_EQ(state.RelaunchCount, 1);
    ASSERT(state.ActiveBucket == BandwidthBucket::Night);
    ASSERT_NEAR(state.ActiveCapKBs, 468.75, 1e-9);
    ASSERT_EQ(f.fake.kill_count, 2);
    ASSERT_EQ(f.fake.alive_count(), 2u);
    ASSERT_EQ(f.fake.count_with_arg("468.75K"), 2u);
    ASSERT_EQ(state.Jobs.size(), 2u);
    ASSERT_EQ(state.Jobs[0].Index, 1);
    ASSERT_EQ(state.Jobs[1].Index, 2);
    ASSERT(state.Jobs[0].IsAlive());
    ASSERT(state.Jobs[1].IsAlive());
    ASSERT(state.Phase == SupervisorPhase::Running);

    TickReport again = f.supervisor.Tick(state);
    ASSERT(!again.Relaunched);
    ASSERT_EQ(state.RelaunchCount, 1);
    ASSERT_EQ(f.fake.processes.size(), 4u);
}

TEST(same_bucket_never_relaunches) {
    Fleet f;
    f.hour = 9;
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    f.hour = 17;
    f.supervisor.Tick(state);
    f.supervisor.Tick(state);
    ASSERT_EQ(state.RelaunchCount, 0);
    ASSERT_EQ(f.fake.kill_count, 0);
}

TEST(relaunch_keeps_finished_jobs_finished) {
    Fleet f;
    f.hour = 17;
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    f.fake.exit(state.Jobs[0].Handle, 0);
    f.supervisor.Tick(state);

    f.hour = 18;
    f.supervisor.Tick(state);

    ASSERT_EQ(state.RelaunchCount, 1);
    ASSERT_EQ(*state.Jobs[0].ExitCode, 0);
    ASSERT(state.Jobs[1].IsAlive());
    ASSERT_EQ(f.fake.processes.size(), 3u);
}

TEST(relaunch_keeps_first_start_time) {
    Fleet f(1);
    f.hour = 17;
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    const auto two_hours_ago = std::chrono::system_clock::now() - std::chrono::hours(2);
    state.Jobs[0].FirstStartTime = two_hours_ago;
    state.Jobs[0].StartTime = two_hours_ago;

    f.hour = 18;
    f.supervisor.Tick(state);
    ASSERT_EQ(state.RelaunchCount, 1);
    ASSERT(state.Jobs[0].FirstStartTime == two_hours_ago);
    ASSERT(state.Jobs[0].StartTime > two_hours_ago);

    TickReport report = f.supervisor.Tick(state);
    ASSERT(report.Heartbeats[0].Elapsed >= std::chrono::hours(2));

    f.fake.exit(state.Jobs[0].Handle, 0);
    f.supervisor.Tick(state);
    RunReport run = RunReport::FromState(state);
    ASSERT_CONTAINS(run.SummaryLines()[0], "succeeded in 02:00:");
}

// =============================================================================
// Heartbeats, stalls and failures
// =============================================================================

TEST(stalled_log_warns_without_kill) {
    Fleet f(1);
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    const std::string log_path = state.Jobs[0].LogPath;
    append(log_path, "Transferred: 1 MiB / 10 MiB, 10%, 1 MiB/s\n");
    fs::last_write_time(log_path, fs::file_time_type::clock::now() - std::chrono::minutes(6));

    TickReport report = f.supervisor.Tick(state);

    ASSERT_EQ(report.StalledJobs.size(), 1u);
    ASSERT_EQ(report.StalledJobs[0], 1);
    ASSERT_EQ(f.fake.kill_count, 0);
    ASSERT(state.Jobs[0].IsAlive());
    ASSERT(report.Heartbeats[0].Stalled);
}

TEST(fresh_log_is_not_stalled) {
    Fleet f(1);
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    append(state.Jobs[0].LogPath, "INFO : starting\n");

    TickReport report = f.supervisor.Tick(state);
    ASSERT(report.StalledJobs.empty());
    ASSERT_EQ(report.Heartbeats.size(), 1u);
    ASSERT(report.Heartbeats[0].Usage.has_value());
}

TEST(heartbeat_tracks_progress_and_lines) {
    Fleet f(1);
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    const std::string log_path = state.Jobs[0].LogPath;

    append(log_path, "INFO : starting\n"
                     "Transferred: 1 MiB / 10 MiB, 10%, 1 MiB/s\r"
                     "Transferred: 5 MiB / 10 MiB, 50%, 1 MiB/s\n"
                     "Transferred: 6 MiB");
    TickReport first = f.supervisor.Tick(state);
    ASSERT_EQ(first.Heartbeats[0].LogLines, 2u);
    ASSERT_NEAR(*first.Heartbeats[0].Progress, 50.0, 1e-9);

    append(log_path, " / 10 MiB, 90%, 1 MiB/s\n");
    TickReport second = f.supervisor.Tick(state);
    ASSERT_EQ(second.Heartbeats[0].LogLines, 3u);
    ASSERT_NEAR(*second.Heartbeats[0].Progress, 90.0, 1e-9);
}

TEST(heartbeat_progress_ignores_file_count_line) {
    Fleet f(1);
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);

    append(state.Jobs[0].LogPath, "Transferred:   2 GiB / 8 GiB, 25%, 10 MiB/s, ETA 10m\n"
                                  "Checks:                 4 / 4, 100%\n"
                                  "Transferred:            3 / 10, 30%\n"
                                  "Elapsed time:      3m25.0s\n");
    TickReport report = f.supervisor.Tick(state);
    ASSERT_NEAR(*report.Heartbeats[0].Progress, 25.0, 1e-9);
}

TEST(missing_log_gives_unknown_heartbeat) {
    Fleet f(1);
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);

    TickReport report = f.supervisor.Tick(state);
    ASSERT_EQ(report.Heartbeats.size(), 1u);
    ASSERT(!report.Heartbeats[0].LogAge.has_value());
    ASSERT(!report.Heartbeats[0].Progress.has_value());
    ASSERT(!report.Heartbeats[0].Stalled);
}

TEST(failure_reported_once) {
    Fleet f;
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    f.fake.exit(state.Jobs[0].Handle, 3);

    TickReport first = f.supervisor.Tick(state);
    ASSERT_EQ(first.FailedJobs.size(), 1u);
    ASSERT_EQ(first.FailedJobs[0], 1);
    ASSERT(state.Jobs[0].FailureReported);

    TickReport second = f.supervisor.Tick(state);
    ASSERT(second.FailedJobs.empty());
    ASSERT(state.Jobs[1].IsAlive());
    ASSERT(state.Phase == SupervisorPhase::Running);
}

// =============================================================================
// Run loop and report
// =============================================================================

TEST(mixed_results_report_failure) {
    Fleet f;
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    f.fake.exit(state.Jobs[0].Handle, 0);
    f.fake.exit(state.Jobs[1].Handle, 1);
    f.supervisor.Tick(state);
    ASSERT(state.Phase == SupervisorPhase::Drained);

    RunReport report = RunReport::FromState(state);
    ASSERT(!report.AllSucceeded());
    ASSERT_EQ(report.ExitStatus(), 1);

    auto lines = report.SummaryLines();
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_CONTAINS(lines[0], "Job 1");
    ASSERT_CONTAINS(lines[0], "succeeded in 00:00:");
    ASSERT_CONTAINS(lines[1], "FAILED with exit code 1");
    ASSERT_CONTAINS(lines[1], state.Jobs[1].LogPath);
    ASSERT_CONTAINS(report.NotificationTitle(), "FAILED");
    ASSERT_CONTAINS(report.NotificationBody(), "1 of 2");
}

TEST(run_drains_when_all_exit) {
    Fleet f;
    f.fake.on_spawn = [](const std::vector<std::string> &, const std::string &) -> std::optional<int> { return 0; };
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);

    f.supervisor.Run(state);
    ASSERT(state.Phase == SupervisorPhase::Drained);
    ASSERT(!state.Interrupted);

    RunReport report = RunReport::FromState(state);
    ASSERT(report.AllSucceeded());
    ASSERT_EQ(report.ExitStatus(), 0);
}

TEST(run_polls_until_exit) {
    Fleet f(1);
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);
    const ProcessHandle handle = state.Jobs[0].Handle;

    int sleeps = 0;
    f.supervisor.SetSleepFunction([&](std::chrono::seconds) {
        if (++sleeps == 3) f.fake.exit(handle, 0);
    });
    f.supervisor.Run(state);

    ASSERT_EQ(sleeps, 3);
    ASSERT_EQ(*state.Jobs[0].ExitCode, 0);
}

TEST(stop_request_kills_fleet) {
    Fleet f;
    f.supervisor.SetStopFunction([] { return true; });
    SupervisorState state = f.supervisor.Start(f.valid, f.policy);

    f.supervisor.Run(state);
    ASSERT(state.Interrupted);
    ASSERT_EQ(f.fake.kill_count, 2);
    ASSERT_EQ(f.fake.alive_count(), 0u);

    RunReport report = RunReport::FromState(state);
    ASSERT_EQ(report.ExitStatus(), 1);
    ASSERT_CONTAINS(report.SummaryLines().back(), "interrupted");
}

TEST(empty_run_is_a_failure) {
    SupervisorState state;
    RunReport report = RunReport::FromState(state);
    ASSERT_EQ(report.ExitStatus(), 1);
    ASSERT_CONTAINS(report.SummaryLines().front(), "No transfer");
}

TEST(desktop_notifier_silent_and_failure) {
    FakeProcessLauncher fake;
    DesktopNotifier silent(fake, true);
    ASSERT(silent.Send("SyncPilot: sync complete", "1 of 1 job(s) succeeded."));
    ASSERT_EQ(fake.processes.size(), 0u);

    fake.on_spawn = [](const std::vector<std::string> &, const std::string &) -> std::optional<int> { return 1; };
    DesktopNotifier loud(fake, false);
    ASSERT(!loud.Send("SyncPilot: sync FAILED", "0 of 1 job(s) succeeded."));
    ASSERT_EQ(fake.processes[0].args[0], std::string("notify-send"));
    ASSERT_EQ(fake.processes[0].args[3], std::string("0 of 1 job(s) succeeded."));
}

// =============================================================================
// Control flow end to end
// =============================================================================

namespace {

std::string write_setup(TempDir &dir) {
    fs::path engine = dir.write("fake-rclone", "#!/bin/sh\nexit 0\n");
    fs::permissions(engine, fs::perms::owner_all);
    fs::path engine_conf = dir.write("rclone.conf", "[gdrive]\ntype = drive\n");
    fs::path volume = dir.mkdir("nas");
    fs::path photos = dir.mkdir("nas/photos");

    std::string text = "SourceVolume = " + volume.string() + "\n" +
                       "EnginePath = " + engine.string() + "\n" +
                       "EngineConfig = " + engine_conf.string() + "\n" +
                       "LogDir = " + (dir.path() / "logs").string() + "\n" +
                       "MaxVolumeWaitAttempts = 2\n" +
                       "Job = " + photos.string() + " | gdrive:Photos\n";
    return dir.write("SyncPilot.conf", text).string();
}

}  // namespace

TEST(control_flow_aborts_when_no_destination_reachable) {
    ConfigGlobal::InitializeDefaults();
    TempDir dir;
    ConfigGlobal::ConfigFile = write_setup(dir);

    FakeProcessLauncher fake;
    fake.on_spawn = [](const std::vector<std::string> &args, const std::string &) -> std::optional<int> {
        if (args[0] == "ping") return 0;
        if (args[1] == "lsd") return 1;
        return 0;
    };
    CountingNotifier notifier;
    ControlFlow flow(fake, notifier);
    flow.SetSleepFunction([](std::chrono::seconds) {});

    ASSERT_EQ(flow.Run(), 1);
    ASSERT_EQ(notifier.sent, 1);
    ASSERT_CONTAINS(notifier.last_body, "reachable");
    ASSERT_EQ(fake.count_with_arg("copy"), 0u);
}

TEST(control_flow_stop_before_launch) {
    ConfigGlobal::InitializeDefaults();
    TempDir dir;
    ConfigGlobal::ConfigFile = write_setup(dir);

    FakeProcessLauncher fake;
    fake.on_spawn = [](const std::vector<std::string> &, const std::string &) -> std::optional<int> { return 0; };
    CountingNotifier notifier;
    ControlFlow flow(fake, notifier);
    flow.SetSleepFunction([](std::chrono::seconds) {});
    flow.SetStopFunction([] { return true; });

    ASSERT_EQ(flow.Run(), 1);
    ASSERT_EQ(notifier.sent, 1);
    ASSERT_CONTAINS(notifier.last_body, "Stop requested");
    ASSERT_EQ(fake.count_with_arg("lsd"), 0u);
    ASSERT_EQ(fake.count_with_arg("copyto"), 0u);
    ASSERT_EQ(fake.count_with_arg("copy"), 0u);
    ASSERT_EQ(fake.kill_count, 0);
}

TEST(control_flow_stop_after_remote_check_skips_measurement) {
    ConfigGlobal::InitializeDefaults();
    TempDir dir;
    ConfigGlobal::ConfigFile = write_setup(dir);

    FakeProcessLauncher fake;
    fake.on_spawn = [](const std::vector<std::string> &, const std::string &) -> std::optional<int> { return 0; };
    CountingNotifier notifier;
    ControlFlow flow(fake, notifier);
    flow.SetSleepFunction([](std::chrono::seconds) {});
    flow.SetStopFunction([&fake] { return fake.count_with_arg("lsd") > 0; });

    ASSERT_EQ(flow.Run(), 1);
    ASSERT_EQ(notifier.sent, 1);
    ASSERT_EQ(fake.count_with_arg("lsd"), 1u);
    ASSERT_EQ(fake.count_with_arg("copyto"), 0u);
    ASSERT_EQ(fake.count_with_arg("copy"), 0u);
}

TEST(control_flow_aborts_on_bad_config) {
    ConfigGlobal::InitializeDefaults();
    TempDir dir;
    ConfigGlobal::ConfigFile = dir.write("SyncPilot.conf", "LogDir = " + (dir.path() / "logs").string() + "\n").string();

    FakeProcessLauncher fake;
    CountingNotifier notifier;
    ControlFlow flow(fake, notifier);

    ASSERT_EQ(flow.Run(), 1);
    ASSERT_EQ(notifier.sent, 1);
    ASSERT_EQ(fake.processes.size(), 0u);
}

TEST(control_flow_runs_to_success) {
    ConfigGlobal::InitializeDefaults();
    TempDir dir;
    ConfigGlobal::ConfigFile = write_setup(dir);

    FakeProcessLauncher fake;
    fake.on_spawn = [](const std::vector<std::string> &args, const std::string &out) -> std::optional<int> {
        if (args.size() > 1 && args[1] == "copyto") {
            std::ofstream log(out, std::ios::app);
            log << "Transferred: 1 MiB / 1 MiB, 100%, 1.250 MiB/s, ETA 0s\n";
        }
        return 0;
    };
    CountingNotifier notifier;
    ControlFlow flow(fake, notifier);
    flow.SetSleepFunction([](std::chrono::seconds) {});

    ASSERT_EQ(flow.Run(), 0);
    ASSERT_EQ(notifier.sent, 1);
    ASSERT_CONTAINS(notifier.last_title, "complete");
    ASSERT_EQ(fake.count_with_arg("copy"), 1u);
    ASSERT_EQ(fake.count_with_arg("deletefile"), 1u);
}

void RunSupervisorTests() {
    RUN_TEST(bucket_change_relaunches_fleet_once);
    RUN_TEST(same_bucket_never_relaunches);
    RUN_TEST(relaunch_keeps_finished_jobs_finished);
    RUN_TEST(relaunch_keeps_first_start_time);
    RUN_TEST(stalled_log_warns_without_kill);
    RUN_TEST(fresh_log_is_not_stalled);
    RUN_TEST(heartbeat_tracks_progress_and_lines);
    RUN_TEST(heartbeat_progress_ignores_file_count_line);
    RUN_TEST(missing_log_gives_unknown_heartbeat);
    RUN_TEST(failure_reported_once);
    RUN_TEST(mixed_results_report_failure);
    RUN_TEST(run_drains_when_all_exit);
    RUN_TEST(run_polls_until_exit);
    RUN_TEST(stop_request_kills_fleet);
    RUN_TEST(empty_run_is_a_failure);
    RUN_TEST(desktop_notifier_silent_and_failure);
    RUN_TEST(control_flow_aborts_when_no_destination_reachable);
    RUN_TEST(control_flow_stop_before_launch);
    RUN_TEST(control_flow_stop_after_remote_check_skips_measurement);
    RUN_TEST(control_flow_aborts_on_bad_config);
    RUN_TEST(control_flow_runs_to_success);
}
