#include <iostream>
#include <cassert>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "GranuBridge/ProcessSupervisor.h"

using namespace GranuBridge;

namespace
{
    // Child process stand-in; the test decides when it exits
    class FakeProcess : public IEngineProcess
    {
    public:
        FakeProcess(int pid, ProcessCallbacks callbacks)
            : processId(pid), callbacks(std::move(callbacks))
        {
        }

        int pid() const override { return processId; }

        bool awaitSpawn(std::string &error) override
        {
            if (failSpawn)
            {
                error = "exec failed: No such file or directory";
                return false;
            }
            return true;
        }

        bool signal(int signal) override
        {
            signals.push_back(signal);
            return !failSignal;
        }

        bool hasExited() const override { return exited; }

        void exit(std::optional<int> code, std::optional<int> signal = std::nullopt)
        {
            exited = true;
            callbacks.onExit(ExitInfo{code, signal});
        }

        int processId;
        ProcessCallbacks callbacks;
        std::vector<int> signals;
        bool failSpawn = false;
        bool failSignal = false;
        bool exited = false;
    };

    class FakeLauncher : public IProcessLauncher
    {
    public:
        std::shared_ptr<IEngineProcess> spawn(const EngineLaunchSpec &spec, ProcessCallbacks callbacks,
                                              std::string &error) override
        {
            ++spawnCount;
            lastSpec = spec;
            if (failLaunch)
            {
                error = "fork failed";
                return nullptr;
            }
            auto process = std::make_shared<FakeProcess>(100 + spawnCount, std::move(callbacks));
            process->failSpawn = failNextSpawn;
            process->failSignal = failSignal;
            failNextSpawn = false;
            processes.push_back(process);
            return process;
        }

        FakeProcess &current() { return *processes.back(); }

        int spawnCount = 0;
        bool failLaunch = false;
        bool failNextSpawn = false;
        bool failSignal = false;
        EngineLaunchSpec lastSpec;
        std::vector<std::shared_ptr<FakeProcess>> processes;
    };

    class FakeResolver : public IEngineRuntimeResolver
    {
    public:
        bool resolve(EngineLaunchSpec &spec, std::string &error) override
        {
            if (!found)
            {
                error = "Engine binary not found. Searched: /opt/ec2/bin/ec2_headless";
                return false;
            }
            spec.binaryPath = "/opt/ec2/bin/ec2_headless";
            spec.args = {"--osc-port", "16447", "--telemetry-port", "16448"};
            spec.dataDir = "/opt/ec2/data";
            return true;
        }

        bool found = true;
    };

    WatchdogConfig makeWatchdog(int maxAttempts = 5, int resetMs = 120000)
    {
        WatchdogConfig config;
        config.autoRestart = true;
        config.restartBaseDelayMs = 1000;
        config.restartMaxDelayMs = 30000;
        config.restartMaxAttempts = maxAttempts;
        config.restartBackoffResetMs = resetMs;
        return config;
    }

    EngineConfig makeEngine()
    {
        EngineConfig config;
        config.stopGraceMs = 5000;
        return config;
    }

    bool logsContain(const ProcessSupervisor &supervisor, const std::string &needle)
    {
        for (const auto &entry : supervisor.logs(LogBuffer::kMaxLimit))
        {
            if (entry.line.find(needle) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    struct Fixture
    {
        explicit Fixture(const WatchdogConfig &watchdog = makeWatchdog())
            : logBuffer(400), supervisor(scheduler, launcher, resolver, logBuffer, makeEngine(), watchdog)
        {
        }

        ManualScheduler scheduler;
        FakeLauncher launcher;
        FakeResolver resolver;
        LogBuffer logBuffer;
        ProcessSupervisor supervisor;
    };
}

void test_restart_delay()
{
    std::cout << "Testing restart delay..." << std::endl;

    assert(ProcessSupervisor::restartDelayMs(1, 1000, 30000) == 1000);
    assert(ProcessSupervisor::restartDelayMs(2, 1000, 30000) == 2000);
    assert(ProcessSupervisor::restartDelayMs(3, 1000, 30000) == 4000);
    assert(ProcessSupervisor::restartDelayMs(5, 1000, 30000) == 16000);
    assert(ProcessSupervisor::restartDelayMs(6, 1000, 30000) == 30000);
    assert(ProcessSupervisor::restartDelayMs(40, 1000, 30000) == 30000);
    assert(ProcessSupervisor::restartDelayMs(0, 250, 30000) == 250);

    std::cout << "Restart delay tests passed." << std::endl;
}

void test_start()
{
    std::cout << "Testing engine start..." << std::endl;

    Fixture fixture;
    std::vector<EngineStatus> transitions;
    fixture.supervisor.addStatusListener([&transitions](const EngineStatusReport &report)
                                         { transitions.push_back(report.status); });

    EngineStatusReport report = fixture.supervisor.start();
    assert(report.ok);
    assert(report.status == EngineStatus::Running);
    assert(report.pid && *report.pid == 101);
    assert(report.startedAtMs);
    assert(report.binaryPath == "/opt/ec2/bin/ec2_headless");
    assert(transitions.size() == 2);
    assert(transitions[0] == EngineStatus::Starting);
    assert(transitions[1] == EngineStatus::Running);
    assert(logsContain(fixture.supervisor, "Engine started (pid=101)"));
    assert(logsContain(fixture.supervisor, "trigger=manual"));

    // Already running: no second child
    report = fixture.supervisor.start();
    assert(report.ok);
    assert(fixture.launcher.spawnCount == 1);

    // Child output lands in the log buffer
    fixture.launcher.current().callbacks.onLine(LogChannel::Stdout, "engine ready");
    assert(logsContain(fixture.supervisor, "engine ready"));

    nlohmann::json json = fixture.supervisor.status();
    assert(json["status"] == "running");
    assert(json["pid"] == 101);

    std::cout << "Engine start tests passed." << std::endl;
}

void test_start_failures()
{
    std::cout << "Testing start failures..." << std::endl;

    {
        Fixture fixture;
        fixture.resolver.found = false;
        const EngineStatusReport report = fixture.supervisor.start();
        assert(!report.ok);
        assert(report.status == EngineStatus::Error);
        assert(report.lastError.find("not found") != std::string::npos);
        assert(fixture.launcher.spawnCount == 0);
        assert(!report.pid);
    }

    {
        Fixture fixture;
        fixture.launcher.failLaunch = true;
        const EngineStatusReport report = fixture.supervisor.start();
        assert(!report.ok);
        assert(report.status == EngineStatus::Error);
        assert(report.lastError == "fork failed");
        // A spawn failure is not an unexpected exit
        assert(!fixture.supervisor.hasPendingRestart());
    }

    {
        Fixture fixture;
        fixture.launcher.failNextSpawn = true;
        const EngineStatusReport report = fixture.supervisor.start();
        assert(!report.ok);
        assert(report.status == EngineStatus::Error);
        assert(!report.pid);
        assert(!fixture.supervisor.hasPendingRestart());
        assert(logsContain(fixture.supervisor, "Failed to spawn engine"));

        // A later start succeeds
        assert(fixture.supervisor.start().ok);
        assert(fixture.supervisor.status().status == EngineStatus::Running);
    }

    std::cout << "Start failure tests passed." << std::endl;
}

void test_watchdog_backoff()
{
    std::cout << "Testing watchdog backoff..." << std::endl;

    Fixture fixture;
    fixture.supervisor.start();

    fixture.launcher.current().exit(1);
    EngineStatusReport report = fixture.supervisor.status();
    assert(report.status == EngineStatus::Error);
    assert(!report.pid);
    assert(report.restartAttempts == 1);
    assert(report.lastError.find("exited unexpectedly") != std::string::npos);
    assert(fixture.supervisor.hasPendingRestart());
    assert(fixture.scheduler.nextDelayMs() == 1000);

    fixture.scheduler.advance(999);
    assert(fixture.launcher.spawnCount == 1);
    fixture.scheduler.advance(1);
    assert(fixture.launcher.spawnCount == 2);
    report = fixture.supervisor.status();
    assert(report.status == EngineStatus::Running);
    assert(report.restartAttempts == 1);
    assert(logsContain(fixture.supervisor, "trigger=watchdog"));

    fixture.launcher.current().exit(std::nullopt, SIGSEGV);
    assert(fixture.supervisor.status().restartAttempts == 2);
    assert(fixture.scheduler.nextDelayMs() == 2000);
    assert(logsContain(fixture.supervisor, "SIGSEGV"));
    fixture.scheduler.advance(2000);
    assert(fixture.launcher.spawnCount == 3);

    // A manual start resets the counter
    fixture.supervisor.stop("test", nullptr);
    fixture.launcher.current().exit(0);
    fixture.supervisor.start();
    assert(fixture.supervisor.status().restartAttempts == 0);

    std::cout << "Watchdog backoff tests passed." << std::endl;
}

void test_watchdog_exhaustion()
{
    std::cout << "Testing watchdog exhaustion..." << std::endl;

    Fixture fixture(makeWatchdog(2));
    fixture.supervisor.start();

    fixture.launcher.current().exit(1);
    fixture.scheduler.advance(1000);
    fixture.launcher.current().exit(1);
    fixture.scheduler.advance(2000);
    assert(fixture.launcher.spawnCount == 3);

    fixture.launcher.current().exit(1);
    const EngineStatusReport report = fixture.supervisor.status();
    assert(report.status == EngineStatus::Error);
    assert(report.restartAttempts == 2);
    assert(!report.autoRestartEnabled);
    assert(!fixture.supervisor.hasPendingRestart());
    assert(logsContain(fixture.supervisor, "watchdog exhausted (2 attempts)"));

    fixture.scheduler.advance(60000);
    assert(fixture.launcher.spawnCount == 3);

    std::cout << "Watchdog exhaustion tests passed." << std::endl;
}

void test_watchdog_reset_window()
{
    std::cout << "Testing watchdog reset window..." << std::endl;

    Fixture fixture(makeWatchdog(5, 5000));
    fixture.supervisor.start();

    fixture.launcher.current().exit(1);
    fixture.scheduler.advance(1000);
    assert(fixture.supervisor.status().restartAttempts == 1);

    // Stable for longer than the reset window
    fixture.scheduler.advance(6000);
    fixture.launcher.current().exit(1);
    assert(fixture.supervisor.status().restartAttempts == 1);
    assert(fixture.scheduler.nextDelayMs() == 1000);

    std::cout << "Watchdog reset window tests passed." << std::endl;
}

void test_watchdog_disabled()
{
    std::cout << "Testing disabled watchdog..." << std::endl;

    WatchdogConfig watchdog = makeWatchdog();
    watchdog.autoRestart = false;
    Fixture fixture(watchdog);
    fixture.supervisor.start();
    fixture.launcher.current().exit(3);

    assert(fixture.supervisor.status().status == EngineStatus::Error);
    assert(!fixture.supervisor.hasPendingRestart());
    assert(logsContain(fixture.supervisor, "watchdog disabled"));

    std::cout << "Disabled watchdog tests passed." << std::endl;
}

void test_stop()
{
    std::cout << "Testing engine stop..." << std::endl;

    Fixture fixture;
    fixture.supervisor.start();

    std::vector<EngineStatusReport> outcomes;
    const auto record = [&outcomes](const EngineStatusReport &report)
    { outcomes.push_back(report); };

    fixture.supervisor.stop("api_stop", record);
    fixture.supervisor.stop("api_stop", record);

    FakeProcess &process = fixture.launcher.current();
    assert(process.signals.size() == 1);
    assert(process.signals[0] == SIGTERM);
    EngineStatusReport report = fixture.supervisor.status();
    assert(report.status == EngineStatus::Stopping);
    assert(report.pid && *report.pid == 101);
    assert(outcomes.empty());

    // Starting while the child is still exiting is refused
    report = fixture.supervisor.start();
    assert(!report.ok);
    assert(report.lastError == "engine_stopping");

    process.exit(0);
    assert(outcomes.size() == 2);
    assert(outcomes[0].ok && outcomes[1].ok);
    assert(outcomes[0].status == EngineStatus::Stopped);
    assert(!outcomes[0].pid);
    assert(outcomes[0].stoppedAtMs);
    assert(!fixture.supervisor.hasPendingRestart());
    assert(!fixture.supervisor.status().autoRestartEnabled);

    // Stopping when nothing runs answers immediately
    outcomes.clear();
    fixture.supervisor.stop("api_stop", record);
    assert(outcomes.size() == 1);
    assert(outcomes[0].ok);
    assert(outcomes[0].status == EngineStatus::Stopped);

    std::cout << "Engine stop tests passed." << std::endl;
}

void test_force_kill()
{
    std::cout << "Testing forced kill..." << std::endl;

    Fixture fixture;
    fixture.supervisor.start();
    fixture.supervisor.stop("api_stop", nullptr);

    FakeProcess &process = fixture.launcher.current();
    fixture.scheduler.advance(4999);
    assert(process.signals.size() == 1);
    fixture.scheduler.advance(1);
    assert(process.signals.size() == 2);
    assert(process.signals[1] == SIGKILL);
    assert(logsContain(fixture.supervisor, "forcing SIGKILL"));

    process.exit(std::nullopt, SIGKILL);
    assert(fixture.supervisor.status().status == EngineStatus::Stopped);

    // Exit within the grace period cancels the kill
    fixture.supervisor.start();
    fixture.supervisor.stop("api_stop", nullptr);
    fixture.launcher.current().exit(0);
    assert(fixture.scheduler.pendingCount() == 0);

    std::cout << "Forced kill tests passed." << std::endl;
}

void test_failed_signal()
{
    std::cout << "Testing signal failure..." << std::endl;

    Fixture fixture;
    fixture.launcher.failSignal = true;
    fixture.supervisor.start();

    std::optional<EngineStatusReport> outcome;
    fixture.supervisor.stop("api_stop", [&outcome](const EngineStatusReport &report)
                            { outcome = report; });
    assert(outcome);
    assert(!outcome->ok);
    assert(outcome->lastError == "failed_to_signal_engine_process");
    assert(outcome->status == EngineStatus::Error);
    assert(!outcome->pid);

    std::cout << "Signal failure tests passed." << std::endl;
}

void test_restart()
{
    std::cout << "Testing engine restart..." << std::endl;

    Fixture fixture;
    fixture.supervisor.start();
    auto first = fixture.launcher.processes.back();

    std::optional<EngineStatusReport> outcome;
    fixture.supervisor.restart([&outcome](const EngineStatusReport &report)
                               { outcome = report; });
    assert(!outcome);
    assert(first->signals.size() == 1);

    first->exit(0);
    assert(outcome);
    assert(outcome->ok);
    assert(outcome->status == EngineStatus::Running);
    assert(outcome->pid && *outcome->pid == 102);
    assert(fixture.launcher.spawnCount == 2);
    assert(outcome->autoRestartEnabled);
    assert(logsContain(fixture.supervisor, "trigger=restart"));

    // A late exit report from the old child changes nothing
    first->callbacks.onExit(ExitInfo{1, std::nullopt});
    assert(fixture.supervisor.status().status == EngineStatus::Running);
    assert(!fixture.supervisor.hasPendingRestart());

    // Restart from stopped just starts
    fixture.supervisor.stop("api_stop", nullptr);
    fixture.launcher.current().exit(0);
    outcome.reset();
    fixture.supervisor.restart([&outcome](const EngineStatusReport &report)
                               { outcome = report; });
    assert(outcome && outcome->ok);
    assert(fixture.launcher.spawnCount == 3);

    std::cout << "Engine restart tests passed." << std::endl;
}

void test_shutdown()
{
    std::cout << "Testing shutdown..." << std::endl;

    Fixture fixture;
    fixture.supervisor.start();
    fixture.launcher.current().exit(1);
    assert(fixture.supervisor.hasPendingRestart());

    bool done = false;
    fixture.supervisor.shutdown([&done](const EngineStatusReport &report)
                                {
                                    done = true;
                                    assert(report.status == EngineStatus::Stopped); });
    assert(done);
    assert(fixture.supervisor.isShuttingDown());
    assert(!fixture.supervisor.hasPendingRestart());

    const EngineStatusReport report = fixture.supervisor.start();
    assert(!report.ok);
    assert(report.lastError == "shutting_down");

    fixture.scheduler.advance(60000);
    assert(fixture.launcher.spawnCount == 1);

    std::cout << "Shutdown tests passed." << std::endl;
}

void test_pid_invariant()
{
    std::cout << "Testing pid invariant..." << std::endl;

    Fixture fixture;
    fixture.supervisor.addStatusListener([](const EngineStatusReport &report)
                                         {
                                             const bool live = report.status == EngineStatus::Starting ||
                                                               report.status == EngineStatus::Running ||
                                                               report.status == EngineStatus::Stopping;
                                             assert(live == report.pid.has_value()); });

    fixture.supervisor.start();
    fixture.launcher.current().exit(1);
    fixture.scheduler.advance(1000);
    fixture.supervisor.stop("api_stop", nullptr);
    fixture.launcher.current().exit(0);

    std::cout << "Pid invariant tests passed." << std::endl;
}

int main()
{
    std::cout << "Running ProcessSupervisor tests..." << std::endl;

    try
    {
        test_restart_delay();
        test_start();
        test_start_failures();
        test_watchdog_backoff();
        test_watchdog_exhaustion();
        test_watchdog_reset_window();
        test_watchdog_disabled();
        test_stop();
        test_force_kill();
        test_failed_signal();
        test_restart();
        test_shutdown();
        test_pid_invariant();

        std::cout << "All tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
