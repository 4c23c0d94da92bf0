#include <iostream>
#include <cassert>
#include <chrono>
#include <csignal>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include "GranuBridge/PosixProcessLauncher.h"

using namespace GranuBridge;

namespace
{
    struct Capture
    {
        std::vector<std::string> stdoutLines;
        std::vector<std::string> stderrLines;
        std::optional<ExitInfo> exit;
        int exitCount = 0;

        ProcessCallbacks callbacks()
        {
            ProcessCallbacks result;
            result.onLine = [this](LogChannel channel, const std::string &line)
            {
                if (channel == LogChannel::Stderr)
                {
                    stderrLines.push_back(line);
                }
                else
                {
                    stdoutLines.push_back(line);
                }
            };
            result.onExit = [this](const ExitInfo &info)
            {
                exit = info;
                ++exitCount;
            };
            return result;
        }
    };

    EngineLaunchSpec shellSpec(const std::string &script)
    {
        EngineLaunchSpec spec;
        spec.binaryPath = "/bin/sh";
        spec.args = {"-c", script};
        return spec;
    }

    // Drive the event loop until the condition holds or the timeout passes
    bool runUntil(boost::asio::io_context &ioContext, const std::function<bool()> &condition,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!condition())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            ioContext.run_one_for(std::chrono::milliseconds(50));
        }
        return true;
    }
}

void test_output_and_exit()
{
    std::cout << "Testing output capture and exit..." << std::endl;

    boost::asio::io_context ioContext;
    PosixProcessLauncher launcher(ioContext);
    Capture capture;

    std::string error;
    auto process = launcher.spawn(shellSpec("echo hello; echo oops 1>&2; printf partial; exit 3"),
                                  capture.callbacks(), error);
    assert(process);
    assert(process->pid() > 0);
    assert(process->awaitSpawn(error));

    const bool done = runUntil(ioContext, [&capture]()
                               { return capture.exit && capture.stdoutLines.size() == 2 && capture.stderrLines.size() == 1; });
    assert(done);
    assert(capture.stdoutLines[0] == "hello");
    assert(capture.stdoutLines[1] == "partial");
    assert(capture.stderrLines[0] == "oops");
    assert(capture.exit->code && *capture.exit->code == 3);
    assert(!capture.exit->signal);
    assert(capture.exitCount == 1);
    assert(process->hasExited());
    assert(!process->signal(SIGTERM));

    std::cout << "Output capture and exit tests passed." << std::endl;
}

void test_environment_and_working_directory()
{
    std::cout << "Testing environment and working directory..." << std::endl;

    boost::asio::io_context ioContext;
    PosixProcessLauncher launcher(ioContext);
    Capture capture;

    EngineLaunchSpec spec = shellSpec("echo \"$GRANUBRIDGE_TEST_VALUE\"; pwd");
    spec.environment["GRANUBRIDGE_TEST_VALUE"] = "granular";
    spec.workingDirectory = "/";

    std::string error;
    auto process = launcher.spawn(spec, capture.callbacks(), error);
    assert(process);
    assert(process->awaitSpawn(error));

    assert(runUntil(ioContext, [&capture]()
                    { return capture.exit && capture.stdoutLines.size() == 2; }));
    assert(capture.stdoutLines[0] == "granular");
    assert(capture.stdoutLines[1] == "/");
    assert(*capture.exit->code == 0);

    std::cout << "Environment and working directory tests passed." << std::endl;
}

void test_exec_failure()
{
    std::cout << "Testing exec failure..." << std::endl;

    boost::asio::io_context ioContext;
    PosixProcessLauncher launcher(ioContext);
    Capture capture;

    EngineLaunchSpec spec;
    spec.binaryPath = "/nonexistent/granubridge/ec2_headless";

    std::string error;
    auto process = launcher.spawn(spec, capture.callbacks(), error);
    assert(process);
    assert(!process->awaitSpawn(error));
    assert(error.find("exec failed") != std::string::npos);
    assert(process->hasExited());

    // A failed spawn is never reported as an exit
    ioContext.run_for(std::chrono::milliseconds(200));
    assert(capture.exitCount == 0);

    EngineLaunchSpec empty;
    error.clear();
    assert(!launcher.spawn(empty, capture.callbacks(), error));
    assert(error == "engine_binary_not_found");

    std::cout << "Exec failure tests passed." << std::endl;
}

void test_signal()
{
    std::cout << "Testing signal delivery..." << std::endl;

    boost::asio::io_context ioContext;
    PosixProcessLauncher launcher(ioContext);
    Capture capture;

    std::string error;
    auto process = launcher.spawn(shellSpec("exec sleep 30"), capture.callbacks(), error);
    assert(process);
    assert(process->awaitSpawn(error));
    assert(!process->hasExited());
    assert(launcher.liveChildren() == 1);

    assert(process->signal(SIGTERM));
    assert(runUntil(ioContext, [&capture]()
                    { return capture.exit.has_value(); }));
    assert(capture.exit->signal && *capture.exit->signal == SIGTERM);
    assert(!capture.exit->code);
    assert(launcher.liveChildren() == 0);

    std::cout << "Signal delivery tests passed." << std::endl;
}

int main()
{
    std::cout << "Running PosixProcessLauncher tests..." << std::endl;

    try
    {
        test_output_and_exit();
        test_environment_and_working_directory();
        test_exec_failure();
        test_signal();

        std::cout << "All tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
