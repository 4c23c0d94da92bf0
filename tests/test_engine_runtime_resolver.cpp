#include <iostream>
#include <cassert>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>
#include "GranuBridge/EngineRuntimeResolver.h"

using namespace GranuBridge;
namespace fs = std::filesystem;

namespace
{
    // Scratch directory removed when the test finishes
    struct TempRoot
    {
        TempRoot()
        {
            path = fs::temp_directory_path() / ("granubridge_resolver_" + std::to_string(::getpid()));
            fs::remove_all(path);
            fs::create_directories(path);
        }

        ~TempRoot()
        {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        fs::path touch(const fs::path &relative) const
        {
            const fs::path file = path / relative;
            fs::create_directories(file.parent_path());
            std::ofstream(file.string()) << "#!/bin/sh\n";
            return file;
        }

        fs::path path;
    };

    bool hasArg(const std::vector<std::string> &args, const std::string &flag, const std::string &value)
    {
        const auto it = std::find(args.begin(), args.end(), flag);
        return it != args.end() && it + 1 != args.end() && *(it + 1) == value;
    }
}

void test_missing_binary()
{
    std::cout << "Testing missing binary..." << std::endl;

    TempRoot root;
    EngineConfig config;
    EngineRuntimeResolver resolver(config, {root.path.string()});

    EngineLaunchSpec spec;
    std::string error;
    assert(!resolver.resolve(spec, error));
    assert(error.find("ec2_headless binary not found") == 0);
    assert(error.find((root.path / "engine-bin" / "linux" / "ec2_headless").string()) != std::string::npos);

    std::cout << "Missing binary tests passed." << std::endl;
}

void test_search_roots()
{
    std::cout << "Testing search roots..." << std::endl;

    TempRoot root;
    const fs::path binary = root.touch(fs::path("engine-bin") / EngineRuntimeResolver::platformDirectory() / "ec2_headless");
    fs::create_directories(root.path / "engine-resources" / "samples");
    fs::create_directories(root.path / "engine-resources" / "libs");

    EngineConfig config;
    config.dataDir = (root.path / "data").string();
    config.oscPort = 17000;
    config.telemetryPort = 17001;
    config.autoStartAudio = true;
    config.noAudio = true;
    EngineRuntimeResolver resolver(config, {root.path.string()});

    EngineLaunchSpec spec;
    std::string error;
    assert(resolver.resolve(spec, error));
    assert(spec.binaryPath == binary.string());
    assert(spec.workingDirectory == binary.parent_path().string());
    assert(fs::is_directory(config.dataDir));
    assert(spec.samplesDir == (root.path / "engine-resources" / "samples").string());
    assert(spec.libDir == (root.path / "engine-resources" / "libs").string());

    const std::string libVariable = EngineRuntimeResolver::libraryPathVariable();
    assert(spec.environment.count(libVariable) == 1);
    assert(spec.environment[libVariable].find(spec.libDir) == 0);

    assert(hasArg(spec.args, "--osc-port", "17000"));
    assert(hasArg(spec.args, "--telemetry-port", "17001"));
    assert(hasArg(spec.args, "--osc-host", "127.0.0.1"));
    assert(hasArg(spec.args, "--data-dir", spec.dataDir));
    assert(hasArg(spec.args, "--samples-dir", spec.samplesDir));
    assert(std::find(spec.args.begin(), spec.args.end(), "--autostart-audio") != spec.args.end());
    assert(std::find(spec.args.begin(), spec.args.end(), "--no-audio") != spec.args.end());

    std::cout << "Search root tests passed." << std::endl;
}

void test_configured_paths()
{
    std::cout << "Testing configured paths..." << std::endl;

    TempRoot root;
    root.touch(fs::path("engine-bin") / "ec2_headless");
    const fs::path custom = root.touch(fs::path("custom") / "ec2_headless");

    EngineConfig config;
    config.binaryPath = custom.string();
    config.dataDir = (root.path / "data").string();
    config.autoStartAudio = false;
    EngineRuntimeResolver resolver(config, {root.path.string()});

    assert(resolver.binaryCandidates().front() == custom.string());

    EngineLaunchSpec spec;
    std::string error;
    assert(resolver.resolve(spec, error));
    assert(spec.binaryPath == custom.string());
    assert(spec.samplesDir.empty());
    assert(spec.libDir.empty());
    assert(spec.environment.empty());
    assert(std::find(spec.args.begin(), spec.args.end(), "--samples-dir") == spec.args.end());
    assert(std::find(spec.args.begin(), spec.args.end(), "--autostart-audio") == spec.args.end());

    // A configured path that does not exist falls through to the search roots
    config.binaryPath = (root.path / "missing" / "ec2_headless").string();
    EngineRuntimeResolver fallback(config, {root.path.string()});
    assert(fallback.resolve(spec, error));
    assert(spec.binaryPath == (root.path / "engine-bin" / "ec2_headless").string());

    std::cout << "Configured path tests passed." << std::endl;
}

void test_default_search_roots()
{
    std::cout << "Testing default search roots..." << std::endl;

    const std::vector<std::string> roots = EngineRuntimeResolver::defaultSearchRoots("/opt/granubridge/bin/granubridge");
    assert(std::find(roots.begin(), roots.end(), "/opt/granubridge/bin") != roots.end());
    assert(std::find(roots.begin(), roots.end(), "/opt/granubridge") != roots.end());
    assert(roots.front() == fs::current_path().string());

    std::cout << "Default search root tests passed." << std::endl;
}

int main()
{
    std::cout << "Running EngineRuntimeResolver tests..." << std::endl;

    try
    {
        test_missing_binary();
        test_search_roots();
        test_configured_paths();
        test_default_search_roots();

        std::cout << "All tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
