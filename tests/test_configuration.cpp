#include <iostream>
#include <cassert>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include "GranuBridge/Configuration.h"
#include "GranuBridge/ConfigurationParser.h"

using namespace GranuBridge;

namespace
{
    // argv storage for parseCommandLine()/load()
    class Args
    {
    public:
        Args(std::initializer_list<std::string> args) : m_storage(args)
        {
            m_storage.insert(m_storage.begin(), "granubridge");
            for (auto &arg : m_storage)
            {
                m_pointers.push_back(&arg[0]);
            }
            m_pointers.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(m_storage.size()); }
        char **argv() { return m_pointers.data(); }

    private:
        std::vector<std::string> m_storage;
        std::vector<char *> m_pointers;
    };

    ConfigurationParser::EnvironmentLookup fakeEnvironment(const std::map<std::string, std::string> &values)
    {
        return [values](const char *name) -> const char *
        {
            auto it = values.find(name);
            return it == values.end() ? nullptr : it->second.c_str();
        };
    }
}

void test_defaults()
{
    std::cout << "Testing configuration defaults..." << std::endl;

    Configuration config;
    assert(config.getGatewayConfig().host == "0.0.0.0");
    assert(config.getGatewayConfig().port == 8787);
    assert(config.getGatewayConfig().allowedOrigin == "*");
    assert(config.getGatewayConfig().httpTimeoutMs == 30000);
    assert(config.getRelayConfig().targetPort == 16447);
    assert(config.getRelayConfig().channelPrefix == "/pose/out");
    assert(config.getRelayConfig().channelCount == 16);
    assert(config.getRelayConfig().maxMessagesPerSecond == 60);
    assert(config.getTelemetryConfig().listenPort == 16448);
    assert(config.getTelemetryConfig().scanAddress == "/ec2/telemetry/scan");
    assert(config.getWatchdogConfig().restartMaxAttempts == 5);
    assert(config.getEngineConfig().logLimit == 400);

    assert(Configuration::normalizePrefix("/a/b///") == "/a/b");
    assert(Configuration::normalizePrefix("///") == "/pose/out");
    assert(Configuration::normalizePrefix("") == "/pose/out");

    std::cout << "Configuration default tests passed." << std::endl;
}

void test_bounded_setters()
{
    std::cout << "Testing bounded setters..." << std::endl;

    Configuration config;
    config.setChannelCount(500);
    assert(config.getRelayConfig().channelCount == 64);
    config.setChannelCount(0);
    assert(config.getRelayConfig().channelCount == 1);
    config.setRestartBaseDelayMs(10);
    assert(config.getWatchdogConfig().restartBaseDelayMs == 250);
    config.setRestartMaxDelayMs(10000000);
    assert(config.getWatchdogConfig().restartMaxDelayMs == 300000);
    config.setRestartMaxAttempts(100);
    assert(config.getWatchdogConfig().restartMaxAttempts == 25);
    config.setRestartBackoffResetMs(1);
    assert(config.getWatchdogConfig().restartBackoffResetMs == 10000);
    config.setLogLimit(10);
    assert(config.getEngineConfig().logLimit == 50);

    assert(ConfigurationParser::parseBoundedInt("12.9", 5, 1, 25) == 12);
    assert(ConfigurationParser::parseBoundedInt("abc", 5, 1, 25) == 5);
    assert(ConfigurationParser::parseBoundedInt("", 5, 1, 25) == 5);
    assert(ConfigurationParser::parseBoundedInt("-3", 5, 1, 25) == 1);
    assert(ConfigurationParser::parseBoundedInt("99", 5, 1, 25) == 25);

    assert(*ConfigurationParser::parseBoolean(" YES ") == true);
    assert(*ConfigurationParser::parseBoolean("off") == false);
    assert(!ConfigurationParser::parseBoolean("maybe"));

    std::cout << "Bounded setter tests passed." << std::endl;
}

void test_json()
{
    std::cout << "Testing JSON configuration..." << std::endl;

    Configuration config;
    assert(ConfigurationParser::parseJsonString(R"({
        "gateway": {"port": 9999, "allowedOrigin": "http://localhost:5173", "httpTimeoutMs": 50},
        "relay": {"channelPrefix": "/ctl/", "channelCount": 8, "maxMessagesPerSecond": 5000},
        "telemetry": {"scanAddress": "/scan"},
        "engine": {"binaryPath": "/opt/ec2_headless", "autoStart": false, "logLimit": 100000},
        "watchdog": {"restartMaxAttempts": 3, "autoRestart": false},
        "unknown": {"ignored": true}
    })", config));

    assert(config.getGatewayConfig().port == 9999);
    assert(config.getGatewayConfig().allowedOrigin == "http://localhost:5173");
    assert(config.getGatewayConfig().httpTimeoutMs == 100);
    assert(config.getRelayConfig().channelPrefix == "/ctl");
    assert(config.getRelayConfig().channelCount == 8);
    assert(config.getRelayConfig().maxMessagesPerSecond == 1000);
    assert(config.getTelemetryConfig().scanAddress == "/scan");
    assert(config.getEngineConfig().binaryPath == "/opt/ec2_headless");
    assert(!config.getEngineConfig().autoStart);
    assert(config.getEngineConfig().logLimit == 2000);
    assert(config.getWatchdogConfig().restartMaxAttempts == 3);
    assert(!config.getWatchdogConfig().autoRestart);

    // Wrong types and malformed documents are rejected
    assert(!ConfigurationParser::parseJsonString(R"({"gateway": {"port": "eighty"}})", config));
    assert(!ConfigurationParser::parseJsonString("{not json", config));
    assert(!ConfigurationParser::parseJsonString("[1, 2]", config));

    // Save and reload round trip through a file
    const std::string path = "test_configuration_roundtrip.json";
    assert(config.saveToJson(path));
    Configuration reloaded;
    assert(reloaded.loadFromJson(path));
    assert(reloaded.toJson() == config.toJson());
    std::remove(path.c_str());

    assert(!reloaded.loadFromJson("does/not/exist.json"));

    std::cout << "JSON configuration tests passed." << std::endl;
}

void test_environment()
{
    std::cout << "Testing environment configuration..." << std::endl;

    Configuration config;
    ConfigurationParser::applyEnvironment(config, fakeEnvironment({
                                                      {"BRIDGE_PORT", "8000"},
                                                      {"OSC_TARGET_HOST", "192.168.1.20"},
                                                      {"OSC_CHANNEL_PREFIX", "/x//"},
                                                      {"CHANNEL_COUNT", "not-a-number"},
                                                      {"MAX_MESSAGES_PER_SECOND", "30"},
                                                      {"TELEMETRY_LISTEN_PORT", "70000"},
                                                      {"GRANUPOSE_ENGINE_AUTOSTART", "false"},
                                                      {"GRANUPOSE_ENGINE_NO_AUDIO", "garbage"},
                                                      {"GRANUPOSE_ENGINE_RESTART_MAX_ATTEMPTS", "0"},
                                                      {"GRANUPOSE_ENGINE_PATH", "   "},
                                                  }));

    assert(config.getGatewayConfig().port == 8000);
    assert(config.getRelayConfig().targetHost == "192.168.1.20");
    assert(config.getRelayConfig().channelPrefix == "/x");
    assert(config.getRelayConfig().channelCount == 16);
    assert(config.getRelayConfig().maxMessagesPerSecond == 30);
    assert(config.getTelemetryConfig().listenPort == 65535);
    assert(!config.getEngineConfig().autoStart);
    assert(!config.getEngineConfig().noAudio);
    assert(config.getWatchdogConfig().restartMaxAttempts == 1);
    assert(config.getEngineConfig().binaryPath.empty());

    std::cout << "Environment configuration tests passed." << std::endl;
}

void test_command_line()
{
    std::cout << "Testing command line..." << std::endl;

    Configuration config;
    Args args{"--port", "9100", "--osc-port", "17000", "--channel-count", "4", "--no-watchdog", "--no-audio"};
    auto result = ConfigurationParser::parseCommandLine(args.argc(), args.argv(), config);
    assert(result.ok);
    assert(!result.showHelp);
    assert(config.getGatewayConfig().port == 9100);
    assert(config.getRelayConfig().targetPort == 17000);
    assert(config.getRelayConfig().channelCount == 4);
    assert(!config.getWatchdogConfig().autoRestart);
    assert(config.getEngineConfig().noAudio);

    Args unknown{"--bogus"};
    result = ConfigurationParser::parseCommandLine(unknown.argc(), unknown.argv(), config);
    assert(!result.ok);
    assert(result.error == "Unknown option: --bogus");

    Args missing{"--port"};
    result = ConfigurationParser::parseCommandLine(missing.argc(), missing.argv(), config);
    assert(!result.ok);

    Args help{"-h"};
    result = ConfigurationParser::parseCommandLine(help.argc(), help.argv(), config);
    assert(result.showHelp);
    assert(ConfigurationParser::usage("granubridge").find("--engine-path") != std::string::npos);

    std::cout << "Command line tests passed." << std::endl;
}

void test_precedence()
{
    std::cout << "Testing configuration precedence..." << std::endl;

    const std::string path = "test_configuration_precedence.json";
    {
        std::ofstream file(path);
        file << R"({"gateway": {"port": 1111, "host": "10.0.0.1"}, "relay": {"channelCount": 2, "targetPort": 2222}})";
    }

    // File < environment < flags
    Configuration config;
    Args args{"--config", path, "--port", "3333"};
    auto result = ConfigurationParser::load(args.argc(), args.argv(), config,
                                            fakeEnvironment({{"BRIDGE_PORT", "4444"}, {"CHANNEL_COUNT", "6"}}));
    assert(result.ok);
    assert(result.configFile == path);
    assert(config.getGatewayConfig().port == 3333);
    assert(config.getGatewayConfig().host == "10.0.0.1");
    assert(config.getRelayConfig().channelCount == 6);
    assert(config.getRelayConfig().targetPort == 2222);
    std::remove(path.c_str());

    Configuration missing;
    Args badFile{"--config", "no/such/file.json"};
    result = ConfigurationParser::load(badFile.argc(), badFile.argv(), missing, fakeEnvironment({}));
    assert(!result.ok);

    std::cout << "Configuration precedence tests passed." << std::endl;
}

int main()
{
    std::cout << "Running Configuration tests..." << std::endl;

    try
    {
        test_defaults();
        test_bounded_setters();
        test_json();
        test_environment();
        test_command_line();
        test_precedence();

        std::cout << "All tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
