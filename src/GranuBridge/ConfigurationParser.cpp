#include "ConfigurationParser.h"
#include "Configuration.h"
#include "OscTypes.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	namespace
	{
		using ValueSetter = std::function<void(Configuration &, const std::string &)>;

		const char *processEnvironment(const char *name)
		{
			return std::getenv(name);
		}

		int parsePort(const std::string &raw, int fallback)
		{
			return ConfigurationParser::parseBoundedInt(raw, fallback, 1, 65535);
		}

		// Flags that take a value
		const std::map<std::string, ValueSetter> &valueFlags()
		{
			static const std::map<std::string, ValueSetter> flags = {
				{"--host", [](Configuration &c, const std::string &v)
				 { c.gateway().host = v; }},
				{"--port", [](Configuration &c, const std::string &v)
				 { c.gateway().port = parsePort(v, c.gateway().port); }},
				{"--allowed-origin", [](Configuration &c, const std::string &v)
				 { c.gateway().allowedOrigin = v; }},
				{"--activity-interval", [](Configuration &c, const std::string &v)
				 { c.gateway().activityLogIntervalMs = ConfigurationParser::parseBoundedInt(v, c.gateway().activityLogIntervalMs, 0, 3600000); }},
				{"--osc-host", [](Configuration &c, const std::string &v)
				 { c.relay().targetHost = v; }},
				{"--osc-port", [](Configuration &c, const std::string &v)
				 { c.relay().targetPort = parsePort(v, c.relay().targetPort); }},
				{"--channel-prefix", [](Configuration &c, const std::string &v)
				 { c.setChannelPrefix(v); }},
				{"--channel-count", [](Configuration &c, const std::string &v)
				 { c.setChannelCount(ConfigurationParser::parseBoundedInt(v, c.relay().channelCount, 1, 64)); }},
				{"--max-rate", [](Configuration &c, const std::string &v)
				 { c.setMaxMessagesPerSecond(ConfigurationParser::parseBoundedInt(v, c.relay().maxMessagesPerSecond, 0, 1000)); }},
				{"--telemetry-host", [](Configuration &c, const std::string &v)
				 { c.telemetry().listenHost = v; }},
				{"--telemetry-port", [](Configuration &c, const std::string &v)
				 { c.telemetry().listenPort = parsePort(v, c.telemetry().listenPort); }},
				{"--hello-address", [](Configuration &c, const std::string &v)
				 { c.telemetry().helloAddress = v; }},
				{"--scan-address", [](Configuration &c, const std::string &v)
				 { c.telemetry().scanAddress = v; }},
				{"--engine-path", [](Configuration &c, const std::string &v)
				 { c.engine().binaryPath = v; }},
				{"--engine-data-dir", [](Configuration &c, const std::string &v)
				 { c.engine().dataDir = v; }},
				{"--engine-samples-dir", [](Configuration &c, const std::string &v)
				 { c.engine().samplesDir = v; }},
				{"--engine-lib-dir", [](Configuration &c, const std::string &v)
				 { c.engine().libDir = v; }},
				{"--log-limit", [](Configuration &c, const std::string &v)
				 { c.setLogLimit(ConfigurationParser::parseBoundedInt(v, static_cast<int>(c.engine().logLimit), 50, 2000)); }},
				{"--restart-attempts", [](Configuration &c, const std::string &v)
				 { c.setRestartMaxAttempts(ConfigurationParser::parseBoundedInt(v, c.watchdog().restartMaxAttempts, 1, 25)); }},
			};
			return flags;
		}

		// Flags without a value
		const std::map<std::string, std::function<void(Configuration &)>> &switchFlags()
		{
			static const std::map<std::string, std::function<void(Configuration &)>> flags = {
				{"--no-autostart", [](Configuration &c)
				 { c.engine().autoStart = false; }},
				{"--no-autostart-audio", [](Configuration &c)
				 { c.engine().autoStartAudio = false; }},
				{"--no-audio", [](Configuration &c)
				 { c.engine().noAudio = true; }},
				{"--no-watchdog", [](Configuration &c)
				 { c.watchdog().autoRestart = false; }},
			};
			return flags;
		}
	}

	int ConfigurationParser::parseBoundedInt(const std::string &raw, int fallback, int minValue, int maxValue)
	{
		const auto parsed = parseFiniteNumber(raw);
		if (!parsed)
		{
			return fallback;
		}

		const double truncated = std::trunc(*parsed);
		if (truncated <= minValue)
		{
			return minValue;
		}
		if (truncated >= maxValue)
		{
			return maxValue;
		}
		return static_cast<int>(truncated);
	}

	std::optional<bool> ConfigurationParser::parseBoolean(const std::string &raw)
	{
		std::string normalized = trim(raw);
		std::transform(normalized.begin(), normalized.end(), normalized.begin(),
					   [](unsigned char c)
					   { return static_cast<char>(std::tolower(c)); });

		if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on")
		{
			return true;
		}
		if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off")
		{
			return false;
		}
		return std::nullopt;
	}

	void ConfigurationParser::applyEnvironment(Configuration &config, const EnvironmentLookup &lookup)
	{
		const EnvironmentLookup getenvFn = lookup ? lookup : EnvironmentLookup(processEnvironment);

		auto text = [&getenvFn](const char *name) -> std::optional<std::string>
		{
			const char *value = getenvFn(name);
			if (!value)
			{
				return std::nullopt;
			}
			std::string trimmed = trim(value);
			if (trimmed.empty())
			{
				return std::nullopt;
			}
			return trimmed;
		};
		auto flag = [&text](const char *name, bool &target)
		{
			if (auto raw = text(name))
			{
				if (auto parsed = parseBoolean(*raw))
				{
					target = *parsed;
				}
			}
		};

		GatewayConfig &gateway = config.gateway();
		RelayConfig &relay = config.relay();
		TelemetryConfig &telemetry = config.telemetry();
		EngineConfig &engine = config.engine();
		WatchdogConfig &watchdog = config.watchdog();

		if (auto v = text("BRIDGE_HOST"))
			gateway.host = *v;
		if (auto v = text("BRIDGE_PORT"))
			gateway.port = parsePort(*v, gateway.port);
		if (auto v = text("ALLOWED_ORIGIN"))
			gateway.allowedOrigin = *v;
		if (auto v = text("OSC_ACTIVITY_LOG_INTERVAL_MS"))
			gateway.activityLogIntervalMs = parseBoundedInt(*v, gateway.activityLogIntervalMs, 0, 3600000);

		if (auto v = text("OSC_TARGET_HOST"))
			relay.targetHost = *v;
		if (auto v = text("OSC_TARGET_PORT"))
			relay.targetPort = parsePort(*v, relay.targetPort);
		if (auto v = text("OSC_CHANNEL_PREFIX"))
			config.setChannelPrefix(*v);
		if (auto v = text("CHANNEL_COUNT"))
			config.setChannelCount(parseBoundedInt(*v, relay.channelCount, 1, 64));
		if (auto v = text("MAX_MESSAGES_PER_SECOND"))
			config.setMaxMessagesPerSecond(parseBoundedInt(*v, relay.maxMessagesPerSecond, 0, 1000));

		if (auto v = text("TELEMETRY_LISTEN_HOST"))
			telemetry.listenHost = *v;
		if (auto v = text("TELEMETRY_LISTEN_PORT"))
			telemetry.listenPort = parsePort(*v, telemetry.listenPort);
		if (auto v = text("TELEMETRY_HELLO_ADDRESS"))
			telemetry.helloAddress = *v;
		if (auto v = text("TELEMETRY_SCAN_ADDRESS"))
			telemetry.scanAddress = *v;

		if (auto v = text("GRANUPOSE_ENGINE_PATH"))
			engine.binaryPath = *v;
		if (auto v = text("GRANUPOSE_ENGINE_DATA_DIR"))
			engine.dataDir = *v;
		if (auto v = text("GRANUPOSE_ENGINE_SAMPLES_DIR"))
			engine.samplesDir = *v;
		if (auto v = text("GRANUPOSE_ENGINE_LIB_DIR"))
			engine.libDir = *v;
		if (auto v = text("GRANUPOSE_ENGINE_OSC_HOST"))
			engine.oscHost = *v;
		if (auto v = text("GRANUPOSE_ENGINE_OSC_PORT"))
			engine.oscPort = parsePort(*v, engine.oscPort);
		if (auto v = text("GRANUPOSE_ENGINE_TELEMETRY_HOST"))
			engine.telemetryHost = *v;
		if (auto v = text("GRANUPOSE_ENGINE_TELEMETRY_PORT"))
			engine.telemetryPort = parsePort(*v, engine.telemetryPort);
		flag("GRANUPOSE_ENGINE_AUTOSTART", engine.autoStart);
		flag("GRANUPOSE_ENGINE_AUTOSTART_AUDIO", engine.autoStartAudio);
		flag("GRANUPOSE_ENGINE_NO_AUDIO", engine.noAudio);
		if (auto v = text("GRANUPOSE_ENGINE_LOG_LIMIT"))
			config.setLogLimit(parseBoundedInt(*v, static_cast<int>(engine.logLimit), 50, 2000));

		flag("GRANUPOSE_ENGINE_WATCHDOG_RESTART", watchdog.autoRestart);
		if (auto v = text("GRANUPOSE_ENGINE_RESTART_BASE_DELAY_MS"))
			config.setRestartBaseDelayMs(parseBoundedInt(*v, watchdog.restartBaseDelayMs, 250, 60000));
		if (auto v = text("GRANUPOSE_ENGINE_RESTART_MAX_DELAY_MS"))
			config.setRestartMaxDelayMs(parseBoundedInt(*v, watchdog.restartMaxDelayMs, 500, 300000));
		if (auto v = text("GRANUPOSE_ENGINE_RESTART_MAX_ATTEMPTS"))
			config.setRestartMaxAttempts(parseBoundedInt(*v, watchdog.restartMaxAttempts, 1, 25));
		if (auto v = text("GRANUPOSE_ENGINE_RESTART_BACKOFF_RESET_MS"))
			config.setRestartBackoffResetMs(parseBoundedInt(*v, watchdog.restartBackoffResetMs, 10000, 900000));
	}

	ConfigurationParser::CommandLineResult ConfigurationParser::parseCommandLine(int argc, char *argv[], Configuration &config)
	{
		CommandLineResult result;

		for (int i = 1; i < argc; i++)
		{
			const std::string arg = argv[i];

			if (arg == "--help" || arg == "-h")
			{
				result.showHelp = true;
				continue;
			}

			if (arg == "--config" || arg == "--save-config")
			{
				if (i + 1 >= argc)
				{
					result.ok = false;
					result.error = "Missing value for " + arg;
					return result;
				}
				(arg == "--config" ? result.configFile : result.saveConfigFile) = argv[++i];
				continue;
			}

			auto switchIt = switchFlags().find(arg);
			if (switchIt != switchFlags().end())
			{
				switchIt->second(config);
				continue;
			}

			auto valueIt = valueFlags().find(arg);
			if (valueIt == valueFlags().end())
			{
				result.ok = false;
				result.error = "Unknown option: " + arg;
				return result;
			}
			if (i + 1 >= argc)
			{
				result.ok = false;
				result.error = "Missing value for " + arg;
				return result;
			}
			valueIt->second(config, argv[++i]);
		}

		return result;
	}

	ConfigurationParser::CommandLineResult ConfigurationParser::load(int argc, char *argv[], Configuration &config,
																	 const EnvironmentLookup &lookup)
	{
		// The flags are parsed once into a scratch copy to find --config before
		// anything is applied, so the file never overrides the environment or flags
		Configuration scratch;
		CommandLineResult probe = parseCommandLine(argc, argv, scratch);
		if (!probe.ok || probe.showHelp)
		{
			return probe;
		}

		if (!probe.configFile.empty() && !parseJsonFile(probe.configFile, config))
		{
			probe.ok = false;
			probe.error = "Failed to load configuration file: " + probe.configFile;
			return probe;
		}

		applyEnvironment(config, lookup);
		return parseCommandLine(argc, argv, config);
	}

	bool ConfigurationParser::parseJsonFile(const std::string &filePath, Configuration &config)
	{
		return config.loadFromJson(filePath);
	}

	bool ConfigurationParser::parseJsonString(const std::string &jsonContent, Configuration &config)
	{
		nlohmann::json document;
		try
		{
			document = nlohmann::json::parse(jsonContent);
		}
		catch (const nlohmann::json::parse_error &e)
		{
			std::cerr << "ConfigurationParser: Failed to parse JSON: " << e.what() << std::endl;
			return false;
		}

		std::string error;
		if (!config.applyJson(document, error))
		{
			std::cerr << "ConfigurationParser: Invalid configuration: " << error << std::endl;
			return false;
		}
		return true;
	}

	std::string ConfigurationParser::usage(const std::string &programName)
	{
		std::ostringstream out;
		out << "Usage: " << programName << " [options]\n"
			<< "\n"
			<< "Options:\n"
			<< "  --config <file>              Load settings from a JSON file\n"
			<< "  --save-config <file>         Write the effective settings to a JSON file\n"
			<< "  --host <addr>                Gateway listen address (default 0.0.0.0)\n"
			<< "  --port <port>                Gateway listen port (default 8787)\n"
			<< "  --allowed-origin <origin>    CORS allowed origin (default *)\n"
			<< "  --activity-interval <ms>     Activity log interval, 0 disables (default 1000)\n"
			<< "  --osc-host <host>            Engine command host (default 127.0.0.1)\n"
			<< "  --osc-port <port>            Engine command port (default 16447)\n"
			<< "  --channel-prefix <path>      OSC channel prefix (default /pose/out)\n"
			<< "  --channel-count <n>          Number of channels (default 16)\n"
			<< "  --max-rate <n>               Messages per second per key, 0 disables (default 60)\n"
			<< "  --telemetry-host <addr>      Telemetry listen address (default 0.0.0.0)\n"
			<< "  --telemetry-port <port>      Telemetry listen port (default 16448)\n"
			<< "  --hello-address <path>       Telemetry hello address (default /ec2/hello)\n"
			<< "  --scan-address <path>        Telemetry scan address (default /ec2/telemetry/scan)\n"
			<< "  --engine-path <file>         Engine binary\n"
			<< "  --engine-data-dir <dir>      Engine data directory\n"
			<< "  --engine-samples-dir <dir>   Engine samples directory\n"
			<< "  --engine-lib-dir <dir>       Engine shared library directory\n"
			<< "  --log-limit <n>              Engine log buffer size, 50..2000 (default 400)\n"
			<< "  --restart-attempts <n>       Watchdog restart attempts, 1..25 (default 5)\n"
			<< "  --no-autostart               Do not start the engine at launch\n"
			<< "  --no-autostart-audio         Do not pass --autostart-audio to the engine\n"
			<< "  --no-audio                   Pass --no-audio to the engine\n"
			<< "  --no-watchdog                Disable automatic restarts\n"
			<< "  -h, --help                   Show this help\n";
		return out.str();
	}

} // namespace GranuBridge
