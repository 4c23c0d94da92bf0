#include "Configuration.h"

#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace GranuBridge
{
	namespace
	{
		int clampInt(int value, int minValue, int maxValue)
		{
			return std::max(minValue, std::min(maxValue, value));
		}

		// Reads an optional key into target; a present key with the wrong type throws
		template <typename T>
		void readKey(const json &section, const char *key, T &target)
		{
			if (section.contains(key) && !section[key].is_null())
			{
				target = section[key].get<T>();
			}
		}
	}

	std::string Configuration::normalizePrefix(const std::string &prefix)
	{
		std::string normalized = prefix;
		while (!normalized.empty() && normalized.back() == '/')
		{
			normalized.pop_back();
		}
		return normalized.empty() ? std::string("/pose/out") : normalized;
	}

	void Configuration::setChannelPrefix(const std::string &prefix)
	{
		m_relay.channelPrefix = normalizePrefix(prefix);
	}

	void Configuration::setChannelCount(int count)
	{
		m_relay.channelCount = clampInt(count, 1, 64);
	}

	void Configuration::setMaxMessagesPerSecond(int rate)
	{
		m_relay.maxMessagesPerSecond = clampInt(rate, 0, 1000);
	}

	void Configuration::setRestartBaseDelayMs(int delayMs)
	{
		m_watchdog.restartBaseDelayMs = clampInt(delayMs, 250, 60000);
	}

	void Configuration::setRestartMaxDelayMs(int delayMs)
	{
		m_watchdog.restartMaxDelayMs = clampInt(delayMs, 500, 300000);
	}

	void Configuration::setRestartMaxAttempts(int attempts)
	{
		m_watchdog.restartMaxAttempts = clampInt(attempts, 1, 25);
	}

	void Configuration::setRestartBackoffResetMs(int windowMs)
	{
		m_watchdog.restartBackoffResetMs = clampInt(windowMs, 10000, 900000);
	}

	void Configuration::setLogLimit(int limit)
	{
		m_engine.logLimit = static_cast<size_t>(clampInt(limit, 50, 2000));
	}

	bool Configuration::applyJson(const json &config, std::string &error)
	{
		if (!config.is_object())
		{
			error = "configuration root must be an object";
			return false;
		}

		try
		{
			if (config.contains("gateway"))
			{
				const auto &gateway = config["gateway"];
				readKey(gateway, "host", m_gateway.host);
				readKey(gateway, "allowedOrigin", m_gateway.allowedOrigin);
				if (gateway.contains("port"))
					m_gateway.port = clampInt(gateway["port"].get<int>(), 1, 65535);
				if (gateway.contains("activityLogIntervalMs"))
					m_gateway.activityLogIntervalMs = std::max(0, gateway["activityLogIntervalMs"].get<int>());
				if (gateway.contains("maxClientQueue"))
					m_gateway.maxClientQueue = static_cast<size_t>(clampInt(gateway["maxClientQueue"].get<int>(), 1, 65536));
				if (gateway.contains("httpTimeoutMs"))
					m_gateway.httpTimeoutMs = clampInt(gateway["httpTimeoutMs"].get<int>(), 100, 600000);
			}

			if (config.contains("relay"))
			{
				const auto &relay = config["relay"];
				readKey(relay, "targetHost", m_relay.targetHost);
				if (relay.contains("targetPort"))
					m_relay.targetPort = clampInt(relay["targetPort"].get<int>(), 1, 65535);
				if (relay.contains("channelPrefix"))
					setChannelPrefix(relay["channelPrefix"].get<std::string>());
				if (relay.contains("channelCount"))
					setChannelCount(relay["channelCount"].get<int>());
				if (relay.contains("maxMessagesPerSecond"))
					setMaxMessagesPerSecond(relay["maxMessagesPerSecond"].get<int>());
			}

			if (config.contains("telemetry"))
			{
				const auto &telemetry = config["telemetry"];
				readKey(telemetry, "listenHost", m_telemetry.listenHost);
				readKey(telemetry, "helloAddress", m_telemetry.helloAddress);
				readKey(telemetry, "scanAddress", m_telemetry.scanAddress);
				if (telemetry.contains("listenPort"))
					m_telemetry.listenPort = clampInt(telemetry["listenPort"].get<int>(), 1, 65535);
			}

			if (config.contains("engine"))
			{
				const auto &engine = config["engine"];
				readKey(engine, "binaryPath", m_engine.binaryPath);
				readKey(engine, "dataDir", m_engine.dataDir);
				readKey(engine, "samplesDir", m_engine.samplesDir);
				readKey(engine, "libDir", m_engine.libDir);
				readKey(engine, "oscHost", m_engine.oscHost);
				readKey(engine, "telemetryHost", m_engine.telemetryHost);
				readKey(engine, "autoStart", m_engine.autoStart);
				readKey(engine, "autoStartAudio", m_engine.autoStartAudio);
				readKey(engine, "noAudio", m_engine.noAudio);
				if (engine.contains("oscPort"))
					m_engine.oscPort = clampInt(engine["oscPort"].get<int>(), 1, 65535);
				if (engine.contains("telemetryPort"))
					m_engine.telemetryPort = clampInt(engine["telemetryPort"].get<int>(), 1, 65535);
				if (engine.contains("logLimit"))
					setLogLimit(engine["logLimit"].get<int>());
				if (engine.contains("stopGraceMs"))
					m_engine.stopGraceMs = clampInt(engine["stopGraceMs"].get<int>(), 100, 60000);
			}

			if (config.contains("watchdog"))
			{
				const auto &watchdog = config["watchdog"];
				readKey(watchdog, "autoRestart", m_watchdog.autoRestart);
				if (watchdog.contains("restartBaseDelayMs"))
					setRestartBaseDelayMs(watchdog["restartBaseDelayMs"].get<int>());
				if (watchdog.contains("restartMaxDelayMs"))
					setRestartMaxDelayMs(watchdog["restartMaxDelayMs"].get<int>());
				if (watchdog.contains("restartMaxAttempts"))
					setRestartMaxAttempts(watchdog["restartMaxAttempts"].get<int>());
				if (watchdog.contains("restartBackoffResetMs"))
					setRestartBackoffResetMs(watchdog["restartBackoffResetMs"].get<int>());
			}
		}
		catch (const json::exception &e)
		{
			error = e.what();
			return false;
		}

		return true;
	}

	bool Configuration::loadFromJson(const std::string &filepath)
	{
		std::ifstream file(filepath);
		if (!file.is_open())
		{
			std::cerr << "Configuration: Failed to open configuration file: " << filepath << std::endl;
			return false;
		}

		json config;
		try
		{
			file >> config;
		}
		catch (const json::parse_error &e)
		{
			std::cerr << "Configuration: Failed to parse " << filepath << ": " << e.what() << std::endl;
			return false;
		}

		std::string error;
		if (!applyJson(config, error))
		{
			std::cerr << "Configuration: Invalid value in " << filepath << ": " << error << std::endl;
			return false;
		}

		std::cout << "Configuration loaded from " << filepath << std::endl;
		return true;
	}

	json Configuration::toJson() const
	{
		json config;
		config["gateway"] = {
			{"host", m_gateway.host},
			{"port", m_gateway.port},
			{"allowedOrigin", m_gateway.allowedOrigin},
			{"activityLogIntervalMs", m_gateway.activityLogIntervalMs},
			{"maxClientQueue", m_gateway.maxClientQueue},
			{"httpTimeoutMs", m_gateway.httpTimeoutMs}};
		config["relay"] = {
			{"targetHost", m_relay.targetHost},
			{"targetPort", m_relay.targetPort},
			{"channelPrefix", m_relay.channelPrefix},
			{"channelCount", m_relay.channelCount},
			{"maxMessagesPerSecond", m_relay.maxMessagesPerSecond}};
		config["telemetry"] = {
			{"listenHost", m_telemetry.listenHost},
			{"listenPort", m_telemetry.listenPort},
			{"helloAddress", m_telemetry.helloAddress},
			{"scanAddress", m_telemetry.scanAddress}};
		config["engine"] = {
			{"binaryPath", m_engine.binaryPath},
			{"dataDir", m_engine.dataDir},
			{"samplesDir", m_engine.samplesDir},
			{"libDir", m_engine.libDir},
			{"oscHost", m_engine.oscHost},
			{"oscPort", m_engine.oscPort},
			{"telemetryHost", m_engine.telemetryHost},
			{"telemetryPort", m_engine.telemetryPort},
			{"autoStart", m_engine.autoStart},
			{"autoStartAudio", m_engine.autoStartAudio},
			{"noAudio", m_engine.noAudio},
			{"logLimit", m_engine.logLimit},
			{"stopGraceMs", m_engine.stopGraceMs}};
		config["watchdog"] = {
			{"autoRestart", m_watchdog.autoRestart},
			{"restartBaseDelayMs", m_watchdog.restartBaseDelayMs},
			{"restartMaxDelayMs", m_watchdog.restartMaxDelayMs},
			{"restartMaxAttempts", m_watchdog.restartMaxAttempts},
			{"restartBackoffResetMs", m_watchdog.restartBackoffResetMs}};
		return config;
	}

	bool Configuration::saveToJson(const std::string &filepath) const
	{
		std::ofstream file(filepath);
		if (!file.is_open())
		{
			std::cerr << "Configuration: Failed to open file for writing: " << filepath << std::endl;
			return false;
		}

		file << toJson().dump(4);
		if (!file.good())
		{
			std::cerr << "Configuration: Failed to write " << filepath << std::endl;
			return false;
		}

		std::cout << "Configuration saved to " << filepath << std::endl;
		return true;
	}

} // namespace GranuBridge
