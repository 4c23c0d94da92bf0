#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief Client-facing HTTP/WebSocket listener settings
	 */
	struct GatewayConfig
	{
		std::string host = "0.0.0.0";
		int port = 8787;
		std::string allowedOrigin = "*";
		int activityLogIntervalMs = 1000; // 0 disables the activity log
		size_t maxClientQueue = 256;	  // Pending outbound frames before a client is skipped
		int httpTimeoutMs = 30000;		  // Per read and per write on HTTP connections
	};

	/**
	 * @brief Outbound command settings
	 */
	struct RelayConfig
	{
		std::string targetHost = "127.0.0.1";
		int targetPort = 16447;
		std::string channelPrefix = "/pose/out";
		int channelCount = 16;
		int maxMessagesPerSecond = 60;
	};

	/**
	 * @brief Inbound telemetry settings
	 */
	struct TelemetryConfig
	{
		std::string listenHost = "0.0.0.0";
		int listenPort = 16448;
		std::string helloAddress = "/ec2/hello";
		std::string scanAddress = "/ec2/telemetry/scan";
		size_t scanBufferLimit = 12000;
	};

	/**
	 * @brief Crash-recovery watchdog settings
	 */
	struct WatchdogConfig
	{
		bool autoRestart = true;
		int restartBaseDelayMs = 1000;
		int restartMaxDelayMs = 30000;
		int restartMaxAttempts = 5;
		int restartBackoffResetMs = 120000;
	};

	/**
	 * @brief Engine subprocess settings
	 *
	 * Empty paths are resolved from candidate locations at start time.
	 */
	struct EngineConfig
	{
		std::string binaryPath;
		std::string dataDir;
		std::string samplesDir;
		std::string libDir;
		std::string oscHost = "127.0.0.1";
		int oscPort = 16447;
		std::string telemetryHost = "127.0.0.1";
		int telemetryPort = 16448;
		bool autoStart = true;
		bool autoStartAudio = true;
		bool noAudio = false;
		size_t logLimit = 400;
		int stopGraceMs = 5000;
	};

	/**
	 * @brief Complete service configuration
	 */
	class Configuration
	{
	public:
		Configuration() = default;

		const GatewayConfig &getGatewayConfig() const { return m_gateway; }
		const RelayConfig &getRelayConfig() const { return m_relay; }
		const TelemetryConfig &getTelemetryConfig() const { return m_telemetry; }
		const EngineConfig &getEngineConfig() const { return m_engine; }
		const WatchdogConfig &getWatchdogConfig() const { return m_watchdog; }

		GatewayConfig &gateway() { return m_gateway; }
		RelayConfig &relay() { return m_relay; }
		TelemetryConfig &telemetry() { return m_telemetry; }
		EngineConfig &engine() { return m_engine; }
		WatchdogConfig &watchdog() { return m_watchdog; }

		void setChannelPrefix(const std::string &prefix);
		void setChannelCount(int count);
		void setMaxMessagesPerSecond(int rate);
		void setRestartBaseDelayMs(int delayMs);
		void setRestartMaxDelayMs(int delayMs);
		void setRestartMaxAttempts(int attempts);
		void setRestartBackoffResetMs(int windowMs);
		void setLogLimit(int limit);

		/**
		 * @brief Apply a JSON document on top of the current values
		 *
		 * Unknown keys are ignored. Out-of-range numbers are clamped.
		 *
		 * @param config JSON object with optional gateway, relay, telemetry,
		 *               engine and watchdog sections
		 * @param error Receives a message when a value has the wrong type
		 * @return true if the document was applied
		 */
		bool applyJson(const nlohmann::json &config, std::string &error);

		/**
		 * @brief Load configuration from a JSON file
		 *
		 * @param filepath Path to the JSON file
		 * @return true if loading was successful
		 */
		bool loadFromJson(const std::string &filepath);

		/**
		 * @brief Save the effective configuration to a JSON file
		 *
		 * @param filepath Path to the JSON file
		 * @return true if saving was successful
		 */
		bool saveToJson(const std::string &filepath) const;

		/**
		 * @brief Effective configuration as JSON
		 */
		nlohmann::json toJson() const;

		/**
		 * @brief Strip trailing slashes from an OSC prefix; falls back to /pose/out
		 */
		static std::string normalizePrefix(const std::string &prefix);

	private:
		GatewayConfig m_gateway;
		RelayConfig m_relay;
		TelemetryConfig m_telemetry;
		EngineConfig m_engine;
		WatchdogConfig m_watchdog;
	};

} // namespace GranuBridge
