#pragma once

#include "Configuration.h"
#include "OscTransport.h"
#include "OscTypes.h"
#include "RateLimiter.h"
#include "Scheduler.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief Result of relaying a single command
	 *
	 * sent and rateLimited are exclusive. error is set for validation,
	 * readiness and socket failures. Channel sends also echo the resolved
	 * address, channel and value.
	 */
	struct SendResult
	{
		bool sent = false;
		bool rateLimited = false;
		std::string error;
		std::string address;
		std::optional<int> channel;
		std::optional<double> value;
	};

	/**
	 * @brief Aggregate result of a batch
	 *
	 * droppedCount counts rate-limited items only; items that failed for other
	 * reasons are visible in results.
	 */
	struct BatchResult
	{
		size_t total = 0;
		size_t sentCount = 0;
		size_t droppedCount = 0;
		std::vector<SendResult> results;
	};

	/**
	 * @brief Snapshot of relay counters
	 */
	struct RelayStats
	{
		std::uint64_t sent = 0;
		std::uint64_t droppedRateLimited = 0;
		std::uint64_t rejectedValidation = 0;
		std::uint64_t transportErrors = 0;
	};

	void to_json(nlohmann::json &j, const SendResult &result);
	void to_json(nlohmann::json &j, const BatchResult &result);
	void to_json(nlohmann::json &j, const RelayStats &stats);

	/**
	 * @brief One channel update in a channel batch
	 */
	struct ChannelUpdate
	{
		int channel = 1;
		double value = 0.0;
	};

	/**
	 * @brief Validated, rate-limited outbound OSC towards the engine
	 *
	 * Every request goes through validation, then the readiness check, then
	 * the per-key rate limiter, and only then to the transport.
	 */
	class CommandRelay
	{
	public:
		/**
		 * @brief Constructor
		 *
		 * @param config Target, channel and rate settings
		 * @param transport Outbound datagram channel (not owned)
		 * @param scheduler Clock used for rate limiting (not owned)
		 */
		CommandRelay(const RelayConfig &config, IOscTransport &transport, IScheduler &scheduler);

		/**
		 * @brief Open the transport towards the configured target
		 *
		 * @return true if the transport is ready
		 */
		bool open();

		/**
		 * @brief Close the transport
		 */
		void close();

		/**
		 * @brief Re-target the transport and re-open it
		 *
		 * @param host New target host
		 * @param port New target port
		 * @return true if the transport is ready
		 */
		bool configure(const std::string &host, int port);

		bool isReady() const { return m_transport.isReady(); }

		/**
		 * @brief Relay one command
		 *
		 * @param request Address, typed arguments and optional rate-limit key
		 * @return SendResult Outcome
		 */
		SendResult send(const CommandRequest &request);

		/**
		 * @brief Relay a channel value to <prefix>/<NN>
		 *
		 * The channel is clamped to [1, channelCount] and the value to [0,1].
		 *
		 * @param channel 1-based channel number
		 * @param value Normalised value
		 * @return SendResult Outcome with address, channel and value echoed
		 */
		SendResult sendChannel(int channel, double value);

		BatchResult sendBatch(const std::vector<CommandRequest> &requests);
		BatchResult sendChannelBatch(const std::vector<ChannelUpdate> &updates);

		/**
		 * @brief OSC address for a (clamped) channel
		 */
		std::string channelAddress(int channel) const;

		/**
		 * @brief Clamp a channel number into [1, channelCount]
		 */
		int clampChannel(int channel) const;

		/**
		 * @brief Check a request without sending it
		 *
		 * @param request Request to check
		 * @param args Receives the normalised arguments on success
		 * @return std::string Empty when valid, otherwise invalid_address or invalid_arg
		 */
		static std::string validate(const CommandRequest &request, std::vector<NormalizedArgument> &args);

		RelayStats stats() const { return m_stats; }
		const RelayConfig &config() const { return m_config; }
		const std::string &lastError() const { return m_lastError; }

	private:
		SendResult dispatch(const std::string &address, const std::vector<NormalizedArgument> &args,
							const std::string &rateLimitKey);

		RelayConfig m_config;
		IOscTransport &m_transport;
		IScheduler &m_scheduler;
		RateLimiter m_rateLimiter;
		RelayStats m_stats;
		std::string m_lastError;
	};

} // namespace GranuBridge
