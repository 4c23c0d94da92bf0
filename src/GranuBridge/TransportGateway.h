#pragma once

#include "CommandRelay.h"
#include "Configuration.h"
#include "GatewayMessages.h"
#include "ProcessSupervisor.h"
#include "Scheduler.h"
#include "TelemetryListener.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief A connected push-channel client as seen by the gateway
	 *
	 * Implemented by the WebSocket session; tests use an in-memory client.
	 */
	class IGatewayClient
	{
	public:
		virtual ~IGatewayClient() = default;

		/**
		 * @brief Whether a frame can be queued now (open and outbound queue not full)
		 */
		virtual bool isWritable() const = 0;

		/**
		 * @brief Queue one text frame
		 */
		virtual void sendText(const std::string &text) = 0;
	};

	/**
	 * @brief HTTP status and JSON body produced for one request
	 *
	 * A 204 response carries no body.
	 */
	struct HttpResponse
	{
		unsigned status = 200;
		nlohmann::json body;
	};

	/**
	 * @brief Gateway-level counters
	 */
	struct GatewayStats
	{
		std::uint64_t telemetryBroadcast = 0;
		std::uint64_t rejectedValidation = 0;
		std::uint64_t invalidJson = 0;
		std::uint64_t httpRequests = 0;
		std::uint64_t clientMessages = 0;
	};

	/**
	 * @brief Protocol logic behind the HTTP and WebSocket endpoints
	 *
	 * Independent of the network layer: GatewayServer feeds it parsed requests
	 * and text frames, and it answers with JSON. Requests are validated here
	 * before anything reaches the relay or the supervisor.
	 */
	class TransportGateway
	{
	public:
		using ResponseCallback = std::function<void(const HttpResponse &)>;

		/**
		 * @brief Constructor
		 *
		 * @param config Listener address, allowed origin and activity interval
		 * @param relay Outbound command path
		 * @param listener Telemetry source for the scan broadcast
		 * @param scheduler Clock and timer for uptime and the activity log
		 * @param supervisor Engine supervisor, or nullptr when the engine is managed elsewhere
		 */
		TransportGateway(const GatewayConfig &config, CommandRelay &relay, TelemetryListener &listener,
						 IScheduler &scheduler, ProcessSupervisor *supervisor = nullptr);
		~TransportGateway();

		TransportGateway(const TransportGateway &) = delete;
		TransportGateway &operator=(const TransportGateway &) = delete;

		/**
		 * @brief Subscribe to telemetry scans and start the activity log
		 */
		void start();

		/**
		 * @brief Unsubscribe and stop the activity log; connected clients are forgotten
		 */
		void stop();

		/**
		 * @brief Register a client and send it bridge:hello
		 *
		 * @return int Client ID for removeClient()
		 */
		int addClient(const std::shared_ptr<IGatewayClient> &client);
		void removeClient(int clientId);
		size_t clientCount() const { return m_clients.size(); }

		/**
		 * @brief Handle one text frame from a client and reply to that client
		 *
		 * @param client Sender
		 * @param text Frame payload
		 */
		void handleClientMessage(IGatewayClient &client, const std::string &text);

		/**
		 * @brief Handle one HTTP request
		 *
		 * Engine stop and restart answer once the process has exited; every
		 * other route answers before returning.
		 *
		 * @param method Request method (GET, POST, OPTIONS)
		 * @param target Path with optional query string
		 * @param body Request body
		 * @param respond Receives the response exactly once
		 */
		void handleHttp(const std::string &method, const std::string &target, const std::string &body,
						ResponseCallback respond);

		/**
		 * @brief Push a scan to every writable client as telemetry:scan
		 *
		 * @return size_t Number of clients the frame was queued for
		 */
		size_t broadcastScan(const TelemetryScanSample &sample);

		nlohmann::json healthPayload() const;
		nlohmann::json configPayload() const;
		nlohmann::json helloPayload() const;

		/**
		 * @brief Build the periodic activity line from counter deltas
		 *
		 * Advances the stored counter baseline.
		 *
		 * @return std::string Empty when nothing happened since the last call
		 */
		std::string takeActivityReport();

		/**
		 * @brief Label for the activity interval: "Ns" for whole seconds, otherwise "Nms"
		 */
		static std::string intervalLabel(int intervalMs);

		GatewayStats stats() const { return m_stats; }
		const GatewayConfig &config() const { return m_config; }

	private:
		struct ActivityBaseline
		{
			std::uint64_t sent = 0;
			std::uint64_t telemetryReceived = 0;
			std::uint64_t rateLimited = 0;
			std::uint64_t errors = 0;
		};

		void sendToClient(IGatewayClient &client, const nlohmann::json &message);
		HttpResponse rejectValidation(const ValidationIssues &issues);
		bool parseBody(const std::string &body, nlohmann::json &document);
		void handleEngineRoute(const std::string &method, const std::string &path, const std::string &query,
							   ResponseCallback respond);
		void scheduleActivityLog();
		ActivityBaseline currentActivity() const;

		GatewayConfig m_config;
		CommandRelay &m_relay;
		TelemetryListener &m_listener;
		IScheduler &m_scheduler;
		ProcessSupervisor *m_supervisor;

		std::map<int, std::weak_ptr<IGatewayClient>> m_clients;
		int m_nextClientId;

		std::int64_t m_startedAtMs;
		GatewayStats m_stats;
		ActivityBaseline m_activityBaseline;
		std::optional<IScheduler::TimerId> m_activityTimer;
		std::optional<int> m_scanSubscription;
	};

} // namespace GranuBridge
