#include "TransportGateway.h"
#include "ConfigurationParser.h"

#include <iostream>
#include <sstream>

namespace GranuBridge
{
	namespace
	{
		const char *const kNotReadyError = "transport_not_ready";

		constexpr int kDefaultCaptureWindowMs = 1500;
		constexpr int kMinCaptureWindowMs = 100;
		constexpr int kMaxCaptureWindowMs = 60000;
		constexpr int kDefaultCaptureMinCount = 6;
		constexpr int kDefaultHelloTimeoutMs = 3000;

		/**
		 * @brief Split "path?query" into its parts
		 */
		void splitTarget(const std::string &target, std::string &path, std::string &query)
		{
			const auto mark = target.find('?');
			path = target.substr(0, mark);
			query = mark == std::string::npos ? std::string() : target.substr(mark + 1);
			if (path.size() > 1 && path.back() == '/')
			{
				path.pop_back();
			}
		}

		/**
		 * @brief Value of a key in an application/x-www-form-urlencoded query
		 */
		std::string queryParameter(const std::string &query, const std::string &key)
		{
			std::istringstream stream(query);
			std::string pair;
			while (std::getline(stream, pair, '&'))
			{
				const auto eq = pair.find('=');
				if (pair.substr(0, eq) == key)
				{
					return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
				}
			}
			return std::string();
		}

		HttpResponse jsonResponse(unsigned status, nlohmann::json body)
		{
			HttpResponse response;
			response.status = status;
			response.body = std::move(body);
			return response;
		}

		HttpResponse errorResponse(unsigned status, const std::string &error)
		{
			return jsonResponse(status, nlohmann::json{{"error", error}});
		}
	}

	TransportGateway::TransportGateway(const GatewayConfig &config, CommandRelay &relay, TelemetryListener &listener,
									   IScheduler &scheduler, ProcessSupervisor *supervisor)
		: m_config(config), m_relay(relay), m_listener(listener), m_scheduler(scheduler), m_supervisor(supervisor),
		  m_nextClientId(1), m_startedAtMs(scheduler.nowMs())
	{
	}

	TransportGateway::~TransportGateway()
	{
		stop();
	}

	void TransportGateway::start()
	{
		if (!m_scanSubscription)
		{
			m_scanSubscription = m_listener.addScanListener([this](const TelemetryScanSample &sample)
															{ broadcastScan(sample); });
		}

		m_activityBaseline = currentActivity();
		if (m_config.activityLogIntervalMs > 0 && !m_activityTimer)
		{
			scheduleActivityLog();
		}
	}

	void TransportGateway::stop()
	{
		if (m_scanSubscription)
		{
			m_listener.removeScanListener(*m_scanSubscription);
			m_scanSubscription.reset();
		}
		if (m_activityTimer)
		{
			m_scheduler.cancel(*m_activityTimer);
			m_activityTimer.reset();
		}
		m_clients.clear();
	}

	int TransportGateway::addClient(const std::shared_ptr<IGatewayClient> &client)
	{
		const int id = m_nextClientId++;
		m_clients[id] = client;
		sendToClient(*client, GatewayMessages::envelope("bridge:hello", helloPayload()));
		return id;
	}

	void TransportGateway::removeClient(int clientId)
	{
		m_clients.erase(clientId);
	}

	void TransportGateway::sendToClient(IGatewayClient &client, const nlohmann::json &message)
	{
		if (!client.isWritable())
		{
			return;
		}
		client.sendText(message.dump());
	}

	size_t TransportGateway::broadcastScan(const TelemetryScanSample &sample)
	{
		const std::string frame = GatewayMessages::envelope("telemetry:scan", sample).dump();

		size_t delivered = 0;
		for (auto it = m_clients.begin(); it != m_clients.end();)
		{
			std::shared_ptr<IGatewayClient> client = it->second.lock();
			if (!client)
			{
				it = m_clients.erase(it);
				continue;
			}
			// Slow or closing clients miss this scan
			if (client->isWritable())
			{
				client->sendText(frame);
				++delivered;
			}
			++it;
		}

		m_stats.telemetryBroadcast += delivered;
		return delivered;
	}

	void TransportGateway::handleClientMessage(IGatewayClient &client, const std::string &text)
	{
		++m_stats.clientMessages;

		nlohmann::json document = nlohmann::json::parse(text, nullptr, false);
		if (document.is_discarded())
		{
			++m_stats.invalidJson;
			sendToClient(client, GatewayMessages::envelope("bridge:error", nlohmann::json{{"error", "invalid_json"}}));
			return;
		}

		ClientMessage message;
		ValidationIssues issues;
		if (!GatewayMessages::parseClientMessage(document, message, issues))
		{
			++m_stats.rejectedValidation;
			sendToClient(client, GatewayMessages::envelope("bridge:error", GatewayMessages::validationFailure(issues)));
			return;
		}

		switch (message.type)
		{
		case ClientMessageType::Ping:
			sendToClient(client, GatewayMessages::envelope("pong", nlohmann::json{{"nowMs", m_scheduler.wallClockMs()}}));
			break;
		case ClientMessageType::ChannelSet:
			sendToClient(client, GatewayMessages::envelope(
									 "bridge:ack", m_relay.sendChannel(message.channel.channel, message.channel.value)));
			break;
		case ClientMessageType::ChannelsSet:
			sendToClient(client, GatewayMessages::envelope(
									 "bridge:ack", GatewayMessages::batchSummary(m_relay.sendChannelBatch(message.channels))));
			break;
		case ClientMessageType::OscSend:
			sendToClient(client, GatewayMessages::envelope("bridge:ack", m_relay.send(message.request)));
			break;
		case ClientMessageType::OscBatch:
			sendToClient(client, GatewayMessages::envelope(
									 "bridge:ack", GatewayMessages::batchSummary(m_relay.sendBatch(message.requests))));
			break;
		}
	}

	HttpResponse TransportGateway::rejectValidation(const ValidationIssues &issues)
	{
		++m_stats.rejectedValidation;
		return jsonResponse(400, GatewayMessages::validationFailure(issues));
	}

	bool TransportGateway::parseBody(const std::string &body, nlohmann::json &document)
	{
		if (body.find_first_not_of(" \t\r\n") == std::string::npos)
		{
			document = nlohmann::json::object();
			return true;
		}

		document = nlohmann::json::parse(body, nullptr, false);
		if (document.is_discarded())
		{
			++m_stats.invalidJson;
			return false;
		}
		return true;
	}

	void TransportGateway::handleHttp(const std::string &method, const std::string &target, const std::string &body,
									  ResponseCallback respond)
	{
		++m_stats.httpRequests;

		std::string path;
		std::string query;
		splitTarget(target, path, query);

		if (method == "OPTIONS")
		{
			respond(jsonResponse(204, nullptr));
			return;
		}

		if (path.rfind("/engine/", 0) == 0 || path.rfind("/telemetry/", 0) == 0)
		{
			handleEngineRoute(method, path, query, std::move(respond));
			return;
		}

		if (method == "GET")
		{
			if (path == "/health")
			{
				respond(jsonResponse(200, healthPayload()));
			}
			else if (path == "/config")
			{
				respond(jsonResponse(200, configPayload()));
			}
			else
			{
				respond(errorResponse(404, "not_found"));
			}
			return;
		}

		if (method != "POST")
		{
			respond(errorResponse(405, "method_not_allowed"));
			return;
		}

		const bool knownRoute = path == "/api/channels" || path == "/api/channels/batch" ||
								path == "/api/osc" || path == "/api/osc/batch";
		if (!knownRoute)
		{
			respond(errorResponse(404, "not_found"));
			return;
		}

		nlohmann::json document;
		if (!parseBody(body, document))
		{
			respond(errorResponse(400, "invalid_json"));
			return;
		}

		ValidationIssues issues;
		if (path == "/api/channels")
		{
			ChannelUpdate update;
			if (!GatewayMessages::parseChannelUpdate(document, update, issues))
			{
				respond(rejectValidation(issues));
				return;
			}
			const SendResult result = m_relay.sendChannel(update.channel, update.value);
			respond(result.error == kNotReadyError ? errorResponse(503, result.error) : jsonResponse(200, result));
		}
		else if (path == "/api/channels/batch")
		{
			std::vector<ChannelUpdate> updates;
			if (!GatewayMessages::parseChannelBatch(document, updates, issues))
			{
				respond(rejectValidation(issues));
				return;
			}
			respond(jsonResponse(200, GatewayMessages::batchSummary(m_relay.sendChannelBatch(updates))));
		}
		else if (path == "/api/osc")
		{
			CommandRequest request;
			if (!GatewayMessages::parseCommandRequest(document, request, issues))
			{
				respond(rejectValidation(issues));
				return;
			}
			const SendResult result = m_relay.send(request);
			respond(result.error == kNotReadyError ? errorResponse(503, result.error) : jsonResponse(200, result));
		}
		else
		{
			std::vector<CommandRequest> requests;
			if (!GatewayMessages::parseCommandBatch(document, requests, issues))
			{
				respond(rejectValidation(issues));
				return;
			}
			respond(jsonResponse(200, GatewayMessages::batchSummary(m_relay.sendBatch(requests))));
		}
	}

	void TransportGateway::handleEngineRoute(const std::string &method, const std::string &path,
											 const std::string &query, ResponseCallback respond)
	{
		if (path == "/telemetry/status")
		{
			if (method != "GET")
			{
				respond(errorResponse(405, "method_not_allowed"));
				return;
			}
			respond(jsonResponse(200, m_listener.statusPayload()));
			return;
		}

		if (path == "/telemetry/capture")
		{
			if (method != "GET")
			{
				respond(errorResponse(405, "method_not_allowed"));
				return;
			}
			const int windowMs = ConfigurationParser::parseBoundedInt(
				queryParameter(query, "windowMs"), kDefaultCaptureWindowMs, kMinCaptureWindowMs, kMaxCaptureWindowMs);
			const int minCount = ConfigurationParser::parseBoundedInt(
				queryParameter(query, "minCount"), kDefaultCaptureMinCount, 1, 5000);
			const int timeoutMs = ConfigurationParser::parseBoundedInt(
				queryParameter(query, "timeoutMs"), windowMs + 3000, 500, 120000);
			m_listener.captureScanWindow(windowMs, minCount, timeoutMs, [respond](const ScanCapture &capture)
										 {
											 nlohmann::json body = capture;
											 body["ok"] = true;
											 respond(jsonResponse(200, body)); });
			return;
		}

		if (path == "/telemetry/hello")
		{
			if (method != "GET")
			{
				respond(errorResponse(405, "method_not_allowed"));
				return;
			}
			const std::string since = queryParameter(query, "sinceMs");
			const auto sinceMs = parseFiniteNumber(since);
			const int timeoutMs = ConfigurationParser::parseBoundedInt(
				queryParameter(query, "timeoutMs"), kDefaultHelloTimeoutMs, 0, 120000);
			m_listener.waitForHello(sinceMs ? static_cast<std::int64_t>(*sinceMs) : 0, timeoutMs,
									[respond](bool ok, const std::optional<TelemetryHelloSample> &hello,
											  const std::string &error)
									{
										if (!ok)
										{
											respond(jsonResponse(504, nlohmann::json{{"ok", false}, {"error", error}}));
											return;
										}
										respond(jsonResponse(200, nlohmann::json{{"ok", true}, {"hello", *hello}}));
									});
			return;
		}

		if (path.rfind("/engine/", 0) != 0)
		{
			respond(errorResponse(404, "not_found"));
			return;
		}

		if (!m_supervisor)
		{
			respond(errorResponse(503, "engine_supervisor_unavailable"));
			return;
		}

		const auto reply = [respond](const EngineStatusReport &report)
		{
			respond(jsonResponse(report.ok ? 200 : 500, report));
		};

		if (method == "GET" && path == "/engine/status")
		{
			reply(m_supervisor->status());
		}
		else if (method == "GET" && path == "/engine/logs")
		{
			const int limit = ConfigurationParser::parseBoundedInt(
				queryParameter(query, "limit"), ProcessSupervisor::kDefaultLogLimit, 1, LogBuffer::kMaxLimit);
			respond(jsonResponse(200, nlohmann::json{{"ok", true}, {"entries", m_supervisor->logs(limit)}}));
		}
		else if (method == "POST" && path == "/engine/start")
		{
			ProcessSupervisor::StartOptions options;
			options.trigger = "api";
			reply(m_supervisor->start(options));
		}
		else if (method == "POST" && path == "/engine/stop")
		{
			m_supervisor->stop("api_stop", reply);
		}
		else if (method == "POST" && path == "/engine/restart")
		{
			m_supervisor->restart(reply);
		}
		else if (path == "/engine/status" || path == "/engine/logs" || path == "/engine/start" ||
				 path == "/engine/stop" || path == "/engine/restart")
		{
			respond(errorResponse(405, "method_not_allowed"));
		}
		else
		{
			respond(errorResponse(404, "not_found"));
		}
	}

	nlohmann::json TransportGateway::configPayload() const
	{
		const RelayConfig &relay = m_relay.config();
		const TelemetryConfig &telemetry = m_listener.config();
		return nlohmann::json{
			{"bridgeHost", m_config.host},
			{"bridgePort", m_config.port},
			{"oscTargetHost", relay.targetHost},
			{"oscTargetPort", relay.targetPort},
			{"telemetryListenHost", telemetry.listenHost},
			{"telemetryListenPort", telemetry.listenPort},
			{"telemetryScanAddress", telemetry.scanAddress},
			{"oscChannelPrefix", relay.channelPrefix},
			{"channelCount", relay.channelCount},
			{"maxMessagesPerSecond", relay.maxMessagesPerSecond},
			{"oscActivityLogIntervalMs", m_config.activityLogIntervalMs},
			{"allowedOrigin", m_config.allowedOrigin}};
	}

	nlohmann::json TransportGateway::healthPayload() const
	{
		const RelayStats relay = m_relay.stats();
		const TelemetryStats telemetry = m_listener.stats();

		nlohmann::json health{
			{"status", "ok"},
			{"bridgeReady", true},
			{"oscReady", m_relay.isReady()},
			{"telemetryReady", m_listener.isReady()},
			{"activeWsClients", m_clients.size()},
			{"uptimeSeconds", (m_scheduler.nowMs() - m_startedAtMs) / 1000},
			{"counters",
			 {{"oscSentCount", relay.sent},
			  {"telemetryReceivedCount", telemetry.receivedScans},
			  {"telemetryBroadcastCount", m_stats.telemetryBroadcast},
			  {"droppedRateLimitedCount", relay.droppedRateLimited},
			  {"rejectedValidationCount", m_stats.rejectedValidation + relay.rejectedValidation},
			  {"oscErrorCount", relay.transportErrors}}},
			{"config", configPayload()}};

		if (m_supervisor)
		{
			health["engine"] = m_supervisor->status();
		}
		return health;
	}

	nlohmann::json TransportGateway::helloPayload() const
	{
		return nlohmann::json{
			{"oscReady", m_relay.isReady()},
			{"telemetryReady", m_listener.isReady()},
			{"bridgePort", m_config.port},
			{"oscTargetHost", m_relay.config().targetHost},
			{"oscTargetPort", m_relay.config().targetPort},
			{"telemetryListenPort", m_listener.config().listenPort},
			{"channelCount", m_relay.config().channelCount}};
	}

	std::string TransportGateway::intervalLabel(int intervalMs)
	{
		if (intervalMs % 1000 == 0)
		{
			return std::to_string(intervalMs / 1000) + "s";
		}
		return std::to_string(intervalMs) + "ms";
	}

	TransportGateway::ActivityBaseline TransportGateway::currentActivity() const
	{
		const RelayStats relay = m_relay.stats();
		ActivityBaseline current;
		current.sent = relay.sent;
		current.telemetryReceived = m_listener.stats().receivedScans;
		current.rateLimited = relay.droppedRateLimited;
		current.errors = relay.transportErrors;
		return current;
	}

	std::string TransportGateway::takeActivityReport()
	{
		const ActivityBaseline current = currentActivity();
		const std::uint64_t sent = current.sent - m_activityBaseline.sent;
		const std::uint64_t received = current.telemetryReceived - m_activityBaseline.telemetryReceived;
		const std::uint64_t rateLimited = current.rateLimited - m_activityBaseline.rateLimited;
		const std::uint64_t errors = current.errors - m_activityBaseline.errors;
		m_activityBaseline = current;

		if (sent == 0 && received == 0 && rateLimited == 0 && errors == 0)
		{
			return std::string();
		}

		const TelemetryConfig &telemetry = m_listener.config();
		std::ostringstream line;
		line << "Activity " << intervalLabel(m_config.activityLogIntervalMs > 0 ? m_config.activityLogIntervalMs : 1000)
			 << ": oscSent=" << sent
			 << " telemetryRx=" << received
			 << " rateLimited=" << rateLimited
			 << " errors=" << errors
			 << " target=" << m_relay.config().targetHost << ":" << m_relay.config().targetPort
			 << " telemetry=" << telemetry.listenHost << ":" << telemetry.listenPort;
		return line.str();
	}

	void TransportGateway::scheduleActivityLog()
	{
		m_activityTimer = m_scheduler.scheduleAfter(m_config.activityLogIntervalMs, [this]()
													{
														m_activityTimer.reset();
														const std::string report = takeActivityReport();
														if (!report.empty())
														{
															std::cout << "TransportGateway: " << report << std::endl;
														}
														scheduleActivityLog(); });
	}

} // namespace GranuBridge
