#include "TelemetryListener.h"

#include <algorithm>
#include <iostream>

namespace GranuBridge
{
	void to_json(nlohmann::json &j, const ScanCapture &capture)
	{
		j = nlohmann::json{
			{"startedAtMs", capture.startedAtMs},
			{"completedAtMs", capture.completedAtMs},
			{"scans", capture.scans},
			{"stats", capture.stats}};
	}

	TelemetryListener::TelemetryListener(const TelemetryConfig &config, boost::asio::io_context &ioContext,
										 IScheduler &scheduler)
		: m_config(config), m_ioContext(ioContext), m_scheduler(scheduler),
		  m_server(nullptr), m_ready(false), m_boundPort(0),
		  m_scanSequence(0), m_nextCallbackId(1)
	{
		m_config.scanBufferLimit = std::max<size_t>(1, m_config.scanBufferLimit);
	}

	TelemetryListener::~TelemetryListener()
	{
		for (const auto id : m_pollTimers)
		{
			m_scheduler.cancel(id);
		}
		m_pollTimers.clear();
		close();
	}

	bool TelemetryListener::open(std::string &error)
	{
		close();

		const std::string port = m_config.listenPort > 0 ? std::to_string(m_config.listenPort) : std::string();
		m_server = lo_server_new_with_proto(port.empty() ? nullptr : port.c_str(), LO_UDP, handleServerError);
		if (!m_server)
		{
			error = "Failed to bind telemetry port " + (port.empty() ? std::string("(ephemeral)") : port);
			m_lastError = error;
			std::cerr << "TelemetryListener: " << error << std::endl;
			return false;
		}

		lo_server_add_method(m_server, nullptr, nullptr, handleOscMessageStatic, this);

		const int fd = lo_server_get_socket_fd(m_server);
		if (fd < 0)
		{
			error = "Telemetry socket has no pollable descriptor";
			m_lastError = error;
			lo_server_free(m_server);
			m_server = nullptr;
			return false;
		}

		m_descriptor = std::make_unique<boost::asio::posix::stream_descriptor>(m_ioContext, fd);
		m_boundPort = lo_server_get_port(m_server);
		m_ready = true;
		m_lastError.clear();

		std::cout << "TelemetryListener: Listening on " << m_config.listenHost << ":" << m_boundPort
				  << " (hello " << m_config.helloAddress << ", scan " << m_config.scanAddress << ")" << std::endl;

		armReceive();
		return true;
	}

	void TelemetryListener::close()
	{
		if (m_descriptor)
		{
			boost::system::error_code ec;
			m_descriptor->cancel(ec);
			// liblo owns the socket and closes it in lo_server_free
			m_descriptor->release();
			m_descriptor.reset();
		}

		if (m_server)
		{
			lo_server_free(m_server);
			m_server = nullptr;
			std::cout << "TelemetryListener: Stopped." << std::endl;
		}

		m_ready = false;
		clearScans();
		clearHello();
	}

	void TelemetryListener::armReceive()
	{
		if (!m_descriptor)
		{
			return;
		}

		m_descriptor->async_wait(boost::asio::posix::stream_descriptor::wait_read,
								 [this](const boost::system::error_code &ec)
								 {
									 if (ec == boost::asio::error::operation_aborted)
									 {
										 return;
									 }
									 if (ec)
									 {
										 ++m_stats.receiveErrors;
										 m_lastError = ec.message();
										 m_ready = false;
										 std::cerr << "TelemetryListener: Receive error: " << ec.message() << std::endl;
										 return;
									 }

									 drainSocket();
									 armReceive();
								 });
	}

	void TelemetryListener::drainSocket()
	{
		while (m_server && lo_server_recv_noblock(m_server, 0) > 0)
		{
		}
	}

	void TelemetryListener::handleServerError(int num, const char *msg, const char *where)
	{
		std::cerr << "TelemetryListener: liblo error " << num << ": " << (msg ? msg : "unknown")
				  << (where ? std::string(" (") + where + ")" : std::string()) << std::endl;
	}

	int TelemetryListener::handleOscMessageStatic(const char *path, const char *types, lo_arg **argv, int argc,
												  lo_message msg, void *user_data)
	{
		(void)msg;
		TelemetryListener *listener = static_cast<TelemetryListener *>(user_data);
		if (!listener || !path)
		{
			return 1;
		}

		OscMessage message;
		message.address = path;
		for (int i = 0; i < argc; i++)
		{
			if (!types || !argv || !argv[i])
				continue;

			switch (types[i])
			{
			case LO_INT32:
				message.args.emplace_back(static_cast<std::int32_t>(argv[i]->i));
				break;
			case LO_INT64:
				message.args.emplace_back(static_cast<std::int64_t>(argv[i]->h));
				break;
			case LO_FLOAT:
				message.args.emplace_back(argv[i]->f);
				break;
			case LO_DOUBLE:
				message.args.emplace_back(argv[i]->d);
				break;
			case LO_STRING:
			case LO_SYMBOL:
				message.args.emplace_back(std::string(&argv[i]->s));
				break;
			case LO_TRUE:
				message.args.emplace_back(true);
				break;
			case LO_FALSE:
				message.args.emplace_back(false);
				break;
			default:
				// Blobs, MIDI and timetags carry nothing the engine telemetry uses
				break;
			}
		}

		listener->handleMessage(message);
		return 0;
	}

	void TelemetryListener::handleMessage(const OscMessage &message)
	{
		const std::int64_t timestampMs = m_scheduler.wallClockMs();

		if (message.address == m_config.scanAddress)
		{
			auto scan = TelemetryParser::parseScan(message, m_config.scanAddress, timestampMs);
			if (!scan)
			{
				++m_stats.malformedScans;
				return;
			}

			m_scans.push_back(*scan);
			while (m_scans.size() > m_config.scanBufferLimit)
			{
				m_scans.pop_front();
			}
			++m_scanSequence;
			++m_stats.receivedScans;
			m_lastScan = std::move(scan);

			// Subscribers may unsubscribe from inside the callback
			const auto callbacks = m_scanCallbacks;
			for (const auto &[id, callback] : callbacks)
			{
				callback(*m_lastScan);
			}
			return;
		}

		if (message.address == m_config.helloAddress)
		{
			auto hello = TelemetryParser::parseHello(message, m_config.helloAddress, timestampMs);
			if (!hello)
			{
				return;
			}

			++m_stats.receivedHellos;
			m_lastHello = std::move(hello);

			const auto callbacks = m_helloCallbacks;
			for (const auto &[id, callback] : callbacks)
			{
				callback(*m_lastHello);
			}
			return;
		}

		++m_stats.ignoredMessages;
	}

	int TelemetryListener::addScanListener(ScanCallback callback)
	{
		const int id = m_nextCallbackId++;
		m_scanCallbacks[id] = std::move(callback);
		return id;
	}

	void TelemetryListener::removeScanListener(int callbackId)
	{
		m_scanCallbacks.erase(callbackId);
	}

	int TelemetryListener::addHelloListener(HelloCallback callback)
	{
		const int id = m_nextCallbackId++;
		m_helloCallbacks[id] = std::move(callback);
		return id;
	}

	void TelemetryListener::removeHelloListener(int callbackId)
	{
		m_helloCallbacks.erase(callbackId);
	}

	void TelemetryListener::clearScans()
	{
		m_scans.clear();
		m_lastScan.reset();
	}

	void TelemetryListener::clearHello()
	{
		m_lastHello.reset();
	}

	std::vector<TelemetryScanSample> TelemetryListener::scansSince(std::uint64_t sequence) const
	{
		const std::uint64_t arrived = m_scanSequence - std::min(sequence, m_scanSequence);
		const size_t count = static_cast<size_t>(std::min<std::uint64_t>(arrived, m_scans.size()));
		return std::vector<TelemetryScanSample>(m_scans.end() - static_cast<std::ptrdiff_t>(count), m_scans.end());
	}

	IScheduler::TimerId TelemetryListener::schedulePoll(std::int64_t delayMs, IScheduler::Task task)
	{
		auto idHolder = std::make_shared<IScheduler::TimerId>(0);
		const IScheduler::TimerId id = m_scheduler.scheduleAfter(delayMs, [this, idHolder, task]()
																 {
			m_pollTimers.erase(*idHolder);
			task(); });
		*idHolder = id;
		m_pollTimers.insert(id);
		return id;
	}

	void TelemetryListener::captureScanWindow(std::int64_t windowMs, int minCount, std::int64_t timeoutMs,
											  CaptureCallback callback, int pollIntervalMs)
	{
		windowMs = std::max<std::int64_t>(0, windowMs);
		const size_t boundedMinCount = static_cast<size_t>(std::max(1, std::min(5000, minCount)));
		if (timeoutMs <= 0)
		{
			timeoutMs = windowMs + 3000;
		}
		timeoutMs = std::max<std::int64_t>(500, std::min<std::int64_t>(120000, timeoutMs));

		const std::int64_t startedMonoMs = m_scheduler.nowMs();
		pollCapture(m_scanSequence, startedMonoMs, m_scheduler.wallClockMs(), windowMs, boundedMinCount,
					startedMonoMs + timeoutMs, std::max(1, pollIntervalMs), std::move(callback));
	}

	void TelemetryListener::pollCapture(std::uint64_t startSequence, std::int64_t startedMonoMs,
										std::int64_t startedAtMs, std::int64_t windowMs, size_t minCount,
										std::int64_t deadlineMs, int pollIntervalMs, CaptureCallback callback)
	{
		const std::int64_t nowMs = m_scheduler.nowMs();
		const std::uint64_t captured = m_scanSequence - startSequence;
		const bool satisfied = nowMs - startedMonoMs >= windowMs && captured >= minCount;

		if (satisfied || nowMs >= deadlineMs)
		{
			ScanCapture capture;
			capture.startedAtMs = startedAtMs;
			capture.completedAtMs = m_scheduler.wallClockMs();
			capture.scans = scansSince(startSequence);
			capture.stats = TelemetryParser::computeScanStats(capture.scans);
			callback(capture);
			return;
		}

		const std::int64_t delay = std::min<std::int64_t>(pollIntervalMs, deadlineMs - nowMs);
		schedulePoll(delay, [this, startSequence, startedMonoMs, startedAtMs, windowMs, minCount, deadlineMs,
							 pollIntervalMs, callback]()
					 { pollCapture(startSequence, startedMonoMs, startedAtMs, windowMs, minCount, deadlineMs,
								   pollIntervalMs, callback); });
	}

	void TelemetryListener::waitForHello(std::int64_t sinceMs, std::int64_t timeoutMs, HelloWaitCallback callback,
										 int pollIntervalMs)
	{
		pollHello(sinceMs, m_scheduler.nowMs() + std::max<std::int64_t>(0, timeoutMs), std::max(1, pollIntervalMs),
				  std::move(callback));
	}

	void TelemetryListener::pollHello(std::int64_t sinceMs, std::int64_t deadlineMs, int pollIntervalMs,
									  HelloWaitCallback callback)
	{
		if (m_lastHello && m_lastHello->timestampMs >= sinceMs)
		{
			callback(true, m_lastHello, std::string());
			return;
		}

		const std::int64_t nowMs = m_scheduler.nowMs();
		if (nowMs >= deadlineMs)
		{
			callback(false, m_lastHello, "telemetry_hello_timeout");
			return;
		}

		const std::int64_t delay = std::min<std::int64_t>(pollIntervalMs, deadlineMs - nowMs);
		schedulePoll(delay, [this, sinceMs, deadlineMs, pollIntervalMs, callback]()
					 { pollHello(sinceMs, deadlineMs, pollIntervalMs, callback); });
	}

	nlohmann::json TelemetryListener::statusPayload() const
	{
		nlohmann::json status = {
			{"ready", m_ready},
			{"listenHost", m_config.listenHost},
			{"listenPort", m_boundPort > 0 ? m_boundPort : m_config.listenPort},
			{"helloAddress", m_config.helloAddress},
			{"scanAddress", m_config.scanAddress},
			{"scanBufferSize", m_scans.size()},
			{"scanBufferLimit", m_config.scanBufferLimit},
			{"lastHello", nullptr},
			{"lastScan", nullptr},
			{"lastError", nullptr},
			{"counters",
			 {{"receivedScans", m_stats.receivedScans},
			  {"receivedHellos", m_stats.receivedHellos},
			  {"malformedScans", m_stats.malformedScans},
			  {"ignoredMessages", m_stats.ignoredMessages},
			  {"receiveErrors", m_stats.receiveErrors}}}};

		if (m_lastHello)
		{
			status["lastHello"] = *m_lastHello;
		}
		if (m_lastScan)
		{
			status["lastScan"] = *m_lastScan;
		}
		if (!m_lastError.empty())
		{
			status["lastError"] = m_lastError;
		}
		return status;
	}

} // namespace GranuBridge
