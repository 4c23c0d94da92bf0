#pragma once

#include "Configuration.h"
#include "OscTypes.h"
#include "Scheduler.h"
#include "TelemetryParser.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <lo/lo.h>
#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief Scans collected over a capture window, with their statistics
	 */
	struct ScanCapture
	{
		std::int64_t startedAtMs = 0;
		std::int64_t completedAtMs = 0;
		std::vector<TelemetryScanSample> scans;
		ScanStats stats;
	};

	void to_json(nlohmann::json &j, const ScanCapture &capture);

	/**
	 * @brief Counters kept by the listener
	 */
	struct TelemetryStats
	{
		std::uint64_t receivedScans = 0;
		std::uint64_t receivedHellos = 0;
		std::uint64_t malformedScans = 0;
		std::uint64_t ignoredMessages = 0;
		std::uint64_t receiveErrors = 0;
	};

	/**
	 * @brief Inbound UDP OSC endpoint for engine telemetry
	 *
	 * A liblo server owns the socket; its descriptor is watched by the
	 * io_context so every datagram is decoded on the event loop thread. Decoded
	 * hello and scan samples are stored and forwarded to subscribers.
	 */
	class TelemetryListener
	{
	public:
		using ScanCallback = std::function<void(const TelemetryScanSample &)>;
		using HelloCallback = std::function<void(const TelemetryHelloSample &)>;
		using CaptureCallback = std::function<void(const ScanCapture &)>;
		using HelloWaitCallback = std::function<void(bool ok, const std::optional<TelemetryHelloSample> &hello,
													 const std::string &error)>;

		static constexpr int kDefaultPollIntervalMs = 150;

		/**
		 * @brief Constructor
		 *
		 * @param config Listen port, addresses and buffer size
		 * @param ioContext Event loop the socket is watched on
		 * @param scheduler Clock and timers for timestamps and capture windows
		 */
		TelemetryListener(const TelemetryConfig &config, boost::asio::io_context &ioContext, IScheduler &scheduler);
		~TelemetryListener();

		TelemetryListener(const TelemetryListener &) = delete;
		TelemetryListener &operator=(const TelemetryListener &) = delete;

		/**
		 * @brief Bind the UDP port and start receiving
		 *
		 * @param error Receives a message on failure
		 * @return true if the listener is receiving
		 */
		bool open(std::string &error);

		/**
		 * @brief Stop receiving, release the port and clear stored scans
		 */
		void close();

		bool isReady() const { return m_ready; }

		/**
		 * @brief Port actually bound (differs from the configured one when that was 0)
		 */
		int boundPort() const { return m_boundPort; }

		/**
		 * @brief Decode and dispatch one message
		 *
		 * Called for every datagram received on the socket.
		 *
		 * @param message Decoded OSC message
		 */
		void handleMessage(const OscMessage &message);

		int addScanListener(ScanCallback callback);
		void removeScanListener(int callbackId);
		int addHelloListener(HelloCallback callback);
		void removeHelloListener(int callbackId);

		/**
		 * @brief Collect the scans that arrive during a window
		 *
		 * Polls until at least windowMs has elapsed and minCount scans were
		 * captured, or until timeoutMs, then reports what arrived.
		 *
		 * @param windowMs Minimum capture duration
		 * @param minCount Minimum number of scans, bounded to [1, 5000]
		 * @param timeoutMs Upper bound on the capture, bounded to [500, 120000]
		 * @param callback Receives the capture
		 * @param pollIntervalMs Interval between checks
		 */
		void captureScanWindow(std::int64_t windowMs, int minCount, std::int64_t timeoutMs,
							   CaptureCallback callback, int pollIntervalMs = kDefaultPollIntervalMs);

		/**
		 * @brief Wait for a hello received at or after a wall-clock time
		 *
		 * @param sinceMs Oldest acceptable hello timestamp
		 * @param timeoutMs How long to wait
		 * @param callback Receives the hello, or telemetry_hello_timeout
		 * @param pollIntervalMs Interval between checks
		 */
		void waitForHello(std::int64_t sinceMs, std::int64_t timeoutMs, HelloWaitCallback callback,
						  int pollIntervalMs = kDefaultPollIntervalMs);

		/**
		 * @brief Drop stored scans and the latest scan; the latest hello is kept
		 */
		void clearScans();

		/**
		 * @brief Forget the latest hello so waiters only accept a newer one
		 */
		void clearHello();

		const std::optional<TelemetryHelloSample> &latestHello() const { return m_lastHello; }
		const std::optional<TelemetryScanSample> &latestScan() const { return m_lastScan; }
		size_t scanBufferSize() const { return m_scans.size(); }
		std::uint64_t scanSequence() const { return m_scanSequence; }
		TelemetryStats stats() const { return m_stats; }
		const TelemetryConfig &config() const { return m_config; }
		const std::string &lastError() const { return m_lastError; }

		/**
		 * @brief Readiness, addresses, latest samples and counters as JSON
		 */
		nlohmann::json statusPayload() const;

	private:
		static int handleOscMessageStatic(const char *path, const char *types, lo_arg **argv, int argc,
										  lo_message msg, void *user_data);
		static void handleServerError(int num, const char *msg, const char *where);

		void armReceive();
		void drainSocket();
		std::vector<TelemetryScanSample> scansSince(std::uint64_t sequence) const;
		void pollCapture(std::uint64_t startSequence, std::int64_t startedMonoMs, std::int64_t startedAtMs,
						 std::int64_t windowMs, size_t minCount, std::int64_t deadlineMs,
						 int pollIntervalMs, CaptureCallback callback);
		void pollHello(std::int64_t sinceMs, std::int64_t deadlineMs, int pollIntervalMs,
					   HelloWaitCallback callback);
		IScheduler::TimerId schedulePoll(std::int64_t delayMs, IScheduler::Task task);

		TelemetryConfig m_config;
		boost::asio::io_context &m_ioContext;
		IScheduler &m_scheduler;

		lo_server m_server;
		std::unique_ptr<boost::asio::posix::stream_descriptor> m_descriptor;
		bool m_ready;
		int m_boundPort;
		std::string m_lastError;

		std::deque<TelemetryScanSample> m_scans;
		std::uint64_t m_scanSequence;
		std::optional<TelemetryScanSample> m_lastScan;
		std::optional<TelemetryHelloSample> m_lastHello;
		TelemetryStats m_stats;

		std::map<int, ScanCallback> m_scanCallbacks;
		std::map<int, HelloCallback> m_helloCallbacks;
		int m_nextCallbackId;

		std::set<IScheduler::TimerId> m_pollTimers;
	};

} // namespace GranuBridge
