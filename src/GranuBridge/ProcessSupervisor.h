#pragma once

#include "Configuration.h"
#include "EngineProcess.h"
#include "LogBuffer.h"
#include "Scheduler.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace GranuBridge
{
	/**
	 * @brief Owns the engine subprocess: start, stop, restart and crash recovery
	 *
	 * All state changes go through one transition function so the pid is set
	 * exactly while the status is starting, running or stopping. Unexpected
	 * exits feed the watchdog, which restarts the engine with exponential
	 * backoff until the attempt budget is spent.
	 */
	class ProcessSupervisor
	{
	public:
		using StatusCallback = std::function<void(const EngineStatusReport &)>;

		static constexpr int kDefaultLogLimit = 200;

		/**
		 * @brief Options for start()
		 */
		struct StartOptions
		{
			StartOptions() {}

			bool preserveBackoff = false;	 // Keep the watchdog attempt counter
			std::string trigger = "manual"; // manual, restart, watchdog or autostart
		};

		/**
		 * @brief Constructor
		 *
		 * @param scheduler Clock and timers for backoff and stop escalation
		 * @param launcher Creates the subprocess
		 * @param resolver Produces the launch spec at each start
		 * @param logBuffer Receives engine output and supervisor events
		 * @param engineConfig Auto-start flag and stop grace period
		 * @param watchdogConfig Backoff settings
		 */
		ProcessSupervisor(IScheduler &scheduler, IProcessLauncher &launcher, IEngineRuntimeResolver &resolver,
						  LogBuffer &logBuffer, const EngineConfig &engineConfig, const WatchdogConfig &watchdogConfig);
		~ProcessSupervisor();

		ProcessSupervisor(const ProcessSupervisor &) = delete;
		ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

		/**
		 * @brief Launch the engine unless it is already running or starting
		 *
		 * Blocks only until exec has been confirmed.
		 *
		 * @param options Backoff handling and trigger label
		 * @return EngineStatusReport Status after the attempt; ok is false on failure
		 */
		EngineStatusReport start(const StartOptions &options = StartOptions());

		/**
		 * @brief Stop the engine: SIGTERM, then SIGKILL after the grace period
		 *
		 * Disables auto-restart. A stop issued while another is in flight joins it
		 * and receives the same outcome.
		 *
		 * @param reason Label written to the log
		 * @param callback Receives the status once the process has exited
		 */
		void stop(const std::string &reason, StatusCallback callback);

		/**
		 * @brief Stop, then start again
		 *
		 * @param callback Receives the start result, or the stop failure when the
		 *                 process could not be signalled
		 */
		void restart(StatusCallback callback);

		/**
		 * @brief Stop for good: no further watchdog restarts
		 *
		 * @param callback Receives the final status
		 */
		void shutdown(StatusCallback callback);

		EngineStatusReport status() const;

		/**
		 * @brief Most recent log entries
		 *
		 * @param limit Number of entries, bounded to [1, log buffer size]
		 */
		std::vector<LogEntry> logs(int limit = kDefaultLogLimit) const;

		/**
		 * @brief Register a callback invoked on every status change
		 *
		 * @return int Callback ID for later removal
		 */
		int addStatusListener(StatusCallback callback);
		void removeStatusListener(int callbackId);

		/**
		 * @brief Register a callback invoked for every new log entry
		 *
		 * @return int Callback ID for later removal
		 */
		int addLogListener(std::function<void(const LogEntry &)> callback);
		void removeLogListener(int callbackId);

		/**
		 * @brief Watchdog delay for an attempt: min(max, base * 2^(attempt - 1))
		 */
		static std::int64_t restartDelayMs(int attempt, int baseDelayMs, int maxDelayMs);

		const EngineProcessState &state() const { return m_state; }
		bool hasPendingRestart() const { return m_restartTimer.has_value(); }
		bool isShuttingDown() const { return m_shuttingDown; }

	private:
		EngineStatusReport report(bool ok, const std::string &error = std::string()) const;
		void transition(EngineStatus next, const std::optional<std::string> &error = std::nullopt);
		void notifyStatusListeners();
		void appendEvent(LogChannel channel, const std::string &line);
		void handleExit(std::uint64_t generation, const ExitInfo &exit);
		void scheduleRestart(const std::string &exitMessage);
		void resetBackoff();
		void cancelRestartTimer();
		void cancelForceKillTimer();
		void finishStop(bool ok, const std::string &error);

		IScheduler &m_scheduler;
		IProcessLauncher &m_launcher;
		IEngineRuntimeResolver &m_resolver;
		LogBuffer &m_logBuffer;
		EngineConfig m_engineConfig;
		WatchdogConfig m_watchdogConfig;

		EngineProcessState m_state;
		std::shared_ptr<IEngineProcess> m_process;
		std::uint64_t m_generation;
		bool m_stopping;
		bool m_shuttingDown;

		std::optional<IScheduler::TimerId> m_restartTimer;
		std::optional<IScheduler::TimerId> m_forceKillTimer;
		std::vector<StatusCallback> m_pendingStops;

		std::map<int, StatusCallback> m_statusListeners;
		int m_nextListenerId;

		// Expires with the supervisor so late process callbacks are dropped
		std::shared_ptr<int> m_lifetime;
	};

} // namespace GranuBridge
