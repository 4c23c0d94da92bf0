#include "ProcessSupervisor.h"

#include <algorithm>
#include <csignal>
#include <iostream>

namespace GranuBridge
{
	ProcessSupervisor::ProcessSupervisor(IScheduler &scheduler, IProcessLauncher &launcher,
										 IEngineRuntimeResolver &resolver, LogBuffer &logBuffer,
										 const EngineConfig &engineConfig, const WatchdogConfig &watchdogConfig)
		: m_scheduler(scheduler), m_launcher(launcher), m_resolver(resolver), m_logBuffer(logBuffer),
		  m_engineConfig(engineConfig), m_watchdogConfig(watchdogConfig),
		  m_generation(0), m_stopping(false), m_shuttingDown(false),
		  m_nextListenerId(1), m_lifetime(std::make_shared<int>(0))
	{
	}

	ProcessSupervisor::~ProcessSupervisor()
	{
		m_lifetime.reset();
		cancelRestartTimer();
		cancelForceKillTimer();

		if (m_process && !m_process->hasExited())
		{
			m_process->signal(SIGKILL);
		}
		m_process.reset();
	}

	std::int64_t ProcessSupervisor::restartDelayMs(int attempt, int baseDelayMs, int maxDelayMs)
	{
		const int exponent = std::max(0, attempt - 1);
		std::int64_t delay = baseDelayMs;
		for (int i = 0; i < exponent && delay < maxDelayMs; ++i)
		{
			delay *= 2;
		}
		return std::min<std::int64_t>(maxDelayMs, delay);
	}

	EngineStatusReport ProcessSupervisor::report(bool ok, const std::string &error) const
	{
		EngineStatusReport result;
		result.ok = ok;
		result.status = m_state.status;
		result.pid = m_state.pid;
		result.binaryPath = m_state.binaryPath;
		result.args = m_state.args;
		result.startedAtMs = m_state.startedAtMs;
		result.stoppedAtMs = m_state.stoppedAtMs;
		result.autoStartEnabled = m_engineConfig.autoStart;
		result.autoRestartEnabled = m_state.allowAutoRestart && m_watchdogConfig.autoRestart;
		result.restartAttempts = m_state.restartAttempts;
		result.restartMaxAttempts = m_watchdogConfig.restartMaxAttempts;
		result.lastError = error.empty() ? m_state.lastError : error;
		return result;
	}

	EngineStatusReport ProcessSupervisor::status() const
	{
		return report(true);
	}

	void ProcessSupervisor::transition(EngineStatus next, const std::optional<std::string> &error)
	{
		m_state.status = next;

		const bool hasProcess = next == EngineStatus::Starting || next == EngineStatus::Running ||
								next == EngineStatus::Stopping;
		if (hasProcess && m_process)
		{
			m_state.pid = m_process->pid();
		}
		else
		{
			m_state.pid.reset();
		}

		if (error)
		{
			m_state.lastError = *error;
		}

		if (next == EngineStatus::Running)
		{
			m_state.startedAtMs = m_scheduler.wallClockMs();
			m_state.stoppedAtMs.reset();
		}
		else if (next == EngineStatus::Stopped || next == EngineStatus::Error)
		{
			m_state.stoppedAtMs = m_scheduler.wallClockMs();
		}

		notifyStatusListeners();
	}

	void ProcessSupervisor::notifyStatusListeners()
	{
		const EngineStatusReport current = report(true);
		const auto listeners = m_statusListeners;
		for (const auto &[id, listener] : listeners)
		{
			listener(current);
		}
	}

	void ProcessSupervisor::appendEvent(LogChannel channel, const std::string &line)
	{
		if (channel == LogChannel::Stderr)
		{
			std::cerr << "ProcessSupervisor: " << line << std::endl;
		}
		else
		{
			std::cout << "ProcessSupervisor: " << line << std::endl;
		}
		m_logBuffer.append(channel, line, m_scheduler.wallClockMs());
	}

	void ProcessSupervisor::cancelRestartTimer()
	{
		if (m_restartTimer)
		{
			m_scheduler.cancel(*m_restartTimer);
			m_restartTimer.reset();
		}
	}

	void ProcessSupervisor::cancelForceKillTimer()
	{
		if (m_forceKillTimer)
		{
			m_scheduler.cancel(*m_forceKillTimer);
			m_forceKillTimer.reset();
		}
	}

	void ProcessSupervisor::resetBackoff()
	{
		cancelRestartTimer();
		m_state.restartAttempts = 0;
		m_state.lastUnexpectedExitAtMs.reset();
	}

	EngineStatusReport ProcessSupervisor::start(const StartOptions &options)
	{
		const std::string trigger = options.trigger.empty() ? std::string("manual") : options.trigger;

		if ((m_state.status == EngineStatus::Running && m_process) || m_state.status == EngineStatus::Starting)
		{
			return report(true);
		}

		if (m_state.status == EngineStatus::Stopping && m_process)
		{
			return report(false, "engine_stopping");
		}

		if (m_shuttingDown)
		{
			return report(false, "shutting_down");
		}

		cancelRestartTimer();
		m_state.allowAutoRestart = true;
		if (!options.preserveBackoff)
		{
			m_state.restartAttempts = 0;
			m_state.lastUnexpectedExitAtMs.reset();
		}

		EngineLaunchSpec spec;
		std::string error;
		if (!m_resolver.resolve(spec, error))
		{
			appendEvent(LogChannel::System, error);
			transition(EngineStatus::Error, error);
			return report(false, error);
		}

		m_state.binaryPath = spec.binaryPath;
		m_state.args = spec.args;

		const std::uint64_t generation = ++m_generation;
		const std::weak_ptr<int> lifetime = m_lifetime;

		ProcessCallbacks callbacks;
		callbacks.onLine = [this, lifetime](LogChannel channel, const std::string &line)
		{
			if (lifetime.expired())
			{
				return;
			}
			m_logBuffer.append(channel, line, m_scheduler.wallClockMs());
		};
		callbacks.onExit = [this, lifetime, generation](const ExitInfo &exit)
		{
			if (lifetime.expired())
			{
				return;
			}
			handleExit(generation, exit);
		};

		m_process = m_launcher.spawn(spec, std::move(callbacks), error);
		if (!m_process)
		{
			appendEvent(LogChannel::System, "Failed to spawn engine: " + error);
			transition(EngineStatus::Error, error);
			return report(false, error);
		}

		m_stopping = false;
		transition(EngineStatus::Starting, std::string());

		if (!m_process->awaitSpawn(error))
		{
			m_process.reset();
			appendEvent(LogChannel::System, "Failed to spawn engine: " + error);
			transition(EngineStatus::Error, error);
			return report(false, error);
		}

		appendEvent(LogChannel::System, "Engine started (pid=" + std::to_string(m_process->pid()) + ") using " +
											spec.binaryPath + " (trigger=" + trigger + ")");
		appendEvent(LogChannel::System, "Engine data dir: " + spec.dataDir);
		if (!spec.samplesDir.empty())
		{
			appendEvent(LogChannel::System, "Engine samples dir: " + spec.samplesDir);
		}
		else
		{
			appendEvent(LogChannel::System, "No samples directory resolved; using engine defaults.");
		}
		if (!spec.libDir.empty())
		{
			appendEvent(LogChannel::System, "Engine runtime libs dir: " + spec.libDir);
		}

		transition(EngineStatus::Running, std::string());
		return report(true);
	}

	void ProcessSupervisor::handleExit(std::uint64_t generation, const ExitInfo &exit)
	{
		if (generation != m_generation)
		{
			return;
		}

		const bool expected = m_stopping;
		appendEvent(LogChannel::System, "Engine exited (" + describeExit(exit) +
											", expected=" + (expected ? "true" : "false") + ")");

		m_process.reset();
		m_stopping = false;
		cancelForceKillTimer();

		if (expected)
		{
			transition(EngineStatus::Stopped, std::string());
			finishStop(true, std::string());
			return;
		}

		const std::string exitMessage = "Engine exited unexpectedly (" + describeExit(exit) + ")";
		transition(EngineStatus::Error, exitMessage);
		scheduleRestart(exitMessage);
	}

	void ProcessSupervisor::scheduleRestart(const std::string &exitMessage)
	{
		if (m_shuttingDown)
		{
			return;
		}

		if (!m_state.allowAutoRestart)
		{
			appendEvent(LogChannel::System, "Engine auto-restart skipped (manual stop policy active).");
			return;
		}

		if (!m_watchdogConfig.autoRestart)
		{
			appendEvent(LogChannel::System, "Engine auto-restart skipped (watchdog disabled).");
			return;
		}

		const std::int64_t now = m_scheduler.nowMs();
		if (!m_state.lastUnexpectedExitAtMs || now - *m_state.lastUnexpectedExitAtMs > m_watchdogConfig.restartBackoffResetMs)
		{
			m_state.restartAttempts = 0;
		}
		m_state.lastUnexpectedExitAtMs = now;

		const int maxAttempts = m_watchdogConfig.restartMaxAttempts;
		if (m_state.restartAttempts >= maxAttempts)
		{
			appendEvent(LogChannel::Stderr, "Engine restart watchdog exhausted (" + std::to_string(maxAttempts) +
												" attempts). Last exit: " + exitMessage);
			m_state.allowAutoRestart = false;
			notifyStatusListeners();
			return;
		}

		const int attempt = ++m_state.restartAttempts;
		const std::int64_t delayMs = restartDelayMs(attempt, m_watchdogConfig.restartBaseDelayMs,
													m_watchdogConfig.restartMaxDelayMs);
		const std::string attemptLabel = std::to_string(attempt) + "/" + std::to_string(maxAttempts);
		appendEvent(LogChannel::System, "Scheduling engine restart attempt " + attemptLabel + " in " +
											std::to_string(delayMs) + "ms (" + exitMessage + ")");

		cancelRestartTimer();
		m_restartTimer = m_scheduler.scheduleAfter(delayMs, [this, attempt, attemptLabel]()
												   {
			m_restartTimer.reset();
			if (m_shuttingDown || !m_state.allowAutoRestart)
			{
				return;
			}

			appendEvent(LogChannel::System, "Executing engine restart attempt " + attemptLabel + ".");
			StartOptions options;
			options.preserveBackoff = true;
			options.trigger = "watchdog";
			const EngineStatusReport result = start(options);
			if (!result.ok)
			{
				const std::string reason = result.lastError.empty() ? std::string("watchdog_restart_start_failed")
																	: result.lastError;
				appendEvent(LogChannel::Stderr, "Engine restart attempt " + std::to_string(attempt) + " failed: " + reason);
				scheduleRestart("watchdog start failure: " + reason);
			} });

		notifyStatusListeners();
	}

	void ProcessSupervisor::stop(const std::string &reason, StatusCallback callback)
	{
		m_state.allowAutoRestart = false;
		resetBackoff();

		if (!m_process)
		{
			if (m_state.status != EngineStatus::Stopped)
			{
				transition(EngineStatus::Stopped, std::string());
			}
			if (callback)
			{
				callback(report(true));
			}
			return;
		}

		m_pendingStops.push_back(std::move(callback));
		if (m_stopping)
		{
			return;
		}

		m_stopping = true;
		transition(EngineStatus::Stopping);
		appendEvent(LogChannel::System, "Stopping engine (reason=" + reason + ")");

		if (!m_process->signal(SIGTERM))
		{
			m_stopping = false;
			const std::string error = "failed_to_signal_engine_process";
			appendEvent(LogChannel::Stderr, error);
			transition(EngineStatus::Error, error);
			finishStop(false, error);
			return;
		}

		const std::uint64_t generation = m_generation;
		cancelForceKillTimer();
		m_forceKillTimer = m_scheduler.scheduleAfter(m_engineConfig.stopGraceMs, [this, generation]()
													 {
			m_forceKillTimer.reset();
			if (generation != m_generation || !m_process || !m_stopping)
			{
				return;
			}

			appendEvent(LogChannel::System, "Engine did not exit after SIGTERM; forcing SIGKILL.");
			if (!m_process->signal(SIGKILL))
			{
				appendEvent(LogChannel::Stderr, "Failed to SIGKILL engine process " + std::to_string(m_process->pid()));
			} });
	}

	void ProcessSupervisor::finishStop(bool ok, const std::string &error)
	{
		std::vector<StatusCallback> callbacks;
		callbacks.swap(m_pendingStops);

		const EngineStatusReport outcome = report(ok, error);
		for (const auto &callback : callbacks)
		{
			if (callback)
			{
				callback(outcome);
			}
		}
	}

	void ProcessSupervisor::restart(StatusCallback callback)
	{
		stop("restart", [this, callback](const EngineStatusReport &stopResult)
			 {
			if (!stopResult.ok && m_process)
			{
				if (callback)
				{
					callback(stopResult);
				}
				return;
			}

			StartOptions options;
			options.trigger = "restart";
			const EngineStatusReport startResult = start(options);
			if (callback)
			{
				callback(startResult);
			} });
	}

	void ProcessSupervisor::shutdown(StatusCallback callback)
	{
		m_shuttingDown = true;
		cancelRestartTimer();
		stop("shutdown", std::move(callback));
	}

	std::vector<LogEntry> ProcessSupervisor::logs(int limit) const
	{
		const int bounded = std::max(1, std::min(limit, static_cast<int>(m_logBuffer.limit())));
		return m_logBuffer.entries(static_cast<size_t>(bounded));
	}

	int ProcessSupervisor::addStatusListener(StatusCallback callback)
	{
		const int id = m_nextListenerId++;
		m_statusListeners[id] = std::move(callback);
		return id;
	}

	void ProcessSupervisor::removeStatusListener(int callbackId)
	{
		m_statusListeners.erase(callbackId);
	}

	int ProcessSupervisor::addLogListener(std::function<void(const LogEntry &)> callback)
	{
		return m_logBuffer.addListener(std::move(callback));
	}

	void ProcessSupervisor::removeLogListener(int callbackId)
	{
		m_logBuffer.removeListener(callbackId);
	}

} // namespace GranuBridge
