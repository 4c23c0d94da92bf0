#pragma once

#include "LogBuffer.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief Lifecycle state of the engine subprocess
	 */
	enum class EngineStatus
	{
		Stopped,
		Starting,
		Running,
		Stopping,
		Error
	};

	std::string engineStatusToString(EngineStatus status);

	/**
	 * @brief Everything needed to launch the engine once
	 */
	struct EngineLaunchSpec
	{
		std::string binaryPath;
		std::vector<std::string> args;
		std::string workingDirectory;
		std::map<std::string, std::string> environment; // Overrides on top of the inherited environment
		std::string dataDir;
		std::string samplesDir;
		std::string libDir;
	};

	/**
	 * @brief How a subprocess ended: exit code or terminating signal
	 */
	struct ExitInfo
	{
		std::optional<int> code;
		std::optional<int> signal;
	};

	/**
	 * @brief Render a signal number as its conventional name (SIGTERM, SIGKILL, ...)
	 */
	std::string signalName(int signal);

	/**
	 * @brief "code=N, signal=NAME" with null for whichever is missing
	 */
	std::string describeExit(const ExitInfo &exit);

	/**
	 * @brief Handle to one spawned subprocess
	 */
	class IEngineProcess
	{
	public:
		virtual ~IEngineProcess() = default;

		virtual int pid() const = 0;

		/**
		 * @brief Block until exec succeeded or failed in the child
		 *
		 * @param error Receives the exec failure reason
		 * @return true if the program image is running
		 */
		virtual bool awaitSpawn(std::string &error) = 0;

		/**
		 * @brief Deliver a signal
		 *
		 * @param signal Signal number
		 * @return true if the signal was delivered
		 */
		virtual bool signal(int signal) = 0;

		virtual bool hasExited() const = 0;
	};

	/**
	 * @brief Callbacks attached to a spawned subprocess
	 *
	 * onLine receives every complete output line; onExit fires once, on the
	 * event loop thread, after the process has been reaped.
	 */
	struct ProcessCallbacks
	{
		std::function<void(LogChannel, const std::string &)> onLine;
		std::function<void(const ExitInfo &)> onExit;
	};

	/**
	 * @brief Creates engine subprocesses
	 */
	class IProcessLauncher
	{
	public:
		virtual ~IProcessLauncher() = default;

		/**
		 * @brief Spawn a subprocess
		 *
		 * @param spec Binary, arguments, working directory and environment
		 * @param callbacks Output and exit notifications
		 * @param error Receives a message when the process could not be created
		 * @return std::shared_ptr<IEngineProcess> Process handle, or nullptr on failure
		 */
		virtual std::shared_ptr<IEngineProcess> spawn(const EngineLaunchSpec &spec, ProcessCallbacks callbacks,
													  std::string &error) = 0;
	};

	/**
	 * @brief Turns configuration into a concrete launch spec at start time
	 */
	class IEngineRuntimeResolver
	{
	public:
		virtual ~IEngineRuntimeResolver() = default;

		/**
		 * @brief Resolve the binary, directories, arguments and environment
		 *
		 * @param spec Receives the launch spec
		 * @param error Receives a message when the engine cannot be located
		 * @return true on success
		 */
		virtual bool resolve(EngineLaunchSpec &spec, std::string &error) = 0;
	};

	/**
	 * @brief Snapshot of the supervisor state
	 *
	 * pid is set if and only if status is Starting, Running or Stopping.
	 */
	struct EngineProcessState
	{
		EngineStatus status = EngineStatus::Stopped;
		std::optional<int> pid;
		std::string binaryPath;
		std::vector<std::string> args;
		std::optional<std::int64_t> startedAtMs;
		std::optional<std::int64_t> stoppedAtMs;
		std::string lastError;
		int restartAttempts = 0;
		bool allowAutoRestart = true;
		std::optional<std::int64_t> lastUnexpectedExitAtMs;
	};

	/**
	 * @brief Status as reported to clients
	 */
	struct EngineStatusReport
	{
		bool ok = true;
		EngineStatus status = EngineStatus::Stopped;
		std::optional<int> pid;
		std::string binaryPath;
		std::vector<std::string> args;
		std::optional<std::int64_t> startedAtMs;
		std::optional<std::int64_t> stoppedAtMs;
		bool autoStartEnabled = true;
		bool autoRestartEnabled = true;
		int restartAttempts = 0;
		int restartMaxAttempts = 0;
		std::string lastError;
	};

	void to_json(nlohmann::json &j, const EngineStatusReport &report);

} // namespace GranuBridge
