#include "EngineProcess.h"

#include <csignal>
#include <sstream>

namespace GranuBridge
{
	std::string engineStatusToString(EngineStatus status)
	{
		switch (status)
		{
		case EngineStatus::Stopped:
			return "stopped";
		case EngineStatus::Starting:
			return "starting";
		case EngineStatus::Running:
			return "running";
		case EngineStatus::Stopping:
			return "stopping";
		case EngineStatus::Error:
			return "error";
		}
		return "error";
	}

	std::string signalName(int signal)
	{
		switch (signal)
		{
		case SIGHUP:
			return "SIGHUP";
		case SIGINT:
			return "SIGINT";
		case SIGQUIT:
			return "SIGQUIT";
		case SIGILL:
			return "SIGILL";
		case SIGABRT:
			return "SIGABRT";
		case SIGFPE:
			return "SIGFPE";
		case SIGKILL:
			return "SIGKILL";
		case SIGSEGV:
			return "SIGSEGV";
		case SIGPIPE:
			return "SIGPIPE";
		case SIGALRM:
			return "SIGALRM";
		case SIGTERM:
			return "SIGTERM";
		case SIGBUS:
			return "SIGBUS";
		case SIGUSR1:
			return "SIGUSR1";
		case SIGUSR2:
			return "SIGUSR2";
		default:
			return "SIG" + std::to_string(signal);
		}
	}

	std::string describeExit(const ExitInfo &exit)
	{
		std::ostringstream out;
		out << "code=" << (exit.code ? std::to_string(*exit.code) : std::string("null"))
			<< ", signal=" << (exit.signal ? signalName(*exit.signal) : std::string("null"));
		return out.str();
	}

	void to_json(nlohmann::json &j, const EngineStatusReport &report)
	{
		j = nlohmann::json{
			{"ok", report.ok},
			{"status", engineStatusToString(report.status)},
			{"pid", nullptr},
			{"binaryPath", report.binaryPath.empty() ? nlohmann::json(nullptr) : nlohmann::json(report.binaryPath)},
			{"args", report.args},
			{"startedAtMs", nullptr},
			{"stoppedAtMs", nullptr},
			{"autoStartEnabled", report.autoStartEnabled},
			{"autoRestartEnabled", report.autoRestartEnabled},
			{"restartAttempts", report.restartAttempts},
			{"restartMaxAttempts", report.restartMaxAttempts},
			{"lastError", report.lastError.empty() ? nlohmann::json(nullptr) : nlohmann::json(report.lastError)}};

		if (report.pid)
		{
			j["pid"] = *report.pid;
		}
		if (report.startedAtMs)
		{
			j["startedAtMs"] = *report.startedAtMs;
		}
		if (report.stoppedAtMs)
		{
			j["stoppedAtMs"] = *report.stoppedAtMs;
		}
	}

} // namespace GranuBridge
