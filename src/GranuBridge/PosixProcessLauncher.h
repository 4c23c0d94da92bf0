#pragma once

#include "EngineProcess.h"

#include <array>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>

namespace GranuBridge
{
	class PosixProcessLauncher;

	/**
	 * @brief A forked child with its output pipes watched on the io_context
	 */
	class PosixEngineProcess : public IEngineProcess, public std::enable_shared_from_this<PosixEngineProcess>
	{
	public:
		PosixEngineProcess(boost::asio::io_context &ioContext, int pid, int statusFd, int stdoutFd, int stderrFd,
						   ProcessCallbacks callbacks);
		~PosixEngineProcess() override;

		PosixEngineProcess(const PosixEngineProcess &) = delete;
		PosixEngineProcess &operator=(const PosixEngineProcess &) = delete;

		int pid() const override { return m_pid; }
		bool awaitSpawn(std::string &error) override;
		bool signal(int signal) override;
		bool hasExited() const override { return m_reaped; }

		/**
		 * @brief Start the asynchronous reads on stdout and stderr
		 */
		void startReading();

		/**
		 * @brief Reap the child if it has exited and schedule the exit callback
		 *
		 * @return true once the child has been reaped
		 */
		bool tryReap();

	private:
		struct OutputStream
		{
			LogChannel channel;
			std::unique_ptr<boost::asio::posix::stream_descriptor> descriptor;
			std::array<char, 4096> buffer;
			std::string pending;
		};

		void readNext(OutputStream &stream);
		void emitLines(OutputStream &stream, bool flush);
		void closeStreams();
		void markExited(int waitStatus, bool notify);

		boost::asio::io_context &m_ioContext;
		int m_pid;
		int m_statusFd;
		OutputStream m_stdout;
		OutputStream m_stderr;
		ProcessCallbacks m_callbacks;
		bool m_reaped;
	};

	/**
	 * @brief IProcessLauncher using fork/execve and SIGCHLD on a Boost.Asio io_context
	 */
	class PosixProcessLauncher : public IProcessLauncher
	{
	public:
		explicit PosixProcessLauncher(boost::asio::io_context &ioContext);
		~PosixProcessLauncher() override;

		std::shared_ptr<IEngineProcess> spawn(const EngineLaunchSpec &spec, ProcessCallbacks callbacks,
											  std::string &error) override;

		/**
		 * @brief Number of children that have not been reaped yet
		 */
		size_t liveChildren() const { return m_children.size(); }

	private:
		void armSignalWait();
		void reapChildren();

		boost::asio::io_context &m_ioContext;
		boost::asio::signal_set m_signals;
		std::map<int, std::weak_ptr<PosixEngineProcess>> m_children;
	};

} // namespace GranuBridge
