#include "PosixProcessLauncher.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/post.hpp>

extern char **environ;

namespace GranuBridge
{
	namespace
	{
		bool makePipe(int fds[2])
		{
			if (::pipe(fds) != 0)
			{
				return false;
			}
			::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
			::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
			return true;
		}

		void closeFd(int &fd)
		{
			if (fd >= 0)
			{
				::close(fd);
				fd = -1;
			}
		}

		// Inherited environment with the overrides applied, as KEY=VALUE strings
		std::vector<std::string> buildEnvironment(const std::map<std::string, std::string> &overrides)
		{
			std::vector<std::string> entries;
			for (char **env = environ; env && *env; ++env)
			{
				const std::string entry(*env);
				const std::string key = entry.substr(0, entry.find('='));
				if (overrides.find(key) == overrides.end())
				{
					entries.push_back(entry);
				}
			}
			for (const auto &[key, value] : overrides)
			{
				entries.push_back(key + "=" + value);
			}
			return entries;
		}

		std::vector<char *> toPointerArray(std::vector<std::string> &strings)
		{
			std::vector<char *> pointers;
			pointers.reserve(strings.size() + 1);
			for (auto &s : strings)
			{
				pointers.push_back(s.data());
			}
			pointers.push_back(nullptr);
			return pointers;
		}

		// Only async-signal-safe calls between fork and exec
		[[noreturn]] void childExec(const char *workingDirectory, int stdoutFd, int stderrFd, int statusFd,
									char *const argv[], char *const envp[])
		{
			int err = 0;

			if (workingDirectory && workingDirectory[0] != '\0' && ::chdir(workingDirectory) != 0)
			{
				err = errno;
			}

			if (err == 0)
			{
				const int devNull = ::open("/dev/null", O_RDONLY);
				if (devNull >= 0)
				{
					::dup2(devNull, STDIN_FILENO);
					::close(devNull);
				}
				if (::dup2(stdoutFd, STDOUT_FILENO) < 0 || ::dup2(stderrFd, STDERR_FILENO) < 0)
				{
					err = errno;
				}
			}

			if (err == 0)
			{
				::execve(argv[0], argv, envp);
				err = errno;
			}

			ssize_t written;
			do
			{
				written = ::write(statusFd, &err, sizeof(err));
			} while (written < 0 && errno == EINTR);
			::_exit(127);
		}
	}

	PosixEngineProcess::PosixEngineProcess(boost::asio::io_context &ioContext, int pid, int statusFd, int stdoutFd,
										   int stderrFd, ProcessCallbacks callbacks)
		: m_ioContext(ioContext), m_pid(pid), m_statusFd(statusFd),
		  m_callbacks(std::move(callbacks)), m_reaped(false)
	{
		m_stdout.channel = LogChannel::Stdout;
		m_stdout.descriptor = std::make_unique<boost::asio::posix::stream_descriptor>(ioContext, stdoutFd);
		m_stderr.channel = LogChannel::Stderr;
		m_stderr.descriptor = std::make_unique<boost::asio::posix::stream_descriptor>(ioContext, stderrFd);
	}

	PosixEngineProcess::~PosixEngineProcess()
	{
		closeFd(m_statusFd);
		if (!m_reaped && m_pid > 0)
		{
			// Never leave an orphan or a zombie behind
			::kill(m_pid, SIGKILL);
			int status = 0;
			while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR)
			{
			}
			m_reaped = true;
		}
	}

	bool PosixEngineProcess::awaitSpawn(std::string &error)
	{
		if (m_statusFd < 0)
		{
			return !m_reaped;
		}

		int childErrno = 0;
		ssize_t count;
		do
		{
			count = ::read(m_statusFd, &childErrno, sizeof(childErrno));
		} while (count < 0 && errno == EINTR);
		closeFd(m_statusFd);

		if (count <= 0)
		{
			// The pipe closed on exec
			return true;
		}

		error = std::string("exec failed: ") + std::strerror(childErrno);

		int status = 0;
		pid_t result;
		do
		{
			result = ::waitpid(m_pid, &status, 0);
		} while (result < 0 && errno == EINTR);

		// A failed spawn is reported by the caller, not as an exit
		markExited(status, false);
		closeStreams();
		return false;
	}

	bool PosixEngineProcess::signal(int signal)
	{
		if (m_reaped || m_pid <= 0)
		{
			return false;
		}
		return ::kill(m_pid, signal) == 0;
	}

	void PosixEngineProcess::startReading()
	{
		readNext(m_stdout);
		readNext(m_stderr);
	}

	void PosixEngineProcess::readNext(OutputStream &stream)
	{
		if (!stream.descriptor || !stream.descriptor->is_open())
		{
			return;
		}

		auto self = shared_from_this();
		stream.descriptor->async_read_some(boost::asio::buffer(stream.buffer),
										   [self, &stream](const boost::system::error_code &ec, std::size_t bytes)
										   {
											   if (bytes > 0)
											   {
												   stream.pending.append(stream.buffer.data(), bytes);
												   self->emitLines(stream, false);
											   }

											   if (ec)
											   {
												   // EOF or the descriptor was closed
												   self->emitLines(stream, true);
												   if (stream.descriptor)
												   {
													   boost::system::error_code ignored;
													   stream.descriptor->close(ignored);
												   }
												   return;
											   }

											   self->readNext(stream);
										   });
	}

	void PosixEngineProcess::emitLines(OutputStream &stream, bool flush)
	{
		size_t newline;
		while ((newline = stream.pending.find('\n')) != std::string::npos)
		{
			std::string line = stream.pending.substr(0, newline);
			stream.pending.erase(0, newline + 1);
			if (!line.empty() && line.back() == '\r')
			{
				line.pop_back();
			}
			if (m_callbacks.onLine)
			{
				m_callbacks.onLine(stream.channel, line);
			}
		}

		if (flush && !stream.pending.empty())
		{
			std::string line;
			line.swap(stream.pending);
			if (m_callbacks.onLine)
			{
				m_callbacks.onLine(stream.channel, line);
			}
		}
	}

	void PosixEngineProcess::closeStreams()
	{
		for (OutputStream *stream : {&m_stdout, &m_stderr})
		{
			if (stream->descriptor && stream->descriptor->is_open())
			{
				boost::system::error_code ignored;
				stream->descriptor->close(ignored);
			}
		}
	}

	bool PosixEngineProcess::tryReap()
	{
		if (m_reaped)
		{
			return true;
		}

		int status = 0;
		const pid_t result = ::waitpid(m_pid, &status, WNOHANG);
		if (result == 0)
		{
			return false;
		}
		if (result < 0)
		{
			if (errno == EINTR)
			{
				return false;
			}
			// ECHILD: someone else reaped it; report an unknown exit
			std::cerr << "PosixProcessLauncher: waitpid(" << m_pid << ") failed: " << std::strerror(errno) << std::endl;
			markExited(-1, true);
			return true;
		}

		markExited(status, true);
		return true;
	}

	void PosixEngineProcess::markExited(int waitStatus, bool notify)
	{
		m_reaped = true;

		ExitInfo exit;
		if (waitStatus >= 0)
		{
			if (WIFEXITED(waitStatus))
			{
				exit.code = WEXITSTATUS(waitStatus);
			}
			else if (WIFSIGNALED(waitStatus))
			{
				exit.signal = WTERMSIG(waitStatus);
			}
		}

		if (notify && m_callbacks.onExit)
		{
			auto self = shared_from_this();
			boost::asio::post(m_ioContext, [self, exit]()
							  { self->m_callbacks.onExit(exit); });
		}
	}

	PosixProcessLauncher::PosixProcessLauncher(boost::asio::io_context &ioContext)
		: m_ioContext(ioContext), m_signals(ioContext, SIGCHLD)
	{
		armSignalWait();
	}

	PosixProcessLauncher::~PosixProcessLauncher()
	{
		boost::system::error_code ignored;
		m_signals.cancel(ignored);
	}

	void PosixProcessLauncher::armSignalWait()
	{
		m_signals.async_wait([this](const boost::system::error_code &ec, int)
							 {
			if (ec == boost::asio::error::operation_aborted)
			{
				return;
			}
			reapChildren();
			armSignalWait(); });
	}

	void PosixProcessLauncher::reapChildren()
	{
		for (auto it = m_children.begin(); it != m_children.end();)
		{
			auto child = it->second.lock();
			if (!child || child->tryReap())
			{
				it = m_children.erase(it);
			}
			else
			{
				++it;
			}
		}
	}

	std::shared_ptr<IEngineProcess> PosixProcessLauncher::spawn(const EngineLaunchSpec &spec, ProcessCallbacks callbacks,
																std::string &error)
	{
		if (spec.binaryPath.empty())
		{
			error = "engine_binary_not_found";
			return nullptr;
		}

		std::vector<std::string> argvStrings;
		argvStrings.push_back(spec.binaryPath);
		argvStrings.insert(argvStrings.end(), spec.args.begin(), spec.args.end());
		std::vector<std::string> envStrings = buildEnvironment(spec.environment);
		std::vector<char *> argv = toPointerArray(argvStrings);
		std::vector<char *> envp = toPointerArray(envStrings);

		int statusPipe[2] = {-1, -1};
		int stdoutPipe[2] = {-1, -1};
		int stderrPipe[2] = {-1, -1};
		if (!makePipe(statusPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe))
		{
			error = std::string("pipe failed: ") + std::strerror(errno);
			for (int *fd : {&statusPipe[0], &statusPipe[1], &stdoutPipe[0], &stdoutPipe[1], &stderrPipe[0], &stderrPipe[1]})
			{
				closeFd(*fd);
			}
			return nullptr;
		}

		const pid_t pid = ::fork();
		if (pid < 0)
		{
			error = std::string("fork failed: ") + std::strerror(errno);
			for (int *fd : {&statusPipe[0], &statusPipe[1], &stdoutPipe[0], &stdoutPipe[1], &stderrPipe[0], &stderrPipe[1]})
			{
				closeFd(*fd);
			}
			return nullptr;
		}

		if (pid == 0)
		{
			childExec(spec.workingDirectory.c_str(), stdoutPipe[1], stderrPipe[1], statusPipe[1],
					  argv.data(), envp.data());
		}

		closeFd(statusPipe[1]);
		closeFd(stdoutPipe[1]);
		closeFd(stderrPipe[1]);

		auto process = std::make_shared<PosixEngineProcess>(m_ioContext, pid, statusPipe[0], stdoutPipe[0],
															stderrPipe[0], std::move(callbacks));
		process->startReading();
		m_children[pid] = process;

		// The child may already have exited before the SIGCHLD handler saw it
		boost::asio::post(m_ioContext, [this]()
						  { reapChildren(); });

		return process;
	}

} // namespace GranuBridge
