#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace GranuBridge
{
	/**
	 * @brief Clock and one-shot timer source used by every timed component
	 *
	 * The supervisor watchdog, the rate limiter and the telemetry capture window
	 * never touch a clock or a timer directly. They go through this interface so
	 * that tests can drive them with a virtual clock.
	 */
	class IScheduler
	{
	public:
		using TimerId = std::uint64_t;
		using Task = std::function<void()>;

		virtual ~IScheduler() = default;

		/**
		 * @brief Monotonic time in milliseconds, used for intervals
		 */
		virtual std::int64_t nowMs() const = 0;

		/**
		 * @brief Wall-clock time in milliseconds since the Unix epoch, used for timestamps
		 */
		virtual std::int64_t wallClockMs() const = 0;

		/**
		 * @brief Run a task once after a delay
		 *
		 * @param delayMs Delay in milliseconds (negative values are treated as 0)
		 * @param task Task to run on the scheduler's thread
		 * @return TimerId Handle that can be passed to cancel()
		 */
		virtual TimerId scheduleAfter(std::int64_t delayMs, Task task) = 0;

		/**
		 * @brief Cancel a pending task
		 *
		 * @param id Handle returned from scheduleAfter()
		 * @return true if the task was still pending and will not run
		 */
		virtual bool cancel(TimerId id) = 0;
	};

	/**
	 * @brief Scheduler backed by steady timers on a Boost.Asio io_context
	 */
	class AsioScheduler : public IScheduler
	{
	public:
		explicit AsioScheduler(boost::asio::io_context &ioContext);
		~AsioScheduler() override;

		std::int64_t nowMs() const override;
		std::int64_t wallClockMs() const override;
		TimerId scheduleAfter(std::int64_t delayMs, Task task) override;
		bool cancel(TimerId id) override;

		/**
		 * @brief Number of tasks that have not fired or been cancelled yet
		 */
		size_t pendingCount() const { return m_timers.size(); }

	private:
		struct PendingTimer
		{
			std::unique_ptr<boost::asio::steady_timer> timer;
			Task task;
		};

		boost::asio::io_context &m_ioContext;
		std::map<TimerId, PendingTimer> m_timers;
		TimerId m_nextId;
	};

	/**
	 * @brief Scheduler with a virtual clock that only moves when advanced
	 *
	 * Tasks run inside advance(), in due-time order, with the clock set to each
	 * task's due time while it runs. Tasks scheduled from inside a task are
	 * honoured in the same advance() call if they fall due within it.
	 */
	class ManualScheduler : public IScheduler
	{
	public:
		explicit ManualScheduler(std::int64_t startMs = 0, std::int64_t wallClockOffsetMs = 1700000000000);

		std::int64_t nowMs() const override { return m_nowMs; }
		std::int64_t wallClockMs() const override { return m_wallClockOffsetMs + m_nowMs; }
		TimerId scheduleAfter(std::int64_t delayMs, Task task) override;
		bool cancel(TimerId id) override;

		/**
		 * @brief Move the clock forward, running every task that falls due
		 *
		 * @param deltaMs Amount of virtual time to advance
		 * @return int Number of tasks that ran
		 */
		int advance(std::int64_t deltaMs);

		/**
		 * @brief Advance straight to the next pending task and run it
		 *
		 * @return true if a task ran
		 */
		bool runNext();

		size_t pendingCount() const { return m_tasks.size(); }

		/**
		 * @brief Delay of the next pending task relative to now, or -1 if none
		 */
		std::int64_t nextDelayMs() const;

	private:
		struct PendingTask
		{
			std::int64_t dueMs;
			Task task;
		};

		std::int64_t m_nowMs;
		std::int64_t m_wallClockOffsetMs;
		std::map<TimerId, PendingTask> m_tasks;
		TimerId m_nextId;
	};

} // namespace GranuBridge
