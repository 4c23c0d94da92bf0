#include "Scheduler.h"

#include <algorithm>
#include <chrono>

namespace GranuBridge
{
	AsioScheduler::AsioScheduler(boost::asio::io_context &ioContext)
		: m_ioContext(ioContext), m_nextId(1)
	{
	}

	AsioScheduler::~AsioScheduler()
	{
		for (auto &[id, pending] : m_timers)
		{
			pending.timer->cancel();
		}
		m_timers.clear();
	}

	std::int64_t AsioScheduler::nowMs() const
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
				   std::chrono::steady_clock::now().time_since_epoch())
			.count();
	}

	std::int64_t AsioScheduler::wallClockMs() const
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
				   std::chrono::system_clock::now().time_since_epoch())
			.count();
	}

	IScheduler::TimerId AsioScheduler::scheduleAfter(std::int64_t delayMs, Task task)
	{
		const TimerId id = m_nextId++;

		auto timer = std::make_unique<boost::asio::steady_timer>(m_ioContext);
		timer->expires_after(std::chrono::milliseconds(std::max<std::int64_t>(0, delayMs)));
		timer->async_wait([this, id](const boost::system::error_code &ec)
						  {
			if (ec == boost::asio::error::operation_aborted)
			{
				return;
			}

			auto it = m_timers.find(id);
			if (it == m_timers.end())
			{
				return;
			}

			// Detach the task before running it so it may reschedule or cancel freely
			Task due = std::move(it->second.task);
			m_timers.erase(it);
			if (due)
			{
				due();
			} });

		m_timers.emplace(id, PendingTimer{std::move(timer), std::move(task)});
		return id;
	}

	bool AsioScheduler::cancel(TimerId id)
	{
		auto it = m_timers.find(id);
		if (it == m_timers.end())
		{
			return false;
		}

		it->second.timer->cancel();
		m_timers.erase(it);
		return true;
	}

	ManualScheduler::ManualScheduler(std::int64_t startMs, std::int64_t wallClockOffsetMs)
		: m_nowMs(startMs), m_wallClockOffsetMs(wallClockOffsetMs), m_nextId(1)
	{
	}

	IScheduler::TimerId ManualScheduler::scheduleAfter(std::int64_t delayMs, Task task)
	{
		const TimerId id = m_nextId++;
		m_tasks.emplace(id, PendingTask{m_nowMs + std::max<std::int64_t>(0, delayMs), std::move(task)});
		return id;
	}

	bool ManualScheduler::cancel(TimerId id)
	{
		return m_tasks.erase(id) > 0;
	}

	std::int64_t ManualScheduler::nextDelayMs() const
	{
		if (m_tasks.empty())
		{
			return -1;
		}

		std::int64_t earliest = m_tasks.begin()->second.dueMs;
		for (const auto &[id, pending] : m_tasks)
		{
			earliest = std::min(earliest, pending.dueMs);
		}
		return std::max<std::int64_t>(0, earliest - m_nowMs);
	}

	int ManualScheduler::advance(std::int64_t deltaMs)
	{
		const std::int64_t targetMs = m_nowMs + std::max<std::int64_t>(0, deltaMs);
		int ran = 0;

		for (;;)
		{
			auto next = m_tasks.end();
			for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it)
			{
				if (it->second.dueMs > targetMs)
				{
					continue;
				}
				if (next == m_tasks.end() || it->second.dueMs < next->second.dueMs)
				{
					next = it;
				}
			}

			if (next == m_tasks.end())
			{
				break;
			}

			m_nowMs = std::max(m_nowMs, next->second.dueMs);
			Task due = std::move(next->second.task);
			m_tasks.erase(next);
			if (due)
			{
				due();
			}
			++ran;
		}

		m_nowMs = targetMs;
		return ran;
	}

	bool ManualScheduler::runNext()
	{
		const std::int64_t delay = nextDelayMs();
		if (delay < 0)
		{
			return false;
		}

		// advance() runs everything due at that instant, which includes the next task
		return advance(delay) > 0;
	}

} // namespace GranuBridge
