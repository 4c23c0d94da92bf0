#include "RateLimiter.h"

#include <algorithm>

namespace GranuBridge
{
	RateLimiter::RateLimiter(int maxMessagesPerSecond)
		: m_maxMessagesPerSecond(0), m_minIntervalMs(0)
	{
		setMaxMessagesPerSecond(maxMessagesPerSecond);
	}

	void RateLimiter::setMaxMessagesPerSecond(int maxMessagesPerSecond)
	{
		m_maxMessagesPerSecond = maxMessagesPerSecond;
		m_minIntervalMs = maxMessagesPerSecond > 0 ? 1000 / maxMessagesPerSecond : 0;
	}

	bool RateLimiter::tryAcquire(const std::string &key, std::int64_t nowMs)
	{
		if (m_minIntervalMs <= 0)
		{
			return true;
		}

		auto it = m_lastSent.find(key);
		if (it == m_lastSent.end())
		{
			m_lastSent.emplace(key, nowMs);
			return true;
		}

		if (nowMs - it->second < m_minIntervalMs)
		{
			return false;
		}

		// Timestamps never move backwards for a key
		it->second = std::max(it->second, nowMs);
		return true;
	}

	std::int64_t RateLimiter::lastSentMs(const std::string &key) const
	{
		auto it = m_lastSent.find(key);
		return it == m_lastSent.end() ? -1 : it->second;
	}

} // namespace GranuBridge
