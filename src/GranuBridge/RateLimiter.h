#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace GranuBridge
{
	/**
	 * @brief Per-key minimum-interval gate
	 *
	 * Each key remembers the monotonic time of its last accepted message. A new
	 * message for the key is accepted only when at least floor(1000 / rate)
	 * milliseconds have passed. Entries are never removed.
	 */
	class RateLimiter
	{
	public:
		/**
		 * @brief Constructor
		 *
		 * @param maxMessagesPerSecond Maximum rate per key (0 or less disables limiting)
		 */
		explicit RateLimiter(int maxMessagesPerSecond = 60);

		/**
		 * @brief Try to accept a message for a key
		 *
		 * @param key Rate-limit key (explicit key or OSC address)
		 * @param nowMs Current monotonic time in milliseconds
		 * @return true if the message may be sent, false if it must be dropped
		 */
		bool tryAcquire(const std::string &key, std::int64_t nowMs);

		/**
		 * @brief Change the rate; existing timestamps are kept
		 */
		void setMaxMessagesPerSecond(int maxMessagesPerSecond);

		int getMaxMessagesPerSecond() const { return m_maxMessagesPerSecond; }
		std::int64_t getMinIntervalMs() const { return m_minIntervalMs; }

		/**
		 * @brief Last accepted timestamp for a key, or -1 if the key was never seen
		 */
		std::int64_t lastSentMs(const std::string &key) const;

		size_t keyCount() const { return m_lastSent.size(); }

	private:
		int m_maxMessagesPerSecond;
		std::int64_t m_minIntervalMs;
		std::unordered_map<std::string, std::int64_t> m_lastSent;
	};

} // namespace GranuBridge
