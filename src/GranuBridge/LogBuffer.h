#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	enum class LogChannel
	{
		Stdout,
		Stderr,
		System
	};

	std::string logChannelToString(LogChannel channel);

	/**
	 * @brief One stored line of engine output or supervisor event
	 */
	struct LogEntry
	{
		std::int64_t timestampMs = 0;
		LogChannel channel = LogChannel::System;
		std::string line;
	};

	void to_json(nlohmann::json &j, const LogEntry &entry);

	/**
	 * @brief Bounded ring of log lines
	 *
	 * Every appended chunk is split into lines; each line is trimmed and empty
	 * lines are dropped. When the ring is full the oldest entry is discarded.
	 */
	class LogBuffer
	{
	public:
		static constexpr size_t kDefaultLimit = 400;
		static constexpr size_t kMinLimit = 50;
		static constexpr size_t kMaxLimit = 2000;

		/**
		 * @brief Constructor
		 *
		 * @param limit Capacity, bounded to [kMinLimit, kMaxLimit]
		 */
		explicit LogBuffer(size_t limit = kDefaultLimit);

		/**
		 * @brief Append text to the buffer
		 *
		 * @param channel Source of the text
		 * @param text One or more lines
		 * @param timestampMs Wall-clock timestamp for the new entries
		 * @return size_t Number of entries stored
		 */
		size_t append(LogChannel channel, const std::string &text, std::int64_t timestampMs);

		/**
		 * @brief Most recent entries, oldest first
		 *
		 * @param limit Maximum number of entries to return
		 */
		std::vector<LogEntry> entries(size_t limit) const;

		size_t size() const { return m_entries.size(); }
		size_t limit() const { return m_limit; }
		void clear() { m_entries.clear(); }

		/**
		 * @brief Register a callback invoked for every stored entry
		 *
		 * @return int Callback ID for later removal
		 */
		int addListener(std::function<void(const LogEntry &)> callback);
		void removeListener(int callbackId);

	private:
		size_t m_limit;
		std::deque<LogEntry> m_entries;
		std::map<int, std::function<void(const LogEntry &)>> m_listeners;
		int m_nextListenerId;
	};

} // namespace GranuBridge
