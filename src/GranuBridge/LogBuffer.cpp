#include "LogBuffer.h"
#include "OscTypes.h"

#include <algorithm>
#include <sstream>

namespace GranuBridge
{
	std::string logChannelToString(LogChannel channel)
	{
		switch (channel)
		{
		case LogChannel::Stdout:
			return "stdout";
		case LogChannel::Stderr:
			return "stderr";
		case LogChannel::System:
			return "system";
		}
		return "system";
	}

	void to_json(nlohmann::json &j, const LogEntry &entry)
	{
		j = nlohmann::json{
			{"timestampMs", entry.timestampMs},
			{"channel", logChannelToString(entry.channel)},
			{"line", entry.line}};
	}

	LogBuffer::LogBuffer(size_t limit)
		: m_limit(std::clamp(limit, kMinLimit, kMaxLimit)), m_nextListenerId(1)
	{
	}

	size_t LogBuffer::append(LogChannel channel, const std::string &text, std::int64_t timestampMs)
	{
		size_t stored = 0;
		std::istringstream lines(text);
		std::string line;
		while (std::getline(lines, line))
		{
			std::string trimmed = trim(line);
			if (trimmed.empty())
			{
				continue;
			}

			m_entries.push_back(LogEntry{timestampMs, channel, std::move(trimmed)});
			while (m_entries.size() > m_limit)
			{
				m_entries.pop_front();
			}
			++stored;

			// Listeners may unsubscribe while being notified
			const LogEntry entry = m_entries.back();
			const auto listeners = m_listeners;
			for (const auto &[id, listener] : listeners)
			{
				listener(entry);
			}
		}
		return stored;
	}

	std::vector<LogEntry> LogBuffer::entries(size_t limit) const
	{
		const size_t count = std::min(limit, m_entries.size());
		return std::vector<LogEntry>(m_entries.end() - static_cast<std::ptrdiff_t>(count), m_entries.end());
	}

	int LogBuffer::addListener(std::function<void(const LogEntry &)> callback)
	{
		const int id = m_nextListenerId++;
		m_listeners[id] = std::move(callback);
		return id;
	}

	void LogBuffer::removeListener(int callbackId)
	{
		m_listeners.erase(callbackId);
	}

} // namespace GranuBridge
