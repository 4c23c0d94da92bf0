#include "CommandRelay.h"
#include "TelemetryParser.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace GranuBridge
{
	void to_json(nlohmann::json &j, const SendResult &result)
	{
		j = nlohmann::json{{"sent", result.sent}};
		if (result.rateLimited)
		{
			j["rateLimited"] = true;
		}
		if (!result.error.empty())
		{
			j["error"] = result.error;
		}
		if (!result.address.empty())
		{
			j["address"] = result.address;
		}
		if (result.channel)
		{
			j["channel"] = *result.channel;
		}
		if (result.value)
		{
			j["value"] = *result.value;
		}
	}

	void to_json(nlohmann::json &j, const BatchResult &result)
	{
		j = nlohmann::json{
			{"total", result.total},
			{"sentCount", result.sentCount},
			{"droppedCount", result.droppedCount},
			{"results", result.results}};
	}

	void to_json(nlohmann::json &j, const RelayStats &stats)
	{
		j = nlohmann::json{
			{"sent", stats.sent},
			{"droppedRateLimited", stats.droppedRateLimited},
			{"rejectedValidation", stats.rejectedValidation},
			{"transportErrors", stats.transportErrors}};
	}

	CommandRelay::CommandRelay(const RelayConfig &config, IOscTransport &transport, IScheduler &scheduler)
		: m_config(config), m_transport(transport), m_scheduler(scheduler),
		  m_rateLimiter(config.maxMessagesPerSecond)
	{
		m_config.channelPrefix = Configuration::normalizePrefix(m_config.channelPrefix);
		m_config.channelCount = std::max(1, m_config.channelCount);
	}

	bool CommandRelay::open()
	{
		std::string error;
		if (!m_transport.open(m_config.targetHost, m_config.targetPort, error))
		{
			m_lastError = error;
			std::cerr << "CommandRelay: Failed to open OSC target " << m_config.targetHost << ":"
					  << m_config.targetPort << ": " << error << std::endl;
			return false;
		}

		m_lastError.clear();
		std::cout << "CommandRelay: OSC ready, forwarding to " << m_config.targetHost << ":"
				  << m_config.targetPort << std::endl;
		return true;
	}

	void CommandRelay::close()
	{
		m_transport.close();
	}

	bool CommandRelay::configure(const std::string &host, int port)
	{
		m_config.targetHost = host;
		m_config.targetPort = port;
		return open();
	}

	std::string CommandRelay::validate(const CommandRequest &request, std::vector<NormalizedArgument> &args)
	{
		if (request.address.empty() || request.address.front() != '/')
		{
			return "invalid_address";
		}

		args.clear();
		args.reserve(request.args.size());
		for (const auto &arg : request.args)
		{
			if (arg.type == 's')
			{
				if (const auto *text = std::get_if<std::string>(&arg.value))
				{
					args.emplace_back(*text);
				}
				else
				{
					std::ostringstream out;
					out << std::get<double>(arg.value);
					args.emplace_back(out.str());
				}
				continue;
			}

			if (arg.type != 'i' && arg.type != 'f' && arg.type != 'd')
			{
				return "invalid_arg";
			}

			const auto number = numericValue(arg.value);
			if (!number)
			{
				return "invalid_arg";
			}

			switch (arg.type)
			{
			case 'i':
			{
				const double truncated = std::trunc(*number);
				if (truncated < static_cast<double>(INT32_MIN) || truncated > static_cast<double>(INT32_MAX))
				{
					return "invalid_arg";
				}
				args.emplace_back(static_cast<std::int32_t>(truncated));
				break;
			}
			case 'f':
				args.emplace_back(static_cast<float>(*number));
				break;
			default:
				args.emplace_back(*number);
				break;
			}
		}

		return std::string();
	}

	SendResult CommandRelay::send(const CommandRequest &request)
	{
		std::vector<NormalizedArgument> args;
		const std::string validationError = validate(request, args);
		if (!validationError.empty())
		{
			++m_stats.rejectedValidation;
			SendResult result;
			result.error = validationError;
			return result;
		}

		const bool hasKey = request.rateLimitKey && !request.rateLimitKey->empty();
		return dispatch(request.address, args, hasKey ? *request.rateLimitKey : request.address);
	}

	int CommandRelay::clampChannel(int channel) const
	{
		return std::max(1, std::min(m_config.channelCount, channel));
	}

	std::string CommandRelay::channelAddress(int channel) const
	{
		std::ostringstream out;
		out << m_config.channelPrefix << "/" << std::setw(2) << std::setfill('0') << clampChannel(channel);
		return out.str();
	}

	SendResult CommandRelay::sendChannel(int channel, double value)
	{
		const int safeChannel = clampChannel(channel);
		const double safeValue = TelemetryParser::clamp01(value);
		const std::string address = channelAddress(safeChannel);

		std::ostringstream key;
		key << "channel:" << std::setw(2) << std::setfill('0') << safeChannel;

		SendResult result = dispatch(address, {static_cast<float>(safeValue)}, key.str());
		result.address = address;
		result.channel = safeChannel;
		result.value = safeValue;
		return result;
	}

	BatchResult CommandRelay::sendBatch(const std::vector<CommandRequest> &requests)
	{
		BatchResult batch;
		batch.total = requests.size();
		batch.results.reserve(requests.size());
		for (const auto &request : requests)
		{
			batch.results.push_back(send(request));
			if (batch.results.back().sent)
			{
				++batch.sentCount;
			}
			else if (batch.results.back().rateLimited)
			{
				++batch.droppedCount;
			}
		}
		return batch;
	}

	BatchResult CommandRelay::sendChannelBatch(const std::vector<ChannelUpdate> &updates)
	{
		BatchResult batch;
		batch.total = updates.size();
		batch.results.reserve(updates.size());
		for (const auto &update : updates)
		{
			batch.results.push_back(sendChannel(update.channel, update.value));
			if (batch.results.back().sent)
			{
				++batch.sentCount;
			}
			else if (batch.results.back().rateLimited)
			{
				++batch.droppedCount;
			}
		}
		return batch;
	}

	SendResult CommandRelay::dispatch(const std::string &address, const std::vector<NormalizedArgument> &args,
									  const std::string &rateLimitKey)
	{
		SendResult result;

		if (!m_transport.isReady())
		{
			result.error = "transport_not_ready";
			return result;
		}

		if (!m_rateLimiter.tryAcquire(rateLimitKey, m_scheduler.nowMs()))
		{
			++m_stats.droppedRateLimited;
			result.rateLimited = true;
			return result;
		}

		std::string error;
		if (!m_transport.send(address, args, error))
		{
			++m_stats.transportErrors;
			m_lastError = error;
			std::cerr << "CommandRelay: Failed to send " << address << " " << describeArguments(args)
					  << " to " << m_config.targetHost << ":" << m_config.targetPort << ": " << error << std::endl;
			// Later sends fail fast until the transport is re-opened
			m_transport.close();
			result.error = error.empty() ? std::string("osc_send_failed") : error;
			return result;
		}

		++m_stats.sent;
		result.sent = true;
		return result;
	}

} // namespace GranuBridge
