#include "GatewayMessages.h"

#include <cmath>

namespace GranuBridge
{
	void to_json(nlohmann::json &j, const ValidationIssue &issue)
	{
		j = nlohmann::json{
			{"code", issue.code},
			{"path", issue.path},
			{"message", issue.message}};
	}

	namespace GatewayMessages
	{
		namespace
		{
			nlohmann::json childPath(const nlohmann::json &path, const nlohmann::json &key)
			{
				nlohmann::json child = path;
				child.push_back(key);
				return child;
			}

			void addIssue(ValidationIssues &issues, const nlohmann::json &path, const std::string &code,
						  const std::string &message)
			{
				ValidationIssue issue;
				issue.path = path;
				issue.code = code;
				issue.message = message;
				issues.push_back(std::move(issue));
			}

			void addTypeIssue(ValidationIssues &issues, const nlohmann::json &path, const std::string &expected,
							  const nlohmann::json &received)
			{
				addIssue(issues, path, "invalid_type",
						 "Expected " + expected + ", received " + typeName(received));
			}

			bool requireObject(const nlohmann::json &payload, ValidationIssues &issues, const nlohmann::json &path)
			{
				if (!payload.is_object())
				{
					addTypeIssue(issues, path, "object", payload);
					return false;
				}
				return true;
			}

			const nlohmann::json *findMember(const nlohmann::json &object, const char *key)
			{
				const auto it = object.find(key);
				return it == object.end() ? nullptr : &(*it);
			}

			bool requireNumber(const nlohmann::json *value, ValidationIssues &issues, const nlohmann::json &path,
							   double &number)
			{
				if (!value)
				{
					addIssue(issues, path, "invalid_type", "Required");
					return false;
				}
				if (!value->is_number())
				{
					addTypeIssue(issues, path, "number", *value);
					return false;
				}
				number = value->get<double>();
				return true;
			}

			bool checkRange(double number, double minValue, double maxValue, ValidationIssues &issues,
							const nlohmann::json &path)
			{
				if (number < minValue)
				{
					std::string message = "Number must be greater than or equal to " + nlohmann::json(minValue).dump();
					addIssue(issues, path, "too_small", message);
					return false;
				}
				if (number > maxValue)
				{
					std::string message = "Number must be less than or equal to " + nlohmann::json(maxValue).dump();
					addIssue(issues, path, "too_big", message);
					return false;
				}
				return true;
			}

			const nlohmann::json *requireArray(const nlohmann::json &payload, const char *key, ValidationIssues &issues,
											   const nlohmann::json &path)
			{
				const nlohmann::json itemsPath = childPath(path, key);
				const nlohmann::json *items = findMember(payload, key);
				if (!items)
				{
					addIssue(issues, itemsPath, "invalid_type", "Required");
					return nullptr;
				}
				if (!items->is_array())
				{
					addTypeIssue(issues, itemsPath, "array", *items);
					return nullptr;
				}
				if (items->size() < kMinBatchItems)
				{
					addIssue(issues, itemsPath, "too_small", "Array must contain at least 1 element(s)");
					return nullptr;
				}
				if (items->size() > kMaxBatchItems)
				{
					addIssue(issues, itemsPath, "too_big",
							 "Array must contain at most " + std::to_string(kMaxBatchItems) + " element(s)");
					return nullptr;
				}
				return items;
			}

			bool parseCommandArgument(const nlohmann::json &payload, CommandArgument &argument,
									  ValidationIssues &issues, const nlohmann::json &path)
			{
				if (!requireObject(payload, issues, path))
				{
					return false;
				}

				bool ok = true;
				const nlohmann::json typePath = childPath(path, "type");
				const nlohmann::json *type = findMember(payload, "type");
				if (!type)
				{
					addIssue(issues, typePath, "invalid_type", "Required");
					ok = false;
				}
				else if (!type->is_string())
				{
					addTypeIssue(issues, typePath, "'f' | 'i' | 'd' | 's'", *type);
					ok = false;
				}
				else
				{
					const std::string tag = type->get<std::string>();
					if (tag != "f" && tag != "i" && tag != "d" && tag != "s")
					{
						addIssue(issues, typePath, "invalid_enum_value",
								 "Invalid enum value. Expected 'f' | 'i' | 'd' | 's', received '" + tag + "'");
						ok = false;
					}
					else
					{
						argument.type = tag[0];
					}
				}

				const nlohmann::json valuePath = childPath(path, "value");
				const nlohmann::json *value = findMember(payload, "value");
				if (!value)
				{
					addIssue(issues, valuePath, "invalid_type", "Required");
					ok = false;
				}
				else if (value->is_number())
				{
					argument.value = value->get<double>();
				}
				else if (value->is_string())
				{
					argument.value = value->get<std::string>();
				}
				else
				{
					addIssue(issues, valuePath, "invalid_union", "Expected number or string, received " + typeName(*value));
					ok = false;
				}

				return ok;
			}
		}

		std::string typeName(const nlohmann::json &value)
		{
			switch (value.type())
			{
			case nlohmann::json::value_t::null:
				return "null";
			case nlohmann::json::value_t::object:
				return "object";
			case nlohmann::json::value_t::array:
				return "array";
			case nlohmann::json::value_t::string:
				return "string";
			case nlohmann::json::value_t::boolean:
				return "boolean";
			case nlohmann::json::value_t::number_integer:
			case nlohmann::json::value_t::number_unsigned:
			case nlohmann::json::value_t::number_float:
				return "number";
			default:
				return "undefined";
			}
		}

		bool parseChannelUpdate(const nlohmann::json &payload, ChannelUpdate &update, ValidationIssues &issues,
								const nlohmann::json &path)
		{
			if (!requireObject(payload, issues, path))
			{
				return false;
			}

			bool ok = true;
			double channel = 0.0;
			const nlohmann::json channelPath = childPath(path, "channel");
			if (!requireNumber(findMember(payload, "channel"), issues, channelPath, channel))
			{
				ok = false;
			}
			else if (std::trunc(channel) != channel)
			{
				addIssue(issues, channelPath, "invalid_type", "Expected integer, received float");
				ok = false;
			}
			else if (!checkRange(channel, kMinChannel, kMaxChannel, issues, channelPath))
			{
				ok = false;
			}

			double value = 0.0;
			const nlohmann::json valuePath = childPath(path, "value");
			if (!requireNumber(findMember(payload, "value"), issues, valuePath, value) ||
				!checkRange(value, 0.0, 1.0, issues, valuePath))
			{
				ok = false;
			}

			if (ok)
			{
				update.channel = static_cast<int>(channel);
				update.value = value;
			}
			return ok;
		}

		bool parseChannelBatch(const nlohmann::json &payload, std::vector<ChannelUpdate> &updates,
							   ValidationIssues &issues, const nlohmann::json &path)
		{
			if (!requireObject(payload, issues, path))
			{
				return false;
			}

			const nlohmann::json *items = requireArray(payload, "channels", issues, path);
			if (!items)
			{
				return false;
			}

			const nlohmann::json itemsPath = childPath(path, "channels");
			std::vector<ChannelUpdate> parsed(items->size());
			bool ok = true;
			for (size_t i = 0; i < items->size(); ++i)
			{
				ok = parseChannelUpdate((*items)[i], parsed[i], issues, childPath(itemsPath, i)) && ok;
			}

			if (ok)
			{
				updates = std::move(parsed);
			}
			return ok;
		}

		bool parseCommandRequest(const nlohmann::json &payload, CommandRequest &request, ValidationIssues &issues,
								 const nlohmann::json &path)
		{
			if (!requireObject(payload, issues, path))
			{
				return false;
			}

			CommandRequest parsed;
			bool ok = true;

			const nlohmann::json addressPath = childPath(path, "address");
			const nlohmann::json *address = findMember(payload, "address");
			if (!address)
			{
				addIssue(issues, addressPath, "invalid_type", "Required");
				ok = false;
			}
			else if (!address->is_string())
			{
				addTypeIssue(issues, addressPath, "string", *address);
				ok = false;
			}
			else
			{
				parsed.address = address->get<std::string>();
				if (parsed.address.empty())
				{
					addIssue(issues, addressPath, "too_small", "String must contain at least 1 character(s)");
					ok = false;
				}
				else if (parsed.address.front() != '/')
				{
					addIssue(issues, addressPath, "invalid_string", "OSC addresses must start with /");
					ok = false;
				}
			}

			// args defaults to an empty list
			const nlohmann::json argsPath = childPath(path, "args");
			const nlohmann::json *args = findMember(payload, "args");
			if (args && !args->is_null())
			{
				if (!args->is_array())
				{
					addTypeIssue(issues, argsPath, "array", *args);
					ok = false;
				}
				else
				{
					parsed.args.resize(args->size());
					for (size_t i = 0; i < args->size(); ++i)
					{
						ok = parseCommandArgument((*args)[i], parsed.args[i], issues, childPath(argsPath, i)) && ok;
					}
				}
			}

			const nlohmann::json *key = findMember(payload, "rateLimitKey");
			if (key && !key->is_null())
			{
				if (!key->is_string())
				{
					addTypeIssue(issues, childPath(path, "rateLimitKey"), "string", *key);
					ok = false;
				}
				else
				{
					parsed.rateLimitKey = key->get<std::string>();
				}
			}

			if (ok)
			{
				request = std::move(parsed);
			}
			return ok;
		}

		bool parseCommandBatch(const nlohmann::json &payload, std::vector<CommandRequest> &requests,
							   ValidationIssues &issues, const nlohmann::json &path)
		{
			if (!requireObject(payload, issues, path))
			{
				return false;
			}

			const nlohmann::json *items = requireArray(payload, "messages", issues, path);
			if (!items)
			{
				return false;
			}

			const nlohmann::json itemsPath = childPath(path, "messages");
			std::vector<CommandRequest> parsed(items->size());
			bool ok = true;
			for (size_t i = 0; i < items->size(); ++i)
			{
				ok = parseCommandRequest((*items)[i], parsed[i], issues, childPath(itemsPath, i)) && ok;
			}

			if (ok)
			{
				requests = std::move(parsed);
			}
			return ok;
		}

		bool parseClientMessage(const nlohmann::json &message, ClientMessage &result, ValidationIssues &issues)
		{
			const nlohmann::json root = nlohmann::json::array();
			if (!requireObject(message, issues, root))
			{
				return false;
			}

			const nlohmann::json typePath = childPath(root, "type");
			const nlohmann::json *type = findMember(message, "type");
			if (!type || !type->is_string())
			{
				addIssue(issues, typePath, "invalid_union_discriminator",
						 "Invalid discriminator value. Expected 'ping' | 'channel:set' | 'channels:set' | "
						 "'osc:send' | 'osc:batch'");
				return false;
			}

			const std::string name = type->get<std::string>();
			if (name == "ping")
			{
				result = ClientMessage();
				result.type = ClientMessageType::Ping;
				return true;
			}

			const nlohmann::json payloadPath = childPath(root, "payload");
			const nlohmann::json *payload = findMember(message, "payload");
			const nlohmann::json missing;
			const nlohmann::json &body = payload ? *payload : missing;

			ClientMessage parsed;
			bool ok = false;
			if (name == "channel:set")
			{
				parsed.type = ClientMessageType::ChannelSet;
				ok = parseChannelUpdate(body, parsed.channel, issues, payloadPath);
			}
			else if (name == "channels:set")
			{
				parsed.type = ClientMessageType::ChannelsSet;
				ok = parseChannelBatch(body, parsed.channels, issues, payloadPath);
			}
			else if (name == "osc:send")
			{
				parsed.type = ClientMessageType::OscSend;
				ok = parseCommandRequest(body, parsed.request, issues, payloadPath);
			}
			else if (name == "osc:batch")
			{
				parsed.type = ClientMessageType::OscBatch;
				ok = parseCommandBatch(body, parsed.requests, issues, payloadPath);
			}
			else
			{
				addIssue(issues, typePath, "invalid_union_discriminator",
						 "Invalid discriminator value. Expected 'ping' | 'channel:set' | 'channels:set' | "
						 "'osc:send' | 'osc:batch'");
				return false;
			}

			if (ok)
			{
				result = std::move(parsed);
			}
			return ok;
		}

		nlohmann::json envelope(const std::string &type, const nlohmann::json &payload)
		{
			return nlohmann::json{{"type", type}, {"payload", payload}};
		}

		nlohmann::json validationFailure(const ValidationIssues &issues)
		{
			return nlohmann::json{{"error", "validation_failed"}, {"issues", issues}};
		}

		nlohmann::json batchSummary(const BatchResult &batch)
		{
			return nlohmann::json{
				{"total", batch.total},
				{"sentCount", batch.sentCount},
				{"droppedCount", batch.droppedCount}};
		}
	}

} // namespace GranuBridge
