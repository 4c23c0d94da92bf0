#pragma once

#include "CommandRelay.h"
#include "OscTypes.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief One reason a client payload was rejected
	 *
	 * path is a JSON array of keys and indices leading to the offending value.
	 */
	struct ValidationIssue
	{
		nlohmann::json path = nlohmann::json::array();
		std::string code;
		std::string message;
	};

	using ValidationIssues = std::vector<ValidationIssue>;

	void to_json(nlohmann::json &j, const ValidationIssue &issue);

	/**
	 * @brief Kinds of message a WebSocket client may send
	 */
	enum class ClientMessageType
	{
		Ping,
		ChannelSet,
		ChannelsSet,
		OscSend,
		OscBatch
	};

	/**
	 * @brief A validated WebSocket message
	 *
	 * Only the member matching type is filled in.
	 */
	struct ClientMessage
	{
		ClientMessageType type = ClientMessageType::Ping;
		ChannelUpdate channel;
		std::vector<ChannelUpdate> channels;
		CommandRequest request;
		std::vector<CommandRequest> requests;
	};

	/**
	 * @brief Schema checks and envelopes for gateway payloads
	 *
	 * Every parse function leaves its output untouched and appends to issues
	 * when the payload does not match.
	 */
	namespace GatewayMessages
	{
		constexpr int kMinChannel = 1;
		constexpr int kMaxChannel = 64;
		constexpr size_t kMinBatchItems = 1;
		constexpr size_t kMaxBatchItems = 64;

		/**
		 * @brief Parse {channel, value}
		 *
		 * channel must be an integer in [1, 64] and value a number in [0, 1].
		 */
		bool parseChannelUpdate(const nlohmann::json &payload, ChannelUpdate &update, ValidationIssues &issues,
								const nlohmann::json &path = nlohmann::json::array());

		/**
		 * @brief Parse {channels: [{channel, value}, ...]} with 1 to 64 items
		 */
		bool parseChannelBatch(const nlohmann::json &payload, std::vector<ChannelUpdate> &updates,
							   ValidationIssues &issues, const nlohmann::json &path = nlohmann::json::array());

		/**
		 * @brief Parse {address, args?, rateLimitKey?}
		 *
		 * address must be non-empty and start with '/'. Each argument is
		 * {type, value} with type one of f, i, d, s and value a number or string.
		 */
		bool parseCommandRequest(const nlohmann::json &payload, CommandRequest &request, ValidationIssues &issues,
								 const nlohmann::json &path = nlohmann::json::array());

		/**
		 * @brief Parse {messages: [request, ...]} with 1 to 64 items
		 */
		bool parseCommandBatch(const nlohmann::json &payload, std::vector<CommandRequest> &requests,
							   ValidationIssues &issues, const nlohmann::json &path = nlohmann::json::array());

		/**
		 * @brief Parse a WebSocket envelope {type, payload}
		 *
		 * @param message Parsed JSON document
		 * @param result Receives the validated message
		 * @param issues Receives the problems found
		 * @return true if the message is valid
		 */
		bool parseClientMessage(const nlohmann::json &message, ClientMessage &result, ValidationIssues &issues);

		/**
		 * @brief Build {type, payload}
		 */
		nlohmann::json envelope(const std::string &type, const nlohmann::json &payload);

		/**
		 * @brief Build {error: "validation_failed", issues}
		 */
		nlohmann::json validationFailure(const ValidationIssues &issues);

		/**
		 * @brief Build {total, sentCount, droppedCount}
		 */
		nlohmann::json batchSummary(const BatchResult &batch);

		/**
		 * @brief Human-readable name of a JSON value's type, as used in issue messages
		 */
		std::string typeName(const nlohmann::json &value);
	}

} // namespace GranuBridge
