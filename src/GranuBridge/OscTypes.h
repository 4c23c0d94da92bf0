#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace GranuBridge
{
	/**
	 * @brief A single decoded OSC argument as received from the wire
	 */
	using OscArgument = std::variant<std::int32_t, std::int64_t, float, double, std::string, bool>;

	/**
	 * @brief A decoded inbound OSC message
	 */
	struct OscMessage
	{
		std::string address;
		std::vector<OscArgument> args;
	};

	/**
	 * @brief Value of an outbound command argument before normalisation
	 *
	 * Clients may send numbers as JSON numbers or as strings, so both are kept
	 * until the relay coerces them according to the type tag.
	 */
	using CommandValue = std::variant<double, std::string>;

	/**
	 * @brief Outbound command argument with its OSC type tag ('f', 'i', 'd' or 's')
	 */
	struct CommandArgument
	{
		char type = 'f';
		CommandValue value = 0.0;
	};

	/**
	 * @brief Outbound OSC command addressed to the engine
	 */
	struct CommandRequest
	{
		std::string address;
		std::vector<CommandArgument> args;
		std::optional<std::string> rateLimitKey;
	};

	/**
	 * @brief Outbound argument after normalisation, ready to be encoded
	 */
	using NormalizedArgument = std::variant<std::int32_t, float, double, std::string>;

	/**
	 * @brief Extract a finite number from an OSC argument
	 *
	 * Numeric arguments are returned as-is, booleans map to 1 or 0 and strings
	 * are parsed when they hold a complete finite number.
	 *
	 * @param arg Argument to inspect
	 * @return std::optional<double> The value, or nothing if the argument is not numeric
	 */
	std::optional<double> numericValue(const OscArgument &arg);

	/**
	 * @brief Parse a string holding a complete finite number
	 */
	std::optional<double> parseFiniteNumber(const std::string &text);

	/**
	 * @brief Extract a finite number from a command value
	 */
	std::optional<double> numericValue(const CommandValue &value);

	/**
	 * @brief Render an argument list as a short human-readable string for logs
	 */
	std::string describeArguments(const std::vector<NormalizedArgument> &args);

	/**
	 * @brief Strip leading and trailing whitespace
	 */
	std::string trim(const std::string &text);

} // namespace GranuBridge
