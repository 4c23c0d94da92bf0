#pragma once

#include <functional>
#include <optional>
#include <string>

namespace GranuBridge
{
	class Configuration;

	/**
	 * @brief Fills a Configuration from JSON files, environment variables and command-line flags
	 *
	 * Precedence, lowest first: built-in defaults, JSON file, environment, command line.
	 */
	class ConfigurationParser
	{
	public:
		using EnvironmentLookup = std::function<const char *(const char *)>;

		/**
		 * @brief Outcome of parsing the command line
		 */
		struct CommandLineResult
		{
			bool ok = true;
			bool showHelp = false;
			std::string configFile;
			std::string saveConfigFile;
			std::string error;
		};

		/**
		 * @brief Full load: JSON file named by --config, then environment, then flags
		 *
		 * @param argc Argument count
		 * @param argv Argument values
		 * @param config Configuration to fill
		 * @param lookup Environment lookup (defaults to the process environment)
		 * @return CommandLineResult Parse outcome
		 */
		static CommandLineResult load(int argc, char *argv[], Configuration &config,
									  const EnvironmentLookup &lookup = EnvironmentLookup());

		/**
		 * @brief Parse configuration from command line arguments
		 *
		 * @param argc Argument count
		 * @param argv Argument values
		 * @param config Configuration to fill
		 * @return CommandLineResult Parse outcome
		 */
		static CommandLineResult parseCommandLine(int argc, char *argv[], Configuration &config);

		/**
		 * @brief Parse configuration from a JSON file
		 *
		 * @param filePath Path to the JSON file
		 * @param config Configuration to fill
		 * @return bool True if parsing was successful
		 */
		static bool parseJsonFile(const std::string &filePath, Configuration &config);

		/**
		 * @brief Parse configuration from a JSON string
		 *
		 * @param jsonContent JSON content as string
		 * @param config Configuration to fill
		 * @return bool True if parsing was successful
		 */
		static bool parseJsonString(const std::string &jsonContent, Configuration &config);

		/**
		 * @brief Apply the BRIDGE_*, OSC_*, TELEMETRY_* and GRANUPOSE_ENGINE_* variables
		 *
		 * Values that are missing or unparsable leave the current setting untouched.
		 *
		 * @param config Configuration to update
		 * @param lookup Environment lookup (defaults to the process environment)
		 */
		static void applyEnvironment(Configuration &config, const EnvironmentLookup &lookup = EnvironmentLookup());

		/**
		 * @brief Parse an integer, truncating and clamping it
		 *
		 * @param raw Text to parse
		 * @param fallback Value when the text is not a finite number
		 * @param minValue Lower bound
		 * @param maxValue Upper bound
		 */
		static int parseBoundedInt(const std::string &raw, int fallback, int minValue, int maxValue);

		/**
		 * @brief Parse 1/true/yes/on or 0/false/no/off, case-insensitively
		 */
		static std::optional<bool> parseBoolean(const std::string &raw);

		/**
		 * @brief Usage text for --help
		 */
		static std::string usage(const std::string &programName);
	};

} // namespace GranuBridge
