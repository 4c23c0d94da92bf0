#pragma once

#include "OscTypes.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace GranuBridge
{
	/**
	 * @brief Normalised hello argument: string, number or boolean
	 */
	using HelloArgument = std::variant<std::string, double, bool>;

	/**
	 * @brief Latest identification message announced by the engine
	 */
	struct TelemetryHelloSample
	{
		std::int64_t timestampMs = 0;
		std::string address;
		std::vector<HelloArgument> args;

		/**
		 * @brief Decode every "key=value" string argument into a map
		 *
		 * Keys and values are trimmed; strings without '=' or with an empty key
		 * are skipped. Later duplicates win.
		 */
		std::map<std::string, std::string> argsMap() const;
	};

	/**
	 * @brief One decoded scan/playhead update
	 */
	struct TelemetryScanSample
	{
		std::int64_t timestampMs = 0;
		double playheadNorm = 0.0;
		double scanHeadNorm = 0.0;
		double scanRangeNorm = 0.0;
		std::optional<std::int64_t> soundFileFrames;
		std::vector<std::int64_t> activeGrainIndices;
		std::vector<double> activeGrainNormPositions;

		size_t activeGrainCount() const { return activeGrainIndices.size(); }
	};

	/**
	 * @brief Summary statistics over a window of scan samples
	 */
	struct ScanStats
	{
		size_t count = 0;
		std::int64_t elapsedMs = 0;
		double cadenceHz = 0.0;
		double playheadSpan = 0.0;
		double scanHeadSpan = 0.0;
		double scanRangeSpan = 0.0;
		size_t activeGrainMax = 0;
	};

	void to_json(nlohmann::json &j, const TelemetryHelloSample &hello);
	void to_json(nlohmann::json &j, const TelemetryScanSample &scan);
	void to_json(nlohmann::json &j, const ScanStats &stats);

	/**
	 * @brief Stateless decoding of engine telemetry messages
	 */
	namespace TelemetryParser
	{
		constexpr size_t kMaxHelloArgs = 32;
		constexpr size_t kMaxGrainIndices = 2048;

		/**
		 * @brief Clamp a value into [0,1]
		 */
		double clamp01(double value);

		/**
		 * @brief Decode a scan message
		 *
		 * Needs at least three arguments whose first three are numeric. Those are
		 * clamped to [0,1]. A fourth numeric argument greater than 1 is taken as
		 * the sound file frame count, and any further numeric arguments are
		 * grain indices.
		 *
		 * @param message Inbound message
		 * @param scanAddress Address scan messages are published on
		 * @param timestampMs Receive timestamp
		 * @return std::optional<TelemetryScanSample> Sample, or nothing when the
		 *         message is not a well-formed scan
		 */
		std::optional<TelemetryScanSample> parseScan(const OscMessage &message,
													 const std::string &scanAddress,
													 std::int64_t timestampMs);

		/**
		 * @brief Decode a hello message
		 *
		 * @param message Inbound message
		 * @param helloAddress Address hello messages are published on
		 * @param timestampMs Receive timestamp
		 * @return std::optional<TelemetryHelloSample> Sample, or nothing for another address
		 */
		std::optional<TelemetryHelloSample> parseHello(const OscMessage &message,
													   const std::string &helloAddress,
													   std::int64_t timestampMs);

		/**
		 * @brief Compute window statistics for a sequence of scans in arrival order
		 */
		ScanStats computeScanStats(const std::vector<TelemetryScanSample> &scans);
	}

} // namespace GranuBridge
