#include "TelemetryParser.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace GranuBridge
{
	namespace
	{
		std::optional<HelloArgument> normalizeHelloArgument(const OscArgument &arg)
		{
			if (const auto *text = std::get_if<std::string>(&arg))
			{
				std::string trimmed = trim(*text);
				if (trimmed.empty())
				{
					return std::nullopt;
				}
				return HelloArgument(std::move(trimmed));
			}
			if (const auto *flag = std::get_if<bool>(&arg))
			{
				return HelloArgument(*flag);
			}

			if (auto value = numericValue(arg))
			{
				return HelloArgument(*value);
			}

			// Non-finite floats are kept as text
			const double raw = std::holds_alternative<float>(arg) ? static_cast<double>(std::get<float>(arg))
																   : std::get<double>(arg);
			if (std::isnan(raw))
			{
				return HelloArgument(std::string("NaN"));
			}
			return HelloArgument(std::string(raw > 0 ? "Infinity" : "-Infinity"));
		}
	}

	std::map<std::string, std::string> TelemetryHelloSample::argsMap() const
	{
		std::map<std::string, std::string> map;
		for (const auto &arg : args)
		{
			const auto *text = std::get_if<std::string>(&arg);
			if (!text)
			{
				continue;
			}

			const std::string trimmed = trim(*text);
			const size_t separator = trimmed.find('=');
			if (separator == std::string::npos || separator == 0)
			{
				continue;
			}

			const std::string key = trim(trimmed.substr(0, separator));
			if (key.empty())
			{
				continue;
			}
			map[key] = trim(trimmed.substr(separator + 1));
		}
		return map;
	}

	void to_json(nlohmann::json &j, const TelemetryHelloSample &hello)
	{
		nlohmann::json args = nlohmann::json::array();
		for (const auto &arg : hello.args)
		{
			std::visit([&args](const auto &v)
					   { args.push_back(v); },
					   arg);
		}

		j = nlohmann::json{
			{"timestampMs", hello.timestampMs},
			{"address", hello.address},
			{"args", args},
			{"argsMap", hello.argsMap()}};
	}

	void to_json(nlohmann::json &j, const TelemetryScanSample &scan)
	{
		j = nlohmann::json{
			{"timestampMs", scan.timestampMs},
			{"playheadNorm", scan.playheadNorm},
			{"scanHeadNorm", scan.scanHeadNorm},
			{"scanRangeNorm", scan.scanRangeNorm},
			{"soundFileFrames", nullptr},
			{"activeGrainCount", scan.activeGrainCount()},
			{"activeGrainIndices", scan.activeGrainIndices},
			{"activeGrainNormPositions", scan.activeGrainNormPositions}};
		if (scan.soundFileFrames)
		{
			j["soundFileFrames"] = *scan.soundFileFrames;
		}
	}

	void to_json(nlohmann::json &j, const ScanStats &stats)
	{
		j = nlohmann::json{
			{"count", stats.count},
			{"elapsedMs", stats.elapsedMs},
			{"cadenceHz", stats.cadenceHz},
			{"playheadSpan", stats.playheadSpan},
			{"scanHeadSpan", stats.scanHeadSpan},
			{"scanRangeSpan", stats.scanRangeSpan},
			{"activeGrainMax", stats.activeGrainMax}};
	}

	namespace TelemetryParser
	{
		double clamp01(double value)
		{
			if (!std::isfinite(value))
			{
				return 0.0;
			}
			return std::min(1.0, std::max(0.0, value));
		}

		std::optional<TelemetryScanSample> parseScan(const OscMessage &message,
													 const std::string &scanAddress,
													 std::int64_t timestampMs)
		{
			if (message.address != scanAddress || message.args.size() < 3)
			{
				return std::nullopt;
			}

			const auto playhead = numericValue(message.args[0]);
			const auto scanHead = numericValue(message.args[1]);
			const auto scanRange = numericValue(message.args[2]);
			if (!playhead || !scanHead || !scanRange)
			{
				return std::nullopt;
			}

			TelemetryScanSample sample;
			sample.timestampMs = timestampMs;
			sample.playheadNorm = clamp01(*playhead);
			sample.scanHeadNorm = clamp01(*scanHead);
			sample.scanRangeNorm = clamp01(*scanRange);

			if (message.args.size() >= 4)
			{
				const auto frames = numericValue(message.args[3]);
				if (frames && *frames > 1.0)
				{
					sample.soundFileFrames = static_cast<std::int64_t>(std::trunc(*frames));
				}
			}

			for (size_t i = 4; i < message.args.size() && sample.activeGrainIndices.size() < kMaxGrainIndices; ++i)
			{
				const auto value = numericValue(message.args[i]);
				if (!value)
				{
					continue;
				}
				sample.activeGrainIndices.push_back(std::max<std::int64_t>(0, static_cast<std::int64_t>(std::trunc(*value))));
			}

			sample.activeGrainNormPositions.reserve(sample.activeGrainIndices.size());
			for (const std::int64_t index : sample.activeGrainIndices)
			{
				if (sample.soundFileFrames && *sample.soundFileFrames > 1)
				{
					sample.activeGrainNormPositions.push_back(
						clamp01(static_cast<double>(index) / static_cast<double>(*sample.soundFileFrames)));
				}
				else
				{
					sample.activeGrainNormPositions.push_back(clamp01(static_cast<double>(index)));
				}
			}

			return sample;
		}

		std::optional<TelemetryHelloSample> parseHello(const OscMessage &message,
													   const std::string &helloAddress,
													   std::int64_t timestampMs)
		{
			if (message.address != helloAddress)
			{
				return std::nullopt;
			}

			TelemetryHelloSample hello;
			hello.timestampMs = timestampMs;
			hello.address = message.address;
			for (const auto &arg : message.args)
			{
				auto normalized = normalizeHelloArgument(arg);
				if (!normalized)
				{
					continue;
				}
				hello.args.push_back(std::move(*normalized));
				if (hello.args.size() >= kMaxHelloArgs)
				{
					break;
				}
			}
			return hello;
		}

		ScanStats computeScanStats(const std::vector<TelemetryScanSample> &scans)
		{
			ScanStats stats;
			if (scans.empty())
			{
				return stats;
			}

			double minPlayhead = std::numeric_limits<double>::max();
			double maxPlayhead = std::numeric_limits<double>::lowest();
			double minScanHead = minPlayhead;
			double maxScanHead = maxPlayhead;
			double minScanRange = minPlayhead;
			double maxScanRange = maxPlayhead;

			for (const auto &scan : scans)
			{
				minPlayhead = std::min(minPlayhead, scan.playheadNorm);
				maxPlayhead = std::max(maxPlayhead, scan.playheadNorm);
				minScanHead = std::min(minScanHead, scan.scanHeadNorm);
				maxScanHead = std::max(maxScanHead, scan.scanHeadNorm);
				minScanRange = std::min(minScanRange, scan.scanRangeNorm);
				maxScanRange = std::max(maxScanRange, scan.scanRangeNorm);
				stats.activeGrainMax = std::max(stats.activeGrainMax, scan.activeGrainCount());
			}

			stats.count = scans.size();
			stats.elapsedMs = std::max<std::int64_t>(0, scans.back().timestampMs - scans.front().timestampMs);
			const double elapsedSeconds = static_cast<double>(stats.elapsedMs) / 1000.0;
			stats.cadenceHz = elapsedSeconds > 0 ? static_cast<double>(stats.count) / elapsedSeconds : 0.0;
			stats.playheadSpan = std::max(0.0, maxPlayhead - minPlayhead);
			stats.scanHeadSpan = std::max(0.0, maxScanHead - minScanHead);
			stats.scanRangeSpan = std::max(0.0, maxScanRange - minScanRange);
			return stats;
		}
	}

} // namespace GranuBridge
