#include "OscTypes.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace GranuBridge
{
	std::string trim(const std::string &text)
	{
		size_t first = 0;
		size_t last = text.size();
		while (first < last && std::isspace(static_cast<unsigned char>(text[first])))
		{
			++first;
		}
		while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])))
		{
			--last;
		}
		return text.substr(first, last - first);
	}

	std::optional<double> parseFiniteNumber(const std::string &text)
	{
		const std::string trimmed = trim(text);
		if (trimmed.empty())
		{
			return std::nullopt;
		}

		errno = 0;
		char *end = nullptr;
		const double value = std::strtod(trimmed.c_str(), &end);
		if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE || !std::isfinite(value))
		{
			return std::nullopt;
		}
		return value;
	}

	std::optional<double> numericValue(const OscArgument &arg)
	{
		if (const auto *i32 = std::get_if<std::int32_t>(&arg))
		{
			return static_cast<double>(*i32);
		}
		if (const auto *i64 = std::get_if<std::int64_t>(&arg))
		{
			return static_cast<double>(*i64);
		}
		if (const auto *f = std::get_if<float>(&arg))
		{
			return std::isfinite(*f) ? std::optional<double>(*f) : std::nullopt;
		}
		if (const auto *d = std::get_if<double>(&arg))
		{
			return std::isfinite(*d) ? std::optional<double>(*d) : std::nullopt;
		}
		if (const auto *b = std::get_if<bool>(&arg))
		{
			return *b ? 1.0 : 0.0;
		}
		return parseFiniteNumber(std::get<std::string>(arg));
	}

	std::optional<double> numericValue(const CommandValue &value)
	{
		if (const auto *d = std::get_if<double>(&value))
		{
			return std::isfinite(*d) ? std::optional<double>(*d) : std::nullopt;
		}
		return parseFiniteNumber(std::get<std::string>(value));
	}

	std::string describeArguments(const std::vector<NormalizedArgument> &args)
	{
		std::ostringstream out;
		out << "[";
		for (size_t i = 0; i < args.size(); ++i)
		{
			if (i > 0)
			{
				out << ", ";
			}
			std::visit([&out](const auto &v)
					   { out << v; },
					   args[i]);
		}
		out << "]";
		return out.str();
	}

} // namespace GranuBridge
