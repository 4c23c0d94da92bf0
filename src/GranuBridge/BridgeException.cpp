#include "BridgeException.h"

#include <unordered_map>

namespace GranuBridge
{
	std::string BridgeException::getErrorDescription(ErrorCode code)
	{
		static const std::unordered_map<ErrorCode, std::string> descriptions = {
			{ErrorCode::None, "No error"},
			{ErrorCode::ConfigurationError, "Configuration error"},
			{ErrorCode::SocketError, "Socket error"}};

		auto it = descriptions.find(code);
		if (it != descriptions.end())
		{
			return it->second;
		}

		return "Unknown error";
	}

} // namespace GranuBridge
