#pragma once

#include <stdexcept>
#include <string>

namespace GranuBridge
{
	/**
	 * @brief Exception raised for conditions the bridge cannot recover from
	 *
	 * Recoverable failures (validation, rate limiting, a dropped datagram) are
	 * reported through return values. This type is reserved for problems that
	 * stop a top-level operation, such as failing to bind the gateway listener.
	 */
	class BridgeException : public std::runtime_error
	{
	public:
		/**
		 * @brief Error codes for bridge exceptions
		 */
		enum class ErrorCode
		{
			None = 0,
			ConfigurationError, ///< Configuration could not be loaded or is invalid
			SocketError			///< Socket could not be created or bound
		};

		/**
		 * @brief Construct a new bridge exception
		 * @param message Error message
		 * @param code Error code
		 */
		BridgeException(const std::string &message, ErrorCode code = ErrorCode::None)
			: std::runtime_error(message), m_code(code) {}

		/**
		 * @brief Get the error code
		 */
		ErrorCode code() const { return m_code; }

		/**
		 * @brief Get a description for an error code
		 * @param code The error code
		 * @return std::string The description
		 */
		static std::string getErrorDescription(ErrorCode code);

	private:
		ErrorCode m_code;
	};

} // namespace GranuBridge
