#pragma once

#include "OscTypes.h"

#include <string>
#include <vector>

#include <lo/lo.h>

namespace GranuBridge
{
	/**
	 * @brief Outbound OSC datagram channel to the engine
	 *
	 * The Command Relay only talks to this interface, so the socket layer can be
	 * replaced in tests.
	 */
	class IOscTransport
	{
	public:
		virtual ~IOscTransport() = default;

		/**
		 * @brief Open (or re-open) the channel towards a target
		 *
		 * @param host Target host name or address
		 * @param port Target UDP port
		 * @param error Receives a message on failure
		 * @return true if the channel is ready to send
		 */
		virtual bool open(const std::string &host, int port, std::string &error) = 0;

		/**
		 * @brief Close the channel; isReady() is false afterwards
		 */
		virtual void close() = 0;

		virtual bool isReady() const = 0;

		/**
		 * @brief Encode and send one OSC message
		 *
		 * @param address OSC address path
		 * @param args Normalised arguments
		 * @param error Receives a message on failure
		 * @return true if the datagram was handed to the socket
		 */
		virtual bool send(const std::string &address, const std::vector<NormalizedArgument> &args,
						  std::string &error) = 0;
	};

	/**
	 * @brief IOscTransport over a liblo UDP address
	 */
	class LibloOscTransport : public IOscTransport
	{
	public:
		LibloOscTransport();
		~LibloOscTransport() override;

		LibloOscTransport(const LibloOscTransport &) = delete;
		LibloOscTransport &operator=(const LibloOscTransport &) = delete;

		bool open(const std::string &host, int port, std::string &error) override;
		void close() override;
		bool isReady() const override { return m_ready; }
		bool send(const std::string &address, const std::vector<NormalizedArgument> &args,
				  std::string &error) override;

	private:
		lo_address m_oscAddress;
		bool m_ready;
		std::string m_targetHost;
		int m_targetPort;
	};

} // namespace GranuBridge
