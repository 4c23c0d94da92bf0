#pragma once

#include "Configuration.h"
#include "TransportGateway.h"

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace GranuBridge
{
	/**
	 * @brief TCP listener serving the gateway over HTTP and WebSocket
	 *
	 * Plain HTTP requests are answered through TransportGateway::handleHttp.
	 * An upgrade request on /ws becomes a push-channel client of the gateway.
	 */
	class GatewayServer
	{
	public:
		/**
		 * @brief Default limit on an HTTP request body in bytes
		 */
		static constexpr size_t kBodyLimit = 512 * 1024;

		/**
		 * @brief Constructor
		 *
		 * @param ioContext Event loop the sockets run on
		 * @param gateway Protocol handler
		 * @param config Listen address, allowed origin and client queue limit
		 */
		GatewayServer(boost::asio::io_context &ioContext, TransportGateway &gateway, const GatewayConfig &config);
		~GatewayServer();

		GatewayServer(const GatewayServer &) = delete;
		GatewayServer &operator=(const GatewayServer &) = delete;

		/**
		 * @brief Bind the listener and start accepting connections
		 *
		 * @throws BridgeException (SocketError) if the address cannot be bound
		 */
		void start();

		/**
		 * @brief Stop accepting connections
		 */
		void stop();

		bool isListening() const { return m_acceptor.is_open(); }

		/**
		 * @brief Port actually bound (differs from the configured one when that was 0)
		 */
		int boundPort() const { return m_boundPort; }

	private:
		void doAccept();

		boost::asio::io_context &m_ioContext;
		TransportGateway &m_gateway;
		GatewayConfig m_config;
		boost::asio::ip::tcp::acceptor m_acceptor;
		int m_boundPort;
	};

} // namespace GranuBridge
