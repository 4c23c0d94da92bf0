#include "GatewayServer.h"
#include "BridgeException.h"

#include <chrono>
#include <deque>
#include <iostream>
#include <optional>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

namespace GranuBridge
{
	namespace beast = boost::beast;
	namespace http = boost::beast::http;
	namespace websocket = boost::beast::websocket;
	using tcp = boost::asio::ip::tcp;

	namespace
	{
		const char *const kServerName = "granubridge";
		const char *const kWebSocketPath = "/ws";

		std::string toString(beast::string_view text)
		{
			return std::string(text.data(), text.size());
		}

		std::string requestPath(beast::string_view target)
		{
			std::string path = toString(target);
			const auto mark = path.find('?');
			if (mark != std::string::npos)
			{
				path.erase(mark);
			}
			return path;
		}

		/**
		 * @brief WebSocket client: one read loop and a bounded write queue
		 */
		class WebSocketSession : public IGatewayClient, public std::enable_shared_from_this<WebSocketSession>
		{
		public:
			WebSocketSession(tcp::socket &&socket, TransportGateway &gateway, size_t maxQueue)
				: m_ws(std::move(socket)), m_gateway(gateway), m_maxQueue(maxQueue), m_open(false), m_clientId(0)
			{
			}

			void run(http::request<http::string_body> request)
			{
				m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
				m_ws.set_option(websocket::stream_base::decorator(
					[](websocket::response_type &response)
					{
						response.set(http::field::server, kServerName);
					}));
				m_ws.async_accept(request, beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
			}

			bool isWritable() const override
			{
				return m_open && m_queue.size() < m_maxQueue;
			}

			void sendText(const std::string &text) override
			{
				if (!isWritable())
				{
					return;
				}
				m_queue.push_back(text);
				if (m_queue.size() == 1)
				{
					doWrite();
				}
			}

		private:
			void onAccept(beast::error_code ec)
			{
				if (ec)
				{
					std::cerr << "GatewayServer: WebSocket handshake failed: " << ec.message() << std::endl;
					return;
				}

				m_open = true;
				m_clientId = m_gateway.addClient(shared_from_this());
				doRead();
			}

			void doRead()
			{
				m_ws.async_read(m_buffer, beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
			}

			void onRead(beast::error_code ec, std::size_t)
			{
				if (ec)
				{
					if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted)
					{
						std::cerr << "GatewayServer: WebSocket read failed: " << ec.message() << std::endl;
					}
					detach();
					return;
				}

				const std::string text = beast::buffers_to_string(m_buffer.data());
				m_buffer.consume(m_buffer.size());
				m_gateway.handleClientMessage(*this, text);
				doRead();
			}

			void doWrite()
			{
				m_ws.text(true);
				m_ws.async_write(boost::asio::buffer(m_queue.front()),
								 beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
			}

			void onWrite(beast::error_code ec, std::size_t)
			{
				if (ec)
				{
					if (ec != boost::asio::error::operation_aborted)
					{
						std::cerr << "GatewayServer: WebSocket write failed: " << ec.message() << std::endl;
					}
					m_queue.clear();
					detach();
					return;
				}

				m_queue.pop_front();
				if (!m_queue.empty())
				{
					doWrite();
				}
			}

			void detach()
			{
				m_open = false;
				if (m_clientId != 0)
				{
					m_gateway.removeClient(m_clientId);
					m_clientId = 0;
				}
			}

			websocket::stream<beast::tcp_stream> m_ws;
			beast::flat_buffer m_buffer;
			TransportGateway &m_gateway;
			size_t m_maxQueue;
			std::deque<std::string> m_queue;
			bool m_open;
			int m_clientId;
		};

		/**
		 * @brief Plain HTTP connection; hands upgrade requests on /ws to WebSocketSession
		 */
		class HttpSession : public std::enable_shared_from_this<HttpSession>
		{
		public:
			HttpSession(tcp::socket &&socket, TransportGateway &gateway, const GatewayConfig &config)
				: m_stream(std::move(socket)), m_gateway(gateway), m_config(config)
			{
			}

			void run()
			{
				doRead();
			}

		private:
			void doRead()
			{
				m_parser.emplace();
				m_parser->body_limit(GatewayServer::kBodyLimit);
				m_stream.expires_after(std::chrono::milliseconds(m_config.httpTimeoutMs));
				http::async_read(m_stream, m_buffer, *m_parser,
								 beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
			}

			void onRead(beast::error_code ec, std::size_t)
			{
				if (ec == http::error::end_of_stream)
				{
					beast::error_code ignored;
					m_stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
					return;
				}
				if (ec)
				{
					if (ec == http::error::body_limit)
					{
						writeResponse(413, nlohmann::json{{"error", "payload_too_large"}}, 11, false);
						return;
					}
					if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted)
					{
						std::cerr << "GatewayServer: HTTP read failed: " << ec.message() << std::endl;
					}
					return;
				}

				http::request<http::string_body> request = m_parser->release();

				if (websocket::is_upgrade(request))
				{
					if (requestPath(request.target()) != kWebSocketPath)
					{
						writeResponse(404, nlohmann::json{{"error", "not_found"}}, request.version(), false);
						return;
					}
					m_stream.expires_never();
					std::make_shared<WebSocketSession>(m_stream.release_socket(), m_gateway, m_config.maxClientQueue)
						->run(std::move(request));
					return;
				}

				// Telemetry and engine routes may answer long after the read deadline
				m_stream.expires_never();

				const unsigned version = request.version();
				const bool keepAlive = request.keep_alive();
				auto self = shared_from_this();
				m_gateway.handleHttp(toString(request.method_string()), toString(request.target()),
									 request.body(),
									 [self, version, keepAlive](const HttpResponse &response)
									 {
										 self->writeResponse(response.status, response.body, version, keepAlive);
									 });
			}

			void writeResponse(unsigned status, const nlohmann::json &body, unsigned version, bool keepAlive)
			{
				auto response = std::make_shared<http::response<http::string_body>>(
					static_cast<http::status>(status), version);
				response->set(http::field::server, kServerName);
				response->set(http::field::access_control_allow_origin, m_config.allowedOrigin);
				response->set(http::field::access_control_allow_methods, "GET,POST,OPTIONS");
				response->set(http::field::access_control_allow_headers, "Content-Type");
				if (status != 204)
				{
					response->set(http::field::content_type, "application/json; charset=utf-8");
					response->body() = body.dump();
				}
				response->keep_alive(keepAlive);
				response->prepare_payload();

				m_stream.expires_after(std::chrono::milliseconds(m_config.httpTimeoutMs));
				auto self = shared_from_this();
				http::async_write(m_stream, *response,
								  [self, response](beast::error_code ec, std::size_t)
								  {
									  self->onWrite(ec, response->need_eof());
								  });
			}

			void onWrite(beast::error_code ec, bool close)
			{
				if (ec)
				{
					if (ec != boost::asio::error::operation_aborted)
					{
						std::cerr << "GatewayServer: HTTP write failed: " << ec.message() << std::endl;
					}
					return;
				}

				if (close)
				{
					beast::error_code ignored;
					m_stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
					return;
				}

				doRead();
			}

			beast::tcp_stream m_stream;
			beast::flat_buffer m_buffer;
			std::optional<http::request_parser<http::string_body>> m_parser;
			TransportGateway &m_gateway;
			GatewayConfig m_config;
		};
	}

	GatewayServer::GatewayServer(boost::asio::io_context &ioContext, TransportGateway &gateway,
								 const GatewayConfig &config)
		: m_ioContext(ioContext), m_gateway(gateway), m_config(config), m_acceptor(ioContext), m_boundPort(0)
	{
	}

	GatewayServer::~GatewayServer()
	{
		stop();
	}

	void GatewayServer::start()
	{
		beast::error_code ec;
		const boost::asio::ip::address address = boost::asio::ip::make_address(m_config.host, ec);
		if (ec)
		{
			throw BridgeException("Invalid gateway host '" + m_config.host + "': " + ec.message(),
								  BridgeException::ErrorCode::ConfigurationError);
		}

		const tcp::endpoint endpoint(address, static_cast<unsigned short>(m_config.port));
		const auto fail = [this](const std::string &what, const beast::error_code &error)
		{
			beast::error_code ignored;
			m_acceptor.close(ignored);
			throw BridgeException("Failed to " + what + " gateway listener on " + m_config.host + ":" +
									  std::to_string(m_config.port) + ": " + error.message(),
								  BridgeException::ErrorCode::SocketError);
		};

		m_acceptor.open(endpoint.protocol(), ec);
		if (ec)
		{
			fail("open", ec);
		}
		m_acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
		if (ec)
		{
			fail("configure", ec);
		}
		m_acceptor.bind(endpoint, ec);
		if (ec)
		{
			fail("bind", ec);
		}
		m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
		if (ec)
		{
			fail("listen on", ec);
		}

		m_boundPort = m_acceptor.local_endpoint().port();
		std::cout << "GatewayServer: Listening on http://" << m_config.host << ":" << m_boundPort
				  << " (WebSocket " << kWebSocketPath << ")" << std::endl;
		doAccept();
	}

	void GatewayServer::stop()
	{
		if (m_acceptor.is_open())
		{
			beast::error_code ec;
			m_acceptor.close(ec);
		}
	}

	void GatewayServer::doAccept()
	{
		m_acceptor.async_accept(m_ioContext,
								[this](beast::error_code ec, tcp::socket socket)
								{
									if (ec)
									{
										if (ec != boost::asio::error::operation_aborted)
										{
											std::cerr << "GatewayServer: Accept failed: " << ec.message() << std::endl;
											doAccept();
										}
										return;
									}

									std::make_shared<HttpSession>(std::move(socket), m_gateway, m_config)->run();
									doAccept();
								});
	}

} // namespace GranuBridge
