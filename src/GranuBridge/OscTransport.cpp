#include "OscTransport.h"

#include <iostream>
#include <type_traits>

namespace GranuBridge
{
	LibloOscTransport::LibloOscTransport()
		: m_oscAddress(nullptr), m_ready(false), m_targetPort(0)
	{
	}

	LibloOscTransport::~LibloOscTransport()
	{
		close();
	}

	bool LibloOscTransport::open(const std::string &host, int port, std::string &error)
	{
		close();

		if (port < 1 || port > 65535)
		{
			error = "invalid_port";
			return false;
		}

		m_oscAddress = lo_address_new(host.c_str(), std::to_string(port).c_str());
		if (!m_oscAddress)
		{
			error = "Failed to create OSC address for " + host + ":" + std::to_string(port);
			std::cerr << "LibloOscTransport: " << error << std::endl;
			return false;
		}

		lo_address_set_ttl(m_oscAddress, 4);

		m_targetHost = host;
		m_targetPort = port;
		m_ready = true;
		return true;
	}

	void LibloOscTransport::close()
	{
		if (m_oscAddress)
		{
			lo_address_free(m_oscAddress);
			m_oscAddress = nullptr;
		}
		m_ready = false;
	}

	bool LibloOscTransport::send(const std::string &address, const std::vector<NormalizedArgument> &args,
								 std::string &error)
	{
		if (!m_ready || !m_oscAddress)
		{
			error = "transport_not_ready";
			return false;
		}

		lo_message msg = lo_message_new();
		if (!msg)
		{
			error = "Failed to create OSC message";
			return false;
		}

		for (const auto &arg : args)
		{
			std::visit([msg](const auto &value)
					   {
				using T = std::decay_t<decltype(value)>;
				if constexpr (std::is_same_v<T, std::int32_t>)
				{
					lo_message_add_int32(msg, value);
				}
				else if constexpr (std::is_same_v<T, float>)
				{
					lo_message_add_float(msg, value);
				}
				else if constexpr (std::is_same_v<T, double>)
				{
					lo_message_add_double(msg, value);
				}
				else
				{
					lo_message_add_string(msg, value.c_str());
				} },
					   arg);
		}

		const int result = lo_send_message(m_oscAddress, address.c_str(), msg);
		lo_message_free(msg);

		if (result == -1)
		{
			const char *reason = lo_address_errstr(m_oscAddress);
			error = reason ? reason : "osc_send_failed";
			// A failed socket will not recover on its own
			m_ready = false;
			return false;
		}

		return true;
	}

} // namespace GranuBridge
