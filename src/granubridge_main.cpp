#include "GranuBridge/BridgeException.h"
#include "GranuBridge/CommandRelay.h"
#include "GranuBridge/Configuration.h"
#include "GranuBridge/ConfigurationParser.h"
#include "GranuBridge/EngineRuntimeResolver.h"
#include "GranuBridge/GatewayServer.h"
#include "GranuBridge/LogBuffer.h"
#include "GranuBridge/OscTransport.h"
#include "GranuBridge/PosixProcessLauncher.h"
#include "GranuBridge/ProcessSupervisor.h"
#include "GranuBridge/Scheduler.h"
#include "GranuBridge/TelemetryListener.h"
#include "GranuBridge/TransportGateway.h"

#include <csignal>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

using namespace GranuBridge;

/**
 * @brief Main entry point for the engine control bridge
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code
 */
int main(int argc, char *argv[])
{
	Configuration config;
	const ConfigurationParser::CommandLineResult parsed = ConfigurationParser::load(argc, argv, config);
	if (parsed.showHelp)
	{
		std::cout << ConfigurationParser::usage(argv[0]);
		return 0;
	}
	if (!parsed.ok)
	{
		std::cerr << "Failed to parse configuration: " << parsed.error << "\n\n"
				  << ConfigurationParser::usage(argv[0]);
		return 1;
	}
	if (!parsed.saveConfigFile.empty())
	{
		if (!config.saveToJson(parsed.saveConfigFile))
		{
			return 1;
		}
		std::cout << "Configuration written to " << parsed.saveConfigFile << std::endl;
		return 0;
	}

	std::cout << "Starting granubridge...\n";

	const EngineConfig &engineConfig = config.getEngineConfig();
	if (engineConfig.oscPort != config.getRelayConfig().targetPort)
	{
		std::cerr << "Warning: engine OSC port " << engineConfig.oscPort << " differs from relay target port "
				  << config.getRelayConfig().targetPort << std::endl;
	}
	if (engineConfig.telemetryPort != config.getTelemetryConfig().listenPort)
	{
		std::cerr << "Warning: engine telemetry port " << engineConfig.telemetryPort
				  << " differs from telemetry listen port " << config.getTelemetryConfig().listenPort << std::endl;
	}

	try
	{
		boost::asio::io_context ioContext;
		AsioScheduler scheduler(ioContext);

		LogBuffer logBuffer(engineConfig.logLimit);
		LibloOscTransport oscTransport;
		CommandRelay relay(config.getRelayConfig(), oscTransport, scheduler);
		TelemetryListener telemetry(config.getTelemetryConfig(), ioContext, scheduler);

		PosixProcessLauncher launcher(ioContext);
		EngineRuntimeResolver resolver(engineConfig, EngineRuntimeResolver::defaultSearchRoots(argv[0]));
		ProcessSupervisor supervisor(scheduler, launcher, resolver, logBuffer, engineConfig,
									 config.getWatchdogConfig());

		TransportGateway gateway(config.getGatewayConfig(), relay, telemetry, scheduler, &supervisor);
		GatewayServer server(ioContext, gateway, config.getGatewayConfig());

		// A fresh engine run must not be mixed with telemetry from the previous one
		supervisor.addStatusListener([&telemetry](const EngineStatusReport &report)
									 {
										 if (report.status == EngineStatus::Starting)
										 {
											 telemetry.clearHello();
											 telemetry.clearScans();
										 } });

		relay.open();

		std::string telemetryError;
		if (!telemetry.open(telemetryError))
		{
			std::cerr << "Telemetry listener unavailable: " << telemetryError << std::endl;
		}

		server.start();
		gateway.start();

		if (engineConfig.autoStart)
		{
			ProcessSupervisor::StartOptions options;
			options.trigger = "autostart";
			const EngineStatusReport report = supervisor.start(options);
			if (!report.ok)
			{
				std::cerr << "Engine auto-start failed: " << report.lastError << std::endl;
			}
		}

		boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int signum)
						   {
							   if (ec)
							   {
								   return;
							   }
							   std::cout << "\nShutdown requested (Signal " << signum << ")...\n";
							   server.stop();
							   gateway.stop();
							   supervisor.shutdown([&](const EngineStatusReport &report)
												   {
													   std::cout << "Engine " << engineStatusToString(report.status)
																 << "; stopping event loop.\n";
													   telemetry.close();
													   relay.close();
													   ioContext.stop(); }); });

		std::cout << "Bridge running. Press Ctrl+C to stop.\n";
		ioContext.run();
	}
	catch (const BridgeException &e)
	{
		std::cerr << "Fatal error (" << BridgeException::getErrorDescription(e.code()) << "): " << e.what()
				  << std::endl;
		return 1;
	}
	catch (const std::exception &e)
	{
		std::cerr << "Unhandled exception: " << e.what() << std::endl;
		return 1;
	}

	std::cout << "Application finished.\n";
	return 0;
}
