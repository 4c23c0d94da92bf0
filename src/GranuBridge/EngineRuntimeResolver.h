#pragma once

#include "Configuration.h"
#include "EngineProcess.h"

#include <string>
#include <vector>

namespace GranuBridge
{
	/**
	 * @brief Locates the engine binary and its resources on disk
	 *
	 * Configured paths win. Otherwise the first existing candidate below each
	 * search root is used: engine-bin/<platform>/, engine-bin/ and
	 * EmissionControl2/ecSource/bin/ for the binary, and the matching
	 * externalResources directories for samples and shared libraries.
	 */
	class EngineRuntimeResolver : public IEngineRuntimeResolver
	{
	public:
		/**
		 * @brief Constructor
		 *
		 * @param config Engine settings
		 * @param searchRoots Directories the candidate locations are relative to
		 */
		EngineRuntimeResolver(const EngineConfig &config, std::vector<std::string> searchRoots);

		bool resolve(EngineLaunchSpec &spec, std::string &error) override;

		/**
		 * @brief Candidate binary locations, in search order
		 */
		std::vector<std::string> binaryCandidates() const;
		std::vector<std::string> samplesDirCandidates() const;
		std::vector<std::string> libDirCandidates() const;

		/**
		 * @brief Search roots for a process: working directory, executable directory and its parent
		 *
		 * @param argv0 argv[0] of the running program
		 */
		static std::vector<std::string> defaultSearchRoots(const std::string &argv0);

		static std::string binaryName();
		static std::string platformDirectory();

		/**
		 * @brief Environment variable holding the shared library search path
		 */
		static std::string libraryPathVariable();

	private:
		std::vector<std::string> candidatesUnder(const std::string &configured,
												 const std::vector<std::string> &relativePaths) const;
		std::string defaultDataDir() const;

		EngineConfig m_config;
		std::vector<std::string> m_searchRoots;
	};

} // namespace GranuBridge
