#include "EngineRuntimeResolver.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace GranuBridge
{
	namespace
	{
		std::string absolutePath(const std::string &path)
		{
			std::error_code ec;
			fs::path absolute = fs::absolute(fs::path(path), ec);
			if (ec)
			{
				return path;
			}
			return absolute.lexically_normal().string();
		}

		std::string firstExisting(const std::vector<std::string> &candidates, bool wantFile)
		{
			for (const auto &candidate : candidates)
			{
				std::error_code ec;
				const bool exists = wantFile ? fs::is_regular_file(candidate, ec) : fs::is_directory(candidate, ec);
				if (exists && !ec)
				{
					return candidate;
				}
			}
			return std::string();
		}
	}

	EngineRuntimeResolver::EngineRuntimeResolver(const EngineConfig &config, std::vector<std::string> searchRoots)
		: m_config(config), m_searchRoots(std::move(searchRoots))
	{
	}

	std::string EngineRuntimeResolver::binaryName()
	{
		return "ec2_headless";
	}

	std::string EngineRuntimeResolver::platformDirectory()
	{
#if defined(__APPLE__)
		return "darwin";
#else
		return "linux";
#endif
	}

	std::string EngineRuntimeResolver::libraryPathVariable()
	{
#if defined(__APPLE__)
		return "DYLD_LIBRARY_PATH";
#else
		return "LD_LIBRARY_PATH";
#endif
	}

	std::vector<std::string> EngineRuntimeResolver::defaultSearchRoots(const std::string &argv0)
	{
		std::vector<std::string> roots;
		std::error_code ec;
		const fs::path cwd = fs::current_path(ec);
		if (!ec)
		{
			roots.push_back(cwd.string());
		}

		if (!argv0.empty())
		{
			const fs::path exeDir = fs::path(absolutePath(argv0)).parent_path();
			roots.push_back(exeDir.string());
			if (exeDir.has_parent_path())
			{
				roots.push_back(exeDir.parent_path().string());
			}
		}

		std::vector<std::string> unique;
		for (const auto &root : roots)
		{
			if (std::find(unique.begin(), unique.end(), root) == unique.end())
			{
				unique.push_back(root);
			}
		}
		return unique;
	}

	std::vector<std::string> EngineRuntimeResolver::candidatesUnder(const std::string &configured,
																	const std::vector<std::string> &relativePaths) const
	{
		std::vector<std::string> candidates;
		if (!configured.empty())
		{
			candidates.push_back(absolutePath(configured));
		}

		for (const auto &root : m_searchRoots)
		{
			for (const auto &relative : relativePaths)
			{
				const std::string candidate = (fs::path(root) / relative).lexically_normal().string();
				if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end())
				{
					candidates.push_back(candidate);
				}
			}
		}
		return candidates;
	}

	std::vector<std::string> EngineRuntimeResolver::binaryCandidates() const
	{
		const std::string name = binaryName();
		return candidatesUnder(m_config.binaryPath,
							   {(fs::path("engine-bin") / platformDirectory() / name).string(),
								(fs::path("engine-bin") / name).string(),
								(fs::path("EmissionControl2") / "ecSource" / "bin" / name).string()});
	}

	std::vector<std::string> EngineRuntimeResolver::samplesDirCandidates() const
	{
		return candidatesUnder(m_config.samplesDir,
							   {(fs::path("EmissionControl2") / "externalResources" / "samples").string(),
								(fs::path("engine-resources") / "samples").string()});
	}

	std::vector<std::string> EngineRuntimeResolver::libDirCandidates() const
	{
		return candidatesUnder(m_config.libDir,
							   {(fs::path("EmissionControl2") / "externalResources" / "libsndfile").string(),
								(fs::path("engine-resources") / "libs").string()});
	}

	std::string EngineRuntimeResolver::defaultDataDir() const
	{
		const char *home = std::getenv("HOME");
		const fs::path base = (home && home[0] != '\0') ? fs::path(home) : fs::temp_directory_path();
		return (base / ".granubridge" / "ec2").string();
	}

	bool EngineRuntimeResolver::resolve(EngineLaunchSpec &spec, std::string &error)
	{
		const std::vector<std::string> binaries = binaryCandidates();
		const std::string binaryPath = firstExisting(binaries, true);
		if (binaryPath.empty())
		{
			std::ostringstream out;
			out << binaryName() << " binary not found. Checked: ";
			for (size_t i = 0; i < binaries.size(); ++i)
			{
				out << (i > 0 ? " | " : "") << binaries[i];
			}
			error = out.str();
			return false;
		}

		const std::string dataDir = m_config.dataDir.empty() ? defaultDataDir() : absolutePath(m_config.dataDir);
		std::error_code ec;
		fs::create_directories(dataDir, ec);
		if (ec)
		{
			error = "Failed to create engine data directory " + dataDir + ": " + ec.message();
			return false;
		}

		spec = EngineLaunchSpec();
		spec.binaryPath = binaryPath;
		spec.workingDirectory = fs::path(binaryPath).parent_path().string();
		spec.dataDir = dataDir;
		spec.samplesDir = firstExisting(samplesDirCandidates(), false);
		spec.libDir = firstExisting(libDirCandidates(), false);

		if (!spec.libDir.empty())
		{
			const std::string variable = libraryPathVariable();
			const char *existing = std::getenv(variable.c_str());
			spec.environment[variable] = (existing && existing[0] != '\0')
											 ? spec.libDir + ":" + existing
											 : spec.libDir;
		}

		spec.args = {
			"--osc-host", m_config.oscHost,
			"--osc-port", std::to_string(m_config.oscPort),
			"--telemetry-host", m_config.telemetryHost,
			"--telemetry-port", std::to_string(m_config.telemetryPort),
			"--data-dir", dataDir};

		if (!spec.samplesDir.empty())
		{
			spec.args.push_back("--samples-dir");
			spec.args.push_back(spec.samplesDir);
		}
		if (m_config.autoStartAudio)
		{
			spec.args.push_back("--autostart-audio");
		}
		if (m_config.noAudio)
		{
			spec.args.push_back("--no-audio");
		}

		return true;
	}

} // namespace GranuBridge
