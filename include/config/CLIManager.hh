/*
 * Copyright 2023-2026 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file CLIManager.hh
 * @brief Command line front end of nettest-cli
 *
 * Options given on the command line override those of the experiment files.
 * Their values are captured while parsing and applied only once every file has
 * been loaded, so the priority is CLI > JSON > defaults:
 *
 * ```cpp
 * CLIManager cli("nettest-cli");
 * cli.registerCLIArguments();
 * cli.parseCLIArguments(argc, argv);
 *
 * Experiment experiment;
 * cli.loadExperiment(experiment);  // config files, then CLI overrides
 * ```
 *
 * Besides the dedicated options (`--timestep`, `--duration`, ...) any option
 * can be overridden globally with `--set name=value`.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config/ExperimentLoader.hh"
#include "config/Option.hh"

// Third-Party Library
#include <CLI/CLI.hpp>

namespace nettest {

class Experiment;

class CLIManager {
	/**
	 * @brief Deferred option override captured from the command line
	 */
	struct CLIParameter {
		std::string                      optionName;  ///< Option name (e.g., "timestep")
		std::function<void(Experiment&)> updateFunc;  ///< Applies the captured value to the experiment
	};

public:
	enum class Command { COMPILE, DECODE };

	/**
	 * @param _name Tool name shown in log labels
	 * @param _configFilePaths Experiment files loaded before those given with --config
	 */
	CLIManager(const std::string& _name, const std::vector<std::string>& _configFilePaths = {})
	    : name(_name), configFilePaths(_configFilePaths), loader(_name) {}

	virtual ~CLIManager() = default;

	/// @brief Register the subcommands and the options shared by every tool
	void registerNetTestCLIArguments();

	/// @brief Register dedicated option overrides, called after registerNetTestCLIArguments()
	virtual void registerCLIArguments();

	/// @brief Parse argc/argv, printing help or errors and exiting when appropriate
	void parseCLIArguments(int argc, char** argv) {
		argv = this->app.ensure_utf8(argv);
		try {
			this->app.parse(argc, argv);
		} catch (const CLI::ParseError& e) { exit(this->app.exit(e)); }
	}

	/**
	 * @brief Load every experiment file into the experiment, then apply the command line overrides
	 * @throws std::runtime_error / std::invalid_argument / ScopeError on invalid configuration
	 */
	void loadExperiment(Experiment& _experiment) const;

	/// @brief Apply the captured overrides; call after the experiment files are loaded
	void setCLIParametersToExperiment(Experiment& _experiment) const;

	CLI::App* getCLIApp() { return &this->app; }

	Command                         getCommand() const;
	std::vector<std::string>        getConfigFilePaths() const;
	const std::string&              getPlacementFilePath() const { return this->placementFilePath; }
	const std::string&              getOutputPath() const { return this->outputPath; }
	const std::string&              getResultsPath() const { return this->resultsPath; }
	const std::vector<std::string>& getTables() const { return this->tables; }
	const std::string&              getNA() const { return this->na; }
	bool                            isDump() const { return this->dump; }
	bool                            isVerbose() const { return this->verbose; }

protected:
	/**
	 * @brief Add a command line option overriding the global value of an experiment option
	 *
	 * ```cpp
	 * addCLIOption<double>("--timestep", "Timestep in seconds", Option::TIMESTEP);
	 * addCLIOption<std::string>("--seed", "Seed, or auto", Option::SEED);
	 * ```
	 * String values are parsed with parseOptionValue().
	 */
	template <typename T>
	inline CLI::Option* addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
	                                 Option _option, const bool& _defaultValue = true);

private:
	void addCLIParameter(const std::string& _optionName, std::function<void(Experiment&)> _updateFunc);

	std::string name;

	/// @brief Default experiment files (from constructor)
	std::vector<std::string> configFilePaths = {};

	/// @brief Additional experiment files specified via --config
	std::vector<std::string> configFilePathsFromCLI = {};

	std::string              placementFilePath;
	std::string              outputPath;
	std::string              resultsPath;
	std::vector<std::string> tables;
	std::string              na      = "NA";
	bool                     dump    = false;
	bool                     verbose = false;

	std::vector<CLIParameter> cliParameters;
	ExperimentLoader          loader;

	CLI::App  app{"Compile network experiments for the on-chip traffic interpreters and decode their results"};
	CLI::App* compileCommand = nullptr;
	CLI::App* decodeCommand  = nullptr;
};

}  // namespace nettest

#include "config/CLIManager.inl"
