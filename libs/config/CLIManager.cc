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

#include "config/CLIManager.hh"

#include <stdexcept>

#include "experiment/Experiment.hh"
#include "results/Results.hh"
#include "utils/Logging.hh"

namespace nettest {

void CLIManager::registerNetTestCLIArguments() {
	this->app.require_subcommand(1);

	this->getCLIApp()
	    ->add_option("-c,--config", this->configFilePathsFromCLI, "Specifies the path(s) to experiment file(s).")
	    ->expected(0, -1);
	this->getCLIApp()->add_option("-p,--placement", this->placementFilePath,
	                              "Placement description; entities not listed are placed automatically.");
	this->getCLIApp()->add_option("-o,--output", this->outputPath,
	                              "Directory for compiled programs or result tables (default: standard output).");
	this->getCLIApp()
	    ->add_option_function<std::vector<std::string>>(
	        "--set",
	        [this](const std::vector<std::string>& _assignments) {
		        for (const auto& assignment : _assignments) {
			        auto eq = assignment.find('=');
			        if (eq == std::string::npos) {
				        throw CLI::ValidationError("--set", "expected option=value, got '" + assignment + "'");
			        }
			        std::string option_name = assignment.substr(0, eq);
			        std::string value       = assignment.substr(eq + 1);
			        this->addCLIParameter(option_name, [option_name, value](Experiment& _experiment) {
				        Option option = optionFromName(option_name);
				        _experiment.getResolver().set(option, parseOptionValue(option, value));
			        });
		        }
	        },
	        "Override the global value of any option, e.g. --set probability=0.5")
	    ->expected(1, -1);
	this->getCLIApp()->add_flag("-v,--verbose", this->verbose, "Log every option assignment and compilation step.");

	this->compileCommand = this->app.add_subcommand("compile", "Compile the program of every entity");
	this->compileCommand->fallthrough();
	this->compileCommand->add_flag("--dump", this->dump, "Print the disassembled program of every entity.");

	this->decodeCommand = this->app.add_subcommand("decode", "Decode result buffers into tables");
	this->decodeCommand->fallthrough();
	this->decodeCommand
	    ->add_option("-r,--results", this->resultsPath, "Directory holding one <entity>.bin result buffer per entity.")
	    ->required();
	this->decodeCommand
	    ->add_option("-t,--table", this->tables, "Tables to write (default: all).")
	    ->check(CLI::IsMember(Results::getTableNames()));
	this->decodeCommand->add_option("--na", this->na, "Text written for missing values.")->default_str(this->na);
}

void CLIManager::registerCLIArguments() {
	this->addCLIOption<std::string>("--seed", "Random seed of every entity, or auto.", Option::SEED);
	this->addCLIOption<double>("--timestep", "Timestep in seconds.", Option::TIMESTEP);
	this->addCLIOption<double>("--warmup", "Unrecorded time before every phase in seconds.", Option::WARMUP);
	this->addCLIOption<double>("--duration", "Recorded time of every phase in seconds.", Option::DURATION);
	this->addCLIOption<double>("--cooldown", "Unrecorded time after every phase in seconds.", Option::COOLDOWN);
	this->addCLIOption<double>("--record-interval", "Seconds between samples, 0 for one sample per phase.",
	                           Option::RECORD_INTERVAL);
	this->addCLIOption<double>("--probability", "Packet probability of every flow per timestep.",
	                           Option::PROBABILITY);
}

void CLIManager::loadExperiment(Experiment& _experiment) const {
	this->loader.parseConfigFiles(_experiment, this->getConfigFilePaths());
	this->setCLIParametersToExperiment(_experiment);
}

void CLIManager::setCLIParametersToExperiment(Experiment& _experiment) const {
	for (const auto& cli_param : this->cliParameters) {
		VERBOSE_LABELED_INFO(this->name) << "Command line override of '" << cli_param.optionName << "'";
		cli_param.updateFunc(_experiment);
	}
}

CLIManager::Command CLIManager::getCommand() const {
	if (this->compileCommand && this->compileCommand->parsed()) return Command::COMPILE;
	if (this->decodeCommand && this->decodeCommand->parsed()) return Command::DECODE;
	throw std::logic_error("No subcommand has been parsed");
}

std::vector<std::string> CLIManager::getConfigFilePaths() const {
	auto paths = this->configFilePaths;
	paths.insert(paths.end(), this->configFilePathsFromCLI.begin(), this->configFilePathsFromCLI.end());
	return paths;
}

void CLIManager::addCLIParameter(const std::string& _optionName, std::function<void(Experiment&)> _updateFunc) {
	auto cli_param = CLIParameter{_optionName, _updateFunc};
	this->cliParameters.push_back(cli_param);
}

}  // namespace nettest
