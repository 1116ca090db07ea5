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
 * @file main.cc
 * @brief nettest-cli entry point
 *
 * @details
 * Offline front end of the experiment description, compiler and decoder. It
 * never talks to a machine: programs are written to files for a loader of the
 * user's choice and result buffers read back from files.
 *
 * # Usage
 *
 * ```bash
 * # compile one program per entity into out/<entity>.bin and print them
 * nettest-cli -c experiment.json -p placement.json -o out compile --dump
 *
 * # decode out/<entity>.bin result buffers into CSV tables
 * nettest-cli -c experiment.json -p placement.json -o tables decode -r out
 *
 * # command line overrides take priority over the experiment files
 * nettest-cli -c experiment.json --duration 0.5 --set probability=0.1 compile
 * ```
 *
 * # Exit Codes
 *
 * | Code | Meaning                                                   |
 * |------|-----------------------------------------------------------|
 * | 0    | Success                                                   |
 * | 1    | Invalid configuration, placement, program or result file  |
 * | 2    | Results decoded but an entity reported a runtime fault    |
 *
 * With exit code 2 the tables are still written.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "NetTest.hh"

using namespace nettest;

namespace {

const std::string kToolName = "nettest-cli";

std::vector<uint8_t> readBinaryFile(const std::filesystem::path& _path) {
	std::ifstream file(_path, std::ios::binary);
	if (!file.is_open()) throw std::runtime_error("Failed to open file: " + _path.string());
	return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void writeBinaryFile(const std::filesystem::path& _path, const std::vector<uint8_t>& _data) {
	std::ofstream file(_path, std::ios::binary);
	if (!file.is_open()) throw std::runtime_error("Failed to create file: " + _path.string());
	file.write(reinterpret_cast<const char*>(_data.data()), static_cast<std::streamsize>(_data.size()));
	if (!file) throw std::runtime_error("Failed to write file: " + _path.string());
}

void compileExperiment(const CLIManager& _cli, const Experiment& _experiment) {
	const auto record_lists   = _experiment.getRecordLists();
	const auto router_access  = _experiment.getRouterAccessEntities();
	const auto compiler       = Compiler(_experiment);
	const auto output_dir     = std::filesystem::path(_cli.getOutputPath());
	bool       write_programs = !_cli.getOutputPath().empty();

	if (write_programs) std::filesystem::create_directories(output_dir);

	for (const auto* entity : _experiment.getEntities()) {
		auto commands = compiler.compile(*entity, record_lists.at(entity), router_access.count(entity) > 0);
		auto program  = commands.pack();
		LABELED_INFO(kToolName) << entity->getName() << ": " << program.size() << " byte program";

		if (write_programs) writeBinaryFile(output_dir / (entity->getName() + ".bin"), program);
		if (_cli.isDump()) std::cout << "# " << entity->getName() << "\n" << Commands::disassemble(program) << "\n";
	}
}

void writeTables(const CLIManager& _cli, const Results& _results) {
	auto names = _cli.getTables().empty() ? Results::getTableNames() : _cli.getTables();

	if (_cli.getOutputPath().empty()) {
		for (const auto& name : names) {
			std::cout << "# " << name << "\n";
			_results.getTable(name).writeCsv(std::cout, _cli.getNA());
			std::cout << "\n";
		}
		return;
	}

	auto output_dir = std::filesystem::path(_cli.getOutputPath());
	std::filesystem::create_directories(output_dir);
	for (const auto& name : names) {
		auto          path = output_dir / (name + ".csv");
		std::ofstream file(path);
		if (!file.is_open()) throw std::runtime_error("Failed to create file: " + path.string());
		_results.getTable(name).writeCsv(file, _cli.getNA());
		LABELED_INFO(kToolName) << "Wrote " << path.string();
	}
}

int decodeExperiment(const CLIManager& _cli, const Experiment& _experiment) {
	const auto record_lists = _experiment.getRecordLists();
	const auto results_dir  = std::filesystem::path(_cli.getResultsPath());

	std::map<const Entity*, std::vector<uint8_t>> buffers;
	for (const auto* entity : _experiment.getEntities()) {
		auto path = results_dir / (entity->getName() + ".bin");
		if (!std::filesystem::exists(path)) {
			LABELED_WARNING(kToolName) << "No results for entity '" << entity->getName() << "' at " << path.string();
			continue;
		}
		buffers[entity] = readBinaryFile(path);
	}

	try {
		auto results = decodeResults(_experiment, record_lists, buffers, _experiment.getRoutes());
		writeTables(_cli, *results);
	} catch (const RunFailure& e) {
		ERROR << e.what();
		writeTables(_cli, *e.getResults());
		return 2;
	}
	return 0;
}

}  // namespace

int main(int argc, char** argv) {
	CLIManager cli(kToolName);
	cli.registerNetTestCLIArguments();
	cli.registerCLIArguments();
	cli.parseCLIArguments(argc, argv);

	LogOStream::setVerbose(cli.isVerbose());

	try {
		Experiment experiment;
		cli.loadExperiment(experiment);
		if (experiment.getNumPhases() == 0) experiment.newPhase();

		auto placer = cli.getPlacementFilePath().empty() ? JsonPlaceAndRoute()
		                                                 : JsonPlaceAndRoute::fromFile(cli.getPlacementFilePath());
		experiment.placeAndRoute(placer);

		switch (cli.getCommand()) {
			case CLIManager::Command::COMPILE: compileExperiment(cli, experiment); return 0;
			case CLIManager::Command::DECODE: return decodeExperiment(cli, experiment);
		}
	} catch (const std::exception& e) { ERROR << e.what(); }
	return 1;
}
