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

#include "experiment/ExperimentRunner.hh"

#include <algorithm>
#include <stdexcept>

#include "compiler/Compiler.hh"
#include "experiment/Experiment.hh"
#include "results/Results.hh"
#include "utils/Logging.hh"

namespace nettest {

void ExperimentRunner::load() {
	if (this->experiment.getNumPhases() == 0) this->experiment.newPhase();

	const auto& placements    = this->experiment.getPlacements();
	auto        router_access = this->experiment.getRouterAccessEntities();
	size_t      total_samples = this->experiment.getTotalNumSamples();
	this->recordLists         = this->experiment.getRecordLists();

	// Compile everything first so that configuration errors abort before the machine is touched
	Compiler                                      compiler(this->experiment);
	std::map<const Entity*, std::vector<uint8_t>> programs;
	for (auto entity : this->getEntities()) {
		const auto& record_list   = this->recordLists.at(entity);
		this->resultSizes[entity] = getResultSize(total_samples, record_list);
		programs[entity]          = compiler.compile(*entity, record_list, router_access.contains(entity)).pack();
	}

	for (auto entity : this->getEntities()) {
		const auto& program = programs.at(entity);

		// The results overwrite the program in place
		size_t size           = std::max(program.size(), this->resultSizes.at(entity));
		this->buffers[entity] = this->transport.allocateBuffer(size, placements.at(entity));
		this->transport.write(this->buffers.at(entity), program);
	}

	this->transport.launch(this->buffers, placements);
	this->transport.waitForState(this->getEntities(), ExecutionState::SYNC0);
	this->loaded = true;

	LABELED_INFO("ExperimentRunner") << "Loaded " << this->buffers.size() << " entities, "
	                                 << this->experiment.getNumPhases() << " phases";
}

void ExperimentRunner::execute() {
	if (!this->loaded) throw std::logic_error("The experiment must be loaded before it is executed");

	auto entities = this->getEntities();
	auto phases   = this->experiment.getPhases();
	for (size_t i = 0; i < phases.size(); ++i) {
		// Barriers alternate between the two synchronisation states
		bool even = (i % 2) == 0;
		VERBOSE_LABELED_INFO("ExperimentRunner") << "Running phase '" << phases[i]->getName() << "'";

		this->transport.sendSignal(even ? Signal::SYNC0 : Signal::SYNC1);

		// After the last phase the interpreters exit instead of waiting at another barrier
		if (i + 1 < phases.size()) {
			this->transport.waitForState(entities, even ? ExecutionState::SYNC1 : ExecutionState::SYNC0);
		}
	}
	this->transport.waitForState(entities, ExecutionState::EXIT);
}

std::shared_ptr<const Results> ExperimentRunner::collect() {
	if (!this->loaded) throw std::logic_error("The experiment must be loaded before results are collected");

	std::map<const Entity*, std::vector<uint8_t>> data;
	for (const auto& [entity, handle] : this->buffers) {
		data[entity] = this->transport.read(handle, this->resultSizes.at(entity));
	}

	return decodeResults(this->experiment, this->recordLists, data, this->experiment.getRoutes());
}

std::shared_ptr<const Results> ExperimentRunner::run() {
	this->load();
	this->execute();
	return this->collect();
}

std::vector<const Entity*> ExperimentRunner::getEntities() const { return this->experiment.getEntities(); }

}  // namespace nettest
