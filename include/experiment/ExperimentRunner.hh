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
 * @file ExperimentRunner.hh
 * @brief Executes a compiled experiment through a Transport
 *
 * A run is split in three steps so that buffers of a run that failed half way
 * can still be collected and decoded:
 *
 * 1. load(): compile every entity, allocate and fill its buffer, launch
 * 2. execute(): release every phase with a synchronisation signal
 * 3. collect(): read every buffer back and decode it
 *
 * run() performs all three and raises RunFailure when faults are reported.
 */

#pragma once

#include <map>
#include <memory>
#include <vector>

#include "experiment/RecordList.hh"
#include "external/Transport.hh"

namespace nettest {

class Experiment;
class Results;

class ExperimentRunner {
public:
	ExperimentRunner(Experiment& _experiment, Transport& _transport) : experiment(_experiment), transport(_transport) {}

	/**
	 * @brief Compile, load and start every entity
	 *
	 * An experiment without phases gets a single phase using the experiment-wide options.
	 * @throws std::logic_error if the experiment has not been placed
	 * @throws CompileError before anything is sent when a program can not be compiled
	 */
	void load();

	/// @brief Step every entity through all phases and wait until they exit
	void execute();

	/**
	 * @brief Read back and decode every result buffer
	 * @throws RunFailure if any entity reported a fault
	 */
	std::shared_ptr<const Results> collect();

	/// @brief load(), execute() and collect()
	std::shared_ptr<const Results> run();

	const std::map<const Entity*, RecordList>& getRecordLists() const { return this->recordLists; }

private:
	std::vector<const Entity*> getEntities() const;

	Experiment& experiment;
	Transport&  transport;

	std::map<const Entity*, RecordList>   recordLists;
	std::map<const Entity*, BufferHandle> buffers;
	std::map<const Entity*, size_t>       resultSizes;
	bool                                  loaded = false;
};

}  // namespace nettest
