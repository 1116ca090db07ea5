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
 * @file Compiler.hh
 * @brief Turns the resolved options of one entity into its instruction stream
 *
 * Every phase of the experiment compiles to the same fixed sequence:
 *
 * 1. router timeout and packet reinjection (router-access entities only)
 * 2. seed, timestep, per-source parameters, record mask and record interval
 * 3. BARRIER, then the packet consumption flag
 * 4. unrecorded warmup, recorded run, unrecorded cooldown
 * 5. consumption re-enabled, then a sleep to flush packets in flight
 * 6. router timeout restored and reinjection disabled (router-access entities only)
 *
 * Parameters are only emitted when they differ from the previous phase, see
 * Commands. The stream starts with the source/sink counts and keys and ends
 * with EXIT.
 */

#pragma once

#include <vector>

#include "compiler/Commands.hh"
#include "experiment/RecordList.hh"

namespace nettest {

class Entity;
class Experiment;
class Phase;

class Compiler {
public:
	explicit Compiler(const Experiment& _experiment) : experiment(_experiment) {}

	/**
	 * @brief Compile the program of one entity
	 * @param _recordList Columns the entity records, see buildRecordList()
	 * @param _routerAccess Whether the entity controls the router of its chip
	 * @throws CompileError if a value can not be represented
	 */
	Commands compile(const Entity& _entity, const RecordList& _recordList, bool _routerAccess) const;

private:
	void compilePhase(Commands& _commands, const Entity& _entity, const Phase& _phase,
	                  const std::vector<Counter>& _recorded, bool _routerAccess) const;

	const Experiment& experiment;
};

}  // namespace nettest
