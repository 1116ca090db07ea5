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

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "experiment/OptionAccessor.hh"
#include "external/PlaceAndRoute.hh"

namespace nettest {

class Experiment;
class Flow;

/**
 * @brief One traffic generating/consuming unit of the experiment (a.k.a. core)
 *
 * Entities are created through Experiment::newEntity() and live as long as the
 * experiment. The flows an entity sources or sinks are registered on it when the
 * flow is created; their order is the source/sink index used on the device.
 */
class Entity {
	friend class Experiment;

public:
	Entity(Experiment& _experiment, size_t _index, const std::string& _name, std::optional<ChipCoord> _chip)
	    : experiment(&_experiment), index(_index), name(_name), chip(_chip) {}

	const std::string&              getName() const { return this->name; }
	size_t                          getIndex() const { return this->index; }
	const std::optional<ChipCoord>& getChipConstraint() const { return this->chip; }
	const std::vector<const Flow*>& getSourceFlows() const { return this->sourceFlows; }
	const std::vector<const Flow*>& getSinkFlows() const { return this->sinkFlows; }

	OptionAccessor option(Option _option) { return OptionAccessor(*this->experiment, _option, this); }

private:
	Experiment*              experiment;
	size_t                   index;
	std::string              name;
	std::optional<ChipCoord> chip;
	std::vector<const Flow*> sourceFlows;
	std::vector<const Flow*> sinkFlows;
};

}  // namespace nettest
