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
#include <string>
#include <vector>

#include "experiment/OptionAccessor.hh"

namespace nettest {

class Entity;
class Experiment;

/**
 * @brief Directed traffic from one source entity to one or more sinks (a.k.a. net)
 *
 * Options set on a flow override those set on its source entity, see
 * OptionResolver.
 */
class Flow {
public:
	Flow(Experiment& _experiment, size_t _index, const std::string& _name, const Entity& _source,
	     const std::vector<const Entity*>& _sinks)
	    : experiment(&_experiment), index(_index), name(_name), source(&_source), sinks(_sinks) {}

	const std::string&                getName() const { return this->name; }
	size_t                            getIndex() const { return this->index; }
	const Entity&                     getSource() const { return *this->source; }
	const std::vector<const Entity*>& getSinks() const { return this->sinks; }
	size_t                            getFanOut() const { return this->sinks.size(); }

	OptionAccessor option(Option _option) { return OptionAccessor(*this->experiment, _option, this); }

private:
	Experiment*                experiment;
	size_t                     index;
	std::string                name;
	const Entity*              source;
	std::vector<const Entity*> sinks;
};

}  // namespace nettest
