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
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace nettest {

/// @brief Value of a descriptive phase label, copied into every result row of the phase
using LabelValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * @brief A named span of experiment time (a.k.a. group)
 *
 * Phases run in creation order. Their labels carry no meaning for the
 * experiment itself and only annotate the result tables.
 */
class Phase {
public:
	Phase(size_t _index, const std::string& _name) : index(_index), name(_name) {}

	const std::string& getName() const { return this->name; }
	size_t             getIndex() const { return this->index; }

	/// @brief Add a label column, replacing the value if the label already exists
	void addLabel(const std::string& _name, const LabelValue& _value);

	const std::vector<std::pair<std::string, LabelValue>>& getLabels() const { return this->labels; }

	/// @brief The label's value, or an empty value when the phase does not carry it
	LabelValue getLabel(const std::string& _name) const;

private:
	size_t                                          index;
	std::string                                     name;
	std::vector<std::pair<std::string, LabelValue>> labels;
};

/**
 * @brief Number of samples a phase records
 *
 * One sample per record interval, or a single sample covering the whole
 * duration when no interval is set. An interval longer than the duration
 * records nothing.
 */
size_t getNumSamples(double _duration, double _recordInterval);

}  // namespace nettest
