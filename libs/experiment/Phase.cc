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

#include "experiment/Phase.hh"

#include <cmath>

namespace nettest {

void Phase::addLabel(const std::string& _name, const LabelValue& _value) {
	for (auto& [name, value] : this->labels) {
		if (name == _name) {
			value = _value;
			return;
		}
	}
	this->labels.emplace_back(_name, _value);
}

LabelValue Phase::getLabel(const std::string& _name) const {
	for (const auto& [name, value] : this->labels) {
		if (name == _name) return value;
	}
	return std::monostate{};
}

size_t getNumSamples(double _duration, double _recordInterval) {
	if (_recordInterval <= 0.0) return 1;

	// 0.3 / 0.1 evaluates to 2.999..., so tolerate rounding noise before flooring
	double ratio = _duration / _recordInterval;
	return static_cast<size_t>(std::floor(ratio + ratio * 1e-9));
}

}  // namespace nettest
