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

#include "experiment/OptionAccessor.hh"

#include "experiment/Experiment.hh"

namespace nettest {

OptionValue OptionAccessor::get() const {
	return this->experiment->getResolver().get(this->option, this->experiment->getCurrentPhase(), this->owner);
}

void OptionAccessor::set(const OptionValue& _value) {
	this->experiment->getResolver().set(this->option, _value, this->experiment->getCurrentPhase(), this->owner);
}

void OptionAccessor::unset() {
	this->experiment->getResolver().unset(this->option, this->experiment->getCurrentPhase(), this->owner);
}

}  // namespace nettest
