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

#include "config/Option.hh"
#include "config/OptionResolver.hh"

namespace nettest {

class Experiment;

/**
 * @brief Typed handle on one option, bound to an owner and to the experiment's current phase
 *
 * Reading or assigning through the accessor resolves against whatever phase is
 * being defined at the time of the call:
 * ```cpp
 * flow.option(Option::PROBABILITY) = 0.5;        // flow default
 * {
 *     auto scope = experiment.definePhase("busy");
 *     flow.option(Option::PROBABILITY) = 1.0;    // flow, only in "busy"
 * }
 * ```
 */
class OptionAccessor {
public:
	OptionAccessor(Experiment& _experiment, Option _option, const OptionOwner& _owner)
	    : experiment(&_experiment), option(_option), owner(_owner) {}

	OptionAccessor(const OptionAccessor&)            = default;
	OptionAccessor& operator=(const OptionAccessor&) = delete;

	OptionAccessor& operator=(const OptionValue& _value) {
		this->set(_value);
		return *this;
	}

	OptionValue get() const;
	void        set(const OptionValue& _value);

	/// @brief Drop the exception stored for the current scope
	void unset();

	bool    asBool() const { return nettest::asBool(this->get()); }
	int64_t asInteger() const { return nettest::asInteger(this->get()); }
	double  asReal() const { return nettest::asReal(this->get()); }
	bool    isAuto() const { return nettest::isAuto(this->get()); }

	Option getOption() const { return this->option; }

private:
	Experiment* experiment;
	Option      option;
	OptionOwner owner;
};

}  // namespace nettest
