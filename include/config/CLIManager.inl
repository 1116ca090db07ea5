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

#include <CLI/CLI.hpp>
#include <string>
#include <type_traits>

#include "config/CLIManager.hh"
#include "experiment/Experiment.hh"

namespace nettest {

template <typename T>
inline CLI::Option* CLIManager::addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
                                             Option _option, const bool& _defaultValue) {
	// Create a callback function for CLI::App
	std::function<void(const T&)> callback = [this, _option](const T& value) {
		// Defer the update until the experiment files are loaded
		auto updateFunc = [_option, value](Experiment& _experiment) {
			if constexpr (std::is_same_v<T, std::string>) {
				_experiment.getResolver().set(_option, parseOptionValue(_option, value));
			} else {
				_experiment.getResolver().set(_option, OptionValue(value));
			}
		};

		this->addCLIParameter(getOptionName(_option), updateFunc);
	};

	// register the option with callback function into CLI Application.
	auto option = this->app.add_option_function(_optionName, callback, _optionDescription);

	// show the built-in default in "--help"
	if (_defaultValue) option->default_str(toString(getOptionInfo(_option).defaultValue));

	return option;
}

}  // namespace nettest
