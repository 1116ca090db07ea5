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
 * @file ExperimentLoader.hh
 * @brief Builds an Experiment from JSON experiment description files
 *
 * ```json
 * {
 *   "options":  { "timestep": 0.0001, "record_sent": true, "record_received": true },
 *   "entities": [ { "name": "a", "chip": [0, 0] }, { "name": "b", "options": { "seed": 1 } } ],
 *   "flows":    [ { "name": "ab", "source": "a", "sinks": ["b"], "options": { "probability": 0.5 } } ],
 *   "phases":   [ { "name": "busy",
 *                   "labels": { "load": 1.0 },
 *                   "options": { "duration": 0.5 },
 *                   "entity_options": { "b": { "consume_packets": false } },
 *                   "flow_options": { "ab": { "probability": 1.0 } } } ]
 * }
 * ```
 *
 * Several files can be loaded into one experiment; later files may refer to
 * entities and flows of earlier ones and override their options. Defining the
 * same entity, flow or phase name twice is an error. Unknown option names are
 * reported and skipped. Values are JSON literals, `null` meaning auto, or the
 * text accepted by parseOptionValue().
 */

#pragma once

#include <string>
#include <vector>

#include "config/Option.hh"
#include "config/OptionResolver.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace nettest {

class Experiment;
class Phase;

class ExperimentLoader {
public:
	explicit ExperimentLoader(const std::string& _name = "ExperimentLoader") : name(_name) {}

	/**
	 * @brief Load every file, in order, into the experiment
	 * @throws std::runtime_error if a file can not be read or parsed
	 * @throws std::invalid_argument if a file describes an invalid experiment
	 */
	void parseConfigFiles(Experiment& _experiment, const std::vector<std::string>& _configFilePaths) const;

	/// @brief Load one parsed description; _source names it in error messages
	void parseConfig(Experiment& _experiment, const nlohmann::ordered_json& _config,
	                 const std::string& _source = "<json>") const;

	/// @brief Convert a JSON literal into a value of the option
	static OptionValue parseOptionJson(Option _option, const nlohmann::ordered_json& _value);

private:
	void parseOptions(Experiment& _experiment, const nlohmann::ordered_json& _options, const Phase* _phase,
	                  const OptionOwner& _owner, const std::string& _context) const;
	void parseEntities(Experiment& _experiment, const nlohmann::ordered_json& _entities) const;
	void parseFlows(Experiment& _experiment, const nlohmann::ordered_json& _flows) const;
	void parsePhases(Experiment& _experiment, const nlohmann::ordered_json& _phases) const;

	std::string name;
};

}  // namespace nettest
