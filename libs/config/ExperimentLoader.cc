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

#include "config/ExperimentLoader.hh"

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>

#include "experiment/Experiment.hh"
#include "utils/Logging.hh"

namespace nettest {

namespace {

using json = nlohmann::ordered_json;

const json& expectObject(const json& _value, const std::string& _context) {
	if (!_value.is_object()) throw std::invalid_argument(_context + " must be a JSON object");
	return _value;
}

const json& expectArray(const json& _value, const std::string& _context) {
	if (!_value.is_array()) throw std::invalid_argument(_context + " must be a JSON array");
	return _value;
}

LabelValue parseLabel(const json& _value, const std::string& _context) {
	if (_value.is_null()) return std::monostate{};
	if (_value.is_boolean()) return _value.get<bool>();
	if (_value.is_number_integer()) return _value.get<int64_t>();
	if (_value.is_number_float()) return _value.get<double>();
	if (_value.is_string()) return _value.get<std::string>();
	throw std::invalid_argument(_context + " must be null, a boolean, a number or a string");
}

}  // namespace

void ExperimentLoader::parseConfigFiles(Experiment& _experiment, const std::vector<std::string>& _configFilePaths) const {
	for (const auto& path : _configFilePaths) {
		if (!std::filesystem::exists(path)) throw std::runtime_error("File " + path + " does not exist");

		std::ifstream f(path);
		if (!f.is_open()) throw std::runtime_error("Error opening file: " + path);

		json j;
		try {
			j = json::parse(f);
		} catch (const json::parse_error& e) {
			throw std::runtime_error("JSON parsing error in file " + path + ": " + e.what());
		}

		this->parseConfig(_experiment, j, path);
		VERBOSE_LABELED_INFO(this->name) << "Loaded " << path;
	}
}

void ExperimentLoader::parseConfig(Experiment& _experiment, const json& _config, const std::string& _source) const {
	try {
		expectObject(_config, "An experiment description");

		for (const auto& [key, value] : _config.items()) {
			if (key != "options" && key != "entities" && key != "flows" && key != "phases") {
				LABELED_WARNING(this->name) << "The section '" << key << "' in " << _source
				                            << " is not recognised. It will be skipped.";
			}
		}

		// Sections refer to each other in this order, whatever their order in the file
		if (_config.contains("options")) {
			this->parseOptions(_experiment, _config.at("options"), nullptr, OptionOwner{}, "the experiment");
		}
		if (_config.contains("entities")) this->parseEntities(_experiment, _config.at("entities"));
		if (_config.contains("flows")) this->parseFlows(_experiment, _config.at("flows"));
		if (_config.contains("phases")) this->parsePhases(_experiment, _config.at("phases"));
	} catch (const json::exception& e) {
		throw std::invalid_argument(_source + ": " + e.what());
	} catch (const std::invalid_argument& e) {
		throw std::invalid_argument(_source + ": " + e.what());
	} catch (const std::out_of_range& e) {
		throw std::invalid_argument(_source + ": " + e.what());
	}
}

OptionValue ExperimentLoader::parseOptionJson(Option _option, const json& _value) {
	if (_value.is_null()) return std::monostate{};
	if (_value.is_boolean()) return _value.get<bool>();
	if (_value.is_number_integer()) return _value.get<int64_t>();
	if (_value.is_number_float()) return _value.get<double>();
	if (_value.is_string()) return parseOptionValue(_option, _value.get<std::string>());
	if (_value.is_array() && _value.size() == 2 && _value.at(0).is_number_unsigned() &&
	    _value.at(1).is_number_unsigned()) {
		return RouterTimeout{_value.at(0).get<uint32_t>(), _value.at(1).get<uint32_t>()};
	}
	throw std::invalid_argument("Option '" + getOptionName(_option) + "' can not be set to " + _value.dump());
}

void ExperimentLoader::parseOptions(Experiment& _experiment, const json& _options, const Phase* _phase,
                                    const OptionOwner& _owner, const std::string& _context) const {
	expectObject(_options, "The options of " + _context);

	for (const auto& [key, value] : _options.items()) {
		Option option;
		try {
			option = optionFromName(key);
		} catch (const std::invalid_argument&) {
			LABELED_WARNING(this->name) << "The option '" << key << "' of " << _context
			                            << " is not defined. It will be skipped.";
			continue;
		}
		_experiment.getResolver().set(option, parseOptionJson(option, value), _phase, _owner);
	}
}

void ExperimentLoader::parseEntities(Experiment& _experiment, const json& _entities) const {
	for (const auto& entry : expectArray(_entities, "'entities'")) {
		expectObject(entry, "An entity");

		std::optional<ChipCoord> chip;
		if (entry.contains("chip")) {
			const auto& coord = entry.at("chip");
			if (!coord.is_array() || coord.size() != 2) {
				throw std::invalid_argument("The chip of an entity must be given as [x, y]");
			}
			chip = ChipCoord{coord.at(0).get<uint32_t>(), coord.at(1).get<uint32_t>()};
		}

		auto& entity = _experiment.newEntity(entry.value("name", std::string()), chip);
		if (entry.contains("options")) {
			this->parseOptions(_experiment, entry.at("options"), nullptr, &entity,
			                   "entity '" + entity.getName() + "'");
		}
	}
}

void ExperimentLoader::parseFlows(Experiment& _experiment, const json& _flows) const {
	for (const auto& entry : expectArray(_flows, "'flows'")) {
		expectObject(entry, "A flow");

		const auto& source = _experiment.getEntity(entry.at("source").get<std::string>());

		std::vector<const Entity*> sinks;
		const auto&                sink_names = entry.at("sinks");
		if (sink_names.is_string()) {
			sinks.push_back(&_experiment.getEntity(sink_names.get<std::string>()));
		} else {
			for (const auto& sink : expectArray(sink_names, "The sinks of a flow")) {
				sinks.push_back(&_experiment.getEntity(sink.get<std::string>()));
			}
		}

		auto& flow = _experiment.newFlow(source, sinks, entry.value("name", std::string()));
		if (entry.contains("options")) {
			this->parseOptions(_experiment, entry.at("options"), nullptr, &flow, "flow '" + flow.getName() + "'");
		}
	}
}

void ExperimentLoader::parsePhases(Experiment& _experiment, const json& _phases) const {
	for (const auto& entry : expectArray(_phases, "'phases'")) {
		expectObject(entry, "A phase");

		auto&       phase   = _experiment.newPhase(entry.value("name", std::string()));
		std::string context = "phase '" + phase.getName() + "'";

		if (entry.contains("labels")) {
			for (const auto& [label, value] : expectObject(entry.at("labels"), "The labels of " + context).items()) {
				phase.addLabel(label, parseLabel(value, "The label '" + label + "' of " + context));
			}
		}
		if (entry.contains("options")) {
			this->parseOptions(_experiment, entry.at("options"), &phase, OptionOwner{}, context);
		}
		if (entry.contains("entity_options")) {
			for (const auto& [name, options] :
			     expectObject(entry.at("entity_options"), "The entity options of " + context).items()) {
				const Entity& entity = _experiment.getEntity(name);
				this->parseOptions(_experiment, options, &phase, &entity, "entity '" + name + "' in " + context);
			}
		}
		if (entry.contains("flow_options")) {
			for (const auto& [name, options] :
			     expectObject(entry.at("flow_options"), "The flow options of " + context).items()) {
				const Flow& flow = _experiment.getFlow(name);
				this->parseOptions(_experiment, options, &phase, &flow, "flow '" + name + "' in " + context);
			}
		}
	}
}

}  // namespace nettest
