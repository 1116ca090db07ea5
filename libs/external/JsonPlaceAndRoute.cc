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

#include "external/JsonPlaceAndRoute.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <vector>

#include "experiment/Entity.hh"
#include "experiment/Flow.hh"
#include "utils/Logging.hh"

namespace nettest {

namespace {

ChipCoord parseChip(const nlohmann::json& _value, const std::string& _context) {
	if (!_value.is_array() || _value.size() != 2) {
		throw std::invalid_argument("The chip of " + _context + " must be given as [x, y]");
	}
	return ChipCoord{_value.at(0).get<uint32_t>(), _value.at(1).get<uint32_t>()};
}

std::string describeChip(const ChipCoord& _chip) {
	return "(" + std::to_string(_chip.x) + ", " + std::to_string(_chip.y) + ")";
}

}  // namespace

JsonPlaceAndRoute::JsonPlaceAndRoute(const nlohmann::json& _description) : description(_description) {
	if (!this->description.is_object()) throw std::invalid_argument("A placement description must be a JSON object");
}

JsonPlaceAndRoute JsonPlaceAndRoute::fromFile(const std::string& _path) {
	if (!std::filesystem::exists(_path)) throw std::runtime_error("File " + _path + " does not exist");

	std::ifstream f(_path);
	if (!f.is_open()) throw std::runtime_error("Error opening file: " + _path);

	try {
		return JsonPlaceAndRoute(nlohmann::json::parse(f));
	} catch (const nlohmann::json::parse_error& e) {
		throw std::runtime_error("JSON parsing error in file " + _path + ": " + e.what());
	}
}

PlaceAndRouteResult JsonPlaceAndRoute::placeAndRoute(const std::map<const Entity*, ResourceDemand>& _demands,
                                                     const std::vector<const Flow*>&               _flows,
                                                     const PlacementConstraints&                   _constraints) {
	std::map<std::string, const Entity*> entities;
	for (const auto& [entity, demand] : _demands) entities[entity->getName()] = entity;

	std::map<std::string, const Flow*> flows;
	for (auto flow : _flows) flows[flow->getName()] = flow;

	auto is_reserved = [&_constraints](uint32_t _core) {
		return std::find(_constraints.reservedCores.begin(), _constraints.reservedCores.end(), _core) !=
		       _constraints.reservedCores.end();
	};

	PlaceAndRouteResult                     result;
	std::map<ChipCoord, std::set<uint32_t>> used_cores;
	uint32_t                                cores_per_chip = _constraints.coresPerChip;

	try {
		cores_per_chip = this->description.value("cores_per_chip", cores_per_chip);

		const auto placements = this->description.value("placements", nlohmann::json::object());
		for (const auto& [name, entry] : placements.items()) {
			auto iter = entities.find(name);
			if (iter == entities.end()) throw std::invalid_argument("Placement of unknown entity '" + name + "'");
			const Entity* entity = iter->second;

			Placement placement{parseChip(entry.at("chip"), "entity '" + name + "'"),
			                    entry.at("cores").get<std::vector<uint32_t>>()};

			auto fixed = _constraints.fixedChips.find(entity);
			if (fixed != _constraints.fixedChips.end() && fixed->second != placement.chip) {
				throw std::invalid_argument("Entity '" + name + "' is placed on chip " + describeChip(placement.chip) +
				                            " but constrained to chip " + describeChip(fixed->second));
			}
			for (auto core : placement.cores) {
				if (core >= cores_per_chip) {
					throw std::invalid_argument("Entity '" + name + "' uses core " + std::to_string(core) +
					                            " but chips only have " + std::to_string(cores_per_chip) + " cores");
				}
				if (is_reserved(core)) {
					throw std::invalid_argument("Entity '" + name + "' uses reserved core " + std::to_string(core));
				}
				if (!used_cores[placement.chip].insert(core).second) {
					throw std::invalid_argument("Core " + std::to_string(core) + " of chip " +
					                            describeChip(placement.chip) + " is allocated twice");
				}
			}
			result.placements[entity] = placement;
		}

		const auto routes = this->description.value("routes", nlohmann::json::object());
		for (const auto& [name, hops] : routes.items()) {
			auto iter = flows.find(name);
			if (iter == flows.end()) throw std::invalid_argument("Route of unknown flow '" + name + "'");
			const Flow* flow = iter->second;

			RoutingPath path;
			for (const auto& [sink_name, count] : hops.items()) {
				auto sink = std::find_if(flow->getSinks().begin(), flow->getSinks().end(),
				                         [&sink_name](const Entity* _sink) { return _sink->getName() == sink_name; });
				if (sink == flow->getSinks().end()) {
					throw std::invalid_argument("Entity '" + sink_name + "' is not a sink of flow '" + name + "'");
				}
				path.hops[*sink] = count.get<uint32_t>();
			}
			result.routes[flow] = path;
		}
	} catch (const nlohmann::json::exception& e) {
		throw std::invalid_argument(std::string("Malformed placement description: ") + e.what());
	}

	// Everything not placed explicitly takes the lowest free cores of its chip, in creation order
	std::vector<const Entity*> unplaced;
	for (const auto& [entity, demand] : _demands) {
		if (!result.placements.contains(entity)) unplaced.push_back(entity);
	}
	std::sort(unplaced.begin(), unplaced.end(),
	          [](const Entity* _a, const Entity* _b) { return _a->getIndex() < _b->getIndex(); });

	for (auto entity : unplaced) {
		auto      fixed = _constraints.fixedChips.find(entity);
		Placement placement{fixed != _constraints.fixedChips.end() ? fixed->second : ChipCoord{}, {}};

		auto& used = used_cores[placement.chip];
		for (uint32_t core = 0; core < cores_per_chip && placement.cores.size() < _demands.at(entity).cores; ++core) {
			if (!is_reserved(core) && used.insert(core).second) placement.cores.push_back(core);
		}
		if (placement.cores.size() < _demands.at(entity).cores) {
			throw std::invalid_argument("Chip " + describeChip(placement.chip) + " has no free core left for entity '" +
			                            entity->getName() + "'");
		}
		VERBOSE_LABELED_INFO("JsonPlaceAndRoute") << "Entity '" << entity->getName() << "' placed on chip "
		                                         << describeChip(placement.chip);
		result.placements[entity] = placement;
	}

	return result;
}

}  // namespace nettest
