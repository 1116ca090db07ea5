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
 * @file JsonPlaceAndRoute.hh
 * @brief PlaceAndRoute backed by a JSON placement description
 *
 * ```json
 * {
 *   "placements": { "a": { "chip": [0, 0], "cores": [1] }, "b": { "chip": [1, 0], "cores": [1] } },
 *   "routes":     { "ab": { "b": 2 } }
 * }
 * ```
 *
 * Entities without a placement are put on their constrained chip, or chip
 * (0, 0), on the lowest free core that is not reserved. They never spill over
 * to another chip: once a chip runs out of cores placement fails. Chips have
 * PlacementConstraints::coresPerChip cores unless the description sets
 * "cores_per_chip". Hop counts of flows without a route are unknown.
 */

#pragma once

#include <string>

#include "external/PlaceAndRoute.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace nettest {

class JsonPlaceAndRoute : public PlaceAndRoute {
public:
	explicit JsonPlaceAndRoute(const nlohmann::json& _description = nlohmann::json::object());

	/// @throws std::runtime_error if the file can not be read or parsed
	static JsonPlaceAndRoute fromFile(const std::string& _path);

	/**
	 * @throws std::invalid_argument if the description names an unknown entity, flow or sink,
	 *         uses a reserved or nonexistent core, or contradicts a chip constraint, or if a chip
	 *         has too few cores for the entities put on it
	 */
	PlaceAndRouteResult placeAndRoute(const std::map<const Entity*, ResourceDemand>& _demands,
	                                  const std::vector<const Flow*>&               _flows,
	                                  const PlacementConstraints&                   _constraints) override;

private:
	nlohmann::json description;
};

}  // namespace nettest
