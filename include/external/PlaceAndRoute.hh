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
 * @file PlaceAndRoute.hh
 * @brief Interface to the placement, allocation and routing collaborator
 *
 * NetTest does not place entities or compute routes itself. A PlaceAndRoute
 * implementation receives the resource demand of every entity together with the
 * flows between them and returns where each entity was put and how many hops
 * each flow's packets travel to reach every sink.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace nettest {

class Entity;
class Flow;

struct ChipCoord {
	uint32_t x = 0;
	uint32_t y = 0;

	auto operator<=>(const ChipCoord&) const = default;
};

/**
 * @brief Location and allocated cores of one entity
 *
 * The core list is whatever the allocator handed out and may be non-contiguous.
 */
struct Placement {
	ChipCoord             chip;
	std::vector<uint32_t> cores;
};

/**
 * @brief Route of one flow, reduced to the hop count towards each sink
 */
struct RoutingPath {
	std::map<const Entity*, uint32_t> hops;

	std::optional<uint32_t> getNumHops(const Entity& _sink) const {
		auto iter = this->hops.find(&_sink);
		if (iter == this->hops.end()) return std::nullopt;
		return iter->second;
	}
};

using PlacementMap = std::map<const Entity*, Placement>;
using RoutingMap   = std::map<const Flow*, RoutingPath>;

struct ResourceDemand {
	uint32_t cores = 1;
};

struct PlacementConstraints {
	/// @brief Entities pinned to a chip by the user
	std::map<const Entity*, ChipCoord> fixedChips;
	/// @brief Cores no entity may be allocated (the monitor core by default)
	std::vector<uint32_t> reservedCores = {0};
	/// @brief Cores of every chip, numbered from 0
	uint32_t coresPerChip = 18;
};

struct PlaceAndRouteResult {
	PlacementMap placements;
	RoutingMap   routes;
};

class PlaceAndRoute {
public:
	virtual ~PlaceAndRoute() = default;

	virtual PlaceAndRouteResult placeAndRoute(const std::map<const Entity*, ResourceDemand>& _demands,
	                                          const std::vector<const Flow*>&               _flows,
	                                          const PlacementConstraints&                   _constraints) = 0;
};

}  // namespace nettest
