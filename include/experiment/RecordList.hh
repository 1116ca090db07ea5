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
 * @file RecordList.hh
 * @brief Column layout of an entity's result buffer
 *
 * The interpreter appends one value per (measured object, counter) pair to every
 * sample. The layout is computed once per run and shared by the compiler and the
 * decoder. Counters are in record-bit order; for one counter the chip comes first
 * (router-access entities only), then the entity's source flows, then its sink
 * flows, then the entity itself.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "counter/Counter.hh"
#include "external/PlaceAndRoute.hh"

namespace nettest {

class Entity;
class Flow;

/// @brief What a recorded value is attributed to
using MeasuredObject = std::variant<ChipCoord, const Flow*, const Entity*>;

struct RecordEntry {
	MeasuredObject object;
	Counter        counter;
};

using RecordList = std::vector<RecordEntry>;

/**
 * @brief Columns recorded by one entity
 * @param _routerChip Chip whose router the entity reads, empty unless it is a router-access entity
 */
RecordList buildRecordList(const Entity& _entity, const std::vector<Counter>& _counters,
                           const std::optional<ChipCoord>& _routerChip);

/// @brief The first entity placed on each chip, keyed by entity
std::map<const Entity*, ChipCoord> selectRouterAccessEntities(const std::vector<const Entity*>& _entities,
                                                              const PlacementMap&               _placements);

/// @brief "(x, y)", a flow name or an entity name
std::string getMeasuredObjectName(const MeasuredObject& _object);

}  // namespace nettest
