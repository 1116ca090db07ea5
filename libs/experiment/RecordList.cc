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

#include "experiment/RecordList.hh"

#include <set>
#include <stdexcept>

#include "experiment/Entity.hh"
#include "experiment/Flow.hh"

namespace nettest {

RecordList buildRecordList(const Entity& _entity, const std::vector<Counter>& _counters,
                           const std::optional<ChipCoord>& _routerChip) {
	RecordList list;
	for (auto counter : getAllCounters()) {
		bool recorded = false;
		for (auto c : _counters) recorded |= (c == counter);
		if (!recorded) continue;

		if (isChipCounter(counter) && _routerChip) list.push_back({*_routerChip, counter});
		if (isSourceCounter(counter)) {
			for (auto flow : _entity.getSourceFlows()) list.push_back({flow, counter});
		}
		if (isSinkCounter(counter)) {
			for (auto flow : _entity.getSinkFlows()) list.push_back({flow, counter});
		}
		if (isPermanentCounter(counter)) list.push_back({&_entity, counter});
	}
	return list;
}

std::map<const Entity*, ChipCoord> selectRouterAccessEntities(const std::vector<const Entity*>& _entities,
                                                              const PlacementMap&               _placements) {
	std::map<const Entity*, ChipCoord> selected;
	std::set<ChipCoord>                chips;
	for (auto entity : _entities) {
		auto iter = _placements.find(entity);
		if (iter == _placements.end()) {
			throw std::invalid_argument("No placement for entity '" + entity->getName() + "'");
		}
		if (chips.insert(iter->second.chip).second) selected[entity] = iter->second.chip;
	}
	return selected;
}

std::string getMeasuredObjectName(const MeasuredObject& _object) {
	if (auto chip = std::get_if<ChipCoord>(&_object)) {
		return "(" + std::to_string(chip->x) + ", " + std::to_string(chip->y) + ")";
	} else if (auto flow = std::get_if<const Flow*>(&_object)) {
		return (*flow)->getName();
	}
	return std::get<const Entity*>(_object)->getName();
}

}  // namespace nettest
