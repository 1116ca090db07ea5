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

#include "counter/Counter.hh"

#include <algorithm>
#include <stdexcept>

namespace nettest {

namespace {

using namespace CounterCategory;

const std::vector<CounterInfo> kCounterTable = {
    {Counter::LOCAL_MULTICAST, "local_multicast", ROUTER},
    {Counter::EXTERNAL_MULTICAST, "external_multicast", ROUTER},
    {Counter::LOCAL_P2P, "local_p2p", ROUTER},
    {Counter::EXTERNAL_P2P, "external_p2p", ROUTER},
    {Counter::LOCAL_NEAREST_NEIGHBOUR, "local_nearest_neighbour", ROUTER},
    {Counter::EXTERNAL_NEAREST_NEIGHBOUR, "external_nearest_neighbour", ROUTER},
    {Counter::LOCAL_FIXED_ROUTE, "local_fixed_route", ROUTER},
    {Counter::EXTERNAL_FIXED_ROUTE, "external_fixed_route", ROUTER},
    {Counter::DROPPED_MULTICAST, "dropped_multicast", ROUTER},
    {Counter::DROPPED_P2P, "dropped_p2p", ROUTER},
    {Counter::DROPPED_NEAREST_NEIGHBOUR, "dropped_nearest_neighbour", ROUTER},
    {Counter::DROPPED_FIXED_ROUTE, "dropped_fixed_route", ROUTER},
    {Counter::COUNTER12, "counter12", ROUTER},
    {Counter::COUNTER13, "counter13", ROUTER},
    {Counter::COUNTER14, "counter14", ROUTER},
    {Counter::COUNTER15, "counter15", ROUTER},
    {Counter::REINJECTED, "reinjected", REINJECTOR},
    {Counter::REINJECT_OVERFLOW, "reinject_overflow", REINJECTOR},
    {Counter::REINJECT_MISSED, "reinject_missed", REINJECTOR},
    {Counter::SENT, "sent", SOURCE},
    {Counter::BLOCKED, "blocked", SOURCE},
    {Counter::RETRIED, "retried", SOURCE},
    {Counter::RECEIVED, "received", SINK},
    {Counter::DEADLINES_MISSED, "deadlines_missed", PERMANENT},
};

std::vector<Counter> buildCounterList() {
	std::vector<Counter> counters;
	for (const auto& info : kCounterTable) counters.push_back(info.counter);
	std::sort(counters.begin(), counters.end(),
	          [](Counter a, Counter b) { return getCounterOrder(a) < getCounterOrder(b); });
	return counters;
}

}  // namespace

const std::vector<Counter>& getAllCounters() {
	static const std::vector<Counter> counters = buildCounterList();
	return counters;
}

const CounterInfo& getCounterInfo(Counter _counter) {
	for (const auto& info : kCounterTable) {
		if (info.counter == _counter) return info;
	}
	throw std::invalid_argument("Unknown counter id " + std::to_string(static_cast<int>(_counter)));
}

Counter counterFromName(const std::string& _name) {
	for (const auto& info : kCounterTable) {
		if (_name == info.name) return info.counter;
	}
	throw std::invalid_argument("Unknown counter '" + _name + "'");
}

uint32_t getRecordMask(const std::vector<Counter>& _counters) {
	uint32_t mask = 0;
	for (auto counter : _counters) mask |= getRecordBit(counter);
	return mask;
}

}  // namespace nettest
