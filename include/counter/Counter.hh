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
 * @file Counter.hh
 * @brief Registry of the countable events the remote interpreters can record
 *
 * The enumerator value of each Counter is its bit in the RECORD mask. Iterating
 * getAllCounters() yields counters in bit order, which is also the order the
 * interpreter appends recorded values to its result buffer, so it must never be
 * reordered.
 *
 * Categories decide what a recorded value is attributed to:
 * - ROUTER / REINJECTOR: the chip, recorded by one router-access entity per chip
 * - SOURCE: each flow the recording entity is the source of
 * - SINK: each flow the recording entity is a sink of
 * - PERMANENT: the recording entity itself
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nettest {

enum class Counter : uint8_t {
	LOCAL_MULTICAST            = 0,
	EXTERNAL_MULTICAST         = 1,
	LOCAL_P2P                  = 2,
	EXTERNAL_P2P               = 3,
	LOCAL_NEAREST_NEIGHBOUR    = 4,
	EXTERNAL_NEAREST_NEIGHBOUR = 5,
	LOCAL_FIXED_ROUTE          = 6,
	EXTERNAL_FIXED_ROUTE       = 7,
	DROPPED_MULTICAST          = 8,
	DROPPED_P2P                = 9,
	DROPPED_NEAREST_NEIGHBOUR  = 10,
	DROPPED_FIXED_ROUTE        = 11,
	COUNTER12                  = 12,
	COUNTER13                  = 13,
	COUNTER14                  = 14,
	COUNTER15                  = 15,
	REINJECTED                 = 16,
	REINJECT_OVERFLOW          = 17,
	REINJECT_MISSED            = 18,
	SENT                       = 24,
	BLOCKED                    = 25,
	RETRIED                    = 26,
	RECEIVED                   = 28,
	DEADLINES_MISSED           = 29,
};

namespace CounterCategory {
constexpr uint8_t ROUTER     = 1u << 0;
constexpr uint8_t REINJECTOR = 1u << 1;
constexpr uint8_t SOURCE     = 1u << 2;
constexpr uint8_t SINK       = 1u << 3;
constexpr uint8_t PERMANENT  = 1u << 4;
}  // namespace CounterCategory

struct CounterInfo {
	Counter     counter;
	const char* name;        ///< Column name used in result tables
	uint8_t     categories;  ///< CounterCategory flags
};

/// @brief Every counter, in record-bit order
const std::vector<Counter>& getAllCounters();

const CounterInfo& getCounterInfo(Counter _counter);

inline std::string getCounterName(Counter _counter) { return getCounterInfo(_counter).name; }

/// @throws std::invalid_argument for an unknown name
Counter counterFromName(const std::string& _name);

inline uint32_t getRecordBit(Counter _counter) { return 1u << static_cast<uint8_t>(_counter); }

inline bool hasCategory(Counter _counter, uint8_t _category) {
	return (getCounterInfo(_counter).categories & _category) != 0;
}

inline bool isRouterCounter(Counter _c) { return hasCategory(_c, CounterCategory::ROUTER); }
inline bool isReinjectorCounter(Counter _c) { return hasCategory(_c, CounterCategory::REINJECTOR); }
inline bool isSourceCounter(Counter _c) { return hasCategory(_c, CounterCategory::SOURCE); }
inline bool isSinkCounter(Counter _c) { return hasCategory(_c, CounterCategory::SINK); }
inline bool isPermanentCounter(Counter _c) { return hasCategory(_c, CounterCategory::PERMANENT); }

/// @brief Counters measured per chip (router or reinjector)
inline bool isChipCounter(Counter _c) {
	return hasCategory(_c, CounterCategory::ROUTER | CounterCategory::REINJECTOR);
}

/// @brief Sort key fixing the column order of every result table
inline uint32_t getCounterOrder(Counter _c) { return static_cast<uint32_t>(_c); }

/// @brief OR of the record bits of every counter given
uint32_t getRecordMask(const std::vector<Counter>& _counters);

}  // namespace nettest
