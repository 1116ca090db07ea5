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
 * @file Option.hh
 * @brief Registry of experiment configuration parameters
 *
 * Each Option has a fixed entry in a static metadata table giving its name, the
 * scopes it may be overridden in, the kind of value it accepts and its default.
 *
 * **Scope classes:**
 * | OptionScope  | global | (phase, -) | (-, entity/flow) | (phase, entity/flow) |
 * |--------------|--------|------------|------------------|----------------------|
 * | GLOBAL_ONLY  |   x    |            |                  |                      |
 * | PHASE_ONLY   |   x    |     x      |                  |                      |
 * | ENTITY_ONLY  |   x    |            |    x (entity)    |                      |
 * | OVERRIDABLE  |   x    |     x      |        x         |          x           |
 *
 * The set of recorded counters fixes the column layout of a result buffer for the
 * whole run, so no record_* option can change per phase. Source, sink and
 * permanent counters are ENTITY_ONLY; router and reinjector counters are
 * GLOBAL_ONLY. The timing options which decide how many samples a phase produces
 * are PHASE_ONLY: every entity must agree on the number of rows it records.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "counter/Counter.hh"

namespace nettest {

/**
 * @brief Router wait times (in router clock cycles) before emergency routing and before dropping
 */
struct RouterTimeout {
	uint32_t wait1 = 0;
	uint32_t wait2 = 0;

	bool operator==(const RouterTimeout& _other) const = default;
};

/// @brief std::monostate stands for "auto" (seed, burst phase) or "leave untouched" (router timeout)
using OptionValue = std::variant<std::monostate, bool, int64_t, double, RouterTimeout>;

enum class OptionScope { GLOBAL_ONLY, PHASE_ONLY, ENTITY_ONLY, OVERRIDABLE };

enum class ValueKind {
	BOOL,
	INTEGER,
	REAL,
	INTEGER_OR_AUTO,  ///< seed
	REAL_OR_AUTO,     ///< burst phase, "auto" picks a random phase
	TIMEOUT_OR_AUTO,  ///< router timeout, "auto" keeps the router's own setting
};

enum class Option {
	SEED,
	TIMESTEP,
	WARMUP,
	DURATION,
	COOLDOWN,
	FLUSH_TIME,
	RECORD_INTERVAL,
	PROBABILITY,
	BURST_PERIOD,
	BURST_DUTY,
	BURST_PHASE,
	USE_PAYLOAD,
	CONSUME_PACKETS,
	NUM_RETRIES,
	PACKETS_PER_TIMESTEP,
	ROUTER_TIMEOUT,
	REINJECT_PACKETS,
	RECORD_LOCAL_MULTICAST,
	RECORD_EXTERNAL_MULTICAST,
	RECORD_LOCAL_P2P,
	RECORD_EXTERNAL_P2P,
	RECORD_LOCAL_NEAREST_NEIGHBOUR,
	RECORD_EXTERNAL_NEAREST_NEIGHBOUR,
	RECORD_LOCAL_FIXED_ROUTE,
	RECORD_EXTERNAL_FIXED_ROUTE,
	RECORD_DROPPED_MULTICAST,
	RECORD_DROPPED_P2P,
	RECORD_DROPPED_NEAREST_NEIGHBOUR,
	RECORD_DROPPED_FIXED_ROUTE,
	RECORD_COUNTER12,
	RECORD_COUNTER13,
	RECORD_COUNTER14,
	RECORD_COUNTER15,
	RECORD_REINJECTED,
	RECORD_REINJECT_OVERFLOW,
	RECORD_REINJECT_MISSED,
	RECORD_SENT,
	RECORD_BLOCKED,
	RECORD_RETRIED,
	RECORD_RECEIVED,
	RECORD_DEADLINES_MISSED,
};

struct OptionInfo {
	Option                 option;
	std::string            name;
	OptionScope            scope;
	ValueKind              kind;
	OptionValue            defaultValue;
	std::optional<Counter> recordedCounter;  ///< Set for the record_* options
};

const std::vector<Option>& getAllOptions();

const OptionInfo& getOptionInfo(Option _option);

inline std::string getOptionName(Option _option) { return getOptionInfo(_option).name; }

/// @throws std::invalid_argument for an unknown name
Option optionFromName(const std::string& _name);

/// @brief The record_* option enabling a counter
Option getRecordOption(Counter _counter);

/**
 * @brief Check a value against the option's ValueKind
 * @return The value, with integers widened to reals where a real is expected
 * @throws std::invalid_argument if the value is of the wrong kind
 */
OptionValue validateOptionValue(Option _option, const OptionValue& _value);

/**
 * @brief Parse a command line style value: "true", "false", "auto", "0.5", "16" or "480,16"
 * @throws std::invalid_argument if the text does not fit the option's ValueKind
 */
OptionValue parseOptionValue(Option _option, const std::string& _text);

bool        isAuto(const OptionValue& _value);
bool        asBool(const OptionValue& _value);
int64_t     asInteger(const OptionValue& _value);
double      asReal(const OptionValue& _value);
std::string toString(const OptionValue& _value);

}  // namespace nettest
