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
 * @file OptionResolver.hh
 * @brief Hierarchical option storage resolving one value per (option, phase, entity or flow)
 *
 * **Resolution order (lowest to highest priority):**
 * ```
 * entity key:  global -> phase -> entity -> (phase, entity)
 * flow key:    global -> phase -> source entity -> (phase, source entity) -> flow -> (phase, flow)
 * ```
 * Every tier only replaces the value resolved by the tiers below it when it
 * holds an entry, so a (phase, entity) exception never leaks into the phase-only
 * or entity-only views, and a flow's own exceptions always win over anything set
 * for its source entity.
 *
 * GLOBAL_ONLY options ignore the phase and owner arguments of get(); PHASE_ONLY
 * options ignore the owner argument. ENTITY_ONLY options ignore the phase and
 * resolve a flow through its source entity. Setting an exception in a scope the
 * option does not support raises ScopeError.
 */

#pragma once

#include <map>
#include <utility>
#include <variant>

#include "config/Option.hh"

namespace nettest {

class Entity;
class Flow;
class Phase;

/// @brief What an option exception is attached to besides an optional phase
using OptionOwner = std::variant<std::monostate, const Entity*, const Flow*>;

class OptionResolver {
public:
	/// @brief Create a resolver holding every option's default as its global value
	OptionResolver();

	OptionValue get(Option _option, const Phase* _phase = nullptr, const OptionOwner& _owner = {}) const;

	/**
	 * @brief Set the value of an option in one scope
	 * @throws ScopeError if the option does not support exceptions in that scope
	 * @throws std::invalid_argument if the value is of the wrong kind
	 */
	void set(Option _option, const OptionValue& _value, const Phase* _phase = nullptr, const OptionOwner& _owner = {});

	/**
	 * @brief Remove an exception so the scope inherits again
	 * @throws std::invalid_argument when asked to remove the global value
	 */
	void unset(Option _option, const Phase* _phase, const OptionOwner& _owner);

	bool hasException(Option _option, const Phase* _phase, const OptionOwner& _owner) const;

private:
	using ScopeKey = std::pair<const Phase*, OptionOwner>;
	using TierMap  = std::map<ScopeKey, OptionValue>;

	void checkScope(Option _option, const Phase* _phase, const OptionOwner& _owner) const;

	/// @brief Value at one tier, or the value resolved so far when the tier is empty
	static const OptionValue& lookup(const TierMap& _tiers, const Phase* _phase, const OptionOwner& _owner,
	                                 const OptionValue& _fallback);

	static std::string describeScope(const Phase* _phase, const OptionOwner& _owner);

	std::map<Option, TierMap> values;
};

}  // namespace nettest
