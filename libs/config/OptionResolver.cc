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

#include "config/OptionResolver.hh"

#include <stdexcept>

#include "errors/Errors.hh"
#include "experiment/Entity.hh"
#include "experiment/Flow.hh"
#include "experiment/Phase.hh"
#include "utils/Logging.hh"

namespace nettest {

OptionResolver::OptionResolver() {
	for (auto option : getAllOptions()) {
		this->values[option].emplace(ScopeKey{nullptr, OptionOwner{}}, getOptionInfo(option).defaultValue);
	}
}

OptionValue OptionResolver::get(Option _option, const Phase* _phase, const OptionOwner& _owner) const {
	const auto& tiers = this->values.at(_option);
	const auto& info  = getOptionInfo(_option);

	const OptionValue& global_value = tiers.at(ScopeKey{nullptr, OptionOwner{}});
	if (info.scope == OptionScope::GLOBAL_ONLY) return global_value;

	const Entity* entity = nullptr;
	const Flow*   flow   = nullptr;
	if (auto e = std::get_if<const Entity*>(&_owner)) {
		entity = *e;
	} else if (auto f = std::get_if<const Flow*>(&_owner)) {
		flow   = *f;
		entity = &flow->getSource();
	}

	if (info.scope == OptionScope::ENTITY_ONLY) {
		return entity ? lookup(tiers, nullptr, entity, global_value) : global_value;
	}

	const OptionValue& phase_value = _phase ? lookup(tiers, _phase, OptionOwner{}, global_value) : global_value;
	if (info.scope == OptionScope::PHASE_ONLY || !entity) return phase_value;

	const OptionValue* value = &lookup(tiers, nullptr, entity, phase_value);
	if (_phase) value = &lookup(tiers, _phase, entity, *value);

	if (flow) {
		value = &lookup(tiers, nullptr, flow, *value);
		if (_phase) value = &lookup(tiers, _phase, flow, *value);
	}

	return *value;
}

void OptionResolver::set(Option _option, const OptionValue& _value, const Phase* _phase, const OptionOwner& _owner) {
	this->checkScope(_option, _phase, _owner);
	auto value = validateOptionValue(_option, _value);

	VERBOSE_LABELED_INFO("OptionResolver") << getOptionName(_option) << " = " << toString(value) << " for "
	                                       << describeScope(_phase, _owner);

	this->values.at(_option)[ScopeKey{_phase, _owner}] = value;
}

void OptionResolver::unset(Option _option, const Phase* _phase, const OptionOwner& _owner) {
	if (!_phase && std::holds_alternative<std::monostate>(_owner)) {
		throw std::invalid_argument("The global value of '" + getOptionName(_option) + "' can not be removed");
	}
	this->values.at(_option).erase(ScopeKey{_phase, _owner});
}

bool OptionResolver::hasException(Option _option, const Phase* _phase, const OptionOwner& _owner) const {
	return this->values.at(_option).contains(ScopeKey{_phase, _owner});
}

void OptionResolver::checkScope(Option _option, const Phase* _phase, const OptionOwner& _owner) const {
	const auto& info      = getOptionInfo(_option);
	const bool  has_owner = !std::holds_alternative<std::monostate>(_owner);

	if (info.scope == OptionScope::GLOBAL_ONLY && (_phase || has_owner)) {
		throw ScopeError("Option '" + info.name + "' is global-only and can not be set for " +
		                 describeScope(_phase, _owner));
	}
	if (info.scope == OptionScope::PHASE_ONLY && has_owner) {
		throw ScopeError("Option '" + info.name + "' can only be set globally or per phase, not for " +
		                 describeScope(_phase, _owner));
	}
	if (info.scope == OptionScope::ENTITY_ONLY && (_phase || std::holds_alternative<const Flow*>(_owner))) {
		throw ScopeError("Option '" + info.name + "' can only be set globally or per entity, not for " +
		                 describeScope(_phase, _owner));
	}
}

const OptionValue& OptionResolver::lookup(const TierMap& _tiers, const Phase* _phase, const OptionOwner& _owner,
                                          const OptionValue& _fallback) {
	auto iter = _tiers.find(ScopeKey{_phase, _owner});
	return iter != _tiers.end() ? iter->second : _fallback;
}

std::string OptionResolver::describeScope(const Phase* _phase, const OptionOwner& _owner) {
	std::string scope;
	if (auto e = std::get_if<const Entity*>(&_owner)) {
		scope = "entity '" + (*e)->getName() + "'";
	} else if (auto f = std::get_if<const Flow*>(&_owner)) {
		scope = "flow '" + (*f)->getName() + "'";
	}

	if (_phase) scope += std::string(scope.empty() ? "" : " in ") + "phase '" + _phase->getName() + "'";
	return scope.empty() ? "the whole experiment" : scope;
}

}  // namespace nettest
