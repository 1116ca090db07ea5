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

#include "config/Option.hh"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace nettest {

namespace {

std::vector<OptionInfo> buildOptionTable() {
	using S = OptionScope;
	using K = ValueKind;

	std::vector<OptionInfo> table = {
	    {Option::SEED, "seed", S::OVERRIDABLE, K::INTEGER_OR_AUTO, std::monostate{}, std::nullopt},
	    {Option::TIMESTEP, "timestep", S::OVERRIDABLE, K::REAL, 0.001, std::nullopt},
	    {Option::WARMUP, "warmup", S::PHASE_ONLY, K::REAL, 1.0, std::nullopt},
	    {Option::DURATION, "duration", S::PHASE_ONLY, K::REAL, 1.0, std::nullopt},
	    {Option::COOLDOWN, "cooldown", S::PHASE_ONLY, K::REAL, 0.0, std::nullopt},
	    {Option::FLUSH_TIME, "flush_time", S::PHASE_ONLY, K::REAL, 0.001, std::nullopt},
	    {Option::RECORD_INTERVAL, "record_interval", S::PHASE_ONLY, K::REAL, 0.0, std::nullopt},
	    {Option::PROBABILITY, "probability", S::OVERRIDABLE, K::REAL, 0.0, std::nullopt},
	    {Option::BURST_PERIOD, "burst_period", S::OVERRIDABLE, K::REAL, 0.0, std::nullopt},
	    {Option::BURST_DUTY, "burst_duty", S::OVERRIDABLE, K::REAL, 0.0, std::nullopt},
	    {Option::BURST_PHASE, "burst_phase", S::OVERRIDABLE, K::REAL_OR_AUTO, 0.0, std::nullopt},
	    {Option::USE_PAYLOAD, "use_payload", S::OVERRIDABLE, K::BOOL, false, std::nullopt},
	    {Option::CONSUME_PACKETS, "consume_packets", S::OVERRIDABLE, K::BOOL, true, std::nullopt},
	    {Option::NUM_RETRIES, "num_retries", S::OVERRIDABLE, K::INTEGER, int64_t{0}, std::nullopt},
	    {Option::PACKETS_PER_TIMESTEP, "packets_per_timestep", S::OVERRIDABLE, K::INTEGER, int64_t{1}, std::nullopt},
	    {Option::ROUTER_TIMEOUT, "router_timeout", S::OVERRIDABLE, K::TIMEOUT_OR_AUTO, std::monostate{}, std::nullopt},
	    {Option::REINJECT_PACKETS, "reinject_packets", S::OVERRIDABLE, K::BOOL, false, std::nullopt},
	};

	// One record_* option per counter, in counter order
	static const Option kRecordOptions[] = {
	    Option::RECORD_LOCAL_MULTICAST,
	    Option::RECORD_EXTERNAL_MULTICAST,
	    Option::RECORD_LOCAL_P2P,
	    Option::RECORD_EXTERNAL_P2P,
	    Option::RECORD_LOCAL_NEAREST_NEIGHBOUR,
	    Option::RECORD_EXTERNAL_NEAREST_NEIGHBOUR,
	    Option::RECORD_LOCAL_FIXED_ROUTE,
	    Option::RECORD_EXTERNAL_FIXED_ROUTE,
	    Option::RECORD_DROPPED_MULTICAST,
	    Option::RECORD_DROPPED_P2P,
	    Option::RECORD_DROPPED_NEAREST_NEIGHBOUR,
	    Option::RECORD_DROPPED_FIXED_ROUTE,
	    Option::RECORD_COUNTER12,
	    Option::RECORD_COUNTER13,
	    Option::RECORD_COUNTER14,
	    Option::RECORD_COUNTER15,
	    Option::RECORD_REINJECTED,
	    Option::RECORD_REINJECT_OVERFLOW,
	    Option::RECORD_REINJECT_MISSED,
	    Option::RECORD_SENT,
	    Option::RECORD_BLOCKED,
	    Option::RECORD_RETRIED,
	    Option::RECORD_RECEIVED,
	    Option::RECORD_DEADLINES_MISSED,
	};

	const auto& counters = getAllCounters();
	for (size_t i = 0; i < counters.size(); ++i) {
		// Chip counters are read by the router-access entity on behalf of the whole chip
		bool chip  = isRouterCounter(counters[i]) || isReinjectorCounter(counters[i]);
		auto scope = chip ? S::GLOBAL_ONLY : S::ENTITY_ONLY;
		table.push_back({kRecordOptions[i], "record_" + getCounterName(counters[i]), scope, K::BOOL, false,
		                 counters[i]});
	}

	return table;
}

const std::vector<OptionInfo>& getOptionTable() {
	static const std::vector<OptionInfo> table = buildOptionTable();
	return table;
}

std::string lowercase(std::string _text) {
	std::transform(_text.begin(), _text.end(), _text.begin(), [](unsigned char c) { return std::tolower(c); });
	return _text;
}

bool isAutoText(const std::string& _text) {
	auto text = lowercase(_text);
	return text == "auto" || text == "none" || text == "null";
}

int64_t parseInteger(const std::string& _text) {
	size_t  consumed = 0;
	int64_t value    = std::stoll(_text, &consumed, 0);
	if (consumed != _text.size()) throw std::invalid_argument("'" + _text + "' is not an integer");
	return value;
}

double parseReal(const std::string& _text) {
	size_t consumed = 0;
	double value    = std::stod(_text, &consumed);
	if (consumed != _text.size()) throw std::invalid_argument("'" + _text + "' is not a number");
	return value;
}

uint32_t parseWait(const std::string& _text) {
	auto value = parseInteger(_text);
	if (value < 0 || value > UINT32_MAX) throw std::invalid_argument("'" + _text + "' is not a valid wait time");
	return static_cast<uint32_t>(value);
}

const char* getKindName(ValueKind _kind) {
	switch (_kind) {
		case ValueKind::BOOL: return "a boolean";
		case ValueKind::INTEGER: return "an integer";
		case ValueKind::REAL: return "a number";
		case ValueKind::INTEGER_OR_AUTO: return "an integer or auto";
		case ValueKind::REAL_OR_AUTO: return "a number or auto";
		case ValueKind::TIMEOUT_OR_AUTO: return "a router timeout or auto";
	}
	return "a value";
}

}  // namespace

const std::vector<Option>& getAllOptions() {
	static const std::vector<Option> options = [] {
		std::vector<Option> all;
		for (const auto& info : getOptionTable()) all.push_back(info.option);
		return all;
	}();
	return options;
}

const OptionInfo& getOptionInfo(Option _option) {
	for (const auto& info : getOptionTable()) {
		if (info.option == _option) return info;
	}
	throw std::invalid_argument("Unknown option id " + std::to_string(static_cast<int>(_option)));
}

Option optionFromName(const std::string& _name) {
	for (const auto& info : getOptionTable()) {
		if (info.name == _name) return info.option;
	}
	throw std::invalid_argument("Unknown option '" + _name + "'");
}

Option getRecordOption(Counter _counter) {
	for (const auto& info : getOptionTable()) {
		if (info.recordedCounter == _counter) return info.option;
	}
	throw std::invalid_argument("No record option for counter '" + getCounterName(_counter) + "'");
}

OptionValue validateOptionValue(Option _option, const OptionValue& _value) {
	const auto& info = getOptionInfo(_option);

	bool        valid = false;
	OptionValue value = _value;

	switch (info.kind) {
		case ValueKind::BOOL: valid = std::holds_alternative<bool>(_value); break;
		case ValueKind::INTEGER: valid = std::holds_alternative<int64_t>(_value); break;
		case ValueKind::INTEGER_OR_AUTO:
			valid = std::holds_alternative<int64_t>(_value) || std::holds_alternative<std::monostate>(_value);
			break;
		case ValueKind::REAL_OR_AUTO:
			if (std::holds_alternative<std::monostate>(_value)) {
				valid = true;
				break;
			}
			[[fallthrough]];
		case ValueKind::REAL:
			if (std::holds_alternative<int64_t>(_value)) {
				value = static_cast<double>(std::get<int64_t>(_value));
				valid = true;
			} else {
				valid = std::holds_alternative<double>(_value);
			}
			break;
		case ValueKind::TIMEOUT_OR_AUTO:
			if (std::holds_alternative<int64_t>(_value) && std::get<int64_t>(_value) >= 0) {
				value = RouterTimeout{static_cast<uint32_t>(std::get<int64_t>(_value)), 0};
				valid = true;
			} else {
				valid = std::holds_alternative<RouterTimeout>(_value) || std::holds_alternative<std::monostate>(_value);
			}
			break;
	}

	if (!valid) {
		throw std::invalid_argument("Option '" + info.name + "' expects " + getKindName(info.kind) + ", got " +
		                            toString(_value));
	}
	return value;
}

OptionValue parseOptionValue(Option _option, const std::string& _text) {
	const auto& info = getOptionInfo(_option);

	switch (info.kind) {
		case ValueKind::BOOL: {
			auto text = lowercase(_text);
			if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
			if (text == "false" || text == "0" || text == "no" || text == "off") return false;
			throw std::invalid_argument("Option '" + info.name + "' expects a boolean, got '" + _text + "'");
		}
		case ValueKind::INTEGER: return parseInteger(_text);
		case ValueKind::REAL: return parseReal(_text);
		case ValueKind::INTEGER_OR_AUTO:
			if (isAutoText(_text)) return std::monostate{};
			return parseInteger(_text);
		case ValueKind::REAL_OR_AUTO:
			if (isAutoText(_text)) return std::monostate{};
			return parseReal(_text);
		case ValueKind::TIMEOUT_OR_AUTO: {
			if (isAutoText(_text)) return std::monostate{};
			auto comma = _text.find(',');
			if (comma == std::string::npos) return RouterTimeout{parseWait(_text), 0};
			return RouterTimeout{parseWait(_text.substr(0, comma)), parseWait(_text.substr(comma + 1))};
		}
	}
	throw std::invalid_argument("Option '" + info.name + "' can not be parsed from '" + _text + "'");
}

bool isAuto(const OptionValue& _value) { return std::holds_alternative<std::monostate>(_value); }

bool asBool(const OptionValue& _value) {
	if (auto b = std::get_if<bool>(&_value)) return *b;
	throw std::invalid_argument("Expected a boolean, got " + toString(_value));
}

int64_t asInteger(const OptionValue& _value) {
	if (auto i = std::get_if<int64_t>(&_value)) return *i;
	throw std::invalid_argument("Expected an integer, got " + toString(_value));
}

double asReal(const OptionValue& _value) {
	if (auto d = std::get_if<double>(&_value)) return *d;
	if (auto i = std::get_if<int64_t>(&_value)) return static_cast<double>(*i);
	throw std::invalid_argument("Expected a number, got " + toString(_value));
}

std::string toString(const OptionValue& _value) {
	std::stringstream ss;
	std::visit(
	    [&ss](const auto& v) {
		    using T = std::decay_t<decltype(v)>;
		    if constexpr (std::is_same_v<T, std::monostate>) {
			    ss << "auto";
		    } else if constexpr (std::is_same_v<T, bool>) {
			    ss << (v ? "true" : "false");
		    } else if constexpr (std::is_same_v<T, RouterTimeout>) {
			    ss << v.wait1 << "," << v.wait2;
		    } else {
			    ss << v;
		    }
	    },
	    _value);
	return ss.str();
}

}  // namespace nettest
