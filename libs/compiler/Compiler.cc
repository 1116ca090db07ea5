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

#include "compiler/Compiler.hh"

#include "errors/Errors.hh"
#include "experiment/Experiment.hh"
#include "utils/Logging.hh"

namespace nettest {

namespace {

uint32_t toCount(Option _option, const OptionValue& _value, const Flow& _flow) {
	int64_t count = asInteger(_value);
	if (count < 0 || count > 0xFFFFFFFF) {
		throw CompileError("Option '" + getOptionName(_option) + "' of flow '" + _flow.getName() +
		                   "' must be within [0, 4294967295], got " + std::to_string(count));
	}
	return static_cast<uint32_t>(count);
}

}  // namespace

Commands Compiler::compile(const Entity& _entity, const RecordList& _recordList, bool _routerAccess) const {
	const auto& source_flows = _entity.getSourceFlows();
	const auto& sink_flows   = _entity.getSinkFlows();

	Commands commands;
	commands.num(static_cast<uint32_t>(source_flows.size()), static_cast<uint32_t>(sink_flows.size()));
	for (size_t i = 0; i < source_flows.size(); ++i) {
		commands.sourceKey(i, this->experiment.getFlowKey(*source_flows[i]));
	}
	for (size_t i = 0; i < sink_flows.size(); ++i) {
		commands.sinkKey(i, this->experiment.getFlowKey(*sink_flows[i]));
	}

	// The record mask must describe exactly the columns the decoder expects
	std::vector<Counter> recorded;
	for (const auto& entry : _recordList) {
		if (recorded.empty() || recorded.back() != entry.counter) recorded.push_back(entry.counter);
	}

	for (auto phase : this->experiment.getPhases()) {
		this->compilePhase(commands, _entity, *phase, recorded, _routerAccess);
	}
	commands.exit();

	VERBOSE_LABELED_INFO("Compiler") << "Entity '" << _entity.getName() << "' compiled to " << commands.getSize()
	                                 << " bytes";
	return commands;
}

void Compiler::compilePhase(Commands& _commands, const Entity& _entity, const Phase& _phase,
                            const std::vector<Counter>& _recorded, bool _routerAccess) const {
	const auto& resolver = this->experiment.getResolver();
	auto        get      = [&](Option _option, const OptionOwner& _owner) {
		return resolver.get(_option, &_phase, _owner);
	};

	bool timeout_set = false;
	if (_routerAccess) {
		auto timeout = get(Option::ROUTER_TIMEOUT, &_entity);
		if (!isAuto(timeout)) {
			_commands.routerTimeout(std::get<RouterTimeout>(timeout));
			timeout_set = true;
		}
		_commands.reinject(asBool(get(Option::REINJECT_PACKETS, &_entity)));
	}

	auto seed = get(Option::SEED, &_entity);
	_commands.seed(isAuto(seed) ? std::nullopt : std::optional<uint32_t>(static_cast<uint32_t>(asInteger(seed))));
	_commands.timestep(asReal(get(Option::TIMESTEP, &_entity)));

	const auto& source_flows = _entity.getSourceFlows();
	for (size_t i = 0; i < source_flows.size(); ++i) {
		const Flow* flow = source_flows[i];

		auto burst_phase = get(Option::BURST_PHASE, flow);
		_commands.probability(i, asReal(get(Option::PROBABILITY, flow)));
		_commands.burst(i, asReal(get(Option::BURST_PERIOD, flow)), asReal(get(Option::BURST_DUTY, flow)),
		                isAuto(burst_phase) ? std::nullopt : std::optional<double>(asReal(burst_phase)));
		_commands.payload(i, asBool(get(Option::USE_PAYLOAD, flow)));
		_commands.numRetries(i, toCount(Option::NUM_RETRIES, get(Option::NUM_RETRIES, flow), *flow));
		_commands.numPackets(i, toCount(Option::PACKETS_PER_TIMESTEP, get(Option::PACKETS_PER_TIMESTEP, flow), *flow));
	}

	_commands.record(_recorded);
	_commands.recordInterval(asReal(get(Option::RECORD_INTERVAL, {})));

	_commands.barrier();
	_commands.consume(asBool(get(Option::CONSUME_PACKETS, &_entity)));

	_commands.run(asReal(get(Option::WARMUP, {})), false);
	_commands.run(asReal(get(Option::DURATION, {})), true);
	_commands.run(asReal(get(Option::COOLDOWN, {})), false);

	_commands.consume(true);
	_commands.sleep(asReal(get(Option::FLUSH_TIME, {})));

	if (_routerAccess) {
		if (timeout_set) _commands.routerTimeoutRestore();
		_commands.reinject(false);
	}
}

}  // namespace nettest
