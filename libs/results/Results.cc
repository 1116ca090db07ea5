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

#include "results/Results.hh"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

#include "experiment/Experiment.hh"
#include "utils/Logging.hh"

namespace nettest {

size_t getResultSize(size_t _numSamples, const RecordList& _recordList) {
	return 4 * (1 + _numSamples * _recordList.size());
}

EntityResults::EntityResults(const Entity& _entity, const RecordList& _recordList,
                             const std::vector<uint8_t>& _buffer, size_t _numSamples)
    : entity(&_entity), recordList(_recordList) {
	if (_buffer.size() < 4) {
		throw std::invalid_argument("Result buffer of entity '" + _entity.getName() + "' holds " +
		                            std::to_string(_buffer.size()) + " bytes, it must at least hold the error word");
	}

	for (size_t i = 0; i < this->recordList.size(); ++i) {
		this->columns.emplace(std::make_pair(this->recordList[i].object, this->recordList[i].counter), i);
	}

	auto word_at = [&_buffer](size_t _offset) {
		return static_cast<uint32_t>(_buffer[_offset]) | (static_cast<uint32_t>(_buffer[_offset + 1]) << 8) |
		       (static_cast<uint32_t>(_buffer[_offset + 2]) << 16) |
		       (static_cast<uint32_t>(_buffer[_offset + 3]) << 24);
	};
	this->errorWord = word_at(0);

	size_t width     = this->recordList.size();
	size_t available = (_buffer.size() - 4) / 4;
	size_t complete  = width == 0 ? _numSamples : std::min(_numSamples, available / width);

	if (complete < _numSamples) {
		LABELED_WARNING("Results") << "Entity '" << _entity.getName() << "' returned " << complete << " of "
		                           << _numSamples << " samples";
	} else if (available > _numSamples * width) {
		LABELED_WARNING("Results") << "Entity '" << _entity.getName() << "' returned "
		                           << (available - _numSamples * width) << " unexpected trailing words";
	}

	this->samples.resize(complete);
	for (size_t sample = 0; sample < complete; ++sample) {
		auto& row = this->samples[sample];
		row.reserve(width);
		for (size_t column = 0; column < width; ++column) row.push_back(word_at(4 * (1 + sample * width + column)));
	}
}

std::optional<uint32_t> EntityResults::getValue(size_t _sample, const MeasuredObject& _object,
                                                Counter _counter) const {
	if (_sample >= this->samples.size()) return std::nullopt;
	auto iter = this->columns.find(std::make_pair(_object, _counter));
	if (iter == this->columns.end()) return std::nullopt;
	return this->samples[_sample][iter->second];
}

bool EntityResults::records(const MeasuredObject& _object, Counter _counter) const {
	return this->columns.contains(std::make_pair(_object, _counter));
}

Results::Results(const Experiment& _experiment, const std::map<const Entity*, RecordList>& _recordLists,
                 const std::map<const Entity*, std::vector<uint8_t>>& _buffers, const RoutingMap& _routes)
    : experiment(_experiment), routes(_routes) {
	for (auto phase : this->experiment.getPhases()) {
		size_t num_samples = this->experiment.getNumSamples(*phase);
		double period      = this->experiment.getSamplePeriod(*phase);
		for (size_t i = 0; i < num_samples; ++i) this->samples.push_back({phase, static_cast<double>(i + 1) * period});

		for (const auto& [name, value] : phase->getLabels()) {
			if (std::find(this->labelNames.begin(), this->labelNames.end(), name) == this->labelNames.end()) {
				this->labelNames.push_back(name);
			}
		}
	}

	std::set<Counter> counters;
	for (auto entity : this->experiment.getEntities()) {
		auto       list_iter = _recordLists.find(entity);
		RecordList list      = list_iter != _recordLists.end() ? list_iter->second : RecordList{};

		auto buffer_iter = _buffers.find(entity);
		auto buffer      = buffer_iter != _buffers.end() ? buffer_iter->second : std::vector<uint8_t>(4, 0);

		this->entityResults.emplace(entity, EntityResults(*entity, list, buffer, this->samples.size()));

		for (const auto& entry : list) {
			counters.insert(entry.counter);
			if (auto chip = std::get_if<ChipCoord>(&entry.object)) {
				auto& recorders = this->routerEntities[*chip];
				if (std::find(recorders.begin(), recorders.end(), entity) == recorders.end()) {
					recorders.push_back(entity);
				}
			}
		}

		uint32_t error_word = this->entityResults.at(entity).getErrorWord();
		if (error_word & ~kKnownFaultMask) {
			std::stringstream ss;
			ss << std::hex << (error_word & ~kKnownFaultMask);
			LABELED_WARNING("Results") << "Ignoring unknown error bits 0x" << ss.str() << " reported by entity '"
			                           << entity->getName() << "'";
		}
		for (auto fault : faultsFromBits(error_word & kKnownFaultMask)) this->faults.insert(fault);
	}

	this->recordedCounters.assign(counters.begin(), counters.end());
	std::sort(this->recordedCounters.begin(), this->recordedCounters.end(),
	          [](Counter _a, Counter _b) { return getCounterOrder(_a) < getCounterOrder(_b); });

	VERBOSE_LABELED_INFO("Results") << "Decoded " << this->samples.size() << " samples of "
	                                << this->entityResults.size() << " entities";
}

ResultTable Results::getTotals() const {
	bool has_sent = std::find(this->recordedCounters.begin(), this->recordedCounters.end(), Counter::SENT) !=
	                this->recordedCounters.end();

	auto columns = this->getCommonColumns();
	for (auto counter : this->recordedCounters) columns.push_back(getCounterName(counter));
	if (has_sent) columns.push_back("ideal_received");

	// Every column of every entity recording a counter
	std::map<Counter, ColumnRefs> refs;
	for (const auto& [entity, results] : this->entityResults) {
		for (const auto& entry : results.getRecordList()) refs[entry.counter].emplace_back(entity, entry.object);
	}

	ResultTable table(columns);
	for (size_t sample = 0; sample < this->getNumRowSamples(this->recordedCounters); ++sample) {
		auto row = this->getCommonCells(sample);
		for (auto counter : this->recordedCounters) {
			auto value = this->sum(sample, counter, refs[counter]);
			row.push_back(value ? Cell(*value) : Cell());
		}

		if (has_sent) {
			std::optional<int64_t> ideal = 0;
			for (auto flow : this->experiment.getFlows()) {
				auto sent = this->sum(sample, Counter::SENT, this->getSourceRefs(*flow));
				if (!sent) {
					ideal.reset();
					break;
				}
				*ideal += *sent * static_cast<int64_t>(flow->getFanOut());
			}
			row.push_back(ideal ? Cell(*ideal) : Cell());
		}
		table.addRow(std::move(row));
	}
	return table;
}

ResultTable Results::getEntityTotals() const {
	auto counters = this->filterCounters(CounterCategory::SOURCE | CounterCategory::SINK | CounterCategory::PERMANENT);

	auto columns = this->getCommonColumns();
	columns.push_back("entity");
	for (auto counter : counters) columns.push_back(getCounterName(counter));

	ResultTable table(columns);
	for (size_t sample = 0; sample < this->getNumRowSamples(counters); ++sample) {
		for (auto entity : this->experiment.getEntities()) {
			auto row = this->getCommonCells(sample);
			row.push_back(entity);

			for (auto counter : counters) {
				ColumnRefs refs;
				if (isSourceCounter(counter)) {
					for (auto flow : entity->getSourceFlows()) refs.emplace_back(entity, flow);
				}
				if (isSinkCounter(counter)) {
					for (auto flow : entity->getSinkFlows()) refs.emplace_back(entity, flow);
				}
				if (isPermanentCounter(counter)) refs.emplace_back(entity, entity);

				auto value = this->sum(sample, counter, refs);
				row.push_back(value ? Cell(*value) : Cell());
			}
			table.addRow(std::move(row));
		}
	}
	return table;
}

ResultTable Results::getFlowTotals() const {
	auto counters = this->filterCounters(CounterCategory::SOURCE | CounterCategory::SINK);

	auto columns = this->getCommonColumns();
	columns.push_back("flow");
	for (auto counter : counters) columns.push_back(getCounterName(counter));
	columns.push_back("fan_out");

	ResultTable table(columns);
	for (size_t sample = 0; sample < this->getNumRowSamples(counters); ++sample) {
		for (auto flow : this->experiment.getFlows()) {
			auto row = this->getCommonCells(sample);
			row.push_back(flow);

			for (auto counter : counters) {
				auto value = this->sum(sample, counter,
				                       isSourceCounter(counter) ? this->getSourceRefs(*flow) : this->getSinkRefs(*flow));
				row.push_back(value ? Cell(*value) : Cell());
			}
			row.push_back(static_cast<int64_t>(flow->getFanOut()));
			table.addRow(std::move(row));
		}
	}
	return table;
}

ResultTable Results::getFlowCounters() const {
	auto counters = this->filterCounters(CounterCategory::SOURCE | CounterCategory::SINK);

	auto columns = this->getCommonColumns();
	for (const char* name : {"flow", "source", "sink"}) columns.push_back(name);
	for (auto counter : counters) columns.push_back(getCounterName(counter));
	columns.push_back("num_hops");

	ResultTable table(columns);
	for (size_t sample = 0; sample < this->getNumRowSamples(counters); ++sample) {
		for (auto flow : this->experiment.getFlows()) {
			auto route = this->routes.find(flow);

			for (auto sink : flow->getSinks()) {
				auto row = this->getCommonCells(sample);
				row.push_back(flow);
				row.push_back(&flow->getSource());
				row.push_back(sink);

				for (auto counter : counters) {
					auto value = this->sum(sample, counter,
					                       isSourceCounter(counter) ? this->getSourceRefs(*flow)
					                                                : ColumnRefs{{sink, MeasuredObject(flow)}});
					row.push_back(value ? Cell(*value) : Cell());
				}

				std::optional<uint32_t> hops;
				if (route != this->routes.end()) hops = route->second.getNumHops(*sink);
				row.push_back(hops ? Cell(static_cast<int64_t>(*hops)) : Cell());
				table.addRow(std::move(row));
			}
		}
	}
	return table;
}

ResultTable Results::getRouterCounters() const {
	auto counters = this->filterCounters(CounterCategory::ROUTER | CounterCategory::REINJECTOR);

	auto columns = this->getCommonColumns();
	columns.push_back("x");
	columns.push_back("y");
	for (auto counter : counters) columns.push_back(getCounterName(counter));

	ResultTable table(columns);
	for (size_t sample = 0; sample < this->getNumRowSamples(counters); ++sample) {
		for (const auto& [chip, entities] : this->routerEntities) {
			auto row = this->getCommonCells(sample);
			row.push_back(static_cast<int64_t>(chip.x));
			row.push_back(static_cast<int64_t>(chip.y));

			ColumnRefs refs;
			for (auto entity : entities) refs.emplace_back(entity, chip);
			for (auto counter : counters) {
				auto value = this->sum(sample, counter, refs);
				row.push_back(value ? Cell(*value) : Cell());
			}
			table.addRow(std::move(row));
		}
	}
	return table;
}

const std::vector<std::string>& Results::getTableNames() {
	static const std::vector<std::string> names = {"totals", "entity_totals", "flow_totals", "flow_counters",
	                                               "router_counters"};
	return names;
}

ResultTable Results::getTable(const std::string& _name) const {
	if (_name == "totals") return this->getTotals();
	if (_name == "entity_totals") return this->getEntityTotals();
	if (_name == "flow_totals") return this->getFlowTotals();
	if (_name == "flow_counters") return this->getFlowCounters();
	if (_name == "router_counters") return this->getRouterCounters();
	throw std::out_of_range("Unknown result table '" + _name + "'");
}

std::optional<int64_t> Results::sum(size_t _sample, Counter _counter, const ColumnRefs& _refs) const {
	int64_t total = 0;
	for (const auto& [entity, object] : _refs) {
		const auto& results = this->entityResults.at(entity);
		if (!results.records(object, _counter)) continue;

		auto value = results.getValue(_sample, object, _counter);
		if (!value) return std::nullopt;
		total += *value;
	}
	return total;
}

size_t Results::getNumRowSamples(const std::vector<Counter>& _counters) const {
	// A table without a single counter column has nothing to report
	return _counters.empty() ? 0 : this->samples.size();
}

std::vector<std::string> Results::getCommonColumns() const {
	auto columns = this->labelNames;
	columns.push_back("phase");
	columns.push_back("time");
	return columns;
}

std::vector<Cell> Results::getCommonCells(size_t _sample) const {
	const auto& info = this->samples[_sample];

	std::vector<Cell> cells;
	for (const auto& name : this->labelNames) {
		cells.push_back(std::visit([](const auto& _value) { return Cell(_value); }, info.phase->getLabel(name)));
	}
	cells.push_back(info.phase);
	cells.push_back(info.time);
	return cells;
}

std::vector<Counter> Results::filterCounters(uint8_t _categories) const {
	std::vector<Counter> counters;
	for (auto counter : this->recordedCounters) {
		if (hasCategory(counter, _categories)) counters.push_back(counter);
	}
	return counters;
}

Results::ColumnRefs Results::getSourceRefs(const Flow& _flow) const { return {{&_flow.getSource(), &_flow}}; }

Results::ColumnRefs Results::getSinkRefs(const Flow& _flow) const {
	ColumnRefs refs;
	for (auto sink : _flow.getSinks()) refs.emplace_back(sink, &_flow);
	return refs;
}

std::shared_ptr<const Results> decodeResults(const Experiment&                                    _experiment,
                                             const std::map<const Entity*, RecordList>&           _recordLists,
                                             const std::map<const Entity*, std::vector<uint8_t>>& _buffers,
                                             const RoutingMap&                                    _routes) {
	auto results = std::make_shared<const Results>(_experiment, _recordLists, _buffers, _routes);
	if (!results->getFaults().empty()) throw RunFailure(results, results->getFaults());
	return results;
}

}  // namespace nettest
