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
 * @file Results.hh
 * @brief Decoding of result buffers into relational tables
 *
 * Every entity returns one buffer: an error word followed by one row of 32-bit
 * counter values per sample, with one column per RecordList entry. Rows are
 * numbered across the whole experiment, phase after phase.
 *
 * All tables start with the same common columns: one column per phase label
 * (missing labels are empty), `phase` and `time`, the end of the sample
 * relative to the start of its phase. Then:
 *
 * | Table           | One row per                 | Counter columns                 |
 * |-----------------|-----------------------------|---------------------------------|
 * | totals          | sample                      | all, plus `ideal_received`      |
 * | entity_totals   | sample, entity              | source, sink and permanent      |
 * | flow_totals     | sample, flow                | source and sink, plus `fan_out` |
 * | flow_counters   | sample, flow, source, sink  | source and sink, plus `num_hops`|
 * | router_counters | sample, chip (`x`, `y`)     | router and reinjector           |
 *
 * A table none of whose counters is recorded by any entity has no rows.
 *
 * Buffers cut short by a failed run are accepted; every value depending on a
 * missing sample is left empty.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors/Errors.hh"
#include "experiment/RecordList.hh"
#include "external/PlaceAndRoute.hh"
#include "results/ResultTable.hh"

namespace nettest {

class Experiment;
class Phase;

/// @brief Size in bytes of a result buffer holding the given number of samples
size_t getResultSize(size_t _numSamples, const RecordList& _recordList);

/**
 * @brief Decoded buffer of one entity
 */
class EntityResults {
public:
	/// @throws std::invalid_argument if the buffer does not even hold the error word
	EntityResults(const Entity& _entity, const RecordList& _recordList, const std::vector<uint8_t>& _buffer,
	              size_t _numSamples);

	const Entity&     getEntity() const { return *this->entity; }
	const RecordList& getRecordList() const { return this->recordList; }
	uint32_t          getErrorWord() const { return this->errorWord; }

	/// @brief Number of complete samples found in the buffer
	size_t getNumSamples() const { return this->samples.size(); }

	/// @brief Recorded value, empty if the sample is missing or the column is not recorded
	std::optional<uint32_t> getValue(size_t _sample, const MeasuredObject& _object, Counter _counter) const;

	bool records(const MeasuredObject& _object, Counter _counter) const;

private:
	const Entity*                                        entity;
	RecordList                                           recordList;
	std::map<std::pair<MeasuredObject, Counter>, size_t> columns;
	uint32_t                                             errorWord = 0;
	std::vector<std::vector<uint32_t>>                   samples;
};

class Results {
public:
	/**
	 * @brief Decode the result buffer of every entity
	 *
	 * Entities without a buffer are treated as having returned no samples.
	 * @param _routes Routing of the flows, used for `num_hops`
	 * @throws std::invalid_argument if a buffer is malformed
	 */
	Results(const Experiment& _experiment, const std::map<const Entity*, RecordList>& _recordLists,
	        const std::map<const Entity*, std::vector<uint8_t>>& _buffers, const RoutingMap& _routes = {});

	/// @brief Union of the counters recorded by any entity, in record-bit order
	const std::vector<Counter>& getRecordedCounters() const { return this->recordedCounters; }

	/// @brief Faults reported by any entity, unknown bits are ignored
	const RuntimeFaultSet& getFaults() const { return this->faults; }

	const std::map<const Entity*, EntityResults>& getEntityResults() const { return this->entityResults; }

	/// @brief Samples in the whole experiment, complete or not
	size_t getNumSamples() const { return this->samples.size(); }

	ResultTable getTotals() const;
	ResultTable getEntityTotals() const;
	ResultTable getFlowTotals() const;
	ResultTable getFlowCounters() const;
	ResultTable getRouterCounters() const;

	static const std::vector<std::string>& getTableNames();

	/// @throws std::out_of_range for a name not listed by getTableNames()
	ResultTable getTable(const std::string& _name) const;

private:
	struct SampleInfo {
		const Phase* phase;
		double       time;
	};

	/// @brief Sum of one counter over the given (entity, object) columns, empty if any value is missing
	using ColumnRefs = std::vector<std::pair<const Entity*, MeasuredObject>>;
	std::optional<int64_t> sum(size_t _sample, Counter _counter, const ColumnRefs& _refs) const;

	/// @brief Samples a table lists, none when it has no counter columns
	size_t getNumRowSamples(const std::vector<Counter>& _counters) const;

	std::vector<std::string> getCommonColumns() const;
	std::vector<Cell>        getCommonCells(size_t _sample) const;

	std::vector<Counter> filterCounters(uint8_t _categories) const;

	ColumnRefs getSourceRefs(const Flow& _flow) const;
	ColumnRefs getSinkRefs(const Flow& _flow) const;

	const Experiment&                      experiment;
	RoutingMap                             routes;
	std::map<const Entity*, EntityResults> entityResults;
	std::vector<Counter>                   recordedCounters;
	std::vector<std::string>               labelNames;
	std::vector<SampleInfo>                samples;
	RuntimeFaultSet                        faults;

	/// @brief Entities recording the router of each chip
	std::map<ChipCoord, std::vector<const Entity*>> routerEntities;
};

/**
 * @brief Decode every buffer of a run
 * @throws RunFailure carrying the decoded results if any entity reported a fault
 */
std::shared_ptr<const Results> decodeResults(const Experiment&                                    _experiment,
                                             const std::map<const Entity*, RecordList>&           _recordLists,
                                             const std::map<const Entity*, std::vector<uint8_t>>& _buffers,
                                             const RoutingMap&                                    _routes = {});

}  // namespace nettest
