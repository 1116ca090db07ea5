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
 * @file Experiment.hh
 * @brief Declarative description of a network experiment
 *
 * An Experiment owns the entities, flows and phases of one run together with
 * the OptionResolver holding every option value. Options are read and written
 * through OptionAccessor objects which resolve against the phase currently being
 * defined:
 *
 * ```cpp
 * nettest::Experiment experiment;
 * auto& a = experiment.newEntity("a");
 * auto& b = experiment.newEntity("b");
 * auto& f = experiment.newFlow(a, b);
 *
 * experiment.option(Option::RECORD_SENT) = true;
 * for (double p : {0.1, 0.5, 1.0}) {
 *     auto scope = experiment.definePhase();
 *     scope.getPhase().addLabel("probability", p);
 *     f.option(Option::PROBABILITY) = p;
 * }
 * ```
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/Option.hh"
#include "config/OptionResolver.hh"
#include "counter/Counter.hh"
#include "experiment/Entity.hh"
#include "experiment/Flow.hh"
#include "experiment/OptionAccessor.hh"
#include "experiment/Phase.hh"
#include "experiment/RecordList.hh"
#include "external/PlaceAndRoute.hh"

namespace nettest {

class PhaseScope;

class Experiment {
public:
	Experiment() = default;

	Experiment(const Experiment&)            = delete;
	Experiment& operator=(const Experiment&) = delete;

	/**
	 * @brief Create a traffic endpoint
	 * @param _name Unique name, `entityN` when empty
	 * @param _chip Chip the entity must be placed on
	 * @throws std::invalid_argument if the name is already taken
	 */
	Entity& newEntity(const std::string& _name = "", std::optional<ChipCoord> _chip = std::nullopt);

	/**
	 * @brief Create a flow from one source to one or more sinks
	 *
	 * A sink listed more than once is kept once.
	 * @throws std::invalid_argument if an endpoint belongs to another experiment, no sink is
	 *         given or the name is already taken
	 */
	Flow& newFlow(const Entity& _source, const std::vector<const Entity*>& _sinks, const std::string& _name = "");
	Flow& newFlow(const Entity& _source, const Entity& _sink, const std::string& _name = "");

	/// @brief Create a phase without opening it
	Phase& newPhase(const std::string& _name = "");

	/**
	 * @brief Make option assignments apply to the given phase
	 * @throws NestingError if another phase is being defined
	 * @throws std::invalid_argument if the phase belongs to another experiment
	 */
	void beginPhase(Phase& _phase);

	/// @throws NestingError if no phase is being defined
	void endPhase();

	/// @brief Create a phase and keep it open until the returned guard is destroyed
	PhaseScope definePhase(const std::string& _name = "");

	/// @brief Phase being defined, nullptr outside any phase
	Phase*       getCurrentPhase() { return this->currentPhase; }
	const Phase* getCurrentPhase() const { return this->currentPhase; }

	/// @brief Experiment-wide option, or the current phase's exception
	OptionAccessor option(Option _option) { return OptionAccessor(*this, _option, OptionOwner{}); }

	OptionResolver&       getResolver() { return this->resolver; }
	const OptionResolver& getResolver() const { return this->resolver; }

	std::vector<const Entity*> getEntities() const;
	std::vector<const Flow*>   getFlows() const;
	std::vector<const Phase*>  getPhases() const;

	size_t getNumEntities() const { return this->entities.size(); }
	size_t getNumFlows() const { return this->flows.size(); }
	size_t getNumPhases() const { return this->phases.size(); }

	/// @throws std::out_of_range if there is no such entity
	Entity& getEntity(const std::string& _name);
	/// @throws std::out_of_range if there is no such flow
	Flow& getFlow(const std::string& _name);
	/// @throws std::out_of_range if there is no such phase
	Phase& getPhase(const std::string& _name);

	bool owns(const Entity& _entity) const;
	bool owns(const Flow& _flow) const;
	bool owns(const Phase& _phase) const;

	/**
	 * @brief Counters whose record_* option is enabled, in record-bit order
	 * @param _entity Entity whose own record_* exceptions apply, none for the experiment-wide choice
	 */
	std::vector<Counter> getRecordedCounters(const Entity* _entity = nullptr) const;

	/// @brief Routing key of a flow, the low 8 bits are left free for the interpreter
	uint32_t getFlowKey(const Flow& _flow) const { return static_cast<uint32_t>(_flow.getIndex()) << 8; }

	/// @brief Samples recorded in a phase, see getNumSamples(double, double)
	size_t getNumSamples(const Phase& _phase) const;

	/// @brief Samples recorded over all phases
	size_t getTotalNumSamples() const;

	/// @brief Seconds between two samples of a phase: record_interval, or duration when it is 0
	double getSamplePeriod(const Phase& _phase) const;

	/**
	 * @brief Run the placement collaborator for every entity
	 *
	 * Each entity demands one core and the monitor core of every chip is reserved.
	 * Entities with a chip constraint are pinned to that chip.
	 * @throws std::invalid_argument if the result misses an entity or ignores a chip constraint
	 */
	void placeAndRoute(PlaceAndRoute& _placer);

	/// @brief Use an externally computed placement instead of placeAndRoute()
	void setPlaceAndRouteResult(const PlaceAndRouteResult& _result);

	bool                isPlaced() const { return this->placed.has_value(); }
	const PlacementMap& getPlacements() const;
	const RoutingMap&   getRoutes() const;

	/**
	 * @brief Entity designated to access the router of each chip
	 *
	 * The first entity created on a chip is its router-access entity.
	 * @throws std::logic_error if the experiment has not been placed
	 */
	std::map<const Entity*, ChipCoord> getRouterAccessEntities() const;

	/**
	 * @brief Result buffer layout of every entity for the recorded counters
	 * @throws std::logic_error if the experiment has not been placed
	 */
	std::map<const Entity*, RecordList> getRecordLists() const;

private:
	void checkName(const std::string& _kind, const std::string& _name, bool _taken) const;
	void validatePlacement(const PlaceAndRouteResult& _result) const;

	OptionResolver resolver;

	std::vector<std::unique_ptr<Entity>> entities;
	std::vector<std::unique_ptr<Flow>>   flows;
	std::vector<std::unique_ptr<Phase>>  phases;

	std::map<std::string, Entity*> entityByName;
	std::map<std::string, Flow*>   flowByName;
	std::map<std::string, Phase*>  phaseByName;

	Phase* currentPhase = nullptr;

	std::optional<PlaceAndRouteResult> placed;
};

/**
 * @brief Keeps a phase open for option assignments while in scope
 */
class PhaseScope {
public:
	PhaseScope(Experiment& _experiment, Phase& _phase) : experiment(_experiment), phase(_phase) {
		this->experiment.beginPhase(this->phase);
	}
	~PhaseScope() {
		if (this->experiment.getCurrentPhase() == &this->phase) this->experiment.endPhase();
	}

	PhaseScope(const PhaseScope&)            = delete;
	PhaseScope& operator=(const PhaseScope&) = delete;

	Phase& getPhase() { return this->phase; }

private:
	Experiment& experiment;
	Phase&      phase;
};

}  // namespace nettest
