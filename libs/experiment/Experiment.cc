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

#include "experiment/Experiment.hh"

#include <algorithm>
#include <stdexcept>

#include "errors/Errors.hh"
#include "utils/Logging.hh"

namespace nettest {

Entity& Experiment::newEntity(const std::string& _name, std::optional<ChipCoord> _chip) {
	size_t      index = this->entities.size();
	std::string name  = _name.empty() ? "entity" + std::to_string(index) : _name;
	this->checkName("entity", name, this->entityByName.contains(name));

	this->entities.push_back(std::make_unique<Entity>(*this, index, name, _chip));
	Entity* entity = this->entities.back().get();
	this->entityByName[name] = entity;

	// A new entity invalidates any placement solution
	this->placed.reset();
	return *entity;
}

Flow& Experiment::newFlow(const Entity& _source, const std::vector<const Entity*>& _sinks, const std::string& _name) {
	if (!this->owns(_source)) {
		throw std::invalid_argument("Source entity '" + _source.getName() + "' belongs to another experiment");
	}
	if (_sinks.empty()) throw std::invalid_argument("A flow needs at least one sink");

	std::vector<const Entity*> sinks;
	for (auto sink : _sinks) {
		if (!sink || !this->owns(*sink)) {
			throw std::invalid_argument("Sink entity '" + (sink ? sink->getName() : std::string("null")) +
			                            "' belongs to another experiment");
		}
		if (std::find(sinks.begin(), sinks.end(), sink) == sinks.end()) sinks.push_back(sink);
	}

	size_t      index = this->flows.size();
	std::string name  = _name.empty() ? "flow" + std::to_string(index) : _name;
	this->checkName("flow", name, this->flowByName.contains(name));

	this->flows.push_back(std::make_unique<Flow>(*this, index, name, _source, sinks));
	Flow* flow = this->flows.back().get();
	this->flowByName[name] = flow;

	this->entities[_source.getIndex()]->sourceFlows.push_back(flow);
	for (auto sink : sinks) this->entities[sink->getIndex()]->sinkFlows.push_back(flow);

	// Routes are computed per flow
	this->placed.reset();
	return *flow;
}

Flow& Experiment::newFlow(const Entity& _source, const Entity& _sink, const std::string& _name) {
	return this->newFlow(_source, std::vector<const Entity*>{&_sink}, _name);
}

Phase& Experiment::newPhase(const std::string& _name) {
	size_t      index = this->phases.size();
	std::string name  = _name.empty() ? "phase" + std::to_string(index) : _name;
	this->checkName("phase", name, this->phaseByName.contains(name));

	this->phases.push_back(std::make_unique<Phase>(index, name));
	Phase* phase = this->phases.back().get();
	this->phaseByName[name] = phase;
	return *phase;
}

void Experiment::beginPhase(Phase& _phase) {
	if (!this->owns(_phase)) {
		throw std::invalid_argument("Phase '" + _phase.getName() + "' belongs to another experiment");
	}
	if (this->currentPhase) {
		throw NestingError("Can not begin phase '" + _phase.getName() + "' while phase '" +
		                   this->currentPhase->getName() + "' is being defined");
	}
	this->currentPhase = &_phase;
}

void Experiment::endPhase() {
	if (!this->currentPhase) throw NestingError("No phase is being defined");
	this->currentPhase = nullptr;
}

PhaseScope Experiment::definePhase(const std::string& _name) { return PhaseScope(*this, this->newPhase(_name)); }

std::vector<const Entity*> Experiment::getEntities() const {
	std::vector<const Entity*> result;
	for (const auto& entity : this->entities) result.push_back(entity.get());
	return result;
}

std::vector<const Flow*> Experiment::getFlows() const {
	std::vector<const Flow*> result;
	for (const auto& flow : this->flows) result.push_back(flow.get());
	return result;
}

std::vector<const Phase*> Experiment::getPhases() const {
	std::vector<const Phase*> result;
	for (const auto& phase : this->phases) result.push_back(phase.get());
	return result;
}

Entity& Experiment::getEntity(const std::string& _name) {
	auto iter = this->entityByName.find(_name);
	if (iter == this->entityByName.end()) throw std::out_of_range("Unknown entity '" + _name + "'");
	return *iter->second;
}

Flow& Experiment::getFlow(const std::string& _name) {
	auto iter = this->flowByName.find(_name);
	if (iter == this->flowByName.end()) throw std::out_of_range("Unknown flow '" + _name + "'");
	return *iter->second;
}

Phase& Experiment::getPhase(const std::string& _name) {
	auto iter = this->phaseByName.find(_name);
	if (iter == this->phaseByName.end()) throw std::out_of_range("Unknown phase '" + _name + "'");
	return *iter->second;
}

bool Experiment::owns(const Entity& _entity) const {
	return _entity.getIndex() < this->entities.size() && this->entities[_entity.getIndex()].get() == &_entity;
}

bool Experiment::owns(const Flow& _flow) const {
	return _flow.getIndex() < this->flows.size() && this->flows[_flow.getIndex()].get() == &_flow;
}

bool Experiment::owns(const Phase& _phase) const {
	return _phase.getIndex() < this->phases.size() && this->phases[_phase.getIndex()].get() == &_phase;
}

std::vector<Counter> Experiment::getRecordedCounters(const Entity* _entity) const {
	OptionOwner          owner = _entity ? OptionOwner(_entity) : OptionOwner{};
	std::vector<Counter> counters;
	for (auto counter : getAllCounters()) {
		if (asBool(this->resolver.get(getRecordOption(counter), nullptr, owner))) counters.push_back(counter);
	}
	return counters;
}

size_t Experiment::getNumSamples(const Phase& _phase) const {
	return nettest::getNumSamples(asReal(this->resolver.get(Option::DURATION, &_phase)),
	                              asReal(this->resolver.get(Option::RECORD_INTERVAL, &_phase)));
}

size_t Experiment::getTotalNumSamples() const {
	size_t total = 0;
	for (const auto& phase : this->phases) total += this->getNumSamples(*phase);
	return total;
}

double Experiment::getSamplePeriod(const Phase& _phase) const {
	double interval = asReal(this->resolver.get(Option::RECORD_INTERVAL, &_phase));
	return interval > 0.0 ? interval : asReal(this->resolver.get(Option::DURATION, &_phase));
}

void Experiment::placeAndRoute(PlaceAndRoute& _placer) {
	std::map<const Entity*, ResourceDemand> demands;
	PlacementConstraints                    constraints;
	for (const auto& entity : this->entities) {
		demands[entity.get()] = ResourceDemand{};
		if (entity->getChipConstraint()) constraints.fixedChips[entity.get()] = *entity->getChipConstraint();
	}

	auto result = _placer.placeAndRoute(demands, this->getFlows(), constraints);
	this->setPlaceAndRouteResult(result);

	LABELED_INFO("Experiment") << "Placed " << this->entities.size() << " entities and routed "
	                           << this->flows.size() << " flows";
}

void Experiment::setPlaceAndRouteResult(const PlaceAndRouteResult& _result) {
	this->validatePlacement(_result);
	this->placed = _result;
}

const PlacementMap& Experiment::getPlacements() const {
	if (!this->placed) throw std::logic_error("The experiment has not been placed");
	return this->placed->placements;
}

const RoutingMap& Experiment::getRoutes() const {
	if (!this->placed) throw std::logic_error("The experiment has not been placed");
	return this->placed->routes;
}

std::map<const Entity*, ChipCoord> Experiment::getRouterAccessEntities() const {
	return selectRouterAccessEntities(this->getEntities(), this->getPlacements());
}

std::map<const Entity*, RecordList> Experiment::getRecordLists() const {
	auto router_access = this->getRouterAccessEntities();

	std::map<const Entity*, RecordList> lists;
	for (const auto& entity : this->entities) {
		auto                     iter = router_access.find(entity.get());
		std::optional<ChipCoord> router_chip;
		if (iter != router_access.end()) router_chip = iter->second;
		lists[entity.get()] = buildRecordList(*entity, this->getRecordedCounters(entity.get()), router_chip);
	}
	return lists;
}

void Experiment::checkName(const std::string& _kind, const std::string& _name, bool _taken) const {
	if (_taken) throw std::invalid_argument("The name '" + _name + "' is already used by another " + _kind);
}

void Experiment::validatePlacement(const PlaceAndRouteResult& _result) const {
	for (const auto& entity : this->entities) {
		auto iter = _result.placements.find(entity.get());
		if (iter == _result.placements.end()) {
			throw std::invalid_argument("No placement for entity '" + entity->getName() + "'");
		}
		const auto& chip = entity->getChipConstraint();
		if (chip && *chip != iter->second.chip) {
			throw std::invalid_argument("Entity '" + entity->getName() + "' must be placed on chip (" +
			                            std::to_string(chip->x) + ", " + std::to_string(chip->y) + ")");
		}
	}
}

}  // namespace nettest
