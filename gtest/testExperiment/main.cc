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
 * @file main.cc
 * @brief GoogleTest suite for experiment construction and hierarchical option resolution
 *
 * @details
 * Covers entity/flow/phase bookkeeping, phase nesting, the precedence of option
 * values (global, phase, entity, entity in phase, flow, flow in phase), scope
 * checks, sample counting and the per-entity record lists derived from a
 * placement.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "config/Option.hh"
#include "counter/Counter.hh"
#include "errors/Errors.hh"
#include "experiment/Experiment.hh"
#include "external/JsonPlaceAndRoute.hh"

using namespace nettest;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ExperimentTest : public ::testing::Test {
protected:
	void SetUp() override {
		this->a  = &this->experiment.newEntity("a");
		this->b  = &this->experiment.newEntity("b");
		this->ab = &this->experiment.newFlow(*this->a, *this->b, "ab");
	}

	Experiment experiment;
	Entity*    a  = nullptr;
	Entity*    b  = nullptr;
	Flow*      ab = nullptr;
};

TEST(CounterTest, Categories) {
	EXPECT_TRUE(isRouterCounter(Counter::LOCAL_MULTICAST));
	EXPECT_TRUE(isReinjectorCounter(Counter::REINJECT_MISSED));
	EXPECT_TRUE(isSourceCounter(Counter::RETRIED));
	EXPECT_TRUE(isSinkCounter(Counter::RECEIVED));
	EXPECT_TRUE(isPermanentCounter(Counter::DEADLINES_MISSED));
	EXPECT_TRUE(isChipCounter(Counter::REINJECTED));
	EXPECT_FALSE(isChipCounter(Counter::SENT));
}

TEST(CounterTest, NamesAndBits) {
	EXPECT_EQ(getCounterName(Counter::DROPPED_P2P), "dropped_p2p");
	EXPECT_EQ(counterFromName("received"), Counter::RECEIVED);
	EXPECT_THROW(counterFromName("bogus"), std::invalid_argument);

	EXPECT_EQ(getRecordBit(Counter::DEADLINES_MISSED), 1u << 29);
	EXPECT_EQ(getRecordMask({Counter::LOCAL_MULTICAST, Counter::SENT}), (1u << 0) | (1u << 24));

	const auto& counters = getAllCounters();
	EXPECT_EQ(counters.size(), 24u);
	EXPECT_TRUE(std::is_sorted(counters.begin(), counters.end()));
}

TEST(OptionTest, ParseAndValidate) {
	EXPECT_EQ(asReal(parseOptionValue(Option::TIMESTEP, "1e-5")), 1e-5);
	EXPECT_TRUE(isAuto(parseOptionValue(Option::SEED, "auto")));
	EXPECT_EQ(asInteger(parseOptionValue(Option::SEED, "0x10")), 16);
	EXPECT_TRUE(asBool(parseOptionValue(Option::USE_PAYLOAD, "yes")));
	EXPECT_EQ(std::get<RouterTimeout>(parseOptionValue(Option::ROUTER_TIMEOUT, "480,16")), (RouterTimeout{480, 16}));
	EXPECT_THROW(parseOptionValue(Option::NUM_RETRIES, "1.5"), std::invalid_argument);

	// Integers are accepted where a real is expected
	EXPECT_EQ(std::get<double>(validateOptionValue(Option::PROBABILITY, int64_t{1})), 1.0);
	EXPECT_THROW(validateOptionValue(Option::USE_PAYLOAD, 0.5), std::invalid_argument);

	EXPECT_EQ(optionFromName("record_sent"), Option::RECORD_SENT);
	EXPECT_EQ(getOptionInfo(Option::RECORD_SENT).recordedCounter, Counter::SENT);
	EXPECT_EQ(toString(OptionValue{}), "auto");
}

TEST_F(ExperimentTest, EntitiesAndFlows) {
	EXPECT_EQ(this->experiment.getNumEntities(), 2u);
	EXPECT_EQ(&this->experiment.getEntity("b"), this->b);
	EXPECT_THROW(this->experiment.getEntity("c"), std::out_of_range);

	EXPECT_EQ(&this->ab->getSource(), this->a);
	EXPECT_THAT(this->ab->getSinks(), ElementsAre(this->b));
	EXPECT_THAT(this->a->getSourceFlows(), ElementsAre(this->ab));
	EXPECT_THAT(this->b->getSinkFlows(), ElementsAre(this->ab));
	EXPECT_EQ(this->experiment.getFlowKey(*this->ab), 0u);

	// Automatic names follow the index
	auto& c = this->experiment.newEntity();
	EXPECT_EQ(c.getName(), "entity2");
	auto& fan_out = this->experiment.newFlow(c, {this->a, this->b, this->a});
	EXPECT_EQ(fan_out.getName(), "flow1");
	EXPECT_EQ(fan_out.getFanOut(), 2u);
	EXPECT_EQ(this->experiment.getFlowKey(fan_out), 0x100u);
}

TEST_F(ExperimentTest, InvalidConstruction) {
	try {
		this->experiment.newEntity("a");
		FAIL() << "duplicate entity names must be rejected";
	} catch (const std::invalid_argument& e) { EXPECT_THAT(e.what(), HasSubstr("already used")); }

	EXPECT_THROW(this->experiment.newFlow(*this->a, std::vector<const Entity*>{}), std::invalid_argument);

	Experiment other;
	auto&      stranger = other.newEntity("x");
	EXPECT_THROW(this->experiment.newFlow(stranger, *this->a), std::invalid_argument);
	EXPECT_THROW(this->experiment.newFlow(*this->a, stranger), std::invalid_argument);
}

TEST_F(ExperimentTest, PhaseNesting) {
	EXPECT_THROW(this->experiment.endPhase(), NestingError);

	{
		auto scope = this->experiment.definePhase("first");
		EXPECT_EQ(this->experiment.getCurrentPhase(), &scope.getPhase());
		EXPECT_THROW(this->experiment.definePhase("second"), NestingError);
	}
	EXPECT_EQ(this->experiment.getCurrentPhase(), nullptr);

	// The phase created by the failed definition is kept but never opened
	EXPECT_EQ(this->experiment.getNumPhases(), 2u);
	EXPECT_EQ(this->experiment.getPhases()[0]->getName(), "first");

	Experiment other;
	auto&      foreign = other.newPhase();
	EXPECT_THROW(this->experiment.beginPhase(foreign), std::invalid_argument);
}

TEST_F(ExperimentTest, PhaseLabels) {
	auto& phase = this->experiment.newPhase("sweep");
	phase.addLabel("load", 0.5);
	phase.addLabel("name", std::string("low"));
	phase.addLabel("load", 0.75);

	ASSERT_EQ(phase.getLabels().size(), 2u);
	EXPECT_EQ(phase.getLabels()[0].first, "load");
	EXPECT_EQ(std::get<double>(phase.getLabel("load")), 0.75);
	EXPECT_TRUE(std::holds_alternative<std::monostate>(phase.getLabel("missing")));
}

TEST_F(ExperimentTest, OptionPrecedence) {
	auto& p1       = this->experiment.newPhase("p1");
	auto& p2       = this->experiment.newPhase("p2");
	auto& resolver = this->experiment.getResolver();

	this->experiment.option(Option::PROBABILITY) = 0.1;
	this->a->option(Option::PROBABILITY)         = 0.2;
	{
		PhaseScope scope(this->experiment, p2);
		this->experiment.option(Option::PROBABILITY) = 0.3;
		this->ab->option(Option::PROBABILITY)        = 0.4;
	}

	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY)), 0.1);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->b)), 0.1);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->a)), 0.2);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->ab)), 0.2);

	// A phase-wide value does not beat an entity exception set outside any phase
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2)), 0.3);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2, this->a)), 0.2);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2, this->ab)), 0.4);

	EXPECT_EQ(this->a->option(Option::PROBABILITY).asReal(), 0.2);
	this->a->option(Option::PROBABILITY).unset();
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->ab)), 0.1);
	EXPECT_THROW(this->experiment.option(Option::PROBABILITY).unset(), std::invalid_argument);
}

TEST_F(ExperimentTest, OptionScopes) {
	auto& phase = this->experiment.newPhase();

	EXPECT_THROW(this->a->option(Option::RECORD_LOCAL_MULTICAST) = true, ScopeError);
	EXPECT_THROW(this->ab->option(Option::RECORD_SENT) = true, ScopeError);
	EXPECT_THROW(this->a->option(Option::DURATION) = 2.0, ScopeError);
	EXPECT_THROW(this->ab->option(Option::WARMUP) = 0.0, ScopeError);

	// Entity-wide record options apply to every phase and to the entity's flows
	EXPECT_NO_THROW(this->a->option(Option::RECORD_SENT) = true);
	auto& resolver = this->experiment.getResolver();
	EXPECT_TRUE(asBool(resolver.get(Option::RECORD_SENT, &phase, this->a)));
	EXPECT_TRUE(asBool(resolver.get(Option::RECORD_SENT, &phase, this->ab)));
	EXPECT_FALSE(asBool(resolver.get(Option::RECORD_SENT, &phase, this->b)));
	EXPECT_FALSE(asBool(resolver.get(Option::RECORD_SENT)));

	PhaseScope scope(this->experiment, phase);
	EXPECT_THROW(this->experiment.option(Option::RECORD_RECEIVED) = true, ScopeError);
	EXPECT_THROW(this->b->option(Option::RECORD_RECEIVED) = true, ScopeError);
	EXPECT_NO_THROW(this->experiment.option(Option::DURATION) = 2.0);
	EXPECT_EQ(this->experiment.option(Option::DURATION).asReal(), 2.0);
}

TEST_F(ExperimentTest, PhaseEntityExceptionStaysInItsScope) {
	auto& p1       = this->experiment.newPhase("p1");
	auto& p2       = this->experiment.newPhase("p2");
	auto& resolver = this->experiment.getResolver();

	resolver.set(Option::PROBABILITY, 0.1);
	resolver.set(Option::PROBABILITY, 0.2, &p1);
	resolver.set(Option::PROBABILITY, 0.3, nullptr, this->b);
	resolver.set(Option::PROBABILITY, 0.4, &p2, this->a);

	// The (p2, a) exception is invisible from the global, phase and entity views
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY)), 0.1);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2)), 0.1);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, nullptr, this->a)), 0.1);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->a)), 0.2);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2, this->a)), 0.4);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2, this->ab)), 0.4);

	// An entity exception beats a phase-wide value
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, nullptr, this->b)), 0.3);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->b)), 0.3);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2, this->b)), 0.3);

	resolver.set(Option::PROBABILITY, 0.5, &p1, this->a);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1, this->a)), 0.5);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p2, this->a)), 0.4);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &p1)), 0.2);
}

TEST_F(ExperimentTest, OptionTypes) {
	EXPECT_THROW(this->experiment.option(Option::USE_PAYLOAD) = 1.0, std::invalid_argument);

	this->experiment.option(Option::ROUTER_TIMEOUT) = int64_t{16};
	EXPECT_EQ(std::get<RouterTimeout>(this->experiment.option(Option::ROUTER_TIMEOUT).get()), (RouterTimeout{16, 0}));

	EXPECT_TRUE(this->experiment.option(Option::SEED).isAuto());
	this->experiment.option(Option::SEED) = int64_t{42};
	EXPECT_EQ(this->experiment.option(Option::SEED).asInteger(), 42);
}

TEST(SampleTest, NumSamples) {
	EXPECT_EQ(getNumSamples(0.0, 0.0), 1u);
	EXPECT_EQ(getNumSamples(1.0, 2.0), 0u);
	EXPECT_EQ(getNumSamples(1.0, 0.1), 10u);
	EXPECT_EQ(getNumSamples(0.3, 0.1), 3u);
}

TEST_F(ExperimentTest, SamplesPerPhase) {
	auto& p1 = this->experiment.newPhase();
	auto& p2 = this->experiment.newPhase();

	this->experiment.getResolver().set(Option::RECORD_INTERVAL, 0.25, &p2);

	EXPECT_EQ(this->experiment.getNumSamples(p1), 1u);
	EXPECT_EQ(this->experiment.getNumSamples(p2), 4u);
	EXPECT_EQ(this->experiment.getTotalNumSamples(), 5u);
	EXPECT_EQ(this->experiment.getSamplePeriod(p1), 1.0);
	EXPECT_EQ(this->experiment.getSamplePeriod(p2), 0.25);
}

TEST_F(ExperimentTest, RecordLists) {
	this->experiment.option(Option::RECORD_LOCAL_MULTICAST)  = true;
	this->experiment.option(Option::RECORD_SENT)             = true;
	this->experiment.option(Option::RECORD_RECEIVED)         = true;
	this->experiment.option(Option::RECORD_DEADLINES_MISSED) = true;

	EXPECT_THROW(this->experiment.getRecordLists(), std::logic_error);

	auto placer = JsonPlaceAndRoute();
	this->experiment.placeAndRoute(placer);
	ASSERT_TRUE(this->experiment.isPlaced());

	// Both entities share chip (0, 0) so only the first reads the router
	auto access = this->experiment.getRouterAccessEntities();
	ASSERT_EQ(access.size(), 1u);
	EXPECT_EQ(access.begin()->first, this->a);

	auto        lists  = this->experiment.getRecordLists();
	const auto& list_a = lists.at(this->a);
	ASSERT_EQ(list_a.size(), 3u);
	EXPECT_EQ(std::get<ChipCoord>(list_a[0].object), (ChipCoord{0, 0}));
	EXPECT_EQ(list_a[0].counter, Counter::LOCAL_MULTICAST);
	EXPECT_EQ(std::get<const Flow*>(list_a[1].object), this->ab);
	EXPECT_EQ(list_a[1].counter, Counter::SENT);
	EXPECT_EQ(std::get<const Entity*>(list_a[2].object), this->a);
	EXPECT_EQ(list_a[2].counter, Counter::DEADLINES_MISSED);

	const auto& list_b = lists.at(this->b);
	ASSERT_EQ(list_b.size(), 2u);
	EXPECT_EQ(std::get<const Flow*>(list_b[0].object), this->ab);
	EXPECT_EQ(list_b[0].counter, Counter::RECEIVED);
	EXPECT_EQ(getMeasuredObjectName(list_b[1].object), "b");

	// Adding an entity drops the placement
	this->experiment.newEntity("c");
	EXPECT_FALSE(this->experiment.isPlaced());
}

TEST_F(ExperimentTest, PerEntityRecordLists) {
	this->experiment.option(Option::RECORD_SENT) = true;
	this->a->option(Option::RECORD_SENT)         = false;
	this->a->option(Option::RECORD_BLOCKED)      = true;
	this->b->option(Option::RECORD_RECEIVED)     = true;

	auto placer = JsonPlaceAndRoute();
	this->experiment.placeAndRoute(placer);

	EXPECT_THAT(this->experiment.getRecordedCounters(), ElementsAre(Counter::SENT));
	EXPECT_THAT(this->experiment.getRecordedCounters(this->a), ElementsAre(Counter::BLOCKED));
	EXPECT_THAT(this->experiment.getRecordedCounters(this->b), ElementsAre(Counter::SENT, Counter::RECEIVED));

	auto lists = this->experiment.getRecordLists();
	ASSERT_EQ(lists.at(this->a).size(), 1u);
	EXPECT_EQ(lists.at(this->a)[0].counter, Counter::BLOCKED);
	EXPECT_EQ(std::get<const Flow*>(lists.at(this->a)[0].object), this->ab);

	// b sources no flow, so only its sink column remains
	ASSERT_EQ(lists.at(this->b).size(), 1u);
	EXPECT_EQ(lists.at(this->b)[0].counter, Counter::RECEIVED);
}

TEST_F(ExperimentTest, JsonPlacement) {
	auto& c = this->experiment.newEntity("c", ChipCoord{1, 1});

	auto description = nlohmann::json::parse(R"({
		"placements": { "b": { "chip": [1, 0], "cores": [3] } },
		"routes": { "ab": { "b": 2 } }
	})");
	auto placer      = JsonPlaceAndRoute(description);
	this->experiment.placeAndRoute(placer);

	const auto& placements = this->experiment.getPlacements();
	EXPECT_EQ(placements.at(this->a).chip, (ChipCoord{0, 0}));
	EXPECT_THAT(placements.at(this->a).cores, ElementsAre(1u));
	EXPECT_EQ(placements.at(this->b).chip, (ChipCoord{1, 0}));
	EXPECT_THAT(placements.at(this->b).cores, ElementsAre(3u));
	EXPECT_EQ(placements.at(&c).chip, (ChipCoord{1, 1}));

	EXPECT_EQ(this->experiment.getRoutes().at(this->ab).getNumHops(*this->b), 2u);
	EXPECT_EQ(this->experiment.getRouterAccessEntities().size(), 3u);
}

TEST_F(ExperimentTest, JsonPlacementErrors) {
	auto unknown = JsonPlaceAndRoute(nlohmann::json::parse(R"({"placements": {"z": {"chip": [0, 0], "cores": [1]}}})"));
	EXPECT_THROW(this->experiment.placeAndRoute(unknown), std::invalid_argument);

	auto reserved = JsonPlaceAndRoute(nlohmann::json::parse(R"({"placements": {"a": {"chip": [0, 0], "cores": [0]}}})"));
	EXPECT_THROW(this->experiment.placeAndRoute(reserved), std::invalid_argument);

	auto not_sink = JsonPlaceAndRoute(nlohmann::json::parse(R"({"routes": {"ab": {"a": 1}}})"));
	EXPECT_THROW(this->experiment.placeAndRoute(not_sink), std::invalid_argument);

	auto no_core = JsonPlaceAndRoute(nlohmann::json::parse(R"({"placements": {"a": {"chip": [0, 0], "cores": [18]}}})"));
	EXPECT_THROW(this->experiment.placeAndRoute(no_core), std::invalid_argument);

	EXPECT_FALSE(this->experiment.isPlaced());
}

TEST_F(ExperimentTest, JsonPlacementFillsOneChip) {
	auto& c = this->experiment.newEntity("c");

	// Core 0 is reserved, so a three core chip holds two entities
	auto small = JsonPlaceAndRoute(nlohmann::json::parse(R"({"cores_per_chip": 3})"));
	try {
		this->experiment.placeAndRoute(small);
		FAIL() << "a third entity does not fit on a three core chip";
	} catch (const std::invalid_argument& e) {
		EXPECT_THAT(e.what(), HasSubstr("'c'"));
	}

	auto enough = JsonPlaceAndRoute(nlohmann::json::parse(R"({"cores_per_chip": 4})"));
	this->experiment.placeAndRoute(enough);
	EXPECT_EQ(this->experiment.getPlacements().at(&c).chip, (ChipCoord{0, 0}));
	EXPECT_THAT(this->experiment.getPlacements().at(&c).cores, ElementsAre(3u));
}

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
