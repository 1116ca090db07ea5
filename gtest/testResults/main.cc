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
 * @brief GoogleTest suite for result decoding, result tables and the experiment runner
 *
 * @details
 * Result buffers are little-endian words: the error word, then one row of
 * recorded values per sample in record-list order. The runner is driven
 * through a gmock Transport standing in for the machine.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <vector>

#include "errors/Errors.hh"
#include "experiment/Experiment.hh"
#include "experiment/ExperimentRunner.hh"
#include "external/JsonPlaceAndRoute.hh"
#include "external/Transport.hh"
#include "results/Results.hh"

using namespace nettest;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;

namespace {

std::vector<uint8_t> toBytes(const std::vector<uint32_t>& _words) {
	std::vector<uint8_t> bytes;
	for (auto word : _words) {
		for (int shift = 0; shift < 32; shift += 8) bytes.push_back(static_cast<uint8_t>(word >> shift));
	}
	return bytes;
}

class MockTransport : public Transport {
public:
	MOCK_METHOD(BufferHandle, allocateBuffer, (size_t, const Placement&), (override));
	MOCK_METHOD(void, write, (BufferHandle, const std::vector<uint8_t>&), (override));
	MOCK_METHOD(void, launch, ((const std::map<const Entity*, BufferHandle>&), const PlacementMap&), (override));
	MOCK_METHOD(void, waitForState, (const std::vector<const Entity*>&, ExecutionState), (override));
	MOCK_METHOD(void, sendSignal, (Signal), (override));
	MOCK_METHOD(std::vector<uint8_t>, read, (BufferHandle, size_t), (override));
};

}  // namespace

class ResultsTest : public ::testing::Test {
protected:
	void SetUp() override {
		this->a  = &this->experiment.newEntity("a");
		this->b  = &this->experiment.newEntity("b");
		this->c  = &this->experiment.newEntity("c");
		this->ab = &this->experiment.newFlow(*this->a, std::vector<const Entity*>{this->b, this->c}, "ab");

		this->experiment.option(Option::RECORD_SENT)     = true;
		this->experiment.option(Option::RECORD_RECEIVED) = true;
	}

	void place() {
		auto placer = JsonPlaceAndRoute(nlohmann::json::parse(R"({"routes": {"ab": {"b": 1, "c": 3}}})"));
		this->experiment.placeAndRoute(placer);
	}

	std::shared_ptr<const Results> decode(const std::map<const Entity*, std::vector<uint8_t>>& _buffers) {
		return decodeResults(this->experiment, this->experiment.getRecordLists(), _buffers,
		                     this->experiment.getRoutes());
	}

	Experiment experiment;
	Entity*    a  = nullptr;
	Entity*    b  = nullptr;
	Entity*    c  = nullptr;
	Flow*      ab = nullptr;
};

TEST(ResultSizeTest, WordsPerSample) {
	RecordList list(3, RecordEntry{ChipCoord{}, Counter::LOCAL_MULTICAST});
	EXPECT_EQ(getResultSize(0, list), 4u);
	EXPECT_EQ(getResultSize(5, list), 4u * (1 + 5 * 3));
	EXPECT_EQ(getResultSize(5, {}), 4u);
}

TEST(EmptyResultsTest, NothingRecorded) {
	Experiment experiment;
	auto&      entity = experiment.newEntity("lonely");
	experiment.newPhase();
	auto placer = JsonPlaceAndRoute();
	experiment.placeAndRoute(placer);

	auto lists = experiment.getRecordLists();
	ASSERT_TRUE(lists.at(&entity).empty());

	auto results = decodeResults(experiment, lists, {{&entity, std::vector<uint8_t>(4, 0)}});
	EXPECT_EQ(results->getNumSamples(), 1u);
	EXPECT_TRUE(results->getFaults().empty());
	EXPECT_TRUE(results->getRecordedCounters().empty());

	for (const auto& name : Results::getTableNames()) EXPECT_EQ(results->getTable(name).getNumRows(), 0u) << name;
	EXPECT_THAT(results->getTotals().getColumns(), ElementsAre("phase", "time"));
}

TEST(EmptyResultsTest, NoPhases) {
	Experiment experiment;
	auto&      entity = experiment.newEntity();
	auto       placer = JsonPlaceAndRoute();
	experiment.placeAndRoute(placer);

	auto results = decodeResults(experiment, experiment.getRecordLists(), {{&entity, std::vector<uint8_t>(4, 0)}});
	EXPECT_EQ(results->getNumSamples(), 0u);
	EXPECT_TRUE(results->getFaults().empty());
	for (const auto& name : Results::getTableNames()) EXPECT_EQ(results->getTable(name).getNumRows(), 0u) << name;
}

TEST_F(ResultsTest, Tables) {
	auto& phase = this->experiment.newPhase("load");
	phase.addLabel("rate", 0.5);
	this->experiment.getResolver().set(Option::RECORD_INTERVAL, 0.5, &phase);
	this->place();

	auto results = this->decode({
	    {this->a, toBytes({0, 10, 20})},
	    {this->b, toBytes({0, 9, 18})},
	    {this->c, toBytes({0, 8, 17})},
	});
	ASSERT_EQ(results->getNumSamples(), 2u);

	auto totals = results->getTotals();
	EXPECT_THAT(totals.getColumns(), ElementsAre("rate", "phase", "time", "sent", "received", "ideal_received"));
	ASSERT_EQ(totals.getNumRows(), 2u);
	EXPECT_EQ(std::get<double>(totals.at(0, "rate")), 0.5);
	EXPECT_EQ(std::get<const Phase*>(totals.at(0, "phase")), &phase);
	EXPECT_EQ(std::get<double>(totals.at(1, "time")), 1.0);
	EXPECT_EQ(std::get<int64_t>(totals.at(0, "sent")), 10);
	EXPECT_EQ(std::get<int64_t>(totals.at(0, "received")), 17);
	EXPECT_EQ(std::get<int64_t>(totals.at(1, "ideal_received")), 40);

	auto entity_totals = results->getEntityTotals();
	ASSERT_EQ(entity_totals.getNumRows(), 6u);
	EXPECT_EQ(std::get<const Entity*>(entity_totals.at(0, "entity")), this->a);
	EXPECT_EQ(std::get<int64_t>(entity_totals.at(0, "received")), 0);
	EXPECT_EQ(std::get<int64_t>(entity_totals.at(1, "sent")), 0);
	EXPECT_EQ(std::get<int64_t>(entity_totals.at(4, "received")), 18);

	auto flow_totals = results->getFlowTotals();
	ASSERT_EQ(flow_totals.getNumRows(), 2u);
	EXPECT_EQ(std::get<int64_t>(flow_totals.at(1, "received")), 35);
	EXPECT_EQ(std::get<int64_t>(flow_totals.at(1, "fan_out")), 2);

	auto flow_counters = results->getFlowCounters();
	ASSERT_EQ(flow_counters.getNumRows(), 4u);
	EXPECT_EQ(std::get<const Entity*>(flow_counters.at(1, "sink")), this->c);
	EXPECT_EQ(std::get<int64_t>(flow_counters.at(1, "sent")), 10);
	EXPECT_EQ(std::get<int64_t>(flow_counters.at(1, "received")), 8);
	EXPECT_EQ(std::get<int64_t>(flow_counters.at(1, "num_hops")), 3);

	EXPECT_EQ(results->getRouterCounters().getNumRows(), 0u);
	EXPECT_THROW(results->getTable("bogus"), std::out_of_range);
}

TEST_F(ResultsTest, EntitiesRecordDifferentCounters) {
	this->experiment.option(Option::RECORD_RECEIVED) = false;
	this->c->option(Option::RECORD_RECEIVED)         = true;
	this->experiment.newPhase();
	this->place();

	auto lists = this->experiment.getRecordLists();
	EXPECT_EQ(lists.at(this->a).size(), 1u);
	EXPECT_TRUE(lists.at(this->b).empty());
	EXPECT_EQ(lists.at(this->c).size(), 1u);

	auto results = this->decode({
	    {this->a, toBytes({0, 10})},
	    {this->b, toBytes({0})},
	    {this->c, toBytes({0, 8})},
	});
	EXPECT_THAT(results->getRecordedCounters(), ElementsAre(Counter::SENT, Counter::RECEIVED));

	auto totals = results->getTotals();
	ASSERT_EQ(totals.getNumRows(), 1u);
	EXPECT_EQ(std::get<int64_t>(totals.at(0, "sent")), 10);
	EXPECT_EQ(std::get<int64_t>(totals.at(0, "received")), 8);

	auto flow_counters = results->getFlowCounters();
	ASSERT_EQ(flow_counters.getNumRows(), 2u);
	EXPECT_EQ(std::get<const Entity*>(flow_counters.at(1, "sink")), this->c);
	EXPECT_EQ(std::get<int64_t>(flow_counters.at(1, "received")), 8);
}

TEST_F(ResultsTest, RouterCounters) {
	this->experiment.option(Option::RECORD_DROPPED_MULTICAST) = true;
	this->experiment.newPhase();
	this->place();

	// Only entity "a" reads the router of chip (0, 0); its record list starts with the chip
	auto results = this->decode({{this->a, toBytes({0, 7, 10})}});
	auto routers = results->getRouterCounters();
	EXPECT_THAT(routers.getColumns(), ElementsAre("phase", "time", "x", "y", "dropped_multicast"));
	ASSERT_EQ(routers.getNumRows(), 1u);
	EXPECT_EQ(std::get<int64_t>(routers.at(0, "dropped_multicast")), 7);
}

TEST_F(ResultsTest, MissingSamplesAreEmpty) {
	this->experiment.newPhase();
	this->place();

	// "c" returned no samples at all, "b" is missing entirely
	auto results = this->decode({{this->a, toBytes({0, 10})}, {this->c, toBytes({0})}});
	auto totals  = results->getTotals();
	EXPECT_EQ(std::get<int64_t>(totals.at(0, "sent")), 10);
	EXPECT_TRUE(std::holds_alternative<std::monostate>(totals.at(0, "received")));

	std::stringstream ss;
	totals.writeCsv(ss, "NA");
	EXPECT_THAT(ss.str(), HasSubstr(",10,NA,20\n"));
}

TEST_F(ResultsTest, FaultsAreUnited) {
	this->experiment.newPhase();
	this->place();

	try {
		this->decode({{this->a, toBytes({0x3, 1})}, {this->b, toBytes({0x1, 1})}, {this->c, toBytes({0, 1})}});
		FAIL() << "faults must be reported";
	} catch (const RunFailure& e) {
		EXPECT_THAT(e.getFaults(), ElementsAre(RuntimeFault::STILL_RUNNING, RuntimeFault::MALLOC));
		ASSERT_NE(e.getResults(), nullptr);
		EXPECT_EQ(std::get<int64_t>(e.getResults()->getTotals().at(0, "sent")), 1);
		EXPECT_THAT(e.what(), HasSubstr("NT_ERR_MALLOC"));
	}
}

TEST_F(ResultsTest, UnknownFaultBitsAreIgnored) {
	this->experiment.newPhase();
	this->place();

	auto results = this->decode({{this->a, toBytes({0x100, 1})}});
	EXPECT_TRUE(results->getFaults().empty());
}

TEST_F(ResultsTest, BufferWithoutErrorWord) {
	this->experiment.newPhase();
	this->place();
	EXPECT_THROW(this->decode({{this->a, {0, 0}}}), std::invalid_argument);
}

TEST(ResultTableTest, Csv) {
	ResultTable table({"name", "flag", "value", "ratio"});
	table.addRow({std::string("a,b"), true, int64_t{3}, 0.25});
	table.addRow({std::string("say \"hi\""), false, Cell(), 1.0 / 3.0});
	EXPECT_THROW(table.addRow({int64_t{1}}), std::invalid_argument);
	EXPECT_THROW(table.getColumnIndex("missing"), std::out_of_range);

	std::stringstream ss;
	table.writeCsv(ss, "-");
	EXPECT_EQ(ss.str(),
	          "name,flag,value,ratio\n"
	          "\"a,b\",True,3,0.25\n"
	          "\"say \"\"hi\"\"\",False,-,0.333333333333\n");
}

TEST(FaultTest, Bits) {
	EXPECT_EQ(faultsFromBits(0x21).size(), 2u);
	EXPECT_EQ(faultsToBits({RuntimeFault::DMA, RuntimeFault::BAD_ARGUMENTS}), 0x14u);
	EXPECT_EQ(getFaultName(RuntimeFault::MOST_DEADLINES_MISSED), "NT_ERR_MOST_DEADLINES_MISSED");
	EXPECT_THROW(faultsFromBits(0x80), std::invalid_argument);
}

TEST_F(ResultsTest, RunnerDrivesTransport) {
	this->experiment.newPhase();
	this->experiment.newPhase();
	this->place();

	MockTransport    transport;
	ExperimentRunner runner(this->experiment, transport);

	EXPECT_THROW(runner.execute(), std::logic_error);

	EXPECT_CALL(transport, allocateBuffer(_, _)).WillOnce(Return(1)).WillOnce(Return(2)).WillOnce(Return(3));
	EXPECT_CALL(transport, write(_, _)).Times(3);
	EXPECT_CALL(transport, read(_, _)).WillRepeatedly(Invoke([](BufferHandle _handle, size_t _size) {
		// a sends 5 then 6, b and c each receive 4 then 5
		auto bytes = _handle == 1 ? toBytes({0, 5, 6}) : toBytes({0, 4, 5});
		EXPECT_EQ(bytes.size(), _size);
		return bytes;
	}));
	{
		InSequence sequence;
		EXPECT_CALL(transport, launch(_, _));
		EXPECT_CALL(transport, waitForState(_, ExecutionState::SYNC0));
		EXPECT_CALL(transport, sendSignal(Signal::SYNC0));
		EXPECT_CALL(transport, waitForState(_, ExecutionState::SYNC1));
		EXPECT_CALL(transport, sendSignal(Signal::SYNC1));
		EXPECT_CALL(transport, waitForState(_, ExecutionState::EXIT));
	}

	auto results = runner.run();
	auto totals  = results->getTotals();
	ASSERT_EQ(totals.getNumRows(), 2u);
	EXPECT_EQ(std::get<int64_t>(totals.at(1, "sent")), 6);
	EXPECT_EQ(std::get<int64_t>(totals.at(1, "received")), 10);
	EXPECT_EQ(std::get<int64_t>(totals.at(1, "ideal_received")), 12);
}

TEST_F(ResultsTest, RunnerCompilesBeforeTouchingTheMachine) {
	this->experiment.newPhase();
	this->experiment.option(Option::TIMESTEP) = 1.5e-9;
	this->place();

	MockTransport    transport;
	ExperimentRunner runner(this->experiment, transport);

	EXPECT_CALL(transport, allocateBuffer(_, _)).Times(0);
	EXPECT_CALL(transport, launch(_, _)).Times(0);
	EXPECT_THROW(runner.load(), CompileError);
}

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
