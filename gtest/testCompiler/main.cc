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
 * @brief GoogleTest suite for compiling experiments into interpreter programs
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <vector>

#include "compiler/Commands.hh"
#include "compiler/Compiler.hh"
#include "errors/Errors.hh"
#include "experiment/Experiment.hh"

using namespace nettest;
using ::testing::ElementsAre;

namespace {

struct Instruction {
	Opcode   opcode;
	uint32_t index;
	uint32_t operand;
};

std::vector<Instruction> decode(const Commands& _commands) {
	std::vector<Instruction> instructions;
	const auto&              words = _commands.getWords();
	for (size_t i = 0; i < words.size(); ++i) {
		auto opcode = static_cast<Opcode>(words[i] & 0xFF);
		auto index  = (words[i] >> 8) & 0xFF;
		instructions.push_back({opcode, index, hasOperand(opcode) ? words[++i] : 0u});
	}
	return instructions;
}

std::vector<Opcode> opcodes(const Commands& _commands) {
	std::vector<Opcode> result;
	for (const auto& instruction : decode(_commands)) result.push_back(instruction.opcode);
	return result;
}

std::vector<uint32_t> operandsOf(const Commands& _commands, Opcode _opcode) {
	std::vector<uint32_t> result;
	for (const auto& instruction : decode(_commands)) {
		if (instruction.opcode == _opcode) result.push_back(instruction.operand);
	}
	return result;
}

}  // namespace

class CompilerTest : public ::testing::Test {
protected:
	void SetUp() override {
		this->a  = &this->experiment.newEntity("a");
		this->b  = &this->experiment.newEntity("b");
		this->ab = &this->experiment.newFlow(*this->a, *this->b, "ab");
		this->ba = &this->experiment.newFlow(*this->b, *this->a, "ba");

		this->experiment.option(Option::TIMESTEP) = 1e-6;
		this->experiment.option(Option::WARMUP)   = 1e-3;
		this->experiment.option(Option::DURATION) = 2e-3;
		this->experiment.option(Option::COOLDOWN) = 0.0;
	}

	Commands compile(const Entity& _entity, bool _routerAccess = false) {
		auto list = buildRecordList(_entity, this->experiment.getRecordedCounters(&_entity),
		                            _routerAccess ? std::optional<ChipCoord>(ChipCoord{0, 0}) : std::nullopt);
		return Compiler(this->experiment).compile(_entity, list, _routerAccess);
	}

	Experiment experiment;
	Entity*    a  = nullptr;
	Entity*    b  = nullptr;
	Flow*      ab = nullptr;
	Flow*      ba = nullptr;
};

TEST_F(CompilerTest, SinglePhaseSequence) {
	this->experiment.newPhase();
	this->experiment.option(Option::SEED)        = int64_t{42};
	this->experiment.option(Option::PROBABILITY) = 0.5;

	auto commands = this->compile(*this->a);
	EXPECT_THAT(opcodes(commands),
	            ElementsAre(Opcode::NUM, Opcode::SINK_KEY, Opcode::SEED, Opcode::TIMESTEP, Opcode::PROBABILITY,
	                        Opcode::BARRIER, Opcode::RUN_NO_RECORD, Opcode::RUN, Opcode::RUN_NO_RECORD,
	                        Opcode::SLEEP, Opcode::EXIT));

	auto instructions = decode(commands);
	EXPECT_EQ(instructions[0].operand, 0x00010001u);  // one source, one sink
	EXPECT_EQ(instructions[1].operand, 0x100u);       // key of flow "ba"
	EXPECT_EQ(instructions[2].operand, 42u);
	EXPECT_EQ(instructions[3].operand, 1000u);  // ns
	EXPECT_EQ(instructions[4].operand, 0x80000000u);
	EXPECT_EQ(instructions[6].operand, 1000u);  // warmup in timesteps
	EXPECT_EQ(instructions[7].operand, 2000u);
	EXPECT_EQ(instructions[8].operand, 0u);
	EXPECT_EQ(instructions[9].operand, 1000u);  // flush in microseconds
}

TEST_F(CompilerTest, PhasesOnlyEmitChanges) {
	auto& first  = this->experiment.newPhase();
	auto& second = this->experiment.newPhase();
	auto& third  = this->experiment.newPhase();

	this->experiment.option(Option::SEED) = int64_t{42};
	this->experiment.getResolver().set(Option::PROBABILITY, 0.5, &first);
	this->experiment.getResolver().set(Option::PROBABILITY, 0.5, &second);
	this->experiment.getResolver().set(Option::PROBABILITY, 0.0, &third);

	auto commands = this->compile(*this->a);
	EXPECT_THAT(operandsOf(commands, Opcode::PROBABILITY), ElementsAre(0x80000000u, 0x00000000u));
	EXPECT_THAT(operandsOf(commands, Opcode::SEED), ElementsAre(42u));
	EXPECT_THAT(operandsOf(commands, Opcode::TIMESTEP), ElementsAre(1000u));
	EXPECT_EQ(operandsOf(commands, Opcode::BARRIER).size(), 3u);
	EXPECT_EQ(operandsOf(commands, Opcode::RUN).size(), 3u);
	EXPECT_EQ(operandsOf(commands, Opcode::RUN_NO_RECORD).size(), 6u);
	EXPECT_EQ(opcodes(commands).back(), Opcode::EXIT);
}

TEST_F(CompilerTest, UnsetPhaseInheritsGlobalValue) {
	auto& first = this->experiment.newPhase();
	this->experiment.newPhase();

	this->experiment.option(Option::PROBABILITY) = 0.0;
	this->experiment.getResolver().set(Option::PROBABILITY, 0.5, &first, this->ab);

	auto commands = this->compile(*this->a);
	EXPECT_THAT(operandsOf(commands, Opcode::PROBABILITY), ElementsAre(0x80000000u, 0x00000000u));
}

TEST_F(CompilerTest, TimestepChangeConvertsOnlyNewValues) {
	auto& first  = this->experiment.newPhase();
	auto& second = this->experiment.newPhase();

	this->ab->option(Option::BURST_DUTY)  = 0.5;
	this->ab->option(Option::BURST_PHASE) = 0.0;
	this->experiment.getResolver().set(Option::TIMESTEP, 2e-6, &second);
	this->experiment.getResolver().set(Option::BURST_PERIOD, 3e-6, &first, this->ab);
	this->experiment.getResolver().set(Option::BURST_PERIOD, 4e-6, &second, this->ab);
	this->experiment.getResolver().set(Option::RECORD_INTERVAL, 3e-6, &first);
	this->experiment.getResolver().set(Option::RECORD_INTERVAL, 4e-6, &second);

	// 3 us is not a whole number of 2 us timesteps, but it is never sent in them
	Commands commands;
	ASSERT_NO_THROW(commands = this->compile(*this->a));
	EXPECT_THAT(operandsOf(commands, Opcode::TIMESTEP), ElementsAre(1000u, 2000u));
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_PERIOD), ElementsAre(3u, 2u));
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_DUTY), ElementsAre(2u, 1u));
	EXPECT_THAT(operandsOf(commands, Opcode::RECORD_INTERVAL), ElementsAre(3u, 2u));
}

TEST_F(CompilerTest, TimestepChangeResendsUnchangedTiming) {
	this->experiment.newPhase();
	auto& second = this->experiment.newPhase();

	this->ab->option(Option::BURST_PERIOD)           = 4e-6;
	this->ab->option(Option::BURST_DUTY)             = 0.5;
	this->ab->option(Option::BURST_PHASE)            = 0.0;
	this->experiment.option(Option::RECORD_INTERVAL) = 1e-3;
	this->experiment.getResolver().set(Option::TIMESTEP, 2e-6, &second);

	auto commands = this->compile(*this->a);
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_PERIOD), ElementsAre(4u, 2u));
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_DUTY), ElementsAre(2u, 1u));
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_PHASE), ElementsAre(0u, 0u));
	EXPECT_THAT(operandsOf(commands, Opcode::RECORD_INTERVAL), ElementsAre(1000u, 500u));
}

TEST_F(CompilerTest, AutoSeedReseedsEveryPhase) {
	this->experiment.newPhase();
	this->experiment.newPhase();

	auto commands = this->compile(*this->b);
	EXPECT_EQ(operandsOf(commands, Opcode::SEED).size(), 2u);
}

TEST_F(CompilerTest, FlowOptionsOverrideEntityOptions) {
	this->experiment.newPhase();
	this->a->option(Option::USE_PAYLOAD)           = true;
	this->a->option(Option::NUM_RETRIES)           = int64_t{3};
	this->ab->option(Option::NUM_RETRIES)          = int64_t{5};
	this->ab->option(Option::PACKETS_PER_TIMESTEP) = int64_t{2};
	this->ab->option(Option::BURST_PERIOD)         = 1e-3;
	this->ab->option(Option::BURST_DUTY)           = 0.5;

	auto commands = this->compile(*this->a);
	EXPECT_THAT(operandsOf(commands, Opcode::NUM_RETRIES), ElementsAre(5u));
	EXPECT_THAT(operandsOf(commands, Opcode::NUM_PACKETS), ElementsAre(2u));
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_PERIOD), ElementsAre(1000u));
	EXPECT_THAT(operandsOf(commands, Opcode::BURST_DUTY), ElementsAre(500u));
	EXPECT_EQ(operandsOf(commands, Opcode::PAYLOAD).size(), 1u);

	// Entity options of the sink do not leak into the source
	EXPECT_TRUE(operandsOf(this->compile(*this->b), Opcode::PAYLOAD).empty());
}

TEST_F(CompilerTest, RecordMaskAndInterval) {
	this->experiment.newPhase();
	this->experiment.option(Option::RECORD_SENT)            = true;
	this->experiment.option(Option::RECORD_RECEIVED)        = true;
	this->experiment.option(Option::RECORD_LOCAL_MULTICAST) = true;
	this->experiment.option(Option::RECORD_INTERVAL)        = 5e-4;

	// Router counters are only recorded by the entity with router access
	EXPECT_THAT(operandsOf(this->compile(*this->a), Opcode::RECORD), ElementsAre((1u << 24) | (1u << 28)));
	EXPECT_THAT(operandsOf(this->compile(*this->a, true), Opcode::RECORD),
	            ElementsAre((1u << 0) | (1u << 24) | (1u << 28)));
	EXPECT_THAT(operandsOf(this->compile(*this->a), Opcode::RECORD_INTERVAL), ElementsAre(500u));
}

TEST_F(CompilerTest, RouterAccessBracketsEachPhase) {
	this->experiment.newPhase();
	this->experiment.newPhase();
	this->experiment.option(Option::ROUTER_TIMEOUT)   = RouterTimeout{16, 0};
	this->experiment.option(Option::REINJECT_PACKETS) = true;

	auto with_access = this->compile(*this->a, true);
	EXPECT_THAT(operandsOf(with_access, Opcode::ROUTER_TIMEOUT), ElementsAre(0x00100000u, 0x00100000u));
	EXPECT_EQ(operandsOf(with_access, Opcode::ROUTER_TIMEOUT_RESTORE).size(), 2u);
	EXPECT_EQ(operandsOf(with_access, Opcode::REINJECTION_ENABLE).size(), 2u);
	EXPECT_EQ(operandsOf(with_access, Opcode::REINJECTION_DISABLE).size(), 2u);

	auto ops = opcodes(with_access);
	EXPECT_EQ(ops[2], Opcode::ROUTER_TIMEOUT);
	EXPECT_EQ(ops[3], Opcode::REINJECTION_ENABLE);

	auto without_access = this->compile(*this->b);
	EXPECT_TRUE(operandsOf(without_access, Opcode::ROUTER_TIMEOUT).empty());
	EXPECT_TRUE(operandsOf(without_access, Opcode::REINJECTION_ENABLE).empty());
}

TEST_F(CompilerTest, AutoRouterTimeoutLeavesRouterAlone) {
	this->experiment.newPhase();

	auto commands = this->compile(*this->a, true);
	EXPECT_TRUE(operandsOf(commands, Opcode::ROUTER_TIMEOUT).empty());
	EXPECT_TRUE(operandsOf(commands, Opcode::ROUTER_TIMEOUT_RESTORE).empty());
}

TEST_F(CompilerTest, InvalidValues) {
	auto& phase = this->experiment.newPhase();

	this->ab->option(Option::NUM_RETRIES) = int64_t{-1};
	EXPECT_THROW(this->compile(*this->a), CompileError);
	this->ab->option(Option::NUM_RETRIES).unset();

	this->experiment.getResolver().set(Option::DURATION, 1.5e-6 + 1e-3, &phase);
	EXPECT_THROW(this->compile(*this->a), CompileError);
	this->experiment.getResolver().set(Option::DURATION, 1e-3, &phase);

	this->experiment.option(Option::PROBABILITY) = 2.0;
	EXPECT_THROW(this->compile(*this->a), CompileError);
}

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
