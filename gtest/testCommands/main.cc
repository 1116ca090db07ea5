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
 * @brief GoogleTest suite for the interpreter instruction stream and router timeout codes
 *
 * @details
 * Every Commands method appends instruction words only when the interpreter's
 * state actually changes. The tests below check both the exact words emitted and
 * that redundant calls emit nothing.
 *
 * Instruction words carry the opcode in bits 0-7 and the source or sink index in
 * bits 8-15; operands follow in a separate word.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "compiler/Commands.hh"
#include "compiler/RouterTimeout.hh"
#include "errors/Errors.hh"

using namespace nettest;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

constexpr uint32_t op(Opcode _opcode, uint32_t _index = 0) { return static_cast<uint32_t>(_opcode) | (_index << 8); }

std::vector<uint32_t> tail(const Commands& _commands, size_t _n) {
	const auto& words = _commands.getWords();
	return std::vector<uint32_t>(words.end() - _n, words.end());
}

}  // namespace

TEST(RouterTimeoutTest, DecodeWaitTime) {
	EXPECT_EQ(decodeWaitTime(0x00), 0u);
	EXPECT_EQ(decodeWaitTime(0x10), 16u);
	EXPECT_EQ(decodeWaitTime(0x4F), 480u);

	int64_t last = -1;
	for (int code = 0; code < 256; ++code) {
		int64_t wait = decodeWaitTime(static_cast<uint8_t>(code));
		EXPECT_GT(wait, last) << "code " << code;
		last = wait;
	}
}

TEST(RouterTimeoutTest, EncodeWaitTime) {
	EXPECT_EQ(encodeWaitTime(0), 0x00);
	EXPECT_EQ(encodeWaitTime(16), 0x10);
	EXPECT_EQ(encodeWaitTime(480), 0x4F);

	for (int code = 0; code < 256; ++code) {
		EXPECT_EQ(encodeWaitTime(decodeWaitTime(static_cast<uint8_t>(code))), code);
	}
}

TEST(RouterTimeoutTest, UnsupportedWaitTimeNamesNearest) {
	for (uint32_t wait : {479u, 481u}) {
		try {
			encodeWaitTime(wait);
			FAIL() << "wait time " << wait << " should not be encodable";
		} catch (const CompileError& e) { EXPECT_THAT(e.what(), HasSubstr("480")); }
	}
}

TEST(RouterTimeoutTest, OperandRoundTrip) {
	EXPECT_EQ(encodeRouterTimeout(RouterTimeout{480, 16}), 0x104F0000u);
	EXPECT_EQ(decodeRouterTimeout(0x104F0000u), (RouterTimeout{480, 16}));
}

TEST(CommandsTest, ExitOnlyOnce) {
	Commands commands;
	commands.exit();
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::EXIT)));
	EXPECT_THROW(commands.exit(), CompileError);
	EXPECT_THROW(commands.barrier(), CompileError);
}

TEST(CommandsTest, SleepInMicroseconds) {
	Commands commands;
	commands.sleep(0.000001);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::SLEEP), 1u));
}

TEST(CommandsTest, Barrier) {
	Commands commands;
	commands.barrier();
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::BARRIER)));
}

TEST(CommandsTest, AutoSeedAlwaysReseeds) {
	Commands commands;

	commands.seed();
	ASSERT_EQ(commands.getWords().size(), 2u);
	EXPECT_EQ(commands.getWords()[0], op(Opcode::SEED));

	commands.seed();
	EXPECT_EQ(commands.getWords().size(), 4u);
	EXPECT_EQ(commands.getWords()[2], op(Opcode::SEED));
}

TEST(CommandsTest, ExplicitSeedOnlyWhenChanged) {
	Commands commands;

	commands.seed(123);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::SEED), 123u));

	commands.seed(123);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.seed(456);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::SEED), 456u));

	// An automatic seed in between means the explicit one must be sent again
	commands.seed();
	commands.seed(456);
	EXPECT_EQ(commands.getWords().size(), 8u);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::SEED), 456u));
}

TEST(CommandsTest, Timestep) {
	Commands commands;
	commands.timestep(1e-9);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::TIMESTEP), 1u));

	commands.timestep(1e-9);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.timestep(1e-6);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::TIMESTEP), 1000u));
}

TEST(CommandsTest, TimestepMustBeWholeNanoseconds) {
	Commands commands;
	try {
		commands.timestep(1.5e-9);
		FAIL() << "a fractional nanosecond timestep must be rejected";
	} catch (const CompileError& e) { EXPECT_THAT(e.what(), HasSubstr("nearest valid value")); }
	EXPECT_TRUE(commands.getWords().empty());
}

TEST(CommandsTest, Run) {
	Commands commands;
	commands.timestep(1e-9);

	commands.run(1e-6);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::RUN), 1000u));

	commands.run(1e-7, false);
	EXPECT_EQ(commands.getWords().size(), 6u);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::RUN_NO_RECORD), 100u));
}

TEST(CommandsTest, RunNeedsTimestepAndWholeSteps) {
	Commands commands;
	EXPECT_THROW(commands.run(1e-6), CompileError);

	commands.timestep(1e-6);
	EXPECT_THROW(commands.run(1.5e-6), CompileError);
}

TEST(CommandsTest, NumDeclaredOnce) {
	Commands commands;
	commands.num(0xAAAA, 0xBBBB);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::NUM), 0xBBBBAAAAu));
	EXPECT_THROW(commands.num(1, 1), CompileError);
}

TEST(CommandsTest, NumLimits) {
	Commands commands;
	EXPECT_THROW(commands.num(0x10000, 0), CompileError);
	EXPECT_THROW(commands.num(0, 0x10000), CompileError);
}

TEST(CommandsTest, RouterTimeout) {
	Commands commands;
	commands.routerTimeout(16);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::ROUTER_TIMEOUT), 0x00100000u));

	commands.routerTimeout(480, 16);
	EXPECT_EQ(commands.getWords().size(), 4u);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::ROUTER_TIMEOUT), 0x104F0000u));

	commands.routerTimeout(RouterTimeout{480, 16});
	EXPECT_EQ(commands.getWords().size(), 4u);

	EXPECT_THROW(commands.routerTimeout(479), CompileError);
}

TEST(CommandsTest, RouterTimeoutRestore) {
	Commands commands;
	commands.routerTimeoutRestore();
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::ROUTER_TIMEOUT_RESTORE)));

	// After a restore the same timeout has to be sent again
	commands.routerTimeout(16);
	commands.routerTimeoutRestore();
	commands.routerTimeout(16);
	EXPECT_EQ(commands.getWords().size(), 6u);
}

TEST(CommandsTest, Reinject) {
	Commands commands;

	commands.reinject(false);
	EXPECT_TRUE(commands.getWords().empty());

	commands.reinject(true);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::REINJECTION_ENABLE)));

	commands.reinject(true);
	EXPECT_EQ(commands.getWords().size(), 1u);

	commands.reinject(false);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::REINJECTION_ENABLE), op(Opcode::REINJECTION_DISABLE)));

	commands.reinject(false);
	EXPECT_EQ(commands.getWords().size(), 2u);
}

TEST(CommandsTest, Record) {
	Commands commands;

	commands.record({});
	EXPECT_TRUE(commands.getWords().empty());

	commands.record({Counter::LOCAL_MULTICAST, Counter::SENT});
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::RECORD), (1u << 0) | (1u << 24)));

	commands.record({Counter::SENT, Counter::LOCAL_MULTICAST});
	EXPECT_EQ(commands.getWords().size(), 2u);
}

TEST(CommandsTest, RecordIntervalFollowsTimestep) {
	Commands commands;
	commands.timestep(1e-9);

	commands.recordInterval(0.0);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.recordInterval(1e-6);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::RECORD_INTERVAL), 1000u));

	commands.recordInterval(1e-3);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::RECORD_INTERVAL), 1000000u));

	commands.recordInterval(1e-3);
	EXPECT_EQ(commands.getWords().size(), 6u);

	// The interval is sent in timesteps, so a new timestep makes it stale
	commands.timestep(1e-6);
	EXPECT_EQ(commands.getWords().size(), 8u);
	commands.recordInterval(1e-3);
	EXPECT_EQ(commands.getWords().size(), 10u);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::RECORD_INTERVAL), 1000u));

	// Only the new interval is converted, the old one need not fit the new timestep
	commands.timestep(1e-9);
	commands.recordInterval(3e-9);
	commands.timestep(2e-9);
	EXPECT_NO_THROW(commands.recordInterval(4e-9));
	EXPECT_THAT(tail(commands, 4), ElementsAre(op(Opcode::TIMESTEP), 2u, op(Opcode::RECORD_INTERVAL), 2u));
}

TEST(CommandsTest, StaleTimingIsResentBeforeBarrierAndRun) {
	Commands commands;
	commands.timestep(1e-9);
	commands.num(1, 0);
	commands.recordInterval(1e-6);
	commands.burst(0, 1e-6, 0.5, 0.25);
	size_t before = commands.getWords().size();

	commands.timestep(1e-8);
	commands.barrier();
	EXPECT_THAT(std::vector<uint32_t>(commands.getWords().begin() + before, commands.getWords().end()),
	            ElementsAre(op(Opcode::TIMESTEP), 10u, op(Opcode::RECORD_INTERVAL), 100u, op(Opcode::BURST_PERIOD),
	                        100u, op(Opcode::BURST_DUTY), 50u, op(Opcode::BURST_PHASE), 25u, op(Opcode::BARRIER)));

	// Nothing is stale any more
	before = commands.getWords().size();
	commands.run(1e-6);
	EXPECT_THAT(std::vector<uint32_t>(commands.getWords().begin() + before, commands.getWords().end()),
	            ElementsAre(op(Opcode::RUN), 100u));
}

TEST(CommandsTest, Probability) {
	Commands commands;
	commands.num(2, 0);

	commands.probability(0, 0.0);
	commands.probability(1, 0.0);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.probability(0, 0.5);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::PROBABILITY, 0), 1u << 31));
	commands.probability(1, 0.25);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::PROBABILITY, 1), 1u << 30));

	commands.probability(0, 0.5);
	commands.probability(1, 0.25);
	EXPECT_EQ(commands.getWords().size(), 6u);

	commands.probability(0, 0.0);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::PROBABILITY, 0), 0u));
	commands.probability(1, 1.0);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::PROBABILITY, 1), 0xFFFFFFFFu));

	EXPECT_THROW(commands.probability(0, 1.5), CompileError);
	EXPECT_THROW(commands.probability(0, -0.1), CompileError);
	EXPECT_THROW(commands.probability(2, 0.5), CompileError);
}

TEST(CommandsTest, Burst) {
	Commands commands;
	commands.timestep(1e-9);
	commands.num(2, 0);
	EXPECT_EQ(commands.getWords().size(), 4u);

	// Disabled bursting emits nothing whatever the duty and phase
	commands.burst(0, 0.0, 0.0, 0.0);
	commands.burst(0, 0.0, 123.0, std::nullopt);
	EXPECT_EQ(commands.getWords().size(), 4u);

	commands.burst(0, 1e-6, 0.1, 0.1);
	EXPECT_EQ(commands.getWords().size(), 10u);
	EXPECT_THAT(tail(commands, 6), ElementsAre(op(Opcode::BURST_PERIOD), 1000u, op(Opcode::BURST_DUTY), 100u,
	                                           op(Opcode::BURST_PHASE), 100u));

	commands.burst(0, 2e-6, 0.1, 0.1);
	EXPECT_EQ(commands.getWords().size(), 16u);
	EXPECT_THAT(tail(commands, 6), ElementsAre(op(Opcode::BURST_PERIOD), 2000u, op(Opcode::BURST_DUTY), 200u,
	                                           op(Opcode::BURST_PHASE), 200u));

	commands.burst(0, 2e-6, 0.1, 0.1);
	EXPECT_EQ(commands.getWords().size(), 16u);

	commands.burst(0, 2e-6, 0.1, 0.5);
	EXPECT_EQ(commands.getWords().size(), 18u);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::BURST_PHASE), 1000u));

	commands.burst(0, 2e-6, 0.2, 0.5);
	EXPECT_EQ(commands.getWords().size(), 20u);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::BURST_DUTY), 400u));

	// Everything is expressed in timesteps so the next burst after a new timestep resends it all
	commands.timestep(2e-9);
	EXPECT_EQ(commands.getWords().size(), 22u);
	commands.burst(0, 2e-6, 0.2, 0.5);
	EXPECT_EQ(commands.getWords().size(), 28u);
	EXPECT_THAT(tail(commands, 6), ElementsAre(op(Opcode::BURST_PERIOD), 1000u, op(Opcode::BURST_DUTY), 200u,
	                                           op(Opcode::BURST_PHASE), 500u));

	// A random phase is drawn again every time
	commands.burst(0, 2e-6, 0.2, std::nullopt);
	EXPECT_EQ(commands.getWords().size(), 30u);
	EXPECT_EQ(commands.getWords()[28], op(Opcode::BURST_PHASE));
	EXPECT_LT(commands.getWords()[29], 1000u);

	commands.burst(0, 2e-6, 0.2, std::nullopt);
	EXPECT_EQ(commands.getWords().size(), 32u);
	EXPECT_EQ(commands.getWords()[30], op(Opcode::BURST_PHASE));

	commands.burst(1, 1e-6, 0.1, 0.1);
	EXPECT_EQ(commands.getWords().size(), 38u);
	EXPECT_THAT(tail(commands, 6), ElementsAre(op(Opcode::BURST_PERIOD, 1), 500u, op(Opcode::BURST_DUTY, 1), 50u,
	                                           op(Opcode::BURST_PHASE, 1), 50u));
}

TEST(CommandsTest, SourceKeyMasksLowByte) {
	Commands commands;
	commands.num(2, 0);

	commands.sourceKey(0, 0);
	commands.sourceKey(1, 0);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.sourceKey(0, 0x00BEEFAA);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::SOURCE_KEY, 0), 0x00BEEF00u));
	commands.sourceKey(1, 0x00DEADBB);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::SOURCE_KEY, 1), 0x00DEAD00u));

	// Only the masked off bits differ
	commands.sourceKey(0, 0x00BEEFCC);
	commands.sourceKey(1, 0x00DEADDD);
	EXPECT_EQ(commands.getWords().size(), 6u);
}

TEST(CommandsTest, Payload) {
	Commands commands;
	commands.num(2, 0);

	commands.payload(0, false);
	commands.payload(1, false);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.payload(0, true);
	commands.payload(1, true);
	commands.payload(0, true);
	commands.payload(1, true);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::PAYLOAD, 0), op(Opcode::PAYLOAD, 1)));
	EXPECT_EQ(commands.getWords().size(), 4u);

	commands.payload(0, false);
	commands.payload(1, false);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::NO_PAYLOAD, 0), op(Opcode::NO_PAYLOAD, 1)));
}

TEST(CommandsTest, NumRetriesAndPackets) {
	Commands commands;
	commands.num(2, 0);

	commands.numRetries(0, 0);
	commands.numPackets(1, 1);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.numRetries(1, 100);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::NUM_RETRIES, 1), 100u));
	commands.numPackets(0, 10);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::NUM_PACKETS, 0), 10u));

	commands.numRetries(1, 100);
	commands.numPackets(0, 10);
	EXPECT_EQ(commands.getWords().size(), 6u);
}

TEST(CommandsTest, Consume) {
	Commands commands;

	commands.consume(true);
	EXPECT_TRUE(commands.getWords().empty());

	commands.consume(false);
	commands.consume(false);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::NO_CONSUME)));

	commands.consume(true);
	EXPECT_THAT(commands.getWords(), ElementsAre(op(Opcode::NO_CONSUME), op(Opcode::CONSUME)));
}

TEST(CommandsTest, SinkKey) {
	Commands commands;
	commands.num(0, 2);

	commands.sinkKey(0, 0);
	commands.sinkKey(1, 0);
	EXPECT_EQ(commands.getWords().size(), 2u);

	commands.sinkKey(0, 0x00BEEFAA);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::SINK_KEY, 0), 0x00BEEF00u));
	commands.sinkKey(1, 0x00DEADBB);
	EXPECT_THAT(tail(commands, 2), ElementsAre(op(Opcode::SINK_KEY, 1), 0x00DEAD00u));

	commands.sinkKey(0, 0x00BEEFCC);
	commands.sinkKey(1, 0x00DEADDD);
	EXPECT_EQ(commands.getWords().size(), 6u);

	EXPECT_THROW(commands.sinkKey(2, 0x100), CompileError);
}

TEST(CommandsTest, SizeAndPack) {
	Commands commands;
	commands.num(0, 0);
	commands.exit();

	EXPECT_EQ(commands.getWords().size(), 3u);
	EXPECT_EQ(commands.getSize(), 16u);
	std::vector<uint8_t> expected = {
	    0x0C, 0, 0, 0,              // 12 bytes of instructions
	    0x06, 0, 0, 0, 0, 0, 0, 0,  // NUM 0 0
	    0x00, 0, 0, 0,              // EXIT
	};
	EXPECT_EQ(commands.pack(), expected);
}

TEST(CommandsTest, Disassemble) {
	Commands commands;
	commands.num(1, 0);
	commands.probability(0, 0.5);
	commands.exit();

	auto text = Commands::disassemble(commands.pack());
	EXPECT_THAT(text, HasSubstr("NUM 1 (0x00000001)"));
	EXPECT_THAT(text, HasSubstr("PROBABILITY 2147483648 (0x80000000)"));
	EXPECT_THAT(text, HasSubstr("EXIT"));

	EXPECT_THROW(Commands::disassemble({1, 2, 3}), std::invalid_argument);
}

TEST(OpcodeTest, Names) {
	EXPECT_STREQ(getOpcodeName(0x25), "PAYLOAD");
	EXPECT_THROW(getOpcodeName(0xFF), std::invalid_argument);
	EXPECT_FALSE(hasOperand(Opcode::NO_CONSUME));
	EXPECT_TRUE(hasOperand(Opcode::SINK_KEY));
}

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
