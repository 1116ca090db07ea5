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
 * @file Commands.hh
 * @brief Builder for the instruction stream executed by one remote interpreter
 *
 * Instructions are little-endian 32-bit words. The low byte of the first word is
 * the opcode and, for per-source and per-sink instructions, bits 8-15 hold the
 * source or sink index. Most instructions carry one operand word.
 *
 * Commands remembers the last value sent for every stateful parameter and only
 * appends an instruction when a value actually changes, so consecutive phases
 * sharing their configuration cost nothing but their barrier and run
 * instructions.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "config/Option.hh"
#include "counter/Counter.hh"

namespace nettest {

enum class Opcode : uint8_t {
	EXIT                   = 0x00,
	SLEEP                  = 0x01,
	BARRIER                = 0x02,
	SEED                   = 0x03,
	TIMESTEP               = 0x04,
	RUN                    = 0x05,
	NUM                    = 0x06,
	ROUTER_TIMEOUT         = 0x07,
	ROUTER_TIMEOUT_RESTORE = 0x08,
	REINJECTION_ENABLE     = 0x09,
	REINJECTION_DISABLE    = 0x0A,
	RUN_NO_RECORD          = 0x0B,
	RECORD                 = 0x10,
	RECORD_INTERVAL        = 0x11,
	PROBABILITY            = 0x20,
	BURST_PERIOD           = 0x21,
	BURST_DUTY             = 0x22,
	BURST_PHASE            = 0x23,
	SOURCE_KEY             = 0x24,
	PAYLOAD                = 0x25,
	NO_PAYLOAD             = 0x26,
	NUM_RETRIES            = 0x27,
	NUM_PACKETS            = 0x28,
	CONSUME                = 0x30,
	NO_CONSUME             = 0x31,
	SINK_KEY               = 0x32,
};

/// @throws std::invalid_argument for a byte that is not an opcode
const char* getOpcodeName(uint8_t _opcode);

bool hasOperand(Opcode _opcode);

class Commands {
public:
	/// @brief Bits of a routing key the interpreter owns
	static constexpr uint32_t kKeyMask = 0xFFFFFF00u;

	Commands();

	/// @brief Terminate the program, nothing can be appended afterwards
	void exit();

	/// @brief Wait for the given number of seconds (rounded to microseconds)
	void sleep(double _seconds);

	/// @brief Wait for the next synchronisation signal
	void barrier();

	/**
	 * @brief Seed the random number generator
	 * @param _seed Explicit seed, sent when it differs from the last one. An empty seed always
	 *        reseeds with a fresh random value.
	 */
	void seed(std::optional<uint32_t> _seed = std::nullopt);

	/**
	 * @brief Set the timestep in seconds, which must be a whole number of nanoseconds
	 *
	 * Burst timing and the record interval are sent in timesteps. After a change
	 * they are resent by the next burst() or recordInterval() call, or before the
	 * next barrier() or run() if no new value was given.
	 */
	void timestep(double _seconds);

	/// @brief Run for a number of seconds, which must be a whole number of timesteps
	void run(double _seconds, bool _record = true);

	/**
	 * @brief Declare the number of sources and sinks of the entity
	 * @throws CompileError when declared a second time
	 */
	void num(uint32_t _numSources, uint32_t _numSinks);

	void routerTimeout(uint32_t _wait1, uint32_t _wait2 = 0);
	void routerTimeout(const RouterTimeout& _timeout) { this->routerTimeout(_timeout.wait1, _timeout.wait2); }
	void routerTimeoutRestore();

	void reinject(bool _enable);

	void record(const std::vector<Counter>& _counters);

	/// @brief Seconds between samples, 0 records a single sample per run
	void recordInterval(double _seconds);

	/// @throws CompileError for a probability outside [0, 1]
	void probability(size_t _source, double _probability);

	/**
	 * @brief Configure bursting of one source
	 * @param _period Burst period in seconds, 0 disables bursting
	 * @param _duty Fraction of the period the source is active
	 * @param _phase Fraction of the period at which the first burst starts, empty for a random phase
	 */
	void burst(size_t _source, double _period, double _duty, std::optional<double> _phase);

	void sourceKey(size_t _source, uint32_t _key);
	void payload(size_t _source, bool _payload);
	void numRetries(size_t _source, uint32_t _numRetries);
	void numPackets(size_t _source, uint32_t _numPackets);

	void consume(bool _consume);
	void sinkKey(size_t _sink, uint32_t _key);

	/// @brief Instruction words appended so far
	const std::vector<uint32_t>& getWords() const { return this->words; }

	/// @brief Size of the packed program including its length prefix
	size_t getSize() const { return 4 * (this->words.size() + 1); }

	/// @brief Length prefixed little-endian program
	std::vector<uint8_t> pack() const;

	/**
	 * @brief Render a packed program as one instruction per line
	 * @throws std::invalid_argument if the program is malformed
	 */
	static std::string disassemble(const std::vector<uint8_t>& _program);

private:
	struct SourceState {
		double                probability = 0.0;
		double                burstPeriod = 0.0;
		double                burstDuty   = 0.0;
		std::optional<double> burstPhase  = 0.0;
		bool                  payload     = false;
		uint32_t              key         = 0;
		uint32_t              numRetries  = 0;
		uint32_t              numPackets  = 1;
		bool                  burstStale  = false;
	};

	void append(Opcode _opcode, size_t _index = 0);
	void append(Opcode _opcode, size_t _index, uint32_t _operand);

	SourceState& getSource(size_t _source);

	uint32_t toTimesteps(double _seconds, const std::string& _what) const;

	void flushStale();
	void emitRecordInterval();
	void emitBurst(size_t _source, bool _period, bool _duty, bool _phase);

	std::vector<uint32_t> words;
	bool                  exited = false;

	std::optional<uint32_t> lastSeed;
	std::optional<double>   lastTimestep;
	double                  lastRecordInterval  = 0.0;
	bool                    recordIntervalStale = false;
	uint32_t                lastRecordMask      = 0;
	std::optional<uint32_t> lastRouterTimeout;
	bool                    lastReinject = false;
	bool                    lastConsume  = true;

	std::optional<std::pair<uint32_t, uint32_t>> numDeclared;

	std::vector<SourceState> sources;
	std::vector<uint32_t>    sinkKeys;

	std::mt19937 rng;
};

}  // namespace nettest
