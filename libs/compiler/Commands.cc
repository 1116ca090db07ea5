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

#include "compiler/Commands.hh"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "compiler/RouterTimeout.hh"
#include "errors/Errors.hh"

namespace nettest {

namespace {

/// @brief Relative error tolerated when converting seconds into a whole number of units
constexpr double kQuantizationTolerance = 1e-6;

std::string formatSeconds(double _seconds) {
	std::ostringstream ss;
	ss << std::setprecision(12) << _seconds << " s";
	return ss.str();
}

/**
 * @brief Convert to a whole number of units of the given size
 * @throws CompileError naming the nearest representable value when not exact
 */
uint32_t quantize(double _value, double _unit, const std::string& _what) {
	if (!(_value >= 0.0)) throw CompileError(_what + " must not be negative, got " + formatSeconds(_value));

	double ratio   = _value / _unit;
	double rounded = std::round(ratio);
	if (rounded > 0xFFFFFFFF) throw CompileError(_what + " of " + formatSeconds(_value) + " is too long");
	if (std::abs(ratio - rounded) > kQuantizationTolerance * std::max(ratio, 1.0)) {
		throw CompileError(_what + " of " + formatSeconds(_value) + " is not a whole multiple of " +
		                   formatSeconds(_unit) + ", the nearest valid value is " + formatSeconds(rounded * _unit));
	}
	return static_cast<uint32_t>(rounded);
}

}  // namespace

const char* getOpcodeName(uint8_t _opcode) {
	switch (static_cast<Opcode>(_opcode)) {
		case Opcode::EXIT: return "EXIT";
		case Opcode::SLEEP: return "SLEEP";
		case Opcode::BARRIER: return "BARRIER";
		case Opcode::SEED: return "SEED";
		case Opcode::TIMESTEP: return "TIMESTEP";
		case Opcode::RUN: return "RUN";
		case Opcode::NUM: return "NUM";
		case Opcode::ROUTER_TIMEOUT: return "ROUTER_TIMEOUT";
		case Opcode::ROUTER_TIMEOUT_RESTORE: return "ROUTER_TIMEOUT_RESTORE";
		case Opcode::REINJECTION_ENABLE: return "REINJECTION_ENABLE";
		case Opcode::REINJECTION_DISABLE: return "REINJECTION_DISABLE";
		case Opcode::RUN_NO_RECORD: return "RUN_NO_RECORD";
		case Opcode::RECORD: return "RECORD";
		case Opcode::RECORD_INTERVAL: return "RECORD_INTERVAL";
		case Opcode::PROBABILITY: return "PROBABILITY";
		case Opcode::BURST_PERIOD: return "BURST_PERIOD";
		case Opcode::BURST_DUTY: return "BURST_DUTY";
		case Opcode::BURST_PHASE: return "BURST_PHASE";
		case Opcode::SOURCE_KEY: return "SOURCE_KEY";
		case Opcode::PAYLOAD: return "PAYLOAD";
		case Opcode::NO_PAYLOAD: return "NO_PAYLOAD";
		case Opcode::NUM_RETRIES: return "NUM_RETRIES";
		case Opcode::NUM_PACKETS: return "NUM_PACKETS";
		case Opcode::CONSUME: return "CONSUME";
		case Opcode::NO_CONSUME: return "NO_CONSUME";
		case Opcode::SINK_KEY: return "SINK_KEY";
	}
	throw std::invalid_argument("Unknown opcode " + std::to_string(_opcode));
}

bool hasOperand(Opcode _opcode) {
	switch (_opcode) {
		case Opcode::EXIT:
		case Opcode::BARRIER:
		case Opcode::ROUTER_TIMEOUT_RESTORE:
		case Opcode::REINJECTION_ENABLE:
		case Opcode::REINJECTION_DISABLE:
		case Opcode::PAYLOAD:
		case Opcode::NO_PAYLOAD:
		case Opcode::CONSUME:
		case Opcode::NO_CONSUME: return false;
		default: return true;
	}
}

Commands::Commands() : rng(std::random_device{}()) {}

void Commands::exit() { this->append(Opcode::EXIT); }

void Commands::sleep(double _seconds) {
	if (!(_seconds >= 0.0)) throw CompileError("Sleep time must not be negative, got " + formatSeconds(_seconds));
	this->append(Opcode::SLEEP, 0, static_cast<uint32_t>(std::llround(_seconds * 1e6)));
}

void Commands::barrier() {
	this->flushStale();
	this->append(Opcode::BARRIER);
}

void Commands::seed(std::optional<uint32_t> _seed) {
	if (!_seed) {
		this->append(Opcode::SEED, 0, static_cast<uint32_t>(this->rng()));
		this->lastSeed.reset();
	} else if (this->lastSeed != _seed) {
		this->append(Opcode::SEED, 0, *_seed);
		this->lastSeed = _seed;
	}
}

void Commands::timestep(double _seconds) {
	if (this->lastTimestep && *this->lastTimestep == _seconds) return;

	uint32_t ns = quantize(_seconds, 1e-9, "Timestep");
	if (ns == 0) throw CompileError("Timestep must be at least 1 ns, got " + formatSeconds(_seconds));

	this->append(Opcode::TIMESTEP, 0, ns);
	this->lastTimestep = _seconds;

	// Values expressed in timesteps are resent by the next recordInterval() or burst(), or by flushStale()
	if (this->lastRecordInterval != 0.0) this->recordIntervalStale = true;
	for (auto& state : this->sources) {
		if (state.burstPeriod != 0.0) state.burstStale = true;
	}
}

void Commands::run(double _seconds, bool _record) {
	this->flushStale();
	this->append(_record ? Opcode::RUN : Opcode::RUN_NO_RECORD, 0,
	             this->toTimesteps(_seconds, _record ? "Run duration" : "Unrecorded run duration"));
}

void Commands::num(uint32_t _numSources, uint32_t _numSinks) {
	if (this->numDeclared) throw CompileError("The number of sources and sinks can only be declared once");
	if (_numSources > 0xFFFF || _numSinks > 0xFFFF) {
		throw CompileError("At most 65535 sources and sinks are supported");
	}

	this->append(Opcode::NUM, 0, _numSources | (_numSinks << 16));
	this->numDeclared = std::make_pair(_numSources, _numSinks);
	this->sources.resize(_numSources);
	this->sinkKeys.resize(_numSinks, 0);
}

void Commands::routerTimeout(uint32_t _wait1, uint32_t _wait2) {
	uint32_t operand = encodeRouterTimeout(RouterTimeout{_wait1, _wait2});
	if (this->lastRouterTimeout == operand) return;

	this->append(Opcode::ROUTER_TIMEOUT, 0, operand);
	this->lastRouterTimeout = operand;
}

void Commands::routerTimeoutRestore() {
	this->append(Opcode::ROUTER_TIMEOUT_RESTORE);
	this->lastRouterTimeout.reset();
}

void Commands::reinject(bool _enable) {
	if (this->lastReinject == _enable) return;
	this->append(_enable ? Opcode::REINJECTION_ENABLE : Opcode::REINJECTION_DISABLE);
	this->lastReinject = _enable;
}

void Commands::record(const std::vector<Counter>& _counters) {
	uint32_t mask = getRecordMask(_counters);
	if (mask == this->lastRecordMask) return;
	this->append(Opcode::RECORD, 0, mask);
	this->lastRecordMask = mask;
}

void Commands::recordInterval(double _seconds) {
	if (_seconds == this->lastRecordInterval && !this->recordIntervalStale) return;
	this->lastRecordInterval  = _seconds;
	this->recordIntervalStale = false;
	this->emitRecordInterval();
}

void Commands::probability(size_t _source, double _probability) {
	if (!(_probability >= 0.0 && _probability <= 1.0)) {
		throw CompileError("Probability must be within [0, 1], got " + std::to_string(_probability));
	}

	auto& state = this->getSource(_source);
	if (state.probability == _probability) return;

	this->append(Opcode::PROBABILITY, _source, static_cast<uint32_t>(std::llround(_probability * 0xFFFFFFFF)));
	state.probability = _probability;
}

void Commands::burst(size_t _source, double _period, double _duty, std::optional<double> _phase) {
	auto& state = this->getSource(_source);

	bool period_changed = state.burstStale || state.burstPeriod != _period;
	bool duty_changed   = state.burstDuty != _duty;
	bool phase_changed  = !_phase || state.burstPhase != _phase;

	state.burstPeriod = _period;
	state.burstDuty   = _duty;
	state.burstPhase  = _phase;
	state.burstStale  = false;

	if (period_changed) {
		// A disabled burst period makes duty and phase irrelevant
		this->emitBurst(_source, true, _period != 0.0, _period != 0.0);
	} else if (_period != 0.0) {
		this->emitBurst(_source, false, duty_changed, phase_changed);
	}
}

void Commands::sourceKey(size_t _source, uint32_t _key) {
	auto&    state = this->getSource(_source);
	uint32_t key   = _key & kKeyMask;
	if (state.key == key) return;
	this->append(Opcode::SOURCE_KEY, _source, key);
	state.key = key;
}

void Commands::payload(size_t _source, bool _payload) {
	auto& state = this->getSource(_source);
	if (state.payload == _payload) return;
	this->append(_payload ? Opcode::PAYLOAD : Opcode::NO_PAYLOAD, _source);
	state.payload = _payload;
}

void Commands::numRetries(size_t _source, uint32_t _numRetries) {
	auto& state = this->getSource(_source);
	if (state.numRetries == _numRetries) return;
	this->append(Opcode::NUM_RETRIES, _source, _numRetries);
	state.numRetries = _numRetries;
}

void Commands::numPackets(size_t _source, uint32_t _numPackets) {
	auto& state = this->getSource(_source);
	if (state.numPackets == _numPackets) return;
	this->append(Opcode::NUM_PACKETS, _source, _numPackets);
	state.numPackets = _numPackets;
}

void Commands::consume(bool _consume) {
	if (this->lastConsume == _consume) return;
	this->append(_consume ? Opcode::CONSUME : Opcode::NO_CONSUME);
	this->lastConsume = _consume;
}

void Commands::sinkKey(size_t _sink, uint32_t _key) {
	if (_sink >= this->sinkKeys.size()) {
		throw CompileError("Sink index " + std::to_string(_sink) + " out of range, " +
		                   std::to_string(this->sinkKeys.size()) + " sinks declared");
	}
	uint32_t key = _key & kKeyMask;
	if (this->sinkKeys[_sink] == key) return;
	this->append(Opcode::SINK_KEY, _sink, key);
	this->sinkKeys[_sink] = key;
}

std::vector<uint8_t> Commands::pack() const {
	std::vector<uint8_t> bytes;
	bytes.reserve(this->getSize());

	auto put = [&bytes](uint32_t _word) {
		for (int shift = 0; shift < 32; shift += 8) bytes.push_back(static_cast<uint8_t>(_word >> shift));
	};

	put(static_cast<uint32_t>(4 * this->words.size()));
	for (auto word : this->words) put(word);
	return bytes;
}

std::string Commands::disassemble(const std::vector<uint8_t>& _program) {
	if (_program.size() < 4 || _program.size() % 4 != 0) {
		throw std::invalid_argument("A program is a sequence of 32-bit words, got " +
		                            std::to_string(_program.size()) + " bytes");
	}

	auto word_at = [&_program](size_t _offset) {
		return static_cast<uint32_t>(_program[_offset]) | (static_cast<uint32_t>(_program[_offset + 1]) << 8) |
		       (static_cast<uint32_t>(_program[_offset + 2]) << 16) |
		       (static_cast<uint32_t>(_program[_offset + 3]) << 24);
	};

	uint32_t length = word_at(0);
	if (length != _program.size() - 4) {
		throw std::invalid_argument("Program length prefix says " + std::to_string(length) + " bytes but " +
		                            std::to_string(_program.size() - 4) + " follow");
	}

	std::ostringstream ss;
	for (size_t offset = 4; offset < _program.size(); offset += 4) {
		uint32_t word   = word_at(offset);
		auto     opcode = static_cast<uint8_t>(word & 0xFF);
		uint32_t index  = (word >> 8) & 0xFF;

		ss << std::setw(4) << std::setfill('0') << std::hex << (offset - 4) << std::dec << std::setfill(' ') << "  "
		   << getOpcodeName(opcode);
		if (index != 0) ss << "[" << index << "]";

		if (hasOperand(static_cast<Opcode>(opcode))) {
			offset += 4;
			if (offset >= _program.size()) {
				throw std::invalid_argument(std::string("Missing operand of ") + getOpcodeName(opcode));
			}
			uint32_t operand = word_at(offset);
			ss << " " << operand << " (0x" << std::hex << std::setw(8) << std::setfill('0') << operand << std::dec
			   << std::setfill(' ') << ")";
		}
		ss << "\n";
	}
	return ss.str();
}

void Commands::append(Opcode _opcode, size_t _index) {
	if (this->exited) {
		throw CompileError(std::string("Can not append ") + getOpcodeName(static_cast<uint8_t>(_opcode)) +
		                   " after EXIT");
	}
	this->words.push_back(static_cast<uint32_t>(_opcode) | (static_cast<uint32_t>(_index) << 8));
	if (_opcode == Opcode::EXIT) this->exited = true;
}

void Commands::append(Opcode _opcode, size_t _index, uint32_t _operand) {
	this->append(_opcode, _index);
	this->words.push_back(_operand);
}

Commands::SourceState& Commands::getSource(size_t _source) {
	if (_source >= this->sources.size()) {
		throw CompileError("Source index " + std::to_string(_source) + " out of range, " +
		                   std::to_string(this->sources.size()) + " sources declared");
	}
	return this->sources[_source];
}

uint32_t Commands::toTimesteps(double _seconds, const std::string& _what) const {
	if (!this->lastTimestep) throw CompileError(_what + " can not be converted before the timestep is set");
	return quantize(_seconds, *this->lastTimestep, _what);
}

void Commands::flushStale() {
	if (this->recordIntervalStale) {
		this->recordIntervalStale = false;
		this->emitRecordInterval();
	}
	for (size_t source = 0; source < this->sources.size(); ++source) {
		if (!this->sources[source].burstStale) continue;
		this->sources[source].burstStale = false;
		this->emitBurst(source, true, true, true);
	}
}

void Commands::emitRecordInterval() {
	this->append(Opcode::RECORD_INTERVAL, 0,
	             this->lastRecordInterval == 0.0 ? 0 : this->toTimesteps(this->lastRecordInterval, "Record interval"));
}

void Commands::emitBurst(size_t _source, bool _period, bool _duty, bool _phase) {
	const auto& state  = this->sources[_source];
	uint32_t    period = state.burstPeriod == 0.0 ? 0 : this->toTimesteps(state.burstPeriod, "Burst period");

	if (_period) this->append(Opcode::BURST_PERIOD, _source, period);
	if (_duty) {
		this->append(Opcode::BURST_DUTY, _source, static_cast<uint32_t>(std::llround(state.burstDuty * period)));
	}
	if (_phase) {
		uint32_t phase;
		if (state.burstPhase) {
			phase = static_cast<uint32_t>(std::llround(*state.burstPhase * period));
		} else {
			phase = period == 0 ? 0 : std::uniform_int_distribution<uint32_t>(0, period - 1)(this->rng);
		}
		this->append(Opcode::BURST_PHASE, _source, phase);
	}
}

}  // namespace nettest
