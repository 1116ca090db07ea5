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
 * @file Errors.hh
 * @brief Exception taxonomy and the device fault flags reported in result buffers
 *
 * | Exception     | Raised when                                                           |
 * |---------------|-----------------------------------------------------------------------|
 * | ScopeError    | an exception value is set outside the scopes an option supports      |
 * | CompileError  | a value can not be represented in the instruction stream              |
 * | NestingError  | a phase is opened while another phase is still being defined          |
 * | RunFailure    | the decoded result buffers report one or more RuntimeFault flags      |
 *
 * Configuration and compile errors are raised before anything is sent to the
 * remote interpreters. RunFailure always carries the complete decoded results.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

namespace nettest {

class Results;

class NetTestError : public std::runtime_error {
public:
	explicit NetTestError(const std::string& _what) : std::runtime_error(_what) {}
};

class ScopeError : public NetTestError {
public:
	explicit ScopeError(const std::string& _what) : NetTestError(_what) {}
};

class CompileError : public NetTestError {
public:
	explicit CompileError(const std::string& _what) : NetTestError(_what) {}
};

class NestingError : public NetTestError {
public:
	explicit NestingError(const std::string& _what) : NetTestError(_what) {}
};

/**
 * @brief Fault flags reported by the remote interpreter in the first word of its result buffer
 */
enum class RuntimeFault : uint32_t {
	STILL_RUNNING         = 1u << 0,
	MALLOC                = 1u << 1,
	DMA                   = 1u << 2,
	UNKNOWN_COMMAND       = 1u << 3,
	BAD_ARGUMENTS         = 1u << 4,
	DEADLINE_MISSED       = 1u << 5,
	MOST_DEADLINES_MISSED = 1u << 6,
};

using RuntimeFaultSet = std::set<RuntimeFault>;

/// @brief Mask of every bit with a RuntimeFault meaning
constexpr uint32_t kKnownFaultMask = 0x7Fu;

/// @brief e.g. "NT_ERR_DEADLINE_MISSED"
std::string getFaultName(RuntimeFault _fault);

/**
 * @brief Convert an error word into the set of faults it flags
 * @throws std::invalid_argument if bits outside kKnownFaultMask are set
 */
RuntimeFaultSet faultsFromBits(uint32_t _bits);

uint32_t faultsToBits(const RuntimeFaultSet& _faults);

/**
 * @brief Raised when a run completed but the interpreters reported faults
 *
 * The decoded results stay accessible through getResults() so that a failed
 * experiment can still be analysed.
 */
class RunFailure : public NetTestError {
public:
	RunFailure(std::shared_ptr<const Results> _results, const RuntimeFaultSet& _faults);

	const std::shared_ptr<const Results>& getResults() const { return this->results; }
	const RuntimeFaultSet&                getFaults() const { return this->faults; }

private:
	static std::string describe(const RuntimeFaultSet& _faults);

	std::shared_ptr<const Results> results;
	RuntimeFaultSet                faults;
};

}  // namespace nettest
