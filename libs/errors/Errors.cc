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

#include "errors/Errors.hh"

#include <array>
#include <sstream>
#include <utility>

namespace nettest {

namespace {

const std::array<std::pair<RuntimeFault, const char*>, 7> kFaultNames = {{
    {RuntimeFault::STILL_RUNNING, "NT_ERR_STILL_RUNNING"},
    {RuntimeFault::MALLOC, "NT_ERR_MALLOC"},
    {RuntimeFault::DMA, "NT_ERR_DMA"},
    {RuntimeFault::UNKNOWN_COMMAND, "NT_ERR_UNKNOWN_COMMAND"},
    {RuntimeFault::BAD_ARGUMENTS, "NT_ERR_BAD_ARGUMENTS"},
    {RuntimeFault::DEADLINE_MISSED, "NT_ERR_DEADLINE_MISSED"},
    {RuntimeFault::MOST_DEADLINES_MISSED, "NT_ERR_MOST_DEADLINES_MISSED"},
}};

}  // namespace

std::string getFaultName(RuntimeFault _fault) {
	for (const auto& [fault, name] : kFaultNames) {
		if (fault == _fault) return name;
	}
	return "NT_ERR_UNKNOWN";
}

RuntimeFaultSet faultsFromBits(uint32_t _bits) {
	if (_bits & ~kKnownFaultMask) {
		std::stringstream ss;
		ss << "Unrecognised fault bits 0x" << std::hex << (_bits & ~kKnownFaultMask) << " in error word 0x" << _bits;
		throw std::invalid_argument(ss.str());
	}

	RuntimeFaultSet faults;
	for (const auto& [fault, name] : kFaultNames) {
		if (_bits & static_cast<uint32_t>(fault)) faults.insert(fault);
	}
	return faults;
}

uint32_t faultsToBits(const RuntimeFaultSet& _faults) {
	uint32_t bits = 0;
	for (auto fault : _faults) bits |= static_cast<uint32_t>(fault);
	return bits;
}

RunFailure::RunFailure(std::shared_ptr<const Results> _results, const RuntimeFaultSet& _faults)
    : NetTestError(RunFailure::describe(_faults)), results(std::move(_results)), faults(_faults) {}

std::string RunFailure::describe(const RuntimeFaultSet& _faults) {
	std::stringstream ss;
	if (_faults.size() == 1) {
		ss << "The experiment reported an error: " << getFaultName(*_faults.begin());
	} else {
		ss << "The experiment reported " << _faults.size() << " errors: ";
		bool first = true;
		for (auto fault : _faults) {
			ss << (first ? "" : ", ") << getFaultName(fault);
			first = false;
		}
	}
	return ss.str();
}

}  // namespace nettest
