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

#include "compiler/RouterTimeout.hh"

#include <algorithm>
#include <array>

#include "errors/Errors.hh"

namespace nettest {

namespace {

const std::array<uint32_t, 256>& getWaitTimeTable() {
	static const std::array<uint32_t, 256> table = [] {
		std::array<uint32_t, 256> values{};
		for (uint32_t code = 0; code < 256; ++code) {
			uint32_t mantissa = code & 0xF;
			uint32_t exponent = (code >> 4) & 0xF;
			values[code]      = exponent <= 4 ? (mantissa + 16 - (1u << (4 - exponent))) << exponent
			                                  : (mantissa + 16) << exponent;
		}
		return values;
	}();
	return table;
}

}  // namespace

uint32_t decodeWaitTime(uint8_t _code) { return getWaitTimeTable()[_code]; }

uint8_t encodeWaitTime(uint32_t _waitTime) {
	const auto& table = getWaitTimeTable();

	auto iter = std::lower_bound(table.begin(), table.end(), _waitTime);
	if (iter != table.end() && *iter == _waitTime) return static_cast<uint8_t>(iter - table.begin());

	uint32_t nearest;
	if (iter == table.end()) {
		nearest = table.back();
	} else if (iter == table.begin()) {
		nearest = table.front();
	} else {
		uint32_t above = *iter;
		uint32_t below = *(iter - 1);
		nearest        = (_waitTime - below) <= (above - _waitTime) ? below : above;
	}
	throw CompileError("Router wait time " + std::to_string(_waitTime) +
	                   " can not be encoded, the nearest supported value is " + std::to_string(nearest));
}

uint32_t encodeRouterTimeout(const RouterTimeout& _timeout) {
	return (static_cast<uint32_t>(encodeWaitTime(_timeout.wait1)) << 16) |
	       (static_cast<uint32_t>(encodeWaitTime(_timeout.wait2)) << 24);
}

RouterTimeout decodeRouterTimeout(uint32_t _operand) {
	return RouterTimeout{decodeWaitTime(static_cast<uint8_t>(_operand >> 16)),
	                     decodeWaitTime(static_cast<uint8_t>(_operand >> 24))};
}

}  // namespace nettest
