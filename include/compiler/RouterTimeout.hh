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
 * @file RouterTimeout.hh
 * @brief Floating point encoding of router wait times
 *
 * Each wait time is stored in one byte, mantissa in bits 0-3 and exponent in
 * bits 4-7:
 *
 * | Exponent | Wait time                  |
 * |----------|----------------------------|
 * | E <= 4   | (M + 16 - 2^(4 - E)) * 2^E |
 * | E > 4    | (M + 16) * 2^E             |
 *
 * All 256 codes decode to distinct, strictly increasing values, so only those
 * values can be encoded.
 */

#pragma once

#include <cstdint>

#include "config/Option.hh"

namespace nettest {

uint32_t decodeWaitTime(uint8_t _code);

/// @throws CompileError naming the nearest supported value if the wait time has no code
uint8_t encodeWaitTime(uint32_t _waitTime);

/// @brief Operand of the ROUTER_TIMEOUT instruction: wait1 in bits 16-23, wait2 in bits 24-31
uint32_t encodeRouterTimeout(const RouterTimeout& _timeout);

RouterTimeout decodeRouterTimeout(uint32_t _operand);

}  // namespace nettest
