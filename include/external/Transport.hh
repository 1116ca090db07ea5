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
 * @file Transport.hh
 * @brief Interface to the collaborator moving programs and results to and from the mesh
 *
 * All calls block. Errors (timeouts, communication failures) are raised by the
 * implementation and are passed through by NetTest without retrying.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "external/PlaceAndRoute.hh"

namespace nettest {

using BufferHandle = uint64_t;

enum class ExecutionState { SYNC0, SYNC1, EXIT };

enum class Signal { SYNC0, SYNC1 };

class Transport {
public:
	virtual ~Transport() = default;

	/// @brief Reserve remote memory next to the entity's cores
	virtual BufferHandle allocateBuffer(size_t _size, const Placement& _placement) = 0;

	virtual void write(BufferHandle _handle, const std::vector<uint8_t>& _data) = 0;

	/// @brief Start the interpreter on every entity, each reading its program from the given buffer
	virtual void launch(const std::map<const Entity*, BufferHandle>& _buffers, const PlacementMap& _placements) = 0;

	/// @brief Block until every entity listed has reached the state
	virtual void waitForState(const std::vector<const Entity*>& _entities, ExecutionState _state) = 0;

	virtual void sendSignal(Signal _signal) = 0;

	virtual std::vector<uint8_t> read(BufferHandle _handle, size_t _size) = 0;
};

}  // namespace nettest
