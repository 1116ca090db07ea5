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

#pragma once

// Errors - Exceptions and runtime faults
#include "errors/Errors.hh"

// Counter - Hardware and software counters of the traffic interpreters
#include "counter/Counter.hh"

// Config - Option registry, hierarchical resolution and experiment files
#include "config/CLIManager.hh"
#include "config/ExperimentLoader.hh"
#include "config/Option.hh"
#include "config/OptionResolver.hh"

// Experiment - Entities, flows and phases
#include "experiment/Entity.hh"
#include "experiment/Experiment.hh"
#include "experiment/ExperimentRunner.hh"
#include "experiment/Flow.hh"
#include "experiment/OptionAccessor.hh"
#include "experiment/Phase.hh"
#include "experiment/RecordList.hh"

// Compiler - Interpreter programs
#include "compiler/Commands.hh"
#include "compiler/Compiler.hh"
#include "compiler/RouterTimeout.hh"

// Results - Decoding and tables
#include "results/ResultTable.hh"
#include "results/Results.hh"

// External - Machine-facing interfaces
#include "external/JsonPlaceAndRoute.hh"
#include "external/PlaceAndRoute.hh"
#include "external/Transport.hh"

// Utils
#include "utils/Logging.hh"
