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
 * @brief GoogleTest suite for experiment files and command line overrides
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "config/CLIManager.hh"
#include "config/ExperimentLoader.hh"
#include "errors/Errors.hh"
#include "experiment/Experiment.hh"

// Third-Party Library
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

using namespace nettest;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

const char* kExperimentJson = R"({
	"options": { "timestep": 1e-5, "record_sent": true, "router_timeout": [480, 16], "seed": null },
	"entities": [ { "name": "a", "chip": [1, 2] }, { "name": "b", "options": { "seed": 7 } } ],
	"flows": [ { "name": "ab", "source": "a", "sinks": ["b"], "options": { "probability": 0.5 } } ],
	"phases": [
		{ "name": "idle", "labels": { "load": 0, "kind": "idle" }, "options": { "duration": 0.5 } },
		{ "name": "busy",
		  "labels": { "load": 1.0 },
		  "entity_options": { "b": { "consume_packets": "off" } },
		  "flow_options": { "ab": { "probability": 1 } } }
	]
})";

}  // namespace

class LoaderTest : public ::testing::Test {
protected:
	void SetUp() override {
		this->path = std::filesystem::temp_directory_path() /
		             ("nettest_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
		              ".json");
		std::ofstream(this->path) << kExperimentJson;
	}

	void TearDown() override { std::filesystem::remove(this->path); }

	std::filesystem::path path;
	ExperimentLoader      loader{"LoaderTest"};
};

TEST_F(LoaderTest, LoadsEverySection) {
	Experiment experiment;
	this->loader.parseConfigFiles(experiment, {this->path.string()});

	auto&       a        = experiment.getEntity("a");
	auto&       b        = experiment.getEntity("b");
	auto&       ab       = experiment.getFlow("ab");
	auto&       idle     = experiment.getPhase("idle");
	auto&       busy     = experiment.getPhase("busy");
	const auto& resolver = experiment.getResolver();

	EXPECT_EQ(a.getChipConstraint(), (ChipCoord{1, 2}));
	EXPECT_THAT(ab.getSinks(), ElementsAre(&b));

	EXPECT_EQ(asReal(resolver.get(Option::TIMESTEP)), 1e-5);
	EXPECT_TRUE(asBool(resolver.get(Option::RECORD_SENT)));
	EXPECT_EQ(std::get<RouterTimeout>(resolver.get(Option::ROUTER_TIMEOUT)), (RouterTimeout{480, 16}));
	EXPECT_TRUE(isAuto(resolver.get(Option::SEED, &idle, &a)));
	EXPECT_EQ(asInteger(resolver.get(Option::SEED, &idle, &b)), 7);

	EXPECT_EQ(asReal(resolver.get(Option::DURATION, &idle)), 0.5);
	EXPECT_EQ(asReal(resolver.get(Option::DURATION, &busy)), 1.0);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &idle, &ab)), 0.5);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &busy, &ab)), 1.0);
	EXPECT_FALSE(asBool(resolver.get(Option::CONSUME_PACKETS, &busy, &b)));
	EXPECT_TRUE(asBool(resolver.get(Option::CONSUME_PACKETS, &idle, &b)));

	// Labels keep the order of the file
	ASSERT_EQ(idle.getLabels().size(), 2u);
	EXPECT_EQ(idle.getLabels()[0].first, "load");
	EXPECT_EQ(std::get<int64_t>(idle.getLabel("load")), 0);
	EXPECT_EQ(std::get<std::string>(idle.getLabel("kind")), "idle");
	EXPECT_EQ(std::get<double>(busy.getLabel("load")), 1.0);
}

TEST_F(LoaderTest, UnknownSectionsAndOptionsAreSkipped) {
	Experiment experiment;
	this->loader.parseConfig(
	    experiment, nlohmann::ordered_json::parse(R"({"comment": "x", "options": {"no_such_option": 1, "warmup": 0}})"),
	    "inline");
	EXPECT_EQ(asReal(experiment.getResolver().get(Option::WARMUP)), 0.0);
}

TEST_F(LoaderTest, Errors) {
	Experiment experiment;
	EXPECT_THROW(this->loader.parseConfigFiles(experiment, {"/nonexistent/experiment.json"}), std::runtime_error);

	auto parse = [this, &experiment](const std::string& _text) {
		this->loader.parseConfig(experiment, nlohmann::ordered_json::parse(_text), "inline");
	};

	try {
		parse(R"({"flows": [{"source": "ghost", "sinks": []}]})");
		FAIL() << "an unknown entity must be rejected";
	} catch (const std::invalid_argument& e) { EXPECT_THAT(e.what(), HasSubstr("inline: ")); }

	EXPECT_THROW(parse(R"({"options": {"use_payload": 0.5}})"), std::invalid_argument);
	EXPECT_THROW(parse(R"({"options": {"router_timeout": [1, 2, 3]}})"), std::invalid_argument);
	EXPECT_THROW(parse(R"({"entities": [{"name": "x", "options": {"duration": 2}}]})"), ScopeError);
	EXPECT_THROW(parse(R"([])"), std::invalid_argument);
}

TEST_F(LoaderTest, LaterFilesExtendEarlierOnes) {
	auto second = std::filesystem::temp_directory_path() / "nettest_LaterFilesExtendEarlierOnes_2.json";
	std::ofstream(second) << R"({"options": {"timestep": 2e-5}, "entities": [{"name": "c"}],
	                             "flows": [{"source": "c", "sinks": "a"}]})";

	Experiment experiment;
	this->loader.parseConfigFiles(experiment, {this->path.string(), second.string()});
	std::filesystem::remove(second);

	EXPECT_EQ(experiment.getNumEntities(), 3u);
	EXPECT_EQ(experiment.getFlows().back()->getName(), "flow1");
	EXPECT_EQ(asReal(experiment.getResolver().get(Option::TIMESTEP)), 2e-5);
}

TEST_F(LoaderTest, CommandLineOverridesFiles) {
	CLIManager cli("LoaderTest");
	cli.registerNetTestCLIArguments();
	cli.registerCLIArguments();
	cli.getCLIApp()->parse("-c " + this->path.string() +
	                       " --duration 0.25 --set probability=0.125 --set record_received=true --seed 3"
	                       " -o out compile --dump");

	EXPECT_EQ(cli.getCommand(), CLIManager::Command::COMPILE);
	EXPECT_TRUE(cli.isDump());
	EXPECT_EQ(cli.getOutputPath(), "out");
	EXPECT_THAT(cli.getConfigFilePaths(), ElementsAre(this->path.string()));

	Experiment experiment;
	cli.loadExperiment(experiment);
	const auto& resolver = experiment.getResolver();
	auto&       idle     = experiment.getPhase("idle");
	auto&       ab       = experiment.getFlow("ab");

	// Global values are replaced, phase and flow exceptions still win
	EXPECT_EQ(asReal(resolver.get(Option::DURATION)), 0.25);
	EXPECT_EQ(asReal(resolver.get(Option::DURATION, &idle)), 0.5);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY)), 0.125);
	EXPECT_EQ(asReal(resolver.get(Option::PROBABILITY, &idle, &ab)), 0.5);
	EXPECT_TRUE(asBool(resolver.get(Option::RECORD_RECEIVED)));
	EXPECT_EQ(asInteger(resolver.get(Option::SEED)), 3);
}

TEST_F(LoaderTest, DecodeCommand) {
	CLIManager cli("LoaderTest");
	cli.registerNetTestCLIArguments();
	cli.registerCLIArguments();
	cli.getCLIApp()->parse("decode -r results -t totals -t flow_totals --na n/a");

	EXPECT_EQ(cli.getCommand(), CLIManager::Command::DECODE);
	EXPECT_EQ(cli.getResultsPath(), "results");
	EXPECT_THAT(cli.getTables(), ElementsAre("totals", "flow_totals"));
	EXPECT_EQ(cli.getNA(), "n/a");
}

TEST_F(LoaderTest, InvalidCommandLines) {
	{
		CLIManager cli("LoaderTest");
		cli.registerNetTestCLIArguments();
		EXPECT_THROW(cli.getCLIApp()->parse("--set probability compile"), CLI::ParseError);
	}
	{
		CLIManager cli("LoaderTest");
		cli.registerNetTestCLIArguments();
		EXPECT_THROW(cli.getCLIApp()->parse("decode -r results -t bogus"), CLI::ParseError);
	}
	{
		CLIManager cli("LoaderTest");
		cli.registerNetTestCLIArguments();
		cli.getCLIApp()->parse("--set no_such_option=1 compile");

		Experiment experiment;
		EXPECT_THROW(cli.loadExperiment(experiment), std::invalid_argument);
	}
}

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
