/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <fstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "testutil/prepare_loggers.hpp"

using beacon::ChainConfig;
using beacon::app::Configurator;
using testing::ElementsAre;

namespace fs = std::filesystem;

class ConfiguratorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    dir = fs::temp_directory_path()
        / ("beacon_configurator_"
           + std::string{testing::UnitTest::GetInstance()
                             ->current_test_info()
                             ->name()});
    fs::remove_all(dir);
    fs::create_directories(dir / "committees");
    write(dir / "validators.json", R"({"data": []})");
    write(dir / "block.json", "{}");
    base_path = "--base-path=" + dir.string();
  }

  void TearDown() override {
    fs::remove_all(dir);
  }

  void write(const fs::path &path, std::string_view content) {
    std::ofstream out{path};
    out << content;
  }

  outcome::result<std::shared_ptr<beacon::app::Configuration>> configure(
      std::vector<const char *> args) {
    args.insert(args.begin(), "beacon_committees");
    Configurator configurator(static_cast<int>(args.size()), args.data());
    OUTCOME_TRY(done, configurator.step1());
    EXPECT_FALSE(done);
    OUTCOME_TRY(configurator.step2());
    return configurator.calculateConfig(
        testutil::prepareLoggers()->getLogger("Configurator", "configurator"));
  }

  fs::path dir;
  std::string base_path;
};

TEST_F(ConfiguratorTest, HelpStopsEarly) {
  const char *argv[] = {"beacon_committees", "--help"};
  Configurator configurator(2, argv);
  ASSERT_OUTCOME_SUCCESS(done, configurator.step1());
  EXPECT_TRUE(done);
}

TEST_F(ConfiguratorTest, FromCommandLine) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({base_path.c_str(),
                                    "--validators=validators.json",
                                    "--committees=committees",
                                    "--block=block.json",
                                    "--epoch-start=10",
                                    "--epoch-catchup=12",
                                    "--threads=4",
                                    "--preset=minimal",
                                    "--shuffle-round-count=20"}));
  EXPECT_EQ(config->validatorsFile(), dir / "validators.json");
  EXPECT_EQ(config->committeesPath(), dir / "committees");
  EXPECT_THAT(config->blockFiles(), ElementsAre(dir / "block.json"));
  EXPECT_FALSE(config->randaoMixHex().has_value());
  EXPECT_EQ(config->epochStart(), 10);
  EXPECT_EQ(config->epochCatchup(), 12);
  EXPECT_EQ(config->threads(), 4);

  auto expected_chain = ChainConfig::minimal();
  expected_chain.shuffle_round_count = 20;
  EXPECT_EQ(config->chain(), expected_chain);
}

TEST_F(ConfiguratorTest, DefaultsToMainnetAndSingleEpoch) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({base_path.c_str(),
                                    "--validators=validators.json",
                                    "--committees=committees",
                                    "--epoch-start=7"}));
  EXPECT_EQ(config->epochCatchup(), 7);
  EXPECT_EQ(config->threads(), 1);
  EXPECT_EQ(config->chain(), ChainConfig::mainnet());
  EXPECT_TRUE(config->blockFiles().empty());
}

TEST_F(ConfiguratorTest, CommandLineOverridesConfigFile) {
  write(dir / "config.yaml", R"(
general:
  validators: validators.json
  committees: committees
  blocks:
    - block.json
  randao-mix: "0x1111111111111111111111111111111111111111111111111111111111111111"
  epoch-start: 3
  epoch-catchup: 5
chain:
  preset: minimal
  slots-per-epoch: 4
)");
  auto config_arg = "--config=" + (dir / "config.yaml").string();
  ASSERT_OUTCOME_SUCCESS(
      config,
      configure({base_path.c_str(), config_arg.c_str(), "--epoch-catchup=9"}));
  EXPECT_EQ(config->validatorsFile(), dir / "validators.json");
  EXPECT_THAT(config->blockFiles(), ElementsAre(dir / "block.json"));
  EXPECT_EQ(config->randaoMixHex(),
            "0x1111111111111111111111111111111111111111111111111111111111111111");
  EXPECT_EQ(config->epochStart(), 3);
  EXPECT_EQ(config->epochCatchup(), 9);
  EXPECT_EQ(config->chain().slots_per_epoch, 4);
  EXPECT_EQ(config->chain().target_committee_size, 4);
}

/**
 * @given a config file with several malformed values in one section
 * @when calculating the configuration
 * @then each malformed value is listed, not only the first one
 */
TEST_F(ConfiguratorTest, ReportsEveryMalformedConfigValue) {
  write(dir / "config.yaml", R"(
general:
  validators: validators.json
  epoch-start: [1, 2]
  committees: committees
  threads: many
)");
  auto config_arg = "--config=" + (dir / "config.yaml").string();
  std::vector<const char *> args{
      "beacon_committees", base_path.c_str(), config_arg.c_str()};
  Configurator configurator(static_cast<int>(args.size()), args.data());
  ASSERT_OUTCOME_SUCCESS(help, configurator.step1());
  EXPECT_FALSE(help);
  EXPECT_OUTCOME_SUCCESS(configurator.step2());

  auto res = configurator.calculateConfig(
      testutil::prepareLoggers()->getLogger("Configurator", "configurator"));
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::ConfigFileParseFailed);
  EXPECT_THAT(configurator.configFileProblems(),
              ElementsAre("Value 'general.epoch-start' must be scalar",
                          "Value 'general.threads' has wrong type"));
}

TEST_F(ConfiguratorTest, RejectsMissingInputs) {
  auto res = configure({base_path.c_str(), "--epoch-start=1"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::InvalidValue);

  EXPECT_OUTCOME_ERROR(configure({base_path.c_str(),
                                  "--validators=absent.json",
                                  "--committees=committees",
                                  "--epoch-start=1"}));
}

TEST_F(ConfiguratorTest, RejectsBackwardEpochRange) {
  auto res = configure({base_path.c_str(),
                        "--validators=validators.json",
                        "--committees=committees",
                        "--epoch-start=10",
                        "--epoch-catchup=9"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::InvalidValue);
}

TEST_F(ConfiguratorTest, RejectsInvalidChain) {
  EXPECT_OUTCOME_ERROR(configure({base_path.c_str(),
                                  "--validators=validators.json",
                                  "--committees=committees",
                                  "--epoch-start=1",
                                  "--preset=testnet"}));
  EXPECT_OUTCOME_ERROR(configure({base_path.c_str(),
                                  "--validators=validators.json",
                                  "--committees=committees",
                                  "--epoch-start=1",
                                  "--shuffle-round-count=300"}));
}

TEST_F(ConfiguratorTest, RejectsMalformedRandaoMix) {
  EXPECT_OUTCOME_ERROR(configure({base_path.c_str(),
                                  "--validators=validators.json",
                                  "--committees=committees",
                                  "--epoch-start=1",
                                  "--randao-mix=0x1234"}));
}

TEST_F(ConfiguratorTest, RejectsUnknownOption) {
  auto res = configure({base_path.c_str(), "--frobnicate"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::CliArgsParseFailed);
}

TEST_F(ConfiguratorTest, DefaultLoggingConfig) {
  const char *argv[] = {"beacon_committees"};
  Configurator configurator(1, argv);
  ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
  ASSERT_TRUE(logging["groups"].IsSequence());
  EXPECT_EQ(logging["groups"][0]["name"].as<std::string>(), "main");
  EXPECT_EQ(logging["groups"][0]["children"][0]["name"].as<std::string>(),
            "beacon");
}
