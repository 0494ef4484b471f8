/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <qtils/final_action.hpp>
#include <qtils/read_file.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "blockchain/light_state_factory.hpp"
#include "log/logger.hpp"
#include "serde/beacon_api.hpp"
#include "verification/election_verifier.hpp"
#include "verification/impl/file_committee_source.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using beacon::app::Configuration;
  using beacon::log::LoggingSystem;

  outcome::result<beacon::LightState> load_state(
      const std::shared_ptr<LoggingSystem> &logsys,
      const Configuration &appcfg) {
    auto logger = logsys->getLogger("Loader", "loader");
    auto &chain = appcfg.chain();

    OUTCOME_TRY(validators_json, qtils::readText(appcfg.validatorsFile()));
    OUTCOME_TRY(validators, beacon::serde::decodeValidators(validators_json));
    SL_INFO(logger,
            "Loaded {} validators from {}",
            validators.size(),
            appcfg.validatorsFile().c_str());

    std::vector<beacon::LightBlock> blocks;
    for (auto &block_file : appcfg.blockFiles()) {
      OUTCOME_TRY(block_json, qtils::readText(block_file));
      OUTCOME_TRY(block, beacon::serde::decodeBlock(block_json));
      SL_VERBOSE(logger,
                 "Loaded block {} at slot {} from {}",
                 block.block_number,
                 block.slot,
                 block_file.c_str());
      blocks.emplace_back(block);
    }

    std::optional<beacon::Hash256> start_mix;
    if (auto &hex = appcfg.randaoMixHex(); hex.has_value()) {
      OUTCOME_TRY(mix, beacon::Hash256::fromHexWithPrefix(hex.value()));
      start_mix = mix;
    }

    OUTCOME_TRY(slot, beacon::firstSlotOfEpoch(appcfg.epochStart(), chain));
    beacon::LightStateFactory factory{logsys, chain};
    return factory.create(slot, std::move(validators), blocks, start_mix);
  }

  int run_elections(std::shared_ptr<LoggingSystem> logsys,
                    std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", beacon::log::defaultGroupName);
    SL_INFO(logger,
            "Elections {} started. Version: {}",
            appcfg->name(),
            appcfg->version());

    auto state_res = load_state(logsys, *appcfg);
    if (state_res.has_error()) {
      SL_CRITICAL(logger, "Failed to load inputs: {}", state_res.error());
      return EXIT_FAILURE;
    }

    auto source = std::make_shared<beacon::verification::FileCommitteeSource>(
        logsys, appcfg->committeesPath(), appcfg->chain());
    beacon::verification::ElectionVerifier verifier{
        logsys, source, appcfg->chain(), appcfg->threads()};

    auto reports_res = verifier.runElections(
        state_res.value(), appcfg->epochStart(), appcfg->epochCatchup());
    if (reports_res.has_error()) {
      SL_CRITICAL(logger, "Elections aborted: {}", reports_res.error());
      return EXIT_FAILURE;
    }

    size_t failed = 0;
    for (auto &report : reports_res.value()) {
      if (not report.passed) {
        ++failed;
        SL_ERROR(logger,
                 "Epoch {}: committees differ from position {}",
                 report.epoch,
                 report.first_difference.value_or(0));
      }
    }
    SL_INFO(logger,
            "Elections finished: {} of {} epochs mismatched",
            failed,
            reports_res.value().size());
    logger->flush();

    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("beacon");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<beacon::app::Configurator>(argc, argv);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "configurator");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      for (auto &problem : app_configurator->configFileProblems()) {
        fmt::println(std::cerr, "  {}", problem);
      }
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  return run_elections(logging_system, app_configuration);
}
