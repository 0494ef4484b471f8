/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "crypto/hash_types.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon::app, Configurator::Error, e) {
  using E = beacon::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown app::Configurator::Error";
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  /**
   * Reads scalar `key` of a yaml section into `out`, recording a problem
   * into `errors` when the node has the wrong shape.
   */
  template <typename T>
  bool read_scalar(const YAML::Node &section,
                   std::string_view section_name,
                   const char *key,
                   std::optional<T> &out,
                   std::ostream &errors) {
    auto node = section[key];
    if (not node.IsDefined()) {
      return true;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << "." << key
             << "' must be scalar\n";
      return false;
    }
    try {
      out = node.as<T>();
    } catch (const YAML::Exception &) {
      errors << "E: Value '" << section_name << "." << key
             << "' has wrong type\n";
      return false;
    }
    return true;
  }

}  // namespace

namespace beacon::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "beacon-committees";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of the run.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lelection=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description input_options("Input options");
    input_options.add_options()
        ("validators", po::value<std::string>(), "Path to beacon-API validators response (JSON).")
        ("committees", po::value<std::string>(), "Path to beacon-API committees response (JSON), or a directory of <epoch>.json files.")
        ("block", po::value<std::vector<std::string>>()->composing(), "Path to beacon-API block response (JSON) providing prev_randao. May be repeated.")
        ("randao-mix", po::value<std::string>(), "0x-prefixed RANDAO mix feeding the seed of the start epoch.")
        ;

    po::options_description election_options("Election options");
    election_options.add_options()
        ("epoch-start", po::value<Epoch>(), "First epoch to verify.")
        ("epoch-catchup", po::value<Epoch>(), "Last epoch to verify. Default: the start epoch.")
        ("threads", po::value<size_t>(), "Number of workers materialising committees.")
        ;

    po::options_description chain_options("Chain options");
    chain_options.add_options()
        ("preset", po::value<std::string>(), "Chain constants preset: mainnet or minimal.")
        ("slots-per-epoch", po::value<uint64_t>(), "Override SLOTS_PER_EPOCH.")
        ("target-committee-size", po::value<uint64_t>(), "Override TARGET_COMMITTEE_SIZE.")
        ("max-committees-per-slot", po::value<uint64_t>(), "Override MAX_COMMITTEES_PER_SLOT.")
        ("epochs-per-historical-vector", po::value<uint64_t>(), "Override EPOCHS_PER_HISTORICAL_VECTOR.")
        ("min-seed-lookahead", po::value<uint64_t>(), "Override MIN_SEED_LOOKAHEAD.")
        ("shuffle-round-count", po::value<uint64_t>(), "Override SHUFFLE_ROUND_COUNT.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(input_options)
        .add(election_options)
        .add(chain_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Beacon committees version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Beacon committees version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: beacon
        children:
          - name: election
          - name: loader
          - name: configurator
          - name: profiling
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  std::vector<std::string> Configurator::getLoggingCliArgs() const {
    if (auto it = cli_values_map_.find("log"); it != cli_values_map_.end()) {
      return it->second.as<std::vector<std::string>>();
    }
    return {};
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initChainConfig());

    return config_;
  }

  std::vector<std::string> Configurator::configFileProblems() const {
    std::vector<std::string> problems;
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      problems.emplace_back(std::string_view(line).substr(3));
    }
    return problems;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    for (auto &problem : configFileProblems()) {
      SL_ERROR(logger_, "  {}", problem);
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    std::optional<std::string> name;
    std::optional<std::string> base_path;
    std::optional<std::string> validators;
    std::optional<std::string> committees;
    std::optional<std::string> randao_mix;
    std::optional<Epoch> epoch_start;
    std::optional<Epoch> epoch_catchup;
    std::optional<size_t> threads;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto read = [&](const char *key, auto &out) {
            if (not read_scalar(section, "general", key, out, file_errors_)) {
              file_has_error_ = true;
            }
          };
          read("name", name);
          read("base-path", base_path);
          read("validators", validators);
          read("committees", committees);
          read("randao-mix", randao_mix);
          read("epoch-start", epoch_start);
          read("epoch-catchup", epoch_catchup);
          read("threads", threads);
          auto blocks = section["blocks"];
          if (blocks.IsDefined()) {
            if (blocks.IsSequence()) {
              for (auto &&block : blocks) {
                if (not block.IsScalar()) {
                  file_errors_
                      << "E: Items of 'general.blocks' must be scalar\n";
                  file_has_error_ = true;
                  break;
                }
                config_->block_files_.emplace_back(block.as<std::string>());
              }
            } else {
              file_errors_ << "E: Value 'general.blocks' must be sequence\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          name = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          base_path = value;
        });
    find_argument<std::string>(
        cli_values_map_, "validators", [&](const std::string &value) {
          validators = value;
        });
    find_argument<std::string>(
        cli_values_map_, "committees", [&](const std::string &value) {
          committees = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_, "block", [&](const std::vector<std::string> &value) {
          config_->block_files_.assign(value.begin(), value.end());
        });
    find_argument<std::string>(
        cli_values_map_, "randao-mix", [&](const std::string &value) {
          randao_mix = value;
        });
    find_argument<Epoch>(cli_values_map_, "epoch-start", [&](Epoch value) {
      epoch_start = value;
    });
    find_argument<Epoch>(cli_values_map_, "epoch-catchup", [&](Epoch value) {
      epoch_catchup = value;
    });
    find_argument<size_t>(cli_values_map_, "threads", [&](size_t value) {
      threads = value;
    });

    if (name.has_value()) {
      config_->name_ = *name;
    }
    config_->base_path_ = base_path.has_value()
                            ? std::filesystem::path{*base_path}
                            : std::filesystem::current_path();
    if (randao_mix.has_value()) {
      boost::trim(*randao_mix);
      if (not randao_mix->empty()) {
        config_->randao_mix_hex_ = *randao_mix;
      }
    }

    // Check values
    if (not config_->base_path_.is_absolute()) {
      SL_ERROR(logger_,
               "The 'base_path' must be defined as absolute: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(
          path.is_absolute() ? path : (config_->base_path_ / path));
    };

    if (not validators.has_value()) {
      SL_ERROR(logger_, "The 'validators' file must be provided");
      return Error::InvalidValue;
    }
    config_->validators_file_ = make_absolute(*validators);
    if (not is_regular_file(config_->validators_file_)) {
      SL_ERROR(logger_,
               "The 'validators' file does not exist or is not a file: {}",
               config_->validators_file_.c_str());
      return Error::InvalidValue;
    }

    if (not committees.has_value()) {
      SL_ERROR(logger_, "The 'committees' path must be provided");
      return Error::InvalidValue;
    }
    config_->committees_path_ = make_absolute(*committees);
    if (not exists(config_->committees_path_)) {
      SL_ERROR(logger_,
               "The 'committees' path does not exist: {}",
               config_->committees_path_.c_str());
      return Error::InvalidValue;
    }

    for (auto &block_file : config_->block_files_) {
      block_file = make_absolute(block_file);
      if (not is_regular_file(block_file)) {
        SL_ERROR(logger_,
                 "The 'block' file does not exist or is not a file: {}",
                 block_file.c_str());
        return Error::InvalidValue;
      }
    }

    if (config_->randao_mix_hex_.has_value()) {
      if (Hash256::fromHexWithPrefix(*config_->randao_mix_hex_).has_error()) {
        SL_ERROR(logger_,
                 "The 'randao-mix' must be 0x-prefixed 32-byte hex: {}",
                 *config_->randao_mix_hex_);
        return Error::InvalidValue;
      }
    }

    if (not epoch_start.has_value()) {
      SL_ERROR(logger_, "The 'epoch-start' must be provided");
      return Error::InvalidValue;
    }
    config_->epoch_start_ = *epoch_start;
    config_->epoch_catchup_ = epoch_catchup.value_or(*epoch_start);
    if (config_->epoch_catchup_ < config_->epoch_start_) {
      SL_ERROR(logger_,
               "The 'epoch-catchup' ({}) must not precede 'epoch-start' ({})",
               config_->epoch_catchup_,
               config_->epoch_start_);
      return Error::InvalidValue;
    }

    if (threads.has_value()) {
      if (*threads == 0) {
        SL_ERROR(logger_, "The 'threads' must be positive");
        return Error::InvalidValue;
      }
      config_->threads_ = *threads;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initChainConfig() {
    std::optional<std::string> preset;
    std::optional<uint64_t> slots_per_epoch;
    std::optional<uint64_t> target_committee_size;
    std::optional<uint64_t> max_committees_per_slot;
    std::optional<uint64_t> epochs_per_historical_vector;
    std::optional<uint64_t> min_seed_lookahead;
    std::optional<uint64_t> shuffle_round_count;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["chain"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto read = [&](const char *key, auto &out) {
            if (not read_scalar(section, "chain", key, out, file_errors_)) {
              file_has_error_ = true;
            }
          };
          read("preset", preset);
          read("slots-per-epoch", slots_per_epoch);
          read("target-committee-size", target_committee_size);
          read("max-committees-per-slot", max_committees_per_slot);
          read("epochs-per-historical-vector", epochs_per_historical_vector);
          read("min-seed-lookahead", min_seed_lookahead);
          read("shuffle-round-count", shuffle_round_count);
        } else {
          file_errors_ << "E: Section 'chain' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "preset", [&](const std::string &value) {
          preset = value;
        });
    auto override_by_cli = [&](const char *name,
                               std::optional<uint64_t> &value) {
      find_argument<uint64_t>(
          cli_values_map_, name, [&](uint64_t cli_value) {
            value = cli_value;
          });
    };
    override_by_cli("slots-per-epoch", slots_per_epoch);
    override_by_cli("target-committee-size", target_committee_size);
    override_by_cli("max-committees-per-slot", max_committees_per_slot);
    override_by_cli("epochs-per-historical-vector",
                    epochs_per_historical_vector);
    override_by_cli("min-seed-lookahead", min_seed_lookahead);
    override_by_cli("shuffle-round-count", shuffle_round_count);

    auto chain_res = ChainConfig::preset(preset.value_or("mainnet"));
    if (chain_res.has_error()) {
      SL_ERROR(logger_,
               "The 'preset' is not valid: {}",
               preset.value_or("mainnet"));
      return Error::InvalidValue;
    }
    auto &chain = chain_res.value();
    chain.slots_per_epoch = slots_per_epoch.value_or(chain.slots_per_epoch);
    chain.target_committee_size =
        target_committee_size.value_or(chain.target_committee_size);
    chain.max_committees_per_slot =
        max_committees_per_slot.value_or(chain.max_committees_per_slot);
    chain.epochs_per_historical_vector =
        epochs_per_historical_vector.value_or(
            chain.epochs_per_historical_vector);
    chain.min_seed_lookahead =
        min_seed_lookahead.value_or(chain.min_seed_lookahead);
    chain.shuffle_round_count =
        shuffle_round_count.value_or(chain.shuffle_round_count);

    if (auto res = chain.validate(); res.has_error()) {
      SL_ERROR(logger_, "Chain constants are not valid: {}", res.error());
      return Error::InvalidValue;
    }
    config_->chain_ = chain;

    SL_DEBUG(logger_,
             "Chain constants: slots_per_epoch={}, target_committee_size={}, "
             "max_committees_per_slot={}, epochs_per_historical_vector={}, "
             "min_seed_lookahead={}, shuffle_round_count={}",
             chain.slots_per_epoch,
             chain.target_committee_size,
             chain.max_committees_per_slot,
             chain.epochs_per_historical_vector,
             chain.min_seed_lookahead,
             chain.shuffle_round_count);

    return outcome::success();
  }

}  // namespace beacon::app
