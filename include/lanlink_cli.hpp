#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace lanlink {
namespace po = boost::program_options;

struct CliParams {
  std::string subcmd;
  std::string config_dir;
  std::string base_dir;
  std::string verbose; // trace|debug|info|warning|error
  bool log_console = false;
  std::string cert_file;
  std::string fingerprint;
  std::vector<std::string> hosts;
  int seconds = 10;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  CliParams params;

  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }
  bool wants_help() const { return vm.count("help") > 0; }
  bool wants_version() const { return vm.count("version") > 0; }
};

// Options shown by --help, bound to `params`.
po::options_description make_generic_options(CliParams &params);

// Parse argv. The first positional becomes params.subcmd. Throws
// po::error on unknown options or bad values.
CliCtx parse_command_line(int argc, const char *const argv[]);

// Subcommand list printed after the option help.
std::string subcommand_usage();

bool is_trust_subcommand(const std::string &subcmd);

} // namespace lanlink
