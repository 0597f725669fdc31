#include "lanlink_cli.hpp"

#include <sstream>

namespace lanlink {

po::options_description make_generic_options(CliParams &params) {
  po::options_description generic_desc(
      "lanlinkd: LAN discovery and peer trust tool");
  generic_desc.add_options() //
      ("config-dir,c", po::value<std::string>(&params.config_dir),
       "configuration directory holding application.json.") //
      ("base-dir", po::value<std::string>(&params.base_dir),
       "directory holding .known-clients and .discovered.") //
      ("verbose", po::value<std::string>(&params.verbose),
       "log level: trace, debug, info, warning, error.") //
      ("log-console", po::bool_switch(&params.log_console)->default_value(false),
       "also write log records to stderr.") //
      ("cert", po::value<std::string>(&params.cert_file),
       "PEM certificate identifying this node.") //
      ("fingerprint", po::value<std::string>(&params.fingerprint),
       "fingerprint for trust, untrust and edit-hosts.") //
      ("host",
       po::value<std::vector<std::string>>(&params.hosts)
           ->multitoken()
           ->composing(),
       "DNS name to pin; repeatable.") //
      ("seconds", po::value<int>(&params.seconds)->default_value(10),
       "how long discover and scan run.") //
      ("version,v", "Print version") //
      ("help,h", "Print help");
  return generic_desc;
}

CliCtx parse_command_line(int argc, const char *const argv[]) {
  CliCtx ctx;
  po::options_description generic_desc = make_generic_options(ctx.params);

  po::options_description hidden_desc("Hidden options");
  hidden_desc.add_options() //
      ("positionals",
       po::value<std::vector<std::string>>(&ctx.positionals)->composing(),
       "all positional arguments");

  po::options_description cmdline_options("Allowed options");
  cmdline_options.add(generic_desc).add(hidden_desc);

  po::positional_options_description p;
  p.add("positionals", -1);

  po::parsed_options parsed = po::command_line_parser(argc, argv)
                                  .options(cmdline_options)
                                  .positional(p)
                                  .run();
  po::store(parsed, ctx.vm);
  po::notify(ctx.vm);

  if (!ctx.positionals.empty()) {
    ctx.params.subcmd = ctx.positionals.front();
  }
  return ctx;
}

std::string subcommand_usage() {
  std::ostringstream oss;
  oss << "Subcommands:\n"
      << "  fingerprint    Print the fingerprint of --cert.\n"
      << "  trust          Pin --fingerprint to every --host.\n"
      << "  untrust        Forget every host pinned to --fingerprint.\n"
      << "  edit-hosts     Replace the hosts pinned to --fingerprint.\n"
      << "  list-trusted   Show pinned fingerprints and hosts.\n"
      << "  verify         Check the PEM chain in --cert for one --host.\n"
      << "  discover       Announce and listen for --seconds, then print the "
         "stored devices.\n"
      << "  scan           Broadcast for --seconds and print each discovery "
         "event.\n";
  return oss.str();
}

bool is_trust_subcommand(const std::string &subcmd) {
  return subcmd == "trust" || subcmd == "untrust" || subcmd == "edit-hosts" ||
         subcmd == "list-trusted";
}

} // namespace lanlink
