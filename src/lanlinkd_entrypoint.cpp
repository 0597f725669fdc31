#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>
#include <fmt/format.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/lanlink_config.hpp"
#include "discovery/broadcaster.hpp"
#include "discovery/device_scanner.hpp"
#include "discovery/discovery_runtime.hpp"
#include "discovery/discovery_service.hpp"
#include "io_context_manager.hpp"
#include "lanlink_cli.hpp"
#include "openssl/openssl_raii.hpp"
#include "trust/cert_validator.hpp"
#include "util/file_util.hpp"
#include "util/fingerprint.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace {

namespace js = boost::json;
using lanlink::fs::path;

using lanlink::CliParams;

// Prints each discovery event as one JSON line.
class ConsoleBroadcaster : public lanlink::discovery::IBroadcaster {
public:
  void broadcast(const lanlink::data::DiscoveredDeviceMessage &message) override {
    std::lock_guard lock(mutex_);
    std::cout << js::serialize(js::value_from(message)) << std::endl;
  }

private:
  std::mutex mutex_;
};

// Blocks until `seconds` pass or SIGINT/SIGTERM arrives.
void wait_for_seconds_or_signal(boost::asio::io_context &ioc, int seconds) {
  std::mutex mutex;
  std::condition_variable cv;
  bool interrupted = false;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int) {
    if (ec) {
      return;
    }
    std::lock_guard lock(mutex);
    interrupted = true;
    cv.notify_all();
  });
  {
    std::unique_lock lock(mutex);
    cv.wait_for(lock, std::chrono::seconds(seconds),
                [&]() { return interrupted; });
  }
  boost::system::error_code ignored;
  signals.cancel(ignored);
}

std::optional<std::string> local_fingerprint(const CliParams &params,
                                             const lanlink::LanlinkConfig &cfg) {
  path cert = params.cert_file.empty() ? cfg.certificate_file
                                       : path(params.cert_file);
  if (cert.empty()) {
    std::cerr << "No certificate configured. Pass --cert or set "
                 "certificate_file in application.json."
              << std::endl;
    return std::nullopt;
  }
  auto fp = lanlink::fingerprint::from_pem_file(cert);
  if (fp.is_err()) {
    std::cerr << fp.error() << std::endl;
    return std::nullopt;
  }
  return fp.value();
}

lanlink::data::DeviceInfo make_device_info(const lanlink::LanlinkConfig &cfg,
                                           std::string fingerprint) {
  lanlink::data::DeviceInfo info;
  info.alias = cfg.alias;
  info.device_model = cfg.device_model;
  info.version = cfg.version;
  info.device_type = lanlink::data::device_type_from_string(cfg.device_type);
  info.fingerprint = std::move(fingerprint);
  info.api_port = cfg.api_port;
  info.protocol = cfg.protocol;
  return info;
}

int report(const monad::MyVoidResult &r, const std::string &ok_message) {
  if (r.is_err()) {
    std::cerr << r.error() << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << ok_message << std::endl;
  return EXIT_SUCCESS;
}

monad::MyResult<std::shared_ptr<lanlink::trust::CertValidator>>
open_validator(const lanlink::LanlinkConfig &cfg) {
  if (cfg.trust_anchor_file.empty() && cfg.trust_anchor_dir.empty()) {
    return lanlink::trust::CertValidator::create(cfg.base_dir);
  }
  auto roots = lanlink::opensslutil::make_root_store_from_paths(
      cfg.trust_anchor_file, cfg.trust_anchor_dir);
  if (roots.is_err()) {
    return monad::MyResult<std::shared_ptr<lanlink::trust::CertValidator>>::Err(
        std::move(roots).error());
  }
  return lanlink::trust::CertValidator::create(cfg.base_dir,
                                               std::move(roots).value());
}

// Validates a PEM chain (leaf first) for --host the way a TLS client would.
int run_verify_command(const CliParams &params,
                       const lanlink::LanlinkConfig &cfg) {
  if (params.cert_file.empty() || params.hosts.size() != 1) {
    std::cerr << "verify needs --cert and exactly one --host" << std::endl;
    return EXIT_FAILURE;
  }
  auto validator = open_validator(cfg);
  if (validator.is_err()) {
    std::cerr << validator.error() << std::endl;
    return EXIT_FAILURE;
  }
  auto pem = lanlink::fileutil::read_file_if_exists(params.cert_file);
  if (pem.is_err() || !pem.value()) {
    std::cerr << "Cannot read " << params.cert_file << std::endl;
    return EXIT_FAILURE;
  }
  auto chain = lanlink::opensslutil::parse_cert_chain(*pem.value());
  if (chain.is_err()) {
    std::cerr << chain.error() << std::endl;
    return EXIT_FAILURE;
  }
  const auto &host = params.hosts.front();
  return report(validator.value()->verify(chain.value(),
                                          lanlink::trust::parse_server_name(host),
                                          std::chrono::system_clock::now()),
                fmt::format("{} is trusted for {}", params.cert_file, host));
}

int run_trust_command(const CliParams &params,
                      const lanlink::LanlinkConfig &cfg) {
  auto validator = open_validator(cfg);
  if (validator.is_err()) {
    std::cerr << validator.error() << std::endl;
    return EXIT_FAILURE;
  }
  auto &v = *validator.value();

  if (params.subcmd == "list-trusted") {
    for (const auto &entry : v.list_trusted()) {
      std::cout << entry.fingerprint << std::endl;
      for (const auto &host : entry.hosts) {
        std::cout << "  " << host << std::endl;
      }
    }
    return EXIT_SUCCESS;
  }

  if (params.fingerprint.empty()) {
    std::cerr << "--fingerprint is required" << std::endl;
    return EXIT_FAILURE;
  }
  if (params.subcmd == "untrust") {
    return report(v.remove_trusted(params.fingerprint),
                  fmt::format("Removed {}", params.fingerprint));
  }
  if (params.hosts.empty()) {
    std::cerr << "at least one --host is required" << std::endl;
    return EXIT_FAILURE;
  }
  if (params.subcmd == "edit-hosts") {
    return report(v.edit_hosts(params.fingerprint, params.hosts),
                  fmt::format("Updated hosts of {}", params.fingerprint));
  }
  return report(v.trust(params.hosts, params.fingerprint),
                fmt::format("Trusted {}", params.fingerprint));
}

int run_discover_command(const CliParams &params,
                         const lanlink::LanlinkConfig &cfg) {
  auto fp = local_fingerprint(params, cfg);
  if (!fp) {
    return EXIT_FAILURE;
  }
  auto info = make_device_info(cfg, *fp);

  lanlink::IoContextManager ioc_manager(
      lanlink::IocConfig{cfg.io_threads, "lanlink-discovery"});
  auto runtime = lanlink::discovery::DiscoveryRuntime::create(
      ioc_manager.ioc(), cfg.discovery, cfg.base_dir);
  if (runtime.is_err()) {
    std::cerr << runtime.error() << std::endl;
    return EXIT_FAILURE;
  }
  auto &rt = *runtime.value();
  auto started = rt.start_service(
      info, std::chrono::seconds(cfg.discovery.announce_interval_seconds));
  if (started.is_err()) {
    std::cerr << started.error() << std::endl;
    return EXIT_FAILURE;
  }

  wait_for_seconds_or_signal(ioc_manager.ioc(), params.seconds);
  rt.shutdown();

  for (const auto &device : rt.get_devices()) {
    std::cout << lanlink::fileutil::pretty_print(js::value_from(device));
  }
  return EXIT_SUCCESS;
}

int run_scan_command(const CliParams &params,
                     const lanlink::LanlinkConfig &cfg) {
  auto fp = local_fingerprint(params, cfg);
  if (!fp) {
    return EXIT_FAILURE;
  }
  auto info = make_device_info(cfg, *fp);

  lanlink::IoContextManager ioc_manager(
      lanlink::IocConfig{cfg.io_threads, "lanlink-scan"});
  lanlink::discovery::DiscoveryService service(ioc_manager.ioc(),
                                               cfg.discovery);
  {
    lanlink::discovery::DeviceScanner scanner(
        service, std::make_shared<ConsoleBroadcaster>(),
        std::chrono::seconds(cfg.discovery.announce_interval_seconds));
    if (auto r = scanner.start_listening(info); r.is_err()) {
      std::cerr << r.error() << std::endl;
      return EXIT_FAILURE;
    }
    if (auto r = scanner.start_broadcast(info,
                                         std::chrono::seconds(params.seconds));
        r.is_err()) {
      std::cerr << r.error() << std::endl;
      return EXIT_FAILURE;
    }
    wait_for_seconds_or_signal(ioc_manager.ioc(), params.seconds);
    scanner.stop_broadcast();
    scanner.stop_listening();
    std::cerr << fmt::format("{} devices seen", scanner.get_devices().size())
              << std::endl;
  }
  service.shutdown();
  return EXIT_SUCCESS;
}

int RunLanlinkApplication(int argc, char *argv[]) {
  try {
    lanlink::CliCtx ctx = lanlink::parse_command_line(argc, argv);
    const auto &cli_params = ctx.params;

    auto showUsage = [&]() {
      lanlink::CliParams scratch;
      std::cerr << lanlink::make_generic_options(scratch) << std::endl
                << lanlink::subcommand_usage();
    };

    if (ctx.wants_help()) {
      showUsage();
      return EXIT_SUCCESS;
    }
    if (ctx.wants_version()) {
      std::cout << LANLINK_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
    if (cli_params.subcmd.empty()) {
      showUsage();
      return EXIT_FAILURE;
    }

    auto defaults = lanlink::resolve_default_paths();
    path config_dir = cli_params.config_dir.empty()
                          ? defaults.config_dir
                          : path(cli_params.config_dir);
    lanlink::LanlinkConfigProviderFile provider(config_dir, defaults.base_dir);
    auto &cfg = provider.get();
    if (!cli_params.base_dir.empty()) {
      cfg.base_dir = cli_params.base_dir;
    }
    if (!cli_params.verbose.empty()) {
      cfg.logging.level = cli_params.verbose;
    }
    cfg.logging.console = cfg.logging.console || cli_params.log_console;
    if (auto r = lanlink::fileutil::ensure_directory(cfg.logging.log_dir);
        r.is_err()) {
      std::cerr << r.error() << std::endl;
      return EXIT_FAILURE;
    }
    init_my_log(cfg.logging);

    const auto &cmd = cli_params.subcmd;
    if (cmd == "fingerprint") {
      auto fp = local_fingerprint(cli_params, cfg);
      if (!fp) {
        return EXIT_FAILURE;
      }
      std::cout << *fp << std::endl
                << lanlink::fingerprint::to_display_groups(*fp) << std::endl;
      return EXIT_SUCCESS;
    }
    if (lanlink::is_trust_subcommand(cmd)) {
      return run_trust_command(cli_params, cfg);
    }
    if (cmd == "verify") {
      return run_verify_command(cli_params, cfg);
    }
    if (cmd == "discover") {
      return run_discover_command(cli_params, cfg);
    }
    if (cmd == "scan") {
      return run_scan_command(cli_params, cfg);
    }
    std::cerr << "Unknown subcommand: " << cmd << std::endl;
    showUsage();
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

} // namespace

int main(int argc, char *argv[]) { return RunLanlinkApplication(argc, argv); }
