#include "trust/trust_store.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "my_error_codes.hpp"
#include "util/file_util.hpp"
#include "util/my_logging.hpp"

namespace lanlink {
namespace trust {
namespace json = boost::json;

namespace {

monad::MyResult<std::map<std::string, std::string>>
parse_report(const std::string &content, const std::string &path) {
  using R = monad::MyResult<std::map<std::string, std::string>>;
  try {
    auto jv = json::parse(content);
    if (!jv.is_object()) {
      throw std::runtime_error("trust report must be an object");
    }
    const auto *entries = jv.as_object().if_contains("entries");
    if (!entries || !entries->is_object()) {
      throw std::runtime_error("trust report missing 'entries' object");
    }
    std::map<std::string, std::string> result;
    for (const auto &kv : entries->as_object()) {
      if (!kv.value().is_string()) {
        throw std::runtime_error(
            fmt::format("fingerprint of '{}' is not a string", kv.key()));
      }
      result.emplace(std::string(kv.key()),
                     std::string(kv.value().as_string().c_str()));
    }
    return R::Ok(std::move(result));
  } catch (const std::exception &e) {
    return R::Err(monad::make_error(
        my_errors::PERSISTENCE::SERIALIZATION,
        fmt::format("Failed to deserialize {}: {}", path, e.what())));
  }
}

std::string serialize_report(const std::map<std::string, std::string> &map) {
  json::object entries;
  for (const auto &[identity, fingerprint] : map) {
    entries[identity] = fingerprint;
  }
  return fileutil::pretty_print(json::object{{"entries", std::move(entries)}});
}

} // namespace

TrustStore::TrustStore(std::filesystem::path report_path, EntryMap entries)
    : report_path_(std::move(report_path)), entries_(std::move(entries)) {}

monad::MyResult<std::unique_ptr<TrustStore>>
TrustStore::open(const std::filesystem::path &base_dir) {
  using R = monad::MyResult<std::unique_ptr<TrustStore>>;
  if (auto r = fileutil::ensure_directory(base_dir); r.is_err()) {
    return R::Err(std::move(r).error());
  }
  auto report_path = base_dir / kTrustFileName;
  auto content = fileutil::read_file_if_exists(report_path);
  if (content.is_err()) {
    return R::Err(std::move(content).error());
  }

  EntryMap entries;
  if (content.value()) {
    auto parsed = parse_report(*content.value(), report_path.string());
    if (parsed.is_err()) {
      return R::Err(std::move(parsed).error());
    }
    entries = std::move(parsed).value();
  }
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << fmt::format("Loaded {} trusted identities from {}", entries.size(),
                     report_path.string());
  return R::Ok(std::unique_ptr<TrustStore>(
      new TrustStore(std::move(report_path), std::move(entries))));
}

std::optional<std::string>
TrustStore::lookup(const std::string &identity) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(identity);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

monad::MyVoidResult
TrustStore::validate_identities(const std::vector<std::string> &domains) {
  for (const auto &domain : domains) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(domain, ec);
    if (domain.empty() || !ec) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::TRUST::INVALID_SERVER_NAME,
          fmt::format("'{}' is not a DNS name", domain)));
    }
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult TrustStore::trust(const std::vector<std::string> &domains,
                                      const std::string &fingerprint) {
  if (fingerprint.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "Fingerprint is empty"));
  }
  if (auto r = validate_identities(domains); r.is_err()) {
    return r;
  }

  std::lock_guard lock(mutex_);
  EntryMap previous = entries_;
  for (const auto &domain : domains) {
    entries_[domain] = fingerprint;
  }
  return commit_locked(std::move(previous));
}

monad::MyVoidResult
TrustStore::remove_fingerprint(const std::string &fingerprint) {
  std::lock_guard lock(mutex_);
  EntryMap previous = entries_;
  auto removed = std::erase_if(entries_, [&](const auto &kv) {
    return kv.second == fingerprint;
  });
  if (removed == 0) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND,
        fmt::format("No identity is pinned to fingerprint {}", fingerprint)));
  }
  return commit_locked(std::move(previous));
}

monad::MyVoidResult
TrustStore::replace_hosts(const std::string &fingerprint,
                          const std::vector<std::string> &hosts) {
  if (fingerprint.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "Fingerprint is empty"));
  }
  if (auto r = validate_identities(hosts); r.is_err()) {
    return r;
  }

  std::lock_guard lock(mutex_);
  EntryMap previous = entries_;
  std::erase_if(entries_,
                [&](const auto &kv) { return kv.second == fingerprint; });
  for (const auto &host : hosts) {
    entries_[host] = fingerprint;
  }
  return commit_locked(std::move(previous));
}

std::vector<TrustedFingerprint> TrustStore::list() const {
  std::map<std::string, std::vector<std::string>> grouped;
  {
    std::lock_guard lock(mutex_);
    for (const auto &[identity, fingerprint] : entries_) {
      grouped[fingerprint].push_back(identity);
    }
  }
  std::vector<TrustedFingerprint> out;
  out.reserve(grouped.size());
  for (auto &[fingerprint, hosts] : grouped) {
    std::sort(hosts.begin(), hosts.end());
    out.push_back(TrustedFingerprint{fingerprint, std::move(hosts)});
  }
  return out;
}

std::size_t TrustStore::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

monad::MyVoidResult TrustStore::commit_locked(EntryMap previous) {
  auto written =
      fileutil::write_file_atomic(report_path_, serialize_report(entries_));
  if (written.is_err()) {
    entries_ = std::move(previous);
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Trust report not saved, change rolled back: "
        << written.error().what;
    return written;
  }
  return monad::MyVoidResult::Ok();
}

} // namespace trust
} // namespace lanlink
