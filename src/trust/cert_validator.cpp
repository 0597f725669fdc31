#include "trust/cert_validator.hpp"

#include <fmt/format.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "util/fingerprint.hpp"
#include "util/my_logging.hpp"

namespace lanlink {
namespace trust {

ServerName parse_server_name(const std::string &host) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(host, ec);
  if (!ec) {
    return address;
  }
  return DnsName{host};
}

std::string to_string(const ServerName &name) {
  if (const auto *dns = std::get_if<DnsName>(&name)) {
    return dns->value;
  }
  return std::get<boost::asio::ip::address>(name).to_string();
}

CertValidator::CertValidator(std::unique_ptr<TrustStore> store,
                             cryptutil::X509_STORE_ptr root_store)
    : store_(std::move(store)), root_store_(std::move(root_store)) {}

monad::MyResult<std::shared_ptr<CertValidator>>
CertValidator::create(const std::filesystem::path &base_dir) {
  auto roots = opensslutil::make_default_root_store();
  if (roots.is_err()) {
    return monad::MyResult<std::shared_ptr<CertValidator>>::Err(
        std::move(roots).error());
  }
  return create(base_dir, std::move(roots).value());
}

monad::MyResult<std::shared_ptr<CertValidator>>
CertValidator::create(const std::filesystem::path &base_dir,
                      cryptutil::X509_STORE_ptr root_store) {
  using R = monad::MyResult<std::shared_ptr<CertValidator>>;
  if (!root_store) {
    return R::Err(monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                                    "Root store is null"));
  }
  auto store = TrustStore::open(base_dir);
  if (store.is_err()) {
    return R::Err(std::move(store).error());
  }
  return R::Ok(std::shared_ptr<CertValidator>(
      new CertValidator(std::move(store).value(), std::move(root_store))));
}

monad::MyVoidResult
CertValidator::verify(const std::vector<cryptutil::X509_ptr> &chain,
                      const ServerName &peer,
                      std::chrono::system_clock::time_point now) const {
  if (auto r = verify_chain(chain, peer, now); r.is_err()) {
    return r;
  }
  auto leaf_fp = fingerprint::of_certificate(chain.front().get());
  if (leaf_fp.is_err()) {
    return monad::MyVoidResult::Err(std::move(leaf_fp).error());
  }
  return check_pin(leaf_fp.value(), peer);
}

monad::MyVoidResult
CertValidator::verify_chain(const std::vector<cryptutil::X509_ptr> &chain,
                            const ServerName &peer,
                            std::chrono::system_clock::time_point now) const {
  if (chain.empty() || !chain.front()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST::CERTIFICATE_PARSING, "Empty certificate chain"));
  }

  cryptutil::X509_STACK_ptr untrusted(sk_X509_new_null());
  if (!untrusted) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::OPENSSL::UNEXPECTED_RESULT, "sk_X509_new_null failed"));
  }
  for (std::size_t i = 1; i < chain.size(); ++i) {
    // The stack frees its entries, so it holds its own references.
    X509_up_ref(chain[i].get());
    if (sk_X509_push(untrusted.get(), chain[i].get()) <= 0) {
      X509_free(chain[i].get());
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::OPENSSL::UNEXPECTED_RESULT, "sk_X509_push failed"));
    }
  }

  cryptutil::X509_STORE_CTX_ptr ctx(X509_STORE_CTX_new(),
                                    &X509_STORE_CTX_free);
  if (!ctx || X509_STORE_CTX_init(ctx.get(), root_store_.get(),
                                  chain.front().get(), untrusted.get()) != 1) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::OPENSSL::UNEXPECTED_RESULT,
        fmt::format("X509_STORE_CTX_init failed: {}",
                    opensslutil::last_openssl_error())));
  }

  X509_VERIFY_PARAM *param = X509_STORE_CTX_get0_param(ctx.get());
  X509_VERIFY_PARAM_set_time(param,
                             std::chrono::system_clock::to_time_t(now));
  X509_VERIFY_PARAM_set_purpose(param, X509_PURPOSE_SSL_SERVER);
  int identity_set = 0;
  if (const auto *dns = std::get_if<DnsName>(&peer)) {
    identity_set = X509_VERIFY_PARAM_set1_host(param, dns->value.c_str(),
                                               dns->value.size());
  } else {
    auto ip = std::get<boost::asio::ip::address>(peer).to_string();
    identity_set = X509_VERIFY_PARAM_set1_ip_asc(param, ip.c_str());
  }
  if (identity_set != 1) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST::INVALID_SERVER_NAME,
        fmt::format("Cannot use '{}' as the expected peer identity",
                    to_string(peer))));
  }

  if (X509_verify_cert(ctx.get()) != 1) {
    int err = X509_STORE_CTX_get_error(ctx.get());
    ERR_clear_error();
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST::CHAIN_VALIDATION,
        fmt::format("Certificate chain for '{}' rejected: {}",
                    to_string(peer), X509_verify_cert_error_string(err))));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult CertValidator::check_pin(const std::string &fingerprint,
                                             const ServerName &peer) const {
  const auto *dns = std::get_if<DnsName>(&peer);
  if (!dns) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST::INVALID_SERVER_NAME,
        fmt::format("Invalid server name: {} is not a DNS name",
                    to_string(peer))));
  }
  auto pinned = store_->lookup(dns->value);
  if (!pinned) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST::UNKNOWN_SERVER,
        fmt::format("Unknown server: {}", dns->value)));
  }
  if (*pinned != fingerprint) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << fmt::format("Fingerprint mismatch for {}: pinned {}, presented {}",
                       dns->value, *pinned, fingerprint);
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST::FINGERPRINT_MISMATCH,
        fmt::format("Certificate fingerprint mismatch for {}", dns->value)));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult
CertValidator::trust(const std::vector<std::string> &domains,
                     const std::string &fingerprint) {
  auto r = store_->trust(domains, fingerprint);
  if (r.is_ok()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << fmt::format("Trusted {} for {} identities", fingerprint,
                       domains.size());
  }
  return r;
}

std::vector<TrustedFingerprint> CertValidator::list_trusted() const {
  return store_->list();
}

monad::MyVoidResult
CertValidator::remove_trusted(const std::string &fingerprint) {
  return store_->remove_fingerprint(fingerprint);
}

monad::MyVoidResult
CertValidator::edit_hosts(const std::string &fingerprint,
                          const std::vector<std::string> &hosts) {
  return store_->replace_hosts(fingerprint, hosts);
}

std::function<bool(bool, boost::asio::ssl::verify_context &)>
CertValidator::make_verify_callback(ServerName peer) {
  auto self = shared_from_this();
  return [self, peer = std::move(peer)](
             bool preverified, boost::asio::ssl::verify_context &vctx) {
    X509_STORE_CTX *ctx = vctx.native_handle();
    if (!preverified) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << fmt::format("Chain validation failed for {}: {}",
                         to_string(peer),
                         X509_verify_cert_error_string(
                             X509_STORE_CTX_get_error(ctx)));
      return false;
    }
    // Only the leaf carries the pinned key.
    if (X509_STORE_CTX_get_error_depth(ctx) != 0) {
      return true;
    }
    auto leaf_fp =
        fingerprint::of_certificate(X509_STORE_CTX_get_current_cert(ctx));
    if (leaf_fp.is_err()) {
      BOOST_LOG_SEV(app_logger(), trivial::warning) << leaf_fp.error().what;
      return false;
    }
    auto pinned = self->check_pin(leaf_fp.value(), peer);
    if (pinned.is_err()) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Handshake rejected: " << pinned.error().what;
      return false;
    }
    return true;
  };
}

} // namespace trust
} // namespace lanlink
