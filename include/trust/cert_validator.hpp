#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/verify_context.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "openssl/crypt_util.hpp"
#include "result_monad.hpp"
#include "trust/trust_store.hpp"

namespace lanlink {
namespace trust {

struct DnsName {
  std::string value;
};

// Identity of the peer being dialed. Only DnsName identities can be pinned.
using ServerName = std::variant<DnsName, boost::asio::ip::address>;

// An IP literal becomes an address, anything else a DnsName.
ServerName parse_server_name(const std::string &host);
std::string to_string(const ServerName &name);

// Standard chain-of-trust validation followed by fingerprint pinning.
//
// verify() order:
//   1. X509_verify_cert against the root store at the given time, with the
//      peer's host name or IP as the expected identity (CHAIN_VALIDATION).
//   2. fingerprint of the leaf public key (CERTIFICATE_PARSING).
//   3. IP identities are refused (INVALID_SERVER_NAME).
//   4. pin lookup: UNKNOWN_SERVER / FINGERPRINT_MISMATCH / accept.
class CertValidator : public std::enable_shared_from_this<CertValidator> {
public:
  // Uses the system default verify paths as the root store.
  static monad::MyResult<std::shared_ptr<CertValidator>>
  create(const std::filesystem::path &base_dir);

  static monad::MyResult<std::shared_ptr<CertValidator>>
  create(const std::filesystem::path &base_dir,
         cryptutil::X509_STORE_ptr root_store);

  // `chain` is leaf first, intermediates after.
  monad::MyVoidResult verify(const std::vector<cryptutil::X509_ptr> &chain,
                             const ServerName &peer,
                             std::chrono::system_clock::time_point now) const;

  // Steps 3 and 4 only, for a fingerprint computed elsewhere.
  monad::MyVoidResult check_pin(const std::string &fingerprint,
                                const ServerName &peer) const;

  monad::MyVoidResult trust(const std::vector<std::string> &domains,
                            const std::string &fingerprint);
  std::vector<TrustedFingerprint> list_trusted() const;
  monad::MyVoidResult remove_trusted(const std::string &fingerprint);
  monad::MyVoidResult edit_hosts(const std::string &fingerprint,
                                 const std::vector<std::string> &hosts);

  // Callback for boost::asio::ssl::stream::set_verify_callback. OpenSSL still
  // performs the chain and host checks (the stream needs verify_peer and a
  // host set with SSL_set1_host); the callback adds the pin check on the leaf.
  std::function<bool(bool, boost::asio::ssl::verify_context &)>
  make_verify_callback(ServerName peer);

  const TrustStore &store() const { return *store_; }

private:
  CertValidator(std::unique_ptr<TrustStore> store,
                cryptutil::X509_STORE_ptr root_store);

  monad::MyVoidResult
  verify_chain(const std::vector<cryptutil::X509_ptr> &chain,
               const ServerName &peer,
               std::chrono::system_clock::time_point now) const;

  std::unique_ptr<TrustStore> store_;
  cryptutil::X509_STORE_ptr root_store_;
};

} // namespace trust
} // namespace lanlink
