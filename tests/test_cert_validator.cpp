#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <openssl/ssl.h>

#include <chrono>
#include <fstream>
#include <string>
#include <vector>

#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "test_cert_helper.hpp"
#include "test_temp_dir.hpp"
#include "trust/cert_validator.hpp"
#include "util/fingerprint.hpp"

namespace {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

using namespace lanlink;
using trust::CertValidator;
using trust::DnsName;

class CertValidatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::vector<cryptutil::X509_ptr> anchors;
    anchors.push_back(testinfra::clone(pki_.ca.get()));
    auto roots = opensslutil::make_root_store(anchors);
    ASSERT_TRUE(roots.is_ok()) << roots.error();
    auto v = CertValidator::create(dir_.path, std::move(roots).value());
    ASSERT_TRUE(v.is_ok()) << v.error();
    validator_ = std::move(v).value();
  }

  std::vector<cryptutil::X509_ptr> chain_for(EVP_PKEY *key,
                                             const std::string &host,
                                             long serial = 2) {
    std::vector<cryptutil::X509_ptr> chain;
    chain.push_back(pki_.issue(key, {host}, serial));
    return chain;
  }

  static std::string fp_of(const std::vector<cryptutil::X509_ptr> &chain) {
    return fingerprint::of_certificate(chain.front().get()).value();
  }

  testinfra::TempDir dir_{"lanlink-validator"};
  testinfra::TestPki pki_;
  std::shared_ptr<CertValidator> validator_;
  std::chrono::system_clock::time_point now_{std::chrono::system_clock::now()};
};

TEST_F(CertValidatorTest, UnknownServerUntilTrusted) {
  auto key = testinfra::make_ec_p256_key();
  auto chain = chain_for(key.get(), "alpha.local");

  auto first = validator_->verify(chain, DnsName{"alpha.local"}, now_);
  ASSERT_TRUE(first.is_err());
  EXPECT_EQ(first.error().code, my_errors::TRUST::UNKNOWN_SERVER);

  ASSERT_TRUE(validator_->trust({"alpha.local"}, fp_of(chain)).is_ok());
  auto second = validator_->verify(chain, DnsName{"alpha.local"}, now_);
  EXPECT_TRUE(second.is_ok()) << second.error();
}

TEST_F(CertValidatorTest, CreateMakesBaseDirAndRejectsPlainFile) {
  std::vector<cryptutil::X509_ptr> anchors;
  anchors.push_back(testinfra::clone(pki_.ca.get()));

  auto base = dir_.path / "fresh" / "trust";
  auto v = CertValidator::create(
      base, opensslutil::make_root_store(anchors).value());
  ASSERT_TRUE(v.is_ok()) << v.error();
  EXPECT_TRUE(std::filesystem::is_directory(base));
  EXPECT_FALSE(std::filesystem::exists(base / ".known-clients"));

  auto plain = dir_.path / "plain";
  {
    std::ofstream ofs(plain);
    ofs << "x";
  }
  auto bad = CertValidator::create(
      plain, opensslutil::make_root_store(anchors).value());
  ASSERT_TRUE(bad.is_err());
  EXPECT_EQ(bad.error().code, my_errors::CONFIG::NOT_A_DIRECTORY);
}

TEST_F(CertValidatorTest, ReissuedCertificateForSameKeyStillMatches) {
  auto key = testinfra::make_ec_p256_key();
  auto original = chain_for(key.get(), "alpha.local", 2);
  ASSERT_TRUE(validator_->trust({"alpha.local"}, fp_of(original)).is_ok());

  auto reissued = chain_for(key.get(), "alpha.local", 99);
  EXPECT_TRUE(validator_->verify(reissued, DnsName{"alpha.local"}, now_).is_ok());
}

TEST_F(CertValidatorTest, DifferentKeyIsFingerprintMismatch) {
  auto pinned_key = testinfra::make_ec_p256_key();
  auto pinned = chain_for(pinned_key.get(), "alpha.local");
  ASSERT_TRUE(validator_->trust({"alpha.local"}, fp_of(pinned)).is_ok());

  auto other_key = testinfra::make_ec_p256_key();
  auto impostor = chain_for(other_key.get(), "alpha.local");
  auto r = validator_->verify(impostor, DnsName{"alpha.local"}, now_);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TRUST::FINGERPRINT_MISMATCH);
}

TEST_F(CertValidatorTest, RetrustOverwritesPreviousPin) {
  auto first_key = testinfra::make_ec_p256_key();
  auto first = chain_for(first_key.get(), "alpha.local", 2);
  auto second_key = testinfra::make_ec_p256_key();
  auto second = chain_for(second_key.get(), "alpha.local", 3);

  ASSERT_TRUE(validator_->trust({"alpha.local"}, fp_of(first)).is_ok());
  ASSERT_TRUE(validator_->trust({"alpha.local"}, fp_of(second)).is_ok());

  auto old_pin = validator_->verify(first, DnsName{"alpha.local"}, now_);
  ASSERT_TRUE(old_pin.is_err());
  EXPECT_EQ(old_pin.error().code, my_errors::TRUST::FINGERPRINT_MISMATCH);
  EXPECT_TRUE(
      validator_->verify(second, DnsName{"alpha.local"}, now_).is_ok());
}

TEST_F(CertValidatorTest, ChainFailuresComeBeforePinning) {
  auto key = testinfra::make_ec_p256_key();
  auto chain = chain_for(key.get(), "alpha.local");
  ASSERT_TRUE(validator_->trust({"alpha.local", "beta.local"}, fp_of(chain))
                  .is_ok());

  // Host not in the certificate.
  auto wrong_host = validator_->verify(chain, DnsName{"beta.local"}, now_);
  ASSERT_TRUE(wrong_host.is_err());
  EXPECT_EQ(wrong_host.error().code, my_errors::TRUST::CHAIN_VALIDATION);

  // Past notAfter.
  auto expired = validator_->verify(chain, DnsName{"alpha.local"},
                                    now_ + std::chrono::hours(24 * 30));
  ASSERT_TRUE(expired.is_err());
  EXPECT_EQ(expired.error().code, my_errors::TRUST::CHAIN_VALIDATION);

  // Issued by a root the store does not hold.
  testinfra::TestPki stranger;
  std::vector<cryptutil::X509_ptr> foreign;
  foreign.push_back(stranger.issue(key.get(), {"alpha.local"}));
  auto untrusted_root = validator_->verify(foreign, DnsName{"alpha.local"}, now_);
  ASSERT_TRUE(untrusted_root.is_err());
  EXPECT_EQ(untrusted_root.error().code, my_errors::TRUST::CHAIN_VALIDATION);

  std::vector<cryptutil::X509_ptr> empty;
  auto none = validator_->verify(empty, DnsName{"alpha.local"}, now_);
  ASSERT_TRUE(none.is_err());
  EXPECT_EQ(none.error().code, my_errors::TRUST::CERTIFICATE_PARSING);
}

TEST_F(CertValidatorTest, IpIdentityRejectedAfterValidChain) {
  auto key = testinfra::make_ec_p256_key();
  testinfra::CertOptions opts;
  opts.ip_addresses = {"192.168.1.20"};
  std::vector<cryptutil::X509_ptr> chain;
  chain.push_back(testinfra::make_certificate(key.get(), opts, pki_.ca.get(),
                                              pki_.ca_key.get()));

  auto peer = trust::parse_server_name("192.168.1.20");
  ASSERT_TRUE(std::holds_alternative<net::ip::address>(peer));
  auto r = validator_->verify(chain, peer, now_);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TRUST::INVALID_SERVER_NAME);

  auto trusted = validator_->trust({"192.168.1.20"}, fp_of(chain));
  ASSERT_TRUE(trusted.is_err());
  EXPECT_EQ(trusted.error().code, my_errors::TRUST::INVALID_SERVER_NAME);
}

TEST_F(CertValidatorTest, EditHostsAndRemove) {
  auto key = testinfra::make_ec_p256_key();
  auto chain = chain_for(key.get(), "alpha.local");
  const auto fp = fp_of(chain);
  ASSERT_TRUE(validator_->trust({"old.local"}, fp).is_ok());
  ASSERT_TRUE(validator_->edit_hosts(fp, {"alpha.local"}).is_ok());

  auto listed = validator_->list_trusted();
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].hosts, std::vector<std::string>{"alpha.local"});
  EXPECT_TRUE(validator_->verify(chain, DnsName{"alpha.local"}, now_).is_ok());

  ASSERT_TRUE(validator_->remove_trusted(fp).is_ok());
  auto r = validator_->verify(chain, DnsName{"alpha.local"}, now_);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TRUST::UNKNOWN_SERVER);
}

TEST_F(CertValidatorTest, PinsSurviveReopen) {
  auto key = testinfra::make_ec_p256_key();
  auto chain = chain_for(key.get(), "alpha.local");
  ASSERT_TRUE(validator_->trust({"alpha.local"}, fp_of(chain)).is_ok());

  std::vector<cryptutil::X509_ptr> anchors;
  anchors.push_back(testinfra::clone(pki_.ca.get()));
  auto reopened =
      CertValidator::create(dir_.path, opensslutil::make_root_store(anchors).value());
  ASSERT_TRUE(reopened.is_ok());
  EXPECT_TRUE(
      reopened.value()->verify(chain, DnsName{"alpha.local"}, now_).is_ok());
}

TEST_F(CertValidatorTest, RootStoreFromPemFile) {
  auto ca_file = dir_.path / "roots.pem";
  {
    std::ofstream ofs(ca_file);
    ofs << testinfra::to_pem(pki_.ca.get());
  }
  auto roots = opensslutil::make_root_store_from_paths(ca_file, {});
  ASSERT_TRUE(roots.is_ok()) << roots.error();
  testinfra::TempDir other("lanlink-validator");
  auto v = CertValidator::create(other.path, std::move(roots).value());
  ASSERT_TRUE(v.is_ok()) << v.error();

  auto key = testinfra::make_ec_p256_key();
  auto leaf = pki_.issue(key.get(), {"alpha.local"});
  auto pem = testinfra::to_pem(leaf.get()) + testinfra::to_pem(pki_.ca.get());
  auto chain = opensslutil::parse_cert_chain(pem);
  ASSERT_TRUE(chain.is_ok()) << chain.error();
  ASSERT_EQ(chain.value().size(), 2u);
  ASSERT_TRUE(v.value()->trust({"alpha.local"}, fp_of(chain.value())).is_ok());
  EXPECT_TRUE(
      v.value()->verify(chain.value(), DnsName{"alpha.local"}, now_).is_ok());

  auto missing =
      opensslutil::make_root_store_from_paths(dir_.path / "absent.pem", {});
  EXPECT_TRUE(missing.is_err());
}

// Runs one TLS handshake over loopback with the validator's callback on the
// client side and returns the client's result.
boost::system::error_code handshake_with_pin(CertValidator &validator,
                                             X509 *ca, X509 *leaf,
                                             EVP_PKEY *leaf_key,
                                             const std::string &host) {
  net::io_context ioc;
  ssl::context server_ctx(ssl::context::tls_server);
  SSL_CTX_use_certificate(server_ctx.native_handle(), leaf);
  SSL_CTX_use_PrivateKey(server_ctx.native_handle(), leaf_key);

  ssl::context client_ctx(ssl::context::tls_client);
  X509_STORE_add_cert(SSL_CTX_get_cert_store(client_ctx.native_handle()), ca);
  client_ctx.set_verify_mode(ssl::verify_peer);

  tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  ssl::stream<tcp::socket> server(ioc, server_ctx);
  ssl::stream<tcp::socket> client(ioc, client_ctx);
  SSL_set1_host(client.native_handle(), host.c_str());
  SSL_set_tlsext_host_name(client.native_handle(), host.c_str());
  client.set_verify_callback(
      validator.make_verify_callback(trust::parse_server_name(host)));

  boost::system::error_code client_ec;
  acceptor.async_accept(server.lowest_layer(),
                        [&](const boost::system::error_code &ec) {
                          if (ec) {
                            return;
                          }
                          server.async_handshake(
                              ssl::stream_base::server,
                              [](const boost::system::error_code &) {});
                        });
  client.lowest_layer().async_connect(
      acceptor.local_endpoint(), [&](const boost::system::error_code &ec) {
        if (ec) {
          client_ec = ec;
          return;
        }
        client.async_handshake(ssl::stream_base::client,
                               [&](const boost::system::error_code &hs_ec) {
                                 client_ec = hs_ec;
                                 boost::system::error_code ignored;
                                 client.lowest_layer().close(ignored);
                                 server.lowest_layer().close(ignored);
                               });
      });
  ioc.run_for(std::chrono::seconds(10));
  return client_ec;
}

TEST_F(CertValidatorTest, VerifyCallbackEnforcesPinDuringHandshake) {
  auto key = testinfra::make_ec_p256_key();
  auto leaf = pki_.issue(key.get(), {"alpha.local"});

  auto rejected = handshake_with_pin(*validator_, pki_.ca.get(), leaf.get(),
                                     key.get(), "alpha.local");
  EXPECT_TRUE(rejected) << "handshake must fail for an unpinned server";

  ASSERT_TRUE(validator_
                  ->trust({"alpha.local"},
                          fingerprint::of_certificate(leaf.get()).value())
                  .is_ok());
  auto accepted = handshake_with_pin(*validator_, pki_.ca.get(), leaf.get(),
                                     key.get(), "alpha.local");
  EXPECT_FALSE(accepted) << accepted.message();
}

} // namespace
