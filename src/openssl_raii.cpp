#include "openssl/openssl_raii.hpp"

#include <fmt/format.h>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509_vfy.h>

#include <utility>

#include "common_macros.hpp"

namespace lanlink {
namespace opensslutil {

std::string last_openssl_error() {
  std::string joined;
  unsigned long err_code;
  while ((err_code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(err_code, buf, sizeof(buf));
    if (!joined.empty()) joined += "; ";
    joined += buf;
  }
  return joined;
}

monad::MyResult<std::vector<unsigned char>> sha256(const unsigned char* data,
                                                   size_t len) {
  using R = monad::MyResult<std::vector<unsigned char>>;
  auto digest_error = [](const char* step) {
    return R::Err(monad::Error{
        .code = my_errors::OPENSSL::UNEXPECTED_RESULT,
        .what = fmt::format("SHA-256 {} failed: {}", step,
                            last_openssl_error())});
  };
  cryptutil::EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!context) return digest_error("context creation");

  if (1 != EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    return digest_error("init");
  }
  if (1 != EVP_DigestUpdate(context.get(), data, len)) {
    return digest_error("update");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (1 != EVP_DigestFinal_ex(context.get(), hash, &length)) {
    return digest_error("finalize");
  }
  return R::Ok(std::vector<unsigned char>(hash, hash + length));
}

monad::MyResult<std::vector<unsigned char>> public_key_der(X509* cert) {
  using R = monad::MyResult<std::vector<unsigned char>>;
  if (!cert) {
    return R::Err(monad::Error{.code = my_errors::TRUST::CERTIFICATE_PARSING,
                               .what = "certificate is null"});
  }
  // X509_get0_pubkey keeps ownership with the certificate.
  EVP_PKEY* pkey = X509_get0_pubkey(cert);
  if (!pkey) {
    return R::Err(monad::Error{
        .code = my_errors::TRUST::CERTIFICATE_PARSING,
        .what = fmt::format("certificate has no usable public key: {}",
                            last_openssl_error())});
  }
  int len = i2d_PUBKEY(pkey, nullptr);
  if (len <= 0) {
    return R::Err(monad::Error{
        .code = my_errors::TRUST::CERTIFICATE_PARSING,
        .what = fmt::format("i2d_PUBKEY failed: {}", last_openssl_error())});
  }
  std::vector<unsigned char> buffer(static_cast<size_t>(len));
  unsigned char* p = buffer.data();
  if (i2d_PUBKEY(pkey, &p) != len) {
    return R::Err(monad::Error{
        .code = my_errors::TRUST::CERTIFICATE_PARSING,
        .what = fmt::format("i2d_PUBKEY failed: {}", last_openssl_error())});
  }
  return R::Ok(std::move(buffer));
}

monad::MyResult<std::vector<cryptutil::X509_ptr>> parse_cert_chain(
    const std::string& pem_data) {
  using R = monad::MyResult<std::vector<cryptutil::X509_ptr>>;
  cryptutil::BIO_ptr bio(BIO_new_mem_buf(pem_data.data(), (int)pem_data.size()),
                         BIO_free);
  if (!bio) {
    return R::Err(monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                               .what = "Failed to create BIO"});
  }

  std::vector<cryptutil::X509_ptr> chain;
  X509* cert = nullptr;
  while ((cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr))) {
    chain.emplace_back(cert, &X509_free);
  }
  // Reading stops with PEM_R_NO_START_LINE at end of input.
  ERR_clear_error();

  if (chain.empty()) {
    return R::Err(monad::Error{.code = my_errors::TRUST::CERTIFICATE_PARSING,
                               .what = "No certificate found in PEM data"});
  }
  DEBUG_PRINT("parse_cert_chain parsed " << chain.size() << " certificates");
  return R::Ok(std::move(chain));
}

monad::MyResult<cryptutil::X509_STORE_ptr> make_default_root_store() {
  using R = monad::MyResult<cryptutil::X509_STORE_ptr>;
  cryptutil::X509_STORE_ptr store(X509_STORE_new(), &X509_STORE_free);
  if (!store) {
    return R::Err(monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                               .what = "X509_STORE_new failed"});
  }
  if (X509_STORE_set_default_paths(store.get()) != 1) {
    return R::Err(monad::Error{
        .code = my_errors::OPENSSL::UNEXPECTED_RESULT,
        .what = fmt::format("X509_STORE_set_default_paths failed: {}",
                            last_openssl_error())});
  }
  return R::Ok(std::move(store));
}

monad::MyResult<cryptutil::X509_STORE_ptr> make_root_store(
    const std::vector<cryptutil::X509_ptr>& anchors) {
  using R = monad::MyResult<cryptutil::X509_STORE_ptr>;
  cryptutil::X509_STORE_ptr store(X509_STORE_new(), &X509_STORE_free);
  if (!store) {
    return R::Err(monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                               .what = "X509_STORE_new failed"});
  }
  for (const auto& anchor : anchors) {
    // X509_STORE_add_cert takes its own reference.
    if (X509_STORE_add_cert(store.get(), anchor.get()) != 1) {
      return R::Err(monad::Error{
          .code = my_errors::OPENSSL::UNEXPECTED_RESULT,
          .what = fmt::format("X509_STORE_add_cert failed: {}",
                              last_openssl_error())});
    }
  }
  return R::Ok(std::move(store));
}

monad::MyResult<cryptutil::X509_STORE_ptr> make_root_store_from_paths(
    const std::filesystem::path& ca_file, const std::filesystem::path& ca_dir) {
  using R = monad::MyResult<cryptutil::X509_STORE_ptr>;
  cryptutil::X509_STORE_ptr store(X509_STORE_new(), &X509_STORE_free);
  if (!store) {
    return R::Err(monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                               .what = "X509_STORE_new failed"});
  }
  const std::string file = ca_file.string();
  const std::string dir = ca_dir.string();
  if (X509_STORE_load_locations(store.get(), file.empty() ? nullptr : file.c_str(),
                                dir.empty() ? nullptr : dir.c_str()) != 1) {
    return R::Err(monad::Error{
        .code = my_errors::OPENSSL::UNEXPECTED_RESULT,
        .what = fmt::format("X509_STORE_load_locations('{}', '{}') failed: {}",
                            file, dir, last_openssl_error())});
  }
  return R::Ok(std::move(store));
}

}  // namespace opensslutil
}  // namespace lanlink
