#pragma once
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/sha.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <filesystem>
#include <string>
#include <vector>

#include "crypt_util.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace lanlink {
namespace opensslutil {

// Drain the thread's OpenSSL error queue into one line ("" when empty).
std::string last_openssl_error();

monad::MyResult<std::vector<unsigned char>> sha256(const unsigned char* data,
                                                   size_t len);

// DER encoded SubjectPublicKeyInfo of the certificate's public key.
monad::MyResult<std::vector<unsigned char>> public_key_der(X509* cert);

// Parses multiple PEM certs; the first one is the leaf, the rest follow in
// the order they appear.
monad::MyResult<std::vector<cryptutil::X509_ptr>> parse_cert_chain(
    const std::string& pem_data);

// Root store backed by the system default verify paths.
monad::MyResult<cryptutil::X509_STORE_ptr> make_default_root_store();

// Root store holding exactly the given anchors.
monad::MyResult<cryptutil::X509_STORE_ptr> make_root_store(
    const std::vector<cryptutil::X509_ptr>& anchors);

// Root store from a PEM bundle file and/or a hashed certificate directory.
monad::MyResult<cryptutil::X509_STORE_ptr> make_root_store_from_paths(
    const std::filesystem::path& ca_file, const std::filesystem::path& ca_dir);

}  // namespace opensslutil
}  // namespace lanlink
