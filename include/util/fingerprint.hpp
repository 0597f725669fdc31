#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/x509.h>

#include "result_monad.hpp"

namespace lanlink {
namespace fingerprint {

// Length of a fingerprint string: base85 of a 32-byte SHA-256 digest.
inline constexpr std::size_t kFingerprintLength = 40;

// Encode bytes with the RFC 1924 base85 alphabet. Each 4-byte group becomes 5
// characters; a trailing group of n bytes becomes n + 1 characters.
std::string base85_encode(const unsigned char *data, std::size_t len);

// Fingerprint of a DER encoded SubjectPublicKeyInfo.
monad::MyResult<std::string>
from_public_key_der(const std::vector<unsigned char> &spki_der);

// Fingerprint of the certificate's public key. Two certificates issued for the
// same key pair share a fingerprint.
monad::MyResult<std::string> of_certificate(X509 *cert);

// Fingerprint of the first (leaf) certificate in a PEM document.
monad::MyResult<std::string> from_pem(const std::string &pem);
monad::MyResult<std::string>
from_pem_file(const std::filesystem::path &cert_path);

// Two characters per cell, used when printing a fingerprint for manual
// comparison, e.g. "0a Bc ..".
std::string to_display_groups(std::string_view fingerprint);

} // namespace fingerprint
} // namespace lanlink
