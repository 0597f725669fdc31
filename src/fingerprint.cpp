#include "util/fingerprint.hpp"

#include <fmt/format.h>

#include <array>
#include <fstream>
#include <iterator>

#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"

namespace lanlink {
namespace fingerprint {

namespace {

constexpr std::array<char, 85> kAlphabet{
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E',
    'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P', 'Q', 'R', 'S', 'T',
    'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i',
    'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x',
    'y', 'z', '!', '#', '$', '%', '&', '(', ')', '*', '+', '-', ';', '<', '=',
    '>', '?', '@', '^', '_', '`', '{', '|', '}', '~'};

} // namespace

std::string base85_encode(const unsigned char *data, std::size_t len) {
  std::string out;
  out.reserve((len / 4) * 5 + 5);
  for (std::size_t i = 0; i < len; i += 4) {
    const std::size_t chunk = std::min<std::size_t>(4, len - i);
    std::uint32_t value = 0;
    for (std::size_t j = 0; j < 4; ++j) {
      value <<= 8;
      if (j < chunk) {
        value |= data[i + j];
      }
    }
    char group[5];
    for (int k = 4; k >= 0; --k) {
      group[k] = kAlphabet[value % 85];
      value /= 85;
    }
    out.append(group, chunk + 1);
  }
  return out;
}

monad::MyResult<std::string>
from_public_key_der(const std::vector<unsigned char> &spki_der) {
  auto digest = opensslutil::sha256(spki_der.data(), spki_der.size());
  if (digest.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(digest.error()));
  }
  return monad::MyResult<std::string>::Ok(
      base85_encode(digest.value().data(), digest.value().size()));
}

monad::MyResult<std::string> of_certificate(X509 *cert) {
  auto der = opensslutil::public_key_der(cert);
  if (der.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(der.error()));
  }
  return from_public_key_der(der.value());
}

monad::MyResult<std::string> from_pem(const std::string &pem) {
  auto chain = opensslutil::parse_cert_chain(pem);
  if (chain.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(chain.error()));
  }
  return of_certificate(chain.value().front().get());
}

monad::MyResult<std::string>
from_pem_file(const std::filesystem::path &cert_path) {
  std::ifstream ifs(cert_path, std::ios::binary);
  if (!ifs.is_open()) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::GENERAL::FILE_NOT_FOUND,
        fmt::format("Unable to open certificate file: {}", cert_path.string())));
  }
  std::string pem((std::istreambuf_iterator<char>(ifs)),
                  std::istreambuf_iterator<char>());
  return from_pem(pem);
}

std::string to_display_groups(std::string_view fingerprint) {
  std::string out;
  out.reserve(fingerprint.size() + fingerprint.size() / 2);
  for (std::size_t i = 0; i < fingerprint.size(); i += 2) {
    if (i > 0) {
      out.push_back(' ');
    }
    out.append(fingerprint.substr(i, 2));
  }
  return out;
}

} // namespace fingerprint
} // namespace lanlink
