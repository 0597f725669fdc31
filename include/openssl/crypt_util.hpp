#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <memory>

namespace lanlink {
namespace cryptutil {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using BIO_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using X509_STORE_ptr = std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)>;
using X509_STORE_CTX_ptr =
    std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)>;

struct X509StackDeleter {
  void operator()(STACK_OF(X509) * sk) const { sk_X509_pop_free(sk, X509_free); }
};
using X509_STACK_ptr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

}  // namespace cryptutil
}  // namespace lanlink
