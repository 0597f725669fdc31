#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "test_cert_helper.hpp"
#include "test_temp_dir.hpp"
#include "util/fingerprint.hpp"

namespace {

using namespace lanlink;

TEST(FingerprintTest, Base85FullAndTrailingGroups) {
  const unsigned char zeros[4] = {0, 0, 0, 0};
  EXPECT_EQ(fingerprint::base85_encode(zeros, 4), "00000");

  const unsigned char bytes[5] = {0xff, 0xff, 0xff, 0xff, 0x01};
  EXPECT_EQ(fingerprint::base85_encode(bytes, 4), "|NsC0");
  // A trailing group of one byte yields two characters.
  EXPECT_EQ(fingerprint::base85_encode(bytes, 5), "|NsC00R");
  EXPECT_EQ(fingerprint::base85_encode(bytes, 0), "");
}

TEST(FingerprintTest, DigestEncodesToFortyCharacters) {
  std::vector<unsigned char> spki{1, 2, 3};
  auto fp = fingerprint::from_public_key_der(spki);
  ASSERT_TRUE(fp.is_ok()) << fp.error();
  EXPECT_EQ(fp.value().size(), fingerprint::kFingerprintLength);
  EXPECT_EQ(fp.value(), fingerprint::from_public_key_der(spki).value());
}

TEST(FingerprintTest, Sha256ReturnsDigestAsResult) {
  const unsigned char abc[3] = {'a', 'b', 'c'};
  auto digest = opensslutil::sha256(abc, sizeof(abc));
  ASSERT_TRUE(digest.is_ok()) << digest.error();
  ASSERT_EQ(digest.value().size(), 32u);
  EXPECT_EQ(digest.value()[0], 0xba);
  EXPECT_EQ(digest.value()[1], 0x78);
  EXPECT_EQ(digest.value()[31], 0xad);
}

TEST(FingerprintTest, SameKeySameFingerprintAcrossCertificates) {
  auto key = testinfra::make_ec_p256_key();
  ASSERT_TRUE(key);
  testinfra::CertOptions first;
  first.common_name = "alpha.local";
  testinfra::CertOptions second;
  second.common_name = "beta.local";
  second.serial = 7;

  auto a = testinfra::make_certificate(key.get(), first);
  auto b = testinfra::make_certificate(key.get(), second);
  auto fa = fingerprint::of_certificate(a.get());
  auto fb = fingerprint::of_certificate(b.get());
  ASSERT_TRUE(fa.is_ok()) << fa.error();
  ASSERT_TRUE(fb.is_ok()) << fb.error();
  EXPECT_EQ(fa.value(), fb.value());
  EXPECT_EQ(fa.value().size(), fingerprint::kFingerprintLength);
}

TEST(FingerprintTest, DifferentKeysDiffer) {
  auto k1 = testinfra::make_ec_p256_key();
  auto k2 = testinfra::make_ec_p256_key();
  testinfra::CertOptions opts;
  auto c1 = testinfra::make_certificate(k1.get(), opts);
  auto c2 = testinfra::make_certificate(k2.get(), opts);
  EXPECT_NE(fingerprint::of_certificate(c1.get()).value(),
            fingerprint::of_certificate(c2.get()).value());
}

TEST(FingerprintTest, PemMatchesCertificate) {
  auto key = testinfra::make_ec_p256_key();
  auto cert = testinfra::make_certificate(key.get(), {});
  auto pem = testinfra::to_pem(cert.get());

  auto from_pem = fingerprint::from_pem(pem);
  ASSERT_TRUE(from_pem.is_ok()) << from_pem.error();
  EXPECT_EQ(from_pem.value(), fingerprint::of_certificate(cert.get()).value());

  testinfra::TempDir dir("lanlink-fp");
  auto file = dir.path / "node.pem";
  {
    std::ofstream ofs(file);
    ofs << pem;
  }
  auto from_file = fingerprint::from_pem_file(file);
  ASSERT_TRUE(from_file.is_ok()) << from_file.error();
  EXPECT_EQ(from_file.value(), from_pem.value());
}

TEST(FingerprintTest, RejectsGarbageAndMissingFiles) {
  EXPECT_TRUE(fingerprint::from_pem("not a certificate").is_err());

  testinfra::TempDir dir("lanlink-fp");
  auto missing = fingerprint::from_pem_file(dir.path / "absent.pem");
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().code, my_errors::GENERAL::FILE_NOT_FOUND);
}

TEST(FingerprintTest, DisplayGroupsPairCharacters) {
  EXPECT_EQ(fingerprint::to_display_groups("abcdef"), "ab cd ef");
  EXPECT_EQ(fingerprint::to_display_groups("abcde"), "ab cd e");
  EXPECT_EQ(fingerprint::to_display_groups(""), "");
}

} // namespace
