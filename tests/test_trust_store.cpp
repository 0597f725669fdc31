#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <fstream>
#include <sstream>
#include <string>

#include "my_error_codes.hpp"
#include "test_temp_dir.hpp"
#include "trust/trust_store.hpp"

namespace {

using namespace lanlink;
using trust::TrustStore;

const std::string kFpA(40, 'A');
const std::string kFpB(40, 'B');

std::string read_all(const std::filesystem::path &p) {
  std::ifstream ifs(p);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

TEST(TrustStoreTest, OpenWithoutFileIsEmptyAndWritesNothing) {
  testinfra::TempDir dir("lanlink-trust");
  auto store = TrustStore::open(dir.path / "nested");
  ASSERT_TRUE(store.is_ok()) << store.error();
  EXPECT_EQ(store.value()->size(), 0u);
  EXPECT_TRUE(std::filesystem::is_directory(dir.path / "nested"));
  EXPECT_FALSE(std::filesystem::exists(store.value()->report_path()));
}

TEST(TrustStoreTest, TrustPersistsAndReloads) {
  testinfra::TempDir dir("lanlink-trust");
  {
    auto store = TrustStore::open(dir.path).value();
    ASSERT_TRUE(store->trust({"alpha.local", "beta.local"}, kFpA).is_ok());
  }
  auto text = read_all(dir.path / trust::kTrustFileName);
  auto jv = boost::json::parse(text);
  const auto &entries = jv.at("entries").as_object();
  EXPECT_EQ(entries.at("alpha.local").as_string(), kFpA);
  EXPECT_EQ(entries.at("beta.local").as_string(), kFpA);

  auto reopened = TrustStore::open(dir.path).value();
  EXPECT_EQ(reopened->lookup("alpha.local"), kFpA);
  EXPECT_EQ(reopened->lookup("beta.local"), kFpA);
  EXPECT_FALSE(reopened->lookup("gamma.local").has_value());
}

TEST(TrustStoreTest, RetrustReplacesPin) {
  testinfra::TempDir dir("lanlink-trust");
  auto store = TrustStore::open(dir.path).value();
  ASSERT_TRUE(store->trust({"alpha.local"}, kFpA).is_ok());
  ASSERT_TRUE(store->trust({"alpha.local"}, kFpB).is_ok());
  EXPECT_EQ(store->lookup("alpha.local"), kFpB);
  EXPECT_EQ(store->size(), 1u);
}

TEST(TrustStoreTest, RejectsIpIdentitiesAndEmptyInput) {
  testinfra::TempDir dir("lanlink-trust");
  auto store = TrustStore::open(dir.path).value();

  auto ip = store->trust({"192.168.1.10"}, kFpA);
  ASSERT_TRUE(ip.is_err());
  EXPECT_EQ(ip.error().code, my_errors::TRUST::INVALID_SERVER_NAME);

  auto v6 = store->trust({"ok.local", "fe80::1"}, kFpA);
  ASSERT_TRUE(v6.is_err());
  // Nothing from a rejected batch is applied.
  EXPECT_FALSE(store->lookup("ok.local").has_value());

  auto empty_fp = store->trust({"ok.local"}, "");
  ASSERT_TRUE(empty_fp.is_err());
  EXPECT_EQ(empty_fp.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST(TrustStoreTest, RemoveFingerprintDropsEveryHost) {
  testinfra::TempDir dir("lanlink-trust");
  auto store = TrustStore::open(dir.path).value();
  ASSERT_TRUE(store->trust({"a.local", "b.local"}, kFpA).is_ok());
  ASSERT_TRUE(store->trust({"c.local"}, kFpB).is_ok());

  ASSERT_TRUE(store->remove_fingerprint(kFpA).is_ok());
  EXPECT_FALSE(store->lookup("a.local").has_value());
  EXPECT_FALSE(store->lookup("b.local").has_value());
  EXPECT_EQ(store->lookup("c.local"), kFpB);

  auto again = store->remove_fingerprint(kFpA);
  ASSERT_TRUE(again.is_err());
  EXPECT_EQ(again.error().code, my_errors::GENERAL::NOT_FOUND);

  auto reopened = TrustStore::open(dir.path).value();
  EXPECT_EQ(reopened->size(), 1u);
}

TEST(TrustStoreTest, ReplaceHostsAndListGrouped) {
  testinfra::TempDir dir("lanlink-trust");
  auto store = TrustStore::open(dir.path).value();
  ASSERT_TRUE(store->trust({"old.local"}, kFpA).is_ok());
  ASSERT_TRUE(store->trust({"other.local"}, kFpB).is_ok());
  ASSERT_TRUE(store->replace_hosts(kFpA, {"zeta.local", "new.local"}).is_ok());

  EXPECT_FALSE(store->lookup("old.local").has_value());
  auto listed = store->list();
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].fingerprint, kFpA);
  EXPECT_EQ(listed[0].hosts,
            (std::vector<std::string>{"new.local", "zeta.local"}));
  EXPECT_EQ(listed[1].fingerprint, kFpB);
  EXPECT_EQ(listed[1].hosts, (std::vector<std::string>{"other.local"}));
}

TEST(TrustStoreTest, MalformedFileIsSerializationError) {
  testinfra::TempDir dir("lanlink-trust");
  {
    std::ofstream ofs(dir.path / trust::kTrustFileName);
    ofs << "{\"entries\": [1, 2]}";
  }
  auto store = TrustStore::open(dir.path);
  ASSERT_TRUE(store.is_err());
  EXPECT_EQ(store.error().code, my_errors::PERSISTENCE::SERIALIZATION);
}

TEST(TrustStoreTest, FailedWriteRollsBack) {
  testinfra::TempDir dir("lanlink-trust");
  auto store = TrustStore::open(dir.path).value();
  ASSERT_TRUE(store->trust({"kept.local"}, kFpA).is_ok());

  // A non-empty directory where the report lives makes the rename fail.
  std::filesystem::remove(store->report_path());
  std::filesystem::create_directories(store->report_path() / "blocker");

  auto r = store->trust({"lost.local"}, kFpB);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::PERSISTENCE::FILE_READ_WRITE);
  EXPECT_FALSE(store->lookup("lost.local").has_value());
  EXPECT_EQ(store->lookup("kept.local"), kFpA);
}

} // namespace
