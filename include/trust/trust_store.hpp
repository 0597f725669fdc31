#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "result_monad.hpp"

namespace lanlink {
namespace trust {

inline constexpr const char kTrustFileName[] = ".known-clients";

// All identities pinned to one fingerprint.
struct TrustedFingerprint {
  std::string fingerprint;
  std::vector<std::string> hosts;
};

// Server identity (DNS name) -> approved fingerprint, mirrored to
// `<base>/.known-clients`. Every mutation rewrites the whole file before it
// returns; when the write fails the in-memory map keeps its previous content.
class TrustStore {
public:
  // Creates `base_dir` when missing and loads an existing trust file. A
  // malformed file is a PERSISTENCE::SERIALIZATION error.
  static monad::MyResult<std::unique_ptr<TrustStore>>
  open(const std::filesystem::path &base_dir);

  std::optional<std::string> lookup(const std::string &identity) const;

  // Pin every domain to `fingerprint`, replacing any earlier pin.
  monad::MyVoidResult trust(const std::vector<std::string> &domains,
                            const std::string &fingerprint);

  // Drop every identity pinned to `fingerprint`. NOT_FOUND if there is none.
  monad::MyVoidResult remove_fingerprint(const std::string &fingerprint);

  // Replace the identity set of `fingerprint` with `hosts`.
  monad::MyVoidResult replace_hosts(const std::string &fingerprint,
                                    const std::vector<std::string> &hosts);

  // Grouped by fingerprint, hosts sorted.
  std::vector<TrustedFingerprint> list() const;

  std::size_t size() const;
  const std::filesystem::path &report_path() const { return report_path_; }

private:
  using EntryMap = std::map<std::string, std::string>;

  explicit TrustStore(std::filesystem::path report_path, EntryMap entries);

  // Persist entries_, or restore `previous` and return the failure.
  monad::MyVoidResult commit_locked(EntryMap previous);

  static monad::MyVoidResult validate_identities(
      const std::vector<std::string> &domains);

  std::filesystem::path report_path_;
  mutable std::mutex mutex_;
  EntryMap entries_;
};

} // namespace trust
} // namespace lanlink
