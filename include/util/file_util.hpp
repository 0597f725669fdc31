#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

#include "result_monad.hpp"

namespace lanlink {
namespace fileutil {

// Create `dir` (and parents) when absent. An existing non-directory path is a
// CONFIG::NOT_A_DIRECTORY error.
monad::MyVoidResult ensure_directory(const std::filesystem::path &dir);

// Whole file contents, or std::nullopt when the file does not exist.
monad::MyResult<std::optional<std::string>>
read_file_if_exists(const std::filesystem::path &path);

// Write to a sibling temporary file and rename it over `path`, so readers see
// either the old or the new content. The file is left owner read/write only.
monad::MyVoidResult write_file_atomic(const std::filesystem::path &path,
                                      const std::string &content);

// Indented JSON with one member per line, for files meant to be hand edited.
std::string pretty_print(const boost::json::value &jv);

} // namespace fileutil
} // namespace lanlink
