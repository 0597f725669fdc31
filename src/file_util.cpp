#include "util/file_util.hpp"

#include <fmt/format.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

#include "my_error_codes.hpp"

namespace lanlink {
namespace fileutil {
namespace fs = std::filesystem;
namespace json = boost::json;

namespace {

std::string generate_temp_suffix() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<std::uint64_t> dist;
  std::uint64_t random_part = dist(gen);
  return fmt::format("{}.{}", now, random_part);
}

void pretty_print_impl(std::ostream &os, const json::value &jv,
                       std::string &indent) {
  switch (jv.kind()) {
  case json::kind::object: {
    const auto &obj = jv.get_object();
    if (obj.empty()) {
      os << "{}";
      return;
    }
    os << "{\n";
    indent.append(2, ' ');
    auto it = obj.begin();
    for (;;) {
      os << indent << json::serialize(it->key()) << ": ";
      pretty_print_impl(os, it->value(), indent);
      if (++it == obj.end())
        break;
      os << ",\n";
    }
    os << "\n";
    indent.resize(indent.size() - 2);
    os << indent << "}";
    break;
  }
  case json::kind::array: {
    const auto &arr = jv.get_array();
    if (arr.empty()) {
      os << "[]";
      return;
    }
    os << "[\n";
    indent.append(2, ' ');
    auto it = arr.begin();
    for (;;) {
      os << indent;
      pretty_print_impl(os, *it, indent);
      if (++it == arr.end())
        break;
      os << ",\n";
    }
    os << "\n";
    indent.resize(indent.size() - 2);
    os << indent << "]";
    break;
  }
  default:
    os << json::serialize(jv);
    break;
  }
}

} // namespace

monad::MyVoidResult ensure_directory(const fs::path &dir) {
  if (dir.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::CONFIG::INVALID_PATH, "Base directory path is empty"));
  }
  std::error_code ec;
  if (fs::exists(dir, ec)) {
    if (!fs::is_directory(dir, ec)) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::CONFIG::NOT_A_DIRECTORY,
          fmt::format("The specified path is not a directory: {}",
                      dir.string())));
    }
    return monad::MyVoidResult::Ok();
  }
  if (!fs::create_directories(dir, ec) && ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::CONFIG::DIRECTORY_CREATION,
        fmt::format("Failed to create directory {}: {}", dir.string(),
                    ec.message())));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<std::optional<std::string>>
read_file_if_exists(const fs::path &path) {
  using R = monad::MyResult<std::optional<std::string>>;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return R::Ok(std::nullopt);
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return R::Err(monad::make_error(
        my_errors::PERSISTENCE::FILE_READ_WRITE,
        fmt::format("Unable to open file: {}", path.string())));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    return R::Err(monad::make_error(
        my_errors::PERSISTENCE::FILE_READ_WRITE,
        fmt::format("Failed reading file: {}", path.string())));
  }
  return R::Ok(std::move(content));
}

monad::MyVoidResult write_file_atomic(const fs::path &path,
                                      const std::string &content) {
  auto tmp_name = path;
  tmp_name += ".tmp-";
  tmp_name += generate_temp_suffix();

  {
    std::ofstream ofs(tmp_name, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::PERSISTENCE::FILE_READ_WRITE,
          fmt::format("Unable to open temporary file: {}",
                      tmp_name.string())));
    }
    ofs << content;
    ofs.flush();
    if (!ofs) {
      std::error_code ignored;
      fs::remove(tmp_name, ignored);
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::PERSISTENCE::FILE_READ_WRITE,
          fmt::format("Failed writing temporary file: {}",
                      tmp_name.string())));
    }
  }

  std::error_code ec;
  // Atomic replace
  fs::rename(tmp_name, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_name, ignored);
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::PERSISTENCE::FILE_READ_WRITE,
        fmt::format("Failed to replace {}: {}", path.string(), ec.message())));
  }

#ifndef _WIN32
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
#endif
  return monad::MyVoidResult::Ok();
}

std::string pretty_print(const json::value &jv) {
  std::ostringstream os;
  std::string indent;
  pretty_print_impl(os, jv, indent);
  os << "\n";
  return os.str();
}

} // namespace fileutil
} // namespace lanlink
