#include "cqa/source/source_loader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>
#include <utility>

namespace cqa::source {

core::Result<SourceUnit, std::string> load_source_file(const std::string& path) {
  using LoadResult = core::Result<SourceUnit, std::string>;

  // Directories open fine on Linux and only fail on the first read.
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return LoadResult::err("Failed to open file: " + path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return LoadResult::err("Failed to open file: " + path);
  }

  std::string data;
  try {
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  } catch (const std::ios_base::failure&) {
    return LoadResult::err("Failed to read file: " + path);
  }
  if (file.bad()) {
    return LoadResult::err("Failed to read file: " + path);
  }

  return LoadResult::ok(SourceUnit::from_text(path, data));
}

core::Result<std::vector<std::string>, std::string> discover_python_files(
    const std::string& root) {
  using ListResult = core::Result<std::vector<std::string>, std::string>;
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return ListResult::err("Directory not found: " + root);
  }

  std::vector<std::string> files;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return ListResult::err("Failed to list directory " + root + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return ListResult::err("Failed to list directory " + root + ": " + ec.message());
    }
    if (it->is_regular_file(ec) && it->path().extension() == ".py") {
      files.push_back(it->path().generic_string());
    }
  }

  std::sort(files.begin(), files.end());
  return ListResult::ok(std::move(files));
}

}  // namespace cqa::source
