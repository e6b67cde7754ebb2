#include "paribind/StagedOutput.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace paribind {
namespace {

bool writeFile(const std::string &path, const std::string &contents) {
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  file << contents;
  return file.good();
}

void removeTemporaries(const std::vector<StagedFile> &files) {
  for (const auto &file : files) {
    std::error_code ec;
    std::filesystem::remove(file.path + ".tmp", ec);
  }
}

} // namespace

bool writeStaged(const std::vector<StagedFile> &files, std::string &error) {
  for (const auto &file : files) {
    std::filesystem::path parent = std::filesystem::path(file.path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        error = "failed to create output directory: " + parent.string();
        return false;
      }
    }
  }
  for (const auto &file : files) {
    if (!writeFile(file.path + ".tmp", file.contents)) {
      error = "failed to write output: " + file.path + ".tmp";
      removeTemporaries(files);
      return false;
    }
  }
  for (const auto &file : files) {
    std::error_code ec;
    std::filesystem::rename(file.path + ".tmp", file.path, ec);
    if (ec) {
      error = "failed to rename " + file.path + ".tmp: " + ec.message();
      removeTemporaries(files);
      return false;
    }
  }
  return true;
}

} // namespace paribind
