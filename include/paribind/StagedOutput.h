#pragma once

#include <string>
#include <vector>

namespace paribind {

struct StagedFile {
  std::string path;
  std::string contents;
};

// Writes every file to "<path>.tmp" and renames them into place only once all
// writes succeeded. On failure no target file is touched.
bool writeStaged(const std::vector<StagedFile> &files, std::string &error);

} // namespace paribind
