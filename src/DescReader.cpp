#include "paribind/DescReader.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace paribind {
namespace {

std::string trim(const std::string &value) {
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

// "C-Name" becomes "cname", "Function" becomes "function".
std::string normalizeKey(const std::string &key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

} // namespace

bool DescReader::readFile(const std::string &path, DescCatalog &out, std::string &error) const {
  std::ifstream file(path);
  if (!file) {
    error = "failed to read catalog: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (!parse(buffer.str(), out, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

bool DescReader::parse(const std::string &text, DescCatalog &out, std::string &error) const {
  std::vector<std::string> lines;
  {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      lines.push_back(std::move(line));
    }
  }

  FieldMap fields;
  int recordLine = 0;
  size_t n = 0;
  while (n < lines.size()) {
    if (lines[n].empty()) {
      if (!fields.empty() && !finishRecord(fields, recordLine, out, error)) {
        return false;
      }
      ++n;
      continue;
    }
    const int lineNumber = static_cast<int>(n) + 1;
    if (lines[n][0] == ' ') {
      error = "line " + std::to_string(lineNumber) + ": continuation line outside of a field";
      return false;
    }
    std::string entry = lines[n++];
    while (n < lines.size() && !lines[n].empty() && lines[n][0] == ' ') {
      entry += "\n";
      entry += lines[n].substr(1);
      ++n;
    }
    size_t colon = entry.find(':');
    if (colon == std::string::npos) {
      error = "line " + std::to_string(lineNumber) + ": expected 'Key: value'";
      return false;
    }
    if (fields.empty()) {
      recordLine = lineNumber;
    }
    std::string key = normalizeKey(trim(entry.substr(0, colon)));
    if (key.empty()) {
      error = "line " + std::to_string(lineNumber) + ": empty field name";
      return false;
    }
    fields[key] = trim(entry.substr(colon + 1));
  }
  if (!fields.empty() && !finishRecord(fields, recordLine, out, error)) {
    return false;
  }
  return true;
}

bool DescReader::finishRecord(FieldMap &fields, int line, DescCatalog &out, std::string &error) const {
  auto it = fields.find("function");
  if (it == fields.end() || it->second.empty()) {
    error = "record at line " + std::to_string(line) + " has no Function field";
    return false;
  }
  std::string name = it->second;
  out[name] = std::move(fields);
  fields.clear();
  return true;
}

} // namespace paribind
