#include "paribind/DocProvider.h"

#include <cctype>
#include <utility>

namespace paribind {

std::string helpDescription(const std::string &help) {
  size_t marker = help.find("): ");
  if (marker == std::string::npos) {
    return "";
  }
  std::string text = help.substr(marker + 3);
  size_t end = text.size();
  while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  text.resize(end);
  if (text.empty()) {
    return text;
  }
  text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  if (text.back() != '.') {
    text += ".";
  }
  return text;
}

RecordDocProvider::RecordDocProvider(const std::vector<FunctionRecord> &records) {
  for (const auto &record : records) {
    add(record);
  }
}

void RecordDocProvider::add(const FunctionRecord &record) {
  if (record.doc) {
    docs_[record.function] = *record.doc;
  } else {
    docs_[record.function] = helpDescription(record.help);
  }
}

void RecordDocProvider::set(const std::string &functionName, std::string doc) {
  docs_[functionName] = std::move(doc);
}

std::string RecordDocProvider::getDoc(const std::string &functionName) const {
  auto it = docs_.find(functionName);
  if (it == docs_.end()) {
    return "";
  }
  return it->second;
}

} // namespace paribind
