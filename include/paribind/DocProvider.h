#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "paribind/Record.h"

namespace paribind {

class DocProvider {
public:
  virtual ~DocProvider() = default;

  // Formatted prose for a generated docstring, or an empty string for none.
  virtual std::string getDoc(const std::string &functionName) const = 0;
};

// Uses each record's doc override, falling back to the description in its help text.
class RecordDocProvider : public DocProvider {
public:
  RecordDocProvider() = default;
  explicit RecordDocProvider(const std::vector<FunctionRecord> &records);

  void add(const FunctionRecord &record);
  void set(const std::string &functionName, std::string doc);
  std::string getDoc(const std::string &functionName) const override;

private:
  std::unordered_map<std::string, std::string> docs_;
};

std::string helpDescription(const std::string &help);

} // namespace paribind
