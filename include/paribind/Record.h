#pragma once

#include <map>
#include <optional>
#include <string>

namespace paribind {

// Catalog fields of one function, keyed by lower-cased field name ("cname", "prototype", ...).
using FieldMap = std::map<std::string, std::string>;

struct FunctionRecord {
  std::string function;
  std::string cname;
  std::string prototype;
  std::string help;
  std::string className = "unknown";
  std::string section = "unknown";
  std::optional<std::string> obsolete;
  std::optional<std::string> doc;
};

bool recordFromFields(const FieldMap &fields, FunctionRecord &out, std::string &error);

} // namespace paribind
