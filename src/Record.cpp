#include "paribind/Record.h"

namespace paribind {
namespace {

const std::string *findField(const FieldMap &fields, const std::string &key) {
  auto it = fields.find(key);
  if (it == fields.end()) {
    return nullptr;
  }
  return &it->second;
}

} // namespace

bool recordFromFields(const FieldMap &fields, FunctionRecord &out, std::string &error) {
  out = FunctionRecord{};
  const std::string *function = findField(fields, "function");
  if (function == nullptr || function->empty()) {
    error = "catalog record has no Function field";
    return false;
  }
  out.function = *function;
  if (const std::string *value = findField(fields, "cname")) {
    out.cname = *value;
  }
  if (const std::string *value = findField(fields, "prototype")) {
    out.prototype = *value;
  }
  if (const std::string *value = findField(fields, "help")) {
    out.help = *value;
  }
  if (const std::string *value = findField(fields, "class")) {
    out.className = *value;
  }
  if (const std::string *value = findField(fields, "section")) {
    out.section = *value;
  }
  if (const std::string *value = findField(fields, "obsolete")) {
    out.obsolete = *value;
  }
  if (const std::string *value = findField(fields, "doc")) {
    out.doc = *value;
  }
  return true;
}

} // namespace paribind
