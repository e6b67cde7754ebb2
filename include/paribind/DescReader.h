#pragma once

#include <map>
#include <string>

#include "paribind/Record.h"

namespace paribind {

// Function name to catalog fields; later records with the same name replace earlier ones.
using DescCatalog = std::map<std::string, FieldMap>;

class DescReader {
public:
  bool readFile(const std::string &path, DescCatalog &out, std::string &error) const;
  bool parse(const std::string &text, DescCatalog &out, std::string &error) const;

private:
  bool finishRecord(FieldMap &fields, int line, DescCatalog &out, std::string &error) const;
};

} // namespace paribind
