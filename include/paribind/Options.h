#pragma once

#include <string>
#include <vector>

namespace paribind {
struct Options {
  std::string descPath;
  std::string outDir = "cypari2";
  std::string genFile = "auto_gen.pxi";
  std::string instanceFile = "auto_instance.pxi";
  std::string declFile = "auto_paridecl.pxd";
  std::vector<std::string> denyNames;
  std::vector<std::string> allowNames;
  std::string dumpPrototype;
  std::string dumpHelp;
  bool dumpSignature = false;
  bool quiet = false;
};
} // namespace paribind
