#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "paribind/DocProvider.h"
#include "paribind/Eligibility.h"
#include "paribind/MethodEmitter.h"
#include "paribind/Record.h"
#include "paribind/StagedOutput.h"

namespace paribind {

struct GeneratorConfig {
  std::string genPath = "cypari2/auto_gen.pxi";
  std::string instancePath = "cypari2/auto_instance.pxi";
  std::string declPath = "cypari2/auto_paridecl.pxd";
  std::string sourceName = "paribind";
  EligibilityRules rules = {defaultDenyList()};
};

struct GeneratedFiles {
  std::string gen;
  std::string instance;
  std::string decl;
};

class Generator {
public:
  enum class Outcome { Emitted, Skipped };

  Generator(GeneratorConfig config, const DocProvider &docs);

  bool canHandle(const FunctionRecord &record) const;
  // Returns false only for a malformed record. An untranslatable prototype is
  // Outcome::Skipped with the parser message in `skipReason`.
  bool handleFunction(const FunctionRecord &record,
                      GeneratedFiles &out,
                      Outcome &outcome,
                      std::string &skipReason,
                      std::string &error) const;
  // Progress goes to `progress`; one "Prototype error:" line per skipped
  // function goes to `diagnostics` once the progress line is finished.
  bool generate(const std::vector<FunctionRecord> &records,
                GeneratedFiles &out,
                std::ostream &progress,
                std::ostream &diagnostics,
                std::string &error) const;
  std::vector<StagedFile> stagedFiles(const GeneratedFiles &files) const;
  bool run(const std::vector<FunctionRecord> &records,
           std::ostream &progress,
           std::ostream &diagnostics,
           std::string &error) const;

  const GeneratorConfig &config() const { return config_; }

private:
  GeneratorConfig config_;
  EligibilityFilter filter_;
  MethodEmitter emitter_;
  const DocProvider &docs_;
};

} // namespace paribind
