#include "paribind/Generator.h"

#include <algorithm>
#include <utility>

#include "paribind/PrototypeParser.h"

namespace paribind {

Generator::Generator(GeneratorConfig config, const DocProvider &docs)
    : config_(std::move(config)), filter_(config_.rules), docs_(docs) {}

bool Generator::canHandle(const FunctionRecord &record) const {
  return filter_.accepts(record.function, record.className, record.section);
}

bool Generator::handleFunction(const FunctionRecord &record,
                               GeneratedFiles &out,
                               Outcome &outcome,
                               std::string &skipReason,
                               std::string &error) const {
  outcome = Outcome::Skipped;
  skipReason.clear();
  if (record.cname.empty()) {
    error = "function " + record.function + " has no C-Name";
    return false;
  }

  CallSignature plain;
  CallSignature instance;
  if (!parsePrototype(record.prototype, record.help, plain, skipReason)) {
    return true;
  }
  if (!parsePrototype(record.prototype, record.help, instance, skipReason, {makeInstanceArgument()})) {
    return true;
  }

  const std::string doc = docs_.getDoc(record.function);
  out.decl += emitter_.emitDeclaration(record.cname, plain);

  if (!plain.arguments.empty() && plain.arguments.front().kind == Argument::Kind::NativeValue) {
    MethodRequest request;
    request.function = record.function;
    request.cname = record.cname;
    request.arguments = &plain.arguments;
    request.callArguments = &plain.arguments;
    request.ret = &plain.ret;
    request.doc = doc;
    request.obsolete = record.obsolete;
    out.gen += emitter_.emitMethod(request);
  }

  std::vector<Argument> callArgs(instance.arguments.begin() + 1, instance.arguments.end());
  MethodRequest request;
  request.function = record.function;
  request.cname = record.cname;
  request.arguments = &instance.arguments;
  request.callArguments = &callArgs;
  request.ret = &instance.ret;
  request.doc = doc;
  request.obsolete = record.obsolete;
  out.instance += emitter_.emitMethod(request);

  outcome = Outcome::Emitted;
  return true;
}

bool Generator::generate(const std::vector<FunctionRecord> &records,
                         GeneratedFiles &out,
                         std::ostream &progress,
                         std::ostream &diagnostics,
                         std::string &error) const {
  std::vector<const FunctionRecord *> sorted;
  sorted.reserve(records.size());
  for (const auto &record : records) {
    sorted.push_back(&record);
  }
  std::stable_sort(sorted.begin(), sorted.end(), [](const FunctionRecord *a, const FunctionRecord *b) {
    return a->function < b->function;
  });

  GeneratedFiles files;
  files.gen = emitter_.genBanner(config_.sourceName);
  files.instance = emitter_.instanceBanner(config_.sourceName);
  files.decl = emitter_.declBanner(config_.sourceName);

  progress << "Generating PARI functions:";
  bool havePlotSvg = false;
  std::vector<std::string> skipped;
  for (const FunctionRecord *record : sorted) {
    if (!canHandle(*record)) {
      progress << " (" << record->function << ")";
      continue;
    }
    progress << " " << record->function;
    progress.flush();
    Outcome outcome = Outcome::Skipped;
    std::string skipReason;
    if (!handleFunction(*record, files, outcome, skipReason, error)) {
      progress << "\n";
      return false;
    }
    if (outcome == Outcome::Skipped) {
      skipped.push_back(record->function + ": " + skipReason);
    }
    if (outcome == Outcome::Emitted && record->function == "plothraw") {
      havePlotSvg = true;
    }
  }
  progress << "\n";
  for (const auto &message : skipped) {
    diagnostics << "Prototype error: " << message << "\n";
  }

  files.instance += std::string("DEF HAVE_PLOT_SVG = ") + (havePlotSvg ? "True" : "False") + "\n";
  out = std::move(files);
  return true;
}

std::vector<StagedFile> Generator::stagedFiles(const GeneratedFiles &files) const {
  return {{config_.genPath, files.gen}, {config_.instancePath, files.instance}, {config_.declPath, files.decl}};
}

bool Generator::run(const std::vector<FunctionRecord> &records,
                    std::ostream &progress,
                    std::ostream &diagnostics,
                    std::string &error) const {
  GeneratedFiles files;
  if (!generate(records, files, progress, diagnostics, error)) {
    return false;
  }
  return writeStaged(stagedFiles(files), error);
}

} // namespace paribind
