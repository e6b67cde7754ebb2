#include "paribind/DescReader.h"
#include "paribind/DocProvider.h"
#include "paribind/Generator.h"
#include "paribind/Options.h"
#include "paribind/PrototypeParser.h"
#include "paribind/Record.h"
#include "paribind/StagedOutput.h"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
std::string trimWhitespace(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

void addUniqueName(std::vector<std::string> &list, const std::string &name) {
  for (const auto &existing : list) {
    if (existing == name) {
      return;
    }
  }
  list.push_back(name);
}

bool parseNameList(const std::string &text, std::vector<std::string> &out, std::string &error) {
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(',', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string token = trimWhitespace(text.substr(start, end - start));
    if (!token.empty()) {
      if (!paribind::isValidFunctionName(token)) {
        error = "invalid function name: " + token;
        return false;
      }
      addUniqueName(out, token);
    }
    if (end == text.size()) {
      break;
    }
    start = end + 1;
  }
  return true;
}

bool parseArgs(int argc, char **argv, paribind::Options &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--out-dir" && i + 1 < argc) {
      out.outDir = argv[++i];
    } else if (arg.rfind("--out-dir=", 0) == 0) {
      out.outDir = arg.substr(std::string("--out-dir=").size());
    } else if (arg == "--gen-file" && i + 1 < argc) {
      out.genFile = argv[++i];
    } else if (arg.rfind("--gen-file=", 0) == 0) {
      out.genFile = arg.substr(std::string("--gen-file=").size());
    } else if (arg == "--instance-file" && i + 1 < argc) {
      out.instanceFile = argv[++i];
    } else if (arg.rfind("--instance-file=", 0) == 0) {
      out.instanceFile = arg.substr(std::string("--instance-file=").size());
    } else if (arg == "--decl-file" && i + 1 < argc) {
      out.declFile = argv[++i];
    } else if (arg.rfind("--decl-file=", 0) == 0) {
      out.declFile = arg.substr(std::string("--decl-file=").size());
    } else if (arg == "--deny" && i + 1 < argc) {
      if (!parseNameList(argv[++i], out.denyNames, error)) {
        return false;
      }
    } else if (arg.rfind("--deny=", 0) == 0) {
      if (!parseNameList(arg.substr(std::string("--deny=").size()), out.denyNames, error)) {
        return false;
      }
    } else if (arg == "--allow" && i + 1 < argc) {
      if (!parseNameList(argv[++i], out.allowNames, error)) {
        return false;
      }
    } else if (arg.rfind("--allow=", 0) == 0) {
      if (!parseNameList(arg.substr(std::string("--allow=").size()), out.allowNames, error)) {
        return false;
      }
    } else if (arg == "--dump-signature" && i + 1 < argc) {
      out.dumpSignature = true;
      out.dumpPrototype = argv[++i];
    } else if (arg.rfind("--dump-signature=", 0) == 0) {
      out.dumpSignature = true;
      out.dumpPrototype = arg.substr(std::string("--dump-signature=").size());
    } else if (arg == "--help-text" && i + 1 < argc) {
      out.dumpHelp = argv[++i];
    } else if (arg.rfind("--help-text=", 0) == 0) {
      out.dumpHelp = arg.substr(std::string("--help-text=").size());
    } else if (arg == "--quiet") {
      out.quiet = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return false;
    } else {
      if (!out.descPath.empty()) {
        return false;
      }
      out.descPath = arg;
    }
  }
  if (out.dumpSignature) {
    return true;
  }
  if (out.genFile.empty() || out.instanceFile.empty() || out.declFile.empty()) {
    error = "output file names cannot be empty";
    return false;
  }
  return !out.descPath.empty();
}

std::string outputPath(const paribind::Options &options, const std::string &file) {
  std::filesystem::path path(file);
  if (path.is_absolute() || options.outDir.empty() || options.outDir == ".") {
    return path.string();
  }
  return (std::filesystem::path(options.outDir) / path).string();
}

paribind::GeneratorConfig makeConfig(const paribind::Options &options) {
  paribind::GeneratorConfig config;
  config.genPath = outputPath(options, options.genFile);
  config.instancePath = outputPath(options, options.instanceFile);
  config.declPath = outputPath(options, options.declFile);
  for (const auto &name : options.denyNames) {
    config.rules.denyList.insert(name);
  }
  for (const auto &name : options.allowNames) {
    config.rules.denyList.erase(name);
  }
  return config;
}
} // namespace

int main(int argc, char **argv) {
  paribind::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << "Usage: paribind <pari.desc> [--out-dir <dir>] [--gen-file <name>] [--instance-file <name>] "
                 "[--decl-file <name>] [--deny <names>] [--allow <names>] [--quiet]\n"
                 "       paribind --dump-signature <prototype> [--help-text <help>]\n";
    return 2;
  }

  std::string error;
  if (options.dumpSignature) {
    paribind::CallSignature signature;
    if (!paribind::parsePrototype(options.dumpPrototype, options.dumpHelp, signature, error)) {
      std::cerr << "Prototype error: " << error << "\n";
      return 2;
    }
    std::cout << paribind::describeSignature(signature) << "\n";
    return 0;
  }

  paribind::DescReader reader;
  paribind::DescCatalog catalog;
  if (!reader.readFile(options.descPath, catalog, error)) {
    std::cerr << "Catalog error: " << error << "\n";
    return 2;
  }
  std::vector<paribind::FunctionRecord> records;
  records.reserve(catalog.size());
  for (const auto &entry : catalog) {
    paribind::FunctionRecord record;
    if (!paribind::recordFromFields(entry.second, record, error)) {
      std::cerr << "Catalog error: " << error << "\n";
      return 2;
    }
    records.push_back(std::move(record));
  }

  paribind::RecordDocProvider docs(records);
  paribind::Generator generator(makeConfig(options), docs);
  std::ostringstream discarded;
  std::ostream &progress = options.quiet ? static_cast<std::ostream &>(discarded) : std::cout;
  paribind::GeneratedFiles files;
  if (!generator.generate(records, files, progress, std::cerr, error)) {
    std::cerr << "Generate error: " << error << "\n";
    return 3;
  }
  if (!paribind::writeStaged(generator.stagedFiles(files), error)) {
    std::cerr << "Output error: " << error << "\n";
    return 3;
  }
  return 0;
}
