#include "paribind/MethodEmitter.h"

#include <sstream>

namespace paribind {
namespace {

std::string joinParameters(const std::vector<Argument> &args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += args[i].parameterFragment();
  }
  return out;
}

std::string joinCallArguments(const std::vector<Argument> &args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += args[i].callFragment();
  }
  return out;
}

} // namespace

std::string MethodEmitter::emitDeclaration(const std::string &cname, const CallSignature &signature) const {
  std::ostringstream out;
  out << "    " << signature.ret.declaredType() << " " << cname << "(";
  bool first = true;
  for (const auto &arg : signature.arguments) {
    if (arg.kind == Argument::Kind::InstanceContext) {
      continue;
    }
    if (!first) {
      out << ", ";
    }
    first = false;
    out << arg.declaredType();
  }
  out << ")\n";
  return out.str();
}

// Template: signature, docstring, obsolescence warning, undocumented argument
// warnings, conversions, sig_on(), call with capture, return or clear.
std::string MethodEmitter::emitMethod(const MethodRequest &request) const {
  const std::vector<Argument> &args = *request.arguments;
  std::ostringstream out;
  out << "    def " << request.function << "(" << joinParameters(args) << "):\n";
  if (!request.doc.empty()) {
    out << "        r'''\n";
    out << "        " << indentDoc(request.doc) << "\n";
    out << "        '''\n";
  }
  if (request.obsolete) {
    out << "        from warnings import warn\n";
    out << "        warn('the PARI/GP function " << request.function << " is obsolete (" << *request.obsolete
        << ")', DeprecationWarning)\n";
  }
  for (const auto &arg : args) {
    out << arg.deprecationFragment(request.function);
  }
  for (const auto &arg : args) {
    out << arg.conversionStatements();
  }
  out << "        sig_on()\n";
  out << request.ret->assignFragment(request.cname + "(" + joinCallArguments(*request.callArguments) + ")");
  out << request.ret->returnStatement();
  out << "\n";
  return out.str();
}

std::string MethodEmitter::genBanner(const std::string &sourceName) const {
  std::ostringstream out;
  out << "# This file is auto-generated by " << sourceName << "\n\n";
  out << "cdef class Gen_auto:\n";
  out << "    \"\"\"\n";
  out << "    Part of the :class:`Gen` class containing auto-generated functions.\n\n";
  out << "    This class is not meant to be used directly, use the derived class\n";
  out << "    :class:`Gen` instead.\n";
  out << "    \"\"\"\n";
  return out.str();
}

std::string MethodEmitter::instanceBanner(const std::string &sourceName) const {
  std::ostringstream out;
  out << "# This file is auto-generated by " << sourceName << "\n\n";
  out << "cdef class Pari_auto:\n";
  out << "    \"\"\"\n";
  out << "    Part of the :class:`Pari` class containing auto-generated functions.\n\n";
  out << "    You must never use this class directly (in fact, Python may crash\n";
  out << "    if you do), use the derived class :class:`Pari` instead.\n";
  out << "    \"\"\"\n";
  return out.str();
}

std::string MethodEmitter::declBanner(const std::string &sourceName) const {
  std::ostringstream out;
  out << "# This file is auto-generated by " << sourceName << "\n\n";
  out << "from .types cimport *\n\n";
  out << "cdef extern from *:\n";
  return out.str();
}

std::string MethodEmitter::indentDoc(const std::string &doc) const {
  std::string out;
  out.reserve(doc.size());
  for (char c : doc) {
    out.push_back(c);
    if (c == '\n') {
      out += "        ";
    }
  }
  return out;
}

} // namespace paribind
