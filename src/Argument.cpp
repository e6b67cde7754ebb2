#include "paribind/Argument.h"

#include <sstream>

namespace paribind {
namespace {

constexpr const char *Indent = "        ";

std::string warnLines(const std::string &indent, const std::string &message) {
  std::string out;
  out += indent + "from warnings import warn\n";
  out += indent + "warn('" + message + "', DeprecationWarning)\n";
  return out;
}

} // namespace

bool Argument::isHostObject() const {
  switch (kind) {
  case Kind::NativeValue:
  case Kind::String:
  case Kind::Variable:
    return true;
  case Kind::SmallInt:
  case Kind::UnsignedInt:
  case Kind::Precision:
  case Kind::InstanceContext:
    return false;
  }
  return false;
}

bool Argument::needsConversion() const {
  switch (kind) {
  case Kind::NativeValue:
  case Kind::String:
  case Kind::Variable:
  case Kind::Precision:
    return true;
  case Kind::SmallInt:
  case Kind::UnsignedInt:
  case Kind::InstanceContext:
    return false;
  }
  return false;
}

std::string Argument::tempName() const {
  return "_" + name;
}

std::string Argument::declaredType() const {
  switch (kind) {
  case Kind::NativeValue:
    return "GEN";
  case Kind::String:
    return isRest ? "GEN" : "char*";
  case Kind::SmallInt:
  case Kind::Variable:
  case Kind::Precision:
    return "long";
  case Kind::UnsignedInt:
    return "ulong";
  case Kind::InstanceContext:
    return "";
  }
  return "";
}

std::string Argument::parameterFragment() const {
  if (isRest) {
    return "*" + name;
  }
  switch (kind) {
  case Kind::InstanceContext:
    return name;
  case Kind::NativeValue:
    if (index == 0) {
      return name;
    }
    return isOptional() ? name + "=None" : name;
  case Kind::String:
  case Kind::Variable:
    return isOptional() ? name + "=None" : name;
  case Kind::SmallInt:
  case Kind::Precision:
    return isOptional() ? "long " + name + "=" + *defaultValue : "long " + name;
  case Kind::UnsignedInt:
    return isOptional() ? "unsigned long " + name + "=" + *defaultValue : "unsigned long " + name;
  }
  return name;
}

std::string Argument::conversionStatements() const {
  const std::string tmp = tempName();
  std::string out;
  switch (kind) {
  case Kind::NativeValue:
    if (index == 0) {
      out += Indent + ("cdef GEN " + tmp + " = " + name + ".g\n");
    } else if (isRest || !isOptional()) {
      out += Indent + (name + " = objtogen(" + name + ")\n");
      out += Indent + ("cdef GEN " + tmp + " = (<Gen>" + name + ").g\n");
    } else {
      const std::string initial = *defaultValue == "0" ? "gen_0" : "NULL";
      out += Indent + ("cdef GEN " + tmp + " = " + initial + "\n");
      out += Indent + ("if " + name + " is not None:\n");
      out += Indent + ("    " + name + " = objtogen(" + name + ")\n");
      out += Indent + ("    " + tmp + " = (<Gen>" + name + ").g\n");
    }
    return out;
  case Kind::String:
    if (isRest) {
      out += Indent + (name + " = objtogen(" + name + ")\n");
      out += Indent + ("cdef GEN " + tmp + " = (<Gen>" + name + ").g\n");
    } else if (!isOptional()) {
      out += Indent + (name + " = to_bytes(" + name + ")\n");
      out += Indent + ("cdef char* " + tmp + " = <bytes>" + name + "\n");
    } else {
      out += Indent + ("cdef char* " + tmp + " = " + *defaultValue + "\n");
      out += Indent + ("if " + name + " is not None:\n");
      out += Indent + ("    " + name + " = to_bytes(" + name + ")\n");
      out += Indent + ("    " + tmp + " = <bytes>" + name + "\n");
    }
    return out;
  case Kind::Variable:
    if (!isOptional()) {
      out += Indent + ("cdef long " + tmp + " = get_var(" + name + ")\n");
    } else {
      out += Indent + ("cdef long " + tmp + " = " + *defaultValue + "\n");
      out += Indent + ("if " + name + " is not None:\n");
      out += Indent + ("    " + tmp + " = get_var(" + name + ")\n");
    }
    return out;
  case Kind::Precision:
    switch (precisionUnit) {
    case PrecisionUnit::Words:
      out += Indent + (name + " = prec_bits_to_words(" + name + ")\n");
      break;
    case PrecisionUnit::Bits:
      out += Indent + ("if not " + name + ":\n");
      out += Indent + ("    " + name + " = default_bitprec()\n");
      break;
    case PrecisionUnit::Series:
      out += Indent + ("if " + name + " < 0:\n");
      out += Indent + ("    " + name + " = precdl  # Global PARI series precision\n");
      break;
    }
    return out;
  case Kind::SmallInt:
  case Kind::UnsignedInt:
  case Kind::InstanceContext:
    return out;
  }
  return out;
}

std::string Argument::callFragment() const {
  switch (kind) {
  case Kind::NativeValue:
  case Kind::String:
  case Kind::Variable:
    return tempName();
  case Kind::SmallInt:
  case Kind::UnsignedInt:
  case Kind::Precision:
  case Kind::InstanceContext:
    return name;
  }
  return name;
}

std::string Argument::deprecationFragment(const std::string &functionName) const {
  if (!undocumented) {
    return "";
  }
  const std::string message = "argument " + std::to_string(position) + " of the PARI/GP function " + functionName +
                              " is undocumented";
  if (!isOptional() || isRest) {
    return warnLines(Indent, message);
  }
  std::string out = Indent;
  if (isHostObject()) {
    out += "if " + name + " is not None:\n";
  } else {
    out += "if " + name + " != " + *defaultValue + ":\n";
  }
  out += warnLines(std::string(Indent) + "    ", message);
  return out;
}

std::string Argument::describe() const {
  if (kind == Kind::InstanceContext) {
    return name;
  }
  std::string type;
  switch (kind) {
  case Kind::NativeValue:
    type = "GEN";
    break;
  case Kind::String:
    type = "str";
    break;
  case Kind::Variable:
    type = "var";
    break;
  case Kind::SmallInt:
  case Kind::Precision:
    type = "long";
    break;
  case Kind::UnsignedInt:
    type = "ulong";
    break;
  case Kind::InstanceContext:
    break;
  }
  std::string out = type + " " + (isRest ? "*" : "") + name;
  if (isOptional()) {
    out += "=" + *defaultValue;
  }
  return out;
}

Argument makeInstanceArgument() {
  Argument arg;
  arg.kind = Argument::Kind::InstanceContext;
  arg.name = "self";
  return arg;
}

std::string Return::declaredType() const {
  switch (kind) {
  case Kind::Handle:
  case Kind::SharedHandle:
    return "GEN";
  case Kind::Int:
    return "int";
  case Kind::Long:
    return "long";
  case Kind::ULong:
    return "ulong";
  case Kind::Void:
    return "void";
  case Kind::String:
    return "char*";
  }
  return "GEN";
}

std::string Return::assignFragment(const std::string &callExpr) const {
  if (kind == Kind::Void) {
    return Indent + callExpr + "\n";
  }
  return Indent + ("cdef " + declaredType() + " _ret = " + callExpr + "\n");
}

std::string Return::returnStatement() const {
  std::string out;
  switch (kind) {
  case Kind::Handle:
    out += Indent + std::string("return new_gen(_ret)\n");
    break;
  case Kind::SharedHandle:
    out += Indent + std::string("_ret = gcopy(_ret)\n");
    out += Indent + std::string("return new_gen(_ret)\n");
    break;
  case Kind::Int:
  case Kind::Long:
  case Kind::ULong:
    out += Indent + std::string("clear_stack()\n");
    out += Indent + std::string("return _ret\n");
    break;
  case Kind::Void:
    out += Indent + std::string("clear_stack()\n");
    break;
  case Kind::String:
    out += Indent + std::string("_str = to_string(_ret)\n");
    out += Indent + std::string("clear_stack()\n");
    out += Indent + std::string("return _str\n");
    break;
  }
  return out;
}

std::string describeSignature(const CallSignature &signature) {
  std::ostringstream out;
  out << "(";
  for (size_t i = 0; i < signature.arguments.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << signature.arguments[i].describe();
  }
  out << ") -> " << signature.ret.declaredType();
  return out.str();
}

} // namespace paribind
