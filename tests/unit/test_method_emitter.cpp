#include "paribind/MethodEmitter.h"
#include "paribind/PrototypeParser.h"

#include <doctest/doctest.h>

#include <optional>
#include <string>
#include <vector>

namespace {
struct EmittedMethods {
  paribind::CallSignature plain;
  paribind::CallSignature instance;
  std::vector<paribind::Argument> instanceCall;
  std::string gen;
  std::string self;
  std::string decl;
};

EmittedMethods emitBoth(const std::string &function,
                        const std::string &cname,
                        const std::string &prototype,
                        const std::string &help,
                        const std::string &doc = "",
                        std::optional<std::string> obsolete = std::nullopt) {
  EmittedMethods methods;
  std::string error;
  REQUIRE(paribind::parsePrototype(prototype, help, methods.plain, error));
  REQUIRE(paribind::parsePrototype(prototype, help, methods.instance, error, {paribind::makeInstanceArgument()}));
  methods.instanceCall.assign(methods.instance.arguments.begin() + 1, methods.instance.arguments.end());

  paribind::MethodEmitter emitter;
  paribind::MethodRequest request;
  request.function = function;
  request.cname = cname;
  request.doc = doc;
  request.obsolete = obsolete;

  request.arguments = &methods.plain.arguments;
  request.callArguments = &methods.plain.arguments;
  request.ret = &methods.plain.ret;
  methods.gen = emitter.emitMethod(request);

  request.arguments = &methods.instance.arguments;
  request.callArguments = &methods.instanceCall;
  request.ret = &methods.instance.ret;
  methods.self = emitter.emitMethod(request);

  methods.decl = emitter.emitDeclaration(cname, methods.plain);
  return methods;
}
} // namespace

TEST_SUITE_BEGIN("paribind.emitter");

TEST_CASE("emits bnfinit value method") {
  const auto methods = emitBoth("bnfinit", "bnfinit0", "GD0,L,DGp", "bnfinit(P,{flag=0},{tech=[]}): compute...");
  const std::string expected = "    def bnfinit(P, long flag=0, tech=None, long precision=0):\n"
                               "        cdef GEN _P = P.g\n"
                               "        cdef GEN _tech = NULL\n"
                               "        if tech is not None:\n"
                               "            tech = objtogen(tech)\n"
                               "            _tech = (<Gen>tech).g\n"
                               "        precision = prec_bits_to_words(precision)\n"
                               "        sig_on()\n"
                               "        cdef GEN _ret = bnfinit0(_P, flag, _tech, precision)\n"
                               "        return new_gen(_ret)\n"
                               "\n";
  CHECK(methods.gen == expected);
}

TEST_CASE("emits bnfinit instance method") {
  const auto methods = emitBoth("bnfinit", "bnfinit0", "GD0,L,DGp", "bnfinit(P,{flag=0},{tech=[]}): compute...");
  const std::string expected = "    def bnfinit(self, P, long flag=0, tech=None, long precision=0):\n"
                               "        P = objtogen(P)\n"
                               "        cdef GEN _P = (<Gen>P).g\n"
                               "        cdef GEN _tech = NULL\n"
                               "        if tech is not None:\n"
                               "            tech = objtogen(tech)\n"
                               "            _tech = (<Gen>tech).g\n"
                               "        precision = prec_bits_to_words(precision)\n"
                               "        sig_on()\n"
                               "        cdef GEN _ret = bnfinit0(_P, flag, _tech, precision)\n"
                               "        return new_gen(_ret)\n"
                               "\n";
  CHECK(methods.self == expected);
}

TEST_CASE("emits declaration lines") {
  CHECK(emitBoth("bnfinit", "bnfinit0", "GD0,L,DGp", "bnfinit(P,{flag=0},{tech=[]}): compute...").decl ==
        "    GEN bnfinit0(GEN, long, GEN, long)\n");
  CHECK(emitBoth("setrand", "setrand", "vG", "setrand(n): reset the seed").decl == "    void setrand(GEN)\n");
  CHECK(emitBoth("getrand", "getrand", "", "getrand(): current seed").decl == "    GEN getrand()\n");
}

TEST_CASE("emits variable arguments with sentinel defaults") {
  const auto methods = emitBoth("ellmodulareqn", "ellmodulareqn", "LDnDn", "ellmodulareqn(N,{x},{y}): modular equation");
  const std::string expected = "    def ellmodulareqn(self, long N, x=None, y=None):\n"
                               "        cdef long _x = -1\n"
                               "        if x is not None:\n"
                               "            _x = get_var(x)\n"
                               "        cdef long _y = -1\n"
                               "        if y is not None:\n"
                               "            _y = get_var(y)\n"
                               "        sig_on()\n"
                               "        cdef GEN _ret = ellmodulareqn(N, _x, _y)\n"
                               "        return new_gen(_ret)\n"
                               "\n";
  CHECK(methods.self == expected);
  CHECK(methods.decl == "    GEN ellmodulareqn(long, long, long)\n");
}

TEST_CASE("emits docstring and void return") {
  const auto methods = emitBoth("setrand", "setrand", "vG", "setrand(n): reset the seed", "Reset the seed.");
  const std::string expectedGen = "    def setrand(n):\n"
                                  "        r'''\n"
                                  "        Reset the seed.\n"
                                  "        '''\n"
                                  "        cdef GEN _n = n.g\n"
                                  "        sig_on()\n"
                                  "        setrand(_n)\n"
                                  "        clear_stack()\n"
                                  "\n";
  CHECK(methods.gen == expectedGen);
  const std::string expectedSelf = "    def setrand(self, n):\n"
                                   "        r'''\n"
                                   "        Reset the seed.\n"
                                   "        '''\n"
                                   "        n = objtogen(n)\n"
                                   "        cdef GEN _n = (<Gen>n).g\n"
                                   "        sig_on()\n"
                                   "        setrand(_n)\n"
                                   "        clear_stack()\n"
                                   "\n";
  CHECK(methods.self == expectedSelf);
}

TEST_CASE("indents every docstring line") {
  const auto methods = emitBoth("f", "f", "G", "f(x): f", "First line.\n\nSecond line.");
  CHECK(methods.gen.find("        r'''\n"
                         "        First line.\n"
                         "        \n"
                         "        Second line.\n"
                         "        '''\n") != std::string::npos);
}

TEST_CASE("obsolete functions warn before the call") {
  const auto methods = emitBoth("bernvec", "bernvec", "L", "bernvec(n): old", "", std::string("2007-03-30"));
  const std::string expected = "    def bernvec(self, long n):\n"
                               "        from warnings import warn\n"
                               "        warn('the PARI/GP function bernvec is obsolete (2007-03-30)', DeprecationWarning)\n"
                               "        sig_on()\n"
                               "        cdef GEN _ret = bernvec(n)\n"
                               "        return new_gen(_ret)\n"
                               "\n";
  CHECK(methods.self == expected);
}

TEST_CASE("integer results are captured and the stack is cleared") {
  const auto methods = emitBoth("issquare", "issquare", "lG", "issquare(x): square test");
  CHECK(methods.gen == "    def issquare(x):\n"
                       "        cdef GEN _x = x.g\n"
                       "        sig_on()\n"
                       "        cdef long _ret = issquare(_x)\n"
                       "        clear_stack()\n"
                       "        return _ret\n"
                       "\n");
}

TEST_CASE("undocumented arguments warn in the generated method") {
  const auto methods = emitBoth("f", "f_c", "GG", "f(x): f");
  const std::string warning = "        from warnings import warn\n"
                              "        warn('argument 2 of the PARI/GP function f is undocumented', DeprecationWarning)\n";
  CHECK(methods.gen.find(warning) != std::string::npos);
  CHECK(methods.self.find(warning) != std::string::npos);
  CHECK(methods.gen.find(warning) < methods.gen.find("sig_on()"));
}

TEST_CASE("banners name the generator and open the extern block") {
  paribind::MethodEmitter emitter;
  CHECK(emitter.genBanner("paribind").find("# This file is auto-generated by paribind\n") == 0);
  CHECK(emitter.genBanner("paribind").find("cdef class Gen_auto:\n") != std::string::npos);
  CHECK(emitter.instanceBanner("paribind").find("cdef class Pari_auto:\n") != std::string::npos);
  const std::string decl = emitter.declBanner("paribind");
  CHECK(decl.size() >= std::string("cdef extern from *:\n").size());
  CHECK(decl.substr(decl.size() - std::string("cdef extern from *:\n").size()) == "cdef extern from *:\n");
}

TEST_SUITE_END();
