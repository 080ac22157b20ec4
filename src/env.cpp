#include "ifacec/env.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace ifacec {

CompileEnv detectEnv(){
    CompileEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("IFACEC_DEFAULT_SCALAR")) e.defaultScalar = v;
    if (const char* v = get("IFACEC_SCALAR_PARAM")) e.scalarParam = v;

    if (const char* v = get("IFACEC_DIAG_JSON")) e.diagJson = (std::string(v) == "1");
    if (const char* v = get("IFACEC_TRACE")) e.trace = (std::string(v) == "1");
    if (const char* v = get("IFACEC_VERIFY_IR")) e.verifyIR = (std::string(v) != "0");

    // Target triple (optional)
    if (const char* v = get("IFACEC_TARGET_TRIPLE")) e.targetTriple = v;

    return e;
}

void trace(const CompileEnv& env, const char* stage, const char* fmt, ...){
    if(!env.trace) return;
    std::fprintf(stderr, "[trace][%s] ", stage);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
}

} // namespace ifacec
