// env.hpp - compiler configuration snapshot read from the process environment
#pragma once
#include <string>

namespace ifacec {

struct CompileEnv {
    std::string defaultScalar = "DefaultScalarValue"; // default type of the implicit scalar parameter
    std::string scalarParam = "__S";                  // name of the synthesized scalar parameter
    bool diagJson = false;
    bool trace = false;
    bool verifyIR = true;
    std::string targetTriple; // empty = host default
};

// Read IFACEC_* variables once; compilations receive the snapshot explicitly.
CompileEnv detectEnv();

// [trace][stage] line on stderr when tracing is enabled.
void trace(const CompileEnv& env, const char* stage, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace ifacec
