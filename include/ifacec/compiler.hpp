// compiler.hpp - contract declaration -> ContractModel + DispatchArtifact
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/diagnostics.hpp"
#include "ifacec/env.hpp"
#include "ifacec/model.hpp"
#include <optional>
#include <vector>

namespace ifacec {

struct CompileResult {
    bool success{false};
    std::optional<ContractModel> model;        // present only on success
    std::optional<DispatchArtifact> artifact;  // present only on success
    std::vector<Diagnostic> diagnostics;
};

class ContractCompiler {
public:
    explicit ContractCompiler(CompileEnv env) : env_(std::move(env)) {}
    // Runs every stage with a fresh diagnostic sink. Aborts after the declaration-level
    // phase and again after the method-level phase when anything was reported.
    CompileResult compile(const ContractDeclaration& decl) const;
    ImplAdaptation adapt(const ImplBlockDeclaration& block) const;
    const CompileEnv& env() const { return env_; }
private:
    CompileEnv env_;
};

// Implementer block adaptation: scalar parameter, bounds and trait path arguments.
ImplAdaptation adapt_impl_block(const ImplBlockDeclaration& block, const CompileEnv& env);

} // namespace ifacec
