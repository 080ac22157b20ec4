// arguments.hpp - role resolution for field method parameters
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/diagnostics.hpp"
#include "ifacec/model.hpp"
#include <optional>
#include <vector>

namespace ifacec {

// Context / Executor / Regular for one non-receiver parameter; nullopt when it was rejected.
std::optional<ArgumentDefinition> resolve_argument(const ParamDecl& p, bool internal, DiagnosticSink& sink);

// All parameters in order. A second Context or Executor argument is reported as
// duplicate-argument-role and dropped.
std::vector<ArgumentDefinition> resolve_arguments(const std::vector<ParamDecl>& params, bool internal, DiagnosticSink& sink);

} // namespace ifacec
