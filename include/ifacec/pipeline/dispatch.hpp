// dispatch.hpp - open/closed dispatch artifact selection
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/model.hpp"
#include <string>

namespace ifacec {

// Trait identifier for open dispatch, enum identifier (default <Trait>Value) for closed.
std::string dispatch_ident(const ContractDeclaration& decl);

DispatchArtifact select_dispatch(const ContractDeclaration& decl, const ContractModel& model);

inline bool is_open(const DispatchArtifact& a){ return std::holds_alternative<OpenDispatch>(a); }

} // namespace ifacec
