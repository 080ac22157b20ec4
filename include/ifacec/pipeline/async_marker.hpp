// async_marker.hpp - asynchronous contract marking
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/model.hpp"

namespace ifacec {

// Async when forced by the declaration or when any trait method is async; an async contract
// with a default-bodied async method additionally requires `Sync`.
AsyncMarking mark_async(const ContractDeclaration& decl);

} // namespace ifacec
