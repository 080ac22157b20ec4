// scalar.hpp - payload (scalar) type parameter resolution
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/env.hpp"
#include "ifacec/model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ifacec {

ScalarParameterKind resolve_scalar(const std::optional<Spanned<TypeExpr>>& override_ty,
                                   const std::vector<std::string>& generics,
                                   const CompileEnv& env);

inline bool is_explicit_generic(const ScalarParameterKind& k){ return std::holds_alternative<ExplicitGenericScalar>(k); }
inline bool is_implicit_generic(const ScalarParameterKind& k){ return std::holds_alternative<ImplicitGenericScalar>(k); }
inline bool is_generic(const ScalarParameterKind& k){ return !std::holds_alternative<ConcreteScalar>(k); }

// Type threaded through generated signatures: the parameter for generic kinds, the type otherwise.
TypeExpr scalar_type(const ScalarParameterKind& k);
// `<scalar>: ScalarValue`
std::string scalar_bound(const ScalarParameterKind& k);
// Declared generics plus the synthesized parameter (with its default) for implicit generics.
std::vector<std::string> signature_generics(const std::vector<std::string>& generics, const ScalarParameterKind& k);

} // namespace ifacec
