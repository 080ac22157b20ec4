// printer.hpp - deterministic EDN rendering of compiled contracts
#pragma once
#include "ifacec/edn.hpp"
#include "ifacec/model.hpp"
#include <string>

namespace ifacec {

edn::node_ptr model_to_edn(const ContractModel& m);
edn::node_ptr artifact_to_edn(const DispatchArtifact& a);
edn::node_ptr adaptation_to_edn(const ImplAdaptation& a);
edn::node_ptr scalar_to_edn(const ScalarParameterKind& k);

// Pretty model form followed by the pretty artifact form.
std::string render_contract(const ContractModel& m, const DispatchArtifact& a);

} // namespace ifacec
