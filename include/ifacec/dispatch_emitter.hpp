// dispatch_emitter.hpp - LLVM lowering of dispatch artifacts
#pragma once
#include "ifacec/env.hpp"
#include "ifacec/model.hpp"
#include <memory>
#include <string>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>

namespace ifacec {

// Open dispatch lowers to a vtable struct plus a fat object {data, vtable}; closed dispatch
// lowers to a {i32 tag, ptr payload} sum. Every field gets a thunk, every implementer a
// downcast helper. Field values and arguments are opaque i8* handles.
class DispatchEmitter {
public:
    explicit DispatchEmitter(CompileEnv env);
    ~DispatchEmitter();
    // Returns nullptr when the lowered module fails verification (message in `error`).
    llvm::Module* emit(const ContractModel& model, const DispatchArtifact& artifact, std::string* error = nullptr);
    // Hands over the last module together with its context; empty if none.
    llvm::orc::ThreadSafeModule take_module();
    // Textual IR of the last emitted module; empty if none.
    std::string ir() const;
private:
    CompileEnv env_;
    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;

    llvm::PointerType* opaque_ptr();
    llvm::Type* result_type(const ContractModel& m);
    llvm::FunctionType* field_callee_type(const ContractModel& m, const FieldDefinition& f);
    void emit_open(const ContractModel& m, const OpenDispatch& o);
    void emit_closed(const ContractModel& m, const ClosedDispatch& c);
};

} // namespace ifacec
