#include "ifacec/dispatch_emitter.hpp"
#include "ifacec/naming.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <cstdio>
#include <iterator>

namespace ifacec {

namespace {

std::string arg_name(const ArgumentDefinition& a){
    if(std::holds_alternative<ContextArgument>(a)) return "ctx";
    if(std::holds_alternative<ExecutorArgument>(a)) return "executor";
    return std::get<RegularArgument>(a).name;
}

void name_args(llvm::Function* F, const FieldDefinition& f, const char* self_name){
    auto it = F->arg_begin();
    it->setName(self_name); ++it;
    for(const auto& a: f.arguments){ it->setName(arg_name(a)); ++it; }
}

// Forwarded arguments: every parameter after the self handle.
std::vector<llvm::Value*> forwarded(llvm::Function* F, llvm::Value* self){
    std::vector<llvm::Value*> out{self};
    for(auto it = std::next(F->arg_begin()); it != F->arg_end(); ++it) out.push_back(&*it);
    return out;
}

} // namespace

DispatchEmitter::DispatchEmitter(CompileEnv env) : env_(std::move(env)) {}
DispatchEmitter::~DispatchEmitter() = default;

llvm::PointerType* DispatchEmitter::opaque_ptr(){
    return llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(*llctx_));
}

// i8* for sync contracts; %struct.<Trait>Future = { state, poll } when async
llvm::Type* DispatchEmitter::result_type(const ContractModel& m){
    if(!m.async.is_async) return opaque_ptr();
    std::string name = "struct." + m.trait_ident + "Future";
    if(auto *ST = llvm::StructType::getTypeByName(*llctx_, name)) return ST;
    return llvm::StructType::create(*llctx_, {opaque_ptr(), opaque_ptr()}, name);
}

// (i8* self, i8* arg...) -> result
llvm::FunctionType* DispatchEmitter::field_callee_type(const ContractModel& m, const FieldDefinition& f){
    std::vector<llvm::Type*> params(f.arguments.size() + 1, opaque_ptr());
    return llvm::FunctionType::get(result_type(m), params, false);
}

void DispatchEmitter::emit_open(const ContractModel& m, const OpenDispatch& o){
    auto& LL = *llctx_;
    auto& M = *module_;
    llvm::IRBuilder<> B(LL);
    auto *i8p = opaque_ptr();

    // vtable: one slot per field, then one per method-bound implementer downcast
    std::vector<llvm::Type*> slots;
    for(const auto& f: m.fields) slots.push_back(llvm::PointerType::getUnqual(field_callee_type(m, f)));
    std::vector<size_t> downcast_slot(m.implementers.size(), SIZE_MAX);
    for(size_t i=0;i<m.implementers.size(); ++i){
        const auto& impl = m.implementers[i];
        if(!impl.downcast) continue;
        auto bm = std::get_if<ByMethod>(&*impl.downcast);
        if(!bm) continue;
        std::vector<llvm::Type*> ps{i8p};
        if(bm->with_context) ps.push_back(i8p);
        downcast_slot[i] = slots.size();
        slots.push_back(llvm::PointerType::getUnqual(llvm::FunctionType::get(i8p, ps, false)));
    }
    auto *VT = llvm::StructType::create(LL, slots, "struct." + o.trait_ident + "VT");
    auto *VTp = llvm::PointerType::getUnqual(VT);
    auto *Obj = llvm::StructType::create(LL, {i8p, VTp}, "struct." + o.trait_ident + "Obj");
    auto *Objp = llvm::PointerType::getUnqual(Obj);

    auto load_parts = [&](llvm::Value* obj){
        auto *dataAddr = B.CreateStructGEP(Obj, obj, 0, "data.addr");
        auto *data = B.CreateLoad(i8p, dataAddr, "data");
        auto *vtAddr = B.CreateStructGEP(Obj, obj, 1, "vt.addr");
        auto *vt = B.CreateLoad(VTp, vtAddr, "vt");
        return std::make_pair(data, vt);
    };

    for(size_t fi=0; fi<m.fields.size(); ++fi){
        const auto& f = m.fields[fi];
        auto *calleeTy = field_callee_type(m, f);
        std::vector<llvm::Type*> ps(f.arguments.size() + 1, i8p);
        ps[0] = Objp;
        auto *FT = llvm::FunctionType::get(result_type(m), ps, false);
        auto *F = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, o.trait_ident + "." + f.method, M);
        name_args(F, f, "obj");
        B.SetInsertPoint(llvm::BasicBlock::Create(LL, "entry", F));
        auto [data, vt] = load_parts(&*F->arg_begin());
        auto *slotAddr = B.CreateStructGEP(VT, vt, static_cast<unsigned>(fi), f.method + ".slot");
        auto *fn = B.CreateLoad(llvm::PointerType::getUnqual(calleeTy), slotAddr, f.method + ".fn");
        auto *res = B.CreateCall(calleeTy, fn, forwarded(F, data));
        B.CreateRet(res);
    }

    for(size_t i=0;i<m.implementers.size(); ++i){
        const auto& impl = m.implementers[i];
        std::string variant = to_string(impl.type);
        auto *FT = llvm::FunctionType::get(i8p, {Objp, i8p}, false);
        auto *F = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, o.trait_ident + ".downcast." + variant, M);
        auto *obj = &*F->arg_begin(); obj->setName("obj");
        auto *ctx = &*std::next(F->arg_begin()); ctx->setName("ctx");
        B.SetInsertPoint(llvm::BasicBlock::Create(LL, "entry", F));
        if(!impl.downcast){
            B.CreateRet(llvm::ConstantPointerNull::get(i8p));
            continue;
        }
        if(auto ext = std::get_if<ByExternalFunction>(&*impl.downcast)){
            auto callee = M.getOrInsertFunction(ext->function, FT);
            B.CreateRet(B.CreateCall(callee, {obj, ctx}, "downcast"));
            continue;
        }
        const auto& bm = std::get<ByMethod>(*impl.downcast);
        auto [data, vt] = load_parts(obj);
        std::vector<llvm::Type*> ps{i8p};
        std::vector<llvm::Value*> args{data};
        if(bm.with_context){ ps.push_back(i8p); args.push_back(ctx); }
        auto *calleeTy = llvm::FunctionType::get(i8p, ps, false);
        auto *slotAddr = B.CreateStructGEP(VT, vt, static_cast<unsigned>(downcast_slot[i]), bm.method + ".slot");
        auto *fn = B.CreateLoad(llvm::PointerType::getUnqual(calleeTy), slotAddr, bm.method + ".fn");
        B.CreateRet(B.CreateCall(calleeTy, fn, args, "downcast"));
    }
}

void DispatchEmitter::emit_closed(const ContractModel& m, const ClosedDispatch& c){
    auto& LL = *llctx_;
    auto& M = *module_;
    llvm::IRBuilder<> B(LL);
    auto *i8p = opaque_ptr();
    auto *i32 = llvm::Type::getInt32Ty(LL);

    auto *Sum = llvm::StructType::create(LL, {i32, i8p}, "struct." + c.ident);
    auto *Sump = llvm::PointerType::getUnqual(Sum);

    auto load_parts = [&](llvm::Value* self){
        auto *tagAddr = B.CreateStructGEP(Sum, self, 0, "tag.addr");
        auto *tag = B.CreateLoad(i32, tagAddr, "tag");
        auto *payloadAddr = B.CreateStructGEP(Sum, self, 1, "payload.addr");
        auto *payload = B.CreateLoad(i8p, payloadAddr, "payload");
        return std::make_pair(tag, payload);
    };

    for(const auto& f: m.fields){
        auto *calleeTy = field_callee_type(m, f);
        std::vector<llvm::Type*> ps(f.arguments.size() + 1, i8p);
        ps[0] = Sump;
        auto *FT = llvm::FunctionType::get(result_type(m), ps, false);
        auto *F = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, c.ident + "." + f.method, M);
        name_args(F, f, "self");
        B.SetInsertPoint(llvm::BasicBlock::Create(LL, "entry", F));
        auto [tag, payload] = load_parts(&*F->arg_begin());
        auto *unreachableBB = llvm::BasicBlock::Create(LL, "invalid.tag", F);
        auto *sw = B.CreateSwitch(tag, unreachableBB, static_cast<unsigned>(c.variants.size()));
        auto args = forwarded(F, payload);
        for(size_t k=0;k<c.variants.size(); ++k){
            const auto& v = c.variants[k];
            auto *caseBB = llvm::BasicBlock::Create(LL, v.name, F);
            sw->addCase(llvm::ConstantInt::get(i32, k), caseBB);
            B.SetInsertPoint(caseBB);
            auto callee = M.getOrInsertFunction(to_string(v.type) + "." + c.trait_ident + "." + f.method, calleeTy);
            B.CreateRet(B.CreateCall(callee, args));
        }
        B.SetInsertPoint(unreachableBB);
        B.CreateUnreachable();
    }

    for(size_t k=0;k<c.variants.size(); ++k){
        const auto& v = c.variants[k];
        auto *FT = llvm::FunctionType::get(i8p, {Sump}, false);
        auto *F = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, c.ident + ".downcast." + to_string(v.type), M);
        F->arg_begin()->setName("self");
        B.SetInsertPoint(llvm::BasicBlock::Create(LL, "entry", F));
        auto [tag, payload] = load_parts(&*F->arg_begin());
        auto *is = B.CreateICmpEQ(tag, llvm::ConstantInt::get(i32, k), "is." + v.name);
        B.CreateRet(B.CreateSelect(is, payload, llvm::ConstantPointerNull::get(i8p), "downcast"));
    }
}

llvm::Module* DispatchEmitter::emit(const ContractModel& model, const DispatchArtifact& artifact, std::string* error){
    module_.reset(); // must die before its context
    llctx_ = std::make_unique<llvm::LLVMContext>();
    module_ = std::make_unique<llvm::Module>(model.dispatch_ident, *llctx_);
    if(!env_.targetTriple.empty()) module_->setTargetTriple(env_.targetTriple);

    if(auto o = std::get_if<OpenDispatch>(&artifact)) emit_open(model, *o);
    else emit_closed(model, std::get<ClosedDispatch>(artifact));
    trace(env_, "lower", "%s: %zu function(s)", model.dispatch_ident.c_str(), module_->size());

    if(env_.verifyIR){
        std::string msg;
        llvm::raw_string_ostream os(msg);
        if(llvm::verifyModule(*module_, &os)){
            os.flush();
            if(error) *error = msg;
            std::fprintf(stderr, "[ifacec] IR verify failed for %s\n", model.dispatch_ident.c_str());
            module_.reset();
            return nullptr;
        }
    }
    return module_.get();
}

llvm::orc::ThreadSafeModule DispatchEmitter::take_module(){
    if(!module_) return {};
    return llvm::orc::ThreadSafeModule(std::move(module_), std::move(llctx_));
}

std::string DispatchEmitter::ir() const {
    if(!module_) return {};
    std::string out;
    llvm::raw_string_ostream os(out);
    module_->print(os, nullptr);
    os.flush();
    return out;
}

} // namespace ifacec
