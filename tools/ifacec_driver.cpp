#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "ifacec/compiler.hpp"
#include "ifacec/diagnostics.hpp"
#include "ifacec/diagnostics_json.hpp"
#include "ifacec/dispatch_emitter.hpp"
#include "ifacec/printer.hpp"
#include "ifacec/reader.hpp"

using namespace ifacec;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: ifacec <file.edn> [--emit-llvm] [--json]\n"; return 1; }
    std::string file;
    bool emitLLVM = false, json = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--emit-llvm") emitLLVM = true;
        else if(a=="--json") json = true;
        else if(!a.empty() && a[0]=='-'){ std::cerr << "[diag] unknown option " << a << "\n"; return 1; }
        else file = a;
    }
    if(file.empty()){ std::cerr << "usage: ifacec <file.edn> [--emit-llvm] [--json]\n"; return 1; }
    std::string src;
    if(!read_file(file, src)){ std::cerr << "[diag] failed to read " << file << "\n"; return 1; }

    CompileEnv env = detectEnv();
    if(json) env.diagJson = true;

    ReadResult doc = read_document(src);
    if(!doc.success){
        std::vector<Diagnostic> ds;
        for(auto& f: doc.failures)
            ds.push_back(Diagnostic{DiagKind::DirectiveParseFailure, code_of(DiagKind::DirectiveParseFailure), f.message, "", f.loc.line, f.loc.col, {}});
        std::cerr << format_diagnostics(ds);
        maybe_print_json(env, false, ds);
        return 1;
    }

    ContractCompiler compiler(env);
    bool failed = false;
    for(auto& item: doc.items){
        if(auto block = std::get_if<ImplBlockDeclaration>(&item)){
            if(!emitLLVM) std::cout << edn::to_pretty_string(adaptation_to_edn(compiler.adapt(*block))) << "\n";
            continue;
        }
        const auto& decl = std::get<ContractDeclaration>(item);
        CompileResult r = compiler.compile(decl);
        if(!r.success){
            std::cerr << "[diag] interface " << decl.ident << " failed to compile:\n" << format_diagnostics(r.diagnostics);
            failed = true;
            continue;
        }
        if(!emitLLVM){ std::cout << render_contract(*r.model, *r.artifact); continue; }
        DispatchEmitter emitter(env);
        std::string verifyErr;
        if(!emitter.emit(*r.model, *r.artifact, &verifyErr)){
            std::cerr << "[diag] lowering " << r.model->dispatch_ident << " failed:\n" << verifyErr;
            failed = true;
            continue;
        }
        std::cout << emitter.ir();
    }
    return failed ? 2 : 0;
}
