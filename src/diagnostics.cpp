#include "ifacec/diagnostics.hpp"
#include <sstream>

namespace ifacec {

const char* code_of(DiagKind k){
    switch(k){
        case DiagKind::DirectiveParseFailure: return "E0001";
        case DiagKind::InvalidReceiverShape: return "E0101";
        case DiagKind::MissingReceiver: return "E0102";
        case DiagKind::ReservedNamePrefix: return "E0103";
        case DiagKind::MalformedArgumentPattern: return "E0201";
        case DiagKind::DisallowedDirectiveCombination: return "E0202";
        case DiagKind::DuplicateArgumentRole: return "E0203";
        case DiagKind::NonImplementerDowncastTarget: return "E0301";
        case DiagKind::DuplicateDowncastBinding: return "E0302";
        case DiagKind::InvalidDowncastSignature: return "E0303";
        case DiagKind::UnsupportedAsyncDowncast: return "E0304";
    }
    return "E0000";
}

const char* kind_name(DiagKind k){
    switch(k){
        case DiagKind::DirectiveParseFailure: return "directive-parse-failure";
        case DiagKind::InvalidReceiverShape: return "invalid-receiver-shape";
        case DiagKind::MissingReceiver: return "missing-receiver";
        case DiagKind::ReservedNamePrefix: return "reserved-name-prefix";
        case DiagKind::MalformedArgumentPattern: return "malformed-argument-pattern";
        case DiagKind::DisallowedDirectiveCombination: return "disallowed-directive-combination";
        case DiagKind::DuplicateArgumentRole: return "duplicate-argument-role";
        case DiagKind::NonImplementerDowncastTarget: return "non-implementer-downcast-target";
        case DiagKind::DuplicateDowncastBinding: return "duplicate-downcast-binding";
        case DiagKind::InvalidDowncastSignature: return "invalid-downcast-signature";
        case DiagKind::UnsupportedAsyncDowncast: return "unsupported-asynchronous-downcast";
    }
    return "unknown";
}

Diagnostic& DiagnosticSink::report(DiagKind kind, std::string message, std::string hint, const SourceLoc& at){
    items_.push_back(Diagnostic{kind, code_of(kind), std::move(message), std::move(hint), at.line, at.col, {}});
    return items_.back();
}

size_t DiagnosticSink::count(DiagKind kind) const {
    size_t n=0;
    for(auto& d: items_) if(d.kind==kind) ++n;
    return n;
}

static void append_position(std::ostringstream& os, int line, int col){
    if(line>=0) os<<" (line "<<line<<":"<<col<<")";
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os<<"error["<<d.code<<"]: "<<d.message;
    append_position(os, d.line, d.col);
    if(!d.hint.empty()) os<<"\n  hint: "<<d.hint;
    for(auto& n: d.notes){
        os<<"\n  note: "<<n.message;
        append_position(os, n.line, n.col);
    }
    return os.str();
}

std::string format_diagnostics(const std::vector<Diagnostic>& ds){
    std::string out;
    for(auto& d: ds){ out += format_diagnostic(d); out += '\n'; }
    return out;
}

} // namespace ifacec
