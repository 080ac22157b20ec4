// diagnostics.hpp - compile-time diagnostics accumulated per compilation
#pragma once
#include "ifacec/edn.hpp"
#include <string>
#include <vector>

namespace ifacec {

enum class DiagKind {
    DirectiveParseFailure,
    InvalidReceiverShape,
    MissingReceiver,
    ReservedNamePrefix,
    MalformedArgumentPattern,
    DisallowedDirectiveCombination,
    DuplicateArgumentRole,
    NonImplementerDowncastTarget,
    DuplicateDowncastBinding,
    InvalidDowncastSignature,
    UnsupportedAsyncDowncast
};

const char* code_of(DiagKind k);
const char* kind_name(DiagKind k);

struct DiagNote { std::string message; int line=-1; int col=-1; };
struct Diagnostic {
    DiagKind kind;
    std::string code;
    std::string message;
    std::string hint;
    int line=-1;
    int col=-1;
    std::vector<DiagNote> notes;
};

// Owned by a single compile call and threaded through every stage; never shared.
class DiagnosticSink {
public:
    Diagnostic& report(DiagKind kind, std::string message, std::string hint, const SourceLoc& at);
    void add(Diagnostic d){ items_.push_back(std::move(d)); }
    bool dirty() const { return !items_.empty(); }
    size_t count(DiagKind kind) const;
    const std::vector<Diagnostic>& items() const { return items_; }
    std::vector<Diagnostic> take(){ return std::move(items_); }
private:
    std::vector<Diagnostic> items_;
};

inline void add_note(Diagnostic& d, std::string message, const SourceLoc& at){
    d.notes.push_back(DiagNote{std::move(message), at.line, at.col});
}

// error[E0101]: message (line L:C)
//   hint: ...
//   note: ... (line L:C)
std::string format_diagnostic(const Diagnostic& d);
std::string format_diagnostics(const std::vector<Diagnostic>& ds);

} // namespace ifacec
