#include "ifacec/diagnostics_json.hpp"
#include "ifacec/env.hpp"
#include <cstdio>
#include <sstream>

namespace ifacec {

std::string json_escape(const std::string& s){
    std::string out = "\"";
    for(char c: s){
        if(c=='"' || c=='\\'){ out += '\\'; out += c; continue; }
        if(c=='\n'){ out += "\\n"; continue; }
        if(c=='\r'){ out += "\\r"; continue; }
        if(c=='\t'){ out += "\\t"; continue; }
        if(static_cast<unsigned char>(c) < 0x20){
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out += buf;
            continue;
        }
        out += c;
    }
    return out + "\"";
}

namespace {

// "line":L,"col":C
void write_position(std::ostringstream& os, int line, int col){
    os << "\"line\":" << line << ",\"col\":" << col;
}

void write_note(std::ostringstream& os, const DiagNote& n){
    os << "{\"message\":" << json_escape(n.message) << ',';
    write_position(os, n.line, n.col);
    os << '}';
}

void write_diagnostic(std::ostringstream& os, const Diagnostic& d){
    os << "{\"code\":" << json_escape(d.code)
       << ",\"kind\":" << json_escape(kind_name(d.kind))
       << ",\"message\":" << json_escape(d.message)
       << ",\"hint\":" << json_escape(d.hint) << ',';
    write_position(os, d.line, d.col);
    os << ",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os << ',';
        write_note(os, d.notes[i]);
    }
    os << "]}";
}

} // namespace

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& ds){
    std::ostringstream os;
    os << "{\"success\":" << (success ? "true" : "false") << ",\"errors\":[";
    for(size_t i=0;i<ds.size(); ++i){
        if(i) os << ',';
        write_diagnostic(os, ds[i]);
    }
    os << "]}";
    return os.str();
}

void maybe_print_json(const CompileEnv& env, bool success, const std::vector<Diagnostic>& ds){
    if(!env.diagJson) return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(success, ds).c_str());
}

} // namespace ifacec
