#include <cassert>
#include <iostream>
#include <string>
#include "ifacec/compiler.hpp"
#include "ifacec/diagnostics_json.hpp"
#include "ifacec/reader.hpp"

using namespace ifacec;

// Compile and serialize directly (no dependency on IFACEC_DIAG_JSON in the test process)
static std::string to_json(const char* src){
    auto r = ContractCompiler(CompileEnv{}).compile(read_contract(src));
    return diagnostics_to_json(r.success, r.diagnostics);
}

static void test_json_success(){
    auto js = to_json("(interface Ok :for [A] :items [ (fn id :receiver \"&self\" :ret \"i32\") ])");
    assert(js == "{\"success\":true,\"errors\":[]}");
}

static void test_json_conflict_with_notes(){
    auto js = to_json(
        "(interface C :for [Human] :external-downcasts [ (downcast Human get_human) ]\n"
        "  :items [ (fn as_human :downcast true :receiver \"&self\" :ret \"Option<&Human>\") ])");
    assert(js.find("\"success\":false")!=std::string::npos);
    auto pos = js.find("E0302");
    assert(pos!=std::string::npos);
    assert(js.find("\"kind\":\"duplicate-downcast-binding\"")!=std::string::npos);
    auto notesPos = js.find("\"notes\":[{", pos);
    assert(notesPos!=std::string::npos);
    // the note points at the external binding on line 1
    assert(js.find("\"line\":1", notesPos)!=std::string::npos);
    (void)pos; (void)notesPos;
}

static void test_json_escape(){
    assert(json_escape("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
}

int run_diagnostics_json_tests(){
    std::cout << "[smoke] diagnostics JSON tests...\n";
    test_json_success();
    test_json_conflict_with_notes();
    test_json_escape();
    std::cout << "[smoke] diagnostics JSON tests passed\n";
    return 0;
}
