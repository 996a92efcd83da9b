#include <cassert>
#include <iostream>
#include <string>

#include "kiln/diagnostics.hpp"
#include "kiln/diagnostics_json.hpp"

using namespace kiln;

static Diagnostic sample_error(){
    Diagnostic d;
    d.code = codes::FunctionNotAvailable;
    d.message = "function Self.f/0 is undefined (function not available)";
    d.hint = "module Self is still being compiled";
    d.file = "self.kiln";
    d.line = 3;
    d.notes.push_back(Note{"first note", 1});
    d.notes.push_back(Note{"second \"quoted\" note", 2});
    d.stack.push_back(Frame{"Self", "f", 0, "self.kiln", 3});
    d.origin = d.stack.front();
    return d;
}

static void test_json_success(){
    auto js = diagnostics_to_json(true, {}, {});
    assert(js == "{\"success\":true,\"errors\":[],\"warnings\":[]}");
}

static void test_json_error_with_notes(){
    auto js = diagnostics_to_json(false, {sample_error()}, {});
    assert(js.find("\"success\":false") != std::string::npos);
    assert(js.find("\"code\":\"E2006\"") != std::string::npos);
    auto notesPos = js.find("\"notes\":[");
    assert(notesPos != std::string::npos);
    auto closing = js.find(']', notesPos);
    auto segment = js.substr(notesPos, closing - notesPos);
    assert(segment.find("},{") != std::string::npos);
    assert(js.find("second \\\"quoted\\\" note") != std::string::npos);
    assert(js.find("\"origin\":{\"module\":\"Self\",\"function\":\"f\",\"arity\":0") != std::string::npos);
}

static void test_json_warnings(){
    Diagnostic w;
    w.code = codes::ModuleRedefinition;
    w.message = "redefining module Again (current version defined in memory)";
    w.line = 1;
    auto js = diagnostics_to_json(true, {}, {w});
    assert(w.is_warning());
    assert(js.find("\"warnings\":[{\"code\":\"W2101\"") != std::string::npos);
    assert(js.find("\"origin\"") == std::string::npos);
}

static void test_escape_controls(){
    assert(json_escape("a\tb") == "\"a\\tb\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
}

static void test_error_round_trip(){
    Diagnostic back = to_diagnostic(make_error(sample_error()));
    assert(back.code == codes::FunctionNotAvailable);
    assert(back.origin && back.origin->function == "f");
    assert(format(back) == "self.kiln:3: function Self.f/0 is undefined (function not available)");
    assert(format(back.stack.front()) == "Self.f/0 (self.kiln:3)");

    Diagnostic foreign = to_diagnostic(llvm::createStringError(llvm::inconvertibleErrorCode(), "plain failure"));
    assert(foreign.code == codes::RuntimeError);
    assert(foreign.message == "plain failure");
}

static void test_sink_collects(){
    DiagnosticSink sink;
    int heard = 0;
    sink.on_report([&](const Diagnostic&){ ++heard; });
    sink.warn(codes::UnusedDocAttribute, "module attribute @doc was set but no definition follows it", "a.kiln", 4);
    assert(sink.size() == 1 && heard == 1);
    assert(sink.warnings()[0].line == 4);
}

void run_diagnostics_json_tests(){
    std::cout << "[diagnostics] JSON tests...\n";
    test_json_success();
    test_json_error_with_notes();
    test_json_warnings();
    test_escape_controls();
    test_error_round_trip();
    test_sink_collects();
    std::cout << "[diagnostics] JSON tests passed\n";
}
