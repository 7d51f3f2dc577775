#include <cassert>
#include <string>
#include "specmark/diagnostics_json.hpp"

using namespace specmark;

void run_diagnostics_json_tests(){
    assert(json_escape("plain") == "\"plain\"");
    assert(json_escape("a\"b\\\n") == "\"a\\\"b\\\\\\n\"");
    assert(json_escape(std::string("\x01", 1)) == "\"\\u0001\"");

    assert(diagnostics_to_json({}) == "{\"count\":0,\"diagnostics\":[]}");

    auto h1 = doc::node::element("h1");
    std::vector<Diagnostic> ds;
    DiagnosticSink sink; sink.out = &ds;
    int forwarded = 0;
    sink.forward = [&](const Diagnostic&){ ++forwarded; };
    sink.attr_warning("header-format", "m", h1.get(), "aoid");
    sink.contents_warning("type-parsing", "bad \"type\"", h1.get(), 3, 4);
    assert(forwarded == 2);
    // unlocated nodes carry -1
    assert(ds[0].line == -1 && ds[0].col == -1);
    auto js = diagnostics_to_json(ds);
    assert(js == "{\"count\":2,\"diagnostics\":["
                 "{\"ruleId\":\"header-format\",\"message\":\"m\",\"locus\":\"attribute\",\"tag\":\"h1\",\"attr\":\"aoid\",\"line\":-1,\"col\":-1},"
                 "{\"ruleId\":\"type-parsing\",\"message\":\"bad \\\"type\\\"\",\"locus\":\"contents\",\"tag\":\"h1\",\"line\":3,\"col\":4}]}");
}
