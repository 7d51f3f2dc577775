#include <cassert>
#include "specmark/inline_render.hpp"

using namespace specmark;

void run_inline_render_tests(){
    auto d = doc::load_document(
        "(emu-clause {:id \"c\"} (h1 \"T\") (p \"  hello  \") (pre \"raw\") (emu-alg \"1. step\")"
        " (emu-clause {:id \"d\"} (p \"nested\")) (p (code \"x\") \" tail\") (p \"   \"))");
    CompileContext ctx;
    ctx.inline_renderer = [](const std::string& s){ return "[" + s + "]"; };
    Clause c; c.node = d.root.get(); c.ns = ctx.biblio.root();
    render_clause_text(c, ctx);

    const auto& kids = d.root->children();
    assert(kids[0]->inner_html() == "[T]");
    assert(kids[1]->inner_html() == "  [hello]  ");
    assert(kids[2]->inner_html() == "raw");
    assert(kids[3]->inner_html() == "1. step");
    assert(kids[4]->first_element_child()->inner_html() == "nested");
    assert(kids[5]->inner_html() == "<code>x</code> [tail]");
    assert(kids[6]->inner_html() == "   ");
    assert(ctx.text_runs["spec"].size() == 3);

    assert(is_opaque_for_inline(*doc::node::element("emu-grammar")));
    assert(is_opaque_for_inline(*doc::node::element("emu-production")));
    assert(!is_opaque_for_inline(*doc::node::element("p")));
    assert(!is_opaque_for_inline(*doc::node::text("x")));

    // without a renderer runs are only registered
    CompileContext plain;
    auto d2 = doc::load_document("(emu-clause (p \"keep _x_\"))");
    Clause c2; c2.node = d2.root.get(); c2.ns = "spec";
    render_clause_text(c2, plain);
    assert(d2.root->first_element_child()->inner_html() == "keep _x_");
    assert(plain.text_runs["spec"].size() == 1);
}
