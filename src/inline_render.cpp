#include "specmark/inline_render.hpp"
#include <cctype>

namespace specmark {

bool is_opaque_for_inline(const doc::node& n){
    if(!n.is_element()) return false;
    static const char* const opaque[] = {
        "pre", "code", "emu-clause", "emu-annex", "emu-intro", "emu-production", "emu-grammar", "emu-alg"
    };
    for(const char* t : opaque) if(n.tag() == t) return true;
    return false;
}

static void render_runs(doc::node& n, const std::string& ns, CompileContext& ctx){
    for(auto& child : n.children()){
        doc::node& c = *child;
        if(c.is_element()){
            if(!is_opaque_for_inline(c)) render_runs(c, ns, ctx);
            continue;
        }
        const std::string& s = c.text();
        size_t b = 0, e = s.size();
        while(b < e && std::isspace((unsigned char)s[b])) ++b;
        while(e > b && std::isspace((unsigned char)s[e - 1])) --e;
        if(b == e) continue;
        ctx.text_runs[ns].push_back(&c);
        if(ctx.inline_renderer)
            c.set_text(s.substr(0, b) + ctx.inline_renderer(s.substr(b, e - b)) + s.substr(e));
    }
}

void render_clause_text(Clause& clause, CompileContext& ctx){
    if(clause.node) render_runs(*clause.node, clause.ns, ctx);
}

} // namespace specmark
