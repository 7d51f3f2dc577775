#include "specmark/clause_builder.hpp"
#include "specmark/diagnostics_json.hpp"
#include "specmark/inline_render.hpp"
#include "specmark/structured_header.hpp"
#include <iostream>

namespace specmark {

static std::string trim_copy(const std::string& s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if(b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool is_clause_like(const doc::node& n){
    return n.is("emu-clause") || n.is("emu-annex") || n.is("emu-intro");
}

ClauseTreeBuilder::ClauseTreeBuilder(CompileContext& ctx) : ctx_(ctx), numberer_(&ctx.sink) {}

Clause& ClauseTreeBuilder::enter(doc::node& n){
    if(!is_clause_like(n))
        throw clause_error("cannot open a clause on <" + n.tag() + ">", &n);

    auto c = std::make_unique<Clause>();
    c->node = &n;
    c->id = n.id();
    if(c->id.empty()) ctx_.sink.node_warning("missing-id", "clause doesn't have an id", &n);
    c->parent = current();
    c->is_intro = n.is("emu-intro");
    c->is_annex = n.is("emu-annex");
    c->is_back_matter = c->is_annex && n.has_attr("back-matter");
    c->is_normative = !c->is_annex || n.has_attr("normative");
    if(c->parent && c->parent->number.empty() && !c->is_intro){
        // nothing to extend under an introduction
        ctx_.sink.node_warning("clause-numbering", "clause is being numbered without numbering its parent clause", &n);
    } else if(!c->is_intro) {
        c->number = numberer_.next(stack_.size(), c->is_annex, n);
    }

    c->ns = c->parent ? c->parent->ns : ctx_.biblio.root();
    if(auto ns = n.attr("namespace"); ns && !ns->empty()){
        ctx_.biblio.create_namespace(*ns, c->ns);
        c->ns = *ns;
    }

    if(auto aoid = n.attr("aoid")){
        std::string v = aoid->empty() ? c->id : *aoid;
        if(!v.empty()) c->aoid = v;
    }

    if(auto type = n.attr("type")){
        if(auto k = parse_clause_kind(*type)) c->kind = *k;
        else ctx_.sink.attr_warning("clause-type", "unknown clause type \"" + *type + "\"", &n, "type");
    }

    Clause* raw = c.get();
    if(c->parent) c->parent->subclauses.push_back(std::move(c));
    else ctx_.clauses.push_back(std::move(c));
    stack_.push_back(raw);
    attach_header(*raw);

    if(ctx_.options.trace)
        std::cerr << "[specmark] enter " << (raw->id.empty() ? "<anonymous>" : raw->id) << " " << raw->number << " ns=" << raw->ns << "\n";
    return *raw;
}

// Runs on enter, so effects reach the worklist in document order.
void ClauseTreeBuilder::attach_header(Clause& c){
    doc::node& n = *c.node;
    doc::node* header = locate_header(n);
    if(!header && ctx_.options.legacy_header_lookup){
        header = locate_legacy_header(n);
        if(!header) throw clause_error("could not locate header element for clause " + c.id, &n);
    }
    c.header = header;
    if(!header){
        ctx_.sink.node_warning("missing-header", "could not locate header element", &n);
        c.title = "UNKNOWN";
        c.title_html = "UNKNOWN";
        return;
    }
    if(doc::node* dl = find_header_dl(*header)) compile_structured_header(c, *header, *dl, ctx_);
    c.title = trim_copy(header->text_content());
    c.title_html = trim_copy(header->inner_html());
}

// First element child, skipping del wrappers and empty span placeholders, looking once inside an ins.
doc::node* ClauseTreeBuilder::locate_header(doc::node& n) const {
    bool descended = false;
    for(doc::node* c = n.first_element_child(); c; c = c->next_element_sibling()){
        if(c->is("del")) continue;
        if(c->is("span") && c->children().empty()) continue;
        if(c->is("ins") && !descended){
            descended = true;
            doc::node* inner = c->first_element_child();
            return inner && inner->is("h1") ? inner : nullptr;
        }
        return c->is("h1") ? c : nullptr;
    }
    return nullptr;
}

doc::node* ClauseTreeBuilder::locate_legacy_header(doc::node& n) const {
    for(auto& child : n.children()){
        doc::node& c = *child;
        if(!c.is_element() || is_clause_like(c)) continue;
        if(c.is("h1")) return &c;
        if(auto h = locate_legacy_header(c)) return h;
    }
    return nullptr;
}

void ClauseTreeBuilder::finalize_notes(Clause& c){
    auto label = [](std::vector<Note>& items, const char* caption, const char* cls){
        for(size_t i = 0; i < items.size(); ++i){
            auto& note = items[i];
            note.number = (items.size() > 1 && !note.editor) ? std::to_string(i + 1) : "";
            std::string text = note.editor ? std::string("Editor's Note") : std::string(caption);
            if(!note.number.empty()) text += " " + note.number;
            auto span = doc::node::element("span");
            span->set_attr("class", cls);
            span->append(doc::node::text(text));
            note.node->prepend(std::move(span));
        }
    };
    label(c.notes, "Note", "note");
    label(c.editor_notes, "Note", "note");
    label(c.examples, "Example", "caption");
}

void ClauseTreeBuilder::apply_attributes_label(Clause& c){
    static const std::pair<const char*, const char*> kinds[] = {
        {"normative-optional", "Normative Optional"},
        {"legacy", "Legacy"},
        {"deprecated", "Deprecated"},
    };
    std::string label;
    for(auto& k : kinds){
        if(!c.node->has_attr(k.first)) continue;
        if(!label.empty()) label += ", ";
        label += k.second;
    }
    if(label.empty()) return;
    c.attributes_label = label;
    auto div = doc::node::element("div");
    div->set_attr("class", "attributes-tag");
    div->append(doc::node::text(label));
    doc::node& placed = c.node->prepend(std::move(div));
    ctx_.text_runs[c.ns].push_back(placed.first_child());
}

void ClauseTreeBuilder::register_entries(Clause& c){
    ClauseEntry ce;
    ce.id = c.id; ce.aoid = c.aoid; ce.title = c.title; ce.title_html = c.title_html; ce.number = c.number;
    ctx_.biblio.add(std::move(ce), c.ns);

    if(!c.aoid) return;
    if(ctx_.biblio.keys_for_namespace(c.ns).count(*c.aoid)){
        ctx_.sink.attr_warning("duplicate-definition", "duplicate definition of " + *c.aoid, c.node, "aoid");
        return;
    }
    OpEntry op;
    op.aoid = *c.aoid;
    op.ref_id = c.id;
    if(is_aoid_kind(c.kind)) op.kind = c.kind;
    op.signature = c.signature;
    op.effects = c.effects;
    op.skip_global_checks = c.skip_global_checks;
    op.skip_return_checks = c.skip_return_checks;
    ctx_.biblio.add(std::move(op), c.ns);
}

void ClauseTreeBuilder::exit(doc::node& n){
    if(stack_.empty() || stack_.back()->node != &n)
        throw clause_error("exit of <" + n.tag() + "> does not match the innermost open clause", &n);
    Clause& c = *stack_.back();

    render_clause_text(c, ctx_);
    finalize_notes(c);
    apply_attributes_label(c);
    register_entries(c);

    if(c.signature && c.signature->return_type && is_mixed_completion_union(*c.signature->return_type))
        ctx_.sink.node_warning("completion-union", "algorithms returning completion records should not return other types as well", c.header ? c.header : &n);

    if(ctx_.options.trace)
        std::cerr << "[specmark] exit " << (c.id.empty() ? "<anonymous>" : c.id) << " title=\"" << c.title << "\""
                  << (c.aoid ? " aoid=" + *c.aoid : std::string()) << "\n";
    stack_.pop_back();
}

void ClauseTreeBuilder::add_note(doc::node& n){
    Clause* c = current();
    if(!c) return;
    Note note; note.node = &n; note.editor = n.attr("type").value_or("") == "editor";
    (note.editor ? c->editor_notes : c->notes).push_back(note);
}

void ClauseTreeBuilder::add_example(doc::node& n){
    Clause* c = current();
    if(!c) return;
    Note ex; ex.node = &n;
    c->examples.push_back(ex);
}

void compile_document(doc::document& d, CompileContext& ctx){
    ctx.document = &d;
    ClauseTreeBuilder builder(ctx);
    doc::Walker w;
    for(const char* tag : {"emu-clause", "emu-annex", "emu-intro"}){
        w.on_enter(tag, [&](doc::node& n){ builder.enter(n); });
        w.on_exit(tag, [&](doc::node& n){ builder.exit(n); });
    }
    w.on_enter("emu-note", [&](doc::node& n){ builder.add_note(n); });
    w.on_enter("emu-example", [&](doc::node& n){ builder.add_example(n); });
    w.walk(*d.root);
    if(ctx.options.diag_json) std::cerr << diagnostics_to_json(ctx.diagnostics) << "\n";
}

} // namespace specmark
