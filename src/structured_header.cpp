#include "specmark/structured_header.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace specmark {

namespace {

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace((unsigned char)s[b])) ++b;
    while(e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split_commas(const std::string& s){
    std::vector<std::string> out;
    size_t start = 0;
    while(start <= s.size()){
        size_t comma = std::min(s.find(',', start), s.size());
        auto part = trim(s.substr(start, comma - start));
        if(!part.empty()) out.push_back(part);
        start = comma + 1;
    }
    return out;
}

std::string var_ref(const ParsedParam& p){
    std::string v = "_" + p.name + "_";
    if(p.wrapper == WrapTag::None) return v;
    std::string tag = wrap_tag_name(p.wrapper);
    return "<" + tag + ">" + v + "</" + tag + ">";
}

std::string describe(const ParsedParam& p){
    std::string s = "_" + p.name + "_";
    if(p.type) s += " (" + *p.type + ")";
    return s;
}

// "a", "a and b", "a, b, and c"
std::string join_list(const std::vector<std::string>& items){
    if(items.size() == 1) return items[0];
    if(items.size() == 2) return items[0] + " and " + items[1];
    std::string s;
    for(size_t i = 0; i + 1 < items.size(); ++i) s += items[i] + ", ";
    return s + "and " + items.back();
}

std::vector<std::string> described(const std::vector<ParsedParam>& ps){
    std::vector<std::string> out;
    for(auto& p : ps) if(p.wrapper != WrapTag::Del) out.push_back(describe(p));
    return out;
}

doc::node* scan_for_dl(doc::node* n){
    for(; n; n = n->next_element_sibling()){
        if(n->is("dl")) return n->has_class("header") ? n : nullptr;
        if(n->is("del") || n->is("ins")) continue;
        if(n->is("span") && n->children().empty()) continue;
        return nullptr;
    }
    return nullptr;
}

void read_flag(const std::string& key, const std::string& value, bool allow_false, const doc::node& dd, DiagnosticSink& sink, bool& out){
    if(value == "true") out = true;
    else if(allow_false && value == "false") out = false;
    else sink.node_warning("header-format", "unknown value for " + key + ": \"" + value + "\"", &dd);
}

} // namespace

HeaderSource header_source(const doc::node& h1, const std::string* document_source){
    HeaderSource hs;
    const auto& kids = h1.children();
    if(document_source && kids.size() == 1 && kids[0]->is_text() && kids[0]->span().located){
        const auto& sp = kids[0]->span();
        if(sp.inner_begin <= sp.inner_end && sp.inner_end <= document_source->size()){
            std::string raw = document_source->substr(sp.inner_begin, sp.inner_end - sp.inner_begin);
            // escaped runs differ from their text; fall back to the serialised copy
            if(raw == kids[0]->text()){
                hs.text = std::move(raw);
                hs.base = sp.inner_begin;
                hs.located = true;
                return hs;
            }
        }
    }
    hs.text = h1.inner_html();
    return hs;
}

std::pair<int, int> header_position(const HeaderSource& hs, const doc::node& h1, size_t offset, const std::string* document_source){
    if(hs.located && document_source) return doc::offset_to_line_col(*document_source, hs.base + offset);
    auto lc = doc::offset_to_line_col(hs.text, offset);
    const auto& sp = h1.span();
    if(sp.line < 0) return lc;
    if(lc.first == 1) return {sp.line, sp.col + lc.second - 1};
    return {sp.line + lc.first - 1, lc.second};
}

doc::node* find_header_dl(doc::node& header){
    if(auto dl = scan_for_dl(header.next_element_sibling())) return dl;
    if(header.parent() && header.parent()->is("ins") && !header.next_element_sibling())
        return scan_for_dl(header.parent()->next_element_sibling());
    return nullptr;
}

HeaderFields read_header_fields(const doc::node& dl, const CompileOptions& opts, DiagnosticSink& sink){
    HeaderFields f;
    std::set<std::string> seen;
    for(doc::node* c = dl.first_element_child(); c; c = c->next_element_sibling()){
        if(!c->is("dt")){
            sink.node_warning("header-format", "expected dt, found " + c->tag(), c);
            continue;
        }
        std::string key = trim(c->text_content());
        doc::node* dd = c->next_element_sibling();
        if(!dd || !dd->is("dd")){
            sink.node_warning("header-format", "expected dd after dt \"" + key + "\"", c);
            continue;
        }
        c = dd;
        if(!seen.insert(key).second){
            sink.node_warning("header-format", "duplicate \"" + key + "\" field", dd);
            continue;
        }
        std::string text = trim(dd->text_content());
        if(key == "description") f.description = trim(dd->inner_html());
        else if(key == "for") f.receiver = trim(dd->inner_html());
        else if(key == "effects"){
            for(auto& e : split_commas(text)){
                if(std::find(opts.known_effects.begin(), opts.known_effects.end(), e) != opts.known_effects.end())
                    f.effects.push_back(e);
                else
                    sink.node_warning("header-effect", "unknown effect \"" + e + "\"", dd);
            }
        }
        else if(key == "redefinition") read_flag(key, text, true, *dd, sink, f.redefinition);
        else if(key == "skip global checks") read_flag(key, text, false, *dd, sink, f.skip_global_checks);
        else if(key == "skip return checks") read_flag(key, text, false, *dd, sink, f.skip_return_checks);
        else sink.node_warning("header-format", "unknown structured header entry type \"" + key + "\"", c);
    }
    return f;
}

std::string format_header(const HeaderParseResult& r, ClauseKind kind){
    if(kind == ClauseKind::SyntaxDirectedOperation) return r.name;
    std::string s = r.name + " (";
    for(size_t i = 0; i < r.params.size(); ++i) s += (i ? ", " : " ") + var_ref(r.params[i]);
    for(size_t i = 0; i < r.optional_params.size(); ++i){
        s += (r.params.empty() && i == 0) ? " [ " : " [ , ";
        s += var_ref(r.optional_params[i]);
    }
    for(size_t i = 0; i < r.optional_params.size(); ++i) s += " ]";
    return s + " )";
}

std::string format_params_phrase(const HeaderParseResult& r){
    auto req = described(r.params);
    auto opt = described(r.optional_params);
    if(req.empty() && opt.empty()) return "no arguments";
    std::string s;
    if(!req.empty()) s = (req.size() == 1 ? "argument " : "arguments ") + join_list(req);
    if(!opt.empty()){
        if(!s.empty()) s += " and ";
        s += (opt.size() == 1 ? "optional argument " : "optional arguments ") + join_list(opt);
    }
    return s;
}

std::string format_preamble(ClauseKind kind, const std::string& name, const std::string& receiver,
                            const std::string& params, const std::optional<std::string>& return_type,
                            const std::string& description, const std::string& trailer){
    std::string lead;
    switch(kind){
        case ClauseKind::AbstractOperation:
        case ClauseKind::NumericMethod: lead = "The abstract operation " + name; break;
        case ClauseKind::SyntaxDirectedOperation: lead = "The syntax-directed operation " + name; break;
        case ClauseKind::HostDefinedAbstractOperation: lead = "The host-defined abstract operation " + name; break;
        case ClauseKind::ImplementationDefinedAbstractOperation: lead = "The implementation-defined abstract operation " + name; break;
        case ClauseKind::ConcreteMethod: lead = "The " + name + " concrete method of " + receiver; break;
        case ClauseKind::InternalMethod: lead = "The " + name + " internal method of " + receiver; break;
        case ClauseKind::BuiltInFunction: lead = "This function"; break;
        case ClauseKind::None: lead = name; break;
    }
    std::string s = lead + " takes " + params;
    if(return_type) s += " and returns " + *return_type;
    s += ".";
    if(!description.empty()) s += " " + description;
    if(!trailer.empty()) s += " " + trailer;
    return s;
}

void compile_structured_header(Clause& clause, doc::node& header, doc::node& dl, CompileContext& ctx){
    auto& sink = ctx.sink;
    const std::string* src = ctx.source();
    HeaderSource hs = header_source(header, src);
    HeaderParseResult r = parse_header(hs.text);
    HeaderFields fields = read_header_fields(dl, ctx.options, sink);

    bool method = clause.kind == ClauseKind::ConcreteMethod || clause.kind == ClauseKind::InternalMethod;
    if(clause.kind == ClauseKind::None)
        sink.node_warning("header-type", "clauses with structured headers should have a type", clause.node);
    if(fields.receiver && !method)
        sink.node_warning("header-format", "\"for\" is only applicable to concrete and internal methods", &dl);
    if(method && !fields.receiver)
        sink.node_warning("header-format", "expected \"for\" field for " + std::string(to_string(clause.kind)), &dl);

    std::optional<std::string> name;
    std::string params = "UNPARSEABLE ARGUMENTS";
    std::optional<std::string> ret;
    if(!r.success){
        auto lc = header_position(hs, header, r.error_offset, src);
        sink.contents_warning("header-format", "failed to parse header", &header, lc.first, lc.second);
    } else {
        name = r.name;
        params = format_params_phrase(r);
        ret = r.return_type;
        if(clause.kind == ClauseKind::NumericMethod && r.name.find("::") == std::string::npos)
            sink.node_warning("numeric-method-for", "numeric methods should be of the form `Type::operation`", &header);

        Signature sig;
        bool typed = true;
        auto compile = [&](const std::optional<std::string>& text, size_t offset) -> TypePtr {
            if(!text) return nullptr;
            try {
                return parse_type(*text);
            } catch (const type_parse_error& e) {
                auto lc = header_position(hs, header, offset + e.offset, src);
                sink.contents_warning("type-parsing", std::string("could not parse type: ") + e.what(), &header, lc.first, lc.second);
                typed = false;
                return nullptr;
            }
        };
        for(auto& p : r.params)
            if(p.wrapper != WrapTag::Del) sig.parameters.push_back({p.name, compile(p.type, p.type_offset)});
        for(auto& p : r.optional_params)
            if(p.wrapper != WrapTag::Del) sig.optional_parameters.push_back({p.name, compile(p.type, p.type_offset)});
        sig.return_type = compile(r.return_type, r.return_offset);
        if(typed) clause.signature = std::move(sig);

        header.replace_children_with_text(format_header(r, clause.kind));
    }

    clause.is_redefinition = fields.redefinition;
    clause.skip_global_checks = fields.skip_global_checks;
    clause.skip_return_checks = fields.skip_return_checks;
    if(fields.receiver) clause.receiver = *fields.receiver;

    if(!fields.redefinition){
        if(clause.node->has_attr("aoid"))
            sink.attr_warning("header-format", "nodes with structured headers should not include an AOID", clause.node, "aoid");
        else if(name && is_aoid_kind(clause.kind)){
            clause.aoid = *name;
            clause.node->set_attr("aoid", *name);
        }
    }

    for(auto& e : fields.effects){
        clause.effects.push_back(e);
        ctx.effects.add(e, clause);
    }

    std::string trailer;
    if(doc::node* next = dl.next_element_sibling()){
        if(next->is("emu-alg")) trailer = "It performs the following steps when called:";
        else if(clause.kind == ClauseKind::SyntaxDirectedOperation && next->is("emu-grammar"))
            trailer = "It is defined piecewise over the following productions:";
    }
    clause.preamble.push_back(format_preamble(clause.kind, name.value_or("UNKNOWN"), clause.receiver,
                                              params, ret, fields.description, trailer));

    std::vector<std::unique_ptr<doc::node>> paras;
    for(auto& text : clause.preamble){
        auto p = doc::node::element("p");
        p->append(doc::node::text(text));
        paras.push_back(std::move(p));
    }
    clause.description_list = dl.replace_with(std::move(paras));
}

} // namespace specmark
