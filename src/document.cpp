#include "specmark/document.hpp"
#include <algorithm>

namespace specmark::doc {

std::unique_ptr<node> node::element(std::string tag){
    std::unique_ptr<node> n(new node(NodeKind::Element));
    n->tag_ = std::move(tag);
    return n;
}

std::unique_ptr<node> node::text(std::string text){
    std::unique_ptr<node> n(new node(NodeKind::Text));
    n->text_ = std::move(text);
    return n;
}

bool node::has_attr(std::string_view name) const {
    for(auto& a : attrs_) if(a.first == name) return true;
    return false;
}

std::optional<std::string> node::attr(std::string_view name) const {
    for(auto& a : attrs_) if(a.first == name) return a.second;
    return std::nullopt;
}

void node::set_attr(const std::string& name, std::string value){
    for(auto& a : attrs_){
        if(a.first == name){ a.second = std::move(value); return; }
    }
    attrs_.emplace_back(name, std::move(value));
}

void node::remove_attr(std::string_view name){
    attrs_.erase(std::remove_if(attrs_.begin(), attrs_.end(), [&](const auto& a){ return a.first == name; }), attrs_.end());
}

bool node::has_class(std::string_view cls) const {
    auto v = attr("class");
    if(!v) return false;
    size_t i = 0;
    while(i < v->size()){
        while(i < v->size() && (*v)[i] == ' ') ++i;
        size_t b = i;
        while(i < v->size() && (*v)[i] != ' ') ++i;
        if(i > b && std::string_view(*v).substr(b, i - b) == cls) return true;
    }
    return false;
}

size_t node::index_in_parent() const {
    auto& sibs = parent_->children_;
    for(size_t i = 0; i < sibs.size(); ++i) if(sibs[i].get() == this) return i;
    return sibs.size();
}

node* node::next_sibling() const {
    if(!parent_) return nullptr;
    size_t i = index_in_parent() + 1;
    return i < parent_->children_.size() ? parent_->children_[i].get() : nullptr;
}

node* node::first_element_child() const {
    for(auto& c : children_) if(c->is_element()) return c.get();
    return nullptr;
}

node* node::next_element_sibling() const {
    for(node* n = next_sibling(); n; n = n->next_sibling())
        if(n->is_element()) return n;
    return nullptr;
}

size_t node::element_child_count() const {
    return static_cast<size_t>(std::count_if(children_.begin(), children_.end(), [](const auto& c){ return c->is_element(); }));
}

node& node::append(std::unique_ptr<node> child){
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

node& node::prepend(std::unique_ptr<node> child){
    child->parent_ = this;
    children_.insert(children_.begin(), std::move(child));
    return *children_.front();
}

std::unique_ptr<node> node::replace_with(std::vector<std::unique_ptr<node>> nodes){
    if(!parent_)
        throw std::logic_error("replace_with: node has no parent");
    node* p = parent_;
    size_t i = index_in_parent();
    std::unique_ptr<node> self = std::move(p->children_[i]);
    p->children_.erase(p->children_.begin() + static_cast<std::ptrdiff_t>(i));
    for(auto& n : nodes){
        n->parent_ = p;
        p->children_.insert(p->children_.begin() + static_cast<std::ptrdiff_t>(i++), std::move(n));
    }
    self->parent_ = nullptr;
    return self;
}

void node::replace_children_with_text(std::string text){
    children_.clear();
    append(node::text(std::move(text)));
}

std::string strip_tags(std::string_view markup){
    std::string out;
    bool in_tag = false;
    for(char c : markup){
        if(c == '<'){ in_tag = true; continue; }
        if(c == '>' && in_tag){ in_tag = false; continue; }
        if(!in_tag) out += c;
    }
    return out;
}

std::string node::text_content() const {
    if(is_text()) return strip_tags(text_);
    std::string out;
    for(auto& c : children_) out += c->text_content();
    return out;
}

std::string node::inner_html() const {
    std::string out;
    for(auto& c : children_) out += c->outer_html();
    return out;
}

std::string node::outer_html() const {
    if(is_text()) return text_;
    std::string out = "<" + tag_;
    for(auto& a : attrs_){
        out += ' ' + a.first;
        if(!a.second.empty()) out += "=\"" + a.second + "\"";
    }
    out += '>';
    out += inner_html();
    out += "</" + tag_ + ">";
    return out;
}

std::pair<int, int> offset_to_line_col(std::string_view source, size_t offset){
    int line = 1, col = 1;
    size_t lim = std::min(offset, source.size());
    for(size_t i = 0; i < lim; ++i){
        if(source[i] == '\n'){ ++line; col = 1; }
        else ++col;
    }
    return {line, col};
}

namespace {

std::string attr_value(const edn::node& v){
    if(auto s = edn::as_string(v)) return *s;
    if(std::holds_alternative<int64_t>(v.data)) return std::to_string(std::get<int64_t>(v.data));
    if(std::holds_alternative<bool>(v.data)) return "";
    if(auto sym = edn::as_symbol(v)) return sym->name;
    throw document_error("unsupported attribute value " + edn::to_string(v), v.line, v.col);
}

std::unique_ptr<node> build(const edn::node_ptr& f){
    if(auto s = edn::as_string(*f)){
        auto t = node::text(*s);
        SourceSpan sp; sp.located = true;
        sp.begin = f->begin; sp.end = f->end;
        sp.inner_begin = f->begin + 1; sp.inner_end = f->end - 1;
        sp.line = f->line; sp.col = f->col;
        t->set_span(sp);
        return t;
    }
    auto l = edn::as_list(*f);
    if(!l || l->elems.empty() || !edn::is_symbol(*l->elems[0]))
        throw document_error("expected element form (tag ...), found " + edn::to_string(*f), f->line, f->col);
    auto el = node::element(edn::as_symbol(*l->elems[0])->name);
    size_t i = 1;
    if(i < l->elems.size() && edn::is_map(*l->elems[i])){
        for(auto& kv : edn::as_map(*l->elems[i])->entries){
            std::string name;
            if(edn::is_keyword(*kv.first)) name = std::get<edn::keyword>(kv.first->data).name;
            else if(auto s = edn::as_string(*kv.first)) name = *s;
            else throw document_error("attribute names must be keywords", kv.first->line, kv.first->col);
            const auto& v = *kv.second;
            if(std::holds_alternative<std::monostate>(v.data)) continue;
            if(std::holds_alternative<bool>(v.data) && !std::get<bool>(v.data)) continue;
            el->set_attr(name, attr_value(v));
        }
        ++i;
    }
    SourceSpan sp; sp.located = true;
    sp.begin = f->begin; sp.end = f->end;
    sp.inner_begin = i < l->elems.size() ? l->elems[i]->begin : f->end - 1;
    sp.inner_end = f->end - 1;
    sp.line = f->line; sp.col = f->col;
    el->set_span(sp);
    for(; i < l->elems.size(); ++i)
        el->append(build(l->elems[i]));
    return el;
}

} // namespace

document load_document(std::string source, std::string filename){
    document d;
    d.source = std::make_shared<const std::string>(std::move(source));
    d.filename = std::move(filename);
    auto form = edn::parse(*d.source);
    d.root = build(form);
    if(!d.root->is_element())
        throw document_error("document root must be an element", form->line, form->col);
    return d;
}

void Walker::walk(node& root){
    if(root.is_text()){
        if(text_) text_(root);
        return;
    }
    auto e = enter_.find(root.tag());
    if(e != enter_.end()) e->second(root);
    // children may be appended by callbacks; index loop tolerates growth
    for(size_t i = 0; i < root.children().size(); ++i)
        walk(*root.children()[i]);
    auto x = exit_.find(root.tag());
    if(x != exit_.end()) x->second(root);
}

} // namespace specmark::doc
