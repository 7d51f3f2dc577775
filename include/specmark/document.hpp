// Element/text tree built from EDN document forms, plus a tag-keyed walker.
#pragma once
#include "specmark/edn.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace specmark::doc {

struct document_error : std::runtime_error {
    document_error(const std::string& msg, int line, int col) : std::runtime_error(msg), line(line), col(col) {}
    int line;
    int col;
};

enum class NodeKind { Element, Text };

// Where a node came from. For text runs [inner_begin, inner_end) is the raw (still escaped)
// string body; for elements it is everything between the tag/attribute map and the closing paren.
struct SourceSpan {
    bool located = false;
    size_t begin = 0, end = 0;
    size_t inner_begin = 0, inner_end = 0;
    int line = -1, col = -1;
};

class node {
public:
    static std::unique_ptr<node> element(std::string tag);
    static std::unique_ptr<node> text(std::string text);

    NodeKind kind() const { return kind_; }
    bool is_element() const { return kind_ == NodeKind::Element; }
    bool is_text() const { return kind_ == NodeKind::Text; }
    bool is(std::string_view tag) const { return is_element() && tag_ == tag; }
    const std::string& tag() const { return tag_; }

    // Text runs hold raw inline markup (e.g. "_x_ is <del>old</del>").
    const std::string& text() const { return text_; }
    void set_text(std::string t) { text_ = std::move(t); }

    bool has_attr(std::string_view name) const;
    std::optional<std::string> attr(std::string_view name) const;
    void set_attr(const std::string& name, std::string value);
    void remove_attr(std::string_view name);
    const std::vector<std::pair<std::string, std::string>>& attrs() const { return attrs_; }
    std::string id() const { return attr("id").value_or(""); }
    bool has_class(std::string_view cls) const;

    node* parent() const { return parent_; }
    const std::vector<std::unique_ptr<node>>& children() const { return children_; }
    node* first_child() const { return children_.empty() ? nullptr : children_.front().get(); }
    node* next_sibling() const;
    node* first_element_child() const;
    node* next_element_sibling() const;
    size_t element_child_count() const;

    node& append(std::unique_ptr<node> child);
    node& prepend(std::unique_ptr<node> child);
    // Replace this node (in its parent) by the given nodes; returns the detached original.
    std::unique_ptr<node> replace_with(std::vector<std::unique_ptr<node>> nodes);
    void replace_children_with_text(std::string text);

    // Concatenated text with inline markup tags stripped.
    std::string text_content() const;
    // Serialised markup of the children.
    std::string inner_html() const;
    std::string outer_html() const;

    const SourceSpan& span() const { return span_; }
    void set_span(const SourceSpan& s) { span_ = s; }

private:
    explicit node(NodeKind k) : kind_(k) {}
    size_t index_in_parent() const;

    NodeKind kind_;
    std::string tag_;
    std::string text_;
    std::vector<std::pair<std::string, std::string>> attrs_;
    std::vector<std::unique_ptr<node>> children_;
    node* parent_ = nullptr;
    SourceSpan span_;
};

struct document {
    std::shared_ptr<const std::string> source;
    std::string filename;
    std::unique_ptr<node> root;
};

// Read a document whose single top-level form is an element:
//   (tag {:attr "value" :flag true} child...)
// Strings become text runs, lists become elements. Attribute values may be strings,
// integers or true (present, empty value); false and nil omit the attribute.
document load_document(std::string source, std::string filename = "<memory>");

// Remove tags from an inline markup run.
std::string strip_tags(std::string_view markup);

// 1-based line/column of a byte offset; offsets past the end clamp to the end.
std::pair<int, int> offset_to_line_col(std::string_view source, size_t offset);

// Depth-first walk raising enter/exit callbacks per element tag; a fallback receives text runs.
class Walker {
public:
    using VisitFn = std::function<void(node&)>;

    Walker& on_enter(const std::string& tag, VisitFn fn) { enter_[tag] = std::move(fn); return *this; }
    Walker& on_exit(const std::string& tag, VisitFn fn) { exit_[tag] = std::move(fn); return *this; }
    Walker& on_text(VisitFn fn) { text_ = std::move(fn); return *this; }

    void walk(node& root);

private:
    std::unordered_map<std::string, VisitFn> enter_;
    std::unordered_map<std::string, VisitFn> exit_;
    VisitFn text_{};
};

} // namespace specmark::doc
