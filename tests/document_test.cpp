#include <cassert>
#include <string>
#include <vector>
#include "specmark/document.hpp"

using namespace specmark;

void run_document_tests(){
    auto d = doc::load_document("(emu-clause {:id \"sec-a\" :legacy true :hidden false :gone nil :n 3}\n  (h1 \"Title <b>x</b>\")\n  (p \"one\" (em \"two\")))");
    doc::node& root = *d.root;
    assert(root.is("emu-clause"));
    assert(root.id() == "sec-a");
    assert(root.has_attr("legacy") && root.attr("legacy")->empty());
    assert(!root.has_attr("hidden") && !root.has_attr("gone"));
    assert(*root.attr("n") == "3");
    assert(root.element_child_count() == 2);

    doc::node* h1 = root.first_element_child();
    assert(h1 && h1->is("h1") && h1->parent() == &root);
    assert(h1->text_content() == "Title x");
    assert(h1->inner_html() == "Title <b>x</b>");
    assert(h1->span().located && h1->span().line == 2 && h1->span().col == 3);
    doc::node* run = h1->first_child();
    assert(run->is_text());
    assert(d.source->substr(run->span().inner_begin, run->span().inner_end - run->span().inner_begin) == "Title <b>x</b>");

    doc::node* p = h1->next_element_sibling();
    assert(p && p->is("p"));
    assert(p->outer_html() == "<p>one<em>two</em></p>");
    assert(p->next_sibling() == nullptr);

    // attributes
    root.set_attr("class", "header  extra");
    assert(root.has_class("header") && root.has_class("extra") && !root.has_class("head"));
    root.remove_attr("legacy");
    assert(!root.has_attr("legacy"));

    // structural edits
    std::vector<std::unique_ptr<doc::node>> repl;
    repl.push_back(doc::node::element("div"));
    repl.push_back(doc::node::text("t"));
    auto old = p->replace_with(std::move(repl));
    assert(old->is("p") && old->parent() == nullptr);
    assert(root.children().size() == 3);
    assert(root.children()[1]->is("div") && root.children()[1]->parent() == &root);
    assert(root.element_child_count() == 2);
    root.prepend(doc::node::element("span"));
    assert(root.first_child()->is("span"));
    h1->replace_children_with_text("Plain");
    assert(h1->inner_html() == "Plain" && !h1->first_child()->span().located);

    assert(doc::strip_tags("a <i>b</i> c") == "a b c");
    assert(doc::offset_to_line_col("ab\ncd", 3) == std::make_pair(2, 1));
    assert(doc::offset_to_line_col("ab", 99) == std::make_pair(1, 3));

    // walker order
    {
        auto w = doc::load_document("(a (b \"x\") (c (b \"y\")))");
        std::vector<std::string> events;
        doc::Walker walker;
        walker.on_enter("b", [&](doc::node&){ events.push_back("enter b"); })
              .on_exit("c", [&](doc::node&){ events.push_back("exit c"); })
              .on_text([&](doc::node& t){ events.push_back(t.text()); });
        walker.walk(*w.root);
        assert((events == std::vector<std::string>{"enter b", "x", "enter b", "y", "exit c"}));
    }

    // only element forms make documents
    {
        bool threw = false;
        try { (void)doc::load_document("\"just text\""); } catch (const doc::document_error&) { threw = true; }
        assert(threw);
        threw = false;
        try { (void)doc::load_document("(\"x\")"); } catch (const doc::document_error& e) { threw = true; assert(e.line == 1); }
        assert(threw);
    }
}
