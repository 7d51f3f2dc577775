#include <gtest/gtest.h>
#include "specmark/structured_header.hpp"

using namespace specmark;

static ParsedParam param(const std::string& name, const char* type = nullptr, WrapTag w = WrapTag::None){
    ParsedParam p; p.name = name; p.wrapper = w;
    if(type) p.type = type;
    return p;
}

TEST(StructuredHeader, ParameterPhrases){
    HeaderParseResult r;
    EXPECT_EQ(format_params_phrase(r), "no arguments");
    r.params = {param("x", "a Number")};
    EXPECT_EQ(format_params_phrase(r), "argument _x_ (a Number)");
    r.params.push_back(param("y"));
    EXPECT_EQ(format_params_phrase(r), "arguments _x_ (a Number) and _y_");
    r.params = {param("a"), param("b"), param("c")};
    EXPECT_EQ(format_params_phrase(r), "arguments _a_, _b_, and _c_");
    r.params = {param("a")};
    r.optional_params = {param("b")};
    EXPECT_EQ(format_params_phrase(r), "argument _a_ and optional argument _b_");
    r.params.clear();
    r.optional_params = {param("a"), param("b")};
    EXPECT_EQ(format_params_phrase(r), "optional arguments _a_ and _b_");
    // removed parameters are not described
    r.optional_params = {param("a"), param("gone", nullptr, WrapTag::Del)};
    EXPECT_EQ(format_params_phrase(r), "optional argument _a_");
}

TEST(StructuredHeader, HeaderFormatting){
    HeaderParseResult r;
    r.name = "Example.Op";
    r.params = {param("x", "a Number"), param("y")};
    r.optional_params = {param("z")};
    EXPECT_EQ(format_header(r, ClauseKind::AbstractOperation), "Example.Op ( _x_, _y_ [ , _z_ ] )");
    EXPECT_EQ(format_header(r, ClauseKind::SyntaxDirectedOperation), "Example.Op");

    r.params = {param("a", nullptr, WrapTag::Ins), param("b", nullptr, WrapTag::Del)};
    r.optional_params.clear();
    EXPECT_EQ(format_header(r, ClauseKind::None), "Example.Op ( <ins>_a_</ins>, <del>_b_</del> )");

    r.params.clear();
    r.optional_params = {param("a"), param("b")};
    EXPECT_EQ(format_header(r, ClauseKind::None), "Example.Op ( [ _a_ [ , _b_ ] ] )");
    r.optional_params.clear();
    EXPECT_EQ(format_header(r, ClauseKind::None), "Example.Op ( )");
}

TEST(StructuredHeader, PreambleLeads){
    const std::string steps = "It performs the following steps when called:";
    EXPECT_EQ(format_preamble(ClauseKind::AbstractOperation, "Foo", "", "argument _x_ (a Number)", std::string("a String"), "", steps),
              "The abstract operation Foo takes argument _x_ (a Number) and returns a String. It performs the following steps when called:");
    EXPECT_EQ(format_preamble(ClauseKind::ConcreteMethod, "HasBinding", "a Declarative Environment Record", "argument _N_ (a String)",
                              std::string("a normal completion containing a Boolean"), "It checks a binding.", ""),
              "The HasBinding concrete method of a Declarative Environment Record takes argument _N_ (a String) and returns a normal completion containing a Boolean. It checks a binding.");
    EXPECT_EQ(format_preamble(ClauseKind::InternalMethod, "[[GetPrototypeOf]]", "an ordinary object _O_", "no arguments", std::nullopt, "", ""),
              "The [[GetPrototypeOf]] internal method of an ordinary object _O_ takes no arguments.");
    EXPECT_EQ(format_preamble(ClauseKind::BuiltInFunction, "parseInt", "", "no arguments", std::nullopt, "", ""),
              "This function takes no arguments.");
    EXPECT_EQ(format_preamble(ClauseKind::HostDefinedAbstractOperation, "HostHook", "", "no arguments", std::nullopt, "", ""),
              "The host-defined abstract operation HostHook takes no arguments.");
    EXPECT_EQ(format_preamble(ClauseKind::None, "UNKNOWN", "", "UNPARSEABLE ARGUMENTS", std::nullopt, "", ""),
              "UNKNOWN takes UNPARSEABLE ARGUMENTS.");
}

TEST(StructuredHeader, DescriptionListFields){
    auto d = doc::load_document(
        "(dl {:class \"header\"}"
        " (dt \"description\") (dd \"It does <b>stuff</b>.\")"
        " (dt \"effects\") (dd \"user-code, bogus\")"
        " (dt \"redefinition\") (dd \"true\")"
        " (dt \"skip global checks\") (dd \"maybe\")"
        " (dt \"skip return checks\") (dd \"true\")"
        " (dt \"description\") (dd \"again\")"
        " (dt \"mystery\") (dd \"x\")"
        " (dt \"for\"))");
    std::vector<Diagnostic> ds;
    DiagnosticSink sink; sink.out = &ds;
    auto f = read_header_fields(*d.root, CompileOptions{}, sink);
    EXPECT_EQ(f.description, "It does <b>stuff</b>.");
    EXPECT_EQ(f.effects, std::vector<std::string>{"user-code"});
    EXPECT_TRUE(f.redefinition);
    EXPECT_FALSE(f.skip_global_checks);
    EXPECT_TRUE(f.skip_return_checks);
    EXPECT_FALSE(f.receiver.has_value());
    EXPECT_EQ(count_rule(ds, "header-effect"), 1u);
    // bad boolean, duplicate key, unknown key, dt without dd
    EXPECT_EQ(count_rule(ds, "header-format"), 4u);
}

TEST(StructuredHeader, LocatesTheDescriptionList){
    auto d = doc::load_document("(emu-clause (h1 \"Foo ( )\") (del (p \"old\")) (span) (dl {:class \"header\"}))");
    doc::node* h1 = d.root->first_element_child();
    doc::node* dl = find_header_dl(*h1);
    ASSERT_NE(dl, nullptr);
    EXPECT_TRUE(dl->is("dl"));

    auto other = doc::load_document("(emu-clause (h1 \"Foo\") (p \"y\") (dl {:class \"header\"}))");
    EXPECT_EQ(find_header_dl(*other.root->first_element_child()), nullptr);
    auto plain = doc::load_document("(emu-clause (h1 \"Foo\") (dl {:class \"terms\"}))");
    EXPECT_EQ(find_header_dl(*plain.root->first_element_child()), nullptr);
    auto wrapped = doc::load_document("(emu-clause (ins (h1 \"Foo ( )\")) (dl {:class \"header\"}))");
    EXPECT_NE(find_header_dl(*wrapped.root->first_element_child()->first_element_child()), nullptr);
}

TEST(StructuredHeader, HeaderSourceUsesDocumentOffsets){
    auto d = doc::load_document("(emu-clause\n  (h1 \"Foo ( _x_ )\"))");
    doc::node* h1 = d.root->first_element_child();
    auto hs = header_source(*h1, d.source.get());
    EXPECT_TRUE(hs.located);
    EXPECT_EQ(hs.text, "Foo ( _x_ )");
    EXPECT_EQ(hs.base, d.source->find("Foo"));
    EXPECT_EQ(header_position(hs, *h1, 6, d.source.get()), std::make_pair(2, 14));

    auto split = doc::load_document("(emu-clause (h1 \"Foo \" (i \"x\")))");
    auto hs2 = header_source(*split.root->first_element_child(), split.source.get());
    EXPECT_FALSE(hs2.located);
    EXPECT_EQ(hs2.text, "Foo <i>x</i>");

    // escaped runs cannot be sliced from the document
    auto escaped = doc::load_document("(emu-clause (h1 \"Say \\\"hi\\\" ( )\"))");
    auto hs3 = header_source(*escaped.root->first_element_child(), escaped.source.get());
    EXPECT_FALSE(hs3.located);
    EXPECT_EQ(hs3.text, "Say \"hi\" ( )");
}
