#include <gtest/gtest.h>
#include <stdexcept>
#include "specmark/biblio.hpp"

using namespace specmark;

static ClauseEntry clause_entry(const std::string& id, const std::string& title){
    ClauseEntry e; e.id = id; e.title = title; e.title_html = title; e.number = "1";
    return e;
}

static OpEntry op_entry(const std::string& aoid, const std::string& ref){
    OpEntry e; e.aoid = aoid; e.ref_id = ref; e.kind = ClauseKind::AbstractOperation;
    return e;
}

TEST(BiblioRegistry, NamespacesFormAForest){
    BiblioRegistry reg;
    EXPECT_EQ(reg.root(), "spec");
    EXPECT_TRUE(reg.create_namespace("child", "spec"));
    EXPECT_FALSE(reg.create_namespace("child", "spec"));
    EXPECT_TRUE(reg.create_namespace("grandchild", "child"));
    EXPECT_THROW(reg.create_namespace("orphan", "nowhere"), std::invalid_argument);
    EXPECT_EQ(reg.namespaces(), (std::vector<std::string>{"spec", "child", "grandchild"}));
    EXPECT_EQ(reg.parent_of("grandchild"), std::optional<std::string>("child"));
    EXPECT_FALSE(reg.parent_of("spec").has_value());
    EXPECT_THROW(reg.add(op_entry("X", "x"), "nowhere"), std::invalid_argument);
}

TEST(BiblioRegistry, LookupsFallBackToParents){
    BiblioRegistry reg;
    reg.create_namespace("child", "spec");
    reg.create_namespace("grandchild", "child");
    reg.add(op_entry("Foo", "sec-foo"), "spec");
    reg.add(clause_entry("sec-foo", "Foo ( )"), "spec");

    ASSERT_NE(reg.by_aoid("Foo", "grandchild"), nullptr);
    EXPECT_EQ(reg.by_aoid("Foo", "grandchild")->ref_id, "sec-foo");
    ASSERT_NE(reg.by_id("sec-foo", "child"), nullptr);
    EXPECT_EQ(reg.by_id("sec-foo", "child")->title, "Foo ( )");
    EXPECT_TRUE(reg.keys_for_namespace("child").empty());
    EXPECT_EQ(reg.keys_for_namespace("spec"), (std::set<std::string>{"Foo"}));

    // a local definition shadows the parent's
    reg.add(op_entry("Foo", "sec-local-foo"), "child");
    EXPECT_EQ(reg.by_aoid("Foo", "grandchild")->ref_id, "sec-local-foo");
    EXPECT_EQ(reg.by_aoid("Foo", "spec")->ref_id, "sec-foo");

    // no propagation downward
    reg.add(clause_entry("sec-deep", "Deep"), "grandchild");
    EXPECT_EQ(reg.by_id("sec-deep", "spec"), nullptr);
    ASSERT_NE(reg.find_id("sec-deep"), nullptr);
    EXPECT_EQ(reg.find_id("sec-deep")->title, "Deep");
    EXPECT_EQ(reg.by_aoid("Missing", "grandchild"), nullptr);
}

TEST(BiblioRegistry, ClauseIdsAndAoidsAreSeparateKeys){
    BiblioRegistry reg;
    reg.add(clause_entry("Bar", "Bar"), "spec");
    EXPECT_EQ(reg.keys_for_namespace("spec").count("Bar"), 0u);
    EXPECT_EQ(reg.by_aoid("Bar", "spec"), nullptr);
    reg.add(op_entry("Bar", "Bar"), "spec");
    EXPECT_EQ(reg.keys_for_namespace("spec").count("Bar"), 1u);
    EXPECT_NE(reg.by_id("Bar", "spec"), nullptr);
    EXPECT_EQ(reg.local_entries("spec").size(), 2u);

    // the first op under a key keeps it
    reg.add(op_entry("Bar", "second"), "spec");
    EXPECT_EQ(reg.by_aoid("Bar", "spec")->ref_id, "Bar");
}

TEST(BiblioJson, ExportsEntriesAndTypes){
    BiblioRegistry reg;
    reg.create_namespace("child", "spec");
    OpEntry op = op_entry("Example.Op", "sec-example");
    Signature sig;
    sig.parameters.push_back({"x", make_named("Number")});
    sig.optional_parameters.push_back({"z", nullptr});
    sig.return_type = make_completion(CompletionKind::Normal, make_list(nullptr));
    op.signature = sig;
    op.effects = {"user-code"};
    reg.add(op, "child");
    ClauseEntry ce = clause_entry("sec-example", "Example.Op ( _x_ )");
    ce.aoid = "Example.Op";
    reg.add(ce, "child");

    auto js = biblio_to_json(reg);
    EXPECT_NE(js.find("{\"root\":\"spec\",\"namespaces\":[{\"name\":\"spec\",\"parent\":null,\"entries\":[]}"), std::string::npos);
    EXPECT_NE(js.find("\"name\":\"child\",\"parent\":\"spec\""), std::string::npos);
    EXPECT_NE(js.find("\"parameters\":[{\"name\":\"x\",\"type\":{\"kind\":\"opaque\",\"type\":\"Number\"}}]"), std::string::npos);
    EXPECT_NE(js.find("\"optionalParameters\":[{\"name\":\"z\",\"type\":null}]"), std::string::npos);
    EXPECT_NE(js.find("\"return\":{\"kind\":\"completion\",\"completionType\":\"normal\",\"typeOfValueIfNormal\":{\"kind\":\"list\",\"elements\":null}}"), std::string::npos);
    EXPECT_NE(js.find("\"effects\":[\"user-code\"]"), std::string::npos);
    EXPECT_NE(js.find("\"type\":\"clause\",\"id\":\"sec-example\",\"aoid\":\"Example.Op\""), std::string::npos);

    EXPECT_EQ(type_to_json(*make_union({make_named("A"), make_completion(CompletionKind::Abrupt)})),
              "{\"kind\":\"union\",\"types\":[{\"kind\":\"opaque\",\"type\":\"A\"},{\"kind\":\"completion\",\"completionType\":\"abrupt\"}]}");
    EXPECT_EQ(type_to_json(*make_record("", {{"K", nullptr}})),
              "{\"kind\":\"record\",\"name\":null,\"fields\":[{\"name\":\"K\",\"type\":null}]}");
}
