#include <gtest/gtest.h>
#include "ifacec/printer.hpp"
#include "test_support.hpp"

using namespace ifacec;
using ifacec::test::compile_text;
using ifacec::test::count_kind;

TEST(ContractCompiler, TwoFieldsAndMethodDowncast){
    auto r = compile_text(R"((interface Thing :for [Widget]
        :items [ (fn name :receiver "&self" :ret "String")
                 (fn value :receiver "&self" :ret "Int")
                 (fn as_widget :downcast true :receiver "&self" :ret "Option<&Widget>") ]))");
    ASSERT_TRUE(r.success) << format_diagnostics(r.diagnostics);
    EXPECT_TRUE(r.diagnostics.empty());
    ASSERT_TRUE(r.model.has_value());
    ASSERT_EQ(r.model->fields.size(), 2u);
    EXPECT_EQ(r.model->fields[0].name, "name");
    EXPECT_EQ(r.model->fields[1].name, "value");
    ASSERT_EQ(r.model->implementers.size(), 1u);
    ASSERT_TRUE(r.model->implementers[0].downcast.has_value());
    EXPECT_EQ(std::get<ByMethod>(*r.model->implementers[0].downcast).method, "as_widget");
    EXPECT_EQ(r.model->name, "Thing");
}

TEST(ContractCompiler, ExternalBindingToNonImplementer){
    auto r = compile_text(R"((interface Thing :for [Widget]
        :external-downcasts [ (downcast Gadget as_gadget) ]
        :items [ (fn name :receiver "&mut self") ]))");
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(r.model.has_value());
    EXPECT_FALSE(r.artifact.has_value());
    // declaration-phase abort: the bad method is never classified
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].kind, DiagKind::NonImplementerDowncastTarget);
    EXPECT_EQ(r.diagnostics[0].line, 2);
}

TEST(ContractCompiler, ExternalAndMethodBindingConflict){
    auto r = compile_text(R"((interface Thing :for [Widget]
        :external-downcasts [ (downcast Widget get_widget) ]
        :items [ (fn as_widget :downcast true :receiver "&self" :ret "Option<&Widget>") ]))");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    const auto& d = r.diagnostics[0];
    EXPECT_EQ(d.kind, DiagKind::DuplicateDowncastBinding);
    EXPECT_NE(d.message.find("as_widget"), std::string::npos);
    EXPECT_NE(d.message.find("get_widget"), std::string::npos);
    EXPECT_EQ(d.line, 3);
    ASSERT_EQ(d.notes.size(), 1u);
    EXPECT_EQ(d.notes[0].line, 2);
}

TEST(ContractCompiler, ContextArgumentIsNeverRegular){
    auto r = compile_text(R"((interface Thing
        :items [ (fn friends :receiver "&self" :ret "Vec<Friend>"
                     :params [ (arg context "&Database") (arg limit "i32") ]) ]))");
    ASSERT_TRUE(r.success);
    const auto& args = r.model->fields.at(0).arguments;
    ASSERT_EQ(args.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ContextArgument>(args[0]));
    EXPECT_EQ(std::get<RegularArgument>(args[1]).name, "limit");
    for(const auto& a: args)
        if(auto reg = std::get_if<RegularArgument>(&a)) EXPECT_NE(reg->name, "context");
    ASSERT_TRUE(r.model->context.has_value());
    EXPECT_TRUE(r.model->context->is_ident("Database"));
}

TEST(ContractCompiler, MutableReceiverAborts){
    auto r = compile_text(R"((interface Thing
        :items [ (fn rename :receiver "&mut self" :ret "bool")
                 (fn id :receiver "&self" :ret "i32") ]))");
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(r.model.has_value());
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].kind, DiagKind::InvalidReceiverShape);
    EXPECT_EQ(r.diagnostics[0].line, 2);
}

TEST(ContractCompiler, ReportsEveryMethodProblemInOneRun){
    auto r = compile_text(R"edn((interface Broken :for [Human]
        :external-downcasts [ (downcast Human get_human) ]
        :items [ (fn rename :receiver "&mut self" :ret "bool")
                 (fn secret :receiver "&self" :ret "i32" :name "__secret")
                 (fn pair :receiver "&self" :params [ (arg "(a, b)" "(i32, i32)") ])
                 (fn both :receiver "&self" :params [ (arg ctx "&Db") (arg context "&Db") ])
                 (fn as_human :downcast true :receiver "&self" :ret "Option<&Human>") ]))edn");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 5u);
    EXPECT_EQ(count_kind(r.diagnostics, DiagKind::InvalidReceiverShape), 1u);
    EXPECT_EQ(count_kind(r.diagnostics, DiagKind::ReservedNamePrefix), 1u);
    EXPECT_EQ(count_kind(r.diagnostics, DiagKind::MalformedArgumentPattern), 1u);
    EXPECT_EQ(count_kind(r.diagnostics, DiagKind::DuplicateArgumentRole), 1u);
    EXPECT_EQ(count_kind(r.diagnostics, DiagKind::DuplicateDowncastBinding), 1u);
    // classification diagnostics precede binding conflicts
    EXPECT_EQ(r.diagnostics.back().kind, DiagKind::DuplicateDowncastBinding);
}

TEST(ContractCompiler, FieldCountMatchesValidMethods){
    auto r = compile_text(R"((interface Thing :for [A B]
        :items [ (fn a :receiver "&self")
                 (fn b :receiver "&self" :ignore true)
                 (fn c :receiver "&self" :deprecated true)
                 (fn as_a :downcast true :receiver "&self" :ret "Option<&A>")
                 (fn as_b :downcast true :receiver "&self" :ret "Option<&B>" :ignore true)
                 (type T)
                 (fn d :receiver "&'a self" :async true) ]))");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.model->fields.size(), 3u);
    EXPECT_EQ(r.model->fields[2].name, "d");
    EXPECT_TRUE(r.model->implementers[0].downcast.has_value());
    EXPECT_FALSE(r.model->implementers[1].downcast.has_value());
    EXPECT_TRUE(r.model->async.is_async);
}

TEST(ContractCompiler, ReservedInterfaceName){
    auto r = compile_text(R"((interface Meta :name "__Schema" :items [ (fn a) ]))");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].kind, DiagKind::ReservedNamePrefix);
    EXPECT_EQ(r.diagnostics[0].message, "interface name `__Schema` must not begin with `__`");

    auto internal = compile_text(R"((interface Meta :name "__Schema" :internal true
        :items [ (fn kind :receiver "&self" :name "__kind") ]))");
    ASSERT_TRUE(internal.success);
    EXPECT_EQ(internal.model->name, "__Schema");
    EXPECT_EQ(internal.model->fields[0].name, "__kind");

    auto raw = compile_text("(interface r#Match)");
    ASSERT_TRUE(raw.success);
    EXPECT_EQ(raw.model->name, "Match");
}

TEST(ContractCompiler, ContextInferenceOrder){
    auto explicit_ctx = compile_text(R"((interface I :context Explicit :for [A]
        :items [ (fn f :receiver "&self" :params [ (arg ctx "&FromField") ])
                 (fn as_a :downcast true :receiver "&self" :params [ (arg ctx "&FromDowncast") ] :ret "Option<&A>") ]))");
    ASSERT_TRUE(explicit_ctx.success);
    EXPECT_TRUE(explicit_ctx.model->context->is_ident("Explicit"));

    auto field_ctx = compile_text(R"((interface I :for [A]
        :items [ (fn f :receiver "&self" :params [ (arg ctx "&FromField") ])
                 (fn as_a :downcast true :receiver "&self" :params [ (arg ctx "&FromDowncast") ] :ret "Option<&A>") ]))");
    ASSERT_TRUE(field_ctx.success);
    EXPECT_TRUE(field_ctx.model->context->is_ident("FromField"));
    EXPECT_TRUE(field_ctx.model->implementers[0].context->is_ident("FromDowncast"));

    auto downcast_ctx = compile_text(R"((interface I :for [A]
        :items [ (fn as_a :downcast true :receiver "&self" :params [ (arg ctx "&FromDowncast") ] :ret "Option<&A>") ]))");
    ASSERT_TRUE(downcast_ctx.success);
    EXPECT_TRUE(downcast_ctx.model->context->is_ident("FromDowncast"));

    auto none = compile_text("(interface I :for [A])");
    ASSERT_TRUE(none.success);
    EXPECT_FALSE(none.model->context.has_value());
}

TEST(ContractCompiler, RenderingIsIdempotent){
    const char* src = R"((interface Character :visibility pub :description "A character" :for [Human Droid]
        :external-downcasts [ (downcast Droid as_droid) ]
        :items [ (fn id :receiver "&self" :ret "&str")
                 (fn friends :receiver "&self" :ret "Vec<CharacterValue>"
                     :params [ (arg ctx "&Database") (arg first_n "Option<i32>" :default 10) ])
                 (fn as_human :downcast true :receiver "&self" :ret "Option<&Human>") ]))";
    auto a = compile_text(src);
    auto b = compile_text(src);
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    std::string ra = render_contract(*a.model, *a.artifact);
    EXPECT_EQ(ra, render_contract(*b.model, *b.artifact));
    EXPECT_NE(ra.find("(contract Character"), std::string::npos);
    EXPECT_NE(ra.find("(closed-dispatch CharacterValue"), std::string::npos);
    EXPECT_NE(ra.find("(by-external \"as_droid\")"), std::string::npos);
    EXPECT_NE(ra.find(":default \"10\""), std::string::npos);
    EXPECT_NE(ra.find("(implicit-generic __S :default \"DefaultScalarValue\")"), std::string::npos);
    EXPECT_NE(ra.find("\"__S: ScalarValue\""), std::string::npos);
    // the rendering is itself readable EDN
    EXPECT_EQ(edn::parse_all(ra).size(), 2u);
}

TEST(ContractCompiler, CompilationsAreIndependent){
    ContractCompiler compiler(test::test_env());
    auto bad = compiler.compile(read_contract(R"((interface A :items [ (fn x :receiver "&mut self") ]))"));
    auto good = compiler.compile(read_contract(R"((interface B :items [ (fn x :receiver "&self") ]))"));
    EXPECT_FALSE(bad.success);
    EXPECT_TRUE(good.success);
    EXPECT_TRUE(good.diagnostics.empty());
}

TEST(DiagnosticFormatting, CodeHintAndNotes){
    auto r = compile_text(R"((interface Thing :for [Widget]
        :external-downcasts [ (downcast Widget get_widget) ]
        :items [ (fn as_widget :downcast true :receiver "&self" :ret "Option<&Widget>") ]))");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    std::string text = format_diagnostic(r.diagnostics[0]);
    EXPECT_EQ(text.rfind("error[E0302]: trait method `as_widget`", 0), 0u);
    EXPECT_NE(text.find("\n  hint: use `:ignore true`"), std::string::npos);
    EXPECT_NE(text.find("\n  note: external downcast function `get_widget` declared here (line 2:"), std::string::npos);
}
