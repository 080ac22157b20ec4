#include <gtest/gtest.h>
#include "ifacec/pipeline/classifier.hpp"
#include "test_support.hpp"

using namespace ifacec;

namespace {

struct Classified {
    ClassifiedMethods methods;
    std::vector<Diagnostic> diags;
};

Classified classify(const char* src){
    DiagnosticSink sink;
    Classified c;
    c.methods = classify_methods(read_contract(src), sink);
    c.diags = sink.take();
    return c;
}

Classified classify_one(const std::string& fn){
    std::string src = "(interface I :for [Human] :items [ " + fn + " ])";
    return classify(src.c_str());
}

} // namespace

TEST(FieldClassifier, BuildsFieldFromSharedRefMethod){
    auto c = classify_one(R"((fn appears_in :receiver "&'a self" :ret "&'a [Episode<'a>]"
                               :description "Films" :deprecated "use `episodes`" :async true))");
    ASSERT_TRUE(c.diags.empty());
    ASSERT_EQ(c.methods.fields.size(), 1u);
    const auto& f = c.methods.fields[0];
    EXPECT_EQ(f.name, "appearsIn");
    EXPECT_EQ(f.method, "appears_in");
    EXPECT_EQ(to_string(f.type), "&[Episode]");
    EXPECT_EQ(f.description.value_or(""), "Films");
    ASSERT_TRUE(f.deprecation.has_value());
    EXPECT_EQ(f.deprecation->reason.value_or(""), "use `episodes`");
    EXPECT_TRUE(f.is_async);
    EXPECT_TRUE(f.arguments.empty());
}

TEST(FieldClassifier, UnitReturnAndRawIdentifier){
    auto c = classify_one(R"((fn r#type :receiver "&self"))");
    ASSERT_EQ(c.methods.fields.size(), 1u);
    EXPECT_EQ(c.methods.fields[0].name, "type");
    EXPECT_EQ(c.methods.fields[0].type, TypeExpr::unit());
}

TEST(FieldClassifier, ReceiverRules){
    struct Case { const char* fn; DiagKind kind; };
    const Case cases[] = {
        {R"((fn a :receiver "&mut self"))", DiagKind::InvalidReceiverShape},
        {R"((fn a :receiver "self"))", DiagKind::InvalidReceiverShape},
        {R"((fn a :receiver "mut self"))", DiagKind::InvalidReceiverShape},
        {R"((fn a :receiver "self: Box<Self>"))", DiagKind::MissingReceiver},
        {R"((fn a))", DiagKind::MissingReceiver},
        {R"((fn a :params [ (arg other "&Self") ]))", DiagKind::InvalidReceiverShape},
        {R"edn((fn a :params [ (arg "(x, y)" "(i32, i32)") ]))edn", DiagKind::MissingReceiver},
    };
    for(const auto& tc: cases){
        auto c = classify_one(tc.fn);
        ASSERT_EQ(c.diags.size(), 1u) << tc.fn;
        EXPECT_EQ(c.diags[0].kind, tc.kind) << tc.fn;
        EXPECT_TRUE(c.methods.fields.empty()) << tc.fn;
    }
    auto mut_ref = classify_one(R"((fn a :receiver "&mut self"))");
    EXPECT_EQ(mut_ref.diags[0].code, "E0101");
    EXPECT_EQ(mut_ref.diags[0].message, "trait method receiver can only be a shared reference `&self`");
    auto none = classify_one(R"((fn a))");
    EXPECT_EQ(none.diags[0].code, "E0102");
    EXPECT_EQ(none.diags[0].message, "trait method should have a shared reference receiver `&self`");
}

TEST(FieldClassifier, ReservedFieldNames){
    auto c = classify_one(R"((fn secret :receiver "&mut self" :name "__secret"))");
    ASSERT_EQ(c.diags.size(), 1u);
    EXPECT_EQ(c.diags[0].kind, DiagKind::ReservedNamePrefix);
    EXPECT_EQ(c.diags[0].message, "field name `__secret` must not begin with `__`");

    // camel-casing collapses the leading underscores
    auto cased = classify_one(R"((fn __hidden :receiver "&self"))");
    EXPECT_TRUE(cased.diags.empty());
    ASSERT_EQ(cased.methods.fields.size(), 1u);
    EXPECT_EQ(cased.methods.fields[0].name, "_Hidden");

    auto internal = classify(R"((interface I :internal true
        :items [ (fn typename :receiver "&self" :name "__typename") ]))");
    EXPECT_TRUE(internal.diags.empty());
    ASSERT_EQ(internal.methods.fields.size(), 1u);
    EXPECT_EQ(internal.methods.fields[0].name, "__typename");
}

TEST(FieldClassifier, IgnoredAndDowncastMethodsAreNotFields){
    auto c = classify(R"((interface I :for [Human] :items [
        (fn id :receiver "&self" :ret "i32")
        (fn scratch :ignore true :receiver "&mut self")
        (fn as_human :downcast true :receiver "&self" :ret "Option<&Human>")
        (type Payload) ]))");
    EXPECT_TRUE(c.diags.empty());
    ASSERT_EQ(c.methods.fields.size(), 1u);
    EXPECT_EQ(c.methods.fields[0].name, "id");
    ASSERT_EQ(c.methods.downcasts.size(), 1u);
    EXPECT_EQ(c.methods.downcasts[0].method, "as_human");
    EXPECT_TRUE(c.methods.downcasts[0].target.is_ident("Human"));
    EXPECT_FALSE(c.methods.downcasts[0].context.has_value());
}

TEST(FieldClassifier, DirectiveFailuresContinueWithNextMethod){
    auto c = classify(R"((interface I :items [
        (fn a :receiver "&self" :ignore "maybe")
        (fn b :receiver "&mut self")
        (fn c :receiver "&self") ]))");
    ASSERT_EQ(c.diags.size(), 2u);
    EXPECT_EQ(c.diags[0].kind, DiagKind::DirectiveParseFailure);
    EXPECT_EQ(c.diags[0].code, "E0001");
    EXPECT_EQ(c.diags[0].line, 2);
    EXPECT_EQ(c.diags[1].kind, DiagKind::InvalidReceiverShape);
    ASSERT_EQ(c.methods.fields.size(), 1u);
    EXPECT_EQ(c.methods.fields[0].name, "c");
}

TEST(DowncastClassifier, AcceptsOptionalContext){
    auto c = classify_one(R"((fn as_human :downcast true :receiver "&self"
                               :params [ (arg ctx "&Session") ] :ret "Option<&Human>"))");
    ASSERT_TRUE(c.diags.empty());
    ASSERT_EQ(c.methods.downcasts.size(), 1u);
    ASSERT_TRUE(c.methods.downcasts[0].context.has_value());
    EXPECT_TRUE(c.methods.downcasts[0].context->is_ident("Session"));
}

TEST(DowncastClassifier, RejectsBadShapes){
    const char* ret_msg = "expects trait method return type to be `Option<&ImplementerType>` only";
    const char* input_msg = "expects trait method to accept `&self` only and, optionally, `&Context`";
    struct Case { const char* fn; DiagKind kind; const char* message; };
    const Case cases[] = {
        {R"((fn d :downcast true :receiver "&self" :ret "Human"))", DiagKind::InvalidDowncastSignature, ret_msg},
        {R"((fn d :downcast true :receiver "&self" :ret "Option<Human>"))", DiagKind::InvalidDowncastSignature, ret_msg},
        {R"((fn d :downcast true :receiver "&self" :ret "Option<&mut Human>"))", DiagKind::InvalidDowncastSignature, ret_msg},
        {R"((fn d :downcast true :receiver "&self"))", DiagKind::InvalidDowncastSignature, ret_msg},
        {R"((fn d :downcast true :receiver "&mut self" :ret "Option<&Human>"))", DiagKind::InvalidDowncastSignature, input_msg},
        {R"((fn d :downcast true :ret "Option<&Human>"))", DiagKind::InvalidDowncastSignature, input_msg},
        {R"((fn d :downcast true :receiver "&self" :ret "Option<&Human>"
               :params [ (arg ctx "Session") ]))", DiagKind::InvalidDowncastSignature, input_msg},
        {R"((fn d :downcast true :receiver "&self" :ret "Option<&Human>"
               :params [ (arg ctx "&Session") (arg extra "&i32") ]))", DiagKind::InvalidDowncastSignature, input_msg},
        {R"((fn d :downcast true :async true :receiver "&self" :ret "Option<&Human>"))",
         DiagKind::UnsupportedAsyncDowncast, "async downcast to interface implementer is not supported"},
    };
    for(const auto& tc: cases){
        auto c = classify_one(tc.fn);
        ASSERT_EQ(c.diags.size(), 1u) << tc.fn;
        EXPECT_EQ(c.diags[0].kind, tc.kind) << tc.fn;
        EXPECT_EQ(c.diags[0].message, tc.message) << tc.fn;
        EXPECT_TRUE(c.methods.downcasts.empty()) << tc.fn;
        EXPECT_TRUE(c.methods.fields.empty()) << tc.fn;
    }
}
