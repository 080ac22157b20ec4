#include <gtest/gtest.h>
#include "ifacec/printer.hpp"
#include "test_support.hpp"

using namespace ifacec;

namespace {

ImplAdaptation adapt(const char* src, CompileEnv env = test::test_env()){
    return ContractCompiler(std::move(env)).adapt(read_impl(src));
}

} // namespace

TEST(ImplAdaptation, ImplicitScalarParameter){
    auto a = adapt("(impl Character :for Human :generics [T] :items [ (fn id) ])");
    EXPECT_EQ(a.generics, (std::vector<std::string>{"T", "__S"}));
    EXPECT_EQ(a.where_bounds, std::vector<std::string>{"__S: ScalarValue + Send + Sync"});
    EXPECT_EQ(to_string(a.trait_path), "Character<__S>");
    EXPECT_TRUE(a.self_type.is_ident("Human"));
    EXPECT_FALSE(a.is_async);
    EXPECT_EQ(edn::to_string(adaptation_to_edn(a)),
              "(impl-adaptation \"Character<__S>\" :for \"Human\" :generics [\"T\" \"__S\"] "
              ":where [\"__S: ScalarValue + Send + Sync\"] "
              ":scalar (implicit-generic __S :default \"DefaultScalarValue\") :async false)");
}

TEST(ImplAdaptation, ExplicitGenericScalarKeepsTraitPath){
    auto a = adapt("(impl Node<S> :for User :generics [S] :scalar S :async true)");
    EXPECT_EQ(a.generics, std::vector<std::string>{"S"});
    EXPECT_EQ(a.where_bounds, std::vector<std::string>{"S: ScalarValue + Send + Sync"});
    EXPECT_EQ(to_string(a.trait_path), "Node<S>");
    EXPECT_TRUE(a.is_async);
}

TEST(ImplAdaptation, ConcreteScalarIsAppendedWithoutBounds){
    auto a = adapt(R"((impl "crate::Character" :for Human :scalar MyScalar))");
    EXPECT_TRUE(a.generics.empty());
    EXPECT_TRUE(a.where_bounds.empty());
    EXPECT_EQ(to_string(a.trait_path), "crate::Character<MyScalar>");
    ASSERT_TRUE(std::holds_alternative<ConcreteScalar>(a.scalar));
}

TEST(ImplAdaptation, AsyncMethodMarksBlock){
    auto a = adapt("(impl Character :for Human :items [ (fn id) (fn friends :async true) ])");
    EXPECT_TRUE(a.is_async);
}

TEST(ImplAdaptation, CustomScalarParameterName){
    CompileEnv env = test::test_env();
    env.scalarParam = "SV";
    auto a = adapt("(impl Character :for Human)", env);
    EXPECT_EQ(a.generics, std::vector<std::string>{"SV"});
    EXPECT_EQ(to_string(a.trait_path), "Character<SV>");
}
