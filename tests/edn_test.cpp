#include <gtest/gtest.h>
#include "ifacec/edn.hpp"

using namespace ifacec;
using namespace ifacec::edn;

TEST(EdnReader, CommasAreWhitespaceAndCommentsAreSkipped){
    auto forms = parse_all("; header\n(fn a, :async true)\n[1, 2]");
    ASSERT_EQ(forms.size(), 2u);
    EXPECT_EQ(to_string(forms[0]), "(fn a :async true)");
    EXPECT_EQ(to_string(forms[1]), "[1 2]");
    EXPECT_EQ(forms[0]->loc.line, 2);
    EXPECT_EQ(forms[0]->loc.col, 1);
    EXPECT_EQ(forms[1]->loc.line, 3);
}

TEST(EdnReader, TypeLikeSymbols){
    auto n = parse("(impl Node<S> :for crate::User)");
    auto l = as_list(*n);
    ASSERT_NE(l, nullptr);
    ASSERT_EQ(l->elems.size(), 4u);
    EXPECT_EQ(text_of(l->elems[1]), "Node<S>");
    EXPECT_EQ(text_of(l->elems[3]), "crate::User");
    EXPECT_EQ(head_of(*n), "impl");
}

TEST(EdnReader, ParseErrorsCarryPosition){
    try {
        parse_all("(interface A\n  :for [B");
        FAIL() << "expected parse_error";
    } catch (const parse_error& e) {
        EXPECT_GE(e.line, 1);
        EXPECT_GE(e.col, 1);
    }
    EXPECT_THROW(parse("\"open"), parse_error);
    EXPECT_THROW(parse("a b"), parse_error);
}

TEST(EdnWriter, KeywordFormsAndPrettyPrinting){
    auto f = keyword_form("field", {{"type", n_str("i32")}, {"async", n_bool(false)}});
    append_kv(f, "method", n_sym("id"));
    EXPECT_EQ(to_string(f), "(field :type \"i32\" :async false :method id)");

    auto nested = keyword_form("contract", {{"fields", node_vec({f})}});
    auto pretty = to_pretty_string(nested);
    EXPECT_NE(pretty.find("\n  :fields"), std::string::npos);
    EXPECT_EQ(to_string(parse(pretty)), to_string(nested));

    node_ptr atom = n_sym("x");
    EXPECT_THROW(append_kv(atom, "k", n_nil()), std::invalid_argument);
}

TEST(EdnReader, NumbersMustBeWholeLexemes){
    EXPECT_THROW(parse("1e"), parse_error);
    EXPECT_THROW(parse("1.5e+"), parse_error);
    EXPECT_EQ(to_string(parse("12")), "12");
    EXPECT_EQ(to_string(parse("1e3")), "1000.0");
}

TEST(EdnWriter, FloatsKeepTheirDigits){
    EXPECT_EQ(to_string(parse("3.14159265358979")), "3.14159265358979");
    EXPECT_EQ(to_string(parse("2.0")), "2.0");
    EXPECT_EQ(to_string(parse("0.1")), "0.1");
    auto third = parse("0.3333333333333333");
    EXPECT_EQ(to_string(parse(to_string(third))), to_string(third));
}
