#include <gtest/gtest.h>
#include "pyemit/edn.hpp"

using namespace pyemit::edn;

TEST(EdnReader, ScalarsAndPositions){
    auto n = parse("(graph :types [Person \"a b\" 42 -1.5 true nil])");
    ASSERT_TRUE(is_list(*n));
    EXPECT_EQ(head_of(*n), "graph");
    auto& elems = as_list(*n)->elems;
    ASSERT_EQ(elems.size(), 3u);
    EXPECT_TRUE(is_keyword(*elems[1]));
    EXPECT_EQ(std::get<keyword>(elems[1]->data).name, "types");
    EXPECT_EQ(elems[1]->col, 8);
    auto* v = as_vector(*elems[2]);
    ASSERT_NE(v, nullptr);
    ASSERT_EQ(v->elems.size(), 6u);
    EXPECT_EQ(text_of(v->elems[0]), "Person");
    EXPECT_EQ(text_of(v->elems[1]), "a b");
    EXPECT_EQ(std::get<int64_t>(v->elems[2]->data), 42);
    EXPECT_DOUBLE_EQ(std::get<double>(v->elems[3]->data), -1.5);
    EXPECT_EQ(std::get<bool>(v->elems[4]->data), true);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(v->elems[5]->data));
}

TEST(EdnReader, CommentsCommasAndLines){
    auto n = parse("; leading comment\n[a,\n  b ; trailing\n  date-time]");
    auto* v = as_vector(*n);
    ASSERT_NE(v, nullptr);
    ASSERT_EQ(v->elems.size(), 3u);
    EXPECT_EQ(n->line, 2);
    EXPECT_EQ(v->elems[1]->line, 3);
    EXPECT_EQ(v->elems[1]->col, 3);
    EXPECT_EQ(text_of(v->elems[2]), "date-time");
}

TEST(EdnReader, StringEscapes){
    auto n = parse("\"line\\none \\\"q\\\"\"");
    EXPECT_EQ(std::get<std::string>(n->data), "line\none \"q\"");
}

TEST(EdnReader, MapsPairEntries){
    auto n = parse("{:a 1 :b [x]}");
    auto& m = std::get<map>(n->data);
    ASSERT_EQ(m.entries.size(), 2u);
    EXPECT_EQ(to_string(*n), "{:a 1 :b [x]}");
}

TEST(EdnReader, ErrorsCarryPositions){
    try {
        parse("(graph\n  :types [)");
        FAIL() << "expected parse_error";
    } catch(const parse_error& e){
        EXPECT_EQ(e.line, 2);
        EXPECT_EQ(e.col, 11);
    }
    EXPECT_THROW(parse("\"open"), parse_error);
    EXPECT_THROW(parse("{:a}"), parse_error);
    EXPECT_THROW(parse("(a) (b)"), parse_error);
    EXPECT_THROW(parse(""), parse_error);
    EXPECT_THROW(parse("(a @)"), parse_error);
}

TEST(EdnReader, FormHelpers){
    auto n = parse("(prop :name \"x\" :optional true)");
    EXPECT_EQ(head_of(*n), "prop");
    EXPECT_EQ(to_string(n), "(prop :name \"x\" :optional true)");
    EXPECT_EQ(text_of(as_list(*n)->elems[2]), "x");
    EXPECT_EQ(text_of(as_list(*n)->elems[1]), "");
    EXPECT_EQ(to_string(parse("[]")), "[]");
    EXPECT_EQ(to_string(node_ptr()), "nil");
    EXPECT_EQ(head_of(*parse("[a]")), "");
    EXPECT_EQ(head_of(*parse("(\"a\")")), "");
}
