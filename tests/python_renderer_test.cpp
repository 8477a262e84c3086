#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "pyemit/python_renderer.hpp"

using namespace pyemit;

namespace {
using Lines = std::vector<std::string>;

Lines render_lines(const TypeGraph& g, RenderOptions opts = {}){
    return render(g, opts).lines;
}
bool has_line(const Lines& lines, const std::string& l){
    return std::find(lines.begin(), lines.end(), l) != lines.end();
}
size_t line_index(const Lines& lines, const std::string& l){
    return (size_t)(std::find(lines.begin(), lines.end(), l) - lines.begin());
}
}

TEST(PythonRenderer, ClassFieldsAndInitializerKeepPropertyOrder){
    TypeGraph g;
    auto person = g.add_class("Person", {{"name", g.get_string()}, {"age", g.get_integer()}});
    g.add_top_level("Person", person);
    Lines expected{
        "class Person:",
        "    name: str",
        "    age: int",
        "",
        "    def __init__(self, name: str, age: int) -> None:",
        "        self.name = name",
        "        self.age = age",
    };
    EXPECT_EQ(render_lines(g), expected);
}

TEST(PythonRenderer, NullableUnionCollapsesToOptional){
    TypeGraph g;
    auto foo = g.add_class("Foo", {{"bar", g.add_nullable(g.get_string())}});
    g.add_top_level("Foo", foo);
    Lines expected{
        "from typing import Optional",
        "",
        "",
        "class Foo:",
        "    bar: Optional[str]",
        "",
        "    def __init__(self, bar: Optional[str]) -> None:",
        "        self.bar = bar",
    };
    EXPECT_EQ(render_lines(g), expected);
}

TEST(PythonRenderer, OptionalPropertiesAreWrappedOnce){
    TypeGraph g;
    auto c = g.add_class("C", {{"a", g.get_integer(), true},
                               {"b", g.add_nullable(g.get_string()), true},
                               {"c", g.get_any(), true},
                               {"d", g.get_null(), true}});
    g.add_top_level("C", c);
    auto lines = render_lines(g);
    EXPECT_TRUE(has_line(lines, "    a: Optional[int]"));
    EXPECT_TRUE(has_line(lines, "    b: Optional[str]"));
    EXPECT_TRUE(has_line(lines, "    c: Any"));
    EXPECT_TRUE(has_line(lines, "    d: None"));
    EXPECT_EQ(lines.front(), "from typing import Any, Optional");
}

TEST(PythonRenderer, SourceForEveryNonSentinelVariant){
    TypeGraph g;
    PythonRenderer r(g, {});
    EXPECT_EQ(r.source_for(g.get_any()), "Any");
    EXPECT_EQ(r.source_for(g.get_null()), "None");
    EXPECT_EQ(r.source_for(g.get_bool()), "bool");
    EXPECT_EQ(r.source_for(g.get_integer()), "int");
    EXPECT_EQ(r.source_for(g.get_double()), "float");
    EXPECT_EQ(r.source_for(g.get_string()), "str");
    EXPECT_EQ(r.source_for(g.get_date()), "date");
    EXPECT_EQ(r.source_for(g.get_time()), "time");
    EXPECT_EQ(r.source_for(g.get_date_time()), "datetime");
    EXPECT_EQ(r.source_for(g.get_array(g.get_string())), "list[str]");
    EXPECT_EQ(r.source_for(g.get_map(g.get_array(g.get_double()))), "dict[str, list[float]]");
    EXPECT_EQ(r.source_for(g.add_nullable(g.get_bool())), "Optional[bool]");
    EXPECT_EQ(r.source_for(g.add_union("", {g.get_integer(), g.get_string(), g.get_null()})), "int | str | None");
    EXPECT_THROW(r.source_for(g.get_none()), render_error);
}

TEST(PythonRenderer, NoneSentinelIsAContractViolation){
    TypeGraph g;
    auto bad = g.add_class("Bad", {{"ok", g.get_string()}, {"x", g.get_array(g.get_none())}});
    g.add_top_level("Bad", bad);
    try {
        render(g, {});
        FAIL() << "expected render_error";
    } catch(const render_error& e){
        std::string msg = e.what();
        EXPECT_NE(msg.find("none"), std::string::npos);
        EXPECT_NE(msg.find("property 'x'"), std::string::npos);
    }

    TypeGraph g2;
    g2.add_top_level("nothing", g2.get_none());
    EXPECT_THROW(render(g2, {}), render_error);
}

TEST(PythonRenderer, EnumOrdinalsRestartPerEnum){
    TypeGraph g;
    auto color = g.add_enum("Color", {"red", "green", "blue"});
    auto size = g.add_enum("Size", {"small", "large"});
    auto shirt = g.add_class("Shirt", {{"color", color}, {"size", size}});
    g.add_top_level("Shirt", shirt);
    auto lines = render_lines(g);
    EXPECT_EQ(lines.front(), "from enum import Enum");
    auto c = line_index(lines, "class Color(Enum):");
    auto s = line_index(lines, "class Size(Enum):");
    ASSERT_LT(c, lines.size());
    ASSERT_LT(s, lines.size());
    EXPECT_EQ(lines[c+1], "    Red = 0");
    EXPECT_EQ(lines[c+2], "    Green = 1");
    EXPECT_EQ(lines[c+3], "    Blue = 2");
    EXPECT_EQ(lines[s+1], "    Small = 0");
    EXPECT_EQ(lines[s+2], "    Large = 1");
    EXPECT_LT(s, line_index(lines, "class Shirt:"));
    EXPECT_TRUE(has_line(lines, "    color: Color"));
}

TEST(PythonRenderer, EmptyEnumAndClassEmitPass){
    TypeGraph g;
    auto e = g.add_enum("Nothing", {});
    auto c = g.add_class("Blank", {});
    auto holder = g.add_class("Holder", {{"e", e}, {"c", c}});
    g.add_top_level("Holder", holder);
    auto lines = render_lines(g);
    auto ei = line_index(lines, "class Nothing(Enum):");
    auto ci = line_index(lines, "class Blank:");
    ASSERT_LT(ei, lines.size());
    ASSERT_LT(ci, lines.size());
    EXPECT_EQ(lines[ei+1], "    pass");
    EXPECT_EQ(lines[ci+1], "    pass");
}

TEST(PythonRenderer, ReservedWordsAreSuffixed){
    TypeGraph g;
    auto kinds = g.add_enum("Kind", {"none", "True", "value", "plain"});
    auto any = g.add_class("any", {{"type", g.get_string()}, {"self", g.get_integer()}, {"class", g.get_bool()},
                                   {"id", g.get_string()}, {"kind", kinds}});
    g.add_top_level("any", any);
    auto lines = render_lines(g);
    EXPECT_TRUE(has_line(lines, "class Any1:"));
    EXPECT_TRUE(has_line(lines, "    type1: str"));
    EXPECT_TRUE(has_line(lines, "    self1: int"));
    EXPECT_TRUE(has_line(lines, "    class1: bool"));
    EXPECT_TRUE(has_line(lines, "    id1: str"));
    EXPECT_TRUE(has_line(lines, "        self.type1 = type1"));
    EXPECT_TRUE(has_line(lines, "    None1 = 0"));
    EXPECT_TRUE(has_line(lines, "    True1 = 1"));
    EXPECT_TRUE(has_line(lines, "    Value = 2"));
    EXPECT_TRUE(has_line(lines, "    Plain = 3"));
}

TEST(PythonRenderer, ConflictingNamesAcrossScopes){
    TypeGraph g;
    auto item = g.add_class("item", {{"first name", g.get_string()}, {"first_name", g.get_string()}});
    g.add_top_level("item", g.get_array(item));
    PythonRenderer r(g, {});
    auto lines = r.render().lines;
    EXPECT_EQ(r.names().top_level_name(0), "Item");
    EXPECT_EQ(r.names().type_name(item), "Item1");
    EXPECT_TRUE(has_line(lines, "class Item1:"));
    EXPECT_TRUE(has_line(lines, "    firstName: str"));
    EXPECT_TRUE(has_line(lines, "    firstName1: str"));
    EXPECT_EQ(lines.back(), "Item = list[Item1]");
}

TEST(PythonRenderer, ImportsListExactlyTheNamesUsed){
    TypeGraph g;
    auto kind = g.add_enum("kind", {"a"});
    auto ev = g.add_class("Event", {{"when", g.get_date_time()}, {"day", g.get_date()}, {"at", g.get_time()},
                                    {"payload", g.get_any()}, {"kind", kind}});
    g.add_top_level("Event", ev);
    auto lines = render_lines(g);
    ASSERT_GE(lines.size(), 5u);
    EXPECT_EQ(lines[0], "from datetime import date, datetime, time");
    EXPECT_EQ(lines[1], "from enum import Enum");
    EXPECT_EQ(lines[2], "from typing import Any");
    EXPECT_EQ(lines[3], "");
    EXPECT_EQ(lines[4], "");

    TypeGraph plain;
    plain.add_top_level("n", plain.get_integer());
    EXPECT_EQ(render_lines(plain), (Lines{"N = int"}));
}

TEST(PythonRenderer, DeclaredUnionsComeAfterClasses){
    TypeGraph g;
    auto phone = g.add_class("Phone", {{"number", g.get_string()}});
    auto contact = g.add_union("Contact", {g.get_string(), phone});
    auto person = g.add_class("Person", {{"contact", contact}});
    g.add_top_level("Person", person);
    RenderOptions opts; opts.declare_unions = true;
    Lines expected{
        "from __future__ import annotations",
        "",
        "from typing import Union",
        "",
        "",
        "class Phone:",
        "    number: str",
        "",
        "    def __init__(self, number: str) -> None:",
        "        self.number = number",
        "",
        "",
        "class Person:",
        "    contact: Contact",
        "",
        "    def __init__(self, contact: Contact) -> None:",
        "        self.contact = contact",
        "",
        "",
        "Contact = Union[",
        "    str,",
        "    Phone,",
        "]",
    };
    EXPECT_EQ(render_lines(g, opts), expected);
}

TEST(PythonRenderer, InlineUnionsWhenNotDeclared){
    TypeGraph g;
    auto phone = g.add_class("Phone", {{"number", g.get_string()}});
    auto contact = g.add_union("Contact", {g.get_string(), phone});
    auto person = g.add_class("Person", {{"contact", contact}});
    g.add_top_level("Person", person);
    auto lines = render_lines(g);
    EXPECT_EQ(lines.front(), "class Phone:");
    EXPECT_TRUE(has_line(lines, "    contact: str | Phone"));
    for(auto& l : lines) EXPECT_EQ(l.find("Union"), std::string::npos) << l;
}

TEST(PythonRenderer, ForwardReferencesBetweenDeclaredUnionsAreQuoted){
    TypeGraph g;
    auto holder = g.add_class("holder");
    auto root = g.add_union("first", {g.get_integer(), holder});
    auto second = g.add_union("second", {g.get_string(), root});
    g.set_class_properties(holder, {{"u", second}});
    g.add_top_level("root", root);
    RenderOptions opts; opts.declare_unions = true;
    auto lines = render_lines(g, opts);
    EXPECT_EQ(lines.front(), "from __future__ import annotations");
    auto h = line_index(lines, "class Holder:");
    auto s = line_index(lines, "Second = Union[");
    auto r = line_index(lines, "Root = Union[");
    ASSERT_LT(r, lines.size());
    EXPECT_LT(h, s);
    EXPECT_LT(s, r);
    EXPECT_EQ(lines[s+2], "    \"Root\",");
    EXPECT_EQ(lines[r+2], "    Holder,");
}

TEST(PythonRenderer, RecursiveClassesPostponeAnnotations){
    TypeGraph g;
    auto node = g.add_class("Node");
    g.set_class_properties(node, {{"children", g.get_array(node)}, {"parent", g.add_nullable(node)}});
    g.add_top_level("node", node);
    Lines expected{
        "from __future__ import annotations",
        "",
        "from typing import Optional",
        "",
        "",
        "class Node:",
        "    children: list[Node]",
        "    parent: Optional[Node]",
        "",
        "    def __init__(self, children: list[Node], parent: Optional[Node]) -> None:",
        "        self.children = children",
        "        self.parent = parent",
    };
    EXPECT_EQ(render_lines(g), expected);
}

TEST(PythonRenderer, TopLevelAliases){
    TypeGraph g;
    auto person = g.add_class("Person", {{"name", g.get_string()}});
    g.add_top_level("people", g.get_array(person));
    g.add_top_level("count", g.get_integer());
    Lines expected{
        "class Person:",
        "    name: str",
        "",
        "    def __init__(self, name: str) -> None:",
        "        self.name = name",
        "",
        "",
        "People = list[Person]",
        "Count = int",
    };
    EXPECT_EQ(render_lines(g), expected);

    TypeGraph g2;
    auto c = g2.add_class("C");
    g2.add_top_level("First", c);
    g2.add_top_level("Second", c);
    EXPECT_EQ(render_lines(g2), (Lines{"class First:", "    pass", "", "", "Second = First"}));
}

TEST(PythonRenderer, LongInitializerSignatureIsExploded){
    TypeGraph g;
    auto contact = g.add_class("Contact", {{"first name", g.get_string()}, {"last name", g.get_string()},
                                           {"email address", g.get_string()}, {"phone number", g.get_string()}});
    g.add_top_level("Contact", contact);
    auto lines = render_lines(g);
    auto d = line_index(lines, "    def __init__(");
    ASSERT_LT(d + 7, lines.size());
    EXPECT_EQ(lines[d+1], "        self,");
    EXPECT_EQ(lines[d+2], "        firstName: str,");
    EXPECT_EQ(lines[d+5], "        phoneNumber: str,");
    EXPECT_EQ(lines[d+6], "    ) -> None:");
    EXPECT_EQ(lines[d+7], "        self.firstName = firstName");
}

TEST(PythonRenderer, LeadingComments){
    TypeGraph g;
    g.add_top_level("n", g.get_integer());
    RenderOptions opts; opts.leading_comments = {"generated", "two\nlines"};
    EXPECT_EQ(render_lines(g, opts), (Lines{"# generated", "# two", "# lines", "", "", "N = int"}));
}

TEST(PythonRenderer, AsciiIdentifiersOption){
    TypeGraph g;
    auto c = g.add_class("Gr\xC3\xB6\xC3\x9F" "e", {{"na\xC3\xAF" "ve", g.get_string()}});
    g.add_top_level("Gr\xC3\xB6\xC3\x9F" "e", c);
    auto unicode_lines = render_lines(g);
    EXPECT_EQ(unicode_lines.front(), "class Gr\xC3\xB6\xC3\x9F" "e:");
    EXPECT_TRUE(has_line(unicode_lines, "    na\xC3\xAF" "ve: str"));
    RenderOptions opts; opts.ascii_identifiers = true;
    auto ascii_lines = render_lines(g, opts);
    EXPECT_EQ(ascii_lines.front(), "class Gre:");
    EXPECT_TRUE(has_line(ascii_lines, "    nave: str"));
}

TEST(PythonRenderer, RenderingTwiceIsIdentical){
    TypeGraph g;
    auto a = g.add_class("a", {{"x", g.add_nullable(g.get_date())}});
    g.add_top_level("a", a);
    PythonRenderer r(g, {});
    auto first = r.render();
    auto second = r.render();
    EXPECT_EQ(first.lines, second.lines);
    EXPECT_EQ(first.to_source(), "from datetime import date\nfrom typing import Optional\n\n\nclass A:\n    x: Optional[date]\n\n    def __init__(self, x: Optional[date]) -> None:\n        self.x = x\n");
}

TEST(PythonRenderer, EmptyGraphRendersNothing){
    TypeGraph g;
    EXPECT_TRUE(render_lines(g).empty());
    EXPECT_EQ(render(g, {}).to_source(), "");
}

TEST(PythonRenderer, DeepReferenceChainRendersInDependencyOrder){
    const size_t depth = 200000;
    TypeGraph g;
    TypeId link = g.add_class("Link", {{"value", g.get_integer()}});
    for (size_t i = 1; i < depth; ++i)
        link = g.add_class("Link", {{"next", g.add_nullable(link)}});
    g.add_top_level("Link", link);

    auto lines = render_lines(g);
    EXPECT_EQ(std::count_if(lines.begin(), lines.end(), [](const std::string& l){ return l.rfind("class ", 0) == 0; }),
              (long)depth);
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0], "from typing import Optional");
    EXPECT_EQ(lines[3], "class Link" + std::to_string(depth - 1) + ":");
    EXPECT_EQ(lines[4], "    value: int");
    auto head = line_index(lines, "class Link:");
    ASSERT_LT(head + 1, lines.size());
    EXPECT_EQ(lines[head + 1], "    next: Optional[Link1]");
    EXPECT_FALSE(has_line(lines, "from __future__ import annotations"));
}

TEST(PythonRenderer, NamesInNonLatinScripts){
    TypeGraph g;
    auto city = g.add_class("কলকাতা", {{"ƁigName", g.get_string()}, {"தமிழ் நாடு", g.get_integer()}});
    g.add_top_level("কলকাতা", city);
    auto lines = render_lines(g);
    EXPECT_TRUE(has_line(lines, "class কলকাতা:"));
    EXPECT_TRUE(has_line(lines, "    ɓigName: str"));
    EXPECT_TRUE(has_line(lines, "    தமிழ்நாடு: int"));
}
