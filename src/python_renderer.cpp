#include "pyemit/python_renderer.hpp"
#include "pyemit/log.hpp"

namespace pyemit
{

namespace
{
    const char *const kKeywords[] = {"False", "None", "True", "and", "as", "assert", "async", "await",
                                     "break", "class", "continue", "def", "del", "elif", "else", "except",
                                     "finally", "for", "from", "global", "if", "import", "in", "is",
                                     "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
                                     "while", "with", "yield"};

    // Names the generated module imports or relies on, plus reserved upstream words.
    const char *const kModuleNames[] = {"Any", "Optional", "Union", "Enum", "date", "time", "datetime",
                                        "list", "dict", "str", "int", "float", "bool", "type", "id"};

    const size_t kMaxSignatureWidth = 79;
} // namespace

PythonRenderer::PythonRenderer(const TypeGraph &graph, RenderOptions options, std::unique_ptr<Namer> namer)
    : Renderer(graph, std::move(options), std::move(namer))
{
}

const NameStyle &PythonRenderer::type_name_style()
{
    static const NameStyle s{first_upper_word_style, first_upper_word_style, all_upper_word_style,
                             all_upper_word_style, ""};
    return s;
}

const NameStyle &PythonRenderer::property_name_style()
{
    static const NameStyle s{all_lower_word_style, first_upper_word_style, all_lower_word_style,
                             all_upper_word_style, ""};
    return s;
}

bool PythonRenderer::is_start_character(unicode::CodePoint cp) const
{
    if (cp == '_')
        return true;
    if (options().ascii_identifiers)
        return cp < 0x80 && ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z'));
    return unicode::is_alphabetic(cp);
}

bool PythonRenderer::is_part_character(unicode::CodePoint cp) const
{
    if (options().ascii_identifiers)
        return unicode::is_ascii_letter_digit_or_underscore(cp);
    return is_start_character(cp) || unicode::is_decimal_digit(cp) || unicode::is_connector_punctuation(cp) ||
           unicode::is_mark(cp);
}

std::string PythonRenderer::style(const std::string &raw, const NameStyle &s) const
{
    auto legalize = make_legalizer([this](unicode::CodePoint cp) { return is_part_character(cp); });
    return combine_words(split_into_words(raw), legalize, s,
                         [this](unicode::CodePoint cp) { return is_start_character(cp); });
}

std::string PythonRenderer::style_type_name(const std::string &raw) const { return style(raw, type_name_style()); }
std::string PythonRenderer::style_property_name(const std::string &raw) const
{
    return style(raw, property_name_style());
}
std::string PythonRenderer::style_enum_case_name(const std::string &raw) const
{
    return style(raw, type_name_style());
}

std::unordered_set<std::string> PythonRenderer::forbidden_words(NameScope scope) const
{
    std::unordered_set<std::string> words(std::begin(kKeywords), std::end(kKeywords));
    switch (scope)
    {
    case NameScope::Global:
        words.insert(std::begin(kModuleNames), std::end(kModuleNames));
        break;
    case NameScope::ClassProperties:
        words.insert(std::begin(kModuleNames), std::end(kModuleNames));
        words.insert("self");
        break;
    case NameScope::EnumCases:
        words.insert({"name", "value", "mro"});
        break;
    }
    return words;
}

std::string PythonRenderer::source_for(TypeId id)
{
    struct V
    {
        PythonRenderer &r;
        TypeId id;

        std::string operator()(const NoneType &) const
        {
            throw render_error("none type reached the renderer: " + r.graph().describe(id) +
                               (r.context_.empty() ? std::string() : " in " + r.context_));
        }
        std::string operator()(const AnyType &) const
        {
            r.typing_names_.insert("Any");
            return "Any";
        }
        std::string operator()(const NullType &) const { return "None"; }
        std::string operator()(const BoolType &) const { return "bool"; }
        std::string operator()(const IntegerType &) const { return "int"; }
        std::string operator()(const DoubleType &) const { return "float"; }
        std::string operator()(const StringType &) const { return "str"; }
        std::string operator()(const DateType &) const
        {
            r.datetime_names_.insert("date");
            return "date";
        }
        std::string operator()(const TimeType &) const
        {
            r.datetime_names_.insert("time");
            return "time";
        }
        std::string operator()(const DateTimeType &) const
        {
            r.datetime_names_.insert("datetime");
            return "datetime";
        }
        std::string operator()(const ArrayType &a) const { return "list[" + r.source_for(a.items) + "]"; }
        std::string operator()(const MapType &m) const { return "dict[str, " + r.source_for(m.values) + "]"; }
        std::string operator()(const ClassType &) const { return r.names().type_name(id); }
        std::string operator()(const EnumType &) const { return r.names().type_name(id); }
        std::string operator()(const UnionType &u) const
        {
            if (auto inner = r.graph().nullable_inner(id))
            {
                r.typing_names_.insert("Optional");
                return "Optional[" + r.source_for(*inner) + "]";
            }
            if (r.options().declare_unions)
            {
                const std::string &name = r.names().type_name(id);
                // Module-level expressions are evaluated eagerly: quote unions not yet bound.
                if (r.eager_ && !r.emitted_unions_.count(id))
                    return "\"" + name + "\"";
                return name;
            }
            std::string out;
            for (size_t i = 0; i < u.members.size(); ++i)
            {
                if (i)
                    out += " | ";
                out += r.source_for(u.members[i]);
            }
            return out;
        }
    };
    return std::visit(V{*this, id}, graph().at(id).data);
}

std::string PythonRenderer::property_source(const ClassProperty &p)
{
    std::string src = source_for(p.type);
    if (p.optional && !graph().nullable_inner(p.type) && !graph().is<NullType>(p.type) &&
        !graph().is<AnyType>(p.type))
    {
        typing_names_.insert("Optional");
        return "Optional[" + src + "]";
    }
    return src;
}

void PythonRenderer::emit_class(TypeId id, const ClassType &c)
{
    const auto &name = names().type_name(id);
    const auto &props = names().property_names(id);
    emit_line("class " + name + ":");
    indent();
    if (c.properties.empty())
    {
        emit_line("pass");
        dedent();
        return;
    }

    std::vector<std::string> sources;
    for (auto &p : c.properties)
    {
        context_ = "property '" + p.name + "' of class " + name;
        sources.push_back(property_source(p));
    }
    context_.clear();

    for (size_t i = 0; i < props.size(); ++i)
        emit_line(props[i] + ": " + sources[i]);
    emit_blank_lines(1);

    std::string params = "self";
    for (size_t i = 0; i < props.size(); ++i)
        params += ", " + props[i] + ": " + sources[i];
    std::string signature = "def __init__(" + params + ") -> None:";
    if (indent_unit().size() + signature.size() <= kMaxSignatureWidth)
        emit_line(signature);
    else
    {
        emit_line("def __init__(");
        indent();
        emit_line("self,");
        for (size_t i = 0; i < props.size(); ++i)
            emit_line(props[i] + ": " + sources[i] + ",");
        dedent();
        emit_line(") -> None:");
    }
    indent();
    for (auto &p : props)
        emit_line("self." + p + " = " + p);
    dedent();
    dedent();
}

void PythonRenderer::emit_enum(TypeId id, const EnumType &e)
{
    uses_enum_ = true;
    emit_line("class " + names().type_name(id) + "(Enum):");
    indent();
    if (e.cases.empty())
        emit_line("pass");
    int ordinal = 0;
    for (auto &c : names().case_names(id))
        emit_line(c + " = " + std::to_string(ordinal++));
    dedent();
}

void PythonRenderer::emit_union(TypeId id, const UnionType &u)
{
    typing_names_.insert("Union");
    context_ = "union " + names().type_name(id);
    emit_line(names().type_name(id) + " = Union[");
    indent();
    for (TypeId m : u.members)
        emit_line(source_for(m) + ",");
    dedent();
    emit_line("]");
    context_.clear();
    emitted_unions_.insert(id);
}

void PythonRenderer::emit_top_level_aliases()
{
    const auto &tops = graph().top_levels();
    bool first = true;
    for (size_t i = 0; i < tops.size(); ++i)
    {
        if (!top_level_is_alias(i))
            continue;
        if (first)
            emit_blank_lines(2);
        first = false;
        context_ = "top-level '" + tops[i].name + "'";
        emit_line(names().top_level_name(i) + " = " + source_for(tops[i].type));
    }
    context_.clear();
}

bool PythonRenderer::needs_postponed_annotations() const
{
    if (has_cycles())
        return true;
    if (!options().declare_unions)
        return false;
    for (TypeId id : ordered_types())
    {
        if (!graph().is<ClassType>(id))
            continue;
        for (TypeId d : dependencies_of(id))
        {
            if (graph().is<UnionType>(d))
                return true;
        }
    }
    return false;
}

std::vector<std::string> PythonRenderer::header_lines() const
{
    std::vector<std::string> groups[3];
    groups[0] = comment_lines("# ", options().leading_comments);
    if (needs_postponed_annotations())
        groups[1].push_back("from __future__ import annotations");

    auto join = [](const std::set<std::string> &names) {
        std::string out;
        for (auto &n : names)
            out += (out.empty() ? "" : ", ") + n;
        return out;
    };
    if (!datetime_names_.empty())
        groups[2].push_back("from datetime import " + join(datetime_names_));
    if (uses_enum_)
        groups[2].push_back("from enum import Enum");
    if (!typing_names_.empty())
        groups[2].push_back("from typing import " + join(typing_names_));

    std::vector<std::string> out;
    for (auto &g : groups)
    {
        if (g.empty())
            continue;
        if (!out.empty())
            out.emplace_back();
        out.insert(out.end(), g.begin(), g.end());
    }
    return out;
}

void PythonRenderer::emit_source_structure()
{
    typing_names_.clear();
    datetime_names_.clear();
    uses_enum_ = false;
    context_.clear();
    emitted_unions_.clear();
    eager_ = false;

    // Body first: the import block lists exactly what the body used.
    std::vector<TypeId> unions;
    for (TypeId id : ordered_types())
    {
        const Type &t = graph().at(id);
        if (auto *c = std::get_if<ClassType>(&t.data))
        {
            emit_blank_lines(2);
            emit_class(id, *c);
        }
        else if (auto *e = std::get_if<EnumType>(&t.data))
        {
            emit_blank_lines(2);
            emit_enum(id, *e);
        }
        else if (std::holds_alternative<UnionType>(t.data))
            unions.push_back(id);
    }

    eager_ = true;
    for (TypeId id : unions)
    {
        emit_blank_lines(2);
        emit_union(id, *graph().get_if<UnionType>(id));
    }
    emit_top_level_aliases();
    eager_ = false;

    auto header = header_lines();
    if (!header.empty() && !buffer_empty())
        header.insert(header.end(), 2, std::string());
    if (debug_enabled())
        debug_log("python") << header.size() << " header lines, " << unions.size() << " declared unions\n";
    prepend_lines(header);
}

RenderResult render(const TypeGraph &graph, const RenderOptions &options)
{
    PythonRenderer r(graph, options);
    return r.render();
}

} // namespace pyemit
