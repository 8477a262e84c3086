// Python 3 target: annotated classes, Enum classes and typing aliases
#pragma once
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "pyemit/renderer.hpp"
#include "pyemit/strings.hpp"

namespace pyemit
{

    class PythonRenderer : public Renderer
    {
    public:
        PythonRenderer(const TypeGraph &graph, RenderOptions options,
                       std::unique_ptr<Namer> namer = make_default_namer());

        // Syntax for a reference to id. Valid after names were assigned (inside render()).
        std::string source_for(TypeId id);

        bool is_start_character(unicode::CodePoint cp) const;
        bool is_part_character(unicode::CodePoint cp) const;

        static const NameStyle &type_name_style();
        static const NameStyle &property_name_style();

    protected:
        std::string style_type_name(const std::string &raw) const override;
        std::string style_property_name(const std::string &raw) const override;
        std::string style_enum_case_name(const std::string &raw) const override;
        std::unordered_set<std::string> forbidden_words(NameScope scope) const override;
        DeclarationOrder declaration_order() const override { return DeclarationOrder::DependenciesFirst; }
        void emit_source_structure() override;

    private:
        std::string style(const std::string &raw, const NameStyle &s) const;
        std::string property_source(const ClassProperty &p);
        void emit_class(TypeId id, const ClassType &c);
        void emit_enum(TypeId id, const EnumType &e);
        void emit_union(TypeId id, const UnionType &u);
        void emit_top_level_aliases();
        bool needs_postponed_annotations() const;
        std::vector<std::string> header_lines() const;

        std::set<std::string> typing_names_;
        std::set<std::string> datetime_names_;
        bool uses_enum_ = false;
        std::string context_;                // what is being rendered, for contract-violation messages
        bool eager_ = false;                 // rendering a module-level expression, not an annotation
        std::unordered_set<TypeId> emitted_unions_;
    };

    // Convenience entry point.
    RenderResult render(const TypeGraph &graph, const RenderOptions &options);

} // namespace pyemit
