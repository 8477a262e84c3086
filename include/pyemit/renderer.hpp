// Target-independent render driver: naming pass, declaration ordering and a buffered line sink
#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "pyemit/naming.hpp"
#include "pyemit/options.hpp"
#include "pyemit/order.hpp"
#include "pyemit/types.hpp"

namespace pyemit
{

    // Upstream contract violation detected while rendering (e.g. the None sentinel was reached).
    struct render_error : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    struct RenderResult
    {
        std::vector<std::string> lines;
        // Lines joined with '\n', each terminated by a newline.
        std::string to_source() const;
    };

    class Renderer
    {
    public:
        Renderer(const TypeGraph &graph, RenderOptions options, std::unique_ptr<Namer> namer);
        virtual ~Renderer() = default;
        Renderer(const Renderer &) = delete;
        Renderer &operator=(const Renderer &) = delete;

        // Fresh name table and line buffer on every call; lines are handed out only if emission completes.
        RenderResult render();

        const NameTable &names() const { return names_; }

    protected:
        virtual std::string style_type_name(const std::string &raw) const = 0;
        virtual std::string style_property_name(const std::string &raw) const = 0;
        virtual std::string style_enum_case_name(const std::string &raw) const = 0;
        virtual std::unordered_set<std::string> forbidden_words(NameScope scope) const = 0;
        virtual DeclarationOrder declaration_order() const = 0;
        virtual void emit_source_structure() = 0;

        const TypeGraph &graph() const { return graph_; }
        const RenderOptions &options() const { return options_; }
        const std::vector<TypeId> &ordered_types() const { return ordered_; }
        bool has_cycles() const { return has_cycles_; }
        // Declared types referenced by a declared id, computed once per render.
        const std::vector<TypeId> &dependencies_of(TypeId id) const { return dependencies_.at(id); }
        // Root rendered as `Name = <type>` instead of naming a declaration after itself.
        bool top_level_is_alias(size_t index) const { return top_level_alias_.at(index); }

        void emit_line(const std::string &text = std::string());
        // Pad to n trailing blank lines; no-op on an empty buffer.
        void emit_blank_lines(unsigned n);
        bool buffer_empty() const { return lines_.empty(); }
        // One prefixed line per comment line; embedded newlines split.
        static std::vector<std::string> comment_lines(const std::string &prefix, const std::vector<std::string> &comments);
        void prepend_lines(const std::vector<std::string> &lines);
        void indent() { ++indent_; }
        void dedent() { --indent_; }
        virtual std::string indent_unit() const { return "    "; }

    private:
        void assign_names(const std::vector<TypeId> &canonical);

        const TypeGraph &graph_;
        RenderOptions options_;
        std::unique_ptr<Namer> namer_;

        NameTable names_;
        std::vector<TypeId> ordered_;
        DependencyLists dependencies_;
        bool has_cycles_ = false;
        std::vector<bool> top_level_alias_;
        std::vector<std::string> lines_;
        unsigned indent_ = 0;
    };

} // namespace pyemit
