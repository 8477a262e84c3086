#include "pyemit/renderer.hpp"
#include "pyemit/log.hpp"

namespace pyemit
{

    std::string RenderResult::to_source() const
    {
        std::string out;
        for (auto &l : lines)
        {
            out += l;
            out += '\n';
        }
        return out;
    }

    Renderer::Renderer(const TypeGraph &graph, RenderOptions options, std::unique_ptr<Namer> namer)
        : graph_(graph), options_(std::move(options)), namer_(std::move(namer))
    {
        if (!namer_)
            namer_ = make_default_namer();
    }

    RenderResult Renderer::render()
    {
        lines_.clear();
        indent_ = 0;
        names_ = NameTable{};

        const bool declare_unions = options_.declare_unions;
        auto canonical = collect_named_types(graph_, declare_unions);
        assign_names(canonical);
        auto ordered = order_declarations(graph_, canonical, declaration_order(), declare_unions);
        ordered_ = std::move(ordered.order);
        dependencies_ = std::move(ordered.dependencies);
        has_cycles_ = ordered.has_cycles;
        if (debug_enabled())
            debug_log("render") << canonical.size() << " declarations, " << graph_.top_levels().size()
                                << " top-levels, cycles=" << (has_cycles_ ? "yes" : "no") << "\n";

        emit_source_structure();

        RenderResult r{std::move(lines_)};
        lines_.clear();
        while (!r.lines.empty() && r.lines.back().empty())
            r.lines.pop_back();
        return r;
    }

    void Renderer::assign_names(const std::vector<TypeId> &canonical)
    {
        const bool declare_unions = options_.declare_unions;
        const auto &tops = graph_.top_levels();

        // Global scope: top-levels first (in root order), then remaining declarations in canonical order.
        std::vector<std::string> candidates;
        std::vector<TypeId> claimed_by_top(tops.size(), 0);
        std::unordered_set<TypeId> claimed;
        top_level_alias_.assign(tops.size(), true);
        for (size_t i = 0; i < tops.size(); ++i)
        {
            TypeId t = tops[i].type;
            if (is_declared(graph_, t, declare_unions) && claimed.insert(t).second)
            {
                top_level_alias_[i] = false;
                claimed_by_top[i] = t;
            }
            candidates.push_back(style_type_name(tops[i].name));
        }
        std::vector<TypeId> unclaimed;
        for (TypeId id : canonical)
        {
            if (claimed.count(id))
                continue;
            unclaimed.push_back(id);
            std::string hint;
            if (auto *c = graph_.get_if<ClassType>(id))
                hint = c->name_hint;
            else if (auto *e = graph_.get_if<EnumType>(id))
                hint = e->name_hint;
            else if (auto *u = graph_.get_if<UnionType>(id))
                hint = u->name_hint;
            candidates.push_back(style_type_name(hint));
        }

        auto global = namer_->assign_names(candidates, forbidden_words(NameScope::Global));
        for (size_t i = 0; i < tops.size(); ++i)
        {
            names_.set_top_level_name(i, global[i]);
            if (!top_level_alias_[i])
                names_.set_type_name(claimed_by_top[i], global[i]);
        }
        for (size_t i = 0; i < unclaimed.size(); ++i)
            names_.set_type_name(unclaimed[i], global[tops.size() + i]);

        auto property_forbidden = forbidden_words(NameScope::ClassProperties);
        auto case_forbidden = forbidden_words(NameScope::EnumCases);
        for (TypeId id : canonical)
        {
            if (auto *c = graph_.get_if<ClassType>(id))
            {
                std::vector<std::string> props;
                for (auto &p : c->properties)
                    props.push_back(style_property_name(p.name));
                names_.set_property_names(id, namer_->assign_names(props, property_forbidden));
            }
            else if (auto *e = graph_.get_if<EnumType>(id))
            {
                std::vector<std::string> cases;
                for (auto &label : e->cases)
                    cases.push_back(style_enum_case_name(label));
                names_.set_case_names(id, namer_->assign_names(cases, case_forbidden));
            }
        }
    }

    void Renderer::emit_line(const std::string &text)
    {
        if (text.empty())
        {
            lines_.emplace_back();
            return;
        }
        std::string line;
        for (unsigned i = 0; i < indent_; ++i)
            line += indent_unit();
        line += text;
        lines_.push_back(std::move(line));
    }

    void Renderer::emit_blank_lines(unsigned n)
    {
        if (lines_.empty())
            return;
        unsigned trailing = 0;
        for (auto it = lines_.rbegin(); it != lines_.rend() && it->empty(); ++it)
            ++trailing;
        for (; trailing < n; ++trailing)
            lines_.emplace_back();
    }

    std::vector<std::string> Renderer::comment_lines(const std::string &prefix, const std::vector<std::string> &comments)
    {
        std::vector<std::string> out;
        for (auto &c : comments)
        {
            size_t start = 0;
            for (;;)
            {
                size_t nl = c.find('\n', start);
                out.push_back(prefix + c.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
                if (nl == std::string::npos)
                    break;
                start = nl + 1;
            }
        }
        return out;
    }

    void Renderer::prepend_lines(const std::vector<std::string> &lines)
    {
        lines_.insert(lines_.begin(), lines.begin(), lines.end());
    }

} // namespace pyemit
