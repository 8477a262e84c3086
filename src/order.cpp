#include "pyemit/order.hpp"
#include "pyemit/log.hpp"

namespace pyemit
{

    bool is_declared(const TypeGraph &g, TypeId id, bool declare_unions)
    {
        if (g.is<ClassType>(id) || g.is<EnumType>(id))
            return true;
        if (g.is<UnionType>(id))
            return declare_unions && !g.nullable_inner(id);
        return false;
    }

    namespace
    {
        // Pushes children in reverse so the explicit stack pops them in stored order.
        void push_children(const TypeGraph &g, TypeId id, std::vector<TypeId> &stack)
        {
            auto children = g.children(id);
            stack.insert(stack.end(), children.rbegin(), children.rend());
        }

        // Look-through walk shared by every source type. Stamps are bumped per source
        // so neither visited marks nor the duplicate check are reallocated.
        class DependencyWalker
        {
        public:
            DependencyWalker(const TypeGraph &g, bool declare_unions)
                : g_(g), declare_unions_(declare_unions), walked_(g.size(), 0), added_(g.size(), 0)
            {
            }

            std::vector<TypeId> dependencies_of(TypeId id)
            {
                ++generation_;
                std::vector<TypeId> deps;
                stack_.clear();
                push_children(g_, id, stack_);
                while (!stack_.empty())
                {
                    TypeId t = stack_.back();
                    stack_.pop_back();
                    if (is_declared(g_, t, declare_unions_))
                    {
                        if (added_[t] != generation_)
                        {
                            added_[t] = generation_;
                            deps.push_back(t);
                        }
                        continue;
                    }
                    if (walked_[t] == generation_)
                        continue;
                    walked_[t] = generation_;
                    push_children(g_, t, stack_);
                }
                return deps;
            }

        private:
            const TypeGraph &g_;
            bool declare_unions_;
            uint32_t generation_ = 0;
            std::vector<uint32_t> walked_;
            std::vector<uint32_t> added_;
            std::vector<TypeId> stack_;
        };

        enum class Mark
        {
            Unvisited,
            Visiting,
            Done
        };

        struct Frame
        {
            TypeId id;
            size_t next;
        };
    } // namespace

    std::vector<TypeId> collect_named_types(const TypeGraph &g, bool declare_unions)
    {
        std::vector<bool> seen(g.size(), false);
        std::vector<TypeId> out;
        std::vector<TypeId> stack;
        for (auto &top : g.top_levels())
        {
            stack.push_back(top.type);
            while (!stack.empty())
            {
                TypeId id = stack.back();
                stack.pop_back();
                if (seen[id])
                    continue;
                seen[id] = true;
                if (is_declared(g, id, declare_unions))
                    out.push_back(id);
                push_children(g, id, stack);
            }
        }
        return out;
    }

    std::vector<TypeId> named_dependencies(const TypeGraph &g, TypeId id, bool declare_unions)
    {
        return DependencyWalker(g, declare_unions).dependencies_of(id);
    }

    DependencyLists named_dependency_lists(const TypeGraph &g, const std::vector<TypeId> &declared,
                                           bool declare_unions)
    {
        DependencyLists lists(g.size());
        DependencyWalker walker(g, declare_unions);
        for (TypeId id : declared)
            lists[id] = walker.dependencies_of(id);
        return lists;
    }

    OrderResult order_declarations(const TypeGraph &g, const std::vector<TypeId> &canonical,
                                   DeclarationOrder policy, bool declare_unions)
    {
        OrderResult r;
        r.dependencies = named_dependency_lists(g, canonical, declare_unions);
        switch (policy)
        {
        case DeclarationOrder::Canonical:
            r.order = canonical;
            return r;
        case DeclarationOrder::Reverse:
            r.order.assign(canonical.rbegin(), canonical.rend());
            return r;
        case DeclarationOrder::DependenciesFirst:
            break;
        }

        // Post-order on an explicit frame stack; a Visiting dependency is a back-edge and is skipped.
        std::vector<Mark> marks(g.size(), Mark::Unvisited);
        std::vector<Frame> stack;
        for (TypeId root : canonical)
        {
            if (marks[root] != Mark::Unvisited)
                continue;
            marks[root] = Mark::Visiting;
            stack.push_back({root, 0});
            while (!stack.empty())
            {
                TypeId id = stack.back().id;
                const auto &deps = r.dependencies[id];
                if (stack.back().next == deps.size())
                {
                    marks[id] = Mark::Done;
                    r.order.push_back(id);
                    stack.pop_back();
                    continue;
                }
                TypeId d = deps[stack.back().next++];
                if (marks[d] == Mark::Visiting)
                {
                    r.has_cycles = true;
                    if (debug_enabled())
                        debug_log("order") << "back-edge " << g.describe(id) << " -> " << g.describe(d) << "\n";
                }
                else if (marks[d] == Mark::Unvisited)
                {
                    marks[d] = Mark::Visiting;
                    stack.push_back({d, 0});
                }
            }
        }
        return r;
    }

} // namespace pyemit
