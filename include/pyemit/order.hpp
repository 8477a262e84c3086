// Named-type collection and declaration ordering
#pragma once
#include <cstdint>
#include <vector>

#include "pyemit/types.hpp"

namespace pyemit
{

    enum class DeclarationOrder
    {
        Canonical,        // first-visit pre-order from the roots
        Reverse,          // canonical, reversed
        DependenciesFirst // post-order over named dependencies
    };

    // Does this node get its own declaration? Nullable unions never do; other unions only with declare_unions.
    bool is_declared(const TypeGraph &g, TypeId id, bool declare_unions);

    // Declared named types reachable from the roots, in first-visit pre-order.
    std::vector<TypeId> collect_named_types(const TypeGraph &g, bool declare_unions);

    // Declared types referenced by id, looking through arrays, maps and undeclared unions.
    std::vector<TypeId> named_dependencies(const TypeGraph &g, TypeId id, bool declare_unions);

    // named_dependencies for every declared id in one pass, indexed by TypeId; other slots stay empty.
    using DependencyLists = std::vector<std::vector<TypeId>>;
    DependencyLists named_dependency_lists(const TypeGraph &g, const std::vector<TypeId> &declared,
                                           bool declare_unions);

    struct OrderResult
    {
        std::vector<TypeId> order;
        DependencyLists dependencies;
        bool has_cycles = false; // only computed for DependenciesFirst
    };

    OrderResult order_declarations(const TypeGraph &g, const std::vector<TypeId> &canonical,
                                   DeclarationOrder policy, bool declare_unions);

} // namespace pyemit
