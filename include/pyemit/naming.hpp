// Name scopes, the Namer collaborator interface and the per-render name table
#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pyemit/types.hpp"

namespace pyemit
{

    enum class NameScope
    {
        Global,          // named types and top-level aliases
        ClassProperties, // one namespace per class
        EnumCases        // one namespace per enum
    };

    // Conflict resolution collaborator: receives already-styled candidates.
    class Namer
    {
    public:
        virtual ~Namer() = default;
        // One final name per candidate (same order), unique among themselves and disjoint from forbidden.
        virtual std::vector<std::string> assign_names(const std::vector<std::string> &candidates,
                                                      const std::unordered_set<std::string> &forbidden) = 0;
    };

    // Keeps the first free candidate verbatim, otherwise appends 1, 2, ... until free.
    class SuffixNamer : public Namer
    {
    public:
        std::vector<std::string> assign_names(const std::vector<std::string> &candidates,
                                              const std::unordered_set<std::string> &forbidden) override;
    };

    std::unique_ptr<Namer> make_default_namer();

    // Names assigned during one render; discarded with the renderer state.
    class NameTable
    {
    public:
        void set_type_name(TypeId id, std::string name) { type_names_[id] = std::move(name); }
        bool has_type_name(TypeId id) const { return type_names_.count(id) != 0; }
        const std::string &type_name(TypeId id) const;

        void set_top_level_name(size_t index, std::string name);
        const std::string &top_level_name(size_t index) const { return top_level_names_.at(index); }

        void set_property_names(TypeId cls, std::vector<std::string> names) { property_names_[cls] = std::move(names); }
        const std::vector<std::string> &property_names(TypeId cls) const;

        void set_case_names(TypeId enm, std::vector<std::string> names) { case_names_[enm] = std::move(names); }
        const std::vector<std::string> &case_names(TypeId enm) const;

    private:
        std::unordered_map<TypeId, std::string> type_names_;
        std::vector<std::string> top_level_names_;
        std::unordered_map<TypeId, std::vector<std::string>> property_names_;
        std::unordered_map<TypeId, std::vector<std::string>> case_names_;
    };

} // namespace pyemit
