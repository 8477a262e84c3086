#include "pyemit/naming.hpp"
#include <stdexcept>

namespace pyemit
{

    std::vector<std::string> SuffixNamer::assign_names(const std::vector<std::string> &candidates,
                                                       const std::unordered_set<std::string> &forbidden)
    {
        std::unordered_set<std::string> taken = forbidden;
        std::unordered_map<std::string, unsigned> counters; // next suffix per candidate
        std::vector<std::string> out;
        out.reserve(candidates.size());
        for (auto &c : candidates)
        {
            std::string name = c;
            auto &n = counters[c];
            while (taken.count(name))
                name = c + std::to_string(++n);
            taken.insert(name);
            out.push_back(std::move(name));
        }
        return out;
    }

    std::unique_ptr<Namer> make_default_namer() { return std::make_unique<SuffixNamer>(); }

    const std::string &NameTable::type_name(TypeId id) const
    {
        auto it = type_names_.find(id);
        if (it == type_names_.end())
            throw std::out_of_range("no name assigned to type #" + std::to_string(id));
        return it->second;
    }

    void NameTable::set_top_level_name(size_t index, std::string name)
    {
        if (top_level_names_.size() <= index)
            top_level_names_.resize(index + 1);
        top_level_names_[index] = std::move(name);
    }

    const std::vector<std::string> &NameTable::property_names(TypeId cls) const
    {
        auto it = property_names_.find(cls);
        if (it == property_names_.end())
            throw std::out_of_range("no property names assigned to class #" + std::to_string(cls));
        return it->second;
    }

    const std::vector<std::string> &NameTable::case_names(TypeId enm) const
    {
        auto it = case_names_.find(enm);
        if (it == case_names_.end())
            throw std::out_of_range("no case names assigned to enum #" + std::to_string(enm));
        return it->second;
    }

} // namespace pyemit
