#include "pyemit/types.hpp"
#include <stdexcept>

namespace pyemit
{

    TypeGraph::TypeGraph()
    { // seed primitives so their ids are stable across graphs
        for (int k = 0; k <= static_cast<int>(PrimitiveKind::DateTime); ++k)
            get_primitive(static_cast<PrimitiveKind>(k));
    }

    TypeId TypeGraph::get_primitive(PrimitiveKind k)
    {
        auto key = static_cast<int>(k);
        auto it = primitive_index_.find(key);
        if (it != primitive_index_.end())
            return it->second;
        TypeData d;
        switch (k)
        {
        case PrimitiveKind::None:
            d = NoneType{};
            break;
        case PrimitiveKind::Any:
            d = AnyType{};
            break;
        case PrimitiveKind::Null:
            d = NullType{};
            break;
        case PrimitiveKind::Bool:
            d = BoolType{};
            break;
        case PrimitiveKind::Integer:
            d = IntegerType{};
            break;
        case PrimitiveKind::Double:
            d = DoubleType{};
            break;
        case PrimitiveKind::String:
            d = StringType{};
            break;
        case PrimitiveKind::Date:
            d = DateType{};
            break;
        case PrimitiveKind::Time:
            d = TimeType{};
            break;
        case PrimitiveKind::DateTime:
            d = DateTimeType{};
            break;
        }
        TypeId id = add_type(std::move(d));
        primitive_index_[key] = id;
        return id;
    }

    TypeId TypeGraph::get_array(TypeId items)
    {
        check_id(items);
        auto it = array_cache_.find(items);
        if (it != array_cache_.end())
            return it->second;
        TypeId id = add_type(ArrayType{items});
        array_cache_[items] = id;
        return id;
    }

    TypeId TypeGraph::get_map(TypeId values)
    {
        check_id(values);
        auto it = map_cache_.find(values);
        if (it != map_cache_.end())
            return it->second;
        TypeId id = add_type(MapType{values});
        map_cache_[values] = id;
        return id;
    }

    TypeId TypeGraph::add_class(std::string name_hint, std::vector<ClassProperty> properties)
    {
        for (auto &p : properties)
            check_id(p.type);
        return add_type(ClassType{std::move(name_hint), std::move(properties)});
    }

    void TypeGraph::set_class_properties(TypeId cls, std::vector<ClassProperty> properties)
    {
        check_id(cls);
        auto *c = std::get_if<ClassType>(&types_[cls].data);
        if (!c)
            throw std::invalid_argument("set_class_properties: " + describe(cls) + " is not a class");
        for (auto &p : properties)
            check_id(p.type);
        c->properties = std::move(properties);
    }

    TypeId TypeGraph::add_enum(std::string name_hint, std::vector<std::string> cases)
    {
        return add_type(EnumType{std::move(name_hint), std::move(cases)});
    }

    TypeId TypeGraph::add_union(std::string name_hint, const std::vector<TypeId> &members)
    {
        std::vector<TypeId> distinct;
        for (auto m : members)
        {
            check_id(m);
            bool seen = false;
            for (auto d : distinct)
                if (d == m)
                    seen = true;
            if (!seen)
                distinct.push_back(m);
        }
        if (distinct.size() < 2)
            throw std::invalid_argument("union '" + name_hint + "' needs at least two distinct members");
        return add_type(UnionType{std::move(name_hint), std::move(distinct)});
    }

    TypeId TypeGraph::add_nullable(TypeId inner)
    {
        check_id(inner);
        if (is<NullType>(inner) || nullable_inner(inner))
            return inner;
        return add_union("", {inner, get_null()});
    }

    void TypeGraph::add_top_level(std::string name, TypeId type)
    {
        check_id(type);
        top_levels_.push_back(TopLevel{std::move(name), type});
    }

    std::optional<TypeId> TypeGraph::nullable_inner(TypeId id) const
    {
        auto *u = get_if<UnionType>(id);
        if (!u || u->members.size() != 2)
            return std::nullopt;
        if (is<NullType>(u->members[0]))
            return u->members[1];
        if (is<NullType>(u->members[1]))
            return u->members[0];
        return std::nullopt;
    }

    std::vector<TypeId> TypeGraph::children(TypeId id) const
    {
        std::vector<TypeId> out;
        const Type &t = at(id);
        if (auto *a = std::get_if<ArrayType>(&t.data))
            out.push_back(a->items);
        else if (auto *m = std::get_if<MapType>(&t.data))
            out.push_back(m->values);
        else if (auto *c = std::get_if<ClassType>(&t.data))
        {
            for (auto &p : c->properties)
                out.push_back(p.type);
        }
        else if (auto *u = std::get_if<UnionType>(&t.data))
            out = u->members;
        return out;
    }

    std::string TypeGraph::describe(TypeId id) const
    {
        if (id >= types_.size())
            return "<bad-type#" + std::to_string(id) + ">";
        struct V
        {
            const TypeGraph &g;
            TypeId id;
            std::string operator()(const NoneType &) const { return "none"; }
            std::string operator()(const AnyType &) const { return "any"; }
            std::string operator()(const NullType &) const { return "null"; }
            std::string operator()(const BoolType &) const { return "bool"; }
            std::string operator()(const IntegerType &) const { return "integer"; }
            std::string operator()(const DoubleType &) const { return "double"; }
            std::string operator()(const StringType &) const { return "string"; }
            std::string operator()(const DateType &) const { return "date"; }
            std::string operator()(const TimeType &) const { return "time"; }
            std::string operator()(const DateTimeType &) const { return "date-time"; }
            std::string operator()(const ArrayType &a) const { return "array<" + g.describe(a.items) + ">"; }
            std::string operator()(const MapType &m) const { return "map<" + g.describe(m.values) + ">"; }
            std::string operator()(const ClassType &c) const { return "class#" + std::to_string(id) + "(" + c.name_hint + ")"; }
            std::string operator()(const EnumType &e) const { return "enum#" + std::to_string(id) + "(" + e.name_hint + ")"; }
            std::string operator()(const UnionType &u) const { return "union#" + std::to_string(id) + "(" + u.name_hint + ")"; }
        };
        return std::visit(V{*this, id}, types_[id].data);
    }

    TypeId TypeGraph::add_type(TypeData d)
    {
        TypeId id = static_cast<TypeId>(types_.size());
        types_.push_back(Type{std::move(d)});
        return id;
    }

    void TypeGraph::check_id(TypeId id) const
    {
        if (id >= types_.size())
            throw std::out_of_range("type id " + std::to_string(id) + " is not part of this graph");
    }

} // namespace pyemit
