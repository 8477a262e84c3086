// Type graph: arena of primitive, structural and named type nodes
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace pyemit
{

    using TypeId = uint32_t;

    // Sentinel for "no type"; reaching the renderer with it is a contract violation.
    struct NoneType {};
    struct AnyType {};
    struct NullType {};
    struct BoolType {};
    struct IntegerType {};
    struct DoubleType {};
    struct StringType {};
    struct DateType {};
    struct TimeType {};
    struct DateTimeType {};

    struct ArrayType
    {
        TypeId items{0};
    };
    struct MapType
    {
        TypeId values{0};
    };

    struct ClassProperty
    {
        std::string name; // raw upstream label
        TypeId type{0};
        bool optional{false};
    };
    struct ClassType
    {
        std::string name_hint;
        std::vector<ClassProperty> properties; // upstream order, never re-sorted
    };
    struct EnumType
    {
        std::string name_hint;
        std::vector<std::string> cases;
    };
    // Members are distinct ids in first-occurrence order; size >= 2.
    struct UnionType
    {
        std::string name_hint;
        std::vector<TypeId> members;
    };

    using TypeData = std::variant<NoneType, AnyType, NullType, BoolType, IntegerType, DoubleType, StringType,
                                  DateType, TimeType, DateTimeType, ArrayType, MapType, ClassType, EnumType, UnionType>;

    struct Type
    {
        TypeData data;
    };

    enum class PrimitiveKind
    {
        None,
        Any,
        Null,
        Bool,
        Integer,
        Double,
        String,
        Date,
        Time,
        DateTime
    };

    struct TopLevel
    {
        std::string name;
        TypeId type{0};
    };

    class TypeGraph
    {
    public:
        TypeGraph();

        TypeId get_primitive(PrimitiveKind k);
        TypeId get_none() { return get_primitive(PrimitiveKind::None); }
        TypeId get_any() { return get_primitive(PrimitiveKind::Any); }
        TypeId get_null() { return get_primitive(PrimitiveKind::Null); }
        TypeId get_bool() { return get_primitive(PrimitiveKind::Bool); }
        TypeId get_integer() { return get_primitive(PrimitiveKind::Integer); }
        TypeId get_double() { return get_primitive(PrimitiveKind::Double); }
        TypeId get_string() { return get_primitive(PrimitiveKind::String); }
        TypeId get_date() { return get_primitive(PrimitiveKind::Date); }
        TypeId get_time() { return get_primitive(PrimitiveKind::Time); }
        TypeId get_date_time() { return get_primitive(PrimitiveKind::DateTime); }

        TypeId get_array(TypeId items);
        TypeId get_map(TypeId values);

        // Named types are never interned: every call yields a fresh identity.
        TypeId add_class(std::string name_hint, std::vector<ClassProperty> properties = {});
        TypeId add_enum(std::string name_hint, std::vector<std::string> cases);
        TypeId add_union(std::string name_hint, const std::vector<TypeId> &members);
        TypeId add_nullable(TypeId inner);

        // Classes may be declared before their properties are known (recursive graphs).
        void set_class_properties(TypeId cls, std::vector<ClassProperty> properties);

        void add_top_level(std::string name, TypeId type);
        const std::vector<TopLevel> &top_levels() const { return top_levels_; }

        const Type &at(TypeId id) const { return types_.at(id); }
        size_t size() const { return types_.size(); }

        template <class T>
        const T *get_if(TypeId id) const { return std::get_if<T>(&at(id).data); }
        template <class T>
        bool is(TypeId id) const { return std::holds_alternative<T>(at(id).data); }

        bool is_named(TypeId id) const { return is<ClassType>(id) || is<EnumType>(id) || is<UnionType>(id); }

        // Inner type of a union whose members are exactly {T, Null}.
        std::optional<TypeId> nullable_inner(TypeId id) const;

        // Direct children in stored order: array items, map values, property types, union members.
        std::vector<TypeId> children(TypeId id) const;

        // Debug rendering, e.g. "class#12(Person)" or "array<string>".
        std::string describe(TypeId id) const;

    private:
        TypeId add_type(TypeData d);
        void check_id(TypeId id) const;

        std::vector<Type> types_;
        std::unordered_map<int, TypeId> primitive_index_;
        std::unordered_map<TypeId, TypeId> array_cache_;
        std::unordered_map<TypeId, TypeId> map_cache_;
        std::vector<TopLevel> top_levels_;
    };

} // namespace pyemit
