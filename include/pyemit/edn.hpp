// Minimal EDN reader used for type-graph descriptions (nodes carry source positions)
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pyemit
{
namespace edn
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " at " + std::to_string(line) + ":" + std::to_string(col)), line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, map>;

    struct node
    {
        node_data data;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one EDN form; trailing non-whitespace is an error.
    node_ptr parse(std::string_view src);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }

    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }

    // Symbol or string payload; empty for anything else.
    inline std::string text_of(const node_ptr &n)
    {
        if (!n)
            return {};
        if (std::holds_alternative<symbol>(n->data))
            return std::get<symbol>(n->data).name;
        if (std::holds_alternative<std::string>(n->data))
            return std::get<std::string>(n->data);
        return {};
    }

    // Head symbol of a list form, empty when n is not a list or has no symbol head.
    inline std::string head_of(const node &n)
    {
        auto *l = as_list(n);
        if (!l || l->elems.empty() || !is_symbol(*l->elems[0]))
            return {};
        return std::get<symbol>(l->elems[0]->data).name;
    }

} // namespace edn
} // namespace pyemit
