// Forms: the tree representation shared by module bodies, attribute values,
// hook results and typespec declarations.
#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kiln
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct set;
    struct map;
    struct tagged_value;
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
    struct set
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };
    struct tagged_value
    {
        symbol tag;
        node_ptr inner;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, set, map, tagged_value>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Structural deep equality. Metadata is ignored unless ignore_metadata is false.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    // Single-line printed form; strings are quoted and escaped so the output reads back.
    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }

    // Total order over forms (kind first, then contents); used for sorted emission.
    bool less(const node_ptr &a, const node_ptr &b);

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
    }

    // ------ predicates / accessors ------

    inline bool is_nil(const node_ptr &n) { return !n || std::holds_alternative<std::monostate>(n->data); }
    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const keyword *as_keyword(const node &n) { return is_keyword(n) ? &std::get<keyword>(n.data) : nullptr; }

    // Elements of a list or vector; empty for anything else.
    const std::vector<node_ptr> &elements(const node &n);

    // Name of a symbol, keyword or string node; empty otherwise.
    std::string name_of(const node_ptr &n);

    // Head symbol name of a list form, or empty.
    std::string head_name(const node &n);

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end() || !it->second)
            return def;
        auto &nd = *it->second;
        if (std::holds_alternative<int64_t>(nd.data))
            return (int)std::get<int64_t>(nd.data);
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }
    inline int line(const node_ptr &n) { return n ? line(*n) : -1; }

    // ------ factories ------

    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }

    inline node_ptr node_list() { return detail::make_node(list{}); }
    inline node_ptr node_vec() { return detail::make_node(vector_t{}); }
    inline node_ptr node_map() { return detail::make_node(map{}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs)
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }
    inline node_ptr node_vec(std::vector<node_ptr> xs)
    {
        vector_t v;
        v.elems = std::move(xs);
        return detail::make_node(std::move(v));
    }
    inline node_ptr node_map(std::initializer_list<std::pair<node_ptr, node_ptr>> xs)
    {
        map m;
        m.entries.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(m));
    }
    inline node_ptr node_tagged(std::string tag, node_ptr inner)
    {
        return detail::make_node(tagged_value{symbol{std::move(tag)}, std::move(inner)});
    }

    inline std::pair<node_ptr, node_ptr> kvp(node_ptr k, node_ptr v) { return {std::move(k), std::move(v)}; }

    // Lookup of a keyword key in a map form; nullptr when absent.
    node_ptr map_get(const node &m, const std::string &kw);

    // Generic appender for list / vector / set nodes.
    node_ptr &operator<<(node_ptr &c, const node_ptr &n);
    node_ptr &operator<<(node_ptr &c, const std::pair<node_ptr, node_ptr> &kv);

} // namespace kiln
