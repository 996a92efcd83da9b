// Structural equality, ordering and printing of forms.
#include "kiln/form.hpp"

#include <sstream>

namespace kiln {

static bool equal_seq(const std::vector<node_ptr>& a, const std::vector<node_ptr>& b, bool ignore_meta) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) if (!equal(a[i], b[i], ignore_meta)) return false;
    return true;
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_meta) {
    if (a.get() == b.get()) return true;
    if (!a || !b) return is_nil(a) && is_nil(b);
    if (a->data.index() != b->data.index()) return false;

    if (!ignore_meta) {
        if (a->metadata.size() != b->metadata.size()) return false;
        for (const auto& kv : a->metadata) {
            auto it = b->metadata.find(kv.first);
            if (it == b->metadata.end()) return false;
            if (!equal(kv.second, it->second, ignore_meta)) return false;
        }
    }

    struct Visitor {
        const node& b; bool ignore_meta;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool v) const { return v == std::get<bool>(b.data); }
        bool operator()(int64_t v) const { return v == std::get<int64_t>(b.data); }
        bool operator()(double v) const { return v == std::get<double>(b.data); }
        bool operator()(const std::string& s) const { return s == std::get<std::string>(b.data); }
        bool operator()(const keyword& k) const { return k.name == std::get<keyword>(b.data).name; }
        bool operator()(const symbol& s) const { return s.name == std::get<symbol>(b.data).name; }
        bool operator()(const list& l) const { return equal_seq(l.elems, std::get<list>(b.data).elems, ignore_meta); }
        bool operator()(const vector_t& v) const { return equal_seq(v.elems, std::get<vector_t>(b.data).elems, ignore_meta); }
        bool operator()(const set& s) const { return equal_seq(s.elems, std::get<set>(b.data).elems, ignore_meta); }
        bool operator()(const map& m) const {
            const auto& other = std::get<map>(b.data).entries;
            if (m.entries.size() != other.size()) return false;
            for (size_t i = 0; i < other.size(); ++i) {
                if (!equal(m.entries[i].first, other[i].first, ignore_meta)) return false;
                if (!equal(m.entries[i].second, other[i].second, ignore_meta)) return false;
            }
            return true;
        }
        bool operator()(const tagged_value& t) const {
            const auto& o = std::get<tagged_value>(b.data);
            return t.tag.name == o.tag.name && equal(t.inner, o.inner, ignore_meta);
        }
    };
    return std::visit(Visitor{*b, ignore_meta}, a->data);
}

static std::string quote_string(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

static std::string join(const std::vector<node_ptr>& elems, char open, char close) {
    std::string out(1, open);
    bool first = true;
    for (auto& ch : elems) {
        if (!first) out += ' ';
        first = false;
        out += to_string(ch);
    }
    out += close;
    return out;
}

std::string to_string(const node& n) {
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream oss;
            oss << d;
            auto s = oss.str();
            if (s.find_first_of(".eE") == std::string::npos) s += ".0";
            return s;
        }
        std::string operator()(const std::string& s) const { return quote_string(s); }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string operator()(const list& l) const { return join(l.elems, '(', ')'); }
        std::string operator()(const vector_t& v) const { return join(v.elems, '[', ']'); }
        std::string operator()(const set& s) const { return '#' + join(s.elems, '{', '}'); }
        std::string operator()(const map& m) const {
            std::string out = "{";
            bool first = true;
            for (auto& kv : m.entries) {
                if (!first) out += ' ';
                first = false;
                out += to_string(kv.first) + ' ' + to_string(kv.second);
            }
            out += '}';
            return out;
        }
        std::string operator()(const tagged_value& tv) const { return '#' + tv.tag.name + ' ' + to_string(tv.inner); }
    };
    return std::visit(V{}, n.data);
}

static int compare(const node_ptr& a, const node_ptr& b);

static int compare_seq(const std::vector<node_ptr>& a, const std::vector<node_ptr>& b) {
    for (size_t i = 0; i < a.size() && i < b.size(); ++i)
        if (int c = compare(a[i], b[i])) return c;
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

template <typename T>
static int three_way(const T& x, const T& y) { return x < y ? -1 : (y < x ? 1 : 0); }

static int compare(const node_ptr& a, const node_ptr& b) {
    if (is_nil(a) || is_nil(b)) return three_way(!is_nil(a), !is_nil(b));
    if (a->data.index() != b->data.index()) return three_way(a->data.index(), b->data.index());
    const node& y = *b;
    return std::visit([&](auto&& x) -> int {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return 0;
        else if constexpr (std::is_same_v<T, keyword> || std::is_same_v<T, symbol>) return three_way(x.name, std::get<T>(y.data).name);
        else if constexpr (std::is_same_v<T, list> || std::is_same_v<T, vector_t> || std::is_same_v<T, set>) return compare_seq(x.elems, std::get<T>(y.data).elems);
        else if constexpr (std::is_same_v<T, map>) return three_way(to_string(*a), to_string(y));
        else if constexpr (std::is_same_v<T, tagged_value>) {
            if (int c = three_way(x.tag.name, std::get<T>(y.data).tag.name)) return c;
            return compare(x.inner, std::get<T>(y.data).inner);
        }
        else return three_way(x, std::get<T>(y.data));
    }, a->data);
}

bool less(const node_ptr& a, const node_ptr& b) { return compare(a, b) < 0; }

const std::vector<node_ptr>& elements(const node& n) {
    static const std::vector<node_ptr> empty;
    if (auto* l = as_list(n)) return l->elems;
    if (auto* v = as_vector(n)) return v->elems;
    return empty;
}

std::string name_of(const node_ptr& n) {
    if (!n) return {};
    if (auto* s = as_symbol(*n)) return s->name;
    if (auto* k = as_keyword(*n)) return k->name;
    if (is_string(*n)) return std::get<std::string>(n->data);
    return {};
}

std::string head_name(const node& n) {
    auto* l = as_list(n);
    if (!l || l->elems.empty() || !l->elems[0] || !is_symbol(*l->elems[0])) return {};
    return std::get<symbol>(l->elems[0]->data).name;
}

node_ptr map_get(const node& m, const std::string& kw) {
    if (!std::holds_alternative<map>(m.data)) return nullptr;
    for (auto& kv : std::get<map>(m.data).entries) {
        if (kv.first && is_keyword(*kv.first) && std::get<keyword>(kv.first->data).name == kw) return kv.second;
    }
    return nullptr;
}

node_ptr& operator<<(node_ptr& c, const node_ptr& n) {
    if (!c)
        throw std::invalid_argument("operator<<: null container node");
    if (std::holds_alternative<list>(c->data)) std::get<list>(c->data).elems.push_back(n);
    else if (std::holds_alternative<vector_t>(c->data)) std::get<vector_t>(c->data).elems.push_back(n);
    else if (std::holds_alternative<set>(c->data)) std::get<set>(c->data).elems.push_back(n);
    else throw std::invalid_argument("operator<<: container is not list/vector/set");
    return c;
}

node_ptr& operator<<(node_ptr& c, const std::pair<node_ptr, node_ptr>& kv) {
    if (!c || !std::holds_alternative<map>(c->data))
        throw std::invalid_argument("operator<<: container is not a map");
    std::get<map>(c->data).entries.push_back(kv);
    return c;
}

} // namespace kiln
