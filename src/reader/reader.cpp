// PEGTL actions that build form trees from the grammar in grammar.hpp.
#include "kiln/reader.hpp"
#include "grammar.hpp"

#include <tao/pegtl.hpp>

namespace kiln {
namespace {

namespace pegtl = tao::pegtl;
namespace g = reader::grammar;

struct frame {
    char kind = '\0'; // '(' '[' '{' '#', or '\0' for top level
    int line = -1, col = -1;
    std::vector<node_ptr> elems;
};

struct build_state {
    std::vector<frame> stack{frame{}};
    std::vector<std::string> tags;

    template <typename Position>
    void push(node_ptr n, const Position& pos) {
        n->metadata["line"] = n_i64((int64_t)pos.line);
        n->metadata["col"] = n_i64((int64_t)pos.column);
        stack.back().elems.push_back(std::move(n));
    }
    template <typename Position>
    void open(char kind, const Position& pos) {
        frame f;
        f.kind = kind;
        f.line = (int)pos.line;
        f.col = (int)pos.column;
        stack.push_back(std::move(f));
    }
    void close() {
        frame f = std::move(stack.back());
        stack.pop_back();
        node_ptr out;
        switch (f.kind) {
        case '(': { list l; l.elems = std::move(f.elems); out = detail::make_node(std::move(l)); break; }
        case '[': { vector_t v; v.elems = std::move(f.elems); out = detail::make_node(std::move(v)); break; }
        case '#': { set s; s.elems = std::move(f.elems); out = detail::make_node(std::move(s)); break; }
        case '{': {
            if (f.elems.size() % 2)
                throw parse_error("map requires even number of forms (line " + std::to_string(f.line) + ")");
            map m;
            for (size_t i = 0; i < f.elems.size(); i += 2) m.entries.emplace_back(f.elems[i], f.elems[i + 1]);
            out = detail::make_node(std::move(m));
            break;
        }
        default:
            throw parse_error("unbalanced collection");
        }
        out->metadata["line"] = n_i64(f.line);
        out->metadata["col"] = n_i64(f.col);
        stack.back().elems.push_back(std::move(out));
    }
};

std::string unescape(const std::string& raw) {
    std::string out;
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size()) { out += c; continue; }
        char e = raw[++i];
        switch (e) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default: out += e; break;
        }
    }
    return out;
}

template <typename Rule>
struct action : pegtl::nothing<Rule> {};

template <>
struct action<g::int_tok> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) {
        int64_t v = 0;
        try { v = std::stoll(in.string()); } catch (const std::exception&) { throw parse_error("invalid integer literal: " + in.string()); }
        s.push(n_i64(v), in.position());
    }
};

template <>
struct action<g::float_tok> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) {
        double v = 0;
        try { v = std::stod(in.string()); } catch (const std::exception&) { throw parse_error("invalid float literal: " + in.string()); }
        s.push(detail::make_node(v), in.position());
    }
};

template <>
struct action<g::str_body> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) { s.push(n_str(unescape(in.string())), in.position()); }
};

template <>
struct action<g::keyword_tok> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) { s.push(n_kw(in.string().substr(1)), in.position()); }
};

template <>
struct action<g::symbol_tok> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) {
        const std::string text = in.string();
        if (text == "nil") s.push(n_nil(), in.position());
        else if (text == "true") s.push(n_bool(true), in.position());
        else if (text == "false") s.push(n_bool(false), in.position());
        else s.push(n_sym(text), in.position());
    }
};

template <>
struct action<g::tag_name> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) { s.tags.push_back(in.string()); }
};

template <>
struct action<g::tagged_form> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, build_state& s) {
        auto& elems = s.stack.back().elems;
        auto inner = elems.back();
        elems.pop_back();
        auto tag = s.tags.back();
        s.tags.pop_back();
        s.push(node_tagged(tag, inner), in.position());
    }
};

template <> struct action<g::list_open> { template <typename I> static void apply(const I& in, build_state& s) { s.open('(', in.position()); } };
template <> struct action<g::vec_open> { template <typename I> static void apply(const I& in, build_state& s) { s.open('[', in.position()); } };
template <> struct action<g::map_open> { template <typename I> static void apply(const I& in, build_state& s) { s.open('{', in.position()); } };
template <> struct action<g::set_open> { template <typename I> static void apply(const I& in, build_state& s) { s.open('#', in.position()); } };
template <> struct action<g::list_close> { template <typename I> static void apply(const I&, build_state& s) { s.close(); } };
template <> struct action<g::vec_close> { template <typename I> static void apply(const I&, build_state& s) { s.close(); } };
template <> struct action<g::map_close> { template <typename I> static void apply(const I&, build_state& s) { s.close(); } };
template <> struct action<g::set_close> { template <typename I> static void apply(const I&, build_state& s) { s.close(); } };

template <typename Grammar>
std::vector<node_ptr> run(std::string_view src, const std::string& source) {
    build_state st;
    pegtl::memory_input<> in(src.data(), src.size(), source);
    try {
        pegtl::parse<Grammar, action>(in, st);
    } catch (const pegtl::parse_error& e) {
        throw parse_error(e.what());
    }
    if (st.stack.size() != 1)
        throw parse_error(source + ": unterminated collection");
    return std::move(st.stack.back().elems);
}

} // namespace

node_ptr read(std::string_view src, const std::string& source) {
    auto forms = run<reader::grammar::one_form>(src, source);
    if (forms.size() != 1)
        throw parse_error(source + ": expected exactly one form");
    return forms.front();
}

std::vector<node_ptr> read_all(std::string_view src, const std::string& source) {
    return run<reader::grammar::all_forms>(src, source);
}

} // namespace kiln
