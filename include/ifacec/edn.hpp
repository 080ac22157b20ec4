// EDN document model used for contract declarations and for rendering compiled models
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include <initializer_list>

namespace ifacec
{

    // Source position of a form; -1 when synthesized.
    struct SourceLoc
    {
        int line = -1;
        int col = -1;
        int end_line = -1;
        int end_col = -1;
        bool known() const { return line >= 0; }
    };

namespace edn
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg), line(line), col(col) {}
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
        SourceLoc loc;
    };

    // Parse exactly one form; trailing input other than whitespace/comments is an error.
    node_ptr parse(std::string_view input);
    // Parse every top-level form in the input.
    std::vector<node_ptr> parse_all(std::string_view input);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return to_string(*p); }
    std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return to_pretty_string(*p, indentWidth); }

    // ------ Accessors ------
    inline bool is_nil(const node &n) { return std::holds_alternative<std::monostate>(n.data); }
    inline const list *as_list(const node &n) { return std::get_if<list>(&n.data); }
    inline const vector_t *as_vector(const node &n) { return std::get_if<vector_t>(&n.data); }
    inline const map *as_map(const node &n) { return std::get_if<map>(&n.data); }
    inline const keyword *as_keyword(const node &n) { return std::get_if<keyword>(&n.data); }
    inline const bool *as_bool(const node &n) { return std::get_if<bool>(&n.data); }
    inline const std::string *as_string(const node &n) { return std::get_if<std::string>(&n.data); }

    // Symbol name or string contents; empty for anything else.
    std::string text_of(const node_ptr &n);
    // Head symbol of a list form, or empty.
    std::string head_of(const node &n);

    // ------ Builders ------
    inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
    inline node_ptr n_sym(std::string name) { return make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return make_node(std::move(s)); }
    inline node_ptr n_bool(bool b) { return make_node(b); }
    inline node_ptr n_nil() { return make_node(std::monostate{}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return make_node(std::move(l));
    }
    inline node_ptr node_vec(std::vector<node_ptr> xs = {})
    {
        vector_t v;
        v.elems = std::move(xs);
        return make_node(std::move(v));
    }

    // (head :k v ...) with pairs appended in order
    node_ptr keyword_form(const std::string &head, std::initializer_list<std::pair<std::string, node_ptr>> kvs);
    // Appends ":k v" to an existing list form.
    void append_kv(node_ptr &form, const std::string &k, node_ptr v);

} // namespace edn
} // namespace ifacec
