// edn.cpp - EDN reader and printers for declaration documents
#include "ifacec/edn.hpp"
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <cctype>
#include <functional>

namespace ifacec::edn
{

namespace detail
{
    struct reader
    {
        std::string_view d;
        size_t p = 0;
        int line = 1, col = 1;
        int last_line = 1, last_col = 1;
        explicit reader(std::string_view s) : d(s) {}
        bool eof() const { return p >= d.size(); }
        char peek() const { return eof() ? '\0' : d[p]; }
        char get()
        {
            if (eof())
                return '\0';
            last_line = line;
            last_col = col;
            char c = d[p++];
            if (c == '\n')
            {
                ++line;
                col = 1;
            }
            else
            {
                ++col;
            }
            return c;
        }
        void skip_ws()
        {
            while (!eof())
            {
                char c = peek();
                if (c == ';')
                {
                    while (!eof() && get() != '\n')
                        continue;
                    continue;
                }
                if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',')
                {
                    get();
                    continue;
                }
                break;
            }
        }
        [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, line, col); }
    };

    inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
    // Type syntax (&'a Option<&T>, Vec<S>) is written directly as symbols, so ' & < > are symbol characters.
    inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&'; }
    inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':' || c == '\''; }

    inline void set_loc(node &n, int sl, int sc, const reader &r)
    {
        n.loc.line = sl;
        n.loc.col = sc;
        n.loc.end_line = r.last_line;
        n.loc.end_col = r.last_col;
    }

    node_ptr parse_value(reader &r);

    node_ptr parse_coll(reader &r, char end, int sl, int sc)
    {
        std::vector<node_ptr> elems;
        r.skip_ws();
        while (!r.eof() && r.peek() != end)
        {
            elems.push_back(parse_value(r));
            r.skip_ws();
        }
        if (r.get() != end)
            throw parse_error("unterminated collection", sl, sc);
        node_ptr out;
        if (end == ')')
            out = make_node(list{std::move(elems)});
        else if (end == ']')
            out = make_node(vector_t{std::move(elems)});
        else
        {
            if (elems.size() % 2)
                throw parse_error("map requires even number of forms", sl, sc);
            map m;
            for (size_t i = 0; i < elems.size(); i += 2)
                m.entries.emplace_back(elems[i], elems[i + 1]);
            out = make_node(std::move(m));
        }
        set_loc(*out, sl, sc, r);
        return out;
    }

    node_ptr parse_string(reader &r)
    {
        int sl = r.line, sc = r.col;
        r.get();
        std::string out;
        bool closed = false;
        while (!r.eof())
        {
            char c = r.get();
            if (c == '"')
            {
                closed = true;
                break;
            }
            if (c == '\\')
            {
                if (r.eof())
                    r.fail("bad escape");
                char e = r.get();
                switch (e)
                {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                default: out += e; break;
                }
            }
            else
                out += c;
        }
        if (!closed)
            throw parse_error("unterminated string", sl, sc);
        auto n = make_node(std::move(out));
        set_loc(*n, sl, sc, r);
        return n;
    }

    node_ptr parse_number(reader &r)
    {
        int sl = r.line, sc = r.col;
        std::string num;
        if (r.peek() == '+' || r.peek() == '-')
            num += r.get();
        bool is_float = false;
        while (is_digit(r.peek()))
            num += r.get();
        if (r.peek() == '.')
        {
            is_float = true;
            num += r.get();
            while (is_digit(r.peek()))
                num += r.get();
        }
        if (r.peek() == 'e' || r.peek() == 'E')
        {
            is_float = true;
            num += r.get();
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            while (is_digit(r.peek()))
                num += r.get();
        }
        node_ptr n;
        size_t used = 0;
        try
        {
            if (is_float)
                n = make_node(std::stod(num, &used));
            else
                n = make_node(static_cast<int64_t>(std::stoll(num, &used)));
        }
        catch (const std::logic_error &)
        {
            throw parse_error("invalid number '" + num + "'", sl, sc);
        }
        if (used != num.size())
            throw parse_error("invalid number '" + num + "'", sl, sc);
        set_loc(*n, sl, sc, r);
        return n;
    }

    node_ptr parse_symbol_or_keyword(reader &r)
    {
        int sl = r.line, sc = r.col;
        bool kw = false;
        if (r.peek() == ':')
        {
            kw = true;
            r.get();
        }
        std::string s;
        while (is_symbol_char(r.peek()))
            s += r.get();
        if (s.empty())
            r.fail("empty symbol");
        node_ptr n;
        if (kw)
            n = make_node(keyword{s});
        else if (s == "nil")
            n = make_node(std::monostate{});
        else if (s == "true")
            n = make_node(true);
        else if (s == "false")
            n = make_node(false);
        else
            n = make_node(symbol{s});
        set_loc(*n, sl, sc, r);
        return n;
    }

    node_ptr parse_value(reader &r)
    {
        r.skip_ws();
        char c = r.peek();
        int sl = r.line, sc = r.col;
        switch (c)
        {
        case '"':
            return parse_string(r);
        case '(':
            r.get();
            return parse_coll(r, ')', sl, sc);
        case '[':
            r.get();
            return parse_coll(r, ']', sl, sc);
        case '{':
            r.get();
            return parse_coll(r, '}', sl, sc);
        case '\0':
            r.fail("unexpected end of input");
        default:
            break;
        }
        if (is_digit(c))
            return parse_number(r);
        if ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1]))
            return parse_number(r);
        if (c == ':' || is_symbol_start(c))
            return parse_symbol_or_keyword(r);
        r.fail(std::string("unexpected character '") + c + "'");
    }
} // namespace detail

node_ptr parse(std::string_view input)
{
    detail::reader r(input);
    r.skip_ws();
    auto v = detail::parse_value(r);
    r.skip_ws();
    if (!r.eof())
        r.fail("unexpected trailing characters");
    return v;
}

std::vector<node_ptr> parse_all(std::string_view input)
{
    detail::reader r(input);
    std::vector<node_ptr> out;
    r.skip_ws();
    while (!r.eof())
    {
        out.push_back(detail::parse_value(r));
        r.skip_ws();
    }
    return out;
}

static std::string quote(const std::string &s)
{
    std::string out = "\"";
    for (char c : s)
    {
        switch (c)
        {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

// Shortest of 15..17 significant digits that reads back to the same value; always
// carries a '.' or exponent so it re-reads as a float.
static std::string format_double(double d)
{
    std::string out;
    for (int prec = 15; prec <= 17; ++prec)
    {
        std::ostringstream oss;
        oss << std::setprecision(prec) << d;
        out = oss.str();
        if (std::strtod(out.c_str(), nullptr) == d)
            break;
    }
    if (out.find_first_of(".eEn") == std::string::npos)
        out += ".0";
    return out;
}

static std::string atom_to_string(const node &n)
{
    if (std::holds_alternative<std::monostate>(n.data)) return "nil";
    if (auto b = std::get_if<bool>(&n.data)) return *b ? "true" : "false";
    if (auto i = std::get_if<int64_t>(&n.data)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&n.data)) return format_double(*d);
    if (auto s = std::get_if<std::string>(&n.data)) return quote(*s);
    if (auto k = std::get_if<keyword>(&n.data)) return ':' + k->name;
    if (auto s = std::get_if<symbol>(&n.data)) return s->name;
    return {};
}

static bool is_atomic(const node &x)
{
    return !std::holds_alternative<list>(x.data) && !std::holds_alternative<vector_t>(x.data) && !std::holds_alternative<map>(x.data);
}

std::string to_string(const node &n)
{
    if (is_atomic(n))
        return atom_to_string(n);
    auto join = [](const std::vector<node_ptr> &elems, char o, char c) {
        std::string out(1, o);
        for (size_t i = 0; i < elems.size(); ++i)
        {
            if (i) out += ' ';
            out += to_string(elems[i]);
        }
        return out + c;
    };
    if (auto l = as_list(n)) return join(l->elems, '(', ')');
    if (auto v = as_vector(n)) return join(v->elems, '[', ']');
    const auto &m = std::get<map>(n.data);
    std::string out = "{";
    for (size_t i = 0; i < m.entries.size(); ++i)
    {
        if (i) out += ' ';
        out += to_string(m.entries[i].first) + ' ' + to_string(m.entries[i].second);
    }
    return out + '}';
}

std::string to_pretty_string(const node &n, int indentWidth)
{
    // Short all-atomic collections stay on one line; keyword forms put each ":k v" pair on its own line.
    const size_t MAX_INLINE_LEN = 90;
    auto pad = [](int spaces) { return std::string(static_cast<size_t>(spaces < 0 ? 0 : spaces), ' '); };

    std::function<std::string(const node &, int)> pp = [&](const node &x, int indent) -> std::string {
        if (is_atomic(x))
            return atom_to_string(x);
        const std::vector<node_ptr> *elems = nullptr;
        char o = '(', c = ')';
        if (auto l = as_list(x)) elems = &l->elems;
        else if (auto v = as_vector(x)) { elems = &v->elems; o = '['; c = ']'; }
        else return to_string(x);
        if (elems->empty()) return std::string{o, c};

        bool allAtomic = true;
        for (auto &e : *elems) if (!is_atomic(*e)) { allAtomic = false; break; }
        if (allAtomic)
        {
            auto flat = to_string(x);
            if (flat.size() <= MAX_INLINE_LEN) return flat;
        }
        std::string out(1, o);
        size_t i = 0;
        if (o == '(')
        {
            // keep the head and any leading atoms before the first keyword on the opening line
            while (i < elems->size() && is_atomic(*(*elems)[i]) && !as_keyword(*(*elems)[i]))
            {
                if (i) out += ' ';
                out += atom_to_string(*(*elems)[i]);
                ++i;
            }
        }
        const int inner = indent + indentWidth;
        while (i < elems->size())
        {
            out += '\n' + pad(inner);
            auto &e = *(*elems)[i];
            out += pp(e, inner);
            if (as_keyword(e) && i + 1 < elems->size())
            {
                out += ' ' + pp(*(*elems)[i + 1], inner);
                ++i;
            }
            ++i;
        }
        out += c;
        return out;
    };
    return pp(n, 0);
}

std::string text_of(const node_ptr &n)
{
    if (!n)
        return {};
    if (auto s = std::get_if<symbol>(&n->data))
        return s->name;
    if (auto s = std::get_if<std::string>(&n->data))
        return *s;
    return {};
}

std::string head_of(const node &n)
{
    auto l = as_list(n);
    if (!l || l->elems.empty())
        return {};
    if (auto s = std::get_if<symbol>(&l->elems[0]->data))
        return s->name;
    return {};
}

node_ptr keyword_form(const std::string &head, std::initializer_list<std::pair<std::string, node_ptr>> kvs)
{
    list l;
    l.elems.push_back(n_sym(head));
    for (auto &pr : kvs)
    {
        l.elems.push_back(n_kw(pr.first));
        l.elems.push_back(pr.second);
    }
    return make_node(std::move(l));
}

void append_kv(node_ptr &form, const std::string &k, node_ptr v)
{
    if (!form || !std::holds_alternative<list>(form->data))
        throw std::invalid_argument("append_kv: form is not a list");
    auto &l = std::get<list>(form->data);
    l.elems.push_back(n_kw(k));
    l.elems.push_back(std::move(v));
}

} // namespace ifacec::edn
