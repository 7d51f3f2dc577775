// edn.cpp - reader and printer for document forms
#include "specmark/edn.hpp"
#include <cctype>
#include <limits>

namespace specmark::edn {

namespace detail {

void reader::skip_ws(){
    while(!eof()){
        char c = peek();
        if(c == ';'){
            while(!eof() && get() != '\n')
                continue;
            continue;
        }
        // commas are whitespace in EDN
        if(c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ','){
            get();
            continue;
        }
        break;
    }
}

static bool is_digit(char c){ return c >= '0' && c <= '9'; }
static bool is_symbol_start(char c){ return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&'; }
static bool is_symbol_char(char c){ return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':'; }

static node_ptr make_node(node_data d, size_t begin, int line, int col){
    auto n = std::make_shared<node>();
    n->data = std::move(d);
    n->begin = begin;
    n->line = line;
    n->col = col;
    return n;
}

static node_ptr parse_collection(reader& r, char close){
    size_t begin = r.p; int sl = r.line, sc = r.col;
    r.get();
    std::vector<node_ptr> elems;
    r.skip_ws();
    while(!r.eof() && r.peek() != close){
        elems.push_back(parse_value(r));
        r.skip_ws();
    }
    if(r.eof())
        throw parse_error("unterminated collection", begin, sl, sc);
    r.get();
    node_ptr out;
    if(close == ')'){
        list l; l.elems = std::move(elems);
        out = make_node(std::move(l), begin, sl, sc);
    } else {
        if(elems.size() % 2)
            throw parse_error("map requires even number of forms", begin, sl, sc);
        map m;
        for(size_t i = 0; i < elems.size(); i += 2)
            m.entries.emplace_back(elems[i], elems[i + 1]);
        out = make_node(std::move(m), begin, sl, sc);
    }
    out->end = r.p;
    return out;
}

static node_ptr parse_string(reader& r){
    size_t begin = r.p; int sl = r.line, sc = r.col;
    r.get();
    std::string out;
    bool closed = false;
    while(!r.eof()){
        char c = r.get();
        if(c == '"'){ closed = true; break; }
        if(c != '\\'){ out += c; continue; }
        if(r.eof())
            r.fail("bad escape");
        char e = r.get();
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            default: out += e; break;
        }
    }
    if(!closed)
        throw parse_error("unterminated string", begin, sl, sc);
    auto n = make_node(std::move(out), begin, sl, sc);
    n->end = r.p;
    return n;
}

static node_ptr parse_integer(reader& r){
    size_t begin = r.p; int sl = r.line, sc = r.col;
    std::string num;
    if(r.peek() == '+' || r.peek() == '-')
        num += r.get();
    while(is_digit(r.peek()))
        num += r.get();
    if(r.peek() == '.' || r.peek() == 'e' || r.peek() == 'E')
        throw parse_error("floating point values are not supported in documents", begin, sl, sc);
    int64_t v = 0;
    bool neg = !num.empty() && num[0] == '-';
    for(char c : num){
        if(!is_digit(c)) continue;
        if(v > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10)
            throw parse_error("integer out of range", begin, sl, sc);
        v = v * 10 + (c - '0');
    }
    auto n = make_node(neg ? -v : v, begin, sl, sc);
    n->end = r.p;
    return n;
}

static node_ptr parse_symbol_or_keyword(reader& r){
    size_t begin = r.p; int sl = r.line, sc = r.col;
    bool kw = false;
    if(r.peek() == ':'){ kw = true; r.get(); }
    std::string s;
    while(is_symbol_char(r.peek()))
        s += r.get();
    if(s.empty())
        throw parse_error("empty symbol", begin, sl, sc);
    node_ptr n;
    if(kw) n = make_node(keyword{s}, begin, sl, sc);
    else if(s == "nil") n = make_node(std::monostate{}, begin, sl, sc);
    else if(s == "true") n = make_node(true, begin, sl, sc);
    else if(s == "false") n = make_node(false, begin, sl, sc);
    else n = make_node(symbol{s}, begin, sl, sc);
    n->end = r.p;
    return n;
}

node_ptr parse_value(reader& r){
    r.skip_ws();
    char c = r.peek();
    if(r.eof())
        r.fail("unexpected end of input");
    switch(c){
        case '"': return parse_string(r);
        case '(': return parse_collection(r, ')');
        case '{': return parse_collection(r, '}');
        default: break;
    }
    if(is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
        return parse_integer(r);
    if(c == ':' || is_symbol_start(c))
        return parse_symbol_or_keyword(r);
    r.fail(std::string("unexpected character '") + c + "'");
}

} // namespace detail

node_ptr parse(std::string_view src){
    detail::reader r(src);
    r.skip_ws();
    auto v = detail::parse_value(r);
    r.skip_ws();
    if(!r.eof())
        r.fail("unexpected trailing characters");
    return v;
}

std::string to_string(const node& n){
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(const std::string& s) const {
            std::string out = "\"";
            for(char c : s){
                if(c == '"' || c == '\\') out += '\\';
                if(c == '\n'){ out += "\\n"; continue; }
                out += c;
            }
            return out + '"';
        }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string operator()(const list& l) const {
            std::string out = "(";
            for(size_t i = 0; i < l.elems.size(); ++i){ if(i) out += ' '; out += to_string(l.elems[i]); }
            return out + ')';
        }
        std::string operator()(const map& m) const {
            std::string out = "{";
            for(size_t i = 0; i < m.entries.size(); ++i){
                if(i) out += ' ';
                out += to_string(m.entries[i].first) + ' ' + to_string(m.entries[i].second);
            }
            return out + '}';
        }
    };
    return std::visit(V{}, n.data);
}

} // namespace specmark::edn
