// EDN forms with source positions; the on-disk rendition of authoring markup
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace specmark::edn
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, size_t offset, int line, int col)
            : std::runtime_error(msg), offset(offset), line(line), col(col) {}
        size_t offset;
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
    struct list;
    struct map;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, std::string, keyword, symbol, list, map>;

    // Byte offsets are into the text handed to parse(); [begin, end) covers the whole form,
    // so a string's raw contents live in [begin + 1, end - 1).
    struct node
    {
        node_data data;
        size_t begin = 0;
        size_t end = 0;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one form (surrounding whitespace and ; comments allowed).
    node_ptr parse(std::string_view src);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return to_string(*p); }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_map(const node &n) { return std::holds_alternative<map>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const map *as_map(const node &n) { return is_map(n) ? &std::get<map>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const std::string *as_string(const node &n) { return is_string(n) ? &std::get<std::string>(n.data) : nullptr; }

    namespace detail
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char get()
            {
                if (eof())
                    return '\0';
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
            void skip_ws();
            [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, p, line, col); }
        };

        node_ptr parse_value(reader &r);
    }

} // namespace specmark::edn
