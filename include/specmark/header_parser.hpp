// Algorithm header grammar: "Name ( _a_: T, _b_ [ , _c_ ] ): R"
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace specmark {

// Revision markup a parameter may be wrapped in.
enum class WrapTag { None, Ins, Del, Mark };

const char* wrap_tag_name(WrapTag w); // "ins", "del", "mark" or ""

struct ParsedParam {
    std::string name;                 // without the surrounding underscores
    WrapTag wrapper = WrapTag::None;
    std::optional<std::string> type;  // raw type text, trimmed
    size_t type_offset = 0;           // byte offset of type text in the header source
};

struct HeaderParseResult {
    bool success = false;
    std::string name;
    std::vector<ParsedParam> params;
    std::vector<ParsedParam> optional_params;
    std::optional<std::string> return_type;
    size_t return_offset = 0;
    // failure only
    std::string error_message;
    size_t error_offset = 0;
};

// Never throws; grammar failures are reported through the result.
HeaderParseResult parse_header(std::string_view src);

} // namespace specmark
