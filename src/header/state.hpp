#pragma once
#include "specmark/header_parser.hpp"
#include <cctype>
#include <string>

namespace specmark::header {

// Shared state threaded through the header actions
struct build_state {
    const char* base = nullptr;
    HeaderParseResult* out = nullptr;
    bool in_optional = false;
    WrapTag pending = WrapTag::None;

    std::vector<ParsedParam>& sink(){ return in_optional ? out->optional_params : out->params; }
    size_t offset_of(const char* p) const { return static_cast<size_t>(p - base); }
};

inline std::string rtrim(std::string s){
    while(!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

} // namespace specmark::header
