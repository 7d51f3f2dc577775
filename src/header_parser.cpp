#include "specmark/header_parser.hpp"
#include "header/state.hpp"
#include "header/grammar.hpp"
#include "header/actions.hpp"
#include <tao/pegtl.hpp>

namespace specmark {

const char* wrap_tag_name(WrapTag w){
    switch(w){
        case WrapTag::Ins: return "ins";
        case WrapTag::Del: return "del";
        case WrapTag::Mark: return "mark";
        case WrapTag::None: break;
    }
    return "";
}

HeaderParseResult parse_header(std::string_view src){
    HeaderParseResult r;
    header::build_state st; st.base = src.data(); st.out = &r;
    tao::pegtl::memory_input in(src.data(), src.size(), "header");
    try {
        if(!tao::pegtl::parse< header::grammar::header, header::actions::action >(in, st)){
            HeaderParseResult f; f.error_message = "expected an operation name"; f.error_offset = 0; return f;
        }
        r.success = true;
        return r;
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        HeaderParseResult f; f.error_message = e.what(); f.error_offset = p.byte; return f;
    }
}

} // namespace specmark
