#pragma once
#include "state.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>

namespace specmark::header::actions {
using namespace tao::pegtl;
using specmark::header::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::ins_open > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.pending = WrapTag::Ins; }
};
template<> struct action< grammar::del_open > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.pending = WrapTag::Del; }
};
template<> struct action< grammar::mark_open > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.pending = WrapTag::Mark; }
};

// A wrapper matched by an abandoned parameter attempt must not carry over.
template<> struct action< grammar::param_start > {
    static void apply0(build_state& st){ st.pending = WrapTag::None; }
};

template<> struct action< grammar::header_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.out->name = rtrim(in.string()); }
};

template<> struct action< grammar::param_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string s = in.string();
        ParsedParam p;
        p.name = s.substr(1, s.size() - 2);
        p.wrapper = st.pending;
        st.pending = WrapTag::None;
        st.sink().push_back(std::move(p));
    }
};

template<> struct action< grammar::param_type > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto& params = st.sink();
        if(params.empty()) return;
        params.back().type = rtrim(in.string());
        params.back().type_offset = st.offset_of(in.begin());
    }
};

template<> struct action< grammar::optional_open > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.in_optional = true; }
};

template<> struct action< grammar::return_type > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.out->return_type = rtrim(in.string());
        st.out->return_offset = st.offset_of(in.begin());
    }
};

} // namespace specmark::header::actions
