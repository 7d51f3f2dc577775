#include "specmark/config.hpp"
#include <cstdlib>

namespace specmark {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

static std::vector<std::string> split_list(const std::string& s){
    std::vector<std::string> out;
    size_t start = 0;
    while(start <= s.size()){
        size_t comma = s.find(',', start);
        if(comma == std::string::npos) comma = s.size();
        size_t b = start, e = comma;
        while(b < e && s[b] == ' ') ++b;
        while(e > b && s[e - 1] == ' ') --e;
        if(e > b) out.push_back(s.substr(b, e - b));
        start = comma + 1;
    }
    return out;
}

CompileOptions CompileOptions::from_env(){
    CompileOptions o;
    if(const char* ns = std::getenv("SPECMARK_NAMESPACE")){ if(*ns) o.root_namespace = ns; }
    o.legacy_header_lookup = env_flag_enabled("SPECMARK_LEGACY_HEADERS");
    o.trace = env_flag_enabled("SPECMARK_TRACE");
    o.diag_json = env_flag_enabled("SPECMARK_DIAG_JSON");
    if(const char* fx = std::getenv("SPECMARK_EFFECTS")) o.known_effects = split_list(fx);
    return o;
}

} // namespace specmark
