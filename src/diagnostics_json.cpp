#include "specmark/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace specmark {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static const char* locus_name(DiagnosticLocus l){
    switch(l){
        case DiagnosticLocus::Node: return "node";
        case DiagnosticLocus::Attribute: return "attribute";
        case DiagnosticLocus::Contents: return "contents";
    }
    return "node";
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& ds){
    std::ostringstream os;
    os<<"{\"count\":"<<ds.size()<<",\"diagnostics\":[";
    for(size_t i=0;i<ds.size(); ++i){
        const auto& d=ds[i]; if(i) os<<",";
        os<<"{"
            "\"ruleId\":"<<json_escape(d.rule_id)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"locus\":\""<<locus_name(d.locus)<<"\"";
        if(d.node) os<<",\"tag\":"<<json_escape(d.node->is_element() ? d.node->tag() : std::string("#text"));
        if(d.locus == DiagnosticLocus::Attribute) os<<",\"attr\":"<<json_escape(d.attr);
        os<<",\"line\":"<<d.line
          <<",\"col\":"<<d.col
          <<"}";
    }
    os<<"]}";
    return os.str();
}

} // namespace specmark
