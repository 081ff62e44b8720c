#include "tinyc/diagnostics_json.hpp"
#include "tinyc/env.hpp"
#include <sstream>
#include <cstdio>

namespace tinyc {

std::string json_escape(const std::string& s){
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        const auto u = static_cast<unsigned char>(c);
        if(c == '"' || c == '\\'){ out += '\\'; out += c; }
        else if(c == '\n') out += "\\n";
        else if(c == '\r') out += "\\r";
        else if(c == '\t') out += "\\t";
        else if(u < 0x20){ out += "\\u00"; out += hex[u >> 4]; out += hex[u & 0xF]; }
        else out += c;
    }
    out += '"';
    return out;
}

std::string diagnostics_to_json(const compile_result& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")
      <<",\"output\":"<<json_escape(r.output)
      <<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        const auto &e=r.errors[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(e.code)
            <<",\"message\":"<<json_escape(e.message)
            <<",\"hint\":"<<json_escape(e.hint)
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const compile_result& r){
    if(diag_json_enabled()){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace tinyc
