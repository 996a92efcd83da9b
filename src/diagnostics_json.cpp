#include "kiln/diagnostics_json.hpp"
#include "kiln/options.hpp"
#include <sstream>
#include <cstdio>

namespace kiln {

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

static void append_frame_json(std::ostringstream& os, const Frame& f){
    os<<"{\"module\":"<<json_escape(f.module)
      <<",\"function\":"<<json_escape(f.function)
      <<",\"arity\":"<<f.arity
      <<",\"file\":"<<json_escape(f.file)
      <<",\"line\":"<<f.line<<"}";
}

static void append_diag_json(std::ostringstream& os, const Diagnostic& d){
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"message\":"<<json_escape(d.message)
        <<",\"hint\":"<<json_escape(d.hint)
        <<",\"file\":"<<json_escape(d.file)
        <<",\"line\":"<<d.line
        <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<",\"line\":"<<d.notes[i].line<<"}";
    }
    os<<"],\"stack\":[";
    for(size_t i=0;i<d.stack.size(); ++i){ if(i) os<<","; append_frame_json(os, d.stack[i]); }
    os<<"]";
    if(d.origin){ os<<",\"origin\":"; append_frame_json(os, *d.origin); }
    os<<"}";
}

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings){
    std::ostringstream os;
    os<<"{\"success\":"<<(success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<errors.size(); ++i){ if(i) os<<","; append_diag_json(os, errors[i]); }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<warnings.size(); ++i){ if(i) os<<","; append_diag_json(os, warnings[i]); }
    os<<"]}";
    return os.str();
}

void maybe_print_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings){
    if(env_flag_enabled("KILN_DIAG_JSON")){
        auto js=diagnostics_to_json(success, errors, warnings);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace kiln
