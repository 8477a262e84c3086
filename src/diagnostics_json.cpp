#include "pyemit/diagnostics_json.hpp"
#include <llvm/Support/raw_ostream.h>
#include <cstdlib>
#include <cstdio>

namespace pyemit {

std::string json_escape(const std::string& s){
    std::string out; llvm::raw_string_ostream o(out); o<<'"';
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

namespace {
void append_notes_json(llvm::raw_ostream& os, const std::vector<GraphNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

template <class D>
void append_diagnostics_json(llvm::raw_ostream& os, const std::vector<D>& ds){
    os<<"[";
    for(size_t i=0;i<ds.size(); ++i){
        const auto &d=ds[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"notes\":";
        append_notes_json(os,d.notes);
        os<<"}";
    }
    os<<"]";
}
} // namespace

std::string diagnostics_to_json(const ReadResult& r){
    std::string out; llvm::raw_string_ostream os(out);
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":";
    append_diagnostics_json(os, r.errors);
    os<<",\"warnings\":";
    append_diagnostics_json(os, r.warnings);
    os<<"}";
    return os.str();
}

void maybe_print_json(const ReadResult& r, llvm::raw_ostream& os){
    if(const char* env = std::getenv("PYEMIT_DIAG_JSON")){
        if(env[0]=='1'){
            os << diagnostics_to_json(r) << "\n";
        }
    }
}

} // namespace pyemit
