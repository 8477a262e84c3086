#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "pyemit/diagnostics_json.hpp"
#include "pyemit/graph_reader.hpp"
#include "pyemit/options.hpp"
#include "pyemit/python_renderer.hpp"

using namespace pyemit;

static const char* kUsage = "usage: pyemitc [--<option>]... [--comment TEXT]... [-o FILE] <graph.edn | ->\n";

static bool read_input(const std::string& path, std::string& out){
    std::stringstream ss;
    if(path=="-"){ ss<<std::cin.rdbuf(); out=ss.str(); return true; }
    std::ifstream ifs(path); if(!ifs) return false;
    ss<<ifs.rdbuf(); out=ss.str(); return true;
}

template <class D>
static void print_diagnostic(const std::string& file, const char* kind, const D& d){
    std::cerr << file; if(d.line>=0) std::cerr << ":"<<d.line<<":"<<d.col; std::cerr << ": " << kind;
    if(!d.code.empty()) std::cerr << "["<<d.code<<"]";
    std::cerr << ": " << d.message << "\n";
    if(!d.hint.empty()) std::cerr << "  hint: " << d.hint << "\n";
    for(auto &n : d.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line "<<n.line<<":"<<n.col<<")"; std::cerr << "\n"; }
}

int main(int argc, char** argv){
    RenderOptions opts = detect_options();
    std::string input, output;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--comment"){ if(++i>=argc){ std::cerr << kUsage; return 2; } opts.leading_comments.push_back(argv[i]); }
        else if(a=="-o"){ if(++i>=argc){ std::cerr << kUsage; return 2; } output=argv[i]; }
        else if(a=="-h" || a=="--help"){
            const auto& lang = python_target();
            std::cout << kUsage << "target: " << lang.display_name << " (." << lang.extension << ")\n";
            for(auto& o : lang.options) std::cout << "  --" << o.name << "  " << o.description << " (default " << (o.default_value?"true":"false") << ")\n";
            return 0;
        }
        // target options from the descriptor table, e.g. --declare-unions
        else if(a.rfind("--",0)==0 && apply_option(opts, llvm::StringRef(a).drop_front(2), true)) continue;
        else if(a.size()>1 && a[0]=='-'){ std::cerr << "unknown option: " << a << "\n" << kUsage; return 2; }
        else if(input.empty()) input=a;
        else { std::cerr << kUsage; return 2; }
    }
    if(input.empty()){ std::cerr << kUsage; return 2; }

    std::string src;
    if(!read_input(input, src)){ std::cerr << "failed to read " << input << "\n"; return 2; }

    TypeGraph graph;
    ReadResult rr;
    try { rr = read_graph(src, graph); }
    catch(const edn::parse_error& e){ std::cerr << input << ":" << e.line << ":" << e.col << ": error: " << e.what() << "\n"; return 1; }
    maybe_print_json(rr);
    for(auto& e : rr.errors) print_diagnostic(input, "error", e);
    for(auto& w : rr.warnings) print_diagnostic(input, "warning", w);
    if(!rr.success) return 1;

    // comments given on the command line come after those from the graph file
    rr.comments.insert(rr.comments.end(), opts.leading_comments.begin(), opts.leading_comments.end());
    opts.leading_comments = std::move(rr.comments);

    RenderResult result;
    try { result = render(graph, opts); }
    catch(const render_error& e){ std::cerr << "render error: " << e.what() << "\n"; return 3; }

    if(output.empty()){ std::cout << result.to_source(); return 0; }
    std::ofstream ofs(output);
    if(!ofs){ std::cerr << "failed to open " << output << " for writing\n"; return 2; }
    ofs << result.to_source();
    if(!ofs){ std::cerr << "failed to write " << output << "\n"; return 2; }
    return 0;
}
