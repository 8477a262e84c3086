#include "pyemit/graph_reader.hpp"
#include "pyemit/python_renderer.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using namespace pyemit;

struct RunResult { double ms_read; double ms_render; size_t source_bytes; };

static RunResult bench_case(const char* name, const std::string &desc, const RenderOptions& opts){
    TypeGraph graph;
    auto t0 = Clock::now();
    auto rr = read_graph(desc, graph);
    auto t1 = Clock::now();
    if(!rr.success){
        std::cerr << "[bench] case '" << name << "' failed to read (" << rr.errors.size() << " errors)\n";
        return {0.0, 0.0, 0};
    }
    auto src = render(graph, opts).to_source();
    auto t2 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(),
             std::chrono::duration<double, std::milli>(t2 - t1).count(), src.size() };
}

// A chain of n classes, each holding the next, plus an enum and a union per class.
static std::string wide_graph(int n){
    std::string types, s;
    for(int i=0;i<n;++i){
        std::string next = i+1<n ? "Node"+std::to_string(i+1) : "string";
        types += "(class :name Node"+std::to_string(i)+" :properties ["
                 "(prop :name \"next item\" :type (nullable "+next+")) "
                 "(prop :name \"tags\" :type (array string)) "
                 "(prop :name \"kind\" :type Kind"+std::to_string(i)+") "
                 "(prop :name \"value\" :type Value"+std::to_string(i)+")])\n";
        types += "(enum :name Kind"+std::to_string(i)+" :cases [\"alpha\" \"beta\" \"gamma delta\"])\n";
        types += "(union :name Value"+std::to_string(i)+" :members [integer string (map double)])\n";
    }
    s = "(graph :top-levels [(top :name \"root\" :type Node0)] :types [\n" + types + "])";
    return s;
}

// Self-referential tree; exercises the cycle path in the dependency ordering.
static const char* kTree = R"EDN(
(graph :top-levels [(top :name "tree" :type TreeNode)]
       :types [(class :name TreeNode :properties [(prop :name "children" :type (array TreeNode))
                                                  (prop :name "parent" :type (nullable TreeNode))
                                                  (prop :name "label" :type string)])])
)EDN";

int main(){
    struct Case { const char* name; std::string desc; bool declare_unions; };
    std::vector<Case> cases;
    cases.push_back({"tree", kTree, false});
    cases.push_back({"chain_50_inline", wide_graph(50), false});
    cases.push_back({"chain_50_declared", wide_graph(50), true});
    cases.push_back({"chain_500_declared", wide_graph(500), true});

    const int iters = 5;
    for(auto &c : cases){
        RenderOptions opts; opts.declare_unions = c.declare_unions;
        double read_total=0, render_total=0; size_t bytes=0;
        for(int i=0;i<iters;++i){
            auto r = bench_case(c.name, c.desc, opts);
            read_total += r.ms_read; render_total += r.ms_render; bytes = r.source_bytes;
        }
        std::cout << "[bench] " << c.name << ": read_ms=" << read_total/iters << ", render_ms=" << render_total/iters
                  << ", source_bytes=" << bytes << "\n";
    }
    return 0;
}
