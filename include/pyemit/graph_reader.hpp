// Reader for EDN type-graph descriptions: (graph :comments [...] :top-levels [...] :types [...])
#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pyemit/edn.hpp"
#include "pyemit/types.hpp"

namespace pyemit
{

struct GraphNote { std::string message; int line=-1; int col=-1; };
struct GraphError { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<GraphNote> notes; };
struct GraphWarning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<GraphNote> notes; };

// Central reporter so every reader component formats diagnostics the same way.
struct ErrorReporter {
    std::vector<GraphError>* errors=nullptr;
    std::vector<GraphWarning>* warnings=nullptr;
    void emit_error(const GraphError& e){ if(errors) errors->push_back(e); }
    void emit_warning(const GraphWarning& w){ if(warnings) warnings->push_back(w); }
    GraphError make_error(std::string code, std::string message, std::string hint, int line, int col){ return GraphError{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
    GraphWarning make_warning(std::string code, std::string message, std::string hint, int line, int col){ return GraphWarning{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
};

struct ReadResult {
    bool success=true;
    std::vector<GraphError> errors;
    std::vector<GraphWarning> warnings;
    std::vector<std::string> comments; // from :comments, for RenderOptions::leading_comments
};

// Builds a TypeGraph from the AST. Only structural and reference checks are performed.
class GraphReader {
public:
    explicit GraphReader(TypeGraph& graph): graph_(graph){}
    ReadResult read_module(const edn::node_ptr& ast);

private:
    using Sections = std::vector<std::pair<std::string, edn::node_ptr>>;
    struct Decl {
        std::string kind; // class | enum | union
        edn::node_ptr form;
        Sections sections;
        TypeId id=0;
        bool building=false;
        bool built=false;
    };

    TypeGraph& graph_;
    std::unordered_map<std::string, Decl> decls_;
    std::vector<std::string> decl_order_;

    void reset();
    void error_code(ReadResult& r, const edn::node& n, std::string code, std::string msg, std::string hint="");
    void warn_code(ReadResult& r, const edn::node& n, std::string code, std::string msg, std::string hint="");
    static int line(const edn::node& n){ return n.line; }
    static int col(const edn::node& n){ return n.col; }

    // Keyword/value pairs after the head symbol of a list form; false (with E2002) on a malformed tail.
    bool read_sections(ReadResult& r, const edn::node& form, Sections& out);
    static edn::node_ptr section(const Sections& s, const std::string& key);

    void collect_declarations(ReadResult& r, const edn::node_ptr& types);
    void build_enum(ReadResult& r, Decl& d, const std::string& name);
    void build_union(ReadResult& r, Decl& d, const std::string& name);
    void build_class(ReadResult& r, Decl& d);
    void collect_top_levels(ReadResult& r, const edn::node_ptr& tops);
    void read_comments(ReadResult& r, const edn::node_ptr& comments);
    void warn_unreachable(ReadResult& r);

    // kBad on error (already reported).
    static constexpr TypeId kBad = static_cast<TypeId>(-1);
    TypeId resolve_type(ReadResult& r, const edn::node_ptr& n);
    TypeId resolve_named(ReadResult& r, const std::string& name, const edn::node& at);
    TypeId make_union(ReadResult& r, const edn::node& at, std::string hint, const std::vector<edn::node_ptr>& member_nodes);
    std::string member_hint(TypeId id) const;

    static int edit_distance(const std::string& a, const std::string& b);
    std::vector<std::string> fuzzy_candidates(const std::string& target, int maxDist=2) const;
    static void append_suggestions(GraphError& err, const std::vector<std::string>& suggs);
};

// Parse and read in one step; malformed EDN text throws edn::parse_error.
ReadResult read_graph(std::string_view src, TypeGraph& graph);

} // namespace pyemit
