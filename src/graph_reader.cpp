#include "pyemit/graph_reader.hpp"
#include "pyemit/log.hpp"
#include <algorithm>
#include <cstdlib>
#include <unordered_set>

namespace pyemit {

using namespace edn;

namespace {
const std::unordered_map<std::string, PrimitiveKind>& primitive_names(){
    static const std::unordered_map<std::string, PrimitiveKind> names{
        {"none",PrimitiveKind::None}, {"any",PrimitiveKind::Any}, {"null",PrimitiveKind::Null},
        {"bool",PrimitiveKind::Bool}, {"integer",PrimitiveKind::Integer}, {"double",PrimitiveKind::Double},
        {"string",PrimitiveKind::String}, {"date",PrimitiveKind::Date}, {"time",PrimitiveKind::Time},
        {"date-time",PrimitiveKind::DateTime}};
    return names;
}
bool is_name_node(const node_ptr& n){ return n && (is_symbol(*n) || is_string(*n)); }
} // namespace

void GraphReader::reset(){ decls_.clear(); decl_order_.clear(); }

void GraphReader::error_code(ReadResult& r, const node& n, std::string code, std::string msg, std::string hint){
    ErrorReporter rep{&r.errors,&r.warnings};
    rep.emit_error(rep.make_error(std::move(code), std::move(msg), std::move(hint), line(n), col(n)));
    r.success=false;
}
void GraphReader::warn_code(ReadResult& r, const node& n, std::string code, std::string msg, std::string hint){
    ErrorReporter rep{&r.errors,&r.warnings};
    rep.emit_warning(rep.make_warning(std::move(code), std::move(msg), std::move(hint), line(n), col(n)));
}

bool GraphReader::read_sections(ReadResult& r, const node& form, Sections& out){
    auto* l = as_list(form);
    if(!l) return false;
    for(size_t j=1;j<l->elems.size(); ++j){
        auto& k = l->elems[j];
        if(!k || !is_keyword(*k)){ error_code(r, k?*k:form, "E2002", "expected keyword, found "+to_string(k), "use :key value pairs"); return false; }
        std::string kw = std::get<keyword>(k->data).name;
        if(++j>=l->elems.size()){ error_code(r, *k, "E2002", "keyword :"+kw+" has no value", "add a value after :"+kw); return false; }
        out.emplace_back(kw, l->elems[j]);
    }
    return true;
}

node_ptr GraphReader::section(const Sections& s, const std::string& key){
    for(auto& kv : s) if(kv.first==key) return kv.second;
    return nullptr;
}

ReadResult GraphReader::read_module(const node_ptr& ast){
    ReadResult r; reset();
    if(!ast || head_of(*ast)!="graph"){
        node dummy; if(ast) dummy=*ast;
        error_code(r, dummy, "E2001", "top form must be (graph ...)", "wrap the description in (graph :top-levels [...] :types [...])");
        return r;
    }
    Sections secs;
    if(!read_sections(r, *ast, secs)) return r;
    for(auto& kv : secs){
        if(kv.first!="comments" && kv.first!="top-levels" && kv.first!="types")
            warn_code(r, *kv.second, "W2101", "unknown graph section :"+kv.first+" ignored", "known sections: :comments :top-levels :types");
    }
    if(auto c = section(secs,"comments")) read_comments(r, c);
    if(auto t = section(secs,"types")) collect_declarations(r, t);

    // enums first (no references), then unions (lazily, they may nest), then class bodies
    for(auto& name : decl_order_){ auto& d=decls_[name]; if(d.kind=="enum") build_enum(r,d,name); }
    for(auto& name : decl_order_){ auto& d=decls_[name]; if(d.kind=="union" && !d.built) build_union(r,d,name); }
    for(auto& name : decl_order_){ auto& d=decls_[name]; if(d.kind=="class") build_class(r,d); }

    if(auto t = section(secs,"top-levels")) collect_top_levels(r, t);
    else warn_code(r, *ast, "W2102", "graph has no :top-levels", "nothing will be rendered");
    if(r.success) warn_unreachable(r);
    if(debug_enabled())
        debug_log("reader") << decls_.size() << " declarations, " << graph_.top_levels().size() << " top-levels, "
                            << r.errors.size() << " errors, " << r.warnings.size() << " warnings\n";
    return r;
}

void GraphReader::read_comments(ReadResult& r, const node_ptr& comments){
    auto* v = as_vector(*comments);
    if(!v){ error_code(r, *comments, "E2002", ":comments must be a vector of strings", "use :comments [\"...\"]"); return; }
    for(auto& c : v->elems){
        if(!c || !is_string(*c)){ error_code(r, c?*c:*comments, "E2002", "comment is not a string: "+to_string(c), "quote the comment text"); continue; }
        r.comments.push_back(std::get<std::string>(c->data));
    }
}

void GraphReader::collect_declarations(ReadResult& r, const node_ptr& types){
    auto* v = as_vector(*types);
    if(!v){ error_code(r, *types, "E2030", ":types must be a vector of declarations", "use :types [ (class ...) (enum ...) (union ...) ]"); return; }
    for(auto& n : v->elems){
        if(!n) continue;
        std::string kind = head_of(*n);
        if(kind!="class" && kind!="enum" && kind!="union"){
            error_code(r, *n, "E2012", "unknown declaration kind: "+(kind.empty()? to_string(n) : kind), "expected class, enum or union"); continue; }
        Decl d; d.kind=kind; d.form=n;
        if(!read_sections(r, *n, d.sections)) continue;
        auto nameNode = section(d.sections,"name");
        if(!is_name_node(nameNode)){ error_code(r, *n, "E2010", kind+" declaration missing :name", "provide ("+kind+" :name Name ...)"); continue; }
        std::string name = text_of(nameNode);
        if(primitive_names().count(name)){ error_code(r, *nameNode, "E2013", "declaration name '"+name+"' shadows a primitive type", "rename the "+kind); continue; }
        if(decls_.count(name)){
            ErrorReporter rep{&r.errors,&r.warnings};
            auto err = rep.make_error("E2011", "duplicate declaration '"+name+"'", "choose a unique name", line(*n), col(*n));
            auto& prev = *decls_[name].form;
            err.notes.push_back(GraphNote{"previous declaration here", line(prev), col(prev)});
            rep.emit_error(err); r.success=false;
            continue;
        }
        // classes get their identity up front so anything may reference them
        if(kind=="class") d.id = graph_.add_class(name);
        decls_.emplace(name, std::move(d));
        decl_order_.push_back(name);
    }
}

void GraphReader::build_enum(ReadResult& r, Decl& d, const std::string& name){
    d.built=true; d.id=kBad;
    std::vector<std::string> cases;
    if(auto casesNode = section(d.sections,"cases")){
        auto* v = as_vector(*casesNode);
        if(!v){ error_code(r, *casesNode, "E2030", "enum :cases must be a vector", "use :cases [\"a\" \"b\"]"); return; }
        for(auto& c : v->elems){
            if(!is_name_node(c)){ error_code(r, c?*c:*casesNode, "E2030", "enum case must be a string or symbol: "+to_string(c), "quote the case label"); continue; }
            cases.push_back(text_of(c));
        }
    }
    d.id = graph_.add_enum(name, std::move(cases));
}

void GraphReader::build_union(ReadResult& r, Decl& d, const std::string& name){
    d.building=true;
    TypeId id = kBad;
    auto members = section(d.sections,"members");
    auto* v = members ? as_vector(*members) : nullptr;
    if(!v) error_code(r, *d.form, "E2030", "union '"+name+"' needs :members [...]", "use :members [T1 T2 ...]");
    else id = make_union(r, *d.form, name, v->elems);
    d.building=false; d.built=true; d.id=id;
}

void GraphReader::build_class(ReadResult& r, Decl& d){
    auto propsNode = section(d.sections,"properties");
    if(!propsNode) return; // no properties
    auto* v = as_vector(*propsNode);
    if(!v){ error_code(r, *propsNode, "E2030", "class :properties must be a vector", "use :properties [ (prop :name \"x\" :type T) ]"); return; }
    std::vector<ClassProperty> props;
    std::unordered_set<std::string> seen;
    for(auto& p : v->elems){
        if(!p || head_of(*p)!="prop"){ error_code(r, p?*p:*propsNode, "E2030", "property entry malformed: "+to_string(p), "use (prop :name \"x\" :type T)"); continue; }
        Sections ps; if(!read_sections(r, *p, ps)) continue;
        auto nameNode = section(ps,"name"); auto typeNode = section(ps,"type");
        if(!is_name_node(nameNode) || !typeNode){ error_code(r, *p, "E2030", "property needs :name and :type", "use (prop :name \"x\" :type T)"); continue; }
        std::string pname = text_of(nameNode);
        if(!seen.insert(pname).second){ error_code(r, *nameNode, "E2031", "duplicate property '"+pname+"'", "property names must be unique within a class"); continue; }
        bool optional=false;
        if(auto o = section(ps,"optional")){
            if(!std::holds_alternative<bool>(o->data)){ error_code(r, *o, "E2030", ":optional must be true or false", ""); continue; }
            optional = std::get<bool>(o->data);
        }
        TypeId t = resolve_type(r, typeNode);
        if(t==kBad) continue;
        props.push_back(ClassProperty{std::move(pname), t, optional});
    }
    graph_.set_class_properties(d.id, std::move(props));
}

void GraphReader::collect_top_levels(ReadResult& r, const node_ptr& tops){
    auto* v = as_vector(*tops);
    if(!v){ error_code(r, *tops, "E2030", ":top-levels must be a vector", "use :top-levels [ (top :name \"X\" :type T) ]"); return; }
    for(auto& t : v->elems){
        if(!t || head_of(*t)!="top"){ error_code(r, t?*t:*tops, "E2030", "top-level entry malformed: "+to_string(t), "use (top :name \"X\" :type T)"); continue; }
        Sections ts; if(!read_sections(r, *t, ts)) continue;
        auto nameNode = section(ts,"name"); auto typeNode = section(ts,"type");
        if(!is_name_node(nameNode) || !typeNode){ error_code(r, *t, "E2040", "top-level missing :name or :type", "use (top :name \"X\" :type T)"); continue; }
        TypeId ty = resolve_type(r, typeNode);
        if(ty==kBad) continue;
        graph_.add_top_level(text_of(nameNode), ty);
    }
}

void GraphReader::warn_unreachable(ReadResult& r){
    std::vector<bool> seen(graph_.size(), false);
    std::vector<TypeId> work;
    for(auto& t : graph_.top_levels()) work.push_back(t.type);
    while(!work.empty()){
        TypeId id = work.back(); work.pop_back();
        if(seen[id]) continue;
        seen[id]=true;
        for(TypeId c : graph_.children(id)) work.push_back(c);
    }
    for(auto& name : decl_order_){
        auto& d = decls_[name];
        if(d.id!=kBad && !seen[d.id])
            warn_code(r, *d.form, "W2100", d.kind+" '"+name+"' is not reachable from any top-level", "it will not be rendered");
    }
}

TypeId GraphReader::resolve_type(ReadResult& r, const node_ptr& n){
    if(!n) return kBad;
    if(is_symbol(*n) || is_string(*n)){
        std::string name = text_of(n);
        auto it = primitive_names().find(name);
        if(it!=primitive_names().end()) return graph_.get_primitive(it->second);
        return resolve_named(r, name, *n);
    }
    auto* l = as_list(*n);
    std::string head = head_of(*n);
    if(!l || head.empty()){ error_code(r, *n, "E2021", "malformed type form: "+to_string(n), "use a type name or (array T) (map T) (nullable T) (union T...)"); return kBad; }
    const auto& args = l->elems;
    if(head=="array" || head=="map" || head=="nullable"){
        if(args.size()!=2){ error_code(r, *n, "E2021", "("+head+" ...) takes exactly one type", "write ("+head+" T)"); return kBad; }
        TypeId inner = resolve_type(r, args[1]);
        if(inner==kBad) return kBad;
        if(head=="array") return graph_.get_array(inner);
        if(head=="map") return graph_.get_map(inner);
        return graph_.add_nullable(inner);
    }
    if(head=="union"){
        std::vector<node_ptr> members(args.begin()+1, args.end());
        return make_union(r, *n, std::string(), members);
    }
    error_code(r, *n, "E2021", "unknown type constructor '"+head+"'", "expected array, map, nullable or union");
    return kBad;
}

TypeId GraphReader::resolve_named(ReadResult& r, const std::string& name, const node& at){
    auto it = decls_.find(name);
    if(it==decls_.end()){
        ErrorReporter rep{&r.errors,&r.warnings};
        auto err = rep.make_error("E2020", "unknown type '"+name+"'", "declare it under :types or use a primitive", line(at), col(at));
        append_suggestions(err, fuzzy_candidates(name));
        rep.emit_error(err); r.success=false;
        return kBad;
    }
    Decl& d = it->second;
    if(d.kind=="union" && !d.built){
        if(d.building){ error_code(r, at, "E2023", "union '"+name+"' contains itself", "break the cycle through a class"); return kBad; }
        build_union(r, d, name);
    }
    // an enum referenced before its build pass is impossible: enums are built first
    return d.id;
}

TypeId GraphReader::make_union(ReadResult& r, const node& at, std::string hint, const std::vector<node_ptr>& member_nodes){
    std::vector<TypeId> members;
    bool bad=false;
    for(auto& m : member_nodes){
        TypeId t = resolve_type(r, m);
        if(t==kBad){ bad=true; continue; }
        if(std::find(members.begin(), members.end(), t)==members.end()) members.push_back(t);
    }
    if(bad) return kBad;
    if(members.size()<2){
        error_code(r, at, "E2022", "union has fewer than two distinct members", "use the member type directly");
        return kBad;
    }
    if(hint.empty()){
        for(size_t i=0;i<members.size(); ++i){ if(i) hint += "_or_"; hint += member_hint(members[i]); }
    }
    return graph_.add_union(std::move(hint), members);
}

std::string GraphReader::member_hint(TypeId id) const {
    struct V {
        const GraphReader& gr;
        std::string operator()(const NoneType&) const { return "none"; }
        std::string operator()(const AnyType&) const { return "any"; }
        std::string operator()(const NullType&) const { return "null"; }
        std::string operator()(const BoolType&) const { return "bool"; }
        std::string operator()(const IntegerType&) const { return "integer"; }
        std::string operator()(const DoubleType&) const { return "double"; }
        std::string operator()(const StringType&) const { return "string"; }
        std::string operator()(const DateType&) const { return "date"; }
        std::string operator()(const TimeType&) const { return "time"; }
        std::string operator()(const DateTimeType&) const { return "date_time"; }
        std::string operator()(const ArrayType& a) const { return gr.member_hint(a.items)+"_array"; }
        std::string operator()(const MapType& m) const { return gr.member_hint(m.values)+"_map"; }
        std::string operator()(const ClassType& c) const { return c.name_hint; }
        std::string operator()(const EnumType& e) const { return e.name_hint; }
        std::string operator()(const UnionType& u) const { return u.name_hint; }
    };
    return std::visit(V{*this}, graph_.at(id).data);
}

int GraphReader::edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    std::vector<int> prev(m+1), cur(m+1);
    for(size_t j=0;j<=m;++j) prev[j]=(int)j;
    for(size_t i=1;i<=n;++i){
        cur[0]=(int)i;
        for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; cur[j]=std::min({prev[j]+1, cur[j-1]+1, prev[j-1]+c}); }
        std::swap(prev,cur);
    }
    return prev[m];
}

std::vector<std::string> GraphReader::fuzzy_candidates(const std::string& target, int maxDist) const {
    std::vector<std::string> pool(decl_order_);
    for(auto& kv : primitive_names()) pool.push_back(kv.first);
    std::sort(pool.begin()+decl_order_.size(), pool.end());
    std::vector<std::string> out;
    for(auto& c : pool){ if(edit_distance(target,c)<=maxDist) out.push_back(c); }
    if(out.size()>5) out.resize(5);
    return out;
}

void GraphReader::append_suggestions(GraphError& err, const std::vector<std::string>& suggs){
    if(suggs.empty()) return;
    // PYEMIT_SUGGEST=0 disables suggestions
    if(const char* env = std::getenv("PYEMIT_SUGGEST")){ if(env[0]=='0') return; }
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+=suggs[i]; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    err.notes.push_back(GraphNote{msg,err.line,err.col});
}

ReadResult read_graph(std::string_view src, TypeGraph& graph){
    auto ast = parse(src);
    GraphReader reader(graph);
    return reader.read_module(ast);
}

} // namespace pyemit
