// Builds a small graph through the TypeGraph API and prints the Python module.
#include <iostream>
#include "pyemit/python_renderer.hpp"

using namespace pyemit;

int main(){
    TypeGraph g;
    TypeId color = g.add_enum("color", {"red", "green", "dark blue"});
    TypeId point = g.add_class("point", {{"x", g.get_integer()}, {"y", g.get_integer()}});
    TypeId shape = g.add_class("shape");
    g.set_class_properties(shape, {
        {"shape id", g.get_string()},
        {"fill color", g.add_nullable(color)},
        {"vertices", g.get_array(point)},
        {"created at", g.get_date_time()},
        {"metadata", g.get_map(g.add_union("", {g.get_string(), g.get_double(), g.get_bool()})), true},
        {"children", g.get_array(shape)},
    });
    g.add_top_level("shapes", g.get_array(shape));

    RenderOptions opts;
    opts.leading_comments = {"Example output of pyemit"};
    try {
        std::cout << render(g, opts).to_source();
    } catch(const render_error& e){
        std::cerr << "render error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
