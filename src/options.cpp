#include "pyemit/options.hpp"
#include "pyemit/log.hpp"
#include <cstdlib>

namespace pyemit
{

std::optional<bool> env_flag(const char *name)
{
    const char *v = std::getenv(name);
    if (!v || !*v)
        return std::nullopt;
    return v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y';
}

RenderOptions detect_options(RenderOptions base)
{
    if (auto v = env_flag("PYEMIT_DECLARE_UNIONS"))
        base.declare_unions = *v;
    if (auto v = env_flag("PYEMIT_ASCII_IDENTIFIERS"))
        base.ascii_identifiers = *v;
    if (debug_enabled())
        debug_log("options") << "declare-unions=" << (base.declare_unions ? "true" : "false")
                                << " ascii-identifiers=" << (base.ascii_identifiers ? "true" : "false") << "\n";
    return base;
}

bool apply_option(RenderOptions &opts, llvm::StringRef name, bool value)
{
    if (name == "declare-unions")
        opts.declare_unions = value;
    else if (name == "ascii-identifiers")
        opts.ascii_identifiers = value;
    else
        return false;
    return true;
}

const TargetLanguage &python_target()
{
    static const TargetLanguage lang{
        "Python",
        {"python", "py"},
        "py",
        {{"declare-unions", "Declare unions as named types", false},
         {"ascii-identifiers", "Restrict identifiers to ASCII", false}}};
    return lang;
}

} // namespace pyemit
