// Debug tracing: tagged lines on llvm::errs() when PYEMIT_DEBUG is truthy
#pragma once
#include <cstdlib>

#include <llvm/Support/raw_ostream.h>

namespace pyemit
{

    inline bool debug_enabled()
    {
        const char *v = std::getenv("PYEMIT_DEBUG");
        return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
    }

    // Usage: if (debug_enabled()) debug_log("order") << "...\n";
    inline llvm::raw_ostream &debug_log(const char *tag)
    {
        return llvm::errs() << "[pyemit][" << tag << "] ";
    }

} // namespace pyemit
