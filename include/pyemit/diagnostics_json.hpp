// diagnostics_json.hpp - JSON serialization for graph reader diagnostics
#pragma once
#include "pyemit/graph_reader.hpp"
#include <string>
#include <llvm/Support/raw_ostream.h>

namespace pyemit {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const ReadResult& r);

// If PYEMIT_DIAG_JSON=1 in the environment, print diagnostics JSON to os (stderr by default).
void maybe_print_json(const ReadResult& r, llvm::raw_ostream& os = llvm::errs());

} // namespace pyemit
