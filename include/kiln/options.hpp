#pragma once
#include <cstdio>
#include <string>

namespace kiln {

struct CompilerOptions {
    bool docs = true;                    // build the Docs chunk and check for dangling @doc/@typedoc
    bool ignore_module_conflict = false; // skip the "module already loaded" warning
    bool internal = false;               // bootstrap modules: no specs/types sections
    bool diag_json = false;
    std::string target_triple;           // empty = host default
};

// Feature flags sourced from environment ("1", "t"/"T", "y"/"Y" enable).
bool env_flag_enabled(const char* name);

// Detect compiler options from process env vars:
//   KILN_DOCS=0 disables docs, KILN_IGNORE_MODULE_CONFLICT, KILN_INTERNAL,
//   KILN_DIAG_JSON, KILN_TARGET_TRIPLE.
CompilerOptions detect_options();

// KILN_DEBUG=1 enables [dbg] tracing on stderr.
bool debug_enabled();

// Install LLVM's fatal error handler and pretty stack traces when
// KILN_INSTALL_FATAL_HANDLER=1. Safe to call repeatedly.
bool install_fatal_handler_if_requested();

} // namespace kiln
