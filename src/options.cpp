#include "kiln/options.hpp"

#include <cstdio>
#include <cstdlib>

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

namespace kiln {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

CompilerOptions detect_options(){
    CompilerOptions o;
    if(const char* d = std::getenv("KILN_DOCS")) o.docs = !(d[0] == '0' || d[0] == 'n' || d[0] == 'N' || d[0] == 'f' || d[0] == 'F');
    o.ignore_module_conflict = env_flag_enabled("KILN_IGNORE_MODULE_CONFLICT");
    o.internal = env_flag_enabled("KILN_INTERNAL");
    o.diag_json = env_flag_enabled("KILN_DIAG_JSON");
    if(const char* t = std::getenv("KILN_TARGET_TRIPLE")) o.target_triple = t;
    return o;
}

bool debug_enabled(){
    static const bool enabled = env_flag_enabled("KILN_DEBUG");
    return enabled;
}

// LLVM fatal error handler (signature matches install_fatal_error_handler requirement)
static void kilnFatalHandler(void *userData, const char *reason, bool genCrashDiag) {
    (void)userData; (void)genCrashDiag;
    fprintf(stderr, "[fatal][llvm] %s\n", reason ? reason : "<null reason>");
    llvm::sys::PrintStackTrace(llvm::errs());
}

bool install_fatal_handler_if_requested(){
    static const bool installed = []{
        if(!env_flag_enabled("KILN_INSTALL_FATAL_HANDLER")) return false;
        llvm::install_fatal_error_handler(kilnFatalHandler);
        llvm::EnablePrettyStackTrace();
        fprintf(stderr, "[diag] Installed LLVM fatal error handler (KILN_INSTALL_FATAL_HANDLER=1)\n");
        return true;
    }();
    return installed;
}

} // namespace kiln
