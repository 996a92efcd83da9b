// Structured compile diagnostics, shared by every stage of the module pipeline.
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace kiln {

namespace codes {
// Fatal
inline constexpr const char* ModuleReserved = "E2001";
inline constexpr const char* ModuleAlreadyDefining = "E2002";
inline constexpr const char* InvalidModuleName = "E2003";
inline constexpr const char* InvalidExternalResource = "E2004";
inline constexpr const char* InternalSymbolOverridden = "E2005";
inline constexpr const char* FunctionNotAvailable = "E2006";
inline constexpr const char* BuildError = "E2007";
inline constexpr const char* DefinitionKindMismatch = "E2008";
inline constexpr const char* InvalidAttribute = "E2009";
inline constexpr const char* InvalidPhase = "E2010";
inline constexpr const char* UndefinedFunction = "E2011";
inline constexpr const char* RuntimeError = "E2012";
inline constexpr const char* LoadError = "E2013";
// Warnings
inline constexpr const char* ModuleRedefinition = "W2101";
inline constexpr const char* UnusedDocAttribute = "W2106";
} // namespace codes

// One entry of an evaluation stack. arity is -1 when unknown.
struct Frame {
    std::string module;
    std::string function;
    int arity = -1;
    std::string file;
    int line = -1;
};

// Frames of the evaluator itself are named under "kiln."; stack pruning cuts at the first one.
inline bool is_internal(const Frame& f) { return f.module.compare(0, 5, "kiln.") == 0; }

struct Note { std::string message; int line = -1; };

struct Diagnostic {
    std::string code;
    std::string message;
    std::string hint;
    std::string file;
    int line = -1;
    std::vector<Note> notes;
    std::vector<Frame> stack;      // innermost first
    std::optional<Frame> origin;   // set when a lower-level error was rewritten into this one
    bool is_warning() const { return !code.empty() && code[0] == 'W'; }
};

// "file:line: message" (file and line omitted when unknown).
std::string format(const Diagnostic& d);
std::string format(const Frame& f);

// llvm::Error payload carrying one Diagnostic.
class CompileError : public llvm::ErrorInfo<CompileError> {
public:
    static char ID;
    explicit CompileError(Diagnostic d) : diag_(std::move(d)) {}
    const Diagnostic& diagnostic() const { return diag_; }
    Diagnostic& diagnostic() { return diag_; }
    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override { return llvm::inconvertibleErrorCode(); }
private:
    Diagnostic diag_;
};

inline llvm::Error make_error(Diagnostic d) { return llvm::make_error<CompileError>(std::move(d)); }
llvm::Error make_error(std::string code, std::string message, std::string file = {}, int line = -1);

// Collapse any llvm::Error into a Diagnostic (foreign errors become code E2012).
Diagnostic to_diagnostic(llvm::Error err);

// Thread-safe collector for warnings produced while compiling.
class DiagnosticSink {
public:
    using Listener = std::function<void(const Diagnostic&)>;
    void report(Diagnostic d);
    void warn(std::string code, std::string message, std::string file, int line);
    std::vector<Diagnostic> warnings() const;
    size_t size() const;
    // Optional observer (the driver prints, tests may record).
    void on_report(Listener l) { std::lock_guard<std::mutex> lock(mu_); listener_ = std::move(l); }
private:
    mutable std::mutex mu_;
    std::vector<Diagnostic> items_;
    Listener listener_;
};

} // namespace kiln
