#include "kiln/diagnostics.hpp"

#include <cstdio>

namespace kiln {

char CompileError::ID = 0;

std::string format(const Diagnostic& d) {
    std::string out;
    if (!d.file.empty()) {
        out += d.file;
        if (d.line >= 0) out += ':' + std::to_string(d.line);
        out += ": ";
    }
    out += d.message;
    return out;
}

std::string format(const Frame& f) {
    std::string out = f.module + '.' + f.function;
    if (f.arity >= 0) out += '/' + std::to_string(f.arity);
    if (!f.file.empty()) out += " (" + f.file + ':' + std::to_string(f.line) + ')';
    return out;
}

void CompileError::log(llvm::raw_ostream& os) const {
    os << diag_.code << ": " << format(diag_);
    if (!diag_.hint.empty()) os << " (" << diag_.hint << ")";
}

llvm::Error make_error(std::string code, std::string message, std::string file, int line) {
    Diagnostic d;
    d.code = std::move(code);
    d.message = std::move(message);
    d.file = std::move(file);
    d.line = line;
    return make_error(std::move(d));
}

Diagnostic to_diagnostic(llvm::Error err) {
    Diagnostic out;
    llvm::handleAllErrors(std::move(err),
        [&](const CompileError& e) { out = e.diagnostic(); },
        [&](const llvm::ErrorInfoBase& e) {
            out.code = codes::RuntimeError;
            out.message = e.message();
        });
    return out;
}

void DiagnosticSink::report(Diagnostic d) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(mu_);
        items_.push_back(d);
        listener = listener_;
    }
    if (listener) listener(d);
    else std::fprintf(stderr, "[warn] %s %s\n", d.code.c_str(), format(d).c_str());
}

void DiagnosticSink::warn(std::string code, std::string message, std::string file, int line) {
    Diagnostic d;
    d.code = std::move(code);
    d.message = std::move(message);
    d.file = std::move(file);
    d.line = line;
    report(std::move(d));
}

std::vector<Diagnostic> DiagnosticSink::warnings() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_;
}

size_t DiagnosticSink::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
}

} // namespace kiln
