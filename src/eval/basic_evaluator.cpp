#include "kiln/eval/basic_evaluator.hpp"
#include "kiln/compiler.hpp"
#include "kiln/diagnostics.hpp"

#include <cctype>

namespace kiln::eval {

namespace {

Frame internal_frame(const Env& env) {
    return Frame{InternalFrameModule, "evaluate", -1, env.file, env.line};
}

llvm::Error raise_error(const std::string& code, const std::string& message, std::vector<Frame> frames, const Env& env) {
    Diagnostic d;
    d.code = code;
    d.message = message;
    d.file = env.file;
    d.line = env.line;
    d.stack = std::move(frames);
    d.stack.push_back(internal_frame(env));
    return make_error(std::move(d));
}

llvm::Error malformed(const std::string& what, const node_ptr& form, const Env& env) {
    return raise_error(codes::RuntimeError, "malformed " + what + ": " + to_string(form), {}, env);
}

bool is_alias(const std::string& name) {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0]));
}

llvm::Expected<Compiler*> session(const Env& env, const std::string& what) {
    if (!env.compiler)
        return raise_error(codes::RuntimeError, what + " needs a compiler session", {}, env);
    return env.compiler;
}

std::optional<DefKind> def_kind(const std::string& head) {
    if (head == "def") return DefKind::Def;
    if (head == "defp") return DefKind::Defp;
    if (head == "defmacro") return DefKind::Defmacro;
    if (head == "defmacrop") return DefKind::Defmacrop;
    return std::nullopt;
}

} // namespace

llvm::Expected<EvalResult> BasicEvaluator::evaluate(const node_ptr& form, const Bindings& bindings, const Env& env) {
    State st{bindings, env};
    auto v = eval(form, st);
    if (!v) return v.takeError();
    return EvalResult{*v, std::move(st.bindings), std::move(st.env)};
}

llvm::Expected<node_ptr> BasicEvaluator::eval(const node_ptr& form, State& st) {
    if (!form) return n_nil();
    if (int l = line(form); l >= 0) st.env.line = l;
    if (is_list(*form)) return eval_list(form, st);
    if (auto* s = as_symbol(*form)) {
        if (auto v = lookup(st.bindings, s->name)) return v;
        if (is_alias(s->name)) return form;
        return raise_error(codes::RuntimeError, "undefined variable " + s->name, {}, st.env);
    }
    if (is_vector(*form)) {
        auto out = node_vec();
        for (auto& e : elements(*form)) {
            auto v = eval(e, st);
            if (!v) return v.takeError();
            out << *v;
        }
        return out;
    }
    return form;
}

llvm::Expected<node_ptr> BasicEvaluator::eval_body(const std::vector<node_ptr>& forms, size_t from, State& st) {
    node_ptr last = n_nil();
    for (size_t i = from; i < forms.size(); ++i) {
        auto v = eval(forms[i], st);
        if (!v) return v.takeError();
        last = *v;
    }
    return last;
}

llvm::Expected<node_ptr> BasicEvaluator::eval_list(const node_ptr& form, State& st) {
    auto& el = elements(*form);
    if (el.empty()) return form;
    const std::string head = head_name(*form);
    if (head.empty()) return malformed("call", form, st.env);

    if (head == "do") return eval_body(el, 1, st);
    if (head == "quote") return el.size() == 2 ? el[1] : n_nil();
    if (head == "let") return eval_let(form, st);
    if (def_kind(head)) return eval_def(head, form, st);
    if (head == "@") return eval_attribute(form, st);
    if (head == "register-attribute") return eval_register_attribute(form, st);
    if (head == "delete-attribute") {
        auto c = session(st.env, head);
        if (!c) return c.takeError();
        if (el.size() != 2) return malformed(head, form, st.env);
        if (auto err = (*c)->delete_attribute(st.env, name_of(el[1]))) return std::move(err);
        return n_nil();
    }
    if (head == "defmodule") return eval_defmodule(form, st);
    if (head == "call") return eval_call(form, st);
    if (head == "compiler-modules") {
        auto out = node_vec();
        for (auto& m : Compiler::compiler_modules(st.env)) out << n_sym(m);
        return out;
    }
    if (head == "raise") {
        auto msg = el.size() > 1 ? eval(el[1], st) : llvm::Expected<node_ptr>(n_str("runtime error"));
        if (!msg) return msg.takeError();
        std::string text = is_string(**msg) ? std::get<std::string>((*msg)->data) : to_string(*msg);
        const std::string fn = st.env.function.empty() ? "__module__" : st.env.function;
        return raise_error(codes::RuntimeError, text, {Frame{st.env.module, fn, 0, st.env.file, st.env.line}}, st.env);
    }

    // Local call into the module being defined.
    int arity = static_cast<int>(el.size()) - 1;
    std::string target = st.env.module.empty() ? std::string("Kiln.Local") : st.env.module;
    return raise_error(codes::UndefinedFunction,
        "function " + target + "." + head + "/" + std::to_string(arity) + " is undefined",
        {Frame{target, head, arity, st.env.file, st.env.line}}, st.env);
}

llvm::Expected<node_ptr> BasicEvaluator::eval_let(const node_ptr& form, State& st) {
    auto& el = elements(*form);
    if (el.size() < 2 || !is_vector(*el[1]) || elements(*el[1]).size() % 2 != 0)
        return malformed("let", form, st.env);
    const size_t mark = st.bindings.size();
    auto& pairs = elements(*el[1]);
    for (size_t i = 0; i < pairs.size(); i += 2) {
        if (!is_symbol(*pairs[i])) return malformed("let", form, st.env);
        auto v = eval(pairs[i + 1], st);
        if (!v) return v.takeError();
        bind(st.bindings, name_of(pairs[i]), *v);
    }
    auto result = eval_body(el, 2, st);
    st.bindings.resize(mark);
    return result;
}

llvm::Expected<node_ptr> BasicEvaluator::eval_def(const std::string& head, const node_ptr& form, State& st) {
    auto& el = elements(*form);
    // (def name [params] body...)
    if (el.size() < 3 || !is_symbol(*el[1]) || !is_vector(*el[2])) return malformed(head, form, st.env);
    auto c = session(st.env, head);
    if (!c) return c.takeError();
    auto clause = node_list();
    for (size_t i = 2; i < el.size(); ++i) clause << el[i];
    NameArity id{name_of(el[1]), static_cast<int>(elements(*el[2]).size())};
    if (auto err = (*c)->define(st.env, *def_kind(head), id, clause)) return std::move(err);
    return node_vec({n_sym(id.name), n_i64(id.arity)});
}

llvm::Expected<node_ptr> BasicEvaluator::eval_attribute(const node_ptr& form, State& st) {
    auto& el = elements(*form);
    if (el.size() < 2 || el.size() > 3 || (!is_keyword(*el[1]) && !is_symbol(*el[1])))
        return malformed("attribute", form, st.env);
    auto c = session(st.env, "@");
    if (!c) return c.takeError();
    const std::string key = name_of(el[1]);
    if (el.size() == 2) {
        auto v = (*c)->get_attribute(st.env, key);
        return v ? *v : n_nil();
    }
    if (auto err = (*c)->put_attribute(st.env, key, el[2])) return std::move(err);
    return el[2];
}

llvm::Expected<node_ptr> BasicEvaluator::eval_register_attribute(const node_ptr& form, State& st) {
    auto& el = elements(*form);
    // (register-attribute :key [:accumulate bool] [:persist bool])
    if (el.size() < 2 || el.size() % 2 != 0) return malformed("register-attribute", form, st.env);
    bool accumulate = false, persist = false;
    for (size_t i = 2; i + 1 < el.size(); i += 2) {
        const std::string opt = name_of(el[i]);
        if (!std::holds_alternative<bool>(el[i + 1]->data)) return malformed("register-attribute", form, st.env);
        bool flag = std::get<bool>(el[i + 1]->data);
        if (opt == "accumulate") accumulate = flag;
        else if (opt == "persist") persist = flag;
        else return malformed("register-attribute", form, st.env);
    }
    auto c = session(st.env, "register-attribute");
    if (!c) return c.takeError();
    if (auto err = (*c)->register_attribute(st.env, name_of(el[1]), accumulate, persist)) return std::move(err);
    return n_nil();
}

llvm::Expected<node_ptr> BasicEvaluator::eval_defmodule(const node_ptr& form, State& st) {
    auto& el = elements(*form);
    if (el.size() < 2 || !is_symbol(*el[1])) return malformed("defmodule", form, st.env);
    auto c = session(st.env, "defmodule");
    if (!c) return c.takeError();
    auto body = node_list({n_sym("do")});
    for (size_t i = 2; i < el.size(); ++i) body << el[i];
    auto compiled = (*c)->compile_module(name_of(el[1]), body, st.bindings, st.env);
    if (!compiled) return compiled.takeError();
    return node_vec({n_kw("module"), n_sym(compiled->name), compiled->value});
}

llvm::Expected<node_ptr> BasicEvaluator::eval_call(const node_ptr& form, State& st) {
    auto& el = elements(*form);
    // (call Module function args...)
    if (el.size() < 3 || !is_symbol(*el[1]) || !is_symbol(*el[2])) return malformed("call", form, st.env);
    Call call;
    call.module = name_of(el[1]);
    call.function = name_of(el[2]);
    for (size_t i = 3; i < el.size(); ++i) {
        auto v = eval(el[i], st);
        if (!v) return v.takeError();
        call.args.push_back(*v);
    }
    auto d = dispatcher_.dispatch(call, st.env);
    if (!d) {
        Diagnostic diag = to_diagnostic(d.takeError());
        diag.stack.push_back(internal_frame(st.env));
        return make_error(std::move(diag));
    }
    if (d->applied) {
        st.env = std::move(*d->applied);
        return n_nil();
    }
    return d->expanded ? eval(d->expanded, st) : n_nil();
}

} // namespace kiln::eval
