#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kiln/hooks.hpp"
#include "test_support.hpp"

using namespace kiln;
using kiln::test::Session;
using kiln::test::contains;
using kiln::test::error_of;
using kiln::test::ok;

namespace {

// A hook function that records "<label>:<name>/<arity>" for each definition it sees.
eval::BasicDispatcher::FunctionFn recorder(std::vector<std::string>& log, std::string label){
    return [&log, label](const Call& call, const Env& env) -> llvm::Expected<Env> {
        log.push_back(label + ":" + name_of(call.args[1]) + "/" + to_string(call.args[2]));
        return env;
    };
}

} // namespace

TEST(Hooks, ParseTargets){
    auto bare = parse_hook_target("before-compile", n_sym("Gen"), "__before_compile__");
    ASSERT_TRUE(static_cast<bool>(bare));
    EXPECT_EQ(bare->module, "Gen");
    EXPECT_EQ(bare->function, "__before_compile__");

    auto pair = parse_hook_target("before-compile", node_vec({n_sym("Gen"), n_sym("prepare")}), "__before_compile__");
    ASSERT_TRUE(static_cast<bool>(pair));
    EXPECT_EQ(pair->function, "prepare");

    auto bad = parse_hook_target("before-compile", n_i64(3), "__before_compile__");
    ASSERT_FALSE(static_cast<bool>(bad));
    EXPECT_EQ(to_diagnostic(bad.takeError()).code, codes::InvalidAttribute);
}

TEST(Hooks, OnDefinitionRunsNewestFirstOncePerDefinition){
    Session s;
    std::vector<std::string> log;
    s.dispatcher.add_function("Trace", "first", recorder(log, "first"));
    s.dispatcher.add_function("Trace", "second", recorder(log, "second"));
    ASSERT_TRUE(ok(s.run(
        "(defmodule Traced\n"
        "  (@ :on-definition [Trace first])\n"
        "  (@ :on-definition [Trace second])\n"
        "  (def f [x] x)\n"
        "  (def f [y] y)\n"
        "  (defp g [] 1))")));
    std::vector<std::string> expected = {"second:f/1", "first:f/1", "second:g/0", "first:g/0"};
    EXPECT_EQ(log, expected);
}

TEST(Hooks, DefinitionsAddedByOnDefinitionDoNotRetrigger){
    Session s;
    int calls = 0;
    s.dispatcher.add_function("Gen", "__on_definition__", [&](const Call& call, const Env& env) -> llvm::Expected<Env> {
        ++calls;
        auto companion = NameArity{name_of(call.args[1]) + "_checked", 0};
        if (auto err = env.compiler->define(env, DefKind::Def, companion, node_list({node_vec(), n_nil()})))
            return std::move(err);
        return env;
    });
    ASSERT_TRUE(ok(s.run("(defmodule Companion (@ :on-definition Gen) (def run [] 1))")));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(s.code_server.exports_function("Companion", NameArity{"run_checked", 0}));
}

TEST(Hooks, BeforeCompileExpansionCanDefine){
    Session s;
    s.dispatcher.add_expander("Gen", "__before_compile__", [](const Call&, const Env&) -> std::optional<node_ptr> {
        return kiln::read("(def generated [] 42)");
    });
    ASSERT_TRUE(ok(s.run("(defmodule UsesGen (@ :before-compile Gen) (def own [] 1))")));
    EXPECT_EQ(s.info("UsesGen", InfoKind::Functions), "[[generated 0] [own 0]]");
}

TEST(Hooks, BeforeCompileRunsNewestFirstAndThreadsEnv){
    Session s;
    std::vector<std::string> seen;
    s.dispatcher.add_function("A", "__before_compile__", [&](const Call&, const Env& env) -> llvm::Expected<Env> {
        seen.push_back("A@" + std::to_string(env.line));
        return env;
    });
    s.dispatcher.add_function("B", "__before_compile__", [&](const Call&, const Env& env) -> llvm::Expected<Env> {
        seen.push_back("B@" + std::to_string(env.line));
        Env next = env;
        next.line = 99;
        return next;
    });
    ASSERT_TRUE(ok(s.run("(defmodule Threaded (@ :before-compile A) (@ :before-compile B))")));
    std::vector<std::string> expected = {"B@1", "A@99"};
    EXPECT_EQ(seen, expected);
}

TEST(Hooks, AfterCompileSeesArtifactButCannotDefine){
    Session s;
    std::string seen_module;
    s.dispatcher.add_function("Watch", "__after_compile__", [&](const Call& call, const Env& env) -> llvm::Expected<Env> {
        EXPECT_EQ(call.arity(), 2);
        if (call.artifact) {
            auto name = call.artifact->find(chunk_ids::Module);
            seen_module = name ? *name : std::string();
        }
        return env;
    });
    ASSERT_TRUE(ok(s.run("(defmodule Watched (@ :after-compile Watch) (def f [] 1))")));
    EXPECT_EQ(seen_module, "Watched");

    s.dispatcher.add_function("Late", "__after_compile__", [](const Call&, const Env& env) -> llvm::Expected<Env> {
        if (auto err = env.compiler->define(env, DefKind::Def, NameArity{"late", 0}, node_list()))
            return std::move(err);
        return env;
    });
    auto d = error_of(s.run("(defmodule TooLate (@ :after-compile Late) (def f [] 1))"));
    EXPECT_EQ(d.code, codes::InvalidPhase);
    EXPECT_TRUE(contains(d.message, "after-hooks")) << d.message;
    EXPECT_FALSE(s.code_server.is_loaded("TooLate"));
    EXPECT_EQ(s.compiler.binaries().size(), 1u);
    EXPECT_EQ(s.registry.size(), 0u);
    // the failed compile released the name
    EXPECT_TRUE(ok(s.run("(defmodule TooLate (def f [] 1))")));
}

TEST(Hooks, AttributesAreReadableWhileHooksRun){
    Session s;
    std::optional<node_ptr> seen;
    s.dispatcher.add_function("Peek", "__before_compile__", [&](const Call&, const Env& env) -> llvm::Expected<Env> {
        seen = s.registry.get_attribute(env.module, "vsn");
        return env;
    });
    ASSERT_TRUE(ok(s.run("(defmodule Peeked (@ :vsn 7) (@ :before-compile Peek))")));
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(to_string(*seen), "7");
    EXPECT_FALSE(s.registry.get_attribute("Peeked", "vsn").has_value());
}

TEST(Hooks, HookErrorsArePrunedAtTheEvaluator){
    Session s;
    s.dispatcher.add_expander("Bad", "__before_compile__", [](const Call&, const Env&) -> std::optional<node_ptr> {
        return kiln::read("(raise \"boom\")");
    });
    auto d = error_of(s.run("(defmodule Victim\n  (@ :before-compile Bad))", "victim.kiln"));
    EXPECT_EQ(d.code, codes::RuntimeError);
    EXPECT_EQ(d.message, "boom");
    ASSERT_FALSE(d.stack.empty());
    for (auto& f : d.stack) EXPECT_FALSE(is_internal(f)) << format(f);
    const Frame& hook = d.stack.back();
    EXPECT_EQ(hook.module, "Bad");
    EXPECT_EQ(hook.function, "__before_compile__");
    EXPECT_EQ(hook.arity, 1);
    EXPECT_EQ(hook.file, "victim.kiln");
}

TEST(Hooks, HookCallingTheModuleReportsNotAvailable){
    Session s;
    s.dispatcher.add_expander("Eager", "__before_compile__", [](const Call&, const Env&) -> std::optional<node_ptr> {
        return kiln::read("(helper 1)");
    });
    auto d = error_of(s.run("(defmodule Pending (@ :before-compile Eager) (def helper [x] x))"));
    EXPECT_EQ(d.code, codes::FunctionNotAvailable);
    ASSERT_TRUE(d.origin.has_value());
    EXPECT_EQ(d.origin->function, "helper");
    EXPECT_EQ(d.origin->arity, 1);
    EXPECT_EQ(d.stack.back().module, "Eager");
}

TEST(Hooks, MissingHookModuleIsUndefined){
    Session s;
    auto d = error_of(s.run("(defmodule Orphan (@ :before-compile Nowhere))"));
    EXPECT_EQ(d.code, codes::UndefinedFunction);
    EXPECT_TRUE(contains(d.message, "Nowhere.__before_compile__/1")) << d.message;
}

TEST(Hooks, MalformedTargetFails){
    Session s;
    auto d = error_of(s.run("(defmodule Malformed (@ :before-compile 12))"));
    EXPECT_EQ(d.code, codes::InvalidAttribute);
}

TEST(Hooks, LoadedModuleExportsResolveHooksAsNoOps){
    Session s;
    ASSERT_TRUE(ok(s.run("(defmodule Provider (def __before_compile__ [env] (raise \"not run\")))")));
    // The hook resolves against Provider's exports; its body is never executed.
    ASSERT_TRUE(ok(s.run("(defmodule Consumer (@ :before-compile Provider) (def f [] 1))")));
    EXPECT_TRUE(s.code_server.is_loaded("Consumer"));
    EXPECT_EQ(s.info("Consumer", InfoKind::Functions), "[[f 0]]");
}
