#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "kiln/collaborators.hpp"
#include "kiln/docs.hpp"
#include "kiln/registry.hpp"

using namespace kiln;

namespace {

ModuleHandle open_ok(ModuleRegistry& r, const std::string& name, int line = 1){
    auto h = r.open(name, Location{"reg.kiln", line});
    if(!h){
        ADD_FAILURE() << "open " << name << ": " << format(to_diagnostic(h.takeError()));
        return ModuleHandle{};
    }
    return std::move(*h);
}

} // namespace

TEST(ModuleRegistry, OpenWhileOpenFailsAndKeepsTheFirstEntry){
    ModuleRegistry r;
    ModuleHandle first = open_ok(r, "Busy", 3);
    ASSERT_TRUE(first.is_open());
    {
        std::lock_guard<std::recursive_mutex> lock(first.entry().mutex());
        llvm::cantFail(first.entry().attributes().write("vsn", n_i64(1)));
    }

    auto second = r.open("Busy", Location{"other.kiln", 9});
    ASSERT_FALSE(static_cast<bool>(second));
    Diagnostic d = to_diagnostic(second.takeError());
    EXPECT_EQ(d.code, codes::ModuleAlreadyDefining);
    EXPECT_EQ(d.message, "cannot define module Busy because it is currently being defined in reg.kiln:3");
    EXPECT_EQ(d.file, "other.kiln");
    EXPECT_EQ(d.line, 9);

    EXPECT_TRUE(r.is_open("Busy"));
    auto v = r.get_attribute("Busy", "vsn");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(to_string(*v), "1");
}

TEST(ModuleRegistry, ReservedNamesCannotOpen){
    ModuleRegistry r;
    for(auto& name : ModuleRegistry::reserved_names()){
        auto h = r.open(name, Location{"reg.kiln", 1});
        ASSERT_FALSE(static_cast<bool>(h)) << name;
        EXPECT_EQ(to_diagnostic(h.takeError()).code, codes::ModuleReserved);
    }
    EXPECT_TRUE(ModuleRegistry::is_reserved("Kiln"));
    EXPECT_FALSE(ModuleRegistry::is_reserved("Kiln.Module"));
    EXPECT_EQ(r.size(), 0u);
}

TEST(ModuleRegistry, CloseIsIdempotentAndReleasesTheName){
    ModuleRegistry r;
    ModuleHandle h = open_ok(r, "Once");
    auto entry = r.lookup("Once");
    ASSERT_TRUE(entry);
    EXPECT_EQ(h.phase(), Phase::Evaluating);

    h.close();
    h.close();
    EXPECT_FALSE(h.is_open());
    EXPECT_EQ(h.phase(), Phase::Closed);
    EXPECT_FALSE(r.is_open("Once"));
    EXPECT_TRUE(entry->closed());
    EXPECT_FALSE(h.get_attribute("vsn").has_value());

    ModuleHandle again = open_ok(r, "Once");
    EXPECT_TRUE(again.is_open());
    EXPECT_NE(r.lookup("Once"), entry);
}

TEST(ModuleRegistry, HandlesCloseOnDestructionAndMove){
    ModuleRegistry r;
    {
        ModuleHandle h = open_ok(r, "Scoped");
        ModuleHandle moved = std::move(h);
        EXPECT_FALSE(h.is_open());
        EXPECT_TRUE(moved.is_open());
        EXPECT_TRUE(r.is_open("Scoped"));
    }
    EXPECT_FALSE(r.is_open("Scoped"));

    ModuleHandle a = open_ok(r, "A");
    ModuleHandle b = open_ok(r, "B");
    a = std::move(b); // closes A
    EXPECT_FALSE(r.is_open("A"));
    EXPECT_TRUE(r.is_open("B"));
    EXPECT_EQ(a.name(), "B");
}

TEST(ModuleRegistry, LookupOutlivesClose){
    ModuleRegistry r;
    ModuleHandle h = open_ok(r, "Stale");
    auto entry = r.lookup("Stale");
    h.close();
    ASSERT_TRUE(entry);
    EXPECT_TRUE(entry->closed());
    EXPECT_EQ(entry->phase(), Phase::Closed);
    EXPECT_EQ(r.lookup("Stale"), nullptr);
    EXPECT_FALSE(r.get_attribute("Stale", "vsn").has_value());
}

TEST(ModuleRegistry, StaleEntryRejectsStoreAccess){
    ModuleRegistry r;
    ModuleHandle h = open_ok(r, "Stale");
    auto entry = r.lookup("Stale");
    ASSERT_TRUE(entry);
    EXPECT_FALSE(static_cast<bool>(entry->ensure_open("write")));
    h.close();

    llvm::Error err = entry->ensure_open("write");
    ASSERT_TRUE(static_cast<bool>(err));
    Diagnostic d = to_diagnostic(std::move(err));
    EXPECT_EQ(d.code, codes::InvalidPhase);
    EXPECT_NE(d.message.find("Stale"), std::string::npos) << d.message;

    // The doc hooks run with the entry lock held and must not reach the released stores.
    Call call{"Kiln.Module", "compile-doc", {n_kw("def"), n_sym("f"), n_i64(0), node_list()}};
    EXPECT_EQ(to_diagnostic(compile_doc_hook(*entry, call, Env{})).code, codes::InvalidPhase);
    call.function = "delete-doc";
    EXPECT_EQ(to_diagnostic(delete_doc_hook(*entry, call, Env{})).code, codes::InvalidPhase);
}

TEST(ModuleRegistry, ConcurrentOpensOfOneNameHaveOneWinner){
    ModuleRegistry r;
    constexpr int Threads = 8;
    std::atomic<int> winners{0}, losers{0};
    std::mutex mu;
    std::vector<ModuleHandle> held;
    std::vector<std::thread> pool;
    for(int i = 0; i < Threads; ++i){
        pool.emplace_back([&, i]{
            auto h = r.open("Contended", Location{"t" + std::to_string(i) + ".kiln", i});
            if(h){
                ++winners;
                std::lock_guard<std::mutex> lock(mu);
                held.push_back(std::move(*h));
            } else {
                llvm::consumeError(h.takeError());
                ++losers;
            }
        });
    }
    for(auto& t : pool) t.join();
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(losers.load(), Threads - 1);
    EXPECT_EQ(r.size(), 1u);
    held.clear();
    EXPECT_EQ(r.size(), 0u);
}

TEST(ModuleRegistry, ConcurrentOpensOfDistinctNames){
    ModuleRegistry r;
    constexpr int Threads = 8, PerThread = 50;
    std::atomic<int> failures{0};
    std::vector<std::thread> pool;
    for(int i = 0; i < Threads; ++i){
        pool.emplace_back([&, i]{
            for(int j = 0; j < PerThread; ++j){
                auto h = r.open("M" + std::to_string(i) + "_" + std::to_string(j), Location{"c.kiln", j});
                if(!h){ llvm::consumeError(h.takeError()); ++failures; continue; }
                std::lock_guard<std::recursive_mutex> lock(h->entry().mutex());
                if(auto err = h->entry().attributes().write("vsn", n_i64(j))){
                    llvm::consumeError(std::move(err));
                    ++failures;
                }
            }
        });
    }
    for(auto& t : pool) t.join();
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(r.size(), 0u);
}

TEST(ModuleRegistry, PhaseNames){
    EXPECT_STREQ(phase_name(Phase::Evaluating), "evaluating");
    EXPECT_STREQ(phase_name(Phase::AfterHooks), "after-hooks");
    EXPECT_STREQ(phase_name(Phase::Closed), "closed");
}
