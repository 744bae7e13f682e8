#include <ctxkeep/context/summary_engine.hpp>

#include "test_helpers.hpp"

#include <set>
#include <thread>

using namespace ctxkeep;

namespace {

class SummaryEngineTest : public ::testing::Test {
protected:
    SummaryEngineTest() : ids("id-"), engine(&sink, &clock, &ids) {}

    ManualClock clock;
    SequentialIdSource ids;
    test::RecordingSink sink;
    SummaryEngine engine;
};

ContextConfig limit_of(int64_t limit) {
    ContextConfig c;
    c.limit_tokens = limit;
    return c;
}

} // anonymous namespace

TEST_F(SummaryEngineTest, AddReturnsStoredItem) {
    clock.set(1700000001234LL);
    ItemMetadata meta;
    meta.set(MetaKey::INTENT, "open_file");
    meta.set(MetaKey::MODEL, "not-for-inputs");

    ContextItem item = engine.add_to_context("helper_ai", "Open my notes please",
                                             ItemKind::INPUT, Priority::HIGH, meta);
    EXPECT_EQ("id-1", item.id);
    EXPECT_EQ(1700000001234LL, item.created_at);
    EXPECT_EQ(5u, item.token_count);
    EXPECT_EQ("open_file", item.metadata.get(MetaKey::INTENT));
    EXPECT_FALSE(item.metadata.has(MetaKey::MODEL));

    ContextState state = engine.get_context_state("helper_ai");
    EXPECT_EQ(1u, state.item_count);
    EXPECT_EQ(5u, state.total_tokens);
    EXPECT_EQ(8000u, state.limit);
}

TEST_F(SummaryEngineTest, UnknownConsumerHasEmptyState) {
    ContextState state = engine.get_context_state("orchestration_ai");
    EXPECT_EQ(0u, state.item_count);
    EXPECT_EQ(0u, state.total_tokens);
    EXPECT_EQ(16000u, state.limit);
    EXPECT_EQ("", engine.get_optimized_context("orchestration_ai"));
    EXPECT_TRUE(engine.consumers().empty());
}

TEST_F(SummaryEngineTest, BuiltinLimits) {
    EXPECT_EQ(8000, builtin_limit_for("helper_ai", 1));
    EXPECT_EQ(8000, builtin_limit_for("accessibility_ai", 1));
    EXPECT_EQ(16000, builtin_limit_for("orchestration_ai", 1));
    EXPECT_EQ(4000, builtin_limit_for("guardian_ai", 1));
    EXPECT_EQ(1234, builtin_limit_for("custom", 1234));
}

TEST_F(SummaryEngineTest, AllHighPriorityStaysOverThreshold) {
    ASSERT_TRUE(engine.configure("helper_ai", limit_of(100)));
    for (int i = 0; i < 3; ++i) {
        engine.add_to_context("helper_ai", test::text_with_tokens(30), ItemKind::INPUT, Priority::HIGH);
    }

    ContextState state = engine.get_context_state("helper_ai");
    EXPECT_EQ(3u, state.item_count);
    EXPECT_EQ(90u, state.total_tokens);
    EXPECT_TRUE(state.needs_compaction);
    EXPECT_EQ(0u, state.compactions);
    EXPECT_TRUE(sink.entries().empty());
}

TEST_F(SummaryEngineTest, AddCompactsWhenThresholdCrossed) {
    ASSERT_TRUE(engine.configure("helper_ai", limit_of(1000)));
    engine.add_to_context("helper_ai", test::text_with_tokens(100, "Policy"),
                          ItemKind::SYSTEM_NOTE, Priority::HIGH);
    for (int i = 0; i < 10; ++i) {
        engine.add_to_context("helper_ai", test::text_with_tokens(80, "Chat" + std::to_string(i)),
                              i % 2 ? ItemKind::REPLY : ItemKind::INPUT, Priority::LOW);
        ContextState state = engine.get_context_state("helper_ai");
        EXPECT_LT(state.total_tokens, 750u) << "after item " << i;
    }

    ContextState state = engine.get_context_state("helper_ai");
    EXPECT_EQ(1u, state.compactions);
    ASSERT_TRUE(state.has_last_compaction);
    EXPECT_LE(state.last_compaction.summarized_tokens, 400u);
    EXPECT_TRUE(state.last_compaction.preserved_in_archive);
    EXPECT_EQ(1u, sink.entries().size());

    EngineStatistics stats = engine.statistics();
    EXPECT_EQ(1u, stats.summaries_created);
    EXPECT_GT(stats.tokens_saved, 0u);

    std::string context = engine.get_optimized_context("helper_ai");
    EXPECT_EQ(0u, context.find("[System] Policy"));
    EXPECT_NE(std::string::npos, context.find("[Summary] Recent: "));
}

TEST_F(SummaryEngineTest, ClearArchivesEveryLiveItem) {
    engine.add_to_context("accessibility_ai", "Screen reader on.", ItemKind::SYSTEM_NOTE, Priority::CRITICAL);
    engine.add_to_context("accessibility_ai", "Read my mail.", ItemKind::INPUT, Priority::MEDIUM);
    engine.add_to_context("accessibility_ai", "You have two messages.", ItemKind::REPLY, Priority::LOW);

    ArchiveResult result = engine.clear_context("accessibility_ai");
    EXPECT_TRUE(result.success);
    EXPECT_EQ("mem-1", result.reference);

    ContextState state = engine.get_context_state("accessibility_ai");
    EXPECT_EQ(0u, state.item_count);
    EXPECT_EQ(0u, state.total_tokens);
    EXPECT_EQ("", engine.get_optimized_context("accessibility_ai"));

    std::vector<test::RecordingSink::Entry> entries = sink.entries();
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ(ArchiveReason::CLEAR, entries[0].reason);
    EXPECT_EQ("accessibility_ai", entries[0].consumer_id);
    ASSERT_EQ(3u, entries[0].items.size());
    EXPECT_EQ("Screen reader on.", entries[0].items[0].content);
    EXPECT_EQ("Read my mail.", entries[0].items[1].content);
    EXPECT_EQ("You have two messages.", entries[0].items[2].content);

    EXPECT_EQ(1u, engine.statistics().contexts_cleared);
}

TEST_F(SummaryEngineTest, ClearingEmptyOrUnknownConsumerWritesNothing) {
    EXPECT_TRUE(engine.clear_context("nobody").success);
    engine.add_to_context("helper_ai", "hi", ItemKind::INPUT, Priority::LOW);
    engine.clear_context("helper_ai");
    EXPECT_TRUE(engine.clear_context("helper_ai").success);
    EXPECT_EQ(1u, sink.entries().size());
}

TEST_F(SummaryEngineTest, ConsumersAreIsolated) {
    engine.add_to_context("helper_ai", "alpha", ItemKind::INPUT, Priority::LOW);
    engine.add_to_context("guardian_ai", "beta", ItemKind::INPUT, Priority::LOW);
    engine.clear_context("helper_ai");

    EXPECT_EQ(0u, engine.get_context_state("helper_ai").item_count);
    EXPECT_EQ(1u, engine.get_context_state("guardian_ai").item_count);
    EXPECT_EQ("User: beta", engine.get_optimized_context("guardian_ai"));

    std::vector<std::string> consumers = engine.consumers();
    ASSERT_EQ(2u, consumers.size());
}

TEST_F(SummaryEngineTest, RejectsInvalidConfiguration) {
    ContextConfig bad;
    bad.limit_tokens = 500;
    bad.threshold_ratio = 0.4;
    bad.target_ratio = 0.5;

    std::string error;
    EXPECT_FALSE(engine.configure("helper_ai", bad, &error));
    EXPECT_NE(std::string::npos, error.find("threshold_ratio"));
    EXPECT_EQ(8000, engine.config_for("helper_ai").limit_tokens);

    bad = ContextConfig();
    bad.limit_tokens = 0;
    EXPECT_FALSE(engine.set_default_config(bad));
}

TEST_F(SummaryEngineTest, ReconfigureReestimatesLiveItems) {
    engine.add_to_context("helper_ai", std::string(40, 'x'), ItemKind::INPUT, Priority::LOW);
    ASSERT_EQ(10u, engine.get_context_state("helper_ai").total_tokens);

    ContextConfig c;
    c.limit_tokens = 2000;
    c.chars_per_token = 2;
    ASSERT_TRUE(engine.configure("helper_ai", c));

    ContextState state = engine.get_context_state("helper_ai");
    EXPECT_EQ(20u, state.total_tokens);
    EXPECT_EQ(2000u, state.limit);
}

TEST_F(SummaryEngineTest, DefaultConfigAppliesToUnconfiguredConsumers) {
    engine.add_to_context("custom_ai", "x", ItemKind::INPUT, Priority::LOW);
    ContextConfig defaults;
    defaults.limit_tokens = 300;
    ASSERT_TRUE(engine.set_default_config(defaults));

    EXPECT_EQ(300u, engine.get_context_state("custom_ai").limit);
    // Built-in limits still win for well-known consumers
    EXPECT_EQ(4000, engine.config_for("guardian_ai").limit_tokens);
}

TEST_F(SummaryEngineTest, ExplicitCompactIsNoopBelowThreshold) {
    engine.add_to_context("helper_ai", "short", ItemKind::INPUT, Priority::LOW);
    CompactionReport report = engine.compact("helper_ai");
    EXPECT_EQ(CompactionStatus::NOT_NEEDED, report.status);
    EXPECT_EQ(CompactionStatus::NOT_NEEDED, engine.compact("nobody").status);
}

TEST_F(SummaryEngineTest, StatisticsJson) {
    engine.add_to_context("helper_ai", "abcd", ItemKind::INPUT, Priority::LOW);
    Json stats = engine.statistics_json();
    EXPECT_EQ(SummaryEngine::VERSION, stats["version"].get<std::string>());
    EXPECT_EQ(0u, stats["summaries_created"].get<uint64_t>());
    ASSERT_TRUE(stats["contexts"].contains("helper_ai"));
    EXPECT_EQ(1u, stats["contexts"]["helper_ai"]["tokens"].get<size_t>());
    EXPECT_EQ("0.0%", stats["contexts"]["helper_ai"]["usage"].get<std::string>());
}

TEST(SummaryEngineFailureTest, ArchiveFailureOnClearStillEmptiesStore) {
    test::FailingSink sink;
    ManualClock clock;
    SummaryEngine engine(&sink, &clock);

    engine.add_to_context("guardian_ai", "scan finished", ItemKind::SYSTEM_NOTE, Priority::MEDIUM);
    ArchiveResult result = engine.clear_context("guardian_ai");
    EXPECT_FALSE(result.success);
    EXPECT_EQ("disk unavailable", result.error);

    ContextState state = engine.get_context_state("guardian_ai");
    EXPECT_EQ(0u, state.item_count);
    EXPECT_TRUE(state.last_archive_failure.occurred);
    EXPECT_EQ(clock.now_ms(), state.last_archive_failure.timestamp);
    EXPECT_EQ(1u, engine.statistics().archive_failures);
}

TEST(SummaryEngineFailureTest, HashIdsAreUniqueByDefault) {
    test::RecordingSink sink;
    SummaryEngine engine(&sink);
    ContextItem a = engine.add_to_context("helper_ai", "same", ItemKind::INPUT, Priority::LOW);
    ContextItem b = engine.add_to_context("helper_ai", "same", ItemKind::INPUT, Priority::LOW);
    EXPECT_EQ(16u, a.id.size());
    EXPECT_NE(a.id, b.id);
}

// Many producers on one consumer: every compaction archives a disjoint set
TEST(SummaryEngineConcurrencyTest, ConcurrentAddsNeverArchiveAnItemTwice) {
    test::RecordingSink sink;
    SummaryEngine engine(&sink);
    ContextConfig c;
    c.limit_tokens = 600;
    ASSERT_TRUE(engine.configure("helper_ai", c));

    const int threads = 8;
    const int per_thread = 40;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.push_back(std::thread([&engine, t]() {
            for (int i = 0; i < per_thread; ++i) {
                engine.add_to_context("helper_ai",
                                      test::text_with_tokens(20, "T" + std::to_string(t) + "n" + std::to_string(i)),
                                      i % 2 ? ItemKind::REPLY : ItemKind::INPUT,
                                      Priority::LOW);
                engine.get_context_state("helper_ai");
                engine.get_optimized_context("helper_ai");
            }
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) {
        workers[i].join();
    }

    std::set<std::string> archived;
    size_t originals = 0;
    std::vector<test::RecordingSink::Entry> entries = sink.entries();
    for (size_t e = 0; e < entries.size(); ++e) {
        for (size_t i = 0; i < entries[e].items.size(); ++i) {
            const ContextItem& item = entries[e].items[i];
            EXPECT_TRUE(archived.insert(item.id).second) << "archived twice: " << item.id;
            if (item.kind != ItemKind::SUMMARY) ++originals;
        }
    }

    ContextState state = engine.get_context_state("helper_ai");
    size_t live_originals = 0;
    std::string context = engine.get_optimized_context("helper_ai");
    for (size_t pos = context.find("User: "); pos != std::string::npos; pos = context.find("User: ", pos + 1)) {
        ++live_originals;
    }
    for (size_t pos = context.find("Assistant: "); pos != std::string::npos; pos = context.find("Assistant: ", pos + 1)) {
        ++live_originals;
    }

    EXPECT_EQ(static_cast<size_t>(threads * per_thread), originals + live_originals);
    EXPECT_EQ(entries.size(), state.compactions);
    EXPECT_LT(state.total_tokens, 450u);
}

TEST(SummaryEngineConcurrencyTest, OverrideSurvivesConcurrentDefaultChange) {
    test::RecordingSink sink;
    SummaryEngine engine(&sink);

    for (int round = 0; round < 50; ++round) {
        std::string id = "worker_" + std::to_string(round);
        engine.add_to_context(id, "Started.", ItemKind::SYSTEM_NOTE, Priority::HIGH);

        std::thread defaults([&engine, round]() {
            engine.set_default_config(limit_of(3000 + round));
        });
        std::thread custom([&engine, &id]() {
            engine.configure(id, limit_of(700));
        });
        defaults.join();
        custom.join();

        EXPECT_EQ(700u, engine.get_context_state(id).limit) << id;
        EXPECT_EQ(700, engine.config_for(id).limit_tokens) << id;
    }
}
