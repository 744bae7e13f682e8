#include <ctxkeep/context/summarizer.hpp>

#include "test_helpers.hpp"

using namespace ctxkeep;

namespace {

ContextItem make_item(ItemKind kind, const std::string& content, int64_t at, uint64_t seq) {
    ContextItem item;
    item.kind = kind;
    item.priority = Priority::LOW;
    item.content = content;
    item.created_at = at;
    item.sequence = seq;
    item.token_count = TokenEstimator().estimate(content);
    return item;
}

} // anonymous namespace

// ============================================================================
// Segmentation
// ============================================================================

TEST(SummarizerTest, SplitsOnTerminatorsFollowedByWhitespace) {
    std::vector<std::string> s = ExtractiveSummarizer::split_sentences(
        "First one. Second one!  Third one?\nFourth without end");
    ASSERT_EQ(4u, s.size());
    EXPECT_EQ("First one.", s[0]);
    EXPECT_EQ("Second one!", s[1]);
    EXPECT_EQ("Third one?", s[2]);
    EXPECT_EQ("Fourth without end", s[3]);
}

TEST(SummarizerTest, DoesNotSplitInsideTokens) {
    std::vector<std::string> s = ExtractiveSummarizer::split_sentences("Version 1.2.3 shipped. Done.");
    ASSERT_EQ(2u, s.size());
    EXPECT_EQ("Version 1.2.3 shipped.", s[0]);
}

TEST(SummarizerTest, TokenizeLowercasesWordRuns) {
    std::vector<std::string> words = ExtractiveSummarizer::tokenize("Open the FILE_name, now!");
    ASSERT_EQ(4u, words.size());
    EXPECT_EQ("open", words[0]);
    EXPECT_EQ("the", words[1]);
    EXPECT_EQ("file_name", words[2]);
    EXPECT_EQ("now", words[3]);
}

TEST(SummarizerTest, StopWordsAndPreservePatterns) {
    ExtractiveSummarizer summarizer;
    EXPECT_TRUE(summarizer.is_stop_word("the"));
    EXPECT_FALSE(summarizer.is_stop_word("rocket"));

    EXPECT_TRUE(summarizer.matches_preserve_pattern("Please open the door"));
    EXPECT_TRUE(summarizer.matches_preserve_pattern("The build FAILED again"));
    EXPECT_FALSE(summarizer.matches_preserve_pattern("Grapes grow slowly"));
}

// ============================================================================
// Single text
// ============================================================================

TEST(SummarizerTest, ShortTextIsReturnedUnchanged) {
    ExtractiveSummarizer summarizer;
    std::string text = "One. Two. Three. Four. Five.";
    EXPECT_EQ(text, summarizer.summarize(text, compression::AGGRESSIVE));
    EXPECT_EQ("", summarizer.summarize(""));
}

TEST(SummarizerTest, TwoSentencesAreReturnedUnchanged) {
    ExtractiveSummarizer summarizer;
    std::string text =
        "This opening sentence is deliberately long so the whole paragraph passes the length gate. "
        "The closing sentence is also long enough to matter for the character count here.";
    ASSERT_GE(text.size(), 100u);
    EXPECT_EQ(text, summarizer.summarize(text, compression::AGGRESSIVE));
}

TEST(SummarizerTest, KeepsTopSentencesInSourceOrder) {
    ExtractiveSummarizer summarizer;
    // The fourth sentence scores highest and the first second; the
    // selection must still read first-then-fourth.
    std::string text =
        "Rocket notes matter. Lemons taste sour. Grapes grow slowly. "
        "Rocket rocket rocket launch. Bananas ripen fast.";
    ASSERT_GE(text.size(), 100u);

    std::vector<ScoredSentence> scored =
        summarizer.score_sentences(ExtractiveSummarizer::split_sentences(text));
    ASSERT_EQ(5u, scored.size());
    EXPECT_GT(scored[3].score, scored[0].score);
    EXPECT_GT(scored[0].score, scored[4].score);

    EXPECT_EQ("Rocket notes matter. Rocket rocket rocket launch.",
              summarizer.summarize(text, 0.4));
}

TEST(SummarizerTest, SentenceCountIsCeilingOfRatio) {
    ExtractiveSummarizer summarizer;
    std::string text =
        "Alpha beta gamma delta. Epsilon zeta eta theta. Iota kappa lambda mu. "
        "Nu xi omicron pi. Rho sigma tau upsilon. Phi chi psi omega.";
    // 6 sentences at 0.2 -> ceil(1.2) = 2
    std::string out = summarizer.summarize(text, compression::AGGRESSIVE);
    EXPECT_EQ(2u, ExtractiveSummarizer::split_sentences(out).size());

    // 6 sentences at 0.8 -> ceil(4.8) = 5
    out = summarizer.summarize(text, compression::MINIMAL);
    EXPECT_EQ(5u, ExtractiveSummarizer::split_sentences(out).size());
}

TEST(SummarizerTest, OutputIsVerbatimSubsetOfSource) {
    ExtractiveSummarizer summarizer;
    std::string text =
        "The user wants to save the report. The weather was mild. "
        "An error occurred while writing the file. Lunch was served at noon. "
        "Please retry the save after fixing permissions.";
    std::string out = summarizer.summarize(text, compression::MODERATE);
    std::vector<std::string> picked = ExtractiveSummarizer::split_sentences(out);
    ASSERT_FALSE(picked.empty());
    for (size_t i = 0; i < picked.size(); ++i) {
        EXPECT_NE(std::string::npos, text.find(picked[i])) << picked[i];
    }
}

// ============================================================================
// Multi-item digest
// ============================================================================

TEST(SummarizerTest, DigestLabelsBuckets) {
    ExtractiveSummarizer summarizer;
    std::vector<ContextItem> items;
    items.push_back(make_item(ItemKind::SYSTEM_NOTE, "Screen reader active.", 1, 1));
    items.push_back(make_item(ItemKind::INPUT, "Open my notes.", 2, 2));
    items.push_back(make_item(ItemKind::REPLY, "Opening notes.", 3, 3));
    items.push_back(make_item(ItemKind::KNOWLEDGE, "Notes live in the vault.", 4, 4));

    std::string digest = summarizer.summarize_items(items, 1000, TokenEstimator());
    EXPECT_EQ("Recent: Open my notes. Opening notes. | Context: Screen reader active. | "
              "Knowledge: Notes live in the vault.", digest);
}

TEST(SummarizerTest, EarlierSummariesAreCarried) {
    ExtractiveSummarizer summarizer;
    std::vector<ContextItem> items;
    ContextItem previous = make_item(ItemKind::SUMMARY, "Recent: User asked for the time.", 1, 1);
    previous.summarized = true;
    items.push_back(previous);
    items.push_back(make_item(ItemKind::INPUT, "What is the date?", 2, 2));

    std::string digest = summarizer.summarize_items(items, 1000, TokenEstimator());
    EXPECT_EQ("Earlier: Recent: User asked for the time. | Recent: What is the date?", digest);
}

TEST(SummarizerTest, RecentBucketTakesLastThreeOfEachKind) {
    ExtractiveSummarizer summarizer;
    std::vector<ContextItem> items;
    for (int i = 1; i <= 5; ++i) {
        items.push_back(make_item(ItemKind::INPUT, "Q" + std::to_string(i) + ".", i, i));
    }
    std::string digest = summarizer.summarize_items(items, 1000, TokenEstimator());
    EXPECT_EQ("Recent: Q3. Q4. Q5.", digest);
}

TEST(SummarizerTest, OnlyLastSystemNotesAreKept) {
    ExtractiveSummarizer summarizer;
    std::vector<ContextItem> items;
    items.push_back(make_item(ItemKind::SYSTEM_NOTE, "Note one.", 1, 1));
    items.push_back(make_item(ItemKind::SYSTEM_NOTE, "Note two.", 2, 2));
    items.push_back(make_item(ItemKind::SYSTEM_NOTE, "Note three.", 3, 3));
    std::string digest = summarizer.summarize_items(items, 1000, TokenEstimator());
    EXPECT_EQ("Context: Note two. Note three.", digest);
}

TEST(SummarizerTest, DigestNeverExceedsTarget) {
    ExtractiveSummarizer summarizer;
    TokenEstimator estimator;
    std::vector<ContextItem> items;
    for (int i = 0; i < 12; ++i) {
        items.push_back(make_item(i % 2 ? ItemKind::REPLY : ItemKind::INPUT,
                                  test::text_with_tokens(60, "Topic" + std::to_string(i)), i, i));
    }

    const size_t targets[] = { 1, 2, 5, 17, 40, 120 };
    for (size_t t = 0; t < sizeof(targets) / sizeof(targets[0]); ++t) {
        std::string digest = summarizer.summarize_items(items, targets[t], estimator);
        EXPECT_LE(estimator.estimate(digest), targets[t]) << "target " << targets[t];
    }

    std::string tight = summarizer.summarize_items(items, 17, estimator);
    EXPECT_EQ(ExtractiveSummarizer::TRUNCATION_MARKER,
              tight.substr(tight.size() - std::string(ExtractiveSummarizer::TRUNCATION_MARKER).size()));
}

TEST(SummarizerTest, TruncationKeepsUtf8Intact) {
    TokenEstimator estimator;
    std::string text;
    for (int i = 0; i < 40; ++i) text += "\xc3\xa9t\xc3\xa9 ";
    std::string cut = ExtractiveSummarizer::truncate_to_tokens(text, 3, estimator);
    EXPECT_LE(estimator.estimate(cut), 3u);
    // No dangling lead byte before the marker
    std::string body = cut.substr(0, cut.size() - 3);
    ASSERT_FALSE(body.empty());
    EXPECT_NE(0xc3, static_cast<unsigned char>(body[body.size() - 1]));
}
