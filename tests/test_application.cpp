#include <ctxkeep/core/application.hpp>

#include "test_helpers.hpp"

#include <sstream>

using namespace ctxkeep;

namespace {

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::make_temp_dir("app");
        Config config;
        config.set_string("log_level", "error");
        config.set_string("archive.backend", "sqlite");
        config.set_string("archive.db_path", join_path(dir, "archive.db"));
        config.set_int("consumers.helper_ai.limit_tokens", 100);
        ASSERT_TRUE(app.init_with(config));
    }

    std::string exec(const std::string& line) {
        std::ostringstream out;
        app.handle_command(line, out);
        return out.str();
    }

    std::string dir;
    Application app;
};

} // anonymous namespace

TEST_F(ApplicationTest, AddThenState) {
    std::string out = exec("add helper_ai input high Please open my notes");
    EXPECT_EQ(0u, out.find("ok "));
    EXPECT_NE(std::string::npos, out.find("tokens=5"));

    Json state = Json::parse(exec("state helper_ai"));
    EXPECT_EQ(1u, state["item_count"].get<size_t>());
    EXPECT_EQ(100u, state["limit"].get<size_t>());
    EXPECT_EQ(1u, state["items_by_priority"]["high"].get<size_t>());

    EXPECT_EQ("User: Please open my notes\n", exec("context helper_ai"));
}

TEST_F(ApplicationTest, RejectsMalformedCommands) {
    EXPECT_EQ(0u, exec("add helper_ai input").find("error: usage"));
    EXPECT_EQ(0u, exec("add helper_ai shout high hello").find("error: unknown kind"));
    EXPECT_EQ(0u, exec("add helper_ai input urgent hello").find("error: unknown priority"));
    EXPECT_EQ(0u, exec("frobnicate").find("error: unknown command"));
    EXPECT_EQ(0u, exec("state").find("error: usage"));
    EXPECT_EQ("", exec("# comment"));
    EXPECT_EQ("", exec("   "));
}

TEST_F(ApplicationTest, ClearReportsArchiveReference) {
    exec("add helper_ai reply low Saved the file.");
    std::string out = exec("clear helper_ai");
    EXPECT_EQ(0u, out.find("cleared archive=arc-"));
    EXPECT_EQ(0u, Json::parse(exec("state helper_ai"))["item_count"].get<size_t>());
}

TEST_F(ApplicationTest, CompactAndStats) {
    EXPECT_EQ(0u, exec("compact helper_ai").find("not_needed"));

    Json stats = Json::parse(exec("stats"));
    EXPECT_EQ(AppInfo::VERSION, stats["version"].get<std::string>());
    EXPECT_TRUE(stats.contains("contexts"));
}

TEST_F(ApplicationTest, RunStopsAtQuit) {
    std::istringstream in("add helper_ai input 4 hello\nquit\nadd helper_ai input 4 ignored\n");
    std::ostringstream out;
    EXPECT_EQ(0, app.run(in, out));
    EXPECT_FALSE(app.is_running());
    EXPECT_EQ(1u, app.engine()->get_context_state("helper_ai").item_count);
}

TEST(ApplicationSetupTest, UnknownBackendFails) {
    Config config;
    config.set_string("log_level", "error");
    config.set_string("archive.backend", "tape");
    Application app;
    EXPECT_FALSE(app.init_with(config));
    EXPECT_EQ(1, app.exit_code());
}

TEST(ApplicationSetupTest, InvalidBudgetFails) {
    std::string dir = test::make_temp_dir("app_bad");
    Config config;
    config.set_string("log_level", "error");
    config.set_string("archive.backend", "vault");
    config.set_string("archive.vault_dir", join_path(dir, "vault"));
    config.set_double("defaults.threshold_ratio", 0.2);
    Application app;
    EXPECT_FALSE(app.init_with(config));
}

TEST(ApplicationSetupTest, StateJsonIncludesFailure) {
    ContextState state;
    state.total_tokens = 10;
    state.limit = 100;
    state.last_archive_failure.occurred = true;
    state.last_archive_failure.message = "disk unavailable";
    Json j = context_state_to_json(state);
    EXPECT_EQ(10u, j["total_tokens"].get<size_t>());
    EXPECT_EQ("disk unavailable", j["last_archive_failure"]["message"].get<std::string>());
    EXPECT_FALSE(j.contains("last_compaction"));
}
