/*
 * ctxkeep C++ - Application Implementation
 */
#include <ctxkeep/core/application.hpp>
#include <ctxkeep/archive/archive_store.hpp>
#include <ctxkeep/archive/vault_sink.hpp>
#include <ctxkeep/core/logger.hpp>
#include <ctxkeep/core/utils.hpp>

#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>

namespace ctxkeep {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - context budget manager\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config FILE  Load configuration from FILE (JSON)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Commands are read from stdin, one per line. Type 'help' for the list.\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

Json context_state_to_json(const ContextState& state) {
    Json j = Json::object();
    j["total_tokens"] = state.total_tokens;
    j["limit"] = state.limit;
    j["target_tokens"] = state.target_tokens;
    j["usage_ratio"] = state.usage_ratio;
    j["item_count"] = state.item_count;
    j["needs_compaction"] = state.needs_compaction;
    j["over_budget"] = state.over_budget;
    j["compactions"] = state.compactions;

    Json by_priority = Json::object();
    for (std::map<Priority, size_t>::const_iterator it = state.items_by_priority.begin();
         it != state.items_by_priority.end(); ++it) {
        by_priority[priority_to_string(it->first)] = it->second;
    }
    j["items_by_priority"] = by_priority;

    if (state.has_last_compaction) {
        Json last = Json::object();
        last["original_tokens"] = state.last_compaction.original_tokens;
        last["summarized_tokens"] = state.last_compaction.summarized_tokens;
        last["compression_ratio"] = state.last_compaction.compression_ratio;
        last["preserved_in_archive"] = state.last_compaction.preserved_in_archive;
        last["archive_ref"] = state.last_compaction.archive_ref;
        j["last_compaction"] = last;
    }

    if (state.last_archive_failure.occurred) {
        Json failure = Json::object();
        failure["message"] = state.last_archive_failure.message;
        failure["timestamp"] = format_timestamp_ms(state.last_archive_failure.timestamp);
        j["last_archive_failure"] = failure;
    }
    return j;
}

namespace {

// First whitespace-delimited word of `s`; `rest` receives the remainder
std::string next_word(const std::string& s, std::string& rest) {
    std::string t = ltrim(s);
    size_t end = t.find_first_of(" \t");
    if (end == std::string::npos) {
        rest.clear();
        return t;
    }
    rest = ltrim(t.substr(end));
    return t.substr(0, end);
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application::Application()
    : running_(true)
    , exit_code_(0)
{}

Application::~Application() {
    shutdown();
}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage(argv[0]);
        exit_code_ = 1;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    LogLevel level = parse_log_level(config_.get_string("log_level", "info"), LogLevel::INFO);
    Logger::instance().set_level(level);
}

bool Application::setup_archive() {
    std::string backend = to_lower(config_.get_string("archive.backend", "sqlite"));

    if (backend == "sqlite") {
        std::string db_path = config_.get_string("archive.db_path", "ctxkeep_archive.db");
        int timeout_ms = static_cast<int>(config_.get_int("archive.timeout_ms", 5000));

        std::unique_ptr<ArchiveStore> store(new ArchiveStore());
        if (!store->open(db_path, timeout_ms)) {
            LOG_ERROR("Failed to open archive database %s: %s",
                      db_path.c_str(), store->last_error().c_str());
            return false;
        }
        sink_.reset(store.release());
    } else if (backend == "vault") {
        std::string dir = config_.get_string("archive.vault_dir", "vault");
        if (!create_directories(dir)) {
            LOG_ERROR("Failed to create vault directory %s", dir.c_str());
            return false;
        }
        sink_.reset(new VaultSink(dir));
    } else {
        LOG_ERROR("Unknown archive.backend '%s' (expected 'sqlite' or 'vault')", backend.c_str());
        return false;
    }

    LOG_INFO("Archive backend: %s", sink_->name());
    return true;
}

bool Application::setup_engine() {
    SummarizerOptions options;
    options.recent_items = static_cast<size_t>(
        config_.get_int("summarizer.recent_items", static_cast<int64_t>(options.recent_items)));
    options.recent_ratio = config_.get_double("summarizer.recent_ratio", options.recent_ratio);
    options.system_items = static_cast<size_t>(
        config_.get_int("summarizer.system_items", static_cast<int64_t>(options.system_items)));
    options.knowledge_ratio = config_.get_double("summarizer.knowledge_ratio", options.knowledge_ratio);

    engine_.reset(new SummaryEngine(sink_.get(), nullptr, nullptr, options));
    if (!engine_->configure_from(config_)) {
        LOG_ERROR("Configuration rejected; fix the budget settings in %s",
                  config_file_.empty() ? "the configuration" : config_file_.c_str());
        return false;
    }
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    Config config;
    if (!config_file_.empty()) {
        if (!config.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s: %s",
                      config_file_.c_str(), config.last_error().c_str());
            exit_code_ = 1;
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    } else {
        LOG_INFO("No --config given, using built-in defaults");
    }

    return init_with(config);
}

bool Application::init_with(const Config& config) {
    config_ = config;
    setup_logging();

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_archive() || !setup_engine()) {
        exit_code_ = 1;
        return false;
    }
    return true;
}

int Application::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (running_.load() && std::getline(in, line)) {
        if (!handle_command(line, out)) {
            break;
        }
    }
    return exit_code_;
}

bool Application::handle_command(const std::string& line, std::ostream& out) {
    std::string args;
    std::string command = to_lower(next_word(line, args));

    if (command.empty() || command[0] == '#') {
        return true;
    }
    if (!engine_) {
        out << "error: not initialized\n";
        return true;
    }

    if (command == "quit" || command == "exit") {
        stop();
        return false;
    } else if (command == "add") {
        cmd_add(args, out);
    } else if (command == "state") {
        cmd_state(trim(args), out);
    } else if (command == "context") {
        cmd_context(trim(args), out);
    } else if (command == "compact") {
        cmd_compact(trim(args), out);
    } else if (command == "clear") {
        cmd_clear(trim(args), out);
    } else if (command == "stats") {
        cmd_stats(out);
    } else if (command == "help") {
        cmd_help(out);
    } else {
        out << "error: unknown command '" << command << "' (try 'help')\n";
    }
    return true;
}

void Application::shutdown() {
    if (!engine_ && !sink_) return;

    LOG_INFO("Shutting down...");
    engine_.reset();
    sink_.reset();
    LOG_DEBUG("Archive closed");
}

// ============================================================================
// Commands
// ============================================================================

void Application::cmd_add(const std::string& args, std::ostream& out) {
    std::string rest;
    std::string consumer = next_word(args, rest);
    std::string kind_name = next_word(rest, rest);
    std::string priority_name = next_word(rest, rest);

    if (consumer.empty() || kind_name.empty() || priority_name.empty() || rest.empty()) {
        out << "error: usage: add <consumer> <kind> <priority> <text>\n";
        return;
    }

    ItemKind kind;
    if (!item_kind_from_string(kind_name, kind)) {
        out << "error: unknown kind '" << kind_name << "'\n";
        return;
    }
    Priority priority;
    if (!priority_from_string(priority_name, priority)) {
        out << "error: unknown priority '" << priority_name << "'\n";
        return;
    }

    ContextItem item = engine_->add_to_context(consumer, rest, kind, priority);
    ContextState state = engine_->get_context_state(consumer);

    char usage[32];
    snprintf(usage, sizeof(usage), "%.1f%%", state.usage_ratio * 100.0);
    out << "ok " << item.id << " tokens=" << item.token_count
        << " usage=" << usage << " (" << state.total_tokens << "/" << state.limit << ")";
    if (state.over_budget) out << " over_budget";
    out << "\n";
}

void Application::cmd_state(const std::string& consumer, std::ostream& out) {
    if (consumer.empty()) {
        out << "error: usage: state <consumer>\n";
        return;
    }
    out << context_state_to_json(engine_->get_context_state(consumer)).dump(2) << "\n";
}

void Application::cmd_context(const std::string& consumer, std::ostream& out) {
    if (consumer.empty()) {
        out << "error: usage: context <consumer>\n";
        return;
    }
    out << engine_->get_optimized_context(consumer) << "\n";
}

void Application::cmd_compact(const std::string& consumer, std::ostream& out) {
    if (consumer.empty()) {
        out << "error: usage: compact <consumer>\n";
        return;
    }
    CompactionReport report = engine_->compact(consumer);
    out << compaction_status_to_string(report.status)
        << " tokens=" << report.tokens_before << "->" << report.tokens_after;
    if (report.archive_failed) {
        out << " archive_error=\"" << report.archive_error << "\"";
    } else if (!report.outcome.archive_ref.empty()) {
        out << " archive=" << report.outcome.archive_ref;
    }
    out << "\n";
}

void Application::cmd_clear(const std::string& consumer, std::ostream& out) {
    if (consumer.empty()) {
        out << "error: usage: clear <consumer>\n";
        return;
    }
    ArchiveResult result = engine_->clear_context(consumer);
    if (result.success) {
        out << "cleared";
        if (!result.reference.empty()) out << " archive=" << result.reference;
        out << "\n";
    } else {
        out << "cleared archive_error=\"" << result.error << "\"\n";
    }
}

void Application::cmd_stats(std::ostream& out) {
    out << engine_->statistics_json().dump(2) << "\n";
}

void Application::cmd_help(std::ostream& out) {
    out << "Commands:\n"
        << "  add <consumer> <kind> <priority> <text>\n"
        << "      kind: input | reply | system | knowledge | summary\n"
        << "      priority: critical | high | medium | low | archive (or 5..1)\n"
        << "  state <consumer>      budget state as JSON\n"
        << "  context <consumer>    optimized context text\n"
        << "  compact <consumer>    run compaction now\n"
        << "  clear <consumer>      archive and empty the context\n"
        << "  stats                 engine statistics as JSON\n"
        << "  help                  this list\n"
        << "  quit                  exit\n";
}

} // namespace ctxkeep
