/*
 * ctxkeep C++ - Application
 *
 * Command-line front end: loads config.json, wires the archive backend
 * and the SummaryEngine, then serves line commands read from a stream.
 */
#ifndef ctxkeep_CORE_APPLICATION_HPP
#define ctxkeep_CORE_APPLICATION_HPP

#include <ctxkeep/archive/sink.hpp>
#include <ctxkeep/context/summary_engine.hpp>
#include <ctxkeep/core/config.hpp>

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

namespace ctxkeep {

struct AppInfo {
    static constexpr const char* NAME = "ctxkeep";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

// JSON view of a consumer's state, as printed by the "state" command
Json context_state_to_json(const ContextState& state);

class Application {
public:
    Application();
    ~Application();

    // Returns false when the process should exit right away; exit_code()
    // tells whether that was an error (--help / --version exit with 0).
    bool init(int argc, char* argv[]);

    // Same as init() but with an already loaded configuration
    bool init_with(const Config& config);

    // Serve commands until "quit" or end of input
    int run(std::istream& in, std::ostream& out);

    // Execute one command line. Returns false on "quit".
    bool handle_command(const std::string& line, std::ostream& out);

    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }
    int exit_code() const { return exit_code_; }

    void shutdown();

    SummaryEngine* engine() { return engine_.get(); }
    Config& config() { return config_; }

private:
    std::atomic<bool> running_;
    int exit_code_;
    std::string config_file_;
    Config config_;
    std::unique_ptr<ArchivalSink> sink_;
    std::unique_ptr<SummaryEngine> engine_;

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_archive();
    bool setup_engine();

    void cmd_add(const std::string& args, std::ostream& out);
    void cmd_state(const std::string& consumer, std::ostream& out);
    void cmd_context(const std::string& consumer, std::ostream& out);
    void cmd_compact(const std::string& consumer, std::ostream& out);
    void cmd_clear(const std::string& consumer, std::ostream& out);
    void cmd_stats(std::ostream& out);
    void cmd_help(std::ostream& out);
};

} // namespace ctxkeep

#endif // ctxkeep_CORE_APPLICATION_HPP
