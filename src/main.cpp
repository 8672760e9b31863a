#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_multiplexer.hpp"
#include "db/postgresql/pg_connector.hpp"
#include "executor/cancellation_controller.hpp"
#include "executor/script_executor.hpp"
#include "history/composite_history_sink.hpp"
#include "history/in_memory_history.hpp"
#include "history/jsonl_history_sink.hpp"
#include "security/secret_store.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>

using namespace sqlrunner;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitStatementError = 1;
constexpr int kExitConnectionError = 2;

constexpr size_t kMaxCellWidth = 40;

volatile std::sig_atomic_t g_interrupts = 0;

int exit_code_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return kExitOk;
        case ErrorCategory::STATEMENT_ERROR: return kExitStatementError;
        default: return kExitConnectionError;
    }
}

int fail(ErrorCategory category, const std::string& message) {
    utils::log::error(std::format("[{}] {}", error_category_to_string(category), message));
    return exit_code_for(category);
}

void signal_handler(int) {
    g_interrupts = g_interrupts + 1;
}

struct CliArgs {
    std::string config_file;
    std::string profile_id;
    std::string script_file = "-";
    std::string database;
    std::string session_id = "cli";
    bool show_history = false;
};

void print_usage() {
    std::cerr << "Usage: sqlrunner <config.toml> <profile-id> [script-file|-] "
                 "[--database <db>] [--session <id>]\n"
                 "       sqlrunner <config.toml> --history\n";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 3) {
        return std::nullopt;
    }

    CliArgs args;
    args.config_file = argv[1];
    if (std::string(argv[2]) == "--history") {
        args.show_history = true;
        return args;
    }
    args.profile_id = argv[2];

    bool have_script = false;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--database" || arg == "--session") && i + 1 < argc) {
            (arg == "--database" ? args.database : args.session_id) = argv[++i];
        } else if (!have_script && (arg == "-" || !arg.starts_with("--"))) {
            args.script_file = arg;
            have_script = true;
        } else {
            return std::nullopt;
        }
    }
    return args;
}

std::optional<std::string> read_script(const std::string& path) {
    std::ostringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    buffer << in.rdbuf();
    return buffer.str();
}

std::string cell_text(const std::optional<std::string>& cell) {
    if (!cell) return "NULL";
    std::string text = *cell;
    for (char& c : text) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (text.size() > kMaxCellWidth) {
        text = text.substr(0, kMaxCellWidth - 3) + "...";
    }
    return text;
}

void print_table(const std::vector<std::string>& columns, const std::vector<Row>& rows,
                 bool with_header) {
    std::vector<size_t> widths(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        widths[i] = std::min(columns[i].size(), kMaxCellWidth);
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], cell_text(row[i]).size());
        }
    }

    auto print_row = [&widths](const std::vector<std::string>& cells) {
        std::string line;
        for (size_t i = 0; i < widths.size(); ++i) {
            if (i > 0) line += " | ";
            const std::string& cell = i < cells.size() ? cells[i] : std::string{};
            line += cell;
            line.append(widths[i] > cell.size() ? widths[i] - cell.size() : 0, ' ');
        }
        std::cout << line << '\n';
    };

    if (with_header) {
        print_row(columns);
        std::string sep;
        for (size_t i = 0; i < widths.size(); ++i) {
            if (i > 0) sep += "-+-";
            sep.append(widths[i], '-');
        }
        std::cout << sep << '\n';
    }
    for (const auto& row : rows) {
        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto& cell : row) cells.push_back(cell_text(cell));
        print_row(cells);
    }
}

void print_outcome(const StatementOutcome& outcome) {
    if (const auto* err = std::get_if<ExecutionError>(&outcome)) {
        std::cerr << std::format("ERROR (statement {}): {}\n", err->statement_index + 1, err->message);
        return;
    }

    const auto& res = std::get<ExecutionResult>(outcome);
    for (const auto& notice : res.notices) {
        std::cout << "NOTICE: " << notice << '\n';
    }

    const double ms = static_cast<double>(res.elapsed.count()) / 1000.0;
    if (res.streamed) {
        std::cout << std::format("({} rows, streamed, {:.1f} ms)\n\n", res.row_count, ms);
    } else if (!res.columns.empty()) {
        print_table(res.columns, res.rows, true);
        std::cout << std::format("({} row{}, {:.1f} ms)\n\n",
                                 res.row_count, res.row_count == 1 ? "" : "s", ms);
    } else {
        std::cout << std::format("{} {} ({:.1f} ms)\n\n", res.command_tag, res.row_count, ms);
    }
}

int show_history(const RunnerConfig& config) {
    if (config.history.file.empty()) {
        std::cerr << "No [history] file configured\n";
        return kExitOk;
    }
    for (const auto& e : JsonlHistorySink::load(config.history.file, config.history.max_entries)) {
        std::cout << std::format("{}  {:<7} {:>10.1f} ms  {:<16} {}\n",
            utils::format_timestamp(e.timestamp), e.success ? "ok" : "failed",
            static_cast<double>(e.duration.count()) / 1000.0,
            e.connection_name, cell_text(e.statement));
    }
    return kExitOk;
}

std::shared_ptr<IHistorySink> build_history(const HistorySettings& settings) {
    auto memory = std::make_shared<InMemoryHistory>(settings.max_entries);
    if (settings.file.empty()) {
        return memory;
    }

    // Seed oldest first so the in-memory view keeps newest-first order
    auto previous = JsonlHistorySink::load(settings.file, settings.max_entries);
    for (auto it = previous.rbegin(); it != previous.rend(); ++it) {
        memory->record(*it);
    }

    auto composite = std::make_shared<CompositeHistorySink>();
    composite->add(memory);
    try {
        composite->add(std::make_shared<JsonlHistorySink>(settings.file));
    } catch (const std::runtime_error& e) {
        utils::log::warn(std::format("{}; history kept in memory only", e.what()));
    }
    return composite;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return kExitConnectionError;
    }

    auto config_result = ConfigLoader::load_from_file(args->config_file);
    if (!config_result.success) {
        return fail(ErrorCategory::CONFIG_ERROR, std::format("Failed to load config '{}': {}",
                                                             args->config_file, config_result.error_message));
    }
    const RunnerConfig& config = config_result.config;
    if (auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    if (args->show_history) {
        return show_history(config);
    }

    const ConnectionProfile* profile = config.find_profile(args->profile_id);
    if (!profile) {
        return fail(ErrorCategory::CONFIG_ERROR, std::format("Unknown profile '{}'", args->profile_id));
    }

    auto script = read_script(args->script_file);
    if (!script) {
        return fail(ErrorCategory::CONFIG_ERROR, std::format("Cannot read script '{}'", args->script_file));
    }

    ConnectionMultiplexer::Options mux_options;
    mux_options.pool.max_connections = config.pool.max_connections;
    mux_options.pool.idle_timeout = config.pool.idle_timeout;
    mux_options.pool.acquire_timeout = config.pool.acquire_timeout;

    ConnectionMultiplexer multiplexer(
        mux_options, make_pg_connector_builder(std::make_shared<EnvSecretStore>()));
    multiplexer.start();

    ScriptExecutor executor(multiplexer, build_history(config.history),
                            ScriptExecutor::Config{.streaming = config.streaming,
                                                   .infer_table_info = true});
    CancellationController canceller(multiplexer);

    std::atomic<int> backend_pid{0};
    std::signal(SIGINT, signal_handler);

    // First Ctrl-C cancels the running statement, the second terminates the backend
    std::jthread watcher([&](std::stop_token stop) {
        int handled = 0;
        while (!stop.stop_requested()) {
            const int seen = g_interrupts;
            if (seen > handled && backend_pid.load() > 0) {
                handled = seen;
                auto result = handled == 1
                    ? canceller.request_cancel(backend_pid.load(), *profile, args->database)
                    : canceller.request_terminate(backend_pid.load(), *profile, args->database);
                if (result.is_error()) {
                    utils::log::warn(std::format("Cancellation failed: {}", result.error_message()));
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    ScriptExecutor::ExecuteOptions options;
    options.database = args->database;
    options.on_backend_pid = [&backend_pid](int pid) { backend_pid.store(pid); };
    options.on_batch = [](const StreamBatch& batch) {
        std::vector<std::string> columns;
        columns.reserve(batch.fields.size());
        for (const auto& f : batch.fields) columns.push_back(f.name);
        print_table(columns, batch.rows, batch.is_first);
    };

    int exit_code = kExitOk;
    try {
        auto summary = executor.execute(*script, *profile, args->session_id, print_outcome, options);
        if (summary.failed) {
            exit_code = exit_code_for(ErrorCategory::STATEMENT_ERROR);
        }
        utils::log::debug(std::format("{}/{} statement(s) succeeded in {} ms",
            summary.statements_succeeded, summary.statements_total,
            std::chrono::duration_cast<std::chrono::milliseconds>(summary.elapsed).count()));
    } catch (const DbError& e) {
        exit_code = fail(e.category(), e.what());
    } catch (const std::exception& e) {
        exit_code = fail(ErrorCategory::INTERNAL_ERROR, e.what());
    }

    watcher.request_stop();
    watcher.join();
    std::signal(SIGINT, SIG_DFL);

    multiplexer.shutdown();
    return exit_code;
}
