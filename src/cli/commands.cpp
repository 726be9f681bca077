#include "dentassist/cli/commands.hpp"
#include "dentassist/core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <nlohmann/json.hpp>

#include "dentassist/assistant/assistant.hpp"
#include "dentassist/gateway/chat_handler.hpp"
#include "dentassist/gateway/knowledge_handler.hpp"
#include "dentassist/gateway/server.hpp"
#include "dentassist/gateway/system_handler.hpp"

#ifndef DENTASSIST_VERSION_STRING
#define DENTASSIST_VERSION_STRING "0.1.0-dev"
#endif

namespace dentassist::cli {

using json = nlohmann::json;
using boost::asio::awaitable;

namespace {

auto make_assistant(boost::asio::io_context& ioc, const Config& config)
    -> std::unique_ptr<assistant::Assistant> {
    try {
        return assistant::Assistant::create(ioc, config);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot open the knowledge base: {}", e.what());
        throw CLI::RuntimeError(1);
    }
}

using Command = std::function<awaitable<int>(assistant::Assistant&)>;

/// Builds an assistant, optionally initializes it, and runs `command` on a
/// private io_context. Throws CLI::RuntimeError with a non-zero exit code.
void run_command(const Config& config, bool initialize, Command command) {
    boost::asio::io_context ioc;
    auto assistant = make_assistant(ioc, config);

    int exit_code = 0;
    boost::asio::co_spawn(ioc,
        [&]() -> awaitable<int> {
            if (initialize) {
                auto init = co_await assistant->initialize();
                if (!init) {
                    LOG_ERROR("Initialization failed: {}", init.error().what());
                    co_return 1;
                }
            }
            co_return co_await command(*assistant);
        },
        [&exit_code](std::exception_ptr ep, int code) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("Command failed: {}", e.what());
                }
                exit_code = 1;
                return;
            }
            exit_code = code;
        });
    ioc.run();

    if (exit_code != 0) {
        throw CLI::RuntimeError(exit_code);
    }
}

void print_results(const std::vector<retrieval::SearchResult>& results) {
    if (results.empty()) {
        std::cout << "No entries matched.\n";
        return;
    }
    for (const auto& r : results) {
        std::cout << r.rank << ". [" << std::fixed << std::setprecision(3)
                  << r.similarity << "] (" << r.category << ") #" << r.id
                  << " " << r.question << "\n"
                  << "   " << r.answer << "\n";
    }
}

/// Accepts either a bare array of entries or {"entries": [...]}.
auto read_import_file(const std::string& path) -> Result<std::vector<knowledge::EntryDraft>> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot open file", path));
    }
    try {
        auto j = json::parse(file);
        const auto& items = j.is_object() ? j.at("entries") : j;
        if (!items.is_array()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Expected an array of entries", path));
        }
        std::vector<knowledge::EntryDraft> drafts;
        drafts.reserve(items.size());
        for (const auto& item : items) {
            drafts.push_back(item.get<knowledge::EntryDraft>());
        }
        return drafts;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid import file", e.what()));
    }
}

/// Marks sessions idle on a fixed period until the io_context stops.
auto expire_idle_loop(assistant::Assistant& assistant, std::chrono::seconds period)
    -> awaitable<void> {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    for (;;) {
        timer.expires_after(period);
        co_await timer.async_wait(boost::asio::use_awaitable);
        auto expired = co_await assistant.expire_idle_sessions();
        if (!expired) {
            LOG_WARN("Idle session sweep failed: {}", expired.error().what());
        } else if (*expired > 0) {
            LOG_INFO("Marked {} chat sessions idle", *expired);
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// redaction
// ---------------------------------------------------------------------------

void redact_secrets(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = std::find(sensitive_keys.begin(), sensitive_keys.end(),
                                          it.key()) != sensitive_keys.end();
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_secrets(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_secrets(elem);
        }
    }
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, Config& config) {
    struct Options {
        uint16_t port = 0;
        std::string bind;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("serve", "Start the WebSocket gateway");
    sub->add_option("-p,--port", opts->port, "Listen port (overrides config)")
        ->envname("DENTASSIST_PORT");
    sub->add_option("-b,--bind", opts->bind, "Bind mode: loopback or all")
        ->check(CLI::IsMember({"loopback", "all"}));

    sub->callback([&config, opts]() {
        if (opts->port != 0) {
            config.gateway.port = opts->port;
        }
        if (!opts->bind.empty()) {
            config.gateway.bind = (opts->bind == "all") ? BindMode::All : BindMode::Loopback;
        }

        boost::asio::io_context ioc;
        auto assistant = make_assistant(ioc, config);

        gateway::GatewayServer server(ioc);
        auto& protocol = *server.protocol();
        gateway::register_chat_handlers(protocol, *assistant);
        gateway::register_knowledge_handlers(protocol, *assistant);
        gateway::register_system_handlers(protocol, *assistant);
        LOG_INFO("All {} RPC handlers registered", protocol.methods().size());

        int exit_code = 0;
        auto sweep = std::chrono::seconds(
            std::clamp(config.sessions.idle_timeout_seconds / 4, 5, 60));

        boost::asio::co_spawn(ioc,
            [&]() -> awaitable<void> {
                auto init = co_await assistant->initialize();
                if (!init) {
                    LOG_ERROR("Initialization failed: {}", init.error().what());
                    exit_code = 1;
                    ioc.stop();
                    co_return;
                }
                boost::asio::co_spawn(ioc, expire_idle_loop(*assistant, sweep),
                                      boost::asio::detached);
                co_await server.start(config.gateway);
            },
            [&](std::exception_ptr ep) {
                if (!ep) return;
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("Gateway failed: {}", e.what());
                }
                exit_code = 1;
                ioc.stop();
            });

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            LOG_INFO("Received shutdown signal");
            boost::asio::co_spawn(ioc,
                [&]() -> awaitable<void> {
                    co_await server.stop();
                    auto saved = assistant->save_index();
                    if (!saved) {
                        LOG_WARN("Index snapshot not saved: {}", saved.error().what());
                    }
                    ioc.stop();
                },
                boost::asio::detached);
        });

        LOG_INFO("Gateway running on port {}. Press Ctrl+C to stop.", config.gateway.port);
        ioc.run();
        LOG_INFO("Gateway stopped.");

        if (exit_code != 0) {
            throw CLI::RuntimeError(exit_code);
        }
    });
}

// ---------------------------------------------------------------------------
// search command
// ---------------------------------------------------------------------------

void register_search_command(CLI::App& app, Config& config) {
    struct Options {
        std::string query;
        size_t top_k = 0;
        double threshold = -1.0;
        std::string category;
        bool as_json = false;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("search", "Search the knowledge base");
    sub->add_option("query", opts->query, "Question to search for")->required();
    sub->add_option("-k,--top-k", opts->top_k, "Maximum number of results");
    sub->add_option("-t,--threshold", opts->threshold, "Minimum similarity (0-1)")
        ->check(CLI::Range(0.0, 1.0));
    sub->add_option("--category", opts->category, "Only entries in this category");
    sub->add_flag("--json", opts->as_json, "Print results as JSON");

    sub->callback([&config, opts]() {
        run_command(config, true, [opts](assistant::Assistant& a) -> awaitable<int> {
            auto options = retrieval::RetrieveOptions::from_config(a.config().retrieval);
            if (opts->top_k != 0) options.k = opts->top_k;
            if (opts->threshold >= 0.0) options.threshold = opts->threshold;
            if (!opts->category.empty()) options.category = opts->category;

            auto results = co_await a.search(opts->query, options);
            if (!results) {
                std::cerr << "Search failed: " << results.error().what() << "\n";
                co_return 1;
            }
            if (opts->as_json) {
                std::cout << json(*results).dump(2) << "\n";
            } else {
                print_results(*results);
            }
            co_return 0;
        });
    });
}

// ---------------------------------------------------------------------------
// ask command
// ---------------------------------------------------------------------------

void register_ask_command(CLI::App& app, Config& config) {
    struct Options {
        std::string query;
        std::string session_id;
        bool as_json = false;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("ask", "Ask the assistant one question");
    sub->add_option("query", opts->query, "Patient question")->required();
    sub->add_option("-s,--session", opts->session_id, "Continue this chat session");
    sub->add_flag("--json", opts->as_json, "Print the reply as JSON");

    sub->callback([&config, opts]() {
        run_command(config, true, [opts](assistant::Assistant& a) -> awaitable<int> {
            auto reply = co_await a.chat(opts->session_id, opts->query);
            if (!reply) {
                std::cerr << "Chat failed: " << reply.error().what() << "\n";
                co_return 1;
            }
            if (opts->as_json) {
                std::cout << json(*reply).dump(2) << "\n";
                co_return 0;
            }
            std::cout << reply->answer << "\n\n";
            if (reply->degraded) {
                std::cout << "(fallback answer; generation unavailable)\n";
            }
            for (const auto& s : reply->sources) {
                std::cout << "  source #" << s.id << " [" << std::fixed
                          << std::setprecision(3) << s.similarity << "] "
                          << s.question << "\n";
            }
            std::cout << "confidence " << std::setprecision(2) << reply->confidence
                      << ", session " << reply->session_id << ", "
                      << reply->response_time_ms << "ms\n";
            co_return 0;
        });
    });
}

// ---------------------------------------------------------------------------
// import command
// ---------------------------------------------------------------------------

void register_import_command(CLI::App& app, Config& config) {
    auto path = std::make_shared<std::string>();

    auto* sub = app.add_subcommand("import", "Import QA entries from a JSON file");
    sub->add_option("file", *path, "JSON array of {question, answer, category, source}")
        ->required()
        ->check(CLI::ExistingFile);

    sub->callback([&config, path]() {
        auto drafts = read_import_file(*path);
        if (!drafts) {
            std::cerr << drafts.error().what() << "\n";
            throw CLI::RuntimeError(1);
        }

        run_command(config, true,
            [drafts = std::move(*drafts)](assistant::Assistant& a) -> awaitable<int> {
                auto created = co_await a.author().batch_create(drafts);
                if (!created) {
                    std::cerr << "Import failed: " << created.error().what() << "\n";
                    co_return 1;
                }
                auto saved = a.save_index();
                if (!saved) {
                    LOG_WARN("Index snapshot not saved: {}", saved.error().what());
                }
                auto unembedded = std::count_if(created->begin(), created->end(),
                    [](const knowledge::QAEntry& e) { return e.needs_embedding(); });
                std::cout << "Imported " << created->size() << " entries";
                if (unembedded > 0) {
                    std::cout << " (" << unembedded
                              << " without embeddings; run `dentassist rebuild`)";
                }
                std::cout << "\n";
                co_return 0;
            });
    });
}

// ---------------------------------------------------------------------------
// rebuild command
// ---------------------------------------------------------------------------

void register_rebuild_command(CLI::App& app, Config& config) {
    auto reembed = std::make_shared<bool>(false);

    auto* sub = app.add_subcommand("rebuild", "Embed missing entries and rebuild the index");
    sub->add_flag("--reembed", *reembed, "Regenerate every embedding");

    sub->callback([&config, reembed]() {
        run_command(config, false, [reembed](assistant::Assistant& a) -> awaitable<int> {
            auto report = co_await a.rebuild_index(*reembed);
            if (!report) {
                std::cerr << "Rebuild failed: " << report.error().what() << "\n";
                co_return 1;
            }
            std::cout << json(*report).dump(2) << "\n";
            if (auto healthy = co_await a.author().verify_integrity(); !healthy) {
                std::cerr << healthy.error().what() << "\n";
            }
            co_return 0;
        });
    });
}

// ---------------------------------------------------------------------------
// stats command
// ---------------------------------------------------------------------------

void register_stats_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("stats", "Print knowledge base, index and chat statistics");

    sub->callback([&config]() {
        run_command(config, true, [](assistant::Assistant& a) -> awaitable<int> {
            auto status = co_await a.status();
            if (!status) {
                std::cerr << "Status failed: " << status.error().what() << "\n";
                co_return 1;
            }
            std::cout << status->dump(2) << "\n";
            co_return 0;
        });
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    sub->callback([&config]() {
        json j = config;
        redact_secrets(j);
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "dentassist " << DENTASSIST_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace dentassist::cli
