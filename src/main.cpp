#include "agent.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "http.hpp"
#include "provider.hpp"
#include "tool.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>

static std::atomic<bool> g_interrupt{false};

static void signal_handler(int /*sig*/) {
    g_interrupt.store(true);
}

static void print_usage() {
    std::cout << "Usage: agentstream [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --model NAME         Use specific model\n"
              << "  --debug              Record pipeline events (see /debug)\n"
              << "  --log-events         Log every event on stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /clear               Clear conversation history\n"
              << "  /debug               Toggle event recording and dump recorded events\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY    API key for Anthropic\n"
              << "  ANTHROPIC_BASE_URL   Override the Anthropic API base URL\n"
              << "  AGENTSTREAM_MODEL    Override the configured model\n";
}

// Streams visible text to stdout and tool transitions to stderr while a
// turn runs, then prints the reasoning block and a tool summary.
class TurnPrinter {
public:
    void on_progress(const agentstream::Progress& progress) {
        const std::string& text = progress.assembler.partial_text();
        if (text.size() > printed_) {
            std::cout << text.substr(printed_) << std::flush;
            printed_ = text.size();
        }
        for (const auto& outcome : progress.outcomes) {
            if (outcome.failed() || !outcome.output.contains("tool_update")) continue;
            const auto& update = outcome.output.at("tool_update");
            std::string key = update.at("id").is_string()
                ? update.at("id").get<std::string>()
                : update.at("name").get<std::string>();
            std::string status = update.at("status").get<std::string>();
            auto& last = statuses_[key];
            if (last != status) {
                std::cerr << "[tool] " << update.at("name").get<std::string>()
                          << ": " << status << "\n";
                last = status;
            }
        }
    }

    void finish(const agentstream::AssembledMessage& msg) {
        if (printed_ == 0 || msg.force_stopped) {
            std::cout << msg.text;
        }
        std::cout << "\n";

        if (msg.hidden_text) {
            std::cout << "\n[reasoning]\n" << *msg.hidden_text << "\n";
        }
        if (!msg.tools.empty()) {
            std::cout << "\n[tools]\n";
            for (const auto& tool : msg.tools) {
                std::cout << "  " << tool.name << " (" << agentstream::tool_status_name(tool.status) << ")";
                if (!tool.input.is_null()) std::cout << " input=" << tool.input.dump();
                if (!tool.result.is_null()) {
                    std::cout << " result=" << (tool.result.is_string()
                        ? tool.result.get<std::string>() : tool.result.dump());
                }
                std::cout << "\n";
            }
        }
    }

private:
    size_t printed_ = 0;
    std::unordered_map<std::string, std::string> statuses_;
};

static void run_turn(agentstream::Conversation& conversation, const std::string& input) {
    g_interrupt.store(false);
    TurnPrinter printer;
    auto msg = conversation.send(input, [&printer](const agentstream::Progress& p) {
        printer.on_progress(p);
    });
    printer.finish(msg);
}

static void dump_debug_events(const agentstream::DebugHandler& debug) {
    const auto& events = debug.events();
    std::cout << "Recorded events: " << events.size() << "\n";
    for (const auto& entry : events) {
        std::cout << "  " << entry.event_type << " " << entry.event_data.dump() << "\n";
    }
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string model_name;
    bool debug = false;
    bool log_events = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else if (std::strcmp(argv[i], "--log-events") == 0) {
            log_events = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    agentstream::http_init();
    auto config = agentstream::Config::load();
    if (!model_name.empty()) config.model = model_name;
    if (debug) config.debug.enabled = true;
    if (log_events) config.debug.log_events = true;

    // Ctrl+C aborts the in-flight request; the turn ends as a forced stop
    std::signal(SIGINT, signal_handler);
    agentstream::http_set_abort_flag(&g_interrupt);

    agentstream::CurlHttpClient http_client;
    std::unique_ptr<agentstream::Provider> provider;
    try {
        provider = agentstream::create_provider(config, http_client);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        agentstream::http_cleanup();
        return 1;
    }

    auto agent = std::make_shared<agentstream::AgentComputation>(
        std::move(provider), agentstream::create_builtin_tools(), config);

    agentstream::ConversationOptions options;
    options.stream = config.stream;
    options.marker = config.marker;
    options.debug_enabled = config.debug.enabled;
    options.debug_max_events = config.debug.max_events;
    options.log_events = config.debug.log_events;

    {
        agentstream::Conversation conversation(agent, options);

        if (!message.empty()) {
            run_turn(conversation, message);
        } else {
            std::cout << "agentstream\n"
                      << "Provider: " << config.provider
                      << " | Model: " << agent->model() << "\n"
                      << "Type /help for commands, /quit to exit.\n\n";

            bool debug_on = config.debug.enabled;
            std::string line;
            while (true) {
                std::cout << "agentstream> " << std::flush;
                if (!std::getline(std::cin, line)) {
                    std::cout << "\n";
                    break;
                }
                if (line.empty()) continue;

                if (line[0] == '/') {
                    if (line == "/quit" || line == "/exit") {
                        break;
                    } else if (line == "/clear") {
                        if (agent->try_clear_history()) {
                            std::cout << "History cleared.\n";
                        } else {
                            std::cout << "Previous turn still running, history kept.\n";
                        }
                    } else if (line == "/debug") {
                        if (debug_on) dump_debug_events(conversation.debug());
                        debug_on = !debug_on;
                        conversation.set_debug(debug_on);
                        if (!debug_on) conversation.clear_debug();
                        std::cout << "Debug recording " << (debug_on ? "on" : "off") << ".\n";
                    } else if (line == "/help") {
                        std::cout << "Commands:\n"
                                  << "  /clear    Clear conversation history (refused while a\n"
                                  << "            timed-out turn is still running)\n"
                                  << "  /debug    Toggle event recording (dumps events when turning off)\n"
                                  << "  /quit     Exit\n"
                                  << "  /exit     Exit\n"
                                  << "  /help     Show this help\n";
                    } else {
                        std::cout << "Unknown command: " << line << "\n";
                    }
                    continue;
                }

                // A timed-out turn keeps running until the model call returns
                if (agent->busy()) {
                    std::cout << "Previous turn still running, try again shortly.\n";
                    continue;
                }
                run_turn(conversation, line);
                std::cout << "\n";
            }
        }
    }

    agentstream::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
