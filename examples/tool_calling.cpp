/**
 * Parley Tool Calling Example
 *
 * Interactive CLI demonstrating the two-phase tool-calling protocol against a
 * local GGUF model.
 *
 * Usage:
 *   ./tool_calling <model_path> [options]
 *
 * Options:
 *   --temperature <float>    Sampling temperature (default: 0.2)
 *   --max-tokens <int>       Max tokens to generate (default: 512)
 *   --context-size <int>     Context window size (default: 8192)
 *   --max-rounds <int>       Tool rounds allowed per user turn (default: 4)
 *   --system <prompt>        System prompt
 *   --verbose                Show library log output
 *   --help                   Show this help message
 */

#include "parley/parley.hpp"

#include <ctime>
#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// Example Tools
// ============================================================================

std::string get_weather(const nlohmann::json& args) {
    const std::string location = args.is_object() ? args.value("location", std::string("unknown")) : "unknown";
    return nlohmann::json{{"location", location}, {"temperature_c", 18}, {"conditions", "partly cloudy"}}.dump();
}

std::string get_current_time(const nlohmann::json&) {
    auto now = std::time(nullptr);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    return std::string(buf);
}

std::string execute_tool(const parley::ToolCall& call) {
    if (call.name() == "get_weather") {
        return get_weather(call.arguments());
    }
    if (call.name() == "get_current_time") {
        return get_current_time(call.arguments());
    }
    return nlohmann::json{{"error", "unknown tool " + call.name()}}.dump();
}

struct CLIArgs {
    std::string model_path;
    float temperature = 0.2f;
    int max_tokens = 512;
    int context_size = 8192;
    int max_rounds = 4;
    std::string system_prompt = "You are a helpful assistant. Use tools when they help.";
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Parley Tool Calling Example\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <model_path> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --temperature <float>    Sampling temperature (default: 0.2)\n";
    std::cout << "  --max-tokens <int>       Max tokens to generate (default: 512)\n";
    std::cout << "  --context-size <int>     Context window size (default: 8192)\n";
    std::cout << "  --max-rounds <int>       Tool rounds allowed per user turn (default: 4)\n";
    std::cout << "  --system <prompt>        System prompt\n";
    std::cout << "  --verbose                Show library log output\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  /history        Print the conversation as JSON\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    if (argc < 2 || std::string(argv[1]) == "--help") {
        args.help = true;
        return args;
    }

    args.model_path = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--temperature" && i + 1 < argc) {
            args.temperature = std::stof(argv[++i]);
        }
        else if (arg == "--max-tokens" && i + 1 < argc) {
            args.max_tokens = std::stoi(argv[++i]);
        }
        else if (arg == "--context-size" && i + 1 < argc) {
            args.context_size = std::stoi(argv[++i]);
        }
        else if (arg == "--max-rounds" && i + 1 < argc) {
            args.max_rounds = std::stoi(argv[++i]);
        }
        else if (arg == "--system" && i + 1 < argc) {
            args.system_prompt = argv[++i];
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }

    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

std::vector<parley::ToolDefinition> build_tools() {
    std::vector<parley::ToolDefinition> tools;

    auto weather = parley::ToolDefinition::create(
        "get_weather",
        "Get the current weather for a location",
        nlohmann::json{
            {"type", "object"},
            {"properties", {{"location", {{"type", "string"}}}}},
            {"required", nlohmann::json::array({"location"})}
        });
    auto clock = parley::ToolDefinition::create(
        "get_current_time",
        "Get the current local date and time",
        nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}});

    if (weather) tools.push_back(*weather);
    if (clock) tools.push_back(*clock);
    return tools;
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return args.model_path.empty() ? 1 : 0;
    }

    if (args.verbose) {
        parley::set_log_level(parley::LogLevel::Info);
    }

    parley::provider::ProviderOptions options;
    options.extra["context_size"] = args.context_size;

    std::cout << "Loading model...\n";
    auto llm = parley::Llm::create("llama:" + args.model_path, options);
    if (!llm) {
        std::cerr << "Error: " << llm.error().to_string() << "\n";
        return 1;
    }
    llm->set_temperature(args.temperature).set_max_tokens(args.max_tokens);

    auto builder = llm->with_tools(build_tools());
    std::cout << "Offering " << builder.tools().size() << " tools.\n";

    parley::MessageCollection messages;
    messages.append_system(args.system_prompt);

    std::string line;
    while (true) {
        std::cout << "\nYou: ";
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            break;
        }

        line.erase(0, line.find_first_not_of(" \t\n\r"));
        line.erase(line.find_last_not_of(" \t\n\r") + 1);

        if (line.empty()) {
            continue;
        }
        if (line == "/quit" || line == "/exit") {
            std::cout << "Goodbye!\n";
            break;
        }
        if (line == "/history") {
            std::cout << messages.to_serializable().dump(2) << "\n";
            continue;
        }

        messages.append_user(line);

        // The caller bounds the tool loop
        for (int round = 0; round < args.max_rounds; ++round) {
            auto response = builder.complete(messages);
            if (!response) {
                std::cerr << "\nError: " << response.error().to_string() << "\n";
                if (response.error().raw_content) {
                    std::cerr << "Raw reply: " << *response.error().raw_content << "\n";
                }
                break;
            }

            if (response->state() == parley::TurnState::Terminal) {
                messages.append_assistant(response->content());
                std::cout << "\nAssistant: " << response->content() << "\n";
                print_separator();
                std::cout << "Tokens: " << response->usage().prompt_tokens << " prompt + "
                          << response->usage().output_tokens << " output = "
                          << response->usage().total_tokens << " total\n";
                break;
            }

            messages.from_response(*response);
            for (const auto& call : response->tool_calls()) {
                std::cout << "[tool] " << call.name() << " " << call.arguments().dump() << "\n";
                messages.append_tool_result(call.id(), execute_tool(call));
            }
        }
    }

    std::cout << "\n";
    return 0;
}
