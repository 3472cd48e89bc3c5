#pragma once

/**
 * @file parley.hpp
 * @brief Main convenience header for Parley
 *
 * Include this single header to get access to all public Parley APIs.
 *
 * Parley is a header-only C++17 library for multi-turn conversations with a
 * language model, including tool-calling round trips and structured output,
 * independent of the vendor that runs the model. A llama.cpp adapter ships
 * as a separate library (parley_llama).
 *
 * Quick Start:
 * @code
 * #include <parley/parley.hpp>
 *
 * int main() {
 *     auto llm = parley::Llm::create("llama:path/to/model.gguf");
 *     if (!llm) {
 *         std::cerr << "Error: " << llm.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     parley::MessageCollection messages;
 *     messages.append_system("You are a helpful assistant.")
 *             .append_user("Hello!");
 *
 *     auto response = llm->set_temperature(0.2f).complete(messages);
 *     if (response) {
 *         std::cout << "Assistant: " << response->content() << std::endl;
 *     } else {
 *         std::cerr << "Error: " << response.error().to_string() << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - parley::Llm: Session entry point bound to "provider:model"
 * - parley::MessageCollection / parley::Message: Conversation history
 * - parley::ToolDefinition / parley::ToolCall: Function calling
 * - parley::Response, StructuredResponse, ToolResponse: Completion results
 * - parley::Error: Structured error handling
 *
 * Thread Safety:
 * - complete() is the only blocking call
 * - One caller thread per MessageCollection at a time
 */

// Core types
#include "types.hpp"
#include "log.hpp"
#include "tool.hpp"
#include "message.hpp"
#include "message_collection.hpp"
#include "response.hpp"

// Provider interface (for custom adapters and testing)
#include "provider/provider.hpp"

// Public API
#include "engine/builders.hpp"
#include "llm.hpp"

/**
 * @namespace parley
 * @brief Main namespace for Parley
 *
 * Nested namespaces:
 * - parley::provider - Provider interface and adapters
 * - parley::engine - Builders, validation and reply mapping
 */
