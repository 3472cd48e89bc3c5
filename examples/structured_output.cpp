/**
 * Parley Structured Output Example
 *
 * Extracts a contact record from free text as schema-shaped JSON.
 *
 * Usage:
 *   ./structured_output <model_path> "<text to extract from>"
 */

#include "parley/parley.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cout << "Usage:\n  " << argv[0] << " <model_path> \"<text to extract from>\"\n";
        return 1;
    }

    auto llm = parley::Llm::create(std::string("llama:") + argv[1]);
    if (!llm) {
        std::cerr << "Error: " << llm.error().to_string() << "\n";
        return 1;
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {"name", {{"type", "string"}}},
            {"email", {{"type", "string"}}},
            {"company", {{"type", "string"}}}
        }},
        {"required", nlohmann::json::array({"name"})}
    };

    parley::MessageCollection messages;
    messages.append_system("Extract the contact described by the user.")
            .append_user(argv[2]);

    auto response = llm->structured(schema)
        .set_temperature(0.0f)
        .set_max_tokens(256)
        .complete(messages);

    if (!response) {
        std::cerr << "Error: " << response.error().to_string() << "\n";
        if (response.error().raw_content) {
            std::cerr << "Raw reply: " << *response.error().raw_content << "\n";
        }
        return 1;
    }

    std::cout << response->structured().dump(2) << "\n";
    return 0;
}
