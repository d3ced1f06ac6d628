#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace comparables_rag {

struct EngineConfig {
    std::string embedding_provider = "hashing"; // "hashing" | "gemini" | "none"
    std::string embedding_model = "text-embedding-004";
    std::string api_key;
    int embedding_dimension = 384;
    std::string host = "127.0.0.1";
    int port = 5003;
    std::string log_level = "info";

    static EngineConfig from_json(const nlohmann::json& j);
};

// Default lookup order, relative to the working directory.
const std::vector<std::string>& default_config_search_paths();

// Reads the first existing file (explicit path first, then the search paths).
// Never throws: a missing or unreadable file yields defaults.
// RAG_EMBEDDING_API_KEY in the environment overrides api_key.
EngineConfig load_engine_config(const std::optional<std::string>& explicit_path = std::nullopt,
                                const std::vector<std::string>& search_paths = default_config_search_paths());

} // namespace comparables_rag
