#include "engine_config.hpp"
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace comparables_rag {

using json = nlohmann::json;

namespace {

// spdlog::level::from_str maps any unknown name to "off".
bool is_known_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    if (!j.is_object()) return cfg;

    cfg.embedding_provider = j.value("embedding_provider", cfg.embedding_provider);
    cfg.embedding_model = j.value("embedding_model", cfg.embedding_model);
    cfg.api_key = j.value("api_key", cfg.api_key);
    cfg.embedding_dimension = j.value("embedding_dimension", cfg.embedding_dimension);
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (!is_known_log_level(cfg.log_level)) {
        spdlog::warn("⚠️ Unknown log_level '{}', falling back to info", cfg.log_level);
        cfg.log_level = "info";
    }
    return cfg;
}

const std::vector<std::string>& default_config_search_paths() {
    static const std::vector<std::string> paths = {
        "rag_config.json",          // 1. Current Working Directory
        "../rag_config.json",       // 2. Parent Directory (common in build/)
        "../../rag_config.json"     // 3. Project Root (from build/Release)
    };
    return paths;
}

EngineConfig load_engine_config(const std::optional<std::string>& explicit_path,
                                const std::vector<std::string>& search_paths) {
    std::vector<std::string> candidates;
    if (explicit_path) candidates.push_back(*explicit_path);
    candidates.insert(candidates.end(), search_paths.begin(), search_paths.end());

    EngineConfig cfg;
    std::ifstream f;
    std::string found_path;
    for (const auto& path : candidates) {
        f.open(path);
        if (f.is_open()) {
            found_path = path;
            break;
        }
        f.clear();
    }

    if (found_path.empty()) {
        spdlog::warn("⚠️ rag_config.json not found, using built-in defaults");
    } else {
        try {
            cfg = EngineConfig::from_json(json::parse(f));
            spdlog::info("🛰️ Loaded engine config from {} (provider: {}, dim: {})",
                         found_path, cfg.embedding_provider, cfg.embedding_dimension);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}. Using defaults.", found_path, e.what());
            cfg = EngineConfig{};
        }
    }

    if (const char* env_key = std::getenv("RAG_EMBEDDING_API_KEY")) {
        if (*env_key != '\0') cfg.api_key = env_key;
    }
    return cfg;
}

} // namespace comparables_rag
