#include <spdlog/spdlog.h>
#include <cmath>
#include <sstream>
#include <verity/config/config_helpers.h>
#include <verity/config/search_config.h>

namespace verity::config {

const char* toString(RerankerMode mode) {
    switch (mode) {
        case RerankerMode::Overlap: return "overlap";
        case RerankerMode::CrossEncoder: return "cross_encoder";
    }
    return "overlap";
}

const char* toString(UnavailablePolicy policy) {
    switch (policy) {
        case UnavailablePolicy::Fail: return "fail";
        case UnavailablePolicy::Fallback: return "fallback";
    }
    return "fail";
}

const char* toString(EmbedderMode mode) {
    switch (mode) {
        case EmbedderMode::Hash: return "hash";
        case EmbedderMode::Onnx: return "onnx";
    }
    return "hash";
}

Result<RerankerMode> parseRerankerMode(const std::string& value) {
    auto v = to_lower(value);
    if (v == "overlap" || v == "jaccard")
        return RerankerMode::Overlap;
    if (v == "cross_encoder" || v == "cross-encoder" || v == "onnx")
        return RerankerMode::CrossEncoder;
    return Error{ErrorCode::InvalidConfiguration, "Unknown reranker mode: " + value};
}

Result<UnavailablePolicy> parseUnavailablePolicy(const std::string& value) {
    auto v = to_lower(value);
    if (v == "fail")
        return UnavailablePolicy::Fail;
    if (v == "fallback")
        return UnavailablePolicy::Fallback;
    return Error{ErrorCode::InvalidConfiguration, "Unknown reranker.on_unavailable: " + value};
}

Result<EmbedderMode> parseEmbedderMode(const std::string& value) {
    auto v = to_lower(value);
    if (v == "hash")
        return EmbedderMode::Hash;
    if (v == "onnx")
        return EmbedderMode::Onnx;
    return Error{ErrorCode::InvalidConfiguration, "Unknown embedder mode: " + value};
}

Result<void> SearchConfig::validate() const {
    auto invalid = [](std::string msg) {
        return Result<void>(Error{ErrorCode::InvalidConfiguration, std::move(msg)});
    };

    if (!std::isfinite(search.alpha) || search.alpha < 0.0 || search.alpha > 1.0)
        return invalid(fmt::format("search.alpha must be in [0, 1], got {}", search.alpha));
    if (!std::isfinite(search.lambda) || search.lambda < 0.0 || search.lambda > 1.0)
        return invalid(fmt::format("search.lambda must be in [0, 1], got {}", search.lambda));
    if (search.minScore && !std::isfinite(*search.minScore))
        return invalid("search.min_score must be finite");
    if (search.retrievalTimeout.count() < 0 || search.rerankTimeout.count() < 0)
        return invalid("timeouts must not be negative");
    if (search.workerThreads == 0)
        return invalid("search.worker_threads must be at least 1");
    if (reranker.maxSequenceLength < 8)
        return invalid("reranker.max_sequence_length is too small");
    if (reranker.batchSize == 0)
        return invalid("reranker.batch_size must be at least 1");
    if (embedder.dimension == 0)
        return invalid("embedder.dimension must be positive");
    if (!std::isfinite(storage.headingWeight) || storage.headingWeight <= 0.0)
        return invalid("storage.heading_weight must be positive");
    return Result<void>();
}

namespace {

// Assign a non-negative integer; negative budgets are a configuration error
Result<void> assignCount(const ConfigMap& map, const std::string& key, size_t& out) {
    auto v = get_int(map, key);
    if (!v)
        return v.error();
    if (v.value()) {
        if (*v.value() < 0) {
            return Error{ErrorCode::InvalidConfiguration,
                         fmt::format("{} must not be negative, got {}", key, *v.value())};
        }
        out = static_cast<size_t>(*v.value());
    }
    return Result<void>();
}

Result<void> assignDouble(const ConfigMap& map, const std::string& key, double& out) {
    auto v = get_double(map, key);
    if (!v)
        return v.error();
    if (v.value())
        out = *v.value();
    return Result<void>();
}

Result<void> assignMillis(const ConfigMap& map, const std::string& key,
                          std::chrono::milliseconds& out) {
    auto v = get_int(map, key);
    if (!v)
        return v.error();
    if (v.value())
        out = std::chrono::milliseconds(*v.value());
    return Result<void>();
}

Result<void> applyMap(const ConfigMap& map, SearchConfig& cfg) {
    // [search]
    for (auto r : {assignDouble(map, "search.alpha", cfg.search.alpha),
                   assignDouble(map, "search.lambda", cfg.search.lambda),
                   assignCount(map, "search.pre_k", cfg.search.preK),
                   assignCount(map, "search.mmr_k", cfg.search.mmrK),
                   assignCount(map, "search.top_n", cfg.search.topN),
                   assignCount(map, "search.worker_threads", cfg.search.workerThreads),
                   assignMillis(map, "search.retrieval_timeout_ms", cfg.search.retrievalTimeout),
                   assignMillis(map, "search.rerank_timeout_ms", cfg.search.rerankTimeout)}) {
        if (!r)
            return r;
    }
    auto minScore = get_double(map, "search.min_score");
    if (!minScore)
        return minScore.error();
    if (minScore.value())
        cfg.search.minScore = minScore.value();
    auto parallel = get_bool(map, "search.parallel_retrieval");
    if (!parallel)
        return parallel.error();
    if (parallel.value())
        cfg.search.parallelRetrieval = *parallel.value();

    // [reranker]
    if (auto it = map.find("reranker.mode"); it != map.end()) {
        auto mode = parseRerankerMode(it->second);
        if (!mode)
            return mode.error();
        cfg.reranker.mode = mode.value();
    }
    if (auto it = map.find("reranker.on_unavailable"); it != map.end()) {
        auto policy = parseUnavailablePolicy(it->second);
        if (!policy)
            return policy.error();
        cfg.reranker.onUnavailable = policy.value();
    }
    if (auto it = map.find("reranker.model_path"); it != map.end())
        cfg.reranker.modelPath = expand_tilde(it->second);
    for (auto r : {assignCount(map, "reranker.max_sequence_length", cfg.reranker.maxSequenceLength),
                   assignCount(map, "reranker.batch_size", cfg.reranker.batchSize)}) {
        if (!r)
            return r;
    }
    if (auto threads = get_int(map, "reranker.num_threads"); !threads) {
        return threads.error();
    } else if (threads.value()) {
        cfg.reranker.numThreads = static_cast<int>(*threads.value());
    }

    // [embedder]
    if (auto it = map.find("embedder.mode"); it != map.end()) {
        auto mode = parseEmbedderMode(it->second);
        if (!mode)
            return mode.error();
        cfg.embedder.mode = mode.value();
    }
    if (auto it = map.find("embedder.model_path"); it != map.end())
        cfg.embedder.modelPath = expand_tilde(it->second);
    for (auto r : {assignCount(map, "embedder.dimension", cfg.embedder.dimension),
                   assignCount(map, "embedder.max_sequence_length",
                               cfg.embedder.maxSequenceLength)}) {
        if (!r)
            return r;
    }
    if (auto threads = get_int(map, "embedder.num_threads"); !threads) {
        return threads.error();
    } else if (threads.value()) {
        cfg.embedder.numThreads = static_cast<int>(*threads.value());
    }

    // [storage]
    if (auto it = map.find("storage.db_path"); it != map.end())
        cfg.storage.dbPath = expand_tilde(it->second);
    return assignDouble(map, "storage.heading_weight", cfg.storage.headingWeight);
}

} // namespace

Result<void> applyEnvironmentOverrides(SearchConfig& config) {
    // Environment values go through the same typed parsing as file values
    ConfigMap env;
    const std::pair<const char*, const char*> mapping[] = {
        {"VERITY_ALPHA", "search.alpha"},         {"VERITY_LAMBDA", "search.lambda"},
        {"VERITY_PRE_K", "search.pre_k"},         {"VERITY_MMR_K", "search.mmr_k"},
        {"VERITY_TOP_N", "search.top_n"},         {"VERITY_RERANKER", "reranker.mode"},
        {"VERITY_RERANK_MODEL", "reranker.model_path"},
        {"VERITY_EMBED_MODEL", "embedder.model_path"},
        {"VERITY_DB", "storage.db_path"},
    };
    for (const auto& [var, key] : mapping) {
        if (auto v = env_value(var)) {
            spdlog::debug("Config override from {}: {} = {}", var, key, *v);
            env[key] = *v;
        }
    }
    if (env.empty()) {
        return Result<void>();
    }
    return applyMap(env, config);
}

Result<SearchConfig> loadSearchConfig(const std::filesystem::path& path) {
    SearchConfig cfg;

    if (!path.empty() && std::filesystem::exists(path)) {
        auto parsed = parse_config_file(path);
        if (!parsed) {
            return parsed.error();
        }
        if (auto r = applyMap(parsed.value(), cfg); !r) {
            return r.error();
        }
        spdlog::debug("Loaded configuration from {}", path.string());
    } else {
        spdlog::debug("No config file at '{}', using defaults", path.string());
    }

    if (auto r = applyEnvironmentOverrides(cfg); !r) {
        return r.error();
    }

    if (cfg.storage.dbPath.empty()) {
        cfg.storage.dbPath = get_data_dir() / "verity.db";
    }

    if (auto r = cfg.validate(); !r) {
        return r.error();
    }
    return cfg;
}

std::string toToml(const SearchConfig& config) {
    std::ostringstream out;
    const auto& s = config.search;
    out << "[search]\n";
    out << fmt::format("alpha = {}\n", s.alpha);
    out << fmt::format("lambda = {}\n", s.lambda);
    out << fmt::format("pre_k = {}\n", s.preK);
    out << fmt::format("mmr_k = {}\n", s.mmrK);
    out << fmt::format("top_n = {}\n", s.topN);
    if (s.minScore)
        out << fmt::format("min_score = {}\n", *s.minScore);
    out << fmt::format("retrieval_timeout_ms = {}\n", s.retrievalTimeout.count());
    out << fmt::format("rerank_timeout_ms = {}\n", s.rerankTimeout.count());
    out << fmt::format("parallel_retrieval = {}\n", s.parallelRetrieval);
    out << fmt::format("worker_threads = {}\n", s.workerThreads);

    const auto& r = config.reranker;
    out << "\n[reranker]\n";
    out << fmt::format("mode = \"{}\"\n", toString(r.mode));
    out << fmt::format("on_unavailable = \"{}\"\n", toString(r.onUnavailable));
    out << fmt::format("model_path = \"{}\"\n", r.modelPath.string());
    out << fmt::format("max_sequence_length = {}\n", r.maxSequenceLength);
    out << fmt::format("batch_size = {}\n", r.batchSize);
    out << fmt::format("num_threads = {}\n", r.numThreads);

    const auto& e = config.embedder;
    out << "\n[embedder]\n";
    out << fmt::format("mode = \"{}\"\n", toString(e.mode));
    out << fmt::format("model_path = \"{}\"\n", e.modelPath.string());
    out << fmt::format("dimension = {}\n", e.dimension);
    out << fmt::format("max_sequence_length = {}\n", e.maxSequenceLength);
    out << fmt::format("num_threads = {}\n", e.numThreads);

    out << "\n[storage]\n";
    out << fmt::format("db_path = \"{}\"\n", config.storage.dbPath.string());
    out << fmt::format("heading_weight = {}\n", config.storage.headingWeight);
    return out.str();
}

} // namespace verity::config
