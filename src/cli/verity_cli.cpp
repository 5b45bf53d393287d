#include <verity/cli/verity_cli.h>
#include <verity/config/config_helpers.h>
#include <verity/ingest/jsonl_ingestor.h>
#include <verity/search/result_json.h>
#include <verity/search/retrieval_pipeline.h>
#include <verity/vector/hash_embedder.h>
#ifdef VERITY_HAVE_ONNX
#include <verity/onnx/onnx_models.h>
#endif

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>

namespace verity::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(std::string s) {
    config::trim(s);
    s = config::to_lower(s);
    if (s == "trace")
        return spdlog::level::trace;
    if (s == "debug")
        return spdlog::level::debug;
    if (s == "info")
        return spdlog::level::info;
    if (s == "warn" || s == "warning")
        return spdlog::level::warn;
    if (s == "error" || s == "err")
        return spdlog::level::err;
    if (s == "critical")
        return spdlog::level::critical;
    if (s == "off")
        return spdlog::level::off;
    return std::nullopt;
}

// Single-line preview of a passage for table output
std::string snippet(const std::string& text, size_t width) {
    std::string s;
    s.reserve(std::min(text.size(), width + 3));
    for (char c : text) {
        if (s.size() >= width) {
            s += "...";
            break;
        }
        s.push_back(c == '\n' || c == '\t' ? ' ' : c);
    }
    return s;
}

} // namespace

VerityCLI::VerityCLI() : out_(&std::cout) {}

VerityCLI::~VerityCLI() = default;

void VerityCLI::setupCommands() {
    app_ = std::make_unique<CLI::App>("Hybrid passage retrieval with reranking", "verity");
    app_->require_subcommand(1);
    app_->add_option("--config", configPath_, "Configuration file (TOML)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");

    auto* ingest = app_->add_subcommand("ingest", "Ingest a JSON-lines corpus");
    ingest->add_option("file", ingest_.file, "JSONL file, one document per line")
        ->required()
        ->check(CLI::ExistingFile);
    ingest->add_option("--db", ingest_.dbPath, "Passage database path");
    ingest->add_option("--title-key", ingest_.titleKey, "Record key holding the title")
        ->capture_default_str();
    ingest->add_option("--text-key", ingest_.textKey, "Record key holding the body text")
        ->capture_default_str();
    ingest->add_option("--year-key", ingest_.yearKey, "Record key holding the year")
        ->capture_default_str();
    ingest->add_option("--category-key", ingest_.categoryKey, "Record key holding the category")
        ->capture_default_str();
    ingest->add_option("--heading-key", ingest_.headingKey, "Record key holding a heading")
        ->capture_default_str();
    ingest->add_option("--chunk-tokens", ingest_.chunkTokens, "Target passage size in tokens")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    ingest->add_option("--chunk-overlap", ingest_.chunkOverlap, "Overlap between passages in tokens")
        ->capture_default_str();
    ingest->callback([this]() {
        configureLogging();
        if (auto r = runIngest(); !r) {
            spdlog::error("Ingest failed: {}", r.error().message);
            throw CLI::RuntimeError(1);
        }
    });

    auto* search = app_->add_subcommand("search", "Search the passage index");
    search->add_option("query", search_.query, "Query text")->required();
    search->add_option("--db", search_.dbPath, "Passage database path");
    search->add_option("--category", search_.category, "Only passages of this category");
    search->add_option("--year", search_.year, "Only passages of this year");
    search->add_option("--pre-k", search_.preK, "Fused candidate pool size")
        ->check(CLI::NonNegativeNumber);
    search->add_option("--mmr-k", search_.mmrK, "Diversity pool size")
        ->check(CLI::NonNegativeNumber);
    search->add_option("--top-n", search_.topN, "Number of results")
        ->check(CLI::NonNegativeNumber);
    search->add_option("--threshold", search_.threshold, "Drop results scoring below this");
    search->add_option("--alpha", search_.alpha, "Lexical weight in fusion")
        ->check(CLI::Range(0.0, 1.0));
    search->add_option("--lambda", search_.lambda, "Relevance weight in MMR")
        ->check(CLI::Range(0.0, 1.0));
    search->add_flag("--json", search_.json, "Output results as JSON");
    search->callback([this]() {
        configureLogging();
        if (auto r = runSearch(); !r) {
            spdlog::error("Search failed: {}", r.error().message);
            throw CLI::RuntimeError(1);
        }
    });

    auto* cfg = app_->add_subcommand("config", "Print the effective configuration");
    cfg->callback([this]() {
        configureLogging();
        if (auto r = runConfig(); !r) {
            spdlog::error("{}", r.error().message);
            throw CLI::RuntimeError(1);
        }
    });
}

int VerityCLI::run(int argc, char* argv[]) {
    setupCommands();
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }
    return 0;
}

// VERITY_LOG_LEVEL wins, then --verbose, else warnings only
void VerityCLI::configureLogging() const {
    if (const char* envLvl = std::getenv("VERITY_LOG_LEVEL")) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

Result<config::SearchConfig> VerityCLI::loadConfig(const std::string& dbOverride) const {
    auto path = config::get_config_path(configPath_);
    spdlog::debug("Using config {}", path.string());
    auto cfg = config::loadSearchConfig(path);
    if (!cfg)
        return cfg.error();
    if (!dbOverride.empty()) {
        cfg.value().storage.dbPath = dbOverride;
    }
    return cfg;
}

Result<std::shared_ptr<vector::IEmbedder>>
VerityCLI::makeEmbedder(const config::SearchConfig& cfg) const {
    switch (cfg.embedder.mode) {
        case config::EmbedderMode::Hash:
            return std::shared_ptr<vector::IEmbedder>(
                std::make_shared<vector::HashEmbedder>(cfg.embedder.dimension));
        case config::EmbedderMode::Onnx:
#ifdef VERITY_HAVE_ONNX
            return onnx::createOnnxEmbedder(cfg.embedder);
#else
            return Error{ErrorCode::NotSupported, "verity was built without ONNX Runtime"};
#endif
    }
    return Error{ErrorCode::InvalidConfiguration, "Unknown embedder mode"};
}

Result<std::shared_ptr<storage::IPassageStore>>
VerityCLI::openStore(const config::SearchConfig& cfg) const {
    std::error_code ec;
    auto parent = cfg.storage.dbPath.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::DatabaseError,
                         fmt::format("Cannot create {}: {}", parent.string(), ec.message())};
        }
    }
    storage::SqliteStoreConfig storeCfg;
    storeCfg.path = cfg.storage.dbPath.string();
    storeCfg.dimension = cfg.embedder.dimension;
    storeCfg.headingWeight = cfg.storage.headingWeight;
    auto store = storage::SqlitePassageStore::open(storeCfg);
    if (!store)
        return store.error();
    return std::shared_ptr<storage::IPassageStore>(std::move(store).value());
}

Result<std::shared_ptr<search::IReranker>>
VerityCLI::makeReranker(const config::SearchConfig& cfg) const {
#ifdef VERITY_HAVE_ONNX
    return search::createReranker(cfg.reranker, onnx::loadOnnxCrossEncoder);
#else
    return search::createReranker(cfg.reranker);
#endif
}

Result<void> VerityCLI::runIngest() {
    auto cfg = loadConfig(ingest_.dbPath);
    if (!cfg)
        return cfg.error();
    auto embedder = makeEmbedder(cfg.value());
    if (!embedder)
        return embedder.error();
    auto store = openStore(cfg.value());
    if (!store)
        return store.error();

    ingest::IngestConfig ingestCfg;
    ingestCfg.titleKey = ingest_.titleKey;
    ingestCfg.textKey = ingest_.textKey;
    ingestCfg.yearKey = ingest_.yearKey;
    ingestCfg.categoryKey = ingest_.categoryKey;
    ingestCfg.headingKey = ingest_.headingKey;
    ingestCfg.splitter.chunkTokens = ingest_.chunkTokens;
    ingestCfg.splitter.overlapTokens = ingest_.chunkOverlap;

    ingest::JsonlIngestor ingestor(store.value(), embedder.value(), ingestCfg);
    auto stats = ingestor.ingestFile(ingest_.file);
    if (!stats)
        return stats.error();

    const auto& s = stats.value();
    *out_ << fmt::format("Ingested {} documents, {} passages ({} already present, {} malformed "
                         "lines) into {}\n",
                         s.documents, s.passages, s.skipped, s.malformed,
                         cfg.value().storage.dbPath.string());
    return Result<void>();
}

Result<void> VerityCLI::runSearch() {
    auto cfg = loadConfig(search_.dbPath);
    if (!cfg)
        return cfg.error();
    auto embedder = makeEmbedder(cfg.value());
    if (!embedder)
        return embedder.error();
    auto store = openStore(cfg.value());
    if (!store)
        return store.error();
    auto reranker = makeReranker(cfg.value());
    if (!reranker)
        return reranker.error();

    search::RetrievalPipeline pipeline(store.value(), embedder.value(), reranker.value(),
                                       cfg.value().search);

    auto* cmd = app_->get_subcommand("search");
    auto query = pipeline.makeQuery(search_.query);
    if (cmd->count("--category"))
        query.filter.category = search_.category;
    if (cmd->count("--year"))
        query.filter.year = search_.year;
    if (cmd->count("--pre-k"))
        query.preK = search_.preK;
    if (cmd->count("--mmr-k"))
        query.mmrK = search_.mmrK;
    if (cmd->count("--top-n"))
        query.topN = search_.topN;
    if (cmd->count("--threshold"))
        query.threshold = search_.threshold;
    if (cmd->count("--alpha"))
        query.alpha = search_.alpha;
    if (cmd->count("--lambda"))
        query.lambda = search_.lambda;

    auto results = pipeline.search(query);
    if (!results)
        return results.error();

    if (search_.json) {
        nlohmann::json doc;
        doc["query"] = search_.query;
        doc["reranker"] = reranker.value()->name();
        doc["results"] = search::toJson(results.value());
        *out_ << doc.dump(2) << "\n";
        return Result<void>();
    }

    if (results.value().empty()) {
        *out_ << "No results.\n";
        return Result<void>();
    }
    size_t rank = 0;
    for (const auto& r : results.value()) {
        const auto& p = r.candidate.passage;
        std::string meta = p.title;
        if (p.heading)
            meta += " > " + *p.heading;
        if (p.year)
            meta += fmt::format(" ({})", *p.year);
        if (p.category)
            meta += " [" + *p.category + "]";
        *out_ << fmt::format("{:>2}. {:.4f}  fused={:+.3f}  #{}  {}\n", ++rank, r.rerankScore,
                             r.candidate.fusedScore, p.id, meta);
        *out_ << fmt::format("    {}\n", snippet(p.text, 160));
    }
    return Result<void>();
}

Result<void> VerityCLI::runConfig() {
    auto cfg = loadConfig("");
    if (!cfg)
        return cfg.error();
    *out_ << fmt::format("# {}\n", config::get_config_path(configPath_).string());
    *out_ << config::toToml(cfg.value());
    return Result<void>();
}

} // namespace verity::cli
