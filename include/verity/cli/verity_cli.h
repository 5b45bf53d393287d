#pragma once

#include <verity/config/search_config.h>
#include <verity/core/types.h>
#include <verity/search/reranker.h>
#include <verity/storage/passage_store.h>
#include <verity/vector/embedder.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace verity::cli {

/**
 * Command line front end: `verity ingest`, `verity search` and `verity config`.
 */
class VerityCLI {
public:
    VerityCLI();
    ~VerityCLI();

    int run(int argc, char* argv[]);

    // Output stream for command results; defaults to std::cout
    void setOutput(std::ostream& out) { out_ = &out; }

private:
    struct IngestArgs {
        std::string file;
        std::string dbPath;
        std::string titleKey = "title";
        std::string textKey = "text";
        std::string yearKey = "year";
        std::string categoryKey = "category";
        std::string headingKey = "heading";
        size_t chunkTokens = 600;
        size_t chunkOverlap = 50;
    };

    struct SearchArgs {
        std::string query;
        std::string dbPath;
        std::string category;
        int year = 0;
        int preK = 0;
        int mmrK = 0;
        int topN = 0;
        double threshold = 0.0;
        double alpha = 0.0;
        double lambda = 0.0;
        bool json = false;
    };

    void setupCommands();
    void configureLogging() const;
    Result<config::SearchConfig> loadConfig(const std::string& dbOverride) const;

    Result<std::shared_ptr<vector::IEmbedder>> makeEmbedder(const config::SearchConfig& cfg) const;
    Result<std::shared_ptr<storage::IPassageStore>> openStore(const config::SearchConfig& cfg) const;
    Result<std::shared_ptr<search::IReranker>> makeReranker(const config::SearchConfig& cfg) const;

    Result<void> runIngest();
    Result<void> runSearch();
    Result<void> runConfig();

    std::unique_ptr<CLI::App> app_;
    std::ostream* out_;
    std::string configPath_;
    bool verbose_ = false;
    IngestArgs ingest_;
    SearchArgs search_;
};

} // namespace verity::cli
