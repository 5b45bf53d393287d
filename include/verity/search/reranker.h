#pragma once

#include <verity/config/search_config.h>
#include <verity/core/types.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace verity::search {

/**
 * @brief Relevance of one (query, document) pair
 */
struct RerankScore {
    double score = 0.0;       // Higher is more relevant
    std::optional<double> raw; // Model output before normalization, if the model has one
};

/**
 * @brief Interface for pairwise rerankers
 *
 * Scores must be deterministic for identical inputs. Their scale is implementation-defined and not
 * comparable across implementations.
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query
     *
     * @param query The search query
     * @param documents The document texts to score
     * @return One score per document, in input order, or error
     */
    virtual Result<std::vector<RerankScore>>
    scoreDocuments(const std::string& query, const std::vector<std::string>& documents) = 0;

    /**
     * @brief Check if the reranker is ready to accept requests
     */
    virtual bool isReady() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Jaccard similarity of lower-cased alphanumeric term sets. Needs no model.
 */
class OverlapReranker final : public IReranker {
public:
    Result<std::vector<RerankScore>> scoreDocuments(const std::string& query,
                                                    const std::vector<std::string>& documents) override;

    bool isReady() const override { return true; }
    std::string name() const override { return "overlap"; }
};

/**
 * @brief A loaded pairwise relevance model (e.g. a BGE or MS-MARCO cross-encoder).
 */
class ICrossEncoderModel {
public:
    virtual ~ICrossEncoderModel() = default;

    /**
     * @brief Raw relevance logits, one per document, in input order
     */
    virtual Result<std::vector<float>> scoreBatch(const std::string& query,
                                                  const std::vector<std::string>& documents) = 0;

    virtual bool isValid() const = 0;
    virtual std::string modelName() const = 0;
};

/**
 * @brief Adapts a cross-encoder model to IReranker.
 *
 * Documents are scored in batches of batchSize; each logit is passed through a sigmoid so scores
 * fall in [0, 1] and the logit is kept as the raw score. Model failures surface as
 * RerankerUnavailable.
 */
class CrossEncoderReranker final : public IReranker {
public:
    explicit CrossEncoderReranker(std::shared_ptr<ICrossEncoderModel> model, size_t batchSize = 16);

    Result<std::vector<RerankScore>> scoreDocuments(const std::string& query,
                                                    const std::vector<std::string>& documents) override;

    bool isReady() const override { return model_ && model_->isValid(); }
    std::string name() const override;

private:
    std::shared_ptr<ICrossEncoderModel> model_;
    size_t batchSize_;
};

using CrossEncoderLoader =
    std::function<Result<std::shared_ptr<ICrossEncoderModel>>(const config::RerankerSettings&)>;

/**
 * @brief Build the configured reranker.
 *
 * For RerankerMode::CrossEncoder the loader is asked for a model. When it is missing or fails, the
 * onUnavailable policy decides between returning RerankerUnavailable and building an
 * OverlapReranker instead. The decision is made here, once, never per query.
 */
Result<std::shared_ptr<IReranker>> createReranker(const config::RerankerSettings& settings,
                                                  const CrossEncoderLoader& loader = {});

} // namespace verity::search
