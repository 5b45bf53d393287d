#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <verity/search/reranker.h>
#include <verity/text/word_tokenizer.h>

namespace verity::search {

Result<std::vector<RerankScore>>
OverlapReranker::scoreDocuments(const std::string& query,
                                const std::vector<std::string>& documents) {
    std::vector<RerankScore> scores;
    scores.reserve(documents.size());
    for (const auto& doc : documents) {
        scores.push_back({text::jaccard(query, doc), std::nullopt});
    }
    return scores;
}

CrossEncoderReranker::CrossEncoderReranker(std::shared_ptr<ICrossEncoderModel> model,
                                           size_t batchSize)
    : model_(std::move(model)), batchSize_(std::max<size_t>(1, batchSize)) {}

std::string CrossEncoderReranker::name() const {
    return model_ ? "cross_encoder:" + model_->modelName() : "cross_encoder";
}

Result<std::vector<RerankScore>>
CrossEncoderReranker::scoreDocuments(const std::string& query,
                                     const std::vector<std::string>& documents) {
    if (!isReady()) {
        return Error{ErrorCode::RerankerUnavailable, "Cross-encoder model not available"};
    }

    std::vector<RerankScore> scores;
    scores.reserve(documents.size());

    for (size_t start = 0; start < documents.size(); start += batchSize_) {
        const size_t end = std::min(documents.size(), start + batchSize_);
        std::vector<std::string> batch(documents.begin() + static_cast<std::ptrdiff_t>(start),
                                       documents.begin() + static_cast<std::ptrdiff_t>(end));

        auto logits = model_->scoreBatch(query, batch);
        if (!logits) {
            spdlog::error("[Reranker] Model '{}' failed: {}", model_->modelName(),
                          logits.error().message);
            return Error{ErrorCode::RerankerUnavailable,
                         "Cross-encoder scoring failed: " + logits.error().message};
        }
        if (logits.value().size() != batch.size()) {
            return Error{ErrorCode::RerankerUnavailable,
                         fmt::format("Cross-encoder returned {} scores for {} documents",
                                     logits.value().size(), batch.size())};
        }
        for (float logit : logits.value()) {
            double raw = static_cast<double>(logit);
            scores.push_back({1.0 / (1.0 + std::exp(-raw)), raw});
        }
    }
    return scores;
}

Result<std::shared_ptr<IReranker>> createReranker(const config::RerankerSettings& settings,
                                                  const CrossEncoderLoader& loader) {
    if (settings.mode == config::RerankerMode::Overlap) {
        spdlog::debug("[Reranker] Using overlap reranker");
        return std::shared_ptr<IReranker>(std::make_shared<OverlapReranker>());
    }

    Error failure{ErrorCode::RerankerUnavailable, "No cross-encoder backend available"};
    if (loader) {
        auto model = loader(settings);
        if (model && model.value() && model.value()->isValid()) {
            spdlog::info("[Reranker] Using cross-encoder '{}'", model.value()->modelName());
            return std::shared_ptr<IReranker>(
                std::make_shared<CrossEncoderReranker>(model.value(), settings.batchSize));
        }
        if (!model) {
            failure.message = "Failed to load cross-encoder: " + model.error().message;
        } else {
            failure.message = "Cross-encoder model is not valid";
        }
    }

    if (settings.onUnavailable == config::UnavailablePolicy::Fallback) {
        spdlog::warn("[Reranker] {}; falling back to overlap reranker", failure.message);
        return std::shared_ptr<IReranker>(std::make_shared<OverlapReranker>());
    }

    spdlog::error("[Reranker] {}", failure.message);
    return failure;
}

} // namespace verity::search
