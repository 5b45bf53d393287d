#pragma once

#include <verity/config/search_config.h>
#include <verity/core/types.h>
#include <verity/search/reranker.h>
#include <verity/vector/embedder.h>

#include <filesystem>
#include <memory>

namespace verity::onnx {

/**
 * @brief Resolved files of a local transformer model.
 *
 * The configured path may name the model directory (holding model.onnx and vocab.txt) or the
 * .onnx file itself, in which case vocab.txt is looked up beside it.
 */
struct ModelFiles {
    std::filesystem::path model;
    std::filesystem::path vocab;
};

Result<ModelFiles> resolveModelFiles(const std::filesystem::path& modelPath);

/**
 * @brief Load a cross-encoder (e.g. bge-reranker-base exported to ONNX) for CrossEncoderReranker.
 *
 * Matches search::CrossEncoderLoader so it can be handed to search::createReranker.
 */
Result<std::shared_ptr<search::ICrossEncoderModel>>
loadOnnxCrossEncoder(const config::RerankerSettings& settings);

/**
 * @brief Load a sentence embedding model. Token states are mean-pooled over the attention mask
 * and L2-normalized; the hidden size must equal settings.dimension.
 */
Result<std::shared_ptr<vector::IEmbedder>>
createOnnxEmbedder(const config::EmbedderSettings& settings);

} // namespace verity::onnx
