#include <verity/onnx/onnx_models.h>
#include <verity/text/wordpiece_tokenizer.h>

#include <fmt/format.h>
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Process-wide ONNX Runtime environment. Leaked on purpose: Ort::Env must outlive every session,
// including ones held by static objects.
static std::mutex* g_onnx_env_mutex = new std::mutex();
static Ort::Env* g_onnx_env = nullptr;

static Ort::Env& get_ort_env() {
    std::lock_guard<std::mutex> lock(*g_onnx_env_mutex);
    if (!g_onnx_env) {
        spdlog::info("[ONNX] Initializing global Ort::Env");
        g_onnx_env = new Ort::Env(ORT_LOGGING_LEVEL_WARNING, "Verity");
    }
    return *g_onnx_env;
}

namespace verity::onnx {

Result<ModelFiles> resolveModelFiles(const fs::path& modelPath) {
    if (modelPath.empty()) {
        return Error{ErrorCode::InvalidConfiguration, "No model path configured"};
    }
    std::error_code ec;
    ModelFiles files;
    if (fs::is_directory(modelPath, ec)) {
        files.model = modelPath / "model.onnx";
        files.vocab = modelPath / "vocab.txt";
    } else {
        files.model = modelPath;
        files.vocab = modelPath.parent_path() / "vocab.txt";
    }
    if (!fs::exists(files.model, ec)) {
        return Error{ErrorCode::FileNotFound, "Model not found: " + files.model.string()};
    }
    if (!fs::exists(files.vocab, ec)) {
        return Error{ErrorCode::FileNotFound, "Vocabulary not found: " + files.vocab.string()};
    }
    return files;
}

namespace {

/**
 * Session plus the names of its inputs and outputs. Run() is serialized per session.
 */
class OnnxSession {
public:
    OnnxSession(std::string tag, std::unique_ptr<Ort::Session> session)
        : tag_(std::move(tag)), session_(std::move(session)) {
        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            inputNames_.emplace_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            outputNames_.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
        }
    }

    static Result<std::unique_ptr<OnnxSession>> load(const std::string& tag, const fs::path& model,
                                                     int numThreads) {
        try {
            Ort::SessionOptions options;
            options.SetIntraOpNumThreads(numThreads > 0 ? numThreads : 4);
            options.SetInterOpNumThreads(1);
            options.AddConfigEntry("session.intra_op.allow_spinning", "0");
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);

            spdlog::info("[{}] Creating Ort::Session for {}", tag, model.string());
            auto session = std::make_unique<Ort::Session>(get_ort_env(), model.c_str(), options);
            auto wrapped = std::make_unique<OnnxSession>(tag, std::move(session));
            spdlog::info("[{}] Session ready (inputs={}, outputs={})", tag,
                         wrapped->inputNames_.size(), wrapped->outputNames_.size());
            return std::move(wrapped);
        } catch (const Ort::Exception& e) {
            spdlog::error("[{}] Failed to load {}: {}", tag, model.string(), e.what());
            return Error{ErrorCode::NotInitialized,
                         std::string("Failed to load ONNX model: ") + e.what()};
        }
    }

    /**
     * Run a [batch, seqLen] int64 batch. Token type ids are fed only when the graph has a third
     * input. Returns the first output's data and shape.
     */
    Result<std::pair<std::vector<float>, std::vector<int64_t>>>
    run(std::vector<int64_t>& ids, std::vector<int64_t>& mask, std::vector<int64_t>& types,
        size_t batch, size_t seqLen) {
        std::vector<int64_t> shape = {static_cast<int64_t>(batch), static_cast<int64_t>(seqLen)};
        auto memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<Ort::Value> inputs;
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(memoryInfo, ids.data(), ids.size(),
                                                           shape.data(), shape.size()));
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(memoryInfo, mask.data(), mask.size(),
                                                           shape.data(), shape.size()));
        if (inputNames_.size() >= 3) {
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memoryInfo, types.data(),
                                                               types.size(), shape.data(),
                                                               shape.size()));
        }

        std::vector<const char*> inNames;
        for (size_t i = 0; i < inputs.size() && i < inputNames_.size(); ++i)
            inNames.push_back(inputNames_[i].c_str());
        std::vector<const char*> outNames;
        if (!outputNames_.empty())
            outNames.push_back(outputNames_.front().c_str());

        try {
            std::lock_guard<std::mutex> lock(runMutex_);
            auto outputs = session_->Run(Ort::RunOptions{nullptr}, inNames.data(), inputs.data(),
                                         inNames.size(), outNames.data(), outNames.size());
            if (outputs.empty()) {
                return Error{ErrorCode::InternalError, "Model returned no outputs"};
            }
            auto info = outputs[0].GetTensorTypeAndShapeInfo();
            const float* data = outputs[0].GetTensorData<float>();
            std::vector<float> values(data, data + info.GetElementCount());
            return std::make_pair(std::move(values), info.GetShape());
        } catch (const Ort::Exception& e) {
            spdlog::error("[{}] Inference failed: {}", tag_, e.what());
            return Error{ErrorCode::InternalError, std::string("ONNX error: ") + e.what()};
        }
    }

private:
    std::string tag_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> inputNames_;
    std::vector<std::string> outputNames_;
    std::mutex runMutex_;
};

struct Batch {
    std::vector<int64_t> ids;
    std::vector<int64_t> mask;
    std::vector<int64_t> types;

    void append(const text::EncodedSequence& seq) {
        ids.insert(ids.end(), seq.inputIds.begin(), seq.inputIds.end());
        mask.insert(mask.end(), seq.attentionMask.begin(), seq.attentionMask.end());
        types.insert(types.end(), seq.tokenTypeIds.begin(), seq.tokenTypeIds.end());
    }
};

class OnnxCrossEncoder final : public search::ICrossEncoderModel {
public:
    OnnxCrossEncoder(std::string name, std::unique_ptr<OnnxSession> session,
                     text::WordPieceTokenizer tokenizer, size_t maxLength)
        : name_(std::move(name)), session_(std::move(session)), tokenizer_(std::move(tokenizer)),
          maxLength_(maxLength) {}

    Result<std::vector<float>> scoreBatch(const std::string& query,
                                          const std::vector<std::string>& documents) override {
        if (documents.empty())
            return std::vector<float>{};

        Batch batch;
        for (const auto& doc : documents) {
            batch.append(tokenizer_.encodePair(query, doc, maxLength_));
        }
        auto out = session_->run(batch.ids, batch.mask, batch.types, documents.size(), maxLength_);
        if (!out)
            return out.error();

        // logits are [batch] or [batch, 1]; with two classes the last one is "relevant"
        const auto& [values, shape] = out.value();
        size_t stride = values.size() / documents.size();
        if (stride == 0) {
            return Error{ErrorCode::InternalError, "Unexpected reranker output shape"};
        }
        std::vector<float> logits;
        logits.reserve(documents.size());
        for (size_t i = 0; i < documents.size(); ++i) {
            logits.push_back(values[i * stride + stride - 1]);
        }
        return logits;
    }

    bool isValid() const override { return session_ != nullptr; }
    std::string modelName() const override { return name_; }

private:
    std::string name_;
    std::unique_ptr<OnnxSession> session_;
    text::WordPieceTokenizer tokenizer_;
    size_t maxLength_;
};

class OnnxEmbedder final : public vector::IEmbedder {
public:
    OnnxEmbedder(std::unique_ptr<OnnxSession> session, text::WordPieceTokenizer tokenizer,
                 size_t maxLength, size_t dimension)
        : session_(std::move(session)), tokenizer_(std::move(tokenizer)), maxLength_(maxLength),
          dimension_(dimension) {}

    Result<Embedding> generateEmbedding(const std::string& text) override {
        auto batch = generateBatchEmbeddings({text});
        if (!batch)
            return batch.error();
        return std::move(batch.value().front());
    }

    Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        if (texts.empty())
            return std::vector<Embedding>{};

        Batch batch;
        for (const auto& t : texts) {
            batch.append(tokenizer_.encode(t, maxLength_));
        }
        auto out = session_->run(batch.ids, batch.mask, batch.types, texts.size(), maxLength_);
        if (!out) {
            return Error{ErrorCode::EmbeddingFailed, out.error().message};
        }
        const auto& [values, shape] = out.value();
        const size_t hidden = shape.empty() ? 0 : static_cast<size_t>(shape.back());
        if (hidden != dimension_) {
            return Error{ErrorCode::EmbeddingFailed,
                         fmt::format("Model hidden size {} does not match configured dimension {}",
                                     hidden, dimension_)};
        }

        std::vector<Embedding> result;
        result.reserve(texts.size());
        for (size_t b = 0; b < texts.size(); ++b) {
            Embedding emb(hidden, 0.0f);
            if (shape.size() == 2) {
                // Already pooled: [batch, hidden]
                std::copy_n(values.begin() + b * hidden, hidden, emb.begin());
            } else {
                // [batch, seq, hidden]: mean over attended tokens
                double count = 0.0;
                for (size_t t = 0; t < maxLength_; ++t) {
                    if (batch.mask[b * maxLength_ + t] == 0)
                        continue;
                    const float* row = values.data() + (b * maxLength_ + t) * hidden;
                    for (size_t h = 0; h < hidden; ++h)
                        emb[h] += row[h];
                    count += 1.0;
                }
                if (count > 0) {
                    for (auto& v : emb)
                        v = static_cast<float>(v / count);
                }
            }
            double norm = 0.0;
            for (float v : emb)
                norm += static_cast<double>(v) * v;
            norm = std::sqrt(norm);
            if (norm > 0) {
                for (auto& v : emb)
                    v = static_cast<float>(v / norm);
            }
            result.push_back(std::move(emb));
        }
        return result;
    }

    bool isAvailable() const override { return session_ != nullptr; }
    std::string getProviderName() const override { return "ONNX"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    std::unique_ptr<OnnxSession> session_;
    text::WordPieceTokenizer tokenizer_;
    size_t maxLength_;
    size_t dimension_;
};

} // namespace

Result<std::shared_ptr<search::ICrossEncoderModel>>
loadOnnxCrossEncoder(const config::RerankerSettings& settings) {
    auto files = resolveModelFiles(settings.modelPath);
    if (!files)
        return files.error();

    auto tokenizer = text::WordPieceTokenizer::fromFile(files.value().vocab);
    if (!tokenizer)
        return tokenizer.error();

    auto session = OnnxSession::load("Reranker", files.value().model, settings.numThreads);
    if (!session)
        return session.error();

    auto name = files.value().model.parent_path().filename().string();
    return std::shared_ptr<search::ICrossEncoderModel>(std::make_shared<OnnxCrossEncoder>(
        name, std::move(session).value(), std::move(tokenizer).value(),
        settings.maxSequenceLength));
}

Result<std::shared_ptr<vector::IEmbedder>>
createOnnxEmbedder(const config::EmbedderSettings& settings) {
    auto files = resolveModelFiles(settings.modelPath);
    if (!files)
        return files.error();

    auto tokenizer = text::WordPieceTokenizer::fromFile(files.value().vocab);
    if (!tokenizer)
        return tokenizer.error();

    auto session = OnnxSession::load("Embedder", files.value().model, settings.numThreads);
    if (!session)
        return session.error();

    return std::shared_ptr<vector::IEmbedder>(std::make_shared<OnnxEmbedder>(
        std::move(session).value(), std::move(tokenizer).value(), settings.maxSequenceLength,
        settings.dimension));
}

} // namespace verity::onnx
