#include <verity/search/result_json.h>

namespace verity::search {

namespace {
template <typename T> nlohmann::json orNull(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}
} // namespace

nlohmann::json toJson(const Passage& passage) {
    return nlohmann::json{
        {"id", passage.id},
        {"doc_id", passage.docId},
        {"title", passage.title},
        {"heading", orNull(passage.heading)},
        {"section_no", orNull(passage.sectionNo)},
        {"text", passage.text},
        {"parent_text", passage.contextText()},
        {"year", orNull(passage.year)},
        {"category", orNull(passage.category)},
    };
}

nlohmann::json toJson(const RankedResult& result) {
    const auto& c = result.candidate;
    auto j = toJson(c.passage);
    j["scores"] = {
        {"lexical", orNull(c.lexicalScore)},
        {"distance", orNull(c.distance)},
        {"semantic", orNull(c.semanticScore)},
        {"lexical_norm", c.lexicalNorm},
        {"semantic_norm", c.semanticNorm},
        {"fused", c.fusedScore},
        {"rerank", result.rerankScore},
        {"rerank_raw", orNull(result.rawRerankScore)},
    };
    return j;
}

nlohmann::json toJson(const std::vector<RankedResult>& results) {
    auto arr = nlohmann::json::array();
    for (const auto& r : results) {
        arr.push_back(toJson(r));
    }
    return arr;
}

} // namespace verity::search
