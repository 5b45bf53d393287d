#pragma once

#include <verity/search/passage.h>

#include <nlohmann/json.hpp>
#include <vector>

namespace verity::search {

nlohmann::json toJson(const Passage& passage);
nlohmann::json toJson(const RankedResult& result);
nlohmann::json toJson(const std::vector<RankedResult>& results);

} // namespace verity::search
