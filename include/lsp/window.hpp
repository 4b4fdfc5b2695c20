#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Show Document Request
struct ShowDocumentParams {
  Uri uri;
  std::optional<bool> external;
  std::optional<bool> takeFocus;
  std::optional<Range> selection;
};

void to_json(nlohmann::json& j, const ShowDocumentParams& p);
void from_json(const nlohmann::json& j, ShowDocumentParams& p);

struct ShowDocumentResult {
  bool success;
};

void to_json(nlohmann::json& j, const ShowDocumentResult& r);
void from_json(const nlohmann::json& j, ShowDocumentResult& r);

}  // namespace lsp
