#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Goto Definition Request
struct DefinitionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {};

void to_json(nlohmann::json& j, const DefinitionParams& p);
void from_json(const nlohmann::json& j, DefinitionParams& p);

// A single location or null; the server never returns location links
using DefinitionResult = std::optional<Location>;

void to_json(nlohmann::json& j, const DefinitionResult& r);
void from_json(const nlohmann::json& j, DefinitionResult& r);

}  // namespace lsp
