#include "lsp/navigation.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const DefinitionParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
}

void from_json(const nlohmann::json& j, DefinitionParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("position").get_to(p.position);
}

void to_json(nlohmann::json& j, const DefinitionResult& r) {
  if (r.has_value()) {
    j = *r;
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, DefinitionResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<Location>();
  }
}

}  // namespace lsp
