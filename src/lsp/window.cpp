#include "lsp/window.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const ShowDocumentParams& p) {
  j = nlohmann::json{{"uri", p.uri}};
  to_json_optional(j, "external", p.external);
  to_json_optional(j, "takeFocus", p.takeFocus);
  to_json_optional(j, "selection", p.selection);
}

void from_json(const nlohmann::json& j, ShowDocumentParams& p) {
  j.at("uri").get_to(p.uri);
  from_json_optional(j, "external", p.external);
  from_json_optional(j, "takeFocus", p.takeFocus);
  from_json_optional(j, "selection", p.selection);
}

void to_json(nlohmann::json& j, const ShowDocumentResult& r) {
  j = nlohmann::json{{"success", r.success}};
}

void from_json(const nlohmann::json& j, ShowDocumentResult& r) {
  j.at("success").get_to(r.success);
}

}  // namespace lsp
