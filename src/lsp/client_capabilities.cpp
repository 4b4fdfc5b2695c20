#include "lsp/client_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "dynamicRegistration", c.dynamicRegistration);
  to_json_optional(j, "relativePatternSupport", c.relativePatternSupport);
}

void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesClientCapabilities& c) {
  from_json_optional(j, "dynamicRegistration", c.dynamicRegistration);
  from_json_optional(j, "relativePatternSupport", c.relativePatternSupport);
}

void to_json(nlohmann::json& j, const WorkspaceClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "didChangeWatchedFiles", c.didChangeWatchedFiles);
}

void from_json(const nlohmann::json& j, WorkspaceClientCapabilities& c) {
  from_json_optional(j, "didChangeWatchedFiles", c.didChangeWatchedFiles);
}

void to_json(nlohmann::json& j, const ShowDocumentClientCapabilities& c) {
  j = nlohmann::json{{"support", c.support}};
}

void from_json(const nlohmann::json& j, ShowDocumentClientCapabilities& c) {
  j.at("support").get_to(c.support);
}

void to_json(nlohmann::json& j, const WindowClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "showDocument", c.showDocument);
}

void from_json(const nlohmann::json& j, WindowClientCapabilities& c) {
  from_json_optional(j, "showDocument", c.showDocument);
}

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncodings", c.positionEncodings);
}

void from_json(const nlohmann::json& j, GeneralClientCapabilities& c) {
  from_json_optional(j, "positionEncodings", c.positionEncodings);
}

void to_json(nlohmann::json& j, const ClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspace", c.workspace);
  to_json_optional(j, "window", c.window);
  to_json_optional(j, "general", c.general);
}

void from_json(const nlohmann::json& j, ClientCapabilities& c) {
  from_json_optional(j, "workspace", c.workspace);
  from_json_optional(j, "window", c.window);
  from_json_optional(j, "general", c.general);
}

}  // namespace lsp
