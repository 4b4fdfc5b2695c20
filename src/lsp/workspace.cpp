#include "lsp/workspace.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// DidChangeWatchedFiles Registration
void to_json(nlohmann::json& j, const RelativePattern& p) {
  j = nlohmann::json{{"baseUri", p.baseUri}, {"pattern", p.pattern}};
}

void from_json(const nlohmann::json& j, RelativePattern& p) {
  // baseUri may also arrive as a WorkspaceFolder
  if (j.at("baseUri").is_object()) {
    j.at("baseUri").at("uri").get_to(p.baseUri);
  } else {
    j.at("baseUri").get_to(p.baseUri);
  }
  j.at("pattern").get_to(p.pattern);
}

void to_json(nlohmann::json& j, const GlobPattern& p) {
  std::visit([&j](auto&& arg) { j = arg; }, p);
}

void from_json(const nlohmann::json& j, GlobPattern& p) {
  if (j.is_string()) {
    p = j.get<Pattern>();
  } else {
    p = j.get<RelativePattern>();
  }
}

void to_json(nlohmann::json& j, const WatchKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, WatchKind& k) {
  k = static_cast<WatchKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const FileSystemWatcher& w) {
  j = nlohmann::json{{"globPattern", w.globPattern}};
  to_json_optional(j, "kind", w.kind);
}

void from_json(const nlohmann::json& j, FileSystemWatcher& w) {
  j.at("globPattern").get_to(w.globPattern);
  from_json_optional(j, "kind", w.kind);
}

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesRegistrationOptions& o) {
  j = nlohmann::json{{"watchers", o.watchers}};
}

void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesRegistrationOptions& o) {
  j.at("watchers").get_to(o.watchers);
}

// DidChangeWatchedFiles Notification
void to_json(nlohmann::json& j, const FileChangeType& p) {
  j = static_cast<int>(p);
}

void from_json(const nlohmann::json& j, FileChangeType& p) {
  p = static_cast<FileChangeType>(j.get<int>());
}

void to_json(nlohmann::json& j, const FileEvent& p) {
  j = nlohmann::json{{"uri", p.uri}, {"type", p.type}};
}

void from_json(const nlohmann::json& j, FileEvent& p) {
  j.at("uri").get_to(p.uri);
  j.at("type").get_to(p.type);
}

void to_json(nlohmann::json& j, const DidChangeWatchedFilesParams& p) {
  j = nlohmann::json{{"changes", p.changes}};
}

void from_json(const nlohmann::json& j, DidChangeWatchedFilesParams& p) {
  j.at("changes").get_to(p.changes);
}

// Execute a command
void to_json(nlohmann::json& j, const ExecuteCommandParams& p) {
  j = nlohmann::json{{"command", p.command}};
  to_json_optional(j, "arguments", p.arguments);
}

void from_json(const nlohmann::json& j, ExecuteCommandParams& p) {
  j.at("command").get_to(p.command);
  from_json_optional(j, "arguments", p.arguments);
}

}  // namespace lsp
