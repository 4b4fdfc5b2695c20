#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// DidChangeWatchedFiles Registration
using Pattern = std::string;

struct RelativePattern {
  Uri baseUri;
  Pattern pattern;
};

void to_json(nlohmann::json& j, const RelativePattern& p);
void from_json(const nlohmann::json& j, RelativePattern& p);

using GlobPattern = std::variant<Pattern, RelativePattern>;

void to_json(nlohmann::json& j, const GlobPattern& p);
void from_json(const nlohmann::json& j, GlobPattern& p);

// Bit flags; combine with |
enum class WatchKind {
  kCreate = 1,
  kChange = 2,
  kDelete = 4,
};

inline auto operator|(WatchKind lhs, WatchKind rhs) -> WatchKind {
  return static_cast<WatchKind>(static_cast<int>(lhs) | static_cast<int>(rhs));
}

void to_json(nlohmann::json& j, const WatchKind& k);
void from_json(const nlohmann::json& j, WatchKind& k);

struct FileSystemWatcher {
  GlobPattern globPattern;
  std::optional<WatchKind> kind;
};

void to_json(nlohmann::json& j, const FileSystemWatcher& w);
void from_json(const nlohmann::json& j, FileSystemWatcher& w);

struct DidChangeWatchedFilesRegistrationOptions {
  std::vector<FileSystemWatcher> watchers;
};

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesRegistrationOptions& o);
void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesRegistrationOptions& o);

// DidChangeWatchedFiles Notification
enum class FileChangeType { kCreated = 1, kChanged = 2, kDeleted = 3 };

void to_json(nlohmann::json& j, const FileChangeType& p);
void from_json(const nlohmann::json& j, FileChangeType& p);

struct FileEvent {
  DocumentUri uri;
  FileChangeType type;
};

void to_json(nlohmann::json& j, const FileEvent& p);
void from_json(const nlohmann::json& j, FileEvent& p);

struct DidChangeWatchedFilesParams {
  std::vector<FileEvent> changes;
};

void to_json(nlohmann::json& j, const DidChangeWatchedFilesParams& p);
void from_json(const nlohmann::json& j, DidChangeWatchedFilesParams& p);

// Execute a command
struct ExecuteCommandParams : WorkDoneProgressParams {
  std::string command;
  std::optional<std::vector<nlohmann::json>> arguments;
};

void to_json(nlohmann::json& j, const ExecuteCommandParams& p);
void from_json(const nlohmann::json& j, ExecuteCommandParams& p);

// LSPAny
using ExecuteCommandResult = nlohmann::json;

}  // namespace lsp
