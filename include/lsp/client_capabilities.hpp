#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Only the capabilities the server inspects are modelled; the rest of the
// client payload is ignored.

struct DidChangeWatchedFilesClientCapabilities {
  std::optional<bool> dynamicRegistration;
  std::optional<bool> relativePatternSupport;
};

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesClientCapabilities& c);
void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesClientCapabilities& c);

struct WorkspaceClientCapabilities {
  std::optional<DidChangeWatchedFilesClientCapabilities> didChangeWatchedFiles;
};

void to_json(nlohmann::json& j, const WorkspaceClientCapabilities& c);
void from_json(const nlohmann::json& j, WorkspaceClientCapabilities& c);

struct ShowDocumentClientCapabilities {
  bool support;
};

void to_json(nlohmann::json& j, const ShowDocumentClientCapabilities& c);
void from_json(const nlohmann::json& j, ShowDocumentClientCapabilities& c);

struct WindowClientCapabilities {
  std::optional<ShowDocumentClientCapabilities> showDocument;
};

void to_json(nlohmann::json& j, const WindowClientCapabilities& c);
void from_json(const nlohmann::json& j, WindowClientCapabilities& c);

struct GeneralClientCapabilities {
  // Raw strings: clients may offer encodings this server does not know
  std::optional<std::vector<std::string>> positionEncodings;
};

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c);
void from_json(const nlohmann::json& j, GeneralClientCapabilities& c);

struct ClientCapabilities {
  std::optional<WorkspaceClientCapabilities> workspace;
  std::optional<WindowClientCapabilities> window;
  std::optional<GeneralClientCapabilities> general;
};

void to_json(nlohmann::json& j, const ClientCapabilities& c);
void from_json(const nlohmann::json& j, ClientCapabilities& c);

}  // namespace lsp
