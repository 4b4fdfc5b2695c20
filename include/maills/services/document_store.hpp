#pragma once

#include <atomic>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "lsp/basic.hpp"
#include "maills/error/error.hpp"

namespace maills::services {

// Immutable view of one open document at one version
struct DocumentSnapshot {
  std::string uri;
  std::string text;
  int version = 0;
};

// Replaces range with text, or the whole document when range is empty
struct DocumentEdit {
  std::optional<lsp::Range> range;
  std::string text;
};

// Open documents keyed by uri. Mutations are serialized on a strand and
// replace the stored snapshot only when every edit of a change succeeds.
class DocumentStore {
 public:
  explicit DocumentStore(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  DocumentStore(const DocumentStore&) = delete;
  DocumentStore(DocumentStore&&) = delete;
  auto operator=(const DocumentStore&) -> DocumentStore& = delete;
  auto operator=(DocumentStore&&) -> DocumentStore& = delete;

  ~DocumentStore() = default;

  // Encoding of incoming positions, fixed during initialize
  void SetPositionEncoding(lsp::PositionEncodingKind encoding);
  [[nodiscard]] auto PositionEncoding() const -> lsp::PositionEncodingKind;

  // Inserts or replaces the document
  auto Open(std::string uri, std::string text, int version)
      -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>>;

  // Applies edits in order. Fails with kUnknownDocument, kStaleVersion when
  // version is not newer than the stored one, or kInvalidEdit.
  auto Change(std::string uri, int version, std::vector<DocumentEdit> edits)
      -> asio::awaitable<
          std::expected<std::shared_ptr<const DocumentSnapshot>, MaillsError>>;

  auto Close(std::string uri)
      -> asio::awaitable<std::expected<void, MaillsError>>;

  // nullptr when the document is not open
  auto Get(std::string uri)
      -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>>;

  auto GetAll()
      -> asio::awaitable<std::vector<std::shared_ptr<const DocumentSnapshot>>>;

  auto PositionToOffset(std::string uri, lsp::Position position)
      -> asio::awaitable<std::optional<std::size_t>>;

  auto OffsetToPosition(std::string uri, std::size_t offset)
      -> asio::awaitable<std::optional<lsp::Position>>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
  asio::strand<asio::any_io_executor> strand_;
  std::atomic<lsp::PositionEncodingKind> encoding_{
      lsp::PositionEncodingKind::kUtf16};
  std::unordered_map<std::string, std::shared_ptr<const DocumentSnapshot>>
      documents_;
};

}  // namespace maills::services
