#include "maills/services/document_store.hpp"

#include <fmt/format.h>

#include "maills/utils/text_position.hpp"

namespace maills::services {

DocumentStore::DocumentStore(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      strand_(asio::make_strand(executor)) {
}

void DocumentStore::SetPositionEncoding(lsp::PositionEncodingKind encoding) {
  encoding_.store(encoding);
}

auto DocumentStore::PositionEncoding() const -> lsp::PositionEncodingKind {
  return encoding_.load();
}

auto DocumentStore::Open(std::string uri, std::string text, int version)
    -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto snapshot = std::make_shared<const DocumentSnapshot>(
      DocumentSnapshot{
          .uri = uri, .text = std::move(text), .version = version});
  if (documents_.contains(uri)) {
    logger_->debug("DocumentStore reopening {} at version {}", uri, version);
  }
  documents_[uri] = snapshot;
  co_return snapshot;
}

auto DocumentStore::Change(
    std::string uri, int version, std::vector<DocumentEdit> edits)
    -> asio::awaitable<
        std::expected<std::shared_ptr<const DocumentSnapshot>, MaillsError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    co_return MaillsError::Unexpected(MaillsErrorCode::kUnknownDocument, uri);
  }
  const auto& current = it->second;
  if (version <= current->version) {
    co_return MaillsError::Unexpected(
        MaillsErrorCode::kStaleVersion,
        fmt::format(
            "{} version {} is not newer than {}", uri, version,
            current->version));
  }

  // Edits apply to a working copy so a failure leaves the document untouched
  const auto encoding = encoding_.load();
  std::string text = current->text;
  for (std::size_t i = 0; i < edits.size(); ++i) {
    auto& edit = edits[i];
    if (!utils::IsValidUtf8(edit.text)) {
      co_return MaillsError::Unexpected(
          MaillsErrorCode::kInvalidEdit,
          fmt::format("edit {} of {} is not valid UTF-8", i, uri));
    }
    if (!edit.range) {
      text = std::move(edit.text);
      continue;
    }
    auto start = utils::PositionToOffset(text, edit.range->start, encoding);
    auto end = utils::PositionToOffset(text, edit.range->end, encoding);
    if (start > end) {
      co_return MaillsError::Unexpected(
          MaillsErrorCode::kInvalidEdit,
          fmt::format("edit {} of {} ends before it starts", i, uri));
    }
    text.replace(start, end - start, edit.text);
  }

  it->second = std::make_shared<const DocumentSnapshot>(
      DocumentSnapshot{
          .uri = uri, .text = std::move(text), .version = version});
  co_return it->second;
}

auto DocumentStore::Close(std::string uri)
    -> asio::awaitable<std::expected<void, MaillsError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (documents_.erase(uri) == 0) {
    co_return MaillsError::Unexpected(MaillsErrorCode::kUnknownDocument, uri);
  }
  co_return std::expected<void, MaillsError>{};
}

auto DocumentStore::Get(std::string uri)
    -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    co_return nullptr;
  }
  co_return it->second;
}

auto DocumentStore::GetAll()
    -> asio::awaitable<std::vector<std::shared_ptr<const DocumentSnapshot>>> {
  co_await asio::post(strand_, asio::use_awaitable);

  std::vector<std::shared_ptr<const DocumentSnapshot>> snapshots;
  snapshots.reserve(documents_.size());
  for (const auto& [_, snapshot] : documents_) {
    snapshots.push_back(snapshot);
  }
  co_return snapshots;
}

auto DocumentStore::PositionToOffset(std::string uri, lsp::Position position)
    -> asio::awaitable<std::optional<std::size_t>> {
  auto snapshot = co_await Get(std::move(uri));
  if (!snapshot) {
    co_return std::nullopt;
  }
  co_return utils::PositionToOffset(
      snapshot->text, position, encoding_.load());
}

auto DocumentStore::OffsetToPosition(std::string uri, std::size_t offset)
    -> asio::awaitable<std::optional<lsp::Position>> {
  auto snapshot = co_await Get(std::move(uri));
  if (!snapshot) {
    co_return std::nullopt;
  }
  co_return utils::OffsetToPosition(snapshot->text, offset, encoding_.load());
}

}  // namespace maills::services
