#include "maills/contacts/contact_source_loader.hpp"

#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

#include <fmt/format.h>

#include "maills/contacts/contact_list_file.hpp"
#include "maills/error/error.hpp"
#include "maills/utils/path_utils.hpp"
#include "maills/utils/scoped_timer.hpp"

namespace maills::contacts {

namespace {

auto ReadTextFile(const CanonicalPath& path)
    -> std::expected<std::string, MaillsError> {
  std::ifstream file(path.Path(), std::ios::binary);
  if (!file) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kFileAccessDenied, path.String());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kFileAccessDenied, path.String());
  }
  return buffer.str();
}

// Inline list entries form one source located at the list file itself
struct Sources {
  std::set<CanonicalPath> files;
  std::optional<CanonicalPath> list_path;
  std::vector<Contact> inline_contacts;
};

void ScanDirectory(
    const std::filesystem::path& dir, Sources& sources,
    ContactIndexBuilder& builder, spdlog::logger& logger) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    builder.AddWarning(
        {.kind = LoadWarningKind::kMissingSource,
         .path = CanonicalPath(dir),
         .message = "vCard directory does not exist"});
    return;
  }

  std::size_t found = 0;
  std::filesystem::recursive_directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  for (; !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    std::error_code status_ec;
    if (it->is_regular_file(status_ec) && IsVCardFile(it->path())) {
      sources.files.insert(CanonicalPath(it->path()));
      ++found;
    }
  }
  if (ec) {
    builder.AddWarning(
        {.kind = LoadWarningKind::kReadFailed,
         .path = CanonicalPath(dir),
         .message = fmt::format("directory scan stopped: {}", ec.message())});
  }
  logger.debug("Found {} vCard files under {}", found, dir.string());
}

void ReadListFile(
    const std::filesystem::path& list_file, Sources& sources,
    ContactIndexBuilder& builder) {
  const CanonicalPath list_path(list_file);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(list_path.Path(), ec)) {
    builder.AddWarning(
        {.kind = LoadWarningKind::kMissingSource,
         .path = list_path,
         .message = "contact list file does not exist"});
    return;
  }

  auto content = ReadTextFile(list_path);
  if (!content) {
    builder.AddWarning(
        {.kind = LoadWarningKind::kReadFailed,
         .path = list_path,
         .message = content.error().message()});
    return;
  }

  const auto base = list_path.Parent();
  for (auto& entry : ParseContactList(*content)) {
    if (auto* file = std::get_if<ContactListFileEntry>(&entry)) {
      auto resolved = base.Resolve(file->path);
      if (!std::filesystem::is_regular_file(resolved.Path(), ec)) {
        builder.AddWarning(
            {.kind = LoadWarningKind::kMissingSource,
             .path = resolved,
             .message = fmt::format(
                 "listed on line {} of {} but does not exist", file->line + 1,
                 list_path)});
        continue;
      }
      sources.files.insert(std::move(resolved));
    } else if (auto* contact = std::get_if<ContactListInlineEntry>(&entry)) {
      sources.list_path = list_path;
      sources.inline_contacts.push_back(Contact{
          .display_name = contact->mailbox.name,
          .nickname = std::nullopt,
          .addresses = {{.address = contact->mailbox.address,
                         .type = std::nullopt,
                         .line = contact->line}},
          .fields = {},
          .source = {.path = list_path, .line = contact->line},
      });
    } else {
      const auto& invalid = std::get<ContactListInvalidEntry>(entry);
      builder.AddWarning(
          {.kind = LoadWarningKind::kInvalidEntry,
           .path = list_path,
           .message = fmt::format(
               "line {}: {}: {}", invalid.line + 1, invalid.reason,
               invalid.text)});
    }
  }
}

void LoadVCardFile(
    const CanonicalPath& path, ContactIndexBuilder& builder,
    spdlog::logger& logger) {
  auto content = ReadTextFile(path);
  if (!content) {
    builder.AddWarning(
        {.kind = LoadWarningKind::kReadFailed,
         .path = path,
         .message = content.error().message()});
    return;
  }

  auto records = ParseVCards(*content);
  if (!records) {
    builder.AddWarning(
        {.kind = LoadWarningKind::kParseFailed,
         .path = path,
         .message = records.error()});
    return;
  }

  std::vector<Contact> contacts;
  contacts.reserve(records->size());
  for (const auto& record : *records) {
    contacts.push_back(ContactFromRecord(record, path));
  }
  logger.trace("Parsed {} cards from {}", contacts.size(), path);
  builder.AddSource(path, std::move(contacts));
}

}  // namespace

auto ContactFromRecord(const VCardRecord& record, const CanonicalPath& path)
    -> Contact {
  Contact contact{
      .display_name = record.formatted_name,
      .nickname = record.nickname,
      .addresses = {},
      .fields = {},
      .source = {.path = path, .line = record.begin_line},
  };

  for (const auto& email : record.emails) {
    contact.addresses.push_back(
        {.address = email.address,
         .type = email.types.empty()
                     ? std::nullopt
                     : std::optional<std::string>(email.types.front()),
         .line = email.line});
  }
  for (const auto& property : record.properties) {
    if (property.value.empty()) {
      continue;
    }
    contact.fields.push_back(
        {.name = property.name,
         .value = property.value,
         .type = property.types.empty()
                     ? std::nullopt
                     : std::optional<std::string>(property.types.front())});
  }
  return contact;
}

auto LoadContacts(
    const ContactSourceOptions& options, std::shared_ptr<spdlog::logger> logger)
    -> LoadResult {
  logger = logger ? logger : spdlog::default_logger();
  utils::ScopedTimer timer("Contact load", logger);

  ContactIndexBuilder builder(logger);
  if (!options.vcard_dir && !options.contact_list_file) {
    logger->info("No contact sources configured, starting with empty index");
    return {.index = builder.Build(), .warnings = {}};
  }

  Sources sources;
  if (options.vcard_dir) {
    ScanDirectory(*options.vcard_dir, sources, builder, *logger);
  }
  if (options.contact_list_file) {
    ReadListFile(*options.contact_list_file, sources, builder);
  }

  // One ordered pass over every source decides duplicate winners
  std::map<CanonicalPath, bool> ordered;
  for (const auto& file : sources.files) {
    ordered.emplace(file, false);
  }
  if (sources.list_path) {
    ordered[*sources.list_path] = true;
  }

  for (const auto& [path, is_list] : ordered) {
    if (is_list) {
      builder.AddSource(path, std::move(sources.inline_contacts));
    } else {
      LoadVCardFile(path, builder, *logger);
    }
  }

  LoadResult result{
      .index = builder.Build(), .warnings = builder.TakeWarnings()};
  for (const auto& warning : result.warnings) {
    logger->warn(
        "Contact source {} ({}): {}", warning.path, ToString(warning.kind),
        warning.message);
  }
  logger->info(
      "Loaded {} contacts with {} addresses from {} sources ({} warnings)",
      result.index.Contacts().size(), result.index.AddressCount(),
      ordered.size(), result.warnings.size());
  return result;
}

}  // namespace maills::contacts
