#include "maills/services/resolution_engine.hpp"

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "maills/contacts/contact_index.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using Catch::Matchers::ContainsSubstring;
using maills::CanonicalPath;
using maills::contacts::Contact;
using maills::contacts::ContactIndex;
using maills::contacts::ContactIndexBuilder;
using maills::services::DocumentSnapshot;
using maills::services::ResolutionEngine;

namespace {

auto MakeContact(
    std::optional<std::string> name, std::string address, std::string path,
    int line) -> Contact {
  return Contact{
      .display_name = std::move(name),
      .nickname = std::nullopt,
      .addresses = {{.address = std::move(address),
                     .type = std::nullopt,
                     .line = line + 2}},
      .fields = {},
      .source = {.path = CanonicalPath(path), .line = line},
  };
}

auto SampleIndex() -> std::shared_ptr<const ContactIndex> {
  auto jane =
      MakeContact("Jane Doe", "jane@example.com", "/contacts/jane.vcf", 0);
  jane.nickname = "JD";
  jane.addresses.front().type = "work";
  jane.fields.push_back(
      {.name = "ORG", .value = "Example Corp", .type = std::nullopt});
  jane.fields.push_back(
      {.name = "TEL", .value = "+1 555 0100", .type = "cell"});

  ContactIndexBuilder builder;
  builder.AddSource(CanonicalPath("/contacts/jane.vcf"), {jane});
  builder.AddSource(
      CanonicalPath("/contacts/other.vcf"),
      {MakeContact("Janet Roe", "janet@other.org", "/contacts/other.vcf", 0),
       MakeContact("Bob Smith", "bob@work.example", "/contacts/other.vcf", 6),
       MakeContact(
           std::nullopt, "x.jane@example.net", "/contacts/other.vcf", 12)});
  return std::make_shared<const ContactIndex>(builder.Build());
}

auto MakeDocument(std::string text) -> std::shared_ptr<const DocumentSnapshot> {
  return std::make_shared<const DocumentSnapshot>(DocumentSnapshot{
      .uri = "file:///tmp/draft.eml", .text = std::move(text), .version = 1});
}

const std::string kDraft =
    "To: jan\n"
    "\n"
    "Hi jane@example.com and stranger@example.org\n";

constexpr auto kUtf16 = lsp::PositionEncodingKind::kUtf16;

}  // namespace

TEST_CASE("ResolutionEngine hover over a known address", "[resolution]") {
  ResolutionEngine engine(MakeDocument(kDraft), SampleIndex(), kUtf16);

  auto hover = engine.Hover({.line = 2, .character = 5});
  REQUIRE(hover.has_value());
  CHECK(hover->contents.kind == lsp::MarkupKind::kMarkdown);
  CHECK(hover->range == lsp::Range{
                            .start = {.line = 2, .character = 3},
                            .end = {.line = 2, .character = 19}});

  const auto& markdown = hover->contents.value;
  CHECK_THAT(markdown, ContainsSubstring("# Jane Doe"));
  CHECK_THAT(markdown, ContainsSubstring("_JD_"));
  CHECK_THAT(markdown, ContainsSubstring("- jane@example.com (work)"));
  CHECK_THAT(markdown, ContainsSubstring("Organizations:\n- Example Corp"));
  CHECK_THAT(
      markdown, ContainsSubstring("Telephone numbers:\n- +1 555 0100 (cell)"));
  CHECK_THAT(markdown, ContainsSubstring("jane.vcf:1"));
}

TEST_CASE("ResolutionEngine hover outside known addresses", "[resolution]") {
  ResolutionEngine engine(MakeDocument(kDraft), SampleIndex(), kUtf16);

  auto unknown = engine.Hover({.line = 2, .character = 30});
  REQUIRE(unknown.has_value());
  CHECK_THAT(
      unknown->contents.value, ContainsSubstring("stranger@example.org"));
  CHECK_THAT(unknown->contents.value, ContainsSubstring("Not in contacts"));

  CHECK_FALSE(engine.Hover({.line = 2, .character = 1}).has_value());
  CHECK_FALSE(engine.Hover({.line = 40, .character = 0}).has_value());

  ResolutionEngine closed(nullptr, SampleIndex(), kUtf16);
  CHECK_FALSE(closed.Hover({.line = 2, .character = 5}).has_value());
}

TEST_CASE(
    "ResolutionEngine hover ranges use the client encoding",
    "[resolution]") {
  // "é" is one UTF-16 unit and two UTF-8 bytes
  auto document = MakeDocument("To: \xC3\xA9 <jane@example.com>\n");

  ResolutionEngine utf16(document, SampleIndex(), kUtf16);
  auto hover = utf16.Hover({.line = 0, .character = 7});
  REQUIRE(hover.has_value());
  CHECK(hover->range->start.character == 7);
  CHECK(hover->range->end.character == 23);

  ResolutionEngine utf8(
      document, SampleIndex(), lsp::PositionEncodingKind::kUtf8);
  hover = utf8.Hover({.line = 0, .character = 8});
  REQUIRE(hover.has_value());
  CHECK(hover->range->start.character == 8);
}

TEST_CASE("ResolutionEngine definition points at the source", "[resolution]") {
  ResolutionEngine engine(MakeDocument(kDraft), SampleIndex(), kUtf16);

  auto location = engine.Definition({.line = 2, .character = 3});
  REQUIRE(location.has_value());
  CHECK(location->uri == CanonicalPath("/contacts/jane.vcf").ToUri());
  // Line of the EMAIL property
  CHECK(location->range.start == lsp::Position{.line = 2, .character = 0});

  CHECK_FALSE(engine.Definition({.line = 2, .character = 30}).has_value());
  CHECK_FALSE(engine.Definition({.line = 0, .character = 0}).has_value());
}

TEST_CASE("ResolutionEngine answers repeated queries alike", "[resolution]") {
  auto document = MakeDocument(kDraft);
  auto index = SampleIndex();
  ResolutionEngine engine(document, index, kUtf16);
  ResolutionEngine again(document, index, kUtf16);

  const lsp::Position on_address{.line = 2, .character = 5};
  auto hover = engine.Hover(on_address);
  auto second_hover = engine.Hover(on_address);
  REQUIRE(hover.has_value());
  REQUIRE(second_hover.has_value());
  CHECK(nlohmann::json(*hover) == nlohmann::json(*second_hover));
  CHECK(
      nlohmann::json(*hover) == nlohmann::json(*again.Hover(on_address)));

  auto definition = engine.Definition(on_address);
  auto second_definition = engine.Definition(on_address);
  REQUIRE(definition.has_value());
  REQUIRE(second_definition.has_value());
  CHECK(nlohmann::json(*definition) == nlohmann::json(*second_definition));

  const lsp::Position in_header{.line = 0, .character = 7};
  auto completion = nlohmann::json(engine.Completion(in_header));
  CHECK(completion == nlohmann::json(engine.Completion(in_header)));
  CHECK(completion == nlohmann::json(again.Completion(in_header)));
  CHECK(completion["items"].size() == 3);
}

TEST_CASE("ResolutionEngine completion ranks and edits", "[resolution]") {
  ResolutionEngine engine(MakeDocument(kDraft), SampleIndex(), kUtf16);

  auto list = engine.Completion({.line = 0, .character = 7});
  CHECK_FALSE(list.isIncomplete);
  REQUIRE(list.items.size() == 3);

  // Prefix matches first, then substring matches
  CHECK(list.items[0].label == "Jane Doe <jane@example.com>");
  CHECK(list.items[1].label == "Janet Roe <janet@other.org>");
  CHECK(list.items[2].label == "x.jane@example.net");
  CHECK(list.items[0].sortText == "0000");
  CHECK(list.items[2].sortText == "0002");

  const auto& first = list.items[0];
  REQUIRE(first.labelDetails.has_value());
  CHECK(first.labelDetails->description == "Example Corp");
  REQUIRE(first.textEdit.has_value());
  // A header position gets the whole mailbox
  CHECK(first.textEdit->newText == "Jane Doe <jane@example.com>");
  CHECK(first.textEdit->range == lsp::Range{
                                     .start = {.line = 0, .character = 4},
                                     .end = {.line = 0, .character = 7}});
  REQUIRE(first.data.has_value());
  CHECK(*first.data == nlohmann::json{{"address", "jane@example.com"}});
}

TEST_CASE(
    "ResolutionEngine completion inserts bare addresses",
    "[resolution]") {
  SECTION("After an angle bracket") {
    ResolutionEngine engine(
        MakeDocument("To: Jane <ja\n"), SampleIndex(), kUtf16);
    auto list = engine.Completion({.line = 0, .character = 12});
    REQUIRE_FALSE(list.items.empty());
    CHECK(list.items[0].textEdit->newText == "jane@example.com");
  }

  SECTION("In free text") {
    ResolutionEngine engine(
        MakeDocument("please ask bo"), SampleIndex(), kUtf16);
    auto list = engine.Completion({.line = 0, .character = 13});
    REQUIRE(list.items.size() == 1);
    CHECK(list.items[0].textEdit->newText == "bob@work.example");
  }

  SECTION("Matches by nickname") {
    ResolutionEngine engine(MakeDocument("jd"), SampleIndex(), kUtf16);
    auto list = engine.Completion({.line = 0, .character = 2});
    REQUIRE(list.items.size() == 1);
    CHECK(list.items[0].detail == "Jane Doe");
  }
}

TEST_CASE(
    "ResolutionEngine completion outside address regions",
    "[resolution]") {
  ResolutionEngine engine(
      MakeDocument("To: bob@example.com\nSubject: ja\n\nbody"),
      SampleIndex(), kUtf16);
  CHECK(engine.Completion({.line = 1, .character = 11}).items.empty());

  ResolutionEngine closed(nullptr, SampleIndex(), kUtf16);
  CHECK(closed.Completion({.line = 0, .character = 0}).items.empty());
}

TEST_CASE("ResolutionEngine completion caps the result", "[resolution]") {
  std::vector<Contact> contacts;
  for (int i = 0; i < 150; ++i) {
    contacts.push_back(MakeContact(
        std::nullopt, fmt::format("user{:03}@example.com", i),
        "/contacts/many.vcf", i * 4));
  }
  ContactIndexBuilder builder;
  builder.AddSource(CanonicalPath("/contacts/many.vcf"), std::move(contacts));
  auto index = std::make_shared<const ContactIndex>(builder.Build());

  ResolutionEngine engine(MakeDocument(""), index, kUtf16);
  auto list = engine.Completion({.line = 0, .character = 0});

  CHECK(list.isIncomplete);
  REQUIRE(list.items.size() == maills::services::kMaxCompletionItems);
  CHECK(list.items.front().label == "user000@example.com");
  CHECK(list.items.back().label == "user099@example.com");
  CHECK(list.items.back().sortText == "0099");
}

TEST_CASE("ResolutionEngine resolves completion items", "[resolution]") {
  ResolutionEngine engine(nullptr, SampleIndex(), kUtf16);

  lsp::CompletionItem item;
  item.label = "Jane Doe <jane@example.com>";
  item.data = nlohmann::json{{"address", "JANE@example.com"}};
  auto resolved = engine.ResolveCompletionItem(item);
  REQUIRE(resolved.documentation.has_value());
  CHECK_THAT(resolved.documentation->value, ContainsSubstring("# Jane Doe"));

  lsp::CompletionItem plain;
  plain.label = "nothing";
  CHECK_FALSE(engine.ResolveCompletionItem(plain).documentation.has_value());

  plain.data = nlohmann::json{{"address", "nobody@example.com"}};
  CHECK_FALSE(engine.ResolveCompletionItem(plain).documentation.has_value());
}

TEST_CASE("ResolutionEngine flags unknown addresses", "[resolution]") {
  ResolutionEngine engine(MakeDocument(kDraft), SampleIndex(), kUtf16);

  auto diagnostics = engine.Diagnostics();
  REQUIRE(diagnostics.size() == 1);
  const auto& diagnostic = diagnostics[0];
  CHECK(diagnostic.severity == lsp::DiagnosticSeverity::kHint);
  CHECK(diagnostic.code == "unknown-address");
  CHECK(diagnostic.source == "maills");
  CHECK(diagnostic.range.start == lsp::Position{.line = 2, .character = 24});
  REQUIRE(diagnostic.data.has_value());
  CHECK(
      *diagnostic.data ==
      nlohmann::json{{"address", "stranger@example.org"}});
}

TEST_CASE("ResolutionEngine offers to add unknown addresses", "[resolution]") {
  ResolutionEngine engine(
      MakeDocument(
          "To: Sam Stone <sam@example.org>, jane@example.com\n"
          "Cc: sam@example.org\n"),
      SampleIndex(), kUtf16);

  SECTION("Whole document") {
    auto actions = engine.CodeActions(
        {.start = {.line = 0, .character = 0},
         .end = {.line = 2, .character = 0}});
    // Offered once per address
    REQUIRE(actions.size() == 1);
    const auto& action = actions[0];
    CHECK(action.title == "Add sam@example.org to contacts");
    CHECK(action.kind == "quickfix");
    REQUIRE(action.command.has_value());
    CHECK(action.command->command == "create_contact");
    REQUIRE(action.command->arguments.has_value());
    CHECK(
        action.command->arguments->front() ==
        nlohmann::json{{"email", "sam@example.org"}, {"name", "Sam Stone"}});
  }

  SECTION("Cursor on a known address") {
    auto actions = engine.CodeActions(
        {.start = {.line = 0, .character = 36},
         .end = {.line = 0, .character = 36}});
    CHECK(actions.empty());
  }

  SECTION("Cursor touching the end of a token") {
    auto actions = engine.CodeActions(
        {.start = {.line = 1, .character = 19},
         .end = {.line = 1, .character = 19}});
    REQUIRE(actions.size() == 1);
    const auto& argument = actions[0].command->arguments->front();
    CHECK(argument.at("email") == "sam@example.org");
    CHECK_FALSE(argument.contains("name"));
  }
}
