#include "maills/contacts/contact_index.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "maills/contacts/contact_store.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using maills::CanonicalPath;
using maills::contacts::Contact;
using maills::contacts::ContactIndex;
using maills::contacts::ContactIndexBuilder;
using maills::contacts::ContactStore;
using maills::contacts::LoadWarningKind;

namespace {

auto MakeContact(
    std::string name, std::vector<std::string> addresses,
    const CanonicalPath& path, int line = 0) -> Contact {
  Contact contact{
      .display_name = std::move(name),
      .nickname = std::nullopt,
      .addresses = {},
      .fields = {},
      .source = {.path = path, .line = line},
  };
  for (auto& address : addresses) {
    contact.addresses.push_back(
        {.address = std::move(address), .type = std::nullopt, .line = line});
  }
  return contact;
}

}  // namespace

TEST_CASE("ContactIndex lookups are case-insensitive", "[contact_index]") {
  const CanonicalPath path("/contacts/jane.vcf");
  ContactIndexBuilder builder;
  builder.AddSource(
      path, {MakeContact("Jane Doe", {"Jane.Doe@Example.com"}, path)});
  auto index = builder.Build();

  const auto* contact = index.Find("jane.doe@example.COM");
  REQUIRE(contact != nullptr);
  CHECK(contact->display_name == "Jane Doe");
  // The stored address keeps its original case
  CHECK(contact->addresses.front().address == "Jane.Doe@Example.com");

  CHECK(index.Find("  jane.doe@example.com ") != nullptr);
  CHECK(index.Find("john@example.com") == nullptr);
  CHECK(index.AddressCount() == 1);
}

TEST_CASE("ContactIndexBuilder lets the later source win", "[contact_index]") {
  const CanonicalPath first("/contacts/a.vcf");
  const CanonicalPath second("/contacts/b.vcf");

  ContactIndexBuilder builder;
  builder.AddSource(
      first,
      {MakeContact(
          "Old Jane", {"jane@example.com", "old@example.com"}, first)});
  builder.AddSource(
      second, {MakeContact("New Jane", {"JANE@example.com"}, second)});

  REQUIRE(builder.Warnings().size() == 1);
  const auto& warning = builder.Warnings().front();
  CHECK(warning.kind == LoadWarningKind::kDuplicateAddress);
  CHECK(warning.path == first);
  CHECK_THAT(
      warning.message,
      Catch::Matchers::ContainsSubstring("JANE@example.com") &&
          Catch::Matchers::ContainsSubstring("/contacts/b.vcf"));

  auto index = builder.Build();
  REQUIRE(index.Find("jane@example.com") != nullptr);
  CHECK(index.Find("jane@example.com")->display_name == "New Jane");
  // The loser keeps its other addresses
  REQUIRE(index.Find("old@example.com") != nullptr);
  CHECK(index.Find("old@example.com")->display_name == "Old Jane");
  CHECK(index.Contacts().size() == 2);
}

TEST_CASE(
    "ContactIndexBuilder drops contacts left without addresses",
    "[contact_index]") {
  const CanonicalPath first("/contacts/a.vcf");
  const CanonicalPath second("/contacts/b.vcf");

  ContactIndexBuilder builder;
  builder.AddSource(first, {MakeContact("Old", {"x@example.com"}, first)});
  builder.AddSource(second, {MakeContact("New", {"x@example.com"}, second)});
  builder.AddSource(second, {MakeContact("Empty", {}, second)});

  auto index = builder.Build();
  REQUIRE(index.Contacts().size() == 1);
  CHECK(index.Contacts().front().display_name == "New");
}

TEST_CASE(
    "ContactIndexBuilder collapses repeats within one contact",
    "[contact_index]") {
  const CanonicalPath path("/contacts/a.vcf");

  ContactIndexBuilder builder;
  builder.AddSource(
      path,
      {MakeContact("Jane", {"jane@example.com", "Jane@Example.com"}, path)});

  CHECK(builder.Warnings().empty());
  auto index = builder.Build();
  REQUIRE(index.Contacts().size() == 1);
  CHECK(index.Contacts().front().addresses.size() == 1);
}

TEST_CASE(
    "ContactIndexBuilder applies later-wins inside one file",
    "[contact_index]") {
  const CanonicalPath path("/contacts/all.vcf");

  ContactIndexBuilder builder;
  builder.AddSource(
      path, {MakeContact("First", {"dup@example.com"}, path, 0),
             MakeContact("Second", {"dup@example.com"}, path, 5)});

  CHECK(builder.Warnings().empty());
  auto index = builder.Build();
  REQUIRE(index.Find("dup@example.com") != nullptr);
  CHECK(index.Find("dup@example.com")->display_name == "Second");
  CHECK(index.Contacts().size() == 1);
}

TEST_CASE("ContactStore starts empty at generation zero", "[contact_store]") {
  ContactStore store;
  auto current = store.Current();
  REQUIRE(current != nullptr);
  CHECK(current->Generation() == 0);
  CHECK(current->Empty());
}

TEST_CASE("ContactStore stamps increasing generations", "[contact_store]") {
  const CanonicalPath path("/contacts/a.vcf");
  ContactStore store;

  auto held = store.Current();
  auto first = store.Install(ContactIndex(
      std::vector<Contact>{MakeContact("Jane", {"jane@example.com"}, path)}));
  auto second = store.Install(ContactIndex());

  CHECK(first->Generation() == 1);
  CHECK(second->Generation() == 2);
  CHECK(store.Current() == second);

  // Snapshots taken earlier are unaffected by later installs
  CHECK(held->Generation() == 0);
  CHECK(first->Find("jane@example.com") != nullptr);
}

TEST_CASE(
    "ContactStore generations stay unique under concurrent installs",
    "[contact_store]") {
  ContactStore store;
  constexpr std::size_t kThreads = 4;
  constexpr std::size_t kInstallsPerThread = 50;

  // Assertions stay on the main thread
  std::vector<std::vector<std::uint64_t>> seen(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (std::size_t t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, &generations = seen[t]]() {
      for (std::size_t i = 0; i < kInstallsPerThread; ++i) {
        generations.push_back(store.Install(ContactIndex())->Generation());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::uint64_t> unique;
  for (const auto& generations : seen) {
    unique.insert(generations.begin(), generations.end());
  }
  CHECK(unique.size() == kThreads * kInstallsPerThread);
  CHECK(store.Current()->Generation() == kThreads * kInstallsPerThread);
}
