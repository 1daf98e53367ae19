// SPDX-License-Identifier: Apache-2.0
#include <screen/FileCompletion.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "Fakes.hpp"

using namespace bufstack;
using bufstack::test::FakeAccounts;
using bufstack::test::FakeFileSystem;
using Completions = std::vector<tui::Completion>;

namespace
{
auto makeFileSystem() -> FakeFileSystem
{
    auto fs = FakeFileSystem {};
    fs.add("docs", true);
    fs.add("docs/a.txt");
    fs.add("docs/b.txt");
    fs.add("downloads", true);
    fs.add("notes.txt");
    return fs;
}
} // namespace

TEST_CASE("completeFilename: a bare tilde is the login's home", "[screen][completion][files]")
{
    auto const fs = makeFileSystem();
    auto accounts = FakeAccounts {};

    CHECK(completeFilename("~", fs, accounts) == Completions { { .value = "/home/alice", .label = "~alice" } });
    CHECK(completeFilename("~/mail", fs, accounts)
          == Completions { { .value = "/home/alice/mail", .label = "~alice" } });
    CHECK(accounts.namesCalls == 0);
}

TEST_CASE("completeFilename: a known account expands to its home", "[screen][completion][files]")
{
    auto const fs = makeFileSystem();
    auto accounts = FakeAccounts {};
    accounts.homes["bob"] = "/srv/bob";

    CHECK(completeFilename("~bob/notes", fs, accounts)
          == Completions { { .value = "/srv/bob/notes", .label = "~bob" } });
}

TEST_CASE("completeFilename: a partial account name lists matching accounts", "[screen][completion][files]")
{
    auto const fs = makeFileSystem();
    auto accounts = FakeAccounts {};

    CHECK(completeFilename("~al", fs, accounts)
          == Completions {
              { .value = "~alice", .label = "~alice" },
              { .value = "~albert", .label = "~albert" },
          });
    CHECK(completeFilename("~zed", fs, accounts).empty());
}

TEST_CASE("completeFilename: path prefixes", "[screen][completion][files]")
{
    auto const fs = makeFileSystem();
    auto accounts = FakeAccounts {};

    SECTION("directories get a trailing slash")
    {
        CHECK(completeFilename("do", fs, accounts)
              == Completions {
                  { .value = "docs/", .label = "docs/" },
                  { .value = "downloads/", .label = "downloads/" },
              });
    }

    SECTION("labels are basenames")
    {
        CHECK(completeFilename("docs/", fs, accounts)
              == Completions {
                  { .value = "docs/a.txt", .label = "a.txt" },
                  { .value = "docs/b.txt", .label = "b.txt" },
              });
    }

    SECTION("no match")
    {
        CHECK(completeFilename("xyz", fs, accounts).empty());
    }
}

TEST_CASE("makeFilenameCompleter wraps completeFilename", "[screen][completion][files]")
{
    auto const fs = makeFileSystem();
    auto accounts = FakeAccounts {};
    auto const provider = makeFilenameCompleter(fs, accounts);

    CHECK(provider("no") == Completions { { .value = "notes.txt", .label = "notes.txt" } });
}
