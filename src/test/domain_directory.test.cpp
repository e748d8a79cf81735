//src/test/domain_directory.test.cpp
#include "gtest/gtest.h"
#include "test_support.h"

#include "core/metadata/AttributeTable.hpp"
#include "core/storage/DomainDirectory.hpp"

#include <algorithm>
#include <fstream>

using lsdb::AttributeMap;
using lsdb::AttributeTable;
using lsdb::DomainDirectory;
using lsdb::ErrorKind;
using lsdb::SdbError;

class DomainDirectoryTest : public TempDataDirTest {};

TEST_F(DomainDirectoryTest, CreateTwiceListsOnce) {
    DomainDirectory dir(test_dir, 100);
    dir.createDomain("books");
    dir.createDomain("books");

    auto domains = dir.listDomains();
    EXPECT_EQ(std::count(domains.begin(), domains.end(), "books"), 1);
    EXPECT_TRUE(dir.exists("books"));
}

TEST_F(DomainDirectoryTest, AcceptsFullCharset) {
    DomainDirectory dir(test_dir, 100);
    dir.createDomain("My_Domain-1.0");
    dir.createDomain("abc");
    dir.createDomain(std::string(255, 'x'));
    EXPECT_EQ(dir.listDomains().size(), 3u);
}

TEST_F(DomainDirectoryTest, RejectsInvalidNames) {
    DomainDirectory dir(test_dir, 100);
    for (const std::string bad : {"ab", "", "has space", "slash/name", "../etc", "semi;colon", "ünïcode"}) {
        EXPECT_EQ(faultKind([&] { dir.createDomain(bad); }), ErrorKind::InvalidParameterValue) << bad;
    }
    EXPECT_EQ(faultKind([&] { dir.createDomain(std::string(256, 'a')); }), ErrorKind::InvalidParameterValue);
    EXPECT_TRUE(dir.listDomains().empty());
}

TEST_F(DomainDirectoryTest, InvalidNameMessageNamesTheValue) {
    DomainDirectory dir(test_dir, 100);
    try {
        dir.createDomain("a b");
        FAIL() << "expected InvalidParameterValue";
    } catch (const SdbError& e) {
        EXPECT_STREQ(e.code(), "InvalidParameterValue");
        EXPECT_STREQ(e.what(), "Value (a b) for parameter DomainName is invalid.");
    }
}

TEST_F(DomainDirectoryTest, CapIsEnforced) {
    DomainDirectory dir(test_dir, 100);
    for (int i = 0; i < 100; ++i) dir.createDomain("domain" + std::to_string(i));
    EXPECT_EQ(dir.listDomains().size(), 100u);

    EXPECT_EQ(faultKind([&] { dir.createDomain("onetoomany"); }), ErrorKind::NumberDomainsExceeded);
    EXPECT_FALSE(dir.exists("onetoomany"));

    // recreating an existing domain at the cap stays idempotent
    EXPECT_NO_THROW(dir.createDomain("domain7"));

    dir.deleteDomain("domain0");
    EXPECT_NO_THROW(dir.createDomain("onetoomany"));
}

TEST_F(DomainDirectoryTest, DeleteMissingIsSilent) {
    DomainDirectory dir(test_dir, 100);
    dir.createDomain("kept");
    EXPECT_NO_THROW(dir.deleteDomain("absent"));
    EXPECT_NO_THROW(dir.deleteDomain("x"));
    EXPECT_EQ(dir.listDomains(), std::vector<std::string>{"kept"});
}

TEST_F(DomainDirectoryTest, DeleteRemovesBackingFile) {
    DomainDirectory dir(test_dir, 100);
    dir.createDomain("gone");
    ASSERT_TRUE(fs::exists(fs::path(test_dir) / "gone"));
    dir.deleteDomain("gone");
    EXPECT_FALSE(fs::exists(fs::path(test_dir) / "gone"));
    EXPECT_TRUE(dir.listDomains().empty());
}

TEST_F(DomainDirectoryTest, ListIgnoresForeignFiles) {
    DomainDirectory dir(test_dir, 100);
    dir.createDomain("real");
    std::ofstream(fs::path(test_dir) / "notes.txt") << "not a database";
    fs::create_directories(fs::path(test_dir) / "subdir");

    EXPECT_EQ(dir.listDomains(), std::vector<std::string>{"real"});
    EXPECT_FALSE(dir.exists("notes.txt"));
}

TEST_F(DomainDirectoryTest, CreatesMissingRoot) {
    const std::string nested = (fs::path(test_dir) / "a" / "b").string();
    DomainDirectory dir(nested, 5);
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_EQ(dir.domainCap(), 5u);
}

TEST_F(DomainDirectoryTest, PathForStaysInsideRoot) {
    DomainDirectory dir(test_dir, 100);
    EXPECT_EQ(dir.pathFor("books"), (fs::path(test_dir) / "books").string());
    EXPECT_THROW(dir.pathFor(".."), SdbError);
}

TEST_F(DomainDirectoryTest, RejectsSqliteSidecarNames) {
    DomainDirectory dir(test_dir, 100);
    for (const std::string bad : {"abc-journal", "abc-wal", "abc-shm", "x.y-journal"}) {
        EXPECT_EQ(faultKind([&] { dir.createDomain(bad); }), ErrorKind::InvalidParameterValue) << bad;
        EXPECT_FALSE(dir.exists(bad)) << bad;
    }
    // only the exact suffixes are taken
    EXPECT_NO_THROW(dir.createDomain("abc-journals"));
    EXPECT_NO_THROW(dir.createDomain("abc-wal.v2"));
    EXPECT_NO_THROW(dir.createDomain("journal-abc"));
}

TEST_F(DomainDirectoryTest, SimilarlyNamedDomainsStayIsolated) {
    DomainDirectory dir(test_dir, 100);
    AttributeTable table(dir);
    dir.createDomain("abc-journals");
    dir.createDomain("abc-wal.v2");
    table.putAttributes("abc-journals", "i1", {{"color", "red"}});
    table.putAttributes("abc-wal.v2", "i1", {{"color", "blue"}});

    dir.createDomain("abc");
    table.putAttributes("abc", "i1", {{"color", "green"}});
    dir.deleteDomain("abc");

    EXPECT_FALSE(dir.exists("abc"));
    EXPECT_EQ(dir.listDomains(), (std::vector<std::string>{"abc-journals", "abc-wal.v2"}));
    EXPECT_EQ(table.getAttributes("abc-journals", "i1"), (AttributeMap{{"color", "red"}}));
    EXPECT_EQ(table.getAttributes("abc-wal.v2", "i1"), (AttributeMap{{"color", "blue"}}));
}

TEST_F(DomainDirectoryTest, DeleteKeepsDatabaseFileInSidecarPosition) {
    DomainDirectory dir(test_dir, 100);
    dir.createDomain("abc");
    dir.createDomain("other");
    // a database file (not a journal) that happens to sit where abc's journal would
    const fs::path lookalike = fs::path(test_dir) / "abc-journal";
    fs::copy_file(fs::path(test_dir) / "other", lookalike);

    dir.deleteDomain("abc");
    EXPECT_FALSE(dir.exists("abc"));
    EXPECT_TRUE(fs::exists(lookalike));
}
