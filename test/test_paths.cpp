#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "intoto/models/helpers.hpp"
#include "intoto/models/paths.hpp"
#include "intoto/crypto/hash.hpp"

using namespace intoto;
using namespace intoto::models;

TEST_CASE("SafePath - accepted paths", "[paths]") {
    std::vector<std::string> accepted = {"foo", "..foo", "foo/..bar", "foo/bar..", "foo/bar", "a/./b", "foo/"};
    for (const auto& path : accepted) {
        INFO("path: " << path);
        REQUIRE_FALSE(SafePath(path).hasError());
    }
}

TEST_CASE("SafePath - rejected paths", "[paths]") {
    std::vector<std::string> rejected = {"", "/foo", "../foo", "foo/..", "foo/../bar", ".."};
    for (const auto& path : rejected) {
        INFO("path: " << path);
        Error err = SafePath(path);
        REQUIRE(err.hasError());
        REQUIRE(err.kind() == ErrorKind::Encoding);
    }
}

TEST_CASE("MetadataPath - construction", "[paths]") {
    SECTION("Valid path is stored verbatim") {
        auto path = MetadataPath::New("delegations/a/./b");
        REQUIRE(path.ok());
        REQUIRE(path.value().Value() == "delegations/a/./b");
        REQUIRE(path.value().Components() == std::vector<std::string>{"delegations", "a", ".", "b"});
    }

    SECTION("Invalid path is rejected") {
        auto path = MetadataPath::New("../root");
        REQUIRE_FALSE(path.ok());
        REQUIRE(path.error().kind() == ErrorKind::Encoding);
    }

    SECTION("Extension is appended") {
        auto path = MetadataPath::New("root");
        REQUIRE(path.ok());
        REQUIRE(path.value().WithExtension("json") == "root.json");
    }

    SECTION("Ordering by wrapped string") {
        auto a = MetadataPath::New("a");
        auto b = MetadataPath::New("b");
        REQUIRE(a.ok());
        REQUIRE(b.ok());
        REQUIRE(a.value() < b.value());
        REQUIRE(a.value() != b.value());
        REQUIRE(a.value() == MetadataPath::New("a").value());
    }
}

TEST_CASE("TargetPath - hash prefix", "[paths]") {
    auto hash = crypto::HashValue::FromHex("abcd");
    REQUIRE(hash.ok());

    SECTION("Nested path keeps directories") {
        auto path = TargetPath::New("foo/bar");
        REQUIRE(path.ok());
        auto prefixed = path.value().WithHashPrefix(hash.value());
        REQUIRE(prefixed.ok());
        REQUIRE(prefixed.value().Value() == "foo/abcd.bar");
    }

    SECTION("Single component") {
        auto path = TargetPath::New("bar.tar.gz");
        REQUIRE(path.ok());
        auto prefixed = path.value().WithHashPrefix(hash.value());
        REQUIRE(prefixed.ok());
        REQUIRE(prefixed.value().Value() == "abcd.bar.tar.gz");
    }

    SECTION("Invalid target path") {
        REQUIRE_FALSE(TargetPath::New("/etc/passwd").ok());
        REQUIRE_FALSE(TargetPath::New("").ok());
    }
}

TEST_CASE("VirtualTargetPath - validation", "[paths]") {
    REQUIRE(VirtualTargetPath::New("out.bin").ok());
    REQUIRE(VirtualTargetPath::New("src/..main.c").ok());
    REQUIRE_FALSE(VirtualTargetPath::New("src/../main.c").ok());
}
