#include <doctest/doctest.h>
#include <relpath/relative_path.hpp>

#include "../../tools/relpath/commands.hpp"
#include "test_util.hpp"

#include <string>

using namespace relpath::cli;
using namespace relpath::cli::commands;
using relpath::json::json;
using relpath::test::CapturedOutput;
using relpath::test::TempDir;

namespace {

GlobalOptions json_options() {
    GlobalOptions opts;
    opts.json = true;
    opts.quiet = true;
    return opts;
}

GlobalOptions text_options() {
    GlobalOptions opts;
    opts.quiet = true;
    return opts;
}

// "café/menu" with é as a single Latin-1 byte
const std::string kLatin1Path = "caf\xe9/menu";
const std::string kReplacementChar = "\xEF\xBF\xBD";

} // namespace

// ============================================================================
// JSON output of arbitrary bytes
// ============================================================================

TEST_CASE("output_json writes non UTF-8 paths with replacement characters") {
    CapturedOutput capture;
    auto j = path_outcome_json(kLatin1Path, relpath::normalize_relative(kLatin1Path));
    CHECK_NOTHROW(output_json(j));

    auto parsed = json::parse(capture.out());
    CHECK(parsed["path"] == "./caf" + kReplacementChar + "/menu");
}

TEST_CASE("print_error in JSON mode survives non UTF-8 messages") {
    CapturedOutput capture;
    CHECK_NOTHROW(print_error("bad \xff byte", true));
    auto parsed = json::parse(capture.out());
    CHECK(parsed["ok"] == false);
}

// ============================================================================
// normalize
// ============================================================================

TEST_CASE("normalize prints every canonical path") {
    CapturedOutput capture;
    int rc = cmd_normalize(text_options(), NormalizeOptions{{"a//b", ".", "c/./d/"}});
    CHECK(rc == 0);
    CHECK(capture.out() == "./a/b\n./.\n./c/d\n");
}

TEST_CASE("normalize exits 1 but still reports every path") {
    CapturedOutput capture;
    int rc = cmd_normalize(json_options(), NormalizeOptions{{"a//b", "/x", "c/./"}});
    CHECK(rc == 1);

    auto out = json::parse(capture.out());
    CHECK(out["ok"] == false);
    REQUIRE(out["results"].size() == 3);
    CHECK(out["results"][0]["path"] == "./a/b");
    CHECK(out["results"][1]["ok"] == false);
    CHECK(out["results"][1]["error"]["code"] == "absolute_path");
    CHECK(out["results"][2]["path"] == "./c");
}

TEST_CASE("normalize in text mode prints the good paths and an error line") {
    CapturedOutput capture;
    int rc = cmd_normalize(text_options(), NormalizeOptions{{"ok/", "x/../y"}});
    CHECK(rc == 1);
    CHECK(capture.out() == "./ok\n");
    CHECK(capture.err().find("Error: relpath normalize: Path string contains a `..` component") !=
          std::string::npos);
}

TEST_CASE("normalize of a non UTF-8 path in JSON mode") {
    CapturedOutput capture;
    int rc = cmd_normalize(json_options(), NormalizeOptions{{kLatin1Path}});
    CHECK(rc == 0);
    auto out = json::parse(capture.out());
    CHECK(out["results"][0]["path"] == "./caf" + kReplacementChar + "/menu");
}

TEST_CASE("normalize uses the --context label") {
    GlobalOptions opts = json_options();
    opts.context = "manifest.entrypoint";
    CapturedOutput capture;
    CHECK(cmd_normalize(opts, NormalizeOptions{{""}}) == 1);
    auto out = json::parse(capture.out());
    CHECK(out["results"][0]["error"]["message"] == "manifest.entrypoint: The string is empty");
}

// ============================================================================
// check
// ============================================================================

TEST_CASE("check reports validity without paths") {
    CapturedOutput capture;
    int rc = cmd_check(json_options(), CheckOptions{{"a/b", "..", "./."}});
    CHECK(rc == 1);

    auto out = json::parse(capture.out());
    CHECK(out["ok"] == false);
    REQUIRE(out["results"].size() == 3);
    CHECK(out["results"][0]["ok"] == true);
    CHECK_FALSE(out["results"][0].contains("path"));
    CHECK(out["results"][1]["error"]["code"] == "parent_component");
    CHECK(out["results"][2]["ok"] == true);
}

TEST_CASE("check exits 0 when all paths are valid") {
    GlobalOptions opts;
    CapturedOutput capture;
    CHECK(cmd_check(opts, CheckOptions{{"a", "b/"}}) == 0);
    CHECK(capture.out() == "a: valid\nb/: valid\n");
}

// ============================================================================
// components
// ============================================================================

TEST_CASE("components prints one component per line") {
    CapturedOutput capture;
    CHECK(cmd_components(text_options(), ComponentsOptions{"a//b/./c/"}) == 0);
    CHECK(capture.out() == "a\nb\nc\n");
}

TEST_CASE("components of the current directory") {
    CapturedOutput capture;
    CHECK(cmd_components(json_options(), ComponentsOptions{"./."}) == 0);

    auto out = json::parse(capture.out());
    CHECK(out["ok"] == true);
    CHECK(out["components"].is_array());
    CHECK(out["components"].empty());
    CHECK(out["path"] == "./.");
}

TEST_CASE("components rejects parent references") {
    CapturedOutput capture;
    CHECK(cmd_components(json_options(), ComponentsOptions{"a/.."}) == 1);
    auto out = json::parse(capture.out());
    CHECK(out["ok"] == false);
}

// ============================================================================
// join
// ============================================================================

TEST_CASE("join concatenates normalized arguments") {
    CapturedOutput capture;
    CHECK(cmd_join(text_options(), JoinOptions{{"a/", "./b//c", "."}}) == 0);
    CHECK(capture.out() == "./a/b/c\n");
}

TEST_CASE("join fails on a bad argument") {
    CapturedOutput capture;
    CHECK(cmd_join(json_options(), JoinOptions{{"a", "../b"}}) == 1);
    auto out = json::parse(capture.out());
    CHECK(out["ok"] == false);
}

// ============================================================================
// batch
// ============================================================================

TEST_CASE("batch exits 1 after a partial failure") {
    TempDir dir;
    auto file = dir.write("paths.json", R"(["a//b", 5, "c/"])");

    CapturedOutput capture;
    CHECK(cmd_batch(json_options(), BatchOptions{file}) == 1);

    auto out = json::parse(capture.out());
    CHECK(out["ok"] == false);
    CHECK(out["normalized"] == 2);
    CHECK(out["failed"] == 1);
    CHECK(out["results"][1]["error"]["code"] == "not_a_string");
    REQUIRE(out.contains("warnings"));
    CHECK(out["warnings"].size() == 1);
}

TEST_CASE("batch prints normalized paths in text mode") {
    TempDir dir;
    auto file = dir.write("paths.json", R"(["a//b", "."])");

    CapturedOutput capture;
    CHECK(cmd_batch(text_options(), BatchOptions{file}) == 0);
    CHECK(capture.out() == "./a/b\n./.\n");
}

TEST_CASE("batch reports an unreadable document") {
    TempDir dir;
    auto file = dir.write("paths.json", R"({"not": "an array"})");

    CapturedOutput capture;
    CHECK(cmd_batch(json_options(), BatchOptions{file}) == 1);
    auto out = json::parse(capture.out());
    CHECK(out["ok"] == false);
}
