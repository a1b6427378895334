/**
 * @file c_api_tests.cpp
 * @brief Tests for the relpath C API
 *
 * NULL safety, error state and string ownership across the C boundary.
 */

#include <doctest/doctest.h>
#include <relpath/relpath.h>

#include <cstring>
#include <string>

// =============================================================================
// Version Tests
// =============================================================================

TEST_CASE("C API: relpath_abi_version returns correct version") {
    CHECK(relpath_abi_version() == RELPATH_ABI_VERSION);
}

TEST_CASE("C API: relpath_version_string returns non-empty string") {
    const char* version = relpath_version_string();
    REQUIRE(version != nullptr);
    CHECK(strlen(version) > 0);
}

// =============================================================================
// Error Handling Tests
// =============================================================================

TEST_CASE("C API: error handling") {
    SUBCASE("initial state has no error") {
        relpath_clear_error();
        CHECK(relpath_get_last_error_code() == RELPATH_OK);
        CHECK(strlen(relpath_get_last_error()) == 0);
    }

    SUBCASE("NULL path is not a string") {
        char* out = relpath_normalize(nullptr, "ffi");
        CHECK(out == nullptr);
        CHECK(relpath_get_last_error_code() == RELPATH_ERROR_NOT_A_STRING);
        CHECK(std::string(relpath_get_last_error()) == "ffi: Not a string");
    }

    SUBCASE("clear_error resets state") {
        CHECK(relpath_normalize("", nullptr) == nullptr);
        CHECK(relpath_get_last_error_code() == RELPATH_ERROR_EMPTY_STRING);
        relpath_clear_error();
        CHECK(relpath_get_last_error_code() == RELPATH_OK);
        CHECK(strlen(relpath_get_last_error()) == 0);
    }

    SUBCASE("successful call clears a previous error") {
        CHECK(relpath_normalize("/abs", nullptr) == nullptr);
        CHECK(relpath_get_last_error_code() == RELPATH_ERROR_ABSOLUTE_PATH);
        char* out = relpath_normalize("ok", nullptr);
        REQUIRE(out != nullptr);
        CHECK(relpath_get_last_error_code() == RELPATH_OK);
        relpath_free_string(out);
    }
}

// =============================================================================
// Normalization Tests
// =============================================================================

TEST_CASE("C API: relpath_normalize returns an owned canonical string") {
    char* out = relpath_normalize("foo//bar/./", nullptr);
    REQUIRE(out != nullptr);
    CHECK(std::string(out) == "./foo/bar");
    relpath_free_string(out);

    char* cwd = relpath_normalize(".", "ffi");
    REQUIRE(cwd != nullptr);
    CHECK(std::string(cwd) == "./.");
    relpath_free_string(cwd);
}

TEST_CASE("C API: relpath_normalize maps each rejection") {
    CHECK(relpath_normalize("", nullptr) == nullptr);
    CHECK(relpath_get_last_error_code() == RELPATH_ERROR_EMPTY_STRING);

    CHECK(relpath_normalize("/etc", nullptr) == nullptr);
    CHECK(relpath_get_last_error_code() == RELPATH_ERROR_ABSOLUTE_PATH);

    CHECK(relpath_normalize("a/../b", "ffi") == nullptr);
    CHECK(relpath_get_last_error_code() == RELPATH_ERROR_PARENT_COMPONENT);
    CHECK(std::string(relpath_get_last_error()) ==
          "ffi: Path string contains a `..` component, which is not supported");
}

TEST_CASE("C API: relpath_is_valid") {
    relpath_clear_error();
    CHECK(relpath_is_valid("a/b") == 1);
    CHECK(relpath_is_valid(".") == 1);
    CHECK(relpath_is_valid("") == 0);
    CHECK(relpath_is_valid("/a") == 0);
    CHECK(relpath_is_valid("..") == 0);
    CHECK(relpath_is_valid(nullptr) == 0);
    CHECK(relpath_get_last_error_code() == RELPATH_OK);
}

TEST_CASE("C API: relpath_component_count") {
    size_t count = 99;
    CHECK(relpath_component_count("a//b/./c/", &count) == RELPATH_OK);
    CHECK(count == 3);

    CHECK(relpath_component_count("./.", &count) == RELPATH_OK);
    CHECK(count == 0);

    CHECK(relpath_component_count("a/..", &count) == RELPATH_ERROR_PARENT_COMPONENT);
    CHECK(relpath_component_count(nullptr, &count) == RELPATH_ERROR_NOT_A_STRING);
    CHECK(relpath_component_count("a", nullptr) == RELPATH_ERROR_INVALID_ARGUMENT);
}

TEST_CASE("C API: relpath_free_string accepts NULL") {
    relpath_free_string(nullptr);
    CHECK(true);
}

TEST_CASE("C API: relpath_is_valid clears a previous error") {
    CHECK(relpath_normalize("/abs", nullptr) == nullptr);
    REQUIRE(relpath_get_last_error_code() == RELPATH_ERROR_ABSOLUTE_PATH);

    CHECK(relpath_is_valid("..") == 0);
    CHECK(relpath_get_last_error_code() == RELPATH_OK);
    CHECK(strlen(relpath_get_last_error()) == 0);
}

TEST_CASE("C API: default label names the C entry point") {
    CHECK(relpath_normalize(nullptr, nullptr) == nullptr);
    CHECK(std::string(relpath_get_last_error()) ==
          "relpath_normalize: Argument NULL is not a valid relative path string: Not a string");

    CHECK(relpath_normalize("", nullptr) == nullptr);
    CHECK(std::string(relpath_get_last_error()) ==
          "relpath_normalize: Argument \"\" is not a valid relative path string: "
          "The string is empty");

    CHECK(relpath_normalize("a/../b", nullptr) == nullptr);
    CHECK(std::string(relpath_get_last_error()) ==
          "relpath_normalize: Argument \"a/../b\" is not a valid relative path string: "
          "Path string contains a `..` component, which is not supported");
}
