#include "read_input.hpp"

#include <doctest.h>

#include <cstdio>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using namespace textdiff;

TEST_CASE("read_input") {
    const auto path = (fs::temp_directory_path() / "textdiff_read_input_test.txt").string();
    {
        FILE* fp = fopen(path.c_str(), "wb");
        REQUIRE(fp != nullptr);
        fputs("first\nsecond\n", fp);
        fclose(fp);
    }

    SUBCASE("file contents") {
        std::string text;
        REQUIRE(read_file(path, text) == InputStatus::kOk);
        REQUIRE(text == "first\nsecond\n");
    }

    SUBCASE("existing path is read") {
        std::string text;
        REQUIRE(resolve_input(path, text) == InputStatus::kOk);
        REQUIRE(text == "first\nsecond\n");
    }

    SUBCASE("unknown path is literal text") {
        std::string text;
        REQUIRE(resolve_input("hello world", text) == InputStatus::kOk);
        REQUIRE(text == "hello world");
    }

    SUBCASE("missing file") {
        std::string text;
        REQUIRE(read_file("/nonexistent/textdiff/file", text) == InputStatus::kFileDoesNotExist);
        REQUIRE(check_file_status("") == InputStatus::kFileDoesNotExist);
    }

    SUBCASE("directories are not readable") {
        std::string text;
        REQUIRE(resolve_input(fs::temp_directory_path().string(), text) == InputStatus::kFileNotReadable);
    }

    SUBCASE("status names") {
        REQUIRE(to_string(InputStatus::kOk) == "Success");
        REQUIRE(to_string(InputStatus::kFileDoesNotExist) == "File does not exist");
    }

    std::error_code ec;
    fs::remove(path, ec);
}
