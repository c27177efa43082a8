#include "read_input.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

using namespace textdiff;

std::string
textdiff::to_string(InputStatus status) {
    switch (status) {
        case InputStatus::kOk:
            return "Success";
        case InputStatus::kFileDoesNotExist:
            return "File does not exist";
        case InputStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case InputStatus::kNoPermission:
            return "File is not readable (no permission)";
        case InputStatus::kReadError:
            return "Failed to read file";
    }
    return "Unknown error";
}

InputStatus
textdiff::check_file_status(const std::string& path) {
    std::error_code ec;
    fs::path file_path(path);

    if (path.empty() || !fs::exists(file_path, ec)) {
        return InputStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_character_file(file_path, ec))) {
        return InputStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none) &&
        ((perms & fs::perms::others_read) == fs::perms::none)) {
        return InputStatus::kNoPermission;
    }

    return InputStatus::kOk;
}

bool
textdiff::read_stream(FILE* fp, std::string& contents) {
    contents.clear();

    char buffer[4096];
    std::size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
        contents.append(buffer, count);
    }
    return ferror(fp) == 0;
}

InputStatus
textdiff::read_file(const std::string& path, std::string& contents) {
    if (auto status = check_file_status(path); status != InputStatus::kOk) {
        return status;
    }

    FILE* fp = fopen(path.c_str(), "rb");
    if (fp == nullptr) {
        return InputStatus::kNoPermission;
    }

    bool ok = read_stream(fp, contents);
    fclose(fp);
    return ok ? InputStatus::kOk : InputStatus::kReadError;
}

InputStatus
textdiff::resolve_input(const std::string& argument, std::string& text) {
    if (argument == "-") {
        return read_stream(stdin, text) ? InputStatus::kOk : InputStatus::kReadError;
    }

    auto status = read_file(argument, text);
    if (status == InputStatus::kFileDoesNotExist) {
        text = argument;
        return InputStatus::kOk;
    }
    return status;
}
