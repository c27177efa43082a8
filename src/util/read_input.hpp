#pragma once

#include <cstdio>
#include <string>

namespace textdiff {

enum class InputStatus {
    kOk,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
    kReadError,
};

std::string
to_string(InputStatus status);

InputStatus
check_file_status(const std::string& path);

// Read everything from an open stream.
bool
read_stream(FILE* fp, std::string& contents);

InputStatus
read_file(const std::string& path, std::string& contents);

// Turn a command line argument into text: "-" reads stdin, an existing path
// is read, and anything else is taken literally.
InputStatus
resolve_input(const std::string& argument, std::string& text);

}  // namespace textdiff
