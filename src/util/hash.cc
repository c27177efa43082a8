#include "util/hash.hpp"

#include <crc32c/crc32c.h>

uint32_t
hash::hash(std::string_view input) {
    return crc32c::Crc32c(input.data(), input.size());
}
