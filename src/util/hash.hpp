#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hash {

uint32_t
hash(std::string_view input);

}  // namespace hash
