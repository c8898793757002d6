#include "util/hash.hpp"

#include <crc32c/crc32c.h>

uint32_t
patchy::hash::hash(const char* input, std::size_t len) {
    return crc32c::Crc32c(input, len);
}

uint32_t
patchy::hash::hash(std::string_view input) {
    return crc32c::Crc32c(input.data(), input.size());
}
