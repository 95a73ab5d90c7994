#include "metalayout/Hash.hpp"

#include "xxhash.h"

namespace metalayout {

Hash hash(std::string_view value, Hash seed) {
    return XXH32(value.data(), value.size(), seed);
}

} // namespace metalayout
