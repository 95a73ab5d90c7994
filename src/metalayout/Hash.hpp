#ifndef SRC_METALAYOUT_HASH_HPP_
#define SRC_METALAYOUT_HASH_HPP_

#include <cstdint>
#include <string_view>

namespace metalayout {

using Hash = std::uint32_t;

// 32-bit xxHash of |value|, stable across platforms. Used to derive include guards for rendered headers.
Hash hash(std::string_view value, Hash seed = 0);

} // namespace metalayout

#endif // SRC_METALAYOUT_HASH_HPP_
