#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace sluice::core {

// Hash map aliases backed by ankerl::unordered_dense.
// Iterators are invalidated on insertion; never hold one across a mutation.

/// Transparent string hash: lets string-keyed maps be probed with string_view
/// without allocating a temporary std::string
struct StringHash {
    using is_transparent = void;
    using is_avalanching = void;

    [[nodiscard]] uint64_t operator()(std::string_view value) const noexcept {
        return ankerl::unordered_dense::hash<std::string_view>{}(value);
    }
};

/// String-keyed map supporting heterogeneous (string_view) lookup
template <typename Value>
using string_map = ankerl::unordered_dense::map<std::string, Value, StringHash, std::equal_to<>>;

}  // namespace sluice::core
