#ifndef REACTREE_STRING_HASH_H
#define REACTREE_STRING_HASH_H

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace reactree {
    /**
     * Transparent string hash, allows lookup by std::string_view without building a std::string.
     */
    struct StringHash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] auto operator()(std::string_view str) const noexcept -> std::uint64_t {
            return ankerl::unordered_dense::hash<std::string_view>{}(str);
        }
    };

    template<typename V>
    using string_map = ankerl::unordered_dense::map<std::string, V, StringHash, std::equal_to<>>;
} // namespace reactree

#endif  // REACTREE_STRING_HASH_H
