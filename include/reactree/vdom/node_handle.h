#ifndef REACTREE_NODE_HANDLE_H
#define REACTREE_NODE_HANDLE_H

#include <reactree/reactree_base.h>

#include <functional>

namespace reactree {
    /**
     * Opaque reference to a materialized host node. The meaning of the index belongs to the NodeOps implementation;
     * index 0 is reserved for "no node".
     */
    struct NodeHandle {
        std::uint32_t index{0};

        [[nodiscard]] constexpr bool is_null() const noexcept { return index == 0; }

        constexpr explicit operator bool() const noexcept { return index != 0; }

        friend constexpr bool operator==(NodeHandle lhs, NodeHandle rhs) noexcept = default;
    };

    inline constexpr NodeHandle NULL_NODE{};

    enum class HostNodeType : std::uint8_t {
        ELEMENT = 1,
        TEXT = 3,
        COMMENT = 8
    };
} // namespace reactree

template<>
struct std::hash<reactree::NodeHandle> {
    std::size_t operator()(reactree::NodeHandle handle) const noexcept { return std::hash<std::uint32_t>{}(handle.index); }
};

template<>
struct fmt::formatter<reactree::NodeHandle> : fmt::formatter<std::uint32_t> {
    auto format(reactree::NodeHandle handle, format_context &ctx) const {
        return fmt::formatter<std::uint32_t>::format(handle.index, ctx);
    }
};

#endif  // REACTREE_NODE_HANDLE_H
