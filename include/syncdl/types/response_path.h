#pragma once

/**
 * @file response_path.h
 * @brief Location of a field or list item within a result tree.
 *
 * A ResponsePath is an immutable, persistent linked list from the leaf back to the root. Extending a path
 * shares the parent's nodes, so each field in the tree carries its full location for the price of one
 * allocation.
 *
 * @code
 * ResponsePath path = ResponsePath{}.add_key("users").add_index(0).add_key("name");
 * path.to_string();  // "users[0].name"
 * @endcode
 */

#include <syncdl/syncdl_export.h>

#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace syncdl {

    using PathElement = std::variant<std::string, std::size_t>;

    class SYNCDL_EXPORT ResponsePath {
    public:
        ResponsePath() = default;

        [[nodiscard]] ResponsePath add_key(std::string key, std::string type_name = {}) const;

        [[nodiscard]] ResponsePath add_index(std::size_t index) const;

        [[nodiscard]] bool empty() const noexcept { return _node == nullptr; }

        [[nodiscard]] std::size_t depth() const noexcept { return _node ? _node->depth : 0; }

        // Last element, the path must not be empty
        [[nodiscard]] const PathElement &key() const;

        // Name of the parent type the last key was resolved on, empty for indices
        [[nodiscard]] const std::string &type_name() const;

        [[nodiscard]] ResponsePath parent() const;

        // Root first
        [[nodiscard]] std::vector<PathElement> as_list() const;

        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const ResponsePath &lhs, const ResponsePath &rhs);

    private:
        struct Node {
            std::shared_ptr<const Node> prev;
            PathElement key;
            std::string type_name;
            std::size_t depth;
        };

        explicit ResponsePath(std::shared_ptr<const Node> node) : _node{std::move(node)} {}

        std::shared_ptr<const Node> _node{};
    };

} // namespace syncdl

template<>
struct fmt::formatter<syncdl::ResponsePath> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const syncdl::ResponsePath &path, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(path.to_string(), ctx);
    }
};
