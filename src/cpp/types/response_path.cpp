#include <syncdl/types/response_path.h>
#include <syncdl/util/errors.h>

#include <algorithm>

namespace syncdl {

    ResponsePath ResponsePath::add_key(std::string key, std::string type_name) const {
        return ResponsePath{std::make_shared<const Node>(Node{_node, std::move(key), std::move(type_name), depth() + 1})};
    }

    ResponsePath ResponsePath::add_index(std::size_t index) const {
        return ResponsePath{std::make_shared<const Node>(Node{_node, index, {}, depth() + 1})};
    }

    const PathElement &ResponsePath::key() const {
        if (!_node) { throw std::out_of_range("An empty response path has no key"); }
        return _node->key;
    }

    const std::string &ResponsePath::type_name() const {
        if (!_node) { throw std::out_of_range("An empty response path has no type name"); }
        return _node->type_name;
    }

    ResponsePath ResponsePath::parent() const {
        return _node ? ResponsePath{_node->prev} : ResponsePath{};
    }

    std::vector<PathElement> ResponsePath::as_list() const {
        std::vector<PathElement> elements;
        elements.reserve(depth());
        for (auto node = _node; node; node = node->prev) { elements.push_back(node->key); }
        std::reverse(elements.begin(), elements.end());
        return elements;
    }

    std::string ResponsePath::to_string() const {
        std::string out;
        for (const auto &element : as_list()) {
            if (const auto *index = std::get_if<std::size_t>(&element)) {
                out += fmt::format("[{}]", *index);
            } else {
                if (!out.empty()) { out.push_back('.'); }
                out += std::get<std::string>(element);
            }
        }
        return out;
    }

    bool operator==(const ResponsePath &lhs, const ResponsePath &rhs) {
        if (lhs._node == rhs._node) { return true; }
        return lhs.as_list() == rhs.as_list();
    }

} // namespace syncdl
