#ifndef SYNCDL_TYPES_VALUE_H
#define SYNCDL_TYPES_VALUE_H

#include <syncdl/syncdl_export.h>
#include <syncdl/syncdl_forward_declarations.h>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace syncdl {

    struct Null {
        friend bool operator==(Null, Null) noexcept { return true; }
    };

    inline constexpr Null null{};

    /**
     * Marks a resolved field that should be left out of the result entirely. It is never stored in a Value.
     */
    struct Undefined {
        friend bool operator==(Undefined, Undefined) noexcept { return true; }
    };

    inline constexpr Undefined undefined{};

    using List = std::vector<Value>;

    /**
     * Insertion ordered string keyed map, the object shape of a result tree (and of source values handed to
     * resolvers). Lookup is linear which suits the small field counts of a selection set.
     */
    class SYNCDL_EXPORT Object {
    public:
        using entry_type = std::pair<std::string, Value>;
        using container_type = std::vector<entry_type>;
        using iterator = container_type::iterator;
        using const_iterator = container_type::const_iterator;

        Object();

        Object(std::initializer_list<entry_type> entries);

        Object(const Object &other);

        Object(Object &&other) noexcept;

        Object &operator=(const Object &other);

        Object &operator=(Object &&other) noexcept;

        ~Object();

        [[nodiscard]] std::size_t size() const noexcept;

        [[nodiscard]] bool empty() const noexcept;

        [[nodiscard]] bool contains(std::string_view key) const;

        [[nodiscard]] const Value *find(std::string_view key) const;

        [[nodiscard]] Value *find(std::string_view key);

        // Throws std::out_of_range if the key is missing
        [[nodiscard]] const Value &at(std::string_view key) const;

        // Replaces an existing entry in place (keeping its position) or appends a new one
        Value &insert_or_assign(std::string key, Value value);

        bool erase(std::string_view key);

        [[nodiscard]] std::vector<std::string> keys() const;

        [[nodiscard]] iterator begin() noexcept;
        [[nodiscard]] iterator end() noexcept;
        [[nodiscard]] const_iterator begin() const noexcept;
        [[nodiscard]] const_iterator end() const noexcept;

        friend bool operator==(const Object &lhs, const Object &rhs);

    private:
        container_type _entries;
    };

    /**
     * Dynamically typed tree value: null, bool, integer, float, string, list or object.
     */
    class SYNCDL_EXPORT Value {
    public:
        using storage_type = std::variant<Null, bool, std::int64_t, double, std::string, List, Object>;

        enum class Kind { NULL_VALUE = 0, BOOLEAN, INT, FLOAT, STRING, LIST, OBJECT };

        Value() noexcept = default;

        Value(Null) noexcept {}

        Value(std::nullptr_t) noexcept {}

        Value(bool v) : _storage{v} {}

        Value(int v) : _storage{static_cast<std::int64_t>(v)} {}

        Value(std::int64_t v) : _storage{v} {}

        Value(double v) : _storage{v} {}

        Value(const char *v) : _storage{std::string{v}} {}

        Value(std::string_view v) : _storage{std::string{v}} {}

        Value(std::string v) : _storage{std::move(v)} {}

        Value(List v) : _storage{std::move(v)} {}

        Value(Object v) : _storage{std::move(v)} {}

        [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_storage.index()); }

        [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::NULL_VALUE; }

        [[nodiscard]] bool is_bool() const noexcept { return kind() == Kind::BOOLEAN; }

        [[nodiscard]] bool is_int() const noexcept { return kind() == Kind::INT; }

        [[nodiscard]] bool is_float() const noexcept { return kind() == Kind::FLOAT; }

        [[nodiscard]] bool is_number() const noexcept { return is_int() || is_float(); }

        [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::STRING; }

        [[nodiscard]] bool is_list() const noexcept { return kind() == Kind::LIST; }

        [[nodiscard]] bool is_object() const noexcept { return kind() == Kind::OBJECT; }

        // Typed accessors throw std::bad_variant_access when the kind does not match
        [[nodiscard]] bool as_bool() const { return std::get<bool>(_storage); }

        [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(_storage); }

        // Integers are widened
        [[nodiscard]] double as_float() const;

        [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(_storage); }

        [[nodiscard]] const List &as_list() const { return std::get<List>(_storage); }

        [[nodiscard]] List &as_list() { return std::get<List>(_storage); }

        [[nodiscard]] const Object &as_object() const { return std::get<Object>(_storage); }

        [[nodiscard]] Object &as_object() { return std::get<Object>(_storage); }

        /**
         * Property lookup on an object value, nullptr if this is not an object or the key is missing.
         */
        [[nodiscard]] const Value *get(std::string_view key) const;

        [[nodiscard]] const storage_type &storage() const noexcept { return _storage; }

        /**
         * Compact JSON rendering.
         */
        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const Value &lhs, const Value &rhs);

    private:
        storage_type _storage{};
    };

    SYNCDL_EXPORT std::string_view to_string(Value::Kind kind);

} // namespace syncdl

template<>
struct fmt::formatter<syncdl::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const syncdl::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};

#endif // SYNCDL_TYPES_VALUE_H
