#include <syncdl/types/schema.h>
#include <syncdl/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace syncdl {

    const OutputType &OutputType::nullable() const {
        if (is_non_null()) { return static_cast<const NonNullType *>(this)->of_type(); }
        return *this;
    }

    LeafType::LeafType(std::string name, serialize_fn serialize)
        : _name{std::move(name)}, _serialize{std::move(serialize)} {
        if (!_serialize) { throw_error<ConfigurationError>("Leaf type '{}' requires a serialize function", _name); }
    }

    Value LeafType::serialize(const Value &value) const { return _serialize(value); }

    ObjectType::ObjectType(std::string name) : _name{std::move(name)} {}

    ObjectType &ObjectType::add_field(std::string name, const OutputType &type, FieldResolver resolve,
                                      Object default_arguments) {
        if (field(name) != nullptr) {
            throw_error<ConfigurationError>("Field '{}' is already defined on type '{}'", name, _name);
        }
        _fields.push_back(FieldDefinition{std::move(name), &type, std::move(resolve), std::move(default_arguments)});
        return *this;
    }

    const FieldDefinition *ObjectType::field(std::string_view name) const {
        auto it = std::find_if(_fields.begin(), _fields.end(),
                               [name](const FieldDefinition &f) { return f.name == name; });
        return it == _fields.end() ? nullptr : &*it;
    }

    std::string ListType::name() const { return fmt::format("[{}]", _of_type->name()); }

    NonNullType::NonNullType(const OutputType &of_type) : _of_type{&of_type} {
        if (of_type.is_non_null()) {
            throw_error<ConfigurationError>("Cannot wrap the non-null type '{}' in another non-null",
                                            of_type.name());
        }
    }

    std::string NonNullType::name() const { return fmt::format("{}!", _of_type->name()); }

    namespace {
        [[noreturn]] void cannot_represent(std::string_view type, const Value &value) {
            throw std::invalid_argument(fmt::format("{} cannot represent value: {}", type, value));
        }

        Value serialize_string(const Value &value) {
            switch (value.kind()) {
                case Value::Kind::STRING: return value;
                case Value::Kind::BOOLEAN: return value.as_bool() ? "true" : "false";
                case Value::Kind::INT: return fmt::format("{}", value.as_int());
                case Value::Kind::FLOAT: return fmt::format("{}", value.as_float());
                default: cannot_represent("String", value);
            }
        }

        Value serialize_int(const Value &value) {
            switch (value.kind()) {
                case Value::Kind::INT: {
                    auto i = value.as_int();
                    if (i < std::numeric_limits<std::int32_t>::min() || i > std::numeric_limits<std::int32_t>::max()) {
                        throw std::invalid_argument(
                            fmt::format("Int cannot represent non 32-bit signed integer value: {}", value));
                    }
                    return value;
                }
                case Value::Kind::BOOLEAN: return value.as_bool() ? 1 : 0;
                case Value::Kind::FLOAT: {
                    // Only floats holding an integral value in the 32 bit range are accepted
                    auto f = value.as_float();
                    if (std::trunc(f) == f && f >= std::numeric_limits<std::int32_t>::min() &&
                        f <= std::numeric_limits<std::int32_t>::max()) {
                        return static_cast<std::int64_t>(f);
                    }
                    throw std::invalid_argument(fmt::format("Int cannot represent non-integer value: {}", value));
                }
                default: throw std::invalid_argument(fmt::format("Int cannot represent non-integer value: {}", value));
            }
        }

        Value serialize_float(const Value &value) {
            switch (value.kind()) {
                case Value::Kind::FLOAT: return value;
                case Value::Kind::INT: return value.as_float();
                case Value::Kind::BOOLEAN: return value.as_bool() ? 1.0 : 0.0;
                default: throw std::invalid_argument(fmt::format("Float cannot represent non numeric value: {}", value));
            }
        }

        Value serialize_boolean(const Value &value) {
            switch (value.kind()) {
                case Value::Kind::BOOLEAN: return value;
                case Value::Kind::INT: return value.as_int() != 0;
                case Value::Kind::FLOAT: return value.as_float() != 0.0;
                default: cannot_represent("Boolean", value);
            }
        }

        Value serialize_id(const Value &value) {
            switch (value.kind()) {
                case Value::Kind::STRING: return value;
                case Value::Kind::INT: return fmt::format("{}", value.as_int());
                default: cannot_represent("ID", value);
            }
        }
    } // namespace

    Schema::Schema()
        : _string{&make<LeafType>("String", serialize_string)}, _int{&make<LeafType>("Int", serialize_int)},
          _float{&make<LeafType>("Float", serialize_float)}, _boolean{&make<LeafType>("Boolean", serialize_boolean)},
          _id{&make<LeafType>("ID", serialize_id)} {}

    ObjectType &Schema::object_type(std::string name) { return make<ObjectType>(std::move(name)); }

    const LeafType &Schema::leaf_type(std::string name, LeafType::serialize_fn serialize) {
        return make<LeafType>(std::move(name), std::move(serialize));
    }

    const ListType &Schema::list_of(const OutputType &of_type) { return make<ListType>(of_type); }

    const NonNullType &Schema::non_null(const OutputType &of_type) { return make<NonNullType>(of_type); }

    const Value &ResolveInfo::argument(std::string_view name) const {
        static const Value missing{};
        auto *value = arguments.find(name);
        return value == nullptr ? missing : *value;
    }

    ResolveResult default_field_resolver(const Value &source, const ResolveInfo &info) {
        if (auto *value = source.get(info.field_name); value != nullptr) { return *value; }
        return Value{};
    }

} // namespace syncdl
