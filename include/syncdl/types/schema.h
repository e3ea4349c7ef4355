#ifndef SYNCDL_TYPES_SCHEMA_H
#define SYNCDL_TYPES_SCHEMA_H

#include <syncdl/syncdl_export.h>
#include <syncdl/syncdl_forward_declarations.h>
#include <syncdl/runtime/deferred.h>
#include <syncdl/types/response_path.h>
#include <syncdl/types/value.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace syncdl {

    /**
     * What a resolver hands back to the executor:
     * - a Value that is available now,
     * - Undefined to leave the field out of the result,
     * - a Deferred<Value> that will settle later (typically from a BatchLoader),
     * - a list of Deferred items, for list fields whose items are loaded individually.
     */
    using DeferredList = std::vector<Deferred<Value>>;
    using ResolveResult = std::variant<Value, Undefined, Deferred<Value>, DeferredList>;

    using FieldResolver = std::function<ResolveResult(const Value &source, const ResolveInfo &info)>;

    /**
     * Output type descriptors. These are the executor's view of an externally defined type system: enough to
     * choose between leaf, object and list completion and to apply non-null semantics.
     */
    struct SYNCDL_EXPORT OutputType {
        enum class Kind { LEAF, OBJECT, LIST, NON_NULL };

        virtual ~OutputType() = default;

        [[nodiscard]] virtual Kind kind() const noexcept = 0;

        // Type reference as written in a schema, e.g. "String", "User", "[User!]!"
        [[nodiscard]] virtual std::string name() const = 0;

        [[nodiscard]] bool is_non_null() const noexcept { return kind() == Kind::NON_NULL; }

        [[nodiscard]] bool is_list() const noexcept { return kind() == Kind::LIST; }

        // The type with a non-null wrapper removed
        [[nodiscard]] const OutputType &nullable() const;
    };

    struct SYNCDL_EXPORT LeafType final : OutputType {
        // Converts a raw resolved (non null) value to its output representation, throws if it cannot
        using serialize_fn = std::function<Value(const Value &)>;

        LeafType(std::string name, serialize_fn serialize);

        [[nodiscard]] Kind kind() const noexcept override { return Kind::LEAF; }

        [[nodiscard]] std::string name() const override { return _name; }

        [[nodiscard]] Value serialize(const Value &value) const;

    private:
        std::string _name;
        serialize_fn _serialize;
    };

    struct SYNCDL_EXPORT FieldDefinition {
        std::string name;
        output_type_ptr type;
        // Empty means the default resolver: a property lookup on the source object
        FieldResolver resolve{};
        Object default_arguments{};
    };

    struct SYNCDL_EXPORT ObjectType final : OutputType {
        explicit ObjectType(std::string name);

        [[nodiscard]] Kind kind() const noexcept override { return Kind::OBJECT; }

        [[nodiscard]] std::string name() const override { return _name; }

        /**
         * Fields can be added after construction so that object types can refer to each other (or to themselves).
         */
        ObjectType &add_field(std::string name, const OutputType &type, FieldResolver resolve = {},
                              Object default_arguments = {});

        [[nodiscard]] const FieldDefinition *field(std::string_view name) const;

        [[nodiscard]] const std::vector<FieldDefinition> &fields() const noexcept { return _fields; }

    private:
        std::string _name;
        std::vector<FieldDefinition> _fields;
    };

    struct SYNCDL_EXPORT ListType final : OutputType {
        explicit ListType(const OutputType &of_type) : _of_type{&of_type} {}

        [[nodiscard]] Kind kind() const noexcept override { return Kind::LIST; }

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] const OutputType &of_type() const noexcept { return *_of_type; }

    private:
        output_type_ptr _of_type;
    };

    struct SYNCDL_EXPORT NonNullType final : OutputType {
        explicit NonNullType(const OutputType &of_type);

        [[nodiscard]] Kind kind() const noexcept override { return Kind::NON_NULL; }

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] const OutputType &of_type() const noexcept { return *_of_type; }

    private:
        output_type_ptr _of_type;
    };

    /**
     * Owns the output types of a schema, references handed out stay valid for the life-time of the schema.
     */
    class SYNCDL_EXPORT Schema {
    public:
        Schema();

        Schema(const Schema &) = delete;

        Schema &operator=(const Schema &) = delete;

        ObjectType &object_type(std::string name);

        const LeafType &leaf_type(std::string name, LeafType::serialize_fn serialize);

        const ListType &list_of(const OutputType &of_type);

        const NonNullType &non_null(const OutputType &of_type);

        [[nodiscard]] const LeafType &string_type() const noexcept { return *_string; }

        [[nodiscard]] const LeafType &int_type() const noexcept { return *_int; }

        [[nodiscard]] const LeafType &float_type() const noexcept { return *_float; }

        [[nodiscard]] const LeafType &boolean_type() const noexcept { return *_boolean; }

        [[nodiscard]] const LeafType &id_type() const noexcept { return *_id; }

        void set_query_type(const ObjectType &type) noexcept { _query_type = &type; }

        void set_mutation_type(const ObjectType &type) noexcept { _mutation_type = &type; }

        [[nodiscard]] object_type_ptr query_type() const noexcept { return _query_type; }

        [[nodiscard]] object_type_ptr mutation_type() const noexcept { return _mutation_type; }

    private:
        template<typename T, typename... Args>
        T &make(Args &&... args) {
            auto type = std::make_unique<T>(std::forward<Args>(args)...);
            auto &ref = *type;
            _types.push_back(std::move(type));
            return ref;
        }

        std::vector<std::unique_ptr<OutputType>> _types;
        const LeafType *_string;
        const LeafType *_int;
        const LeafType *_float;
        const LeafType *_boolean;
        const LeafType *_id;
        object_type_ptr _query_type{nullptr};
        object_type_ptr _mutation_type{nullptr};
    };

    /**
     * One field of an already parsed selection set.
     */
    struct SYNCDL_EXPORT FieldNode {
        std::string name;
        std::string alias{};
        Object arguments{};
        std::vector<FieldNode> selection_set{};

        [[nodiscard]] const std::string &response_name() const noexcept { return alias.empty() ? name : alias; }
    };

    /**
     * Everything a resolver gets to know about the field it is resolving. Only valid for the duration of the
     * resolver call, copy what is needed into any continuation.
     */
    struct SYNCDL_EXPORT ResolveInfo {
        const std::string &field_name;
        const ObjectType &parent_type;
        const OutputType &return_type;
        const ResponsePath &path;
        const Object &arguments;
        const FieldNode &field_node;
        const Value &root_value;
        BatchScope &scope;
        void *context;

        // Argument value, null when neither given nor defaulted
        [[nodiscard]] const Value &argument(std::string_view name) const;

        template<typename T>
        [[nodiscard]] T &context_as() const {
            return *static_cast<T *>(context);
        }
    };

    /**
     * The resolver used when a field definition does not provide one: the value of the source object's property
     * with the field name, null if the source is not an object or has no such property.
     */
    SYNCDL_EXPORT ResolveResult default_field_resolver(const Value &source, const ResolveInfo &info);

} // namespace syncdl

#endif // SYNCDL_TYPES_SCHEMA_H
