#ifndef SYNCDL_RUNTIME_EXECUTION_CONTEXT_H
#define SYNCDL_RUNTIME_EXECUTION_CONTEXT_H

#include <syncdl/syncdl_export.h>
#include <syncdl/syncdl_forward_declarations.h>
#include <syncdl/runtime/batch_scope.h>
#include <syncdl/runtime/deferred.h>
#include <syncdl/types/error_type.h>
#include <syncdl/types/response_path.h>
#include <syncdl/types/schema.h>
#include <syncdl/types/value.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace syncdl {

    enum class OperationType { QUERY, MUTATION };

    SYNCDL_EXPORT std::string_view to_string(OperationType operation_type);

    struct ExecutionOptions {
        // Root fields of a mutation are resolved one at a time, the scope is drained after each of them
        OperationType operation_type{OperationType::QUERY};
        // Added to the scope for the duration of each execute call
        std::vector<execution_observer_ptr> observers{};
    };

    /**
     * Evaluates a selection set against a schema, producing a data tree and the errors encountered along the way.
     *
     * Resolvers may return Deferred values (usually from a BatchLoader sharing this context's scope). Each level
     * of the tree is completed into a frame of slots, pending slots are filled by continuations as their values
     * settle during the scope drain, and the level settles once its last slot is filled. Every execute call runs
     * inside a single activation of the scope, so all loads made while walking one level of the tree end up in the
     * same batch.
     */
    class SYNCDL_EXPORT ExecutionContext {
    public:
        ExecutionContext(const Schema &schema, BatchScope &scope, ExecutionOptions options = {});

        ExecutionContext(const ExecutionContext &) = delete;

        ExecutionContext &operator=(const ExecutionContext &) = delete;

        /**
         * Throws IncompleteExecutionError if deferred work was left unsettled once the scope has drained, and lets
         * any other contract error (InvalidStateError, ConfigurationError, BatchContractError) propagate.
         * Field errors do not throw, they are collected into the result.
         */
        [[nodiscard]] ExecutionResult execute(const std::vector<FieldNode> &selection_set,
                                              const Value &root_value = {}, void *context_value = nullptr);

        [[nodiscard]] const Schema &schema() const noexcept { return *_schema; }

        [[nodiscard]] BatchScope &scope() const noexcept { return *_scope; }

        [[nodiscard]] const ExecutionOptions &options() const noexcept { return _options; }

        [[nodiscard]] bool is_executing() const noexcept { return _executing; }

        // Errors recorded so far by the current execution
        [[nodiscard]] const std::vector<LocatedError> &errors() const noexcept { return _errors; }

    private:
        using Completion = std::variant<Value, Deferred<Value>>;
        using FieldOutcome = std::variant<Value, Undefined, Deferred<Value>>;

        // Field nodes sharing a response name, their selection sets are merged
        struct CollectedField {
            std::string response_name;
            std::vector<const FieldNode *> nodes;
        };

        // What a continuation needs to know about the field it completes
        struct FieldFrame {
            object_type_ptr parent_type;
            const FieldDefinition *definition;
            std::vector<const FieldNode *> nodes;
        };

        using field_frame_ptr = std::shared_ptr<const FieldFrame>;

        struct CompletionFrame;

        using completion_frame_ptr = std::shared_ptr<CompletionFrame>;

        static std::vector<CollectedField> collect_fields(const std::vector<const FieldNode *> &nodes);

        Completion execute_fields(const ObjectType &parent_type, const Value &source, const ResponsePath &path,
                                  const std::vector<const FieldNode *> &nodes, bool serially);

        FieldOutcome execute_field(const ObjectType &parent_type, const Value &source, const CollectedField &field,
                                   const ResponsePath &path);

        Completion complete_value(const field_frame_ptr &field, const OutputType &type, const ResponsePath &path,
                                  const Value &result);

        Completion complete_list_value(const field_frame_ptr &field, const ListType &type, const ResponsePath &path,
                                       const Value &result);

        Completion complete_object_value(const field_frame_ptr &field, const ObjectType &type,
                                         const ResponsePath &path, const Value &result);

        Completion complete_deferred_items(const field_frame_ptr &field, const OutputType &type,
                                           const ResponsePath &path, const DeferredList &items);

        Completion ensure_non_null(Completion completion, const FieldFrame &field) const;

        void complete_item(const completion_frame_ptr &frame, std::size_t index, const OutputType &item_type,
                           const ResponsePath &item_path, const std::function<Completion()> &complete);

        Deferred<Value> complete_later(const field_frame_ptr &field, const Deferred<Value> &raw,
                                       const OutputType &type, const ResponsePath &path);

        Deferred<Value> guard(const Deferred<Value> &completion, const OutputType &type, const ResponsePath &path);

        void await_slot(const completion_frame_ptr &frame, std::size_t index, const Deferred<Value> &pending);

        static Completion finish_frame(const completion_frame_ptr &frame);

        Value handle_field_error(const std::exception_ptr &error, const OutputType &type, const ResponsePath &path);

        void settle_handled(const Deferred<Value> &target, const std::exception_ptr &error, const OutputType &type,
                            const ResponsePath &path);

        void record_error(const LocatedError &error);

        const Schema *_schema;
        BatchScope *_scope;
        ExecutionOptions _options;
        std::vector<LocatedError> _errors{};
        const Value *_root_value{nullptr};
        void *_context_value{nullptr};
        bool _executing{false};
    };

} // namespace syncdl

#endif // SYNCDL_RUNTIME_EXECUTION_CONTEXT_H
