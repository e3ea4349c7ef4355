#include <syncdl/runtime/execution_context.h>
#include <syncdl/runtime/execution_observer.h>
#include <syncdl/util/errors.h>
#include <syncdl/util/scope.h>

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace syncdl {

    std::string_view to_string(OperationType operation_type) {
        switch (operation_type) {
            case OperationType::QUERY: return "query";
            case OperationType::MUTATION: return "mutation";
        }
        return "unknown";
    }

    namespace {
        bool is_contract_error(const std::exception_ptr &error) {
            try {
                std::rethrow_exception(error);
            } catch (const SyncdlError &) {
                return true;
            } catch (...) {
                return false;
            }
        }
    } // namespace

    /**
     * The slots of one object or list level. Pending slots are filled in by continuations, the level settles
     * (through result) when the last one arrives. A failed slot fails the whole level.
     */
    struct ExecutionContext::CompletionFrame {
        bool is_object;
        std::vector<std::string> names{};
        std::vector<std::optional<Value>> slots{};
        std::size_t pending{0};
        bool failed{false};
        Deferred<Value> result{};

        // Empty slots are omitted from objects and become null in lists
        [[nodiscard]] Value assemble() {
            if (!is_object) {
                List list;
                list.reserve(slots.size());
                for (auto &slot : slots) { list.push_back(slot ? std::move(*slot) : Value{}); }
                return list;
            }
            Object object;
            for (std::size_t i = 0; i < slots.size(); ++i) {
                if (slots[i]) { object.insert_or_assign(names[i], std::move(*slots[i])); }
            }
            return object;
        }
    };

    ExecutionContext::ExecutionContext(const Schema &schema, BatchScope &scope, ExecutionOptions options)
        : _schema{&schema}, _scope{&scope}, _options{std::move(options)} {}

    ExecutionResult ExecutionContext::execute(const std::vector<FieldNode> &selection_set, const Value &root_value,
                                              void *context_value) {
        if (_executing) { throw InvalidStateError("ExecutionContext is already executing."); }
        auto root_type = _options.operation_type == OperationType::MUTATION ? _schema->mutation_type()
                                                                             : _schema->query_type();
        if (root_type == nullptr) {
            throw_error<ConfigurationError>("Schema does not define a {} type.", to_string(_options.operation_type));
        }

        _executing = true;
        _errors.clear();
        _root_value = &root_value;
        _context_value = context_value;

        std::vector<execution_observer_ptr> added;
        for (auto *observer : _options.observers) {
            auto &registered = _scope->observers();
            if (std::find(registered.begin(), registered.end(), observer) == registered.end()) {
                _scope->add_observer(observer);
                added.push_back(observer);
            }
        }
        auto reset = make_scope_exit([this, &added] {
            for (auto *observer : added) { _scope->remove_observer(observer); }
            _executing = false;
            _root_value = nullptr;
            _context_value = nullptr;
        });

        for (auto *observer : _options.observers) { observer->on_before_execution(*this); }

        std::vector<const FieldNode *> nodes;
        nodes.reserve(selection_set.size());
        for (const auto &node : selection_set) { nodes.push_back(&node); }

        std::optional<Completion> root;
        {
            BatchScope::Activation activation{*_scope};
            try {
                root.emplace(execute_fields(*root_type, root_value, ResponsePath{}, nodes,
                                            _options.operation_type == OperationType::MUTATION));
            } catch (const LocatedError &e) {
                // A non-null root field failed, there is no nullable parent to absorb it
                record_error(e);
            }
            activation.close();
        }

        ExecutionResult result;
        if (root) {
            if (auto *value = std::get_if<Value>(&*root)) {
                result.data = std::move(*value);
            } else {
                const auto &deferred = std::get<Deferred<Value>>(*root);
                if (!deferred.is_done()) {
                    throw IncompleteExecutionError(
                        "Execution did not complete, deferred values were left unsettled after the batch scope drained.");
                }
                try {
                    result.data = deferred.get_result();
                } catch (const LocatedError &e) {
                    record_error(e);
                }
            }
        }
        result.errors = std::move(_errors);
        _errors.clear();

        for (auto *observer : _options.observers) { observer->on_after_execution(*this, result); }
        return result;
    }

    std::vector<ExecutionContext::CollectedField>
    ExecutionContext::collect_fields(const std::vector<const FieldNode *> &nodes) {
        std::vector<CollectedField> fields;
        for (const auto *node : nodes) {
            const auto &name = node->response_name();
            auto it = std::find_if(fields.begin(), fields.end(),
                                   [&name](const CollectedField &f) { return f.response_name == name; });
            if (it == fields.end()) {
                fields.push_back(CollectedField{name, {node}});
            } else {
                it->nodes.push_back(node);
            }
        }
        return fields;
    }

    ExecutionContext::Completion ExecutionContext::execute_fields(const ObjectType &parent_type, const Value &source,
                                                                  const ResponsePath &path,
                                                                  const std::vector<const FieldNode *> &nodes,
                                                                  bool serially) {
        auto frame = std::make_shared<CompletionFrame>(CompletionFrame{true});
        for (const auto &field : collect_fields(nodes)) {
            auto field_path = path.add_key(field.response_name, parent_type.name());
            auto outcome = execute_field(parent_type, source, field, field_path);
            if (std::holds_alternative<Undefined>(outcome)) { continue; }

            auto index = frame->slots.size();
            frame->names.push_back(field.response_name);
            frame->slots.emplace_back();
            if (auto *value = std::get_if<Value>(&outcome)) {
                frame->slots[index] = std::move(*value);
                continue;
            }

            auto &deferred = std::get<Deferred<Value>>(outcome);
            if (serially && !deferred.is_done()) { _scope->drain(); }
            if (deferred.is_done()) {
                // A failure here is a non-null error on its way to the nearest nullable parent
                frame->slots[index] = deferred.get_result();
            } else {
                await_slot(frame, index, deferred);
            }
        }
        return finish_frame(frame);
    }

    ExecutionContext::FieldOutcome ExecutionContext::execute_field(const ObjectType &parent_type,
                                                                   const Value &source, const CollectedField &field,
                                                                   const ResponsePath &path) {
        const auto &node = *field.nodes.front();
        const auto *definition = parent_type.field(node.name);
        if (definition == nullptr) { return undefined; }

        const auto &return_type = *definition->type;
        auto frame = std::make_shared<const FieldFrame>(FieldFrame{&parent_type, definition, field.nodes});

        Object arguments(definition->default_arguments);
        for (const auto &[name, value] : node.arguments) { arguments.insert_or_assign(name, value); }
        ResolveInfo info{definition->name, parent_type, return_type, path, arguments, node,
                         *_root_value,     *_scope,     _context_value};

        try {
            for (auto *observer : _options.observers) { observer->on_before_field_resolve(info); }
            auto resolved = definition->resolve ? definition->resolve(source, info)
                                                : default_field_resolver(source, info);
            for (auto *observer : _options.observers) { observer->on_after_field_resolve(info); }

            if (std::holds_alternative<Undefined>(resolved)) { return undefined; }

            std::optional<Completion> completion;
            if (auto *value = std::get_if<Value>(&resolved)) {
                completion.emplace(complete_value(frame, return_type, path, *value));
            } else if (auto *items = std::get_if<DeferredList>(&resolved)) {
                completion.emplace(complete_deferred_items(frame, return_type, path, *items));
            } else {
                const auto &deferred = std::get<Deferred<Value>>(resolved);
                if (!deferred.is_done()) {
                    for (auto *observer : _options.observers) { observer->on_field_deferred(path); }
                    return complete_later(frame, deferred, return_type, path);
                }
                completion.emplace(complete_value(frame, return_type, path, deferred.get_result()));
            }

            if (auto *value = std::get_if<Value>(&*completion)) { return std::move(*value); }
            const auto &pending = std::get<Deferred<Value>>(*completion);
            if (pending.is_done()) { return pending.get_result(); }
            return guard(pending, return_type, path);
        } catch (...) {
            return handle_field_error(std::current_exception(), return_type, path);
        }
    }

    ExecutionContext::Completion ExecutionContext::complete_value(const field_frame_ptr &field,
                                                                  const OutputType &type, const ResponsePath &path,
                                                                  const Value &result) {
        if (type.is_non_null()) {
            return ensure_non_null(complete_value(field, type.nullable(), path, result), *field);
        }
        if (result.is_null()) { return Value{}; }

        switch (type.kind()) {
            case OutputType::Kind::LEAF: return static_cast<const LeafType &>(type).serialize(result);
            case OutputType::Kind::LIST:
                return complete_list_value(field, static_cast<const ListType &>(type), path, result);
            case OutputType::Kind::OBJECT:
                return complete_object_value(field, static_cast<const ObjectType &>(type), path, result);
            case OutputType::Kind::NON_NULL: break;
        }
        throw_error<InvalidStateError>("Cannot complete a value of type '{}'", type.name());
    }

    ExecutionContext::Completion ExecutionContext::complete_list_value(const field_frame_ptr &field,
                                                                       const ListType &type,
                                                                       const ResponsePath &path,
                                                                       const Value &result) {
        if (!result.is_list()) {
            throw std::runtime_error(fmt::format("Expected Iterable, but did not find one for field '{}.{}'.",
                                                 field->parent_type->name(), field->definition->name));
        }
        const auto &items = result.as_list();
        const auto &item_type = type.of_type();
        auto frame = std::make_shared<CompletionFrame>(CompletionFrame{false});
        frame->slots.resize(items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            auto item_path = path.add_index(i);
            complete_item(frame, i, item_type, item_path,
                          [&] { return complete_value(field, item_type, item_path, items[i]); });
        }
        return finish_frame(frame);
    }

    ExecutionContext::Completion ExecutionContext::complete_object_value(const field_frame_ptr &field,
                                                                         const ObjectType &type,
                                                                         const ResponsePath &path,
                                                                         const Value &result) {
        std::vector<const FieldNode *> nodes;
        for (const auto *node : field->nodes) {
            for (const auto &child : node->selection_set) { nodes.push_back(&child); }
        }
        return execute_fields(type, result, path, nodes, false);
    }

    ExecutionContext::Completion ExecutionContext::complete_deferred_items(const field_frame_ptr &field,
                                                                           const OutputType &type,
                                                                           const ResponsePath &path,
                                                                           const DeferredList &items) {
        if (type.is_non_null()) {
            return ensure_non_null(complete_deferred_items(field, type.nullable(), path, items), *field);
        }
        if (!type.is_list()) {
            throw std::runtime_error(fmt::format("Expected a single value, but received a list for field '{}.{}'.",
                                                 field->parent_type->name(), field->definition->name));
        }
        const auto &item_type = static_cast<const ListType &>(type).of_type();
        auto frame = std::make_shared<CompletionFrame>(CompletionFrame{false});
        frame->slots.resize(items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            auto item_path = path.add_index(i);
            const auto &item = items[i];
            if (item.is_done()) {
                complete_item(frame, i, item_type, item_path,
                              [&] { return complete_value(field, item_type, item_path, item.get_result()); });
            } else {
                await_slot(frame, i, complete_later(field, item, item_type, item_path));
            }
        }
        return finish_frame(frame);
    }

    ExecutionContext::Completion ExecutionContext::ensure_non_null(Completion completion,
                                                                   const FieldFrame &field) const {
        auto message = fmt::format("Cannot return null for non-nullable field {}.{}.", field.parent_type->name(),
                                   field.definition->name);
        if (auto *value = std::get_if<Value>(&completion)) {
            if (value->is_null()) { throw std::runtime_error(message); }
            return completion;
        }
        return std::get<Deferred<Value>>(completion).then([message](const Value &value) -> Value {
            if (value.is_null()) { throw std::runtime_error(message); }
            return value;
        });
    }

    void ExecutionContext::complete_item(const completion_frame_ptr &frame, std::size_t index,
                                         const OutputType &item_type, const ResponsePath &item_path,
                                         const std::function<Completion()> &complete) {
        std::exception_ptr error;
        try {
            auto completion = complete();
            if (auto *value = std::get_if<Value>(&completion)) {
                frame->slots[index] = std::move(*value);
                return;
            }
            const auto &pending = std::get<Deferred<Value>>(completion);
            if (pending.is_done()) {
                frame->slots[index] = pending.get_result();
                return;
            }
            await_slot(frame, index, guard(pending, item_type, item_path));
            return;
        } catch (...) {
            error = std::current_exception();
        }
        // Throws for a non-null item, the list as a whole is then null (or propagates further)
        frame->slots[index] = handle_field_error(error, item_type, item_path);
    }

    Deferred<Value> ExecutionContext::complete_later(const field_frame_ptr &field, const Deferred<Value> &raw,
                                                     const OutputType &type, const ResponsePath &path) {
        Deferred<Value> completed;
        auto on_settled = [this, field, completed, type = &type, path](const Deferred<Value> &settled) {
            std::optional<Completion> completion;
            std::exception_ptr error;
            try {
                completion.emplace(complete_value(field, *type, path, settled.get_result()));
            } catch (...) {
                error = std::current_exception();
            }
            if (error) {
                settle_handled(completed, error, *type, path);
            } else if (auto *value = std::get_if<Value>(&*completion)) {
                completed.set_result(std::move(*value));
            } else {
                completed.set_result(guard(std::get<Deferred<Value>>(*completion), *type, path));
            }
        };
        if (raw.is_done()) {
            on_settled(raw);
        } else {
            raw.on_done(std::move(on_settled));
        }
        return completed;
    }

    Deferred<Value> ExecutionContext::guard(const Deferred<Value> &completion, const OutputType &type,
                                            const ResponsePath &path) {
        Deferred<Value> guarded;
        auto on_settled = [this, guarded, type = &type, path](const Deferred<Value> &settled) {
            if (settled.is_failed()) {
                settle_handled(guarded, settled.error(), *type, path);
            } else {
                guarded.set_result(settled.get_result());
            }
        };
        if (completion.is_done()) {
            on_settled(completion);
        } else {
            completion.on_done(std::move(on_settled));
        }
        return guarded;
    }

    void ExecutionContext::await_slot(const completion_frame_ptr &frame, std::size_t index,
                                      const Deferred<Value> &pending) {
        ++frame->pending;
        pending.on_done([frame, index](const Deferred<Value> &settled) {
            if (frame->failed) { return; }
            if (settled.is_failed()) {
                frame->failed = true;
                frame->result.set_error(settled.error());
                return;
            }
            frame->slots[index] = settled.get_result();
            if (--frame->pending == 0) { frame->result.set_result(frame->assemble()); }
        });
    }

    ExecutionContext::Completion ExecutionContext::finish_frame(const completion_frame_ptr &frame) {
        if (frame->pending == 0) { return frame->assemble(); }
        return frame->result;
    }

    Value ExecutionContext::handle_field_error(const std::exception_ptr &error, const OutputType &type,
                                               const ResponsePath &path) {
        if (is_contract_error(error)) { std::rethrow_exception(error); }
        auto located = LocatedError::locate(error, path);
        if (type.is_non_null()) { throw located; }
        record_error(located);
        return Value{};
    }

    void ExecutionContext::settle_handled(const Deferred<Value> &target, const std::exception_ptr &error,
                                          const OutputType &type, const ResponsePath &path) {
        std::optional<Value> value;
        std::exception_ptr propagated;
        try {
            value.emplace(handle_field_error(error, type, path));
        } catch (const LocatedError &) {
            propagated = std::current_exception();
        } catch (const SyncdlError &) {
            propagated = std::current_exception();
        }
        if (propagated) {
            target.set_error(propagated);
        } else {
            target.set_result(std::move(*value));
        }
    }

    void ExecutionContext::record_error(const LocatedError &error) {
        _errors.push_back(error);
        for (auto *observer : _options.observers) { observer->on_field_error(error); }
    }

} // namespace syncdl
