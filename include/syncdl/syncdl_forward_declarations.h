#ifndef SYNCDL_FORWARD_DECLARATIONS_H
#define SYNCDL_FORWARD_DECLARATIONS_H


namespace syncdl {
    // Value - held by value, containers own their children
    class Value;
    class Object;

    template<typename T>
    class Deferred;

    // BatchScope - owned by the caller, loaders and resolvers hold references
    class BatchScope;

    // Output types - owned by the Schema, everything else refers to them by raw pointer / reference
    struct OutputType;
    using output_type_ptr = const OutputType*;

    struct LeafType;

    struct ObjectType;
    using object_type_ptr = const ObjectType*;

    struct ListType;
    struct NonNullType;

    class Schema;

    struct FieldDefinition;
    struct FieldNode;
    struct ResolveInfo;

    class ResponsePath;

    struct LocatedError;
    struct ExecutionResult;

    // ExecutionLifeCycleObserver - externally owned, registered by raw pointer
    struct ExecutionLifeCycleObserver;
    using execution_observer_ptr = ExecutionLifeCycleObserver*;

    class ExecutionContext;
} // namespace syncdl

#endif // SYNCDL_FORWARD_DECLARATIONS_H
