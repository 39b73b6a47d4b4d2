#ifndef REACTREE_FORWARD_DECLARATIONS_H
#define REACTREE_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace reactree {
    // Value graph - objects and arrays are shared, identity-compared values
    class Value;

    class Object;
    using object_ptr = Object*;
    using object_s_ptr = std::shared_ptr<Object>;

    class Array;
    using array_ptr = Array*;
    using array_s_ptr = std::shared_ptr<Array>;

    // Interceptor - owned by the Object / Array it instruments
    class Interceptor;
    using interceptor_ptr = Interceptor*;

    // Subject - shared between the instrumented property and its subscribers
    struct Subject;
    using subject_ptr = Subject*;
    using subject_s_ptr = std::shared_ptr<Subject>;

    // Subscriber - held weakly by subjects
    struct Subscriber;
    using subscriber_ptr = Subscriber*;
    using subscriber_s_ptr = std::shared_ptr<Subscriber>;
    using subscriber_w_ptr = std::weak_ptr<Subscriber>;

    // Watcher - held strongly by its owner and by the scheduler queue while pending
    class Watcher;
    using watcher_ptr = Watcher*;
    using watcher_s_ptr = std::shared_ptr<Watcher>;

    class Computed;
    using computed_s_ptr = std::shared_ptr<Computed>;

    class Scheduler;
    using scheduler_ptr = Scheduler*;

    struct TickHost;
    using tick_host_ptr = TickHost*;

    // Render nodes
    struct VNode;
    using vnode_ptr = VNode*;
    using vnode_s_ptr = std::shared_ptr<VNode>;
    using VNodeList = std::vector<vnode_s_ptr>;
    using vnode_list_s_ptr = std::shared_ptr<VNodeList>;

    struct VNodeData;
    struct AsyncFactory;
    using async_factory_s_ptr = std::shared_ptr<AsyncFactory>;

    struct ComponentInstance;
    using component_instance_s_ptr = std::shared_ptr<ComponentInstance>;

    struct NodeOps;
    class HostTree;
    class Patcher;

    // Component runtime
    struct ComponentDefinition;
    using component_definition_s_ptr = std::shared_ptr<const ComponentDefinition>;

    class Component;
    using component_ptr = Component*;
    using component_s_ptr = std::shared_ptr<Component>;
} // namespace reactree

#endif  // REACTREE_FORWARD_DECLARATIONS_H
