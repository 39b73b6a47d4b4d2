#ifndef REACTREE_VNODE_H
#define REACTREE_VNODE_H

#include <reactree/types/value.h>
#include <reactree/util/string_hash.h>
#include <reactree/vdom/node_handle.h>

#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace reactree {
    enum class VNodeKind : std::uint8_t {
        ELEMENT = 0,
        TEXT = 1,
        COMMENT = 2,
        COMPONENT = 3,
        // A comment standing in for an async component that has not resolved yet
        ASYNC_PLACEHOLDER = 4
    };

    REACTREE_EXPORT std::string_view to_string(VNodeKind kind);

    using VNodeKey = std::variant<std::int64_t, std::string>;

    // Tag prefix of component placeholders, matched against any host element when hydrating
    inline constexpr std::string_view COMPONENT_TAG_PREFIX{"reactree-component"};

    REACTREE_EXPORT std::string to_string(const VNodeKey &key);

    /**
     * Shared completion callback for remove hooks.
     *
     * Every remove listener (each module and the node's own remove hook) must invoke the callback once; the host node
     * is removed when the last listener has done so. Copies share the same count.
     */
    class REACTREE_EXPORT RemoveCallback {
    public:
        RemoveCallback(std::function<void()> on_complete, std::size_t listeners);

        void operator()() const;

        void add_listeners(std::size_t count) const;

        [[nodiscard]] std::size_t listeners() const;

    private:
        struct State {
            std::size_t listeners;
            std::function<void()> on_complete;
        };

        std::shared_ptr<State> _state;
    };

    struct REACTREE_EXPORT VNodeHooks {
        std::function<void(VNode &vnode, bool hydrating)> init;
        std::function<void(VNode &old_vnode, VNode &vnode)> prepatch;
        std::function<void(VNode &empty_vnode, VNode &vnode)> create;
        std::function<void(VNode &vnode)> insert;
        std::function<void(VNode &old_vnode, VNode &vnode)> update;
        std::function<void(VNode &old_vnode, VNode &vnode)> postpatch;
        std::function<void(VNode &vnode, const RemoveCallback &remove)> remove;
        std::function<void(VNode &vnode)> destroy;

        [[nodiscard]] bool any() const;
    };

    /**
     * The typed data bag of a render node. The reconciler reads key, hook, keep_alive, pre and pending_insert;
     * everything else is for modules.
     */
    struct REACTREE_EXPORT VNodeData {
        using string_map = reactree::string_map<std::string>;

        std::optional<VNodeKey> key;
        string_map attrs;
        string_map dom_props;
        std::string class_name;
        std::string style;
        std::vector<std::string> on;
        VNodeHooks hook;
        bool keep_alive{false};
        // An enter / leave transition is bound to this node
        bool transition{false};
        // Skip compilation concerns such as the unknown element check
        bool pre{false};
        // Insert queue of a component's initial patch, handed to its placeholder
        std::optional<std::vector<vnode_ptr>> pending_insert;

        /**
         * True when hydrating must run the create hooks, i.e. the data holds more than what server rendering
         * already materialized (attrs, class and key).
         */
        [[nodiscard]] bool needs_create_on_hydrate() const;
    };

    /**
     * Resolution state shared by every placeholder created for one async component.
     */
    struct REACTREE_EXPORT AsyncFactory {
        component_definition_s_ptr resolved;
        bool error{false};

        [[nodiscard]] bool is_resolved() const { return resolved != nullptr; }
    };

    /**
     * What a component placeholder carries to instantiate or update its child component.
     */
    struct REACTREE_EXPORT VNodeComponentOptions {
        component_definition_s_ptr definition;
        object_s_ptr props_data;
        vnode_list_s_ptr children;
        std::string tag;
    };

    /**
     * The view of a live component instance the reconciler needs.
     */
    struct REACTREE_EXPORT ComponentInstance {
        virtual ~ComponentInstance() = default;

        /**
         * The host node of the component's rendered root.
         */
        [[nodiscard]] virtual NodeHandle root_element() const = 0;

        /**
         * The component's retained render tree root, nullptr before the first render.
         */
        [[nodiscard]] virtual vnode_ptr root_vnode() const = 0;

        [[nodiscard]] virtual const std::optional<std::string> &scope_id() const = 0;

        /**
         * The instance whose tree is currently being patched, if any.
         */
        [[nodiscard]] static ComponentInstance *active();

        /**
         * The instance whose render function is currently running, if any. Nodes created meanwhile take it as their
         * context.
         */
        [[nodiscard]] static const ComponentInstance *rendering();
    };

    /**
     * Marks an instance as the active instance for the lifetime of the scope.
     */
    struct REACTREE_EXPORT ActiveInstanceScope {
        explicit ActiveInstanceScope(ComponentInstance *instance);

        ~ActiveInstanceScope();

        ActiveInstanceScope(const ActiveInstanceScope &) = delete;

        ActiveInstanceScope &operator=(const ActiveInstanceScope &) = delete;

    private:
        ComponentInstance *_previous;
    };

    /**
     * Marks an instance as rendering for the lifetime of the scope.
     */
    struct REACTREE_EXPORT RenderingInstanceScope {
        explicit RenderingInstanceScope(const ComponentInstance *instance);

        ~RenderingInstanceScope();

        RenderingInstanceScope(const RenderingInstanceScope &) = delete;

        RenderingInstanceScope &operator=(const RenderingInstanceScope &) = delete;

    private:
        const ComponentInstance *_previous;
    };

    /**
     * One position in a render tree.
     *
     * A node handed to the reconciler is not changed during a patch pass apart from the reconciler's own bookkeeping
     * (elm, component_instance, is_root_insert, is_async_placeholder). A node that is already materialized and appears
     * again in a children list is cloned before being materialized a second time.
     */
    struct REACTREE_EXPORT VNode {
        VNodeKind kind{VNodeKind::COMMENT};
        // Element or component tag, empty for text and comments
        std::string tag;
        std::optional<std::string> ns;
        std::optional<VNodeData> data;
        // nullptr when the node has no children list
        vnode_list_s_ptr children;
        std::optional<std::string> text;
        std::optional<VNodeKey> key;

        NodeHandle elm;
        component_instance_s_ptr component_instance;
        std::shared_ptr<VNodeComponentOptions> component_options;
        // The instance that rendered this node
        const ComponentInstance *context{nullptr};
        // Placeholder node of the component this node is the root of
        vnode_ptr parent{nullptr};
        async_factory_s_ptr async_factory;

        std::optional<std::string> fn_scope_id;

        bool is_static{false};
        bool is_cloned{false};
        bool is_once{false};
        bool is_root_insert{true};
        bool is_async_placeholder{false};

        [[nodiscard]] bool is_comment() const { return kind == VNodeKind::COMMENT || kind == VNodeKind::ASYNC_PLACEHOLDER; }

        [[nodiscard]] bool has_tag() const { return !tag.empty(); }

        [[nodiscard]] bool has_children() const { return children != nullptr; }

        [[nodiscard]] std::string to_string() const;
    };

    /**
     * Element node. The key is taken from data, the namespace from config().tag_namespace and applied to children.
     */
    REACTREE_EXPORT vnode_s_ptr create_element_vnode(std::string tag, std::optional<VNodeData> data = std::nullopt,
                                                     VNodeList children = {});

    /**
     * Element node with text content and no children.
     */
    REACTREE_EXPORT vnode_s_ptr create_text_element_vnode(std::string tag, std::optional<VNodeData> data,
                                                          std::string text);

    REACTREE_EXPORT vnode_s_ptr create_text_vnode(std::string text);

    REACTREE_EXPORT vnode_s_ptr create_comment_vnode(std::string text);

    /**
     * An empty comment, used where a render produced nothing.
     */
    REACTREE_EXPORT vnode_s_ptr create_empty_vnode(std::string text = {});

    REACTREE_EXPORT vnode_s_ptr create_async_placeholder(async_factory_s_ptr factory,
                                                         std::optional<VNodeData> data = std::nullopt);

    /**
     * Shallow copy sharing data and children with the original, marked as cloned.
     */
    REACTREE_EXPORT vnode_s_ptr clone_vnode(const VNode &vnode);

    /**
     * Apply a namespace to vnode and its element descendants that do not have one, foreignObject children excepted.
     */
    REACTREE_EXPORT void apply_namespace(VNode &vnode, std::optional<std::string> ns, bool force = false);
} // namespace reactree

#endif  // REACTREE_VNODE_H
