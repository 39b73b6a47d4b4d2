#include <catch2/catch_test_macros.hpp>

#include <reactree/config.h>
#include <reactree/vdom/host_tree.h>
#include <reactree/vdom/modules/attrs.h>
#include <reactree/vdom/patch.h>

#include <algorithm>
#include <optional>

using namespace reactree;

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct PatchFixture {
    ConfigScope config_scope;
    HostTree tree;
    Patcher patcher;
    std::vector<std::string> warnings;

    explicit PatchFixture(std::vector<Module> extra = {}) : patcher{tree, with_attrs(tree, std::move(extra))} {
        config().warn_handler = [this](const std::string &message) { warnings.push_back(message); };
    }

    static std::vector<Module> with_attrs(HostTree &tree, std::vector<Module> extra) {
        extra.insert(extra.begin(), make_attrs_module(tree));
        return extra;
    }

    // Render vnode detached, then start counting from a clean slate
    NodeHandle mount(const vnode_s_ptr &vnode) {
        auto elm = patcher.patch(vnode_s_ptr{}, vnode);
        tree.reset_counts();
        return elm;
    }

    [[nodiscard]] bool warned(std::string_view fragment) const {
        return std::ranges::any_of(warnings, [fragment](const std::string &w) { return w.find(fragment) != std::string::npos; });
    }
};

vnode_s_ptr li(std::int64_t key, std::string text) {
    return create_element_vnode("li", VNodeData{.key = VNodeKey{key}}, {create_text_vnode(std::move(text))});
}

vnode_s_ptr keyed_list(std::initializer_list<std::int64_t> keys) {
    VNodeList children;
    for (auto key : keys) { children.push_back(li(key, std::to_string(key))); }
    return create_element_vnode("ul", VNodeData{}, std::move(children));
}

}  // namespace

// ============================================================================
// Keyed children
// ============================================================================

TEST_CASE("Patcher - rotating keyed children moves one node", "[vdom][patch]") {
    PatchFixture f;
    auto old = keyed_list({1, 2, 3});
    auto elm = f.mount(old);
    REQUIRE(f.tree.serialize(elm) == "<ul><li>1</li><li>2</li><li>3</li></ul>");
    auto first_li = f.tree.children(elm)[0];

    auto next = keyed_list({3, 1, 2});
    REQUIRE(f.patcher.patch(old, next) == elm);
    REQUIRE(f.tree.serialize(elm) == "<ul><li>3</li><li>1</li><li>2</li></ul>");
    CHECK(f.tree.counts().moves == 1);
    CHECK(f.tree.counts().creates() == 0);
    CHECK(f.tree.counts().removes == 0);
    // Nodes are reused, not recreated
    CHECK(f.tree.children(elm)[1] == first_li);
    CHECK((*next->children)[1]->elm == first_li);
}

TEST_CASE("Patcher - inserting in the middle creates only the new node", "[vdom][patch]") {
    PatchFixture f;
    auto old = keyed_list({1, 2});
    auto elm = f.mount(old);

    auto next = create_element_vnode("ul", VNodeData{}, {li(1, "1"), li(9, "9"), li(2, "2")});
    f.patcher.patch(old, next);
    REQUIRE(f.tree.serialize(elm) == "<ul><li>1</li><li>9</li><li>2</li></ul>");
    CHECK(f.tree.counts().created_elements == 1);
    CHECK(f.tree.counts().removes == 0);
    CHECK(f.tree.counts().moves == 0);
}

TEST_CASE("Patcher - removing from the middle removes only that node", "[vdom][patch]") {
    PatchFixture f;
    auto old = keyed_list({1, 2, 3});
    auto elm = f.mount(old);

    f.patcher.patch(old, keyed_list({1, 3}));
    REQUIRE(f.tree.serialize(elm) == "<ul><li>1</li><li>3</li></ul>");
    CHECK(f.tree.counts().removes == 1);
    CHECK(f.tree.counts().creates() == 0);
}

TEST_CASE("Patcher - reversing and shuffling keeps host order in line", "[vdom][patch]") {
    PatchFixture f;
    auto old = keyed_list({1, 2, 3, 4, 5});
    auto elm = f.mount(old);

    auto reversed = keyed_list({5, 4, 3, 2, 1});
    f.patcher.patch(old, reversed);
    REQUIRE(f.tree.serialize(elm) == "<ul><li>5</li><li>4</li><li>3</li><li>2</li><li>1</li></ul>");
    CHECK(f.tree.counts().creates() == 0);

    auto shuffled = keyed_list({2, 6, 5, 1});
    f.patcher.patch(reversed, shuffled);
    REQUIRE(f.tree.serialize(elm) == "<ul><li>2</li><li>6</li><li>5</li><li>1</li></ul>");
    CHECK(f.tree.counts().created_elements == 1);
}

TEST_CASE("Patcher - a matching key on a different tag is created fresh", "[vdom][patch]") {
    PatchFixture f;
    auto old = keyed_list({1, 2, 3});
    auto elm = f.mount(old);
    auto old_li2 = (*old->children)[1]->elm;

    auto p2 = create_element_vnode("p", VNodeData{.key = VNodeKey{std::int64_t{2}}}, {create_text_vnode("2")});
    auto next = create_element_vnode("ul", VNodeData{}, {p2, li(4, "4")});
    f.patcher.patch(old, next);

    REQUIRE(f.tree.serialize(elm) == "<ul><p>2</p><li>4</li></ul>");
    CHECK(f.tree.counts().created_elements == 2);
    CHECK(f.tree.counts().removes == 3);
    CHECK(f.tree.counts().moves == 0);
    CHECK(p2->elm != old_li2);
    CHECK(f.tree.parent_node(old_li2) == NULL_NODE);
}

TEST_CASE("Patcher - unkeyed children are matched by searching the old range", "[vdom][patch]") {
    PatchFixture f;
    auto unkeyed = [](std::initializer_list<const char *> tags) {
        VNodeList children;
        for (const auto *tag : tags) { children.push_back(create_text_element_vnode(tag, VNodeData{}, tag)); }
        return create_element_vnode("div", VNodeData{}, std::move(children));
    };

    auto old = unkeyed({"span", "em", "b", "i"});
    auto elm = f.mount(old);
    auto old_b = (*old->children)[2]->elm;

    // No end probe matches the leading <b>, it is found by scanning the old children
    auto next = unkeyed({"b", "span", "i", "em"});
    f.patcher.patch(old, next);

    REQUIRE(f.tree.serialize(elm) == "<div><b>b</b><span>span</span><i>i</i><em>em</em></div>");
    CHECK((*next->children)[0]->elm == old_b);
    CHECK(f.tree.counts().creates() == 0);
    CHECK(f.tree.counts().removes == 0);
    CHECK(f.tree.counts().moves == 2);
}

TEST_CASE("Patcher - patching a tree onto itself does nothing", "[vdom][patch]") {
    PatchFixture f;
    auto vnode = keyed_list({1, 2});
    f.mount(vnode);

    f.patcher.patch(vnode, vnode);
    auto counts = f.tree.counts();
    CHECK(counts.creates() == 0);
    CHECK(counts.moves == 0);
    CHECK(counts.inserts == 0);
    CHECK(counts.removes == 0);
    CHECK(counts.text_updates == 0);
}

TEST_CASE("Patcher - duplicate keys are reported", "[vdom][patch]") {
    PatchFixture f;
    auto old = keyed_list({1, 2});
    f.mount(old);

    f.patcher.patch(old, keyed_list({1, 1}));
    REQUIRE(f.warned("Duplicate keys detected: '1'"));
}

// ============================================================================
// Unkeyed content
// ============================================================================

TEST_CASE("Patcher - text changes update in place", "[vdom][patch]") {
    PatchFixture f;
    auto old = create_element_vnode("p", VNodeData{}, {create_text_vnode("hello")});
    auto elm = f.mount(old);

    f.patcher.patch(old, create_element_vnode("p", VNodeData{}, {create_text_vnode("world")}));
    REQUIRE(f.tree.serialize(elm) == "<p>world</p>");
    CHECK(f.tree.counts().text_updates == 1);
    CHECK(f.tree.counts().creates() == 0);
}

TEST_CASE("Patcher - a different tag replaces the node", "[vdom][patch]") {
    PatchFixture f;
    auto root = f.tree.create_root();
    auto old = create_element_vnode("p", VNodeData{}, {create_text_vnode("a")});
    f.tree.append_child(root, f.mount(old));
    REQUIRE(f.tree.serialize(root) == "<div><p>a</p></div>");
    f.tree.reset_counts();

    auto next = create_element_vnode("section", VNodeData{}, {create_text_vnode("a")});
    auto elm = f.patcher.patch(old, next);
    REQUIRE(elm != old->elm);
    REQUIRE(f.tree.serialize(root) == "<div><section>a</section></div>");
    CHECK(f.tree.counts().removes == 1);
}

TEST_CASE("Patcher - a node shared between positions is cloned", "[vdom][patch]") {
    PatchFixture f;
    auto shared = create_element_vnode("span", VNodeData{}, {create_text_vnode("x")});
    auto vnode = create_element_vnode("div", VNodeData{}, {shared, shared});
    auto elm = f.mount(vnode);

    REQUIRE(f.tree.serialize(elm) == "<div><span>x</span><span>x</span></div>");
    const auto &children = *vnode->children;
    REQUIRE(children[0] != children[1]);
    REQUIRE(children[1]->is_cloned);
    REQUIRE(children[0]->elm != children[1]->elm);
}

// ============================================================================
// Modules and hooks
// ============================================================================

TEST_CASE("Patcher - the attrs module keeps attributes in line", "[vdom][patch][attrs]") {
    PatchFixture f;
    auto old = create_element_vnode("div", VNodeData{.attrs = {{"id", "a"}, {"title", "t"}}, .class_name = "c"});
    auto elm = f.mount(old);
    REQUIRE(f.tree.serialize(elm) == R"(<div class="c" id="a" title="t"></div>)");

    auto next = create_element_vnode("div", VNodeData{.attrs = {{"id", "b"}}, .style = "color: red"});
    f.patcher.patch(old, next);
    REQUIRE(f.tree.serialize(elm) == R"(<div id="b" style="color: red"></div>)");
}

TEST_CASE("Patcher - removal waits for every remove listener", "[vdom][patch]") {
    std::optional<RemoveCallback> pending;
    PatchFixture f{{Module{.name = "transition", .remove = [&pending](VNode &, const RemoveCallback &remove) {
        pending = remove;
    }}}};
    auto old = keyed_list({1, 2});
    auto elm = f.mount(old);

    f.patcher.patch(old, keyed_list({1}));
    REQUIRE(pending.has_value());
    REQUIRE(f.tree.counts().removes == 0);
    REQUIRE(f.tree.children(elm).size() == 2);

    (*pending)();
    REQUIRE(f.tree.counts().removes == 1);
    REQUIRE(f.tree.serialize(elm) == "<ul><li>1</li></ul>");
}

TEST_CASE("Patcher - hooks run through the node life-cycle", "[vdom][patch]") {
    PatchFixture f;
    std::vector<std::string> log;
    auto with_hooks = [&log](std::string text) {
        VNodeData data;
        data.hook.create = [&log](VNode &, VNode &) { log.push_back("create"); };
        data.hook.insert = [&log](VNode &) { log.push_back("insert"); };
        data.hook.prepatch = [&log](VNode &, VNode &) { log.push_back("prepatch"); };
        data.hook.update = [&log](VNode &, VNode &) { log.push_back("update"); };
        data.hook.postpatch = [&log](VNode &, VNode &) { log.push_back("postpatch"); };
        data.hook.destroy = [&log](VNode &) { log.push_back("destroy"); };
        return create_element_vnode("span", std::move(data), {create_text_vnode(std::move(text))});
    };

    auto old = create_element_vnode("div", VNodeData{}, {with_hooks("a")});
    f.mount(old);
    REQUIRE(log == std::vector<std::string>{"create", "insert"});

    log.clear();
    auto next = create_element_vnode("div", VNodeData{}, {with_hooks("b")});
    f.patcher.patch(old, next);
    REQUIRE(log == std::vector<std::string>{"prepatch", "update", "postpatch"});

    log.clear();
    REQUIRE(f.patcher.patch(next, vnode_s_ptr{}) == NULL_NODE);
    REQUIRE(log == std::vector<std::string>{"destroy"});
}

TEST_CASE("Patcher - same_vnode compares key, tag and input type", "[vdom][patch]") {
    auto a = create_element_vnode("input", VNodeData{.attrs = {{"type", "text"}}});
    auto b = create_element_vnode("input", VNodeData{.attrs = {{"type", "email"}}});
    auto c = create_element_vnode("input", VNodeData{.attrs = {{"type", "checkbox"}}});
    REQUIRE(Patcher::same_vnode(*a, *b));
    REQUIRE_FALSE(Patcher::same_vnode(*a, *c));
    REQUIRE_FALSE(Patcher::same_vnode(*li(1, "x"), *li(2, "x")));
    REQUIRE_FALSE(Patcher::same_vnode(*create_text_vnode("x"), *create_comment_vnode("x")));
}

TEST_CASE("Patcher - async placeholders keep their comment until the factory changes", "[vdom][patch][async]") {
    PatchFixture f;
    auto factory = std::make_shared<AsyncFactory>();
    auto wrap = [](vnode_s_ptr child) { return create_element_vnode("div", VNodeData{}, {std::move(child)}); };

    auto old = wrap(create_async_placeholder(factory));
    auto elm = f.mount(old);
    REQUIRE(f.tree.serialize(elm) == "<div><!----></div>");
    auto comment = f.tree.children(elm)[0];

    auto next = wrap(create_async_placeholder(factory));
    f.patcher.patch(old, next);
    CHECK(f.tree.counts().creates() == 0);
    CHECK(f.tree.counts().removes == 0);
    CHECK((*next->children)[0]->elm == comment);

    // Once adopted as a placeholder, an unresolved factory leaves the node alone
    (*next->children)[0]->is_async_placeholder = true;
    auto pending = wrap(create_async_placeholder(factory));
    f.patcher.patch(next, pending);
    CHECK((*pending->children)[0]->is_async_placeholder);
    CHECK((*pending->children)[0]->elm == comment);
    CHECK(f.tree.counts().creates() == 0);

    auto other = wrap(create_async_placeholder(std::make_shared<AsyncFactory>()));
    f.patcher.patch(pending, other);
    CHECK(f.tree.counts().created_comments == 1);
    CHECK(f.tree.counts().removes == 1);
    CHECK(f.tree.children(elm)[0] != comment);
}
