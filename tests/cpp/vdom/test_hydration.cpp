#include <catch2/catch_test_macros.hpp>

#include <reactree/config.h>
#include <reactree/vdom/host_tree.h>
#include <reactree/vdom/modules/attrs.h>
#include <reactree/vdom/patch.h>

#include <algorithm>

using namespace reactree;

namespace {

struct HydrationFixture {
    ConfigScope config_scope;
    HostTree tree;
    Patcher patcher{tree, {make_attrs_module(tree)}};
    std::vector<std::string> warnings;
    NodeHandle body;

    HydrationFixture() : body{tree.create_root("body")} {
        config().warn_handler = [this](const std::string &message) { warnings.push_back(message); };
    }

    // Server markup: <div><p>hi</p></div>, or <div><span>hi</span></div> when mismatched
    NodeHandle server_render(bool mismatched = false) {
        auto root = tree.create_element("div", VNode{});
        auto child = tree.create_element(mismatched ? "span" : "p", VNode{});
        tree.append_child(child, tree.create_text_node("hi"));
        tree.append_child(root, child);
        tree.append_child(body, root);
        tree.reset_counts();
        return root;
    }

    [[nodiscard]] std::size_t warning_count(std::string_view fragment) const {
        return static_cast<std::size_t>(std::ranges::count_if(
            warnings, [fragment](const std::string &w) { return w.find(fragment) != std::string::npos; }));
    }
};

vnode_s_ptr client_render(std::string text = "hi") {
    return create_element_vnode("div", VNodeData{}, {
        create_element_vnode("p", VNodeData{}, {create_text_vnode(std::move(text))}),
    });
}

}  // namespace

TEST_CASE("Hydration - matching server markup is adopted", "[vdom][hydration]") {
    HydrationFixture f;
    auto root = f.server_render();
    auto vnode = client_render();

    REQUIRE(f.patcher.patch(root, vnode, true) == root);
    REQUIRE(f.tree.counts().creates() == 0);
    REQUIRE(f.tree.counts().inserts == 0);
    REQUIRE(vnode->elm == root);
    REQUIRE((*vnode->children)[0]->elm == f.tree.first_child(root));
    REQUIRE(f.warnings.empty());

    // Later patches work against the adopted nodes
    auto next = client_render("bye");
    f.patcher.patch(vnode, next);
    REQUIRE(f.tree.serialize(f.body) == "<body><div><p>bye</p></div></body>");
    REQUIRE(f.tree.counts().creates() == 0);
}

TEST_CASE("Hydration - the server rendered attribute triggers hydration", "[vdom][hydration]") {
    HydrationFixture f;
    auto root = f.server_render();
    f.tree.set_attribute(root, SSR_ATTR, "true");

    REQUIRE(f.patcher.patch(root, client_render()) == root);
    REQUIRE(f.tree.counts().creates() == 0);
    REQUIRE_FALSE(f.tree.has_attribute(root, SSR_ATTR));
}

TEST_CASE("Hydration - text differences are corrected in place", "[vdom][hydration]") {
    HydrationFixture f;
    auto root = f.server_render();

    REQUIRE(f.patcher.patch(root, client_render("hello"), true) == root);
    REQUIRE(f.tree.serialize(root) == "<div><p>hello</p></div>");
    REQUIRE(f.tree.counts().creates() == 0);
}

TEST_CASE("Hydration - a mismatch falls back to a full render", "[vdom][hydration]") {
    HydrationFixture f;
    auto root = f.server_render(true);
    auto vnode = client_render();

    auto elm = f.patcher.patch(root, vnode, true);
    REQUIRE(elm != root);
    REQUIRE(f.tree.serialize(f.body) == "<body><div><p>hi</p></div></body>");
    REQUIRE(f.tree.parent_node(root) == NULL_NODE);
    REQUIRE(f.tree.counts().created_elements == 2);
    REQUIRE(f.warning_count("Mismatching childNodes") == 1);
    REQUIRE(f.warning_count("not matching server-rendered content") == 1);
}

TEST_CASE("Hydration - the childNodes mismatch is reported once", "[vdom][hydration]") {
    HydrationFixture f;
    f.patcher.patch(f.server_render(true), client_render(), true);
    f.patcher.patch(f.server_render(true), client_render(), true);

    REQUIRE(f.warning_count("Mismatching childNodes") == 1);
    REQUIRE(f.warning_count("not matching server-rendered content") == 2);
}

TEST_CASE("Hydration - an empty host element is populated by the client", "[vdom][hydration]") {
    HydrationFixture f;
    auto root = f.tree.create_element("div", VNode{});
    f.tree.append_child(f.body, root);
    f.tree.reset_counts();

    REQUIRE(f.patcher.patch(root, client_render(), true) == root);
    REQUIRE(f.tree.serialize(root) == "<div><p>hi</p></div>");
    REQUIRE(f.tree.counts().created_elements == 1);
}
