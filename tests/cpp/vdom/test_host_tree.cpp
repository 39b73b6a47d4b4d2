#include <catch2/catch_test_macros.hpp>

#include <reactree/vdom/host_tree.h>
#include <reactree/vdom/vnode.h>

#include <stdexcept>

using namespace reactree;

TEST_CASE("HostTree - building and serializing", "[vdom][host_tree]") {
    HostTree tree;
    auto root = tree.create_root();
    REQUIRE(tree.counts().creates() == 0);

    auto list = tree.create_element("ul", VNode{});
    auto first = tree.create_element("li", VNode{});
    auto text = tree.create_text_node("one");
    auto comment = tree.create_comment("c");
    tree.append_child(first, text);
    tree.append_child(list, first);
    tree.append_child(list, comment);
    tree.append_child(root, list);
    tree.set_attribute(list, "id", "items");
    tree.set_attribute(list, "class", "a");

    REQUIRE(tree.serialize(root) == R"(<div><ul class="a" id="items"><li>one</li><!--c--></ul></div>)");
    REQUIRE(tree.counts().created_elements == 2);
    REQUIRE(tree.counts().created_text_nodes == 1);
    REQUIRE(tree.counts().created_comments == 1);
    REQUIRE(tree.counts().inserts == 4);
    REQUIRE(tree.node_count() == 5);

    REQUIRE(tree.parent_node(first) == list);
    REQUIRE(tree.next_sibling(first) == comment);
    REQUIRE(tree.next_sibling(comment) == NULL_NODE);
    REQUIRE(tree.first_child(list) == first);
    REQUIRE(tree.tag_name(list) == "UL");
    REQUIRE(tree.tag_name(text).empty());
    REQUIRE(tree.node_type(comment) == HostNodeType::COMMENT);
    REQUIRE(tree.text_content(root) == "one");
}

TEST_CASE("HostTree - re-inserting an attached node counts as a move", "[vdom][host_tree]") {
    HostTree tree;
    auto root = tree.create_root();
    auto a = tree.create_text_node("a");
    auto b = tree.create_text_node("b");
    tree.append_child(root, a);
    tree.append_child(root, b);
    tree.reset_counts();

    tree.insert_before(root, b, a);
    REQUIRE(tree.serialize(root) == "<div>ba</div>");
    REQUIRE(tree.counts().moves == 1);
    REQUIRE(tree.counts().inserts == 0);

    tree.remove_child(root, a);
    REQUIRE(tree.serialize(root) == "<div>b</div>");
    REQUIRE(tree.counts().removes == 1);
    REQUIRE(tree.parent_node(a) == NULL_NODE);
}

TEST_CASE("HostTree - text content", "[vdom][host_tree]") {
    HostTree tree;
    auto root = tree.create_root();
    tree.append_child(root, tree.create_element("span", VNode{}));
    tree.set_text_content(root, "replaced");
    REQUIRE(tree.serialize(root) == "<div>replaced</div>");
    REQUIRE(tree.children(root).size() == 1);

    tree.set_text_content(root, "");
    REQUIRE_FALSE(tree.has_child_nodes(root));
    REQUIRE(tree.counts().text_updates == 2);
}

TEST_CASE("HostTree - invalid operations throw", "[vdom][host_tree]") {
    HostTree tree;
    auto root = tree.create_root();
    auto text = tree.create_text_node("t");
    auto other = tree.create_text_node("o");

    REQUIRE_THROWS_AS(tree.append_child(text, other), std::invalid_argument);
    REQUIRE_THROWS_AS(tree.remove_child(root, text), std::invalid_argument);
    REQUIRE_THROWS_AS(tree.insert_before(root, text, other), std::invalid_argument);
    REQUIRE_THROWS_AS(tree.parent_node(NULL_NODE), std::out_of_range);
    REQUIRE_THROWS_AS(tree.parent_node(NodeHandle{99}), std::out_of_range);
}

TEST_CASE("HostTree - style scopes and namespaces", "[vdom][host_tree]") {
    HostTree tree;
    auto svg = tree.create_element_ns("svg", "svg");
    tree.set_style_scope(svg, "data-v-1");
    tree.set_style_scope(svg, "data-v-1");
    REQUIRE(tree.namespace_of(svg) == std::optional<std::string>{"svg"});
    REQUIRE(tree.style_scopes(svg).size() == 1);
}
