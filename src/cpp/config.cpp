#include <reactree/config.h>

#include <algorithm>

namespace reactree {
    bool Config::is_ignored_element(std::string_view tag) const {
        return std::ranges::any_of(ignored_elements, [tag](const std::string &ignored) { return ignored == tag; });
    }

    std::optional<std::string> Config::tag_namespace(std::string_view tag) const {
        if (get_tag_namespace) { return get_tag_namespace(tag); }
        if (tag == "svg") { return std::string{"svg"}; }
        // Only the root of MathML is given a namespace, nested tags inherit it
        if (tag == "math") { return std::string{"math"}; }
        return std::nullopt;
    }

    bool Config::unknown_element(std::string_view tag) const {
        if (!is_unknown_element || is_ignored_element(tag)) { return false; }
        return is_unknown_element(tag);
    }

    Config &config() {
        static Config instance;
        return instance;
    }

    ConfigScope::ConfigScope() : _saved{config()} {}

    ConfigScope::~ConfigScope() { config() = std::move(_saved); }
} // namespace reactree
