#include <vieweval/layout/element_classifier.hpp>
#include <vieweval/dom/html_document.hpp>
#include <algorithm>
#include <initializer_list>
#include <string_view>

namespace vieweval::layout {

namespace {

using core::ComponentCategory;

bool tag_in(const dom::Element& el, std::initializer_list<std::string_view> tags) {
  return std::find(tags.begin(), tags.end(), el.tag) != tags.end();
}

std::string lower_attr(const dom::Element& el, std::string_view name) {
  return dom::to_lower(dom::trim(el.attribute_or_empty(name)));
}

bool role_is(const dom::Element& el, std::string_view role) {
  return lower_attr(el, "role") == role;
}

bool any_class(const dom::Element& el, std::initializer_list<std::string_view> tokens) {
  return std::any_of(tokens.begin(), tokens.end(),
                     [&el](std::string_view t) { return el.has_class(t); });
}

bool class_contains(const dom::Element& el, std::initializer_list<std::string_view> parts) {
  const std::string cls = lower_attr(el, "class");
  return std::any_of(parts.begin(), parts.end(),
                     [&cls](std::string_view p) { return cls.find(p) != std::string::npos; });
}

bool id_in(const dom::Element& el, std::initializer_list<std::string_view> ids) {
  const std::string id = lower_attr(el, "id");
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool is_text_tag(const dom::Element& el) {
  return tag_in(el, {"p", "span", "a", "strong", "em", "b", "i", "small", "h1", "h2",
                     "h3", "h4", "h5", "h6", "li", "th", "td", "label", "code", "pre",
                     "blockquote", "div"});
}

}  // namespace

ElementClassifier::ElementClassifier(std::vector<ClassificationRule> rules)
    : rules_(std::move(rules)) {}

ElementClassifier ElementClassifier::with_default_rules() {
  std::vector<ClassificationRule> rules = {
      {"video-tag", [](const dom::Element& el) { return el.tag == "video"; },
       ComponentCategory::Video},
      {"img-tag", [](const dom::Element& el) { return el.tag == "img"; },
       ComponentCategory::Image},
      {"button-tag",
       [](const dom::Element& el) {
         if (el.tag == "button") return true;
         if (el.tag != "input") return false;
         const std::string type = lower_attr(el, "type");
         return type == "button" || type == "submit" || type == "reset";
       },
       ComponentCategory::Button},
      {"nav-tag", [](const dom::Element& el) { return el.tag == "nav"; },
       ComponentCategory::NavBar},
      {"hr-tag", [](const dom::Element& el) { return el.tag == "hr"; },
       ComponentCategory::Divider},
      {"form-table-tag", [](const dom::Element& el) { return tag_in(el, {"form", "table"}); },
       ComponentCategory::FormTable},
      {"button-role", [](const dom::Element& el) { return role_is(el, "button"); },
       ComponentCategory::Button},
      {"navigation-heuristic",
       [](const dom::Element& el) {
         return role_is(el, "navigation") ||
                any_class(el, {"nav", "navigation", "menu", "navbar"}) ||
                id_in(el, {"menu", "nav", "navigation", "navbar"});
       },
       ComponentCategory::NavBar},
      {"separator-heuristic",
       [](const dom::Element& el) {
         return role_is(el, "separator") || class_contains(el, {"separator", "divider"}) ||
                id_in(el, {"separator", "divider"});
       },
       ComponentCategory::Divider},
      {"form-class", [](const dom::Element& el) { return el.tag == "div" && el.has_class("form"); },
       ComponentCategory::FormTable},
      {"text-block",
       [](const dom::Element& el) {
         if (!is_text_tag(el)) return false;
         // A div only counts when it holds text itself rather than through children.
         if (el.tag == "div") return el.has_direct_text;
         return !el.text.empty();
       },
       ComponentCategory::TextBlock},
  };
  return ElementClassifier(std::move(rules));
}

std::optional<core::ComponentCategory> ElementClassifier::classify(
    const dom::Element& element) const {
  for (const auto& rule : rules_) {
    if (rule.matches && rule.matches(element)) return rule.category;
  }
  return std::nullopt;
}

bool is_interactive(const dom::Element& element) {
  const std::string& tag = element.tag;
  if (tag == "button" || tag == "select" || tag == "textarea") return true;
  if (tag == "a") return element.has_attribute("href");
  if (tag == "input") return lower_attr(element, "type") != "hidden";
  const std::string role = lower_attr(element, "role");
  if (role == "button" || role == "link") return true;
  return element.has_attribute("onclick");
}

}  // namespace vieweval::layout
