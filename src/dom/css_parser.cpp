#include <vieweval/dom/css_parser.hpp>
#include <cctype>
#include <string>

namespace vieweval::dom {

namespace {

std::string strip_comments(std::string_view css) {
  std::string out;
  out.reserve(css.size());
  std::size_t i = 0;
  while (i < css.size()) {
    if (css.compare(i, 2, "/*") == 0) {
      const auto end = css.find("*/", i + 2);
      if (end == std::string_view::npos) break;
      i = end + 2;
      out.push_back(' ');
      continue;
    }
    out.push_back(css[i++]);
  }
  return out;
}

/// Index of the '}' closing the block whose '{' is at open; npos when unbalanced.
std::size_t matching_brace(std::string_view text, std::size_t open) {
  int depth = 0;
  char quote = 0;
  for (std::size_t i = open; i < text.size(); ++i) {
    const char c = text[i];
    if (quote) {
      if (c == '\\') ++i;
      else if (c == quote) quote = 0;
      continue;
    }
    if (c == '"' || c == '\'') quote = c;
    else if (c == '{') ++depth;
    else if (c == '}' && --depth == 0) return i;
  }
  return std::string_view::npos;
}

std::vector<std::string> split_selectors(std::string_view prelude) {
  std::vector<std::string> out;
  int depth = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= prelude.size(); ++i) {
    const char c = i < prelude.size() ? prelude[i] : ',';
    if (c == '(' || c == '[') ++depth;
    else if ((c == ')' || c == ']') && depth > 0) --depth;
    else if (c == ',' && depth == 0) {
      std::string sel = trim(prelude.substr(start, i - start));
      if (!sel.empty()) out.push_back(std::move(sel));
      start = i + 1;
    }
  }
  return out;
}

void parse_block(std::string_view text, const std::string& media, std::vector<StyleRule>& out) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos >= text.size()) break;

    const auto brace = text.find('{', pos);
    if (text[pos] == '@') {
      const auto semi = text.find(';', pos);
      if (brace == std::string_view::npos || (semi != std::string_view::npos && semi < brace)) {
        if (semi == std::string_view::npos) break;
        pos = semi + 1;  // statement at-rule (@import, @charset)
        continue;
      }
      const auto close = matching_brace(text, brace);
      if (close == std::string_view::npos) break;

      std::size_t name_end = pos + 1;
      while (name_end < brace && (std::isalnum(static_cast<unsigned char>(text[name_end])) ||
                                  text[name_end] == '-')) {
        ++name_end;
      }
      const std::string name = to_lower(text.substr(pos + 1, name_end - pos - 1));
      const std::string prelude = trim(text.substr(name_end, brace - name_end));
      const std::string_view inner = text.substr(brace + 1, close - brace - 1);
      if (name == "media") {
        parse_block(inner, media.empty() ? prelude : media + " and " + prelude, out);
      } else if (name == "supports") {
        parse_block(inner, media, out);
      }
      pos = close + 1;
      continue;
    }

    if (brace == std::string_view::npos) break;
    const auto close = matching_brace(text, brace);
    if (close == std::string_view::npos) break;

    StyleRule rule;
    rule.selectors = split_selectors(text.substr(pos, brace - pos));
    rule.declarations = parse_declarations(text.substr(brace + 1, close - brace - 1));
    rule.media = media;
    if (!rule.selectors.empty() && !rule.declarations.empty()) {
      out.push_back(std::move(rule));
    }
    pos = close + 1;
  }
}

/// Rightmost compound selector with pseudo-classes removed.
std::string rightmost_compound(std::string_view selector) {
  int depth = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i < selector.size(); ++i) {
    const char c = selector[i];
    if (c == '(' || c == '[') ++depth;
    else if ((c == ')' || c == ']') && depth > 0) --depth;
    else if (depth == 0 && (std::isspace(static_cast<unsigned char>(c)) || c == '>' ||
                            c == '+' || c == '~')) {
      start = i + 1;
    }
  }
  std::string compound(selector.substr(start));

  depth = 0;
  for (std::size_t i = 0; i < compound.size(); ++i) {
    const char c = compound[i];
    if (c == '[') ++depth;
    else if (c == ']' && depth > 0) --depth;
    else if (c == ':' && depth == 0) {
      compound.resize(i);
      break;
    }
  }
  return compound;
}

}  // namespace

std::vector<Declaration> parse_declarations(std::string_view block) {
  std::vector<Declaration> out;
  int depth = 0;
  char quote = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= block.size(); ++i) {
    const char c = i < block.size() ? block[i] : ';';
    if (quote) {
      if (c == '\\') ++i;
      else if (c == quote) quote = 0;
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }
    if (c == '(') ++depth;
    else if (c == ')' && depth > 0) --depth;
    else if (c == ';' && depth == 0) {
      const std::string_view part = block.substr(start, i - start);
      start = i + 1;
      const auto colon = part.find(':');
      if (colon == std::string_view::npos) continue;
      Declaration d;
      d.property = to_lower(trim(part.substr(0, colon)));
      std::string value = trim(part.substr(colon + 1));
      const auto bang = to_lower(value).rfind("!important");
      if (bang != std::string::npos) value = trim(std::string_view(value).substr(0, bang));
      d.value = std::move(value);
      if (!d.property.empty() && !d.value.empty()) out.push_back(std::move(d));
    }
  }
  return out;
}

std::vector<StyleRule> parse_stylesheet(std::string_view css) {
  std::vector<StyleRule> out;
  const std::string text = strip_comments(css);
  parse_block(text, "", out);
  return out;
}

bool selector_matches(std::string_view selector, const Element& element) {
  const std::string compound = rightmost_compound(trim(selector));
  if (compound.empty() || compound.find('[') != std::string::npos) return false;

  std::size_t i = 0;
  while (i < compound.size() && compound[i] != '.' && compound[i] != '#') ++i;
  const std::string tag = to_lower(compound.substr(0, i));
  if (!tag.empty() && tag != "*" && tag != element.tag) return false;

  while (i < compound.size()) {
    const char kind = compound[i++];
    const std::size_t start = i;
    while (i < compound.size() && compound[i] != '.' && compound[i] != '#') ++i;
    const std::string_view name = std::string_view(compound).substr(start, i - start);
    if (name.empty()) return false;
    if (kind == '.' && !element.has_class(name)) return false;
    if (kind == '#' && element.attribute_or_empty("id") != name) return false;
  }
  return true;
}

std::optional<std::string> find_declaration(const std::vector<Declaration>& declarations,
                                            std::string_view property) {
  std::optional<std::string> found;
  for (const auto& d : declarations) {
    if (d.property == property) found = d.value;
  }
  return found;
}

}  // namespace vieweval::dom
