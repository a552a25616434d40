#include <vieweval/dom/html_document.hpp>
#include <vieweval/core/logger.hpp>
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <memory>
#include <string>

namespace vieweval::dom {

namespace {

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlStringDeleter {
  void operator()(xmlChar* s) const noexcept { xmlFree(s); }
};
using XmlStringPtr = std::unique_ptr<xmlChar, XmlStringDeleter>;

std::string to_std(const xmlChar* s) {
  return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

std::string node_name(const xmlNode* node) { return to_lower(to_std(node->name)); }

bool is_element(const xmlNode* node) noexcept {
  return node && node->type == XML_ELEMENT_NODE;
}

bool is_text(const xmlNode* node) noexcept {
  return node && (node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE);
}

/// Elements whose content never renders as page text.
bool is_skipped_tag(std::string_view tag) noexcept {
  return tag == "script" || tag == "style" || tag == "noscript" || tag == "template";
}

bool is_blank(std::string_view s) noexcept {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string collapse_whitespace(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (const unsigned char c : s) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(static_cast<char>(c));
  }
  return out;
}

std::string node_content(const xmlNode* node) {
  XmlStringPtr content(xmlNodeGetContent(node));
  return to_std(content.get());
}

std::unordered_map<std::string, std::string> read_attributes(const xmlNode* node) {
  std::unordered_map<std::string, std::string> out;
  for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
    XmlStringPtr value(xmlNodeListGetString(node->doc, attr->children, 1));
    out.emplace(to_lower(to_std(attr->name)), to_std(value.get()));
  }
  return out;
}

std::vector<std::string> split_classes(std::string_view value) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < value.size()) {
    while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i]))) ++i;
    const std::size_t start = i;
    while (i < value.size() && !std::isspace(static_cast<unsigned char>(value[i]))) ++i;
    if (i > start) out.emplace_back(value.substr(start, i - start));
  }
  return out;
}

/// 1-based position among preceding element siblings with the same tag.
std::size_t nth_of_type(const xmlNode* node) {
  std::size_t nth = 1;
  for (const xmlNode* sib = node->prev; sib; sib = sib->prev) {
    if (is_element(sib) && xmlStrcasecmp(sib->name, node->name) == 0) ++nth;
  }
  return nth;
}

}  // namespace

/// Walks the libxml2 tree once and fills an HtmlDocument.
class DocumentBuilder {
 public:
  explicit DocumentBuilder(HtmlDocument& doc) : doc_(doc) {}

  void visit(xmlNode* node) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
      if (!is_element(cur)) continue;
      const std::string tag = node_name(cur);
      if (tag == "meta") {
        record_meta(cur);
      } else if (tag == "style") {
        doc_.style_sheets_.push_back(node_content(cur));
        continue;
      } else if (tag == "body" && !body_seen_) {
        body_seen_ = true;
        index_element(cur, std::nullopt, "");
        continue;
      }
      visit(cur->children);
    }
  }

 private:
  void record_meta(const xmlNode* node) {
    const auto attrs = read_attributes(node);
    const auto name = attrs.find("name");
    if (name == attrs.end() || to_lower(trim(name->second)) != "viewport") return;
    const auto content = attrs.find("content");
    doc_.meta_viewport_ = content == attrs.end() ? std::string() : content->second;
  }

  /// Indexes node and its subtree; returns the subtree's raw text.
  std::string index_element(xmlNode* node,
                            std::optional<std::size_t> parent,
                            const std::string& parent_path) {
    Element el;
    el.tag = node_name(node);
    el.attributes = read_attributes(node);
    el.parent = parent;
    if (const auto cls = el.attributes.find("class"); cls != el.attributes.end()) {
      el.classes = split_classes(cls->second);
    }

    if (!parent) {
      el.path = "body";
    } else {
      // A repeated id falls back to the positional segment so paths stay unique.
      const auto id = el.attributes.find("id");
      std::string id_path;
      if (id != el.attributes.end() && !id->second.empty()) id_path = el.tag + "#" + id->second;
      if (!id_path.empty() && !doc_.by_path_.contains(id_path)) {
        el.path = std::move(id_path);
      } else {
        std::string segment = el.tag + ":nth-of-type(" + std::to_string(nth_of_type(node)) + ")";
        el.path = parent_path.empty() ? std::move(segment) : parent_path + " > " + segment;
      }
    }

    const std::size_t index = doc_.elements_.size();
    doc_.by_path_.emplace(el.path, index);
    doc_.elements_.push_back(std::move(el));

    // Children of body start their paths afresh, as body is not part of an id.
    const std::string child_base = parent ? doc_.elements_[index].path : std::string();

    std::string text;
    bool direct_text = false;
    for (xmlNode* child = node->children; child; child = child->next) {
      if (is_text(child)) {
        const std::string content = to_std(child->content);
        if (!is_blank(content)) direct_text = true;
        text += content;
      } else if (is_element(child)) {
        const std::string child_tag = node_name(child);
        if (child_tag == "style") {
          doc_.style_sheets_.push_back(node_content(child));
          continue;
        }
        if (child_tag == "meta") record_meta(child);
        if (is_skipped_tag(child_tag)) continue;
        text += ' ';
        text += index_element(child, index, child_base);
      }
    }

    Element& self = doc_.elements_[index];
    self.has_direct_text = direct_text;
    self.text = collapse_whitespace(text);
    return text;
  }

  HtmlDocument& doc_;
  bool body_seen_{false};
};

const std::string* Element::attribute(std::string_view name) const {
  const auto it = attributes.find(std::string(name));
  return it == attributes.end() ? nullptr : &it->second;
}

std::string_view Element::attribute_or_empty(std::string_view name) const {
  const std::string* value = attribute(name);
  return value ? std::string_view(*value) : std::string_view();
}

bool Element::has_class(std::string_view token) const noexcept {
  return std::find(classes.begin(), classes.end(), token) != classes.end();
}

std::expected<HtmlDocument, core::EvalError> HtmlDocument::parse(std::string_view html) {
  if (html.empty() || is_blank(html) || html.size() > static_cast<std::size_t>(INT_MAX)) {
    return std::unexpected(core::EvalError::ExtractionError);
  }

  constexpr int kOptions = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                           HTML_PARSE_NOWARNING | HTML_PARSE_NONET;
  XmlDocPtr xml(htmlReadMemory(html.data(), static_cast<int>(html.size()),
                               nullptr, "UTF-8", kOptions));
  if (!xml) {
    logger().warn("HTML parser rejected the document");
    return std::unexpected(core::EvalError::ExtractionError);
  }
  xmlNode* root = xmlDocGetRootElement(xml.get());
  if (!root) {
    return std::unexpected(core::EvalError::ExtractionError);
  }

  HtmlDocument doc;
  DocumentBuilder builder(doc);
  builder.visit(root);
  logger().debug("parsed document: {} body elements, {} style blocks, viewport meta {}",
                 doc.elements_.size(), doc.style_sheets_.size(),
                 doc.meta_viewport_ ? "present" : "absent");
  return doc;
}

const Element* HtmlDocument::find(std::string_view path) const {
  const auto it = by_path_.find(std::string(path));
  return it == by_path_.end() ? nullptr : &elements_[it->second];
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n\f");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n\f");
  return std::string(s.substr(start, end - start + 1));
}

}  // namespace vieweval::dom
