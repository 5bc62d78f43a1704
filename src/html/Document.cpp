#include "html/Document.hpp"
#include "text/TextUtil.hpp"

#include <stdexcept>

namespace html {

static bool is_hidden_container(const xmlNode* n) {
    if (n->type != XML_ELEMENT_NODE || !n->name) return false;
    return xmlStrcasecmp(n->name, BAD_CAST "script") == 0 ||
           xmlStrcasecmp(n->name, BAD_CAST "style") == 0;
}

static bool is_text_type(const xmlNode* n) {
    return n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE;
}

static void collect_text(const xmlNode* node, std::vector<std::string>& pieces) {
    for (const xmlNode* cur = node; cur; cur = cur->next) {
        if (is_text_type(cur) && cur->content) {
            pieces.emplace_back(reinterpret_cast<const char*>(cur->content));
        } else if (cur->type == XML_ELEMENT_NODE && !is_hidden_container(cur) && cur->children) {
            collect_text(cur->children, pieces);
        }
    }
}

static void walk_elements(xmlNode* node, const Node::Predicate& pred, std::vector<Node>& out, bool first_only) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (first_only && !out.empty()) return;
        if (cur->type != XML_ELEMENT_NODE) continue;

        Node n(cur);
        if (pred(n)) {
            out.push_back(n);
            if (first_only) return;
        }
        if (cur->children) walk_elements(cur->children, pred, out, first_only);
    }
}

static Node::Predicate tag_in(const std::vector<std::string>& tags) {
    return [tags](const Node& n) {
        const std::string t = n.tag();
        for (const auto& want : tags) {
            if (t == want) return true;
        }
        return false;
    };
}

bool Node::is_element() const { return node_ && node_->type == XML_ELEMENT_NODE; }

bool Node::is_text() const { return node_ && is_text_type(node_); }

std::string Node::tag() const {
    if (!is_element() || !node_->name) return "";
    return textutil::to_lower(reinterpret_cast<const char*>(node_->name));
}

bool Node::is_tag(const char* name) const {
    return is_element() && node_->name && xmlStrcasecmp(node_->name, BAD_CAST name) == 0;
}

std::string Node::attr(const std::string& name) const {
    if (!is_element()) return "";
    xmlChar* v = xmlGetProp(node_, BAD_CAST name.c_str());
    if (!v) return "";
    std::string s = reinterpret_cast<char*>(v);
    xmlFree(v);
    return s;
}

bool Node::has_attr(const std::string& name) const {
    return is_element() && xmlHasProp(node_, BAD_CAST name.c_str()) != nullptr;
}

bool Node::class_matches(const std::regex& re) const {
    const std::string cls = attr("class");
    if (cls.empty()) return false;
    for (const auto& token : textutil::split_ws(cls)) {
        if (std::regex_search(token, re)) return true;
    }
    return std::regex_search(cls, re);
}

bool Node::has_class(const std::string& cls) const {
    for (const auto& token : textutil::split_ws(attr("class"))) {
        if (token == cls) return true;
    }
    return false;
}

std::string Node::text(const std::string& sep) const {
    if (!node_) return "";
    std::vector<std::string> pieces;
    if (is_text()) {
        if (node_->content) pieces.emplace_back(reinterpret_cast<const char*>(node_->content));
    } else if (!is_hidden_container(node_)) {
        collect_text(node_->children, pieces);
    }

    std::vector<std::string> kept;
    kept.reserve(pieces.size());
    for (const auto& p : pieces) {
        std::string t = textutil::fold_nbsp(textutil::trim(p));
        if (!t.empty()) kept.push_back(std::move(t));
    }
    return textutil::join(kept, sep);
}

std::string Node::raw_text() const {
    if (!node_) return "";
    std::vector<std::string> pieces;
    if (is_text()) {
        if (node_->content) return reinterpret_cast<const char*>(node_->content);
        return "";
    }
    collect_text(node_->children, pieces);
    return textutil::join(pieces, "");
}

std::string Node::own_text() const {
    if (!is_element()) return "";
    std::string out;
    for (const xmlNode* cur = node_->children; cur; cur = cur->next) {
        if (is_text_type(cur) && cur->content) out += reinterpret_cast<const char*>(cur->content);
    }
    return textutil::trim(textutil::fold_nbsp(out));
}

Node Node::parent() const {
    if (!node_ || !node_->parent || node_->parent->type != XML_ELEMENT_NODE) return Node();
    return Node(node_->parent);
}

Node Node::closest(const std::vector<std::string>& tags) const {
    auto match = tag_in(tags);
    for (Node p = parent(); p; p = p.parent()) {
        if (match(p)) return p;
    }
    return Node();
}

bool Node::is_descendant_of(const Node& other) const {
    if (!node_ || !other.node_) return false;
    for (xmlNode* p = node_->parent; p; p = p->parent) {
        if (p == other.node_) return true;
    }
    return false;
}

std::vector<Node> Node::find_all(const std::vector<std::string>& tags) const {
    return find_all(tag_in(tags));
}

std::vector<Node> Node::find_all(const Predicate& pred) const {
    std::vector<Node> out;
    if (node_ && node_->children) walk_elements(node_->children, pred, out, false);
    return out;
}

Node Node::find_first(const Predicate& pred) const {
    std::vector<Node> out;
    if (node_ && node_->children) walk_elements(node_->children, pred, out, true);
    return out.empty() ? Node() : out.front();
}

Document Document::parse(const std::string& html) {
    if (html.empty()) throw std::runtime_error("cannot parse empty HTML document");

    htmlDocPtr d = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), "page.html", "UTF-8",
                                  HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!d) throw std::runtime_error("libxml2 failed to parse HTML document");
    if (!xmlDocGetRootElement(d)) {
        xmlFreeDoc(d);
        throw std::runtime_error("HTML document has no root element");
    }

    Document doc;
    doc.doc_.reset(d);
    doc.source_ = html;
    return doc;
}

Node Document::root() const {
    return Node(xmlDocGetRootElement(doc_.get()));
}

std::string Document::title() const {
    Node r = root();
    if (r.is_tag("title")) return r.text();
    Node t = r.find_first([](const Node& n) { return n.is_tag("title"); });
    return t ? t.text() : "";
}

std::string Document::text() const {
    return root().raw_text();
}

std::vector<Node> Document::find_all(const std::vector<std::string>& tags) const {
    return find_all(tag_in(tags));
}

std::vector<Node> Document::find_all(const Node::Predicate& pred) const {
    std::vector<Node> out;
    xmlNode* r = xmlDocGetRootElement(doc_.get());
    if (r) walk_elements(r, pred, out, false);
    return out;
}

Node Document::find_first(const Node::Predicate& pred) const {
    std::vector<Node> out;
    xmlNode* r = xmlDocGetRootElement(doc_.get());
    if (r) walk_elements(r, pred, out, true);
    return out.empty() ? Node() : out.front();
}

static void walk_text(xmlNode* node, const std::regex& re, std::vector<Node>& out) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (is_text_type(cur)) {
            if (cur->content && std::regex_search(reinterpret_cast<const char*>(cur->content), re)) {
                out.emplace_back(cur);
            }
        } else if (cur->type == XML_ELEMENT_NODE && !is_hidden_container(cur) && cur->children) {
            walk_text(cur->children, re, out);
        }
    }
}

std::vector<Node> Document::text_nodes_matching(const std::regex& re) const {
    std::vector<Node> out;
    xmlNode* r = xmlDocGetRootElement(doc_.get());
    if (r) walk_text(r, re, out);
    return out;
}

}  // namespace html
