#pragma once

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

namespace html {

// Non-owning view of one libxml2 node. Only valid while the Document that
// produced it is alive.
class Node {
public:
    using Predicate = std::function<bool(const Node&)>;

    Node() = default;
    explicit Node(xmlNode* n) : node_(n) {}

    bool valid() const { return node_ != nullptr; }
    explicit operator bool() const { return valid(); }

    bool is_element() const;
    bool is_text() const;

    // lowercase tag name, "" for non-elements
    std::string tag() const;
    bool is_tag(const char* name) const;

    std::string attr(const std::string& name) const;
    bool has_attr(const std::string& name) const;

    // regex_search against each class token and against the whole attribute
    bool class_matches(const std::regex& re) const;
    bool has_class(const std::string& cls) const;

    // every descendant text piece trimmed, empties dropped, joined with sep
    std::string text(const std::string& sep = "") const;
    // descendant text exactly as parsed
    std::string raw_text() const;
    // trimmed text of direct text children only
    std::string own_text() const;

    Node parent() const;
    // nearest ancestor (self excluded) whose tag is one of tags
    Node closest(const std::vector<std::string>& tags) const;
    bool is_descendant_of(const Node& other) const;

    // descendant elements in document order
    std::vector<Node> find_all(const std::vector<std::string>& tags) const;
    std::vector<Node> find_all(const Predicate& pred) const;
    Node find_first(const Predicate& pred) const;

    xmlNode* raw() const { return node_; }
    bool operator==(const Node& o) const { return node_ == o.node_; }
    bool operator!=(const Node& o) const { return node_ != o.node_; }

private:
    xmlNode* node_ = nullptr;
};

class Document {
public:
    // throws std::runtime_error if libxml2 cannot build a tree
    static Document parse(const std::string& html);

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    Node root() const;
    std::string title() const;
    std::string text() const;

    std::vector<Node> find_all(const std::vector<std::string>& tags) const;
    std::vector<Node> find_all(const Node::Predicate& pred) const;
    Node find_first(const Node::Predicate& pred) const;

    // text nodes (outside script/style) whose content regex_search-es re
    std::vector<Node> text_nodes_matching(const std::regex& re) const;

    const std::string& source() const { return source_; }

private:
    struct DocFree {
        void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
    };

    Document() = default;

    std::unique_ptr<xmlDoc, DocFree> doc_;
    std::string source_;
};

}  // namespace html
