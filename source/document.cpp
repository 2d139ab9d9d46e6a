// document.cpp - ParsedDocument queries and DocumentBuilder

#include <ooxml_fidelity/document.h>
#include <ooxml_fidelity/namespaces.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <stdexcept>

namespace ooxml_fidelity {

std::string to_display_string(const QName& name) {
    if (name.ns_uri.empty()) {
        return name.local;
    }
    if (auto prefix = canonical_prefix(name.ns_uri)) {
        if (prefix->empty()) {
            return name.local;
        }
        std::string result;
        result.reserve(prefix->size() + 1 + name.local.size());
        result.append(*prefix).append(":").append(name.local);
        return result;
    }
    return "{" + name.ns_uri + "}" + name.local;
}

// ============================================================
// Node
// ============================================================

const std::string* Node::attribute(const QName& attr_name) const noexcept {
    for (const auto& attr : attributes) {
        if (attr.name == attr_name) {
            return &attr.value;
        }
    }
    return nullptr;
}

const std::string* Node::attribute_by_local(std::string_view local) const noexcept {
    for (const auto& attr : attributes) {
        if (attr.name.local == local) {
            return &attr.value;
        }
    }
    return nullptr;
}

// ============================================================
// ParsedDocument
// ============================================================

NodeId ParsedDocument::subtree_end(NodeId id) const {
    const auto depth = nodes_[id].depth;
    NodeId end = id + 1;
    while (end < nodes_.size() && nodes_[end].depth > depth) {
        ++end;
    }
    return end;
}

std::size_t ParsedDocument::subtree_units(NodeId id) const {
    std::size_t units = 0;
    const NodeId end = subtree_end(id);
    for (NodeId i = id; i < end; ++i) {
        const Node& n = nodes_[i];
        units += 1 + n.attributes.size() + (n.has_text() ? 1 : 0);
    }
    return units;
}

bool ParsedDocument::subtree_has_text(NodeId id) const {
    const NodeId end = subtree_end(id);
    for (NodeId i = id; i < end; ++i) {
        if (nodes_[i].has_text()) {
            return true;
        }
    }
    return false;
}

std::string ParsedDocument::subtree_text(NodeId id) const {
    std::string text;
    const NodeId end = subtree_end(id);
    for (NodeId i = id; i < end; ++i) {
        text += nodes_[i].text;
    }
    return text;
}

bool ParsedDocument::is_within(NodeId id, NodeId ancestor) const {
    for (NodeId cur = id; cur != kNoNode; cur = nodes_[cur].parent) {
        if (cur == ancestor) {
            return true;
        }
    }
    return false;
}

std::size_t count_comparable_units(const ParsedDocument& doc) {
    return doc.empty() ? 0 : doc.subtree_units(doc.root());
}

// ============================================================
// DocumentBuilder
// ============================================================

NodeId DocumentBuilder::open(QName name, std::vector<Attribute> attributes) {
    if (stack_.empty() && (root_closed_ || !staged_.empty())) {
        throw std::logic_error("DocumentBuilder: document already has a root element");
    }

    const auto id = static_cast<NodeId>(staged_.size());
    Node node;
    node.name = std::move(name);
    node.attributes = std::move(attributes);
    if (!stack_.empty()) {
        node.parent = stack_.back();
        node.depth = staged_[stack_.back()].depth + 1;
        staged_[stack_.back()].children.push_back(id);
    }
    staged_.push_back(std::move(node));
    stack_.push_back(id);
    return id;
}

void DocumentBuilder::append_text(std::string_view text) {
    if (stack_.empty()) {
        return;  // character data outside the document element
    }
    staged_[stack_.back()].text.append(text);
}

void DocumentBuilder::close() {
    if (stack_.empty()) {
        throw std::logic_error("DocumentBuilder: close() without open element");
    }
    Node& node = staged_[stack_.back()];
    if (boost::algorithm::all(node.text, boost::algorithm::is_space())) {
        node.text.clear();
    }
    stack_.pop_back();
    if (stack_.empty()) {
        root_closed_ = true;
    }
}

ParsedDocument DocumentBuilder::finish() {
    if (!stack_.empty()) {
        throw std::logic_error("DocumentBuilder: finish() with unclosed elements");
    }
    auto transient = ParsedDocument::node_vector{}.transient();
    for (auto& node : staged_) {
        transient.push_back(std::move(node));
    }
    staged_.clear();
    root_closed_ = false;
    return ParsedDocument{transient.persistent()};
}

} // namespace ooxml_fidelity
