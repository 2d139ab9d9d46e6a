// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document.h
/// @brief Immutable, namespace-resolved markup tree.
///
/// A ParsedDocument is an arena of nodes addressed by NodeId. Node 0 is the
/// document element and every node precedes its descendants, so NodeId order
/// is document order. Names are (namespace URI, local name) pairs; the prefix
/// used in the source markup is not retained.
///
/// Documents are built once through DocumentBuilder and never change
/// afterwards. Two documents never share node identities; cross-document
/// alignment works on keys derived from names and attributes.

#pragma once

#include "ooxml_fidelity_config.h"
#include "api.h"

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <compare>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace ooxml_fidelity {

using NodeId = std::uint32_t;

inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

/// Namespace-qualified name
struct QName {
    std::string ns_uri;   ///< Empty for names in no namespace
    std::string local;

    bool operator==(const QName&) const = default;
    auto operator<=>(const QName&) const = default;
};

/// Render a name with its canonical prefix ("w:color"), unprefixed for names in
/// no namespace or the spreadsheet main namespace, or as "{uri}local" when the
/// namespace is not a well-known OOXML one.
[[nodiscard]] OOXML_FIDELITY_API std::string to_display_string(const QName& name);

struct Attribute {
    QName name;
    std::string value;

    bool operator==(const Attribute&) const = default;
};

struct Node {
    QName name;
    std::vector<Attribute> attributes;  ///< Source order; namespace declarations excluded
    std::string text;                   ///< Direct character data; empty if whitespace only
    std::vector<NodeId> children;       ///< Element children in source order
    NodeId parent = kNoNode;
    std::uint32_t depth = 0;

    /// Value of the attribute with the given name, or nullptr
    [[nodiscard]] const std::string* attribute(const QName& attr_name) const noexcept;

    /// Value of the first attribute with the given local name in any namespace
    [[nodiscard]] const std::string* attribute_by_local(std::string_view local) const noexcept;

    [[nodiscard]] bool has_text() const noexcept { return !text.empty(); }
};

class OOXML_FIDELITY_API ParsedDocument {
public:
    using node_vector = immer::vector<Node>;

    /// An empty document (no document element)
    ParsedDocument() = default;

    explicit ParsedDocument(node_vector nodes) : nodes_(std::move(nodes)) {}

    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

    /// Document element; only meaningful when !empty()
    [[nodiscard]] NodeId root() const noexcept { return 0; }

    [[nodiscard]] const Node& node(NodeId id) const { return nodes_[id]; }

    [[nodiscard]] const node_vector& nodes() const noexcept { return nodes_; }

    /// Last NodeId of the subtree rooted at `id` plus one
    [[nodiscard]] NodeId subtree_end(NodeId id) const;

    /// Elements + attributes + non-blank texts within the subtree rooted at `id`
    [[nodiscard]] std::size_t subtree_units(NodeId id) const;

    /// True if any node of the subtree carries text
    [[nodiscard]] bool subtree_has_text(NodeId id) const;

    /// All direct text of the subtree, concatenated in document order
    [[nodiscard]] std::string subtree_text(NodeId id) const;

    /// True if `ancestor` is `id` or one of its ancestors
    [[nodiscard]] bool is_within(NodeId id, NodeId ancestor) const;

private:
    node_vector nodes_;
};

/// Number of comparable units in the document: elements + attributes +
/// non-blank text nodes. This is the denominator of preservation rates.
[[nodiscard]] OOXML_FIDELITY_API std::size_t count_comparable_units(const ParsedDocument& doc);

// ============================================================
// DocumentBuilder
//
// Staged construction in document order:
//   DocumentBuilder b;
//   b.open({std::string(ns::wordprocessingml), "document"}, {});
//   b.open({std::string(ns::wordprocessingml), "body"}, {});
//   ...
//   b.close();
//   b.close();
//   ParsedDocument doc = b.finish();
// ============================================================

class OOXML_FIDELITY_API DocumentBuilder {
public:
    /// Start an element as a child of the currently open element
    NodeId open(QName name, std::vector<Attribute> attributes);

    /// Append character data to the currently open element
    void append_text(std::string_view text);

    /// Close the currently open element
    void close();

    [[nodiscard]] std::size_t open_depth() const noexcept { return stack_.size(); }

    /// Freeze the staged nodes into an immutable document
    /// @throws std::logic_error if elements are still open or a second root was started
    [[nodiscard]] ParsedDocument finish();

private:
    std::vector<Node> staged_;
    std::vector<NodeId> stack_;
    bool root_closed_ = false;
};

} // namespace ooxml_fidelity
