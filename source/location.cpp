// location.cpp - Location rendering and pattern matching

#include <ooxml_fidelity/location.h>

#include <algorithm>
#include <array>
#include <map>
#include <utility>

namespace ooxml_fidelity {

namespace {

constexpr std::array<std::string_view, 4> kIdentityAttributes{
    "styleId", "abstractNumId", "numId", "r"};

// ============================================================
// Pattern matching helpers
// ============================================================

struct PatternSegment {
    std::string_view text;
    bool descendant = false;  // preceded by "//"
};

// '*' matches any run of characters
bool glob_match(std::string_view pattern, std::string_view text) {
    std::size_t p = 0, t = 0;
    std::size_t star = std::string_view::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

// A segment without '*' matches any name it is a prefix of, so "w:rsid"
// covers w:rsidR and w:rsidRDefault
bool text_matches(std::string_view pattern, std::string_view name) {
    if (pattern.find('*') == std::string_view::npos) {
        return name.starts_with(pattern);
    }
    return glob_match(pattern, name);
}

bool name_matches(std::string_view pattern, std::string_view name) {
    if (text_matches(pattern, name)) {
        return true;
    }
    const auto colon = name.find(':');
    if (pattern.find(':') == std::string_view::npos && colon != std::string_view::npos) {
        return text_matches(pattern, name.substr(colon + 1));
    }
    return false;
}

bool segment_matches(std::string_view pattern, std::string_view segment) {
    const bool pattern_is_attr = !pattern.empty() && pattern.front() == '@';
    const bool segment_is_attr = !segment.empty() && segment.front() == '@';
    if (pattern_is_attr) {
        return segment_is_attr && name_matches(pattern.substr(1), segment.substr(1));
    }
    return name_matches(pattern, segment_is_attr ? segment.substr(1) : segment);
}

std::vector<PatternSegment> split_pattern(std::string_view pattern) {
    std::vector<PatternSegment> segments;
    while (!pattern.empty() && pattern.front() == '/') {
        pattern.remove_prefix(1);
    }
    bool descendant = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= pattern.size(); ++i) {
        if (i == pattern.size() || pattern[i] == '/') {
            if (i > start) {
                segments.push_back({pattern.substr(start, i - start), descendant});
                descendant = false;
            } else if (i < pattern.size()) {
                descendant = true;  // empty segment: "//"
            }
            start = i + 1;
        }
    }
    return segments;
}

// Segment names of a location; predicates are stripped, '/' inside
// predicates does not split.
std::vector<std::string_view> split_location(std::string_view location) {
    std::vector<std::string_view> names;
    std::size_t start = 0;
    int bracket_depth = 0;
    char quote = '\0';
    auto flush = [&](std::size_t end) {
        if (end > start) {
            auto segment = location.substr(start, end - start);
            names.push_back(segment.substr(0, segment.find('[')));
        }
        start = end + 1;
    };
    for (std::size_t i = 0; i < location.size(); ++i) {
        const char c = location[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '[') {
            ++bracket_depth;
        } else if (c == ']') {
            bracket_depth = std::max(0, bracket_depth - 1);
        } else if (c == '/' && bracket_depth == 0) {
            flush(i);
        }
    }
    flush(location.size());
    return names;
}

bool match_from(const std::vector<PatternSegment>& pattern, std::size_t pi,
                const std::vector<std::string_view>& location, std::size_t li) {
    if (li >= location.size() || !segment_matches(pattern[pi].text, location[li])) {
        return false;
    }
    if (pi + 1 == pattern.size()) {
        return true;
    }
    if (pattern[pi + 1].descendant) {
        for (std::size_t next = li + 1; next < location.size(); ++next) {
            if (match_from(pattern, pi + 1, location, next)) {
                return true;
            }
        }
        return false;
    }
    return match_from(pattern, pi + 1, location, li + 1);
}

} // anonymous namespace

// ============================================================
// Keys and rendering
// ============================================================

const Attribute* identity_attribute(const Node& node) noexcept {
    for (const auto& attr : node.attributes) {
        if (std::find(kIdentityAttributes.begin(), kIdentityAttributes.end(), attr.name.local) !=
            kIdentityAttributes.end()) {
            return &attr;
        }
    }
    return nullptr;
}

std::vector<SiblingKey> child_keys(const ParsedDocument& doc, NodeId parent) {
    const Node& p = doc.node(parent);
    std::vector<SiblingKey> keys;
    keys.reserve(p.children.size());
    std::map<std::pair<QName, std::string>, std::uint32_t> seen;
    for (NodeId child : p.children) {
        const Node& c = doc.node(child);
        SiblingKey key;
        key.name = c.name;
        if (const Attribute* id_attr = identity_attribute(c)) {
            key.identity = id_attr->value;
            key.identity_attribute = id_attr->name;
        }
        key.occurrence = ++seen[{key.name, key.identity}];
        keys.push_back(std::move(key));
    }
    return keys;
}

SiblingKey root_key(const ParsedDocument& doc) {
    SiblingKey key;
    const Node& root = doc.node(doc.root());
    key.name = root.name;
    if (const Attribute* id_attr = identity_attribute(root)) {
        key.identity = id_attr->value;
        key.identity_attribute = id_attr->name;
    }
    return key;
}

std::string format_step(const SiblingKey& key) {
    std::string step = to_display_string(key.name);
    if (key.identity_attribute.local.empty()) {
        step += "[" + std::to_string(key.occurrence) + "]";
        return step;
    }
    step += "[@" + to_display_string(key.identity_attribute) + "='" + key.identity + "']";
    if (key.occurrence > 1) {
        step += "[" + std::to_string(key.occurrence) + "]";
    }
    return step;
}

std::string node_location(const ParsedDocument& doc, NodeId id) {
    std::vector<std::string> steps;
    for (NodeId cur = id; cur != kNoNode; cur = doc.node(cur).parent) {
        const NodeId parent = doc.node(cur).parent;
        if (parent == kNoNode) {
            steps.push_back(format_step(root_key(doc)));
            break;
        }
        const auto& siblings = doc.node(parent).children;
        const auto index = static_cast<std::size_t>(
            std::find(siblings.begin(), siblings.end(), cur) - siblings.begin());
        steps.push_back(format_step(child_keys(doc, parent)[index]));
    }
    std::string location;
    for (auto it = steps.rbegin(); it != steps.rend(); ++it) {
        location += "/" + *it;
    }
    return location;
}

std::string attribute_location(const std::string& element_location, const QName& attribute) {
    return element_location + "/@" + to_display_string(attribute);
}

std::string text_location(const std::string& element_location) {
    return element_location + "/text()";
}

bool location_matches(std::string_view pattern, std::string_view location) {
    const auto segments = split_pattern(pattern);
    if (segments.empty()) {
        return false;
    }
    const auto names = split_location(location);
    for (std::size_t start = 0; start < names.size(); ++start) {
        if (match_from(segments, 0, names, start)) {
            return true;
        }
    }
    return false;
}

} // namespace ooxml_fidelity
