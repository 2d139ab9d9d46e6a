// carrier_catalog.cpp - Pattern compilation, matching, and the built-in catalog

#include <ooxml_fidelity/carrier_catalog.h>
#include <ooxml_fidelity/errors.h>
#include <ooxml_fidelity/namespaces.h>

#include <boost/algorithm/string/trim.hpp>

#include <zug/compose.hpp>
#include <zug/into_vector.hpp>
#include <zug/transducer/filter.hpp>
#include <zug/transducer/map.hpp>

#include <algorithm>

namespace ooxml_fidelity {

namespace {

[[noreturn]] void pattern_error(std::string_view pattern, const std::string& reason) {
    throw ConfigurationError("Invalid carrier pattern '" + std::string(pattern) + "': " + reason);
}

CarrierPattern::Step parse_step(std::string_view pattern, std::string_view name, bool descendant,
                                bool is_attribute) {
    CarrierPattern::Step step;
    step.descendant = descendant;
    const auto colon = name.find(':');
    if (colon == std::string_view::npos) {
        step.local = std::string(name);
        if (is_attribute) {
            step.ns_uri = std::string{};  // unprefixed attributes are in no namespace
        }
    } else {
        const auto prefix = name.substr(0, colon);
        auto uri = namespace_uri(prefix);
        if (!uri) {
            pattern_error(pattern, "unknown prefix '" + std::string(prefix) + "'");
        }
        step.ns_uri = std::string(*uri);
        step.local = std::string(name.substr(colon + 1));
    }
    if (step.local.empty()) {
        pattern_error(pattern, "empty local name");
    }
    return step;
}

bool step_matches(const CarrierPattern::Step& step, const QName& name, MatchTier tier) {
    if (step.local != "*" && step.local != name.local) {
        return false;
    }
    if (tier == MatchTier::LocalName || !step.ns_uri) {
        return true;
    }
    return *step.ns_uri == name.ns_uri;
}

std::optional<std::string> element_value(const Node& node) {
    if (const auto* val = node.attribute_by_local("val")) {
        return *val;
    }
    if (const auto* val = node.attribute_by_local("value")) {
        return *val;
    }
    if (node.has_text()) {
        return boost::algorithm::trim_copy(node.text);
    }
    return std::nullopt;
}

std::vector<CarrierMatch> matches_for_tier(const CarrierPattern& pattern, const ParsedDocument& doc,
                                           MatchTier tier) {
    std::vector<CarrierMatch> matches;
    for (NodeId id : pattern.select(doc, tier)) {
        const Node& node = doc.node(id);
        if (!pattern.targets_attribute()) {
            matches.push_back(CarrierMatch{id, std::nullopt, element_value(node), tier});
            continue;
        }
        for (const auto& attr : node.attributes) {
            if (step_matches(*pattern.attribute_step(), attr.name, tier)) {
                matches.push_back(CarrierMatch{id, attr.name, attr.value, tier});
            }
        }
    }
    return matches;
}

} // anonymous namespace

// ============================================================
// CarrierPattern
// ============================================================

CarrierPattern CarrierPattern::compile(std::string_view text) {
    CarrierPattern result;
    result.source_ = boost::algorithm::trim_copy(std::string(text));
    std::string_view rest = result.source_;
    if (rest.empty()) {
        pattern_error(text, "empty pattern");
    }

    while (!rest.empty()) {
        bool descendant = false;
        if (rest.substr(0, 2) == "//") {
            descendant = true;
            rest.remove_prefix(2);
        } else if (rest.front() == '/') {
            rest.remove_prefix(1);
        } else {
            pattern_error(text, "expected '/' before step");
        }

        const auto end = std::min(rest.find('/'), rest.size());
        const auto name = rest.substr(0, end);
        rest.remove_prefix(end);
        if (name.empty()) {
            pattern_error(text, "empty step");
        }

        if (name.front() == '@') {
            if (!rest.empty()) {
                pattern_error(text, "attribute step must be last");
            }
            if (descendant || result.steps_.empty()) {
                pattern_error(text, "attribute step must follow an element step with '/'");
            }
            result.attribute_ = parse_step(text, name.substr(1), false, true);
        } else {
            result.steps_.push_back(parse_step(text, name, descendant, false));
        }
    }
    return result;
}

std::set<std::string> CarrierPattern::namespaces() const {
    std::set<std::string> uris;
    for (const auto& step : steps_) {
        if (step.ns_uri && !step.ns_uri->empty()) {
            uris.insert(*step.ns_uri);
        }
    }
    if (attribute_ && attribute_->ns_uri && !attribute_->ns_uri->empty()) {
        uris.insert(*attribute_->ns_uri);
    }
    return uris;
}

std::vector<NodeId> CarrierPattern::select(const ParsedDocument& doc, MatchTier tier) const {
    if (doc.empty() || steps_.empty()) {
        return {};
    }

    const auto count = static_cast<NodeId>(doc.size());
    std::vector<NodeId> context;
    bool at_document = true;  // context is the virtual parent of the root

    for (const auto& step : steps_) {
        std::vector<char> selected(count, 0);
        auto consider = [&](NodeId id) {
            if (step_matches(step, doc.node(id).name, tier)) {
                selected[id] = 1;
            }
        };

        if (at_document) {
            if (step.descendant) {
                for (NodeId id = 0; id < count; ++id) consider(id);
            } else {
                consider(doc.root());
            }
        } else {
            for (NodeId ctx : context) {
                if (step.descendant) {
                    const NodeId end = doc.subtree_end(ctx);
                    for (NodeId id = ctx + 1; id < end; ++id) consider(id);
                } else {
                    for (NodeId child : doc.node(ctx).children) consider(child);
                }
            }
        }

        context.clear();
        for (NodeId id = 0; id < count; ++id) {
            if (selected[id]) context.push_back(id);
        }
        at_document = false;
        if (context.empty()) {
            break;
        }
    }
    return context;
}

std::vector<CarrierMatch> find_carrier_matches(const CarrierPattern& pattern, const ParsedDocument& doc) {
    auto matches = matches_for_tier(pattern, doc, MatchTier::Qualified);
    if (matches.empty()) {
        matches = matches_for_tier(pattern, doc, MatchTier::LocalName);
    }
    return matches;
}

// ============================================================
// Catalog
// ============================================================

CarrierMapping make_carrier_mapping(std::string_view location_pattern, CarrierKind kind,
                                    Significance significance, std::string design_token_path,
                                    std::string description,
                                    std::set<DocumentType> document_types) {
    CarrierMapping mapping;
    mapping.pattern = CarrierPattern::compile(location_pattern);
    mapping.location_pattern = mapping.pattern.source();
    mapping.carrier_kind = kind;
    mapping.significance = significance;
    mapping.design_token_path = std::move(design_token_path);
    mapping.description = std::move(description);
    mapping.applicable_document_types = std::move(document_types);
    mapping.namespace_identities = mapping.pattern.namespaces();
    if (mapping.namespace_identities.empty() &&
        mapping.applicable_document_types == std::set<DocumentType>{DocumentType::Excel}) {
        mapping.namespace_identities.insert(std::string(ns::spreadsheetml));
    }
    return mapping;
}

CarrierCatalog::CarrierCatalog(std::vector<CarrierMapping> mappings)
    : mappings_(std::move(mappings)) {}

std::vector<const CarrierMapping*> CarrierCatalog::applicable(std::optional<DocumentType> type) const {
    return zug::into_vector(
        zug::comp(zug::filter([type](const CarrierMapping& m) { return !type || m.applies_to(*type); }),
                  zug::map([](const CarrierMapping& m) { return &m; })),
        mappings_);
}

const CarrierMapping* CarrierCatalog::find_by_token(std::string_view token_path) const noexcept {
    for (const auto& mapping : mappings_) {
        if (mapping.design_token_path == token_path) {
            return &mapping;
        }
    }
    return nullptr;
}

const CarrierCatalog& CarrierCatalog::standard() {
    static const CarrierCatalog catalog = [] {
        using K = CarrierKind;
        using S = Significance;
        const std::set<DocumentType> all{DocumentType::Word, DocumentType::PowerPoint,
                                         DocumentType::Excel};
        const std::set<DocumentType> word{DocumentType::Word};
        const std::set<DocumentType> pptx{DocumentType::PowerPoint};
        const std::set<DocumentType> xlsx{DocumentType::Excel};

        std::vector<CarrierMapping> m;

        // Theme colors
        m.push_back(make_carrier_mapping("//a:clrScheme//a:srgbClr/@val", K::ColorScheme, S::Critical,
                                         "tokens.color.primary", "Primary theme colors", all));
        m.push_back(make_carrier_mapping("//a:clrScheme//a:sysClr/@val", K::ColorScheme, S::Critical,
                                         "tokens.color.system", "System theme colors", all));
        m.push_back(make_carrier_mapping("//w:color/@w:val", K::CharacterStyle, S::Important,
                                         "tokens.color.text", "Text color formatting", word));

        // Theme fonts
        m.push_back(make_carrier_mapping("//a:fontScheme//a:latin/@typeface", K::FontScheme,
                                         S::Critical, "tokens.typography.fontFamily.primary",
                                         "Primary font family", all));
        m.push_back(make_carrier_mapping("//a:fontScheme//a:ea/@typeface", K::FontScheme, S::Critical,
                                         "tokens.typography.fontFamily.eastAsian",
                                         "East Asian font family", all));
        m.push_back(make_carrier_mapping("//w:rFonts/@w:ascii", K::CharacterStyle, S::Important,
                                         "tokens.typography.fontFamily.body", "Body text font family",
                                         word));

        // Theme identity
        m.push_back(make_carrier_mapping("//a:clrScheme/@name", K::ThemeVariant, S::Moderate,
                                         "tokens.theme.colorScheme", "Color scheme name", all));
        m.push_back(make_carrier_mapping("//a:fontScheme/@name", K::ThemeVariant, S::Moderate,
                                         "tokens.theme.fontScheme", "Font scheme name", all));
        m.push_back(make_carrier_mapping("//a:fmtScheme/@name", K::ThemeVariant, S::Cosmetic,
                                         "tokens.theme.formatScheme", "Format scheme name", all));

        // Paragraph styles
        m.push_back(make_carrier_mapping("//w:pStyle/@w:val", K::ParagraphStyle, S::Important,
                                         "tokens.typography.styles", "Paragraph style references",
                                         word));
        m.push_back(make_carrier_mapping("//w:spacing/@w:before", K::ParagraphStyle, S::Important,
                                         "tokens.spacing.paragraph.before", "Paragraph spacing before",
                                         word));
        m.push_back(make_carrier_mapping("//w:spacing/@w:after", K::ParagraphStyle, S::Important,
                                         "tokens.spacing.paragraph.after", "Paragraph spacing after",
                                         word));
        m.push_back(make_carrier_mapping("//w:ind/@w:left", K::ParagraphStyle, S::Important,
                                         "tokens.spacing.indentation.left", "Left indentation", word));

        // Character styles
        m.push_back(make_carrier_mapping("//w:sz/@w:val", K::CharacterStyle, S::Important,
                                         "tokens.typography.fontSize", "Font size", word));
        m.push_back(make_carrier_mapping("//w:b", K::CharacterStyle, S::Important,
                                         "tokens.typography.fontWeight.bold", "Bold formatting", word));
        m.push_back(make_carrier_mapping("//w:i", K::CharacterStyle, S::Important,
                                         "tokens.typography.fontStyle.italic", "Italic formatting",
                                         word));
        m.push_back(make_carrier_mapping("//w:kern/@w:val", K::CharacterStyle, S::Cosmetic,
                                         "tokens.typography.kerning", "Kerning threshold", word));

        // Tables
        m.push_back(make_carrier_mapping("//w:tblStyle/@w:val", K::TableStyle, S::Important,
                                         "tokens.table.style", "Table style reference", word));
        m.push_back(make_carrier_mapping("//w:tcPr//w:shd/@w:fill", K::TableStyle, S::Important,
                                         "tokens.table.cell.background", "Table cell background color",
                                         word));

        // Lists
        m.push_back(make_carrier_mapping("//w:numPr//w:numId/@w:val", K::ListStyle, S::Important,
                                         "tokens.list.numbering.id", "Numbering list ID", word));
        m.push_back(make_carrier_mapping("//w:numPr//w:ilvl/@w:val", K::ListStyle, S::Important,
                                         "tokens.list.level", "List indentation level", word));

        // Presentation
        m.push_back(make_carrier_mapping("//p:sldLayout/@type", K::LayoutMaster, S::Critical,
                                         "tokens.layout.slideLayout", "Slide layout type", pptx));
        m.push_back(make_carrier_mapping("//a:solidFill//a:srgbClr/@val", K::ColorScheme, S::Important,
                                         "tokens.color.fill", "Shape fill colors", pptx));

        // Shape properties: p:spPr in slides, pic:spPr in documents, xdr:spPr in sheets
        m.push_back(make_carrier_mapping("//p:spPr//a:solidFill/a:srgbClr/@val", K::ColorScheme,
                                         S::Important, "tokens.color.shapeFill",
                                         "Shape properties fill color", all));

        // Spreadsheet
        m.push_back(make_carrier_mapping("//cellXfs//xf/@numFmtId", K::CellStyle, S::Important,
                                         "tokens.cell.numberFormat", "Cell number format", xlsx));
        m.push_back(make_carrier_mapping("//fills//fill//fgColor/@rgb", K::CellStyle, S::Important,
                                         "tokens.cell.background", "Cell background color", xlsx));

        return CarrierCatalog{std::move(m)};
    }();
    return catalog;
}

} // namespace ooxml_fidelity
