// xml_reader.cpp - libxml2 tree walk into the node arena

#include <ooxml_fidelity/xml_reader.h>
#include <ooxml_fidelity/log.h>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <boost/algorithm/string/trim.hpp>

#include <climits>
#include <memory>
#include <mutex>
#include <vector>

namespace ooxml_fidelity {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

constexpr int kParseOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                              XML_PARSE_NOCDATA;

std::string to_std_string(const xmlChar* text) {
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string{};
}

QName qualified_name(const xmlNs* ns, const xmlChar* local) {
    return QName{ns ? to_std_string(ns->href) : std::string{}, to_std_string(local)};
}

std::string attribute_value(xmlDoc* doc, const xmlAttr* attr) {
    xmlChar* raw = xmlNodeListGetString(doc, attr->children, 1);
    std::string value = to_std_string(raw);
    if (raw) {
        xmlFree(raw);
    }
    return value;
}

void walk(xmlDoc* doc, const xmlNode* element, DocumentBuilder& builder) {
    std::vector<Attribute> attributes;
    for (const xmlAttr* attr = element->properties; attr; attr = attr->next) {
        attributes.push_back(Attribute{qualified_name(attr->ns, attr->name), attribute_value(doc, attr)});
    }
    builder.open(qualified_name(element->ns, element->name), std::move(attributes));

    for (const xmlNode* child = element->children; child; child = child->next) {
        switch (child->type) {
            case XML_ELEMENT_NODE:
                walk(doc, child, builder);
                break;
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                builder.append_text(reinterpret_cast<const char*>(child->content));
                break;
            default:
                break;  // comments, processing instructions, entity refs
        }
    }
    builder.close();
}

std::string last_error_message() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) {
        return "unknown XML parse error";
    }
    std::string message = err->message;
    boost::algorithm::trim_right(message);
    return "line " + std::to_string(err->line) + ": " + message;
}

} // anonymous namespace

std::optional<ParsedDocument> parse_document(std::string_view bytes, std::string* error_out) {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { xmlInitParser(); });

    if (bytes.empty() || bytes.size() > static_cast<std::size_t>(INT_MAX)) {
        if (error_out) *error_out = bytes.empty() ? "empty document" : "document too large";
        detail::log_input_error("parse_document", "<bytes>", "empty or oversized input");
        return std::nullopt;
    }

    xmlResetLastError();
    XmlDocPtr doc{xmlReadMemory(bytes.data(), static_cast<int>(bytes.size()), nullptr, nullptr,
                                kParseOptions),
                  &xmlFreeDoc};
    if (!doc) {
        std::string message = last_error_message();
        detail::log_input_error("parse_document", "<bytes>", message);
        if (error_out) *error_out = std::move(message);
        return std::nullopt;
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        if (error_out) *error_out = "document has no root element";
        detail::log_input_error("parse_document", "<bytes>", "no root element");
        return std::nullopt;
    }

    DocumentBuilder builder;
    walk(doc.get(), root, builder);
    return builder.finish();
}

} // namespace ooxml_fidelity
