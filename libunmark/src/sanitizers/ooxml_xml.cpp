//
// Created on 22/10/26.
//

#include "../../include/ooxml_xml.hpp"
#include "../../include/logger.hpp"
#include <pugixml.hpp>
#include <regex>
#include <sstream>
#include <vector>

namespace {

const char* xml_tag() {
    return "OoxmlXml";
}

bool parse(pugi::xml_document& doc, const std::string& xml, const std::string_view what) {
    const pugi::xml_parse_result result =
        doc.load_buffer(xml.data(), xml.size(), pugi::parse_full, pugi::encoding_utf8);
    if (!result) {
        Logger::log(LogLevel::Warning,
                    std::string(what) + " does not parse (" + result.description() + " at offset " +
                    std::to_string(result.offset) + ")",
                    xml_tag());
        return false;
    }
    return true;
}

std::string serialize(const pugi::xml_document& doc) {
    std::ostringstream oss;
    doc.save(oss, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return oss.str();
}

std::string_view local_name(const std::string_view qname) {
    const auto colon = qname.find(':');
    return colon == std::string_view::npos ? qname : qname.substr(colon + 1);
}

// resolves the namespace uri bound to the element's prefix
std::string_view namespace_of(const pugi::xml_node node) {
    const std::string_view qname = node.name();
    const auto colon = qname.find(':');
    const std::string attr = colon == std::string_view::npos
                                 ? std::string("xmlns")
                                 : "xmlns:" + std::string(qname.substr(0, colon));
    for (pugi::xml_node n = node; n; n = n.parent()) {
        if (const pugi::xml_attribute a = n.attribute(attr.c_str())) {
            return a.value();
        }
    }
    return {};
}

std::string normalize(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string seg;
    while (std::getline(ss, seg, '/')) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(seg);
    }
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += '/';
        out += p;
    }
    return out;
}

} // namespace

namespace unmark::ooxml {

bool remove_track_revisions(std::string& settings_xml) {
    pugi::xml_document doc;
    if (parse(doc, settings_xml, "word/settings.xml")) {
        std::vector<pugi::xml_node> doomed;
        for (const pugi::xpath_node& xn : doc.select_nodes("//*[local-name()='trackRevisions']")) {
            const pugi::xml_node node = xn.node();
            const std::string_view ns = namespace_of(node);
            if (ns == kWordNamespace || ns == kWordStrictNamespace) {
                doomed.push_back(node);
            }
        }
        for (const auto& node : doomed) {
            node.parent().remove_child(node);
        }
        if (doomed.empty()) return false;
        settings_xml = serialize(doc);
        return true;
    }

    // textual fallback, same removal scope
    Logger::log(LogLevel::Warning, "Falling back to textual trackRevisions removal", xml_tag());
    static const std::regex self_closing(R"(<w:trackRevisions[^>]*/>)");
    static const std::regex paired(R"(<w:trackRevisions[^>]*>[\s\S]*?</w:trackRevisions>)");
    std::string out = std::regex_replace(settings_xml, self_closing, "");
    out = std::regex_replace(out, paired, "");
    if (out == settings_xml) return false;
    settings_xml = std::move(out);
    return true;
}

std::string rels_name_for(const std::string_view part_name) {
    const auto slash = part_name.find_last_of('/');
    if (slash == std::string_view::npos) {
        return "_rels/" + std::string(part_name) + ".rels";
    }
    return std::string(part_name.substr(0, slash + 1)) + "_rels/" +
           std::string(part_name.substr(slash + 1)) + ".rels";
}

std::string resolve_target(const std::string_view rels_name, const std::string_view target) {
    if (target.starts_with('/')) {
        return normalize(std::string(target));
    }
    // "word/_rels/document.xml.rels" describes parts relative to "word/"
    std::string base(rels_name);
    const auto slash = base.find_last_of('/');
    base = slash == std::string::npos ? std::string() : base.substr(0, slash);
    if (base == "_rels") {
        base.clear();
    } else if (base.ends_with("/_rels")) {
        base.resize(base.size() - 6);
    }
    return normalize(base.empty() ? std::string(target) : base + "/" + std::string(target));
}

bool prune_relationships(std::string& rels_xml,
                         const std::string_view rels_name,
                         const std::unordered_set<std::string>& removed) {
    pugi::xml_document doc;
    if (!parse(doc, rels_xml, rels_name)) return false;

    std::vector<pugi::xml_node> doomed;
    for (const pugi::xml_node rel : doc.document_element().children()) {
        if (local_name(rel.name()) != "Relationship") continue;
        if (std::string_view(rel.attribute("TargetMode").value()) == "External") continue;
        const std::string target = resolve_target(rels_name, rel.attribute("Target").value());
        if (removed.contains(target)) {
            Logger::log(LogLevel::Debug, std::string(rels_name) + ": dropping relationship to " + target, xml_tag());
            doomed.push_back(rel);
        }
    }
    for (const auto& node : doomed) {
        node.parent().remove_child(node);
    }
    if (doomed.empty()) return false;
    rels_xml = serialize(doc);
    return true;
}

bool prune_content_types(std::string& content_types_xml,
                         const std::unordered_set<std::string>& removed) {
    pugi::xml_document doc;
    if (!parse(doc, content_types_xml, "[Content_Types].xml")) return false;

    std::vector<pugi::xml_node> doomed;
    for (const pugi::xml_node child : doc.document_element().children()) {
        if (local_name(child.name()) != "Override") continue;
        const std::string part = normalize(child.attribute("PartName").value());
        if (removed.contains(part)) {
            doomed.push_back(child);
        }
    }
    for (const auto& node : doomed) {
        node.parent().remove_child(node);
    }
    if (doomed.empty()) return false;
    content_types_xml = serialize(doc);
    return true;
}

} // namespace unmark::ooxml
