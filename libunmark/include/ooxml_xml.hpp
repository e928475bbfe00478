//
// Created on 22/10/26.
//

/**
 * @file ooxml_xml.hpp
 * @brief XML edits applied to Office Open XML package parts.
 *
 * All functions take a part's text and edit it in place, returning whether
 * anything changed. Parts that fail to parse are left untouched, except
 * for track-revisions removal, which has a textual fallback.
 */

#ifndef UNMARK_OOXML_XML_HPP
#define UNMARK_OOXML_XML_HPP

#include <string>
#include <string_view>
#include <unordered_set>

namespace unmark::ooxml {

    ///< WordprocessingML main namespace (transitional and strict).
    inline constexpr std::string_view kWordNamespace =
        "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
    inline constexpr std::string_view kWordStrictNamespace =
        "http://purl.oclc.org/ooxml/wordprocessingml/main";

    /**
     * @name Empty replacement parts
     * Each document declares exactly the namespace(s) of the part it replaces.
     * @{
     */
    inline constexpr std::string_view kEmptyWordComments =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<w:comments xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"></w:comments>)";
    inline constexpr std::string_view kEmptyWordCommentsEx =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<w15:commentsEx xmlns:w15="http://schemas.microsoft.com/office/word/2012/wordml"></w15:commentsEx>)";
    inline constexpr std::string_view kEmptyWordCommentsIds =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<w16cid:commentsIds xmlns:w16cid="http://schemas.microsoft.com/office/word/2016/wordml/cid"></w16cid:commentsIds>)";
    inline constexpr std::string_view kEmptyWordCommentsExtensible =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<w16cex:commentsExtensible xmlns:w16cex="http://schemas.microsoft.com/office/word/2018/wordml/cex"></w16cex:commentsExtensible>)";
    inline constexpr std::string_view kEmptyWordPeople =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<w15:people xmlns:w15="http://schemas.microsoft.com/office/word/2012/wordml"></w15:people>)";
    inline constexpr std::string_view kEmptySheetComments =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<comments xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><authors></authors><commentList></commentList></comments>)";
    inline constexpr std::string_view kEmptySheetThreadedComments =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<ThreadedComments xmlns="http://schemas.microsoft.com/office/spreadsheetml/2018/threadedcomments"></ThreadedComments>)";
    inline constexpr std::string_view kEmptySheetPersons =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<personList xmlns="http://schemas.microsoft.com/office/spreadsheetml/2018/threadedcomments"></personList>)";
    inline constexpr std::string_view kEmptySlideComments =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<p:cmLst xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main"></p:cmLst>)";
    inline constexpr std::string_view kEmptySlideModernComments =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<p188:cmLst xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships" xmlns:p188="http://schemas.microsoft.com/office/powerpoint/2018/8/main"></p188:cmLst>)";
    inline constexpr std::string_view kEmptySlideCommentAuthors =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<p:cmAuthorLst xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main"></p:cmAuthorLst>)";
    inline constexpr std::string_view kEmptySlideAuthors =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        R"(<p188:authorLst xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships" xmlns:p188="http://schemas.microsoft.com/office/powerpoint/2018/8/main"></p188:authorLst>)";
    /** @} */

    /**
     * @brief Remove every w:trackRevisions element from word/settings.xml.
     *
     * The part is parsed and matching elements are removed by node identity.
     * If it does not parse, the self-closing and paired forms are removed
     * textually instead.
     * @return True if at least one element was removed.
     */
    bool remove_track_revisions(std::string& settings_xml);

    /**
     * @brief Drop Relationship elements whose internal target is a removed part.
     * @param rels_xml Text of a .rels part.
     * @param rels_name Archive name of the .rels part (locates the source part).
     * @param removed Archive names of removed parts (no leading slash).
     * @return True if any relationship was dropped.
     */
    bool prune_relationships(std::string& rels_xml,
                             std::string_view rels_name,
                             const std::unordered_set<std::string>& removed);

    /**
     * @brief Drop Override elements of [Content_Types].xml naming a removed part.
     * @return True if any override was dropped.
     */
    bool prune_content_types(std::string& content_types_xml,
                             const std::unordered_set<std::string>& removed);

    /**
     * @brief Archive name of the .rels part that belongs to @p part_name
     * ("word/document.xml" -> "word/_rels/document.xml.rels").
     */
    std::string rels_name_for(std::string_view part_name);

    /**
     * @brief Resolve a relationship target against the directory of its source part.
     * @return Normalized archive name without leading slash.
     */
    std::string resolve_target(std::string_view rels_name, std::string_view target);

} // namespace unmark::ooxml

#endif // UNMARK_OOXML_XML_HPP
