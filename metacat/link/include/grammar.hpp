#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "expected.hpp"


namespace metacat::link::grammar {

    // <#E/{entityType}/{entityFQN}[/{fieldName}[/{arrayFieldName}[/{arrayFieldValue}]]]>
    inline constexpr std::string_view kOpenToken = "<#E/";
    inline constexpr char kCloseToken = '>';
    inline constexpr char kSegmentSeparator = '/';
    inline constexpr char kFallbackSeparator = '|';
    inline constexpr std::size_t kMaxSegments = 5;


    struct Segments 
    {
        std::string entityType;
        std::string entityFqn;
        std::optional<std::string> fieldName;
        std::optional<std::string> arrayFieldName;
        std::optional<std::string> arrayFieldValue;
    };


    /**
     * @brief One raw occurrence of a link inside a larger text.
     * offset/length cover the occurrence as written (fallback text included);
     * body is the part between the open token and the close token, fallback text removed.
     */
    struct TokenSpan 
    {
        std::size_t offset{0};
        std::size_t length{0};
        std::string body;
    };


    /**
     * @brief Drop a fallback display suffix: everything from the first '|' on is replaced by '>'.
     * "<#E/user/user1|[@User One](http://x)>" -> "<#E/user/user1>". Text without '|' is returned as is.
     */
    std::string stripFallbackDisplay(std::string_view text);

    /**
     * @brief True when the text has no fallback display, or when its fallback text carries no '<'
     * and exactly one '>' which ends the text.
     */
    bool hasSafeFallbackDisplay(std::string_view text);

    /**
     * @brief Positional split of a link body into at most kMaxSegments segments.
     * The last segment takes the remainder of the body. Trailing empty segments are absent.
     */
    Expected<Segments> splitBody(std::string_view body);

    /**
     * @brief Lenient left-to-right scan for well-formed, non-overlapping link occurrences.
     * Linear in text length; never fails.
     */
    std::vector<TokenSpan> scanTokens(std::string_view text);

} // namespace metacat::link::grammar
