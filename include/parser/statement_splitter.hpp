#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrunner {

/**
 * @brief One executable statement carved out of a script
 */
struct Statement {
    std::string text;       // Trimmed, including its terminating ';' if any
    size_t index = 0;       // 0-based position among the script's statements
    size_t offset = 0;      // Byte offset of the first significant char in the script
};

/**
 * @brief Statement splitter - single-pass scan of a multi-statement script
 *
 * Splits on ';' only when outside of:
 * - 'single quoted' literals ('' is an escaped quote)
 * - $tag$ dollar quoted bodies $tag$ (tag may be empty)
 * - block comments (not nested: the first closing marker ends the comment)
 * - -- line comments
 *
 * Never fails. An unterminated quote or comment at end of input is kept as
 * part of a trailing statement instead of being dropped.
 *
 * Example:
 *   Input:  "SELECT 'a;b'; SELECT 2;"
 *   Output: ["SELECT 'a;b';", "SELECT 2;"]
 */
class StatementSplitter {
public:
    /**
     * @brief Scanner states
     */
    enum class State {
        NORMAL,              // Plain SQL text, ';' terminates
        IN_SINGLE_QUOTE,     // Inside 'string literal'
        IN_DOLLAR_QUOTE,     // Inside $tag$ ... $tag$
        IN_BLOCK_COMMENT,    // Inside block comment
        IN_LINE_COMMENT      // Inside -- comment, until newline
    };

    /**
     * @brief Split a script into ordered statements
     * @param script Raw SQL text (may be empty)
     * @return Statements in script order; empty for blank input
     */
    [[nodiscard]] static std::vector<Statement> split(std::string_view script);

    /**
     * @brief Convenience wrapper returning only statement texts
     */
    [[nodiscard]] static std::vector<std::string> split_texts(std::string_view script);

    /**
     * @brief Length of a $tag$ token starting at pos, or 0 if none
     */
    [[nodiscard]] static size_t match_dollar_tag(std::string_view sql, size_t pos);
};

} // namespace sqlrunner
