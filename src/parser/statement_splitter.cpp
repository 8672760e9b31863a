#include "parser/statement_splitter.hpp"
#include "core/utils.hpp"

namespace sqlrunner {

namespace {

inline bool is_tag_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

/**
 * @brief Accumulates the current statement and emits it on terminators
 */
class Accumulator {
public:
    explicit Accumulator(std::vector<Statement>& out) : out_(out) {}

    void append(char c) { text_ += c; }
    void append(std::string_view s) { text_ += s; }

    // Emit trimmed text if non-empty and restart at next_start
    void flush(size_t next_start) {
        const auto first = text_.find_first_not_of(utils::kWhitespace);
        if (first != std::string::npos) {
            Statement stmt;
            stmt.text = utils::trim(text_);
            stmt.index = out_.size();
            stmt.offset = start_ + first;
            out_.emplace_back(std::move(stmt));
        }
        text_.clear();
        start_ = next_start;
    }

private:
    std::vector<Statement>& out_;
    std::string text_;
    size_t start_ = 0;
};

} // anonymous namespace

size_t StatementSplitter::match_dollar_tag(std::string_view sql, size_t pos) {
    if (pos >= sql.size() || sql[pos] != '$') {
        return 0;
    }
    size_t i = pos + 1;
    while (i < sql.size() && is_tag_char(sql[i])) {
        ++i;
    }
    if (i < sql.size() && sql[i] == '$') {
        return i - pos + 1;
    }
    return 0;
}

std::vector<Statement> StatementSplitter::split(std::string_view sql) {
    std::vector<Statement> statements;
    Accumulator acc(statements);

    State state = State::NORMAL;
    std::string_view dollar_tag;

    const size_t len = sql.size();
    size_t i = 0;
    while (i < len) {
        const char c = sql[i];
        const char next_c = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case State::NORMAL: {
                if (c == '/' && next_c == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    acc.append(sql.substr(i, 2));
                    i += 2;
                    continue;
                }
                if (c == '-' && next_c == '-') {
                    state = State::IN_LINE_COMMENT;
                    acc.append(sql.substr(i, 2));
                    i += 2;
                    continue;
                }
                if (const size_t tag_len = match_dollar_tag(sql, i); tag_len > 0) {
                    state = State::IN_DOLLAR_QUOTE;
                    dollar_tag = sql.substr(i, tag_len);
                    acc.append(dollar_tag);
                    i += tag_len;
                    continue;
                }
                if (c == '\'') {
                    state = State::IN_SINGLE_QUOTE;
                    acc.append(c);
                    ++i;
                    continue;
                }
                if (c == ';') {
                    acc.append(c);
                    acc.flush(i + 1);
                    ++i;
                    continue;
                }
                acc.append(c);
                ++i;
                break;
            }

            case State::IN_SINGLE_QUOTE: {
                if (c == '\'' && next_c == '\'') {
                    acc.append("''");
                    i += 2;
                    continue;
                }
                if (c == '\'') {
                    state = State::NORMAL;
                }
                acc.append(c);
                ++i;
                break;
            }

            case State::IN_DOLLAR_QUOTE: {
                // Only the exact opening tag closes; any other $x$ is body text
                // and is consumed one char at a time.
                if (c == '$' && sql.substr(i, dollar_tag.size()) == dollar_tag &&
                    match_dollar_tag(sql, i) == dollar_tag.size()) {
                    state = State::NORMAL;
                    acc.append(dollar_tag);
                    i += dollar_tag.size();
                    dollar_tag = {};
                    continue;
                }
                acc.append(c);
                ++i;
                break;
            }

            case State::IN_BLOCK_COMMENT: {
                if (c == '*' && next_c == '/') {
                    state = State::NORMAL;
                    acc.append("*/");
                    i += 2;
                    continue;
                }
                acc.append(c);
                ++i;
                break;
            }

            case State::IN_LINE_COMMENT: {
                if (c == '\n') {
                    state = State::NORMAL;
                }
                acc.append(c);
                ++i;
                break;
            }
        }
    }

    // Trailing text is kept whatever state the scan ended in
    acc.flush(len);
    return statements;
}

std::vector<std::string> StatementSplitter::split_texts(std::string_view script) {
    std::vector<std::string> texts;
    auto statements = split(script);
    texts.reserve(statements.size());
    for (auto& stmt : statements) {
        texts.emplace_back(std::move(stmt.text));
    }
    return texts;
}

} // namespace sqlrunner
