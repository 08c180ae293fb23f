#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace loom::css {

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, Number, Percentage,
        Dimension, Whitespace, Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        Delim, CDC, CDO, EndOfFile
    };
    Type type = EndOfFile;
    // Ident/Function/AtKeyword/Hash: the name without its sigil. String: the
    // unescaped contents. Numeric tokens: the source text, unit included.
    std::string value;
    double numeric_value = 0;
    std::string unit;

    bool operator==(const CSSToken& other) const;
};

// Source text of a token, as it would appear in a stylesheet.
std::string serialize_token(const CSSToken& token);

// Pull tokenizer over stylesheet text. Comments produce no tokens; a run of
// white space is one Whitespace token.
class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input) : input_(input) {}

    // Returns EndOfFile forever once the input is exhausted.
    CSSToken next_token();

    // The result always ends with EndOfFile.
    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;
};

} // namespace loom::css
