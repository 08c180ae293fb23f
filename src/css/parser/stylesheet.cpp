#include <loom/css/parser/stylesheet.h>
#include <loom/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>

namespace loom::css {

namespace {

constexpr const char* kModule = "css.parser";

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool opens_nesting(CSSToken::Type type) {
    return type == CSSToken::LeftBrace || type == CSSToken::LeftParen ||
           type == CSSToken::LeftBracket || type == CSSToken::Function;
}

bool closes_nesting(CSSToken::Type type) {
    return type == CSSToken::RightBrace || type == CSSToken::RightParen ||
           type == CSSToken::RightBracket;
}

// Serializes a token range with runs of whitespace collapsed to one space and
// leading/trailing whitespace removed.
std::string serialize_range(const std::vector<CSSToken>& tokens, size_t begin, size_t end) {
    std::string out;
    bool pending_space = false;
    for (size_t i = begin; i < end; ++i) {
        if (tokens[i].type == CSSToken::Whitespace) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += serialize_token(tokens[i]);
    }
    return out;
}

class StyleSheetParser {
public:
    StyleSheetParser(std::string_view css, core::DiagnosticScope diagnostics)
        : tokens_(CSSTokenizer::tokenize_all(css)), diagnostics_(std::move(diagnostics)) {}

    StyleSheet parse_sheet();
    std::vector<Declaration> parse_block_contents();

private:
    std::vector<CSSToken> tokens_;
    size_t pos_ = 0;
    core::DiagnosticScope diagnostics_;

    const CSSToken& current() const { return tokens_[std::min(pos_, tokens_.size() - 1)]; }
    bool at_end() const { return current().type == CSSToken::EndOfFile; }

    void skip_at_rule();
    // Consumes a {...} block starting at the current '{'. Returns the token
    // range of its contents.
    std::pair<size_t, size_t> consume_block();
    std::vector<Declaration> parse_declarations(size_t begin, size_t end);
    bool parse_declaration(size_t begin, size_t end, Declaration& out);
};

StyleSheet StyleSheetParser::parse_sheet() {
    StyleSheet sheet;
    while (!at_end()) {
        auto type = current().type;
        if (type == CSSToken::Whitespace || type == CSSToken::CDO || type == CSSToken::CDC) {
            ++pos_;
            continue;
        }
        if (type == CSSToken::AtKeyword) {
            diagnostics_.warning(kModule, "at-rule @" + current().value + " skipped");
            skip_at_rule();
            continue;
        }
        if (type == CSSToken::RightBrace) {
            diagnostics_.warning(kModule, "stray '}' ignored");
            ++pos_;
            continue;
        }

        // Qualified rule: prelude up to '{' at nesting depth 0.
        size_t prelude_begin = pos_;
        int depth = 0;
        while (!at_end()) {
            auto t = current().type;
            if (t == CSSToken::LeftBrace && depth == 0) break;
            if (opens_nesting(t)) ++depth;
            else if (closes_nesting(t) && depth > 0) --depth;
            ++pos_;
        }
        std::string selector_text = serialize_range(tokens_, prelude_begin, pos_);
        if (at_end()) {
            diagnostics_.warning(kModule, "rule '" + selector_text + "' has no declaration block");
            break;
        }

        auto [body_begin, body_end] = consume_block();

        std::string error;
        auto selectors = parse_selector_list(selector_text, &error);
        if (!selectors) {
            diagnostics_.warning(kModule, "rule '" + selector_text + "' dropped: " + error);
            continue;
        }

        StyleRule rule;
        rule.selectors = std::move(*selectors);
        rule.selector_text = std::move(selector_text);
        rule.declarations = parse_declarations(body_begin, body_end);
        sheet.rules.push_back(std::move(rule));
    }
    return sheet;
}

std::vector<Declaration> StyleSheetParser::parse_block_contents() {
    return parse_declarations(0, tokens_.size() - 1);
}

void StyleSheetParser::skip_at_rule() {
    ++pos_;
    int depth = 0;
    while (!at_end()) {
        auto t = current().type;
        if (t == CSSToken::Semicolon && depth == 0) {
            ++pos_;
            return;
        }
        if (t == CSSToken::LeftBrace && depth == 0) {
            consume_block();
            return;
        }
        if (opens_nesting(t)) ++depth;
        else if (closes_nesting(t) && depth > 0) --depth;
        ++pos_;
    }
}

std::pair<size_t, size_t> StyleSheetParser::consume_block() {
    ++pos_;  // '{'
    size_t begin = pos_;
    int depth = 0;
    while (!at_end()) {
        auto t = current().type;
        if (t == CSSToken::RightBrace && depth == 0) {
            size_t end = pos_;
            ++pos_;
            return {begin, end};
        }
        if (opens_nesting(t)) ++depth;
        else if (closes_nesting(t) && depth > 0) --depth;
        ++pos_;
    }
    diagnostics_.warning(kModule, "unterminated block closed at end of stylesheet");
    return {begin, pos_};
}

std::vector<Declaration> StyleSheetParser::parse_declarations(size_t begin, size_t end) {
    std::vector<Declaration> declarations;
    size_t start = begin;
    int depth = 0;
    for (size_t i = begin; i <= end; ++i) {
        bool boundary = i == end;
        if (!boundary) {
            auto t = tokens_[i].type;
            if (opens_nesting(t)) ++depth;
            else if (closes_nesting(t) && depth > 0) --depth;
            boundary = t == CSSToken::Semicolon && depth == 0;
        }
        if (!boundary) continue;

        Declaration decl;
        if (parse_declaration(start, i, decl)) {
            declarations.push_back(std::move(decl));
        }
        start = i + 1;
    }
    return declarations;
}

bool StyleSheetParser::parse_declaration(size_t begin, size_t end, Declaration& out) {
    while (begin < end && tokens_[begin].type == CSSToken::Whitespace) ++begin;
    while (end > begin && tokens_[end - 1].type == CSSToken::Whitespace) --end;
    if (begin == end) {
        return false;
    }

    std::string text = serialize_range(tokens_, begin, end);
    if (tokens_[begin].type != CSSToken::Ident) {
        diagnostics_.warning(kModule, "malformed declaration '" + text + "' skipped");
        return false;
    }
    out.property = ascii_lower(tokens_[begin].value);

    size_t i = begin + 1;
    while (i < end && tokens_[i].type == CSSToken::Whitespace) ++i;
    if (i == end || tokens_[i].type != CSSToken::Colon) {
        diagnostics_.warning(kModule, "declaration '" + text + "' is missing ':'; skipped");
        return false;
    }
    ++i;

    // Trailing "! important".
    size_t value_end = end;
    if (value_end > i && tokens_[value_end - 1].type == CSSToken::Ident &&
        ascii_lower(tokens_[value_end - 1].value) == "important") {
        size_t j = value_end - 1;
        while (j > i && tokens_[j - 1].type == CSSToken::Whitespace) --j;
        if (j > i && tokens_[j - 1].type == CSSToken::Delim && tokens_[j - 1].value == "!") {
            out.important = true;
            value_end = j - 1;
        }
    }

    for (size_t k = i; k < value_end; ++k) {
        auto t = tokens_[k].type;
        if (t == CSSToken::LeftBrace || t == CSSToken::RightBrace ||
            (t == CSSToken::Delim && tokens_[k].value == "!")) {
            diagnostics_.warning(kModule, "declaration '" + text + "' has an invalid value; skipped");
            return false;
        }
    }

    out.value = serialize_range(tokens_, i, value_end);
    if (out.value.empty()) {
        diagnostics_.warning(kModule, "declaration '" + text + "' has an empty value; skipped");
        return false;
    }
    return true;
}

} // namespace

StyleSheet parse_stylesheet(std::string_view css, core::DiagnosticScope diagnostics) {
    StyleSheetParser parser(css, std::move(diagnostics));
    return parser.parse_sheet();
}

std::vector<Declaration> parse_declaration_block(std::string_view css,
                                                 core::DiagnosticScope diagnostics) {
    StyleSheetParser parser(css, std::move(diagnostics));
    return parser.parse_block_contents();
}

} // namespace loom::css
