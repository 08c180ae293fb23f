#include <loom/css/parser/tokenizer.h>
#include <cctype>
#include <cstdlib>

namespace loom::css {
namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_name_char(char c) {
    return is_name_start(c) || is_digit(c) || c == '-';
}

// Cursor over the tokenizer's input. Reading past the end yields '\0'.
struct Cursor {
    std::string_view text;
    size_t& pos;

    char at(size_t ahead = 0) const {
        return pos + ahead < text.size() ? text[pos + ahead] : '\0';
    }
    bool done() const { return pos >= text.size(); }
    char take() { return done() ? '\0' : text[pos++]; }
    bool looking_at(std::string_view prefix) const {
        return text.substr(pos, prefix.size()) == prefix;
    }

    bool escape_at(size_t ahead) const {
        return at(ahead) == '\\' && at(ahead + 1) != '\n' && at(ahead + 1) != '\0';
    }
    bool ident_at(size_t ahead = 0) const {
        const char c = at(ahead);
        if (c == '-') {
            const char next = at(ahead + 1);
            return is_name_start(next) || next == '-' || escape_at(ahead + 1);
        }
        return is_name_start(c) || escape_at(ahead);
    }
    bool number_at(size_t ahead = 0) const {
        size_t i = ahead;
        if (at(i) == '+' || at(i) == '-') ++i;
        if (is_digit(at(i))) return true;
        return at(i) == '.' && is_digit(at(i + 1));
    }
};

CSSToken make(CSSToken::Type type, std::string value) {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    return token;
}

// Escapes outside ASCII decode to '?'; names in the supported subset are ASCII.
std::string read_name(Cursor& in) {
    std::string name;
    for (;;) {
        if (is_name_char(in.at())) {
            name += in.take();
        } else if (in.escape_at(0)) {
            in.take();
            if (!is_hex(in.at())) {
                name += in.take();
                continue;
            }
            std::string hex;
            while (hex.size() < 6 && is_hex(in.at())) hex += in.take();
            if (is_space(in.at())) in.take();
            const unsigned long code = std::strtoul(hex.c_str(), nullptr, 16);
            name += (code > 0 && code <= 0x7F) ? static_cast<char>(code) : '?';
        } else {
            return name;
        }
    }
}

// An unescaped newline ends the string early and is left for the next token.
CSSToken read_string(Cursor& in, char quote) {
    CSSToken token = make(CSSToken::String, "");
    while (!in.done()) {
        const char c = in.at();
        if (c == '\n') break;
        in.take();
        if (c == quote) break;
        if (c != '\\') {
            token.value += c;
        } else if (in.at() == '\n') {
            in.take();
        } else if (!in.done()) {
            token.value += in.take();
        }
    }
    return token;
}

CSSToken read_numeric(Cursor& in) {
    const size_t start = in.pos;
    if (in.at() == '+' || in.at() == '-') in.take();
    while (is_digit(in.at())) in.take();
    if (in.at() == '.' && is_digit(in.at(1))) {
        in.take();
        while (is_digit(in.at())) in.take();
    }
    if (in.at() == 'e' || in.at() == 'E') {
        const size_t sign = (in.at(1) == '+' || in.at(1) == '-') ? 1 : 0;
        if (is_digit(in.at(1 + sign))) {
            in.pos += 1 + sign;
            while (is_digit(in.at())) in.take();
        }
    }

    const std::string number(in.text.substr(start, in.pos - start));
    CSSToken token = make(CSSToken::Number, number);
    token.numeric_value = std::strtod(number.c_str(), nullptr);
    if (in.ident_at()) {
        token.type = CSSToken::Dimension;
        token.unit = read_name(in);
        token.value += token.unit;
    } else if (in.at() == '%') {
        in.take();
        token.type = CSSToken::Percentage;
        token.value += '%';
    }
    return token;
}

CSSToken read_ident_like(Cursor& in) {
    CSSToken token = make(CSSToken::Ident, read_name(in));
    if (in.at() == '(') {
        in.take();
        token.type = CSSToken::Function;
    }
    return token;
}

CSSToken::Type punctuation_type(char c) {
    switch (c) {
        case '(': return CSSToken::LeftParen;
        case ')': return CSSToken::RightParen;
        case '[': return CSSToken::LeftBracket;
        case ']': return CSSToken::RightBracket;
        case '{': return CSSToken::LeftBrace;
        case '}': return CSSToken::RightBrace;
        case ',': return CSSToken::Comma;
        case ':': return CSSToken::Colon;
        case ';': return CSSToken::Semicolon;
        default:  return CSSToken::Delim;
    }
}

} // namespace

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit;
}

std::string serialize_token(const CSSToken& token) {
    switch (token.type) {
        case CSSToken::Function:  return token.value + "(";
        case CSSToken::AtKeyword: return "@" + token.value;
        case CSSToken::Hash:      return "#" + token.value;
        case CSSToken::String:    return "\"" + token.value + "\"";
        case CSSToken::EndOfFile: return "";
        default:                  return token.value;
    }
}

CSSToken CSSTokenizer::next_token() {
    Cursor in{input_, pos_};

    // Unterminated comments run to the end of input.
    while (in.looking_at("/*")) {
        const size_t close = input_.find("*/", pos_ + 2);
        pos_ = close == std::string_view::npos ? input_.size() : close + 2;
    }

    if (in.done()) {
        return make(CSSToken::EndOfFile, "");
    }

    const char c = in.at();
    if (is_space(c)) {
        while (is_space(in.at())) in.take();
        return make(CSSToken::Whitespace, " ");
    }
    if (c == '"' || c == '\'') {
        in.take();
        return read_string(in, c);
    }
    if (in.looking_at("<!--")) {
        pos_ += 4;
        return make(CSSToken::CDO, "<!--");
    }
    if (in.looking_at("-->")) {
        pos_ += 3;
        return make(CSSToken::CDC, "-->");
    }
    if (in.number_at()) {
        return read_numeric(in);
    }
    if (in.ident_at()) {
        return read_ident_like(in);
    }

    in.take();
    if (c == '#' && (is_name_char(in.at()) || in.escape_at(0))) {
        return make(CSSToken::Hash, read_name(in));
    }
    if (c == '@' && in.ident_at()) {
        return make(CSSToken::AtKeyword, read_name(in));
    }
    return make(punctuation_type(c), std::string(1, c));
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;
    do {
        tokens.push_back(tokenizer.next_token());
    } while (tokens.back().type != CSSToken::EndOfFile);
    return tokens;
}

} // namespace loom::css
