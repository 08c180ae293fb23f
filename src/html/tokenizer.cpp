#include <loom/html/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace loom::html {

const char* token_type_name(Token::Type type) {
    switch (type) {
        case Token::DOCTYPE:   return "DOCTYPE";
        case Token::StartTag:  return "StartTag";
        case Token::EndTag:    return "EndTag";
        case Token::Text:      return "Text";
        case Token::Comment:   return "Comment";
        case Token::EndOfFile: return "EndOfFile";
    }
    return "unknown";
}

Tokenizer::Tokenizer(std::string_view input, core::DiagnosticScope diagnostics)
    : input_(input), diagnostics_(std::move(diagnostics)) {}

void Tokenizer::parse_error(const std::string& message) {
    ++parse_errors_;
    diagnostics_.warning("html.tokenizer", message + " at offset " + std::to_string(pos_));
}

static void append_utf8(std::string& out, unsigned long codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string Tokenizer::decode_character_reference() {
    size_t start = pos_;

    if (exhausted()) return "&";

    // Numeric character reference: &#NN; or &#xHH;
    if (current() == '#') {
        advance();
        bool hex = false;
        if (current() == 'x' || current() == 'X') {
            hex = true;
            advance();
        }

        std::string digits;
        while (!exhausted() && (hex ? std::isxdigit(static_cast<unsigned char>(current()))
                                 : std::isdigit(static_cast<unsigned char>(current())))) {
            digits += advance();
        }

        if (digits.empty() || digits.size() > 8) {
            pos_ = start;
            parse_error("malformed numeric character reference");
            return "&";
        }

        if (current() == ';') {
            advance();
        } else {
            parse_error("numeric character reference without ';'");
        }

        unsigned long codepoint = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
        if (codepoint == 0 || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return "\xEF\xBF\xBD";
        }

        std::string result;
        append_utf8(result, codepoint);
        return result;
    }

    std::string name;
    while (!exhausted() && std::isalnum(static_cast<unsigned char>(current())) && name.size() < 32) {
        name += advance();
    }
    bool has_semicolon = false;
    if (!name.empty() && current() == ';') {
        advance();
        has_semicolon = true;
    }

    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},

        {"nbsp", "\xC2\xA0"},   {"iexcl", "\xC2\xA1"}, {"cent", "\xC2\xA2"},
        {"pound", "\xC2\xA3"},  {"yen", "\xC2\xA5"},   {"sect", "\xC2\xA7"},
        {"copy", "\xC2\xA9"},   {"laquo", "\xC2\xAB"}, {"reg", "\xC2\xAE"},
        {"deg", "\xC2\xB0"},    {"plusmn", "\xC2\xB1"}, {"micro", "\xC2\xB5"},
        {"para", "\xC2\xB6"},   {"middot", "\xC2\xB7"}, {"raquo", "\xC2\xBB"},
        {"frac12", "\xC2\xBD"}, {"iquest", "\xC2\xBF"}, {"times", "\xC3\x97"},
        {"divide", "\xC3\xB7"},

        {"Agrave", "\xC3\x80"}, {"Aacute", "\xC3\x81"}, {"Auml", "\xC3\x84"},
        {"Ccedil", "\xC3\x87"}, {"Eacute", "\xC3\x89"}, {"Ntilde", "\xC3\x91"},
        {"Ouml", "\xC3\x96"},   {"Uuml", "\xC3\x9C"},   {"szlig", "\xC3\x9F"},
        {"agrave", "\xC3\xA0"}, {"aacute", "\xC3\xA1"}, {"auml", "\xC3\xA4"},
        {"ccedil", "\xC3\xA7"}, {"egrave", "\xC3\xA8"}, {"eacute", "\xC3\xA9"},
        {"ntilde", "\xC3\xB1"}, {"ouml", "\xC3\xB6"},   {"uuml", "\xC3\xBC"},

        {"ensp", "\xE2\x80\x82"},  {"emsp", "\xE2\x80\x83"},  {"thinsp", "\xE2\x80\x89"},
        {"zwnj", "\xE2\x80\x8C"},  {"zwj", "\xE2\x80\x8D"},   {"ndash", "\xE2\x80\x93"},
        {"mdash", "\xE2\x80\x94"}, {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"}, {"bull", "\xE2\x80\xA2"},
        {"hellip", "\xE2\x80\xA6"}, {"prime", "\xE2\x80\xB2"}, {"euro", "\xE2\x82\xAC"},
        {"trade", "\xE2\x84\xA2"}, {"larr", "\xE2\x86\x90"},  {"uarr", "\xE2\x86\x91"},
        {"rarr", "\xE2\x86\x92"},  {"darr", "\xE2\x86\x93"},  {"harr", "\xE2\x86\x94"},
        {"minus", "\xE2\x88\x92"}, {"infin", "\xE2\x88\x9E"}, {"ne", "\xE2\x89\xA0"},
        {"le", "\xE2\x89\xA4"},    {"ge", "\xE2\x89\xA5"},

        {"alpha", "\xCE\xB1"}, {"beta", "\xCE\xB2"}, {"gamma", "\xCE\xB3"},
        {"delta", "\xCE\xB4"}, {"pi", "\xCF\x80"},   {"sigma", "\xCF\x83"},
        {"omega", "\xCF\x89"},
    };

    auto it = entities.find(name);
    if (it != entities.end()) {
        // Without ';' only the XML entities resolve, so query strings such as
        // "&lang=en" survive untouched.
        if (has_semicolon ||
            name == "amp" || name == "lt" || name == "gt" ||
            name == "quot" || name == "apos") {
            return it->second;
        }
    }

    pos_ = start;
    return "&";
}

// Tokens are handed out one at a time; buffered text always goes first.

Token Tokenizer::emit(Token token) {
    if (text_.empty()) {
        return token;
    }
    pending_ = std::move(token);
    Token text;
    text.type = Token::Text;
    text.data = std::move(text_);
    text_.clear();
    return text;
}

Token Tokenizer::emit_tag() {
    state_ = LexState::Data;
    Token& tag = tag_;

    // First occurrence of an attribute name wins.
    std::vector<Attribute> unique;
    unique.reserve(tag.attributes.size());
    for (auto& attr : tag.attributes) {
        bool seen = std::any_of(unique.begin(), unique.end(),
            [&](const Attribute& a) { return a.name == attr.name; });
        if (seen) {
            parse_error("duplicate attribute '" + attr.name + "' on <" + tag.name + ">");
            continue;
        }
        unique.push_back(std::move(attr));
    }
    tag.attributes = std::move(unique);

    if (tag.type == Token::EndTag) {
        if (!tag.attributes.empty()) {
            parse_error("end tag </" + tag.name + "> carries attributes");
            tag.attributes.clear();
        }
        tag.self_closing = false;
    } else if (tag.type == Token::StartTag) {
        if (!tag.self_closing && (tag.name == "script" || tag.name == "style")) {
            state_ = LexState::RAWTEXT;
            open_raw_tag_ = tag.name;
        }
    }

    return emit(std::move(tag_));
}

Token Tokenizer::emit_tag_at_eof() {
    parse_error("unterminated <" + tag_.name + "> tag at end of input");
    return emit_tag();
}

Token Tokenizer::finish() {
    Token t;
    t.type = Token::EndOfFile;
    return emit(std::move(t));
}

static char to_lower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

static bool is_space(char c) {
    return c == '\t' || c == '\n' || c == '\f' || c == ' ' || c == '\r';
}

std::vector<Token> Tokenizer::tokenize_all() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().type == Token::EndOfFile) break;
    }
    return tokens;
}

Token Tokenizer::next_token() {
    if (pending_) {
        Token t = std::move(*pending_);
        pending_.reset();
        return t;
    }

    while (true) {
        switch (state_) {

        // Data
        case LexState::Data: {
            if (exhausted()) return finish();
            char c = advance();
            if (c == '<') {
                state_ = LexState::TagOpen;
                continue;
            }
            if (c == '&') {
                text_ += decode_character_reference();
                continue;
            }
            text_ += c;
            continue;
        }

        // Tag Open
        case LexState::TagOpen: {
            if (exhausted()) {
                text_ += '<';
                state_ = LexState::Data;
                continue;
            }
            char c = advance();
            if (c == '!') {
                state_ = LexState::MarkupDeclarationOpen;
                continue;
            }
            if (c == '/') {
                state_ = LexState::EndTagOpen;
                continue;
            }
            if (std::isalpha(static_cast<unsigned char>(c))) {
                tag_ = Token{};
                tag_.type = Token::StartTag;
                step_back();
                state_ = LexState::TagName;
                continue;
            }
            if (c == '?') {
                parse_error("processing instruction treated as comment");
                tag_ = Token{};
                tag_.type = Token::Comment;
                step_back();
                state_ = LexState::BogusComment;
                continue;
            }
            // A '<' not followed by a tag name is text.
            text_ += '<';
            step_back();
            state_ = LexState::Data;
            continue;
        }

        // End Tag Open
        case LexState::EndTagOpen: {
            if (exhausted()) {
                text_ += "</";
                state_ = LexState::Data;
                continue;
            }
            char c = advance();
            if (std::isalpha(static_cast<unsigned char>(c))) {
                tag_ = Token{};
                tag_.type = Token::EndTag;
                step_back();
                state_ = LexState::TagName;
                continue;
            }
            if (c == '>') {
                parse_error("empty end tag '</>'");
                state_ = LexState::Data;
                continue;
            }
            parse_error("invalid end tag name");
            tag_ = Token{};
            tag_.type = Token::Comment;
            step_back();
            state_ = LexState::BogusComment;
            continue;
        }

        // Tag Name
        case LexState::TagName: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (is_space(c)) {
                state_ = LexState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = LexState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                return emit_tag();
            }
            tag_.name += to_lower(c);
            continue;
        }

        // Before Attribute Name
        case LexState::BeforeAttributeName: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (is_space(c)) {
                continue;
            }
            if (c == '/' || c == '>') {
                step_back();
                state_ = LexState::AfterAttributeName;
                continue;
            }
            Attribute attr;
            if (c == '=') {
                parse_error("attribute name starts with '='");
                attr.name = "=";
            } else {
                step_back();
            }
            tag_.attributes.push_back(std::move(attr));
            state_ = LexState::AttributeName;
            continue;
        }

        // Attribute Name
        case LexState::AttributeName: {
            if (exhausted()) {
                state_ = LexState::AfterAttributeName;
                continue;
            }
            char c = advance();
            if (is_space(c) || c == '/' || c == '>') {
                step_back();
                state_ = LexState::AfterAttributeName;
                continue;
            }
            if (c == '=') {
                state_ = LexState::BeforeAttributeValue;
                continue;
            }
            tag_.attributes.back().name += to_lower(c);
            continue;
        }

        // After Attribute Name
        case LexState::AfterAttributeName: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (is_space(c)) {
                continue;
            }
            if (c == '/') {
                state_ = LexState::SelfClosingStartTag;
                continue;
            }
            if (c == '=') {
                state_ = LexState::BeforeAttributeValue;
                continue;
            }
            if (c == '>') {
                return emit_tag();
            }
            tag_.attributes.push_back(Attribute{});
            step_back();
            state_ = LexState::AttributeName;
            continue;
        }

        // Before Attribute Value
        case LexState::BeforeAttributeValue: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (is_space(c)) {
                continue;
            }
            if (c == '"') {
                state_ = LexState::AttributeValueDoubleQuoted;
                continue;
            }
            if (c == '\'') {
                state_ = LexState::AttributeValueSingleQuoted;
                continue;
            }
            if (c == '>') {
                parse_error("missing attribute value");
                return emit_tag();
            }
            step_back();
            state_ = LexState::AttributeValueUnquoted;
            continue;
        }

        // Attribute Value (Double-Quoted)
        case LexState::AttributeValueDoubleQuoted: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (c == '"') {
                state_ = LexState::AfterAttributeValueQuoted;
                continue;
            }
            if (c == '&') {
                tag_.attributes.back().value += decode_character_reference();
                continue;
            }
            tag_.attributes.back().value += c;
            continue;
        }

        // Attribute Value (Single-Quoted)
        case LexState::AttributeValueSingleQuoted: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (c == '\'') {
                state_ = LexState::AfterAttributeValueQuoted;
                continue;
            }
            if (c == '&') {
                tag_.attributes.back().value += decode_character_reference();
                continue;
            }
            tag_.attributes.back().value += c;
            continue;
        }

        // Attribute Value (Unquoted)
        case LexState::AttributeValueUnquoted: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (is_space(c)) {
                state_ = LexState::BeforeAttributeName;
                continue;
            }
            if (c == '&') {
                tag_.attributes.back().value += decode_character_reference();
                continue;
            }
            if (c == '>') {
                return emit_tag();
            }
            tag_.attributes.back().value += c;
            continue;
        }

        // After Attribute Value (Quoted)
        case LexState::AfterAttributeValueQuoted: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (is_space(c)) {
                state_ = LexState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = LexState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                return emit_tag();
            }
            parse_error("missing whitespace between attributes");
            step_back();
            state_ = LexState::BeforeAttributeName;
            continue;
        }

        // Self-Closing Start Tag
        case LexState::SelfClosingStartTag: {
            if (exhausted()) return emit_tag_at_eof();
            char c = advance();
            if (c == '>') {
                tag_.self_closing = true;
                return emit_tag();
            }
            parse_error("unexpected '/' in tag");
            step_back();
            state_ = LexState::BeforeAttributeName;
            continue;
        }

        // Bogus Comment
        case LexState::BogusComment: {
            if (exhausted()) {
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '>') {
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            tag_.data += c;
            continue;
        }

        // Markup Declaration Open
        case LexState::MarkupDeclarationOpen: {
            if (pos_ + 1 < input_.size() && input_[pos_] == '-' && input_[pos_ + 1] == '-') {
                pos_ += 2;
                tag_ = Token{};
                tag_.type = Token::Comment;
                state_ = LexState::CommentStart;
                continue;
            }
            if (pos_ + 6 < input_.size()) {
                std::string next7;
                for (size_t i = 0; i < 7; ++i) {
                    next7 += static_cast<char>(std::toupper(
                        static_cast<unsigned char>(input_[pos_ + i])));
                }
                if (next7 == "DOCTYPE") {
                    pos_ += 7;
                    tag_ = Token{};
                    tag_.type = Token::DOCTYPE;
                    state_ = LexState::DOCTYPE;
                    continue;
                }
            }
            parse_error("bogus markup declaration");
            tag_ = Token{};
            tag_.type = Token::Comment;
            state_ = LexState::BogusComment;
            continue;
        }

        // Comment states
        case LexState::CommentStart: {
            if (exhausted()) {
                parse_error("unterminated comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '-') {
                state_ = LexState::CommentStartDash;
                continue;
            }
            if (c == '>') {
                parse_error("abrupt closing of empty comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            step_back();
            state_ = LexState::Comment;
            continue;
        }

        case LexState::CommentStartDash: {
            if (exhausted()) {
                parse_error("unterminated comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '-') {
                state_ = LexState::CommentEnd;
                continue;
            }
            if (c == '>') {
                parse_error("abrupt closing of empty comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            tag_.data += '-';
            step_back();
            state_ = LexState::Comment;
            continue;
        }

        case LexState::Comment: {
            if (exhausted()) {
                parse_error("unterminated comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '-') {
                state_ = LexState::CommentEndDash;
                continue;
            }
            tag_.data += c;
            continue;
        }

        case LexState::CommentEndDash: {
            if (exhausted()) {
                parse_error("unterminated comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '-') {
                state_ = LexState::CommentEnd;
                continue;
            }
            tag_.data += '-';
            step_back();
            state_ = LexState::Comment;
            continue;
        }

        case LexState::CommentEnd: {
            if (exhausted()) {
                parse_error("unterminated comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '>') {
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            if (c == '!') {
                state_ = LexState::CommentEndBang;
                continue;
            }
            if (c == '-') {
                tag_.data += '-';
                continue;
            }
            tag_.data += "--";
            step_back();
            state_ = LexState::Comment;
            continue;
        }

        case LexState::CommentEndBang: {
            if (exhausted()) {
                parse_error("unterminated comment");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (c == '-') {
                tag_.data += "--!";
                state_ = LexState::CommentEndDash;
                continue;
            }
            if (c == '>') {
                parse_error("comment closed by '--!>'");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            tag_.data += "--!";
            step_back();
            state_ = LexState::Comment;
            continue;
        }

        // DOCTYPE states
        case LexState::DOCTYPE: {
            if (exhausted()) {
                parse_error("unterminated DOCTYPE");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (!is_space(c)) {
                step_back();
            }
            state_ = LexState::BeforeDOCTYPEName;
            continue;
        }

        case LexState::BeforeDOCTYPEName: {
            if (exhausted()) {
                parse_error("unterminated DOCTYPE");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (is_space(c)) {
                continue;
            }
            if (c == '>') {
                parse_error("DOCTYPE without a name");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            tag_.name = std::string(1, to_lower(c));
            state_ = LexState::DOCTYPEName;
            continue;
        }

        case LexState::DOCTYPEName: {
            if (exhausted()) {
                parse_error("unterminated DOCTYPE");
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            char c = advance();
            if (is_space(c)) {
                state_ = LexState::AfterDOCTYPEName;
                continue;
            }
            if (c == '>') {
                state_ = LexState::Data;
                return emit(std::move(tag_));
            }
            tag_.name += to_lower(c);
            continue;
        }

        case LexState::AfterDOCTYPEName: {
            // PUBLIC/SYSTEM identifiers are skipped; the token only carries
            // the name.
            while (!exhausted()) {
                if (advance() == '>') {
                    state_ = LexState::Data;
                    return emit(std::move(tag_));
                }
            }
            parse_error("unterminated DOCTYPE");
            state_ = LexState::Data;
            return emit(std::move(tag_));
        }

        // RAWTEXT states
        case LexState::RAWTEXT: {
            if (exhausted()) {
                parse_error("unterminated <" + open_raw_tag_ + "> content");
                return finish();
            }
            char c = advance();
            if (c == '<') {
                state_ = LexState::RAWTEXTLessThanSign;
                continue;
            }
            text_ += c;
            continue;
        }

        case LexState::RAWTEXTLessThanSign: {
            if (!exhausted() && current() == '/') {
                advance();
                end_tag_buffer_.clear();
                state_ = LexState::RAWTEXTEndTagOpen;
                continue;
            }
            text_ += '<';
            state_ = LexState::RAWTEXT;
            continue;
        }

        case LexState::RAWTEXTEndTagOpen: {
            if (!exhausted() && std::isalpha(static_cast<unsigned char>(current()))) {
                tag_ = Token{};
                tag_.type = Token::EndTag;
                state_ = LexState::RAWTEXTEndTagName;
                continue;
            }
            text_ += "</";
            state_ = LexState::RAWTEXT;
            continue;
        }

        case LexState::RAWTEXTEndTagName: {
            if (exhausted()) {
                text_ += "</";
                text_ += end_tag_buffer_;
                state_ = LexState::RAWTEXT;
                continue;
            }
            char c = advance();
            if (is_space(c) && closes_raw_text()) {
                state_ = LexState::BeforeAttributeName;
                continue;
            }
            if (c == '/' && closes_raw_text()) {
                state_ = LexState::SelfClosingStartTag;
                continue;
            }
            if (c == '>' && closes_raw_text()) {
                return emit_tag();
            }
            if (std::isalpha(static_cast<unsigned char>(c))) {
                tag_.name += to_lower(c);
                end_tag_buffer_ += c;
                continue;
            }
            // Not the matching end tag: everything consumed so far is text.
            text_ += "</";
            text_ += end_tag_buffer_;
            step_back();
            state_ = LexState::RAWTEXT;
            continue;
        }

        } // switch
    }
}

} // namespace loom::html
