#pragma once
#include <loom/core/diagnostics.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom::html {

struct Attribute {
    std::string name;
    std::string value;
};

struct Token {
    enum Type { DOCTYPE, StartTag, EndTag, Text, Comment, EndOfFile };
    Type type = EndOfFile;
    std::string name;
    std::vector<Attribute> attributes;  // source order, first duplicate wins
    bool self_closing = false;
    std::string data;  // For Text/Comment tokens
};

const char* token_type_name(Token::Type type);

// Lexer states, after the HTML tokenization states they are named for.
enum class LexState {
    Data, TagOpen, EndTagOpen, TagName,
    BeforeAttributeName, AttributeName, AfterAttributeName,
    BeforeAttributeValue, AttributeValueDoubleQuoted, AttributeValueSingleQuoted,
    AttributeValueUnquoted, AfterAttributeValueQuoted,
    SelfClosingStartTag, BogusComment,
    MarkupDeclarationOpen, CommentStart, CommentStartDash, Comment,
    CommentEndDash, CommentEnd, CommentEndBang,
    DOCTYPE, BeforeDOCTYPEName, DOCTYPEName, AfterDOCTYPEName,
    RAWTEXT, RAWTEXTLessThanSign, RAWTEXTEndTagOpen, RAWTEXTEndTagName
};

// Permissive HTML tokenizer. Never fails: every malformed construct is
// recovered and reported as a warning. Consecutive character data is batched
// into a single Text token. After a non self-closing <script> or <style>
// start tag the tokenizer switches itself to RAWTEXT until the matching end
// tag.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input,
                       core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "lex"));

    Token next_token();
    // Runs to EndOfFile; the returned list always ends with the EOF token.
    std::vector<Token> tokenize_all();

    LexState state() const { return state_; }
    size_t parse_error_count() const { return parse_errors_; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    LexState state_ = LexState::Data;
    std::string open_raw_tag_;
    Token tag_;
    std::string end_tag_buffer_;
    std::string text_;
    std::optional<Token> pending_;
    core::DiagnosticScope diagnostics_;
    size_t parse_errors_ = 0;

    char advance() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }
    char current() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    bool exhausted() const { return pos_ >= input_.size(); }
    void step_back() {
        if (pos_ > 0) --pos_;
    }
    // The end tag being read closes the raw text element that was opened.
    bool closes_raw_text() const { return !open_raw_tag_.empty() && tag_.name == open_raw_tag_; }
    void parse_error(const std::string& message);

    // Returns buffered text first when there is any and queues `token`.
    Token emit(Token token);
    Token emit_tag();
    Token emit_tag_at_eof();
    Token finish();

    // Called after '&'. Returns the decoded reference, or "&" when the input
    // does not start a known reference.
    std::string decode_character_reference();
};

} // namespace loom::html
