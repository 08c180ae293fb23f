#include <loom/css/parser/selector.h>
#include <loom/css/parser/tokenizer.h>

#include <cctype>
#include <tuple>

namespace loom::css {

bool Specificity::operator<(const Specificity& other) const {
    return std::tie(ids, classes, types) < std::tie(other.ids, other.classes, other.types);
}

bool Specificity::operator==(const Specificity& other) const {
    return std::tie(ids, classes, types) == std::tie(other.ids, other.classes, other.types);
}

Specificity specificity_of(const ComplexSelector& selector) {
    Specificity result;
    for (const auto& part : selector.parts) {
        for (const auto& simple : part.compound.components) {
            if (simple.kind == SelectorKind::Id) {
                ++result.ids;
            } else if (simple.kind == SelectorKind::Class) {
                ++result.classes;
            } else if (simple.kind == SelectorKind::Type) {
                ++result.types;
            }
        }
    }
    return result;
}

namespace {

std::string lowercase(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool is_delim(const CSSToken& token, const char* text) {
    return token.type == CSSToken::Delim && token.value == text;
}

// Recursive descent over the token stream. The first failure wins; later
// calls to fail() keep the original message.
class SelectorParser {
public:
    explicit SelectorParser(std::vector<CSSToken> tokens) : tokens_(std::move(tokens)) {}

    std::optional<SelectorList> parse_list();
    const std::string& error() const { return error_; }

private:
    const CSSToken& peek() const {
        static const CSSToken end{};
        return index_ < tokens_.size() ? tokens_[index_] : end;
    }
    bool done() const { return peek().type == CSSToken::EndOfFile; }
    void next() {
        if (index_ < tokens_.size()) ++index_;
    }
    bool eat_whitespace() {
        bool ate = false;
        while (!done() && peek().type == CSSToken::Whitespace) {
            next();
            ate = true;
        }
        return ate;
    }
    bool fail(const std::string& message) {
        if (error_.empty()) error_ = message;
        return false;
    }
    bool unexpected() {
        return fail("unexpected '" + serialize_token(peek()) + "' in selector");
    }

    bool complex(ComplexSelector& out);
    bool compound(CompoundSelector& out);
    bool simple(CompoundSelector& out, bool& progressed);

    std::vector<CSSToken> tokens_;
    std::size_t index_ = 0;
    std::string error_;
};

std::optional<SelectorList> SelectorParser::parse_list() {
    SelectorList list;
    for (;;) {
        eat_whitespace();
        ComplexSelector selector;
        if (!complex(selector)) return std::nullopt;
        list.selectors.push_back(std::move(selector));

        eat_whitespace();
        if (done()) return list;
        if (peek().type != CSSToken::Comma) {
            unexpected();
            return std::nullopt;
        }
        next();
    }
}

bool SelectorParser::complex(ComplexSelector& out) {
    out.parts.emplace_back();
    if (!compound(out.parts.back().compound)) return false;

    for (;;) {
        const bool spaced = eat_whitespace();
        if (done() || peek().type == CSSToken::Comma) return true;

        ComplexSelector::Part part;
        const CSSToken& token = peek();
        if (is_delim(token, ">")) {
            next();
            eat_whitespace();
            part.combinator = Combinator::Child;
        } else if (is_delim(token, "+") || is_delim(token, "~")) {
            return fail("sibling combinator '" + token.value + "' is not supported");
        } else if (spaced) {
            part.combinator = Combinator::Descendant;
        } else {
            return unexpected();
        }

        if (!compound(part.compound)) return false;
        out.parts.push_back(std::move(part));
    }
}

bool SelectorParser::compound(CompoundSelector& out) {
    bool progressed = true;
    while (progressed && !done()) {
        if (!simple(out, progressed)) return false;
    }
    if (!out.components.empty()) return true;
    return done() ? fail("empty selector") : unexpected();
}

// Consumes one simple selector if the next token starts one. Sets
// `progressed` to false when it does not.
bool SelectorParser::simple(CompoundSelector& out, bool& progressed) {
    const CSSToken& token = peek();
    progressed = true;

    if (token.type == CSSToken::Ident || is_delim(token, "*")) {
        const bool universal = token.type != CSSToken::Ident;
        if (!out.components.empty()) {
            return fail(universal ? "'*' must come first in a compound selector"
                                  : "type selector must come first in a compound selector");
        }
        out.components.push_back({universal ? SelectorKind::Universal : SelectorKind::Type,
                                  universal ? std::string("*") : lowercase(token.value)});
        next();
        return true;
    }
    if (is_delim(token, ".")) {
        next();
        if (peek().type != CSSToken::Ident) return fail("expected class name after '.'");
        out.components.push_back({SelectorKind::Class, peek().value});
        next();
        return true;
    }
    if (token.type == CSSToken::Hash) {
        out.components.push_back({SelectorKind::Id, token.value});
        next();
        return true;
    }
    if (token.type == CSSToken::Colon) return fail("pseudo-classes are not supported");
    if (token.type == CSSToken::LeftBracket) return fail("attribute selectors are not supported");

    progressed = false;
    return true;
}

} // namespace

std::optional<SelectorList> parse_selector_list(std::string_view input, std::string* error) {
    SelectorParser parser(CSSTokenizer::tokenize_all(input));
    std::optional<SelectorList> list = parser.parse_list();
    if (!list && error) *error = parser.error();
    return list;
}

std::string selector_to_string(const ComplexSelector& selector) {
    std::string text;
    for (const auto& part : selector.parts) {
        if (part.combinator == Combinator::Child) {
            text += " > ";
        } else if (part.combinator == Combinator::Descendant) {
            text += ' ';
        }
        for (const auto& simple : part.compound.components) {
            if (simple.kind == SelectorKind::Class) {
                text += '.';
            } else if (simple.kind == SelectorKind::Id) {
                text += '#';
            }
            text += simple.value;
        }
    }
    return text;
}

} // namespace loom::css
