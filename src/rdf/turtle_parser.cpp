/**
 * @file turtle_parser.cpp
 * @brief Turtle / N-Triples reader implementation
 */

#include "webid/rdf/turtle_parser.h"
#include "webid/rdf/iri.h"
#include <cctype>

namespace webid::rdf {

namespace {
    /// Tracks '[' and '(' nesting for the lifetime of one production
    class NestingGuard {
    public:
        explicit NestingGuard(size_t& depth) : depth_(depth) { ++depth_; }
        ~NestingGuard() { --depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        size_t& depth_;
    };

    bool isNameStartChar(unsigned char c) {
        return std::isalpha(c) || c == '_' || c >= 0x80;
    }

    bool isNameChar(unsigned char c) {
        return isNameStartChar(c) || std::isdigit(c) || c == '-';
    }

    void appendUtf8(std::string& out, unsigned long cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

TurtleParser::TurtleParser(Graph& graph, const std::string& baseUri)
    : graph_(graph), base_(baseUri) {}

void TurtleParser::parse(const std::string& document) {
    input_ = &document;
    pos_ = 0;
    line_ = 1;

    // UTF-8 byte order mark
    if (document.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        pos_ = 3;
    }

    skipWhitespace();
    while (!atEnd()) {
        parseStatement();
        skipWhitespace();
    }
    input_ = nullptr;
}

// --- Lexical helpers ---

bool TurtleParser::atEnd() const {
    return pos_ >= input_->size();
}

char TurtleParser::peek(size_t offset) const {
    size_t index = pos_ + offset;
    return index < input_->size() ? (*input_)[index] : '\0';
}

char TurtleParser::get() {
    if (atEnd()) {
        return '\0';
    }
    char c = (*input_)[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void TurtleParser::skipWhitespace() {
    while (!atEnd()) {
        char c = peek();
        if (c == '#') {
            while (!atEnd() && peek() != '\n') {
                get();
            }
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            get();
        } else {
            break;
        }
    }
}

bool TurtleParser::consumeIf(char c) {
    skipWhitespace();
    if (!atEnd() && peek() == c) {
        get();
        return true;
    }
    return false;
}

void TurtleParser::expect(char c) {
    if (!consumeIf(c)) {
        if (atEnd()) {
            throw error(std::string("expected '") + c + "' but reached end of document");
        }
        throw error(std::string("expected '") + c + "' but found '" + peek() + "'");
    }
}

bool TurtleParser::matchKeyword(const std::string& keyword, bool caseInsensitive) {
    if (input_->size() - pos_ < keyword.size()) {
        return false;
    }
    for (size_t i = 0; i < keyword.size(); ++i) {
        char actual = (*input_)[pos_ + i];
        char wanted = keyword[i];
        if (caseInsensitive) {
            actual = static_cast<char>(std::tolower(static_cast<unsigned char>(actual)));
            wanted = static_cast<char>(std::tolower(static_cast<unsigned char>(wanted)));
        }
        if (actual != wanted) {
            return false;
        }
    }
    unsigned char next = static_cast<unsigned char>(peek(keyword.size()));
    if (isNameChar(next) || next == ':') {
        return false;
    }
    pos_ += keyword.size();
    return true;
}

common::ParsingException TurtleParser::error(const std::string& message) const {
    return common::ParsingException(message, line_);
}

// --- Grammar productions ---

void TurtleParser::parseStatement() {
    skipWhitespace();

    if (peek() == '@') {
        if (matchKeyword("@prefix", false)) {
            parsePrefixDirective(false);
            return;
        }
        if (matchKeyword("@base", false)) {
            parseBaseDirective(false);
            return;
        }
        throw error("unknown directive");
    }
    if (matchKeyword("PREFIX", true)) {
        parsePrefixDirective(true);
        return;
    }
    if (matchKeyword("BASE", true)) {
        parseBaseDirective(true);
        return;
    }

    parseTriples();
    expect('.');
}

void TurtleParser::parsePrefixDirective(bool sparqlStyle) {
    skipWhitespace();
    std::string prefix = readPrefixName();
    skipWhitespace();
    prefixes_[prefix] = readIriRef();
    if (!sparqlStyle) {
        expect('.');
    }
}

void TurtleParser::parseBaseDirective(bool sparqlStyle) {
    skipWhitespace();
    base_ = readIriRef();
    if (!sparqlStyle) {
        expect('.');
    }
}

void TurtleParser::parseTriples() {
    skipWhitespace();

    if (peek() == '[') {
        Term subject = parseBlankNodePropertyList();
        skipWhitespace();
        // "[ ... ] ." is a complete statement on its own
        if (peek() != '.') {
            parsePredicateObjectList(subject);
        }
        return;
    }

    Term subject = parseSubject();
    parsePredicateObjectList(subject);
}

void TurtleParser::parsePredicateObjectList(const Term& subject) {
    Term predicate = parsePredicate();
    parseObjectList(subject, predicate);

    while (consumeIf(';')) {
        skipWhitespace();
        char c = peek();
        if (atEnd() || c == '.' || c == ']' || c == ';') {
            continue;
        }
        Term next = parsePredicate();
        parseObjectList(subject, next);
    }
}

void TurtleParser::parseObjectList(const Term& subject, const Term& predicate) {
    do {
        Term object = parseObject();
        graph_.add(subject, predicate, object);
    } while (consumeIf(','));
}

Term TurtleParser::parseSubject() {
    skipWhitespace();
    char c = peek();

    if (c == '_' && peek(1) == ':') {
        return parseBlankNodeLabel();
    }
    if (c == '(') {
        return parseCollection();
    }
    if (c == '"' || c == '\'' || std::isdigit(static_cast<unsigned char>(c))) {
        throw error("literal not allowed in subject position");
    }
    return parseIriOrPrefixedName();
}

Term TurtleParser::parsePredicate() {
    skipWhitespace();
    if (matchKeyword("a", false)) {
        return Term::iri(vocab::RDF_TYPE);
    }
    if (atEnd()) {
        throw error("expected predicate but reached end of document");
    }
    return parseIriOrPrefixedName();
}

Term TurtleParser::parseObject() {
    skipWhitespace();
    if (atEnd()) {
        throw error("expected object but reached end of document");
    }

    char c = peek();
    if (c == '<') {
        return Term::iri(readIriRef());
    }
    if (c == '_' && peek(1) == ':') {
        return parseBlankNodeLabel();
    }
    if (c == '[') {
        return parseBlankNodePropertyList();
    }
    if (c == '(') {
        return parseCollection();
    }
    if (c == '"' || c == '\'') {
        return parseLiteral();
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
        return parseNumericLiteral();
    }
    if (matchKeyword("true", false)) {
        return Term::literal("true", vocab::XSD_BOOLEAN);
    }
    if (matchKeyword("false", false)) {
        return Term::literal("false", vocab::XSD_BOOLEAN);
    }
    return parseIriOrPrefixedName();
}

Term TurtleParser::parseBlankNodePropertyList() {
    NestingGuard guard(depth_);
    if (depth_ > kMaxNesting) {
        throw error("nesting too deep");
    }
    expect('[');
    Term node = graph_.newBlankNode();

    skipWhitespace();
    if (peek() == ']') {
        get();
        return node;
    }

    parsePredicateObjectList(node);
    expect(']');
    return node;
}

Term TurtleParser::parseCollection() {
    NestingGuard guard(depth_);
    if (depth_ > kMaxNesting) {
        throw error("nesting too deep");
    }
    expect('(');

    std::vector<Term> items;
    skipWhitespace();
    while (peek() != ')') {
        if (atEnd()) {
            throw error("unterminated collection");
        }
        items.push_back(parseObject());
        skipWhitespace();
    }
    get();

    if (items.empty()) {
        return Term::iri(vocab::RDF_NIL);
    }

    const Term first = Term::iri(vocab::RDF_FIRST);
    const Term rest = Term::iri(vocab::RDF_REST);
    Term head = graph_.newBlankNode();
    Term current = head;
    for (size_t i = 0; i < items.size(); ++i) {
        graph_.add(current, first, items[i]);
        if (i + 1 == items.size()) {
            graph_.add(current, rest, Term::iri(vocab::RDF_NIL));
        } else {
            Term next = graph_.newBlankNode();
            graph_.add(current, rest, next);
            current = next;
        }
    }
    return head;
}

Term TurtleParser::parseIriOrPrefixedName() {
    skipWhitespace();
    if (peek() == '<') {
        return Term::iri(readIriRef());
    }

    unsigned char c = static_cast<unsigned char>(peek());
    if (!isNameStartChar(c) && c != ':') {
        throw error(std::string("unexpected character '") + peek() + "'");
    }

    std::string prefix = readPrefixName();
    std::string local = readLocalName();

    auto it = prefixes_.find(prefix);
    if (it == prefixes_.end()) {
        throw error("undefined prefix '" + prefix + ":'");
    }
    return Term::iri(it->second + local);
}

Term TurtleParser::parseBlankNodeLabel() {
    get();  // '_'
    get();  // ':'

    std::string label;
    size_t trailingDots = 0;
    while (!atEnd()) {
        unsigned char c = static_cast<unsigned char>(peek());
        if (isNameChar(c)) {
            trailingDots = 0;
        } else if (c == '.') {
            ++trailingDots;
        } else {
            break;
        }
        label += static_cast<char>(get());
    }
    pos_ -= trailingDots;
    label.resize(label.size() - trailingDots);

    if (label.empty()) {
        throw error("empty blank node label");
    }
    return blankFor(label);
}

Term TurtleParser::parseLiteral() {
    std::string lexical = readString();

    if (peek() == '@') {
        get();
        std::string language;
        while (!atEnd()) {
            unsigned char c = static_cast<unsigned char>(peek());
            if (!std::isalnum(c) && c != '-') {
                break;
            }
            language += static_cast<char>(get());
        }
        if (language.empty()) {
            throw error("empty language tag");
        }
        return Term::literal(lexical, "", language);
    }

    if (peek() == '^' && peek(1) == '^') {
        get();
        get();
        Term datatype = parseIriOrPrefixedName();
        return Term::literal(lexical, datatype.value);
    }

    return Term::literal(lexical);
}

Term TurtleParser::parseNumericLiteral() {
    std::string lexical;
    bool hasDigits = false;
    bool isDecimal = false;
    bool isDouble = false;

    if (peek() == '+' || peek() == '-') {
        lexical += get();
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        lexical += get();
        hasDigits = true;
    }
    // A '.' without a following digit ends the statement
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        isDecimal = true;
        lexical += get();
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            lexical += get();
            hasDigits = true;
        }
    }
    if (hasDigits && (peek() == 'e' || peek() == 'E')) {
        isDouble = true;
        lexical += get();
        if (peek() == '+' || peek() == '-') {
            lexical += get();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw error("malformed exponent in numeric literal");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            lexical += get();
        }
    }

    if (!hasDigits) {
        throw error("malformed numeric literal '" + lexical + "'");
    }

    if (isDouble) return Term::literal(lexical, vocab::XSD_DOUBLE);
    if (isDecimal) return Term::literal(lexical, vocab::XSD_DECIMAL);
    return Term::literal(lexical, vocab::XSD_INTEGER);
}

// --- Token readers ---

std::string TurtleParser::readIriRef() {
    if (peek() != '<') {
        throw error("expected IRI");
    }
    get();

    std::string raw;
    while (true) {
        if (atEnd()) {
            throw error("unterminated IRI");
        }
        char c = get();
        if (c == '>') {
            break;
        }
        if (c == '\\') {
            raw += readEscape(true);
        } else if (std::isspace(static_cast<unsigned char>(c)) || c == '<' || c == '"') {
            throw error("invalid character in IRI");
        } else {
            raw += c;
        }
    }
    return resolveIri(base_, raw);
}

std::string TurtleParser::readPrefixName() {
    std::string prefix;
    while (!atEnd()) {
        unsigned char c = static_cast<unsigned char>(peek());
        if (!isNameChar(c) && c != '.') {
            break;
        }
        prefix += static_cast<char>(get());
    }
    if (peek() != ':') {
        throw error("expected ':' after prefix '" + prefix + "'");
    }
    get();
    return prefix;
}

std::string TurtleParser::readLocalName() {
    static const std::string escapable = "_~.-!$&'()*+,;=/?#@%";

    std::string local;
    size_t trailingDots = 0;
    while (!atEnd()) {
        unsigned char c = static_cast<unsigned char>(peek());
        if (isNameChar(c) || c == ':') {
            local += static_cast<char>(get());
            trailingDots = 0;
        } else if (c == '.') {
            local += static_cast<char>(get());
            ++trailingDots;
        } else if (c == '%') {
            if (hexValue(peek(1)) < 0 || hexValue(peek(2)) < 0) {
                throw error("malformed percent escape in local name");
            }
            local += get();
            local += get();
            local += get();
            trailingDots = 0;
        } else if (c == '\\') {
            get();
            char escaped = get();
            if (escapable.find(escaped) == std::string::npos) {
                throw error(std::string("invalid escape '\\") + escaped + "' in local name");
            }
            local += escaped;
            trailingDots = 0;
        } else {
            break;
        }
    }
    // Trailing dots terminate the statement
    pos_ -= trailingDots;
    local.resize(local.size() - trailingDots);
    return local;
}

std::string TurtleParser::readString() {
    const char quote = get();
    const bool longForm = peek() == quote && peek(1) == quote;
    if (longForm) {
        get();
        get();
    }

    std::string value;
    while (true) {
        if (atEnd()) {
            throw error("unterminated string literal");
        }
        char c = peek();
        if (longForm) {
            if (c == quote && peek(1) == quote && peek(2) == quote) {
                // Up to two quotes may precede the closing delimiter
                if (peek(3) == quote) {
                    value += get();
                    continue;
                }
                get();
                get();
                get();
                break;
            }
        } else {
            if (c == quote) {
                get();
                break;
            }
            if (c == '\n' || c == '\r') {
                throw error("line break in short string literal");
            }
        }

        get();
        if (c == '\\') {
            value += readEscape(false);
        } else {
            value += c;
        }
    }
    return value;
}

std::string TurtleParser::readEscape(bool inIri) {
    char c = get();
    std::string out;

    if (c == 'u' || c == 'U') {
        int digits = (c == 'u') ? 4 : 8;
        unsigned long cp = 0;
        for (int i = 0; i < digits; ++i) {
            int v = hexValue(get());
            if (v < 0) {
                throw error("malformed unicode escape");
            }
            cp = cp * 16 + static_cast<unsigned long>(v);
        }
        if (cp > 0x10FFFF) {
            throw error("unicode escape out of range");
        }
        appendUtf8(out, cp);
        return out;
    }

    if (inIri) {
        throw error(std::string("invalid escape '\\") + c + "' in IRI");
    }

    switch (c) {
        case 't':  return "\t";
        case 'b':  return "\b";
        case 'n':  return "\n";
        case 'r':  return "\r";
        case 'f':  return "\f";
        case '"':  return "\"";
        case '\'': return "'";
        case '\\': return "\\";
        default:
            throw error(std::string("invalid escape '\\") + c + "' in string");
    }
}

Term TurtleParser::blankFor(const std::string& label) {
    auto it = blankLabels_.find(label);
    if (it != blankLabels_.end()) {
        return it->second;
    }
    Term node = graph_.newBlankNode();
    blankLabels_.emplace(label, node);
    return node;
}

} // namespace webid::rdf
