/**
 * @file sparql_query.cpp
 * @brief SPARQL subset parser
 */

#include "webid/rdf/sparql_query.h"
#include "webid/common/exceptions.h"
#include "webid/utils/string_utils.h"
#include <cctype>

namespace webid::rdf {

/**
 * @brief Single-use cursor over the query text
 */
class SparqlParser {
public:
    explicit SparqlParser(const std::string& text) : text_(text) {}

    SelectQuery run() {
        SelectQuery query;

        skipSpace();
        while (matchKeyword("PREFIX")) {
            skipSpace();
            std::string prefix = readPrefixLabel();
            skipSpace();
            query.prefixes_[prefix] = readIriRef();
            skipSpace();
        }

        if (!matchKeyword("SELECT")) {
            throw error("expected SELECT");
        }
        skipSpace();
        if (matchKeyword("DISTINCT")) {
            query.distinct_ = true;
            skipSpace();
        }

        if (peek() == '*') {
            ++pos_;
            query.selectAll_ = true;
        } else {
            while (peek() == '?' || peek() == '$') {
                query.variables_.push_back(readVariable());
                skipSpace();
            }
            if (query.variables_.empty()) {
                throw error("expected projection variables or '*'");
            }
        }
        skipSpace();

        matchKeyword("WHERE");
        skipSpace();
        expect('{');

        prefixes_ = &query.prefixes_;
        parsePatterns(query.patterns_);

        skipSpace();
        if (pos_ < text_.size()) {
            throw error("unexpected trailing input");
        }
        return query;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    const std::map<std::string, std::string>* prefixes_ = nullptr;

    common::ParsingException error(const std::string& message) const {
        return common::ParsingException("SPARQL: " + message + " at offset " + std::to_string(pos_));
    }

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    void skipSpace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '#') {
                while (pos_ < text_.size() && text_[pos_] != '\n') ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        if (peek() != c) {
            throw error(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool matchKeyword(const std::string& keyword) {
        if (pos_ + keyword.size() > text_.size()) {
            return false;
        }
        if (!utils::equalsIgnoreCase(text_.substr(pos_, keyword.size()), keyword)) {
            return false;
        }
        size_t end = pos_ + keyword.size();
        if (end < text_.size() &&
            (std::isalnum(static_cast<unsigned char>(text_[end])) || text_[end] == '_')) {
            return false;
        }
        pos_ = end;
        return true;
    }

    static bool isNameChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
               c == '.' || static_cast<unsigned char>(c) >= 0x80;
    }

    std::string readName() {
        size_t start = pos_;
        while (pos_ < text_.size() && isNameChar(text_[pos_])) ++pos_;
        // A trailing '.' ends the pattern, it is not part of the name
        while (pos_ > start && text_[pos_ - 1] == '.') --pos_;
        return text_.substr(start, pos_ - start);
    }

    std::string readPrefixLabel() {
        std::string prefix = readName();
        expect(':');
        return prefix;
    }

    std::string readIriRef() {
        expect('<');
        size_t end = text_.find('>', pos_);
        if (end == std::string::npos) {
            throw error("unterminated IRI");
        }
        std::string iri = text_.substr(pos_, end - pos_);
        for (char c : iri) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                throw error("whitespace in IRI");
            }
        }
        pos_ = end + 1;
        return iri;
    }

    std::string readVariable() {
        ++pos_;  // '?' or '$'
        std::string name = readName();
        if (name.empty()) {
            throw error("empty variable name");
        }
        return name;
    }

    std::string readQuoted() {
        char quote = text_[pos_++];
        std::string value;
        while (true) {
            if (pos_ >= text_.size()) {
                throw error("unterminated string");
            }
            char c = text_[pos_++];
            if (c == quote) break;
            if (c == '\\') {
                if (pos_ >= text_.size()) {
                    throw error("unterminated string");
                }
                char e = text_[pos_++];
                switch (e) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case '"': value += '"'; break;
                    case '\'': value += '\''; break;
                    case '\\': value += '\\'; break;
                    default: throw error(std::string("unknown escape '\\") + e + "'");
                }
            } else {
                value += c;
            }
        }
        return value;
    }

    std::string expandPrefixed(const std::string& prefix, const std::string& local) {
        auto it = prefixes_->find(prefix);
        if (it == prefixes_->end()) {
            throw error("undeclared prefix '" + prefix + ":'");
        }
        return it->second + local;
    }

    PatternTerm readTerm(bool predicatePosition) {
        skipSpace();
        char c = peek();

        if (c == '?' || c == '$') {
            return PatternTerm::var(readVariable());
        }
        if (c == '<') {
            return PatternTerm::constant(Term::iri(readIriRef()));
        }
        if (c == '"' || c == '\'') {
            if (predicatePosition) {
                throw error("literal in predicate position");
            }
            std::string lexical = readQuoted();
            if (peek() == '@') {
                ++pos_;
                std::string lang = readName();
                return PatternTerm::constant(Term::literal(lexical, "", lang));
            }
            if (text_.compare(pos_, 2, "^^") == 0) {
                pos_ += 2;
                std::string datatype;
                if (peek() == '<') {
                    datatype = readIriRef();
                } else {
                    std::string prefix = readPrefixLabel();
                    datatype = expandPrefixed(prefix, readName());
                }
                return PatternTerm::constant(Term::literal(lexical, datatype));
            }
            return PatternTerm::constant(Term::literal(lexical));
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+') {
            if (predicatePosition) {
                throw error("literal in predicate position");
            }
            size_t start = pos_++;
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
            std::string digits = text_.substr(start, pos_ - start);
            if (digits == "-" || digits == "+") {
                throw error("malformed number");
            }
            return PatternTerm::constant(Term::literal(digits, vocab::XSD_INTEGER));
        }

        std::string name = readName();
        if (peek() == ':') {
            ++pos_;
            std::string local = readName();
            return PatternTerm::constant(Term::iri(expandPrefixed(name, local)));
        }
        if (name == "a" && predicatePosition) {
            return PatternTerm::constant(Term::iri(vocab::RDF_TYPE));
        }
        if (name == "true" || name == "false") {
            return PatternTerm::constant(Term::literal(name, vocab::XSD_BOOLEAN));
        }
        throw error(name.empty() ? "unexpected character" : "unexpected token '" + name + "'");
    }

    void parsePatterns(std::vector<TriplePattern>& out) {
        while (true) {
            skipSpace();
            if (peek() == '}') {
                ++pos_;
                return;
            }
            if (pos_ >= text_.size()) {
                throw error("unterminated group pattern");
            }

            PatternTerm subject = readTerm(false);
            while (true) {
                PatternTerm predicate = readTerm(true);
                while (true) {
                    PatternTerm object = readTerm(false);
                    out.push_back(TriplePattern{subject, predicate, object});
                    skipSpace();
                    if (peek() != ',') break;
                    ++pos_;
                }
                if (peek() != ';') break;
                ++pos_;
                skipSpace();
                if (peek() == '.' || peek() == '}') break;
            }

            skipSpace();
            if (peek() == '.') {
                ++pos_;
            } else if (peek() != '}') {
                throw error("expected '.' or '}'");
            }
        }
    }
};

SelectQuery SelectQuery::parse(const std::string& text) {
    SparqlParser parser(text);
    return parser.run();
}

} // namespace webid::rdf
