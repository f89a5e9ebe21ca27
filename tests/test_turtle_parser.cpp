/**
 * @file test_turtle_parser.cpp
 * @brief Unit tests for the Turtle / N-Triples reader
 */

#include <gtest/gtest.h>
#include "webid/rdf/turtle_parser.h"

using namespace webid;
using namespace webid::rdf;

namespace {
    const std::string kBase = "https://alice.example/profile/card";
    const std::string kCert = "http://www.w3.org/ns/auth/cert#";
    const std::string kFoaf = "http://xmlns.com/foaf/0.1/";
}

class TurtleParserTest : public ::testing::Test {
protected:
    Graph graph_;

    void parse(const std::string& ttl, const std::string& base = kBase) {
        TurtleParser parser(graph_, base);
        parser.parse(ttl);
    }

    /// Objects of (subject, predicate)
    std::vector<Term> objects(const Term& subject, const std::string& predicate) {
        Term p = Term::iri(predicate);
        std::vector<Term> out;
        for (const Triple* t : graph_.match(&subject, &p, nullptr)) {
            out.push_back(t->object);
        }
        return out;
    }

    size_t lineOfError(const std::string& ttl) {
        try {
            parse(ttl);
        } catch (const common::ParsingException& e) {
            return e.line();
        }
        return 0;
    }
};

// ============================================================================
// Directives and IRIs
// ============================================================================

TEST_F(TurtleParserTest, PrefixAndRelativeIris) {
    parse("@prefix foaf: <http://xmlns.com/foaf/0.1/> .\n"
          "<#me> foaf:name \"Alice\" .\n");

    auto names = objects(Term::iri(kBase + "#me"), kFoaf + "name");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], Term::literal("Alice"));
}

TEST_F(TurtleParserTest, SparqlStyleDirectivesAndBase) {
    parse("PREFIX foaf: <http://xmlns.com/foaf/0.1/>\n"
          "BASE <https://bob.example/dir/>\n"
          "<card#i> foaf:knows <../other#x> .\n");

    auto known = objects(Term::iri("https://bob.example/dir/card#i"), kFoaf + "knows");
    ASSERT_EQ(known.size(), 1u);
    EXPECT_EQ(known[0], Term::iri("https://bob.example/other#x"));
}

TEST_F(TurtleParserTest, EmptyPrefixAndTypeKeyword) {
    parse("@prefix : <http://example.org/ns#> .\n"
          ":alice a :Person .\n");

    auto types = objects(Term::iri("http://example.org/ns#alice"), vocab::RDF_TYPE);
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], Term::iri("http://example.org/ns#Person"));
}

TEST_F(TurtleParserTest, UndefinedPrefixIsError) {
    EXPECT_THROW(parse("<#me> foaf:name \"x\" ."), common::ParsingException);
}

// ============================================================================
// Predicate / object lists and blank nodes
// ============================================================================

TEST_F(TurtleParserTest, PredicateAndObjectLists) {
    parse("@prefix foaf: <http://xmlns.com/foaf/0.1/> .\n"
          "<#me> foaf:nick \"a\", \"b\" ;\n"
          "      foaf:name \"Alice\" ;\n"
          "      .\n");

    EXPECT_EQ(objects(Term::iri(kBase + "#me"), kFoaf + "nick").size(), 2u);
    EXPECT_EQ(objects(Term::iri(kBase + "#me"), kFoaf + "name").size(), 1u);
    EXPECT_EQ(graph_.size(), 3u);
}

TEST_F(TurtleParserTest, BlankNodePropertyListForKey) {
    parse("@prefix cert: <http://www.w3.org/ns/auth/cert#> .\n"
          "<#me> cert:key [ cert:modulus \"AB12\" ; cert:exponent 65537 ] .\n");

    auto keys = objects(Term::iri(kBase + "#me"), kCert + "key");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_TRUE(keys[0].isBlank());

    auto exponent = objects(keys[0], kCert + "exponent");
    ASSERT_EQ(exponent.size(), 1u);
    EXPECT_EQ(exponent[0].value, "65537");
    EXPECT_EQ(exponent[0].datatype, vocab::XSD_INTEGER);
}

TEST_F(TurtleParserTest, BlankNodeLabelsShareNodeWithinDocument) {
    parse("<#me> <http://www.w3.org/ns/auth/cert#key> _:k .\n"
          "_:k <http://www.w3.org/ns/auth/cert#modulus> \"CD\" .\n");

    auto keys = objects(Term::iri(kBase + "#me"), kCert + "key");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(objects(keys[0], kCert + "modulus").size(), 1u);
}

TEST_F(TurtleParserTest, StandaloneBlankNodeStatement) {
    parse("[ <http://xmlns.com/foaf/0.1/name> \"anon\" ] .");
    EXPECT_EQ(graph_.size(), 1u);
}

TEST_F(TurtleParserTest, Collection) {
    parse("<#me> <http://example.org/list> ( 1 2 ) .");

    auto heads = objects(Term::iri(kBase + "#me"), "http://example.org/list");
    ASSERT_EQ(heads.size(), 1u);
    auto first = objects(heads[0], vocab::RDF_FIRST);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].value, "1");
    // two first, two rest, one link
    EXPECT_EQ(graph_.size(), 5u);
}

TEST_F(TurtleParserTest, EmptyCollectionIsNil) {
    parse("<#me> <http://example.org/list> () .");
    auto heads = objects(Term::iri(kBase + "#me"), "http://example.org/list");
    ASSERT_EQ(heads.size(), 1u);
    EXPECT_EQ(heads[0], Term::iri(vocab::RDF_NIL));
}

// ============================================================================
// Literals
// ============================================================================

TEST_F(TurtleParserTest, LiteralForms) {
    parse("@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .\n"
          "<#s> <#hex> \"0aFF\"^^xsd:hexBinary ;\n"
          "     <#lang> \"bonjour\"@fr ;\n"
          "     <#dec> 1.5 ;\n"
          "     <#dbl> 1e3 ;\n"
          "     <#neg> -7 ;\n"
          "     <#bool> true ;\n"
          "     <#single> 'single' .\n");

    Term s = Term::iri(kBase + "#s");
    EXPECT_EQ(objects(s, kBase + "#hex")[0],
              Term::literal("0aFF", "http://www.w3.org/2001/XMLSchema#hexBinary"));
    EXPECT_EQ(objects(s, kBase + "#lang")[0], Term::literal("bonjour", "", "fr"));
    EXPECT_EQ(objects(s, kBase + "#dec")[0], Term::literal("1.5", vocab::XSD_DECIMAL));
    EXPECT_EQ(objects(s, kBase + "#dbl")[0], Term::literal("1e3", vocab::XSD_DOUBLE));
    EXPECT_EQ(objects(s, kBase + "#neg")[0], Term::literal("-7", vocab::XSD_INTEGER));
    EXPECT_EQ(objects(s, kBase + "#bool")[0], Term::literal("true", vocab::XSD_BOOLEAN));
    EXPECT_EQ(objects(s, kBase + "#single")[0], Term::literal("single"));
}

TEST_F(TurtleParserTest, EscapesAndLongStrings) {
    parse("<#s> <#p> \"tab\\there \\u00e9\" ;\n"
          "     <#q> \"\"\"line one\nline \"two\"\"\"\" .\n");

    Term s = Term::iri(kBase + "#s");
    EXPECT_EQ(objects(s, kBase + "#p")[0].value, "tab\there \xC3\xA9");
    EXPECT_EQ(objects(s, kBase + "#q")[0].value, "line one\nline \"two\"");
}

TEST_F(TurtleParserTest, IntegerFollowedByStatementDot) {
    parse("<#k> <http://www.w3.org/ns/auth/cert#exponent> 65537.");
    auto e = objects(Term::iri(kBase + "#k"), kCert + "exponent");
    ASSERT_EQ(e.size(), 1u);
    EXPECT_EQ(e[0].value, "65537");
}

// ============================================================================
// N-Triples, comments, duplicates
// ============================================================================

TEST_F(TurtleParserTest, NTriplesWithComments) {
    parse("# profile\n"
          "<https://a.example/#me> <http://xmlns.com/foaf/0.1/name> \"A\" . # trailing\n"
          "<https://a.example/#me> <http://xmlns.com/foaf/0.1/name> \"A\" .\n");
    EXPECT_EQ(graph_.size(), 1u);
}

TEST_F(TurtleParserTest, ByteOrderMarkSkipped) {
    parse("\xEF\xBB\xBF<#a> <#b> <#c> .");
    EXPECT_EQ(graph_.size(), 1u);
}

TEST_F(TurtleParserTest, EmptyDocument) {
    parse("  # nothing here\n");
    EXPECT_TRUE(graph_.empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(TurtleParserTest, ErrorsCarryLineNumber) {
    EXPECT_EQ(lineOfError("<#a> <#b> <#c> .\n<#a> <#b> .\n"), 2u);
    EXPECT_EQ(lineOfError("<#a> <#b> \"unterminated\n\" ."), 1u);
}

TEST_F(TurtleParserTest, MalformedInputs) {
    EXPECT_THROW(parse("<#a> <#b> <#c>"), common::ParsingException);
    EXPECT_THROW(parse("\"lit\" <#b> <#c> ."), common::ParsingException);
    EXPECT_THROW(parse("<#a b> <#b> <#c> ."), common::ParsingException);
    EXPECT_THROW(parse("@foo <x> ."), common::ParsingException);
    EXPECT_THROW(parse("<!DOCTYPE html><html></html>"), common::ParsingException);
}

TEST_F(TurtleParserTest, NestingWithinLimitParses) {
    const size_t depth = TurtleParser::kMaxNesting;
    std::string ttl = "<#me> <#p> ";
    for (size_t i = 0; i < depth - 1; ++i) {
        ttl += "[ <#p> ";
    }
    ttl += "( 1 )";
    ttl += std::string(depth - 1, ']');
    ttl += " .";

    ASSERT_NO_THROW(parse(ttl));
    EXPECT_FALSE(graph_.empty());
}

TEST_F(TurtleParserTest, DeepNestingRejected) {
    std::string ttl = "<#me> <#p> ";
    for (size_t i = 0; i < TurtleParser::kMaxNesting + 1; ++i) {
        ttl += "[ <#p> ";
    }
    ttl += "1";
    ttl += std::string(TurtleParser::kMaxNesting + 1, ']');
    ttl += " .";

    try {
        parse(ttl);
        FAIL() << "expected ParsingException";
    } catch (const common::ParsingException& e) {
        EXPECT_NE(std::string(e.what()).find("nesting too deep"), std::string::npos);
    }
}

TEST_F(TurtleParserTest, DeepCollectionNestingRejected) {
    const size_t depth = 100000;
    std::string ttl = "<#me> <#p> " + std::string(depth, '(') + " 1 " + std::string(depth, ')') + " .";
    EXPECT_THROW(parse(ttl), common::ParsingException);
}
