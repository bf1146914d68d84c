#include <catch2/catch.hpp>
#include "tex/tex_result.hpp"
#include "util/utf8.hpp"
#include <nlohmann/json.hpp>

using namespace mfnf::tex;
using json = nlohmann::json;

TEST_CASE("TexResult: Construction and equality", "[tex_result]") {
    SECTION("Payload kinds keep their text") {
        TexResult valid = TexResult::valid("x^{2}");
        REQUIRE(valid.kind() == TexResultKind::Valid);
        REQUIRE(valid.text() == "x^{2}");
        REQUIRE(valid.is_valid());

        TexResult unknown = TexResult::unknown_function("\\foo");
        REQUIRE(unknown.kind() == TexResultKind::UnknownFunction);
        REQUIRE(unknown.text() == "\\foo");
        REQUIRE_FALSE(unknown.is_valid());
    }

    SECTION("Equality compares kind and text") {
        REQUIRE(TexResult::valid("a") == TexResult::valid("a"));
        REQUIRE(TexResult::valid("a") != TexResult::valid("b"));
        REQUIRE(TexResult::valid("") != TexResult::unknown_function(""));
        REQUIRE(TexResult::syntax_error() != TexResult::lexing_error());
    }

    SECTION("Default result is an unknown error") {
        REQUIRE(TexResult() == TexResult::unknown_error());
    }
}

TEST_CASE("TexResult: Kind names", "[tex_result]") {
    REQUIRE(to_string(TexResultKind::Valid) == "valid");
    REQUIRE(to_string(TexResultKind::UnknownFunction) == "unknown_function");
    REQUIRE(parse_result_kind("syntax_error") == TexResultKind::SyntaxError);
    REQUIRE(parse_result_kind("lexing_error") == TexResultKind::LexingError);
    REQUIRE(parse_result_kind("unknown_error") == TexResultKind::UnknownError);
    REQUIRE_THROWS_AS(parse_result_kind("Ok"), TexResultParseError);
}

TEST_CASE("classify_checker_output: First byte selects the kind", "[tex_result][classify]") {
    REQUIRE(classify_checker_output("+\\frac{1}{2}") == TexResult::valid("\\frac{1}{2}"));
    REQUIRE(classify_checker_output("+") == TexResult::valid(""));
    REQUIRE(classify_checker_output("F\\mathbbm") == TexResult::unknown_function("\\mathbbm"));
    REQUIRE(classify_checker_output("S") == TexResult::syntax_error());
    REQUIRE(classify_checker_output("E") == TexResult::lexing_error());
    REQUIRE(classify_checker_output("X") == TexResult::unknown_error());
    REQUIRE(classify_checker_output("") == TexResult::unknown_error());
}

TEST_CASE("classify_checker_output: Payload of discarding kinds is dropped", "[tex_result][classify]") {
    REQUIRE(classify_checker_output("Sline 3") == TexResult::syntax_error());
    REQUIRE(classify_checker_output("Eunexpected '#'") == TexResult::lexing_error());
    REQUIRE(classify_checker_output("?garbage") == TexResult::unknown_error());
}

TEST_CASE("classify_checker_output: Payload must be UTF-8", "[tex_result][classify]") {
    REQUIRE(classify_checker_output("+\xC3\xA4") == TexResult::valid("\xC3\xA4"));
    REQUIRE_THROWS_AS(classify_checker_output("+\xFF"), CorruptedCheckerOutputError);
    REQUIRE_THROWS_AS(classify_checker_output("S\xC3"), CorruptedCheckerOutputError);

    // The selector byte itself is not part of the payload
    REQUIRE(classify_checker_output("\xFF") == TexResult::unknown_error());
}

TEST_CASE("TexResult: JSON conversion", "[tex_result][json]") {
    SECTION("Payload is written only when present") {
        json j = TexResult::valid("a+b");
        REQUIRE(j["kind"] == "valid");
        REQUIRE(j["text"] == "a+b");

        json k = TexResult::syntax_error();
        REQUIRE(k["kind"] == "syntax_error");
        REQUIRE_FALSE(k.contains("text"));
    }

    SECTION("Results read back from JSON") {
        auto result = json::parse(R"({"kind": "unknown_function", "text": "\\foo"})").get<TexResult>();
        REQUIRE(result == TexResult::unknown_function("\\foo"));

        auto plain = json::parse(R"({"kind": "lexing_error"})").get<TexResult>();
        REQUIRE(plain == TexResult::lexing_error());
    }

    SECTION("Malformed results are rejected") {
        REQUIRE_THROWS_AS(json::parse(R"({"kind": "fine"})").get<TexResult>(), TexResultParseError);
        REQUIRE_THROWS_AS(json::parse(R"({"text": "x"})").get<TexResult>(), TexResultParseError);
        REQUIRE_THROWS_AS(json::parse(R"({"kind": "valid", "text": 3})").get<TexResult>(),
                          TexResultParseError);
    }
}

TEST_CASE("format_result_line: Report lines", "[tex_result][json]") {
    SECTION("Source and result are written as one object") {
        json line = json::parse(format_result_line("x^2", TexResult::valid("x^2")));
        REQUIRE(line["source"] == "x^2");
        REQUIRE(line["result"]["kind"] == "valid");
        REQUIRE(line["result"]["text"] == "x^2");
    }

    SECTION("Invalid UTF-8 in the source is replaced") {
        std::string text;
        REQUIRE_NOTHROW(text = format_result_line("a\xFF" "b", TexResult::syntax_error()));
        REQUIRE(text.find('\n') == std::string::npos);

        json line = json::parse(text);
        REQUIRE(line["source"] == "a\xEF\xBF\xBD" "b");
        REQUIRE(line["result"]["kind"] == "syntax_error");
    }
}

TEST_CASE("is_valid_utf8: Well-formedness", "[utf8]") {
    REQUIRE(mfnf::is_valid_utf8(""));
    REQUIRE(mfnf::is_valid_utf8("plain ascii"));
    REQUIRE(mfnf::is_valid_utf8("\xC3\xA4\xE2\x82\xAC\xF0\x9F\x98\x80"));  // ä € 😀

    REQUIRE_FALSE(mfnf::is_valid_utf8("\x80"));              // stray continuation
    REQUIRE_FALSE(mfnf::is_valid_utf8("\xC0\xAF"));          // overlong '/'
    REQUIRE_FALSE(mfnf::is_valid_utf8("\xE0\x80\xAF"));      // overlong
    REQUIRE_FALSE(mfnf::is_valid_utf8("\xED\xA0\x80"));      // surrogate
    REQUIRE_FALSE(mfnf::is_valid_utf8("\xF4\x90\x80\x80"));  // above U+10FFFF
    REQUIRE_FALSE(mfnf::is_valid_utf8("\xE2\x82"));          // truncated
    REQUIRE_FALSE(mfnf::is_valid_utf8("\xFF"));
}
