#include "metalayout/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>

namespace metalayout {

TEST_CASE("ErrorReporter line numbers") {
    SUBCASE("empty string") {
        ErrorReporter er(true);
        std::string code("");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data()) == 1);
    }
    SUBCASE("one liner") {
        ErrorReporter er(true);
        std::string code("{ \"tables\": [ { \"name\": \"Module\", \"code\": 0, \"fields\": [] } ] }");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data()) == 1);
        CHECK(er.getLineNumber(code.data() + 10) == 1);
        CHECK(er.getLineNumber(code.data() + code.size()) == 1);
    }
    SUBCASE("multiline string") {
        ErrorReporter er(true);
        std::string code("{\n  \"tables\": [\n    {\n      \"name\": \"Module\"\n    }\n  ]\n}\n");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data() + 1) == 1);
        CHECK(er.getLineNumber(code.data() + 2) == 2);
        CHECK(er.getLineNumber(code.data() + 16) == 3);
        CHECK(er.getLineNumber(code.data() + 24) == 4);
    }
    SUBCASE("multiple empty lines") {
        ErrorReporter er(true);
        std::string code("\n\n\n\n5");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data()) == 1);
        CHECK(er.getLineNumber(code.data() + 1) == 2);
        CHECK(er.getLineNumber(code.data() + 2) == 3);
        CHECK(er.getLineNumber(code.data() + 3) == 4);
        CHECK(er.getLineNumber(code.data() + 4) == 5);
    }
    SUBCASE("new code resets line map") {
        ErrorReporter er(true);
        std::string first("a\nb\nc");
        er.setCode(first.data());
        CHECK(er.getLineNumber(first.data() + 4) == 3);
        std::string second("abc");
        er.setCode(second.data());
        CHECK(er.getLineNumber(second.data() + 2) == 1);
    }
}

TEST_CASE("ErrorReporter faults") {
    SUBCASE("starts ok") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
        CHECK(!er.hasFault(Fault::kDuplicateCode));
    }
    SUBCASE("records kind and message in order") {
        ErrorReporter er(true);
        er.addDuplicateCodeFault("A", "B", 5);
        er.addUnresolvedReferenceFault("A.Parent", "references table", "Missing");
        REQUIRE(er.errorCount() == 2);
        CHECK(!er.ok());
        CHECK(er.faults()[0].kind == Fault::kDuplicateCode);
        CHECK(er.faults()[0].message.find("'A'") != std::string::npos);
        CHECK(er.faults()[0].message.find("'B'") != std::string::npos);
        CHECK(er.faults()[0].message.find("5") != std::string::npos);
        CHECK(er.faults()[1].kind == Fault::kUnresolvedReference);
        CHECK(er.faults()[1].message.find("Missing") != std::string::npos);
        CHECK(er.hasFault(Fault::kUnresolvedReference));
        CHECK(!er.hasFault(Fault::kUnsupportedKind));
    }
    SUBCASE("file errors") {
        ErrorReporter er(true);
        er.addFileNotFoundError("/no/such/schema.json");
        REQUIRE(er.errorCount() == 1);
        CHECK(er.faults()[0].kind == Fault::kFile);
        CHECK(er.faults()[0].message.find("/no/such/schema.json") != std::string::npos);
    }
    SUBCASE("fault names") {
        CHECK(std::string(faultName(Fault::kDuplicateCode)) == "DuplicateCodeFault");
        CHECK(std::string(faultName(Fault::kUnresolvedReference)) == "UnresolvedReferenceFault");
        CHECK(std::string(faultName(Fault::kUnsupportedKind)) == "UnsupportedKindFault");
    }
}

} // namespace metalayout
