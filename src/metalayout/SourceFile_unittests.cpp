#include "metalayout/SourceFile.hpp"

#include "metalayout/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace metalayout {

TEST_CASE("SourceFile read") {
    SUBCASE("schema file") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SourceFile sourceFile(std::string(METALAYOUT_SCHEMA_DIR) + "/ecma335.json");
        REQUIRE(sourceFile.read(errorReporter));
        CHECK(errorReporter->ok());
        REQUIRE(sourceFile.size() > 1);
        CHECK(sourceFile.code()[sourceFile.size() - 1] == '\0');
        CHECK(sourceFile.codeView().size() == sourceFile.size() - 1);
        CHECK(sourceFile.codeView().front() == '{');
    }
    SUBCASE("missing file") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SourceFile sourceFile("/definitely/not/a/schema.json");
        CHECK(!sourceFile.read(errorReporter));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->faults()[0].kind == Fault::kFile);
        CHECK(errorReporter->faults()[0].message.find("not found") != std::string::npos);
    }
    SUBCASE("directory is a read error") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SourceFile sourceFile(METALAYOUT_SCHEMA_DIR);
        CHECK(!sourceFile.read(errorReporter));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->faults()[0].kind == Fault::kFile);
        CHECK(errorReporter->faults()[0].message.find("read error") != std::string::npos);
        CHECK(sourceFile.codeView().empty());
    }
}

} // namespace metalayout
