// layoutgen, reads a JSON table schema and generates record layout and decoding artifacts for it
#include "metalayout/ArtifactDumpJSON.hpp"
#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Generator.hpp"
#include "metalayout/HeaderRenderer.hpp"
#include "metalayout/SchemaLoader.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

DEFINE_string(schemaFile, "", "Path to the JSON table schema to generate from.");
DEFINE_string(headerFile, "", "Path to save the generated C++ header to. Skipped if empty.");
DEFINE_string(jsonFile, "", "Path to save a JSON dump of the generated artifacts to. Skipped if empty.");
DEFINE_bool(prettyJSON, true, "Pretty-print the JSON dump.");
DEFINE_string(namespaceName, "metadata", "C++ namespace of the generated header.");
DEFINE_bool(verbose, false, "Log generation progress.");

namespace {

bool writeFile(const std::string& path, std::string_view contents, metalayout::ErrorReporter* errorReporter) {
    std::ofstream outFile(path, std::ofstream::binary);
    if (!outFile) {
        errorReporter->addFileOpenError(path);
        return false;
    }
    outFile.write(contents.data(), contents.size());
    if (!outFile) {
        errorReporter->addFileWriteError(path);
        return false;
    }
    SPDLOG_INFO("Wrote {} bytes to {}", contents.size(), path);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("layoutgen --schemaFile=<schema.json> [--headerFile=<out.hpp>] [--jsonFile=<out.json>]");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    spdlog::set_level(FLAGS_verbose ? spdlog::level::debug : spdlog::level::warn);

    if (FLAGS_schemaFile.empty()) {
        std::cerr << "layoutgen requires --schemaFile.\n";
        return -1;
    }
    if (FLAGS_headerFile.empty() && FLAGS_jsonFile.empty()) {
        std::cerr << "layoutgen requires at least one of --headerFile or --jsonFile.\n";
        return -1;
    }

    auto errorReporter = std::make_shared<metalayout::ErrorReporter>();
    metalayout::SchemaLoader loader(errorReporter);
    if (!loader.loadFile(FLAGS_schemaFile)) {
        std::cerr << "layoutgen failed to load schema file: " << FLAGS_schemaFile << "\n";
        return -1;
    }

    metalayout::Generator generator(errorReporter);
    auto artifacts = generator.generate(loader.schema(), loader.schemes());
    if (!artifacts) {
        std::cerr << "layoutgen found " << errorReporter->errorCount() << " faults in schema file: "
                  << FLAGS_schemaFile << "\n";
        return -1;
    }

    if (!FLAGS_headerFile.empty()) {
        metalayout::HeaderRenderer renderer(FLAGS_namespaceName);
        if (!writeFile(FLAGS_headerFile, renderer.render(*artifacts, FLAGS_headerFile), errorReporter.get())) {
            return -1;
        }
    }

    if (!FLAGS_jsonFile.empty()) {
        metalayout::ArtifactDumpJSON dump;
        if (!dump.dump(*artifacts, FLAGS_prettyJSON)) {
            return -1;
        }
        if (!writeFile(FLAGS_jsonFile, dump.json(), errorReporter.get())) {
            return -1;
        }
    }

    return 0;
}
