#ifndef SRC_METALAYOUT_GENERATOR_HPP_
#define SRC_METALAYOUT_GENERATOR_HPP_

#include "metalayout/Catalog.hpp"
#include "metalayout/CodedDispatch.hpp"
#include "metalayout/DecodePlan.hpp"
#include "metalayout/Registry.hpp"
#include "metalayout/WidthFormula.hpp"

#include <memory>
#include <string_view>

namespace metalayout {

class ErrorReporter;
struct Schema;
struct SchemeSet;

// Everything derived from one schema. Only ever handed out complete.
struct Artifacts {
    Catalog catalog;
    WidthFormulas widthFormulas;
    DecodePlans decodePlans;
    CodedDispatches codedDispatches;
    Registry registry;

    // Each returns nullptr if there is no artifact under |name|.
    const WidthFormula* widthFormula(std::string_view tableName) const;
    const DecodePlan* decodePlan(std::string_view tableName) const;
    const CodedDispatch* codedDispatch(std::string_view schemeName) const;
};

// Runs the catalog builder, reference validation, and then the width, decode, dispatch and registry builders. The
// last four only read the schema and the catalog. Any fault stops the run after the stage that found it.
class Generator {
public:
    Generator();
    explicit Generator(std::shared_ptr<ErrorReporter> errorReporter);
    ~Generator() = default;

    // Returns nullptr if the schema has any fault, with the faults recorded in errorReporter().
    std::unique_ptr<Artifacts> generate(const Schema& schema, const SchemeSet& schemes);

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_GENERATOR_HPP_
