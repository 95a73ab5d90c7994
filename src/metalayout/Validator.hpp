#ifndef SRC_METALAYOUT_VALIDATOR_HPP_
#define SRC_METALAYOUT_VALIDATOR_HPP_

#include <string>
#include <vector>

namespace metalayout {

class Catalog;
struct CodeScheme;
class ErrorReporter;
struct Schema;
struct SchemeSet;

// Checks that every cross-table reference in a schema resolves, so that no builder downstream of the catalog has to
// deal with dangling names.
class Validator {
public:
    // Checks every TableRef and RowRange target, every CodedRef scheme, and the tables of every scheme the schema
    // uses. Reports one UnresolvedReferenceFault per broken reference.
    static bool validateReferences(const Schema& schema, const SchemeSet& schemes, const Catalog& catalog,
                                   ErrorReporter* errorReporter);

    // The schemes referenced by at least one CodedRef in |schema|, in SchemeSet order. Unknown names are skipped.
    static std::vector<const CodeScheme*> usedSchemes(const Schema& schema, const SchemeSet& schemes);

private:
    static bool validateScheme(const CodeScheme& scheme, const Catalog& catalog, ErrorReporter* errorReporter);
};

} // namespace metalayout

#endif // SRC_METALAYOUT_VALIDATOR_HPP_
