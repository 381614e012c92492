#include "adiabat/parser/FormulaParser.hpp"
#include "adiabat/util/Elements.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <cctype>
#include <climits>

namespace Adiabat {
namespace FormulaParser {

int parse(const std::string& cFormula, ElementCounts& counts) {
    counts.clear();

    if (cFormula.empty()) {
        return ErrorCode::kInvalidFormula;
    }

    size_t i = 0;
    const size_t n = cFormula.size();

    while (i < n) {
        // Element symbol: one uppercase letter then any lowercase letters
        if (!std::isupper(static_cast<unsigned char>(cFormula[i]))) {
            counts.clear();
            return ErrorCode::kInvalidFormula;
        }

        std::string cElement(1, cFormula[i]);
        ++i;
        while (i < n && std::islower(static_cast<unsigned char>(cFormula[i]))) {
            cElement += cFormula[i];
            ++i;
        }

        // Optional count
        long iCount = 0;
        bool lHasDigits = false;
        while (i < n && std::isdigit(static_cast<unsigned char>(cFormula[i]))) {
            iCount = iCount * 10 + (cFormula[i] - '0');
            if (iCount > INT_MAX) {
                counts.clear();
                return ErrorCode::kInvalidFormula;
            }
            lHasDigits = true;
            ++i;
        }
        if (!lHasDigits) {
            iCount = 1;
        } else if (iCount == 0) {
            counts.clear();
            return ErrorCode::kInvalidFormula;
        }

        // Merge repeated symbols
        bool lFound = false;
        for (auto& [cSymbol, iAtoms] : counts) {
            if (cSymbol == cElement) {
                if (iAtoms > INT_MAX - iCount) {
                    counts.clear();
                    return ErrorCode::kInvalidFormula;
                }
                iAtoms += static_cast<int>(iCount);
                lFound = true;
                break;
            }
        }
        if (!lFound) {
            counts.emplace_back(cElement, static_cast<int>(iCount));
        }
    }

    return ErrorCode::kSuccess;
}

int countOf(const ElementCounts& counts, const std::string& cElement) {
    for (const auto& [cSymbol, iAtoms] : counts) {
        if (cSymbol == cElement) return iAtoms;
    }
    return 0;
}

int totalAtoms(const ElementCounts& counts) {
    int nAtoms = 0;
    for (const auto& entry : counts) {
        nAtoms += entry.second;
    }
    return nAtoms;
}

int molarMass(const ElementCounts& counts, double& dMolarMass) {
    dMolarMass = 0.0;
    for (const auto& [cSymbol, iAtoms] : counts) {
        double dElementMass = Elements::molarMass(cSymbol);
        if (dElementMass <= 0.0) {
            dMolarMass = 0.0;
            return ErrorCode::kUnknownElement;
        }
        dMolarMass += dElementMass * iAtoms;
    }
    return ErrorCode::kSuccess;
}

} // namespace FormulaParser
} // namespace Adiabat
