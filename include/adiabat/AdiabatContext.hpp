#pragma once

#include <memory>
#include "context/SpeciesState.hpp"
#include "context/AdiabatIO.hpp"
#include "context/MinimizerState.hpp"

namespace Adiabat {

/// Context object holding all state of one calculation
/// Pass AdiabatContext& to all functions for computation
class AdiabatContext {
public:
    /// Chemical system: candidates, element basis, A and b
    std::unique_ptr<SpeciesState> species;

    /// Input/Output state
    std::unique_ptr<AdiabatIO> io;

    /// Inner/outer solver bookkeeping
    std::unique_ptr<MinimizerState> solver;

    /// Constructor - initializes all state objects
    AdiabatContext();

    /// Destructor
    ~AdiabatContext();

    /// Move constructor
    AdiabatContext(AdiabatContext&&) noexcept;

    /// Move assignment
    AdiabatContext& operator=(AdiabatContext&&) noexcept;

    // Deleted copy operations (context is not copyable)
    AdiabatContext(const AdiabatContext&) = delete;
    AdiabatContext& operator=(const AdiabatContext&) = delete;

    /// Get the current error/info code
    int infoAdiabat() const { return io->INFOAdiabat; }

    /// Set the error/info code
    void setInfoAdiabat(int code) { io->INFOAdiabat = code; }

    /// Check if computation was successful
    bool isSuccess() const { return io->INFOAdiabat == 0; }

    /// Reset solver state for a new calculation (keeps inputs)
    void resetAdiabat();

    /// Full reset including inputs
    void resetAll();
};

} // namespace Adiabat
