#include "adiabat/AdiabatContext.hpp"

namespace Adiabat {

AdiabatContext::AdiabatContext()
    : species(std::make_unique<SpeciesState>())
    , io(std::make_unique<AdiabatIO>())
    , solver(std::make_unique<MinimizerState>())
{
}

AdiabatContext::~AdiabatContext() = default;

AdiabatContext::AdiabatContext(AdiabatContext&&) noexcept = default;

AdiabatContext& AdiabatContext::operator=(AdiabatContext&&) noexcept = default;

void AdiabatContext::resetAdiabat() {
    // Keep inputs, drop results and the built system
    io->resetOutput();
    species->reset();
    solver->reset();
}

void AdiabatContext::resetAll() {
    species->reset();
    io->reset();
    solver->reset();
}

} // namespace Adiabat
