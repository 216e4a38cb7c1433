#pragma once
/** @file  Consolidate.hpp
 *  @brief Many source wells into one destination well, one dispense per chunk.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::commands {

  /// Each chunk aspirates `volume` (plus an optional air gap) from up to
  /// `floor(maxVolume / (volume + airGap))` sources, then dispenses them together.
  protocols::CompilationResult consolidate(const protocols::ConsolidateArgs& args,
                                           const model::StaticContext& ctx,
                                           const model::SimulationState& state);

} // namespace pipetgen::commands
