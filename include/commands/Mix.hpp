#pragma once
/** @file  Mix.hpp
 *  @brief Repeated aspirate/dispense in place, well by well.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::commands {

  /// Fails MIX_BAD_VOLUME unless 0 < volume <= pipette max; each well is one chunk
  /// for tip-change purposes.
  protocols::CompilationResult mix(const protocols::MixArgs& args, const model::StaticContext& ctx,
                                   const model::SimulationState& state);

} // namespace pipetgen::commands
