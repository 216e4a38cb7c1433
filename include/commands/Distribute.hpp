#pragma once
/** @file  Distribute.hpp
 *  @brief One source well to many destination wells, one aspirate per chunk.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <vector>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::commands {

  /**
   * @brief Split \p wells into consecutive groups of at most \p maxPerChunk.
   *
   * Only the last group may be shorter. \p maxPerChunk must be positive.
   */
  std::vector<std::vector<std::string>> chunkWells(const std::vector<std::string>& wells,
                                                   std::size_t maxPerChunk);

  /**
   * @brief Compile a distribute step.
   *
   * Capacity per chunk is the pipette max minus the disposal volume and the air gap.
   * A per-well volume above that fails PIPETTE_VOLUME_EXCEEDED before anything is
   * emitted. Each chunk aspirates `wells x volume + disposal`, dispenses into every
   * well of the chunk and, when the disposal volume is positive, blows out into the
   * disposal well.
   */
  protocols::CompilationResult distribute(const protocols::DistributeArgs& args,
                                          const model::StaticContext& ctx,
                                          const model::SimulationState& state);

} // namespace pipetgen::commands
