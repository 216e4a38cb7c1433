#pragma once
/** @file  Transfer.hpp
 *  @brief Well-to-well transfers, splitting volumes the tip cannot hold at once.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <vector>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::commands {

  /// Upper bound on the aspirations one well pair may be split into.
  inline constexpr std::size_t kMaxSplitParts = 10000;

  /**
   * @brief Break \p volume into aspirate-sized parts no larger than \p max.
   *
   * `v <= max` stays whole, `v < 2 max` becomes two halves, anything larger is
   * `max` repeated with the last `max + remainder` shared evenly between the final
   * two parts so no part is a tiny remainder. Returns an empty list when more than
   * kMaxSplitParts parts would be needed.
   */
  std::vector<double> splitLiquid(double volume, double max);

  /// Pairs sources with destinations 1:1 (or broadcasts a single source / single
  /// destination). Every split part of every pair is one chunk.
  protocols::CompilationResult transfer(const protocols::TransferArgs& args,
                                        const model::StaticContext& ctx,
                                        const model::SimulationState& state);

} // namespace pipetgen::commands
