#pragma once
/** @file  SimulationState.hpp
 *  @brief Snapshot of the dynamic robot/labware facts that instructions change.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <set>
#include <string>
#include <utility>

namespace pipetgen::model {

  class StaticContext;

  struct WellContents {
    double volume{ 0.0 };          ///< uL
    std::set<std::string> liquidIds; ///< composition markers
    bool operator==(const WellContents&) const = default;
  };

  using WellKey = std::pair<std::string, std::string>; ///< (labware id, well name)

  /**
 * @struct SimulationState
 * @brief Plain value threaded through a compilation.
 *
 *  * Atomic creators take it by const reference and return a modified copy;
 *    nothing edits a state that another step already observed.
 *  * A well missing from `liquids` is untracked (never filled, never aspirated).
 *  * Ordered maps keep iteration (and therefore output) deterministic.
 */
  struct SimulationState {
    std::map<std::string, bool> tips;                                ///< pipette -> carries a tip
    std::map<WellKey, WellContents> liquids;                         ///< tracked wells
    std::map<std::string, std::map<std::string, bool>> tipracks;     ///< rack -> well -> available
    std::map<std::string, std::set<std::string>> tipContents;        ///< pipette -> carried markers

    /// Every tip rack in \p ctx full, no tips on pipettes, no tracked liquid.
    static SimulationState initial(const StaticContext& ctx);

    bool hasTip(const std::string& pipette) const;
    const WellContents* contents(const std::string& labware, const std::string& well) const;
    bool tipAvailable(const std::string& tiprack, const std::string& well) const;

    bool operator==(const SimulationState&) const = default;
  };

} // namespace pipetgen::model
