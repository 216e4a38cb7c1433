/* @file SimulationState.cpp
 * @brief initial state construction and read helpers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"

using namespace pipetgen::model;

SimulationState SimulationState::initial(const StaticContext& ctx) {
  SimulationState state;
  for (const auto& [id, pipette] : ctx.pipettes())
    state.tips[id] = false;

  for (const auto& [id, lw] : ctx.allLabware()) {
    if (!lw.isTiprack)
      continue;
    auto& rack = state.tipracks[id];
    for (const auto& [wellName, geometry] : lw.wells)
      rack[wellName] = true;
  }
  return state;
}

bool SimulationState::hasTip(const std::string& pipette) const {
  auto it = tips.find(pipette);
  return it != tips.end() && it->second;
}

const WellContents* SimulationState::contents(const std::string& labware,
                                              const std::string& well) const {
  auto it = liquids.find(WellKey{ labware, well });
  return it == liquids.end() ? nullptr : &it->second;
}

bool SimulationState::tipAvailable(const std::string& tiprack, const std::string& well) const {
  auto rack = tipracks.find(tiprack);
  if (rack == tipracks.end())
    return false;
  auto it = rack->second.find(well);
  return it != rack->second.end() && it->second;
}
