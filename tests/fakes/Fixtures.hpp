#pragma once
/** @file  Fixtures.hpp
 *  @brief Standard deck, robot states and expected-instruction builders for compiler tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "model/WellSet.hpp"
#include "protocols/Instruction.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen {
  namespace test {

    inline const std::string kP300Single = "p300SingleId";
    inline const std::string kP300Multi = "p300MultiId";
    inline const std::string kSourcePlate = "sourcePlateId";
    inline const std::string kDestPlate = "destPlateId";
    inline const std::string kTrough = "troughId";
    inline const std::string kTrash = "trashId";
    inline const std::string kTiprack1 = "tiprack1Id";
    inline const std::string kTiprack2 = "tiprack2Id";

    constexpr double kPlateDepth = 10.54;
    constexpr double kTrashDepth = 77.0;

    // overrides carried by every transfer-like fixture record
    constexpr double kAspirateFlow = 2.1;
    constexpr double kDispenseFlow = 2.2;
    constexpr double kAspirateOffset = 3.1;
    constexpr double kDispenseOffset = 3.2;
    constexpr double kTouchTipAfterAspirateOffset = 3.3;
    constexpr double kTouchTipAfterDispenseOffset = 3.4;
    constexpr double kAirGapOffset = kPlateDepth + 1.0; ///< default 1 mm above the well top

    /**
 * @brief Deck with a p300 single (tiprack1) and a p300 8-channel (tiprack2),
 *        96-well source/dest plates, a 12-column trough and a fixed trash.
 */
    inline std::shared_ptr<const model::StaticContext> makeContext() {
      std::map<std::string, model::PipetteSpec> pipettes;
      pipettes[kP300Single] =
          model::PipetteSpec{ kP300Single, "p300_single", 300.0, 1, { 46.43, 46.43, 46.43 },
                              { kTiprack1 } };
      pipettes[kP300Multi] =
          model::PipetteSpec{ kP300Multi, "p300_multi", 300.0, 8, { 46.43, 46.43, 46.43 },
                              { kTiprack2 } };

      std::map<std::string, model::LabwareDef> labware;
      auto source = model::gridLabware(kSourcePlate, 8, 12, kPlateDepth, 360.0);
      source.slot = "1";
      auto dest = model::gridLabware(kDestPlate, 8, 12, kPlateDepth, 360.0);
      dest.slot = "2";
      auto trough = model::gridLabware(kTrough, 1, 12, 40.0, 15000.0);
      trough.slot = "3";
      auto rack1 = model::gridLabware(kTiprack1, 8, 12, 59.3, 300.0);
      rack1.slot = "4";
      rack1.isTiprack = true;
      auto rack2 = model::gridLabware(kTiprack2, 8, 12, 59.3, 300.0);
      rack2.slot = "5";
      rack2.isTiprack = true;

      model::LabwareDef trash;
      trash.id = kTrash;
      trash.displayName = "Fixed trash";
      trash.slot = "12";
      trash.isTrash = true;
      trash.ordering = { { "A1" } };
      trash.wells["A1"] = model::WellGeometry{ kTrashDepth, 0.0, 0.0, 0.0 };

      for (auto* lw : { &source, &dest, &trough, &rack1, &rack2, &trash })
        labware[lw->id] = *lw;

      return std::make_shared<const model::StaticContext>(
          std::move(pipettes), std::move(labware), std::map<std::string, model::ModuleDef>{},
          model::WellLocation{ kTrash, "A1" });
    }

    /// Full racks, the p300 single already holding a tip.
    inline model::SimulationState stateWithTip(const model::StaticContext& ctx) {
      auto state = model::SimulationState::initial(ctx);
      state.tips[kP300Single] = true;
      return state;
    }

    /// No pipette holds a tip and every rack well is consumed.
    inline model::SimulationState noTipsRemain(const model::StaticContext& ctx) {
      auto state = model::SimulationState::initial(ctx);
      for (auto& [rack, wells] : state.tipracks)
        for (auto& [well, available] : wells)
          available = false;
      return state;
    }

    /// Flow-rate / offset overrides and defaults shared by transfer-like fixtures.
    template <typename Args> Args transferLike() {
      Args args;
      args.name = "test step";
      args.description = "fixture";
      args.pipette = kP300Single;
      args.aspirateFlowRateUlSec = kAspirateFlow;
      args.dispenseFlowRateUlSec = kDispenseFlow;
      args.aspirateOffsetFromBottomMm = kAspirateOffset;
      args.dispenseOffsetFromBottomMm = kDispenseOffset;
      args.touchTipAfterAspirateOffsetMmFromBottom = kTouchTipAfterAspirateOffset;
      args.touchTipAfterDispenseOffsetMmFromBottom = kTouchTipAfterDispenseOffset;
      return args;
    }

    //---expected instruction builders-------------------------------------

    inline protocols::Instruction aspirateCmd(const std::string& well, double volume,
                                              const std::string& labware = kSourcePlate,
                                              double offset = kAspirateOffset,
                                              double flowRate = kAspirateFlow,
                                              const std::string& pipette = kP300Single) {
      protocols::Aspirate a;
      a.pipette = pipette;
      a.volume = volume;
      a.labware = labware;
      a.well = well;
      a.offsetFromBottomMm = offset;
      a.flowRate = flowRate;
      return { a };
    }

    inline protocols::Instruction dispenseCmd(const std::string& well, double volume,
                                              const std::string& labware = kDestPlate,
                                              double offset = kDispenseOffset,
                                              double flowRate = kDispenseFlow,
                                              const std::string& pipette = kP300Single) {
      protocols::Dispense d;
      d.pipette = pipette;
      d.volume = volume;
      d.labware = labware;
      d.well = well;
      d.offsetFromBottomMm = offset;
      d.flowRate = flowRate;
      return { d };
    }

    inline protocols::Instruction airGapCmd(const std::string& well, double volume,
                                            const std::string& labware = kSourcePlate) {
      protocols::AirGap g;
      g.pipette = kP300Single;
      g.volume = volume;
      g.labware = labware;
      g.well = well;
      g.offsetFromBottomMm = kAirGapOffset;
      g.flowRate = kAspirateFlow;
      return { g };
    }

    inline protocols::Instruction dispenseAirGapCmd(const std::string& well, double volume,
                                                    const std::string& labware = kDestPlate) {
      protocols::DispenseAirGap g;
      g.pipette = kP300Single;
      g.volume = volume;
      g.labware = labware;
      g.well = well;
      g.offsetFromBottomMm = kAirGapOffset;
      g.flowRate = kDispenseFlow;
      return { g };
    }

    inline protocols::Instruction delayCmd(double seconds) {
      return { protocols::Delay{ seconds } };
    }

    inline protocols::Instruction touchTipCmd(const std::string& well,
                                              const std::string& labware = kSourcePlate,
                                              double offset = kTouchTipAfterAspirateOffset) {
      return { protocols::TouchTip{ kP300Single, labware, well, offset } };
    }

    inline protocols::Instruction blowoutCmd(const std::string& labware, const std::string& well,
                                             double flowRate, double offset) {
      return { protocols::Blowout{ kP300Single, labware, well, flowRate, offset } };
    }

    inline protocols::Instruction pickUpTipCmd(const std::string& well,
                                               const std::string& tiprack = kTiprack1,
                                               const std::string& pipette = kP300Single) {
      return { protocols::PickUpTip{ pipette, tiprack, well } };
    }

    inline protocols::Instruction dropTipCmd(const std::string& pipette = kP300Single) {
      return { protocols::DropTip{ pipette, kTrash, "A1" } };
    }

    inline protocols::Instruction moveToWellCmd(const std::string& well, const std::string& labware,
                                                double z) {
      return { protocols::MoveToWell{ kP300Single, labware, well, { 0.0, 0.0, z } } };
    }

    /// moveToWell at \p z above the bottom, then wait.
    inline std::vector<protocols::Instruction>
    delayWithOffsetCmds(const std::string& well, const std::string& labware, double z,
                        double seconds) {
      return { moveToWellCmd(well, labware, z), delayCmd(seconds) };
    }

    inline std::vector<protocols::Instruction>
    join(std::initializer_list<std::vector<protocols::Instruction>> parts) {
      std::vector<protocols::Instruction> out;
      for (const auto& part : parts)
        out.insert(out.end(), part.begin(), part.end());
      return out;
    }

  } // namespace test
} // namespace pipetgen
