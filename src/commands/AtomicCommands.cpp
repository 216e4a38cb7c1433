/* @file AtomicCommands.cpp
 * @brief validation + state bookkeeping for each single hardware instruction
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <utility>
#include <vector>

// PipetGen headers
#include "commands/AtomicCommands.hpp"
#include "model/WellSet.hpp"

namespace pipetgen::commands {

  using model::LabwareDef;
  using model::PipetteSpec;
  using model::SimulationState;
  using model::StaticContext;
  using model::WellKey;
  using protocols::CommandError;
  using protocols::CommandWarning;
  using protocols::ErrorKind;
  using protocols::Instruction;
  using protocols::StepResult;
  using protocols::StepSuccess;
  using protocols::WarningKind;

  namespace {

    constexpr double kVolumeEpsilon = 1e-9;

    struct Target {
      const PipetteSpec* pipette{ nullptr };
      const LabwareDef* labware{ nullptr };
      std::vector<std::string> wells; ///< one entry per channel
    };

    std::optional<CommandError> resolveTarget(const StaticContext& ctx, const std::string& pipette,
                                              const std::string& labware, const std::string& well,
                                              Target& out) {
      out.pipette = ctx.pipette(pipette);
      if (!out.pipette)
        return protocols::pipetteDoesNotExist(pipette);

      out.labware = ctx.labware(labware);
      if (!out.labware)
        return protocols::labwareDoesNotExist(labware);

      if (!out.labware->well(well))
        return protocols::wellDoesNotExist(labware, well);

      out.wells = model::channelWells(*out.labware, well, out.pipette->channels);
      if (out.wells.empty())
        return protocols::wellDoesNotExist(labware, well);
      return std::nullopt;
    }

    std::optional<CommandError> validateLiquidMove(const PipettingArgs& args,
                                                   const StaticContext& ctx,
                                                   const SimulationState& state,
                                                   const char* verb, Target& target) {
      if (auto err = resolveTarget(ctx, args.pipette, args.labware, args.well, target))
        return err;

      if (args.volume <= 0.0)
        return CommandError{ ErrorKind::InvalidArgument, std::string("Cannot ") + verb +
                                                             " a non-positive volume",
                             std::to_string(args.volume) };

      if (args.volume > target.pipette->maxVolume + kVolumeEpsilon)
        return protocols::pipetteVolumeExceeded(args.pipette, args.volume,
                                                target.pipette->maxVolume);

      if (!state.hasTip(args.pipette))
        return protocols::insufficientTips(args.pipette, std::string("Attempted to ") + verb +
                                                             " with no tip on the pipette");
      return std::nullopt;
    }

    // per-well totals; a reservoir well touched by all 8 channels counts 8 times
    std::map<std::string, double> perWellVolume(const std::vector<std::string>& wells,
                                                double volume) {
      std::map<std::string, double> totals;
      for (const auto& w : wells)
        totals[w] += volume;
      return totals;
    }

    Instruction liquidMove(protocols::LiquidMove move, protocols::InstructionKind kind) {
      switch (kind) {
      case protocols::InstructionKind::Aspirate:
        return Instruction{ protocols::Aspirate{ std::move(move) } };
      case protocols::InstructionKind::Dispense:
        return Instruction{ protocols::Dispense{ std::move(move) } };
      case protocols::InstructionKind::AirGap:
        return Instruction{ protocols::AirGap{ std::move(move) } };
      default:
        return Instruction{ protocols::DispenseAirGap{ std::move(move) } };
      }
    }

    protocols::LiquidMove toMove(const PipettingArgs& args) {
      return { args.pipette, args.volume, args.labware, args.well, args.offsetFromBottomMm,
               args.flowRate };
    }

  } // namespace

  StepResult aspirate(const PipettingArgs& args, const StaticContext& ctx,
                      const SimulationState& state) {
    Target target;
    if (auto err = validateLiquidMove(args, ctx, state, "aspirate", target))
      return *err;

    SimulationState next = state;
    std::vector<CommandWarning> warnings;

    if (!target.labware->isTrash) {
      const auto totals = perWellVolume(target.wells, args.volume);

      auto& carried = next.tipContents[args.pipette];
      for (const auto& [well, requested] : totals) {
        auto it = next.liquids.find(WellKey{ args.labware, well });
        if (it == next.liquids.end()) {
          warnings.push_back({ WarningKind::AspirateFromPristineWell,
                               "Aspirating from " + args.labware + "/" + well +
                                   ", which has no tracked liquid" });
          continue;
        }
        if (it->second.volume + kVolumeEpsilon < requested)
          warnings.push_back(protocols::aspirateMoreThanWellContents(args.labware, well, requested,
                                                                     it->second.volume));
        carried.insert(it->second.liquidIds.begin(), it->second.liquidIds.end());
        it->second.volume -= requested;
        // volume floors at empty; an emptied well keeps its entry but loses its markers
        if (it->second.volume <= kVolumeEpsilon) {
          it->second.volume = 0.0;
          it->second.liquidIds.clear();
        }
      }
    }

    return StepSuccess{ liquidMove(toMove(args), protocols::InstructionKind::Aspirate),
                        std::move(next), std::move(warnings) };
  }

  StepResult dispense(const PipettingArgs& args, const StaticContext& ctx,
                      const SimulationState& state) {
    Target target;
    if (auto err = validateLiquidMove(args, ctx, state, "dispense", target))
      return *err;

    SimulationState next = state;
    std::vector<CommandWarning> warnings;

    if (!target.labware->isTrash) {
      const auto carriedIt = state.tipContents.find(args.pipette);
      for (const auto& [well, added] : perWellVolume(target.wells, args.volume)) {
        auto& contents = next.liquids[WellKey{ args.labware, well }];
        contents.volume += added;
        if (carriedIt != state.tipContents.end())
          contents.liquidIds.insert(carriedIt->second.begin(), carriedIt->second.end());

        const auto* geometry = target.labware->well(well);
        if (geometry && geometry->maxVolume > 0.0 &&
            contents.volume > geometry->maxVolume + kVolumeEpsilon)
          warnings.push_back({ WarningKind::OverMaxWellVolume,
                               "Dispensing into " + args.labware + "/" + well +
                                   " exceeds its maximum volume" });
      }
    }

    return StepSuccess{ liquidMove(toMove(args), protocols::InstructionKind::Dispense),
                        std::move(next), std::move(warnings) };
  }

  StepResult airGap(const PipettingArgs& args, const StaticContext& ctx,
                    const SimulationState& state) {
    Target target;
    if (auto err = validateLiquidMove(args, ctx, state, "air gap", target))
      return *err;
    return StepSuccess{ liquidMove(toMove(args), protocols::InstructionKind::AirGap), state,
                        {} };
  }

  StepResult dispenseAirGap(const PipettingArgs& args, const StaticContext& ctx,
                            const SimulationState& state) {
    Target target;
    if (auto err = validateLiquidMove(args, ctx, state, "dispense an air gap", target))
      return *err;
    return StepSuccess{ liquidMove(toMove(args), protocols::InstructionKind::DispenseAirGap),
                        state, {} };
  }

  StepResult delay(const DelayArgs& args, const StaticContext&, const SimulationState& state) {
    if (args.seconds < 0.0)
      return CommandError{ ErrorKind::InvalidArgument, "Delay must not be negative",
                           std::to_string(args.seconds) };
    return StepSuccess{ Instruction{ protocols::Delay{ args.seconds } }, state, {} };
  }

  StepResult moveToWell(const MoveToWellArgs& args, const StaticContext& ctx,
                        const SimulationState& state) {
    Target target;
    if (auto err = resolveTarget(ctx, args.pipette, args.labware, args.well, target))
      return *err;
    return StepSuccess{
      Instruction{ protocols::MoveToWell{ args.pipette, args.labware, args.well, args.offset } },
      state, {}
    };
  }

  StepResult touchTip(const TouchTipArgs& args, const StaticContext& ctx,
                      const SimulationState& state) {
    Target target;
    if (auto err = resolveTarget(ctx, args.pipette, args.labware, args.well, target))
      return *err;
    if (!state.hasTip(args.pipette))
      return protocols::insufficientTips(args.pipette,
                                         "Attempted to touch tip with no tip on the pipette");
    return StepSuccess{ Instruction{ protocols::TouchTip{ args.pipette, args.labware, args.well,
                                                          args.offsetFromBottomMm } },
                        state,
                        {} };
  }

  StepResult blowout(const BlowoutArgs& args, const StaticContext& ctx,
                     const SimulationState& state) {
    Target target;
    if (auto err = resolveTarget(ctx, args.pipette, args.labware, args.well, target))
      return *err;
    if (!state.hasTip(args.pipette))
      return protocols::insufficientTips(args.pipette,
                                         "Attempted to blow out with no tip on the pipette");

    SimulationState next = state;
    next.tipContents.erase(args.pipette);
    return StepSuccess{ Instruction{ protocols::Blowout{ args.pipette, args.labware, args.well,
                                                         args.flowRate,
                                                         args.offsetFromBottomMm } },
                        std::move(next),
                        {} };
  }

  StepResult pickUpTip(const PickUpTipArgs& args, const StaticContext& ctx,
                       const SimulationState& state) {
    Target target;
    if (auto err = resolveTarget(ctx, args.pipette, args.tiprack, args.well, target))
      return *err;
    if (!target.labware->isTiprack)
      return CommandError{ ErrorKind::InvalidArgument, "Tips can only be picked up from a tip rack",
                           args.tiprack };

    for (const auto& well : target.wells) {
      if (!state.tipAvailable(args.tiprack, well))
        return protocols::insufficientTips(args.pipette, "No tip available at " + args.tiprack +
                                                             "/" + well);
    }

    SimulationState next = state;
    next.tips[args.pipette] = true;
    next.tipContents.erase(args.pipette);
    auto& rack = next.tipracks[args.tiprack];
    for (const auto& well : target.wells)
      rack[well] = false;

    return StepSuccess{
      Instruction{ protocols::PickUpTip{ args.pipette, args.tiprack, args.well } },
      std::move(next), {}
    };
  }

  StepResult dropTip(const DropTipArgs& args, const StaticContext& ctx,
                     const SimulationState& state) {
    if (!ctx.pipette(args.pipette))
      return protocols::pipetteDoesNotExist(args.pipette);
    const LabwareDef* lw = ctx.labware(args.labware);
    if (!lw)
      return protocols::labwareDoesNotExist(args.labware);
    if (!lw->well(args.well))
      return protocols::wellDoesNotExist(args.labware, args.well);

    SimulationState next = state;
    next.tips[args.pipette] = false;
    next.tipContents.erase(args.pipette);
    return StepSuccess{ Instruction{ protocols::DropTip{ args.pipette, args.labware, args.well } },
                        std::move(next),
                        {} };
  }

} // namespace pipetgen::commands
