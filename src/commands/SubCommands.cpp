/* @file SubCommands.cpp
 * @brief tip replacement, mixing and positional delays reused by every compound creator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// PipetGen headers
#include "commands/AtomicCommands.hpp"
#include "commands/SubCommands.hpp"
#include "model/WellSet.hpp"

namespace pipetgen::commands {

  namespace {
    // both argument records spell the override fields the same way
    template <typename Args>
    PipettingParams resolveWithFallbacks(const Args& args, const model::PipetteSpec& pipette,
                                         const model::CompilerDefaults& defaults) {
      const auto& rates = pipette.defaultFlowRates;
      PipettingParams p;
      p.aspirateFlowRate = args.aspirateFlowRateUlSec.value_or(rates.aspirate);
      p.dispenseFlowRate = args.dispenseFlowRateUlSec.value_or(rates.dispense);
      p.aspirateOffsetFromBottomMm =
          args.aspirateOffsetFromBottomMm.value_or(defaults.aspirateOffsetFromBottomMm);
      p.dispenseOffsetFromBottomMm =
          args.dispenseOffsetFromBottomMm.value_or(defaults.dispenseOffsetFromBottomMm);
      p.blowoutFlowRate = args.blowoutFlowRateUlSec.value_or(rates.blowout);
      p.blowoutOffsetFromTopMm = args.blowoutOffsetFromTopMm.value_or(defaults.blowoutOffsetFromTopMm);
      return p;
    }
  } // namespace

  PipettingParams resolveParams(const protocols::TransferLikeArgs& args,
                                const model::PipetteSpec& pipette,
                                const model::CompilerDefaults& defaults) {
    return resolveWithFallbacks(args, pipette, defaults);
  }

  PipettingParams resolveParams(const protocols::MixArgs& args, const model::PipetteSpec& pipette,
                                const model::CompilerDefaults& defaults) {
    return resolveWithFallbacks(args, pipette, defaults);
  }

  double offsetFromTop(const model::StaticContext& ctx, const std::string& labware,
                       const std::string& well, double mmFromTop) {
    const model::LabwareDef* lw = ctx.labware(labware);
    const model::WellGeometry* geometry = lw ? lw->well(well) : nullptr;
    return (geometry ? geometry->depthMm : 0.0) + mmFromTop;
  }

  bool tipChangeDue(protocols::ChangeTip policy, std::size_t chunkIndex) {
    switch (policy) {
    case protocols::ChangeTip::Always:
      return true;
    case protocols::ChangeTip::Once:
      return chunkIndex == 0;
    case protocols::ChangeTip::Never:
    default:
      return false;
    }
  }

  std::optional<model::WellLocation> nextTip(const model::StaticContext& ctx,
                                             const model::SimulationState& state,
                                             const std::string& pipette) {
    const model::PipetteSpec* spec = ctx.pipette(pipette);
    if (!spec)
      return std::nullopt;

    for (const auto& rackId : spec->tiprackIds) {
      const model::LabwareDef* rack = ctx.labware(rackId);
      if (!rack || !rack->isTiprack)
        continue;
      for (const auto& candidate : model::pickUpCandidates(*rack, spec->channels)) {
        bool allAvailable = true;
        for (const auto& well : model::channelWells(*rack, candidate, spec->channels))
          allAvailable = allAvailable && state.tipAvailable(rackId, well);
        if (allAvailable)
          return model::WellLocation{ rackId, candidate };
      }
    }
    return std::nullopt;
  }

  void replaceTip(core::ResultAccumulator& acc, const std::string& pipette) {
    if (acc.failed())
      return;

    if (acc.state().hasTip(pipette)) {
      const auto& trash = acc.context().trash();
      acc.chain(dropTip, DropTipArgs{ pipette, trash.labware, trash.well });
      if (acc.failed())
        return;
    }

    auto tip = nextTip(acc.context(), acc.state(), pipette);
    if (!tip) {
      acc.fail(protocols::insufficientTips(pipette, "Not enough tips to complete the operation"));
      return;
    }
    acc.chain(pickUpTip, PickUpTipArgs{ pipette, tip->labware, tip->well });
  }

  void delayWithOffset(core::ResultAccumulator& acc, const std::string& pipette,
                       const std::string& labware, const std::string& well,
                       const protocols::DelayConfig& config) {
    acc.chain(moveToWell, MoveToWellArgs{ pipette, labware, well, { 0.0, 0.0, config.mmFromBottom } });
    acc.chain(delay, DelayArgs{ config.seconds });
  }

  void mixInPlace(core::ResultAccumulator& acc, const MixStep& step) {
    for (int i = 0; i < step.mix.times; ++i) {
      acc.chain(aspirate, PipettingArgs{ step.pipette, step.mix.volume, step.labware, step.well,
                                         step.aspirateFlowRate, step.aspirateOffsetFromBottomMm });
      if (step.aspirateDelaySeconds)
        acc.chain(delay, DelayArgs{ *step.aspirateDelaySeconds });

      acc.chain(dispense, PipettingArgs{ step.pipette, step.mix.volume, step.labware, step.well,
                                         step.dispenseFlowRate, step.dispenseOffsetFromBottomMm });
      if (step.dispenseDelaySeconds)
        acc.chain(delay, DelayArgs{ *step.dispenseDelaySeconds });
    }
  }

  void touchTipAt(core::ResultAccumulator& acc, const std::string& pipette,
                  const std::string& labware, const std::string& well,
                  std::optional<double> offsetFromBottomMm) {
    const double offset = offsetFromBottomMm.value_or(offsetFromTop(
        acc.context(), labware, well, acc.context().defaults().touchTipOffsetFromTopMm));
    acc.chain(touchTip, TouchTipArgs{ pipette, labware, well, offset });
  }

  void blowoutAt(core::ResultAccumulator& acc, const std::string& pipette,
                 const model::WellLocation& location, const PipettingParams& params) {
    acc.chain(blowout,
              BlowoutArgs{ pipette, location.labware, location.well, params.blowoutFlowRate,
                           offsetFromTop(acc.context(), location.labware, location.well,
                                         params.blowoutOffsetFromTopMm) });
  }

} // namespace pipetgen::commands
