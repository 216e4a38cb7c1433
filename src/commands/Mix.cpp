/* @file Mix.cpp
 * @brief in-place mixing across a list of wells
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// PipetGen headers
#include "commands/Mix.hpp"
#include "commands/SubCommands.hpp"
#include "core/ResultAccumulator.hpp"

namespace pipetgen::commands {

  protocols::CompilationResult mix(const protocols::MixArgs& args, const model::StaticContext& ctx,
                                   const model::SimulationState& state) {
    core::ResultAccumulator acc(ctx, state);

    const model::PipetteSpec* pipette = ctx.pipette(args.pipette);
    if (!pipette) {
      acc.fail(protocols::pipetteDoesNotExist(args.pipette));
      return std::move(acc).finish();
    }

    if (args.volume <= 0.0 || args.volume > pipette->maxVolume) {
      acc.fail({ protocols::ErrorKind::MixBadVolume,
                 "Mix volume must be positive and within the pipette's capacity",
                 std::to_string(args.volume) + " uL on " + args.pipette });
      return std::move(acc).finish();
    }
    if (args.times < 1) {
      acc.fail({ protocols::ErrorKind::InvalidArgument, "Mix repetitions must be at least 1",
                 std::to_string(args.times) });
      return std::move(acc).finish();
    }

    const PipettingParams params = resolveParams(args, *pipette, ctx.defaults());

    for (std::size_t w = 0; w < args.wells.size() && !acc.failed(); ++w) {
      const std::string& well = args.wells[w];

      if (tipChangeDue(args.changeTip, w))
        replaceTip(acc, args.pipette);

      mixInPlace(acc, MixStep{ args.pipette, args.labware, well,
                               protocols::MixConfig{ args.times, args.volume },
                               params.aspirateFlowRate, params.dispenseFlowRate,
                               params.aspirateOffsetFromBottomMm, params.dispenseOffsetFromBottomMm,
                               args.aspirateDelaySeconds, args.dispenseDelaySeconds });

      if (args.blowoutLocation)
        blowoutAt(acc, args.pipette, *args.blowoutLocation, params);

      if (args.touchTip)
        touchTipAt(acc, args.pipette, args.labware, well, args.touchTipMmFromBottom);
    }

    return std::move(acc).finish();
  }

} // namespace pipetgen::commands
