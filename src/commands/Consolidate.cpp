/* @file Consolidate.cpp
 * @brief chunk planning and per-chunk instruction template for consolidate
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

// PipetGen headers
#include "commands/AtomicCommands.hpp"
#include "commands/Consolidate.hpp"
#include "commands/Distribute.hpp" // chunkWells
#include "commands/SubCommands.hpp"
#include "core/ResultAccumulator.hpp"

namespace pipetgen::commands {

  namespace {
    constexpr double kVolumeEpsilon = 1e-9;
  }

  protocols::CompilationResult consolidate(const protocols::ConsolidateArgs& args,
                                           const model::StaticContext& ctx,
                                           const model::SimulationState& state) {
    core::ResultAccumulator acc(ctx, state);

    const model::PipetteSpec* pipette = ctx.pipette(args.pipette);
    if (!pipette) {
      acc.fail(protocols::pipetteDoesNotExist(args.pipette));
      return std::move(acc).finish();
    }

    const double airGapVolume = args.aspirateAirGapVolume.value_or(0.0);
    if (args.volume <= 0.0 || airGapVolume < 0.0) {
      acc.fail({ protocols::ErrorKind::InvalidArgument,
                 "Consolidate volume must be positive (air gap may be zero)", args.name });
      return std::move(acc).finish();
    }

    // every source leaves its own air gap in the tip
    const double perSource = args.volume + airGapVolume;
    const double fit = std::floor(pipette->maxVolume / perSource + kVolumeEpsilon);
    if (fit < 1.0) {
      acc.fail(protocols::pipetteVolumeExceeded(args.pipette, perSource, pipette->maxVolume));
      return std::move(acc).finish();
    }
    // clamp in double so a tiny per-source volume cannot overflow the cast
    const auto wellsPerChunk = static_cast<std::size_t>(std::min(
        fit, static_cast<double>(std::max<std::size_t>(args.sourceWells.size(), 1))));

    const PipettingParams params = resolveParams(args, *pipette, ctx.defaults());
    const auto& defaults = ctx.defaults();

    std::optional<double> aspirateDelaySeconds;
    std::optional<double> dispenseDelaySeconds;
    if (args.aspirateDelay)
      aspirateDelaySeconds = args.aspirateDelay->seconds;
    if (args.dispenseDelay)
      dispenseDelaySeconds = args.dispenseDelay->seconds;

    const auto chunks = chunkWells(args.sourceWells, wellsPerChunk);
    for (std::size_t c = 0; c < chunks.size() && !acc.failed(); ++c) {
      const auto& chunk = chunks[c];

      if (tipChangeDue(args.changeTip, c))
        replaceTip(acc, args.pipette);

      for (std::size_t s = 0; s < chunk.size(); ++s) {
        const std::string& source = chunk[s];

        // only the first source sees a clean tip
        if (s == 0 && args.mixBeforeAspirate)
          mixInPlace(acc, MixStep{ args.pipette, args.sourceLabware, source,
                                   *args.mixBeforeAspirate, params.aspirateFlowRate,
                                   params.dispenseFlowRate, params.aspirateOffsetFromBottomMm,
                                   params.aspirateOffsetFromBottomMm, aspirateDelaySeconds,
                                   dispenseDelaySeconds });
        if (s == 0 && args.preWetTip)
          mixInPlace(acc, MixStep{ args.pipette, args.sourceLabware, source,
                                   protocols::MixConfig{ 1, args.volume }, params.aspirateFlowRate,
                                   params.dispenseFlowRate, params.aspirateOffsetFromBottomMm,
                                   params.aspirateOffsetFromBottomMm, aspirateDelaySeconds,
                                   dispenseDelaySeconds });

        acc.chain(aspirate, PipettingArgs{ args.pipette, args.volume, args.sourceLabware, source,
                                           params.aspirateFlowRate,
                                           params.aspirateOffsetFromBottomMm });
        if (args.aspirateDelay)
          delayWithOffset(acc, args.pipette, args.sourceLabware, source, *args.aspirateDelay);

        if (args.touchTipAfterAspirate)
          touchTipAt(acc, args.pipette, args.sourceLabware, source,
                     args.touchTipAfterAspirateOffsetMmFromBottom);

        if (airGapVolume > 0.0) {
          acc.chain(airGap, PipettingArgs{ args.pipette, airGapVolume, args.sourceLabware, source,
                                           params.aspirateFlowRate,
                                           offsetFromTop(ctx, args.sourceLabware, source,
                                                         defaults.airGapOffsetFromTopMm) });
          if (aspirateDelaySeconds)
            acc.chain(delay, DelayArgs{ *aspirateDelaySeconds });
        }
      }

      const double chunkSize = static_cast<double>(chunk.size());
      if (airGapVolume > 0.0) {
        acc.chain(dispenseAirGap,
                  PipettingArgs{ args.pipette, chunkSize * airGapVolume, args.destLabware,
                                 args.destWell, params.dispenseFlowRate,
                                 offsetFromTop(ctx, args.destLabware, args.destWell,
                                               defaults.airGapOffsetFromTopMm) });
        if (dispenseDelaySeconds)
          acc.chain(delay, DelayArgs{ *dispenseDelaySeconds });
      }

      acc.chain(dispense, PipettingArgs{ args.pipette, chunkSize * args.volume, args.destLabware,
                                         args.destWell, params.dispenseFlowRate,
                                         params.dispenseOffsetFromBottomMm });
      if (args.dispenseDelay)
        delayWithOffset(acc, args.pipette, args.destLabware, args.destWell, *args.dispenseDelay);

      if (args.mixInDestination)
        mixInPlace(acc, MixStep{ args.pipette, args.destLabware, args.destWell,
                                 *args.mixInDestination, params.aspirateFlowRate,
                                 params.dispenseFlowRate, params.dispenseOffsetFromBottomMm,
                                 params.dispenseOffsetFromBottomMm, aspirateDelaySeconds,
                                 dispenseDelaySeconds });

      if (args.touchTipAfterDispense)
        touchTipAt(acc, args.pipette, args.destLabware, args.destWell,
                   args.touchTipAfterDispenseOffsetMmFromBottom);

      if (args.blowoutLocation)
        blowoutAt(acc, args.pipette, *args.blowoutLocation, params);
    }

    return std::move(acc).finish();
  }

} // namespace pipetgen::commands
