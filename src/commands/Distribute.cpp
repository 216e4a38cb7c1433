/* @file Distribute.cpp
 * @brief chunk planning and per-chunk instruction template for distribute
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

// PipetGen headers
#include "commands/AtomicCommands.hpp"
#include "commands/Distribute.hpp"
#include "commands/SubCommands.hpp"
#include "core/ResultAccumulator.hpp"

namespace pipetgen::commands {

  namespace {
    constexpr double kVolumeEpsilon = 1e-9;
  }

  std::vector<std::vector<std::string>> chunkWells(const std::vector<std::string>& wells,
                                                   std::size_t maxPerChunk) {
    std::vector<std::vector<std::string>> chunks;
    if (maxPerChunk == 0)
      return chunks;
    for (std::size_t i = 0; i < wells.size(); i += maxPerChunk) {
      const std::size_t end = std::min(wells.size(), i + maxPerChunk);
      chunks.emplace_back(wells.begin() + i, wells.begin() + end);
    }
    return chunks;
  }

  protocols::CompilationResult distribute(const protocols::DistributeArgs& args,
                                          const model::StaticContext& ctx,
                                          const model::SimulationState& state) {
    core::ResultAccumulator acc(ctx, state);

    const model::PipetteSpec* pipette = ctx.pipette(args.pipette);
    if (!pipette) {
      acc.fail(protocols::pipetteDoesNotExist(args.pipette));
      return std::move(acc).finish();
    }

    const double disposal = args.disposalVolume.value_or(0.0);
    const double airGapVolume = args.aspirateAirGapVolume.value_or(0.0);
    if (args.volume <= 0.0 || disposal < 0.0 || airGapVolume < 0.0) {
      acc.fail({ protocols::ErrorKind::InvalidArgument,
                 "Distribute volumes must be positive (disposal and air gap may be zero)",
                 args.name });
      return std::move(acc).finish();
    }

    // capacity check happens before any chunk is planned
    const double maxVolumePerChunk = pipette->maxVolume - disposal - airGapVolume;
    if (args.volume > maxVolumePerChunk + kVolumeEpsilon) {
      acc.fail(protocols::pipetteVolumeExceeded(args.pipette, args.volume + disposal + airGapVolume,
                                                pipette->maxVolume));
      return std::move(acc).finish();
    }

    // clamp in double so a tiny per-well volume cannot overflow the cast
    const double fit = std::floor(maxVolumePerChunk / args.volume + kVolumeEpsilon);
    const auto maxWellsPerChunk = static_cast<std::size_t>(
        std::max(1.0, std::min(fit, static_cast<double>(std::max<std::size_t>(
                                        args.destWells.size(), 1)))));
    const PipettingParams params = resolveParams(args, *pipette, ctx.defaults());
    const model::WellLocation disposalLocation{
      args.disposalLabware.value_or(ctx.trash().labware),
      args.disposalWell.value_or(ctx.trash().well)
    };
    const double airGapOffset = offsetFromTop(ctx, args.sourceLabware, args.sourceWell,
                                              ctx.defaults().airGapOffsetFromTopMm);

    if (args.preWetTip)
      acc.warn({ protocols::WarningKind::PreWetNotSupported,
                 "Pre-wet tip is not available for distribute; no pre-wet was compiled" });

    std::optional<double> aspirateDelaySeconds;
    std::optional<double> dispenseDelaySeconds;
    if (args.aspirateDelay)
      aspirateDelaySeconds = args.aspirateDelay->seconds;
    if (args.dispenseDelay)
      dispenseDelaySeconds = args.dispenseDelay->seconds;

    const auto chunks = chunkWells(args.destWells, maxWellsPerChunk);
    for (std::size_t c = 0; c < chunks.size() && !acc.failed(); ++c) {
      const auto& chunk = chunks[c];

      if (tipChangeDue(args.changeTip, c))
        replaceTip(acc, args.pipette);

      // mix dispenses back at the aspirate height
      if (args.mixBeforeAspirate)
        mixInPlace(acc, MixStep{ args.pipette, args.sourceLabware, args.sourceWell,
                                 *args.mixBeforeAspirate, params.aspirateFlowRate,
                                 params.dispenseFlowRate, params.aspirateOffsetFromBottomMm,
                                 params.aspirateOffsetFromBottomMm, aspirateDelaySeconds,
                                 dispenseDelaySeconds });

      const double aspirateVolume = static_cast<double>(chunk.size()) * args.volume + disposal;
      acc.chain(aspirate, PipettingArgs{ args.pipette, aspirateVolume, args.sourceLabware,
                                         args.sourceWell, params.aspirateFlowRate,
                                         params.aspirateOffsetFromBottomMm });
      if (args.aspirateDelay)
        delayWithOffset(acc, args.pipette, args.sourceLabware, args.sourceWell,
                        *args.aspirateDelay);

      if (args.touchTipAfterAspirate)
        touchTipAt(acc, args.pipette, args.sourceLabware, args.sourceWell,
                   args.touchTipAfterAspirateOffsetMmFromBottom);

      const bool tookAirGap = airGapVolume > 0.0;
      if (tookAirGap) {
        acc.chain(airGap, PipettingArgs{ args.pipette, airGapVolume, args.sourceLabware,
                                         args.sourceWell, params.aspirateFlowRate, airGapOffset });
        if (aspirateDelaySeconds)
          acc.chain(delay, DelayArgs{ *aspirateDelaySeconds });
      }

      for (std::size_t w = 0; w < chunk.size(); ++w) {
        const std::string& well = chunk[w];

        // the single air gap of the chunk leaves into the first destination
        if (tookAirGap && w == 0) {
          acc.chain(dispenseAirGap,
                    PipettingArgs{ args.pipette, airGapVolume, args.destLabware, well,
                                   params.dispenseFlowRate,
                                   offsetFromTop(ctx, args.destLabware, well,
                                                 ctx.defaults().airGapOffsetFromTopMm) });
          if (dispenseDelaySeconds)
            acc.chain(delay, DelayArgs{ *dispenseDelaySeconds });
        }

        acc.chain(dispense, PipettingArgs{ args.pipette, args.volume, args.destLabware, well,
                                           params.dispenseFlowRate,
                                           params.dispenseOffsetFromBottomMm });
        if (args.dispenseDelay)
          delayWithOffset(acc, args.pipette, args.destLabware, well, *args.dispenseDelay);

        if (args.touchTipAfterDispense)
          touchTipAt(acc, args.pipette, args.destLabware, well,
                     args.touchTipAfterDispenseOffsetMmFromBottom);
      }

      if (disposal > 0.0)
        blowoutAt(acc, args.pipette, disposalLocation, params);
    }

    return std::move(acc).finish();
  }

} // namespace pipetgen::commands
