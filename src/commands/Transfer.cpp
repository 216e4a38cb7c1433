/* @file Transfer.cpp
 * @brief pair planning, volume splitting and per-chunk template for transfer
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
#include "commands/SubCommands.hpp"
#include "commands/Transfer.hpp"
#include "core/ResultAccumulator.hpp"

namespace pipetgen::commands {

  namespace {
    constexpr double kVolumeEpsilon = 1e-9;

    struct SubTransfer {
      std::string source;
      std::string dest;
      double volume{ 0.0 };
    };
  } // namespace

  std::vector<double> splitLiquid(double volume, double max) {
    if (volume <= max + kVolumeEpsilon)
      return { volume };
    if (volume < 2 * max)
      return { volume / 2, volume / 2 };

    const double whole = std::floor(volume / max);
    if (!(whole <= static_cast<double>(kMaxSplitParts)))
      return {};
    const auto wholeParts = static_cast<std::size_t>(whole);
    const double remainder = volume - static_cast<double>(wholeParts) * max;
    if (remainder <= kVolumeEpsilon)
      return std::vector<double>(wholeParts, max);

    std::vector<double> parts(wholeParts - 1, max);
    const double lastPair = (max + remainder) / 2;
    parts.push_back(lastPair);
    parts.push_back(lastPair);
    return parts;
  }

  protocols::CompilationResult transfer(const protocols::TransferArgs& args,
                                        const model::StaticContext& ctx,
                                        const model::SimulationState& state) {
    core::ResultAccumulator acc(ctx, state);

    const model::PipetteSpec* pipette = ctx.pipette(args.pipette);
    if (!pipette) {
      acc.fail(protocols::pipetteDoesNotExist(args.pipette));
      return std::move(acc).finish();
    }

    const auto& sources = args.sourceWells;
    const auto& dests = args.destWells;
    const bool pairwise = sources.size() == dests.size();
    const bool broadcast = !sources.empty() && !dests.empty() &&
                           (sources.size() == 1 || dests.size() == 1);
    if (!pairwise && !broadcast) {
      acc.fail({ protocols::ErrorKind::WellCountMismatch,
                 "Source and destination well counts must match, or one side must be a single well",
                 std::to_string(sources.size()) + " -> " + std::to_string(dests.size()) });
      return std::move(acc).finish();
    }

    const double airGapVolume = args.aspirateAirGapVolume.value_or(0.0);
    if (args.volume <= 0.0 || airGapVolume < 0.0) {
      acc.fail({ protocols::ErrorKind::InvalidArgument,
                 "Transfer volume must be positive (air gap may be zero)", args.name });
      return std::move(acc).finish();
    }

    const double capacity = pipette->maxVolume - airGapVolume;
    if (capacity <= kVolumeEpsilon) {
      acc.fail(protocols::pipetteVolumeExceeded(args.pipette, airGapVolume, pipette->maxVolume));
      return std::move(acc).finish();
    }

    const std::vector<double> parts = splitLiquid(args.volume, capacity);
    if (parts.empty()) {
      acc.fail({ protocols::ErrorKind::PipetteVolumeExceeded,
                 "Transfer volume needs more than " + std::to_string(kMaxSplitParts) +
                     " aspirations per well pair",
                 args.pipette });
      return std::move(acc).finish();
    }

    std::vector<SubTransfer> plan;
    const std::size_t pairs = std::max(sources.size(), dests.size());
    for (std::size_t i = 0; i < pairs; ++i) {
      const std::string& source = sources.size() == 1 ? sources.front() : sources[i];
      const std::string& dest = dests.size() == 1 ? dests.front() : dests[i];
      for (double part : parts)
        plan.push_back({ source, dest, part });
    }

    const PipettingParams params = resolveParams(args, *pipette, ctx.defaults());
    const auto& defaults = ctx.defaults();

    std::optional<double> aspirateDelaySeconds;
    std::optional<double> dispenseDelaySeconds;
    if (args.aspirateDelay)
      aspirateDelaySeconds = args.aspirateDelay->seconds;
    if (args.dispenseDelay)
      dispenseDelaySeconds = args.dispenseDelay->seconds;

    for (std::size_t c = 0; c < plan.size() && !acc.failed(); ++c) {
      const SubTransfer& sub = plan[c];

      if (tipChangeDue(args.changeTip, c))
        replaceTip(acc, args.pipette);

      if (args.mixBeforeAspirate)
        mixInPlace(acc, MixStep{ args.pipette, args.sourceLabware, sub.source,
                                 *args.mixBeforeAspirate, params.aspirateFlowRate,
                                 params.dispenseFlowRate, params.aspirateOffsetFromBottomMm,
                                 params.aspirateOffsetFromBottomMm, aspirateDelaySeconds,
                                 dispenseDelaySeconds });

      if (args.preWetTip)
        mixInPlace(acc, MixStep{ args.pipette, args.sourceLabware, sub.source,
                                 protocols::MixConfig{ 1, sub.volume }, params.aspirateFlowRate,
                                 params.dispenseFlowRate, params.aspirateOffsetFromBottomMm,
                                 params.aspirateOffsetFromBottomMm, aspirateDelaySeconds,
                                 dispenseDelaySeconds });

      acc.chain(aspirate, PipettingArgs{ args.pipette, sub.volume, args.sourceLabware, sub.source,
                                         params.aspirateFlowRate,
                                         params.aspirateOffsetFromBottomMm });
      if (args.aspirateDelay)
        delayWithOffset(acc, args.pipette, args.sourceLabware, sub.source, *args.aspirateDelay);

      if (args.touchTipAfterAspirate)
        touchTipAt(acc, args.pipette, args.sourceLabware, sub.source,
                   args.touchTipAfterAspirateOffsetMmFromBottom);

      if (airGapVolume > 0.0) {
        acc.chain(airGap, PipettingArgs{ args.pipette, airGapVolume, args.sourceLabware,
                                         sub.source, params.aspirateFlowRate,
                                         offsetFromTop(ctx, args.sourceLabware, sub.source,
                                                       defaults.airGapOffsetFromTopMm) });
        if (aspirateDelaySeconds)
          acc.chain(delay, DelayArgs{ *aspirateDelaySeconds });

        acc.chain(dispenseAirGap, PipettingArgs{ args.pipette, airGapVolume, args.destLabware,
                                                 sub.dest, params.dispenseFlowRate,
                                                 offsetFromTop(ctx, args.destLabware, sub.dest,
                                                               defaults.airGapOffsetFromTopMm) });
        if (dispenseDelaySeconds)
          acc.chain(delay, DelayArgs{ *dispenseDelaySeconds });
      }

      acc.chain(dispense, PipettingArgs{ args.pipette, sub.volume, args.destLabware, sub.dest,
                                         params.dispenseFlowRate,
                                         params.dispenseOffsetFromBottomMm });
      if (args.dispenseDelay)
        delayWithOffset(acc, args.pipette, args.destLabware, sub.dest, *args.dispenseDelay);

      if (args.mixInDestination)
        mixInPlace(acc, MixStep{ args.pipette, args.destLabware, sub.dest,
                                 *args.mixInDestination, params.aspirateFlowRate,
                                 params.dispenseFlowRate, params.dispenseOffsetFromBottomMm,
                                 params.dispenseOffsetFromBottomMm, aspirateDelaySeconds,
                                 dispenseDelaySeconds });

      if (args.touchTipAfterDispense)
        touchTipAt(acc, args.pipette, args.destLabware, sub.dest,
                   args.touchTipAfterDispenseOffsetMmFromBottom);

      if (args.blowoutLocation)
        blowoutAt(acc, args.pipette, *args.blowoutLocation, params);
    }

    return std::move(acc).finish();
  }

} // namespace pipetgen::commands
