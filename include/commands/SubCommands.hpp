#pragma once
/** @file  SubCommands.hpp
 *  @brief Instruction sub-sequences shared by the compound creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>

// PipetGen headers
#include "core/ResultAccumulator.hpp"
#include "model/StaticContext.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::commands {

  /// Flow rates and offsets with every fallback applied.
  struct PipettingParams {
    double aspirateFlowRate{ 0.0 };
    double dispenseFlowRate{ 0.0 };
    double aspirateOffsetFromBottomMm{ 0.0 };
    double dispenseOffsetFromBottomMm{ 0.0 };
    double blowoutFlowRate{ 0.0 };
    double blowoutOffsetFromTopMm{ 0.0 };
  };

  PipettingParams resolveParams(const protocols::TransferLikeArgs& args,
                                const model::PipetteSpec& pipette,
                                const model::CompilerDefaults& defaults);

  PipettingParams resolveParams(const protocols::MixArgs& args, const model::PipetteSpec& pipette,
                                const model::CompilerDefaults& defaults);

  /// Depth of the well plus \p mmFromTop; 0 + \p mmFromTop for unknown wells
  /// (the atomic creator reports those).
  double offsetFromTop(const model::StaticContext& ctx, const std::string& labware,
                       const std::string& well, double mmFromTop);

  /// Whether a fresh tip is due before chunk \p chunkIndex under \p policy.
  bool tipChangeDue(protocols::ChangeTip policy, std::size_t chunkIndex);

  /// First rack well (in the pipette's tip rack order) the pipette can pick up from.
  std::optional<model::WellLocation> nextTip(const model::StaticContext& ctx,
                                             const model::SimulationState& state,
                                             const std::string& pipette);

  /// Drop the current tip (if any) into the trash and pick up the next one.
  void replaceTip(core::ResultAccumulator& acc, const std::string& pipette);

  /// Move to \p mmFromBottom above the well bottom and wait there.
  void delayWithOffset(core::ResultAccumulator& acc, const std::string& pipette,
                       const std::string& labware, const std::string& well,
                       const protocols::DelayConfig& config);

  struct MixStep {
    std::string pipette;
    std::string labware;
    std::string well;
    protocols::MixConfig mix;
    double aspirateFlowRate{ 0.0 };
    double dispenseFlowRate{ 0.0 };
    double aspirateOffsetFromBottomMm{ 0.0 };
    double dispenseOffsetFromBottomMm{ 0.0 };
    std::optional<double> aspirateDelaySeconds;
    std::optional<double> dispenseDelaySeconds;
  };

  /// `times` x [aspirate, delay?, dispense, delay?] in one well.
  void mixInPlace(core::ResultAccumulator& acc, const MixStep& step);

  /// Touch tip, falling back to the configured offset below the well top.
  void touchTipAt(core::ResultAccumulator& acc, const std::string& pipette,
                  const std::string& labware, const std::string& well,
                  std::optional<double> offsetFromBottomMm);

  void blowoutAt(core::ResultAccumulator& acc, const std::string& pipette,
                 const model::WellLocation& location, const PipettingParams& params);

} // namespace pipetgen::commands
