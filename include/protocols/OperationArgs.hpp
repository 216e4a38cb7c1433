#pragma once
/** @file  OperationArgs.hpp
 *  @brief Declarative step records consumed by the compound command creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// PipetGen headers
#include "model/StaticContext.hpp"

namespace pipetgen {
  namespace protocols {

    enum class ChangeTip { Never, Once, Always };

    inline const char* toString(ChangeTip c) {
      switch (c) {
      case ChangeTip::Never:
        return "never";
      case ChangeTip::Once:
        return "once";
      case ChangeTip::Always:
        return "always";
      default:
        return "unknown";
      }
    }

    struct MixConfig {
      int times{ 0 };
      double volume{ 0.0 };
    };

    struct DelayConfig {
      double seconds{ 0.0 };
      double mmFromBottom{ 0.0 };
    };

    /**
 * @struct TransferLikeArgs
 * @brief Fields shared by distribute, consolidate and transfer.
 *
 *  Unset flow rates fall back to the pipette defaults, unset offsets to
 *  model::CompilerDefaults.
 */
    struct TransferLikeArgs {
      std::string name;
      std::string description;

      std::string pipette;
      double volume{ 0.0 }; ///< per destination well (distribute), per source (consolidate)
      ChangeTip changeTip{ ChangeTip::Always };

      std::optional<double> aspirateFlowRateUlSec;
      std::optional<double> dispenseFlowRateUlSec;
      std::optional<double> aspirateOffsetFromBottomMm;
      std::optional<double> dispenseOffsetFromBottomMm;

      // aspirate column
      bool preWetTip{ false };
      std::optional<MixConfig> mixBeforeAspirate;
      std::optional<DelayConfig> aspirateDelay;
      bool touchTipAfterAspirate{ false };
      std::optional<double> touchTipAfterAspirateOffsetMmFromBottom;
      std::optional<double> aspirateAirGapVolume;

      // dispense column
      std::optional<DelayConfig> dispenseDelay;
      bool touchTipAfterDispense{ false };
      std::optional<double> touchTipAfterDispenseOffsetMmFromBottom;
      std::optional<double> blowoutFlowRateUlSec;
      std::optional<double> blowoutOffsetFromTopMm;
    };

    struct DistributeArgs : TransferLikeArgs {
      std::string sourceLabware;
      std::string sourceWell;
      std::string destLabware;
      std::vector<std::string> destWells;

      std::optional<double> disposalVolume;
      std::optional<std::string> disposalLabware;
      std::optional<std::string> disposalWell;
    };

    struct ConsolidateArgs : TransferLikeArgs {
      std::string sourceLabware;
      std::vector<std::string> sourceWells;
      std::string destLabware;
      std::string destWell;

      std::optional<MixConfig> mixInDestination;
      std::optional<model::WellLocation> blowoutLocation;
    };

    struct TransferArgs : TransferLikeArgs {
      std::string sourceLabware;
      std::vector<std::string> sourceWells;
      std::string destLabware;
      std::vector<std::string> destWells;

      std::optional<MixConfig> mixInDestination;
      std::optional<model::WellLocation> blowoutLocation;
    };

    struct MixArgs {
      std::string name;
      std::string description;

      std::string pipette;
      std::string labware;
      std::vector<std::string> wells;
      double volume{ 0.0 };
      int times{ 0 };
      ChangeTip changeTip{ ChangeTip::Always };

      std::optional<double> aspirateFlowRateUlSec;
      std::optional<double> dispenseFlowRateUlSec;
      std::optional<double> aspirateOffsetFromBottomMm;
      std::optional<double> dispenseOffsetFromBottomMm;
      std::optional<double> aspirateDelaySeconds;
      std::optional<double> dispenseDelaySeconds;

      bool touchTip{ false };
      std::optional<double> touchTipMmFromBottom;
      std::optional<model::WellLocation> blowoutLocation;
      std::optional<double> blowoutFlowRateUlSec;
      std::optional<double> blowoutOffsetFromTopMm;
    };

  } // namespace protocols
} // namespace pipetgen
