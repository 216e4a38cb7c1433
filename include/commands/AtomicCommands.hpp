#pragma once
/** @file  AtomicCommands.hpp
 *  @brief Pure creators for single hardware instructions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"
#include "protocols/Instruction.hpp"

namespace pipetgen::commands {

  // Every creator has the shape
  //   StepResult creator(const Args&, const StaticContext&, const SimulationState&)
  // and never touches the state it was given.

  struct PipettingArgs {
    std::string pipette;
    double volume{ 0.0 };
    std::string labware;
    std::string well;
    double flowRate{ 0.0 };
    double offsetFromBottomMm{ 0.0 };
  };

  struct DelayArgs {
    double seconds{ 0.0 };
  };

  struct TouchTipArgs {
    std::string pipette;
    std::string labware;
    std::string well;
    double offsetFromBottomMm{ 0.0 };
  };

  struct BlowoutArgs {
    std::string pipette;
    std::string labware;
    std::string well;
    double flowRate{ 0.0 };
    double offsetFromBottomMm{ 0.0 };
  };

  struct PickUpTipArgs {
    std::string pipette;
    std::string tiprack;
    std::string well;
  };

  struct DropTipArgs {
    std::string pipette;
    std::string labware;
    std::string well;
  };

  struct MoveToWellArgs {
    std::string pipette;
    std::string labware;
    std::string well;
    protocols::Offset offset{};
  };

  /// Draws liquid; decrements every touched source well and loads its markers into the tip.
  protocols::StepResult aspirate(const PipettingArgs& args, const model::StaticContext& ctx,
                                 const model::SimulationState& state);

  /// Pushes liquid out; increments every touched destination well.
  protocols::StepResult dispense(const PipettingArgs& args, const model::StaticContext& ctx,
                                 const model::SimulationState& state);

  /// Aspirate of air: validated like aspirate, no liquid bookkeeping.
  protocols::StepResult airGap(const PipettingArgs& args, const model::StaticContext& ctx,
                               const model::SimulationState& state);

  /// Dispense of air: validated like dispense, no liquid bookkeeping.
  protocols::StepResult dispenseAirGap(const PipettingArgs& args,
                                       const model::StaticContext& ctx,
                                       const model::SimulationState& state);

  protocols::StepResult delay(const DelayArgs& args, const model::StaticContext& ctx,
                              const model::SimulationState& state);

  protocols::StepResult moveToWell(const MoveToWellArgs& args, const model::StaticContext& ctx,
                                   const model::SimulationState& state);

  protocols::StepResult touchTip(const TouchTipArgs& args, const model::StaticContext& ctx,
                                 const model::SimulationState& state);

  /// Expels whatever the tip holds into the target well; the tip loses its markers.
  protocols::StepResult blowout(const BlowoutArgs& args, const model::StaticContext& ctx,
                                const model::SimulationState& state);

  /// Fails INSUFFICIENT_TIPS when any rack well under the pipette's channels is consumed.
  protocols::StepResult pickUpTip(const PickUpTipArgs& args, const model::StaticContext& ctx,
                                  const model::SimulationState& state);

  protocols::StepResult dropTip(const DropTipArgs& args, const model::StaticContext& ctx,
                                const model::SimulationState& state);

} // namespace pipetgen::commands
