#pragma once
/** @file  Instruction.hpp
 *  @brief Closed set of atomic hardware instructions emitted by the compiler.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>

namespace pipetgen {
  namespace protocols {

    enum class InstructionKind : std::uint8_t {
      Aspirate,
      Dispense,
      AirGap,
      DispenseAirGap,
      Delay,
      TouchTip,
      Blowout,
      PickUpTip,
      DropTip,
      MoveToWell,
      Count
    };
    static_assert(static_cast<std::uint8_t>(InstructionKind::Count) == 10,
                  "Instruction kind count changed please update the wire codec");

    inline const char* toString(InstructionKind k) {
      switch (k) {
      case InstructionKind::Aspirate:
        return "aspirate";
      case InstructionKind::Dispense:
        return "dispense";
      case InstructionKind::AirGap:
        return "airGap";
      case InstructionKind::DispenseAirGap:
        return "dispenseAirGap";
      case InstructionKind::Delay:
        return "delay";
      case InstructionKind::TouchTip:
        return "touchTip";
      case InstructionKind::Blowout:
        return "blowout";
      case InstructionKind::PickUpTip:
        return "pickUpTip";
      case InstructionKind::DropTip:
        return "dropTip";
      case InstructionKind::MoveToWell:
        return "moveToWell";
      default:
        return "unknown";
      }
    }

    // shared shape of aspirate / dispense / airGap / dispenseAirGap
    struct LiquidMove {
      std::string pipette;
      double volume{ 0.0 };
      std::string labware;
      std::string well;
      double offsetFromBottomMm{ 0.0 };
      double flowRate{ 0.0 };
      bool operator==(const LiquidMove&) const = default;
    };

    struct Aspirate : LiquidMove {
      bool operator==(const Aspirate&) const = default;
    };
    struct Dispense : LiquidMove {
      bool operator==(const Dispense&) const = default;
    };
    struct AirGap : LiquidMove {
      bool operator==(const AirGap&) const = default;
    };
    struct DispenseAirGap : LiquidMove {
      bool operator==(const DispenseAirGap&) const = default;
    };

    struct Delay {
      double waitSeconds{ 0.0 };
      bool operator==(const Delay&) const = default;
    };

    struct TouchTip {
      std::string pipette;
      std::string labware;
      std::string well;
      double offsetFromBottomMm{ 0.0 };
      bool operator==(const TouchTip&) const = default;
    };

    struct Blowout {
      std::string pipette;
      std::string labware;
      std::string well;
      double flowRate{ 0.0 };
      double offsetFromBottomMm{ 0.0 };
      bool operator==(const Blowout&) const = default;
    };

    struct PickUpTip {
      std::string pipette;
      std::string labware;
      std::string well;
      bool operator==(const PickUpTip&) const = default;
    };

    struct DropTip {
      std::string pipette;
      std::string labware;
      std::string well;
      bool operator==(const DropTip&) const = default;
    };

    struct Offset {
      double x{ 0.0 };
      double y{ 0.0 };
      double z{ 0.0 };
      bool operator==(const Offset&) const = default;
    };

    struct MoveToWell {
      std::string pipette;
      std::string labware;
      std::string well;
      Offset offset{};
      bool operator==(const MoveToWell&) const = default;
    };

    using InstructionParams = std::variant<Aspirate, Dispense, AirGap, DispenseAirGap, Delay,
                                           TouchTip, Blowout, PickUpTip, DropTip, MoveToWell>;

    /**
 * @struct Instruction
 * @brief One immutable hardware step. Order in the output list is the contract.
 *
 *  * The variant index matches InstructionKind, so `kind()` is exhaustive by construction.
 *  * Streams as its wire record (see io/JsonCodec.hpp).
 */
    struct Instruction {
      InstructionParams params;

      InstructionKind kind() const { return static_cast<InstructionKind>(params.index()); }

      template <typename T> const T* as() const { return std::get_if<T>(&params); }

      bool operator==(const Instruction&) const = default;
    };

    /// Prints the JSON wire record; defined in src/io/JsonCodec.cpp.
    std::ostream& operator<<(std::ostream& os, const Instruction& instruction);

  } // namespace protocols
} // namespace pipetgen
