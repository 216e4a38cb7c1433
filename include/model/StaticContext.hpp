#pragma once
/** @file  StaticContext.hpp
 *  @brief Read-only registries of pipettes, labware and modules for one compilation session.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipetgen {
  namespace model {

    struct FlowRates {
      double aspirate{ 0.0 }; ///< uL/s
      double dispense{ 0.0 }; ///< uL/s
      double blowout{ 0.0 };  ///< uL/s
    };

    struct PipetteSpec {
      std::string id;
      std::string name;
      double maxVolume{ 0.0 }; ///< uL per channel
      int channels{ 1 };       ///< 1 or 8
      FlowRates defaultFlowRates{};
      std::vector<std::string> tiprackIds; ///< searched in order for the next tip
    };

    struct WellGeometry {
      double depthMm{ 0.0 };
      double maxVolume{ 0.0 }; ///< uL
      double x{ 0.0 };
      double y{ 0.0 };
    };

    /**
 * @struct LabwareDef
 * @brief Well layout of one piece of labware on the deck.
 *
 *  * `ordering` lists columns left to right, each column top to bottom
 *    (column-major, the order tips are consumed in).
 */
    struct LabwareDef {
      std::string id;
      std::string displayName;
      std::string slot;
      std::optional<std::string> moduleId;
      bool isTiprack{ false };
      bool isTrash{ false };
      std::vector<std::vector<std::string>> ordering;
      std::map<std::string, WellGeometry> wells;

      const WellGeometry* well(const std::string& name) const;
    };

    struct ModuleDef {
      std::string id;
      std::string model;
      std::string slot;
    };

    struct WellLocation {
      std::string labware;
      std::string well;
      bool operator==(const WellLocation&) const = default;
    };

    /// Fallback offsets used when an operation leaves them unset.
    struct CompilerDefaults {
      double aspirateOffsetFromBottomMm{ 1.0 };
      double dispenseOffsetFromBottomMm{ 0.5 };
      double touchTipOffsetFromTopMm{ -1.0 };
      double airGapOffsetFromTopMm{ 1.0 };
      double blowoutOffsetFromTopMm{ 0.0 };
    };

    /**
 * @class StaticContext
 * @brief Immutable catalog shared (by `shared_ptr<const StaticContext>`) across a run.
 *
 *  * Built once by the caller or by io::contextFromJson; never mutated afterwards.
 *  * Lookups return nullptr for unknown ids; callers turn that into a CommandError.
 */
    class StaticContext {
    public:
      StaticContext(std::map<std::string, PipetteSpec> pipettes,
                    std::map<std::string, LabwareDef> labware,
                    std::map<std::string, ModuleDef> modules, WellLocation trash,
                    CompilerDefaults defaults = {});

      const PipetteSpec* pipette(const std::string& id) const;
      const LabwareDef* labware(const std::string& id) const;
      const ModuleDef* module(const std::string& id) const;

      /// Labware `labwareId` sits on, if any.
      const ModuleDef* moduleUnder(const std::string& labwareId) const;

      const WellLocation& trash() const { return trash_; }
      const CompilerDefaults& defaults() const { return defaults_; }

      const std::map<std::string, PipetteSpec>& pipettes() const { return pipettes_; }
      const std::map<std::string, LabwareDef>& allLabware() const { return labware_; }

    private:
      std::map<std::string, PipetteSpec> pipettes_;
      std::map<std::string, LabwareDef> labware_;
      std::map<std::string, ModuleDef> modules_;
      WellLocation trash_;
      CompilerDefaults defaults_;
    };

  } // namespace model
} // namespace pipetgen
