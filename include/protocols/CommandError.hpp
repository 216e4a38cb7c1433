#pragma once
/** @file  CommandError.hpp
 *  @brief Fatal errors and non-fatal warnings reported by command creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

namespace pipetgen {
  namespace protocols {

    enum class ErrorKind : std::uint8_t {
      PipetteDoesNotExist,
      PipetteVolumeExceeded,
      InsufficientTips,
      LabwareDoesNotExist,
      WellDoesNotExist,
      MixBadVolume,
      WellCountMismatch,
      InvalidArgument,
    };

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::PipetteDoesNotExist:
        return "PIPETTE_DOES_NOT_EXIST";
      case ErrorKind::PipetteVolumeExceeded:
        return "PIPETTE_VOLUME_EXCEEDED";
      case ErrorKind::InsufficientTips:
        return "INSUFFICIENT_TIPS";
      case ErrorKind::LabwareDoesNotExist:
        return "LABWARE_DOES_NOT_EXIST";
      case ErrorKind::WellDoesNotExist:
        return "WELL_DOES_NOT_EXIST";
      case ErrorKind::MixBadVolume:
        return "MIX_BAD_VOLUME";
      case ErrorKind::WellCountMismatch:
        return "WELL_COUNT_MISMATCH";
      case ErrorKind::InvalidArgument:
        return "INVALID_ARGUMENT";
      default:
        return "UNKNOWN";
      }
    }

    enum class WarningKind : std::uint8_t {
      AspirateFromPristineWell,
      AspirateMoreThanWellContents,
      OverMaxWellVolume,
      PreWetNotSupported,
    };

    inline const char* toString(WarningKind k) {
      switch (k) {
      case WarningKind::AspirateFromPristineWell:
        return "ASPIRATE_FROM_PRISTINE_WELL";
      case WarningKind::AspirateMoreThanWellContents:
        return "ASPIRATE_MORE_THAN_WELL_CONTENTS";
      case WarningKind::OverMaxWellVolume:
        return "OVER_MAX_WELL_VOLUME";
      case WarningKind::PreWetNotSupported:
        return "PRE_WET_NOT_SUPPORTED";
      default:
        return "UNKNOWN";
      }
    }

    struct CommandError {
      ErrorKind kind;
      std::string message;
      std::string detail; ///< offending id / well / volume, free form
      bool operator==(const CommandError&) const = default;
    };

    struct CommandWarning {
      WarningKind kind;
      std::string message;
      bool operator==(const CommandWarning&) const = default;
    };

    // factory helpers keep the message wording in one place
    CommandError pipetteDoesNotExist(const std::string& pipette);
    CommandError labwareDoesNotExist(const std::string& labware);
    CommandError wellDoesNotExist(const std::string& labware, const std::string& well);
    CommandError pipetteVolumeExceeded(const std::string& pipette, double volume, double max);
    CommandError insufficientTips(const std::string& pipette, const std::string& why);
    CommandWarning aspirateMoreThanWellContents(const std::string& labware,
                                                const std::string& well, double requested,
                                                double available);

  } // namespace protocols
} // namespace pipetgen
