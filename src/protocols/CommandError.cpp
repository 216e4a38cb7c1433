/* @file CommandError.cpp
 * @brief canned error constructors shared by atomic and compound creators
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>

// PipetGen headers
#include "protocols/CommandError.hpp"

namespace pipetgen {
  namespace protocols {

    CommandError pipetteDoesNotExist(const std::string& pipette) {
      return { ErrorKind::PipetteDoesNotExist,
               "Attempted to use a pipette that does not exist", pipette };
    }

    CommandError labwareDoesNotExist(const std::string& labware) {
      return { ErrorKind::LabwareDoesNotExist,
               "Attempted to interact with labware that does not exist", labware };
    }

    CommandError wellDoesNotExist(const std::string& labware, const std::string& well) {
      return { ErrorKind::WellDoesNotExist, "Attempted to use a well that does not exist",
               labware + "/" + well };
    }

    CommandError pipetteVolumeExceeded(const std::string& pipette, double volume, double max) {
      std::ostringstream detail;
      detail << pipette << ": requested " << volume << " uL, capacity " << max << " uL";
      return { ErrorKind::PipetteVolumeExceeded,
               "Attempted to move more liquid than the pipette can hold", detail.str() };
    }

    CommandError insufficientTips(const std::string& pipette, const std::string& why) {
      return { ErrorKind::InsufficientTips, why, pipette };
    }

    CommandWarning aspirateMoreThanWellContents(const std::string& labware,
                                                const std::string& well, double requested,
                                                double available) {
      std::ostringstream message;
      message << "Aspirating " << requested << " uL from " << labware << "/" << well
              << ", which holds " << available << " uL";
      return { WarningKind::AspirateMoreThanWellContents, message.str() };
    }

  } // namespace protocols
} // namespace pipetgen
