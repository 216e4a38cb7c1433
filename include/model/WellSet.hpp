#pragma once
/** @file  WellSet.hpp
 *  @brief Well ordering and multichannel footprint helpers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// PipetGen headers
#include "model/StaticContext.hpp"

namespace pipetgen {
  namespace model {

    /**
     * @brief Wells touched when a pipette with \p channels channels is positioned at \p well.
     *
     * Single channel: just \p well. Eight channels: \p well and the wells below it in
     * the same column (every other row on 16-row columns). On a column shorter than
     * eight wells every channel lands in \p well, so it appears once per channel.
     * Returns an empty list if \p well is not in the labware's ordering, or if eight
     * channels placed there would run off the bottom of the column.
     */
    std::vector<std::string> channelWells(const LabwareDef& labware, const std::string& well,
                                          int channels);

    /// Column-major list of wells a pipette may be positioned at to pick up tips.
    std::vector<std::string> pickUpCandidates(const LabwareDef& tiprack, int channels);

    /// Regular `rows` x `columns` layout named A1..; every well shares one geometry.
    LabwareDef gridLabware(const std::string& id, int rows, int columns, double depthMm,
                           double maxVolume);

  } // namespace model
} // namespace pipetgen
