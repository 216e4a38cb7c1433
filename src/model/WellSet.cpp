/* @file WellSet.cpp
 * @brief column walking for multichannel pipettes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <utility>

// PipetGen headers
#include "model/StaticContext.hpp"
#include "model/WellSet.hpp"

namespace pipetgen {
  namespace model {

    namespace {
      constexpr int kMultiChannelCount = 8;
      constexpr std::size_t kDenseColumnRows = 16; // 384 layout: channels skip a row
    } // namespace

    std::vector<std::string> channelWells(const LabwareDef& labware, const std::string& well,
                                          int channels) {
      for (const auto& column : labware.ordering) {
        for (std::size_t row = 0; row < column.size(); ++row) {
          if (column[row] != well)
            continue;

          if (channels != kMultiChannelCount)
            return { well };

          if (column.size() < kMultiChannelCount)
            return std::vector<std::string>(kMultiChannelCount, well);

          const std::size_t step = column.size() >= kDenseColumnRows ? 2 : 1;
          std::vector<std::string> touched;
          for (std::size_t r = row; r < column.size() && touched.size() < kMultiChannelCount;
               r += step)
            touched.push_back(column[r]);
          // channels that would hang past the last row make the position unreachable
          if (touched.size() < kMultiChannelCount)
            return {};
          return touched;
        }
      }
      return {};
    }

    std::vector<std::string> pickUpCandidates(const LabwareDef& tiprack, int channels) {
      std::vector<std::string> out;
      for (const auto& column : tiprack.ordering) {
        if (column.empty())
          continue;
        if (channels == kMultiChannelCount) {
          out.push_back(column.front());
          continue;
        }
        out.insert(out.end(), column.begin(), column.end());
      }
      return out;
    }

    LabwareDef gridLabware(const std::string& id, int rows, int columns, double depthMm,
                           double maxVolume) {
      LabwareDef lw;
      lw.id = id;
      lw.displayName = id;
      for (int c = 0; c < columns; ++c) {
        std::vector<std::string> column;
        for (int r = 0; r < rows; ++r) {
          // rows past Z continue as AA, AB, ... the way 1536 plates are named
          std::string row = r < 26 ? std::string(1, static_cast<char>('A' + r))
                                   : std::string("A") + static_cast<char>('A' + (r - 26));
          std::string name = row + std::to_string(c + 1);
          lw.wells[name] = WellGeometry{ depthMm, maxVolume, 9.0 * c, -9.0 * r };
          column.push_back(std::move(name));
        }
        lw.ordering.push_back(std::move(column));
      }
      return lw;
    }

  } // namespace model
} // namespace pipetgen
