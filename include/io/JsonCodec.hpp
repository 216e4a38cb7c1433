#pragma once
/** @file  JsonCodec.hpp
 *  @brief nlohmann::json mappings for the wire record, step records and the catalog.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// Third-party headers
#include <nlohmann/json_fwd.hpp>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CommandError.hpp"
#include "protocols/Instruction.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::protocols {

  // ADL hooks so `nlohmann::json j = instruction;` and `j.get<DistributeArgs>()` work.
  // Wire record: {kind, pipetteId, labwareId, well, volume?, flowRate?,
  //               offsetFromBottomMm?, moveOffset?}
  // A delay targets no pipette or well, so its record is only {kind, waitSeconds}.
  void to_json(nlohmann::json& j, const Instruction& instruction);
  void from_json(const nlohmann::json& j, Instruction& instruction);

  void to_json(nlohmann::json& j, const CommandError& error);
  void to_json(nlohmann::json& j, const CommandWarning& warning);

  void from_json(const nlohmann::json& j, DistributeArgs& args);
  void from_json(const nlohmann::json& j, ConsolidateArgs& args);
  void from_json(const nlohmann::json& j, TransferArgs& args);
  void from_json(const nlohmann::json& j, MixArgs& args);

} // namespace pipetgen::protocols

namespace pipetgen::io {

  /// One instruction as a single JSON line terminated by "\r\n".
  std::string toWire(const protocols::Instruction& instruction);

  /// Inverse of toWire(); throws `std::runtime_error` on a malformed record.
  protocols::Instruction fromWire(const std::string& line);

  /**
   * @brief Build the static context from a catalog document.
   *
   * Expects `pipettes`, `labware` and `trash`; `modules` and `defaults` are optional.
   * A labware entry either lists `ordering` + `wells` or gives a `grid`
   * {rows, columns, depth, maxVolume}. Throws `std::runtime_error` on malformed input.
   */
  std::shared_ptr<const model::StaticContext> contextFromJson(const nlohmann::json& catalog);

  /// Full tip racks plus the optional `initialState` {tips, liquids} section of \p catalog.
  model::SimulationState initialStateFromJson(const nlohmann::json& catalog,
                                              const model::StaticContext& ctx);

} // namespace pipetgen::io
