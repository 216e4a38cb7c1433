/* @file CreatorRegistry.cpp
 * @brief name -> creator lookup for JSON step records
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// Third-party headers
#include <nlohmann/json.hpp>

// PipetGen headers
#include "commands/CompoundCommand.hpp"
#include "core/CreatorRegistry.hpp"
#include "io/JsonCodec.hpp"

using namespace pipetgen::core;
using pipetgen::commands::CompoundCommand;

namespace {

  template <typename Args> CreatorRegistry::Creator decoderFor() {
    return [](const nlohmann::json& record) -> std::unique_ptr<CompoundCommand> {
      return pipetgen::commands::makeCommand(record.get<Args>());
    };
  }

} // namespace

CreatorRegistry CreatorRegistry::withDefaults() {
  CreatorRegistry registry;
  registry.registerCreator("distribute", decoderFor<pipetgen::protocols::DistributeArgs>());
  registry.registerCreator("consolidate", decoderFor<pipetgen::protocols::ConsolidateArgs>());
  registry.registerCreator("transfer", decoderFor<pipetgen::protocols::TransferArgs>());
  registry.registerCreator("mix", decoderFor<pipetgen::protocols::MixArgs>());
  return registry;
}

bool CreatorRegistry::registerCreator(const std::string& name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

bool CreatorRegistry::contains(const std::string& name) const {
  return creators_.count(name) != 0;
}

std::vector<std::string> CreatorRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, creator] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

std::unique_ptr<CompoundCommand> CreatorRegistry::create(const std::string& name,
                                                         const nlohmann::json& record) const {
  const auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[CreatorRegistry] no creator registered for: " + name);

  try {
    return it->second(record);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("[CreatorRegistry] malformed " + name + " record: " + e.what());
  }
}

std::unique_ptr<CompoundCommand> CreatorRegistry::create(const nlohmann::json& record) const {
  const auto it = record.find("commandCreatorFnName");
  if (it == record.end() || !it->is_string())
    throw std::runtime_error("[CreatorRegistry] step record has no commandCreatorFnName");
  return create(it->get<std::string>(), record);
}
