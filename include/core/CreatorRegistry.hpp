#pragma once
/** @file  CreatorRegistry.hpp
 *  @brief Runtime registry that maps step names to compound command creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pipetgen::commands {
  class CompoundCommand;
}

namespace pipetgen::core {

  /**
 * @class CreatorRegistry
 * @brief Register & instantiate compound commands by string key.
 *
 *  * Keeps ProtocolCompiler decoupled from concrete step kinds.
 *  * Creators decode a JSON step record into a `unique_ptr<CompoundCommand>`.
 */
  class CreatorRegistry {
  public:
    using Creator =
        std::function<std::unique_ptr<commands::CompoundCommand>(const nlohmann::json&)>;

    /// Registry holding distribute, consolidate, transfer and mix.
    static CreatorRegistry withDefaults();

    /// Register a creator under \p name.  Returns false on duplicate.
    bool registerCreator(const std::string& name, Creator maker);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const; ///< sorted

    /// Decode \p record with the creator for \p name.
    /// Throws `std::out_of_range` if unknown, `std::runtime_error` on a malformed record.
    std::unique_ptr<commands::CompoundCommand> create(const std::string& name,
                                                      const nlohmann::json& record) const;

    /// As create(), keyed by the record's own `commandCreatorFnName` field.
    std::unique_ptr<commands::CompoundCommand> create(const nlohmann::json& record) const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace pipetgen::core
