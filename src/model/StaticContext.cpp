/* @file StaticContext.cpp
 * @brief registry lookups for the immutable compilation context
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// PipetGen headers
#include "model/StaticContext.hpp"

using namespace pipetgen::model;

const WellGeometry* LabwareDef::well(const std::string& name) const {
  auto it = wells.find(name);
  return it == wells.end() ? nullptr : &it->second;
}

StaticContext::StaticContext(std::map<std::string, PipetteSpec> pipettes,
                             std::map<std::string, LabwareDef> labware,
                             std::map<std::string, ModuleDef> modules, WellLocation trash,
                             CompilerDefaults defaults)
    : pipettes_(std::move(pipettes)), labware_(std::move(labware)),
      modules_(std::move(modules)), trash_(std::move(trash)), defaults_(defaults) {}

const PipetteSpec* StaticContext::pipette(const std::string& id) const {
  auto it = pipettes_.find(id);
  return it == pipettes_.end() ? nullptr : &it->second;
}

const LabwareDef* StaticContext::labware(const std::string& id) const {
  auto it = labware_.find(id);
  return it == labware_.end() ? nullptr : &it->second;
}

const ModuleDef* StaticContext::module(const std::string& id) const {
  auto it = modules_.find(id);
  return it == modules_.end() ? nullptr : &it->second;
}

const ModuleDef* StaticContext::moduleUnder(const std::string& labwareId) const {
  const LabwareDef* lw = labware(labwareId);
  if (!lw || !lw->moduleId)
    return nullptr;
  return module(*lw->moduleId);
}
