/* @file JsonCodec.cpp
 * @brief nlohmann::json mapping of instructions, step records and the catalog
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Third-party headers
#include <nlohmann/json.hpp>

// PipetGen headers
#include "io/JsonCodec.hpp"
#include "model/WellSet.hpp"

using json = nlohmann::json;

namespace pipetgen {
  namespace {

    template <typename T> std::optional<T> optionalField(const json& j, const char* key) {
      const auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return std::nullopt;
      return it->get<T>();
    }

    protocols::InstructionKind kindFromString(const std::string& name) {
      using protocols::InstructionKind;
      for (std::uint8_t i = 0; i < static_cast<std::uint8_t>(InstructionKind::Count); ++i) {
        const auto kind = static_cast<InstructionKind>(i);
        if (name == protocols::toString(kind))
          return kind;
      }
      throw std::runtime_error("[JsonCodec] unknown instruction kind: " + name);
    }

    protocols::ChangeTip changeTipFromString(const std::string& name) {
      using protocols::ChangeTip;
      for (ChangeTip c : { ChangeTip::Never, ChangeTip::Once, ChangeTip::Always })
        if (name == protocols::toString(c))
          return c;
      throw std::runtime_error("[JsonCodec] unknown changeTip policy: " + name);
    }

    void writeMove(json& j, const protocols::LiquidMove& move) {
      j["pipetteId"] = move.pipette;
      j["labwareId"] = move.labware;
      j["well"] = move.well;
      j["volume"] = move.volume;
      j["flowRate"] = move.flowRate;
      j["offsetFromBottomMm"] = move.offsetFromBottomMm;
    }

    template <typename Move> Move readMove(const json& j) {
      Move move;
      j.at("pipetteId").get_to(move.pipette);
      j.at("labwareId").get_to(move.labware);
      j.at("well").get_to(move.well);
      j.at("volume").get_to(move.volume);
      j.at("flowRate").get_to(move.flowRate);
      j.at("offsetFromBottomMm").get_to(move.offsetFromBottomMm);
      return move;
    }

    // pipette / labware / well triple shared by tip and touch-tip records
    template <typename Target> void writeTarget(json& j, const Target& t) {
      j["pipetteId"] = t.pipette;
      j["labwareId"] = t.labware;
      j["well"] = t.well;
    }

    template <typename Target> void readTarget(const json& j, Target& t) {
      j.at("pipetteId").get_to(t.pipette);
      j.at("labwareId").get_to(t.labware);
      j.at("well").get_to(t.well);
    }

    std::optional<protocols::MixConfig> readMix(const json& j, const char* key) {
      const auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return std::nullopt;
      protocols::MixConfig mix;
      it->at("times").get_to(mix.times);
      it->at("volume").get_to(mix.volume);
      return mix;
    }

    std::optional<protocols::DelayConfig> readDelay(const json& j, const char* key) {
      const auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return std::nullopt;
      protocols::DelayConfig delay;
      it->at("seconds").get_to(delay.seconds);
      delay.mmFromBottom = it->value("mmFromBottom", 0.0);
      return delay;
    }

    std::optional<model::WellLocation> readLocation(const json& j, const char* key) {
      const auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return std::nullopt;
      model::WellLocation loc;
      it->at("labware").get_to(loc.labware);
      it->at("well").get_to(loc.well);
      return loc;
    }

    void readTransferLike(const json& j, protocols::TransferLikeArgs& a) {
      a.name = j.value("name", std::string{});
      a.description = j.value("description", std::string{});
      j.at("pipette").get_to(a.pipette);
      j.at("volume").get_to(a.volume);
      a.changeTip = changeTipFromString(j.value("changeTip", std::string("always")));

      a.aspirateFlowRateUlSec = optionalField<double>(j, "aspirateFlowRateUlSec");
      a.dispenseFlowRateUlSec = optionalField<double>(j, "dispenseFlowRateUlSec");
      a.aspirateOffsetFromBottomMm = optionalField<double>(j, "aspirateOffsetFromBottomMm");
      a.dispenseOffsetFromBottomMm = optionalField<double>(j, "dispenseOffsetFromBottomMm");

      a.preWetTip = j.value("preWetTip", false);
      a.mixBeforeAspirate = readMix(j, "mixBeforeAspirate");
      a.aspirateDelay = readDelay(j, "aspirateDelay");
      a.touchTipAfterAspirate = j.value("touchTipAfterAspirate", false);
      a.touchTipAfterAspirateOffsetMmFromBottom =
          optionalField<double>(j, "touchTipAfterAspirateOffsetMmFromBottom");
      a.aspirateAirGapVolume = optionalField<double>(j, "aspirateAirGapVolume");

      a.dispenseDelay = readDelay(j, "dispenseDelay");
      a.touchTipAfterDispense = j.value("touchTipAfterDispense", false);
      a.touchTipAfterDispenseOffsetMmFromBottom =
          optionalField<double>(j, "touchTipAfterDispenseOffsetMmFromBottom");
      a.blowoutFlowRateUlSec = optionalField<double>(j, "blowoutFlowRateUlSec");
      a.blowoutOffsetFromTopMm = optionalField<double>(j, "blowoutOffsetFromTopMm");
    }

    model::PipetteSpec readPipette(const json& j) {
      model::PipetteSpec p;
      j.at("id").get_to(p.id);
      p.name = j.value("name", p.id);
      j.at("maxVolume").get_to(p.maxVolume);
      p.channels = j.value("channels", 1);
      if (p.channels != 1 && p.channels != 8)
        throw std::runtime_error("[JsonCodec] pipette " + p.id + " must have 1 or 8 channels");
      if (p.maxVolume <= 0.0)
        throw std::runtime_error("[JsonCodec] pipette " + p.id + " needs a positive maxVolume");
      const json& rates = j.at("defaultFlowRates");
      rates.at("aspirate").get_to(p.defaultFlowRates.aspirate);
      rates.at("dispense").get_to(p.defaultFlowRates.dispense);
      p.defaultFlowRates.blowout = rates.value("blowout", p.defaultFlowRates.dispense);
      p.tiprackIds = j.value("tiprackIds", std::vector<std::string>{});
      return p;
    }

    model::LabwareDef readLabware(const json& j) {
      const std::string id = j.at("id").get<std::string>();
      model::LabwareDef lw;

      if (const auto grid = j.find("grid"); grid != j.end()) {
        lw = model::gridLabware(id, grid->at("rows").get<int>(), grid->at("columns").get<int>(),
                                grid->at("depth").get<double>(),
                                grid->at("maxVolume").get<double>());
      } else {
        lw.id = id;
        j.at("ordering").get_to(lw.ordering);
        for (const auto& item : j.at("wells").items()) {
          const json& geo = item.value();
          model::WellGeometry g;
          geo.at("depth").get_to(g.depthMm);
          geo.at("maxVolume").get_to(g.maxVolume);
          g.x = geo.value("x", 0.0);
          g.y = geo.value("y", 0.0);
          lw.wells.emplace(item.key(), g);
        }
        for (const auto& column : lw.ordering)
          for (const auto& well : column)
            if (!lw.wells.count(well))
              throw std::runtime_error("[JsonCodec] labware " + id + " orders unknown well " +
                                       well);
      }

      lw.displayName = j.value("displayName", id);
      lw.slot = j.value("slot", std::string{});
      lw.moduleId = optionalField<std::string>(j, "moduleId");
      lw.isTiprack = j.value("isTiprack", false);
      lw.isTrash = j.value("isTrash", false);
      return lw;
    }

    model::CompilerDefaults readDefaults(const json& j) {
      model::CompilerDefaults d;
      d.aspirateOffsetFromBottomMm =
          j.value("aspirateOffsetFromBottomMm", d.aspirateOffsetFromBottomMm);
      d.dispenseOffsetFromBottomMm =
          j.value("dispenseOffsetFromBottomMm", d.dispenseOffsetFromBottomMm);
      d.touchTipOffsetFromTopMm = j.value("touchTipOffsetFromTopMm", d.touchTipOffsetFromTopMm);
      d.airGapOffsetFromTopMm = j.value("airGapOffsetFromTopMm", d.airGapOffsetFromTopMm);
      d.blowoutOffsetFromTopMm = j.value("blowoutOffsetFromTopMm", d.blowoutOffsetFromTopMm);
      return d;
    }

    std::shared_ptr<const model::StaticContext> buildContext(const json& catalog) {
      std::map<std::string, model::PipetteSpec> pipettes;
      for (const auto& entry : catalog.at("pipettes")) {
        auto p = readPipette(entry);
        pipettes.emplace(p.id, std::move(p));
      }

      std::map<std::string, model::LabwareDef> labware;
      for (const auto& entry : catalog.at("labware")) {
        auto lw = readLabware(entry);
        labware.emplace(lw.id, std::move(lw));
      }

      std::map<std::string, model::ModuleDef> modules;
      if (const auto it = catalog.find("modules"); it != catalog.end()) {
        for (const auto& entry : *it) {
          model::ModuleDef m;
          entry.at("id").get_to(m.id);
          m.model = entry.value("model", std::string{});
          m.slot = entry.value("slot", std::string{});
          modules.emplace(m.id, std::move(m));
        }
      }

      model::WellLocation trash;
      catalog.at("trash").at("labware").get_to(trash.labware);
      trash.well = catalog.at("trash").value("well", std::string("A1"));

      const auto trashLw = labware.find(trash.labware);
      if (trashLw == labware.end() || !trashLw->second.well(trash.well))
        throw std::runtime_error("[JsonCodec] trash " + trash.labware + ":" + trash.well +
                                 " is not a known well");
      trashLw->second.isTrash = true;

      for (const auto& [id, p] : pipettes)
        for (const auto& rack : p.tiprackIds) {
          const auto it = labware.find(rack);
          if (it == labware.end() || !it->second.isTiprack)
            throw std::runtime_error("[JsonCodec] pipette " + id + " references tip rack " +
                                     rack + " which is not a tip rack");
        }

      for (const auto& [id, lw] : labware)
        if (lw.moduleId && !modules.count(*lw.moduleId))
          throw std::runtime_error("[JsonCodec] labware " + id + " sits on unknown module " +
                                   *lw.moduleId);

      model::CompilerDefaults defaults;
      if (const auto it = catalog.find("defaults"); it != catalog.end())
        defaults = readDefaults(*it);

      return std::make_shared<const model::StaticContext>(
          std::move(pipettes), std::move(labware), std::move(modules), std::move(trash),
          defaults);
    }

  } // namespace

  namespace protocols {

    void to_json(json& j, const Instruction& instruction) {
      j = json::object();
      j["kind"] = toString(instruction.kind());

      switch (instruction.kind()) {
      case InstructionKind::Aspirate:
        writeMove(j, *instruction.as<Aspirate>());
        break;
      case InstructionKind::Dispense:
        writeMove(j, *instruction.as<Dispense>());
        break;
      case InstructionKind::AirGap:
        writeMove(j, *instruction.as<AirGap>());
        break;
      case InstructionKind::DispenseAirGap:
        writeMove(j, *instruction.as<DispenseAirGap>());
        break;
      case InstructionKind::Delay:
        j["waitSeconds"] = instruction.as<Delay>()->waitSeconds;
        break;
      case InstructionKind::TouchTip: {
        const auto& t = *instruction.as<TouchTip>();
        writeTarget(j, t);
        j["offsetFromBottomMm"] = t.offsetFromBottomMm;
        break;
      }
      case InstructionKind::Blowout: {
        const auto& b = *instruction.as<Blowout>();
        writeTarget(j, b);
        j["flowRate"] = b.flowRate;
        j["offsetFromBottomMm"] = b.offsetFromBottomMm;
        break;
      }
      case InstructionKind::PickUpTip:
        writeTarget(j, *instruction.as<PickUpTip>());
        break;
      case InstructionKind::DropTip:
        writeTarget(j, *instruction.as<DropTip>());
        break;
      case InstructionKind::MoveToWell: {
        const auto& m = *instruction.as<MoveToWell>();
        writeTarget(j, m);
        j["moveOffset"] = { { "x", m.offset.x }, { "y", m.offset.y }, { "z", m.offset.z } };
        break;
      }
      default:
        throw std::logic_error("[JsonCodec] instruction without a wire mapping");
      }
    }

    void from_json(const json& j, Instruction& instruction) {
      switch (kindFromString(j.at("kind").get<std::string>())) {
      case InstructionKind::Aspirate:
        instruction.params = readMove<Aspirate>(j);
        break;
      case InstructionKind::Dispense:
        instruction.params = readMove<Dispense>(j);
        break;
      case InstructionKind::AirGap:
        instruction.params = readMove<AirGap>(j);
        break;
      case InstructionKind::DispenseAirGap:
        instruction.params = readMove<DispenseAirGap>(j);
        break;
      case InstructionKind::Delay:
        instruction.params = Delay{ j.at("waitSeconds").get<double>() };
        break;
      case InstructionKind::TouchTip: {
        TouchTip t;
        readTarget(j, t);
        j.at("offsetFromBottomMm").get_to(t.offsetFromBottomMm);
        instruction.params = std::move(t);
        break;
      }
      case InstructionKind::Blowout: {
        Blowout b;
        readTarget(j, b);
        j.at("flowRate").get_to(b.flowRate);
        j.at("offsetFromBottomMm").get_to(b.offsetFromBottomMm);
        instruction.params = std::move(b);
        break;
      }
      case InstructionKind::PickUpTip: {
        PickUpTip p;
        readTarget(j, p);
        instruction.params = std::move(p);
        break;
      }
      case InstructionKind::DropTip: {
        DropTip d;
        readTarget(j, d);
        instruction.params = std::move(d);
        break;
      }
      case InstructionKind::MoveToWell: {
        MoveToWell m;
        readTarget(j, m);
        const json& off = j.at("moveOffset");
        m.offset = Offset{ off.value("x", 0.0), off.value("y", 0.0), off.value("z", 0.0) };
        instruction.params = std::move(m);
        break;
      }
      default:
        throw std::runtime_error("[JsonCodec] unsupported instruction kind");
      }
    }

    std::ostream& operator<<(std::ostream& os, const Instruction& instruction) {
      return os << json(instruction).dump();
    }

    void to_json(json& j, const CommandError& error) {
      j = json{ { "type", toString(error.kind) },
                { "message", error.message },
                { "detail", error.detail } };
    }

    void to_json(json& j, const CommandWarning& warning) {
      j = json{ { "type", toString(warning.kind) }, { "message", warning.message } };
    }

    void from_json(const json& j, DistributeArgs& args) {
      readTransferLike(j, args);
      j.at("sourceLabware").get_to(args.sourceLabware);
      j.at("sourceWell").get_to(args.sourceWell);
      j.at("destLabware").get_to(args.destLabware);
      j.at("destWells").get_to(args.destWells);
      args.disposalVolume = optionalField<double>(j, "disposalVolume");
      args.disposalLabware = optionalField<std::string>(j, "disposalLabware");
      args.disposalWell = optionalField<std::string>(j, "disposalWell");
    }

    void from_json(const json& j, ConsolidateArgs& args) {
      readTransferLike(j, args);
      j.at("sourceLabware").get_to(args.sourceLabware);
      j.at("sourceWells").get_to(args.sourceWells);
      j.at("destLabware").get_to(args.destLabware);
      j.at("destWell").get_to(args.destWell);
      args.mixInDestination = readMix(j, "mixInDestination");
      args.blowoutLocation = readLocation(j, "blowoutLocation");
    }

    void from_json(const json& j, TransferArgs& args) {
      readTransferLike(j, args);
      j.at("sourceLabware").get_to(args.sourceLabware);
      j.at("sourceWells").get_to(args.sourceWells);
      j.at("destLabware").get_to(args.destLabware);
      j.at("destWells").get_to(args.destWells);
      args.mixInDestination = readMix(j, "mixInDestination");
      args.blowoutLocation = readLocation(j, "blowoutLocation");
    }

    void from_json(const json& j, MixArgs& args) {
      args.name = j.value("name", std::string{});
      args.description = j.value("description", std::string{});
      j.at("pipette").get_to(args.pipette);
      j.at("labware").get_to(args.labware);
      j.at("wells").get_to(args.wells);
      j.at("volume").get_to(args.volume);
      j.at("times").get_to(args.times);
      args.changeTip = changeTipFromString(j.value("changeTip", std::string("always")));

      args.aspirateFlowRateUlSec = optionalField<double>(j, "aspirateFlowRateUlSec");
      args.dispenseFlowRateUlSec = optionalField<double>(j, "dispenseFlowRateUlSec");
      args.aspirateOffsetFromBottomMm = optionalField<double>(j, "aspirateOffsetFromBottomMm");
      args.dispenseOffsetFromBottomMm = optionalField<double>(j, "dispenseOffsetFromBottomMm");
      args.aspirateDelaySeconds = optionalField<double>(j, "aspirateDelaySeconds");
      args.dispenseDelaySeconds = optionalField<double>(j, "dispenseDelaySeconds");

      args.touchTip = j.value("touchTip", false);
      args.touchTipMmFromBottom = optionalField<double>(j, "touchTipMmFromBottom");
      args.blowoutLocation = readLocation(j, "blowoutLocation");
      args.blowoutFlowRateUlSec = optionalField<double>(j, "blowoutFlowRateUlSec");
      args.blowoutOffsetFromTopMm = optionalField<double>(j, "blowoutOffsetFromTopMm");
    }

  } // namespace protocols

  namespace io {

    std::string toWire(const protocols::Instruction& instruction) {
      return json(instruction).dump() + "\r\n";
    }

    protocols::Instruction fromWire(const std::string& line) {
      std::string body = line;
      while (!body.empty() && (body.back() == '\n' || body.back() == '\r'))
        body.pop_back();

      try {
        return json::parse(body).get<protocols::Instruction>();
      } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[JsonCodec] malformed wire record: ") + e.what());
      }
    }

    std::shared_ptr<const model::StaticContext> contextFromJson(const json& catalog) {
      try {
        return buildContext(catalog);
      } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[JsonCodec] malformed catalog: ") + e.what());
      }
    }

    model::SimulationState initialStateFromJson(const json& catalog,
                                                const model::StaticContext& ctx) {
      auto state = model::SimulationState::initial(ctx);
      const auto section = catalog.find("initialState");
      if (section == catalog.end())
        return state;

      try {
        if (const auto tips = section->find("tips"); tips != section->end()) {
          for (const auto& item : tips->items()) {
            const std::string& pipette = item.key();
            if (!ctx.pipette(pipette))
              throw std::runtime_error("[JsonCodec] initial tip on unknown pipette " + pipette);
            state.tips[pipette] = item.value().get<bool>();
          }
        }

        if (const auto liquids = section->find("liquids"); liquids != section->end()) {
          for (const auto& entry : *liquids) {
            const auto labware = entry.at("labware").get<std::string>();
            const auto well = entry.at("well").get<std::string>();
            const auto* lw = ctx.labware(labware);
            if (!lw || !lw->well(well))
              throw std::runtime_error("[JsonCodec] initial liquid in unknown well " + labware +
                                       ":" + well);

            model::WellContents contents;
            entry.at("volume").get_to(contents.volume);
            if (const auto ids = entry.find("liquidIds"); ids != entry.end())
              for (const auto& id : *ids)
                contents.liquidIds.insert(id.get<std::string>());
            state.liquids[{ labware, well }] = std::move(contents);
          }
        }
      } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[JsonCodec] malformed initialState: ") + e.what());
      }
      return state;
    }

  } // namespace io
} // namespace pipetgen
