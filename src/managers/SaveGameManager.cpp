/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SaveGameManager.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include "world/GameWorld.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Spacegame;
using BinarySerial::Reader;
using BinarySerial::Writer;

bool SaveGameManager::initialized = false;

// File signature constant
constexpr char SPACE_SAVE_SIGNATURE[9] = {'S', 'P', 'A', 'C', 'E',
                                          'S', 'A', 'V', 'E'};
constexpr size_t SPACE_SAVE_SIGNATURE_SIZE = sizeof(SPACE_SAVE_SIGNATURE);

namespace {

// Marker flag bits, in EntityRecord declaration order
enum MarkerBit : uint16_t {
  ACCESS_PORT = 1 << 0,
  CONTAINER = 1 << 1,
  IS_CARRIED = 1 << 2,
  MOBILE = 1 << 3,
  NETWORKABLE = 1 << 4,
  OBSTRUCTIVE = 1 << 5,
  PLANQ = 1 << 6,
  PLAYER = 1 << 7,
  LMR = 1 << 8,
  FACADE = 1 << 9
};

bool writeCell(Writer &out, const ScreenCell &cell) {
  return out.writeString(cell.glyph) && out.write(cell.fg) && out.write(cell.bg) &&
         out.write(cell.mods);
}

bool readCell(Reader &in, ScreenCell &cell) {
  return in.readString(cell.glyph) && in.read(cell.fg) && in.read(cell.bg) && in.read(cell.mods);
}

bool writeCount(Writer &out, size_t count) { return out.write(static_cast<uint32_t>(count)); }

bool readCount(Reader &in, uint32_t &count) {
  constexpr uint32_t MAX_COUNT = 1024 * 1024;
  return in.read(count) && count <= MAX_COUNT;
}

bool writePresence(Writer &out, bool present) { return out.write(static_cast<uint8_t>(present)); }

bool readPresence(Reader &in, bool &present) {
  uint8_t byte = 0;
  if (!in.read(byte))
    return false;
  present = byte != 0;
  return true;
}

/* Entities */

uint16_t packMarkers(const EntityRecord &rec) {
  uint16_t bits = 0;
  if (rec.accessPort) bits |= ACCESS_PORT;
  if (rec.container) bits |= CONTAINER;
  if (rec.isCarried) bits |= IS_CARRIED;
  if (rec.mobile) bits |= MOBILE;
  if (rec.networkable) bits |= NETWORKABLE;
  if (rec.obstructive) bits |= OBSTRUCTIVE;
  if (rec.planq) bits |= PLANQ;
  if (rec.player) bits |= PLAYER;
  if (rec.lmr) bits |= LMR;
  if (rec.facade) bits |= FACADE;
  return bits;
}

void unpackMarkers(uint16_t bits, EntityRecord &rec) {
  rec.accessPort = bits & ACCESS_PORT;
  rec.container = bits & CONTAINER;
  rec.isCarried = bits & IS_CARRIED;
  rec.mobile = bits & MOBILE;
  rec.networkable = bits & NETWORKABLE;
  rec.obstructive = bits & OBSTRUCTIVE;
  rec.planq = bits & PLANQ;
  rec.player = bits & PLAYER;
  rec.lmr = bits & LMR;
  rec.facade = bits & FACADE;
}

bool writeEntity(Writer &out, EntityID id, const EntityRecord &rec) {
  if (!out.write(id) || !out.write(packMarkers(rec)))
    return false;

  if (!writePresence(out, rec.body.has_value()))
    return false;
  if (rec.body) {
    if (!out.write(rec.body->refPosn) || !writeCount(out, rec.body->extent.size()))
      return false;
    for (const auto &[posn, cell] : rec.body->extent) {
      if (!out.write(posn) || !writeCell(out, cell))
        return false;
    }
  }

  if (!writePresence(out, rec.description.has_value()))
    return false;
  if (rec.description &&
      !(out.writeString(rec.description->name) && out.writeString(rec.description->desc) &&
        out.writeString(rec.description->locn)))
    return false;

  if (!writePresence(out, rec.actions.has_value()))
    return false;
  if (rec.actions) {
    std::vector<ActionType> actions(rec.actions->actions.begin(), rec.actions->actions.end());
    if (!out.writeVector(actions))
      return false;
  }

  if (!writePresence(out, rec.memory.has_value()))
    return false;
  if (rec.memory) {
    if (!writeCount(out, rec.memory->cells.size()))
      return false;
    for (const auto &[posn, cell] : rec.memory->cells) {
      if (!out.write(posn) || !writeCell(out, cell))
        return false;
    }
  }

  if (!out.writeOptional(rec.device) || !out.writeOptional(rec.key) ||
      !out.writeOptional(rec.lockable) || !out.writeOptional(rec.opaque))
    return false;

  if (!writePresence(out, rec.openable.has_value()))
    return false;
  if (rec.openable &&
      !(out.write(rec.openable->isOpen) && out.write(rec.openable->isStuck) &&
        out.writeString(rec.openable->openGlyph) && out.writeString(rec.openable->closedGlyph)))
    return false;

  if (!out.writeOptional(rec.portable))
    return false;

  if (!writePresence(out, rec.viewshed.has_value()))
    return false;
  if (rec.viewshed &&
      !(out.write(rec.viewshed->range) && out.writeVector(rec.viewshed->visibleTiles) &&
        out.write(rec.viewshed->dirty)))
    return false;

  if (!writePresence(out, rec.pursuit.has_value()))
    return false;
  if (rec.pursuit &&
      !(out.write(rec.pursuit->chasing) && out.write(rec.pursuit->lineOfSight) &&
        out.writeOptional(rec.pursuit->lastKnownTarget) &&
        out.write(rec.pursuit->ticksWithoutSight)))
    return false;

  return out.good();
}

bool readEntity(Reader &in, EntityID &id, EntityRecord &rec) {
  uint16_t markers = 0;
  if (!in.read(id) || !in.read(markers))
    return false;
  unpackMarkers(markers, rec);

  bool present = false;
  if (!readPresence(in, present))
    return false;
  if (present) {
    Body body;
    uint32_t count = 0;
    if (!in.read(body.refPosn) || !readCount(in, count))
      return false;
    body.extent.resize(count);
    for (auto &[posn, cell] : body.extent) {
      if (!in.read(posn) || !readCell(in, cell))
        return false;
    }
    rec.body = std::move(body);
  }

  if (!readPresence(in, present))
    return false;
  if (present) {
    Description desc;
    if (!in.readString(desc.name) || !in.readString(desc.desc) || !in.readString(desc.locn))
      return false;
    rec.description = std::move(desc);
  }

  if (!readPresence(in, present))
    return false;
  if (present) {
    std::vector<ActionType> actions;
    if (!in.readVector(actions))
      return false;
    rec.actions = ActionSet{{actions.begin(), actions.end()}};
  }

  if (!readPresence(in, present))
    return false;
  if (present) {
    Memory memory;
    uint32_t count = 0;
    if (!readCount(in, count))
      return false;
    for (uint32_t i = 0; i < count; ++i) {
      Position posn;
      ScreenCell cell;
      if (!in.read(posn) || !readCell(in, cell))
        return false;
      memory.cells.emplace(posn, std::move(cell));
    }
    rec.memory = std::move(memory);
  }

  if (!in.readOptional(rec.device) || !in.readOptional(rec.key) ||
      !in.readOptional(rec.lockable) || !in.readOptional(rec.opaque))
    return false;

  if (!readPresence(in, present))
    return false;
  if (present) {
    Openable openable;
    if (!in.read(openable.isOpen) || !in.read(openable.isStuck) ||
        !in.readString(openable.openGlyph) || !in.readString(openable.closedGlyph))
      return false;
    rec.openable = std::move(openable);
  }

  if (!in.readOptional(rec.portable))
    return false;

  if (!readPresence(in, present))
    return false;
  if (present) {
    Viewshed viewshed;
    if (!in.read(viewshed.range) || !in.readVector(viewshed.visibleTiles) ||
        !in.read(viewshed.dirty))
      return false;
    rec.viewshed = std::move(viewshed);
  }

  if (!readPresence(in, present))
    return false;
  if (present) {
    Pursuit pursuit;
    if (!in.read(pursuit.chasing) || !in.read(pursuit.lineOfSight) ||
        !in.readOptional(pursuit.lastKnownTarget) || !in.read(pursuit.ticksWithoutSight))
      return false;
    rec.pursuit = std::move(pursuit);
  }
  return true;
}

bool writeRegistry(Writer &out, const EntityRegistry &registry) {
  if (!out.write(registry.getNextId()) || !writeCount(out, registry.size()))
    return false;
  for (const auto &[id, rec] : registry.entities()) {
    if (!writeEntity(out, id, rec)) {
      SAVEGAME_ERROR("Failed to write entity " + std::to_string(id));
      return false;
    }
  }
  return true;
}

bool readRegistry(Reader &in, EntityRegistry &registry) {
  EntityID nextId = 1;
  uint32_t count = 0;
  if (!in.read(nextId) || !readCount(in, count))
    return false;
  for (uint32_t i = 0; i < count; ++i) {
    EntityID id = INVALID_ENTITY;
    EntityRecord rec;
    if (!readEntity(in, id, rec)) {
      SAVEGAME_ERROR("Failed to read entity record " + std::to_string(i));
      return false;
    }
    if (!registry.restore(id, std::move(rec))) {
      SAVEGAME_ERROR("Duplicate entity id in save: " + std::to_string(id));
      return false;
    }
  }
  registry.setNextId(nextId);
  return true;
}

/* Decks, portals and rooms */

bool writeDeck(Writer &out, const WorldMap &deck) {
  if (!out.write(deck.getWidth()) || !out.write(deck.getHeight()))
    return false;
  for (const Tile &tile : deck.tiles()) {
    if (!out.write(tile.ttype) || !writeCell(out, tile.cell) ||
        !writeCount(out, tile.contents.size()))
      return false;
    for (const auto &[priority, id] : tile.contents) {
      if (!out.write(priority) || !out.write(id))
        return false;
    }
  }
  return out.writeFlags(deck.revealedTiles());
}

bool readDeck(Reader &in, WorldMap &deck) {
  int width = 0;
  int height = 0;
  if (!in.read(width) || !in.read(height) || width < 0 || height < 0 ||
      width > MAPWIDTH * 16 || height > MAPHEIGHT * 16)
    return false;
  deck = WorldMap(width, height);
  for (Tile &tile : deck.tiles()) {
    uint32_t count = 0;
    if (!in.read(tile.ttype) || !readCell(in, tile.cell) || !readCount(in, count))
      return false;
    tile.contents.resize(count);
    for (auto &[priority, id] : tile.contents) {
      if (!in.read(priority) || !in.read(id))
        return false;
    }
  }
  std::vector<bool> revealed;
  if (!in.readFlags(revealed) || revealed.size() != deck.revealedTiles().size())
    return false;
  deck.revealedTiles() = std::move(revealed);
  return true;
}

bool writeModel(Writer &out, const WorldModel &model) {
  if (!writeCount(out, model.levels.size()))
    return false;
  for (const WorldMap &deck : model.levels) {
    if (!writeDeck(out, deck))
      return false;
  }

  if (!writeCount(out, model.portals().size()))
    return false;
  for (const Portal &portal : model.portals()) {
    if (!out.write(portal.left) || !out.write(portal.right) || !out.write(portal.bidir))
      return false;
  }

  const auto &rooms = model.layout.rooms();
  if (!writeCount(out, rooms.size()))
    return false;
  for (size_t i = 0; i < rooms.size(); ++i) {
    const GraphRoom &room = rooms[i];
    if (!out.writeString(room.getName()) || !out.write(room.getCenterpoint()) ||
        !out.write(room.getUpperLeft()) || !out.write(room.getLowerRight()) ||
        !writeCount(out, room.cells().size()))
      return false;
    for (const auto &[posn, type] : room.cells()) {
      if (!out.write(posn) || !out.write(type))
        return false;
    }
    std::vector<uint32_t> targets;
    for (RoomIndex target : model.layout.successors(i))
      targets.push_back(static_cast<uint32_t>(target));
    if (!out.writeVector(targets))
      return false;
  }
  return true;
}

bool readModel(Reader &in, WorldModel &model) {
  uint32_t count = 0;
  if (!readCount(in, count))
    return false;
  model.levels.resize(count);
  for (WorldMap &deck : model.levels) {
    if (!readDeck(in, deck))
      return false;
  }

  if (!readCount(in, count))
    return false;
  model.clearPortals();
  for (uint32_t i = 0; i < count; ++i) {
    Position left;
    Position right;
    bool bidir = false;
    if (!in.read(left) || !in.read(right) || !in.read(bidir))
      return false;
    model.addPortal(left, right, bidir);
  }

  if (!readCount(in, count))
    return false;
  model.layout.clear();
  std::vector<std::vector<uint32_t>> successors(count);
  for (uint32_t i = 0; i < count; ++i) {
    GraphRoom room;
    std::string name;
    Position center;
    Position ul;
    Position dr;
    uint32_t cells = 0;
    if (!in.readString(name) || !in.read(center) || !in.read(ul) || !in.read(dr) ||
        !readCount(in, cells))
      return false;
    room.setName(std::move(name));
    room.setBounds(ul, dr, center);
    for (uint32_t c = 0; c < cells; ++c) {
      Position posn;
      CellType type{};
      if (!in.read(posn) || !in.read(type))
        return false;
      room.setCell(posn, type);
    }
    if (!in.readVector(successors[i]))
      return false;
    model.layout.addRoom(std::move(room));
  }
  // Doors are kept as per-room lists with the newest first
  for (uint32_t i = 0; i < count; ++i) {
    for (auto it = successors[i].rbegin(); it != successors[i].rend(); ++it) {
      if (*it >= count)
        return false;
      model.layout.connect(i, *it);
    }
  }
  return true;
}

/* Message log */

bool writeMessages(Writer &out, const std::vector<Message> &messages) {
  if (!writeCount(out, messages.size()))
    return false;
  for (const Message &msg : messages) {
    if (!out.write(msg.timestamp) || !out.write(msg.priority) || !out.writeString(msg.channel) ||
        !out.writeString(msg.text))
      return false;
  }
  return true;
}

bool readMessages(Reader &in, std::vector<Message> &messages) {
  uint32_t count = 0;
  if (!readCount(in, count))
    return false;
  messages.resize(count);
  for (Message &msg : messages) {
    if (!in.read(msg.timestamp) || !in.read(msg.priority) || !in.readString(msg.channel) ||
        !in.readString(msg.text))
      return false;
  }
  return true;
}

bool writeLog(Writer &out, const MessageLog &log) {
  if (!writeCount(out, log.channels().size()))
    return false;
  for (const MessageChannel &channel : log.channels()) {
    if (!out.writeString(channel.name) || !writeMessages(out, channel.contents))
      return false;
  }
  return true;
}

bool readLog(Reader &in, MessageLog &log) {
  uint32_t count = 0;
  if (!readCount(in, count))
    return false;
  auto &channels = log.channels();
  channels.clear();
  channels.resize(count);
  for (MessageChannel &channel : channels) {
    if (!in.readString(channel.name) || !readMessages(in, channel.contents))
      return false;
  }
  return true;
}

/* PLANQ */

bool writePlanq(Writer &out, const PlanqData &planq) {
  return out.write(planq.powerIsOn) && out.write(planq.bootStage) && out.write(planq.isCarried) &&
         out.write(planq.cpuMode) && out.write(planq.actionMode) &&
         out.write(planq.showTerminal) && out.write(planq.showCliInput) &&
         out.write(planq.playerLoc) && writeMessages(out, planq.stdoutLog) &&
         out.writeVector(planq.procTable) && out.write(planq.jackCnxn) &&
         out.writeString(planq.cliBuffer) && out.write(planq.errorReported) &&
         out.write(planq.errorElapsed) && out.writeVector(planq.pendingEvents);
}

bool readPlanq(Reader &in, PlanqData &planq) {
  return in.read(planq.powerIsOn) && in.read(planq.bootStage) && in.read(planq.isCarried) &&
         in.read(planq.cpuMode) && in.read(planq.actionMode) && in.read(planq.showTerminal) &&
         in.read(planq.showCliInput) && in.read(planq.playerLoc) &&
         readMessages(in, planq.stdoutLog) && in.readVector(planq.procTable) &&
         in.read(planq.jackCnxn) && in.readString(planq.cliBuffer) &&
         in.read(planq.errorReported) && in.read(planq.errorElapsed) &&
         in.readVector(planq.pendingEvents);
}

bool writeSample(Writer &out, const PlanqDataType &value) {
  if (!out.write(static_cast<uint8_t>(value.index())))
    return false;
  if (const auto *text = std::get_if<PlanqText>(&value))
    return out.writeString(text->text);
  if (const auto *integer = std::get_if<PlanqInteger>(&value))
    return out.write(integer->value);
  if (const auto *percent = std::get_if<PlanqPercent>(&value))
    return out.write(percent->value);
  if (const auto *decimal = std::get_if<PlanqDecimal>(&value))
    return out.write(decimal->numer) && out.write(decimal->denom);
  if (const auto *series = std::get_if<PlanqSeries>(&value)) {
    std::vector<uint64_t> values(series->values.begin(), series->values.end());
    return out.writeVector(values);
  }
  return true;
}

bool readSample(Reader &in, PlanqDataType &value) {
  uint8_t index = 0;
  if (!in.read(index))
    return false;
  switch (index) {
  case 0:
    value = std::monostate{};
    return true;
  case 1: {
    PlanqText text;
    if (!in.readString(text.text))
      return false;
    value = std::move(text);
    return true;
  }
  case 2: {
    PlanqInteger integer;
    if (!in.read(integer.value))
      return false;
    value = integer;
    return true;
  }
  case 3: {
    PlanqPercent percent;
    if (!in.read(percent.value))
      return false;
    value = percent;
    return true;
  }
  case 4: {
    PlanqDecimal decimal;
    if (!in.read(decimal.numer) || !in.read(decimal.denom))
      return false;
    value = decimal;
    return true;
  }
  case 5: {
    std::vector<uint64_t> values;
    if (!in.readVector(values))
      return false;
    value = PlanqSeries{{values.begin(), values.end()}};
    return true;
  }
  default:
    SAVEGAME_ERROR("Unknown monitor sample type: " + std::to_string(index));
    return false;
  }
}

bool writeMonitor(Writer &out, const PlanqMonitor &monitor) {
  if (!out.writeStrings(monitor.getStatusBars()) || !writeCount(out, monitor.rawData().size()))
    return false;
  for (const auto &[source, value] : monitor.rawData()) {
    if (!out.writeString(source) || !writeSample(out, value))
      return false;
  }
  if (!writeCount(out, monitor.sampleTimers().size()))
    return false;
  for (const DataSampleTimer &timer : monitor.sampleTimers()) {
    if (!out.write(timer.timer) || !out.writeString(timer.source))
      return false;
  }
  return true;
}

bool readMonitor(Reader &in, PlanqMonitor &monitor) {
  std::vector<std::string> bars;
  uint32_t count = 0;
  if (!in.readStrings(bars) || !readCount(in, count))
    return false;
  monitor.clear();
  for (uint32_t i = 0; i < count; ++i) {
    std::string source;
    PlanqDataType value;
    if (!in.readString(source) || !readSample(in, value))
      return false;
    monitor.set(source, std::move(value));
  }
  for (const auto &bar : bars)
    monitor.watch(bar);

  if (!readCount(in, count))
    return false;
  std::vector<DataSampleTimer> timers(count);
  for (DataSampleTimer &timer : timers) {
    if (!in.read(timer.timer) || !in.readString(timer.source))
      return false;
  }
  monitor.sampleTimers() = std::move(timers);
  return true;
}

/* Whole world */

bool writeWorld(Writer &out, const GameWorld &world) {
  if (!writeRegistry(out, world.registry)) {
    SAVEGAME_ERROR("Failed to write entities");
    return false;
  }
  if (!writeModel(out, world.model)) {
    SAVEGAME_ERROR("Failed to write world model");
    return false;
  }
  if (!writeLog(out, world.log)) {
    SAVEGAME_ERROR("Failed to write message log");
    return false;
  }
  if (!writePlanq(out, world.planq) || !writeMonitor(out, world.monitor)) {
    SAVEGAME_ERROR("Failed to write PLANQ state");
    return false;
  }

  std::ostringstream rngState;
  rngState << world.rng;
  return out.writeString(rngState.str()) && out.write(world.victoryPoint) &&
         out.write(world.elapsedTime) && out.write(world.tickCount) &&
         out.writeVector(world.pendingEvents) && out.writeOptional(world.requestedMode);
}

bool readWorld(Reader &in, GameWorld &world) {
  if (!readRegistry(in, world.registry)) {
    SAVEGAME_ERROR("Error reading entities");
    return false;
  }
  if (!readModel(in, world.model)) {
    SAVEGAME_ERROR("Error reading world model");
    return false;
  }
  if (!readLog(in, world.log)) {
    SAVEGAME_ERROR("Error reading message log");
    return false;
  }
  if (!readPlanq(in, world.planq) || !readMonitor(in, world.monitor)) {
    SAVEGAME_ERROR("Error reading PLANQ state");
    return false;
  }

  std::string rngText;
  if (!in.readString(rngText))
    return false;
  std::istringstream rngState(rngText);
  rngState >> world.rng;
  if (rngState.fail()) {
    SAVEGAME_ERROR("Error reading random number generator state");
    return false;
  }
  return in.read(world.victoryPoint) && in.read(world.elapsedTime) && in.read(world.tickCount) &&
         in.readVector(world.pendingEvents) && in.readOptional(world.requestedMode);
}

// Summary block that follows the header, read back by getSaveInfo()
bool writeSummary(Writer &out, const GameWorld &world) {
  const auto position = world.positionOf(world.player());
  std::string room;
  if (position) {
    if (auto name = world.model.getRoomName(*position))
      room = *name;
  }
  return out.writeOptional(position) && out.writeString(room) && out.write(world.tickCount);
}

bool readSummary(Reader &in, SaveGameData &info) {
  return in.readOptional(info.playerPosition) && in.readString(info.playerRoom) &&
         in.read(info.tickCount);
}

} // namespace

bool SaveGameManager::save(const std::string &saveFileName, const GameWorld &world) {
  // Ensure the save directory exists
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_ERROR("Failed to ensure save directory exists!");
    return false;
  }

  const std::string fullPath = getFullSavePath(saveFileName);
  try {
    std::ofstream file(fullPath, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      SAVEGAME_ERROR("Could not open file " + fullPath + " for writing!");
      return false;
    }
    SAVEGAME_DEBUG("Opened file for writing: " + fullPath);

    // We'll write the header at the end once we know the data size
    file.seekp(sizeof(SaveGameHeader));
    const std::streampos dataStart = file.tellp();

    Writer writer(std::shared_ptr<std::ostream>(&file, [](std::ostream *) { /* no-op deleter */ }));
    if (!writeSummary(writer, world)) {
      SAVEGAME_ERROR("Failed to write save summary");
      return false;
    }
    if (!writeWorld(writer, world)) {
      SAVEGAME_ERROR("Failed to write world to " + fullPath);
      return false;
    }
    writer.flush();

    const std::streampos dataEnd = file.tellp();
    const uint32_t dataSize = static_cast<uint32_t>(dataEnd - dataStart);

    // Go back and write the header
    file.seekp(0);
    if (!writeHeader(file, dataSize)) {
      SAVEGAME_ERROR("Failed to write save header");
      return false;
    }
    file.close();

    SAVEGAME_INFO("Save successful: " + saveFileName);
    return true;
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error saving game: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::saveToSlot(int slotNumber, const GameWorld &world) {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return save(getSlotFileName(slotNumber), world);
}

bool SaveGameManager::load(const std::string &saveFileName, GameWorld &world) const {
  const std::string fullPath = getFullSavePath(saveFileName);
  if (!std::filesystem::exists(fullPath)) {
    SAVEGAME_ERROR("Save file does not exist: " + saveFileName);
    return false;
  }

  try {
    std::ifstream file(fullPath, std::ios::binary | std::ios::in);
    if (!file.is_open()) {
      SAVEGAME_ERROR("Could not open file for reading: " + fullPath);
      return false;
    }

    SaveGameHeader header;
    if (!readHeader(file, header)) {
      SAVEGAME_ERROR("Invalid save file format");
      return false;
    }
    if (header.version != SAVE_FORMAT_VERSION) {
      SAVEGAME_ERROR("Unsupported save version " + std::to_string(header.version) + " in " +
                     saveFileName);
      return false;
    }

    Reader reader(std::shared_ptr<std::istream>(&file, [](std::istream *) {}));
    SaveGameData summary;
    if (!readSummary(reader, summary)) {
      SAVEGAME_ERROR("Error reading save summary");
      return false;
    }

    // Read into a scratch world so a bad file leaves the caller's world alone
    auto loaded = std::make_unique<GameWorld>();
    if (!readWorld(reader, *loaded)) {
      SAVEGAME_ERROR("Error reading world from " + saveFileName);
      return false;
    }
    world = std::move(*loaded);

    SAVEGAME_INFO("Game loaded: " + saveFileName);
    return true;
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error loading game: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::loadFromSlot(int slotNumber, GameWorld &world) const {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return load(getSlotFileName(slotNumber), world);
}

bool SaveGameManager::deleteSave(const std::string &saveFileName) const {
  try {
    const std::string fullPath = getFullSavePath(saveFileName);
    if (std::filesystem::exists(fullPath)) {
      std::filesystem::remove(fullPath);
      SAVEGAME_INFO("Deleted save: " + saveFileName);
      return true;
    }
    SAVEGAME_ERROR("Save file does not exist: " + fullPath);
    return false;
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error deleting save file: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::deleteSlot(int slotNumber) const {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return deleteSave(getSlotFileName(slotNumber));
}

boost::container::small_vector<std::string, 10> SaveGameManager::getSaveFiles() const {
  boost::container::small_vector<std::string, 10> saveFiles;
  const std::string savePath = m_saveDirectory + "/game_saves";

  std::error_code ec;
  if (!std::filesystem::is_directory(savePath, ec)) {
    return saveFiles;
  }

  try {
    for (const auto &entry : std::filesystem::directory_iterator(savePath)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::string extension = entry.path().extension().string();
      std::transform(extension.begin(), extension.end(), extension.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      const std::string fileName = entry.path().filename().string();
      if (extension == ".dat" && isValidSaveFile(fileName)) {
        saveFiles.push_back(fileName);
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error listing save files: " + std::string(e.what()));
  }

  std::sort(saveFiles.begin(), saveFiles.end());
  return saveFiles;
}

SaveGameData SaveGameManager::getSaveInfo(const std::string &saveFileName) const {
  return extractSaveInfo(saveFileName);
}

boost::container::small_vector<SaveGameData, 10> SaveGameManager::getAllSaveInfo() const {
  boost::container::small_vector<SaveGameData, 10> saveInfoList;
  for (const auto &file : getSaveFiles()) {
    saveInfoList.push_back(extractSaveInfo(file));
  }
  return saveInfoList;
}

bool SaveGameManager::saveExists(const std::string &saveFileName) const {
  std::error_code ec;
  return std::filesystem::exists(getFullSavePath(saveFileName), ec);
}

bool SaveGameManager::slotExists(int slotNumber) const {
  if (slotNumber < 1) {
    return false;
  }
  return saveExists(getSlotFileName(slotNumber));
}

bool SaveGameManager::isValidSaveFile(const std::string &saveFileName) const {
  if (!saveExists(saveFileName)) {
    return false;
  }

  std::ifstream file(getFullSavePath(saveFileName), std::ios::binary | std::ios::in);
  if (!file.is_open()) {
    return false;
  }
  SaveGameHeader header;
  return readHeader(file, header) && header.version == SAVE_FORMAT_VERSION;
}

void SaveGameManager::setSaveDirectory(const std::string &directory) {
  m_saveDirectory = directory;
  // Ensure the game_saves subdirectory exists right away
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_WARN("Save directory is not usable yet: " + directory);
  }
}

void SaveGameManager::clean() {
  if (m_isShutdown) {
    return;
  }
  m_isShutdown = true;
  SAVEGAME_INFO("Save Game Manager resources cleaned!");
}

// Private helper methods
std::string SaveGameManager::getSlotFileName(int slotNumber) const {
  return "save_slot_" + std::to_string(slotNumber) + ".dat";
}

std::string SaveGameManager::getFullSavePath(const std::string &saveFileName) const {
  return m_saveDirectory + "/game_saves/" + saveFileName;
}

bool SaveGameManager::ensureSaveDirectoryExists() const {
  const std::string savePath = m_saveDirectory + "/game_saves";
  std::error_code ec;
  if (std::filesystem::is_directory(savePath, ec)) {
    return true;
  }
  std::filesystem::create_directories(savePath, ec);
  if (ec || !std::filesystem::is_directory(savePath)) {
    SAVEGAME_ERROR("Failed to create save directory " + savePath +
                   (ec ? ": " + ec.message() : std::string{}));
    return false;
  }
  SAVEGAME_INFO("Created save directory: " + savePath);
  return true;
}

SaveGameData SaveGameManager::extractSaveInfo(const std::string &saveFileName) const {
  SaveGameData info;
  info.saveName = saveFileName;

  if (!saveExists(saveFileName)) {
    return info;
  }

  try {
    std::ifstream file(getFullSavePath(saveFileName), std::ios::binary | std::ios::in);
    if (!file.is_open()) {
      return info;
    }

    SaveGameHeader header;
    if (!readHeader(file, header)) {
      SAVEGAME_ERROR("Invalid save file format when extracting info!");
      return info;
    }

    // Set timestamp from header using thread-safe localtime
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &header.timestamp);
#else
    localtime_r(&header.timestamp, &timeinfo);
#endif
    char buffer[80];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
    info.timestamp = buffer;

    Reader reader(std::shared_ptr<std::istream>(&file, [](std::istream *) {}));
    if (!readSummary(reader, info)) {
      SAVEGAME_WARN("Save summary unreadable in " + saveFileName);
    }
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error extracting save info: " + std::string(e.what()));
  }

  return info;
}

bool SaveGameManager::writeHeader(std::ofstream &file, uint32_t dataSize) const {
  SaveGameHeader header;
  std::memcpy(header.signature, SPACE_SAVE_SIGNATURE, SPACE_SAVE_SIGNATURE_SIZE);
  header.version = SAVE_FORMAT_VERSION;
  header.timestamp = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  header.dataSize = dataSize;

  file.write(reinterpret_cast<const char *>(&header), sizeof(SaveGameHeader));
  return file.good();
}

bool SaveGameManager::readHeader(std::ifstream &file, SaveGameHeader &header) const {
  file.read(reinterpret_cast<char *>(&header), sizeof(SaveGameHeader));
  if (!file.good()) {
    return false;
  }
  return std::memcmp(header.signature, SPACE_SAVE_SIGNATURE, SPACE_SAVE_SIGNATURE_SIZE) == 0;
}
