/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameSession.hpp"
#include "controllers/ai/ChaseController.hpp"
#include "controllers/planq/PlanqController.hpp"
#include "controllers/planq/PlanqMonitorController.hpp"
#include "controllers/world/DoorController.hpp"
#include "controllers/world/ExamineController.hpp"
#include "controllers/world/ItemController.hpp"
#include "controllers/world/LockController.hpp"
#include "controllers/world/MapIndexingController.hpp"
#include "controllers/world/MovementController.hpp"
#include "controllers/world/OperableController.hpp"
#include "controllers/world/VictoryController.hpp"
#include "controllers/world/VisibilityController.hpp"
#include "core/Logger.hpp"
#include "managers/SaveGameManager.hpp"
#include "managers/SettingsManager.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <tuple>
#include <unordered_map>
#include <utility>

using namespace Spacegame;

namespace {

Position settingPosition(const std::string &category, const std::string &xKey,
                         const std::string &yKey, const std::string &zKey,
                         const Position &fallback) {
  const auto &settings = SettingsManager::Instance();
  return Position(settings.get<int>(category, xKey, fallback.x),
                  settings.get<int>(category, yKey, fallback.y),
                  settings.get<int>(category, zKey, fallback.z));
}

// Removes the last UTF-8 code point from text
void popGlyph(std::string &text) {
  while (!text.empty()) {
    const auto byte = static_cast<unsigned char>(text.back());
    text.pop_back();
    if ((byte & 0xC0) != 0x80)
      break;
  }
}

MenuItem<GameEvent> eventItem(const EntityRecord &record, GameEvent event,
                              std::optional<Position> target = std::nullopt) {
  return MenuItem<GameEvent>::item(record.name(), std::move(event), target);
}

} // namespace

GameSession::GameSession() : m_mason(std::make_unique<JsonWorldBuilder>()) {
  const auto &settings = SettingsManager::Instance();
  setTickInterval(settings.get<float>("game", "tick_interval", 0.25f));
  m_saveFilename = settings.get<std::string>("save", "filename", "demo_game");
  SaveGameManager::Instance().setSaveDirectory(
      settings.get<std::string>("save", "directory", "res"));
}

GameSession::~GameSession() = default;

void GameSession::setTickInterval(float seconds) {
  if (seconds <= 0.0f) {
    GAMESESSION_WARN(std::format("Ignoring tick interval {}", seconds));
    return;
  }
  m_tickInterval = seconds;
}

void GameSession::update(float deltaTime) {
  if (m_mode != EngineMode::Running) {
    m_tickAccumulator = 0.0f;
    tick();
    return;
  }
  m_tickAccumulator += deltaTime;
  while (m_tickAccumulator >= m_tickInterval) {
    m_tickAccumulator -= m_tickInterval;
    tick();
    if (m_mode != EngineMode::Running) {
      m_tickAccumulator = 0.0f;
      break;
    }
  }
}

void GameSession::tick() {
  const EngineMode modeBefore = m_mode;
  for (const auto &event : m_mainMenu.drainEvents()) {
    handleMainMenuSelection(event.selected);
  }
  // A new game has already run its first world update
  if (m_mode != modeBefore && m_mode == EngineMode::Running) {
    return;
  }

  for (const auto &event : m_contextMenu.drainEvents()) {
    const GameEvent &selected = event.selected;
    if (!m_world) {
      continue;
    }
    if (selected.isValid()) {
      m_world->queueEvent(selected);
    } else {
      GAMESESSION_WARN("Dropping invalid menu event " + selected.toString());
    }
  }

  switch (m_mode) {
  case EngineMode::Offline:
    m_running = false;
    break;
  case EngineMode::Standby:
    break;
  case EngineMode::Startup:
    setMode(EngineMode::Running);
    break;
  case EngineMode::Running:
    worldUpdate();
    break;
  case EngineMode::Paused:
    break;
  case EngineMode::GoodEnd:
  case EngineMode::BadEnd:
    if (!m_endAnnounced && m_world) {
      m_world->log.tellPlayer(m_mode == EngineMode::GoodEnd ? "Victory" : "Game over");
      GAMESESSION_INFO(std::format("Game finished: {}", engineModeName(m_mode)));
      m_endAnnounced = true;
    }
    m_running = false;
    break;
  }
}

void GameSession::handleMainMenuSelection(const std::string &selection) {
  MENU_DEBUG("Main menu selected " + selection);
  if (selection == "main.new_game") {
    newGame();
  } else if (selection == "main.load_game") {
    loadGame();
  } else if (selection == "main.save_game") {
    if (saveGame()) {
      GAMESESSION_INFO("Game saved, shutting down");
      quit();
    }
  } else if (selection == "main.abandon_game") {
    GAMESESSION_INFO(std::format("Deleting save {} and shutting down", getSaveFileName()));
    deleteGame();
    quit();
  } else if (selection == "main.quit") {
    GAMESESSION_INFO("Session is shutting down");
    quit();
  } else {
    MENU_ERROR("Unhandled main menu option '" + selection + "'");
  }
}

void GameSession::worldUpdate() {
  if (!m_world) {
    return;
  }

  // Events queued during dispatch wait for the next tick
  const std::vector<GameEvent> events = std::exchange(m_world->pendingEvents, {});
  for (const GameEvent &event : events) {
    if (!event.isValid()) {
      GAMESESSION_WARN("Dropping invalid event " + event.toString());
      continue;
    }
    switch (event.getType().kind) {
    case GameEventType::Kind::PauseToggle:
      pauseToggle();
      break;
    case GameEventType::Kind::ModeSwitch:
      setMode(event.getType().mode);
      break;
    case GameEventType::Kind::SaveRequest:
      saveGame();
      break;
    case GameEventType::Kind::LoadRequest:
      // The world is replaced, so nothing else from this tick applies
      loadGame();
      return;
    default:
      m_controllers.dispatch(event, *m_world);
      break;
    }
  }

  m_controllers.updateAll(m_tickInterval, *m_world);
  m_world->elapsedTime += m_tickInterval;
  ++m_world->tickCount;

  if (m_world->requestedMode) {
    const EngineMode requested = *m_world->requestedMode;
    m_world->requestedMode.reset();
    setMode(requested);
  }
}

void GameSession::setMode(EngineMode mode) {
  if (mode != m_mode) {
    GAMESESSION_DEBUG(std::format("Mode {} -> {}", engineModeName(m_mode), engineModeName(mode)));
  }
  m_mode = mode;
}

void GameSession::quit() {
  setMode(EngineMode::Offline);
  m_running = false;
}

bool GameSession::newGame() {
  if (!m_standby) {
    GAMESESSION_WARN("Game in progress, halting it first");
    haltGame();
  }

  if (!initWorld() || !buildWorldMap()) {
    GAMESESSION_ERROR("Could not start a new game");
    haltGame();
    return false;
  }
  initControllers();
  worldUpdate();

  m_standby = false;
  m_running = true;
  m_endAnnounced = false;
  setMode(EngineMode::Running);
  GAMESESSION_INFO("New game started");
  return true;
}

bool GameSession::initWorld() {
  const auto &settings = SettingsManager::Instance();
  auto world = std::make_unique<GameWorld>();

  const int seed = settings.get<int>("game", "rng_seed", 0);
  world->rng.seed(seed != 0 ? static_cast<std::mt19937::result_type>(seed)
                            : std::random_device{}());

  world->log = MessageLog({"world", "planq", "debug"});
  world->victoryPoint = settingPosition("victory", "x", "y", "z", world->victoryPoint);

  EntityRecord player;
  player.body = Body(settingPosition("player", "spawn_x", "spawn_y", "spawn_z", Position(4, 14, 1)),
                     ScreenCell("@", static_cast<uint8_t>(Color::White)));
  player.description = Description{"Pleyeur", "Still your old self.", ""};
  player.viewshed = Viewshed{8};
  player.memory = Memory{};
  player.player = true;
  player.mobile = true;
  player.obstructive = true;
  player.container = true;
  const EntityID playerId = world->registry.create(std::move(player));

  EntityRecord lmr;
  lmr.body = Body(settingPosition("lmr", "spawn_x", "spawn_y", "spawn_z", Position(12, 12, 0)),
                  ScreenCell("l", static_cast<uint8_t>(Color::LightCyan)));
  lmr.description = Description{"LMR", "The Light Maintenance Robot is awaiting instructions.", ""};
  lmr.viewshed = Viewshed{5};
  lmr.pursuit = Pursuit{};
  lmr.lmr = true;
  lmr.mobile = true;
  lmr.obstructive = true;
  world->registry.create(std::move(lmr));

  if (!m_artisan.loadDefinitions(settings.get<std::string>("game", "items_file", "res/data/furniture_items.json"),
                                 settings.get<std::string>("game", "sets_file", "res/data/furniture_sets.json"))) {
    GAMESESSION_ERROR("Item definitions failed to load");
    return false;
  }

  m_artisan.create("planq");
  if (settings.get<bool>("planq", "start_carried", false)) {
    m_artisan.giveTo(playerId);
  } else {
    m_artisan.at(settingPosition("planq", "spawn_x", "spawn_y", "spawn_z", Position(5, 14, 1)));
  }
  if (!m_artisan.build(world->registry)) {
    GAMESESSION_ERROR("Could not build the PLANQ");
    return false;
  }

  world->planq = PlanqData{};
  world->monitor = PlanqMonitor{};
  world->log.tellPlayer("WELCOME TO SPACEGAME");

  m_world = std::move(world);
  m_endAnnounced = false;
  setMode(EngineMode::Startup);
  return true;
}

bool GameSession::buildWorldMap() {
  if (!m_world) {
    return false;
  }
  const auto &settings = SettingsManager::Instance();
  const std::string layout = settings.get<std::string>("game", "layout_file", "res/data/ship_layout.json");
  if (!m_mason->buildWorld(layout)) {
    GAMESESSION_ERROR("Ship layout " + layout + " failed to build");
    return false;
  }
  m_world->model = m_mason->takeModel();
  GameWorld &world = *m_world;

  // Each entry is (item name, reference position, body variant)
  std::vector<std::tuple<std::string, Position, size_t>> spawns;
  for (const auto &[name, posn] : m_mason->getEssentialItemRequests()) {
    spawns.emplace_back(name, posn, 0);
  }
  for (const auto &[room, item] : m_mason->getAdditionalItemRequests()) {
    auto shape = m_artisan.getRandomShape(item, world.rng);
    if (!shape) {
      continue;
    }
    auto placement = world.model.findSpawnpointIn(room, std::move(*shape), world.rng);
    if (!placement) {
      GAMESESSION_WARN(std::format("No room for {} in {}", item, room));
      continue;
    }
    // Copies of one item inside a placement take successive body cells
    std::unordered_map<std::string, size_t> variants;
    for (const auto &[name, posn] : *placement) {
      spawns.emplace_back(name, posn, variants[name]++);
    }
  }

  for (const auto &[name, posn, variant] : spawns) {
    if (!m_artisan.create(name, variant).at(posn).build(world.registry)) {
      GAMESESSION_WARN(std::format("Failed to spawn {} at {}", name, posn.toString()));
    }
  }

  // Everything on the ground, the player and LMR included, goes onto the map
  for (auto &[id, record] : world.registry.entities()) {
    if (!record.body || record.isCarried) {
      continue;
    }
    world.model.addContents(record.body->posns(), record.obstructive ? 20 : 10, id);
    if (record.description && record.mobile) {
      if (auto room = world.model.getRoomName(record.body->refPosn)) {
        record.description->locn = *room;
      }
    }
  }

  GAMESESSION_INFO(std::format("World built: {} decks, {} entities, {} items spawned",
                               world.model.levels.size(), world.registry.size(),
                               m_artisan.getSpawnCount()));
  return true;
}

void GameSession::initControllers() {
  const auto &settings = SettingsManager::Instance();
  m_controllers.clear();
  m_controllers.add<MovementController>();
  m_controllers.add<DoorController>();
  m_controllers.add<LockController>();
  m_controllers.add<ItemController>();
  m_controllers.add<ExamineController>();
  m_controllers.add<OperableController>();
  m_controllers.add<PlanqController>();
  m_controllers.add<PlanqMonitorController>();
  m_controllers.add<ChaseController>(settings.get<int>("lmr", "chase_interval", 2),
                                     settings.get<int>("lmr", "max_ticks_without_sight", 20));
  m_controllers.add<MapIndexingController>();
  m_controllers.add<VisibilityController>();
  m_controllers.add<VictoryController>();
}

void GameSession::haltGame() {
  m_controllers.clear();
  m_world.reset();
  m_contextMenu.reset();
  m_visibleMenu = MenuType::None;
  m_standby = true;
  m_running = true;
  m_endAnnounced = false;
  setMode(EngineMode::Standby);
}

bool GameSession::saveGame() {
  if (!m_world) {
    GAMESESSION_WARN("No game to save");
    return false;
  }
  return SaveGameManager::Instance().save(getSaveFileName(), *m_world);
}

bool GameSession::loadGame() {
  auto &saves = SaveGameManager::Instance();
  if (!saves.saveExists(getSaveFileName())) {
    GAMESESSION_ERROR("No save file " + saves.getFullSavePath(getSaveFileName()));
    return false;
  }

  auto loaded = std::make_unique<GameWorld>();
  if (!saves.load(getSaveFileName(), *loaded)) {
    return false;
  }

  if (!m_standby) {
    GAMESESSION_WARN("Game in progress, halting it first");
    haltGame();
  }
  m_world = std::move(loaded);

  // Derived map state is not saved
  MapIndexingController::reindex(*m_world);
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (record.viewshed) {
      VisibilityController::refresh(id, *m_world);
    }
  }
  initControllers();

  m_standby = false;
  m_running = true;
  m_endAnnounced = false;
  setMode(EngineMode::Paused);
  GAMESESSION_INFO("Game loaded from " + saves.getFullSavePath(getSaveFileName()));
  return true;
}

bool GameSession::deleteGame() { return SaveGameManager::Instance().deleteSave(getSaveFileName()); }

void GameSession::pauseGame() {
  if (m_mode != EngineMode::Running) {
    return;
  }
  m_controllers.suspendAll();
  setMode(EngineMode::Paused);
}

void GameSession::unpauseGame() {
  if (m_mode != EngineMode::Paused || !m_world) {
    return;
  }
  m_controllers.resumeAll();
  setMode(EngineMode::Running);
}

void GameSession::pauseToggle() {
  if (m_mode == EngineMode::Paused) {
    unpauseGame();
  } else {
    pauseGame();
  }
}

void GameSession::setMenu(MenuType type, int x, int y) {
  if (type == MenuType::Main) {
    std::vector<MenuItem<std::string>> items;
    items.push_back(MenuItem<std::string>::item("New Game", "main.new_game"));
    if (!m_standby) {
      items.push_back(MenuItem<std::string>::item("Save Game", "main.save_game"));
    }
    if (SaveGameManager::Instance().saveExists(getSaveFileName())) {
      items.push_back(MenuItem<std::string>::item("Load Game", "main.load_game"));
    }
    if (!m_standby) {
      items.push_back(MenuItem<std::string>::item("Abandon Game", "main.abandon_game"));
    }
    items.push_back(MenuItem<std::string>::item("Quit", "main.quit"));
    m_mainMenu = MenuState<std::string>(std::move(items));
    m_mainMenu.activate();
  }
  m_menuX = x;
  m_menuY = y;
  m_visibleMenu = type;
}

// ---------------------------------------------------------------------------
// Input

void GameSession::handleKey(const KeyEvent &key) {
  if (key.isCtrlC()) {
    GAMESESSION_INFO("Ctrl-C received, shutting down");
    quit();
    return;
  }
  if (m_mode == EngineMode::Running && m_world) {
    if (m_world->planq.isCliOpen()) {
      handleCliKey(key);
    } else {
      handleRunningKey(key);
    }
    return;
  }
  handleMenuKey(key);
}

void GameSession::handleCliKey(const KeyEvent &key) {
  PlanqController *planq = m_controllers.get<PlanqController>();
  if (!planq) {
    return;
  }
  PlanqData &data = m_world->planq;
  switch (key.code) {
  case KeyEvent::Code::Escape:
    planq->processEvent({PlanqEvent::Type::CliClose}, *m_world);
    break;
  case KeyEvent::Code::Enter: {
    const std::string input = data.cliBuffer;
    m_world->log.tellPlanq("> " + input);
    planq->processEvent({PlanqEvent::Type::CliClose}, *m_world);
    planq->exec(planqParser(input), *m_world);
    break;
  }
  case KeyEvent::Code::Backspace:
    popGlyph(data.cliBuffer);
    break;
  case KeyEvent::Code::Char:
    if (!key.ctrl) {
      data.cliBuffer += key.utf8();
    }
    break;
  default:
    break;
  }
}

void GameSession::handleMenuKey(const KeyEvent &key) {
  const bool ended = m_mode == EngineMode::GoodEnd || m_mode == EngineMode::BadEnd;
  if (key.code == KeyEvent::Code::Escape || key.isChar(U'Q')) {
    m_mainMenu.reset();
    m_contextMenu.reset();
    if (m_standby) {
      setMenu(MenuType::Main, m_menuX, m_menuY);
      return;
    }
    if (ended) {
      if (m_visibleMenu == MenuType::None) {
        setMenu(MenuType::Main, INGAME_MENU_X, INGAME_MENU_Y);
      } else {
        m_visibleMenu = MenuType::None;
      }
      return;
    }
    m_visibleMenu = MenuType::None;
    unpauseGame();
    return;
  }

  if (m_mode == EngineMode::Paused && m_visibleMenu == MenuType::None && key.isChar(U'p')) {
    pauseToggle();
    return;
  }

  if (m_visibleMenu != MenuType::Main && !m_standby) {
    return;
  }
  if (key.isChar(U'h') || key.code == KeyEvent::Code::Left) {
    m_mainMenu.left();
  } else if (key.isChar(U'j') || key.code == KeyEvent::Code::Down) {
    m_mainMenu.down();
  } else if (key.isChar(U'k') || key.code == KeyEvent::Code::Up) {
    m_mainMenu.up();
  } else if (key.isChar(U'l') || key.code == KeyEvent::Code::Right) {
    m_mainMenu.right();
  } else if (key.code == KeyEvent::Code::Enter) {
    m_visibleMenu = MenuType::None;
    m_mainMenu.select();
    if (!m_standby) {
      unpauseGame();
    }
    m_contextMenu.reset();
  }
}

void GameSession::queuePlayerAction(ActionType action) {
  m_world->queueEvent(GameEvent::create(GameEventType::playerAction(action), m_world->player()));
}

void GameSession::openContextMenu(std::vector<MenuItem<GameEvent>> entries,
                                  const std::string &emptyMessage) {
  if (entries.empty()) {
    m_world->log.tellPlayer(emptyMessage);
    return;
  }
  m_contextMenu = MenuState<GameEvent>(std::move(entries));
  m_contextMenu.activate();
  setMenu(MenuType::Context, CONTEXT_MENU_X, CONTEXT_MENU_Y);
}

void GameSession::handleRunningKey(const KeyEvent &key) {
  const bool contextOpen = m_visibleMenu == MenuType::Context;

  switch (key.code) {
  case KeyEvent::Code::Escape:
    break;
  case KeyEvent::Code::Enter:
    if (contextOpen) {
      m_contextMenu.select();
      m_visibleMenu = MenuType::None;
      m_contextMenu.reset();
    }
    return;
  case KeyEvent::Code::Left:
    contextOpen ? m_contextMenu.left() : queuePlayerAction(ActionType::moveTo(Direction::W));
    return;
  case KeyEvent::Code::Right:
    contextOpen ? m_contextMenu.right() : queuePlayerAction(ActionType::moveTo(Direction::E));
    return;
  case KeyEvent::Code::Up:
    contextOpen ? m_contextMenu.up() : queuePlayerAction(ActionType::moveTo(Direction::N));
    return;
  case KeyEvent::Code::Down:
    contextOpen ? m_contextMenu.down() : queuePlayerAction(ActionType::moveTo(Direction::S));
    return;
  case KeyEvent::Code::Char:
    break;
  default:
    return;
  }

  if (key.code == KeyEvent::Code::Escape || key.isChar(U'Q')) {
    m_contextMenu.reset();
    if (m_visibleMenu != MenuType::None) {
      m_visibleMenu = MenuType::None;
    } else {
      setMenu(MenuType::Main, INGAME_MENU_X, INGAME_MENU_Y);
      pauseGame();
    }
    return;
  }

  switch (key.ch) {
  case U'p':
    pauseToggle();
    break;
  case U'h':
    queuePlayerAction(ActionType::moveTo(Direction::W));
    break;
  case U'j':
    queuePlayerAction(ActionType::moveTo(Direction::S));
    break;
  case U'k':
    queuePlayerAction(ActionType::moveTo(Direction::N));
    break;
  case U'l':
    queuePlayerAction(ActionType::moveTo(Direction::E));
    break;
  case U'y':
    queuePlayerAction(ActionType::moveTo(Direction::NW));
    break;
  case U'u':
    queuePlayerAction(ActionType::moveTo(Direction::NE));
    break;
  case U'b':
    queuePlayerAction(ActionType::moveTo(Direction::SW));
    break;
  case U'n':
    queuePlayerAction(ActionType::moveTo(Direction::SE));
    break;
  case U'>':
    queuePlayerAction(ActionType::moveTo(Direction::DOWN));
    break;
  case U'<':
    queuePlayerAction(ActionType::moveTo(Direction::UP));
    break;
  case U'i':
    openContextMenu(inventoryEntries(), "You are not carrying anything.");
    break;
  case U'd':
    openContextMenu(dropEntries(), "You have nothing to drop.");
    break;
  case U'g':
    openContextMenu(pickupEntries(), "There's nothing here to pick up.");
    break;
  case U'o':
    openContextMenu(openableEntries(false), "There's nothing nearby to open.");
    break;
  case U'c':
    openContextMenu(openableEntries(true), "There's nothing nearby to close.");
    break;
  case U'x':
    openContextMenu(examineEntries(), "There's nothing nearby to examine.");
    break;
  case U'a':
    openContextMenu(deviceEntries(), "There's nothing nearby to use.");
    break;
  case U'L':
    openContextMenu(lockableEntries(false), "There's nothing to lock nearby.");
    break;
  case U'U':
    openContextMenu(lockableEntries(true), "There's nothing to unlock nearby.");
    break;
  case U'C':
    openContextMenu(accessPortEntries(), "There are no access ports nearby.");
    break;
  case U'D':
    disconnectPlanq();
    break;
  case U'P':
  case U':':
    if (auto *planq = m_controllers.get<PlanqController>()) {
      planq->processEvent({PlanqEvent::Type::CliOpen}, *m_world);
    }
    break;
  default:
    GAMESESSION_DEBUG(std::format("Unhandled key U+{:04X}", static_cast<uint32_t>(key.ch)));
    break;
  }
}

std::vector<MenuItem<GameEvent>> GameSession::inventoryEntries() const {
  std::vector<MenuItem<GameEvent>> groups;
  const EntityID player = m_world->player();
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (!record.description || !record.portable || record.portable->carrier != player ||
        !record.actions || record.actions->actions.empty()) {
      continue;
    }
    std::vector<GameEvent> events;
    for (const ActionType &action : record.actions->actions) {
      events.push_back(GameEvent::create(GameEventType::playerAction(action), player, id));
    }
    auto submenu = makeNewSubmenu<GameEvent>(
        std::move(events), [](const GameEvent &e) { return e.getType().action.toString(); });
    groups.push_back(MenuItem<GameEvent>::group(record.name(), std::move(submenu)));
  }
  return groups;
}

std::vector<MenuItem<GameEvent>> GameSession::dropEntries() const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (record.description && record.portable && record.isCarried &&
        record.portable->carrier == player) {
      entries.push_back(eventItem(
          record, GameEvent::create(GameEventType::playerAction(ActionType::Kind::DropItem), player, id)));
    }
  }
  return entries;
}

std::vector<MenuItem<GameEvent>> GameSession::pickupEntries() const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  const auto here = m_world->positionOf(player);
  if (!here) {
    return entries;
  }
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (record.description && record.body && record.portable && !record.isCarried &&
        record.body->contains(*here)) {
      entries.push_back(eventItem(
          record, GameEvent::create(GameEventType::playerAction(ActionType::Kind::MoveItem), player, id)));
    }
  }
  return entries;
}

std::vector<MenuItem<GameEvent>> GameSession::openableEntries(bool currentlyOpen) const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  const auto here = m_world->positionOf(player);
  if (!here) {
    return entries;
  }
  const auto kind = currentlyOpen ? ActionType::Kind::CloseItem : ActionType::Kind::OpenItem;
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (record.description && record.body && record.openable &&
        record.openable->isOpen == currentlyOpen && record.body->isAdjacentTo(*here)) {
      entries.push_back(eventItem(record, GameEvent::create(GameEventType::playerAction(kind), player, id),
                                  record.body->refPosn));
    }
  }
  return entries;
}

std::vector<MenuItem<GameEvent>> GameSession::examineEntries() const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  const auto here = m_world->positionOf(player);
  if (!here) {
    return entries;
  }
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (id == player || record.facade || record.isCarried || !record.description || !record.body) {
      continue;
    }
    if (record.body->isWithinRange(*here, 2)) {
      entries.push_back(eventItem(
          record, GameEvent::create(GameEventType::playerAction(ActionType::Kind::Examine), player, id),
          record.body->refPosn));
    }
  }
  return entries;
}

std::vector<MenuItem<GameEvent>> GameSession::deviceEntries() const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  const auto here = m_world->positionOf(player);
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (!record.device || !record.description) {
      continue;
    }
    const bool carried = record.portable && record.isCarried && record.portable->carrier == player;
    const bool nearby = !record.isCarried && record.body && here && record.body->isWithinRange(*here, 1);
    if (carried || nearby) {
      entries.push_back(eventItem(
          record, GameEvent::create(GameEventType::playerAction(ActionType::Kind::UseItem), player, id)));
    }
  }
  return entries;
}

std::vector<MenuItem<GameEvent>> GameSession::lockableEntries(bool currentlyLocked) const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  const auto here = m_world->positionOf(player);
  if (!here) {
    return entries;
  }
  const auto kind = currentlyLocked ? ActionType::Kind::UnlockItem : ActionType::Kind::LockItem;
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (record.description && record.body && record.lockable &&
        record.lockable->isLocked == currentlyLocked && record.body->isWithinRange(*here, 1)) {
      entries.push_back(eventItem(record, GameEvent::create(GameEventType::playerAction(kind), player, id),
                                  record.body->refPosn));
    }
  }
  return entries;
}

std::vector<MenuItem<GameEvent>> GameSession::accessPortEntries() const {
  std::vector<MenuItem<GameEvent>> entries;
  const EntityID player = m_world->player();
  const auto here = m_world->positionOf(player);
  if (!here) {
    return entries;
  }
  for (const auto &[id, record] : m_world->registry.entities()) {
    if (record.accessPort && record.description && record.body && record.body->isAdjacentTo(*here)) {
      entries.push_back(eventItem(record, GameEvent::create(GameEventType::planqConnect(id), player, id),
                                  record.body->refPosn));
    }
  }
  return entries;
}

void GameSession::disconnectPlanq() {
  if (m_world->planq.jackCnxn == INVALID_ENTITY) {
    m_world->log.tellPlayer("There's nothing connected to your PLANQ.");
    return;
  }
  if (auto *planq = m_controllers.get<PlanqController>()) {
    planq->exec({PlanqCmd::Kind::Disconnect, ""}, *m_world);
  }
}

// ---------------------------------------------------------------------------
// Rendering

void GameSession::solveLayout(const UIRect &area) {
  m_layoutArea = area;
  m_grid.calcLayout(area);
  m_camera.setDims(std::max(0, m_grid.camera.width - 2), std::max(0, m_grid.camera.height - 2));
}

void GameSession::render(Console &console) {
  console.clear();
  if (!(console.area() == m_layoutArea)) {
    solveLayout(console.area());
  }

  if (m_standby || !m_world) {
    renderMenus(console);
    return;
  }

  renderCamera(console);
  renderMenus(console);
  renderPlanq(console);
  renderMessageLog(console);
  if (m_mode == EngineMode::Paused) {
    renderPauseBanner(console);
  }
}

void GameSession::renderCamera(Console &console) {
  const UIRect &rect = m_grid.camera;
  console.drawBox(rect, static_cast<uint8_t>(Color::White));
  const UIRect inner{rect.x + 1, rect.y + 1, rect.width - 2, rect.height - 2};

  if (m_visibleMenu == MenuType::Context) {
    m_camera.setReticle(m_contextMenu.target());
  } else {
    m_camera.setReticle(std::nullopt);
  }

  if (m_camera.update(*m_world)) {
    m_camera.blit(console, inner);
  } else {
    console.print(inner.x, inner.y, "[no CameraView initialized]", 7, 0, Mods::NONE, inner.width);
  }
}

void GameSession::renderMenus(Console &console) const {
  const MenuStyle style;
  const bool showMain = m_visibleMenu == MenuType::Main || m_standby;
  if (showMain) {
    console.print(m_menuX, m_menuY - 1, " MAIN", style.highlight.fg, style.shadow.bg, Mods::BOLD,
                  std::max(style.minDropWidth, static_cast<int>(m_mainMenu.width) + 2));
    renderMenu(console, m_mainMenu, m_menuX, m_menuY, style);
  } else if (m_visibleMenu == MenuType::Context) {
    console.print(m_menuX, m_menuY - 1, " CONTEXT", style.highlight.fg, style.shadow.bg, Mods::BOLD,
                  std::max(style.minDropWidth, static_cast<int>(m_contextMenu.width) + 2));
    renderMenu(console, m_contextMenu, m_menuX, m_menuY, style);
  }
}

void GameSession::renderPlanq(Console &console) {
  const PlanqData &planq = m_world->planq;
  const PlanqMonitor &monitor = m_world->monitor;
  m_grid.calcPlanqLayout(monitor.getStatusBars().size(), planq.showCliInput);

  const uint8_t frame = static_cast<uint8_t>(Color::White);
  const UIRect &status = m_grid.planqStatus;
  if (!planq.isCarried) {
    console.print(status.x + 1, status.y + 1, "[no PLANQ detected]", static_cast<uint8_t>(Color::DarkGray), 0,
                  Mods::NONE, status.width - 2);
    return;
  }

  if (planq.showTerminal) {
    const UIRect &out = m_grid.planqStdout;
    console.drawBox(out, frame, "PLANQ");
    const int rows = std::max(0, out.height - 2);
    const auto lines = m_world->log.getLogAsLines("planq");
    const size_t start = lines.size() > static_cast<size_t>(rows) ? lines.size() - rows : 0;
    for (size_t i = start; i < lines.size(); ++i) {
      console.print(out.x + 1, out.y + 1 + static_cast<int>(i - start), lines[i],
                    static_cast<uint8_t>(Color::LightGreen), 0, Mods::NONE, out.width - 2);
    }
    if (planq.showCliInput && !m_grid.planqStdin.isEmpty()) {
      const UIRect &in = m_grid.planqStdin;
      console.fill(in, ScreenCell(" ", 7, static_cast<uint8_t>(Color::Black)));
      console.print(in.x, in.y, "> " + planq.cliBuffer + "_", static_cast<uint8_t>(Color::LightGreen), 0,
                    Mods::NONE, in.width);
    }
  }

  console.drawBox(status, frame);
  const int width = status.width - 2;
  int row = status.y + 1;
  for (const PlanqStatusLine &line : monitor.formatLines(width)) {
    if (row >= status.y + status.height - 1) {
      break;
    }
    if (line.gauge >= 0) {
      const int filled = width * std::clamp(line.gauge, 0, 100) / 100;
      const auto glyphs = Console::splitGlyphs(line.text);
      for (int x = 0; x < width; ++x) {
        const uint8_t bg = x < filled ? static_cast<uint8_t>(Color::Green) : 0;
        const std::string glyph = x < static_cast<int>(glyphs.size()) ? glyphs[static_cast<size_t>(x)] : " ";
        console.put(status.x + 1 + x, row, ScreenCell(glyph, static_cast<uint8_t>(Color::White), bg));
      }
    } else {
      console.print(status.x + 1, row, line.text, 7, 0, Mods::NONE, width);
    }
    ++row;
  }
}

void GameSession::renderMessageLog(Console &console) const {
  const UIRect &rect = m_grid.messageLog;
  if (rect.isEmpty()) {
    return;
  }
  console.drawBox(rect, static_cast<uint8_t>(Color::White));
  const auto lines = m_world->log.getLogAsLines("world");
  const int rows = std::max(0, rect.height - 2);
  const size_t start = lines.size() > static_cast<size_t>(rows) ? lines.size() - rows : 0;
  for (size_t i = start; i < lines.size(); ++i) {
    console.print(rect.x + 1, rect.y + 1 + static_cast<int>(i - start), lines[i], 7, 0, Mods::NONE,
                  rect.width - 2);
  }
}

void GameSession::renderPauseBanner(Console &console) const {
  static const std::string banner{"*** PAUSED ***"};
  const UIRect &camera = m_grid.camera;
  const int width = static_cast<int>(banner.size()) + 4;
  const UIRect area{camera.x + std::max(0, (camera.width - width) / 2), camera.y + 5, width, 3};
  console.fill(area, ScreenCell(" ", 0, static_cast<uint8_t>(Color::Black)));
  console.drawBox(area, static_cast<uint8_t>(Color::LightYellow));
  console.print(area.x + 2, area.y + 1, banner, static_cast<uint8_t>(Color::LightYellow), 0, Mods::BOLD);
}
