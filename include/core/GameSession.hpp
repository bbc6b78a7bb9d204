/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include "controllers/ControllerRegistry.hpp"
#include "core/EngineMode.hpp"
#include "entities/ItemBuilder.hpp"
#include "events/GameEvent.hpp"
#include "managers/InputManager.hpp"
#include "ui/CameraView.hpp"
#include "ui/Console.hpp"
#include "ui/Menu.hpp"
#include "ui/UIGrid.hpp"
#include "world/GameWorld.hpp"
#include "world/WorldBuilder.hpp"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief One play session: the world, its controllers and the menus around it
 *
 * The session owns the GameWorld while a game is loaded and drives it one
 * tick at a time. Keys arrive through handleKey(); anything that changes
 * the world is queued as a GameEvent and applied on the next tick, while
 * menu navigation and the pause toggle act immediately.
 *
 * Usage:
 * @code
 * GameSession session;
 * session.setMenu(Spacegame::MenuType::Main, 30, 15);
 * while (!session.isOffline()) {
 *     while (auto key = InputManager::Instance().pollKey()) {
 *         session.handleKey(*key);
 *     }
 *     session.update(deltaTime);
 *     session.render(console);
 * }
 * @endcode
 */
class GameSession {
public:
    static constexpr int MAIN_MENU_X = 30;
    static constexpr int MAIN_MENU_Y = 15;
    static constexpr int INGAME_MENU_X = 15;
    static constexpr int INGAME_MENU_Y = 15;
    static constexpr int CONTEXT_MENU_X = 15;
    static constexpr int CONTEXT_MENU_Y = 5;

    GameSession();
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Advance the session by deltaTime seconds
     *
     * While Running, the world ticks once for each tick interval that has
     * elapsed. In every other mode the session ticks straight away so that
     * menu selections are handled without waiting.
     */
    void update(float deltaTime);

    // One pass of menu handling and mode dispatch
    void tick();

    void handleKey(const Spacegame::KeyEvent& key);

    void render(Spacegame::Console& console);

    // Game lifecycle
    bool newGame();
    bool loadGame();
    bool saveGame();
    bool deleteGame();
    void haltGame();
    void pauseGame();
    void unpauseGame();
    void pauseToggle();
    void quit();

    void setMode(Spacegame::EngineMode mode);
    Spacegame::EngineMode getMode() const { return m_mode; }
    bool isOffline() const { return m_mode == Spacegame::EngineMode::Offline; }
    bool isStandby() const { return m_standby; }
    // False once the game has ended or the session is shutting down
    bool isRunning() const { return m_running; }

    // Builds the main menu from the current state; context menus are built by the key handlers
    void setMenu(Spacegame::MenuType type, int x, int y);
    Spacegame::MenuType getVisibleMenu() const { return m_visibleMenu; }
    Spacegame::MenuState<std::string>& getMainMenu() { return m_mainMenu; }
    Spacegame::MenuState<Spacegame::GameEvent>& getContextMenu() { return m_contextMenu; }

    Spacegame::GameWorld* getWorld() { return m_world.get(); }
    const Spacegame::GameWorld* getWorld() const { return m_world.get(); }
    ControllerRegistry& getControllers() { return m_controllers; }

    void solveLayout(const Spacegame::UIRect& area);
    const Spacegame::UIGrid& getGrid() const { return m_grid; }
    const Spacegame::CameraView& getCamera() const { return m_camera; }

    // Save name without directory or extension
    void setSaveFilename(const std::string& name) { m_saveFilename = name; }
    const std::string& getSaveFilename() const { return m_saveFilename; }
    std::string getSaveFileName() const { return m_saveFilename + ".dat"; }

    float getTickInterval() const { return m_tickInterval; }
    void setTickInterval(float seconds);

private:
    bool initWorld();
    bool buildWorldMap();
    void initControllers();
    void worldUpdate();
    void handleMainMenuSelection(const std::string& selection);

    void handleRunningKey(const Spacegame::KeyEvent& key);
    void handleCliKey(const Spacegame::KeyEvent& key);
    void handleMenuKey(const Spacegame::KeyEvent& key);
    void queuePlayerAction(Spacegame::ActionType action);
    void openContextMenu(std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> entries,
                         const std::string& emptyMessage);

    // Context menu builders for the action keys
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> inventoryEntries() const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> dropEntries() const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> pickupEntries() const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> openableEntries(bool currentlyOpen) const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> examineEntries() const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> deviceEntries() const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> lockableEntries(bool currentlyLocked) const;
    std::vector<Spacegame::MenuItem<Spacegame::GameEvent>> accessPortEntries() const;
    void disconnectPlanq();

    void renderCamera(Spacegame::Console& console);
    void renderMenus(Spacegame::Console& console) const;
    void renderPlanq(Spacegame::Console& console);
    void renderMessageLog(Spacegame::Console& console) const;
    void renderPauseBanner(Spacegame::Console& console) const;

    Spacegame::EngineMode m_mode{Spacegame::EngineMode::Standby};
    bool m_running{true};
    bool m_standby{true};
    bool m_endAnnounced{false};

    std::unique_ptr<Spacegame::GameWorld> m_world;
    ControllerRegistry m_controllers;
    std::unique_ptr<Spacegame::WorldBuilder> m_mason;
    Spacegame::ItemBuilder m_artisan;

    Spacegame::MenuType m_visibleMenu{Spacegame::MenuType::None};
    Spacegame::MenuState<std::string> m_mainMenu;
    Spacegame::MenuState<Spacegame::GameEvent> m_contextMenu;
    int m_menuX{MAIN_MENU_X};
    int m_menuY{MAIN_MENU_Y};

    Spacegame::UIGrid m_grid;
    Spacegame::UIRect m_layoutArea;
    Spacegame::CameraView m_camera;

    std::string m_saveFilename{"demo_game"};
    float m_tickInterval{0.25f};
    float m_tickAccumulator{0.0f};
};

#endif // GAME_SESSION_HPP
