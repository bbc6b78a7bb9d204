/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_EVENT_HPP
#define GAME_EVENT_HPP

/**
 * @file GameEvent.hpp
 * @brief Gameplay events queued by input handlers and menus
 *
 * A GameEvent pairs a GameEventType with an optional context naming the
 * acting entity (subject) and the entity acted upon (object). Events are
 * validated by the session before being dispatched to the controllers on
 * the next world tick.
 */

#include "core/EngineMode.hpp"
#include "entities/EntityID.hpp"
#include "utils/Position.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace Spacegame {

/**
 * Something an entity can do. Only MoveTo carries a direction; every
 * other kind leaves dir at its default so that comparisons stay exact.
 */
struct ActionType {
    enum class Kind : uint8_t {
        NoAction = 0,
        Examine,
        MoveTo,
        Inventory,
        MoveItem,
        DropItem,
        UseItem,
        KillItem,
        OpenItem,
        CloseItem,
        LockItem,
        UnlockItem
    };

    Kind kind{Kind::NoAction};
    Direction dir{Direction::N};

    constexpr ActionType() = default;
    constexpr ActionType(Kind k) : kind(k) {}
    constexpr ActionType(Kind k, Direction d) : kind(k), dir(d) {}

    static constexpr ActionType moveTo(Direction d) { return {Kind::MoveTo, d}; }

    // Display name, also used as the menu label
    std::string toString() const;

    constexpr auto operator<=>(const ActionType&) const = default;
    constexpr bool operator==(const ActionType&) const = default;
};

struct GameEventType {
    enum class Kind : uint8_t {
        NullEvent = 0,
        PauseToggle,
        ModeSwitch,
        PlayerAction,
        ActorAction,
        PlanqConnect,
        SaveRequest,
        LoadRequest
    };

    Kind kind{Kind::NullEvent};
    ActionType action{};
    EngineMode mode{EngineMode::Offline};
    EntityID target{INVALID_ENTITY};

    static GameEventType nullEvent() { return {}; }
    static GameEventType pauseToggle() { return {Kind::PauseToggle}; }
    static GameEventType modeSwitch(EngineMode m) { return {Kind::ModeSwitch, {}, m}; }
    static GameEventType playerAction(ActionType a) { return {Kind::PlayerAction, a}; }
    static GameEventType actorAction(ActionType a) { return {Kind::ActorAction, a}; }
    static GameEventType planqConnect(EntityID t) {
        return {Kind::PlanqConnect, {}, EngineMode::Offline, t};
    }
    static GameEventType saveRequest() { return {Kind::SaveRequest}; }
    static GameEventType loadRequest() { return {Kind::LoadRequest}; }

    bool isAction() const { return kind == Kind::PlayerAction || kind == Kind::ActorAction; }

    std::string toString() const;

    bool operator==(const GameEventType&) const = default;
};

struct GameEventContext {
    EntityID subject{INVALID_ENTITY};
    EntityID object{INVALID_ENTITY};

    bool isBlank() const { return subject == INVALID_ENTITY && object == INVALID_ENTITY; }
    // Exactly one side is still the placeholder
    bool isPartial() const {
        return (subject == INVALID_ENTITY) != (object == INVALID_ENTITY);
    }

    bool operator==(const GameEventContext&) const = default;
};

class GameEvent {
public:
    GameEvent() = default;

    // Stores no context when both ids are the placeholder
    static GameEvent create(GameEventType type,
                            EntityID subject = INVALID_ENTITY,
                            EntityID object = INVALID_ENTITY);

    bool isValid() const;

    const GameEventType& getType() const { return m_type; }
    const std::optional<GameEventContext>& getContext() const { return m_context; }
    EntityID getSubject() const { return m_context ? m_context->subject : INVALID_ENTITY; }
    EntityID getObject() const { return m_context ? m_context->object : INVALID_ENTITY; }

    bool isAction(ActionType::Kind kind) const {
        return m_type.isAction() && m_type.action.kind == kind;
    }

    std::string toString() const;

    bool operator==(const GameEvent&) const = default;

private:
    GameEventType m_type{};
    std::optional<GameEventContext> m_context;
};

inline std::ostream& operator<<(std::ostream& os, const ActionType& action) {
    return os << action.toString();
}

inline std::ostream& operator<<(std::ostream& os, const GameEvent& event) {
    return os << event.toString();
}

} // namespace Spacegame

#endif // GAME_EVENT_HPP
