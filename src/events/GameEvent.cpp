/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/GameEvent.hpp"
#include "core/Logger.hpp"

#include <format>

namespace Spacegame {

std::string ActionType::toString() const
{
    switch (kind) {
        case Kind::NoAction:   return "NoAction";
        case Kind::Examine:    return "Examine";
        case Kind::MoveTo:     return std::format("MoveTo({})", directionName(dir));
        case Kind::Inventory:  return "Inventory";
        case Kind::MoveItem:   return "Move";
        case Kind::DropItem:   return "Drop";
        case Kind::UseItem:    return "Use";
        case Kind::KillItem:   return "Kill";
        case Kind::OpenItem:   return "Open";
        case Kind::CloseItem:  return "Close";
        case Kind::LockItem:   return "Lock";
        case Kind::UnlockItem: return "Unlock";
    }
    return "Unknown";
}

std::string GameEventType::toString() const
{
    switch (kind) {
        case Kind::NullEvent:    return "NullEvent";
        case Kind::PauseToggle:  return "PauseToggle";
        case Kind::ModeSwitch:   return std::format("ModeSwitch({})", engineModeName(mode));
        case Kind::PlayerAction: return std::format("PlayerAction({})", action.toString());
        case Kind::ActorAction:  return std::format("ActorAction({})", action.toString());
        case Kind::PlanqConnect: return std::format("PlanqConnect({})", target);
        case Kind::SaveRequest:  return "SaveRequest";
        case Kind::LoadRequest:  return "LoadRequest";
    }
    return "Unknown";
}

GameEvent GameEvent::create(GameEventType type, EntityID subject, EntityID object)
{
    GameEvent event;
    event.m_type = type;
    if (subject != INVALID_ENTITY || object != INVALID_ENTITY) {
        event.m_context = GameEventContext{subject, object};
    }
    return event;
}

bool GameEvent::isValid() const
{
    using K = GameEventType::Kind;
    using A = ActionType::Kind;

    switch (m_type.kind) {
        case K::NullEvent:
            return false;
        case K::PauseToggle:
        case K::ModeSwitch:
        case K::SaveRequest:
        case K::LoadRequest:
            return true;
        case K::PlayerAction:
        case K::ActorAction: {
            if (!m_context) {
                return m_type.action.kind == A::Inventory;
            }
            const bool hasSubject = m_context->subject != INVALID_ENTITY;
            const bool hasObject = m_context->object != INVALID_ENTITY;
            switch (m_type.action.kind) {
                case A::MoveTo:
                    return hasSubject;
                case A::Examine:
                case A::UseItem:
                case A::MoveItem:
                case A::DropItem:
                case A::KillItem:
                case A::OpenItem:
                case A::CloseItem:
                case A::LockItem:
                case A::UnlockItem:
                    return hasSubject && hasObject;
                default:
                    CONTROLLER_WARN("Unhandled action in event validation: " + toString());
                    return false;
            }
        }
        case K::PlanqConnect:
            return m_type.target != INVALID_ENTITY && m_context && !m_context->isBlank();
    }
    return false;
}

std::string GameEvent::toString() const
{
    if (!m_context) {
        return m_type.toString();
    }
    return std::format("{} [{} -> {}]", m_type.toString(), m_context->subject, m_context->object);
}

} // namespace Spacegame
