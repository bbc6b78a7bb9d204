/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_REGISTRY_HPP
#define CONTROLLER_REGISTRY_HPP

/**
 * @file ControllerRegistry.hpp
 * @brief Type-erased container for the gameplay controllers
 *
 * The ControllerRegistry provides:
 * - Heterogeneous storage of controller types, kept in insertion order
 * - Event dispatch to every active controller in that order
 * - Batch suspend/resume operations
 * - Automatic IUpdatable detection and update dispatch
 * - Type-safe retrieval via get<T>()
 *
 * Ownership: GameSession owns the ControllerRegistry, which owns the controllers.
 *
 * Usage:
 * @code
 * ControllerRegistry controllers;
 * controllers.add<MovementController>();
 * controllers.add<ChaseController>(2, 20);  // Constructor args forwarded
 *
 * for (const auto& event : world.pendingEvents) {
 *     controllers.dispatch(event, world);
 * }
 * controllers.updateAll(tickInterval, world);
 * @endcode
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

class ControllerRegistry
{
public:
    ControllerRegistry() = default;
    ~ControllerRegistry() = default;

    // Non-copyable (owns the controllers)
    ControllerRegistry(const ControllerRegistry&) = delete;
    ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    // Movable
    ControllerRegistry(ControllerRegistry&&) noexcept = default;
    ControllerRegistry& operator=(ControllerRegistry&&) noexcept = default;

    /**
     * @brief Add a controller of type T
     * @tparam T Controller type (must derive from ControllerBase)
     * @tparam Args Constructor argument types
     * @param args Arguments forwarded to T's constructor
     * @return Reference to the created controller
     *
     * If a controller of type T already exists, returns the existing one.
     * Automatically detects IUpdatable interface and adds to update list.
     */
    template<typename T, typename... Args>
    T& add(Args&&... args)
    {
        static_assert(std::is_base_of_v<ControllerBase, T>,
            "T must derive from ControllerBase");

        std::type_index const typeIdx(typeid(T));

        // Check if already registered
        auto it = m_typeToIndex.find(typeIdx);
        if (it != m_typeToIndex.end()) {
            return *static_cast<T*>(m_controllers[it->second].get());
        }

        // Create and store
        auto controller = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *controller;

        size_t index = m_controllers.size();
        m_controllers.push_back(std::move(controller));
        m_typeToIndex[typeIdx] = index;

        // Cache IUpdatable interface if present (compile-time detection)
        if constexpr (std::is_base_of_v<IUpdatable, T>) {
            m_updatables.push_back({
                static_cast<IUpdatable*>(&ref),
                static_cast<ControllerBase*>(&ref)
            });
        }

        return ref;
    }

    /**
     * @brief Get a controller of type T
     * @tparam T Controller type to retrieve
     * @return Pointer to controller, or nullptr if not found
     */
    template<typename T>
    T* get()
    {
        static_assert(std::is_base_of_v<ControllerBase, T>,
            "T must derive from ControllerBase");

        auto it = m_typeToIndex.find(std::type_index(typeid(T)));
        if (it != m_typeToIndex.end()) {
            return static_cast<T*>(m_controllers[it->second].get());
        }
        return nullptr;
    }

    /**
     * @brief Get a controller of type T (const version)
     */
    template<typename T>
    const T* get() const
    {
        return const_cast<ControllerRegistry*>(this)->get<T>();
    }

    /**
     * @brief Check if a controller of type T is registered
     */
    template<typename T>
    [[nodiscard]] bool has() const
    {
        return m_typeToIndex.find(std::type_index(typeid(T))) != m_typeToIndex.end();
    }

    // --- Batch Operations ---

    /**
     * @brief Hand an event to every controller that is not suspended
     * @param event Validated event for this tick
     * @param world World the event applies to
     */
    void dispatch(const Spacegame::GameEvent& event, Spacegame::GameWorld& world)
    {
        for (auto& controller : m_controllers) {
            if (!controller->isSuspended()) {
                controller->handleEvent(event, world);
            }
        }
    }

    /**
     * @brief Suspend all controllers
     * Called when the session pauses
     */
    void suspendAll()
    {
        for (auto& controller : m_controllers) {
            controller->suspend();
        }
    }

    /**
     * @brief Resume all controllers
     * Called when the session unpauses
     */
    void resumeAll()
    {
        for (auto& controller : m_controllers) {
            controller->resume();
        }
    }

    /**
     * @brief Update all IUpdatable controllers
     * @param deltaTime Tick length in seconds
     * @param world World being advanced
     *
     * Only calls update() on controllers that:
     * 1. Implement IUpdatable interface
     * 2. Are not currently suspended
     *
     * Called on every world tick after the queued events are dispatched
     */
    void updateAll(float deltaTime, Spacegame::GameWorld& world)
    {
        for (auto& [updatable, base] : m_updatables) {
            if (!base->isSuspended()) {
                updatable->update(deltaTime, world);
            }
        }
    }

    /**
     * @brief Get count of registered controllers
     */
    [[nodiscard]] size_t size() const { return m_controllers.size(); }

    /**
     * @brief Check if registry is empty
     */
    [[nodiscard]] bool empty() const { return m_controllers.empty(); }

    /**
     * @brief Remove all controllers
     */
    void clear()
    {
        m_controllers.clear();
        m_updatables.clear();
        m_typeToIndex.clear();
    }

private:
    /**
     * @brief Entry for IUpdatable controllers
     * Caches both interfaces to avoid repeated dynamic_cast
     */
    struct UpdatableEntry {
        IUpdatable* updatable;    // For calling update()
        ControllerBase* base;     // For checking isSuspended()
    };

    std::vector<std::unique_ptr<ControllerBase>> m_controllers;
    std::vector<UpdatableEntry> m_updatables;
    std::unordered_map<std::type_index, size_t> m_typeToIndex;
};

#endif // CONTROLLER_REGISTRY_HPP
