/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SAVE_GAME_MANAGER_HPP
#define SAVE_GAME_MANAGER_HPP

#include "utils/Position.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <optional>
#include <string>

namespace Spacegame {
struct GameWorld;
}

// SaveGame header structure - used at the beginning of save files
struct SaveGameHeader {
    char signature[9]{'S', 'P', 'A', 'C', 'E', 'S', 'A', 'V', 'E'}; // File signature "SPACESAVE"
    uint32_t version{2};                                          // Save format version
    time_t timestamp{0};                                          // Save timestamp
    uint32_t dataSize{0};                                         // Size of data section
};

// Summary of a save file, read without loading the world
struct SaveGameData {
    std::string saveName{};
    std::string timestamp{};
    std::optional<Spacegame::Position> playerPosition{};
    std::string playerRoom{};
    uint64_t tickCount{0};
};

/**
 * Writes and reads whole GameWorlds to binary files under
 * "<save directory>/game_saves/". A save is the header, a short summary
 * block used by getSaveInfo(), then the world itself.
 *
 * Nothing here throws to the caller: every failure is logged and
 * reported through the return value. A failed load leaves the target
 * world untouched.
 */
class SaveGameManager {
public:
    static constexpr uint32_t SAVE_FORMAT_VERSION = 2;

    ~SaveGameManager() = default;

    static SaveGameManager& Instance() {
        static SaveGameManager instance;
        initialized = true;
        return instance;
    }

    static bool Exists() { return initialized; }

    // Save the world to a file; returns true if the save was successful
    bool save(const std::string& saveFileName, const Spacegame::GameWorld& world);

    // Slots are numbered from 1 and stored as "save_slot_<n>.dat"
    bool saveToSlot(int slotNumber, const Spacegame::GameWorld& world);

    // Replace the world with the file's contents
    bool load(const std::string& saveFileName, Spacegame::GameWorld& world) const;

    bool loadFromSlot(int slotNumber, Spacegame::GameWorld& world) const;

    bool deleteSave(const std::string& saveFileName) const;

    bool deleteSlot(int slotNumber) const;

    // Valid .dat files in the save directory
    boost::container::small_vector<std::string, 10> getSaveFiles() const;

    SaveGameData getSaveInfo(const std::string& saveFileName) const;

    boost::container::small_vector<SaveGameData, 10> getAllSaveInfo() const;

    bool saveExists(const std::string& saveFileName) const;

    bool slotExists(int slotNumber) const;

    // True if the file exists and starts with a valid header
    bool isValidSaveFile(const std::string& saveFileName) const;

    // Set the base directory for save files
    void setSaveDirectory(const std::string& directory);
    const std::string& getSaveDirectory() const { return m_saveDirectory; }

    std::string getFullSavePath(const std::string& saveFileName) const;

    // Clean up resources
    void clean();

private:
    std::string m_saveDirectory{"res"};  // Default save directory
    bool m_isShutdown{false};
    static bool initialized;

    // Helper methods
    std::string getSlotFileName(int slotNumber) const;
    bool ensureSaveDirectoryExists() const;
    SaveGameData extractSaveInfo(const std::string& saveFileName) const;

    // Binary file operations
    bool writeHeader(std::ofstream& file, uint32_t dataSize) const;
    bool readHeader(std::ifstream& file, SaveGameHeader& header) const;

    // Delete copy constructor and assignment operator
    SaveGameManager(const SaveGameManager&) = delete;  // prevent copy construction
    SaveGameManager& operator=(const SaveGameManager&) = delete;  // prevent assignment

    SaveGameManager() = default;
};

#endif  // SAVE_GAME_MANAGER_HPP
