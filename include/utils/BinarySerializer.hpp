/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization used by the save game system.
 * Writers and readers share ownership of their stream so a caller can
 * keep seeking on it (the save header is written last).
 */
namespace Spacegame::BinarySerial {

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  static std::unique_ptr<Writer> createFileWriter(const std::string &filename) {
    auto stream = std::make_shared<std::ofstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SAVEGAME_ERROR("Failed to create writer for file: " + filename);
      return nullptr;
    }
    SAVEGAME_DEBUG("Created binary writer for file: " + filename);
    return std::make_unique<Writer>(stream);
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    if (length > 0) {
      m_stream->write(str.c_str(), length);
    }
    return m_stream->good();
  }

  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = static_cast<uint32_t>(vec.size());
    if (!write(size)) {
      return false;
    }
    if (size > 0) {
      m_stream->write(reinterpret_cast<const char *>(vec.data()),
                      sizeof(T) * size);
    }
    return m_stream->good();
  }

  // std::vector<bool> has no contiguous storage, so pack one byte per flag
  bool writeFlags(const std::vector<bool> &flags) {
    std::vector<uint8_t> bytes(flags.begin(), flags.end());
    return writeVector(bytes);
  }

  bool writeStrings(const std::vector<std::string> &strings) {
    if (!write(static_cast<uint32_t>(strings.size()))) {
      return false;
    }
    for (const auto &s : strings) {
      if (!writeString(s)) {
        return false;
      }
    }
    return true;
  }

  // Presence byte followed by the value
  template <typename T> bool writeOptional(const std::optional<T> &value) {
    if (!write(static_cast<uint8_t>(value.has_value()))) {
      return false;
    }
    return !value || write(*value);
  }

  bool good() const { return m_stream && m_stream->good(); }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

  static constexpr uint32_t MAX_STRING_BYTES = 1024 * 1024;
  static constexpr uint32_t MAX_ELEMENTS = 1024 * 1024;

public:
  explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static std::unique_ptr<Reader> createFileReader(const std::string &filename) {
    auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SAVEGAME_ERROR("Failed to create reader for file: " + filename);
      return nullptr;
    }
    SAVEGAME_DEBUG("Created binary reader for file: " + filename);
    return std::make_unique<Reader>(stream);
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > MAX_STRING_BYTES) {
      SAVEGAME_ERROR("String length too large: " + std::to_string(length) +
                     " bytes");
      return false;
    }

    str.resize(length);
    m_stream->read(&str[0], length);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  template <typename T> bool readVector(std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }

    if (size == 0) {
      vec.clear();
      return true;
    }

    if (size > MAX_ELEMENTS) {
      SAVEGAME_ERROR("Vector size too large: " + std::to_string(size) +
                     " elements");
      return false;
    }

    vec.resize(size);
    m_stream->read(reinterpret_cast<char *>(vec.data()), sizeof(T) * size);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(sizeof(T) * size);
  }

  bool readFlags(std::vector<bool> &flags) {
    std::vector<uint8_t> bytes;
    if (!readVector(bytes)) {
      return false;
    }
    flags.assign(bytes.begin(), bytes.end());
    return true;
  }

  bool readStrings(std::vector<std::string> &strings) {
    uint32_t count = 0;
    if (!read(count) || count > MAX_ELEMENTS) {
      return false;
    }
    strings.resize(count);
    for (auto &s : strings) {
      if (!readString(s)) {
        return false;
      }
    }
    return true;
  }

  template <typename T> bool readOptional(std::optional<T> &value) {
    uint8_t present = 0;
    if (!read(present)) {
      return false;
    }
    if (!present) {
      value.reset();
      return true;
    }
    T inner{};
    if (!read(inner)) {
      return false;
    }
    value = inner;
    return true;
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace Spacegame::BinarySerial

#endif // BINARY_SERIALIZER_HPP
