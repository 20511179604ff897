/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <format>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization for save data.
 * Values are written in host byte order; strings and vectors carry a
 * uint32_t length prefix.
 */
namespace StrataEngine::BinarySerial {

// Upper bounds accepted when reading length prefixes
inline constexpr uint32_t MAX_STRING_LENGTH = 1024 * 1024;
inline constexpr uint32_t MAX_VECTOR_ELEMENTS = 1024 * 1024;

class Writer {
public:
    explicit Writer(std::shared_ptr<std::ostream> stream) : m_stream(std::move(stream)) {
        if (!m_stream || !m_stream->good()) {
            throw std::runtime_error("Invalid output stream");
        }
    }

    ~Writer() {
        if (m_stream) {
            m_stream->flush();
        }
    }

    static std::unique_ptr<Writer> createFileWriter(const std::string& filename) {
        auto stream = std::make_shared<std::ofstream>(filename, std::ios::binary | std::ios::trunc);
        if (!stream->is_open()) {
            SAVEGAME_ERROR("Failed to create writer for file: " + filename);
            return nullptr;
        }
        return std::make_unique<Writer>(std::move(stream));
    }

    template <typename T> bool write(const T& value) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        m_stream->write(reinterpret_cast<const char*>(&value), sizeof(T));
        return m_stream->good();
    }

    bool writeString(const std::string& str) {
        if (str.size() > MAX_STRING_LENGTH) {
            SAVEGAME_ERROR(std::format("String too long to serialize: {} bytes", str.size()));
            return false;
        }
        const auto length = static_cast<uint32_t>(str.size());
        if (!write(length)) {
            return false;
        }
        if (length > 0) {
            m_stream->write(str.data(), length);
        }
        return m_stream->good();
    }

    template <typename T> bool writeVector(const std::vector<T>& vec) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        if (vec.size() > MAX_VECTOR_ELEMENTS) {
            SAVEGAME_ERROR(std::format("Vector too large to serialize: {} elements", vec.size()));
            return false;
        }
        const auto size = static_cast<uint32_t>(vec.size());
        if (!write(size)) {
            return false;
        }
        if (size > 0) {
            m_stream->write(reinterpret_cast<const char*>(vec.data()), sizeof(T) * size);
        }
        return m_stream->good();
    }

    bool good() const { return m_stream && m_stream->good(); }

    void flush() { m_stream->flush(); }

private:
    std::shared_ptr<std::ostream> m_stream;
};

class Reader {
public:
    explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(std::move(stream)) {
        if (!m_stream || !m_stream->good()) {
            throw std::runtime_error("Invalid input stream");
        }
    }

    static std::unique_ptr<Reader> createFileReader(const std::string& filename) {
        auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
        if (!stream->is_open()) {
            SAVEGAME_ERROR("Failed to create reader for file: " + filename);
            return nullptr;
        }
        return std::make_unique<Reader>(std::move(stream));
    }

    template <typename T> bool read(T& value) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        m_stream->read(reinterpret_cast<char*>(&value), sizeof(T));
        return m_stream->good() && m_stream->gcount() == static_cast<std::streamsize>(sizeof(T));
    }

    bool readString(std::string& str) {
        uint32_t length = 0;
        if (!read(length)) {
            return false;
        }
        if (length == 0) {
            str.clear();
            return true;
        }
        if (length > MAX_STRING_LENGTH) {
            SAVEGAME_ERROR(std::format("String length too large: {} bytes", length));
            return false;
        }

        str.resize(length);
        m_stream->read(str.data(), length);
        return m_stream->good() && m_stream->gcount() == static_cast<std::streamsize>(length);
    }

    template <typename T> bool readVector(std::vector<T>& vec) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        uint32_t size = 0;
        if (!read(size)) {
            return false;
        }
        if (size == 0) {
            vec.clear();
            return true;
        }
        if (size > MAX_VECTOR_ELEMENTS) {
            SAVEGAME_ERROR(std::format("Vector size too large: {} elements", size));
            return false;
        }

        vec.resize(size);
        const auto bytes = static_cast<std::streamsize>(sizeof(T) * size);
        m_stream->read(reinterpret_cast<char*>(vec.data()), bytes);
        return m_stream->good() && m_stream->gcount() == bytes;
    }

    bool good() const { return m_stream && m_stream->good(); }

private:
    std::shared_ptr<std::istream> m_stream;
};

} // namespace StrataEngine::BinarySerial

#endif // BINARY_SERIALIZER_HPP
