/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <cstring>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization for replay files.
 * Every scalar is stored little-endian regardless of the host.
 */
namespace ArenaEngine::BinarySerial {

namespace detail {

template <size_t N> struct UnsignedOfSize;
template <> struct UnsignedOfSize<1> { using type = uint8_t; };
template <> struct UnsignedOfSize<2> { using type = uint16_t; };
template <> struct UnsignedOfSize<4> { using type = uint32_t; };
template <> struct UnsignedOfSize<8> { using type = uint64_t; };

template <typename T>
using WireType = typename UnsignedOfSize<sizeof(T)>::type;

template <typename T>
constexpr bool isScalar = std::is_arithmetic_v<T> || std::is_enum_v<T>;

} // namespace detail

// Reject absurd lengths from corrupt files before allocating
inline constexpr uint32_t MAX_STRING_LENGTH = 1024 * 1024;
inline constexpr uint32_t MAX_VECTOR_SIZE = 1024 * 1024;

/**
 * Binary writer over a shared output stream
 */
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

  // Create writer for file
  static std::unique_ptr<Writer> createFileWriter(const std::string &filename) {
    auto stream = std::make_shared<std::ofstream>(filename, std::ios::binary | std::ios::trunc);
    if (!stream->is_open()) {
      REPLAY_ERROR("Failed to create writer for file: " + filename);
      return nullptr;
    }
    REPLAY_DEBUG("Created binary writer for file: " + filename);
    return std::make_unique<Writer>(stream);
  }

  // Write scalars (integers, floats, bools, enums) little-endian
  template <typename T> bool write(const T &value) {
    static_assert(detail::isScalar<T>, "Type must be an arithmetic or enum type");
    detail::WireType<T> bits;
    std::memcpy(&bits, &value, sizeof(T));
    boost::endian::native_to_little_inplace(bits);
    m_stream->write(reinterpret_cast<const char *>(&bits), sizeof(bits));
    return m_stream->good();
  }

  // Write raw bytes, e.g. a signature or pre-encoded records
  bool writeBytes(const void *data, size_t size) {
    m_stream->write(static_cast<const char *>(data), static_cast<std::streamsize>(size));
    return m_stream->good();
  }

  // Write strings
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

  // Write vectors of scalars
  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(detail::isScalar<T>, "Type must be an arithmetic or enum type");
    uint32_t size = static_cast<uint32_t>(vec.size());
    if (!write(size)) {
      return false;
    }
    for (const T &value : vec) {
      if (!write(value)) {
        return false;
      }
    }
    return m_stream->good();
  }

  // Write custom serializable objects
  template <typename T> bool writeSerializable(const T &obj) {
    return obj.serialize(*this);
  }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

/**
 * Binary reader over a shared input stream
 */
class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

public:
  explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  // Create reader for file
  static std::unique_ptr<Reader> createFileReader(const std::string &filename) {
    auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      REPLAY_ERROR("Failed to create reader for file: " + filename);
      return nullptr;
    }
    REPLAY_DEBUG("Created binary reader for file: " + filename);
    return std::make_unique<Reader>(stream);
  }

  // Read scalars stored little-endian
  template <typename T> bool read(T &value) {
    static_assert(detail::isScalar<T>, "Type must be an arithmetic or enum type");
    detail::WireType<T> bits{};
    m_stream->read(reinterpret_cast<char *>(&bits), sizeof(bits));
    if (!m_stream->good() || m_stream->gcount() != sizeof(bits)) {
      return false;
    }
    boost::endian::little_to_native_inplace(bits);
    std::memcpy(&value, &bits, sizeof(T));
    return true;
  }

  bool readBytes(void *data, size_t size) {
    m_stream->read(static_cast<char *>(data), static_cast<std::streamsize>(size));
    return m_stream->good() && m_stream->gcount() == static_cast<std::streamsize>(size);
  }

  // Read strings
  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > MAX_STRING_LENGTH) {
      REPLAY_ERROR(std::format("String length too large: {} bytes", length));
      return false;
    }

    str.resize(length);
    m_stream->read(&str[0], length);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  // Read vectors of scalars
  template <typename T> bool readVector(std::vector<T> &vec) {
    static_assert(detail::isScalar<T>, "Type must be an arithmetic or enum type");
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }

    if (size > MAX_VECTOR_SIZE) {
      REPLAY_ERROR(std::format("Vector size too large: {} elements", size));
      return false;
    }

    vec.assign(size, T{});
    for (T &value : vec) {
      if (!read(value)) {
        return false;
      }
    }
    return true;
  }

  // Read custom serializable objects
  template <typename T> bool readSerializable(T &obj) {
    return obj.deserialize(*this);
  }

  // True once the stream has no more bytes
  bool atEnd() {
    return m_stream->peek() == std::char_traits<char>::eof();
  }

};

} // namespace ArenaEngine::BinarySerial

/**
 * Helper macros for serialize/deserialize bodies
 */
#define SERIALIZE_PRIMITIVE(writer, member)                                    \
  if (!writer.write(member))                                                   \
    return false;

#define DESERIALIZE_PRIMITIVE(reader, member)                                  \
  if (!reader.read(member))                                                    \
    return false;

#define SERIALIZE_STRING(writer, member)                                       \
  if (!writer.writeString(member))                                             \
    return false;

#define DESERIALIZE_STRING(reader, member)                                     \
  if (!reader.readString(member))                                              \
    return false;

#endif // BINARY_SERIALIZER_HPP
