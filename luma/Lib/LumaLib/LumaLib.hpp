#ifndef LUMA_LIB_LUMA_LIB_HPP
#define LUMA_LIB_LUMA_LIB_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "luma/Lib/LumaLib/LumaCfg.hpp"

namespace LumaLib {

  //! Raw payload bytes
  using Bytes = std::vector<std::uint8_t>;

  //! One element per on-air bit, each 0 or 1
  using BitStream = std::vector<std::uint8_t>;

  /**
   * 8-bit type tag carried in every frame.
   *
   * Tags outside this list are still carried and decoded; they are
   * reported as "UNKNOWN" by dataTypeName().
   */
  enum class DataType : std::uint8_t {
    TEXT         = 0x01,
    JSON         = 0x02,
    FILE         = 0x03,
    SENSOR_DATA  = 0x04,
    IMAGE        = 0x05,
    AUDIO        = 0x06,
    GESTURE      = 0x07,
    MESH_COMMAND = 0x08,
    QUANTUM_KEY  = 0x09,
  };

  inline std::uint8_t toTag(DataType type) {
    return static_cast<std::uint8_t>(type);
  }

  //! Human-readable name of a type tag, "UNKNOWN" for unrecognized tags
  const char* dataTypeName(std::uint8_t tag);

  //! True for tags whose payload is expected to be a JSON document
  bool isJsonType(std::uint8_t tag);

  Bytes toBytes(const std::string& text);
  std::string toString(const Bytes& bytes);

} // namespace LumaLib

#endif
