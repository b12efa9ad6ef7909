#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

const char* dataTypeName(std::uint8_t tag) {
  switch (static_cast<DataType>(tag)) {
    case DataType::TEXT:
      return "TEXT";
    case DataType::JSON:
      return "JSON";
    case DataType::FILE:
      return "FILE";
    case DataType::SENSOR_DATA:
      return "SENSOR_DATA";
    case DataType::IMAGE:
      return "IMAGE";
    case DataType::AUDIO:
      return "AUDIO";
    case DataType::GESTURE:
      return "GESTURE";
    case DataType::MESH_COMMAND:
      return "MESH_COMMAND";
    case DataType::QUANTUM_KEY:
      return "QUANTUM_KEY";
    default:
      return "UNKNOWN";
  }
}

bool isJsonType(std::uint8_t tag) {
  return tag == toTag(DataType::JSON) || tag == toTag(DataType::SENSOR_DATA);
}

Bytes toBytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

std::string toString(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

} // namespace LumaLib
