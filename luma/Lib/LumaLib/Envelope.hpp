#ifndef LUMA_LIB_ENVELOPE_HPP
#define LUMA_LIB_ENVELOPE_HPP

#include <cstdint>
#include <string>

#include "luma/Lib/LumaLib/Chunker.hpp"
#include "luma/Lib/LumaLib/Fec.hpp"
#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  /**
   * Payload envelope carried inside a frame.
   *
   * Wire forms (JSON objects, keys in any order):
   *  - tagged data:  {"kind":"data","flags":F,"data":"<b64>"}
   *                  {"kind":"data","flags":F,"fec":{"scheme":S,"length":N,"data":"<b64>"}}
   *  - tagged chunk: {"kind":"chunk","id":I,"sequence":Q,"total":T,"flags":F,
   *                   "data":"<b64>" | "fec":{...}}
   *  - legacy chunk: {"sequence":Q,"total":T,"data":"<literal text>"}
   *  - legacy FEC:   {"data":"<literal text>","fec":{...}}
   * Any other payload is RAW and used as-is.
   */
  struct Envelope {
    enum class Kind {
      RAW,
      DATA,
      CHUNK,
    };

    Kind kind = Kind::RAW;
    std::uint8_t flags = 0;
    Bytes data;           // RAW: whole payload, otherwise the "data" field
    bool hasFec = false;
    FecBlock fec;

    // CHUNK only
    std::uint32_t id = 0;
    std::uint32_t sequence = 0;
    std::uint32_t total = 0;
  };

  //! Classify payload once; never fails (unrecognized content is RAW)
  Envelope parseEnvelope(const Bytes& payload);

  //! Serialize a tagged data envelope; fec may be null
  Bytes serializeDataEnvelope(std::uint8_t flags, const Bytes& data, const FecBlock* fec);

  //! Serialize a tagged chunk envelope; when fec is non-null it replaces chunk.data
  Bytes serializeChunkEnvelope(std::uint32_t id, const Chunk& chunk, std::uint8_t flags, const FecBlock* fec);

  //! Backend payload routing tag taken from a JSON "mode" field
  enum class BackendMode {
    NONE,
    AUTH,
    CONFIG,
    COMMAND,
  };

  const char* backendModeName(BackendMode mode);

  /**
   * Inspect a decoded payload for a backend envelope: a JSON object whose
   * "mode" is "auth", "config" or "command", optionally preceded by a
   * two-character mode prefix ("01", "10", "11", "00").
   */
  BackendMode detectBackendMode(const Bytes& payload);

  //! True when payload parses as a JSON document
  bool isJsonDocument(const Bytes& payload);

} // namespace LumaLib

#endif
