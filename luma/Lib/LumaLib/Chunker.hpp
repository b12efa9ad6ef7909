#ifndef LUMA_LIB_CHUNKER_HPP
#define LUMA_LIB_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  struct Chunk {
    std::uint32_t sequence = 0;  // 0-based index
    std::uint32_t total = 0;     // chunk count of the logical payload
    Bytes data;
  };

  enum class ReassemblyStatus : std::int32_t {
    COMPLETE   = 0,
    INCOMPLETE = 1,  // still waiting; not an error
  };

  struct ReassemblyResult {
    ReassemblyStatus status = ReassemblyStatus::INCOMPLETE;
    Bytes data;                   // meaningful only when COMPLETE
    std::uint64_t firstSeenMs = 0; // arrival time of the group's first chunk (tables only)
  };

  /**
   * Split payload into ceil(len / maxChunkSize) contiguous pieces.
   *
   * Returns false when maxChunkSize is 0. An empty payload yields no chunks.
   */
  bool chunkPayload(const Bytes& payload, std::size_t maxChunkSize, std::vector<Chunk>& out);

  /**
   * Sort by sequence and concatenate.
   *
   * INCOMPLETE unless the set holds exactly one chunk for every sequence
   * in [0, total) and every chunk agrees on total. Missing, duplicated
   * or inconsistent chunks all read as INCOMPLETE.
   */
  ReassemblyResult reassembleChunks(std::vector<Chunk> chunks);

  /**
   * Pending reassembly groups keyed by (type tag, transmission id).
   *
   * A group is dropped as soon as it completes, when it has not been
   * touched for timeoutMs, or when it is the least recently touched
   * group and room is needed for a new one.
   */
  class ReassemblyTable {
    public:
      ReassemblyTable(std::uint64_t timeoutMs, std::size_t maxGroups);

      //! Store chunk and try to complete its group
      ReassemblyResult add(std::uint8_t type, std::uint32_t id, Chunk chunk, std::uint64_t nowMs);

      //! Drop groups idle for longer than the timeout, returns how many
      std::size_t expire(std::uint64_t nowMs);

      std::size_t pendingGroups() const { return m_groups.size(); }
      std::size_t evictions() const { return m_evictions; }
      std::size_t expiredCount() const { return m_expired; }

      void clear();

    private:
      struct Key {
        std::uint8_t type;
        std::uint32_t id;
        bool operator<(const Key& other) const {
          return (type != other.type) ? type < other.type : id < other.id;
        }
      };

      struct Group {
        std::vector<Chunk> chunks;
        std::uint64_t firstSeenMs = 0;
        std::uint64_t lastTouchMs = 0;
      };

      void evictOldest();

      std::uint64_t m_timeoutMs;
      std::size_t m_maxGroups;
      std::size_t m_evictions;
      std::size_t m_expired;
      std::map<Key, Group> m_groups;
  };

} // namespace LumaLib

#endif
