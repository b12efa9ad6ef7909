#include "luma/Lib/LumaLib/Chunker.hpp"

#include <algorithm>
#include <utility>

namespace LumaLib {

bool chunkPayload(const Bytes& payload, std::size_t maxChunkSize, std::vector<Chunk>& out) {
  if (maxChunkSize == 0) {
    return false;
  }

  out.clear();
  const std::size_t total = (payload.size() + maxChunkSize - 1) / maxChunkSize;
  out.reserve(total);
  for (std::size_t i = 0; i < payload.size(); i += maxChunkSize) {
    const std::size_t end = std::min(payload.size(), i + maxChunkSize);
    Chunk c;
    c.sequence = static_cast<std::uint32_t>(i / maxChunkSize);
    c.total = static_cast<std::uint32_t>(total);
    c.data.assign(payload.begin() + static_cast<std::ptrdiff_t>(i),
                  payload.begin() + static_cast<std::ptrdiff_t>(end));
    out.push_back(std::move(c));
  }
  return true;
}

ReassemblyResult reassembleChunks(std::vector<Chunk> chunks) {
  ReassemblyResult r{};
  if (chunks.empty()) {
    return r;
  }

  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const Chunk& a, const Chunk& b) { return a.sequence < b.sequence; });

  const std::uint32_t total = chunks[0].total;
  if (chunks.size() != total) {
    return r;
  }
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].sequence != i || chunks[i].total != total) {
      return r; // gap, duplicate or disagreeing total
    }
  }

  for (const Chunk& c : chunks) {
    r.data.insert(r.data.end(), c.data.begin(), c.data.end());
  }
  r.status = ReassemblyStatus::COMPLETE;
  return r;
}

// ---------- ReassemblyTable ----------

ReassemblyTable::ReassemblyTable(std::uint64_t timeoutMs, std::size_t maxGroups)
  : m_timeoutMs(timeoutMs)
  , m_maxGroups(maxGroups == 0 ? 1 : maxGroups)
  , m_evictions(0)
  , m_expired(0)
{
}

ReassemblyResult ReassemblyTable::add(std::uint8_t type, std::uint32_t id, Chunk chunk, std::uint64_t nowMs) {
  this->expire(nowMs);

  const Key key{type, id};
  auto it = m_groups.find(key);
  if (it == m_groups.end()) {
    if (m_groups.size() >= m_maxGroups) {
      this->evictOldest();
    }
    Group fresh;
    fresh.firstSeenMs = nowMs;
    it = m_groups.emplace(key, std::move(fresh)).first;
  }

  Group& group = it->second;
  group.lastTouchMs = nowMs;

  // A different total means a new transmission reused the key
  if (!group.chunks.empty() && group.chunks.front().total != chunk.total) {
    group.chunks.clear();
    group.firstSeenMs = nowMs;
  }

  auto same = std::find_if(group.chunks.begin(), group.chunks.end(),
                           [&chunk](const Chunk& c) { return c.sequence == chunk.sequence; });
  if (same != group.chunks.end()) {
    *same = std::move(chunk); // retransmitted copy replaces the earlier one
  } else {
    group.chunks.push_back(std::move(chunk));
  }

  ReassemblyResult r = reassembleChunks(group.chunks);
  r.firstSeenMs = group.firstSeenMs;
  if (r.status == ReassemblyStatus::COMPLETE) {
    m_groups.erase(it);
  }
  return r;
}

std::size_t ReassemblyTable::expire(std::uint64_t nowMs) {
  std::size_t dropped = 0;
  for (auto it = m_groups.begin(); it != m_groups.end();) {
    if (nowMs >= it->second.lastTouchMs && nowMs - it->second.lastTouchMs > m_timeoutMs) {
      it = m_groups.erase(it);
      ++dropped;
      ++m_expired;
    } else {
      ++it;
    }
  }
  return dropped;
}

void ReassemblyTable::evictOldest() {
  auto oldest = m_groups.end();
  for (auto it = m_groups.begin(); it != m_groups.end(); ++it) {
    if (oldest == m_groups.end() || it->second.lastTouchMs < oldest->second.lastTouchMs) {
      oldest = it;
    }
  }
  if (oldest != m_groups.end()) {
    m_groups.erase(oldest);
    ++m_evictions;
  }
}

void ReassemblyTable::clear() {
  m_groups.clear();
}

} // namespace LumaLib
