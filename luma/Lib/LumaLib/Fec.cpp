#include "luma/Lib/LumaLib/Fec.hpp"

namespace LumaLib {

namespace {

constexpr std::size_t COPIES = 3;

} // namespace

const char* RepetitionFec::scheme() const {
  return "rep3";
}

FecBlock RepetitionFec::encode(const Bytes& data) const {
  FecBlock block;
  block.scheme = this->scheme();
  block.length = static_cast<std::uint32_t>(data.size());
  block.data.reserve(data.size() * COPIES);
  for (std::size_t copy = 0; copy < COPIES; ++copy) {
    block.data.insert(block.data.end(), data.begin(), data.end());
  }
  return block;
}

FecResult RepetitionFec::decode(const FecBlock& block) const {
  FecResult r{};
  if (block.scheme != this->scheme()) {
    r.data = block.data; // not ours to correct, pass through untouched
    return r;
  }

  const std::size_t n = block.length;
  bool ok = (block.data.size() == n * COPIES);
  // A short block still yields whatever complete triples it holds
  const std::size_t usable = ok ? n : block.data.size() / COPIES;

  r.data.reserve(usable);
  for (std::size_t i = 0; i < usable; ++i) {
    const std::uint8_t a = block.data[i];
    const std::uint8_t b = block.data[usable + i];
    const std::uint8_t c = block.data[2 * usable + i];

    if (a == b && b == c) {
      r.data.push_back(a);
    } else if (a == b || a == c) {
      r.data.push_back(a);
      ++r.errorsCorrected;
    } else if (b == c) {
      r.data.push_back(b);
      ++r.errorsCorrected;
    } else {
      r.data.push_back(static_cast<std::uint8_t>((a & b) | (a & c) | (b & c)));
      ok = false;
    }
  }

  r.success = ok;
  return r;
}

} // namespace LumaLib
