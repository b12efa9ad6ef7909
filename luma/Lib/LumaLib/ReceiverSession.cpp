#include "luma/Lib/LumaLib/ReceiverSession.hpp"

#include <iterator>
#include <limits>
#include <memory>
#include <utility>

#include "luma/Lib/LumaLib/Bits.hpp"
#include "luma/Lib/LumaLib/Lzss.hpp"
#include "luma/Lib/LumaLib/Parity.hpp"

namespace LumaLib {

namespace {

constexpr std::size_t NO_CANDIDATE = std::numeric_limits<std::size_t>::max();

} // namespace

const char* receiverStateName(ReceiverState state) {
  switch (state) {
    case ReceiverState::IDLE:
      return "IDLE";
    case ReceiverState::CALIBRATING:
      return "CALIBRATING";
    case ReceiverState::WAITING_FOR_START:
      return "WAITING_FOR_START";
    case ReceiverState::RECEIVING:
      return "RECEIVING";
    case ReceiverState::END_DETECTED:
      return "END_DETECTED";
    case ReceiverState::PARITY_CHECK:
      return "PARITY_CHECK";
    case ReceiverState::SUCCESS:
      return "SUCCESS";
    case ReceiverState::ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

const char* receiveEventName(ReceiveEvent event) {
  switch (event) {
    case ReceiveEvent::NONE:
      return "None";
    case ReceiveEvent::IGNORED:
      return "Ignored";
    case ReceiveEvent::START_DETECTED:
      return "StartDetected";
    case ReceiveEvent::MESSAGE_DECODED:
      return "MessageDecoded";
    case ReceiveEvent::MESSAGE_REJECTED:
      return "MessageRejected";
    case ReceiveEvent::PACKET_DECODED:
      return "PacketDecoded";
    case ReceiveEvent::CHUNK_BUFFERED:
      return "ChunkBuffered";
    case ReceiveEvent::PACKET_REJECTED:
      return "PacketRejected";
    case ReceiveEvent::DECOMPRESSION_FAILED:
      return "DecompressionFailed";
  }
  return "Unknown";
}

// ------------------------------------------------------------------
// Construction / configuration
// ------------------------------------------------------------------

ReceiverSession::ReceiverSession(const ReceiverConfig& config)
  : m_config(config)
  , m_state(IdleState{})
  , m_threshold(config.initialThreshold)
  , m_fec(std::make_unique<RepetitionFec>())
  , m_scanOffset(0)
  , m_candidateStart(NO_CANDIDATE)
  , m_candidateStartMs(0)
  , m_reassembly(config.reassemblyTimeoutMs, config.maxPendingGroups)
{
  if (m_config.maxBufferBits < 2 * Cfg::MIN_PACKET_BITS) {
    m_config.maxBufferBits = 2 * Cfg::MIN_PACKET_BITS;
  }
}

void ReceiverSession::setFecCodec(std::unique_ptr<FecCodec> codec) {
  if (codec) {
    m_fec = std::move(codec);
  }
}

void ReceiverSession::setMode(ReceiveMode mode) {
  m_config.mode = mode;
  this->clearBuffers();
  const ReceiverState current = this->state();
  if (current != ReceiverState::IDLE && current != ReceiverState::CALIBRATING) {
    m_state = WaitingState{};
  }
}

// ------------------------------------------------------------------
// Calibration
// ------------------------------------------------------------------

void ReceiverSession::startCalibration() {
  this->clearBuffers();
  CalibrationEngine engine(m_config.calibrationMethod,
                           m_config.calibrationMargin,
                           m_config.maxCalibrationSamples);
  engine.start();
  m_state = CalibratingState{std::move(engine)};
}

bool ReceiverSession::addCalibrationSample(std::uint8_t brightness) {
  CalibratingState* calibrating = std::get_if<CalibratingState>(&m_state);
  if (calibrating == nullptr) {
    return false;
  }
  return calibrating->engine.addSample(brightness);
}

CalibrationStatus ReceiverSession::finishCalibration() {
  CalibratingState* calibrating = std::get_if<CalibratingState>(&m_state);
  if (calibrating == nullptr) {
    return CalibrationStatus::NOT_CALIBRATING;
  }

  std::uint8_t threshold = m_threshold;
  const CalibrationStatus status = calibrating->engine.finish(threshold);
  if (status == CalibrationStatus::OK) {
    m_threshold = threshold;
    m_state = WaitingState{};
  }
  return status;
}

void ReceiverSession::setThreshold(std::uint8_t threshold) {
  m_threshold = threshold;
}

void ReceiverSession::startReceiving() {
  const ReceiverState current = this->state();
  if (current == ReceiverState::IDLE || current == ReceiverState::CALIBRATING) {
    this->clearBuffers();
    m_state = WaitingState{};
  }
}

// ------------------------------------------------------------------
// Sample intake
// ------------------------------------------------------------------

SampleReport ReceiverSession::processSample(std::uint8_t brightness, std::uint64_t nowMs) {
  const std::uint8_t bit = (brightness > m_threshold) ? 1 : 0;
  return this->processBit(bit, nowMs);
}

SampleReport ReceiverSession::processBit(std::uint8_t bit, std::uint64_t nowMs) {
  SampleReport report{};
  report.bit = (bit != 0) ? 1 : 0;

  const ReceiverState current = this->state();
  if (current == ReceiverState::IDLE || current == ReceiverState::CALIBRATING) {
    report.event = ReceiveEvent::IGNORED;
    report.state = current;
    return report;
  }

  if (m_config.mode == ReceiveMode::LEGACY) {
    this->processLegacyBit(report.bit, nowMs, report);
  } else {
    report.expiredGroups = m_reassembly.expire(nowMs);
    this->processPacketBit(report.bit, nowMs, report);
  }

  report.state = this->state();
  return report;
}

// ---------- Legacy mode ----------

void ReceiverSession::processLegacyBit(std::uint8_t bit, std::uint64_t nowMs, SampleReport& report) {
  if (std::holds_alternative<SuccessState>(m_state) || std::holds_alternative<ErrorState>(m_state)) {
    m_state = WaitingState{};
  }

  if (WaitingState* waiting = std::get_if<WaitingState>(&m_state)) {
    waiting->window = static_cast<std::uint8_t>((waiting->window << 1) | bit);
    if (waiting->filled < Cfg::MARKER_BITS) {
      ++waiting->filled;
    }
    if (waiting->filled == Cfg::MARKER_BITS && waiting->window == Cfg::START_MARKER) {
      ReceivingState receiving;
      receiving.startMs = nowMs;
      m_state = std::move(receiving);
      report.event = ReceiveEvent::START_DETECTED;
    }
    return;
  }

  ReceivingState* receiving = std::get_if<ReceivingState>(&m_state);
  if (receiving == nullptr) {
    return;
  }

  receiving->bits.push_back(bit);
  const std::size_t n = receiving->bits.size();

  // The end marker only counts when it follows whole 9-bit units
  if (n >= Cfg::MARKER_BITS &&
      (n - Cfg::MARKER_BITS) % Cfg::LEGACY_UNIT_BITS == 0 &&
      fromBinary(receiving->bits, n - Cfg::MARKER_BITS, Cfg::MARKER_BITS) == Cfg::END_MARKER) {
    EndDetectedState end;
    end.unitBits.assign(receiving->bits.begin(),
                        receiving->bits.end() - static_cast<std::ptrdiff_t>(Cfg::MARKER_BITS));
    end.startMs = receiving->startMs;
    m_state = std::move(end);
    this->runParityCheck(nowMs, report);
    return;
  }

  if (n > m_config.maxBufferBits) {
    // End marker lost; give up on this message
    ++m_stats.framingErrors;
    m_state = ErrorState{};
    report.event = ReceiveEvent::MESSAGE_REJECTED;
  }
}

void ReceiverSession::runParityCheck(std::uint64_t nowMs, SampleReport& report) {
  EndDetectedState* end = std::get_if<EndDetectedState>(&m_state);
  if (end == nullptr) {
    return;
  }

  ParityCheckState check;
  check.unitBits = std::move(end->unitBits);
  check.startMs = end->startMs;
  m_state = std::move(check);
  const ParityCheckState& pc = std::get<ParityCheckState>(m_state);

  std::string message;
  message.reserve(pc.unitBits.size() / Cfg::LEGACY_UNIT_BITS);
  for (std::size_t i = 0; i + Cfg::LEGACY_UNIT_BITS <= pc.unitBits.size(); i += Cfg::LEGACY_UNIT_BITS) {
    const std::uint8_t* unit = pc.unitBits.data() + i;
    if (!validateParity(unit, Cfg::LEGACY_UNIT_BITS)) {
      ++m_stats.parityErrors;
      m_state = ErrorState{};
      report.event = ReceiveEvent::MESSAGE_REJECTED;
      return;
    }
    message.push_back(static_cast<char>(fromBinary(unit, 8)));
  }

  const std::uint64_t startMs = pc.startMs;
  this->emitRecord(toTag(DataType::TEXT), toBytes(message), startMs, nowMs);
  m_state = SuccessState{std::move(message)};
  report.event = ReceiveEvent::MESSAGE_DECODED;
}

// ---------- Packet mode ----------

void ReceiverSession::processPacketBit(std::uint8_t bit, std::uint64_t nowMs, SampleReport& report) {
  if (std::holds_alternative<SuccessState>(m_state) || std::holds_alternative<ErrorState>(m_state)) {
    m_state = WaitingState{};
  }

  m_packetBits.push_back(bit);
  if (m_packetBits.size() < Cfg::MIN_PACKET_BITS) {
    return;
  }

  bool rejected = false;
  while (true) {
    const ParseResult r = decodePacket(m_packetBits, m_scanOffset, m_config.maxPacketPayload);
    // A rejection stays the reported status unless a later frame decodes
    if (!rejected || r.status == ParseStatus::OK) {
      report.parseStatus = r.status;
    }

    if (r.status == ParseStatus::OK) {
      const std::uint64_t startMs =
          (m_candidateStart == r.startIndex) ? m_candidateStartMs : nowMs;
      this->acceptFrame(r, startMs, nowMs, report);
      break;
    }

    if (r.status == ParseStatus::START_FRAME_NOT_FOUND) {
      m_scanOffset = r.scannedTo;
      m_candidateStart = NO_CANDIDATE;
      if (!rejected) {
        m_state = WaitingState{};
      }
      break;
    }

    if (r.status == ParseStatus::INCOMPLETE_FRAME) {
      if (m_candidateStart != r.startIndex) {
        m_candidateStart = r.startIndex;
        m_candidateStartMs = nowMs;
      }
      // Noise ahead of a real start marker can announce a long frame that
      // never ends; a complete frame behind it wins over the stalled candidate
      ParseResult later;
      if (this->findFrameEndingNow(r.startIndex + 1, later)) {
        report.parseStatus = ParseStatus::OK;
        this->acceptFrame(later, m_candidateStartMs, nowMs, report);
        break;
      }

      m_scanOffset = r.startIndex;
      if (!rejected) {
        ReceivingState receiving;
        receiving.startMs = m_candidateStartMs;
        m_state = std::move(receiving);
      }
      break;
    }

    // Corrupt frame: fatal to this message only, resume after its start marker
    ++m_stats.packetsRejected;
    if (r.status == ParseStatus::CHECKSUM_MISMATCH) {
      ++m_stats.checksumErrors;
    } else {
      ++m_stats.framingErrors;
    }
    report.event = ReceiveEvent::PACKET_REJECTED;
    m_state = ErrorState{};
    rejected = true;
    m_scanOffset = r.startIndex + 1;
    m_candidateStart = NO_CANDIDATE;
  }

  this->enforceBufferCap(report);
}

bool ReceiverSession::findFrameEndingNow(std::size_t after, ParseResult& found) const {
  // Anything that ended earlier was already seen on an earlier bit
  const std::size_t n = m_packetBits.size();
  if (fromBinary(m_packetBits, n - Cfg::MARKER_BITS, Cfg::MARKER_BITS) != Cfg::END_MARKER) {
    return false;
  }

  const std::size_t lengthAt = Cfg::MARKER_BITS + Cfg::TYPE_BITS;
  for (std::size_t start = after; start + Cfg::MIN_PACKET_BITS <= n; ++start) {
    if (fromBinary(m_packetBits, start, Cfg::MARKER_BITS) != Cfg::START_MARKER) {
      continue;
    }
    const std::size_t length = fromBinary(m_packetBits, start + lengthAt, Cfg::LENGTH_BITS);
    if (length > m_config.maxPacketPayload || start + packetBitLength(length) != n) {
      continue;
    }
    ParseResult r = decodePacket(m_packetBits, start, m_config.maxPacketPayload);
    if (r.status == ParseStatus::OK) {
      found = std::move(r);
      return true;
    }
  }
  return false;
}

void ReceiverSession::acceptFrame(const ParseResult& frame, std::uint64_t startMs,
                                  std::uint64_t nowMs, SampleReport& report) {
  m_packetBits.erase(m_packetBits.begin(),
                     m_packetBits.begin() + static_cast<std::ptrdiff_t>(frame.endIndex));
  m_scanOffset = 0;
  m_candidateStart = NO_CANDIDATE;
  ++m_stats.packetsDecoded;
  this->dispatchPacket(frame.packet, startMs, nowMs, report);
}

void ReceiverSession::dispatchPacket(const Packet& packet, std::uint64_t startMs,
                                     std::uint64_t nowMs, SampleReport& report) {
  Envelope env = parseEnvelope(packet.payload);
  Bytes data = std::move(env.data);

  if ((env.flags & PacketFlags::FEC_ENABLED) != 0) {
    if (env.hasFec) {
      FecResult fec = m_fec->decode(env.fec);
      report.errorsCorrected = fec.errorsCorrected;
      m_stats.fecErrorsCorrected += fec.errorsCorrected;
      if (fec.success) {
        report.fecStatus = FecStatus::DECODED;
      } else {
        // Uncorrectable: the best-effort bytes still go through
        report.fecStatus = FecStatus::FAILED_PASSTHROUGH;
        ++m_stats.fecFailures;
      }
      data = std::move(fec.data);
    } else {
      report.fecStatus = FecStatus::FAILED_PASSTHROUGH;
      ++m_stats.fecFailures;
    }
  }

  std::uint64_t recordStartMs = startMs;
  if (env.kind == Envelope::Kind::CHUNK) {
    Chunk chunk;
    chunk.sequence = env.sequence;
    chunk.total = env.total;
    chunk.data = std::move(data);
    const std::size_t evictedBefore = m_reassembly.evictions();
    ReassemblyResult joined = m_reassembly.add(packet.type, env.id, std::move(chunk), nowMs);
    report.evictedGroups = m_reassembly.evictions() - evictedBefore;
    if (joined.status != ReassemblyStatus::COMPLETE) {
      report.event = ReceiveEvent::CHUNK_BUFFERED;
      m_state = WaitingState{};
      return;
    }
    data = std::move(joined.data);
    recordStartMs = joined.firstSeenMs;
  }

  if ((env.flags & PacketFlags::COMPRESSED) != 0) {
    Bytes plain;
    if (!lzssDecompress(data, plain, m_config.maxMessageBytes)) {
      ++m_stats.decompressionFailures;
      report.event = ReceiveEvent::DECOMPRESSION_FAILED;
      m_state = ErrorState{};
      return;
    }
    data.swap(plain);
  }

  this->emitRecord(packet.type, std::move(data), recordStartMs, nowMs);
  report.event = ReceiveEvent::PACKET_DECODED;
  m_state = SuccessState{};
}

void ReceiverSession::enforceBufferCap(SampleReport& report) {
  if (m_packetBits.size() <= m_config.maxBufferBits) {
    return;
  }

  const std::size_t keep = m_config.maxBufferBits / 2;
  m_packetBits.erase(m_packetBits.begin(),
                     m_packetBits.end() - static_cast<std::ptrdiff_t>(keep));
  m_scanOffset = 0;
  m_candidateStart = NO_CANDIDATE;
  ++m_stats.truncations;
  report.truncated = true;
  if (std::holds_alternative<ReceivingState>(m_state)) {
    m_state = WaitingState{};
  }
}

// ------------------------------------------------------------------
// Output / housekeeping
// ------------------------------------------------------------------

void ReceiverSession::emitRecord(std::uint8_t type, Bytes data, std::uint64_t startMs, std::uint64_t nowMs) {
  DecodedRecord record;
  record.type = type;
  record.typeName = dataTypeName(type);
  record.timestampMs = nowMs;
  record.durationMs = (nowMs >= startMs) ? (nowMs - startMs) : 0;
  record.size = data.size();
  record.isJson = isJsonType(type) && isJsonDocument(data);
  record.backendMode = detectBackendMode(data);
  record.data = std::move(data);

  m_outbox.push_back(std::move(record));
  ++m_stats.messagesDecoded;
}

void ReceiverSession::clearBuffers() {
  m_packetBits.clear();
  m_scanOffset = 0;
  m_candidateStart = NO_CANDIDATE;
  m_candidateStartMs = 0;
}

void ReceiverSession::reset() {
  this->clearBuffers();
  m_reassembly.clear();
  m_state = IdleState{};
}

ReceiverState ReceiverSession::state() const {
  return static_cast<ReceiverState>(m_state.index());
}

std::size_t ReceiverSession::bufferedBits() const {
  if (m_config.mode == ReceiveMode::PACKET) {
    return m_packetBits.size();
  }
  if (const ReceivingState* receiving = std::get_if<ReceivingState>(&m_state)) {
    return receiving->bits.size();
  }
  return 0;
}

std::string ReceiverSession::lastMessage() const {
  if (const SuccessState* success = std::get_if<SuccessState>(&m_state)) {
    return success->message;
  }
  return std::string();
}

std::vector<DecodedRecord> ReceiverSession::takeRecords() {
  std::vector<DecodedRecord> records(std::make_move_iterator(m_outbox.begin()),
                                     std::make_move_iterator(m_outbox.end()));
  m_outbox.clear();
  return records;
}

ReceiverStats ReceiverSession::stats() const {
  ReceiverStats s = m_stats;
  s.mode = m_config.mode;
  s.state = this->state();
  s.threshold = m_threshold;
  s.pendingGroups = m_reassembly.pendingGroups();
  s.bufferedBits = this->bufferedBits();
  s.expiredGroups = static_cast<std::uint32_t>(m_reassembly.expiredCount());
  s.evictedGroups = static_cast<std::uint32_t>(m_reassembly.evictions());
  return s;
}

} // namespace LumaLib
