#include "luma/Lib/LumaLib/Envelope.hpp"

#include <json/json.h>

#include <memory>

#include "luma/Lib/LumaLib/Base64.hpp"

namespace LumaLib {

namespace {

bool parseJson(const char* begin, const char* end, Json::Value& root) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  return reader->parse(begin, end, &root, &errors);
}

bool parseJsonObject(const Bytes& payload, Json::Value& root) {
  // Cheap rejection before invoking the parser on binary payloads
  std::size_t i = 0;
  while (i < payload.size() && (payload[i] == ' ' || payload[i] == '\n' ||
                                payload[i] == '\r' || payload[i] == '\t')) {
    ++i;
  }
  if (i >= payload.size() || payload[i] != '{') {
    return false;
  }
  const char* begin = reinterpret_cast<const char*>(payload.data());
  if (!parseJson(begin, begin + payload.size(), root)) {
    return false;
  }
  return root.isObject();
}

std::string writeJson(const Json::Value& root) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

bool readUInt(const Json::Value& root, const char* key, std::uint32_t& value) {
  const Json::Value& v = root[key];
  if (!v.isUInt()) {
    return false;
  }
  value = v.asUInt();
  return true;
}

bool readFecBlock(const Json::Value& node, FecBlock& block) {
  if (!node.isObject() || !node["scheme"].isString() || !node["data"].isString()) {
    return false;
  }
  std::uint32_t length = 0;
  if (!readUInt(node, "length", length)) {
    return false;
  }
  Bytes data;
  if (!base64Decode(node["data"].asString(), data)) {
    return false;
  }
  block.scheme = node["scheme"].asString();
  block.length = length;
  block.data.swap(data);
  return true;
}

Json::Value fecToJson(const FecBlock& block) {
  Json::Value node(Json::objectValue);
  node["scheme"] = block.scheme;
  node["length"] = block.length;
  node["data"] = base64Encode(block.data);
  return node;
}

// "data" of a tagged envelope is base64; absent when an FEC block carries it
bool readTaggedBody(const Json::Value& root, Envelope& env) {
  std::uint32_t flags = 0;
  if (root.isMember("flags")) {
    if (!readUInt(root, "flags", flags) || flags > 0xFFu) {
      return false;
    }
  }
  env.flags = static_cast<std::uint8_t>(flags);

  if (root.isMember("fec")) {
    if (!readFecBlock(root["fec"], env.fec)) {
      return false;
    }
    env.hasFec = true;
  }
  if (root["data"].isString()) {
    if (!base64Decode(root["data"].asString(), env.data)) {
      return false;
    }
  } else if (!env.hasFec) {
    return false;
  }
  return true;
}

bool parseTagged(const Json::Value& root, Envelope& env) {
  const std::string kind = root["kind"].asString();
  if (kind == "data") {
    env.kind = Envelope::Kind::DATA;
    return readTaggedBody(root, env);
  }
  if (kind == "chunk") {
    env.kind = Envelope::Kind::CHUNK;
    if (!readUInt(root, "id", env.id) ||
        !readUInt(root, "sequence", env.sequence) ||
        !readUInt(root, "total", env.total)) {
      return false;
    }
    if (env.total == 0 || env.sequence >= env.total) {
      return false;
    }
    return readTaggedBody(root, env);
  }
  return false;
}

bool parseLegacy(const Json::Value& root, Envelope& env) {
  if (root.isMember("sequence") && root.isMember("total") && root["data"].isString()) {
    if (!readUInt(root, "sequence", env.sequence) || !readUInt(root, "total", env.total)) {
      return false;
    }
    if (env.total == 0 || env.sequence >= env.total) {
      return false;
    }
    env.kind = Envelope::Kind::CHUNK;
    env.id = 0;
    env.data = toBytes(root["data"].asString());
    return true;
  }
  if (root["data"].isString() && root.isMember("fec")) {
    if (!readFecBlock(root["fec"], env.fec)) {
      return false;
    }
    env.kind = Envelope::Kind::DATA;
    env.flags = PacketFlags::FEC_ENABLED;
    env.hasFec = true;
    env.data = toBytes(root["data"].asString());
    return true;
  }
  return false;
}

} // namespace

Envelope parseEnvelope(const Bytes& payload) {
  Envelope raw;
  raw.data = payload;

  Json::Value root;
  if (!parseJsonObject(payload, root)) {
    return raw;
  }

  const Json::Value& object = root;
  Envelope env;
  const bool ok = object["kind"].isString() ? parseTagged(object, env) : parseLegacy(object, env);
  return ok ? env : raw;
}

Bytes serializeDataEnvelope(std::uint8_t flags, const Bytes& data, const FecBlock* fec) {
  Json::Value root(Json::objectValue);
  root["kind"] = "data";
  root["flags"] = static_cast<Json::UInt>(flags);
  if (fec != nullptr) {
    root["fec"] = fecToJson(*fec);
  } else {
    root["data"] = base64Encode(data);
  }
  return toBytes(writeJson(root));
}

Bytes serializeChunkEnvelope(std::uint32_t id, const Chunk& chunk, std::uint8_t flags, const FecBlock* fec) {
  Json::Value root(Json::objectValue);
  root["kind"] = "chunk";
  root["id"] = id;
  root["sequence"] = chunk.sequence;
  root["total"] = chunk.total;
  root["flags"] = static_cast<Json::UInt>(flags);
  if (fec != nullptr) {
    root["fec"] = fecToJson(*fec);
  } else {
    root["data"] = base64Encode(chunk.data);
  }
  return toBytes(writeJson(root));
}

const char* backendModeName(BackendMode mode) {
  switch (mode) {
    case BackendMode::NONE:
      return "none";
    case BackendMode::AUTH:
      return "auth";
    case BackendMode::CONFIG:
      return "config";
    case BackendMode::COMMAND:
      return "command";
  }
  return "none";
}

BackendMode detectBackendMode(const Bytes& payload) {
  Json::Value root;
  bool parsed = parseJsonObject(payload, root);
  if (!parsed && payload.size() > 2) {
    const char p0 = static_cast<char>(payload[0]);
    const char p1 = static_cast<char>(payload[1]);
    if ((p0 == '0' || p0 == '1') && (p1 == '0' || p1 == '1')) {
      const Bytes body(payload.begin() + 2, payload.end());
      parsed = parseJsonObject(body, root);
    }
  }
  const Json::Value& object = root;
  if (!parsed || !object["mode"].isString()) {
    return BackendMode::NONE;
  }

  const std::string mode = object["mode"].asString();
  if (mode == "auth") {
    return BackendMode::AUTH;
  }
  if (mode == "config") {
    return BackendMode::CONFIG;
  }
  if (mode == "command") {
    return BackendMode::COMMAND;
  }
  return BackendMode::NONE;
}

bool isJsonDocument(const Bytes& payload) {
  if (payload.empty()) {
    return false;
  }
  Json::Value root;
  const char* begin = reinterpret_cast<const char*>(payload.data());
  return parseJson(begin, begin + payload.size(), root);
}

} // namespace LumaLib
