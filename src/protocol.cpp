#include <framecrypt/protocol.h>

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace framecrypt::protocol {

using nlohmann::json;

namespace {

constexpr auto inbound_types = std::array<std::string_view, 8>{
  "init",     "updateKey",         "encrypt",  "decrypt",
  "enableEncryption", "disableEncryption", "getStats", "cleanup",
};

constexpr auto outbound_types = std::array<std::string_view, 7>{
  "ready",           "keyUpdated", "encryptSuccess", "decryptSuccess",
  "error",           "cleanupComplete", "stats",
};

constexpr auto error_codes = std::array<std::pair<ErrorCode, std::string_view>, 7>{ {
  { ErrorCode::encryption_failed, "ENCRYPTION_FAILED" },
  { ErrorCode::decryption_failed, "DECRYPTION_FAILED" },
  { ErrorCode::generation_unrecoverable, "GENERATION_UNRECOVERABLE" },
  { ErrorCode::authentication_failed, "AUTHENTICATION_FAILED" },
  { ErrorCode::key_import_failed, "KEY_IMPORT_FAILED" },
  { ErrorCode::invalid_message, "INVALID_MESSAGE" },
  { ErrorCode::unknown_message_type, "UNKNOWN_MESSAGE_TYPE" },
} };

[[noreturn]] void
invalid(const std::string& type, const std::string& what)
{
  throw protocol_error(ErrorCode::invalid_message,
                       "Malformed '" + type + "' message: " + what);
}

std::optional<uint64_t>
as_unsigned(const json& value)
{
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }

  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(value.get<int64_t>());
  }

  return std::nullopt;
}

json
make_header(const char* type, const std::optional<OperationId>& id)
{
  auto header = json{ { "type", type } };
  if (id) {
    header["operationId"] = *id;
  }
  return header;
}

json
key_payload(const KeyMaterial& key)
{
  return { { "encryptionKey", key.encryption_key },
           { "generation", key.generation } };
}

///
/// Inbound encoding
///
Envelope
to_envelope(Init&& msg)
{
  auto header = make_header("init", msg.operation_id);
  if (msg.key) {
    header["payload"] = key_payload(*msg.key);
  }
  return { std::move(header), std::nullopt };
}

Envelope
to_envelope(UpdateKey&& msg)
{
  auto header = make_header("updateKey", msg.operation_id);
  header["payload"] = key_payload(msg.key);
  return { std::move(header), std::nullopt };
}

Envelope
to_envelope(Encrypt&& msg)
{
  return { make_header("encrypt", msg.operation_id), std::move(msg.frame) };
}

Envelope
to_envelope(Decrypt&& msg)
{
  return { make_header("decrypt", msg.operation_id), std::move(msg.frame) };
}

Envelope
to_envelope(EnableEncryption&& msg)
{
  return { make_header("enableEncryption", msg.operation_id), std::nullopt };
}

Envelope
to_envelope(DisableEncryption&& msg)
{
  return { make_header("disableEncryption", msg.operation_id), std::nullopt };
}

Envelope
to_envelope(GetStats&& msg)
{
  return { make_header("getStats", msg.operation_id), std::nullopt };
}

Envelope
to_envelope(Cleanup&& msg)
{
  return { make_header("cleanup", msg.operation_id), std::nullopt };
}

///
/// Outbound encoding
///
Envelope
to_envelope(Ready&& msg)
{
  return { make_header("ready", msg.operation_id), std::nullopt };
}

Envelope
to_envelope(KeyUpdated&& msg)
{
  return { make_header("keyUpdated", msg.operation_id), std::nullopt };
}

Envelope
to_envelope(EncryptSuccess&& msg)
{
  auto header = make_header("encryptSuccess", msg.operation_id);
  header["payload"] = { { "encryptionTime", msg.encryption_time_ms } };
  return { std::move(header), std::move(msg.frame) };
}

Envelope
to_envelope(DecryptSuccess&& msg)
{
  auto header = make_header("decryptSuccess", msg.operation_id);
  auto payload = json{ { "decryptionTime", msg.decryption_time_ms },
                       { "wasEncrypted", msg.was_encrypted } };
  if (msg.used_generation) {
    payload["usedGeneration"] = *msg.used_generation;
  }
  header["payload"] = std::move(payload);
  return { std::move(header), std::move(msg.frame) };
}

Envelope
to_envelope(Error&& msg)
{
  auto header = make_header("error", msg.operation_id);
  auto payload = json{ { "error", msg.message } };
  if (msg.code) {
    payload["code"] = to_string(*msg.code);
  }
  header["payload"] = std::move(payload);
  return { std::move(header), std::nullopt };
}

Envelope
to_envelope(CleanupComplete&& msg)
{
  return { make_header("cleanupComplete", msg.operation_id), std::nullopt };
}

Envelope
to_envelope(StatsReport&& msg)
{
  auto header = make_header("stats", msg.operation_id);
  header["payload"] = msg.stats;
  return { std::move(header), std::nullopt };
}

///
/// Field access for decoding
///
std::optional<OperationId>
read_operation_id(const std::string& type, const json& header)
{
  const auto it = header.find("operationId");
  if (it == header.end() || it->is_null()) {
    return std::nullopt;
  }

  const auto id = as_unsigned(*it);
  if (!id) {
    invalid(type, "operationId must be a non-negative integer");
  }
  return id;
}

OperationId
require_operation_id(const std::string& type, const json& header)
{
  const auto id = read_operation_id(type, header);
  if (!id) {
    invalid(type, "operationId is required");
  }
  return *id;
}

const json&
require_payload(const std::string& type, const json& header)
{
  const auto it = header.find("payload");
  if (it == header.end() || !it->is_object()) {
    invalid(type, "payload object is required");
  }
  return *it;
}

bytes
require_frame(const std::string& type, Envelope& envelope)
{
  if (!envelope.frame) {
    invalid(type, "frame buffer is required");
  }
  return std::move(*envelope.frame);
}

Generation
read_generation(const std::string& type, const json& value)
{
  const auto generation = as_unsigned(value);
  if (!generation || *generation > std::numeric_limits<Generation>::max()) {
    invalid(type, "generation must be an unsigned 32-bit integer");
  }
  return static_cast<Generation>(*generation);
}

KeyMaterial
read_key(const std::string& type, const json& payload)
{
  const auto key = payload.find("encryptionKey");
  if (key == payload.end() || !key->is_object()) {
    invalid(type, "encryptionKey object is required");
  }

  const auto generation = payload.find("generation");
  if (generation == payload.end()) {
    invalid(type, "generation is required");
  }

  return { *key, read_generation(type, *generation) };
}

double
read_time(const std::string& type, const json& payload, const char* name)
{
  const auto it = payload.find(name);
  if (it == payload.end() || !it->is_number()) {
    invalid(type, std::string(name) + " must be a number");
  }
  return it->get<double>();
}

std::string
read_type(const json& header)
{
  if (!header.is_object()) {
    throw protocol_error(ErrorCode::invalid_message,
                         "Message must be a JSON object");
  }

  const auto it = header.find("type");
  if (it == header.end() || !it->is_string()) {
    throw protocol_error(ErrorCode::invalid_message,
                         "Message has no string 'type' field");
  }
  return it->get<std::string>();
}

///
/// Per-kind decoding
///
Init
decode_init(const std::string& type, const json& header)
{
  auto msg = Init{ read_operation_id(type, header), std::nullopt };

  const auto payload = header.find("payload");
  if (payload == header.end() || payload->is_null()) {
    return msg;
  }

  if (!payload->is_object()) {
    invalid(type, "payload must be an object");
  }

  const auto key = payload->find("encryptionKey");
  if (key == payload->end() || key->is_null()) {
    return msg;
  }

  if (!key->is_object()) {
    invalid(type, "encryptionKey must be an object");
  }

  auto material = KeyMaterial{ *key, 1 };
  const auto generation = payload->find("generation");
  if (generation != payload->end() && !generation->is_null()) {
    material.generation = read_generation(type, *generation);
  }

  msg.key = std::move(material);
  return msg;
}

Error
decode_error(const std::string& type, const json& header)
{
  const auto& payload = require_payload(type, header);

  const auto message = payload.find("error");
  if (message == payload.end() || !message->is_string()) {
    invalid(type, "error must be a string");
  }

  auto msg = Error{ read_operation_id(type, header),
                    message->get<std::string>(),
                    std::nullopt };

  const auto code = payload.find("code");
  if (code != payload.end() && code->is_string()) {
    msg.code = error_code_from_string(code->get<std::string>());
  }

  return msg;
}

DecryptSuccess
decode_decrypt_success(const std::string& type, Envelope& envelope)
{
  const auto& header = envelope.header;
  const auto& payload = require_payload(type, header);

  const auto was_encrypted = payload.find("wasEncrypted");
  if (was_encrypted == payload.end() || !was_encrypted->is_boolean()) {
    invalid(type, "wasEncrypted must be a boolean");
  }

  auto msg = DecryptSuccess{ require_operation_id(type, header),
                             require_frame(type, envelope),
                             read_time(type, payload, "decryptionTime"),
                             was_encrypted->get<bool>(),
                             std::nullopt };

  const auto used = payload.find("usedGeneration");
  if (used != payload.end() && !used->is_null()) {
    msg.used_generation = read_generation(type, *used);
  }

  return msg;
}

StatsReport
decode_stats(const std::string& type, const json& header)
{
  const auto& payload = require_payload(type, header);

  try {
    return { read_operation_id(type, header), payload.get<Statistics>() };
  } catch (const json::exception& e) {
    invalid(type, e.what());
  }
}

} // namespace

protocol_error::protocol_error(ErrorCode code, const std::string& what)
  : cipher_error(what)
  , code(code)
{
}

std::string
to_string(ErrorCode code)
{
  for (const auto& [value, name] : error_codes) {
    if (value == code) {
      return std::string(name);
    }
  }
  return "UNKNOWN";
}

std::optional<ErrorCode>
error_code_from_string(std::string_view code)
{
  for (const auto& [value, name] : error_codes) {
    if (name == code) {
      return value;
    }
  }
  return std::nullopt;
}

bool
is_inbound_type(std::string_view type)
{
  return std::find(inbound_types.begin(), inbound_types.end(), type) !=
         inbound_types.end();
}

bool
is_outbound_type(std::string_view type)
{
  return std::find(outbound_types.begin(), outbound_types.end(), type) !=
         outbound_types.end();
}

Envelope
encode(Inbound&& message)
{
  return std::visit([](auto&& msg) { return to_envelope(std::move(msg)); },
                    std::move(message));
}

Envelope
encode(Outbound&& message)
{
  return std::visit([](auto&& msg) { return to_envelope(std::move(msg)); },
                    std::move(message));
}

Inbound
decode_inbound(Envelope&& envelope)
{
  const auto type = read_type(envelope.header);
  const auto& header = envelope.header;

  if (!is_inbound_type(type)) {
    throw protocol_error(ErrorCode::unknown_message_type,
                         "Unknown message type: " + type);
  }

  if (type == "init") {
    return decode_init(type, header);
  }

  if (type == "updateKey") {
    return UpdateKey{ read_operation_id(type, header),
                      read_key(type, require_payload(type, header)) };
  }

  if (type == "encrypt") {
    return Encrypt{ require_operation_id(type, header),
                    require_frame(type, envelope) };
  }

  if (type == "decrypt") {
    return Decrypt{ require_operation_id(type, header),
                    require_frame(type, envelope) };
  }

  if (type == "enableEncryption") {
    return EnableEncryption{ read_operation_id(type, header) };
  }

  if (type == "disableEncryption") {
    return DisableEncryption{ read_operation_id(type, header) };
  }

  if (type == "getStats") {
    return GetStats{ read_operation_id(type, header) };
  }

  return Cleanup{ read_operation_id(type, header) };
}

Outbound
decode_outbound(Envelope&& envelope)
{
  const auto type = read_type(envelope.header);
  const auto& header = envelope.header;

  if (!is_outbound_type(type)) {
    throw protocol_error(ErrorCode::unknown_message_type,
                         "Unknown message type: " + type);
  }

  if (type == "ready") {
    return Ready{ read_operation_id(type, header) };
  }

  if (type == "keyUpdated") {
    return KeyUpdated{ read_operation_id(type, header) };
  }

  if (type == "encryptSuccess") {
    const auto& payload = require_payload(type, header);
    return EncryptSuccess{ require_operation_id(type, header),
                           require_frame(type, envelope),
                           read_time(type, payload, "encryptionTime") };
  }

  if (type == "decryptSuccess") {
    return decode_decrypt_success(type, envelope);
  }

  if (type == "error") {
    return decode_error(type, header);
  }

  if (type == "cleanupComplete") {
    return CleanupComplete{ read_operation_id(type, header) };
  }

  return decode_stats(type, header);
}

std::optional<OperationId>
operation_id(const Inbound& message)
{
  return std::visit(
    [](const auto& msg) -> std::optional<OperationId> { return msg.operation_id; },
    message);
}

std::optional<OperationId>
operation_id(const Outbound& message)
{
  return std::visit(
    [](const auto& msg) -> std::optional<OperationId> { return msg.operation_id; },
    message);
}

std::optional<OperationId>
peek_operation_id(const nlohmann::json& header)
{
  if (!header.is_object()) {
    return std::nullopt;
  }

  const auto it = header.find("operationId");
  if (it == header.end()) {
    return std::nullopt;
  }
  return as_unsigned(*it);
}

} // namespace framecrypt::protocol
