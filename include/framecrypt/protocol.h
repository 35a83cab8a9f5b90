#pragma once

#include <framecrypt/errors.h>
#include <framecrypt/stats.h>
#include <framecrypt/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace framecrypt::protocol {

// Caller-chosen token matching a reply to its request
using OperationId = uint64_t;

enum struct ErrorCode
{
  encryption_failed,
  decryption_failed,
  generation_unrecoverable,
  authentication_failed,
  key_import_failed,
  invalid_message,
  unknown_message_type,
};

std::string to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(std::string_view code);

struct protocol_error : cipher_error
{
  protocol_error(ErrorCode code, const std::string& what);

  const ErrorCode code;
};

// What travels on a channel: a JSON header and, for frame-carrying messages,
// the frame buffer itself.  Envelopes are only ever moved, so a frame handed
// across is no longer owned by the sender.
struct Envelope
{
  nlohmann::json header;
  std::optional<bytes> frame;
};

// Key material as delivered by the key exchange: a JSON Web Key and the
// generation it belongs to.
struct KeyMaterial
{
  nlohmann::json encryption_key;
  Generation generation = 1;
};

///
/// Host to worker
///
struct Init
{
  std::optional<OperationId> operation_id;
  std::optional<KeyMaterial> key;
};

struct UpdateKey
{
  std::optional<OperationId> operation_id;
  KeyMaterial key;
};

struct Encrypt
{
  OperationId operation_id = 0;
  bytes frame;
};

struct Decrypt
{
  OperationId operation_id = 0;
  bytes frame;
};

struct EnableEncryption
{
  std::optional<OperationId> operation_id;
};

struct DisableEncryption
{
  std::optional<OperationId> operation_id;
};

struct GetStats
{
  std::optional<OperationId> operation_id;
};

struct Cleanup
{
  std::optional<OperationId> operation_id;
};

using Inbound = std::variant<Init,
                             UpdateKey,
                             Encrypt,
                             Decrypt,
                             EnableEncryption,
                             DisableEncryption,
                             GetStats,
                             Cleanup>;

///
/// Worker to host
///
struct Ready
{
  std::optional<OperationId> operation_id;
};

struct KeyUpdated
{
  std::optional<OperationId> operation_id;
};

struct EncryptSuccess
{
  OperationId operation_id = 0;
  bytes frame;
  double encryption_time_ms = 0.0;
};

struct DecryptSuccess
{
  OperationId operation_id = 0;
  bytes frame;
  double decryption_time_ms = 0.0;
  bool was_encrypted = false;
  std::optional<Generation> used_generation;
};

struct Error
{
  std::optional<OperationId> operation_id;
  std::string message;
  std::optional<ErrorCode> code;
};

struct CleanupComplete
{
  std::optional<OperationId> operation_id;
};

struct StatsReport
{
  std::optional<OperationId> operation_id;
  Statistics stats;
};

using Outbound = std::variant<Ready,
                              KeyUpdated,
                              EncryptSuccess,
                              DecryptSuccess,
                              Error,
                              CleanupComplete,
                              StatsReport>;

// Type guards over the closed sets of message kinds
bool is_inbound_type(std::string_view type);
bool is_outbound_type(std::string_view type);

// Conversion between typed messages and envelopes.  Decoding checks the
// message kind against the closed set and the fields each kind requires, and
// throws protocol_error otherwise.
Envelope encode(Inbound&& message);
Envelope encode(Outbound&& message);
Inbound decode_inbound(Envelope&& envelope);
Outbound decode_outbound(Envelope&& envelope);

std::optional<OperationId> operation_id(const Inbound& message);
std::optional<OperationId> operation_id(const Outbound& message);

// Best effort recovery of the correlation id from a header that may not
// decode, so that the rejection can still be matched by the caller.
std::optional<OperationId> peek_operation_id(const nlohmann::json& header);

} // namespace framecrypt::protocol
