#pragma once

#include <optional>
#include <string>
#include <string_view>

// Inbound datagram classification for the command port. Telemetry and state
// frames share the port space with command acknowledgements, so every payload
// is filtered here before it can reach a waiting command.

// True when the payload is not 7-bit clean and less than 70% of its bytes are
// printable ASCII [32,126].
bool is_binary(std::string_view bytes);

// Decodes as UTF-8, then ASCII, then Latin-1 (first success wins) and trims
// surrounding whitespace. The result is always UTF-8.
std::optional<std::string> decode_text(std::string_view bytes);

// Accepts numerics, known response tokens, and any string of at most 50
// characters. Empty text is rejected.
bool is_valid_response(std::string_view text);

// Full filter used by the transport: binary payloads, undecodable payloads and
// invalid text all yield nullopt.
std::optional<std::string> classify_datagram(std::string_view bytes);
