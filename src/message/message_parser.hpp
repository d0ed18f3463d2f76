#pragma once

#include "pileup/types.hpp"
#include <optional>
#include <string>

namespace pileup {

// What an FT8/FT4 message is doing
enum class MessageType : uint8_t {
    UNKNOWN,
    CQ,         // CQ [DX|region] CALL [GRID]
    DIRECTED,   // CALLEE CALLER (no payload)
    GRID,       // CALLEE CALLER GRID
    REPORT,     // CALLEE CALLER -12
    R_REPORT,   // CALLEE CALLER R-12
    RRR,        // CALLEE CALLER RRR
    RR73,       // CALLEE CALLER RR73
    FINAL_73,   // CALLEE CALLER 73
};

const char* messageTypeToString(MessageType type);

// Structured intent of one message. Unparsable text leaves every field unset.
struct ParsedMessage {
    MessageType type = MessageType::UNKNOWN;

    std::optional<std::string> caller;   // Station transmitting this message
    std::optional<std::string> callee;   // Station being addressed
    std::optional<std::string> grid;
    std::optional<int> report;

    bool is_cq = false;
    bool is_reply = false;
    bool is_final = false;               // RR73 / 73

    bool empty() const { return !caller.has_value(); }
};

/**
 * Message Classifier
 *
 * Stateless. Recognises tokens by shape (callsign, locator, report),
 * never by dictionary lookup.
 */
class MessageParser {
public:
    static ParsedMessage parse(const std::string& message);

    // Fill the derived fields of a decode from its message text
    static ParsedMessage annotate(Decode& decode);
};

} // namespace pileup
