#include "message_parser.hpp"
#include "pileup/logging.hpp"
#include <cctype>
#include <sstream>
#include <vector>

namespace pileup {

const char* messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::CQ:       return "cq";
        case MessageType::DIRECTED: return "directed";
        case MessageType::GRID:     return "grid";
        case MessageType::REPORT:   return "report";
        case MessageType::R_REPORT: return "r_report";
        case MessageType::RRR:      return "rrr";
        case MessageType::RR73:     return "rr73";
        case MessageType::FINAL_73: return "73";
        default: return "unknown";
    }
}

// ============================================================================
// Token shapes
// ============================================================================

std::string normalizeCallsign(const std::string& call) {
    std::string result;
    result.reserve(call.size());

    for (char c : call) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        // Only allow A-Z, 0-9, / (drops the <> of hashed calls)
        if ((c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '/') {
            result += c;
        }
    }

    return result;
}

// Prefix (1-3) + digit + up to 3 more + final letter, e.g. K1ABC, JA1XYZ, DX1X, 3DA0RU
static bool isBaseCallsign(const std::string& s) {
    if (s.size() < 3 || s.size() > 8) return false;

    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(s.back()))) return false;

    for (size_t p = 1; p <= 3 && p < s.size(); ++p) {
        if (!std::isdigit(static_cast<unsigned char>(s[p]))) continue;
        size_t tail = s.size() - p - 1;
        if (tail >= 1 && tail <= 4) return true;
    }
    return false;
}

bool isPlausibleCallsign(const std::string& call) {
    if (call.empty() || call.size() > 13 || call == "CQ") {
        return false;
    }

    // Portable forms (VP2E/K1ABC, K1ABC/P): the longest segment is the base call
    std::string base;
    size_t start = 0;
    while (start <= call.size()) {
        size_t slash = call.find('/', start);
        std::string part = call.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (part.empty()) return false;
        if (part.size() > base.size()) base = part;
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    return isBaseCallsign(base);
}

bool isLocator(const std::string& token) {
    // 4-character square, optionally followed by a 2-letter subsquare
    if (token.size() != 4 && token.size() != 6) return false;
    if (token.compare(0, 4, "RR73") == 0) return false;

    auto upper = [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); };
    char a = upper(token[0]);
    char b = upper(token[1]);
    if (a < 'A' || a > 'R' || b < 'A' || b > 'R') return false;
    if (!std::isdigit(static_cast<unsigned char>(token[2])) ||
        !std::isdigit(static_cast<unsigned char>(token[3]))) {
        return false;
    }
    if (token.size() == 6) {
        char c = upper(token[4]);
        char d = upper(token[5]);
        if (c < 'A' || c > 'X' || d < 'A' || d > 'X') return false;
    }
    return true;
}

// Signal report "-12" / "+05" (optionally with leading R)
static std::optional<int> parseReport(const std::string& token) {
    if (token.size() != 3) return std::nullopt;
    if (token[0] != '-' && token[0] != '+') return std::nullopt;
    if (!std::isdigit(static_cast<unsigned char>(token[1])) ||
        !std::isdigit(static_cast<unsigned char>(token[2]))) {
        return std::nullopt;
    }
    int value = (token[1] - '0') * 10 + (token[2] - '0');
    return token[0] == '-' ? -value : value;
}

static std::vector<std::string> tokenize(const std::string& message) {
    std::vector<std::string> tokens;
    std::istringstream in(message);
    std::string tok;
    while (in >> tok) {
        for (char& c : tok) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        // Hashed callsigns arrive as <K1ABC>
        if (tok.size() > 2 && tok.front() == '<' && tok.back() == '>') {
            tok = tok.substr(1, tok.size() - 2);
        }
        tokens.push_back(tok);
    }
    return tokens;
}

// ============================================================================
// Classification
// ============================================================================

static ParsedMessage parseCq(const std::vector<std::string>& tokens) {
    ParsedMessage result;

    // "K1ABC CQ [FN42]"
    if (tokens.size() >= 2 && tokens[1] == "CQ") {
        if (!isPlausibleCallsign(tokens[0])) return result;
        result.caller = normalizeCallsign(tokens[0]);
        if (tokens.size() >= 3 && isLocator(tokens[2])) {
            result.grid = tokens[2].substr(0, 4);
        }
    } else {
        // "CQ [DX|NA|POTA|...] K1ABC [FN42]" - the modifier is at most one token
        size_t call_idx = 0;
        for (size_t i = 1; i < tokens.size() && i <= 2; ++i) {
            if (isPlausibleCallsign(tokens[i])) {
                call_idx = i;
                break;
            }
        }
        if (call_idx == 0) return result;

        result.caller = normalizeCallsign(tokens[call_idx]);
        if (call_idx + 1 < tokens.size() && isLocator(tokens[call_idx + 1])) {
            result.grid = tokens[call_idx + 1].substr(0, 4);
        }
    }

    result.type = MessageType::CQ;
    result.is_cq = true;
    return result;
}

static ParsedMessage parseDirected(const std::vector<std::string>& tokens) {
    ParsedMessage result;

    if (tokens.size() < 2) return result;
    if (!isPlausibleCallsign(tokens[0]) || !isPlausibleCallsign(tokens[1])) return result;

    result.callee = normalizeCallsign(tokens[0]);
    result.caller = normalizeCallsign(tokens[1]);
    result.is_reply = true;
    result.type = MessageType::DIRECTED;

    if (tokens.size() < 3) return result;

    const std::string& payload = tokens[2];
    if (payload == "RR73") {
        result.type = MessageType::RR73;
        result.is_final = true;
    } else if (payload == "RRR") {
        result.type = MessageType::RRR;
    } else if (payload == "73") {
        result.type = MessageType::FINAL_73;
        result.is_final = true;
    } else if (isLocator(payload)) {
        result.type = MessageType::GRID;
        result.grid = payload.substr(0, 4);
    } else if (payload.size() == 4 && payload[0] == 'R') {
        if (auto report = parseReport(payload.substr(1))) {
            result.type = MessageType::R_REPORT;
            result.report = report;
        }
    } else if (auto report = parseReport(payload)) {
        result.type = MessageType::REPORT;
        result.report = report;
    }

    return result;
}

ParsedMessage MessageParser::parse(const std::string& message) {
    std::vector<std::string> tokens = tokenize(message);
    if (tokens.empty()) return ParsedMessage{};

    ParsedMessage result;
    if (tokens[0] == "CQ" || (tokens.size() >= 2 && tokens[1] == "CQ")) {
        result = parseCq(tokens);
    } else {
        result = parseDirected(tokens);
    }

    if (result.empty()) {
        LOG_PARSER(TRACE, "Unparsed: '%s'", message.c_str());
        return ParsedMessage{};
    }

    LOG_PARSER(TRACE, "'%s' -> %s caller=%s callee=%s", message.c_str(),
               messageTypeToString(result.type), result.caller->c_str(),
               result.callee ? result.callee->c_str() : "-");
    return result;
}

ParsedMessage MessageParser::annotate(Decode& decode) {
    ParsedMessage parsed = parse(decode.message);

    decode.callsign = parsed.caller;
    decode.grid = parsed.grid;
    decode.is_cq = parsed.is_cq;
    decode.is_reply = parsed.is_reply;
    decode.replying_to = parsed.callee;

    return parsed;
}

} // namespace pileup
