#include "usage/usage_parser.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include <nlohmann/json.hpp>

namespace tokentally {

namespace {

// Thrown internally for well-formed JSON with the wrong field types.
struct FieldTypeError {
    std::string message;
};

uint64_t readCounter(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_number_unsigned()) {
        throw FieldTypeError{std::string("field '") + key
                             + "' must be a non-negative integer"};
    }
    return it->get<uint64_t>();
}

std::string readString(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw FieldTypeError{std::string("field '") + key + "' must be a string"};
    }
    return it->get<std::string>();
}

double readCost(const nlohmann::json &object)
{
    const auto it = object.find("cost");
    if (it == object.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw FieldTypeError{"field 'cost' must be a number"};
    }
    return it->get<double>();
}

TokenUsage readTokens(const nlohmann::json &tokens)
{
    if (!tokens.is_object()) {
        throw FieldTypeError{"field 'tokens' must be an object"};
    }

    TokenUsage usage;
    usage.input = readCounter(tokens, "input");
    usage.output = readCounter(tokens, "output");
    usage.reasoning = readCounter(tokens, "reasoning");

    const auto cache = tokens.find("cache");
    if (cache != tokens.end() && !cache->is_null()) {
        if (!cache->is_object()) {
            throw FieldTypeError{"field 'tokens.cache' must be an object"};
        }
        usage.cache.write = readCounter(*cache, "write");
        usage.cache.read = readCounter(*cache, "read");
    }
    return usage;
}

} // namespace

ParseOutcome ParseOutcome::relevant(UsagePart part)
{
    ParseOutcome outcome;
    outcome.kind = Kind::Relevant;
    outcome.part = std::move(part);
    return outcome;
}

ParseOutcome ParseOutcome::irrelevant()
{
    return ParseOutcome{};
}

ParseOutcome ParseOutcome::malformed(ParseError::Kind kind, std::string message)
{
    ParseOutcome outcome;
    outcome.kind = Kind::Malformed;
    outcome.error = ParseError{kind, std::move(message)};
    return outcome;
}

ParseOutcome parseUsageJson(const std::string &content)
{
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error &ex) {
        return ParseOutcome::malformed(ParseError::Kind::Json, ex.what());
    }

    if (!json.is_object()) {
        return ParseOutcome::malformed(ParseError::Kind::Json,
                                       "usage part must be a JSON object");
    }

    try {
        const std::string eventType = readString(json, "type");

        const auto tokens = json.find("tokens");
        if (tokens == json.end() || tokens->is_null()) {
            return ParseOutcome::irrelevant();
        }
        if (eventType != kTokenBearingEventType) {
            return ParseOutcome::irrelevant();
        }

        UsagePart part;
        part.id = readString(json, "id");
        part.messageId = readString(json, "messageID");
        part.sessionId = readString(json, "sessionID");
        part.eventType = eventType;
        part.tokens = readTokens(*tokens);
        part.cost = readCost(json);
        return ParseOutcome::relevant(std::move(part));
    } catch (const FieldTypeError &ex) {
        return ParseOutcome::malformed(ParseError::Kind::Json, ex.message);
    }
}

ParseOutcome parseUsageFile(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        return ParseOutcome::malformed(ParseError::Kind::Io,
                                       "cannot open " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return ParseOutcome::malformed(ParseError::Kind::Io,
                                       "failed reading " + path.string());
    }
    return parseUsageJson(content);
}

} // namespace tokentally
