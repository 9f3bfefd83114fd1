#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace tokentally {

// Only parts of this type carry token accounting.
constexpr const char *kTokenBearingEventType = "step-finish";

// Result of decoding one part file. Exactly one of the three shapes:
// Relevant carries `part` (whose tokens are always present), Malformed
// carries `error`, Irrelevant carries nothing.
struct ParseOutcome {
    enum class Kind {
        Relevant,
        Irrelevant,
        Malformed
    };

    Kind kind = Kind::Irrelevant;
    std::optional<UsagePart> part;
    std::optional<ParseError> error;

    static ParseOutcome relevant(UsagePart part);
    static ParseOutcome irrelevant();
    static ParseOutcome malformed(ParseError::Kind kind, std::string message);

    bool isRelevant() const { return kind == Kind::Relevant; }
    bool isMalformed() const { return kind == Kind::Malformed; }
};

/**
 * Decode a usage part document.
 *
 * - Not JSON, not an object, or fields of the wrong JSON type: Malformed(Json).
 * - No "tokens" (or null), or a "type" that is missing or not "step-finish":
 *   Irrelevant.
 * - Otherwise Relevant. Missing counters, ids and cost default to zero/empty.
 */
ParseOutcome parseUsageJson(const std::string &content);

// As parseUsageJson; an unreadable file yields Malformed(Io).
ParseOutcome parseUsageFile(const std::filesystem::path &path);

} // namespace tokentally
