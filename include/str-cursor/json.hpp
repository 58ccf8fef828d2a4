/// @file json.hpp
/// @brief nlohmann/json interoperability for str-cursor.
///
/// Provides ADL serialization (to_json/from_json) for the spanners and
/// Error, so that positions can be reported as structured diagnostics, and
/// json::span_of() to describe a cursor's current highlight.

#pragma once

#include <str-cursor/cursor.hpp>
#include <str-cursor/error.hpp>
#include <str-cursor/spanner.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace str_cursor {

// -- Spanners -----------------------------------------------------------------

void to_json(nlohmann::json& j, NoOpSpanner);
void from_json(const nlohmann::json& j, NoOpSpanner& s);

void to_json(nlohmann::json& j, const ByteSpanner& s);
void from_json(const nlohmann::json& j, ByteSpanner& s);

void to_json(nlohmann::json& j, const CharSpanner& s);
void from_json(const nlohmann::json& j, CharSpanner& s);

/// Serialized as `{"row": r, "col": c}`. The saved columns are not part of
/// the JSON form; a RowColSpanner read back is in its validated state.
void to_json(nlohmann::json& j, const RowColSpanner& s);
void from_json(const nlohmann::json& j, RowColSpanner& s);

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind);
void from_json(const nlohmann::json& j, ErrorKind& kind);

void to_json(nlohmann::json& j, const Error& e);
auto error_from_json(const nlohmann::json& j) -> Error;

}  // namespace str_cursor

namespace str_cursor::json {

/// Describe the cursor's highlight: `{"tail": ..., "head": ..., "highlight": "..."}`.
template <Spanner S>
auto span_of(const StrCursor<S>& cursor) -> nlohmann::json {
    return nlohmann::json{
        {"tail", cursor.spanner_tail},
        {"head", cursor.spanner_head},
        {"highlight", std::string{cursor.highlight()}},
    };
}

}  // namespace str_cursor::json
