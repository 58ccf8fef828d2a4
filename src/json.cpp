#include <str-cursor/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace str_cursor {

namespace {

void require_object(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) {
        throw std::runtime_error{std::string{what} + " must be a JSON object"};
    }
}

}  // anonymous namespace

// -- Spanners -----------------------------------------------------------------

void to_json(nlohmann::json& j, NoOpSpanner) {
    j = nlohmann::json::object();
}

void from_json(const nlohmann::json& j, NoOpSpanner&) {
    require_object(j, "NoOpSpanner");
}

void to_json(nlohmann::json& j, const ByteSpanner& s) {
    j = nlohmann::json{{"bytes", s.bytes}};
}

void from_json(const nlohmann::json& j, ByteSpanner& s) {
    require_object(j, "ByteSpanner");
    s.bytes = j.at("bytes").get<std::size_t>();
}

void to_json(nlohmann::json& j, const CharSpanner& s) {
    j = nlohmann::json{{"chars", s.chars}};
}

void from_json(const nlohmann::json& j, CharSpanner& s) {
    require_object(j, "CharSpanner");
    s.chars = j.at("chars").get<std::size_t>();
}

void to_json(nlohmann::json& j, const RowColSpanner& s) {
    j = nlohmann::json{{"row", s.row()}, {"col", s.col()}};
}

void from_json(const nlohmann::json& j, RowColSpanner& s) {
    require_object(j, "RowColSpanner");
    s = RowColSpanner::at(j.at("row").get<std::size_t>(), j.at("col").get<std::size_t>());
}

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    const auto name = j.get<std::string>();
    const auto parsed = error_kind_from_string(name);
    if (!parsed) {
        throw std::runtime_error{"unknown error kind: " + name};
    }
    kind = *parsed;
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", e.kind}, {"message", e.message}};
}

auto error_from_json(const nlohmann::json& j) -> Error {
    require_object(j, "Error");
    return Error{j.at("kind").get<ErrorKind>(), j.at("message").get<std::string>()};
}

}  // namespace str_cursor
