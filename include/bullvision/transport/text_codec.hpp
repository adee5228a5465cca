#pragma once

#include <bullvision/core/result.hpp>

#include <string>
#include <string_view>

namespace bullvision {

// ---------------------------------------------------------------------------
// TextCodec — converts protocol lines between the process-internal UTF-8 and
// a backend's configured wire encoding.
//
// Supported encodings:
//   utf-8   (aliases: utf8)                      pass-through
//   latin-1 (aliases: latin1, iso-8859-1)        one byte per code point
// ---------------------------------------------------------------------------
class TextCodec {
public:
    static Result<TextCodec, Error> Create(std::string_view encoding);

    /// Canonical encoding name ("utf-8" or "latin-1").
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    /// UTF-8 text -> wire bytes. Fails with ErrorCategory::Protocol when the
    /// text is not valid UTF-8 or holds a character the encoding lacks.
    [[nodiscard]] Result<std::string, Error> Encode(std::string_view utf8) const;

    /// Wire bytes -> UTF-8 text. Never fails; invalid UTF-8 input is passed
    /// through and rejected later by the JSON parser.
    [[nodiscard]] std::string Decode(std::string_view wire) const;

private:
    enum class Kind { Utf8, Latin1 };

    TextCodec(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

    Kind kind_;
    std::string name_;
};

} // namespace bullvision
