#include <bullvision/transport/text_codec.hpp>

#include <algorithm>
#include <cctype>

namespace bullvision {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Error EncodeError(const std::string& message) {
    return Error::Make(ErrorCategory::Protocol, "Encode", "", message);
}

} // anonymous namespace

Result<TextCodec, Error> TextCodec::Create(std::string_view encoding) {
    const auto name = Lower(encoding);
    if (name.empty() || name == "utf-8" || name == "utf8") {
        return Result<TextCodec, Error>::Ok(TextCodec(Kind::Utf8, "utf-8"));
    }
    if (name == "latin-1" || name == "latin1" || name == "iso-8859-1" ||
        name == "iso8859-1") {
        return Result<TextCodec, Error>::Ok(TextCodec(Kind::Latin1, "latin-1"));
    }
    return Result<TextCodec, Error>::Err(Error::Make(
        ErrorCategory::Config, "TextCodec", std::string(encoding),
        "Unsupported text encoding (expected utf-8 or latin-1)"));
}

Result<std::string, Error> TextCodec::Encode(std::string_view utf8) const {
    if (kind_ == Kind::Utf8) {
        return Result<std::string, Error>::Ok(std::string(utf8));
    }

    // UTF-8 -> Latin-1: only code points up to U+00FF are representable, so
    // valid input is either a single ASCII byte or a two-byte sequence
    // starting with 0xC2 or 0xC3.
    std::string out;
    out.reserve(utf8.size());
    for (std::size_t i = 0; i < utf8.size(); ++i) {
        const auto c = static_cast<unsigned char>(utf8[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            continue;
        }
        if (c == 0xC2 || c == 0xC3) {
            if (i + 1 >= utf8.size()) {
                return Result<std::string, Error>::Err(
                    EncodeError("Truncated UTF-8 sequence at end of message"));
            }
            const auto next = static_cast<unsigned char>(utf8[i + 1]);
            if ((next & 0xC0) != 0x80) {
                return Result<std::string, Error>::Err(
                    EncodeError("Invalid UTF-8 continuation byte at offset " +
                                std::to_string(i + 1)));
            }
            out.push_back(static_cast<char>(((c & 0x03) << 6) | (next & 0x3F)));
            ++i;
            continue;
        }
        return Result<std::string, Error>::Err(EncodeError(
            "Character at offset " + std::to_string(i) +
            " is not representable in latin-1"));
    }
    return Result<std::string, Error>::Ok(std::move(out));
}

std::string TextCodec::Decode(std::string_view wire) const {
    if (kind_ == Kind::Utf8) {
        return std::string(wire);
    }

    std::string out;
    out.reserve(wire.size() + wire.size() / 4);
    for (char ch : wire) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(ch);
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace bullvision
