// =============================================================================
// numgen - CSV Text Encoding Implementation
// =============================================================================

#include "numgen/lookup/text_encoding.h"

#include <cerrno>
#include <system_error>

namespace numgen::lookup {

namespace {

const iconv_t kInvalidConverter = reinterpret_cast<iconv_t>(-1);

/// @brief Length of the UTF-8 sequence led by @p lead, or 0 if it cannot lead one.
std::size_t sequenceLength(unsigned char lead) noexcept {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

/// @brief Drop a trailing partial line so a sample never ends inside a character.
std::string_view wholeLines(std::string_view sample) noexcept {
    const auto newline = sample.rfind('\n');
    return newline == std::string_view::npos ? sample : sample.substr(0, newline + 1);
}

}  // namespace

std::string_view encodingName(TextEncoding encoding) noexcept {
    switch (encoding) {
        case TextEncoding::kUtf8:
            return "UTF-8";
        case TextEncoding::kGb18030:
            return "GB18030";
    }
    return "unknown";
}

bool isValidUtf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        const std::size_t length = sequenceLength(lead);
        if (length == 0 || i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        if (length >= 3) {
            const auto second = static_cast<unsigned char>(text[i + 1]);
            // Overlong forms, UTF-16 surrogates and values above U+10FFFF
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

Result<TextEncoding> detectEncoding(std::string_view sample, bool complete) {
    const std::string_view text = complete ? sample : wholeLines(sample);
    if (isValidUtf8(text)) {
        return TextEncoding::kUtf8;
    }

    try {
        Gb18030Decoder decoder;
        if (auto decoded = decoder.decode(text); !decoded) {
            return makeError<TextEncoding>(ErrorCode::kSourceUnreadable,
                                           "text is neither UTF-8 nor GB18030/GBK");
        }
    } catch (const NumgenException& ex) {
        return makeError<TextEncoding>(Error(ex));
    }
    return TextEncoding::kGb18030;
}

// =============================================================================
// Gb18030Decoder
// =============================================================================

Gb18030Decoder::Gb18030Decoder() : cd_(iconv_open("UTF-8", "GB18030")) {
    if (cd_ == kInvalidConverter) {
        throw IOError(ErrorCode::kSourceUnreadable,
                      IOError::formatWithSystemError(
                          "no GB18030 converter available",
                          std::error_code(errno, std::generic_category())));
    }
}

Gb18030Decoder::~Gb18030Decoder() {
    iconv_close(cd_);
}

Result<std::string> Gb18030Decoder::decode(std::string_view text) {
    // Each GB18030 byte becomes at most two UTF-8 bytes
    std::string out(text.size() * 2 + 4, '\0');

    char* in = const_cast<char*>(text.data());
    std::size_t inLeft = text.size();
    char* outPtr = out.data();
    std::size_t outLeft = out.size();

    iconv(cd_, nullptr, nullptr, nullptr, nullptr);
    while (inLeft > 0) {
        if (iconv(cd_, &in, &inLeft, &outPtr, &outLeft) != static_cast<std::size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            const std::size_t used = out.size() - outLeft;
            out.resize(out.size() * 2);
            outPtr = out.data() + used;
            outLeft = out.size() - used;
            continue;
        }
        const std::size_t offset = text.size() - inLeft;
        return makeError<std::string>(
            ErrorCode::kSourceUnreadable,
            errno == EINVAL ? "truncated GB18030 sequence at byte " + std::to_string(offset)
                            : "invalid GB18030 sequence at byte " + std::to_string(offset));
    }
    out.resize(out.size() - outLeft);
    return out;
}

}  // namespace numgen::lookup
