// =============================================================================
// numgen - CSV Text Encoding
// =============================================================================
// Detects whether segment CSV text is UTF-8 or GB18030 and converts GB18030
// (a superset of GBK and GB2312) to UTF-8 through iconv, so region names are
// stored in the same encoding callers type them in.
// =============================================================================

#ifndef NUMGEN_LOOKUP_TEXT_ENCODING_H
#define NUMGEN_LOOKUP_TEXT_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <iconv.h>

#include "numgen/common/error.h"

namespace numgen::lookup {

/// @brief Bytes examined when detecting the encoding of a file.
inline constexpr std::size_t kEncodingSampleBytes = 64 * 1024;

enum class TextEncoding : std::uint8_t {
    kUtf8,
    kGb18030,
};

[[nodiscard]] std::string_view encodingName(TextEncoding encoding) noexcept;

/// @brief Strict UTF-8 check: no overlong forms, surrogates or code points above U+10FFFF.
[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

/// @brief Choose the encoding of a sample taken from the start of a file.
/// @param sample Leading bytes of the file.
/// @param complete True when the sample is the whole file.
/// @return kSourceUnreadable when the sample is neither UTF-8 nor GB18030.
[[nodiscard]] Result<TextEncoding> detectEncoding(std::string_view sample, bool complete);

/// @brief Converts GB18030 text to UTF-8.
///
/// The constructor throws IOError (kSourceUnreadable) when the platform
/// has no GB18030 converter.
class Gb18030Decoder {
public:
    Gb18030Decoder();
    ~Gb18030Decoder();

    Gb18030Decoder(const Gb18030Decoder&) = delete;
    Gb18030Decoder& operator=(const Gb18030Decoder&) = delete;

    /// @brief Convert one complete piece of text.
    /// @return UTF-8 text, or kSourceUnreadable for an invalid or truncated sequence.
    [[nodiscard]] Result<std::string> decode(std::string_view text);

private:
    iconv_t cd_;
};

}  // namespace numgen::lookup

#endif  // NUMGEN_LOOKUP_TEXT_ENCODING_H
