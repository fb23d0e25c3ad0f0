// =============================================================================
// numgen - Artifact Writer
// =============================================================================
// Streams an ordered identifier set to a line-oriented text file.
//
// Key features:
// - One identifier per line, each terminated by '\n', in set order
// - Atomic write using temporary file + hard link strategy: a failed write
//   never leaves a file under the artifact's name
// - The temporary file is created exclusively and removed on every path
// - Publishing never replaces an existing file: when the requested name is
//   taken (by this or another process) a _2, _3, ... disambiguator is inserted
//   before the extension and the name actually used is returned
// - Reports the size observed on disk after the stream is closed
//
// Error Handling:
// - kDestinationUnwritable: store directory missing or file not creatable
// - kDiskExhausted: write or flush failed mid-stream
// - kCancelled: the cancellation token fired between write batches
// =============================================================================

#ifndef NUMGEN_ARTIFACT_ARTIFACT_WRITER_H
#define NUMGEN_ARTIFACT_ARTIFACT_WRITER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "numgen/common/cancellation.h"
#include "numgen/common/error.h"
#include "numgen/common/types.h"
#include "numgen/gen/identifier_set.h"

namespace numgen::artifact {

/// @brief Suffix appended to the destination name while it is being written.
inline constexpr std::string_view kTempSuffix = ".tmp";

/// @brief Lines formatted per write() call on the underlying stream.
inline constexpr std::size_t kWriteBatchLines = 65'536;

/// @brief Names tried before giving up on a taken destination.
inline constexpr std::uint32_t kMaxNameAttempts = 1000;

/// @brief Name for the @p attempt-th try at @p baseName.
/// @return baseName for attempt 1, otherwise "_{attempt}" inserted before the extension.
[[nodiscard]] std::string disambiguateName(std::string_view baseName, std::uint32_t attempt);

class ArtifactWriter {
public:
    /// @brief Construct a writer for a store directory.
    /// @param storeDir Existing directory the artifact is written into.
    /// @param cancellation Optional cancellation signal checked between batches.
    explicit ArtifactWriter(std::filesystem::path storeDir,
                            const CancellationToken* cancellation = nullptr);

    /// @brief Write the identifiers to @p destinationName inside the store.
    /// @param identifiers Ascending identifier set.
    /// @param destinationName File name (no directory components).
    /// @return The completed artifact with its on-disk size and line count. Its
    ///         name differs from @p destinationName when that file already existed.
    [[nodiscard]] Result<Artifact> write(const gen::IdentifierSet& identifiers,
                                         std::string_view destinationName) const;

    [[nodiscard]] const std::filesystem::path& storeDir() const noexcept { return storeDir_; }

private:
    std::filesystem::path storeDir_;
    const CancellationToken* cancellation_;
};

}  // namespace numgen::artifact

#endif  // NUMGEN_ARTIFACT_ARTIFACT_WRITER_H
