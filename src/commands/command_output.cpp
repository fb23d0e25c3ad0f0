// =============================================================================
// numgen - Command Output Helpers Implementation
// =============================================================================

#include "command_output.h"

#include <iostream>

#include <fmt/format.h>

#include "numgen/common/logger.h"

namespace numgen::commands {

std::string jsonString(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

int reportFailure(std::string_view operation, const Error& error) {
    NUMGEN_LOG_ERROR("{} failed [{}]: {}", operation, errorCodeToString(error.code()),
                     error.message());
    if (isStorageFailure(error.code())) {
        std::cerr << "Error: " << operation << " failed" << std::endl;
    } else {
        std::cerr << "Error: " << error.message() << std::endl;
    }
    return error.exitCode();
}

}  // namespace numgen::commands
