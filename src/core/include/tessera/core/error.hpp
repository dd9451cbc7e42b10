#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace tessera {

// ============================================================================
// Pack errors
// ============================================================================

enum class PackErrorCode : u8 {
    InvalidConfig,       // Non-positive grid parameters, duplicate names, ...
    SourceUnrenderable,  // One icon failed to parse or rasterize
    EmptySet,            // Nothing discovered for a category
    ReadError,           // Input could not be read
    WriteError           // Output could not be written
};

[[nodiscard]] constexpr std::string_view pack_error_code_name(PackErrorCode code) {
    switch (code) {
        case PackErrorCode::InvalidConfig:      return "InvalidConfig";
        case PackErrorCode::SourceUnrenderable: return "SourceUnrenderable";
        case PackErrorCode::EmptySet:           return "EmptySet";
        case PackErrorCode::ReadError:          return "ReadError";
        case PackErrorCode::WriteError:         return "WriteError";
    }
    return "Unknown";
}

struct PackError {
    PackErrorCode code{PackErrorCode::InvalidConfig};
    std::string message;

    static PackError invalid_config(std::string message);
    static PackError unrenderable(std::string message);
    static PackError empty_set(std::string message);
    static PackError read_error(std::string message);
    static PackError write_error(std::string message);

    /// "<CodeName>: <message>"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const PackError&) const = default;
};

template<typename T>
using PackResult = Result<T, PackError>;

} // namespace tessera
