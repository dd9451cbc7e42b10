#include "tessera/core/error.hpp"

namespace tessera {

PackError PackError::invalid_config(std::string message) {
    return {PackErrorCode::InvalidConfig, std::move(message)};
}

PackError PackError::unrenderable(std::string message) {
    return {PackErrorCode::SourceUnrenderable, std::move(message)};
}

PackError PackError::empty_set(std::string message) {
    return {PackErrorCode::EmptySet, std::move(message)};
}

PackError PackError::read_error(std::string message) {
    return {PackErrorCode::ReadError, std::move(message)};
}

PackError PackError::write_error(std::string message) {
    return {PackErrorCode::WriteError, std::move(message)};
}

std::string PackError::to_string() const {
    std::string result(pack_error_code_name(code));
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    return result;
}

} // namespace tessera
