#include "ScreenErrors.h"

namespace chroma {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::InvalidState:     return "InvalidState";
        case ErrorCode::NotStarted:       return "NotStarted";
        case ErrorCode::InsufficientData: return "InsufficientData";
    }
    return "Unknown";
}

void throwInvalidArgument(const std::string& what) {
    throw ScreenError(ErrorCode::InvalidArgument, what);
}

void throwInvalidState(const std::string& what) {
    throw ScreenError(ErrorCode::InvalidState, what);
}

void throwNotStarted(const std::string& what) {
    throw ScreenError(ErrorCode::NotStarted, what);
}

void throwInsufficientData(const std::string& what) {
    throw ScreenError(ErrorCode::InsufficientData, what);
}

} // namespace chroma
