// ==============================================================================
// error.cpp - Таксономия ошибок ntreg
// ==============================================================================

#include <cstdio>
#include <ntreg/error.hpp>

namespace ntreg {

const char* reg_error_kind_to_string(RegErrorKind kind) {
    switch (kind) {
    case RegErrorKind::OpenFailed:
        return "OpenFailed";
    case RegErrorKind::AccessDenied:
        return "AccessDenied";
    case RegErrorKind::InvalidHandle:
        return "InvalidHandle";
    case RegErrorKind::InsufficientResources:
        return "InsufficientResources";
    case RegErrorKind::NameNotFound:
        return "NameNotFound";
    case RegErrorKind::HandleClosed:
        return "HandleClosed";
    case RegErrorKind::TransportFailure:
        return "TransportFailure";
    case RegErrorKind::TruncatedHeader:
        return "TruncatedHeader";
    case RegErrorKind::HeaderReadError:
        return "HeaderReadError";
    case RegErrorKind::LengthMismatch:
        return "LengthMismatch";
    case RegErrorKind::DwordConversion:
        return "DwordConversion";
    case RegErrorKind::QwordConversion:
        return "QwordConversion";
    case RegErrorKind::SmallNameBlob:
        return "SmallNameBlob";
    case RegErrorKind::NameConversion:
        return "NameConversion";
    case RegErrorKind::StringConversion:
        return "StringConversion";
    }
    return "Unknown";
}

std::string RegError::format() const {
    return message;
}

bool RegError::is_transport() const {
    switch (kind) {
    case RegErrorKind::OpenFailed:
    case RegErrorKind::AccessDenied:
    case RegErrorKind::InvalidHandle:
    case RegErrorKind::InsufficientResources:
    case RegErrorKind::NameNotFound:
    case RegErrorKind::HandleClosed:
    case RegErrorKind::TransportFailure:
        return true;
    default:
        return false;
    }
}

bool RegError::is_decode() const {
    switch (kind) {
    case RegErrorKind::TruncatedHeader:
    case RegErrorKind::HeaderReadError:
    case RegErrorKind::LengthMismatch:
    case RegErrorKind::DwordConversion:
    case RegErrorKind::QwordConversion:
    case RegErrorKind::SmallNameBlob:
        return true;
    default:
        return false;
    }
}

bool RegError::is_text() const {
    return kind == RegErrorKind::NameConversion || kind == RegErrorKind::StringConversion;
}

RegError make_error(RegErrorKind kind, std::string message) {
    RegError err;
    err.kind = kind;
    err.message = std::move(message);
    return err;
}

std::string format_status(std::uint32_t status) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", status);
    return buf;
}

RegError error_from_status(std::string_view operation, std::string_view resource,
                           std::uint32_t status) {
    RegError err;
    err.operation = std::string(operation);
    err.resource = std::string(resource);
    err.status = status;

    switch (status) {
    case STATUS_ACCESS_DENIED:
        err.kind = RegErrorKind::AccessDenied;
        err.message = "Access denied: " + err.resource;
        break;
    case STATUS_INVALID_HANDLE:
        err.kind = RegErrorKind::InvalidHandle;
        err.message = "Invalid handle during " + err.operation;
        break;
    case STATUS_INSUFFICIENT_RESOURCES:
        err.kind = RegErrorKind::InsufficientResources;
        err.message = "Insufficient resources during " + err.operation;
        break;
    case STATUS_OBJECT_NAME_NOT_FOUND:
        err.kind = RegErrorKind::NameNotFound;
        err.message = "Name not found: " + err.resource;
        break;
    default:
        if (operation == "open") {
            err.kind = RegErrorKind::OpenFailed;
            err.message = "Could not open registry key " + err.resource + " error code " +
                          format_status(status);
        } else {
            err.kind = RegErrorKind::TransportFailure;
            err.message = err.operation + " failed for '" + err.resource + "' error code " +
                          format_status(status);
        }
        break;
    }

    // Для open сохраняем путь и код в сообщении для всех видов
    if (operation == "open" && err.kind != RegErrorKind::OpenFailed) {
        err.message += " (" + format_status(status) + ")";
    }

    return err;
}

}  // namespace ntreg
