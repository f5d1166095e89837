#pragma once

#include <exception>
#include <string>
#include <utility>
#include <vector>

enum class ErrorKind {
    NotFound,
    InUse,
    CorruptArchive,
    DanglingModReference,
    BackupMissing,
    PartialApplyFailure,
    UnrecoverableState
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InUse: return "InUse";
        case ErrorKind::CorruptArchive: return "CorruptArchive";
        case ErrorKind::DanglingModReference: return "DanglingModReference";
        case ErrorKind::BackupMissing: return "BackupMissing";
        case ErrorKind::PartialApplyFailure: return "PartialApplyFailure";
        case ErrorKind::UnrecoverableState: return "UnrecoverableState";
    }
    return "Unknown";
}

class ModException : public std::exception {
public:
    ModException(ErrorKind kind, std::string msg, std::vector<std::string> subjects = {})
        : kind(kind), message(std::string(ErrorKindName(kind)) + ": " + msg), subjects(std::move(subjects)) {}

    ErrorKind kind;
    std::string message;
    // Offending paths or ids, depending on kind
    std::vector<std::string> subjects;

    const char* what() const noexcept override {
        return message.c_str();
    }
};
