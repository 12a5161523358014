#include "util/error.hpp"

extern "C" {
#include <string.h>
}

std::string TError::ErrorName(EError error) {
    return cocoon::EError_Name(error);
}

std::string TError::ToString() const {
    if (Errno)
        return fmt::format("{}:({}: {})", ErrorName(Error), strerror(Errno), Text);
    if (Text.length())
        return fmt::format("{}:({})", ErrorName(Error), Text);
    return ErrorName(Error);
}

bool TError::IsConfigError() const {
    switch (Error) {
    case EError::InvalidConfig:
    case EError::InvalidValue:
    case EError::OverlappingIdRange:
    case EError::RelativeWorkingDirWithChroot:
    case EError::MissingRootMapping:
    case EError::EmptyMountTarget:
    case EError::InvalidIdRange:
    case EError::UnmappedIdentity:
    case EError::MountNamespaceRequired:
        return true;
    default:
        return false;
    }
}

std::ostream &operator<<(std::ostream &os, const TError &err) {
    os << err.ToString();
    return os;
}

const TError OK;
