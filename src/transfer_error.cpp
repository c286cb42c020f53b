#include "transfer_error.h"

#include <cerrno>

QString errorKindToString(TransferErrorKind kind)
{
    switch (kind) {
        case TransferErrorKind::None: return "None";
        case TransferErrorKind::PathNotFound: return "PathNotFound";
        case TransferErrorKind::PermissionDenied: return "PermissionDenied";
        case TransferErrorKind::CopyVerificationFailed: return "CopyVerificationFailed";
        case TransferErrorKind::ChunkFailure: return "ChunkFailure";
        case TransferErrorKind::ReassemblyFailure: return "ReassemblyFailure";
        case TransferErrorKind::Cancelled: return "Cancelled";
        case TransferErrorKind::AmbiguousMapping: return "AmbiguousMapping";
        case TransferErrorKind::InvalidProposal: return "InvalidProposal";
        case TransferErrorKind::IoError: return "IoError";
    }
    return "";
}

TransferErrorKind errorKindFromErrno(int err)
{
    switch (err) {
        case 0: return TransferErrorKind::None;
        case ENOENT:
        case ENOTDIR:
            return TransferErrorKind::PathNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return TransferErrorKind::PermissionDenied;
        default:
            return TransferErrorKind::IoError;
    }
}
