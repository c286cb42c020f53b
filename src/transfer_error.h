#pragma once
#include <QString>

enum class TransferErrorKind {
    None,
    PathNotFound,
    PermissionDenied,
    CopyVerificationFailed,
    ChunkFailure,
    ReassemblyFailure,
    Cancelled,
    AmbiguousMapping,
    InvalidProposal,
    IoError
};

// Outcome of one filesystem operation. Expected failures are values, not exceptions.
struct TransferResult {
    TransferErrorKind kind = TransferErrorKind::None;
    QString message;
    bool usedCopyFallback = false;   // move crossed volumes and was copied instead

    bool ok() const { return kind == TransferErrorKind::None; }
    bool cancelled() const { return kind == TransferErrorKind::Cancelled; }

    static TransferResult success(bool viaCopy = false) {
        TransferResult r;
        r.usedCopyFallback = viaCopy;
        return r;
    }
    static TransferResult failure(TransferErrorKind kind, const QString& message) {
        TransferResult r;
        r.kind = kind;
        r.message = message;
        return r;
    }
    static TransferResult cancelledResult() {
        return failure(TransferErrorKind::Cancelled, QStringLiteral("Operation cancelled"));
    }
};

QString errorKindToString(TransferErrorKind kind);

// Maps an errno value from a failed filesystem call
TransferErrorKind errorKindFromErrno(int err);
