#include <array>

#include "AppError.h"

using namespace std;

string_view toString(ErrorKind kind) noexcept
{
    constexpr auto names = to_array<string_view>({
        "DeviceUnavailable",
        "NoActiveModel",
        "ModelNotDownloaded",
        "ModelNotLoaded",
        "EmptyInput",
        "EngineFailure",
        "DownloadFailure",
        "UnknownModel",
        "NoSpeechDetected"
    });

    const auto ix = static_cast<size_t>(kind);
    return ix < names.size() ? names[ix] : "Unknown";
}

ostream& operator << (ostream& os, ErrorKind kind)
{
    return os << toString(kind);
}

QString formatReason(ErrorKind kind, const QString& detail)
{
    const auto name = toString(kind);
    return QStringLiteral("%1: %2").arg(QString::fromUtf8(name.data(), static_cast<qsizetype>(name.size())), detail);
}
