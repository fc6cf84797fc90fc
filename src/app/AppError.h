#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <QString>

enum class ErrorKind {
    DeviceUnavailable,
    NoActiveModel,
    ModelNotDownloaded,
    ModelNotLoaded,
    EmptyInput,
    EngineFailure,
    DownloadFailure,
    UnknownModel,
    NoSpeechDetected
};

std::string_view toString(ErrorKind kind) noexcept;
std::ostream& operator << (std::ostream& os, ErrorKind kind);

// "<Kind>: <detail>", the form used in error events
QString formatReason(ErrorKind kind, const QString& detail);

/*! Failure of a synchronous operation.
 *
 *  Thrown by the components. The command bridge catches it and turns it into
 *  an error event.
 */
class AppError : public std::runtime_error
{
public:
    AppError(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    ErrorKind kind() const noexcept { return kind_; }

    QString reason() const {
        return formatReason(kind_, QString::fromUtf8(what()));
    }

private:
    ErrorKind kind_;
};
