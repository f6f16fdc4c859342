#pragma once
#include <stdexcept>
#include <string>

namespace Anime1Relay {

    enum class ErrorKind {
        InvalidUrl,
        MalformedPage,
        UnknownUrlType,
        UnknownCategory,
        UnknownVideo,
        UpstreamError,
        UpstreamUnavailable,
        UnsupportedPlaylistFormat
    };

    class RelayError : public std::runtime_error {
    public:
        RelayError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind Kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    class InvalidUrl : public RelayError {
    public:
        explicit InvalidUrl(const std::string& message = "Invalid url")
            : RelayError(ErrorKind::InvalidUrl, message) {}
    };

    class MalformedPage : public RelayError {
    public:
        explicit MalformedPage(const std::string& message)
            : RelayError(ErrorKind::MalformedPage, message) {}
    };

    class UnknownUrlType : public RelayError {
    public:
        explicit UnknownUrlType(const std::string& message = "Unknown url type")
            : RelayError(ErrorKind::UnknownUrlType, message) {}
    };

    class UnknownCategory : public RelayError {
    public:
        explicit UnknownCategory(const std::string& message = "Unknown category")
            : RelayError(ErrorKind::UnknownCategory, message) {}
    };

    class UnknownVideo : public RelayError {
    public:
        explicit UnknownVideo(const std::string& message = "Unknown video")
            : RelayError(ErrorKind::UnknownVideo, message) {}
    };

    // Upstream answered with a non-success HTTP status.
    class UpstreamError : public RelayError {
    public:
        UpstreamError(long status, const std::string& message)
            : RelayError(ErrorKind::UpstreamError, message), status_(status) {}

        long Status() const noexcept { return status_; }

    private:
        long status_;
    };

    // Transport-level failure: DNS, connect, TLS, reset, stall.
    class UpstreamUnavailable : public RelayError {
    public:
        explicit UpstreamUnavailable(const std::string& message)
            : RelayError(ErrorKind::UpstreamUnavailable, message) {}
    };

    class UnsupportedPlaylistFormat : public RelayError {
    public:
        explicit UnsupportedPlaylistFormat(const std::string& format)
            : RelayError(ErrorKind::UnsupportedPlaylistFormat, "Unknown playlist type " + format) {}
    };

}
