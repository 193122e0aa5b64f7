#pragma once

#include <stdexcept>
#include <string>

namespace rangedl {

enum class ErrorKind {
    Setup,
    Write,
    Finalize,
    Config
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace rangedl
