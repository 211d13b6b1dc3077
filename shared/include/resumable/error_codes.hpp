/**
 * Resumable - Error codes shared by the state store, cache and manager.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace resumable
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        InvalidArgument = 2,
        IoFailure = 3,
        ArtifactCreateFailed = 4,
        CorruptArtifact = 5,
        SchemaMismatch = 6,
        InvariantViolation = 7,
        InternalError = 8
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class UploadStateError : public std::runtime_error
    {
    public:
        UploadStateError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace resumable
