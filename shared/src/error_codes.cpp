#include "resumable/error_codes.hpp"

#include <array>

namespace resumable
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 9> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::IoFailure, "io_failure"},
            {ErrorCode::ArtifactCreateFailed, "artifact_create_failed"},
            {ErrorCode::CorruptArtifact, "corrupt_artifact"},
            {ErrorCode::SchemaMismatch, "schema_mismatch"},
            {ErrorCode::InvariantViolation, "invariant_violation"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    UploadStateError::UploadStateError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace resumable
