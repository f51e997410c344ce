#pragma once

// ============================================================================
// OperationError - Error kinds shared by the page engine and the PDF backend
// ============================================================================
// InputError and ValidationError abort an operation. Partial selections and
// sanitizer degradation are not errors: they travel as warnings/flags on the
// respective result structs.
// ============================================================================

#include <QString>

enum class OperationError {
    None,               ///< No error
    InputError,         ///< Malformed or inaccessible source file
    ValidationError     ///< Structurally invalid operation parameters
};

inline QString operationErrorName(OperationError error)
{
    switch (error) {
        case OperationError::None:            return QStringLiteral("none");
        case OperationError::InputError:      return QStringLiteral("input");
        case OperationError::ValidationError: return QStringLiteral("validation");
    }
    return QStringLiteral("unknown");
}
