module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it:
    //                          - arena / buffer reservations that can run out
    //                          - operations taking an id that may be stale
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome:
    //                          - lookup of a mesh, material or node by name
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no such object".
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //
    // InvalidOperation is reported for requests that are legal in general but
    // not in the current state (e.g. activating an already active instance).
    // Those are logged as warnings by the store that rejects them, the store
    // state is left untouched, and the code is still returned to the caller.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,

        // Arena / store errors (700-799)
        CapacityExceeded = 700,
        AllocationFull = 701,
        InvalidHandle = 702,
        InvalidOperation = 703,
        OutOfResources = 704,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                return "Success";
            case ErrorCode::OutOfMemory:            return "OutOfMemory";
            case ErrorCode::ResourceNotFound:       return "ResourceNotFound";
            case ErrorCode::InvalidArgument:        return "InvalidArgument";
            case ErrorCode::InvalidState:           return "InvalidState";
            case ErrorCode::OutOfRange:             return "OutOfRange";
            case ErrorCode::DeviceLost:             return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:      return "OutOfDeviceMemory";
            case ErrorCode::CapacityExceeded:       return "CapacityExceeded";
            case ErrorCode::AllocationFull:         return "AllocationFull";
            case ErrorCode::InvalidHandle:          return "InvalidHandle";
            case ErrorCode::InvalidOperation:       return "InvalidOperation";
            case ErrorCode::OutOfResources:         return "OutOfResources";
            default:                                return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    // Helper to create error result
    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
