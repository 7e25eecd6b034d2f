/**
 * @file digraph_exceptions.cpp
 */
#include "rdgraph/common/digraph_exceptions.hpp"

namespace rdgraph
{

const char* to_string(DigraphErrorCode code) noexcept
{
    switch (code)
    {
    case DigraphErrorCode::NullArgument:
        return "NullArgument";
    case DigraphErrorCode::NotFound:
        return "NotFound";
    case DigraphErrorCode::IncompleteResolution:
        return "IncompleteResolution";
    case DigraphErrorCode::InvalidCapacity:
        return "InvalidCapacity";
    case DigraphErrorCode::InvariantViolation:
        return "InvariantViolation";
    }
    return "Unknown";
}

} // namespace rdgraph
