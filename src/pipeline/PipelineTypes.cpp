#include "PipelineTypes.hpp"

namespace pipeline
{

int http_status_for(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::None:
        return 200;
    case ErrorKind::Validation:
        return 400;
    case ErrorKind::Storage:
    case ErrorKind::Extraction:
    case ErrorKind::Unexpected:
        return 500;
    }
    return 500;
}

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Storage:
        return "storage";
    case ErrorKind::Extraction:
        return "extraction";
    case ErrorKind::Unexpected:
        return "unexpected";
    }
    return "unexpected";
}

} // namespace pipeline
