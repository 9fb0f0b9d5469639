#include "BackendAdapter.h"

namespace media {
const char* backendKindName(BackendKind kind)
{
    switch (kind) {
    case BackendKind::None:
        return "none";
    case BackendKind::Primary:
        return "primary";
    case BackendKind::Universal:
        return "universal";
    }
    return "unknown";
}
} // namespace media
