#include "float_types.hpp"

namespace drift {

const char* float_side_name(FloatSide side) {
    return side == FloatSide::Left ? "left" : "right";
}

const char* clear_side_name(ClearSide side) {
    switch (side) {
    case ClearSide::Left:  return "left";
    case ClearSide::Right: return "right";
    case ClearSide::Both:  return "both";
    }
    return "unknown";
}

const char* float_error_name(FloatError error) {
    switch (error) {
    case FLOAT_ERROR_NONE:               return "none";
    case FLOAT_ERROR_INVALID_WIDTH:      return "invalid-width";
    case FLOAT_ERROR_INVALID_DIMENSIONS: return "invalid-dimensions";
    case FLOAT_ERROR_LIMIT_EXCEEDED:     return "limit-exceeded";
    case FLOAT_ERROR_INTERNAL:           return "internal-error";
    }
    return "unknown";
}

}  // namespace drift
