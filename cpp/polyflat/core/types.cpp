#include "polyflat/core/types.h"

namespace polyflat {

const char* errorMessage(ConvertError error) noexcept {
    switch (error) {
        case ConvertError::Ok: return "ok";
        case ConvertError::InvalidStepCount: return "step count must be a positive integer";
        case ConvertError::InvalidMaxError: return "max error must be a positive finite number";
        case ConvertError::InvalidTargetWidth: return "target width must be a positive finite number";
        case ConvertError::InvalidSubdivisionLimit: return "subdivision limits must be positive";
        case ConvertError::UnknownMethod: return "unknown flattening method (use 'fixed' or 'adaptive')";
        case ConvertError::SubdivisionLimitExceeded: return "adaptive subdivision exceeded its depth or point limit";
        case ConvertError::PolygonTooLarge: return "polygon has too many vertices for the output format";
        case ConvertError::CoordinateOverflow: return "coordinate does not fit in the output database units";
        case ConvertError::InvalidSinkState: return "output sink rejected the polygon";
    }
    return "unknown error";
}

} // namespace polyflat
