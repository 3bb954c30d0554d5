#include "lpm/errors.hpp"

namespace lpm {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OutOfBoundsTick:    return "out_of_bounds_tick";
        case ErrorCode::InvalidRange:       return "invalid_range";
        case ErrorCode::InvalidInput:       return "invalid_input";
        case ErrorCode::NoPriceData:        return "no_price_data";
        case ErrorCode::Arithmetic:         return "arithmetic";
        case ErrorCode::Config:             return "config";
        case ErrorCode::Transient:          return "transient";
        case ErrorCode::Chain:              return "chain";
        case ErrorCode::Revert:             return "revert";
        case ErrorCode::Unauthorized:       return "unauthorized";
        case ErrorCode::PositionIdNotFound: return "position_id_not_found";
    }
    return "unknown";
}

} // namespace lpm
