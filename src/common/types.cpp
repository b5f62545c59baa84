#include "nestbar/common/types.hpp"

namespace nestbar {
namespace common {

std::string to_string(IndicatorState state) {
    switch (state) {
        case IndicatorState::CREATED: return "CREATED";
        case IndicatorState::ACTIVE: return "ACTIVE";
        case IndicatorState::FINISHED: return "FINISHED";
        case IndicatorState::ABORTED: return "ABORTED";
        default: return "UNKNOWN";
    }
}

}}
