// igamestate.cpp
#include "uttt/core/igamestate.h"

namespace uttt {
namespace core {

std::string moveErrorToString(MoveError error) {
    switch (error) {
        case MoveError::OUT_OF_RANGE: return "OutOfRange";
        case MoveError::INVALID_PLAYER: return "InvalidPlayer";
        case MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID: return "CellOccupiedOrWrongSubgrid";
        case MoveError::INVALID_SUBGRID_SHAPE: return "InvalidSubgridShape";
        default: return "Unknown";
    }
}

} // namespace core
} // namespace uttt
