#include "compare/options.hpp"

using namespace nestdiff;

nestdiff::ArrayStrategy
nestdiff::array_strategy_from_string(const std::string& s) {
    if (s == "v" || s == "value" || s == "default")
        return ArrayStrategy::kValue;
    else if (s == "i" || s == "index")
        return ArrayStrategy::kIndex;
    return ArrayStrategy::kInvalid;
}

std::string
nestdiff::repr(ArrayStrategy strategy) {
    switch (strategy) {
        case ArrayStrategy::kIndex:
            return "index";
        case ArrayStrategy::kValue:
            return "value";
        case ArrayStrategy::kInvalid:
            /* fall-through */
        default:
            return "invalid";
    }
}
