#pragma once

#include <string>

namespace nestdiff {

enum class ArrayStrategy {
    kInvalid,
    kIndex,  // Compare elements by position
    kValue,  // Pair elements by best content match
};

ArrayStrategy
array_strategy_from_string(const std::string& s);

std::string
repr(ArrayStrategy strategy);

// The only externally tunable knobs of the comparison engine.
struct DiffOptions {
    bool ignore_empty_fields = false;
    bool ignore_zero_values = false;
    bool ignore_key_case = false;
    bool ignore_value_case = false;
    ArrayStrategy array_strategy = ArrayStrategy::kValue;
};

}  // namespace nestdiff
