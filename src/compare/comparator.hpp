#pragma once

/*
    Pairwise structural comparison of two (possibly absent) values.

    Scalars are compared directly, arrays are handed to the array matcher and
    strings holding line breaks to the multiline splitter. The comparator is
    total: it never fails on well-formed trees, and a value whose payload does
    not match its type tag is reported as a modification.
*/

#include "compare/options.hpp"
#include "model/diff_result.hpp"
#include "model/value.hpp"

namespace nestdiff {

class Comparator {
   public:
    explicit Comparator(DiffOptions options) : options_(options) {
    }

    // Compare two roots; the result has an empty path.
    DiffResult
    compare(const ValuePtr& a, const ValuePtr& b) const;

    // Compare two values found at `path` below the comparison root.
    DiffResult
    compare_at(const ValuePtr& a, const ValuePtr& b, const Path& path) const;

    // Equality of two scalar strings, honouring ignore_value_case.
    bool
    strings_equal(const std::string& a, const std::string& b) const;

    const DiffOptions&
    options() const {
        return options_;
    }

   private:
    DiffResult
    compare_objects(const ValuePtr& a, const ValuePtr& b, const Path& path) const;

    // Should a key whose value on one side is `value` (nullptr when
    // `exists` is false) be left out of the comparison?
    bool
    should_ignore(const ValuePtr& value, bool exists) const;

    DiffOptions options_;
};

}  // namespace nestdiff
