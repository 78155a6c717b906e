#pragma once
#include <stdexcept>

namespace prc {

// Adjacent buckets disagree on their shared bound, or a bucket is inverted.
struct non_contiguous_buckets : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Nothing left to collapse once zero-count buckets are dropped.
struct empty_distribution : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
