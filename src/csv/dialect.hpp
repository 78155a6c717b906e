#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace prc {

struct csv_dialect {
    char delimiter = ',';
    char quote     = '"';
    bool has_header = true;
    std::vector<std::string> null_tokens = {"", "NA", "N/A", "null", "NULL", "NaN"};
};

// Unreadable input: missing file, missing column, unparsable cell.
struct csv_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
