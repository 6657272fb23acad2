#pragma once

#include <optional>
#include <string>

#include "../models/TableRecord.hpp"

struct TableParseOutcome {
    std::optional<TableRecord> record;  // Empty when the source has no usable table
    std::string error;

    bool ok() const { return record.has_value(); }
};
