#pragma once

#include "table_config.hpp"
#include "table_data.hpp"

// Infers merged ranges from runs of empty cells that follow a non-empty anchor,
// either along a row or down a column. Each cell joins at most one range and
// row ranges are claimed before column ranges.
//
// Ignore leaves the table alone. Preserve marks every cell of a range as Merged,
// with the span recorded on the anchor only. Expand marks as Preserve does and
// then copies the anchor's content into the other cells of its range.
void handleMerges(TableData& table, MergeCellsHandling policy);
