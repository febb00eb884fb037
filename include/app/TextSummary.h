#pragma once

#include <string>

#include "model/WaitTimesData.h"

/**
 * @brief Console rendition of a snapshot (--text-only).
 *
 * Parks in fetch order, open rides by wait descending, then the total
 * open-ride count and the fetch time.
 */
std::string formatTextSummary(const WaitTimesData &data);
