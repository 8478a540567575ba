#pragma once

#include "storage.client.hh"

#include <vector>

namespace s3stream {
/**
 * @brief Sort @p parts by part number in place.
 * @details The part numbers must be a permutation of 1..N, where N is the
 * number of parts, so each part's number is also its destination index. The
 * parts are cycled into place in O(N) time with O(1) extra space.
 * @throws IncompleteUploadError if a part number is out of range or
 * duplicated.
 */
void
reorder_parts(std::vector<Part>& parts);

/**
 * @brief Check that @p parts are numbered 1..N in ascending order.
 */
[[nodiscard]] bool
parts_are_complete(const std::vector<Part>& parts);
} // namespace s3stream
