#include "macros.hh"
#include "upload.parts.hh"
#include "errors.hh"

#include <utility> // std::swap

void
s3stream::reorder_parts(std::vector<Part>& parts)
{
    const auto n_parts = parts.size();

    for (size_t i = 0; i < n_parts; ++i) {
        while (parts[i].number != i + 1) {
            const auto number = parts[i].number;
            if (number == 0 || number > n_parts) {
                throw IncompleteUploadError(
                  LOG_ERROR("Part number ",
                            number,
                            " is out of range for ",
                            n_parts,
                            " parts"),
                  n_parts,
                  n_parts);
            }

            // part numbers are 1-based
            const auto dest = number - 1;
            if (parts[dest].number == number) {
                throw IncompleteUploadError(
                  LOG_ERROR("Duplicate part number ", number),
                  n_parts,
                  n_parts);
            }

            std::swap(parts[i], parts[dest]);
        }
    }
}

bool
s3stream::parts_are_complete(const std::vector<Part>& parts)
{
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].number != i + 1) {
            return false;
        }
    }

    return true;
}
