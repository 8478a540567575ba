#include "errors.hh"
#include "upload.parts.hh"
#include "unit.test.macros.hh"

#include <algorithm>
#include <numeric>
#include <random>

namespace {
std::vector<s3stream::Part>
make_parts(const std::vector<unsigned int>& numbers)
{
    std::vector<s3stream::Part> parts;
    for (auto number : numbers) {
        parts.push_back({ number, "etag-" + std::to_string(number) });
    }
    return parts;
}

void
check_ordered(const std::vector<s3stream::Part>& parts)
{
    CHECK(s3stream::parts_are_complete(parts));
    for (size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(unsigned int, parts[i].number, i + 1);

        // etags travel with their part numbers
        EXPECT_STR_EQ(parts[i].etag.c_str(),
                      ("etag-" + std::to_string(i + 1)).c_str());
    }
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        // every arrival order of five parts
        std::vector<unsigned int> numbers{ 1, 2, 3, 4, 5 };
        do {
            auto parts = make_parts(numbers);
            s3stream::reorder_parts(parts);
            check_ordered(parts);
        } while (std::next_permutation(numbers.begin(), numbers.end()));

        // a large shuffled upload
        numbers.resize(10000);
        std::iota(numbers.begin(), numbers.end(), 1u);
        std::shuffle(numbers.begin(), numbers.end(), std::mt19937{ 1234 });
        {
            auto parts = make_parts(numbers);
            CHECK(!s3stream::parts_are_complete(parts));
            s3stream::reorder_parts(parts);
            check_ordered(parts);
        }

        // nothing to do
        {
            std::vector<s3stream::Part> parts;
            s3stream::reorder_parts(parts);
            CHECK(s3stream::parts_are_complete(parts));
        }

        // a gap in the numbering
        {
            auto parts = make_parts({ 1, 2, 4 });
            EXPECT_THROWS(s3stream::IncompleteUploadError,
                          s3stream::reorder_parts(parts));
        }

        // a part uploaded twice
        {
            auto parts = make_parts({ 2, 1, 2 });
            EXPECT_THROWS(s3stream::IncompleteUploadError,
                          s3stream::reorder_parts(parts));
        }

        // part numbers start at 1
        {
            auto parts = make_parts({ 0, 1 });
            EXPECT_THROWS(s3stream::IncompleteUploadError,
                          s3stream::reorder_parts(parts));
        }

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
