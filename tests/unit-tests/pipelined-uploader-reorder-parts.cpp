#include "chunked.stream.hh"
#include "pipelined.uploader.hh"
#include "mock.storage.client.hh"
#include "unit.test.macros.hh"

#include <algorithm>

namespace {
void
check_completed_in_order(const MockStorageClient& client, unsigned int n_parts)
{
    EXPECT_EQ(int, client.n_completed, 1);
    EXPECT_EQ(unsigned int, client.completed_parts.size(), n_parts);
    for (auto i = 0u; i < n_parts; ++i) {
        EXPECT_EQ(unsigned int, client.completed_parts[i].number, i + 1);
        EXPECT_STR_EQ(client.completed_parts[i].etag.c_str(),
                      ("etag-" + std::to_string(i + 1)).c_str());
    }
}

// parts 3, 4 and 5 finish before parts 1 and 2
void
test_first_parts_finish_last()
{
    auto client = std::make_shared<MockStorageClient>();
    Gate late_parts_done;
    client->before_upload = [&](unsigned int part_number) {
        if (part_number <= 2) {
            late_parts_done.wait(3);
        }
    };
    client->after_upload = [&](unsigned int part_number) {
        if (part_number > 2) {
            late_parts_done.notify();
        }
    };

    s3stream::ChunkedStream stream(
      4,
      std::make_unique<s3stream::PipelinedUploader>(
        client, "bucket", "object", s3stream::Headers{}, 5));

    const std::vector<std::byte> data(20, std::byte{ 7 });
    stream.write(data);
    stream.close();

    EXPECT_EQ(int, client->completion_order.size(), 5);
    for (auto i = 0; i < 3; ++i) {
        CHECK(client->completion_order[i] > 2);
    }

    check_completed_in_order(*client, 5);
}

// with two workers, the second part of every pair finishes first
void
test_pairs_finish_reversed()
{
    constexpr unsigned int n_parts = 6;

    auto client = std::make_shared<MockStorageClient>();
    Gate finished[n_parts + 1];
    client->before_upload = [&](unsigned int part_number) {
        if (part_number % 2 == 1) {
            finished[part_number + 1].wait(1);
        }
    };
    client->after_upload = [&](unsigned int part_number) {
        finished[part_number].notify();
    };

    auto uploader = std::make_unique<s3stream::PipelinedUploader>(
      client, "bucket", "object", s3stream::Headers{}, 2);
    auto* handle = uploader.get();

    s3stream::ChunkedStream stream(4, std::move(uploader));
    for (auto i = 0u; i < n_parts; ++i) {
        const std::vector<std::byte> data(4, static_cast<std::byte>(i));
        stream.write(data);
    }
    stream.close();

    CHECK(handle->max_parts_in_flight() <= 2);
    CHECK(client->max_concurrent_uploads <= 2);
    for (auto i = 0u; i < n_parts; i += 2) {
        EXPECT_EQ(unsigned int, client->completion_order[i], i + 2);
        EXPECT_EQ(unsigned int, client->completion_order[i + 1], i + 1);
    }

    check_completed_in_order(*client, n_parts);

    // each part carries the data that was written for it
    for (const auto& part : client->uploaded) {
        EXPECT_EQ(int, part.data.size(), 4);
        EXPECT_EQ(int, static_cast<int>(part.data[0]), part.number - 1);
    }
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        test_first_parts_finish_last();
        test_pairs_finish_reversed();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
