#include "chunked.stream.hh"
#include "errors.hh"
#include "unit.test.macros.hh"

namespace {
class NullHandler : public s3stream::ChunkHandler
{
  public:
    explicit NullHandler(int& n_closed)
      : n_closed_(n_closed)
    {
    }

    void open() override {}

    std::optional<s3stream::ChunkBuffer> write(
      s3stream::ChunkBuffer&& chunk) override
    {
        return std::move(chunk);
    }

    void close() override { ++n_closed_; }

  private:
    int& n_closed_;
};
} // namespace

int
main()
{
    int retval = 1;

    try {
        int n_closed = 0;

        EXPECT_THROWS(
          s3stream::ConfigurationError,
          s3stream::ChunkedStream(0, std::make_unique<NullHandler>(n_closed)));
        EXPECT_THROWS(s3stream::ConfigurationError,
                      s3stream::ChunkedStream(16, nullptr));

        s3stream::ChunkedStream stream(
          16, std::make_unique<NullHandler>(n_closed));
        const std::vector<std::byte> data(20, std::byte{ 1 });
        stream.write(data);

        std::vector<std::byte> buf(8);
        EXPECT_THROWS(s3stream::UnsupportedOperationError, stream.read(buf));

        stream.close();
        EXPECT_EQ(int, n_closed, 1);

        // closing again does nothing
        stream.close();
        EXPECT_EQ(int, n_closed, 1);

        EXPECT_THROWS(s3stream::StreamClosedError, stream.write(data));
        EXPECT_THROWS(s3stream::StreamClosedError, stream.flush());

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
