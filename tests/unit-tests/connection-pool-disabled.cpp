#include "connection.pool.hh"
#include "mock.connection.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 1;

    try {
        ConnectionCounters::reset();
        const auto signer = make_test_signer();

        // a pool of size 0 keeps nothing
        s3stream::ConnectionPool<MockConnection> pool({ .max_size = 0 });

        for (auto i = 1; i <= 3; ++i) {
            auto conn = pool.acquire("http://localhost:9000", signer);
            EXPECT_EQ(int, conn->id(), i);
            pool.release(std::move(conn));
            EXPECT_EQ(int, pool.size(), 0);
            EXPECT_EQ(int, ConnectionCounters::closed.load(), i);
        }

        // releasing nothing is harmless
        pool.release(nullptr);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
