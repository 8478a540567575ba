#include "connection.pool.hh"

s3stream::detail::ThreadAffinity
s3stream::detail::current_thread_affinity()
{
    // destroyed when the thread exits, which expires every weak_ptr to it
    thread_local const auto token = std::make_shared<char>(0);

    return { std::this_thread::get_id(), token };
}
