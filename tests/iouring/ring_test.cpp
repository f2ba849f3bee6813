#include <optional>
#include <stdexcept>
#include <system_error>

#include <cstdint>

#include <liburing.h>

#include <gtest/gtest.h>

#include <hobeta/iouring/cqe.hpp>
#include <hobeta/iouring/ring.hpp>

using namespace hobeta;

static constexpr auto make_ring = [](std::uint32_t entries) -> std::optional<IOUring> {
    try {
        return IOUring{entries};
    } catch (const std::system_error&) {
        return std::nullopt;
    }
};

TEST(IOUring, InitDefault) {
    const std::uint32_t entries = 16;
    auto ring = make_ring(entries);
    if (!ring)
        GTEST_SKIP() << "io_uring is not available on this host";

    EXPECT_TRUE(*ring);
    EXPECT_TRUE(ring->get()->ring_fd != -1);
    EXPECT_EQ(ring->get_sq_entries(), entries);

    ring->close();
    EXPECT_FALSE(*ring);
    EXPECT_TRUE(ring->get()->ring_fd == -1);
    EXPECT_EQ(ring->get_sq_entries(), 0u);
}

TEST(IOUring, MoveConstructor) {
    const std::uint32_t entries = 16;
    auto source = make_ring(entries);
    if (!source)
        GTEST_SKIP() << "io_uring is not available on this host";

    IOUring destination{std::move(*source)};

    EXPECT_FALSE(*source);
    EXPECT_EQ(source->get_sq_entries(), 0u);

    EXPECT_TRUE(destination);
    EXPECT_EQ(destination.get_sq_entries(), entries);
}

TEST(IOUring, ClosedRing) {
    auto ring = make_ring(4);
    if (!ring)
        GTEST_SKIP() << "io_uring is not available on this host";

    ring->close();

    EXPECT_THROW((void)ring->get_sqe(), std::logic_error);
    EXPECT_THROW(ring->submit(), std::logic_error);
    EXPECT_THROW((void)ring->wait_cqe(), std::logic_error);
}

TEST(IOUring, NOPOperation) {
    auto ring = make_ring(16);
    if (!ring)
        GTEST_SKIP() << "io_uring is not available on this host";

    const std::uint64_t user_data = 0x123456789ABCDEF;

    io_uring_sqe* sqe = nullptr;
    EXPECT_NO_THROW(sqe = ring->get_sqe());
    ASSERT_NE(sqe, nullptr);

    ::io_uring_prep_nop(sqe);
    ::io_uring_sqe_set_data64(sqe, user_data);
    EXPECT_NO_THROW(ring->submit());

    EXPECT_NO_THROW(const Cqe cqe = ring->wait_cqe(); EXPECT_EQ(cqe.get_data64(), user_data);
                    EXPECT_TRUE(cqe.ok()); EXPECT_EQ(cqe.error(), 0););
}
