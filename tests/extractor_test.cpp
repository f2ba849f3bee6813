#include <array>
#include <span>
#include <stdexcept>
#include <vector>

#include <cstddef>
#include <cstdint>

#include <gtest/gtest.h>

#include <hobeta/extractor.hpp>
#include <hobeta/header/codec.hpp>
#include <hobeta/header/header.hpp>
#include <hobeta/io/memory.hpp>

using namespace hobeta;

static constexpr auto make_header = [](std::uint16_t length) -> std::vector<std::byte> {
    std::vector<std::byte> raw{
        std::byte{'T'}, std::byte{'E'}, std::byte{'S'}, std::byte{'T'}, std::byte{'F'},
        std::byte{'I'}, std::byte{'L'}, std::byte{'E'}, std::byte{'B'}, std::byte{100},
        std::byte{0},   std::byte{static_cast<std::uint8_t>(length & 0xFF)},
        std::byte{static_cast<std::uint8_t>(length >> 8)},
        std::byte{3},   std::byte{1},
    };

    const std::uint16_t crc = checksum(raw);
    raw.push_back(static_cast<std::byte>(crc & 0xFF));
    raw.push_back(static_cast<std::byte>(crc >> 8));

    return raw;
};

static constexpr auto make_payload = [](std::size_t size) {
    std::vector<std::byte> payload(size);
    for (std::size_t i = 0; i < size; ++i)
        payload[i] = static_cast<std::byte>((i * 13 + 7) & 0xFF);
    return payload;
};

static constexpr auto concat = [](std::vector<std::byte> a, const std::vector<std::byte>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
};

TEST(Extractor, TestfileScenario) {
    const auto raw = make_header(256);
    const auto payload = make_payload(256);
    MemorySource source{concat(raw, payload)};
    MemorySink sink;

    const auto [header, crc] = read_header(source);
    const std::array<std::uint8_t, 8> name{'T', 'E', 'S', 'T', 'F', 'I', 'L', 'E'};
    EXPECT_EQ(header.filename, name);
    EXPECT_EQ(header.filetype, 'B');
    EXPECT_EQ(header.start, 100);
    EXPECT_EQ(header.length, 256);
    EXPECT_EQ(header.first_sector, 3);
    EXPECT_EQ(header.occupied_sectors, 1);
    EXPECT_EQ(header.check_sum, 3700);
    ASSERT_TRUE(verify(header, crc));

    EXPECT_EQ(copy(header, true, false, source, sink), 256u);
    EXPECT_EQ(sink.data(), payload);
}

TEST(Extractor, DeclaredLengthTruncatesPadding) {
    const auto raw = make_header(100);
    const auto payload = make_payload(256);
    MemorySource source{concat(raw, payload)};
    MemorySink sink;

    const Header header = read_header(source).header;

    EXPECT_EQ(copy(header, true, false, source, sink), 100u);
    EXPECT_EQ(sink.data(), std::vector<std::byte>(payload.begin(), payload.begin() + 100));
}

TEST(Extractor, ShortSource) {
    const auto raw = make_header(1000);
    const auto payload = make_payload(300);
    MemorySource source{concat(raw, payload)};
    MemorySink sink;

    const Header header = read_header(source).header;

    std::uint64_t copied = 0;
    EXPECT_NO_THROW(copied = copy(header, true, false, source, sink));
    EXPECT_EQ(copied, 300u);
    EXPECT_EQ(sink.data(), payload);
}

TEST(Extractor, IgnoreDeclaredLength) {
    const auto raw = make_header(10);
    const auto payload = make_payload(777);
    const auto file = concat(raw, payload);
    MemorySource source{file};
    MemorySink sink;

    const Header header = read_header(source).header;

    EXPECT_EQ(plan_budget(header, true, source), file.size() - Header::wire_size);
    EXPECT_EQ(copy(header, true, true, source, sink), file.size() - Header::wire_size);
    EXPECT_EQ(sink.data(), payload);
}

TEST(Extractor, IgnoreDeclaredLengthWithoutPayload) {
    MemorySource source{make_header(512)};
    MemorySink sink;

    const Header header = read_header(source).header;

    EXPECT_EQ(plan_budget(header, true, source), 0u);
    EXPECT_EQ(copy(header, true, true, source, sink), 0u);
    EXPECT_TRUE(sink.data().empty());
    EXPECT_EQ(sink.write_count(), 0u);
}

TEST(Extractor, ZeroDeclaredLength) {
    MemorySource source{concat(make_header(0), make_payload(64))};
    MemorySink sink;

    const Header header = read_header(source).header;

    EXPECT_EQ(copy(header, true, false, source, sink), 0u);
    EXPECT_TRUE(sink.data().empty());
}

TEST(Extractor, CopiesInChunks) {
    const auto payload = make_payload(1000);
    MemorySource source{concat(make_header(1000), payload)};
    MemorySink sink;

    const Header header = read_header(source).header;

    EXPECT_EQ(copy(header, true, false, source, sink, 64), 1000u);
    EXPECT_EQ(sink.data(), payload);
    EXPECT_EQ(sink.write_count(), 16u);
}

TEST(Extractor, CopiesFromPayloadStart) {
    const auto payload = make_payload(50);
    MemorySource source{concat(make_header(50), payload)};
    MemorySink sink;

    const Header header = read_header(source).header;
    source.seek(3);

    EXPECT_EQ(copy(header, true, false, source, sink), 50u);
    EXPECT_EQ(sink.data(), payload);
}

TEST(Extractor, WrongChecksumStillCopies) {
    auto raw = make_header(32);
    raw[15] = std::byte{0x00};
    raw[16] = std::byte{0x00};
    const auto payload = make_payload(32);
    MemorySource source{concat(raw, payload)};
    MemorySink sink;

    const auto [header, crc] = read_header(source);
    ASSERT_FALSE(verify(header, crc));

    EXPECT_EQ(copy(header, false, false, source, sink), 32u);
    EXPECT_EQ(sink.data(), payload);
}

TEST(Extractor, ZeroChunkSize) {
    MemorySource source{concat(make_header(8), make_payload(8))};
    MemorySink sink;

    const Header header = read_header(source).header;

    EXPECT_THROW((void)copy(header, true, false, source, sink, 0), std::invalid_argument);
    EXPECT_TRUE(sink.data().empty());
}
