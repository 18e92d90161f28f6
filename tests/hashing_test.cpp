#include <array>
#include <cstddef>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "capsync/store/hashing.hpp"
#include "support/temp_dir.hpp"

using capsync::core::Hash256;
using capsync::core::StatusCode;
using capsync::core::StatusDomain;

namespace {

// BLAKE3("")
constexpr const char* kEmptyHex = "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262";

const capsync::store::u8* bytes(const char* s) {
    return reinterpret_cast<const capsync::store::u8*>(s);
}

} // namespace

TEST(StoreHashing, EmptyVector) {
    Hash256 out{};
    ASSERT_EQ(capsync::store::hash_compute({nullptr, 0}, &out).code, StatusCode::Ok);
    EXPECT_EQ(capsync::store::hash_hex(out), kEmptyHex);
    EXPECT_FALSE(capsync::store::hash_is_zero(out));
}

TEST(StoreHashing, DeterministicAndDifferent) {
    Hash256 h1{};
    Hash256 h2{};
    Hash256 h3{};
    EXPECT_EQ(capsync::store::hash_compute({bytes("abc"), 3}, &h1).code, StatusCode::Ok);
    EXPECT_EQ(capsync::store::hash_compute({bytes("abc"), 3}, &h2).code, StatusCode::Ok);
    EXPECT_EQ(capsync::store::hash_compute({bytes("abd"), 3}, &h3).code, StatusCode::Ok);
    EXPECT_EQ(h1, h2);
    EXPECT_NE(h1, h3);
}

TEST(StoreHashing, InvalidArguments) {
    Hash256 out{};
    const capsync::core::Status s = capsync::store::hash_compute({nullptr, 1}, &out);
    EXPECT_EQ(s.domain, StatusDomain::Store);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(capsync::store::hash_compute({nullptr, 0}, nullptr).code, StatusCode::Invalid);
}

TEST(StoreHashing, StreamMatchesOneShot) {
    const std::string data(200'000, 'x');
    Hash256 one{};
    ASSERT_EQ(capsync::store::hash_compute({bytes(data.data()), static_cast<capsync::core::u32>(data.size())}, &one).code,
              StatusCode::Ok);

    capsync::store::HashStream stream;
    stream.update(data.data(), 1);
    stream.update(data.data() + 1, 70'000);
    stream.update(data.data() + 70'001, data.size() - 70'001);
    Hash256 streamed{};
    stream.finalize(&streamed);
    EXPECT_EQ(one, streamed);
}

TEST(StoreHashing, StreamKeepsStateAcrossMove) {
    const std::string data = "segment bytes written in two parts";
    Hash256 one{};
    ASSERT_EQ(capsync::store::hash_compute({bytes(data.data()), static_cast<capsync::core::u32>(data.size())}, &one).code,
              StatusCode::Ok);

    capsync::store::HashStream first;
    first.update(data.data(), 10);
    capsync::store::HashStream second(std::move(first));
    second.update(data.data() + 10, data.size() - 10);

    Hash256 streamed{};
    second.finalize(&streamed);
    EXPECT_EQ(one, streamed);

    capsync::store::HashStream third;
    third = std::move(second);
    Hash256 again{};
    third.finalize(&again);
    EXPECT_EQ(one, again);
}

TEST(StoreHashing, FileHashAndSize) {
    capsync::test::TempDir tmp;
    const std::string content(150'000, 'q');
    const std::string path = tmp.write("chunk.mov", content);

    Hash256 file_hash{};
    capsync::core::u64 size = 0;
    ASSERT_EQ(capsync::store::hash_file(path.c_str(), &file_hash, &size).code, StatusCode::Ok);
    EXPECT_EQ(size, content.size());

    Hash256 mem{};
    ASSERT_EQ(capsync::store::hash_compute({bytes(content.data()), static_cast<capsync::core::u32>(content.size())}, &mem).code,
              StatusCode::Ok);
    EXPECT_EQ(file_hash, mem);

    EXPECT_EQ(capsync::store::hash_file(tmp.sub("missing").c_str(), &file_hash, &size).code, StatusCode::NotFound);
}

TEST(StoreHashing, HexRoundTripAndRejects) {
    Hash256 h{};
    ASSERT_TRUE(capsync::store::hash_from_hex(kEmptyHex, &h));
    EXPECT_EQ(capsync::store::hash_hex(h), kEmptyHex);

    char buf[65];
    capsync::store::hash_to_hex(h, buf, sizeof(buf));
    EXPECT_STREQ(buf, kEmptyHex);

    EXPECT_FALSE(capsync::store::hash_from_hex("abc", &h));
    EXPECT_FALSE(capsync::store::hash_from_hex(std::string(64, 'g'), &h));
}
