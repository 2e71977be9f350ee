#include <catch2/catch.hpp>
#include <field_alert/utils/circular_buffer.hpp>

TEST_CASE("CircularBuffer evicts the oldest item when full", "[circular_buffer]") {
    CircularBuffer<int, 3> buf;
    CHECK(buf.isEmpty());
    CHECK(buf.capacity() == 3);

    CHECK_FALSE(buf.pushOverwrite(1));
    CHECK_FALSE(buf.pushOverwrite(2));
    CHECK_FALSE(buf.pushOverwrite(3));
    CHECK(buf.isFull());
    CHECK(buf.pushOverwrite(4));

    REQUIRE(buf.size() == 3);
    CHECK(buf.at(0) == 2);
    CHECK(buf.at(2) == 4);

    int newest = 0;
    REQUIRE(buf.newest(newest));
    CHECK(newest == 4);
}

TEST_CASE("CircularBuffer push refuses when full", "[circular_buffer]") {
    CircularBuffer<int, 2> buf;
    CHECK(buf.push(1));
    CHECK(buf.push(2));
    CHECK_FALSE(buf.push(3));
    CHECK(buf.at(0) == 1);
}

TEST_CASE("CircularBuffer copies the newest items oldest first", "[circular_buffer]") {
    CircularBuffer<int, 4> buf;
    for (int i = 1; i <= 6; ++i) {
        (void)buf.pushOverwrite(i);
    }
    int out[4] = {};
    REQUIRE(buf.copyTo(out, 4) == 4);
    CHECK(out[0] == 3);
    CHECK(out[3] == 6);

    int two[2] = {};
    REQUIRE(buf.copyTo(two, 2) == 2);
    CHECK(two[0] == 5);
    CHECK(two[1] == 6);

    buf.clear();
    int unused = 0;
    CHECK(buf.isEmpty());
    CHECK_FALSE(buf.newest(unused));
    CHECK(buf.copyTo(out, 4) == 0);
}
