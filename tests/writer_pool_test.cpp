#include <catch2/catch_test_macros.hpp>

#include "negotiate/json/byte_buffer.hpp"
#include "negotiate/json/writer_pool.hpp"

#include <stdexcept>
#include <string>

using namespace negotiate;

TEST_CASE("JsonWriterPool reuses released writers", "[json][pool]") {
    JsonWriterPool pool;
    ArrayByteBuffer buffer;

    REQUIRE(pool.idle_count() == 0);

    auto writer = pool.acquire(buffer);
    REQUIRE(writer != nullptr);
    REQUIRE(writer->attached());
    JsonWriter* first_instance = writer.get();

    pool.release(std::move(writer));
    REQUIRE(pool.idle_count() == 1);

    auto again = pool.acquire(buffer);
    REQUIRE(again.get() == first_instance);
    REQUIRE(pool.idle_count() == 0);

    pool.release(std::move(again));
}

TEST_CASE("JsonWriterPool hands out writers with clean state", "[json][pool]") {
    JsonWriterPool pool;
    ArrayByteBuffer first;
    ArrayByteBuffer second;

    auto writer = pool.acquire(first);
    writer->write_start_object();
    writer->write_start_array("abandoned");
    pool.release(std::move(writer));

    auto reused = pool.acquire(second);
    REQUIRE(reused->current_depth() == 0);
    REQUIRE(reused->bytes_pending() == 0);

    reused->write_start_array();
    reused->write_end_array();
    reused->flush();

    REQUIRE(first.written_count() == 0);
    REQUIRE(second.written_view() == "[]");
    pool.release(std::move(reused));
}

TEST_CASE("JsonWriterPool bounds the number of idle writers", "[json][pool]") {
    WriterPoolConfig config;
    config.max_idle_writers = 2;
    JsonWriterPool pool(config);
    ArrayByteBuffer buffer;

    auto a = pool.acquire(buffer);
    auto b = pool.acquire(buffer);
    auto c = pool.acquire(buffer);

    pool.release(std::move(a));
    pool.release(std::move(b));
    pool.release(std::move(c));

    REQUIRE(pool.idle_count() == 2);
}

TEST_CASE("JsonWriterPool drops writers that grew too large", "[json][pool]") {
    WriterPoolConfig config;
    config.max_retained_capacity = 64;
    JsonWriterPool pool(config);
    ArrayByteBuffer buffer;

    auto writer = pool.acquire(buffer);
    writer->write_start_array();
    writer->write_string_value(std::string(1024, 'x'));
    writer->write_end_array();
    writer->flush();
    pool.release(std::move(writer));

    REQUIRE(pool.idle_count() == 0);
}

TEST_CASE("JsonWriterPool ignores null releases", "[json][pool]") {
    JsonWriterPool pool;
    pool.release(nullptr);
    REQUIRE(pool.idle_count() == 0);
}

TEST_CASE("PooledJsonWriter returns its writer on scope exit", "[json][pool]") {
    JsonWriterPool pool;
    ArrayByteBuffer buffer;

    {
        PooledJsonWriter writer(pool, buffer);
        writer->write_start_object();
        writer->write_end_object();
        writer->flush();
        REQUIRE(pool.idle_count() == 0);
    }

    REQUIRE(pool.idle_count() == 1);
    REQUIRE(buffer.written_view() == "{}");
}

TEST_CASE("PooledJsonWriter returns its writer when an exception unwinds", "[json][pool]") {
    JsonWriterPool pool;
    ArrayByteBuffer buffer;

    auto misuse = [&]() {
        PooledJsonWriter writer(pool, buffer);
        writer->write_end_object();  // nothing open
    };

    REQUIRE_THROWS_AS(misuse(), std::logic_error);
    REQUIRE(pool.idle_count() == 1);
}
