#include "celestiada/sdk/types.hpp"
#include "celestiada/sdk/Namespace.hpp"
#include "celestiada/sdk/Logger.hpp"

#include <boost/test/unit_test.hpp>

using namespace celestiada::sdk;

BOOST_AUTO_TEST_SUITE(types_tests)

BOOST_AUTO_TEST_CASE(hex_encoding)
{
    BOOST_CHECK_EQUAL(bytes_to_hex(ByteVector{0x00, 0x0f, 0xa0, 0xff}), "000fa0ff");
    BOOST_CHECK_EQUAL(bytes_to_hex(ByteVector()), "");

    auto bytes = hex_to_bytes("0x000FA0ff");
    BOOST_REQUIRE(bytes.is_ok());
    BOOST_CHECK(bytes.value() == (ByteVector{0x00, 0x0f, 0xa0, 0xff}));

    BOOST_CHECK(hex_to_bytes("abc").error() == ErrorCode::INVALID_PARAMETER);
    BOOST_CHECK(hex_to_bytes("zz").error() == ErrorCode::INVALID_PARAMETER);
    BOOST_CHECK(hex_to_bytes("").value().empty());
}

BOOST_AUTO_TEST_CASE(result_carries_detail)
{
    Result<int> ok(5);
    BOOST_CHECK(ok.is_ok());
    BOOST_CHECK_EQUAL(ok.value(), 5);

    Result<int> failed(ErrorCode::MISSING_PREIMAGE, "abcd");
    BOOST_CHECK(failed.is_err());
    BOOST_CHECK_EQUAL(failed.error_detail(), "abcd");
    BOOST_CHECK_EQUAL(failed.error_message(), ErrorCodeToString(ErrorCode::MISSING_PREIMAGE) + ": abcd");
    BOOST_CHECK_THROW(failed.value(), std::runtime_error);

    Result<void> done;
    BOOST_CHECK(done.is_ok());
    BOOST_CHECK_EQUAL(Result<void>(ErrorCode::TIMEOUT).error_message(), ErrorCodeToString(ErrorCode::TIMEOUT));
}

BOOST_AUTO_TEST_CASE(v0_namespace_layout)
{
    auto ns = Namespace::from_v0_hex("0102");
    BOOST_REQUIRE(ns.is_ok());

    ByteVector bytes = ns.value().bytes();
    BOOST_REQUIRE_EQUAL(bytes.size(), constants::NAMESPACE_SIZE);
    for (size_t i = 0; i < 27; i++) {
        BOOST_CHECK_EQUAL(bytes[i], 0x00);
    }
    BOOST_CHECK_EQUAL(bytes[27], 0x01);
    BOOST_CHECK_EQUAL(bytes[28], 0x02);

    auto parsed = Namespace::from_bytes(bytes);
    BOOST_REQUIRE(parsed.is_ok());
    BOOST_CHECK(parsed.value() == ns.value());
}

BOOST_AUTO_TEST_CASE(v0_namespace_limits)
{
    BOOST_CHECK(Namespace::from_v0(ByteVector()).error() == ErrorCode::INVALID_PARAMETER);
    BOOST_CHECK(Namespace::from_v0(ByteVector(10, 0x01)).is_ok());
    BOOST_CHECK(Namespace::from_v0(ByteVector(11, 0x01)).error() == ErrorCode::INVALID_PARAMETER);
    BOOST_CHECK(Namespace::from_bytes(ByteVector(28, 0x00)).error() == ErrorCode::INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(log_level_names)
{
    BOOST_CHECK(Logger::level_from_string("debug") == Logger::LogLevel::DEBUG);
    BOOST_CHECK(Logger::level_from_string("warn") == Logger::LogLevel::WARNING);
    BOOST_CHECK(Logger::level_from_string("bogus") == Logger::LogLevel::INFO);
    BOOST_CHECK_EQUAL(Logger::level_to_string(Logger::LogLevel::CRITICAL), "CRITICAL");
}

BOOST_AUTO_TEST_SUITE_END()
