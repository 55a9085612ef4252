#include <gmock/gmock.h>

#include "mock_gemini.h"

#include <config/common.h>
#include <gemini/geminiclient.h>
#include <gemini/geminiinit.h>

#include <boost/asio/error.hpp>

#include <string>
#include <utility>

using namespace testing;
using namespace gmn::testing;

TEST(ParseResponseHeaderTest, status_and_meta)
{
    ResponseHeader header{};

    ASSERT_TRUE(parse_response_header("20 text/gemini; lang=en", header));

    EXPECT_EQ(GEMINI_SUCCESS_VAL, header.status);
    EXPECT_EQ("text/gemini; lang=en", header.meta);
}

TEST(ParseResponseHeaderTest, line_ending_is_removed)
{
    ResponseHeader header{};

    ASSERT_TRUE(parse_response_header("51 Not found\r\n", header));

    EXPECT_EQ(GEMINI_NOT_FOUND_VAL, header.status);
    EXPECT_EQ("Not found", header.meta);
}

TEST(ParseResponseHeaderTest, status_without_meta)
{
    ResponseHeader header{};

    ASSERT_TRUE(parse_response_header("20", header));

    EXPECT_EQ(GEMINI_SUCCESS_VAL, header.status);
    EXPECT_EQ("", header.meta);
}

TEST(ParseResponseHeaderTest, rejects_short_status)
{
    ResponseHeader header{};

    EXPECT_FALSE(parse_response_header("2", header));
    EXPECT_FALSE(parse_response_header("", header));
}

TEST(ParseResponseHeaderTest, rejects_non_digit_status)
{
    ResponseHeader header{};

    EXPECT_FALSE(parse_response_header("OK text/gemini", header));
}

TEST(ParseResponseHeaderTest, rejects_three_digit_status)
{
    ResponseHeader header{};

    EXPECT_FALSE(parse_response_header("200 OK", header));
}

TEST(ParseResponseHeaderTest, rejects_oversized_meta)
{
    ResponseHeader header{};

    EXPECT_FALSE(parse_response_header("30 " + std::string(GEMINI_MAX_META + 1, 'x'), header));
    EXPECT_TRUE(parse_response_header("30 " + std::string(GEMINI_MAX_META, 'x'), header));
}

TEST(GeminiStatusTest, status_class)
{
    EXPECT_EQ(GEMINI_CLASS_INPUT, gemini_status_class(GEMINI_SENSITIVE_INPUT_VAL));
    EXPECT_EQ(GEMINI_CLASS_SUCCESS, gemini_status_class(GEMINI_SUCCESS_VAL));
    EXPECT_EQ(GEMINI_CLASS_REDIRECT, gemini_status_class(GEMINI_REDIRECT_PERM_VAL));
    EXPECT_EQ(GEMINI_CLASS_TEMPFAIL, gemini_status_class(GEMINI_SLOW_DOWN_VAL));
    EXPECT_EQ(GEMINI_CLASS_PERMFAIL, gemini_status_class(GEMINI_BAD_REQUEST_VAL));
    EXPECT_EQ(GEMINI_CLASS_CERT, gemini_status_class(GEMINI_CERT_INVALID_VAL));
}

TEST(GeminiStatusTest, status_text)
{
    EXPECT_STREQ("Not found", gemini_status_text(GEMINI_NOT_FOUND_VAL));
    EXPECT_STREQ("Client certificate required", gemini_status_text(GEMINI_CERT_REQUIRED_VAL));
    EXPECT_STREQ("Unknown status", gemini_status_text(99));
}

class GeminiConnectTest : public Test
{
public:
    ~GeminiConnectTest() override = default;

protected:
    void SetUp() override
    {
        init_gemini();
        set_gemini_connection_factory(m_factory.AsStdFunction());
        m_connection = std::make_shared<StrictMock<MockGeminiConnection>>();
    }
    void TearDown() override
    {
        set_gemini_connection_factory(nullptr);
    }

    const std::string           m_host{"geminiprotocol.net"};
    MockGeminiConnectionFactory m_factory;
    MockConnectionPtr           m_connection;
    error_code                  m_ec;
};

TEST_F(GeminiConnectTest, factory_creates_connection)
{
    EXPECT_CALL(m_factory, Call(m_host, GEMINI_PORT, IsNull(), _)).WillOnce(Return(m_connection));

    const ConnectionPtr result = gemini_connect(m_host, GEMINI_PORT, nullptr, m_ec);

    EXPECT_EQ(m_connection, result);
    EXPECT_FALSE(m_ec);
}

TEST_F(GeminiConnectTest, certificate_is_passed_to_factory)
{
    const ClientCertificate cert{"certs/h.crt", "certs/h.key"};
    EXPECT_CALL(m_factory, Call(m_host, 1966, Eq(&cert), _)).WillOnce(Return(m_connection));

    const ConnectionPtr result = gemini_connect(m_host, 1966, &cert, m_ec);

    EXPECT_EQ(m_connection, result);
}

TEST_F(GeminiConnectTest, failure_keeps_factory_error)
{
    EXPECT_CALL(m_factory, Call(m_host, GEMINI_PORT, _, _))
        .WillOnce(DoAll(SetArgReferee<3>(error_code(boost::asio::error::host_not_found)), Return(nullptr)));

    const ConnectionPtr result = gemini_connect(m_host, GEMINI_PORT, nullptr, m_ec);

    EXPECT_EQ(nullptr, result);
    EXPECT_EQ(error_code(boost::asio::error::host_not_found), m_ec);
}

TEST_F(GeminiConnectTest, failure_without_error_is_refused)
{
    EXPECT_CALL(m_factory, Call(m_host, GEMINI_PORT, _, _)).WillOnce(Return(nullptr));

    const ConnectionPtr result = gemini_connect(m_host, GEMINI_PORT, nullptr, m_ec);

    EXPECT_EQ(nullptr, result);
    EXPECT_TRUE(m_ec);
}

TEST_F(GeminiConnectTest, no_factory)
{
    set_gemini_connection_factory(nullptr);

    const ConnectionPtr result = gemini_connect(m_host, GEMINI_PORT, nullptr, m_ec);

    EXPECT_EQ(nullptr, result);
    EXPECT_TRUE(m_ec);
}

TEST_F(GeminiConnectTest, request_writes_line)
{
    EXPECT_CALL(*m_connection, write_line(StrEq("gemini://geminiprotocol.net/"), _)).Times(1);

    EXPECT_TRUE(gemini_request(*m_connection, "gemini://geminiprotocol.net/", m_ec));
}

TEST_F(GeminiConnectTest, request_write_failure)
{
    EXPECT_CALL(*m_connection, write_line(_, _))
        .WillOnce(SetArgReferee<1>(error_code(boost::asio::error::broken_pipe)));

    EXPECT_FALSE(gemini_request(*m_connection, "gemini://geminiprotocol.net/", m_ec));
    EXPECT_EQ(error_code(boost::asio::error::broken_pipe), m_ec);
}
