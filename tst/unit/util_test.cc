#include <stdint.h>
#include <cstdlib>
#include <cstring>
#include <string>
#include <gtest/gtest.h>
#include "jqr/util.h"
#include "jqr/stats.h"
#include "test_env.h"

class UtilTest : public ::testing::Test {
 protected:
    void SetUp() override {
        setupTestEnv();
    }
};

TEST_F(UtilTest, testCodeToMessage) {
    for (JqrUtilCode code=JQRUTIL_SUCCESS; code < JQRUTIL_LAST; code = JqrUtilCode(code + 1)) {
        const char *msg = jqrutil_code_to_message(code);
        EXPECT_TRUE(msg != nullptr);
        if (code == JQRUTIL_SUCCESS || code == JQRUTIL_WRONG_NUM_ARGS) {
            EXPECT_STREQ(msg, "");
        } else {
            EXPECT_GT(strlen(msg), 0);
        }
    }
    EXPECT_STREQ(jqrutil_code_to_message(JQRUTIL_LAST), "");
}

TEST_F(UtilTest, testDoubleToStringRapidJson) {
    double v = 189.31;
    char buf[BUF_SIZE_DOUBLE_RAPID_JSON];
    size_t len = jqrutil_double_to_string_rapidjson(v, buf, sizeof(buf));
    EXPECT_STREQ(buf, "189.31");
    EXPECT_EQ(len, strlen(buf));

    len = jqrutil_double_to_string_rapidjson(100.0, buf, sizeof(buf));
    EXPECT_STREQ(buf, "100.0");
    EXPECT_EQ(len, 5);

    len = jqrutil_double_to_string_rapidjson(-0.5, buf, sizeof(buf));
    EXPECT_STREQ(buf, "-0.5");

    // buffer too small
    char small[8];
    len = jqrutil_double_to_string_rapidjson(v, small, sizeof(small));
    EXPECT_EQ(len, 0);
    EXPECT_STREQ(small, "");
}

TEST_F(UtilTest, testUtf8Length) {
    EXPECT_EQ(jqrutil_utf8_length("", 0), 0);
    EXPECT_EQ(jqrutil_utf8_length("hello", 5), 5);
    const char *s = "h\xC3\xA9llo";           // héllo
    EXPECT_EQ(jqrutil_utf8_length(s, strlen(s)), 5);
    const char *emoji = "\xF0\x9F\x98\x80!";  // U+1F600 followed by '!'
    EXPECT_EQ(jqrutil_utf8_length(emoji, strlen(emoji)), 2);
}

TEST_F(UtilTest, testAppendPointerToken) {
    std::string pointer;
    jqrutil_append_pointer_token(pointer, "store", 5);
    jqrutil_append_pointer_token(pointer, "0", 1);
    EXPECT_EQ(pointer, "/store/0");

    jqrutil_append_pointer_token(pointer, "a/b~c", 5);
    EXPECT_EQ(pointer, "/store/0/a~1b~0c");

    std::string root;
    jqrutil_append_pointer_token(root, "", 0);
    EXPECT_EQ(root, "/");
}

TEST_F(UtilTest, testLogLevel) {
    EXPECT_STREQ(jqrutil_get_log_level(), JQR_LOG_DEBUG);
    EXPECT_TRUE(jqrutil_is_log_level_enabled(JQR_LOG_DEBUG));

    EXPECT_EQ(jqrutil_set_log_level(JQR_LOG_NOTICE), JQRUTIL_SUCCESS);
    EXPECT_FALSE(jqrutil_is_log_level_enabled(JQR_LOG_DEBUG));
    EXPECT_FALSE(jqrutil_is_log_level_enabled(JQR_LOG_VERBOSE));
    EXPECT_TRUE(jqrutil_is_log_level_enabled(JQR_LOG_NOTICE));
    EXPECT_TRUE(jqrutil_is_log_level_enabled(JQR_LOG_WARNING));
    EXPECT_FALSE(jqrutil_is_log_level_enabled("chatty"));

    EXPECT_EQ(jqrutil_set_log_level("chatty"), JQRUTIL_UNKNOWN_LOG_LEVEL);
    EXPECT_STREQ(jqrutil_get_log_level(), JQR_LOG_NOTICE);
}

TEST_F(UtilTest, testLogHook) {
    jqr_log(JQR_LOG_NOTICE, "%d queries in %s", 3, "total");
    EXPECT_EQ(test_getLogText(), "notice: 3 queries in total\n");
    EXPECT_EQ(test_getLogText(), "");
}
