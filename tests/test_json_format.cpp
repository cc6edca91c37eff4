#include <gtest/gtest.h>
#include "../src/json_format.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace test_support;

class JsonFormatTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        init_localization();
        work_dir = fs::absolute("tmp_json_format_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }
};

TEST_F(JsonFormatTest, IndentsWithTwoSpaces) {
    std::string formatted = format_json(R"({"a":1,"b":[true,null]})");
    EXPECT_EQ(formatted,
        "{\n"
        "  \"a\": 1,\n"
        "  \"b\": [\n"
        "    true,\n"
        "    null\n"
        "  ]\n"
        "}");
}

TEST_F(JsonFormatTest, KeepsMemberOrder) {
    std::string formatted = format_json(R"({"zeta":"last?","alpha":"no","mid":{"y":2,"x":1}})");
    EXPECT_LT(formatted.find("zeta"), formatted.find("alpha"));
    EXPECT_LT(formatted.find("alpha"), formatted.find("mid"));
    EXPECT_LT(formatted.find("\"y\""), formatted.find("\"x\""));
}

TEST_F(JsonFormatTest, IsStableWhenAppliedTwice) {
    std::string once = format_json("[ {\"k\" : \"v\"} ,  3 ]");
    EXPECT_EQ(format_json(once), once);
}

TEST_F(JsonFormatTest, RejectsMalformedJson) {
    try {
        format_json("{\"unterminated\": [1, 2");
        FAIL() << "Expected UnpackException";
    } catch (const UnpackException& e) {
        EXPECT_EQ(e.code(), UnpackErrc::JsonFormat);
    }
}

TEST_F(JsonFormatTest, WritesFormattedStreamToFile) {
    StringStream in(R"({"layer":{"id":7,"name":"mesh"}})");
    fs::path target = work_dir / "3dSceneLayer.json";
    write_pretty_json(in, target);

    std::string written = read_file(target);
    EXPECT_NE(written.find("\n  \"layer\": {\n    \"id\": 7,"), std::string::npos);
    EXPECT_EQ(strip_whitespace(written), R"({"layer":{"id":7,"name":"mesh"}})");
}

TEST_F(JsonFormatTest, UnwritableTargetIsAnEntryWriteError) {
    StringStream in("{}");
    try {
        write_pretty_json(in, work_dir / "missing_dir" / "out.json");
        FAIL() << "Expected UnpackException";
    } catch (const UnpackException& e) {
        EXPECT_EQ(e.code(), UnpackErrc::EntryWrite);
    }
}

TEST_F(JsonFormatTest, KeepsIntegersWiderThanSixtyFourBits) {
    EXPECT_EQ(format_json(R"({"big":123456789012345678901234567890})"),
        "{\n"
        "  \"big\": 123456789012345678901234567890\n"
        "}");
}

TEST_F(JsonFormatTest, KeepsDuplicateMembers) {
    EXPECT_EQ(format_json(R"({"k":1,"k":2})"),
        "{\n"
        "  \"k\": 1,\n"
        "  \"k\": 2\n"
        "}");
}

TEST_F(JsonFormatTest, KeepsNumberSpelling) {
    EXPECT_EQ(format_json(R"([1.10,1E5,-0.0,1e400])"),
        "[\n"
        "  1.10,\n"
        "  1E5,\n"
        "  -0.0,\n"
        "  1e400\n"
        "]");
}

TEST_F(JsonFormatTest, EmptyContainersStayOnOneLine) {
    EXPECT_EQ(format_json(R"({"a":{},"b":[],"c":[{}]})"),
        "{\n"
        "  \"a\": {},\n"
        "  \"b\": [],\n"
        "  \"c\": [\n"
        "    {}\n"
        "  ]\n"
        "}");
}

TEST_F(JsonFormatTest, TopLevelScalar) {
    EXPECT_EQ(format_json("  \"s\\u00e9\\n\"  "), "\"s\xc3\xa9\\n\"");
}

TEST_F(JsonFormatTest, RejectsTrailingGarbage) {
    try {
        format_json("{} {}");
        FAIL() << "Expected UnpackException";
    } catch (const UnpackException& e) {
        EXPECT_EQ(e.code(), UnpackErrc::JsonFormat);
    }
}
