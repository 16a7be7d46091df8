#include <gtest/gtest.h>

#include <QJsonDocument>
#include <QJsonObject>

#include "toolhub/protocol/json_framer.h"

using namespace toolhub;

namespace {

QJsonObject toObject(const QByteArray& data) {
    return QJsonDocument::fromJson(data).object();
}

} // namespace

TEST(JsonFramerTest, SingleLineObjects) {
    JsonFramer framer;
    framer.append("{\"id\":1}\n{\"id\":2}\n");

    QByteArray obj;
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("id").toInt(), 1);
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("id").toInt(), 2);
    EXPECT_FALSE(framer.tryReadObject(obj));
}

TEST(JsonFramerTest, MultiLineObject) {
    JsonFramer framer;
    framer.append("{\n  \"id\": 2,\n  \"result\": {\n    \"tools\": []\n  }\n}\n");

    QByteArray obj;
    ASSERT_TRUE(framer.tryReadObject(obj));
    const QJsonObject parsed = toObject(obj);
    EXPECT_EQ(parsed.value("id").toInt(), 2);
    EXPECT_TRUE(parsed.value("result").toObject().contains("tools"));
}

TEST(JsonFramerTest, ObjectSplitAcrossChunks) {
    JsonFramer framer;
    QByteArray obj;

    framer.append("{\"id\":5,\"text\":\"a");
    EXPECT_FALSE(framer.tryReadObject(obj));
    framer.append("b}c\"}\n");
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("text").toString(), "ab}c");
}

TEST(JsonFramerTest, SkipsLogNoise) {
    JsonFramer framer;
    framer.append("Server listening on stdio\nwarning: value {1} ignored\n{\"id\":3}\n");

    QByteArray obj;
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("id").toInt(), 3);
    EXPECT_FALSE(framer.tryReadObject(obj));
    EXPECT_EQ(framer.bufferSize(), 0);
}

TEST(JsonFramerTest, EscapedQuotesAndBracesInStrings) {
    JsonFramer framer;
    framer.append(R"({"msg":"say \"{hi}\" [x]"})" "\n");

    QByteArray obj;
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("msg").toString(), "say \"{hi}\" [x]");
}

TEST(JsonFramerTest, IndentedOpeningBraceStillFrames) {
    JsonFramer framer;
    framer.append("   {\"id\":9}\n");

    QByteArray obj;
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("id").toInt(), 9);
}

TEST(JsonFramerTest, ClearDropsPartialObject) {
    JsonFramer framer;
    framer.append("{\"id\":1,");
    QByteArray obj;
    EXPECT_FALSE(framer.tryReadObject(obj));

    framer.clear();
    EXPECT_EQ(framer.bufferSize(), 0);
    framer.append("{\"id\":4}\n");
    ASSERT_TRUE(framer.tryReadObject(obj));
    EXPECT_EQ(toObject(obj).value("id").toInt(), 4);
}
