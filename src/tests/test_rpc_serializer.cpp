#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "toolhub/protocol/rpc_serializer.h"

using namespace toolhub;

TEST(RpcSerializerTest, ParseRequestWithParams) {
    RpcMessage msg;
    QString error;
    ASSERT_TRUE(parseRpcMessage(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{"limit":5}})", msg, error));
    EXPECT_TRUE(msg.isRequest());
    EXPECT_FALSE(msg.isNotification());
    EXPECT_EQ(msg.id.toInt(), 7);
    EXPECT_EQ(msg.method, "tools/list");
    EXPECT_EQ(msg.paramsObject().value("limit").toInt(), 5);
}

TEST(RpcSerializerTest, NullIdCountsAsPresent) {
    RpcMessage msg;
    QString error;
    ASSERT_TRUE(parseRpcMessage(R"({"jsonrpc":"2.0","id":null,"method":"ping"})", msg, error));
    EXPECT_TRUE(msg.hasId());
    EXPECT_TRUE(msg.id.isNull());
}

TEST(RpcSerializerTest, NotificationHasNoId) {
    RpcMessage msg;
    QString error;
    ASSERT_TRUE(parseRpcMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                                msg, error));
    EXPECT_TRUE(msg.isNotification());
    EXPECT_FALSE(msg.hasId());
}

TEST(RpcSerializerTest, RejectsInvalidJsonAndNonObjects) {
    RpcMessage msg;
    QString error;
    EXPECT_FALSE(parseRpcMessage("{not json", msg, error));
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(parseRpcMessage("[1,2,3]", msg, error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(RpcSerializerTest, StringIdSurvivesSerialization) {
    const QByteArray data = serializeRpcMessage(makeRpcResult("abc-1", QJsonObject{{"ok", true}}));
    ASSERT_TRUE(data.endsWith('\n'));
    EXPECT_EQ(data.count('\n'), 1);

    const QJsonObject obj = QJsonDocument::fromJson(data).object();
    EXPECT_EQ(obj.value("jsonrpc").toString(), "2.0");
    EXPECT_EQ(obj.value("id").toString(), "abc-1");
    EXPECT_TRUE(obj.value("result").toObject().value("ok").toBool());
    EXPECT_FALSE(obj.contains("error"));
}

TEST(RpcSerializerTest, ErrorCarriesCodeMessageAndData) {
    const RpcMessage msg = makeRpcError(3, rpc::kInvalidParams, "Tool not found: x",
                                        QJsonObject{{"hint", "list first"}});
    const QJsonObject obj = rpcMessageToJson(msg);
    EXPECT_EQ(obj.value("id").toInt(), 3);
    EXPECT_FALSE(obj.contains("result"));

    const QJsonObject err = obj.value("error").toObject();
    EXPECT_EQ(err.value("code").toInt(), -32602);
    EXPECT_EQ(err.value("message").toString(), "Tool not found: x");
    EXPECT_EQ(err.value("data").toObject().value("hint").toString(), "list first");
}

TEST(RpcSerializerTest, ErrorWithoutIdUsesNull) {
    const QJsonObject obj = rpcMessageToJson(
        makeRpcError(QJsonValue(QJsonValue::Undefined), rpc::kParseError, "Parse error"));
    ASSERT_TRUE(obj.contains("id"));
    EXPECT_TRUE(obj.value("id").isNull());
    EXPECT_FALSE(obj.value("error").toObject().contains("data"));
}

TEST(RpcSerializerTest, ResponseDetection) {
    RpcMessage msg;
    ASSERT_TRUE(rpcMessageFromJson(QJsonObject{{"jsonrpc", "2.0"}, {"id", 2},
                                               {"result", QJsonObject{}}}, msg));
    EXPECT_TRUE(msg.isResponse());
    EXPECT_FALSE(msg.isRequest());

    RpcMessage empty;
    EXPECT_FALSE(rpcMessageFromJson(QJsonObject{{"jsonrpc", "2.0"}, {"id", 2}}, empty));
}
