#include <gtest/gtest.h>

#include <QStringList>

#include "hue_sse.h"

using namespace huesync;

namespace {

QStringList g_streamWarnings;

void captureStreamWarnings(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    if (type == QtWarningMsg && context.category && QByteArray(context.category) == "huesync.stream")
        g_streamWarnings.append(message);
}

} // namespace

TEST(ChangeEventParsingTest, BatchedEnvelopesYieldOneEventPerEntry)
{
    const QByteArray data = R"([
        {"creationtime":"2024-01-01T10:00:00Z","id":"e1","type":"update",
         "data":[{"id":"L1","type":"light","on":{"on":true}},
                 {"id":"L2","type":"light","dimming":{"brightness":20}}]},
        {"creationtime":"2024-01-01T10:00:01Z","id":"e2","type":"delete",
         "data":[{"id":"S9","type":"scene"}]}
    ])";

    ChangeEventList events;
    QString error;
    ASSERT_TRUE(parseChangeEvents(data, &events, &error)) << error.toStdString();
    ASSERT_EQ(events.size(), 3);

    EXPECT_EQ(events.at(0).kind, ChangeKind::Update);
    EXPECT_EQ(events.at(0).id, QStringLiteral("L1"));
    EXPECT_EQ(events.at(0).eventId, QStringLiteral("e1"));
    EXPECT_EQ(events.at(0).creationTime, QStringLiteral("2024-01-01T10:00:00Z"));
    EXPECT_TRUE(events.at(0).attributes.value(QStringLiteral("on")).isObject());
    EXPECT_GT(events.at(0).receivedAtMs, 0);

    EXPECT_EQ(events.at(1).id, QStringLiteral("L2"));
    EXPECT_EQ(events.at(2).kind, ChangeKind::Delete);
    EXPECT_EQ(events.at(2).type, QStringLiteral("scene"));
}

TEST(ChangeEventParsingTest, SingleObjectEnvelope)
{
    ChangeEventList events;
    ASSERT_TRUE(parseChangeEvents(R"({"id":"e3","type":"add","data":[{"id":"R1","type":"room"}]})", &events));
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events.at(0).kind, ChangeKind::Add);
}

TEST(ChangeEventParsingTest, ErrorEnvelopesAreSkippedWithWarning)
{
    g_streamWarnings.clear();
    const QtMessageHandler previous = qInstallMessageHandler(captureStreamWarnings);

    ChangeEventList events;
    const bool parsed = parseChangeEvents(
        R"([{"id":"e4","type":"error","data":[{"description":"internal"}]}])", &events);
    qInstallMessageHandler(previous);

    ASSERT_TRUE(parsed);
    EXPECT_TRUE(events.isEmpty());
    ASSERT_EQ(g_streamWarnings.size(), 1);
    EXPECT_TRUE(g_streamWarnings.at(0).contains(QStringLiteral("e4")));
    EXPECT_TRUE(g_streamWarnings.at(0).contains(QStringLiteral("internal")));
}

TEST(ChangeEventParsingTest, MalformedFramesAreRejectedWithoutPartialOutput)
{
    ChangeEventList events;
    QString error;

    EXPECT_FALSE(parseChangeEvents("not json", &events, &error));
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(parseChangeEvents(R"([{"type":"update","data":{}}])", &events, &error));
    EXPECT_FALSE(parseChangeEvents(R"([{"type":"rename","data":[]}])", &events, &error));
    EXPECT_FALSE(parseChangeEvents("42", &events, &error));

    // The first envelope is valid, the second is not: nothing is emitted.
    EXPECT_FALSE(parseChangeEvents(R"([{"type":"update","data":[{"id":"L1","type":"light"}]},
                                      {"type":"update","data":[{"type":"light"}]}])",
                                   &events, &error));
    EXPECT_TRUE(events.isEmpty());
}
