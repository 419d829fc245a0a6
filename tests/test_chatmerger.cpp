/**
 * @file test_chatmerger.cpp
 * @brief Unit tests for ChatArchive parsing and ChatMerger
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QJsonDocument>
#include "backup/chatmerger.h"
#include "fakes.h"

using namespace Backup;

class TestChatMerger : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Parsing Tests ==========
    void testParseArchive();
    void testParseRejectsNonObject();
    void testParseToleratesMissingSections();

    // ========== Overwrite Tests ==========
    void testOverwriteReplacesEverything();

    // ========== Merge Tests ==========
    void testMergeAppendsOnlyUnknownMessages();
    void testMergeInsertsNewConversation();
    void testMergeAnnotationsOnlyWhereMissing();
    void testMergeIsIdempotent();
    void testMergeSkipsIdsKnownElsewhere();
    void testMergeDuplicateConversationInArchive();

private:
    ChatArchive makeArchive() const;

    MemoryChatService *m_chats;
};

void TestChatMerger::init()
{
    m_chats = new MemoryChatService();
}

void TestChatMerger::cleanup()
{
    delete m_chats;
    m_chats = nullptr;
}

ChatArchive TestChatMerger::makeArchive() const
{
    ChatArchive archive;
    archive.conversations = {makeConversation("c1"), makeConversation("c2")};
    archive.messages = {
        makeMessage("m1", "c1"),
        makeMessage("m2", "c1", "assistant"),
        makeMessage("m3", "c1"),
        makeMessage("m4", "c2", "assistant"),
    };
    archive.toolEvents.insert("m2", QJsonArray{QJsonObject{{"tool", "search"}}});
    archive.thoughtSigs.insert("m4", "sig-archive");
    return archive;
}

// ========== Parsing Tests ==========

void TestChatMerger::testParseArchive()
{
    const QByteArray json = R"({
        "version": 1,
        "conversations": [{"id": "c1", "title": "Hello", "pinned": true}],
        "messages": [{"id": "m1", "conversationId": "c1", "role": "assistant", "content": "hi"}],
        "toolEvents": {"m1": [{"tool": "calc"}]},
        "geminiThoughtSigs": {"m1": "abc"}
    })";

    ChatArchive archive;
    QVERIFY(ChatArchive::parse(json, &archive));
    QCOMPARE(archive.conversations.size(), 1);
    QCOMPARE(archive.conversations.first().fields.value("pinned").toBool(), true);
    QCOMPARE(archive.messages.first().role, QString("assistant"));
    QCOMPARE(archive.toolEvents.value("m1").size(), 1);
    QCOMPARE(archive.thoughtSigs.value("m1"), QString("abc"));
}

void TestChatMerger::testParseRejectsNonObject()
{
    ChatArchive archive;
    QString error;
    QVERIFY(!ChatArchive::parse("[1,2,3]", &archive, &error));
    QVERIFY(!error.isEmpty());
}

void TestChatMerger::testParseToleratesMissingSections()
{
    ChatArchive archive;
    QVERIFY(ChatArchive::parse("{\"version\":1}", &archive));
    QVERIFY(archive.conversations.isEmpty());
    QVERIFY(archive.messages.isEmpty());
}

// ========== Overwrite Tests ==========

void TestChatMerger::testOverwriteReplacesEverything()
{
    m_chats->add(makeConversation("old"), {makeMessage("x1", "old")});
    m_chats->setToolEvents("x1", QJsonArray{1});

    RestoreStats stats;
    QStringList warnings;
    QVERIFY(ChatMerger(m_chats).overwrite(makeArchive(), &stats, &warnings));

    QCOMPARE(m_chats->order, QStringList({"c1", "c2"}));
    QCOMPARE(m_chats->messageIds("c1"), QStringList({"m1", "m2", "m3"}));
    QVERIFY(m_chats->toolEvents("x1").isEmpty());
    QCOMPARE(m_chats->toolEvents("m2").size(), 1);
    QCOMPARE(m_chats->geminiThoughtSignature("m4"), QString("sig-archive"));

    QCOMPARE(stats.conversationsRestored, 2);
    QCOMPARE(stats.messagesRestored, 4);
    QCOMPARE(m_chats->clearCount, 1);
    QCOMPARE(m_chats->commitCount, 1);
    QVERIFY(warnings.isEmpty());
}

// ========== Merge Tests ==========

void TestChatMerger::testMergeAppendsOnlyUnknownMessages()
{
    m_chats->add(makeConversation("c1"), {makeMessage("m1", "c1"), makeMessage("m2", "c1")});

    ChatArchive archive;
    archive.conversations = {makeConversation("c1")};
    archive.messages = {makeMessage("m2", "c1"), makeMessage("m3", "c1")};

    RestoreStats stats;
    QStringList warnings;
    QVERIFY(ChatMerger(m_chats).merge(archive, &stats, &warnings));

    QCOMPARE(m_chats->messageIds("c1"), QStringList({"m1", "m2", "m3"}));
    QCOMPARE(stats.conversationsRestored, 0);
    QCOMPARE(stats.messagesRestored, 1);
    QCOMPARE(m_chats->clearCount, 0);
}

void TestChatMerger::testMergeInsertsNewConversation()
{
    m_chats->add(makeConversation("c1"), {makeMessage("m1", "c1")});

    RestoreStats stats;
    QStringList warnings;
    QVERIFY(ChatMerger(m_chats).merge(makeArchive(), &stats, &warnings));

    QCOMPARE(m_chats->order, QStringList({"c1", "c2"}));
    QCOMPARE(m_chats->messageIds("c1"), QStringList({"m1", "m2", "m3"}));
    QCOMPARE(m_chats->messageIds("c2"), QStringList({"m4"}));
    QCOMPARE(stats.conversationsRestored, 1);
}

void TestChatMerger::testMergeAnnotationsOnlyWhereMissing()
{
    m_chats->add(makeConversation("c2"), {makeMessage("m4", "c2", "assistant")});
    m_chats->setGeminiThoughtSignature("m4", "sig-local");

    RestoreStats stats;
    QStringList warnings;
    QVERIFY(ChatMerger(m_chats).merge(makeArchive(), &stats, &warnings));

    QCOMPARE(m_chats->geminiThoughtSignature("m4"), QString("sig-local"));
    QCOMPARE(m_chats->toolEvents("m2").size(), 1);
}

void TestChatMerger::testMergeIsIdempotent()
{
    RestoreStats stats;
    QStringList warnings;
    ChatMerger merger(m_chats);

    QVERIFY(merger.merge(makeArchive(), &stats, &warnings));
    const int afterFirst = m_chats->totalMessages();
    const QStringList orderAfterFirst = m_chats->order;

    QVERIFY(merger.merge(makeArchive(), &stats, &warnings));
    QCOMPARE(m_chats->totalMessages(), afterFirst);
    QCOMPARE(m_chats->order, orderAfterFirst);
}

void TestChatMerger::testMergeSkipsIdsKnownElsewhere()
{
    // Message ids are global: m3 already lives in another conversation
    m_chats->add(makeConversation("c1"), {makeMessage("m1", "c1")});
    m_chats->add(makeConversation("other"), {makeMessage("m3", "other")});

    RestoreStats stats;
    QStringList warnings;
    QVERIFY(ChatMerger(m_chats).merge(makeArchive(), &stats, &warnings));

    QCOMPARE(m_chats->messageIds("c1"), QStringList({"m1", "m2"}));
    QCOMPARE(m_chats->messageIds("other"), QStringList({"m3"}));
}

void TestChatMerger::testMergeDuplicateConversationInArchive()
{
    ChatArchive archive;
    archive.conversations = {makeConversation("c1"), makeConversation("c1")};
    archive.messages = {makeMessage("m1", "c1"), makeMessage("m2", "c1")};

    RestoreStats stats;
    QStringList warnings;
    QVERIFY(ChatMerger(m_chats).merge(archive, &stats, &warnings));

    QCOMPARE(m_chats->order, QStringList({"c1"}));
    QCOMPARE(m_chats->messageIds("c1"), QStringList({"m1", "m2"}));
    QCOMPARE(stats.conversationsRestored, 1);
    QCOMPARE(stats.messagesRestored, 2);

    // Same again with c1 already stored locally
    QVERIFY(ChatMerger(m_chats).merge(archive, &stats, &warnings));
    QCOMPARE(m_chats->messageIds("c1"), QStringList({"m1", "m2"}));
    QVERIFY(warnings.isEmpty());
}

QTEST_MAIN(TestChatMerger)
#include "test_chatmerger.moc"
