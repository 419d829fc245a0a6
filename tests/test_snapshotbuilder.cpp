/**
 * @file test_snapshotbuilder.cpp
 * @brief Unit tests for SnapshotBuilder
 *
 * Tests the settings and chats blobs, file tree entries and the archive
 * entry list for each export toggle.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "backup/snapshotbuilder.h"
#include "backup/preferencesstore.h"
#include "fakes.h"

using namespace Backup;

namespace {

QStringList entryPaths(const QList<ArchiveEntry> &entries)
{
    QStringList paths;
    for (const ArchiveEntry &e : entries) paths << e.path;
    return paths;
}

} // namespace

class TestSnapshotBuilder : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Settings Tests ==========
    void testSettingsBlobDropsLocalOnlyKeys();

    // ========== Chats Tests ==========
    void testChatsBlobLayout();
    void testAnnotationsOnlyForAssistantMessages();

    // ========== File Tree Tests ==========
    void testFileTreeEntries();

    // ========== Archive Entry Tests ==========
    void testEntriesFollowToggles();
    void testBackupFileName();

private:
    QTemporaryDir *m_tempDir;
    PreferencesStore *m_prefs;
    MemoryChatService *m_chats;
    DataDirectories m_dirs;
};

void TestSnapshotBuilder::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_prefs = new PreferencesStore(m_tempDir->filePath("preferences.json"));
    m_chats = new MemoryChatService();
    m_dirs = DataDirectories::fromRoot(m_tempDir->filePath("data"));
}

void TestSnapshotBuilder::cleanup()
{
    delete m_prefs;
    delete m_chats;
    delete m_tempDir;
    m_prefs = nullptr;
    m_chats = nullptr;
    m_tempDir = nullptr;
}

// ========== Settings Tests ==========

void TestSnapshotBuilder::testSettingsBlobDropsLocalOnlyKeys()
{
    QVERIFY(m_prefs->setValue("theme_mode_v1", "dark"));
    QVERIFY(m_prefs->setValue("font_scale_v1", 1.25));
    QVERIFY(m_prefs->setValue("window_width_v1", 1280));
    QVERIFY(m_prefs->setValue("window_maximized_v1", true));

    SnapshotBuilder builder(m_prefs, m_chats, m_dirs);
    const QJsonObject obj = QJsonDocument::fromJson(builder.buildSettingsBlob()).object();

    QCOMPARE(obj.size(), 2);
    QCOMPARE(obj.value("theme_mode_v1").toString(), QString("dark"));
    QCOMPARE(obj.value("font_scale_v1").toDouble(), 1.25);
    QVERIFY(!obj.contains("window_width_v1"));
}

// ========== Chats Tests ==========

void TestSnapshotBuilder::testChatsBlobLayout()
{
    m_chats->add(makeConversation("c1"), {makeMessage("m1", "c1"), makeMessage("m2", "c1", "assistant")});
    m_chats->add(makeConversation("c2"), {});
    m_chats->setToolEvents("m2", QJsonArray{QJsonObject{{"tool", "search"}}});
    m_chats->setGeminiThoughtSignature("m2", "sig");

    SnapshotBuilder builder(m_prefs, m_chats, m_dirs);
    const QJsonObject root = QJsonDocument::fromJson(builder.buildChatsBlob()).object();

    QCOMPARE(root.value("version").toInt(), 1);
    QCOMPARE(root.value("conversations").toArray().size(), 2);
    QCOMPARE(root.value("messages").toArray().size(), 2);
    QCOMPARE(root.value("toolEvents").toObject().value("m2").toArray().size(), 1);
    QCOMPARE(root.value("geminiThoughtSigs").toObject().value("m2").toString(), QString("sig"));

    const QJsonObject first = root.value("messages").toArray().at(0).toObject();
    QCOMPARE(first.value("conversationId").toString(), QString("c1"));
    QCOMPARE(first.value("content").toString(), QString("m1"));
}

void TestSnapshotBuilder::testAnnotationsOnlyForAssistantMessages()
{
    m_chats->add(makeConversation("c1"), {makeMessage("u1", "c1", "user"), makeMessage("a1", "c1", "assistant")});
    m_chats->setToolEvents("u1", QJsonArray{1});
    m_chats->setGeminiThoughtSignature("u1", "user-sig");
    m_chats->setToolEvents("a1", QJsonArray());

    SnapshotBuilder builder(m_prefs, m_chats, m_dirs);
    const QJsonObject root = QJsonDocument::fromJson(builder.buildChatsBlob()).object();

    QVERIFY(root.value("toolEvents").toObject().isEmpty());
    QVERIFY(root.value("geminiThoughtSigs").toObject().isEmpty());
}

// ========== File Tree Tests ==========

void TestSnapshotBuilder::testFileTreeEntries()
{
    QVERIFY(FileTree::writeFileStaged(m_dirs.uploadDir + "/doc.pdf", "pdf"));
    QVERIFY(FileTree::writeFileStaged(m_dirs.imagesDir + "/2024/pic.png", "png"));
    // avatars/ does not exist

    SnapshotBuilder builder(m_prefs, m_chats, m_dirs);
    const QList<ArchiveEntry> entries = builder.buildFileTrees();

    QCOMPARE(entryPaths(entries), QStringList({"upload/doc.pdf", "images/2024/pic.png"}));
    QCOMPARE(entries.first().sourcePath, QDir(m_dirs.uploadDir).filePath("doc.pdf"));
}

// ========== Archive Entry Tests ==========

void TestSnapshotBuilder::testEntriesFollowToggles()
{
    QVERIFY(FileTree::writeFileStaged(m_dirs.avatarsDir + "/me.png", "me"));
    SnapshotBuilder builder(m_prefs, m_chats, m_dirs);

    WebDavConfig cfg;
    QCOMPARE(entryPaths(builder.buildArchiveEntries(cfg)),
             QStringList({"settings.json", "chats.json", "avatars/me.png"}));

    cfg.includeChats = false;
    QCOMPARE(entryPaths(builder.buildArchiveEntries(cfg)),
             QStringList({"settings.json", "avatars/me.png"}));

    cfg.includeFiles = false;
    QCOMPARE(entryPaths(builder.buildArchiveEntries(cfg)), QStringList({"settings.json"}));
}

void TestSnapshotBuilder::testBackupFileName()
{
    const QDateTime when(QDate(2024, 6, 7), QTime(8, 9, 10, 11));
    QCOMPARE(SnapshotBuilder::backupFileName(when),
             QString("kelivo_backup_2024-06-07T08-09-10.011.zip"));
}

QTEST_MAIN(TestSnapshotBuilder)
#include "test_snapshotbuilder.moc"
