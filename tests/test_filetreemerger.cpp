/**
 * @file test_filetreemerger.cpp
 * @brief Unit tests for FileTreeMerger and the FileTree helpers
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "backup/filetreemerger.h"
#include "backup/datadirectories.h"

using namespace Backup;

namespace {

QByteArray readAll(const QString &path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

} // namespace

class TestFileTreeMerger : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== FileTree Tests ==========
    void testRelativeFilesSorted();
    void testRelativeFilesMissingRoot();
    void testCopyFileStagedCreatesParents();
    void testCopyFileStagedMissingSource();

    // ========== Merge Tests ==========
    void testMergeKeepsExistingFiles();
    void testMergeCreatesDestination();
    void testCopyFailureSkipsFile();

    // ========== Overwrite Tests ==========
    void testOverwriteReplacesTree();
    void testMissingSourceIsNoop();

private:
    QString src() const { return m_tempDir->filePath("src"); }
    QString dst() const { return m_tempDir->filePath("dst"); }

    QTemporaryDir *m_tempDir;
};

void TestFileTreeMerger::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestFileTreeMerger::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ========== FileTree Tests ==========

void TestFileTreeMerger::testRelativeFilesSorted()
{
    QVERIFY(FileTree::writeFileStaged(src() + "/b.txt", "b"));
    QVERIFY(FileTree::writeFileStaged(src() + "/a/z.txt", "z"));
    QVERIFY(FileTree::writeFileStaged(src() + "/.hidden", "h"));

    QCOMPARE(FileTree::relativeFiles(src()), QStringList({".hidden", "a/z.txt", "b.txt"}));
    QCOMPARE(FileTree::relativeDirectories(src()), QStringList({"a"}));
}

void TestFileTreeMerger::testRelativeFilesMissingRoot()
{
    QVERIFY(FileTree::relativeFiles(m_tempDir->filePath("none")).isEmpty());
}

void TestFileTreeMerger::testCopyFileStagedCreatesParents()
{
    QVERIFY(FileTree::writeFileStaged(src() + "/f.bin", "payload"));
    QVERIFY(FileTree::copyFileStaged(src() + "/f.bin", dst() + "/x/y/f.bin"));
    QCOMPARE(readAll(dst() + "/x/y/f.bin"), QByteArray("payload"));
}

void TestFileTreeMerger::testCopyFileStagedMissingSource()
{
    QString error;
    QVERIFY(!FileTree::copyFileStaged(src() + "/none", dst() + "/none", &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!QFile::exists(dst() + "/none"));
}

// ========== Merge Tests ==========

void TestFileTreeMerger::testMergeKeepsExistingFiles()
{
    QVERIFY(FileTree::writeFileStaged(src() + "/x.png", "archived-x"));
    QVERIFY(FileTree::writeFileStaged(src() + "/sub/z.png", "archived-z"));
    QVERIFY(FileTree::writeFileStaged(dst() + "/x.png", "local-x"));
    QVERIFY(FileTree::writeFileStaged(dst() + "/y.png", "local-y"));

    RestoreStats stats;
    QStringList warnings;
    FileTreeMerger::merge(src(), dst(), &stats, &warnings);

    QCOMPARE(readAll(dst() + "/x.png"), QByteArray("local-x"));
    QCOMPARE(readAll(dst() + "/y.png"), QByteArray("local-y"));
    QCOMPARE(readAll(dst() + "/sub/z.png"), QByteArray("archived-z"));
    QCOMPARE(stats.filesCopied, 1);
    QCOMPARE(stats.filesSkipped, 1);
    QVERIFY(warnings.isEmpty());
}

void TestFileTreeMerger::testMergeCreatesDestination()
{
    QVERIFY(QDir().mkpath(src() + "/empty"));

    RestoreStats stats;
    QStringList warnings;
    FileTreeMerger::merge(src(), dst(), &stats, &warnings);

    QVERIFY(QFileInfo(dst() + "/empty").isDir());
}

void TestFileTreeMerger::testCopyFailureSkipsFile()
{
    QVERIFY(FileTree::writeFileStaged(src() + "/a.png", "archived-a"));
    QVERIFY(FileTree::writeFileStaged(src() + "/sub/b.png", "archived-b"));
    QVERIFY(FileTree::writeFileStaged(src() + "/z.png", "archived-z"));
    // A plain file where the sub-directory has to go
    QVERIFY(FileTree::writeFileStaged(dst() + "/sub", "blocker"));

    RestoreStats stats;
    QStringList warnings;
    FileTreeMerger::merge(src(), dst(), &stats, &warnings);

    QCOMPARE(stats.filesFailed, 1);
    QCOMPARE(stats.filesCopied, 2);
    QVERIFY(!warnings.isEmpty());
    QVERIFY(warnings.last().contains("sub"));
    QCOMPARE(readAll(dst() + "/a.png"), QByteArray("archived-a"));
    QCOMPARE(readAll(dst() + "/z.png"), QByteArray("archived-z"));
    QCOMPARE(readAll(dst() + "/sub"), QByteArray("blocker"));
}

// ========== Overwrite Tests ==========

void TestFileTreeMerger::testOverwriteReplacesTree()
{
    QVERIFY(FileTree::writeFileStaged(src() + "/x.png", "archived-x"));
    QVERIFY(FileTree::writeFileStaged(dst() + "/x.png", "local-x"));
    QVERIFY(FileTree::writeFileStaged(dst() + "/y.png", "local-y"));

    RestoreStats stats;
    QStringList warnings;
    FileTreeMerger::overwrite(src(), dst(), &stats, &warnings);

    QCOMPARE(FileTree::relativeFiles(dst()), QStringList({"x.png"}));
    QCOMPARE(readAll(dst() + "/x.png"), QByteArray("archived-x"));
    QCOMPARE(stats.filesCopied, 1);
}

void TestFileTreeMerger::testMissingSourceIsNoop()
{
    QVERIFY(FileTree::writeFileStaged(dst() + "/keep.txt", "keep"));

    RestoreStats stats;
    QStringList warnings;
    FileTreeMerger::overwrite(src(), dst(), &stats, &warnings);
    FileTreeMerger::merge(src(), dst(), &stats, &warnings);

    QCOMPARE(readAll(dst() + "/keep.txt"), QByteArray("keep"));
    QCOMPARE(stats.filesCopied, 0);
}

QTEST_MAIN(TestFileTreeMerger)
#include "test_filetreemerger.moc"
