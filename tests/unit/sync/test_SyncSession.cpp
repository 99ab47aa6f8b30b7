#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include "sync/SyncSession.hpp"

using namespace lrc;
using namespace lrc::sync;

namespace {
using Tags = std::vector<std::string>;

SyncSession readySession(const std::vector<std::string>& lines) {
    SyncSession session;
    session.setAudio("song.mp3");
    if (!session.loadLyrics(lines))
        qFatal("fixture lyrics rejected");
    return session;
}
} // namespace

class TestSyncSession : public QObject {
    Q_OBJECT

private slots:
    void testCleanLines() {
        auto lines = SyncSession::cleanLines("  Hello \r\n\n\tWorld\r\n   \n");
        QCOMPARE(lines, (Tags{"Hello", "World"}));
    }

    void testCleanLinesUnicodeBlanks() {
        // U+3000 ideographic space and U+00A0 no-break space
        auto lines = SyncSession::cleanLines(
                "Hello\n\xE3\x80\x80\n\xC2\xA0\n\xE3\x80\x80World\xC2\xA0\n");
        QCOMPARE(lines, (Tags{"Hello", "World"}));
    }

    void testLoadUnicodeBlankOnlyFails() {
        SyncSession session;
        auto loaded = session.loadLyricsText("\xE3\x80\x80\n\xC2\xA0 \n");
        QVERIFY(loaded.isErr());
        QVERIFY(loaded.error().code == ErrorCode::EmptyFile);
        QVERIFY(!session.hasLyrics());
    }

    void testLoadDropsBlankLines() {
        SyncSession session;
        auto loaded = session.loadLyrics({"Hello", "", "World", "  "});
        QVERIFY(loaded.isOk());
        QCOMPARE(session.lines(), (Tags{"Hello", "World"}));
        QCOMPARE(session.cursor(), std::size_t(0));
        QVERIFY(session.state() == SessionState::Ready);
    }

    void testLoadEmptyFails() {
        auto session = readySession({"keep"});
        session.advance(100);

        auto loaded = session.loadLyrics({"", "   ", "\t"});
        QVERIFY(loaded.isErr());
        QVERIFY(loaded.error().code == ErrorCode::EmptyFile);

        // Previous lyrics survive a rejected load
        QCOMPARE(session.lines(), (Tags{"keep"}));
        QCOMPARE(session.timestamps().size(), std::size_t(1));
    }

    void testLoadResetsProgress() {
        auto session = readySession({"a", "b", "c"});
        session.advance(100);
        session.advance(200);

        QVERIFY(session.loadLyrics({"x", "y"}).isOk());
        QCOMPARE(session.cursor(), std::size_t(0));
        QVERIFY(session.timestamps().empty());
        QCOMPARE(session.exportRecords().size(), std::size_t(2));
    }

    void testSetAudioKeepsSyncState() {
        auto session = readySession({"a", "b"});
        session.advance(1000);
        session.setAudio("other.wav");
        QCOMPARE(session.cursor(), std::size_t(1));
        QCOMPARE(session.timestampTags(), (Tags{"[00:01.00]"}));
    }

    void testScenario() {
        SyncSession session;
        session.setAudio("song.mp3");
        QVERIFY(session.loadLyrics({"Hello", "", "World", "  "}).isOk());

        auto first = session.advance(1500);
        QVERIFY(first.isOk());
        QCOMPARE(first.value(), false);
        QCOMPARE(session.timestampTags(), (Tags{"[00:01.50]"}));
        QCOMPARE(session.cursor(), std::size_t(1));

        // Partial export fills the untapped line with the last timestamp
        auto partial = session.exportRecords();
        QCOMPARE(partial.size(), std::size_t(2));
        QCOMPARE(partial[1].time.toString(), std::string("[00:01.50]"));
        QCOMPARE(partial[1].text, std::string("World"));

        auto second = session.advance(4000);
        QVERIFY(second.isOk());
        QCOMPARE(second.value(), true);
        QCOMPARE(session.timestampTags(), (Tags{"[00:01.50]", "[00:04.00]"}));
        QCOMPARE(session.cursor(), std::size_t(2));
        QVERIFY(session.state() == SessionState::Complete);

        auto records = session.exportRecords();
        QCOMPARE(records[0].time.toString() + " " + records[0].text,
                 std::string("[00:01.50] Hello"));
        QCOMPARE(records[1].time.toString() + " " + records[1].text,
                 std::string("[00:04.00] World"));

        QVERIFY(session.rewind().isOk());
        QCOMPARE(session.cursor(), std::size_t(1));
        QCOMPARE(session.timestamps().size(), std::size_t(2));

        QVERIFY(session.advance(5000).isOk());
        QCOMPARE(session.timestampTags(), (Tags{"[00:01.50]", "[00:05.00]"}));
        QCOMPARE(session.cursor(), std::size_t(2));

        QVERIFY(session.undoLastTimestamp());
        QCOMPARE(session.timestampTags(), (Tags{"[00:01.50]"}));
        QCOMPARE(session.cursor(), std::size_t(1));
    }

    void testRewindThenAdvanceOverwrites() {
        auto session = readySession({"a", "b", "c"});
        session.advance(100);
        session.advance(200);
        auto before = session.timestamps().size();

        QVERIFY(session.rewind().isOk());
        QVERIFY(session.advance(250).isOk());

        QCOMPARE(session.timestamps().size(), before);
        QCOMPARE(session.timestamps()[1].millis(), i64(250));
        QCOMPARE(session.cursor(), std::size_t(2));
    }

    void testRewindPastRecordedKeepsLaterEntries() {
        auto session = readySession({"a", "b", "c"});
        session.advance(100);
        session.advance(200);
        session.advance(300);

        session.rewind();
        session.rewind();
        QCOMPARE(session.cursor(), std::size_t(1));
        QVERIFY(session.state() == SessionState::Ready);

        session.advance(222);
        QCOMPARE(session.timestampTags(),
                 (Tags{"[00:00.10]", "[00:00.22]", "[00:00.30]"}));
        QCOMPARE(session.cursor(), std::size_t(2));
    }

    void testRewindAtStartIsNoop() {
        auto session = readySession({"a"});
        QVERIFY(session.rewind().isOk());
        QCOMPARE(session.cursor(), std::size_t(0));
    }

    void testAdvanceWhenComplete() {
        auto session = readySession({"only"});
        QVERIFY(session.advance(10).isOk());

        auto again = session.advance(20);
        QVERIFY(again.isErr());
        QVERIFY(again.error().code == ErrorCode::AlreadyComplete);
        QCOMPARE(session.timestampTags(), (Tags{"[00:00.01]"}));
    }

    void testNotReadyLeavesStateUnchanged() {
        SyncSession noLyrics;
        noLyrics.setAudio("song.mp3");
        auto adv = noLyrics.advance(1000);
        QVERIFY(adv.isErr());
        QVERIFY(adv.error().code == ErrorCode::NotReady);
        QCOMPARE(noLyrics.cursor(), std::size_t(0));
        QVERIFY(noLyrics.timestamps().empty());
        QVERIFY(noLyrics.state() == SessionState::Empty);

        SyncSession noAudio;
        QVERIFY(noAudio.loadLyrics({"a", "b"}).isOk());
        QVERIFY(noAudio.advance(1000).error().code == ErrorCode::NotReady);
        QVERIFY(noAudio.rewind().error().code == ErrorCode::NotReady);
        QCOMPARE(noAudio.cursor(), std::size_t(0));
        QVERIFY(noAudio.timestamps().empty());
    }

    void testUndoOnEmptyIsNoop() {
        auto session = readySession({"a", "b"});
        QVERIFY(!session.undoLastTimestamp());
        QVERIFY(!session.undoLastTimestamp());
        QCOMPARE(session.cursor(), std::size_t(0));
        QVERIFY(session.timestamps().empty());
    }

    void testRepeatedUndoStopsAtZero() {
        auto session = readySession({"a", "b", "c"});
        session.advance(1);
        session.advance(2);
        for (int i = 0; i < 5; ++i)
            session.undoLastTimestamp();
        QCOMPARE(session.cursor(), std::size_t(0));
        QVERIFY(session.timestamps().empty());
    }

    void testUndoAfterRewindKeepsLowerCursor() {
        auto session = readySession({"a", "b", "c"});
        session.advance(100);
        session.advance(200);
        session.advance(300);
        session.rewind();
        session.rewind();

        QVERIFY(session.undoLastTimestamp());
        QCOMPARE(session.timestamps().size(), std::size_t(2));
        QCOMPARE(session.cursor(), std::size_t(1));
    }

    void testExportWithoutTimestamps() {
        auto session = readySession({"a", "b", "c"});
        auto records = session.exportRecords();
        QCOMPARE(records.size(), std::size_t(3));
        for (const auto& rec : records)
            QCOMPARE(rec.time.toString(), std::string("[00:00.00]"));
    }

    void testNegativePositionClamps() {
        auto session = readySession({"a"});
        session.advance(-40);
        QCOMPARE(session.timestampTags(), (Tags{"[00:00.00]"}));
    }

    void testDisplayQueries() {
        auto session = readySession({"one", "two", "three"});
        QCOMPARE(session.currentLine(), std::string("one"));
        QCOMPARE(session.nextLine(), std::string("two"));

        session.advance(1000);
        session.advance(2000);
        QCOMPARE(session.currentLine(), std::string("three"));
        QCOMPARE(session.nextLine(), std::string());

        session.advance(3000);
        QCOMPARE(session.currentLine(), std::string());
        QCOMPARE(session.syncedCount(), std::size_t(3));

        session.undoLastTimestamp();
        auto preview = session.previewEntries();
        QCOMPARE(preview.size(), std::size_t(3));
        QCOMPARE(preview[0].tag, std::string("[00:01.00]"));
        QCOMPARE(preview[2].tag, std::string("[-]"));
        QCOMPARE(preview[2].text, std::string("three"));
    }

    void testLoadLyricsFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        fs::path path = fs::path(dir.path().toStdString()) / "lyrics.txt";
        {
            std::ofstream out(path, std::ios::binary);
            out << "\xEF\xBB\xBF" << "Intro line\r\n\r\n  Second  \r\n";
        }

        SyncSession session;
        auto loaded = session.loadLyricsFile(path);
        QVERIFY(loaded.isOk());
        QCOMPARE(session.lines(), (Tags{"Intro line", "Second"}));
        QVERIFY(session.lyricsPath() == path);
    }

    void testLoadLyricsFileErrors() {
        QTemporaryDir dir;
        fs::path base(dir.path().toStdString());

        SyncSession session;
        auto missing = session.loadLyricsFile(base / "missing.txt");
        QVERIFY(missing.isErr());
        QVERIFY(missing.error().code == ErrorCode::NotFound);

        {
            std::ofstream out(base / "blank.txt");
            out << "\n   \n\t\n";
        }
        auto blank = session.loadLyricsFile(base / "blank.txt");
        QVERIFY(blank.isErr());
        QVERIFY(blank.error().code == ErrorCode::EmptyFile);
        QVERIFY(session.lyricsPath().empty());
    }
};

int runTestSyncSession(int argc, char** argv) {
    TestSyncSession tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_SyncSession.moc"
