#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include "util/FileUtils.hpp"

using namespace lrc;
namespace fs = std::filesystem;

class TestFileUtils : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        QVERIFY(dir_.isValid());
        base_ = dir_.path().toStdString();
        for (const char* name : {"song.mp3", "SONG2.WAV", "clip.ogg", "noext"}) {
            std::ofstream out(base_ / name);
            out << "dummy content";
        }
    }

    void testExtension() {
        QCOMPARE(file::extension("a/b/Track.MP3"), std::string(".mp3"));
        QCOMPARE(file::extension("noext"), std::string());
    }

    void testAcceptsSupportedAudio() {
        QVERIFY(file::validateAudioPath(base_ / "song.mp3").isOk());
        QVERIFY(file::validateAudioPath(base_ / "SONG2.WAV").isOk());
    }

    void testRejectsUnsupportedAudio() {
        auto ogg = file::validateAudioPath(base_ / "clip.ogg");
        QVERIFY(ogg.isErr());
        QVERIFY(ogg.error().code == ErrorCode::UnsupportedFormat);

        auto none = file::validateAudioPath(base_ / "noext");
        QVERIFY(none.error().code == ErrorCode::UnsupportedFormat);
    }

    void testMissingFileIsNotFound() {
        // Existence is checked first, even for a bad extension
        auto missingMp3 = file::validateAudioPath(base_ / "absent.mp3");
        QVERIFY(missingMp3.error().code == ErrorCode::NotFound);
        auto missingOgg = file::validateAudioPath(base_ / "absent.ogg");
        QVERIFY(missingOgg.error().code == ErrorCode::NotFound);
        // A directory is not an audio file
        QVERIFY(file::validateAudioPath(base_).error().code ==
                ErrorCode::NotFound);
    }

    void testWriteAndReadText() {
        auto path = base_ / "text.txt";
        QVERIFY(file::writeTextAtomic(path, "\xEF\xBB\xBFline\n").isOk());
        auto text = file::readText(path);
        QVERIFY(text.isOk());
        QCOMPARE(text.value(), std::string("line\n"));
    }

    void testReadMissing() {
        auto text = file::readText(base_ / "nope.txt");
        QVERIFY(text.isErr());
        QVERIFY(text.error().code == ErrorCode::NotFound);
    }

private:
    QTemporaryDir dir_;
    fs::path base_;
};

int runTestFileUtils(int argc, char** argv) {
    TestFileUtils tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_FileUtils.moc"
