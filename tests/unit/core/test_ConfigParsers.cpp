#include <toml++/toml.h>
#include <QtTest>
#include "core/ConfigParsers.hpp"

using namespace lrc;

class TestConfigParsers : public QObject {
    Q_OBJECT

private slots:
    void testParseAudio() {
        auto tbl = toml::parse(R"(
            [audio]
            sample_rate = 48000
            channels = 1
            buffer_size = 1024
            volume = 0.5
        )");

        AudioConfig cfg;
        ConfigParsers::parseAudio(tbl, cfg);

        QCOMPARE(cfg.sampleRate, 48000u);
        QCOMPARE(cfg.channels, 1u);
        QCOMPARE(cfg.bufferSize, 1024u);
        QCOMPARE(cfg.volume, 0.5f);
    }

    void testParseAudioClamps() {
        auto tbl = toml::parse(R"(
            [audio]
            channels = 8
            buffer_size = 16
            volume = 3.0
        )");

        AudioConfig cfg;
        ConfigParsers::parseAudio(tbl, cfg);

        QCOMPARE(cfg.channels, 2u);
        QCOMPARE(cfg.bufferSize, 256u);
        QCOMPARE(cfg.volume, 1.0f);
    }

    void testParseSync() {
        auto tbl = toml::parse(R"(
            [sync]
            tick_interval_ms = 5
            stop_on_complete = false
        )");

        SyncConfig cfg;
        ConfigParsers::parseSync(tbl, cfg);

        QCOMPARE(cfg.tickIntervalMs, 10u);
        QCOMPARE(cfg.stopOnComplete, false);
        QCOMPARE(cfg.confirmEmptySave, true);
    }

    void testParseExport() {
        auto tbl = toml::parse(R"(
            [export]
            extension = "txt"
            fallback_name = ""
            write_header = true
            artist = "Someone"
        )");

        ExportConfig cfg;
        ConfigParsers::parseExport(tbl, cfg);

        QCOMPARE(cfg.extension, std::string(".txt"));
        QCOMPARE(cfg.fallbackName, std::string("output"));
        QCOMPARE(cfg.writeHeader, true);
        QCOMPARE(cfg.artist, std::string("Someone"));
    }

    void testParseKeyboard() {
        auto tbl = toml::parse(R"(
            [keyboard]
            next_line = "Down"
        )");

        KeyboardConfig cfg;
        ConfigParsers::parseKeyboard(tbl, cfg);

        QCOMPARE(cfg.nextLine, std::string("Down"));
        QCOMPARE(cfg.backLine, std::string("Backspace"));
        QCOMPARE(cfg.playPause, std::string("Space"));
        QCOMPARE(cfg.save, std::string("Ctrl+S"));
    }

    void testParseCueColors() {
        auto tbl = toml::parse(R"(
            [cue]
            active_color = "#FF0000"
            font_size = 1000
        )");

        CueConfig cfg;
        ConfigParsers::parseCue(tbl, cfg);

        QVERIFY(cfg.activeColor == Color::fromHex("#FF0000"));
        QCOMPARE(cfg.fontSize, 200u);
    }

    void testMissingSectionsKeepDefaults() {
        auto tbl = toml::parse("");

        SyncConfig sync;
        ExportConfig exp;
        ConfigParsers::parseSync(tbl, sync);
        ConfigParsers::parseExport(tbl, exp);

        QCOMPARE(sync.tickIntervalMs, 100u);
        QCOMPARE(exp.extension, std::string(".lrc"));
        QCOMPARE(exp.writeHeader, false);
    }

    void testSerialize() {
        AudioConfig audio;
        audio.sampleRate = 22050;
        SyncConfig sync;
        ExportConfig exporting;
        exporting.fallbackName = "untitled";
        UIConfig ui;
        CueConfig cue;
        KeyboardConfig keyboard;

        auto tbl = ConfigParsers::serialize(
                audio, sync, exporting, ui, cue, keyboard, false);

        auto audioTbl = tbl["audio"].as_table();
        QVERIFY(audioTbl != nullptr);
        auto rate = (*audioTbl)["sample_rate"].value<i64>();
        QVERIFY(rate.has_value());
        QCOMPARE(*rate, i64(22050));

        auto exportTbl = tbl["export"].as_table();
        QVERIFY(exportTbl != nullptr);
        QCOMPARE((*exportTbl)["fallback_name"].as_string()->get(),
                 std::string("untitled"));

        // What we write we can read back
        ExportConfig parsed;
        ConfigParsers::parseExport(tbl, parsed);
        QCOMPARE(parsed.fallbackName, std::string("untitled"));
    }
};

int runTestConfigParsers(int argc, char** argv) {
    TestConfigParsers tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ConfigParsers.moc"
