#include <spdlog/sinks/ostream_sink.h>
#include <QtTest>
#include <sstream>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        lrc::Logger::shutdown();
    }

    void testInitialization() {
        lrc::Logger::init("test_app", true);
        QVERIFY(lrc::Logger::get() != nullptr);

        // Should not crash
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        lrc::Logger::shutdown();
    }

    void testDoubleInit() {
        lrc::Logger::init("test_app", true);
        // Second init replaces the registered logger
        lrc::Logger::init("test_app", true);
        QVERIFY(lrc::Logger::get() != nullptr);
        lrc::Logger::shutdown();
    }

    void testSetDebug() {
        lrc::Logger::init("test_app", false);
        QVERIFY(lrc::Logger::get()->level() == spdlog::level::info);
        lrc::Logger::setDebug(true);
        QVERIFY(lrc::Logger::get()->level() == spdlog::level::debug);
        lrc::Logger::shutdown();
    }

    void testLogFileFollowsAppName() {
        lrc::Logger::init("test_app", false);
        const auto& path = lrc::Logger::logFile();
        QVERIFY(path.empty() || path.filename() == "test_app.log");
        lrc::Logger::shutdown();
        QVERIFY(lrc::Logger::logFile().empty());
    }

    void testCommandOutcome() {
        lrc::Logger::init("test_app", true);
        std::ostringstream out;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%l %v");
        lrc::Logger::get()->sinks().push_back(sink);

        lrc::Logger::command("nextLine", lrc::Result<bool>::ok(false));
        lrc::Logger::command("save",
                             lrc::Result<void>::err(lrc::ErrorCode::IoError,
                                                    "disk full"));
        lrc::Logger::command("undo", "nothing to undo");

        auto text = out.str();
        QVERIFY(text.find("debug nextLine: ok") != std::string::npos);
        QVERIFY(text.find("warning save: IoError disk full") !=
                std::string::npos);
        QVERIFY(text.find("debug undo: nothing to undo") != std::string::npos);
        lrc::Logger::shutdown();
    }

    void testInfoLevelHidesSuccessfulCommands() {
        lrc::Logger::init("test_app", false);
        std::ostringstream out;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%l %v");
        lrc::Logger::get()->sinks().push_back(sink);

        lrc::Logger::command("backLine", lrc::Result<void>::ok());
        lrc::Logger::command("play",
                             lrc::Result<void>::err(lrc::ErrorCode::NotReady,
                                                    "Load audio first."));

        auto text = out.str();
        QVERIFY(text.find("backLine") == std::string::npos);
        QVERIFY(text.find("warning play: NotReady Load audio first.") !=
                std::string::npos);
        lrc::Logger::shutdown();
    }

    void testGetInitializesLazily() {
        lrc::Logger::shutdown();
        QVERIFY(lrc::Logger::get() != nullptr);
        lrc::Logger::shutdown();
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
