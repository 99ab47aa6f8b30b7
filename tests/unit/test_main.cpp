/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 */
#include <QCoreApplication>
#include <QtTest>

int runTestLogger(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestFileUtils(int argc, char** argv);
int runTestTimestamp(int argc, char** argv);
int runTestSyncSession(int argc, char** argv);
int runTestLrcWriter(int argc, char** argv);
int runTestPlaybackClock(int argc, char** argv);
int runTestSyncController(int argc, char** argv);

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    int status = 0;
    status |= runTestLogger(argc, argv);
    status |= runTestConfigParsers(argc, argv);
    status |= runTestFileUtils(argc, argv);
    status |= runTestTimestamp(argc, argv);
    status |= runTestSyncSession(argc, argv);
    status |= runTestLrcWriter(argc, argv);
    status |= runTestPlaybackClock(argc, argv);
    status |= runTestSyncController(argc, argv);

    return status;
}
