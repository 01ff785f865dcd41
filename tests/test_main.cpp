#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestPythonLexer(int argc, char** argv);
extern int runTestAllowList(int argc, char** argv);
extern int runTestPolicyGate(int argc, char** argv);
extern int runTestScriptComposer(int argc, char** argv);
extern int runTestSessionStore(int argc, char** argv);
extern int runTestHttpWire(int argc, char** argv);
extern int runTestDockerEngineClient(int argc, char** argv);
extern int runTestSandboxExecutor(int argc, char** argv);
extern int runTestSandboxInterpreter(int argc, char** argv);
extern int runTestEndToEnd(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Enclave::Logger::instance().initialize("enclave-tests.log", Enclave::Logger::Level::Trace);
    Enclave::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"PythonLexer", runTestPythonLexer},
        {"AllowList", runTestAllowList},
        {"PolicyGate", runTestPolicyGate},
        {"ScriptComposer", runTestScriptComposer},
        {"SessionStore", runTestSessionStore},
        {"HttpWire", runTestHttpWire},
        {"DockerEngineClient", runTestDockerEngineClient},
        {"SandboxExecutor", runTestSandboxExecutor},
        {"SandboxInterpreter", runTestSandboxInterpreter},
        {"EndToEnd", runTestEndToEnd}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Enclave::Test::TestUtils::cleanupTestEnvironment();

    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
