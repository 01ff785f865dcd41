#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QTemporaryDir>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/engine/ContainerEngine.hpp"

namespace Enclave {
namespace Test {

/**
 * @brief Test utilities shared by the Enclave suites
 *
 * Owns the process-wide temporary directory, writes fixture files and
 * answers whether a real Docker daemon with the sandbox image can be used.
 */
class TestUtils : public QObject {
    Q_OBJECT

public:
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "enclave_test");
    static void cleanupTempDirectory(const QString& path);

    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");

    // Docker daemon reachable and the sandbox image present
    static bool isDockerAvailable(QString* reason = nullptr);

    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void assertFileExists(const QString& filePath, const QString& context = QString());
    static void assertFileNotExists(const QString& filePath, const QString& context = QString());

private:
    static QTemporaryDir* tempDir_;
};

/**
 * @brief RAII helper for test scope management
 */
class TestScope {
public:
    explicit TestScope(const QString& testName);
    ~TestScope();

    QString getTempDirectory() const;

private:
    QString testName_;
    QString tempDirectory_;
};

// Readable text for the error types carried by Expected in this project
template<typename E, typename std::enable_if<std::is_enum<E>::value, int>::type = 0>
QString describeError(E error) {
    return QString("error code %1").arg(static_cast<int>(error));
}

inline QString describeError(const EngineFault& fault) {
    return fault.describe();
}

inline QString describeError(const QString& error) {
    return error;
}

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        message += ": " + describeError(result.error());
        QFAIL(qPrintable(message));
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context) {
    if (result.hasValue()) {
        QString message = QString("Expected error but got value");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }

    if (result.error() != expectedError) {
        QString message = QString("Expected error %1 but got error %2")
                         .arg(static_cast<int>(expectedError))
                         .arg(static_cast<int>(result.error()));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

// Convenience macros for testing
#define ASSERT_EXPECTED_VALUE(result) TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_EXISTS(path) TestUtils::assertFileExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_NOT_EXISTS(path) TestUtils::assertFileNotExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))

#define TEST_SCOPE(name) TestScope _testScope(name)

} // namespace Test
} // namespace Enclave
