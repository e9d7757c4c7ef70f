/**
 * @file test_sendoptions.cpp
 * @brief Unit tests for SendOptions.
 */

#include <QtTest/QtTest>
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>
#include <QThread>

#include "models/sendoptions.h"

class TestSendOptions : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tempDir_;

    QString settingsPath(const QString &name) const
    {
        return tempDir_.path() + '/' + name + ".ini";
    }

private slots:
    void testDefaults()
    {
        const SendOptions options;

        QCOMPARE(options.workerCount, qMax(1, QThread::idealThreadCount()));
        QCOMPARE(options.program, QString("rsync"));
        QCOMPARE(options.extraArguments, QStringList{"--mkpath"});
        QVERIFY(options.cancelOnFailure);
    }

    void testEmptySettingsKeepDefaults()
    {
        QSettings settings(settingsPath("empty"), QSettings::IniFormat);

        const SendOptions options = SendOptions::fromSettings(settings);

        QCOMPARE(options.workerCount, SendOptions::defaultWorkerCount());
        QCOMPARE(options.program, QString("rsync"));
        QVERIFY(options.cancelOnFailure);
    }

    void testSaveAndLoad()
    {
        SendOptions saved;
        saved.workerCount = 6;
        saved.program = "/opt/rsync/bin/rsync";
        saved.extraArguments = {"--mkpath", "--bwlimit=1000"};
        saved.cancelOnFailure = false;

        {
            QSettings settings(settingsPath("saved"), QSettings::IniFormat);
            saved.save(settings);
        }

        QSettings settings(settingsPath("saved"), QSettings::IniFormat);
        const SendOptions loaded = SendOptions::fromSettings(settings);

        QCOMPARE(loaded.workerCount, 6);
        QCOMPARE(loaded.program, QString("/opt/rsync/bin/rsync"));
        QCOMPARE(loaded.extraArguments, (QStringList{"--mkpath", "--bwlimit=1000"}));
        QVERIFY(!loaded.cancelOnFailure);
    }

    void testInvalidWorkerCountIgnored()
    {
        QSettings settings(settingsPath("invalid"), QSettings::IniFormat);
        settings.setValue("send/workers", 0);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Ignoring invalid send/workers setting"));
        const SendOptions options = SendOptions::fromSettings(settings);

        QCOMPARE(options.workerCount, SendOptions::defaultWorkerCount());
    }
};

QTEST_MAIN(TestSendOptions)
#include "test_sendoptions.moc"
