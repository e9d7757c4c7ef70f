/**
 * @file test_transfercommand.cpp
 * @brief Unit tests for TransferCommand.
 */

#include <QtTest/QtTest>

#include "services/transfercommand.h"

class TestTransferCommand : public QObject
{
    Q_OBJECT

private slots:
    void testJoinDestination_data()
    {
        QTest::addColumn<QString>("root");
        QTest::addColumn<QString>("suffix");
        QTest::addColumn<QString>("expected");

        QTest::newRow("empty suffix marks root as directory") << "user@host:incoming" << "" << "user@host:incoming/";
        QTest::newRow("empty suffix, root with slash") << "/srv/backup/" << "" << "/srv/backup/";
        QTest::newRow("empty suffix, remote home") << "host:" << "" << "host:";
        QTest::newRow("remote root") << "user@host:incoming" << "run1" << "user@host:incoming/run1/";
        QTest::newRow("remote root with slash") << "user@host:incoming/" << "run1/sub" << "user@host:incoming/run1/sub/";
        QTest::newRow("remote home") << "host:" << "run1" << "host:run1/";
        QTest::newRow("local root") << "/srv/backup" << "run1/sub" << "/srv/backup/run1/sub/";
        QTest::newRow("suffix with trailing slash") << "/srv/backup" << "run1/" << "/srv/backup/run1/";
        QTest::newRow("suffix with leading slash") << "/srv/backup" << "/run1" << "/srv/backup/run1/";
    }

    void testJoinDestination()
    {
        QFETCH(QString, root);
        QFETCH(QString, suffix);
        QFETCH(QString, expected);

        QCOMPARE(TransferCommand::joinDestination(root, suffix), expected);
    }

    void testDefaultArguments()
    {
        TransferCommand command("user@host:incoming", SendOptions());
        const TransferUnit unit{"/data/run1/a.dat", "run1"};

        QCOMPARE(command.program(), QString("rsync"));
        QCOMPARE(command.arguments(unit),
                 (QStringList{"-c", "--partial", "--mkpath", "/data/run1/a.dat",
                              "user@host:incoming/run1/"}));
    }

    void testBareFileGoesToRoot()
    {
        TransferCommand command("/srv/backup/", SendOptions());
        const TransferUnit unit{"/data/notes.txt", QString()};

        QCOMPARE(command.destinationFor(unit), QString("/srv/backup/"));
        QCOMPARE(command.arguments(unit).last(), QString("/srv/backup/"));
    }

    void testBareFilesShareRootDirectory()
    {
        TransferCommand command("/srv/new", SendOptions());

        QCOMPARE(command.arguments({"/data/a.txt", QString()}).last(), QString("/srv/new/"));
        QCOMPARE(command.arguments({"/data/b.txt", QString()}).last(), QString("/srv/new/"));
        QCOMPARE(command.arguments({"/data/run1/c.txt", "run1"}).last(), QString("/srv/new/run1/"));
    }

    void testCustomProgramAndExtraArguments()
    {
        SendOptions options;
        options.program = "/usr/local/bin/rsync";
        options.extraArguments = {"-e", "ssh -p 2222"};

        TransferCommand command("host:dst", options);
        const TransferUnit unit{"/src/file", "src"};

        QCOMPARE(command.commandLine(unit),
                 (QStringList{"/usr/local/bin/rsync", "-c", "--partial", "-e", "ssh -p 2222",
                              "/src/file", "host:dst/src/"}));
    }

    void testNoExtraArguments()
    {
        SendOptions options;
        options.extraArguments.clear();

        TransferCommand command("host:dst", options);
        QCOMPARE(command.arguments({"/src/file", QString()}),
                 (QStringList{"-c", "--partial", "/src/file", "host:dst/"}));
    }
};

QTEST_MAIN(TestTransferCommand)
#include "test_transfercommand.moc"
