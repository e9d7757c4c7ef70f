#include "sendoptions.h"

#include <QDebug>
#include <QSettings>
#include <QThread>
#include <QtGlobal>

int SendOptions::defaultWorkerCount()
{
    return qMax(1, QThread::idealThreadCount());
}

SendOptions SendOptions::fromSettings(const QSettings &settings)
{
    SendOptions options;

    bool ok = false;
    const int workers = settings.value("send/workers", options.workerCount).toInt(&ok);
    if (ok && workers > 0) {
        options.workerCount = workers;
    } else {
        qWarning() << "Ignoring invalid send/workers setting:" << settings.value("send/workers");
    }

    const QString program = settings.value("send/program", options.program).toString();
    if (!program.isEmpty()) {
        options.program = program;
    }

    options.extraArguments = settings.value("send/extraArguments", options.extraArguments).toStringList();
    options.cancelOnFailure = settings.value("send/cancelOnFailure", options.cancelOnFailure).toBool();
    return options;
}

SendOptions SendOptions::load()
{
    QSettings settings;
    return fromSettings(settings);
}

void SendOptions::save(QSettings &settings) const
{
    settings.setValue("send/workers", workerCount);
    settings.setValue("send/program", program);
    settings.setValue("send/extraArguments", extraArguments);
    settings.setValue("send/cancelOnFailure", cancelOnFailure);
}
