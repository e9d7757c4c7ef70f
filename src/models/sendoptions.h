/**
 * @file sendoptions.h
 * @brief Configuration of a send run.
 */

#ifndef SENDOPTIONS_H
#define SENDOPTIONS_H

#include <QString>
#include <QStringList>

class QSettings;

/**
 * @brief Settings that shape how files are sent.
 *
 * Defaults apply when a key is missing from the settings store. The command
 * line overrides individual fields after load().
 *
 * Settings keys:
 * - send/workers: number of parallel workers
 * - send/program: transfer tool executable
 * - send/extraArguments: arguments inserted before source and destination
 * - send/cancelOnFailure: stop handing out work after the first failure
 */
struct SendOptions {
    int workerCount = defaultWorkerCount();
    QString program = QStringLiteral("rsync");
    QStringList extraArguments = {QStringLiteral("--mkpath")};
    bool cancelOnFailure = true;

    /**
     * @brief Returns the host's logical processor count, at least 1.
     */
    [[nodiscard]] static int defaultWorkerCount();

    /**
     * @brief Reads options from a settings store.
     * @param settings Store to read, missing keys keep their defaults.
     * @return The options.
     */
    [[nodiscard]] static SendOptions fromSettings(const QSettings &settings);

    /**
     * @brief Reads options from the application's default settings store.
     */
    [[nodiscard]] static SendOptions load();

    /**
     * @brief Writes options to a settings store.
     * @param settings Store to write.
     */
    void save(QSettings &settings) const;
};

#endif // SENDOPTIONS_H
