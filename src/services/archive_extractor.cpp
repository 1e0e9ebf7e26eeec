module;
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QString>
#include <QStringList>

module emularr.services.archive_extractor;

import emularr.utils.archive_utils;

namespace utils = emularr::utils;

ProcessArchiveExtractor::ProcessArchiveExtractor(QObject* parent)
    : QObject(parent)
{
}

bool ProcessArchiveExtractor::shouldExtract(const QString& filePath) const
{
    return utils::shouldExtract(filePath);
}

std::optional<ProcessArchiveExtractor::Command> ProcessArchiveExtractor::commandFor(const QString& archivePath,
                                                                                   const QString& destinationDir)
{
    Command cmd;
    switch (utils::detectArchiveKind(archivePath)) {
    case utils::ArchiveKind::Zip:
        cmd.program = QStringLiteral("unzip");
        cmd.arguments << QStringLiteral("-o") << archivePath << QStringLiteral("-d") << destinationDir;
        break;
    case utils::ArchiveKind::Tar:
        cmd.program = QStringLiteral("tar");
        cmd.arguments << QStringLiteral("-xf") << archivePath << QStringLiteral("-C") << destinationDir;
        break;
    case utils::ArchiveKind::SevenZip:
        cmd.program = QStringLiteral("7z");
        cmd.arguments << QStringLiteral("x") << QStringLiteral("-y")
                      << (QStringLiteral("-o") + destinationDir) << archivePath;
        break;
    case utils::ArchiveKind::Rar:
        cmd.program = QStringLiteral("unrar");
        cmd.arguments << QStringLiteral("x") << QStringLiteral("-o+") << archivePath
                      << (QDir(destinationDir).absolutePath() + QLatin1Char('/'));
        break;
    case utils::ArchiveKind::Gzip:
        cmd.program = QStringLiteral("gzip");
        cmd.arguments << QStringLiteral("-dc") << archivePath;
        cmd.standardOutputFile = QDir(destinationDir).filePath(utils::archiveBaseName(archivePath));
        break;
    case utils::ArchiveKind::None:
        return std::nullopt;
    }
    return cmd;
}

void ProcessArchiveExtractor::extract(const QString& archivePath, const QString& destinationDir, Callback done)
{
    const auto command = commandFor(archivePath, destinationDir);
    if (!command) {
        done(std::unexpected(QStringLiteral("Unsupported archive: %1").arg(QFileInfo(archivePath).fileName())));
        return;
    }
    if (!QDir().mkpath(destinationDir)) {
        done(std::unexpected(QStringLiteral("Cannot create directory %1").arg(destinationDir)));
        return;
    }

    qDebug() << "Extracting" << archivePath << "with" << command->program << "into" << destinationDir;

    auto* proc = new QProcess(this);
    proc->setProgram(command->program);
    proc->setArguments(command->arguments);
    if (!command->standardOutputFile.isEmpty()) {
        proc->setStandardOutputFile(command->standardOutputFile, QIODevice::Truncate);
    }
    proc->setProcessChannelMode(command->standardOutputFile.isEmpty() ? QProcess::MergedChannels
                                                                      : QProcess::SeparateChannels);

    // finished() and errorOccurred() can both fire; only the first settles.
    auto settled = std::make_shared<bool>(false);
    const QString program = command->program;
    ++m_running;

    auto settle = [this, proc, settled, done](const ArchiveExtractor::Result& result) {
        if (*settled) return;
        *settled = true;
        --m_running;
        proc->deleteLater();
        done(result);
    };

    connect(proc, &QProcess::finished, this, [proc, settle, program, destinationDir](int exitCode, QProcess::ExitStatus status) {
        if (status != QProcess::NormalExit || exitCode != 0) {
            const QString output = QString::fromLocal8Bit(proc->readAllStandardError()
                                                          + proc->readAllStandardOutput()).trimmed();
            QString message = QStringLiteral("%1 exited with code %2").arg(program).arg(exitCode);
            if (!output.isEmpty()) message += QStringLiteral(": ") + output.left(500);
            settle(std::unexpected(message));
            return;
        }
        settle(destinationDir);
    });
    connect(proc, &QProcess::errorOccurred, this, [proc, settle, program](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            settle(std::unexpected(QStringLiteral("%1 not found (is it installed?)").arg(program)));
            return;
        }
        // Crashes and exit codes are reported through finished().
        if (proc->state() == QProcess::NotRunning && error != QProcess::Crashed) {
            settle(std::unexpected(QStringLiteral("%1: %2").arg(program, proc->errorString())));
        }
    });

    proc->start();
}
