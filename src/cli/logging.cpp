#include "cli/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>
#include <cstdio>

namespace sheaf::cli {
namespace {

// One previous log is kept as "<name>.1" once the current one grows past this.
constexpr qint64 kRotateBytes = 4 * 1024 * 1024;

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/sheaf.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

// Engine messages start with their loop's tag ("SYNC: ...", "PLAN: ...").
QString component_of(const QString& msg, const char* category) {
    if (category != nullptr && qstrcmp(category, "default") != 0) {
        return QString::fromLatin1(category);
    }
    const auto colon = msg.indexOf(QLatin1Char(':'));
    if (colon > 0 && colon <= 8) {
        const auto tag = msg.left(colon);
        bool upper = true;
        for (const auto ch : tag) {
            upper = upper && ch.isUpper();
        }
        if (upper) {
            return tag.toLower();
        }
    }
    return QStringLiteral("sheaf");
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool opened = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void rotate(LoggerState& s) {
    if (s.file.isOpen()) {
        s.file.close();
    }
    const QString backup = s.path + QStringLiteral(".1");
    QFile::remove(backup);
    if (!QFile::rename(s.path, backup)) {
        std::fprintf(stderr, "sheaf: cannot rotate log file %s\n", qPrintable(s.path));
    }
    s.opened = false;
}

void open_log(LoggerState& s) {
    if (s.opened) return;
    s.opened = true;

    if (s.path.isEmpty()) {
        return;
    }

    if (!QDir().mkpath(QFileInfo(s.path).absolutePath())) {
        std::fprintf(stderr, "sheaf: cannot create log directory for %s\n", qPrintable(s.path));
        return;
    }

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "sheaf: cannot open log file %s\n", qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    open_log(s);
    if (s.file.isOpen() && s.file.size() > kRotateBytes) {
        rotate(s);
        open_log(s);
    }

    const auto line = QStringLiteral("%1 %2 [%3] %4\n")
                          .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                               QString::fromLatin1(level_tag(type)),
                               component_of(msg, ctx.category),
                               msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }

    // The command-line user sees problems without opening the log.
    if (type != QtDebugMsg && type != QtInfoMsg) {
        std::fprintf(stderr, "%s\n", qPrintable(msg));
    }
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        s.opened = false;
    }
    qSetMessagePattern(QStringLiteral("%{message}"));
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

QString active_log_file_path() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    return s.path;
}

} // namespace sheaf::cli
