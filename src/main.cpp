#include <QGuiApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include "cli/logging.hpp"
#include "cli/offline_plan.hpp"
#include "cli/plan_report.hpp"
#include "cli/sync_timeout.hpp"
#include "encoding/qt_encoding_gateway.hpp"
#include "engine/export_session.hpp"
#include "storage/book_manifest.hpp"
#include "storage/folder_remote_store.hpp"
#include "storage/settings_store.hpp"

namespace {

constexpr int kExitError = 1;
constexpr int kExitOversized = 2;
constexpr int kExitTimeout = 3;

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return kExitError;
}

} // namespace

int main(int argc, char *argv[])
{
    // Bundles are painted without a display.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    app.setApplicationName("sheaf");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("sheaf");
    app.setOrganizationDomain("sheaf.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Split a book of images and PDFs into size-bounded PDF parts"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption maxMbOption(
        QStringList{QStringLiteral("max-mb")},
        QStringLiteral("Maximum size of one part in MB (5-50)."),
        QStringLiteral("mb"));
    parser.addOption(maxMbOption);

    const QCommandLineOption levelOption(
        QStringList{QStringLiteral("level")},
        QStringLiteral("Image compression: low, medium or high."),
        QStringLiteral("level"));
    parser.addOption(levelOption);

    const QCommandLineOption marginOption(
        QStringList{QStringLiteral("margin")},
        QStringLiteral("Safety margin below the maximum, in percent (0-20)."),
        QStringLiteral("percent"));
    parser.addOption(marginOption);

    const QCommandLineOption saveSettingsOption(
        QStringList{QStringLiteral("save-settings")},
        QStringLiteral("Remember --max-mb, --level and --margin for later runs."));
    parser.addOption(saveSettingsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for 'plan')."));
    parser.addOption(jsonOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include item IDs in text output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption storeOption(
        QStringList{QStringLiteral("store")},
        QStringLiteral("Directory that receives uploaded parts (for 'sync')."),
        QStringLiteral("dir"));
    parser.addOption(storeOption);

    const QCommandLineOption folderOption(
        QStringList{QStringLiteral("folder")},
        QStringLiteral("Remote folder id, overriding the manifest's remoteFolderId."),
        QStringLiteral("id"));
    parser.addOption(folderOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("timeout")},
        QStringLiteral("Give up 'sync' after this many seconds (default 600, at most 86400)."),
        QStringLiteral("seconds"),
        QStringLiteral("600"));
    parser.addOption(timeoutOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write the log here instead of the default location."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugOptimizerOption(
        QStringList{QStringLiteral("debug-optimizer")},
        QStringLiteral("Enable optimizer debug logging (also sets SHEAF_DEBUG_OPTIMIZER=1)."));
    parser.addOption(debugOptimizerOption);

    const QCommandLineOption debugPlanOption(
        QStringList{QStringLiteral("debug-plan")},
        QStringLiteral("Enable planner debug logging (also sets SHEAF_DEBUG_PLAN=1)."));
    parser.addOption(debugPlanOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets SHEAF_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run: 'plan' or 'sync'."));
    parser.addPositionalArgument(QStringLiteral("manifest"),
                                 QStringLiteral("Book manifest (JSON)."));
    parser.process(app);

    if (parser.isSet(debugOptimizerOption)) {
        qputenv("SHEAF_DEBUG_OPTIMIZER", "1");
    }
    if (parser.isSet(debugPlanOption)) {
        qputenv("SHEAF_DEBUG_PLAN", "1");
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("SHEAF_DEBUG_SYNC", "1");
    }

    sheaf::cli::install_file_logging(parser.value(logFileOption));
    qInfo() << "sheaf: logging to" << sheaf::cli::active_log_file_path();

    const auto positional = parser.positionalArguments();
    if (positional.size() < 2) {
        parser.showHelp(kExitError);
    }
    const auto command = positional.at(0);

    // Stored settings, then command-line overrides.
    QSettings stored;
    auto settings = sheaf::storage::load_settings(stored);
    const auto timings = sheaf::storage::load_timings(stored);

    if (parser.isSet(maxMbOption)) {
        bool ok = false;
        const auto mb = parser.value(maxMbOption).toDouble(&ok);
        if (!ok) {
            return fail(QStringLiteral("--max-mb expects a number"));
        }
        settings.max_chunk_size_bytes = static_cast<int64_t>(mb * static_cast<double>(sheaf::MIB));
    }
    if (parser.isSet(levelOption)) {
        const auto level = sheaf::parse_compression_level(parser.value(levelOption).toStdString());
        if (!level) {
            return fail(QStringLiteral("--level must be low, medium or high"));
        }
        settings.compression_level = *level;
    }
    if (parser.isSet(marginOption)) {
        bool ok = false;
        settings.safety_margin_percent = parser.value(marginOption).toDouble(&ok);
        if (!ok) {
            return fail(QStringLiteral("--margin expects a number"));
        }
    }
    const auto valid = sheaf::validate_settings(settings);
    if (valid.is_err()) {
        return fail(QString::fromStdString(valid.unwrap_err().message));
    }
    if (parser.isSet(saveSettingsOption)) {
        sheaf::storage::save_settings(stored, settings);
        stored.sync();
    }

    auto manifest = sheaf::storage::load_manifest(positional.at(1));
    if (manifest.is_err()) {
        return fail(QString::fromStdString(manifest.unwrap_err().message));
    }
    auto book = sheaf::with_settings(std::move(manifest).unwrap(), settings);
    if (parser.isSet(folderOption)) {
        book = sheaf::with_remote_folder(std::move(book), parser.value(folderOption).toStdString());
    }

    if (command == QStringLiteral("plan")) {
        sheaf::engine::ItemCache cache;
        const auto planned = sheaf::cli::plan_offline(book, cache);
        if (planned.is_err()) {
            return fail(QString::fromStdString(planned.unwrap_err().message));
        }
        const auto& plan = planned.unwrap();
        const auto opts = sheaf::cli::PlanReportOptions{.includeIds = parser.isSet(includeIdsOption)};
        QTextStream(stdout) << (parser.isSet(jsonOption)
                                    ? sheaf::cli::format_plan_json(book, plan)
                                    : sheaf::cli::format_plan(book, plan, opts));
        return plan.violations().empty() ? 0 : kExitOversized;
    }

    if (command == QStringLiteral("sync")) {
        if (!parser.isSet(storeOption)) {
            return fail(QStringLiteral("'sync' needs --store <dir>"));
        }
        if (book.remote_folder_id.empty()) {
            return fail(QStringLiteral("no remote folder: set remoteFolderId in the manifest or pass --folder"));
        }
        const auto timeout = sheaf::cli::parse_sync_timeout(parser.value(timeoutOption));
        if (timeout.is_err()) {
            return fail(QString::fromStdString(timeout.unwrap_err().message));
        }

        sheaf::engine::ExportSession session(
            std::make_unique<sheaf::encoding::QtEncodingGateway>(),
            std::make_unique<sheaf::storage::FolderRemoteStore>(parser.value(storeOption)));
        session.setTimings(timings);
        session.load(book);

        QTextStream out(stdout);
        QObject::connect(&session, &sheaf::engine::ExportSession::statusChanged,
                         &app, [&out](const QString& status) {
            if (!status.isEmpty()) {
                out << status << Qt::endl;
            }
        });
        QObject::connect(&session, &sheaf::engine::ExportSession::planChanged, &app, [&]() {
            out << sheaf::cli::format_plan(session.book(), session.plan(),
                                           {.includeIds = false, .includeItems = false});
            out.flush();
        });
        QObject::connect(&session, &sheaf::engine::ExportSession::syncRecordsChanged, &app, [&]() {
            out << sheaf::cli::format_sync_records(session.syncRecords());
            out.flush();
        });
        QObject::connect(&session, &sheaf::engine::ExportSession::allSynced, &app, [&]() {
            app.exit(session.violations().empty() ? 0 : kExitOversized);
        });
        QTimer::singleShot(std::chrono::milliseconds(timeout.unwrap()), &app, [&]() {
            QTextStream(stderr) << "sync timed out\n"
                                << sheaf::cli::format_sync_records(session.syncRecords());
            app.exit(kExitTimeout);
        });

        session.start();
        const int code = app.exec();
        session.stop();
        return code;
    }

    return fail(QStringLiteral("unknown command '%1' (expected 'plan' or 'sync')").arg(command));
}
