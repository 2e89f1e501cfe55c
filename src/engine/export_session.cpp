#include "engine/export_session.hpp"

#include <QDebug>

namespace sheaf::engine {

ExportSession::ExportSession(std::unique_ptr<encoding::EncodingGateway> gateway,
                             std::unique_ptr<storage::RemoteStore> store,
                             QObject* parent)
    : QObject(parent)
    , gateway_(std::move(gateway))
    , store_(std::move(store))
    , optimizer_(std::make_unique<BackgroundOptimizer>(book_, *gateway_))
    , planner_(std::make_unique<PlanController>(book_, *gateway_))
    , sync_(std::make_unique<SyncEngine>(book_, *gateway_, *store_))
{
    connect(optimizer_.get(), &BackgroundOptimizer::progressChanged,
            this, &ExportSession::progressChanged);
    connect(optimizer_.get(), &BackgroundOptimizer::statusChanged, this, [this]() {
        emit statusChanged(statusText());
    });
    connect(planner_.get(), &PlanController::statusChanged, this, [this](const QString& status) {
        planner_status_ = status;
        emit statusChanged(statusText());
    });
    connect(planner_.get(), &PlanController::planChanged, this, &ExportSession::onPlanChanged);
    connect(planner_.get(), &PlanController::oversizedItems, this, &ExportSession::oversizedItems);
    connect(sync_.get(), &SyncEngine::recordsChanged, this, &ExportSession::syncRecordsChanged);
    connect(sync_.get(), &SyncEngine::allChunksSynced, this, &ExportSession::allSynced);
}

ExportSession::~ExportSession() {
    stop();
}

void ExportSession::setItems(std::vector<Item> items) {
    book_.setItems(std::move(items));
}

void ExportSession::setSettings(const Settings& settings) {
    book_.setSettings(clamp_settings(settings));
}

void ExportSession::setTitle(const QString& title) {
    book_.setTitle(title.toStdString());
}

void ExportSession::setRemoteFolder(const QString& folder_id) {
    book_.setRemoteFolder(folder_id.toStdString());
}

void ExportSession::setTimings(const EngineTimings& timings) {
    optimizer_->setTickInterval(timings.optimizer_tick_ms);
    planner_->setDebounceInterval(timings.plan_debounce_ms);
    planner_->setRetryInterval(timings.sync_retry_ms);
    auto options = sync_->options();
    options.tick_ms = timings.sync_retry_ms;
    sync_->setOptions(options);
}

void ExportSession::setSyncOptions(const SyncOptions& options) {
    sync_->setOptions(options);
}

void ExportSession::load(const BookSnapshot& book) {
    book_.setTitle(book.title);
    book_.setSettings(clamp_settings(book.settings));
    book_.setItems(book.items);
    book_.setRemoteFolder(book.remote_folder_id);
}

void ExportSession::start() {
    if (running_) {
        return;
    }
    running_ = true;
    qInfo() << "SESSION: start title=" << QString::fromStdString(book_.snapshot().title)
             << "items=" << book_.snapshot().items.size();
    optimizer_->start();
    planner_->start();
    sync_->start();
}

void ExportSession::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    sync_->stop();
    planner_->stop();
    optimizer_->stop();
    qInfo() << "SESSION: stop";
}

QString ExportSession::statusText() const {
    if (!optimizer_->statusText().isEmpty()) {
        return optimizer_->statusText();
    }
    return planner_status_;
}

void ExportSession::onPlanChanged() {
    if (planner_->hasPlan()) {
        sync_->setPlan(planner_->plan());
    } else {
        sync_->clearPlan();
    }
    emit planChanged();
}

} // namespace sheaf::engine
