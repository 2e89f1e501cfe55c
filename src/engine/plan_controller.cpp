#include "engine/plan_controller.hpp"
#include "engine/fingerprint.hpp"

#include <QDebug>
#include <QPointer>
#include <QTimer>

namespace sheaf::engine {

namespace {
bool plan_debug_enabled() {
    return qEnvironmentVariableIsSet("SHEAF_DEBUG_PLAN");
}
} // namespace

PlanController::PlanController(BookState& book, encoding::EncodingGateway& gateway, QObject* parent)
    : QObject(parent)
    , book_(book)
    , gateway_(gateway)
    , timer_(std::make_unique<QTimer>(this))
    , debounce_ms_(EngineTimings{}.plan_debounce_ms)
    , retry_ms_(EngineTimings{}.sync_retry_ms)
{
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &PlanController::runPass);
    connect(&book_, &BookState::itemsChanged, this, &PlanController::onContentChanged);
    connect(&book_, &BookState::titleChanged, this, &PlanController::onContentChanged);
    connect(&book_, &BookState::settingsChanged, this, &PlanController::onSettingsChanged);
    connect(&book_, &BookState::cacheChanged, this, &PlanController::onCacheChanged);
}

PlanController::~PlanController() = default;

void PlanController::setDebounceInterval(int ms) {
    debounce_ms_ = ms;
}

void PlanController::setRetryInterval(int ms) {
    retry_ms_ = ms;
}

void PlanController::start() {
    if (running_) {
        return;
    }
    running_ = true;
    schedule(0);
}

void PlanController::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    rerun_ = false;
    timer_->stop();
    generation_ = generation_.next();
}

void PlanController::schedule(int delay_ms) {
    if (!running_) {
        return;
    }
    timer_->start(delay_ms);
}

bool PlanController::gateOpen() const {
    const auto& snapshot = book_.snapshot();
    if (snapshot.items.empty()) {
        return true;
    }
    for (const auto& item : snapshot.items) {
        if (!book_.cache().needs_processing(item, snapshot.settings)) {
            return true;
        }
    }
    return false;
}

void PlanController::onContentChanged() {
    generation_ = generation_.next();
    schedule(debounce_ms_);
}

void PlanController::onSettingsChanged() {
    generation_ = generation_.next();
    gated_ = true;
    const bool had_plan = planned_;
    plan_ = ChunkPlan{};
    planned_ = false;
    planned_inputs_.clear();
    if (plan_debug_enabled()) {
        qInfo() << "PLAN: settings changed, plan cleared";
    }
    if (had_plan) {
        emit planChanged();
    }
    schedule(debounce_ms_);
}

void PlanController::onCacheChanged() {
    schedule(debounce_ms_);
}

void PlanController::runPass() {
    if (!running_) {
        return;
    }
    if (pass_) {
        rerun_ = true;
        return;
    }
    if (gated_) {
        if (!gateOpen()) {
            if (plan_debug_enabled()) {
                qInfo() << "PLAN: waiting for a refreshed item";
            }
            return;
        }
        gated_ = false;
    }

    const auto& snapshot = book_.snapshot();
    auto inputs = book_.cache().planner_items(snapshot.items, snapshot.settings);
    if (planned_ && inputs == planned_inputs_ && snapshot.title == planned_title_ &&
        plan_.effective_limit == snapshot.settings.effective_limit()) {
        return;
    }

    pass_ = std::make_unique<ActivePass>(ActivePass{
        .generation = generation_,
        .pass = std::make_unique<PlanningPass>(inputs, snapshot.settings, snapshot.title),
        .bundle = book_.cache().bundle_items(snapshot.items),
        .inputs = inputs,
        .title = QString::fromStdString(snapshot.title),
        .level = snapshot.settings.compression_level,
    });
    ++pass_count_;
    if (plan_debug_enabled()) {
        qInfo() << "PLAN: pass" << pass_count_ << "items=" << inputs.size()
                << "limit=" << snapshot.settings.effective_limit();
    }
    verifyNext();
}

void PlanController::verifyNext() {
    if (pass_->pass->finished()) {
        completePass();
        return;
    }

    const auto request = *pass_->pass->pending();
    encoding::BundleItems batch(pass_->bundle.begin() + static_cast<std::ptrdiff_t>(request.begin),
                                pass_->bundle.begin() + static_cast<std::ptrdiff_t>(request.end));
    emit statusChanged(QStringLiteral("Measuring %1 items...").arg(request.size()));
    if (plan_debug_enabled()) {
        qInfo() << "PLAN: verify items" << request.begin << "to" << request.end;
    }

    QPointer<PlanController> self(this);
    const Generation generation = pass_->generation;
    const auto title = QString::fromStdString(part_title(pass_->title.toStdString(), request.part_number));
    gateway_.encode(batch, title, pass_->level,
                    [self, generation](Result<QByteArray, Error> result) {
        if (!self || !self->pass_) {
            return;
        }
        if (generation != self->generation_) {
            if (plan_debug_enabled()) {
                qInfo() << "PLAN: discard stale pass";
            }
            self->pass_.reset();
            self->rerun_ = false;
            emit self->statusChanged(QString{});
            self->schedule(self->debounce_ms_);
            return;
        }
        if (result.is_err()) {
            self->abortPass(result.unwrap_err());
            return;
        }
        self->pass_->pass->supply(static_cast<int64_t>(result.unwrap().size()));
        self->verifyNext();
    });
}

void PlanController::completePass() {
    auto plan = with_fingerprints(pass_->pass->plan());
    const int verifications = pass_->pass->verification_count();
    planned_inputs_ = std::move(pass_->inputs);
    planned_title_ = pass_->title.toStdString();
    pass_.reset();

    const bool changed = !planned_ || plan != plan_;
    plan_ = std::move(plan);
    planned_ = true;
    emit statusChanged(QString{});

    if (plan_debug_enabled()) {
        qInfo() << "PLAN: pass done chunks=" << plan_.size()
                << "verifications=" << verifications << "changed=" << changed;
    }

    if (changed) {
        emit planChanged();
        const auto violations = plan_.violations();
        if (!violations.empty()) {
            qWarning() << "PLAN:" << violations.size() << "item(s) exceed the limit of"
                       << plan_.effective_limit << "bytes";
            emit oversizedItems(violations);
        }
    }

    if (rerun_) {
        rerun_ = false;
        schedule(debounce_ms_);
    }
}

void PlanController::abortPass(const Error& error) {
    qWarning() << "PLAN: verification failed:" << QString::fromStdString(error.message);
    pass_.reset();
    rerun_ = false;
    emit statusChanged(QString{});
    emit planningFailed(QString::fromStdString(error.message));
    schedule(retry_ms_);
}

} // namespace sheaf::engine
