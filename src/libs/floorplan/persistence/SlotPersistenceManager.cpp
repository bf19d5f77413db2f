// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/persistence/SlotPersistenceManager.hpp"

#include "floorplan/api/ISlotService.hpp"

#include <utils/Macros.hpp>

#include <QtCore/QLoggingCategory>

#include <utility>
#include <vector>

Q_LOGGING_CATEGORY(fppersistlog, "floorplan.persistence")

namespace FloorPlan {

namespace {

QString slotNameIn(const QVector<Slot>& snapshots, const SlotId& id)
{
    for (const Slot& slot : snapshots) {
        if (slot.id == id)
            return slot.displayName();
    }
    return id.value();
}

bool isTransformOnlyRequest(const SlotUpdateList& requests, const SlotId& id)
{
    for (const SlotUpdate& req : requests) {
        if (req.id == id)
            return req.patch.isTransformOnly();
    }
    return false;
}

Api::SlotServiceError serviceUnavailable()
{
    return Api::SlotServiceError(Api::SlotServiceErrorCode::Transport,
                                 QStringLiteral("Slot service is not available."));
}

} // namespace

SlotPersistenceManager::SlotPersistenceManager(SlotStore* store, Api::ISlotService* service, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_service(service)
{}

SlotPersistenceManager::~SlotPersistenceManager() = default;

void SlotPersistenceManager::setVenueId(const QString& venueId)
{
    if (m_venueId == venueId)
        return;
    if (!m_batches.empty())
        qCInfo(fppersistlog) << "Venue changed with" << m_batches.size() << "pending batches; dropping them";
    reset();
    m_venueId = venueId;
}

Utils::Result SlotPersistenceManager::submitUpdates(const SlotUpdateList& updates)
{
    UTILS_GUARD_OK(m_store, QStringLiteral("No slot store attached."));
    UTILS_GUARD_OK(!updates.isEmpty(), QStringLiteral("No slot changes to save."));

    Utils::Result result;
    for (const SlotUpdate& update : updates) {
        if (!update.id) {
            result.addError(QStringLiteral("Slot id is missing."));
            continue;
        }
        if (!m_store->contains(update.id))
            result.addError(QStringLiteral("Slot %1 is not loaded.").arg(update.id.value()));
        if (update.patch.isEmpty())
            result.addError(QStringLiteral("Update for slot %1 is empty.").arg(update.id.value()));

        const Utils::Result valid = update.patch.validate();
        for (const QString& err : valid.errors)
            result.addError(err);
    }
    if (!result) {
        qCWarning(fppersistlog).noquote() << "Rejected slot update:" << result.errors.join(QStringLiteral("; "));
        return result;
    }

    Batch batch;
    batch.op = PersistenceOp::Update;
    for (const SlotUpdate& update : updates) {
        if (!batch.touched.contains(update.id)) {
            batch.snapshots.push_back(*m_store->findSlot(update.id));
            batch.touched.insert(update.id);
        }
        batch.requests.push_back(SlotUpdate{update.id, update.patch.roundedTransform()});
    }

    for (const SlotUpdate& update : updates)
        m_store->applyPatch(update.id, update.patch);

    enqueue(std::move(batch));
    return Utils::Result::success();
}

Utils::Result SlotPersistenceManager::submitDelete(const SlotId& id)
{
    UTILS_GUARD_OK(m_store, QStringLiteral("No slot store attached."));
    UTILS_GUARD_OK(id.isValid(), QStringLiteral("Slot id is missing."));

    std::optional<RemovedSlot> removed = m_store->removeSlot(id);
    if (!removed)
        return Utils::Result::failure(QStringLiteral("Slot %1 is not loaded.").arg(id.value()));

    Batch batch;
    batch.op = PersistenceOp::Delete;
    batch.touched.insert(id);
    batch.removed = std::move(removed);
    enqueue(std::move(batch));
    return Utils::Result::success();
}

Utils::Result SlotPersistenceManager::submitCreate(const SlotDraft& draft)
{
    UTILS_GUARD_OK(m_store, QStringLiteral("No slot store attached."));

    const Utils::Result valid = draft.validate();
    if (!valid) {
        qCWarning(fppersistlog).noquote() << "Rejected slot draft:" << valid.errors.join(QStringLiteral("; "));
        return valid;
    }

    Batch batch;
    batch.op = PersistenceOp::Create;
    batch.draft = draft;
    enqueue(std::move(batch));
    return Utils::Result::success();
}

bool SlotPersistenceManager::hasPendingWrites(const SlotId& id) const
{
    for (const Batch& batch : m_batches) {
        if (batch.touched.contains(id))
            return true;
    }
    return false;
}

void SlotPersistenceManager::reset()
{
    m_batches.clear();
    setBusy(false);
}

SlotPersistenceManager::Batch* SlotPersistenceManager::findBatch(quint64 serial)
{
    for (Batch& batch : m_batches) {
        if (batch.serial == serial)
            return &batch;
    }
    return nullptr;
}

bool SlotPersistenceManager::isTouchedAfter(quint64 serial, const SlotId& id) const
{
    bool after = false;
    for (const Batch& batch : m_batches) {
        if (after && batch.touched.contains(id))
            return true;
        if (batch.serial == serial)
            after = true;
    }
    return false;
}

bool SlotPersistenceManager::isTouchedLaterInBatch(const Batch& batch, int requestIndex) const
{
    const SlotId& id = batch.requests.at(requestIndex).id;
    for (int i = requestIndex + 1; i < batch.requests.size(); ++i) {
        if (batch.requests.at(i).id == id)
            return true;
    }
    return false;
}

bool SlotPersistenceManager::isBlocked(const Batch& batch) const
{
    for (const Batch& earlier : m_batches) {
        if (earlier.serial == batch.serial)
            return false;
        if (earlier.touched.intersects(batch.touched))
            return true;
    }
    return false;
}

quint64 SlotPersistenceManager::enqueue(Batch batch)
{
    batch.serial = m_nextSerial++;
    const quint64 serial = batch.serial;
    qCDebug(fppersistlog).noquote() << "Queued" << toString(batch.op) << "batch" << serial
                                    << "touching" << batch.touched.size() << "slots";
    m_batches.push_back(std::move(batch));
    setBusy(true);
    pump();
    return serial;
}

void SlotPersistenceManager::pump()
{
    QVector<quint64> ready;
    for (const Batch& batch : m_batches) {
        if (!batch.started && !isBlocked(batch))
            ready.push_back(batch.serial);
    }

    for (quint64 serial : ready) {
        Batch* batch = findBatch(serial);
        if (batch && !batch->started)
            start(*batch);
    }
}

void SlotPersistenceManager::start(Batch& batch)
{
    batch.started = true;
    const quint64 serial = batch.serial;

    if (!m_service) {
        const SlotId failedId = batch.touched.isEmpty() ? SlotId{} : *batch.touched.constBegin();
        failBatch(serial, failedId, serviceUnavailable());
        return;
    }

    QPointer<SlotPersistenceManager> self(this);
    switch (batch.op) {
        case PersistenceOp::Update:
            sendNextUpdate(serial);
            break;
        case PersistenceOp::Delete:
            m_service->deleteSlot(m_venueId, batch.removed->slot.id,
                                  [self, serial](Api::SlotServiceError error) {
                                      if (self)
                                          self->onDeleteReply(serial, error);
                                  });
            break;
        case PersistenceOp::Create:
            m_service->createSlot(m_venueId, batch.draft, [self, serial](Api::SlotReply reply) {
                if (self)
                    self->onCreateReply(serial, reply);
            });
            break;
    }
}

void SlotPersistenceManager::sendNextUpdate(quint64 serial)
{
    Batch* batch = findBatch(serial);
    UTILS_GUARD(batch);

    if (batch->nextRequest >= batch->requests.size()) {
        completeBatch(serial);
        return;
    }
    if (!m_service) {
        failBatch(serial, batch->requests.at(batch->nextRequest).id, serviceUnavailable());
        return;
    }

    const int index = batch->nextRequest;
    const SlotUpdate request = batch->requests.at(index);
    QPointer<SlotPersistenceManager> self(this);
    m_service->updateSlot(m_venueId, request.id, request.patch,
                          [self, serial, index](Api::SlotReply reply) {
                              if (self)
                                  self->onUpdateReply(serial, index, reply);
                          });
}

void SlotPersistenceManager::onUpdateReply(quint64 serial, int requestIndex, const Api::SlotReply& reply)
{
    Batch* batch = findBatch(serial);
    if (!batch) {
        qCDebug(fppersistlog) << "Ignoring reply for dropped batch" << serial;
        return;
    }

    const SlotUpdate& request = batch->requests.at(requestIndex);
    const SlotId id = request.id;
    const bool transformOnly = request.patch.isTransformOnly();
    if (!reply.ok()) {
        failBatch(serial, id, reply.error());
        return;
    }

    // A newer local edit of this slot wins over the server echo.
    const bool adopt = reply.value().id == id && !isTouchedLaterInBatch(*batch, requestIndex)
                       && !isTouchedAfter(serial, id);
    batch->nextRequest = requestIndex + 1;

    if (adopt && m_store)
        m_store->replaceSlot(reply.value());

    Slot saved = reply.value();
    if (saved.id != id) {
        const Slot* local = m_store ? m_store->findSlot(id) : nullptr;
        saved = local ? *local : Slot{};
        saved.id = id;
    }
    emit slotSaved(saved, transformOnly);

    sendNextUpdate(serial);
}

void SlotPersistenceManager::onDeleteReply(quint64 serial, const Api::SlotServiceError& error)
{
    Batch* batch = findBatch(serial);
    if (!batch) {
        qCDebug(fppersistlog) << "Ignoring reply for dropped batch" << serial;
        return;
    }

    const Slot removed = batch->removed->slot;
    if (!error.ok()) {
        failBatch(serial, removed.id, error);
        return;
    }

    completeBatch(serial);
    emit slotDeleted(removed);
}

void SlotPersistenceManager::onCreateReply(quint64 serial, const Api::SlotReply& reply)
{
    if (!findBatch(serial)) {
        qCDebug(fppersistlog) << "Ignoring reply for dropped batch" << serial;
        return;
    }

    if (!reply.ok()) {
        failBatch(serial, SlotId{}, reply.error());
        return;
    }

    const Slot created = reply.value();
    completeBatch(serial);

    if (m_store) {
        m_store->appendSlot(created);
        m_store->selection().setSelectedSlot(created.id);
    }
    qCInfo(fppersistlog).noquote() << "Created slot" << created.id.value();
    emit slotCreated(created);
}

void SlotPersistenceManager::completeBatch(quint64 serial)
{
    for (auto it = m_batches.begin(); it != m_batches.end(); ++it) {
        if (it->serial == serial) {
            m_batches.erase(it);
            break;
        }
    }
    if (m_batches.empty())
        setBusy(false);
    pump();
}

void SlotPersistenceManager::failBatch(quint64 serial, const SlotId& failedId, const Api::SlotServiceError& error)
{
    std::optional<Batch> failed;
    std::vector<Batch> dependents;
    SlotIdSet affected;

    for (auto it = m_batches.begin(); it != m_batches.end();) {
        if (!failed) {
            if (it->serial == serial) {
                affected = it->touched;
                failed = std::move(*it);
                it = m_batches.erase(it);
                continue;
            }
            ++it;
            continue;
        }
        if (!it->started && it->touched.intersects(affected)) {
            affected.unite(it->touched);
            dependents.push_back(std::move(*it));
            it = m_batches.erase(it);
            continue;
        }
        ++it;
    }
    UTILS_GUARD(failed);

    SlotActionFailure failure;
    failure.op = failed->op;
    failure.slotId = failedId;
    failure.error = error;
    switch (failed->op) {
        case PersistenceOp::Update:
            failure.slotName = slotNameIn(failed->snapshots, failedId);
            failure.transformOnly = isTransformOnlyRequest(failed->requests, failedId);
            break;
        case PersistenceOp::Delete:
            failure.slotName = failed->removed ? failed->removed->slot.displayName() : failedId.value();
            break;
        case PersistenceOp::Create:
            failure.slotName = failed->draft.label;
            break;
    }

    for (auto it = dependents.rbegin(); it != dependents.rend(); ++it)
        rollback(*it);
    rollback(*failed);

    qCWarning(fppersistlog).noquote() << failure.message() << "(" << Api::toString(error.code()) << ")"
                                      << "- rolled back batch" << serial << "and" << dependents.size()
                                      << "dependent batches";

    if (m_batches.empty())
        setBusy(false);
    emit actionFailed(failure);
    pump();
}

void SlotPersistenceManager::rollback(const Batch& batch)
{
    UTILS_GUARD(m_store);

    switch (batch.op) {
        case PersistenceOp::Update:
            for (auto it = batch.snapshots.crbegin(); it != batch.snapshots.crend(); ++it) {
                if (!m_store->replaceSlot(*it))
                    qCDebug(fppersistlog) << "Slot" << it->id.value() << "no longer loaded; nothing to restore";
            }
            break;
        case PersistenceOp::Delete:
            if (batch.removed)
                m_store->restoreSlot(*batch.removed);
            break;
        case PersistenceOp::Create:
            break;
    }
}

void SlotPersistenceManager::setBusy(bool busy)
{
    if (m_busy == busy)
        return;
    m_busy = busy;
    emit busyChanged(m_busy);
}

} // namespace FloorPlan
