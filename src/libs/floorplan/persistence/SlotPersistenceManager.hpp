// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/document/SlotStore.hpp"
#include "floorplan/persistence/PersistenceTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QPointer>

#include <deque>
#include <optional>

namespace FloorPlan {

namespace Api { class ISlotService; }

// Writes local edits back to the slot service.
//
// Updates and deletes are applied to the store first and queued as a batch
// together with a snapshot of every slot they touch. Requests inside a batch
// go out one at a time in submission order. A batch waits while an earlier
// unfinished batch touches one of its slots, so writes to the same slot reach
// the service in local commit order.
//
// When any request of a batch fails, the whole batch is restored from its
// snapshot. Queued batches that touch the same slots were built on top of the
// rejected state; they are dropped and restored first, newest to oldest.
//
// Creates are not optimistic: the slot enters the store once the service
// has assigned its id.
class FLOORPLAN_EXPORT SlotPersistenceManager final : public QObject
{
    Q_OBJECT

public:
    SlotPersistenceManager(SlotStore* store, Api::ISlotService* service, QObject* parent = nullptr);
    ~SlotPersistenceManager() override;

    void setVenueId(const QString& venueId);
    const QString& venueId() const noexcept { return m_venueId; }

    Utils::Result submitUpdates(const SlotUpdateList& updates);
    Utils::Result submitDelete(const SlotId& id);
    Utils::Result submitCreate(const SlotDraft& draft);

    bool isIdle() const noexcept { return m_batches.empty(); }
    int pendingBatchCount() const noexcept { return static_cast<int>(m_batches.size()); }
    bool hasPendingWrites(const SlotId& id) const;

    // Forgets every queued and in-flight batch without restoring anything.
    // Replies that arrive later are ignored.
    void reset();

signals:
    void actionFailed(const FloorPlan::SlotActionFailure& failure);
    // transformOnly is set when the request carried geometry fields only.
    void slotSaved(const FloorPlan::Slot& saved, bool transformOnly);
    void slotCreated(const FloorPlan::Slot& slot);
    void slotDeleted(const FloorPlan::Slot& removed);
    void busyChanged(bool busy);

private:
    struct Batch final {
        quint64 serial = 0;
        PersistenceOp op = PersistenceOp::Update;
        SlotIdSet touched;
        bool started = false;

        // Update
        SlotUpdateList requests;
        QVector<Slot> snapshots;
        int nextRequest = 0;

        // Delete
        std::optional<RemovedSlot> removed;

        // Create
        SlotDraft draft;
    };

    Batch* findBatch(quint64 serial);
    bool isTouchedAfter(quint64 serial, const SlotId& id) const;
    bool isTouchedLaterInBatch(const Batch& batch, int requestIndex) const;
    bool isBlocked(const Batch& batch) const;
    quint64 enqueue(Batch batch);

    void pump();
    void start(Batch& batch);
    void sendNextUpdate(quint64 serial);
    void onUpdateReply(quint64 serial, int requestIndex, const Api::SlotReply& reply);
    void onDeleteReply(quint64 serial, const Api::SlotServiceError& error);
    void onCreateReply(quint64 serial, const Api::SlotReply& reply);

    void completeBatch(quint64 serial);
    void failBatch(quint64 serial, const SlotId& failedId, const Api::SlotServiceError& error);
    void rollback(const Batch& batch);
    void setBusy(bool busy);

    QPointer<SlotStore> m_store;
    QPointer<Api::ISlotService> m_service;
    QString m_venueId;
    std::deque<Batch> m_batches;
    quint64 m_nextSerial = 1;
    bool m_busy = false;
};

} // namespace FloorPlan
