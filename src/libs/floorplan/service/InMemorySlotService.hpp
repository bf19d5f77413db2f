// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/api/ISlotService.hpp"

#include <QtCore/QHash>
#include <QtCore/QMap>
#include <QtCore/QVector>

#include <optional>

namespace FloorPlan::Service {

enum class SlotOperation : quint8 { List, Create, Update, Delete };

// Slot service backed by process memory. Replies are delivered from the event
// loop after the configured latency so callers see real asynchrony.
class FLOORPLAN_EXPORT InMemorySlotService final : public Api::ISlotService
{
    Q_OBJECT

public:
    explicit InMemorySlotService(QObject* parent = nullptr);

    void setLatencyMs(int ms);
    int latencyMs() const noexcept { return m_latencyMs; }

    void seedSlots(const QString& venueId, const SlotList& slots);
    SlotList storedSlots(const QString& venueId) const;
    const Slot* storedSlot(const QString& venueId, const SlotId& id) const;

    // The next count calls of op fail with error.
    void failNext(SlotOperation op, Api::SlotServiceError error, int count = 1);
    // Every call of op fails until cleared with std::nullopt.
    void setPersistentFailure(SlotOperation op, std::optional<Api::SlotServiceError> error);

    int requestCount(SlotOperation op) const { return m_requestCounts.value(op, 0); }
    const SlotUpdateList& receivedUpdates() const noexcept { return m_receivedUpdates; }

    void listSlots(const QString& venueId, const SlotFilters& filters, Api::ListSlotsCallback done) override;
    void createSlot(const QString& venueId, const SlotDraft& draft, Api::SlotCallback done) override;
    void updateSlot(const QString& venueId, const SlotId& id, const SlotPatch& patch, Api::SlotCallback done) override;
    void deleteSlot(const QString& venueId, const SlotId& id, Api::DeleteSlotCallback done) override;

private:
    std::optional<Api::SlotServiceError> takeInjectedFailure(SlotOperation op);
    template <typename Fn>
    void deliver(Fn&& fn);
    int indexOf(const QString& venueId, const SlotId& id) const;

    QHash<QString, SlotList> m_venues;
    QMap<SlotOperation, QVector<Api::SlotServiceError>> m_pendingFailures;
    QMap<SlotOperation, Api::SlotServiceError> m_persistentFailures;
    QMap<SlotOperation, int> m_requestCounts;
    SlotUpdateList m_receivedUpdates;
    int m_latencyMs = Constants::kDefaultServiceLatencyMs;
    quint64 m_nextId = 0;
};

} // namespace FloorPlan::Service
