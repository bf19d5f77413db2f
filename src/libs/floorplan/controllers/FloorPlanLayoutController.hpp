// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/SlotHandles.hpp"
#include "floorplan/persistence/PersistenceTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QPointF>
#include <QtCore/QStringList>

#include <optional>

namespace FloorPlan {

namespace Api { class ISlotService; }
class SlotPersistenceManager;
class SlotStore;

enum class LoadState : quint8 { Idle, Loading, Ready, Failed };

// Owns the slot collection and the selection for one venue, loads them from
// the slot service and routes every edit from the canvas and the inspector.
class FLOORPLAN_EXPORT FloorPlanLayoutController final : public QObject
{
    Q_OBJECT

public:
    explicit FloorPlanLayoutController(Api::ISlotService* service, QObject* parent = nullptr);
    ~FloorPlanLayoutController() override;

    SlotStore& store() noexcept { return *m_store; }
    const SlotStore& store() const noexcept { return *m_store; }
    SlotPersistenceManager& persistence() noexcept { return *m_persistence; }

    const QString& venueId() const noexcept { return m_venueId; }
    void setVenueId(const QString& venueId);

    // Empty or the all-zones sentinel for no filter.
    const QString& zoneFilter() const noexcept { return m_zoneFilter; }
    void setZoneFilter(const QString& zone);

    // All-zones sentinel first, then every zone seen for this venue.
    QStringList zones() const;

    LoadState loadState() const noexcept { return m_loadState; }
    const QString& loadError() const noexcept { return m_loadError; }
    const QString& actionError() const noexcept { return m_actionError; }
    // Last completed create, inspector save or delete.
    const QString& statusMessage() const noexcept { return m_statusMessage; }

    // Valid only when exactly one slot is selected.
    const Slot* primarySelectedSlot() const;

    // Store contents with the inspector preview laid over them.
    SlotList displayedSlots() const;
    bool hasPreview() const noexcept { return m_preview.has_value(); }

    SlotDraft defaultDraft() const;

public slots:
    void reload();

    // Canvas callbacks
    void selectSlot(const FloorPlan::SlotId& id, bool multi);
    void moveSlot(const FloorPlan::SlotId& id, const QPointF& topLeft);
    void transformSlot(const FloorPlan::SlotId& id, const FloorPlan::SlotGeometry& geometry);

public:
    Utils::Result updateSlotTransforms(const SlotUpdateList& updates);

    // Inspector callbacks
    void previewSlotFields(const SlotId& id, const SlotPatch& patch);
    void clearPreview();
    Utils::Result saveSlotFields(const SlotId& id, const SlotPatch& patch);
    Utils::Result addSlot();
    Utils::Result createSlot(const SlotDraft& draft);
    Utils::Result deleteSlot(const SlotId& id);

    void clearActionError();
    void clearStatusMessage();

signals:
    void loadStateChanged(FloorPlan::LoadState state);
    void zoneFilterChanged(const QString& zone);
    void zonesChanged();
    void actionErrorChanged(const QString& message);
    void statusMessageChanged(const QString& message);
    void previewChanged();
    void slotsLoaded();

private:
    void setLoadState(LoadState state, const QString& error = QString());
    void setActionError(const QString& message);
    void setStatusMessage(const QString& message);
    void rememberZones(const SlotList& slots);
    void onActionFailed(const SlotActionFailure& failure);
    Utils::Result reportRejected(const Utils::Result& result);

    QPointer<Api::ISlotService> m_service;
    SlotStore* m_store = nullptr;
    SlotPersistenceManager* m_persistence = nullptr;

    QString m_venueId;
    QString m_zoneFilter;
    QStringList m_knownZones;
    LoadState m_loadState = LoadState::Idle;
    QString m_loadError;
    QString m_actionError;
    QString m_statusMessage;
    quint64 m_loadGeneration = 0;

    struct FieldPreview final {
        SlotId id;
        SlotPatch patch;
    };
    std::optional<FieldPreview> m_preview;
};

} // namespace FloorPlan
