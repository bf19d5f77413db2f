// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
QT_END_NAMESPACE

namespace Utils::Async { class DebouncedInvoker; }

namespace FloorPlan {

class SlotInspectorModel;

class FLOORPLAN_EXPORT SlotInspectorPanel final : public QWidget
{
    Q_OBJECT

public:
    explicit SlotInspectorPanel(QWidget* parent = nullptr);
    ~SlotInspectorPanel() override;

    // Null shows the empty state.
    void setSlot(const Slot* slot);
    void setZones(const QStringList& zones);
    void setBusy(bool busy);

    SlotInspectorModel* model() const noexcept { return m_model; }

signals:
    void previewRequested(const FloorPlan::SlotId& id, const FloorPlan::SlotPatch& patch);
    void previewCleared();
    void saveRequested(const FloorPlan::SlotId& id, const FloorPlan::SlotPatch& patch);
    void deleteRequested(const FloorPlan::SlotId& id);

private:
    void buildUi();
    void syncFromModel();
    void syncEnabled();
    void schedulePreview();
    void onSave();
    void onDelete();

    SlotInspectorModel* m_model = nullptr;
    Utils::Async::DebouncedInvoker* m_previewDebounce = nullptr;
    bool m_syncing = false;
    bool m_busy = false;

    QLabel* m_emptyLabel = nullptr;
    QWidget* m_form = nullptr;
    QLineEdit* m_label = nullptr;
    QComboBox* m_status = nullptr;
    QComboBox* m_type = nullptr;
    QComboBox* m_shape = nullptr;
    QLineEdit* m_width = nullptr;
    QLineEdit* m_height = nullptr;
    QLineEdit* m_rotation = nullptr;
    QComboBox* m_zone = nullptr;
    QLabel* m_position = nullptr;
    QLabel* m_validation = nullptr;
    QPushButton* m_save = nullptr;
    QPushButton* m_delete = nullptr;
};

} // namespace FloorPlan
